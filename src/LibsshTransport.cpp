// LibsshTransport.cpp
//
// Purpose:
//   libssh-backed transport for one ShellDeck session.
//   - Creates and owns a libssh session (ssh_new ... ssh_free)
//   - Authenticates with password, or private key + optional passphrase
//   - Opens one exec channel per command and one SFTP session per
//     listing/transfer (each SFTP session is its own channel)
//   - Serialises libssh access with a mutex held for one protocol step
//
// Design notes:
//   - shutdown() only raises a flag; channels see it on their next call and
//     fail with ConnectionLost. The libssh session is disconnected and freed
//     in the destructor, after every channel object is gone, so a channel
//     never touches freed memory.
//   - Never log secrets (passwords, passphrases, private key paths).

#include "LibsshTransport.h"

#include <QByteArray>
#include <QFile>
#include <QThread>
#include <QElapsedTimer>
#include <QDebug>

#include <libssh/libssh.h>
#include <libssh/sftp.h>
#include <libssh/callbacks.h>

#include <sodium.h>

#include <fcntl.h>
#include <sys/stat.h>

#include <algorithm>
#include <cstring>
#include <mutex>

#include "AppConfig.h"

// ------------------------------------------------------------
// Small helpers
// ------------------------------------------------------------
static QString libsshError(ssh_session s)
{
    if (!s) return QStringLiteral("libssh: null session");
    return QString::fromLocal8Bit(ssh_get_error(s));
}

static void libraryInitOnce()
{
    static std::once_flag once;
    std::call_once(once, []() {
        ssh_init();
        if (sodium_init() < 0)
            qWarning().noquote() << "[SSH] sodium_init failed; secrets are wiped with std::fill";
    });
}

// Best-effort wipe of a secret copy (plaintext should never persist longer than needed).
static void wipe(QByteArray& secret)
{
    if (secret.isEmpty()) return;
    if (sodium_init() >= 0) sodium_memzero(secret.data(), (size_t)secret.size());
    else std::fill(secret.begin(), secret.end(), '\0');
    secret.clear();
}

static ErrorCode classifyConnectFailure(const QString& msg)
{
    const QString m = msg.toLower();
    static const char* protocolHints[] = {
        "kex", "key exchange", "algorithm", "negotiat", "banner",
        "protocol", "host key", "hostkey", "mac ", "cipher"
    };
    for (const char* h : protocolHints) {
        if (m.contains(QLatin1String(h)))
            return ErrorCode::Protocol;
    }
    return ErrorCode::Network;
}

static QString sftpStatusText(int code)
{
    switch (code) {
        case SSH_FX_EOF:                 return QStringLiteral("end of file");
        case SSH_FX_NO_SUCH_FILE:        return QStringLiteral("No such file or directory");
        case SSH_FX_PERMISSION_DENIED:   return QStringLiteral("Permission denied");
        case SSH_FX_FAILURE:             return QStringLiteral("Failure");
        case SSH_FX_BAD_MESSAGE:         return QStringLiteral("Bad message");
        case SSH_FX_NO_CONNECTION:       return QStringLiteral("No connection");
        case SSH_FX_CONNECTION_LOST:     return QStringLiteral("Connection lost");
        case SSH_FX_OP_UNSUPPORTED:      return QStringLiteral("Operation unsupported");
        case SSH_FX_FILE_ALREADY_EXISTS: return QStringLiteral("File already exists");
        default:                         return QString();
    }
}

static EntryKind kindFromAttributes(sftp_attributes a)
{
    switch (a->permissions & S_IFMT) {
        case S_IFDIR: return EntryKind::Directory;
        case S_IFREG: return EntryKind::File;
        case S_IFLNK: return EntryKind::Symlink;
        case 0:       break;            // server sent no type bits
        default:      return EntryKind::Other;
    }

    switch (a->type) {
        case SSH_FILEXFER_TYPE_DIRECTORY: return EntryKind::Directory;
        case SSH_FILEXFER_TYPE_REGULAR:   return EntryKind::File;
        case SSH_FILEXFER_TYPE_SYMLINK:   return EntryKind::Symlink;
        default:                          return EntryKind::Other;
    }
}

static QString joinRemote(const QString& dir, const QString& name)
{
    return dir.endsWith('/') ? (dir + name) : (dir + "/" + name);
}

static DirectoryEntry entryFromAttributes(const QString& fullPath, const QString& name, sftp_attributes a)
{
    DirectoryEntry e;
    e.name     = name;
    e.fullPath = fullPath;
    e.kind     = kindFromAttributes(a);
    e.size     = (quint64)a->size;
    e.perms    = (quint32)a->permissions;
    e.mtime    = (qint64)a->mtime;
    return e;
}

// Passphrase callback for ssh_pki_import_privkey_file (UI supplies passphrase).
static int passphraseCallback(const char* prompt, char* buf, size_t len,
                              int echo, int verify, void* userdata)
{
    Q_UNUSED(prompt);
    Q_UNUSED(echo);
    Q_UNUSED(verify);

    auto* provider = static_cast<LibsshTransport::PassphraseProvider*>(userdata);
    if (!provider || !*provider || len == 0) return SSH_ERROR;

    bool ok = false;
    QByteArray utf8 = (*provider)(QString(), &ok).toUtf8();
    if (!ok) {
        wipe(utf8);
        return SSH_ERROR;
    }

    const size_t n = std::min(len - 1, static_cast<size_t>(utf8.size()));
    std::memcpy(buf, utf8.constData(), n);
    buf[n] = '\0';
    wipe(utf8);
    return SSH_OK;
}

// =====================================================
// Exec channel
// =====================================================
class LibsshExecChannel : public ExecChannel
{
public:
    LibsshExecChannel(LibsshTransport* t, ssh_channel ch) : m_t(t), m_ch(ch) {}
    ~LibsshExecChannel() override { abort(); }

    int read(char* buf, int len, bool* isStderr, int waitMs, OpError* err) override
    {
        QElapsedTimer timer;
        timer.start();

        while (true) {
            {
                QMutexLocker lock(&m_t->m_mutex);
                if (!m_ch || !m_t->usableLocked(err))
                    return -1;

                for (int stream = 0; stream <= 1; ++stream) {
                    const int avail = ssh_channel_poll_timeout(m_ch, 0, stream);
                    if (avail == SSH_ERROR) {
                        m_t->connectionLostLocked(err, "channel poll");
                        return -1;
                    }
                    if (avail <= 0)
                        continue;   // nothing, or SSH_EOF

                    const int n = ssh_channel_read_nonblocking(m_ch, buf, (uint32_t)len, stream);
                    if (n == SSH_ERROR) {
                        m_t->connectionLostLocked(err, "channel read");
                        return -1;
                    }
                    if (n > 0) {
                        if (isStderr) *isStderr = (stream == 1);
                        return n;
                    }
                }

                if (ssh_channel_is_eof(m_ch))
                    return 0;
            }

            if (timer.elapsed() >= waitMs)
                return 0;

            // Yield the session lock to sibling channels between polls.
            QThread::msleep(2);
        }
    }

    bool isEof() override
    {
        QMutexLocker lock(&m_t->m_mutex);
        return !m_ch || ssh_channel_is_eof(m_ch);
    }

    int closeAndGetExitStatus() override
    {
        QMutexLocker lock(&m_t->m_mutex);
        if (!m_ch) return -1;

        ssh_channel_send_eof(m_ch);
        ssh_channel_close(m_ch);
        const int status = ssh_channel_get_exit_status(m_ch); // deprecated in 0.11, still works
        ssh_channel_free(m_ch);
        m_ch = nullptr;
        return status;
    }

    void abort() override
    {
        QMutexLocker lock(&m_t->m_mutex);
        if (!m_ch) return;

        if (ssh_channel_is_open(m_ch))
            ssh_channel_close(m_ch);
        ssh_channel_free(m_ch);
        m_ch = nullptr;
    }

private:
    LibsshTransport* m_t;
    ssh_channel m_ch;
};

// =====================================================
// SFTP file handle
// =====================================================
class LibsshRemoteFile : public RemoteFile
{
public:
    LibsshRemoteFile(LibsshTransport* t, sftp_session sftp, sftp_file f, const QString& path)
        : m_t(t), m_sftp(sftp), m_file(f), m_path(path) {}

    ~LibsshRemoteFile() override
    {
        QMutexLocker lock(&m_t->m_mutex);
        if (m_file) sftp_close(m_file);
    }

    qint64 read(char* buf, qint64 len, OpError* err) override
    {
        QMutexLocker lock(&m_t->m_mutex);
        if (!m_t->usableLocked(err)) return -1;

        const ssize_t n = sftp_read(m_file, buf, (size_t)len);
        if (n < 0) {
            failLocked(err, "SFTP read");
            return -1;
        }
        return (qint64)n;
    }

    qint64 write(const char* buf, qint64 len, OpError* err) override
    {
        QMutexLocker lock(&m_t->m_mutex);
        if (!m_t->usableLocked(err)) return -1;

        const ssize_t n = sftp_write(m_file, buf, (size_t)len);
        if (n < 0) {
            failLocked(err, "SFTP write");
            return -1;
        }
        return (qint64)n;
    }

private:
    void failLocked(OpError* err, const char* what)
    {
        if (!ssh_is_connected(m_t->m_session)) {
            m_t->connectionLostLocked(err, what);
            return;
        }
        const QString status = sftpStatusText(sftp_get_error(m_sftp));
        setError(err, ErrorCode::Remote,
                 QString("%1 failed for '%2': %3")
                     .arg(QLatin1String(what), m_path,
                          status.isEmpty() ? libsshError(m_t->m_session) : status));
    }

    LibsshTransport* m_t;
    sftp_session m_sftp;
    sftp_file m_file;
    QString m_path;
};

// =====================================================
// SFTP channel
// =====================================================
class LibsshSftpChannel : public SftpChannel
{
public:
    LibsshSftpChannel(LibsshTransport* t, sftp_session sftp) : m_t(t), m_sftp(sftp) {}

    ~LibsshSftpChannel() override
    {
        QMutexLocker lock(&m_t->m_mutex);
        if (m_sftp) sftp_free(m_sftp);
    }

    bool readDir(const QString& path, QVector<DirectoryEntry>* out, OpError* err) override
    {
        if (out) out->clear();

        QMutexLocker lock(&m_t->m_mutex);
        if (!m_t->usableLocked(err)) return false;

        sftp_dir dir = sftp_opendir(m_sftp, path.toUtf8().constData());
        if (!dir) {
            failLocked(err, "sftp_opendir", path);
            return false;
        }

        QVector<DirectoryEntry> items;
        while (sftp_attributes a = sftp_readdir(m_sftp, dir)) {
            const QString name = QString::fromUtf8(a->name ? a->name : "");
            if (name.isEmpty() || name == "." || name == "..") {
                sftp_attributes_free(a);
                continue;
            }
            items.push_back(entryFromAttributes(joinRemote(path, name), name, a));
            sftp_attributes_free(a);
        }

        const bool complete = sftp_dir_eof(dir);
        sftp_closedir(dir);

        if (!complete) {
            failLocked(err, "sftp_readdir", path);
            return false;
        }

        if (out) *out = items;
        return true;
    }

    bool stat(const QString& path, DirectoryEntry* out, OpError* err) override
    {
        QMutexLocker lock(&m_t->m_mutex);
        if (!m_t->usableLocked(err)) return false;

        sftp_attributes a = sftp_stat(m_sftp, path.toUtf8().constData());
        if (!a) {
            failLocked(err, "sftp_stat", path);
            return false;
        }

        const int slash = path.lastIndexOf('/');
        const QString name = (slash >= 0) ? path.mid(slash + 1) : path;
        if (out) *out = entryFromAttributes(path, name, a);
        sftp_attributes_free(a);
        return true;
    }

    bool realPath(const QString& path, QString* out, OpError* err) override
    {
        QMutexLocker lock(&m_t->m_mutex);
        if (!m_t->usableLocked(err)) return false;

        char* resolved = sftp_canonicalize_path(m_sftp, path.toUtf8().constData());
        if (!resolved) {
            failLocked(err, "sftp_canonicalize_path", path);
            return false;
        }
        if (out) *out = QString::fromUtf8(resolved);
        ssh_string_free_char(resolved);
        return true;
    }

    std::unique_ptr<RemoteFile> open(const QString& path, OpenMode mode, OpError* err) override
    {
        QMutexLocker lock(&m_t->m_mutex);
        if (!m_t->usableLocked(err)) return nullptr;

        const int flags = (mode == OpenMode::Read) ? O_RDONLY : (O_WRONLY | O_CREAT | O_TRUNC);
        const mode_t perms = (mode == OpenMode::Read) ? 0 : (S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);

        sftp_file f = sftp_open(m_sftp, path.toUtf8().constData(), flags, perms);
        if (!f) {
            failLocked(err, "sftp_open", path);
            return nullptr;
        }
        return std::unique_ptr<RemoteFile>(new LibsshRemoteFile(m_t, m_sftp, f, path));
    }

    bool rename(const QString& from, const QString& to, OpError* err) override
    {
        QMutexLocker lock(&m_t->m_mutex);
        if (!m_t->usableLocked(err)) return false;

        const QByteArray f = from.toUtf8();
        const QByteArray t = to.toUtf8();
        if (sftp_rename(m_sftp, f.constData(), t.constData()) == SSH_OK)
            return true;

        // Servers that refuse to overwrite on rename: unlink destination, retry.
        sftp_unlink(m_sftp, t.constData());
        if (sftp_rename(m_sftp, f.constData(), t.constData()) == SSH_OK)
            return true;

        failLocked(err, "sftp_rename", from + " -> " + to);
        return false;
    }

    bool remove(const QString& path, OpError* err) override
    {
        QMutexLocker lock(&m_t->m_mutex);
        if (!m_t->usableLocked(err)) return false;

        if (sftp_unlink(m_sftp, path.toUtf8().constData()) != SSH_OK) {
            failLocked(err, "sftp_unlink", path);
            return false;
        }
        return true;
    }

private:
    void failLocked(OpError* err, const char* what, const QString& path)
    {
        if (!ssh_is_connected(m_t->m_session)) {
            m_t->connectionLostLocked(err, what);
            return;
        }
        const QString status = sftpStatusText(sftp_get_error(m_sftp));
        setError(err, ErrorCode::Remote,
                 QString("%1 failed for '%2': %3")
                     .arg(QLatin1String(what), path,
                          status.isEmpty() ? libsshError(m_t->m_session) : status));
    }

    LibsshTransport* m_t;
    sftp_session m_sftp;
};

// =====================================================
// LibsshTransport
// =====================================================
LibsshTransport::LibsshTransport(const Options& opts)
    : m_opts(opts)
{
    libraryInitOnce();
}

LibsshTransport::~LibsshTransport()
{
    QMutexLocker lock(&m_mutex);
    if (m_session) {
        qInfo().noquote() << QString("[SSH] disconnect %1 (ssh_disconnect + free)").arg(m_target);
        ssh_disconnect(m_session);
        ssh_free(m_session);
        m_session = nullptr;
    }
}

TransportFactory LibsshTransport::factory(const AppConfig& config, PassphraseProvider provider)
{
    Options o;
    o.connectTimeoutSec     = config.connectTimeoutSec;
    o.strictHostKeyChecking = config.strictHostKeyChecking;
    o.knownHostsFile        = config.knownHostsFile;
    o.kexPreference         = config.kexPreference;
    o.passphraseProvider    = std::move(provider);

    return [o]() -> std::unique_ptr<SshTransport> {
        return std::unique_ptr<SshTransport>(new LibsshTransport(o));
    };
}

bool LibsshTransport::usableLocked(OpError* err) const
{
    if (m_shutdown.load() || !m_session) {
        setError(err, ErrorCode::ConnectionLost, QStringLiteral("Connection closed."));
        return false;
    }
    return true;
}

void LibsshTransport::connectionLostLocked(OpError* err, const QString& what) const
{
    const QString detail = m_session ? libsshError(m_session) : QStringLiteral("no session");
    setError(err, ErrorCode::ConnectionLost,
             QString("Connection lost during %1: %2").arg(what, detail));
}

// ------------------------------------------------------------
// open(): TCP connect, handshake, optional host key check, auth
// ------------------------------------------------------------
bool LibsshTransport::open(const ConnectRequest& req, OpError* err)
{
    QMutexLocker lock(&m_mutex);

    if (m_session) {
        setError(err, ErrorCode::Protocol, QStringLiteral("Transport already open."));
        return false;
    }

    const QString host = req.host.trimmed();
    const QString user = req.username.trimmed();
    const int port = (req.port > 0) ? req.port : 22;
    m_target = QString("%1@%2:%3").arg(user, host).arg(port);

    qInfo().noquote() << QString("[SSH] connect start %1 auth=%2")
                         .arg(m_target, authMethodToString(req.authMethod));

    ssh_session s = ssh_new();
    if (!s) {
        setError(err, ErrorCode::Network, QStringLiteral("ssh_new() failed."));
        return false;
    }

    auto fail = [&](ErrorCode code, const QString& msg, bool connected) -> bool {
        setError(err, code, msg);
        qWarning().noquote() << QString("[SSH] connect FAILED %1: %2").arg(m_target, msg);
        if (connected) ssh_disconnect(s);
        ssh_free(s);
        return false;
    };

    auto optSet = [&](enum ssh_options_e opt, const void* val, const char* what) -> bool {
        if (ssh_options_set(s, opt, val) != SSH_OK) {
            qWarning().noquote() << QString("[SSH] ssh_options_set(%1) failed: %2")
                                    .arg(QLatin1String(what), libsshError(s));
            return false;
        }
        return true;
    };

    const QByteArray hostUtf8 = host.toUtf8();
    const QByteArray userUtf8 = user.toUtf8();
    const long timeoutSec = (req.timeoutSec > 0) ? req.timeoutSec : m_opts.connectTimeoutSec;

    if (!optSet(SSH_OPTIONS_HOST, hostUtf8.constData(), "HOST") ||
        !optSet(SSH_OPTIONS_USER, userUtf8.constData(), "USER") ||
        !optSet(SSH_OPTIONS_PORT, &port, "PORT")) {
        return fail(ErrorCode::Network, QStringLiteral("Invalid connection options: %1").arg(libsshError(s)), false);
    }
    optSet(SSH_OPTIONS_TIMEOUT, &timeoutSec, "TIMEOUT");

    if (!m_opts.knownHostsFile.isEmpty()) {
        const QByteArray kh = QFile::encodeName(m_opts.knownHostsFile);
        optSet(SSH_OPTIONS_KNOWNHOSTS, kh.constData(), "KNOWNHOSTS");
    }

    // NOTE: must be set BEFORE ssh_connect().
    if (!m_opts.kexPreference.isEmpty()) {
        const QByteArray kex = m_opts.kexPreference.toLatin1();
        if (optSet(SSH_OPTIONS_KEY_EXCHANGE, kex.constData(), "KEY_EXCHANGE"))
            qInfo().noquote() << QString("[SSH] KEX preference set: %1").arg(m_opts.kexPreference);
    }

    int rc = ssh_connect(s);
    if (rc != SSH_OK) {
        const QString e = libsshError(s);
        return fail(classifyConnectFailure(e), QStringLiteral("ssh_connect failed: %1").arg(e), false);
    }

    const char* kexAlgoC = ssh_get_kex_algo(s);
    m_kex = kexAlgoC ? QString::fromLatin1(kexAlgoC) : QString();
    qInfo().noquote() << QString("[SSH] ssh_connect OK %1 kex='%2' cipher in='%3' out='%4'")
                         .arg(m_target,
                              m_kex.isEmpty() ? QStringLiteral("?") : m_kex,
                              QString::fromLatin1(ssh_get_cipher_in(s) ? ssh_get_cipher_in(s) : "?"),
                              QString::fromLatin1(ssh_get_cipher_out(s) ? ssh_get_cipher_out(s) : "?"));

    if (m_opts.strictHostKeyChecking) {
        const enum ssh_known_hosts_e state = ssh_session_is_known_server(s);
        if (state != SSH_KNOWN_HOSTS_OK) {
            QString why;
            switch (state) {
                case SSH_KNOWN_HOSTS_CHANGED:   why = "host key CHANGED"; break;
                case SSH_KNOWN_HOSTS_OTHER:     why = "host key of another type is known"; break;
                case SSH_KNOWN_HOSTS_UNKNOWN:   why = "host is unknown"; break;
                case SSH_KNOWN_HOSTS_NOT_FOUND: why = "known_hosts file not found"; break;
                default:                        why = "known_hosts check failed: " + libsshError(s); break;
            }
            return fail(ErrorCode::Protocol, QStringLiteral("Host key verification failed: %1").arg(why), true);
        }
        qInfo().noquote() << QString("[SSH] host key verified %1").arg(m_target);
    }

    if (req.authMethod == AuthMethod::Password) {
        QByteArray pw = req.password.toUtf8();
        rc = ssh_userauth_password(s, nullptr, pw.constData());
        wipe(pw);
    } else {
        const QByteArray keyPath = QFile::encodeName(req.privateKeyPath.trimmed());
        QByteArray pass = req.passphrase.toUtf8();

        ssh_key key = nullptr;
        PassphraseProvider provider = m_opts.passphraseProvider;
        const int irc = ssh_pki_import_privkey_file(keyPath.constData(),
                                                    pass.isEmpty() ? nullptr : pass.constData(),
                                                    provider ? passphraseCallback : nullptr,
                                                    provider ? &provider : nullptr,
                                                    &key);
        wipe(pass);

        if (irc != SSH_OK || !key) {
            if (key) ssh_key_free(key);
            return fail(ErrorCode::Authentication,
                        QStringLiteral("Cannot load private key (missing file, wrong passphrase or unsupported format)."),
                        true);
        }

        rc = ssh_userauth_publickey(s, nullptr, key);
        ssh_key_free(key);
    }

    if (rc == SSH_AUTH_ERROR) {
        const QString e = libsshError(s);
        const ErrorCode code = ssh_is_connected(s) ? ErrorCode::Protocol : ErrorCode::Network;
        return fail(code, QStringLiteral("Authentication error: %1").arg(e), true);
    }
    if (rc != SSH_AUTH_SUCCESS) {
        return fail(ErrorCode::Authentication,
                    QStringLiteral("%1 authentication rejected by server.")
                        .arg(req.authMethod == AuthMethod::Password ? "Password" : "Public-key"),
                    true);
    }

    m_session = s;
    m_shutdown.store(false);

    qInfo().noquote() << QString("[SSH] connect OK %1").arg(m_target);
    return true;
}

void LibsshTransport::shutdown()
{
    if (!m_shutdown.exchange(true))
        qInfo().noquote() << QString("[SSH] shutdown %1").arg(m_target);
}

bool LibsshTransport::isAlive() const
{
    QMutexLocker lock(&m_mutex);
    return !m_shutdown.load() && m_session && ssh_is_connected(m_session);
}

QString LibsshTransport::negotiatedKex() const
{
    QMutexLocker lock(&m_mutex);
    return m_kex;
}

// ------------------------------------------------------------
// Keepalive: one real round trip. A session channel is opened and closed
// again; the open blocks until the peer confirms or refuses it, for at most
// the session timeout (SSH_OPTIONS_TIMEOUT). A refusal is still an answer.
// ------------------------------------------------------------
bool LibsshTransport::sendKeepalive(OpError* err)
{
    QMutexLocker lock(&m_mutex);
    if (!usableLocked(err)) return false;

    if (!ssh_is_connected(m_session)) {
        connectionLostLocked(err, "keepalive");
        return false;
    }

    ssh_channel ch = ssh_channel_new(m_session);
    if (!ch) {
        connectionLostLocked(err, "keepalive");
        return false;
    }

    const int rc = ssh_channel_open_session(ch);
    if (rc == SSH_OK) {
        ssh_channel_close(ch);
        ssh_channel_free(ch);
        return true;
    }

    const bool refused = (rc == SSH_ERROR && ssh_is_connected(m_session)
                          && ssh_get_error_code(m_session) == SSH_REQUEST_DENIED);
    ssh_channel_free(ch);

    if (refused) {
        qDebug().noquote() << QString("[SSH] keepalive %1: channel refused (%2), peer answered")
                              .arg(m_target, libsshError(m_session));
        return true;
    }

    if (rc == SSH_AGAIN && ssh_is_connected(m_session)) {
        setError(err, ErrorCode::Timeout,
                 QString("No keepalive reply from %1 within the session timeout.").arg(m_target));
        return false;
    }

    connectionLostLocked(err, "keepalive");
    return false;
}

std::unique_ptr<ExecChannel> LibsshTransport::openExec(const QString& command, OpError* err)
{
    QMutexLocker lock(&m_mutex);
    if (!usableLocked(err)) return nullptr;

    ssh_channel ch = ssh_channel_new(m_session);
    if (!ch) {
        connectionLostLocked(err, "ssh_channel_new");
        return nullptr;
    }

    if (ssh_channel_open_session(ch) != SSH_OK) {
        if (!ssh_is_connected(m_session))
            connectionLostLocked(err, "ssh_channel_open_session");
        else
            setError(err, ErrorCode::Remote,
                     QStringLiteral("ssh_channel_open_session failed: %1").arg(libsshError(m_session)));
        ssh_channel_free(ch);
        return nullptr;
    }

    if (ssh_channel_request_exec(ch, command.toUtf8().constData()) != SSH_OK) {
        if (!ssh_is_connected(m_session))
            connectionLostLocked(err, "ssh_channel_request_exec");
        else
            setError(err, ErrorCode::Remote,
                     QStringLiteral("ssh_channel_request_exec failed: %1").arg(libsshError(m_session)));
        ssh_channel_close(ch);
        ssh_channel_free(ch);
        return nullptr;
    }

    return std::unique_ptr<ExecChannel>(new LibsshExecChannel(this, ch));
}

std::unique_ptr<SftpChannel> LibsshTransport::openSftp(OpError* err)
{
    QMutexLocker lock(&m_mutex);
    if (!usableLocked(err)) return nullptr;

    sftp_session sftp = sftp_new(m_session);
    if (!sftp) {
        connectionLostLocked(err, "sftp_new");
        return nullptr;
    }

    if (sftp_init(sftp) != SSH_OK) {
        if (!ssh_is_connected(m_session))
            connectionLostLocked(err, "sftp_init");
        else
            setError(err, ErrorCode::Remote,
                     QStringLiteral("sftp_init failed: %1").arg(libsshError(m_session)));
        sftp_free(sftp);
        return nullptr;
    }

    return std::unique_ptr<SftpChannel>(new LibsshSftpChannel(this, sftp));
}
