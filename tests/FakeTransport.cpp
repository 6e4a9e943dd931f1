// FakeTransport.cpp
#include "FakeTransport.h"

#include <QMutexLocker>
#include <QElapsedTimer>
#include <QStringList>
#include <QThread>

#include <algorithm>
#include <cstring>
#include <stdexcept>

static QString parentOf(const QString& path)
{
    const int slash = path.lastIndexOf('/');
    return slash <= 0 ? QStringLiteral("/") : path.left(slash);
}

static QString baseName(const QString& path)
{
    return path.mid(path.lastIndexOf('/') + 1);
}

static QString normalize(const QString& path)
{
    QStringList out;
    for (const QString& part : path.split('/', Qt::SkipEmptyParts)) {
        if (part == ".") continue;
        if (part == "..") { if (!out.isEmpty()) out.removeLast(); continue; }
        out.push_back(part);
    }
    return "/" + out.join('/');
}

static void remoteError(OpError* err, const QString& what, const QString& path)
{
    setError(err, ErrorCode::Remote, QString("%1 failed for '%2'").arg(what, path));
}

// =====================================================
// FakeServer
// =====================================================
FakeServer::FakeServer()
{
    FakeNode root;
    root.kind = EntryKind::Directory;
    root.perms = 0755;
    nodes.insert("/", root);
}

FakeCommand FakeServer::run(const QString& command) const
{
    FakeCommand c;
    const QString verb = command.section(' ', 0, 0);
    const QString rest = command.section(' ', 1);

    if (verb == "echo") {
        c.stdoutData = rest.toUtf8() + "\n";
    } else if (verb == "err") {
        c.stderrData = rest.toUtf8() + "\n";
        c.exitCode = 1;
    } else if (verb == "exit") {
        c.exitCode = rest.trimmed().toInt();
    } else if (verb == "sleep") {
        c.delayMs = rest.section(' ', 0, 0).toInt();
        c.stdoutData = rest.section(' ', 1).toUtf8() + "\n";
    } else if (verb == "hang") {
        c.hang = true;
    } else if (verb == "yes") {
        c.stdoutData = QByteArray(rest.trimmed().toInt(), 'y');
    } else {
        c.stderrData = QString("%1: command not found\n").arg(verb).toUtf8();
        c.exitCode = 127;
    }
    return c;
}

void FakeServer::addDir(const QString& path)
{
    QMutexLocker lock(&mutex);
    const QString p = normalize(path);
    if (p != "/" && !nodes.contains(parentOf(p))) {
        lock.unlock();
        addDir(parentOf(p));
        lock.relock();
    }
    FakeNode n;
    n.kind = EntryKind::Directory;
    n.perms = 0755;
    nodes.insert(p, n);
}

void FakeServer::addFile(const QString& path, const QByteArray& data)
{
    addDir(parentOf(normalize(path)));
    QMutexLocker lock(&mutex);
    FakeNode n;
    n.kind = EntryKind::File;
    n.data = data;
    nodes.insert(normalize(path), n);
}

void FakeServer::addLink(const QString& path, const QString& target)
{
    addDir(parentOf(normalize(path)));
    QMutexLocker lock(&mutex);
    FakeNode n;
    n.kind = EntryKind::Symlink;
    n.linkTarget = target;
    n.perms = 0777;
    nodes.insert(normalize(path), n);
}

void FakeServer::setUnreadable(const QString& path, bool unreadable)
{
    QMutexLocker lock(&mutex);
    auto it = nodes.find(normalize(path));
    if (it != nodes.end())
        it->unreadable = unreadable;
}

bool FakeServer::fileData(const QString& path, QByteArray* out) const
{
    QMutexLocker lock(&mutex);
    QString real;
    if (!resolveLocked(path, true, &real)) return false;
    const auto it = nodes.constFind(real);
    if (it == nodes.constEnd() || it->kind != EntryKind::File) return false;
    *out = it->data;
    return true;
}

bool FakeServer::exists(const QString& path) const
{
    QMutexLocker lock(&mutex);
    return nodes.contains(normalize(path));
}

bool FakeServer::resolveLocked(const QString& path, bool followLast, QString* out) const
{
    QStringList pending = normalize(path).split('/', Qt::SkipEmptyParts);
    QString current = "/";
    int hops = 0;

    while (!pending.isEmpty()) {
        const QString part = pending.takeFirst();
        const QString next = normalize(current + "/" + part);

        const auto it = nodes.constFind(next);
        if (it == nodes.constEnd())
            return false;

        if (it->kind == EntryKind::Symlink && (followLast || !pending.isEmpty())) {
            if (++hops > 40) return false;
            const QString target = it->linkTarget.startsWith('/')
                                       ? it->linkTarget
                                       : current + "/" + it->linkTarget;
            pending = normalize(target).split('/', Qt::SkipEmptyParts) + pending;
            current = "/";
            continue;
        }
        current = next;
    }

    *out = current;
    return true;
}

// =====================================================
// Exec channel
// =====================================================
class FakeExecChannel : public ExecChannel
{
public:
    FakeExecChannel(FakeTransport* t, const FakeCommand& cmd) : m_t(t), m_cmd(cmd)
    {
        m_timer.start();
        auto& s = *m_t->server();
        const int now = ++s.openExecChannels;
        int prev = s.maxConcurrentExec.load();
        while (now > prev && !s.maxConcurrentExec.compare_exchange_weak(prev, now)) {}
    }

    ~FakeExecChannel() override { abort(); }

    int read(char* buf, int len, bool* isStderr, int waitMs, OpError* err) override
    {
        QElapsedTimer wait;
        wait.start();

        while (true) {
            if (!m_t->usable(err))
                return -1;

            if (!m_cmd.hang && m_timer.elapsed() >= m_cmd.delayMs) {
                if (m_outPos < m_cmd.stdoutData.size()) {
                    const int n = std::min(len, (int)m_cmd.stdoutData.size() - m_outPos);
                    memcpy(buf, m_cmd.stdoutData.constData() + m_outPos, n);
                    m_outPos += n;
                    if (isStderr) *isStderr = false;
                    return n;
                }
                if (m_errPos < m_cmd.stderrData.size()) {
                    const int n = std::min(len, (int)m_cmd.stderrData.size() - m_errPos);
                    memcpy(buf, m_cmd.stderrData.constData() + m_errPos, n);
                    m_errPos += n;
                    if (isStderr) *isStderr = true;
                    return n;
                }
                return 0;
            }

            if (wait.elapsed() >= waitMs)
                return 0;
            QThread::msleep(2);
        }
    }

    bool isEof() override
    {
        return !m_cmd.hang && m_timer.elapsed() >= m_cmd.delayMs
            && m_outPos >= m_cmd.stdoutData.size() && m_errPos >= m_cmd.stderrData.size();
    }

    int closeAndGetExitStatus() override
    {
        abort();
        return m_cmd.exitCode;
    }

    void abort() override
    {
        if (m_closed) return;
        m_closed = true;
        --m_t->server()->openExecChannels;
    }

private:
    FakeTransport* m_t;
    FakeCommand m_cmd;
    QElapsedTimer m_timer;
    int m_outPos = 0;
    int m_errPos = 0;
    bool m_closed = false;
};

// =====================================================
// SFTP
// =====================================================
class FakeRemoteFile : public RemoteFile
{
public:
    FakeRemoteFile(FakeTransport* t, const QString& realPath) : m_t(t), m_path(realPath) {}

    qint64 read(char* buf, qint64 len, OpError* err) override
    {
        if (!streamOk(err)) return -1;

        FakeServer& s = *m_t->server();
        QMutexLocker lock(&s.mutex);
        const auto it = s.nodes.constFind(m_path);
        if (it == s.nodes.constEnd()) {
            remoteError(err, "read", m_path);
            return -1;
        }

        qint64 n = std::min<qint64>(len, it->data.size() - m_pos);
        if (s.ioChunkLimit.load() > 0) n = std::min<qint64>(n, s.ioChunkLimit.load());
        if (n <= 0) return 0;

        memcpy(buf, it->data.constData() + m_pos, (size_t)n);
        m_pos += n;
        return n;
    }

    qint64 write(const char* buf, qint64 len, OpError* err) override
    {
        if (!streamOk(err)) return -1;

        FakeServer& s = *m_t->server();
        QMutexLocker lock(&s.mutex);
        auto it = s.nodes.find(m_path);
        if (it == s.nodes.end()) {
            remoteError(err, "write", m_path);
            return -1;
        }

        qint64 n = len;
        if (s.ioChunkLimit.load() > 0) n = std::min<qint64>(n, s.ioChunkLimit.load());
        it->data.append(buf, (int)n);
        m_pos += n;
        return n;
    }

private:
    bool streamOk(OpError* err)
    {
        if (!m_t->usable(err)) return false;

        FakeServer& s = *m_t->server();
        const qint64 limit = s.failAfterBytes.load();
        if (limit >= 0 && m_pos >= limit) {
            s.dropped = true;
            return m_t->usable(err);
        }
        return true;
    }

    FakeTransport* m_t;
    QString m_path;
    qint64 m_pos = 0;
};

class FakeSftpChannel : public SftpChannel
{
public:
    explicit FakeSftpChannel(FakeTransport* t) : m_t(t) {}

    bool readDir(const QString& path, QVector<DirectoryEntry>* out, OpError* err) override
    {
        if (!m_t->usable(err)) return false;

        FakeServer& s = *m_t->server();
        QMutexLocker lock(&s.mutex);

        QString real;
        if (!s.resolveLocked(path, true, &real)) {
            setError(err, ErrorCode::Remote, QString("No such file or directory: %1").arg(path));
            return false;
        }
        const FakeNode& dir = s.nodes[real];
        if (dir.kind != EntryKind::Directory) {
            setError(err, ErrorCode::Remote, QString("Not a directory: %1").arg(path));
            return false;
        }
        if (dir.unreadable) {
            setError(err, ErrorCode::Remote, QString("Permission denied: %1").arg(path));
            return false;
        }

        out->clear();
        const QString base = (path.endsWith('/') || path == "/") ? path : path + "/";
        for (auto it = s.nodes.constBegin(); it != s.nodes.constEnd(); ++it) {
            if (it.key() == "/" || parentOf(it.key()) != real) continue;
            DirectoryEntry e;
            e.name = baseName(it.key());
            e.fullPath = base + e.name;
            e.kind = it->kind;
            e.size = (quint64)it->data.size();
            e.perms = it->perms;
            e.mtime = it->mtime;
            out->push_back(e);
        }
        // Servers return entries in no particular order.
        std::reverse(out->begin(), out->end());
        return true;
    }

    bool stat(const QString& path, DirectoryEntry* out, OpError* err) override
    {
        if (!m_t->usable(err)) return false;

        FakeServer& s = *m_t->server();
        QMutexLocker lock(&s.mutex);
        QString real;
        if (!s.resolveLocked(path, true, &real)) {
            setError(err, ErrorCode::Remote, QString("No such file or directory: %1").arg(path));
            return false;
        }
        const FakeNode& n = s.nodes[real];
        out->name = baseName(path);
        out->fullPath = path;
        out->kind = n.kind;
        out->size = (quint64)n.data.size();
        out->perms = n.perms;
        out->mtime = n.mtime;
        return true;
    }

    bool realPath(const QString& path, QString* out, OpError* err) override
    {
        if (!m_t->usable(err)) return false;

        FakeServer& s = *m_t->server();
        QMutexLocker lock(&s.mutex);
        if (!s.resolveLocked(path, true, out)) {
            setError(err, ErrorCode::Remote, QString("No such file or directory: %1").arg(path));
            return false;
        }
        return true;
    }

    std::unique_ptr<RemoteFile> open(const QString& path, OpenMode mode, OpError* err) override
    {
        if (!m_t->usable(err)) return nullptr;

        FakeServer& s = *m_t->server();
        QMutexLocker lock(&s.mutex);

        QString real;
        if (mode == OpenMode::Read) {
            if (!s.resolveLocked(path, true, &real) || s.nodes[real].kind != EntryKind::File) {
                setError(err, ErrorCode::Remote, QString("No such file: %1").arg(path));
                return nullptr;
            }
            if (s.nodes[real].unreadable) {
                setError(err, ErrorCode::Remote, QString("Permission denied: %1").arg(path));
                return nullptr;
            }
        } else {
            QString parent;
            if (!s.resolveLocked(parentOf(normalize(path)), true, &parent)
                || s.nodes[parent].kind != EntryKind::Directory) {
                setError(err, ErrorCode::Remote, QString("No such directory for %1").arg(path));
                return nullptr;
            }
            if (s.nodes[parent].unreadable) {
                setError(err, ErrorCode::Remote, QString("Permission denied: %1").arg(path));
                return nullptr;
            }
            real = normalize(parent + "/" + baseName(normalize(path)));
            FakeNode n;
            n.kind = EntryKind::File;
            s.nodes.insert(real, n);
        }
        return std::unique_ptr<RemoteFile>(new FakeRemoteFile(m_t, real));
    }

    bool rename(const QString& from, const QString& to, OpError* err) override
    {
        if (!m_t->usable(err)) return false;

        FakeServer& s = *m_t->server();
        QMutexLocker lock(&s.mutex);
        const QString f = normalize(from);
        if (!s.nodes.contains(f)) {
            remoteError(err, "rename", from);
            return false;
        }
        s.nodes.insert(normalize(to), s.nodes.take(f));
        return true;
    }

    bool remove(const QString& path, OpError* err) override
    {
        if (!m_t->usable(err)) return false;

        FakeServer& s = *m_t->server();
        QMutexLocker lock(&s.mutex);
        if (s.nodes.remove(normalize(path)) == 0) {
            remoteError(err, "remove", path);
            return false;
        }
        return true;
    }

private:
    FakeTransport* m_t;
};

// =====================================================
// FakeTransport
// =====================================================
FakeTransport::FakeTransport(std::shared_ptr<FakeServer> server)
    : m_server(std::move(server))
{
}

FakeTransport::~FakeTransport() = default;

bool FakeTransport::open(const ConnectRequest& req, OpError* err)
{
    if (!m_server->reachable) {
        setError(err, ErrorCode::Network, QString("Cannot reach %1:%2").arg(req.host).arg(req.port));
        return false;
    }
    if (m_server->handshakeFails) {
        setError(err, ErrorCode::Protocol, QStringLiteral("Key exchange failed: no matching algorithm"));
        return false;
    }

    const bool userOk = (req.username == m_server->username);
    const bool credOk = (req.authMethod == AuthMethod::Password)
                            ? req.password == m_server->password
                            : req.privateKeyPath == m_server->keyPath;
    if (!userOk || !credOk) {
        setError(err, ErrorCode::Authentication, QStringLiteral("Authentication rejected by server."));
        return false;
    }

    ++m_server->connects;
    m_open = true;
    return true;
}

void FakeTransport::shutdown()
{
    m_shutdown = true;
}

bool FakeTransport::isAlive() const
{
    return m_open && !m_shutdown && !m_server->dropped;
}

bool FakeTransport::usable(OpError* err) const
{
    if (m_shutdown || !m_open) {
        setError(err, ErrorCode::ConnectionLost, QStringLiteral("Connection closed."));
        return false;
    }
    if (m_server->dropped) {
        setError(err, ErrorCode::ConnectionLost, QStringLiteral("Connection reset by peer."));
        return false;
    }
    return true;
}

bool FakeTransport::sendKeepalive(OpError* err)
{
    if (!usable(err)) return false;
    if (!m_server->peerResponsive) {
        setError(err, ErrorCode::Timeout, QStringLiteral("No keepalive reply."));
        return false;
    }
    return true;
}

std::unique_ptr<ExecChannel> FakeTransport::openExec(const QString& command, OpError* err)
{
    if (!usable(err)) return nullptr;
    if (m_server->execThrows)
        throw std::runtime_error("exec channel exploded");
    return std::unique_ptr<ExecChannel>(new FakeExecChannel(this, m_server->run(command)));
}

std::unique_ptr<SftpChannel> FakeTransport::openSftp(OpError* err)
{
    if (!usable(err)) return nullptr;
    return std::unique_ptr<SftpChannel>(new FakeSftpChannel(this));
}

TransportFactory fakeTransportFactory(const std::shared_ptr<FakeServer>& server)
{
    return [server]() -> std::unique_ptr<SshTransport> {
        return std::unique_ptr<SshTransport>(new FakeTransport(server));
    };
}
