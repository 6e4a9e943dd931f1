// LibsshTransport.h
//
// Purpose:
//   libssh implementation of SshTransport:
//     - Connection/authentication (password, or private key + passphrase)
//     - Optional known_hosts verification
//     - Exec channels for remote commands
//     - SFTP channels for listings and streaming transfers
//     - Keepalive probes (channel open/close round trip)
//
// Thread model:
//   A libssh session is not safe for concurrent use, so every libssh call
//   goes through m_mutex. The lock is held for one protocol step only
//   (one poll, one read, one write), which lets several channels make
//   progress on the same connection chunk by chunk.
//
// Never log secrets (passwords, passphrases, private key paths).

#pragma once

#include <QString>
#include <QMutex>
#include <atomic>
#include <functional>

#include "SshTransport.h"

struct AppConfig;

// Forward-declare libssh session type to avoid pulling libssh headers into the header.
struct ssh_session_struct;
using ssh_session = ssh_session_struct*;

class LibsshTransport : public SshTransport
{
public:
    // Injected by the credential store / UI when an encrypted key has no
    // passphrase in the request. ok=false means the user cancelled.
    using PassphraseProvider = std::function<QString(const QString& keyFile, bool* ok)>;

    struct Options
    {
        int     connectTimeoutSec = 15;
        bool    strictHostKeyChecking = false;
        QString knownHostsFile;
        QString kexPreference;
        PassphraseProvider passphraseProvider;
    };

    explicit LibsshTransport(const Options& opts);
    ~LibsshTransport() override;

    bool open(const ConnectRequest& req, OpError* err) override;
    void shutdown() override;
    bool isAlive() const override;
    bool sendKeepalive(OpError* err) override;

    std::unique_ptr<ExecChannel> openExec(const QString& command, OpError* err) override;
    std::unique_ptr<SftpChannel> openSftp(OpError* err) override;

    QString negotiatedKex() const override;

    // Factory used by SessionRegistry in production.
    static TransportFactory factory(const AppConfig& config,
                                    PassphraseProvider provider = nullptr);

private:
    friend class LibsshExecChannel;
    friend class LibsshSftpChannel;
    friend class LibsshRemoteFile;

    // Must be called with m_mutex held.
    bool usableLocked(OpError* err) const;
    void connectionLostLocked(OpError* err, const QString& what) const;

    ssh_session m_session = nullptr;
    mutable QMutex m_mutex;
    std::atomic_bool m_shutdown{false};

    Options m_opts;
    QString m_kex;
    QString m_target;   // user@host:port, for logs
};
