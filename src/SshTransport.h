// SshTransport.h
//
// Purpose:
//   Abstract seam over one authenticated SSH connection.
//     - open(): TCP connect + handshake + authentication
//     - openExec(): one exec channel per remote command
//     - openSftp(): one SFTP channel per listing/transfer
//     - sendKeepalive(): liveness probe that waits for the peer's reply
//     - shutdown(): forces every open channel to fail with ConnectionLost
//
// Design boundary:
//   The production implementation is LibsshTransport. Tests plug an
//   in-memory implementation in through SessionRegistry's TransportFactory.
//
// Thread model:
//   Implementations must tolerate calls from several worker threads at once
//   (one per channel). Lifetime: every channel/file object must be destroyed
//   before the transport that created it.

#pragma once

#include <QString>
#include <QVector>
#include <QtGlobal>
#include <functional>
#include <memory>

#include "OpError.h"
#include "SshTypes.h"

// One remote command (exec request) on its own channel.
class ExecChannel
{
public:
    virtual ~ExecChannel() = default;

    // Reads what is available on stdout or stderr, waiting up to waitMs.
    // Returns >0 bytes read (isStderr tells which stream), 0 when nothing
    // arrived in time, -1 on error (err filled).
    virtual int read(char* buf, int len, bool* isStderr, int waitMs, OpError* err) = 0;

    // True once the remote side sent EOF and no buffered data is left.
    virtual bool isEof() = 0;

    // Sends EOF, closes the channel and returns the remote exit status
    // (-1 when the server did not report one).
    virtual int closeAndGetExitStatus() = 0;

    // Closes without waiting for the remote process (timeouts/cancel).
    virtual void abort() = 0;
};

// An open remote file on an SFTP channel. Closed on destruction.
class RemoteFile
{
public:
    virtual ~RemoteFile() = default;

    // Returns bytes read, 0 at EOF, -1 on error.
    virtual qint64 read(char* buf, qint64 len, OpError* err) = 0;

    // Returns bytes written (may be short), -1 on error.
    virtual qint64 write(const char* buf, qint64 len, OpError* err) = 0;
};

class SftpChannel
{
public:
    enum class OpenMode {
        Read,
        WriteTruncate
    };

    virtual ~SftpChannel() = default;

    // Single level, lstat semantics (symlinks reported as Symlink).
    // "." and ".." are omitted. No particular order.
    virtual bool readDir(const QString& path, QVector<DirectoryEntry>* out, OpError* err) = 0;

    // stat() follows symlinks.
    virtual bool stat(const QString& path, DirectoryEntry* out, OpError* err) = 0;

    // Canonical absolute path with symlinks resolved.
    virtual bool realPath(const QString& path, QString* out, OpError* err) = 0;

    virtual std::unique_ptr<RemoteFile> open(const QString& path, OpenMode mode, OpError* err) = 0;

    virtual bool rename(const QString& from, const QString& to, OpError* err) = 0;
    virtual bool remove(const QString& path, OpError* err) = 0;
};

class SshTransport
{
public:
    virtual ~SshTransport() = default;

    virtual bool open(const ConnectRequest& req, OpError* err) = 0;

    // Idempotent. After shutdown every channel call fails with ConnectionLost.
    virtual void shutdown() = 0;

    // Local view only: false once the socket is known to be gone.
    virtual bool isAlive() const = 0;

    // One request/reply exchange with the peer. Fails with Timeout when no
    // reply arrives in time, ConnectionLost when the connection is gone.
    virtual bool sendKeepalive(OpError* err) = 0;

    virtual std::unique_ptr<ExecChannel> openExec(const QString& command, OpError* err) = 0;
    virtual std::unique_ptr<SftpChannel> openSftp(OpError* err) = 0;

    // Negotiated key exchange, for logs (may be empty).
    virtual QString negotiatedKex() const { return QString(); }
};

using TransportFactory = std::function<std::unique_ptr<SshTransport>()>;
