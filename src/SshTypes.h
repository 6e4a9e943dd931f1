#pragma once

#include <QString>
#include <QByteArray>
#include <QVector>
#include <QDateTime>
#include <QtGlobal>

// -----------------------------
// Connect parameters
// -----------------------------
enum class AuthMethod {
    Password,
    PrivateKey
};

struct ConnectRequest {
    QString host;
    int     port = 22;
    QString username;

    AuthMethod authMethod = AuthMethod::Password;

    // Secrets: never logged, never copied into session metadata.
    QString password;
    QString privateKeyPath;
    QString passphrase;     // optional, for encrypted keys

    int timeoutSec = 0;     // 0 => AppConfig::connectTimeoutSec
};

// -----------------------------
// Directory listing
// -----------------------------
enum class EntryKind {
    File,
    Directory,
    Symlink,
    Other
};

struct DirectoryEntry {
    QString   name;          // basename
    QString   fullPath;      // absolute remote path
    QString   relativePath;  // recursive listing: path relative to the listed root
    EntryKind kind = EntryKind::File;

    quint64 size  = 0;       // bytes
    quint32 perms = 0;       // st_mode (permissions + type bits)
    qint64  mtime = 0;       // seconds since epoch

    QString linkTarget;      // resolved target for followed symlinks
    QString error;           // descent into this entry failed (recursive listing)
};

struct ListingError {
    QString path;
    QString relativePath;
    QString message;
};

struct DirectoryListing {
    QString path;
    QVector<DirectoryEntry> entries;
    QVector<ListingError>   errors;   // recursive listing only
    bool truncated = false;           // entry cap reached
};

// -----------------------------
// Command execution
// -----------------------------
struct CommandResult {
    QByteArray stdoutData;
    QByteArray stderrData;
    int     exitCode   = -1;
    qint64  durationMs = 0;
    bool    truncated  = false;   // buffer cap reached (non-streaming mode)
    bool    streamed   = false;   // output went to a sink, buffers are empty
};

// -----------------------------
// Transfers
// -----------------------------
enum class TransferDirection {
    Upload,
    Download
};

struct TransferResult {
    TransferDirection direction = TransferDirection::Upload;
    QString localPath;
    QString remotePath;
    quint64 bytesTransferred = 0;
    quint64 totalBytes = 0;
    bool    totalKnown = false;
    qint64  durationMs = 0;
    bool    atomic = false;
};

// -----------------------------
// Sessions
// -----------------------------
enum class SessionState {
    Connecting,
    Ready,
    Busy,
    Closing,
    Closed,
    Error
};

struct SessionSummary {
    QString   id;
    QString   host;
    int       port = 22;
    QString   username;
    AuthMethod authMethod = AuthMethod::Password;
    QDateTime connectedSince;
    QDateTime lastActivity;
    SessionState state = SessionState::Connecting;
    int       openChannels = 0;
};

static inline QString entryKindToString(EntryKind k)
{
    switch (k) {
        case EntryKind::File:      return "file";
        case EntryKind::Directory: return "directory";
        case EntryKind::Symlink:   return "symlink";
        case EntryKind::Other:     return "other";
    }
    return "other";
}

static inline QString sessionStateToString(SessionState s)
{
    switch (s) {
        case SessionState::Connecting: return "connecting";
        case SessionState::Ready:      return "ready";
        case SessionState::Busy:       return "busy";
        case SessionState::Closing:    return "closing";
        case SessionState::Closed:     return "closed";
        case SessionState::Error:      return "error";
    }
    return "error";
}

static inline QString transferDirectionToString(TransferDirection d)
{
    return d == TransferDirection::Upload ? "upload" : "download";
}

static inline QString authMethodToString(AuthMethod m)
{
    return m == AuthMethod::Password ? "password" : "key";
}
