// OpError.h
//
// Error taxonomy shared by every core component.
// Components return bool and fill an optional OpError* (same shape as the
// QString* err convention used elsewhere); the Dispatcher turns it into a
// result envelope.

#pragma once

#include <QString>
#include <QtGlobal>

enum class ErrorCode {
    None,
    Validation,      // malformed/out-of-policy input, never reaches a session
    NotFound,        // identifier unknown to the registry
    Authentication,  // credentials rejected by the remote host
    Network,         // unreachable host, DNS failure, timeout before handshake
    Protocol,        // handshake/negotiation/host key failure
    ConnectionLost,  // session died mid-operation (incl. keepalive)
    Transfer,        // I/O failure during upload/download (bytesDone is set)
    Timeout,         // caller-specified operation timeout elapsed
    Cancelled,       // cooperative cancellation observed
    LimitExceeded,   // session or channel cap reached
    Remote           // SFTP status failure on the requested path
};

struct OpError
{
    ErrorCode code = ErrorCode::None;
    QString   message;
    quint64   bytesDone = 0;   // partial progress (transfers)

    bool isSet() const { return code != ErrorCode::None; }

    void clear()
    {
        code = ErrorCode::None;
        message.clear();
        bytesDone = 0;
    }
};

static inline void setError(OpError* err, ErrorCode code, const QString& message)
{
    if (!err) return;
    err->code = code;
    err->message = message;
}

static inline QString errorTypeName(ErrorCode c)
{
    switch (c) {
        case ErrorCode::None:           return "None";
        case ErrorCode::Validation:     return "ValidationError";
        case ErrorCode::NotFound:       return "NotFoundError";
        case ErrorCode::Authentication: return "AuthenticationError";
        case ErrorCode::Network:        return "NetworkError";
        case ErrorCode::Protocol:       return "ProtocolError";
        case ErrorCode::ConnectionLost: return "ConnectionLostError";
        case ErrorCode::Transfer:       return "TransferError";
        case ErrorCode::Timeout:        return "TimeoutError";
        case ErrorCode::Cancelled:      return "CancelledError";
        case ErrorCode::LimitExceeded:  return "LimitExceededError";
        case ErrorCode::Remote:         return "RemoteError";
    }
    return "UnknownError";
}
