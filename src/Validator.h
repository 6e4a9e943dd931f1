// Validator.h
//
// Purpose:
//   Shape/type/format checks for every parameterised operation request.
//   Each validateXxx() takes the raw request object and returns either an
//   accepted typed value or an ordered list of human-readable reasons.
//
// Rules:
//   - Pure functions: no I/O except resolving local paths against the
//     configured roots, no state, never throws.
//   - Parameterless reads (getConnections) have no validator on purpose.

#pragma once

#include <QString>
#include <QStringList>
#include <QJsonObject>

#include "SshTypes.h"

namespace Validator {

template <typename T>
struct Validated
{
    bool        accepted = false;
    T           value{};
    QStringList reasons;

    static Validated accept(const T& v)
    {
        Validated r;
        r.accepted = true;
        r.value = v;
        return r;
    }

    static Validated reject(const QStringList& why)
    {
        Validated r;
        r.reasons = why;
        return r;
    }
};

// Caller-configured restrictions (from AppConfig).
struct ValidationPolicy
{
    QStringList allowedLocalRoots;   // empty => no restriction
};

struct CommandRequest
{
    QString connectionId;
    QString command;
    int     timeoutMs = 0;          // 0 => AppConfig::commandTimeoutMs
    bool    stream = false;
    QString requestId;
};

struct PathRequest
{
    QString connectionId;
    QString remotePath;
};

struct TransferRequest
{
    QString connectionId;
    QString localPath;
    QString remotePath;
    bool    atomicSet = false;      // request overrides AppConfig::atomicTransfers
    bool    atomic = false;
    QString requestId;
};

struct SessionRequest
{
    QString connectionId;
};

struct CancelRequest
{
    QString requestId;
};

// Field-level predicates (also used by the CLI for early checks).
bool isValidHost(const QString& host);
bool isValidUsername(const QString& user);
bool isValidIdentifier(const QString& id);
bool isSafeLocalPath(const QString& path);
bool isSafeRemotePath(const QString& path);
bool isInsideAllowedRoots(const QString& localPath, const QStringList& roots);

Validated<ConnectRequest>  validateConnect(const QJsonObject& req);
Validated<CommandRequest>  validateExecute(const QJsonObject& req);
Validated<PathRequest>     validateList(const QJsonObject& req);
Validated<TransferRequest> validateTransfer(const QJsonObject& req, const ValidationPolicy& policy);
Validated<SessionRequest>  validateSession(const QJsonObject& req);
Validated<CancelRequest>   validateCancel(const QJsonObject& req);

// Persistence-layer objects: shape only, accepted as-is.
Validated<QJsonObject> validateBookmark(const QJsonObject& bookmark);
Validated<QJsonObject> validateProfile(const QJsonObject& profile);

} // namespace Validator
