// Validator.cpp
#include "Validator.h"

#include <QRegularExpression>
#include <QJsonValue>
#include <QFileInfo>
#include <QDir>

#include <cmath>

namespace {

const int kMaxHostLen     = 255;
const int kMaxUserLen     = 32;
const int kMaxPasswordLen = 256;
const int kMaxCommandLen  = 4096;
const int kMaxPathLen     = 4096;
const int kMaxCommandTimeoutMs = 3600 * 1000;
const double kMaxExactInteger = 9007199254740992.0;   // 2^53

bool hasControlChars(const QString& s)
{
    for (const QChar c : s) {
        if (c.unicode() < 0x20 || c.unicode() == 0x7f)
            return true;
    }
    return false;
}

// Reads an optional/required string field. Wrong type is a reason.
bool readString(const QJsonObject& o, const char* key, QString* out,
                QStringList* reasons, bool required)
{
    const QJsonValue v = o.value(QLatin1String(key));
    if (v.isUndefined() || v.isNull()) {
        if (required) reasons->push_back(QString("%1 is required").arg(QLatin1String(key)));
        return false;
    }
    if (!v.isString()) {
        reasons->push_back(QString("%1 must be a string").arg(QLatin1String(key)));
        return false;
    }
    *out = v.toString();
    return true;
}

// Integral JSON number (JSON has only doubles).
bool readInt(const QJsonObject& o, const char* key, qint64* out, QStringList* reasons)
{
    const QJsonValue v = o.value(QLatin1String(key));
    if (v.isUndefined() || v.isNull())
        return false;

    const double d = v.toDouble();
    if (!v.isDouble() || std::floor(d) != d || std::isinf(d)) {
        reasons->push_back(QString("%1 must be an integer").arg(QLatin1String(key)));
        return false;
    }
    // Beyond 2^53 a double no longer holds exact integers; far beyond it the
    // cast below is undefined.
    if (std::fabs(d) > kMaxExactInteger) {
        reasons->push_back(QString("%1 is out of range").arg(QLatin1String(key)));
        return false;
    }
    *out = (qint64)d;
    return true;
}

bool readBool(const QJsonObject& o, const char* key, bool* out, QStringList* reasons)
{
    const QJsonValue v = o.value(QLatin1String(key));
    if (v.isUndefined() || v.isNull())
        return false;
    if (!v.isBool()) {
        reasons->push_back(QString("%1 must be a boolean").arg(QLatin1String(key)));
        return false;
    }
    *out = v.toBool();
    return true;
}

bool isIPv4Shape(const QString& host)
{
    static const QRegularExpression re(QStringLiteral("^(\\d{1,3}\\.){3}\\d{1,3}$"));
    return re.match(host).hasMatch();
}

bool isValidIPv4(const QString& host)
{
    const QStringList octets = host.split('.');
    if (octets.size() != 4) return false;
    for (const QString& o : octets) {
        bool ok = false;
        const int n = o.toInt(&ok, 10);
        if (!ok || n < 0 || n > 255) return false;
    }
    return true;
}

bool isValidIPv6(const QString& host)
{
    static const QRegularExpression re(
        QStringLiteral("^(([0-9a-fA-F]{0,4}:){2,7}[0-9a-fA-F]{0,4}|::1|::)$"));
    if (!re.match(host).hasMatch())
        return false;
    return host.count(QStringLiteral("::")) <= 1;
}

bool isValidHostname(const QString& host)
{
    static const QRegularExpression re(QStringLiteral(
        "^([a-zA-Z0-9]([a-zA-Z0-9-]{0,61}[a-zA-Z0-9])?\\.)*"
        "[a-zA-Z0-9]([a-zA-Z0-9-]{0,61}[a-zA-Z0-9])?$"));
    return re.match(host).hasMatch();
}

void requireIdentifier(const QJsonObject& o, QString* out, QStringList* reasons)
{
    if (!readString(o, "connectionId", out, reasons, true))
        return;
    if (out->trimmed().isEmpty())
        reasons->push_back("connectionId must not be empty");
    else if (!Validator::isValidIdentifier(*out))
        reasons->push_back("connectionId has an invalid format");
}

void requireRemotePath(const QJsonObject& o, QString* out, QStringList* reasons)
{
    if (!readString(o, "remotePath", out, reasons, true))
        return;
    if (out->trimmed().isEmpty())
        reasons->push_back("remotePath must not be empty");
    else if (!Validator::isSafeRemotePath(*out))
        reasons->push_back("remotePath is too long or contains control characters");
}

void optionalRequestId(const QJsonObject& o, QString* out, QStringList* reasons)
{
    if (readString(o, "requestId", out, reasons, false)) {
        if (out->isEmpty() || out->size() > 128 || hasControlChars(*out))
            reasons->push_back("requestId must be 1..128 printable characters");
    }
}

// Canonical form of a path that may not exist yet: the deepest existing
// ancestor is canonicalised (symlinks resolved) and the rest appended.
QString resolveLocal(const QString& path)
{
    QString abs = QDir::cleanPath(QFileInfo(path).absoluteFilePath());
    QString tail;

    while (true) {
        const QFileInfo fi(abs);
        if (fi.exists()) {
            const QString canon = fi.canonicalFilePath();
            const QString base = canon.isEmpty() ? abs : canon;
            return tail.isEmpty() ? base : QDir::cleanPath(base + "/" + tail);
        }

        const int slash = abs.lastIndexOf('/');
        if (slash <= 0)
            return QDir::cleanPath(abs + (tail.isEmpty() ? QString() : "/" + tail));

        const QString leaf = abs.mid(slash + 1);
        tail = tail.isEmpty() ? leaf : leaf + "/" + tail;
        abs = abs.left(slash);
    }
}

} // namespace

namespace Validator {

// ------------------------------------------------------------
// Predicates
// ------------------------------------------------------------
bool isValidHost(const QString& host)
{
    if (host.isEmpty() || host.size() > kMaxHostLen)
        return false;

    if (isIPv4Shape(host))
        return isValidIPv4(host);

    return isValidIPv6(host) || isValidHostname(host);
}

bool isValidUsername(const QString& user)
{
    static const QRegularExpression re(QStringLiteral("^[a-zA-Z0-9._-]+$"));
    return !user.isEmpty() && user.size() <= kMaxUserLen && re.match(user).hasMatch();
}

bool isValidIdentifier(const QString& id)
{
    static const QRegularExpression re(QStringLiteral(
        "^[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}$"));
    return re.match(id).hasMatch();
}

bool isSafeLocalPath(const QString& path)
{
    if (path.trimmed().isEmpty() || path.size() > kMaxPathLen)
        return false;

    static const QRegularExpression invalid(QStringLiteral("[<>\"|?*\\x00-\\x1f]"));
    if (invalid.match(path).hasMatch())
        return false;

    const QStringList parts = path.split(QRegularExpression(QStringLiteral("[/\\\\]")));
    return !parts.contains(QStringLiteral(".."));
}

bool isSafeRemotePath(const QString& path)
{
    return !path.trimmed().isEmpty() && path.size() <= kMaxPathLen && !hasControlChars(path);
}

bool isInsideAllowedRoots(const QString& localPath, const QStringList& roots)
{
    if (roots.isEmpty())
        return true;

    const QString target = resolveLocal(localPath);
    for (const QString& r : roots) {
        const QString root = resolveLocal(r);
        if (root.isEmpty())
            continue;
        if (target == root)
            return true;
        const QString prefix = root.endsWith('/') ? root : root + "/";
        if (target.startsWith(prefix))
            return true;
    }
    return false;
}

// ------------------------------------------------------------
// connect
// ------------------------------------------------------------
Validated<ConnectRequest> validateConnect(const QJsonObject& req)
{
    QStringList reasons;
    ConnectRequest c;

    if (readString(req, "host", &c.host, &reasons, true)) {
        c.host = c.host.trimmed();
        if (c.host.isEmpty())
            reasons.push_back("host must not be empty");
        else if (!isValidHost(c.host))
            reasons.push_back("host is not a valid hostname or IP address");
    }

    qint64 port = 22;
    if (readInt(req, "port", &port, &reasons)) {
        if (port < 1 || port > 65535)
            reasons.push_back("port must be between 1 and 65535");
    }
    c.port = (int)qBound<qint64>(1, port, 65535);

    if (readString(req, "username", &c.username, &reasons, true)) {
        if (c.username.isEmpty())
            reasons.push_back("username must not be empty");
        else if (!isValidUsername(c.username))
            reasons.push_back("username must be at most 32 characters of [A-Za-z0-9._-]");
    }

    const bool hasPassword = readString(req, "password", &c.password, &reasons, false)
                             && !c.password.isEmpty();
    const bool hasKey = readString(req, "privateKey", &c.privateKeyPath, &reasons, false)
                        && !c.privateKeyPath.trimmed().isEmpty();
    readString(req, "passphrase", &c.passphrase, &reasons, false);

    if (hasPassword && hasKey) {
        reasons.push_back("exactly one authentication method is allowed: password or privateKey, not both");
    } else if (!hasPassword && !hasKey) {
        reasons.push_back("an authentication method is required: password or privateKey");
    }

    if (hasPassword && c.password.size() > kMaxPasswordLen)
        reasons.push_back("password must be at most 256 characters");

    if (hasKey && (hasControlChars(c.privateKeyPath) || c.privateKeyPath.size() > kMaxPathLen))
        reasons.push_back("privateKey path contains invalid characters");

    if (!c.passphrase.isEmpty() && !hasKey)
        reasons.push_back("passphrase is only allowed together with privateKey");

    c.authMethod = hasKey ? AuthMethod::PrivateKey : AuthMethod::Password;

    QString authType;
    if (readString(req, "authType", &authType, &reasons, false)) {
        if (authType != "password" && authType != "key") {
            reasons.push_back("authType must be \"password\" or \"key\"");
        } else if ((authType == "password" && hasKey) || (authType == "key" && hasPassword)) {
            reasons.push_back(QString("authType \"%1\" does not match the supplied credentials").arg(authType));
        }
    }

    qint64 timeout = 0;
    if (readInt(req, "timeout", &timeout, &reasons)) {
        if (timeout < 1 || timeout > 300)
            reasons.push_back("timeout must be between 1 and 300 seconds");
        else
            c.timeoutSec = (int)timeout;
    }

    if (!reasons.isEmpty())
        return Validated<ConnectRequest>::reject(reasons);
    return Validated<ConnectRequest>::accept(c);
}

// ------------------------------------------------------------
// executeCommand
// ------------------------------------------------------------
Validated<CommandRequest> validateExecute(const QJsonObject& req)
{
    QStringList reasons;
    CommandRequest r;

    requireIdentifier(req, &r.connectionId, &reasons);

    if (readString(req, "command", &r.command, &reasons, true)) {
        if (r.command.trimmed().isEmpty())
            reasons.push_back("command must not be empty");
        else if (r.command.size() > kMaxCommandLen)
            reasons.push_back("command must be at most 4096 characters");
        else if (r.command.contains(QChar(0)))
            reasons.push_back("command must not contain NUL characters");
    }

    qint64 timeoutMs = 0;
    if (readInt(req, "timeoutMs", &timeoutMs, &reasons)) {
        if (timeoutMs < 1 || timeoutMs > kMaxCommandTimeoutMs)
            reasons.push_back("timeoutMs must be between 1 and 3600000");
        else
            r.timeoutMs = (int)timeoutMs;
    }

    readBool(req, "stream", &r.stream, &reasons);
    optionalRequestId(req, &r.requestId, &reasons);
    if (r.stream && r.requestId.isEmpty())
        reasons.push_back("requestId is required when stream is true");

    if (!reasons.isEmpty())
        return Validated<CommandRequest>::reject(reasons);
    return Validated<CommandRequest>::accept(r);
}

// ------------------------------------------------------------
// listDirectory / listDirectoryRecursive
// ------------------------------------------------------------
Validated<PathRequest> validateList(const QJsonObject& req)
{
    QStringList reasons;
    PathRequest r;

    requireIdentifier(req, &r.connectionId, &reasons);
    requireRemotePath(req, &r.remotePath, &reasons);

    if (!reasons.isEmpty())
        return Validated<PathRequest>::reject(reasons);
    return Validated<PathRequest>::accept(r);
}

// ------------------------------------------------------------
// uploadFile / downloadFile
// ------------------------------------------------------------
Validated<TransferRequest> validateTransfer(const QJsonObject& req, const ValidationPolicy& policy)
{
    QStringList reasons;
    TransferRequest r;

    requireIdentifier(req, &r.connectionId, &reasons);
    requireRemotePath(req, &r.remotePath, &reasons);

    if (readString(req, "localPath", &r.localPath, &reasons, true)) {
        if (r.localPath.trimmed().isEmpty())
            reasons.push_back("localPath must not be empty");
        else if (!isSafeLocalPath(r.localPath))
            reasons.push_back("localPath contains invalid characters or a '..' segment");
        else if (!isInsideAllowedRoots(r.localPath, policy.allowedLocalRoots))
            reasons.push_back("localPath is outside the allowed local directories");
    }

    r.atomicSet = readBool(req, "atomic", &r.atomic, &reasons);
    optionalRequestId(req, &r.requestId, &reasons);

    if (!reasons.isEmpty())
        return Validated<TransferRequest>::reject(reasons);
    return Validated<TransferRequest>::accept(r);
}

// ------------------------------------------------------------
// disconnect / cancelOperation
// ------------------------------------------------------------
Validated<SessionRequest> validateSession(const QJsonObject& req)
{
    QStringList reasons;
    SessionRequest r;
    requireIdentifier(req, &r.connectionId, &reasons);

    if (!reasons.isEmpty())
        return Validated<SessionRequest>::reject(reasons);
    return Validated<SessionRequest>::accept(r);
}

Validated<CancelRequest> validateCancel(const QJsonObject& req)
{
    QStringList reasons;
    CancelRequest r;

    if (readString(req, "requestId", &r.requestId, &reasons, true) && r.requestId.isEmpty())
        reasons.push_back("requestId must not be empty");

    if (!reasons.isEmpty())
        return Validated<CancelRequest>::reject(reasons);
    return Validated<CancelRequest>::accept(r);
}

// ------------------------------------------------------------
// Bookmarks / profiles
// ------------------------------------------------------------
Validated<QJsonObject> validateBookmark(const QJsonObject& b)
{
    QStringList reasons;
    QString id, name, type, path;

    if (readString(b, "id", &id, &reasons, true) && id.trimmed().isEmpty())
        reasons.push_back("id must not be empty");
    if (readString(b, "name", &name, &reasons, true) && name.trimmed().isEmpty())
        reasons.push_back("name must not be empty");

    if (readString(b, "type", &type, &reasons, true)) {
        if (type != "server" && type != "directory")
            reasons.push_back("type must be \"server\" or \"directory\"");
        else if (type == "directory") {
            if (!readString(b, "path", &path, &reasons, false) || path.trimmed().isEmpty())
                reasons.push_back("path is required for directory bookmarks");
        }
    }

    const QJsonValue created = b.value("createdAt");
    if (!created.isUndefined() && !created.isNull()) {
        if (!created.isDouble() || created.toDouble() <= 0)
            reasons.push_back("createdAt must be a positive number");
    }

    if (!reasons.isEmpty())
        return Validated<QJsonObject>::reject(reasons);
    return Validated<QJsonObject>::accept(b);
}

Validated<QJsonObject> validateProfile(const QJsonObject& p)
{
    QStringList reasons;
    QString id, name, host, user, authType;

    if (readString(p, "id", &id, &reasons, true) && id.trimmed().isEmpty())
        reasons.push_back("id must not be empty");
    if (readString(p, "name", &name, &reasons, true) && name.trimmed().isEmpty())
        reasons.push_back("name must not be empty");
    if (readString(p, "host", &host, &reasons, true) && !isValidHost(host.trimmed()))
        reasons.push_back("host is not a valid hostname or IP address");
    if (readString(p, "username", &user, &reasons, true) && !isValidUsername(user))
        reasons.push_back("username must be at most 32 characters of [A-Za-z0-9._-]");

    qint64 port = 0;
    if (readInt(p, "port", &port, &reasons) && (port < 1 || port > 65535))
        reasons.push_back("port must be between 1 and 65535");

    if (readString(p, "authType", &authType, &reasons, false)
        && authType != "password" && authType != "key") {
        reasons.push_back("authType must be \"password\" or \"key\"");
    }

    if (!reasons.isEmpty())
        return Validated<QJsonObject>::reject(reasons);
    return Validated<QJsonObject>::accept(p);
}

} // namespace Validator
