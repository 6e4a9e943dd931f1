// Dispatcher.cpp
#include "Dispatcher.h"

#include <QtConcurrent/QtConcurrent>
#include <QFutureInterface>
#include <QJsonArray>
#include <QJsonValue>
#include <QJsonDocument>
#include <QMutexLocker>
#include <QDebug>

#include <exception>

#include "SessionRegistry.h"
#include "Logger.h"

// =====================================================
// Envelopes
// =====================================================

static QJsonObject okEnvelope(const QJsonValue& data)
{
    QJsonObject o;
    o.insert("success", true);
    o.insert("data", data);
    return o;
}

static QJsonObject validationEnvelope(const QStringList& reasons)
{
    QJsonObject o;
    o.insert("success", false);
    o.insert("error", QString("Validation failed: %1").arg(reasons.join("; ")));
    o.insert("code", QStringLiteral("VALIDATION_ERROR"));
    o.insert("details", QJsonArray::fromStringList(reasons));
    return o;
}

static QJsonObject handlerEnvelope(const OpError& e)
{
    QJsonObject o;
    o.insert("success", false);
    o.insert("error", e.message.isEmpty() ? errorTypeName(e.code) : e.message);
    o.insert("code", QStringLiteral("HANDLER_ERROR"));
    o.insert("errorType", errorTypeName(e.code));
    if (e.code == ErrorCode::Transfer || e.code == ErrorCode::Cancelled)
        o.insert("bytesTransferred", (qint64)e.bytesDone);
    return o;
}

static QFuture<QJsonObject> readyFuture(const QJsonObject& o)
{
    QFutureInterface<QJsonObject> fi;
    fi.reportStarted();
    fi.reportResult(o);
    fi.reportFinished();
    return fi.future();
}

// =====================================================
// JSON shapes
// =====================================================

static QJsonObject entryToJson(const DirectoryEntry& e)
{
    QJsonObject o;
    o.insert("name", e.name);
    o.insert("path", e.fullPath);
    if (!e.relativePath.isEmpty())
        o.insert("relativePath", e.relativePath);
    o.insert("type", entryKindToString(e.kind));
    o.insert("size", (qint64)e.size);
    o.insert("permissions", (qint64)(e.perms & 07777));
    o.insert("modifyTime", e.mtime);
    if (!e.linkTarget.isEmpty())
        o.insert("linkTarget", e.linkTarget);
    if (!e.error.isEmpty())
        o.insert("error", e.error);
    return o;
}

static QJsonObject listingToJson(const DirectoryListing& l, bool recursive)
{
    QJsonArray entries;
    for (const DirectoryEntry& e : l.entries)
        entries.push_back(entryToJson(e));

    QJsonObject o;
    o.insert("path", l.path);
    o.insert("entries", entries);

    if (recursive) {
        QJsonArray errors;
        for (const ListingError& le : l.errors) {
            QJsonObject x;
            x.insert("path", le.path);
            x.insert("relativePath", le.relativePath);
            x.insert("message", le.message);
            errors.push_back(x);
        }
        o.insert("errors", errors);
        o.insert("truncated", l.truncated);
    }
    return o;
}

static QJsonObject transferToJson(const TransferResult& r)
{
    QJsonObject o;
    o.insert("direction", transferDirectionToString(r.direction));
    o.insert("localPath", r.localPath);
    o.insert("remotePath", r.remotePath);
    o.insert("bytesTransferred", (qint64)r.bytesTransferred);
    o.insert("totalBytes", (qint64)r.totalBytes);
    o.insert("durationMs", r.durationMs);
    o.insert("atomic", r.atomic);
    return o;
}

static QJsonObject summaryToJson(const SessionSummary& s)
{
    QJsonObject o;
    o.insert("connectionId", s.id);
    o.insert("host", s.host);
    o.insert("port", s.port);
    o.insert("username", s.username);
    o.insert("authType", authMethodToString(s.authMethod));
    o.insert("connectedSince", s.connectedSince.toString(Qt::ISODateWithMs));
    o.insert("lastActivity", s.lastActivity.toString(Qt::ISODateWithMs));
    o.insert("state", sessionStateToString(s.state));
    o.insert("openChannels", s.openChannels);
    return o;
}

// =====================================================
// Dispatcher
// =====================================================

Dispatcher::Dispatcher(SessionRegistry* registry, const AppConfig& config, QObject* parent)
    : QObject(parent)
    , m_registry(registry)
    , m_cfg(config)
    , m_executor(registry, config.maxBufferedOutputBytes, config.commandAuditMode)
    , m_lister(registry, config.listMaxDepth, config.listMaxEntries)
    , m_transfers(registry, TransferEngine::Options{config.transferChunkBytes, config.tempSuffix})
{
    m_pool.setMaxThreadCount(qMax(1, m_cfg.workerThreads));
    registerRoutes();
}

Dispatcher::~Dispatcher()
{
    {
        QMutexLocker lock(&m_tokenMutex);
        for (auto it = m_tokens.begin(); it != m_tokens.end(); ++it)
            it.value().cancel();
    }
    m_pool.waitForDone();
}

QStringList Dispatcher::operations() const
{
    QStringList ops = m_routes.keys();
    ops.sort();
    return ops;
}

QFuture<QJsonObject> Dispatcher::dispatch(const QString& op, const QJsonObject& request)
{
    const auto it = m_routes.constFind(op);
    if (it == m_routes.constEnd()) {
        qWarning().noquote() << QString("[DISPATCH] unknown operation '%1'").arg(op);
        OpError e;
        setError(&e, ErrorCode::NotFound, QString("Unknown operation: %1").arg(op));
        return readyFuture(handlerEnvelope(e));
    }

    qDebug().noquote() << QString("[DISPATCH] %1 %2")
                          .arg(op, QString::fromUtf8(QJsonDocument(Logger::redact(request))
                                                         .toJson(QJsonDocument::Compact)));
    return it.value()(request);
}

QJsonObject Dispatcher::call(const QString& op, const QJsonObject& request)
{
    QFuture<QJsonObject> f = dispatch(op, request);
    f.waitForFinished();
    return f.result();
}

bool Dispatcher::cancel(const QString& requestId)
{
    QMutexLocker lock(&m_tokenMutex);
    const auto it = m_tokens.constFind(requestId);
    if (it == m_tokens.constEnd())
        return false;

    it.value().cancel();
    qInfo().noquote() << QString("[DISPATCH] cancel requested for %1").arg(requestId);
    return true;
}

bool Dispatcher::beginTracked(const QString& requestId, CancelToken* token)
{
    if (requestId.isEmpty())
        return true;

    QMutexLocker lock(&m_tokenMutex);
    if (m_tokens.contains(requestId))
        return false;
    m_tokens.insert(requestId, *token);
    return true;
}

void Dispatcher::endTracked(const QString& requestId)
{
    if (requestId.isEmpty())
        return;

    QMutexLocker lock(&m_tokenMutex);
    m_tokens.remove(requestId);
}

// Validator middleware: identical shape for every parameterised operation.
template <typename T>
void Dispatcher::addValidatedRoute(const QString& op,
                                   std::function<Validator::Validated<T>(const QJsonObject&)> validate,
                                   std::function<bool(const T&, QJsonValue*, OpError*)> handler)
{
    m_routes.insert(op, [this, op, validate, handler](const QJsonObject& request) -> QFuture<QJsonObject> {
        const Validator::Validated<T> v = validate(request);
        if (!v.accepted) {
            qInfo().noquote() << QString("[DISPATCH] %1 rejected: %2").arg(op, v.reasons.join("; "));
            return readyFuture(validationEnvelope(v.reasons));
        }

        const T accepted = v.value;
        return QtConcurrent::run(&m_pool, [op, handler, accepted]() -> QJsonObject {
            QJsonValue data;
            OpError e;
            try {
                if (handler(accepted, &data, &e))
                    return okEnvelope(data);
            } catch (const std::exception& ex) {
                setError(&e, ErrorCode::Protocol, QString("Internal error: %1").arg(QString::fromLocal8Bit(ex.what())));
            }

            if (!e.isSet())
                setError(&e, ErrorCode::Protocol, QStringLiteral("Operation failed."));

            qWarning().noquote() << QString("[DISPATCH] %1 failed: %2 (%3)")
                                    .arg(op, e.message, errorTypeName(e.code));
            return handlerEnvelope(e);
        });
    });
}

void Dispatcher::registerRoutes()
{
    using namespace Validator;

    addValidatedRoute<ConnectRequest>("connect", validateConnect,
        [this](const ConnectRequest& req, QJsonValue* data, OpError* err) {
            QString id;
            if (!m_registry->connect(req, &id, err))
                return false;

            QJsonObject o;
            o.insert("connectionId", id);
            o.insert("host", req.host);
            o.insert("port", req.port);
            o.insert("username", req.username);
            *data = o;
            return true;
        });

    addValidatedRoute<CommandRequest>("executeCommand", validateExecute,
        [this](const CommandRequest& req, QJsonValue* data, OpError* err) {
            CancelToken token;
            TrackedRequest tracked(this, req.requestId, &token);
            if (!tracked.held()) {
                setError(err, ErrorCode::Validation, QString("requestId %1 is already in use.").arg(req.requestId));
                return false;
            }

            CommandExecutor::OutputSink sink;
            if (req.stream) {
                const QString rid = req.requestId;
                sink = [this, rid](const QByteArray& chunk, bool isStderr) {
                    emit commandOutput(rid, chunk, isStderr);
                };
            }

            const int timeoutMs = req.timeoutMs > 0 ? req.timeoutMs : m_cfg.commandTimeoutMs;

            CommandResult r;
            if (!m_executor.execute(req.connectionId, req.command, timeoutMs, &r, err, sink, &token))
                return false;

            QJsonObject o;
            o.insert("stdout", QString::fromUtf8(r.stdoutData));
            o.insert("stderr", QString::fromUtf8(r.stderrData));
            o.insert("exitCode", r.exitCode);
            o.insert("durationMs", r.durationMs);
            o.insert("truncated", r.truncated);
            o.insert("streamed", r.streamed);
            *data = o;
            return true;
        });

    addValidatedRoute<PathRequest>("listDirectory", validateList,
        [this](const PathRequest& req, QJsonValue* data, OpError* err) {
            DirectoryListing l;
            if (!m_lister.list(req.connectionId, req.remotePath, &l, err))
                return false;
            *data = listingToJson(l, false);
            return true;
        });

    addValidatedRoute<PathRequest>("listDirectoryRecursive", validateList,
        [this](const PathRequest& req, QJsonValue* data, OpError* err) {
            DirectoryListing l;
            if (!m_lister.listRecursive(req.connectionId, req.remotePath, &l, err))
                return false;
            *data = listingToJson(l, true);
            return true;
        });

    const ValidationPolicy policy{m_cfg.allowedLocalRoots};
    auto validateTransferWithPolicy = [policy](const QJsonObject& r) {
        return validateTransfer(r, policy);
    };

    auto runTransfer = [this](TransferDirection dir, const TransferRequest& req, QJsonValue* data, OpError* err) {
        CancelToken token;
        TrackedRequest tracked(this, req.requestId, &token);
        if (!tracked.held()) {
            setError(err, ErrorCode::Validation, QString("requestId %1 is already in use.").arg(req.requestId));
            return false;
        }

        const QString rid = req.requestId;
        TransferEngine::ProgressFn progress = [this, rid](const TransferTask& t) {
            emit transferProgress(rid, t.bytesDone, t.totalKnown ? t.totalBytes : 0);
        };

        const bool atomic = req.atomicSet ? req.atomic : m_cfg.atomicTransfers;

        TransferResult r;
        const bool ok = (dir == TransferDirection::Upload)
            ? m_transfers.upload(req.connectionId, req.localPath, req.remotePath, atomic, &r, err, progress, &token)
            : m_transfers.download(req.connectionId, req.remotePath, req.localPath, atomic, &r, err, progress, &token);
        if (!ok)
            return false;

        *data = transferToJson(r);
        return true;
    };

    addValidatedRoute<TransferRequest>("uploadFile", validateTransferWithPolicy,
        [runTransfer](const TransferRequest& req, QJsonValue* data, OpError* err) {
            return runTransfer(TransferDirection::Upload, req, data, err);
        });

    addValidatedRoute<TransferRequest>("downloadFile", validateTransferWithPolicy,
        [runTransfer](const TransferRequest& req, QJsonValue* data, OpError* err) {
            return runTransfer(TransferDirection::Download, req, data, err);
        });

    addValidatedRoute<SessionRequest>("disconnect", validateSession,
        [this](const SessionRequest& req, QJsonValue* data, OpError* err) {
            if (!m_registry->disconnect(req.connectionId, err))
                return false;
            QJsonObject o;
            o.insert("connectionId", req.connectionId);
            o.insert("disconnected", true);
            *data = o;
            return true;
        });

    // Answered on the caller's thread: no I/O involved.
    m_routes.insert("cancelOperation", [this](const QJsonObject& request) -> QFuture<QJsonObject> {
        const Validated<CancelRequest> v = validateCancel(request);
        if (!v.accepted)
            return readyFuture(validationEnvelope(v.reasons));

        QJsonObject o;
        o.insert("requestId", v.value.requestId);
        o.insert("cancelled", cancel(v.value.requestId));
        return readyFuture(okEnvelope(o));
    });

    // Parameterless read: no validator.
    m_routes.insert("getConnections", [this](const QJsonObject&) -> QFuture<QJsonObject> {
        QJsonArray arr;
        for (const SessionSummary& s : m_registry->list())
            arr.push_back(summaryToJson(s));
        return readyFuture(okEnvelope(arr));
    });
}
