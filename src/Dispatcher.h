// Dispatcher.h
//
// Purpose:
//   Boundary between the UI (or CLI) and the session core.
//     - Receives named operations with a JSON request
//     - Runs the Validator as middleware in front of every parameterised
//       operation (getConnections is deliberately unvalidated)
//     - Executes the accepted request on a worker pool so the event loop
//       never blocks
//     - Always answers with an envelope:
//         {success:true,  data}
//         {success:false, error, code:"VALIDATION_ERROR", details:[...]}
//         {success:false, error, code:"HANDLER_ERROR", errorType[, bytesTransferred]}
//
// Progress and streamed output are reported through signals, emitted from
// worker threads (receivers get them queued).

#pragma once

#include <QObject>
#include <QHash>
#include <QMutex>
#include <QFuture>
#include <QJsonObject>
#include <QStringList>
#include <QThreadPool>
#include <functional>

#include "AppConfig.h"
#include "OpError.h"
#include "CancelToken.h"
#include "Validator.h"
#include "CommandExecutor.h"
#include "DirectoryLister.h"
#include "TransferEngine.h"

class SessionRegistry;

class Dispatcher : public QObject
{
    Q_OBJECT
public:
    Dispatcher(SessionRegistry* registry, const AppConfig& config, QObject* parent = nullptr);
    ~Dispatcher() override;

    // Never throws; the future always yields an envelope.
    QFuture<QJsonObject> dispatch(const QString& op, const QJsonObject& request);

    // Blocking convenience (CLI, tests). Must not be called from a pool thread.
    QJsonObject call(const QString& op, const QJsonObject& request);

    QStringList operations() const;

    // Signals the in-flight operation registered under requestId.
    bool cancel(const QString& requestId);

signals:
    void transferProgress(const QString& requestId, quint64 bytesDone, quint64 totalBytes);
    void commandOutput(const QString& requestId, const QByteArray& chunk, bool isStderr);

private:
    using Route = std::function<QFuture<QJsonObject>(const QJsonObject&)>;

    template <typename T>
    void addValidatedRoute(const QString& op,
                           std::function<Validator::Validated<T>(const QJsonObject&)> validate,
                           std::function<bool(const T&, QJsonValue* data, OpError* err)> handler);

    void registerRoutes();

    // Cancel tokens keyed by requestId (empty id => untracked token).
    bool beginTracked(const QString& requestId, CancelToken* token);
    void endTracked(const QString& requestId);

    // Holds a requestId for one handler run; released on every exit path.
    class TrackedRequest
    {
    public:
        TrackedRequest(Dispatcher* d, const QString& requestId, CancelToken* token)
            : m_d(d), m_id(requestId), m_held(d->beginTracked(requestId, token)) {}
        ~TrackedRequest() { if (m_held) m_d->endTracked(m_id); }

        TrackedRequest(const TrackedRequest&) = delete;
        TrackedRequest& operator=(const TrackedRequest&) = delete;

        bool held() const { return m_held; }

    private:
        Dispatcher* m_d;
        QString     m_id;
        bool        m_held;
    };

    SessionRegistry* m_registry;
    AppConfig        m_cfg;

    CommandExecutor  m_executor;
    DirectoryLister  m_lister;
    TransferEngine   m_transfers;

    QHash<QString, Route> m_routes;

    QMutex m_tokenMutex;
    QHash<QString, CancelToken> m_tokens;

    // Declared last: joined before anything the handlers touch goes away.
    QThreadPool m_pool;
};
