// SessionRegistry.cpp
#include "SessionRegistry.h"

#include <QtConcurrent/QtConcurrent>
#include <QFutureWatcher>
#include <QUuid>
#include <QThread>
#include <QElapsedTimer>
#include <QJsonObject>
#include <QDebug>

#include <algorithm>

#include "AuditLogger.h"

static QJsonObject sessionFields(const QString& id, const QString& host, int port, const QString& user)
{
    QJsonObject f;
    f.insert("connection_id", id);
    f.insert("target", QString("%1@%2:%3").arg(user, host).arg(port));
    return f;
}

SessionRegistry::SessionRegistry(const AppConfig& config, TransportFactory factory, QObject* parent)
    : QObject(parent)
    , m_cfg(config)
    , m_factory(std::move(factory))
{
    m_probePool.setMaxThreadCount(qBound(1, m_cfg.workerThreads / 4, 4));
}

SessionRegistry::~SessionRegistry()
{
    disconnectAll();
    m_probePool.waitForDone();
}

// ------------------------------------------------------------
// connect
// ------------------------------------------------------------
bool SessionRegistry::connect(const ConnectRequest& req, QString* outId, OpError* err)
{
    if (outId) outId->clear();

    {
        QWriteLocker lock(&m_lock);
        if (m_sessions.size() + m_pendingConnects >= m_cfg.maxSessions) {
            setError(err, ErrorCode::LimitExceeded,
                     QStringLiteral("Session limit reached (%1).").arg(m_cfg.maxSessions));
            return false;
        }
        ++m_pendingConnects;
    }

    // Minted up front for log correlation; published only on success.
    const QString id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    const QString host = req.host.trimmed();
    const int port = req.port > 0 ? req.port : 22;
    const QString user = req.username.trimmed();

    qInfo().noquote() << QString("[REGISTRY] connect %1 -> %2@%3:%4 (%5)")
                         .arg(id, user, host).arg(port).arg(authMethodToString(req.authMethod));

    auto releasePending = [this]() {
        QWriteLocker lock(&m_lock);
        --m_pendingConnects;
    };

    std::unique_ptr<SshTransport> transport = m_factory ? m_factory() : nullptr;
    if (!transport) {
        releasePending();
        setError(err, ErrorCode::Protocol, QStringLiteral("No transport available."));
        return false;
    }

    QElapsedTimer timer;
    timer.start();

    OpError openErr;
    if (!transport->open(req, &openErr)) {
        releasePending();

        qWarning().noquote() << QString("[REGISTRY] connect %1 failed after %2 ms: %3 (%4)")
                                .arg(id).arg(timer.elapsed())
                                .arg(openErr.message, errorTypeName(openErr.code));

        QJsonObject f = sessionFields(id, host, port, user);
        f.insert("error_type", errorTypeName(openErr.code));
        f.insert("duration_ms", (qint64)timer.elapsed());
        AuditLogger::writeEvent("session.connect_failed", f);

        if (err) *err = openErr;
        return false;
    }

    const QString kex = transport->negotiatedKex();

    QSharedPointer<TransportSession> session(
        new TransportSession(id, req, std::move(transport),
                             m_cfg.maxChannelsPerSession, m_cfg.channelWaitMs));

    session->setFaultHandler([this](const QString& sid, const QString& reason) {
        markLost(sid, reason);
    });

    {
        QWriteLocker lock(&m_lock);
        --m_pendingConnects;
        m_sessions.insert(id, session);
    }
    session->markReady();

    qInfo().noquote() << QString("[REGISTRY] session %1 ready in %2 ms kex='%3' (sessions=%4)")
                         .arg(id).arg(timer.elapsed())
                         .arg(kex.isEmpty() ? QStringLiteral("?") : kex)
                         .arg(count());

    QJsonObject f = sessionFields(id, host, port, user);
    f.insert("auth", authMethodToString(req.authMethod));
    f.insert("duration_ms", (qint64)timer.elapsed());
    if (!kex.isEmpty()) f.insert("kex", kex);
    AuditLogger::writeEvent("session.connect", f);

    QMetaObject::invokeMethod(this, [this, id]() {
        startKeepalive(id);
        emit sessionOpened(id);
    }, Qt::QueuedConnection);

    if (outId) *outId = id;
    return true;
}

// ------------------------------------------------------------
// lookup / list
// ------------------------------------------------------------
QSharedPointer<TransportSession> SessionRegistry::lookup(const QString& id, OpError* err) const
{
    QReadLocker lock(&m_lock);

    const auto it = m_sessions.constFind(id);
    if (it != m_sessions.constEnd())
        return it.value();

    if (m_lost.contains(id)) {
        setError(err, ErrorCode::ConnectionLost,
                 QStringLiteral("Connection %1 was lost.").arg(id));
    } else {
        setError(err, ErrorCode::NotFound,
                 QStringLiteral("No connection with id %1.").arg(id));
    }
    return QSharedPointer<TransportSession>();
}

QVector<SessionSummary> SessionRegistry::list() const
{
    QVector<SessionSummary> out;
    {
        QReadLocker lock(&m_lock);
        out.reserve(m_sessions.size());
        for (auto it = m_sessions.constBegin(); it != m_sessions.constEnd(); ++it)
            out.push_back(it.value()->summary());
    }

    std::stable_sort(out.begin(), out.end(), [](const SessionSummary& a, const SessionSummary& b) {
        if (a.connectedSince != b.connectedSince)
            return a.connectedSince < b.connectedSince;
        return a.id < b.id;
    });
    return out;
}

int SessionRegistry::count() const
{
    QReadLocker lock(&m_lock);
    return m_sessions.size();
}

// ------------------------------------------------------------
// disconnect
// ------------------------------------------------------------
bool SessionRegistry::disconnect(const QString& id, OpError* err)
{
    QSharedPointer<TransportSession> session;
    {
        QWriteLocker lock(&m_lock);
        session = m_sessions.take(id);
    }

    if (!session) {
        setError(err, ErrorCode::NotFound, QStringLiteral("No connection with id %1.").arg(id));
        return false;
    }

    const SessionSummary s = session->summary();
    session->close();

    qInfo().noquote() << QString("[REGISTRY] session %1 disconnected (sessions=%2)").arg(id).arg(count());

    QJsonObject f = sessionFields(id, s.host, s.port, s.username);
    f.insert("open_channels", s.openChannels);
    AuditLogger::writeEvent("session.disconnect", f);

    afterTeardown(id, QStringLiteral("disconnected"));
    return true;
}

int SessionRegistry::disconnectAll()
{
    QHash<QString, QSharedPointer<TransportSession>> all;
    {
        QWriteLocker lock(&m_lock);
        all.swap(m_sessions);
    }

    for (auto it = all.begin(); it != all.end(); ++it) {
        it.value()->close();
        afterTeardown(it.key(), QStringLiteral("disconnected"));
    }

    if (!all.isEmpty()) {
        qInfo().noquote() << QString("[REGISTRY] disconnectAll closed %1 session(s)").arg(all.size());
        AuditLogger::writeEvent("session.disconnect_all", QJsonObject{{"count", all.size()}});
    }
    return all.size();
}

// ------------------------------------------------------------
// Faults (any thread)
// ------------------------------------------------------------
void SessionRegistry::markLost(const QString& id, const QString& reason)
{
    QSharedPointer<TransportSession> session;
    {
        QWriteLocker lock(&m_lock);
        session = m_sessions.take(id);
        if (!session)
            return;
        rememberLostLocked(id);
    }

    const SessionSummary s = session->summary();
    session->close(SessionState::Error);

    qWarning().noquote() << QString("[REGISTRY] session %1 lost: %2 (sessions=%3)")
                            .arg(id, reason).arg(count());

    QJsonObject f = sessionFields(id, s.host, s.port, s.username);
    f.insert("reason", reason);
    AuditLogger::writeEvent("session.lost", f);

    afterTeardown(id, reason);
}

void SessionRegistry::rememberLostLocked(const QString& id)
{
    if (m_cfg.lostSessionMemory <= 0)
        return;

    m_lost.insert(id);
    m_lostOrder.enqueue(id);
    while (m_lostOrder.size() > m_cfg.lostSessionMemory)
        m_lost.remove(m_lostOrder.dequeue());
}

void SessionRegistry::afterTeardown(const QString& id, const QString& reason)
{
    if (QThread::currentThread() == thread()) {
        stopKeepalive(id);
        emit sessionClosed(id, reason);
        return;
    }

    QMetaObject::invokeMethod(this, [this, id, reason]() {
        stopKeepalive(id);
        emit sessionClosed(id, reason);
    }, Qt::QueuedConnection);
}

// ------------------------------------------------------------
// Keepalive (registry thread)
// ------------------------------------------------------------
void SessionRegistry::startKeepalive(const QString& id)
{
    if (m_cfg.keepaliveIntervalMs <= 0 || m_timers.contains(id))
        return;

    // Session may already be gone if disconnect raced the queued start.
    {
        QReadLocker lock(&m_lock);
        if (!m_sessions.contains(id))
            return;
    }

    auto* t = new QTimer(this);
    t->setInterval(m_cfg.keepaliveIntervalMs);
    QObject::connect(t, &QTimer::timeout, this, [this, id]() { onKeepaliveTick(id); });
    m_timers.insert(id, t);
    t->start();

    qDebug().noquote() << QString("[REGISTRY] keepalive %1 every %2 ms (max missed %3)")
                          .arg(id).arg(m_cfg.keepaliveIntervalMs).arg(m_cfg.keepaliveMaxMissed);
}

void SessionRegistry::stopKeepalive(const QString& id)
{
    QTimer* t = m_timers.take(id);
    if (t) {
        t->stop();
        t->deleteLater();
    }
}

void SessionRegistry::onKeepaliveTick(const QString& id)
{
    if (m_probing.contains(id))
        return;   // previous probe still in flight

    QSharedPointer<TransportSession> session = lookup(id, nullptr);
    if (!session) {
        stopKeepalive(id);
        return;
    }

    m_probing.insert(id);

    auto* w = new QFutureWatcher<QString>(this);
    QObject::connect(w, &QFutureWatcher<QString>::finished, this, [this, w, id, session]() {
        const QString failure = w->result();
        w->deleteLater();
        m_probing.remove(id);

        if (failure.isEmpty()) {
            session->resetMissedProbes();
            return;
        }

        const int missed = session->recordMissedProbe();
        qWarning().noquote() << QString("[REGISTRY] keepalive %1 missed %2/%3: %4")
                                .arg(id).arg(missed).arg(m_cfg.keepaliveMaxMissed).arg(failure);

        if (missed >= m_cfg.keepaliveMaxMissed)
            markLost(id, QStringLiteral("keepalive: peer unresponsive after %1 probes").arg(missed));
    });

    // Empty result = probe answered.
    w->setFuture(QtConcurrent::run(&m_probePool, [session]() -> QString {
        OpError e;
        if (session->probe(&e))
            return QString();
        return e.message.isEmpty() ? QStringLiteral("probe failed") : e.message;
    }));
}
