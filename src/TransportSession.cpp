// TransportSession.cpp
#include "TransportSession.h"

#include <QMutexLocker>
#include <QElapsedTimer>
#include <QDebug>

// Slot waits are sliced so close() and cancellation are noticed quickly.
static const int kSlotPollMs = 50;

TransportSession::TransportSession(const QString& id,
                                   const ConnectRequest& req,
                                   std::unique_ptr<SshTransport> transport,
                                   int maxChannels,
                                   int channelWaitMs)
    : m_id(id)
    , m_host(req.host.trimmed())
    , m_port(req.port > 0 ? req.port : 22)
    , m_username(req.username.trimmed())
    , m_authMethod(req.authMethod)
    , m_connectedSince(QDateTime::currentDateTimeUtc())
    , m_maxChannels(qMax(1, maxChannels))
    , m_channelWaitMs(qMax(0, channelWaitMs))
    , m_transport(std::move(transport))
    , m_slots(qMax(1, maxChannels))
    , m_lastActivity(m_connectedSince)
{
}

TransportSession::~TransportSession()
{
    // Last reference gone: every channel is already destroyed.
    if (m_transport)
        m_transport->shutdown();
}

SessionState TransportSession::state() const
{
    QMutexLocker lock(&m_stateMutex);
    return m_state;
}

QDateTime TransportSession::lastActivity() const
{
    QMutexLocker lock(&m_stateMutex);
    return m_lastActivity;
}

int TransportSession::openChannels() const
{
    QMutexLocker lock(&m_stateMutex);
    return m_openChannels;
}

SessionSummary TransportSession::summary() const
{
    SessionSummary s;
    s.id             = m_id;
    s.host           = m_host;
    s.port           = m_port;
    s.username       = m_username;
    s.authMethod     = m_authMethod;
    s.connectedSince = m_connectedSince;

    QMutexLocker lock(&m_stateMutex);
    s.lastActivity = m_lastActivity;
    s.state        = m_state;
    s.openChannels = m_openChannels;
    return s;
}

void TransportSession::markReady()
{
    QMutexLocker lock(&m_stateMutex);
    if (m_state == SessionState::Connecting)
        m_state = (m_openChannels > 0) ? SessionState::Busy : SessionState::Ready;
}

void TransportSession::touch()
{
    QMutexLocker lock(&m_stateMutex);
    m_lastActivity = QDateTime::currentDateTimeUtc();
}

bool TransportSession::isClosed() const
{
    QMutexLocker lock(&m_stateMutex);
    return m_state == SessionState::Closing
        || m_state == SessionState::Closed
        || m_state == SessionState::Error;
}

void TransportSession::close(SessionState via)
{
    {
        QMutexLocker lock(&m_stateMutex);
        if (m_state == SessionState::Closed)
            return;
        m_state = (via == SessionState::Error) ? SessionState::Error : SessionState::Closing;
        m_faultHandler = nullptr;
    }

    if (m_transport)
        m_transport->shutdown();

    QMutexLocker lock(&m_stateMutex);
    m_state = SessionState::Closed;
}

bool TransportSession::beginChannel(OpError* err, const CancelToken* cancel)
{
    QElapsedTimer timer;
    timer.start();

    while (true) {
        if (isClosed()) {
            setError(err, ErrorCode::ConnectionLost,
                     QStringLiteral("Session %1 is closed.").arg(m_id));
            return false;
        }
        if (cancel && cancel->isCancelled()) {
            setError(err, ErrorCode::Cancelled, QStringLiteral("Operation cancelled."));
            return false;
        }

        const qint64 left = m_channelWaitMs - timer.elapsed();
        if (m_slots.tryAcquire(1, (int)qBound<qint64>(0, left, kSlotPollMs)))
            break;

        if (timer.elapsed() >= m_channelWaitMs) {
            setError(err, ErrorCode::Timeout,
                     QStringLiteral("No free channel on session %1 (limit %2) after %3 ms.")
                         .arg(m_id).arg(m_maxChannels).arg(m_channelWaitMs));
            return false;
        }
    }

    QMutexLocker lock(&m_stateMutex);
    if (m_state == SessionState::Closing || m_state == SessionState::Closed
        || m_state == SessionState::Error) {
        lock.unlock();
        m_slots.release(1);
        setError(err, ErrorCode::ConnectionLost,
                 QStringLiteral("Session %1 is closed.").arg(m_id));
        return false;
    }

    ++m_openChannels;
    if (m_state == SessionState::Ready)
        m_state = SessionState::Busy;
    m_lastActivity = QDateTime::currentDateTimeUtc();
    return true;
}

void TransportSession::endChannel()
{
    {
        QMutexLocker lock(&m_stateMutex);
        m_openChannels = qMax(0, m_openChannels - 1);
        if (m_openChannels == 0 && m_state == SessionState::Busy)
            m_state = SessionState::Ready;
        m_lastActivity = QDateTime::currentDateTimeUtc();
    }
    m_slots.release(1);
}

bool TransportSession::probe(OpError* err)
{
    if (isClosed()) {
        setError(err, ErrorCode::ConnectionLost, QStringLiteral("Session is closed."));
        return false;
    }
    if (!m_transport->isAlive()) {
        setError(err, ErrorCode::ConnectionLost, QStringLiteral("Transport is no longer connected."));
        return false;
    }
    if (!m_transport->sendKeepalive(err))
        return false;

    touch();
    return true;
}

int TransportSession::recordMissedProbe()
{
    QMutexLocker lock(&m_stateMutex);
    return ++m_missedProbes;
}

void TransportSession::resetMissedProbes()
{
    QMutexLocker lock(&m_stateMutex);
    m_missedProbes = 0;
}

void TransportSession::setFaultHandler(const FaultHandler& handler)
{
    QMutexLocker lock(&m_stateMutex);
    m_faultHandler = handler;
}

void TransportSession::reportFault(const OpError& err)
{
    if (err.code != ErrorCode::ConnectionLost)
        return;

    FaultHandler handler;
    {
        QMutexLocker lock(&m_stateMutex);
        handler = m_faultHandler;
        m_faultHandler = nullptr;
    }

    if (handler) {
        qWarning().noquote() << QString("[REGISTRY] session %1 fault: %2").arg(m_id, err.message);
        handler(m_id, err.message);
    }
}
