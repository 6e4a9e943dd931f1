// TransportSession.h
//
// Purpose:
//   One authenticated connection to one remote host, as seen by the core.
//     - Owns the SshTransport (exclusively)
//     - Tracks lifecycle state (Connecting, Ready/Busy, Closing, Closed, Error)
//     - Bounds the number of concurrently open channels
//     - Records activity and missed keepalive probes
//
// Ownership:
//   Held in QSharedPointer. SessionRegistry owns the registered reference;
//   in-flight operations hold their own copy until they finish, so the
//   transport always outlives the channels opened on it.
//
// Secrets are never stored here: only host/port/user/auth method.

#pragma once

#include <QString>
#include <QDateTime>
#include <QMutex>
#include <QSemaphore>
#include <functional>
#include <memory>

#include "OpError.h"
#include "SshTypes.h"
#include "SshTransport.h"
#include "CancelToken.h"

class TransportSession
{
public:
    // Called (from any thread) when an operation observes that the
    // connection died underneath it.
    using FaultHandler = std::function<void(const QString& id, const QString& reason)>;

    TransportSession(const QString& id,
                     const ConnectRequest& req,
                     std::unique_ptr<SshTransport> transport,
                     int maxChannels,
                     int channelWaitMs);
    ~TransportSession();

    TransportSession(const TransportSession&) = delete;
    TransportSession& operator=(const TransportSession&) = delete;

    QString id() const { return m_id; }
    QString host() const { return m_host; }
    int port() const { return m_port; }
    QString username() const { return m_username; }
    AuthMethod authMethod() const { return m_authMethod; }
    QDateTime connectedSince() const { return m_connectedSince; }

    SessionState state() const;
    QDateTime lastActivity() const;
    int openChannels() const;
    SessionSummary summary() const;

    // Connecting -> Ready, once the registry has published the session.
    void markReady();
    void touch();

    bool isClosed() const;

    // Shuts the transport down (every open channel then fails with
    // ConnectionLost). Idempotent. finalState Error records a fault before
    // the session settles in Closed.
    void close(SessionState via = SessionState::Closing);

    // Channel slots. beginChannel waits up to channelWaitMs for a free slot.
    bool beginChannel(OpError* err, const CancelToken* cancel = nullptr);
    void endChannel();

    // Valid only between beginChannel() and endChannel().
    SshTransport* transport() const { return m_transport.get(); }

    // Keepalive
    bool probe(OpError* err);
    int recordMissedProbe();
    void resetMissedProbes();

    void setFaultHandler(const FaultHandler& handler);

    // Forwards ConnectionLost errors to the fault handler (once).
    void reportFault(const OpError& err);

private:
    const QString    m_id;
    const QString    m_host;
    const int        m_port;
    const QString    m_username;
    const AuthMethod m_authMethod;
    const QDateTime  m_connectedSince;
    const int        m_maxChannels;
    const int        m_channelWaitMs;

    std::unique_ptr<SshTransport> m_transport;

    QSemaphore m_slots;

    mutable QMutex m_stateMutex;
    SessionState m_state = SessionState::Connecting;
    QDateTime    m_lastActivity;
    int          m_openChannels = 0;
    int          m_missedProbes = 0;
    FaultHandler m_faultHandler;
};

// RAII channel slot. Operations declare it before the channel object so the
// channel is destroyed first.
class ChannelLease
{
public:
    ChannelLease(TransportSession* session, OpError* err, const CancelToken* cancel = nullptr)
        : m_session(session)
    {
        m_acquired = m_session && m_session->beginChannel(err, cancel);
    }

    ~ChannelLease()
    {
        if (m_acquired)
            m_session->endChannel();
    }

    ChannelLease(const ChannelLease&) = delete;
    ChannelLease& operator=(const ChannelLease&) = delete;

    bool acquired() const { return m_acquired; }

private:
    TransportSession* m_session = nullptr;
    bool m_acquired = false;
};
