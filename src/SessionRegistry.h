// SessionRegistry.h
//
// Purpose:
//   Single authority for live sessions: identifier -> TransportSession.
//     - connect(): mint identifier, handshake + auth, publish, start keepalive
//     - lookup(): O(1) resolution used before every operation
//     - disconnect()/disconnectAll(): stop keepalive, shut transport, remove
//     - list(): snapshot ordered by connect time
//
// Thread model:
//   connect/lookup/disconnect/list may be called from any thread (the
//   Dispatcher calls them from its worker pool). The map is guarded by a
//   QReadWriteLock that is never held across I/O. Keepalive timers live on
//   the registry's thread; probes run on a private QThreadPool.
//
// Identifiers of sessions that died (keepalive or transport fault) are
// remembered for a while so lookups report ConnectionLost instead of
// NotFound.

#pragma once

#include <QObject>
#include <QHash>
#include <QSet>
#include <QQueue>
#include <QTimer>
#include <QThreadPool>
#include <QReadWriteLock>
#include <QSharedPointer>

#include "AppConfig.h"
#include "OpError.h"
#include "SshTransport.h"
#include "TransportSession.h"

class SessionRegistry : public QObject
{
    Q_OBJECT
public:
    SessionRegistry(const AppConfig& config, TransportFactory factory, QObject* parent = nullptr);
    ~SessionRegistry() override;

    // Blocking (handshake). Never retries.
    bool connect(const ConnectRequest& req, QString* outId, OpError* err);

    QSharedPointer<TransportSession> lookup(const QString& id, OpError* err) const;

    bool disconnect(const QString& id, OpError* err);
    int disconnectAll();

    QVector<SessionSummary> list() const;
    int count() const;

    const AppConfig& config() const { return m_cfg; }

signals:
    void sessionOpened(const QString& id);
    void sessionClosed(const QString& id, const QString& reason);

private:
    void markLost(const QString& id, const QString& reason);
    void rememberLostLocked(const QString& id);

    // Registry thread only.
    void startKeepalive(const QString& id);
    void stopKeepalive(const QString& id);
    void onKeepaliveTick(const QString& id);
    void afterTeardown(const QString& id, const QString& reason);

    AppConfig        m_cfg;
    TransportFactory m_factory;

    mutable QReadWriteLock m_lock;
    QHash<QString, QSharedPointer<TransportSession>> m_sessions;
    QSet<QString>   m_lost;
    QQueue<QString> m_lostOrder;
    int             m_pendingConnects = 0;

    QHash<QString, QTimer*> m_timers;
    QSet<QString>           m_probing;

    // Declared last: destroyed (and joined) first.
    QThreadPool m_probePool;
};
