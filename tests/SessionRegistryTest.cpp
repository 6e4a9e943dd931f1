#include "TestHelpers.h"

#include <QSet>
#include <QSignalSpy>

#include "Validator.h"

TEST_F(FakeSessionTest, ConnectIssuesFreshIdentifiersListedInConnectOrder)
{
    makeRegistry();

    QSet<QString> seen;
    QStringList order;
    for (int i = 0; i < 5; ++i) {
        const QString id = connectOrFail();
        ASSERT_FALSE(id.isEmpty());
        EXPECT_TRUE(Validator::isValidIdentifier(id));
        EXPECT_FALSE(seen.contains(id));
        seen.insert(id);
        order << id;
        QThread::msleep(2);
    }

    const QVector<SessionSummary> list = registry->list();
    ASSERT_EQ(list.size(), 5);
    for (int i = 0; i < list.size(); ++i) {
        EXPECT_EQ(list[i].id, order[i]);
        EXPECT_EQ(list[i].host, QString("host.example"));
        EXPECT_EQ(list[i].username, QString("alice"));
        EXPECT_EQ(list[i].state, SessionState::Ready);
        EXPECT_TRUE(list[i].connectedSince.isValid());
    }
}

TEST_F(FakeSessionTest, ConnectClassifiesFailures)
{
    makeRegistry();

    ConnectRequest bad = passwordRequest();
    bad.password = "wrong";
    QString id;
    OpError err;
    EXPECT_FALSE(registry->connect(bad, &id, &err));
    EXPECT_EQ(err.code, ErrorCode::Authentication);
    EXPECT_TRUE(id.isEmpty());

    server->reachable = false;
    err.clear();
    EXPECT_FALSE(registry->connect(passwordRequest(), &id, &err));
    EXPECT_EQ(err.code, ErrorCode::Network);

    server->reachable = true;
    server->handshakeFails = true;
    err.clear();
    EXPECT_FALSE(registry->connect(passwordRequest(), &id, &err));
    EXPECT_EQ(err.code, ErrorCode::Protocol);

    EXPECT_EQ(registry->count(), 0);
}

TEST_F(FakeSessionTest, ConnectWithPrivateKey)
{
    makeRegistry();

    ConnectRequest r = passwordRequest();
    r.authMethod = AuthMethod::PrivateKey;
    r.password.clear();
    r.privateKeyPath = server->keyPath;

    QString id;
    OpError err;
    ASSERT_TRUE(registry->connect(r, &id, &err)) << err.message.toStdString();
    EXPECT_EQ(registry->list().first().authMethod, AuthMethod::PrivateKey);
}

TEST_F(FakeSessionTest, LookupUnknownIdentifierIsNotFound)
{
    makeRegistry();

    OpError err;
    EXPECT_TRUE(registry->lookup("0f8fad5b-d9cb-469f-a165-70867728950e", &err).isNull());
    EXPECT_EQ(err.code, ErrorCode::NotFound);
}

TEST_F(FakeSessionTest, DisconnectTwiceIsAckThenNotFound)
{
    makeRegistry();
    const QString id = connectOrFail();

    QSharedPointer<TransportSession> held = registry->lookup(id, nullptr);
    ASSERT_FALSE(held.isNull());

    OpError err;
    EXPECT_TRUE(registry->disconnect(id, &err));
    EXPECT_FALSE(err.isSet());
    EXPECT_EQ(held->state(), SessionState::Closed);

    EXPECT_FALSE(registry->disconnect(id, &err));
    EXPECT_EQ(err.code, ErrorCode::NotFound);
    EXPECT_TRUE(registry->list().isEmpty());
}

TEST_F(FakeSessionTest, DisconnectFailsInFlightChannels)
{
    makeRegistry();
    const QString id = connectOrFail();

    QSharedPointer<TransportSession> s = registry->lookup(id, nullptr);
    OpError err;
    ChannelLease lease(s.data(), &err);
    ASSERT_TRUE(lease.acquired());
    std::unique_ptr<SftpChannel> sftp = s->transport()->openSftp(&err);
    ASSERT_TRUE(sftp != nullptr);
    EXPECT_EQ(s->state(), SessionState::Busy);

    ASSERT_TRUE(registry->disconnect(id, &err));

    QVector<DirectoryEntry> entries;
    EXPECT_FALSE(sftp->readDir("/", &entries, &err));
    EXPECT_EQ(err.code, ErrorCode::ConnectionLost);
}

TEST_F(FakeSessionTest, SessionCapIsEnforced)
{
    AppConfig c = testConfig();
    c.maxSessions = 2;
    makeRegistry(c);

    connectOrFail();
    connectOrFail();

    QString id;
    OpError err;
    EXPECT_FALSE(registry->connect(passwordRequest(), &id, &err));
    EXPECT_EQ(err.code, ErrorCode::LimitExceeded);
    EXPECT_EQ(server->connects.load(), 2);
}

TEST_F(FakeSessionTest, ChannelCapWaitsThenTimesOut)
{
    AppConfig c = testConfig();
    c.maxChannelsPerSession = 1;
    c.channelWaitMs = 100;
    makeRegistry(c);

    QSharedPointer<TransportSession> s = registry->lookup(connectOrFail(), nullptr);
    OpError err;
    ChannelLease first(s.data(), &err);
    ASSERT_TRUE(first.acquired());

    ChannelLease second(s.data(), &err);
    EXPECT_FALSE(second.acquired());
    EXPECT_EQ(err.code, ErrorCode::Timeout);
    EXPECT_EQ(s->openChannels(), 1);
}

TEST_F(FakeSessionTest, DisconnectAllClosesEverything)
{
    makeRegistry();
    connectOrFail();
    connectOrFail();
    connectOrFail();

    EXPECT_EQ(registry->disconnectAll(), 3);
    EXPECT_EQ(registry->count(), 0);
}

TEST_F(FakeSessionTest, KeepaliveRemovesUnresponsivePeer)
{
    AppConfig c = testConfig();
    c.keepaliveIntervalMs = 40;
    c.keepaliveMaxMissed = 3;
    makeRegistry(c);

    QSignalSpy closed(registry.get(), &SessionRegistry::sessionClosed);
    const QString id = connectOrFail();

    // A responsive peer survives several intervals.
    spinEventLoop(200);
    EXPECT_EQ(registry->count(), 1);

    server->peerResponsive = false;
    QElapsedTimer t;
    t.start();
    ASSERT_TRUE(waitUntil([&] { return registry->count() == 0; }, 3000));

    // N x interval, plus scheduling slack.
    EXPECT_LT(t.elapsed(), 3 * 40 + 1000);

    OpError err;
    EXPECT_TRUE(registry->lookup(id, &err).isNull());
    EXPECT_EQ(err.code, ErrorCode::ConnectionLost);

    ASSERT_TRUE(waitUntil([&] { return closed.count() == 1; }, 1000));
    EXPECT_EQ(closed.first().at(0).toString(), id);
}

TEST_F(FakeSessionTest, SilentPeerTimesOutWithoutDroppingSession)
{
    makeRegistry();
    const QString id = connectOrFail();

    QSharedPointer<TransportSession> s = registry->lookup(id, nullptr);
    server->peerResponsive = false;

    OpError err;
    EXPECT_FALSE(s->probe(&err));
    EXPECT_EQ(err.code, ErrorCode::Timeout);

    // One unanswered probe is a miss, not a fault.
    EXPECT_EQ(registry->count(), 1);
    EXPECT_FALSE(s->isClosed());
}

TEST_F(FakeSessionTest, TransportFaultMarksSessionLost)
{
    makeRegistry();
    const QString id = connectOrFail();

    QSharedPointer<TransportSession> s = registry->lookup(id, nullptr);
    server->dropped = true;

    OpError err;
    EXPECT_FALSE(s->probe(&err));
    s->reportFault(err);

    EXPECT_EQ(registry->count(), 0);
    EXPECT_EQ(s->state(), SessionState::Closed);

    OpError lookupErr;
    registry->lookup(id, &lookupErr);
    EXPECT_EQ(lookupErr.code, ErrorCode::ConnectionLost);

    // Disconnecting a lost session is reported, not fatal.
    EXPECT_FALSE(registry->disconnect(id, &lookupErr));
    EXPECT_EQ(lookupErr.code, ErrorCode::NotFound);
}
