#include "TestHelpers.h"

#include <QtConcurrent/QtConcurrent>
#include <QFuture>
#include <QThreadPool>

#include "CommandExecutor.h"

class CommandExecutorTest : public FakeSessionTest
{
protected:
    void SetUp() override
    {
        FakeSessionTest::SetUp();
        makeRegistry();
        id = connectOrFail();
        executor.reset(new CommandExecutor(registry.get(), 1024, 0));
    }

    QString id;
    std::unique_ptr<CommandExecutor> executor;
};

TEST_F(CommandExecutorTest, CollectsStdoutAndExitCode)
{
    CommandResult r;
    OpError err;
    ASSERT_TRUE(executor->execute(id, "echo hello world", 5000, &r, &err)) << err.message.toStdString();
    EXPECT_EQ(r.stdoutData, QByteArray("hello world\n"));
    EXPECT_TRUE(r.stderrData.isEmpty());
    EXPECT_EQ(r.exitCode, 0);
    EXPECT_FALSE(r.truncated);
    EXPECT_GE(r.durationMs, 0);
}

TEST_F(CommandExecutorTest, NonZeroExitIsAResult)
{
    CommandResult r;
    OpError err;
    ASSERT_TRUE(executor->execute(id, "err boom", 5000, &r, &err));
    EXPECT_EQ(r.stderrData, QByteArray("boom\n"));
    EXPECT_EQ(r.exitCode, 1);

    ASSERT_TRUE(executor->execute(id, "exit 42", 5000, &r, &err));
    EXPECT_EQ(r.exitCode, 42);
}

TEST_F(CommandExecutorTest, UnknownIdentifierIsNotFound)
{
    CommandResult r;
    OpError err;
    EXPECT_FALSE(executor->execute("0f8fad5b-d9cb-469f-a165-70867728950e", "echo x", 1000, &r, &err));
    EXPECT_EQ(err.code, ErrorCode::NotFound);
}

TEST_F(CommandExecutorTest, TimeoutClosesChannel)
{
    CommandResult r;
    OpError err;
    QElapsedTimer t;
    t.start();
    EXPECT_FALSE(executor->execute(id, "hang", 150, &r, &err));
    EXPECT_EQ(err.code, ErrorCode::Timeout);
    EXPECT_LT(t.elapsed(), 2000);
    EXPECT_EQ(server->openExecChannels.load(), 0);
    EXPECT_EQ(registry->lookup(id, nullptr)->openChannels(), 0);
}

TEST_F(CommandExecutorTest, CancelStopsCommand)
{
    CancelToken token;
    QFuture<bool> f = QtConcurrent::run([&]() {
        CommandResult r;
        OpError err;
        const bool ok = executor->execute(id, "hang", 10000, &r, &err, nullptr, &token);
        return !ok && err.code == ErrorCode::Cancelled;
    });

    QThread::msleep(100);
    token.cancel();
    f.waitForFinished();
    EXPECT_TRUE(f.result());
}

TEST_F(CommandExecutorTest, BufferCapFlagsTruncation)
{
    CommandResult r;
    OpError err;
    ASSERT_TRUE(executor->execute(id, "yes 5000", 5000, &r, &err));
    EXPECT_EQ(r.stdoutData.size(), 1024);
    EXPECT_TRUE(r.truncated);
}

TEST_F(CommandExecutorTest, SinkReceivesOutputWithoutBuffering)
{
    QByteArray streamed;
    CommandResult r;
    OpError err;
    ASSERT_TRUE(executor->execute(id, "yes 100000", 5000, &r, &err,
                                  [&](const QByteArray& chunk, bool isStderr) {
                                      EXPECT_FALSE(isStderr);
                                      streamed.append(chunk);
                                  }));
    EXPECT_EQ(streamed.size(), 100000);
    EXPECT_TRUE(r.stdoutData.isEmpty());
    EXPECT_TRUE(r.streamed);
    EXPECT_FALSE(r.truncated);
}

TEST_F(CommandExecutorTest, ConcurrentExecutesDoNotCrossTalk)
{
    const int n = 10;
    QThreadPool pool;
    pool.setMaxThreadCount(n);

    QVector<QFuture<QByteArray>> futures;
    for (int i = 0; i < n; ++i) {
        futures.push_back(QtConcurrent::run(&pool, [this, i]() -> QByteArray {
            CommandResult r;
            OpError err;
            if (!executor->execute(id, QString("sleep 100 output-%1").arg(i), 5000, &r, &err))
                return QByteArray("FAILED: ") + err.message.toUtf8();
            return r.stdoutData;
        }));
    }

    for (int i = 0; i < n; ++i) {
        futures[i].waitForFinished();
        EXPECT_EQ(futures[i].result(), QString("output-%1\n").arg(i).toUtf8());
    }

    EXPECT_GT(server->maxConcurrentExec.load(), 1);
    EXPECT_EQ(registry->lookup(id, nullptr)->state(), SessionState::Ready);
}

TEST_F(CommandExecutorTest, ConnectionLossMarksSessionLost)
{
    CancelToken never;
    QFuture<int> f = QtConcurrent::run([&]() {
        CommandResult r;
        OpError err;
        executor->execute(id, "hang", 10000, &r, &err, nullptr, &never);
        return (int)err.code;
    });

    QThread::msleep(100);
    server->dropped = true;
    f.waitForFinished();

    EXPECT_EQ(f.result(), (int)ErrorCode::ConnectionLost);
    EXPECT_EQ(registry->count(), 0);

    OpError err;
    registry->lookup(id, &err);
    EXPECT_EQ(err.code, ErrorCode::ConnectionLost);
}
