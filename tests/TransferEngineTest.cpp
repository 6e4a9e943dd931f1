#include "TestHelpers.h"

#include <QDir>
#include <QFileInfo>

#include "TransferEngine.h"

class TransferEngineTest : public FakeSessionTest
{
protected:
    static constexpr int kChunk = 64 * 1024;

    void SetUp() override
    {
        FakeSessionTest::SetUp();
        server->addDir("/up");
        makeRegistry();
        id = connectOrFail();

        TransferEngine::Options o;
        o.chunkBytes = kChunk;
        engine.reset(new TransferEngine(registry.get(), o));
    }

    // Upload then download `data`, return what came back.
    QByteArray roundTrip(const QByteArray& data, bool atomic)
    {
        const QString src = tmp.filePath("src.bin");
        const QString dst = tmp.filePath("dst.bin");
        EXPECT_TRUE(writeLocalFile(src, data));

        TransferResult r;
        OpError err;
        EXPECT_TRUE(engine->upload(id, src, "/up/file.bin", atomic, &r, &err)) << err.message.toStdString();
        EXPECT_EQ(r.bytesTransferred, (quint64)data.size());

        QByteArray remote;
        EXPECT_TRUE(server->fileData("/up/file.bin", &remote));
        EXPECT_EQ(remote, data);

        EXPECT_TRUE(engine->download(id, "/up/file.bin", dst, atomic, &r, &err)) << err.message.toStdString();
        EXPECT_EQ(r.bytesTransferred, (quint64)data.size());
        return readLocalFile(dst);
    }

    QString id;
    std::unique_ptr<TransferEngine> engine;
};

TEST_F(TransferEngineTest, RoundTripIsByteIdenticalAcrossChunkBoundaries)
{
    const QVector<int> sizes = { 0, 1, kChunk - 1, kChunk, kChunk + 1, 10 * 1024 * 1024 };
    for (int size : sizes) {
        const QByteArray data = patternBytes(size);
        EXPECT_EQ(roundTrip(data, false), data) << "size " << size;
    }
}

TEST_F(TransferEngineTest, ShortReadsAndWritesAreCompleted)
{
    server->ioChunkLimit = 1000;
    const QByteArray data = patternBytes(3 * kChunk + 17);
    EXPECT_EQ(roundTrip(data, false), data);
}

TEST_F(TransferEngineTest, ProgressIsMonotonicAndReachesTotal)
{
    const QByteArray data = patternBytes(5 * kChunk + 100);
    const QString src = tmp.filePath("p.bin");
    ASSERT_TRUE(writeLocalFile(src, data));

    QVector<quint64> seen;
    TransferResult r;
    OpError err;
    ASSERT_TRUE(engine->upload(id, src, "/up/p.bin", false, &r, &err,
                               [&](const TransferTask& t) {
                                   EXPECT_TRUE(t.totalKnown);
                                   EXPECT_EQ(t.totalBytes, (quint64)data.size());
                                   seen << t.bytesDone;
                               }));

    ASSERT_EQ(seen.size(), 6);
    for (int i = 1; i < seen.size(); ++i)
        EXPECT_GT(seen[i], seen[i - 1]);
    EXPECT_EQ(seen.last(), (quint64)data.size());
    EXPECT_EQ(r.totalBytes, (quint64)data.size());
    EXPECT_EQ(r.direction, TransferDirection::Upload);
}

TEST_F(TransferEngineTest, CancelledUploadLeavesPartialFile)
{
    const QByteArray data = patternBytes(4 * kChunk);
    const QString src = tmp.filePath("c.bin");
    ASSERT_TRUE(writeLocalFile(src, data));

    CancelToken token;
    TransferResult r;
    OpError err;
    EXPECT_FALSE(engine->upload(id, src, "/up/c.bin", false, &r, &err,
                                [&](const TransferTask&) { token.cancel(); }, &token));
    EXPECT_EQ(err.code, ErrorCode::Cancelled);
    EXPECT_EQ(err.bytesDone, (quint64)kChunk);

    QByteArray partial;
    ASSERT_TRUE(server->fileData("/up/c.bin", &partial));
    EXPECT_EQ(partial, data.left(kChunk));

    // The session is still usable.
    EXPECT_EQ(registry->lookup(id, nullptr)->state(), SessionState::Ready);
}

TEST_F(TransferEngineTest, CancelledAtomicUploadLeavesNothing)
{
    const QString src = tmp.filePath("c.bin");
    ASSERT_TRUE(writeLocalFile(src, patternBytes(4 * kChunk)));

    CancelToken token;
    TransferResult r;
    OpError err;
    EXPECT_FALSE(engine->upload(id, src, "/up/c.bin", true, &r, &err,
                                [&](const TransferTask&) { token.cancel(); }, &token));
    EXPECT_EQ(err.code, ErrorCode::Cancelled);
    EXPECT_FALSE(server->exists("/up/c.bin"));
    EXPECT_FALSE(server->exists("/up/c.bin.shelldeck.part"));
}

TEST_F(TransferEngineTest, AtomicUploadWritesTempThenRenames)
{
    const QByteArray data = patternBytes(3 * kChunk);
    const QString src = tmp.filePath("a.bin");
    ASSERT_TRUE(writeLocalFile(src, data));
    server->addFile("/up/a.bin", "old contents");

    bool sawTemp = false;
    TransferResult r;
    OpError err;
    ASSERT_TRUE(engine->upload(id, src, "/up/a.bin", true, &r, &err,
                               [&](const TransferTask& t) {
                                   EXPECT_EQ(t.writePath, QString("/up/a.bin.shelldeck.part"));
                                   sawTemp = sawTemp || server->exists(t.writePath);
                                   QByteArray old;
                                   EXPECT_TRUE(server->fileData("/up/a.bin", &old));
                                   EXPECT_EQ(old, QByteArray("old contents"));
                               }));
    EXPECT_TRUE(sawTemp);
    EXPECT_TRUE(r.atomic);

    QByteArray remote;
    ASSERT_TRUE(server->fileData("/up/a.bin", &remote));
    EXPECT_EQ(remote, data);
    EXPECT_FALSE(server->exists("/up/a.bin.shelldeck.part"));
}

TEST_F(TransferEngineTest, AtomicDownloadReplacesLocalFile)
{
    const QByteArray data = patternBytes(2 * kChunk + 5);
    server->addFile("/up/d.bin", data);

    const QString dst = tmp.filePath("d.bin");
    ASSERT_TRUE(writeLocalFile(dst, "stale"));

    TransferResult r;
    OpError err;
    ASSERT_TRUE(engine->download(id, "/up/d.bin", dst, true, &r, &err)) << err.message.toStdString();
    EXPECT_EQ(readLocalFile(dst), data);
    EXPECT_FALSE(QFileInfo::exists(dst + ".shelldeck.part"));
    EXPECT_EQ(r.direction, TransferDirection::Download);
}

TEST_F(TransferEngineTest, DroppedUploadReportsBytesDone)
{
    const QString src = tmp.filePath("f.bin");
    ASSERT_TRUE(writeLocalFile(src, patternBytes(5 * kChunk)));
    server->failAfterBytes = 100000;

    TransferResult r;
    OpError err;
    EXPECT_FALSE(engine->upload(id, src, "/up/f.bin", false, &r, &err));
    EXPECT_EQ(err.code, ErrorCode::Transfer);
    EXPECT_EQ(err.bytesDone, (quint64)(2 * kChunk));
    EXPECT_EQ(registry->count(), 0);
}

TEST_F(TransferEngineTest, DroppedDownloadKeepsPartialLocalFile)
{
    server->addFile("/up/big.bin", patternBytes(5 * kChunk));
    server->failAfterBytes = 100000;

    const QString dst = tmp.filePath("big.bin");
    TransferResult r;
    OpError err;
    EXPECT_FALSE(engine->download(id, "/up/big.bin", dst, false, &r, &err));
    EXPECT_EQ(err.code, ErrorCode::Transfer);
    EXPECT_EQ(err.bytesDone, (quint64)(2 * kChunk));
    EXPECT_EQ(QFileInfo(dst).size(), 2 * kChunk);
}

TEST_F(TransferEngineTest, DownloadCreatesMissingDirectories)
{
    server->addFile("/up/n.txt", "nested");
    const QString dst = tmp.filePath("a/b/c/n.txt");

    TransferResult r;
    OpError err;
    ASSERT_TRUE(engine->download(id, "/up/n.txt", dst, false, &r, &err)) << err.message.toStdString();
    EXPECT_EQ(readLocalFile(dst), QByteArray("nested"));
}

TEST_F(TransferEngineTest, DownloadRefusesDirectoriesAndMissingFiles)
{
    const QString dst = tmp.filePath("x/out.bin");
    TransferResult r;
    OpError err;

    EXPECT_FALSE(engine->download(id, "/up", dst, false, &r, &err));
    EXPECT_EQ(err.code, ErrorCode::Remote);

    err.clear();
    EXPECT_FALSE(engine->download(id, "/up/missing.bin", dst, false, &r, &err));
    EXPECT_EQ(err.code, ErrorCode::Remote);
    EXPECT_FALSE(QFileInfo::exists(dst));
    EXPECT_EQ(registry->count(), 1);
}

TEST_F(TransferEngineTest, UploadOfMissingLocalFileFails)
{
    TransferResult r;
    OpError err;
    EXPECT_FALSE(engine->upload(id, tmp.filePath("nope.bin"), "/up/nope.bin", false, &r, &err));
    EXPECT_EQ(err.code, ErrorCode::Transfer);
    EXPECT_FALSE(server->exists("/up/nope.bin"));
}

TEST_F(TransferEngineTest, UnknownIdentifierIsNotFound)
{
    TransferResult r;
    OpError err;
    EXPECT_FALSE(engine->download("0f8fad5b-d9cb-469f-a165-70867728950e", "/up/x", tmp.filePath("x"),
                                  false, &r, &err));
    EXPECT_EQ(err.code, ErrorCode::NotFound);
}
