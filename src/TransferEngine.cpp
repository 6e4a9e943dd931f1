// TransferEngine.cpp
#include "TransferEngine.h"

#include <QFile>
#include <QFileInfo>
#include <QDir>
#include <QByteArray>
#include <QElapsedTimer>
#include <QJsonObject>
#include <QDebug>

#include "SessionRegistry.h"
#include "AuditLogger.h"

static void auditTransfer(const TransferTask& t, const QString& connectionId,
                          const char* outcome, qint64 durationMs)
{
    QJsonObject f;
    f.insert("connection_id", connectionId);
    f.insert("direction", transferDirectionToString(t.direction));
    f.insert("outcome", QLatin1String(outcome));
    f.insert("bytes", (qint64)t.bytesDone);
    if (t.totalKnown) f.insert("total", (qint64)t.totalBytes);
    f.insert("duration_ms", durationMs);
    AuditLogger::writeEvent("transfer.finish", f);
}

// Wraps a mid-stream failure: keeps the cause text, reports bytes done.
static void failTransfer(OpError* err, const TransferTask& t, const QString& why)
{
    if (!err) return;
    err->code = ErrorCode::Transfer;
    err->message = QString("%1 failed after %2 bytes: %3")
                       .arg(transferDirectionToString(t.direction))
                       .arg(t.bytesDone)
                       .arg(why);
    err->bytesDone = t.bytesDone;
}

static void failCancelled(OpError* err, const TransferTask& t)
{
    if (!err) return;
    err->code = ErrorCode::Cancelled;
    err->message = QString("%1 cancelled after %2 bytes.")
                       .arg(transferDirectionToString(t.direction))
                       .arg(t.bytesDone);
    err->bytesDone = t.bytesDone;
}

static TransferResult makeResult(const TransferTask& t, const QString& localPath,
                                 const QString& remotePath, bool atomic, qint64 durationMs)
{
    TransferResult r;
    r.direction        = t.direction;
    r.localPath        = localPath;
    r.remotePath       = remotePath;
    r.bytesTransferred = t.bytesDone;
    r.totalBytes       = t.totalKnown ? t.totalBytes : t.bytesDone;
    r.totalKnown       = t.totalKnown;
    r.durationMs       = durationMs;
    r.atomic           = atomic;
    return r;
}

// Local rename over an existing file (QFile::rename refuses to overwrite).
static bool replaceLocal(const QString& from, const QString& to, QString* why)
{
    if (QFile::exists(to) && !QFile::remove(to)) {
        if (why) *why = QString("cannot replace %1").arg(to);
        return false;
    }
    if (!QFile::rename(from, to)) {
        if (why) *why = QString("cannot rename %1 to %2").arg(from, to);
        return false;
    }
    return true;
}

TransferEngine::TransferEngine(SessionRegistry* registry, const Options& opts)
    : m_registry(registry)
    , m_opts(opts)
{
    m_opts.chunkBytes = qMax(1, m_opts.chunkBytes);
    if (m_opts.tempSuffix.isEmpty())
        m_opts.tempSuffix = ".part";
}

// ------------------------------------------------------------
// upload: local file -> remote path
// ------------------------------------------------------------
bool TransferEngine::upload(const QString& connectionId,
                            const QString& localPath,
                            const QString& remotePath,
                            bool atomic,
                            TransferResult* out,
                            OpError* err,
                            const ProgressFn& progress,
                            const CancelToken* cancel)
{
    if (out) *out = TransferResult{};

    QSharedPointer<TransportSession> session = m_registry->lookup(connectionId, err);
    if (!session)
        return false;

    TransferTask task;
    task.direction   = TransferDirection::Upload;
    task.source      = localPath;
    task.destination = remotePath;
    task.writePath   = atomic ? remotePath + m_opts.tempSuffix : remotePath;

    QFile local(localPath);
    if (!local.open(QIODevice::ReadOnly)) {
        setError(err, ErrorCode::Transfer,
                 QString("Cannot open local file %1: %2").arg(localPath, local.errorString()));
        return false;
    }
    task.totalBytes = (quint64)local.size();
    task.totalKnown = true;

    OpError localErr;
    ChannelLease lease(session.data(), &localErr, cancel);
    if (!lease.acquired()) {
        if (err) *err = localErr;
        return false;
    }

    std::unique_ptr<SftpChannel> sftp = session->transport()->openSftp(&localErr);
    if (!sftp) {
        session->reportFault(localErr);
        if (err) *err = localErr;
        return false;
    }

    QElapsedTimer timer;
    timer.start();

    qInfo().noquote() << QString("[XFER] upload %1 -> %2 (%3 bytes%4)")
                         .arg(localPath, remotePath).arg(task.totalBytes)
                         .arg(atomic ? ", atomic" : "");

    std::unique_ptr<RemoteFile> remote = sftp->open(task.writePath, SftpChannel::OpenMode::WriteTruncate, &localErr);
    if (!remote) {
        session->reportFault(localErr);
        auditTransfer(task, connectionId, "open_failed", timer.elapsed());
        if (err) *err = localErr;
        return false;
    }

    auto abandon = [&]() {
        remote.reset();
        if (atomic && !session->isClosed()) {
            OpError ignored;
            if (!sftp->remove(task.writePath, &ignored))
                qWarning().noquote() << QString("[XFER] cannot remove temp %1: %2").arg(task.writePath, ignored.message);
        }
    };

    QByteArray buf(m_opts.chunkBytes, Qt::Uninitialized);

    while (true) {
        if (cancel && cancel->isCancelled()) {
            abandon();
            qInfo().noquote() << QString("[XFER] upload %1 cancelled at %2 bytes").arg(remotePath).arg(task.bytesDone);
            auditTransfer(task, connectionId, "cancelled", timer.elapsed());
            failCancelled(err, task);
            return false;
        }

        const qint64 n = local.read(buf.data(), buf.size());
        if (n < 0) {
            abandon();
            auditTransfer(task, connectionId, "failed", timer.elapsed());
            failTransfer(err, task, QString("local read error: %1").arg(local.errorString()));
            return false;
        }
        if (n == 0)
            break;

        qint64 written = 0;
        while (written < n) {
            const qint64 w = remote->write(buf.constData() + written, n - written, &localErr);
            if (w <= 0) {
                session->reportFault(localErr);
                abandon();
                qWarning().noquote() << QString("[XFER] upload %1 failed at %2 bytes: %3")
                                        .arg(remotePath).arg(task.bytesDone + written).arg(localErr.message);
                task.bytesDone += (quint64)written;
                auditTransfer(task, connectionId, "failed", timer.elapsed());
                failTransfer(err, task, localErr.isSet() ? localErr.message : QStringLiteral("short write"));
                return false;
            }
            written += w;
        }

        task.bytesDone += (quint64)n;
        if (progress) progress(task);
    }

    remote.reset();   // close before rename

    if (atomic && !sftp->rename(task.writePath, remotePath, &localErr)) {
        session->reportFault(localErr);
        abandon();
        auditTransfer(task, connectionId, "failed", timer.elapsed());
        failTransfer(err, task, localErr.message);
        return false;
    }

    session->touch();

    const TransferResult r = makeResult(task, localPath, remotePath, atomic, timer.elapsed());
    qInfo().noquote() << QString("[XFER] upload %1 done: %2 bytes in %3 ms")
                         .arg(remotePath).arg(r.bytesTransferred).arg(r.durationMs);
    auditTransfer(task, connectionId, "ok", r.durationMs);

    if (out) *out = r;
    return true;
}

// ------------------------------------------------------------
// download: remote path -> local file
// ------------------------------------------------------------
bool TransferEngine::download(const QString& connectionId,
                              const QString& remotePath,
                              const QString& localPath,
                              bool atomic,
                              TransferResult* out,
                              OpError* err,
                              const ProgressFn& progress,
                              const CancelToken* cancel)
{
    if (out) *out = TransferResult{};

    QSharedPointer<TransportSession> session = m_registry->lookup(connectionId, err);
    if (!session)
        return false;

    TransferTask task;
    task.direction   = TransferDirection::Download;
    task.source      = remotePath;
    task.destination = localPath;
    task.writePath   = atomic ? localPath + m_opts.tempSuffix : localPath;

    OpError localErr;
    ChannelLease lease(session.data(), &localErr, cancel);
    if (!lease.acquired()) {
        if (err) *err = localErr;
        return false;
    }

    std::unique_ptr<SftpChannel> sftp = session->transport()->openSftp(&localErr);
    if (!sftp) {
        session->reportFault(localErr);
        if (err) *err = localErr;
        return false;
    }

    QElapsedTimer timer;
    timer.start();

    DirectoryEntry st;
    if (sftp->stat(remotePath, &st, &localErr)) {
        if (st.kind == EntryKind::Directory) {
            setError(err, ErrorCode::Remote, QString("%1 is a directory.").arg(remotePath));
            return false;
        }
        task.totalBytes = st.size;
        task.totalKnown = (st.kind == EntryKind::File);
    } else if (localErr.code == ErrorCode::ConnectionLost) {
        session->reportFault(localErr);
        if (err) *err = localErr;
        return false;
    }
    localErr.clear();

    std::unique_ptr<RemoteFile> remote = sftp->open(remotePath, SftpChannel::OpenMode::Read, &localErr);
    if (!remote) {
        session->reportFault(localErr);
        auditTransfer(task, connectionId, "open_failed", timer.elapsed());
        if (err) *err = localErr;
        return false;
    }

    const QString parentDir = QFileInfo(localPath).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        setError(err, ErrorCode::Transfer, QString("Cannot create local directory %1").arg(parentDir));
        return false;
    }

    QFile local(task.writePath);
    if (!local.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        setError(err, ErrorCode::Transfer,
                 QString("Cannot open local file %1: %2").arg(task.writePath, local.errorString()));
        return false;
    }

    qInfo().noquote() << QString("[XFER] download %1 -> %2 (%3%4)")
                         .arg(remotePath, localPath)
                         .arg(task.totalKnown ? QString::number(task.totalBytes) + " bytes" : QStringLiteral("size unknown"))
                         .arg(atomic ? ", atomic" : "");

    auto abandon = [&]() {
        local.close();
        if (atomic)
            QFile::remove(task.writePath);
    };

    QByteArray buf(m_opts.chunkBytes, Qt::Uninitialized);

    while (true) {
        if (cancel && cancel->isCancelled()) {
            abandon();
            qInfo().noquote() << QString("[XFER] download %1 cancelled at %2 bytes").arg(remotePath).arg(task.bytesDone);
            auditTransfer(task, connectionId, "cancelled", timer.elapsed());
            failCancelled(err, task);
            return false;
        }

        // Fill one chunk (SFTP reads may come back short).
        qint64 filled = 0;
        bool eof = false;
        while (filled < buf.size()) {
            const qint64 n = remote->read(buf.data() + filled, buf.size() - filled, &localErr);
            if (n < 0) {
                session->reportFault(localErr);
                if (filled > 0 && local.write(buf.constData(), filled) == filled)
                    task.bytesDone += (quint64)filled;
                abandon();
                qWarning().noquote() << QString("[XFER] download %1 failed at %2 bytes: %3")
                                        .arg(remotePath).arg(task.bytesDone).arg(localErr.message);
                auditTransfer(task, connectionId, "failed", timer.elapsed());
                failTransfer(err, task, localErr.message);
                return false;
            }
            if (n == 0) {
                eof = true;
                break;
            }
            filled += n;
        }

        if (filled > 0) {
            if (local.write(buf.constData(), filled) != filled) {
                const QString why = local.errorString();
                abandon();
                auditTransfer(task, connectionId, "failed", timer.elapsed());
                failTransfer(err, task, QString("local write error: %1").arg(why));
                return false;
            }
            task.bytesDone += (quint64)filled;
            if (progress) progress(task);
        }

        if (eof)
            break;
    }

    remote.reset();

    if (!local.flush()) {
        const QString why = local.errorString();
        abandon();
        auditTransfer(task, connectionId, "failed", timer.elapsed());
        failTransfer(err, task, QString("local flush error: %1").arg(why));
        return false;
    }
    local.close();

    QString why;
    if (atomic && !replaceLocal(task.writePath, localPath, &why)) {
        QFile::remove(task.writePath);
        auditTransfer(task, connectionId, "failed", timer.elapsed());
        failTransfer(err, task, why);
        return false;
    }

    session->touch();

    const TransferResult r = makeResult(task, localPath, remotePath, atomic, timer.elapsed());
    qInfo().noquote() << QString("[XFER] download %1 done: %2 bytes in %3 ms")
                         .arg(remotePath).arg(r.bytesTransferred).arg(r.durationMs);
    auditTransfer(task, connectionId, "ok", r.durationMs);

    if (out) *out = r;
    return true;
}
