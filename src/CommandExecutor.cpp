// CommandExecutor.cpp
#include "CommandExecutor.h"

#include <QElapsedTimer>
#include <QJsonObject>
#include <QDebug>

#include "SessionRegistry.h"
#include "AuditLogger.h"

static const int kReadChunk = 32 * 1024;
static const int kReadWaitMs = 50;

// Appends up to the cap; returns false once something was dropped.
static bool appendCapped(QByteArray* dst, const char* data, int n, qint64 room)
{
    if (room <= 0) return false;
    const int take = (int)qMin<qint64>(n, room);
    dst->append(data, take);
    return take == n;
}

CommandExecutor::CommandExecutor(SessionRegistry* registry, int maxBufferedBytes, int auditMode)
    : m_registry(registry)
    , m_maxBuffered(qMax(0, maxBufferedBytes))
    , m_auditMode(auditMode)
{
}

bool CommandExecutor::execute(const QString& connectionId,
                              const QString& command,
                              int timeoutMs,
                              CommandResult* out,
                              OpError* err,
                              const OutputSink& sink,
                              const CancelToken* cancel)
{
    if (out) *out = CommandResult{};

    QSharedPointer<TransportSession> session = m_registry->lookup(connectionId, err);
    if (!session)
        return false;

    QElapsedTimer timer;
    timer.start();

    QJsonObject audit = AuditLogger::commandFields(command, timeoutMs, m_auditMode);
    audit.insert("connection_id", connectionId);

    auto finishAudit = [&](const char* outcome, int exitCode) {
        audit.insert("outcome", QLatin1String(outcome));
        audit.insert("duration_ms", (qint64)timer.elapsed());
        if (exitCode != -1) audit.insert("exit_code", exitCode);
        AuditLogger::writeEvent("exec.finish", audit);
    };

    OpError localErr;
    ChannelLease lease(session.data(), &localErr, cancel);
    if (!lease.acquired()) {
        if (err) *err = localErr;
        return false;
    }

    std::unique_ptr<ExecChannel> ch = session->transport()->openExec(command, &localErr);
    if (!ch) {
        session->reportFault(localErr);
        qWarning().noquote() << QString("[EXEC] %1 open failed: %2").arg(connectionId, localErr.message);
        finishAudit("open_failed", -1);
        if (err) *err = localErr;
        return false;
    }

    CommandResult r;
    r.streamed = (bool)sink;

    QByteArray buf(kReadChunk, Qt::Uninitialized);

    while (true) {
        if (cancel && cancel->isCancelled()) {
            ch->abort();
            finishAudit("cancelled", -1);
            setError(err, ErrorCode::Cancelled, QStringLiteral("Command cancelled."));
            return false;
        }

        if (timeoutMs > 0 && timer.elapsed() >= timeoutMs) {
            ch->abort();
            qWarning().noquote() << QString("[EXEC] %1 timed out after %2 ms (remote process may still run)")
                                    .arg(connectionId).arg(timeoutMs);
            finishAudit("timeout", -1);
            setError(err, ErrorCode::Timeout,
                     QStringLiteral("Command timed out after %1 ms.").arg(timeoutMs));
            return false;
        }

        bool isStderr = false;
        const int n = ch->read(buf.data(), buf.size(), &isStderr, kReadWaitMs, &localErr);
        if (n < 0) {
            ch->abort();
            session->reportFault(localErr);
            finishAudit("failed", -1);
            if (err) *err = localErr;
            return false;
        }

        if (n > 0) {
            if (sink) {
                sink(QByteArray(buf.constData(), n), isStderr);
            } else {
                const qint64 room = (qint64)m_maxBuffered - r.stdoutData.size() - r.stderrData.size();
                if (!appendCapped(isStderr ? &r.stderrData : &r.stdoutData, buf.constData(), n, room))
                    r.truncated = true;
            }
            continue;
        }

        if (ch->isEof())
            break;
    }

    r.exitCode = ch->closeAndGetExitStatus();
    ch.reset();

    r.durationMs = timer.elapsed();
    session->touch();

    qInfo().noquote() << QString("[EXEC] %1 exit=%2 in %3 ms (out=%4 err=%5%6)")
                         .arg(connectionId).arg(r.exitCode).arg(r.durationMs)
                         .arg(r.stdoutData.size()).arg(r.stderrData.size())
                         .arg(r.truncated ? " truncated" : "");

    finishAudit("ok", r.exitCode);

    if (out) *out = r;
    return true;
}
