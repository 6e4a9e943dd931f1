// AppConfig.cpp
#include "AppConfig.h"

#include <QSettings>
#include <QDir>
#include <QtGlobal>

static int readInt(QSettings& s, const char* key, int def, int lo, int hi)
{
    bool ok = false;
    const int v = s.value(QLatin1String(key), def).toInt(&ok);
    return ok ? qBound(lo, v, hi) : def;
}

AppConfig AppConfig::load(QSettings& s)
{
    AppConfig c;

    c.keepaliveIntervalMs = readInt(s, "keepalive/intervalMs", c.keepaliveIntervalMs, 0, 3600 * 1000);
    c.keepaliveMaxMissed  = readInt(s, "keepalive/maxMissed",  c.keepaliveMaxMissed, 1, 100);

    c.maxSessions           = readInt(s, "session/maxSessions",   c.maxSessions, 1, 1024);
    c.maxChannelsPerSession = readInt(s, "session/maxChannels",   c.maxChannelsPerSession, 1, 64);
    c.channelWaitMs         = readInt(s, "session/channelWaitMs", c.channelWaitMs, 0, 3600 * 1000);
    c.lostSessionMemory     = readInt(s, "session/lostMemory",    c.lostSessionMemory, 0, 100000);

    c.connectTimeoutSec     = readInt(s, "ssh/connectTimeoutSec", c.connectTimeoutSec, 1, 300);
    c.strictHostKeyChecking = s.value("ssh/strictHostKeyChecking", c.strictHostKeyChecking).toBool();
    c.knownHostsFile        = s.value("ssh/knownHostsFile", c.knownHostsFile).toString().trimmed();
    c.kexPreference         = s.value("ssh/kexPreference", c.kexPreference).toString().trimmed();

    c.transferChunkBytes = readInt(s, "transfer/chunkBytes", c.transferChunkBytes, 1024, 4 * 1024 * 1024);
    c.atomicTransfers    = s.value("transfer/atomic", c.atomicTransfers).toBool();

    const QString suffix = s.value("transfer/tempSuffix", c.tempSuffix).toString().trimmed();
    if (!suffix.isEmpty() && !suffix.contains('/'))
        c.tempSuffix = suffix;

    c.allowedLocalRoots.clear();
    const QStringList roots = s.value("transfer/allowedLocalRoots").toStringList();
    for (const QString& r : roots) {
        const QString t = r.trimmed();
        if (!t.isEmpty())
            c.allowedLocalRoots.push_back(QDir::cleanPath(t));
    }

    c.commandTimeoutMs       = readInt(s, "exec/timeoutMs", c.commandTimeoutMs, 1, 3600 * 1000);
    c.maxBufferedOutputBytes = readInt(s, "exec/maxBufferedBytes", c.maxBufferedOutputBytes,
                                       4096, 512 * 1024 * 1024);

    c.listMaxDepth   = readInt(s, "list/maxDepth",   c.listMaxDepth, 1, 256);
    c.listMaxEntries = readInt(s, "list/maxEntries", c.listMaxEntries, 1, 10 * 1000 * 1000);

    c.workerThreads    = readInt(s, "core/workerThreads",   c.workerThreads, 1, 128);
    c.logLevel         = readInt(s, "log/level",            c.logLevel, 0, 2);
    c.commandAuditMode = readInt(s, "audit/commandLogMode", c.commandAuditMode, 0, 2);
    c.auditDir         = s.value("audit/dir", c.auditDir).toString().trimmed();

    return c;
}

void AppConfig::save(QSettings& s) const
{
    s.setValue("keepalive/intervalMs", keepaliveIntervalMs);
    s.setValue("keepalive/maxMissed", keepaliveMaxMissed);

    s.setValue("session/maxSessions", maxSessions);
    s.setValue("session/maxChannels", maxChannelsPerSession);
    s.setValue("session/channelWaitMs", channelWaitMs);
    s.setValue("session/lostMemory", lostSessionMemory);

    s.setValue("ssh/connectTimeoutSec", connectTimeoutSec);
    s.setValue("ssh/strictHostKeyChecking", strictHostKeyChecking);
    s.setValue("ssh/knownHostsFile", knownHostsFile);
    s.setValue("ssh/kexPreference", kexPreference);

    s.setValue("transfer/chunkBytes", transferChunkBytes);
    s.setValue("transfer/atomic", atomicTransfers);
    s.setValue("transfer/tempSuffix", tempSuffix);
    s.setValue("transfer/allowedLocalRoots", allowedLocalRoots);

    s.setValue("exec/timeoutMs", commandTimeoutMs);
    s.setValue("exec/maxBufferedBytes", maxBufferedOutputBytes);

    s.setValue("list/maxDepth", listMaxDepth);
    s.setValue("list/maxEntries", listMaxEntries);

    s.setValue("core/workerThreads", workerThreads);
    s.setValue("log/level", logLevel);
    s.setValue("audit/commandLogMode", commandAuditMode);
    s.setValue("audit/dir", auditDir);
}
