#pragma once

#include <QString>
#include <QStringList>

class QSettings;

/*
    AppConfig
    ---------
    Tunables for the session core, read from QSettings.

    Keys (group/key):
      keepalive/intervalMs          keepalive/maxMissed
      session/maxSessions           session/maxChannels
      session/channelWaitMs         session/lostMemory
      ssh/connectTimeoutSec         ssh/strictHostKeyChecking
      ssh/knownHostsFile            ssh/kexPreference
      transfer/chunkBytes           transfer/atomic
      transfer/tempSuffix           transfer/allowedLocalRoots
      exec/timeoutMs                exec/maxBufferedBytes
      list/maxDepth                 list/maxEntries
      core/workerThreads            log/level
      audit/commandLogMode          audit/dir

    Values out of range are clamped on load.
*/
struct AppConfig
{
    // Keepalive
    int keepaliveIntervalMs = 30 * 1000;
    int keepaliveMaxMissed  = 3;

    // Resource caps
    int maxSessions          = 32;
    int maxChannelsPerSession = 10;
    int channelWaitMs        = 30 * 1000;
    int lostSessionMemory    = 256;   // remembered ids of lost sessions

    // Connect
    int     connectTimeoutSec      = 15;
    bool    strictHostKeyChecking  = false;
    QString knownHostsFile;           // empty => libssh default (~/.ssh/known_hosts)
    QString kexPreference;            // empty => libssh defaults

    // Transfers
    int         transferChunkBytes = 64 * 1024;
    bool        atomicTransfers    = false;
    QString     tempSuffix         = ".shelldeck.part";
    QStringList allowedLocalRoots;    // empty => no root restriction

    // Command execution
    int commandTimeoutMs      = 90 * 1000;
    int maxBufferedOutputBytes = 16 * 1024 * 1024;

    // Recursive listing
    int listMaxDepth   = 32;
    int listMaxEntries = 100000;

    // Threads / logging / audit
    int     workerThreads    = 16;
    int     logLevel         = 1;   // 0=Errors only, 1=Normal, 2=Debug
    int     commandAuditMode = 1;   // 0=none, 1=safe (head+hash), 2=full
    QString auditDir;                // empty => default

    static AppConfig load(QSettings& s);
    void save(QSettings& s) const;
};
