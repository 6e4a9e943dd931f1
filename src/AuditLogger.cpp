// AuditLogger.cpp
#include "AuditLogger.h"

#include <QDir>
#include <QDateTime>
#include <QFile>
#include <QStandardPaths>
#include <QJsonDocument>
#include <QMutex>
#include <QMutexLocker>
#include <QThread>
#include <QCryptographicHash>
#include <QCoreApplication>

// =====================================================
// Process-wide audit state, guarded by one mutex.
// One open file per day ("audit-YYYY-MM-DD.jsonl"); reopened when the
// day or the directory changes. Write failures drop the event quietly.
// =====================================================

static QMutex  g_auditMutex;
static QString g_appName;
static QString g_sessionId;
static QString g_auditDirOverride;
static bool    g_enabled = true;

static QFile*  g_auditFile = nullptr;
static QString g_openDate;
static QString g_openPath;

static QString dayKey()
{
    return QDateTime::currentDateTime().toString("yyyy-MM-dd");
}

// Must be called with g_auditMutex held.
static QString baseAuditDirLocked()
{
    if (!g_auditDirOverride.isEmpty())
        return g_auditDirOverride;
    return QDir::cleanPath(QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation)
                           + "/audit");
}

static QString filePathForDayLocked(const QString& day)
{
    return QDir(baseAuditDirLocked()).filePath(QString("audit-%1.jsonl").arg(day));
}

static void closeAuditFileLocked()
{
    if (g_auditFile) {
        if (g_auditFile->isOpen())
            g_auditFile->close();
        delete g_auditFile;
        g_auditFile = nullptr;
    }
    g_openDate.clear();
    g_openPath.clear();
}

static bool ensureOpenLocked()
{
    const QString today = dayKey();
    const QString wantPath = filePathForDayLocked(today);

    if (g_auditFile && g_auditFile->isOpen() && g_openDate == today && g_openPath == wantPath)
        return true;

    QDir().mkpath(baseAuditDirLocked());
    closeAuditFileLocked();

    g_auditFile = new QFile(wantPath);
    if (!g_auditFile->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        closeAuditFileLocked();
        return false;
    }

    g_openDate = today;
    g_openPath = wantPath;
    return true;
}

// First 16 hex chars of SHA-256: correlates identical commands without storing them.
static QString hashUtf8Short(const QString& s)
{
    const QByteArray h = QCryptographicHash::hash(s.toUtf8(), QCryptographicHash::Sha256).toHex();
    return QString::fromLatin1(h.left(16));
}

namespace AuditLogger {

void install(const QString& appName)
{
    // No qInfo/qWarning in here: Logger may not be installed yet.
    QMutexLocker lock(&g_auditMutex);
    g_appName = appName;
    if (g_enabled)
        ensureOpenLocked();
}

void setEnabled(bool on)
{
    QMutexLocker lock(&g_auditMutex);
    g_enabled = on;
    if (!on)
        closeAuditFileLocked();
}

bool isEnabled()
{
    QMutexLocker lock(&g_auditMutex);
    return g_enabled;
}

void setSessionId(const QString& sessionId)
{
    QMutexLocker lock(&g_auditMutex);
    g_sessionId = sessionId;
}

QString sessionId()
{
    QMutexLocker lock(&g_auditMutex);
    return g_sessionId;
}

QString auditDir()
{
    QMutexLocker lock(&g_auditMutex);
    return baseAuditDirLocked();
}

QString currentLogFilePath()
{
    QMutexLocker lock(&g_auditMutex);
    if (!g_openPath.isEmpty())
        return g_openPath;
    return filePathForDayLocked(dayKey());
}

void setAuditDirOverride(const QString& absoluteDirPath)
{
    QMutexLocker lock(&g_auditMutex);

    const QString trimmed = absoluteDirPath.trimmed();
    const QString newVal = trimmed.isEmpty() ? QString() : QDir::cleanPath(trimmed);
    if (newVal == g_auditDirOverride)
        return;

    g_auditDirOverride = newVal;
    closeAuditFileLocked();
}

void writeEvent(const QString& eventName, const QJsonObject& fields)
{
    QMutexLocker lock(&g_auditMutex);

    if (!g_enabled || !ensureOpenLocked())
        return;

    QJsonObject o;
    o.insert("ts", QDateTime::currentDateTime().toString(Qt::ISODateWithMs));
    o.insert("event", eventName);
    o.insert("app", g_appName.isEmpty() ? QCoreApplication::applicationName() : g_appName);
    o.insert("pid", (qint64)QCoreApplication::applicationPid());
    o.insert("thread", (qint64)(quintptr)QThread::currentThreadId());

    if (!g_sessionId.isEmpty())
        o.insert("app_session", g_sessionId);

    for (auto it = fields.begin(); it != fields.end(); ++it)
        o.insert(it.key(), it.value());

    g_auditFile->write(QJsonDocument(o).toJson(QJsonDocument::Compact) + "\n");
    g_auditFile->flush();
}

QJsonObject commandFields(const QString& command, int timeoutMs, int mode)
{
    QJsonObject f;
    f.insert("timeout_ms", timeoutMs);

    const QString trimmed = command.trimmed();
    if (trimmed.isEmpty() || mode <= 0)
        return f;

    const QString head = trimmed.section(' ', 0, 0);
    if (!head.isEmpty())
        f.insert("cmd_head", head.left(64));
    f.insert("cmd_hash", hashUtf8Short(trimmed));

    if (mode >= 2)
        f.insert("cmd_full", trimmed);

    return f;
}

} // namespace AuditLogger
