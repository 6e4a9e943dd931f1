// Logger.cpp
#include "Logger.h"

#include <QDir>
#include <QDateTime>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>
#include <QTextStream>
#include <QMutex>
#include <QMutexLocker>
#include <QAtomicInt>
#include <QThread>
#include <QDebug>

#include <cstdio>     // fprintf
#include <cstdlib>    // abort

#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
#include <QStringConverter>
#endif

// =====================================================
// Global logger state (process-wide)
// =====================================================

static QFile*     g_file  = nullptr;   // Open log file handle
static QMutex     g_mutex;             // Guards file + path state
static QString    g_path;              // Absolute path to log file
static QString    g_pathOverride;
static QAtomicInt g_level(1);          // 0=Errors only, 1=Normal, 2=Debug
static QAtomicInt g_echo(0);           // copy records to stderr

// Prevent recursion if something inside handler triggers Qt logging again
static thread_local bool g_inHandler = false;

static const qint64 kRotateBytes = 4 * 1024 * 1024;
static const int    kRotateKeep  = 3;

static const char* levelName(QtMsgType t)
{
    switch (t) {
        case QtDebugMsg:    return "DEBUG";
        case QtInfoMsg:     return "INFO";
        case QtWarningMsg:  return "WARN";
        case QtCriticalMsg: return "ERROR";
        case QtFatalMsg:    return "FATAL";
    }
    return "LOG";
}

// 0 = WARN/ERROR/FATAL, 1 = + INFO, 2 = everything
static bool allowMessage(QtMsgType type)
{
    const int lvl = g_level.loadAcquire();
    if (type == QtDebugMsg)
        return lvl >= 2;
    if (type == QtInfoMsg)
        return lvl >= 1;
    return true;
}

// One record = one physical line
static QString normalizeMessage(QString s)
{
    s.replace("\r\n", "\n");
    s.replace('\r', '\n');
    s.replace('\n', ' ');
    s.replace('\t', ' ');
    return s.simplified();
}

static QString formatRecord(QtMsgType type, const QMessageLogContext& ctx, const QString& msg)
{
    const QString ts = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz");
    const quintptr tid = reinterpret_cast<quintptr>(QThread::currentThreadId());

    QString line = QString("%1 [%2] (t%3) ")
                       .arg(ts, QLatin1String(levelName(type)))
                       .arg(tid % 100000);

    if (ctx.file && ctx.line > 0)
        line += QString("%1:%2 - ").arg(QFileInfo(QString::fromUtf8(ctx.file)).fileName()).arg(ctx.line);

    line += normalizeMessage(msg);
    return line;
}

static void writeStderr(const QString& line)
{
    const QByteArray utf8 = line.toUtf8();
    std::fprintf(stderr, "%s\n", utf8.constData());
    std::fflush(stderr);
}

static void handler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg)
{
    if (!allowMessage(type) || g_inHandler) {
        if (type == QtFatalMsg) abort(); // never suppress fatal
        return;
    }
    g_inHandler = true;

    const QString line = formatRecord(type, ctx, msg);

    {
        QMutexLocker lock(&g_mutex);

        if (g_file && g_file->isOpen()) {
            QTextStream out(g_file);
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
            out.setEncoding(QStringConverter::Utf8);
#else
            out.setCodec("UTF-8");
#endif
            out << line << "\n";
            out.flush();
        } else {
            writeStderr(line);
        }

        if (g_echo.loadAcquire() && g_file && g_file->isOpen())
            writeStderr(line);
    }

    g_inHandler = false;

    if (type == QtFatalMsg)
        abort();
}

// Size-based rotation: log -> .1 -> .2 -> .3 (oldest dropped)
static void rotateIfNeeded(const QString& path)
{
    QFileInfo fi(path);
    if (!fi.exists() || fi.size() < kRotateBytes)
        return;

    QFile::remove(path + "." + QString::number(kRotateKeep));
    for (int i = kRotateKeep - 1; i >= 1; --i) {
        const QString older = path + "." + QString::number(i);
        if (QFileInfo::exists(older))
            QFile::rename(older, path + "." + QString::number(i + 1));
    }
    QFile::rename(path, path + ".1");
}

// Must be called with g_mutex held.
static bool reopenLocked(const QString& path)
{
    if (g_file) {
        if (g_file->isOpen()) g_file->close();
        delete g_file;
        g_file = nullptr;
    }

    QDir().mkpath(QFileInfo(path).absolutePath());
    rotateIfNeeded(path);

    g_file = new QFile(path);
    if (!g_file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "Logger: failed to open log file: %s\n", path.toUtf8().constData());
        std::fflush(stderr);
        delete g_file;
        g_file = nullptr;
        return false;
    }
    g_path = path;
    return true;
}

namespace Logger {

void install(const QString& appName)
{
    const QString defaultPath =
        QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation)
        + "/logs/" + appName + ".log";

    {
        QMutexLocker lock(&g_mutex);
        const QString chosen = g_pathOverride.isEmpty() ? defaultPath : g_pathOverride;
        reopenLocked(QDir::cleanPath(chosen));
    }

    qInstallMessageHandler(handler);
    qInfo().noquote() << QString("[LOG] logger initialized: %1 level=%2")
                         .arg(logFilePath()).arg(logLevel());
}

void setLogLevel(int level)
{
    g_level.storeRelease(qBound(0, level, 2));
}

int logLevel()
{
    return g_level.loadAcquire();
}

void setEchoToStderr(bool on)
{
    g_echo.storeRelease(on ? 1 : 0);
}

QString logFilePath()
{
    QMutexLocker lock(&g_mutex);
    return g_path;
}

void setLogFilePathOverride(const QString& absoluteFilePath)
{
    QMutexLocker lock(&g_mutex);

    g_pathOverride = absoluteFilePath.trimmed().isEmpty()
                         ? QString()
                         : QDir::cleanPath(absoluteFilePath.trimmed());

    // Cleared: keep the current file; next install() uses the default.
    if (g_pathOverride.isEmpty())
        return;

    reopenLocked(g_pathOverride);
}

QString logDirPath()
{
    const QString p = logFilePath();
    return p.isEmpty() ? QString() : QFileInfo(p).absolutePath();
}

QJsonObject redact(const QJsonObject& request)
{
    static const char* secretKeys[] = { "password", "passphrase", "privateKey" };

    QJsonObject o = request;
    for (const char* k : secretKeys) {
        const QString key = QLatin1String(k);
        if (o.contains(key))
            o.insert(key, QStringLiteral("[HIDDEN]"));
    }
    return o;
}

} // namespace Logger
