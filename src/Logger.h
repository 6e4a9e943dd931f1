#pragma once
#include <QString>
#include <QJsonObject>

// Process-wide Qt message handler: qDebug/qInfo/qWarning/qCritical go to a
// size-rotated log file (stderr fallback). Component code logs with a
// bracketed tag, e.g. qInfo().noquote() << "[REGISTRY] ...".
namespace Logger {
    void install(const QString& appName);

    // 0=Errors only, 1=Normal, 2=Debug
    void setLogLevel(int level);
    int  logLevel();

    // Also copy every accepted record to stderr (CLI use).
    void setEchoToStderr(bool on);

    QString logFilePath();
    void setLogFilePathOverride(const QString& absoluteFilePath);  // empty => use default
    QString logDirPath();

    // Copy of a request object with secret fields masked, safe to log.
    QJsonObject redact(const QJsonObject& request);
}
