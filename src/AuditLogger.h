#pragma once

#include <QString>
#include <QJsonObject>

// Append-only JSONL audit trail (one file per day) for session lifecycle,
// command execution and transfer events. Callers never pass secrets.
namespace AuditLogger {
    void install(const QString& appName);

    void setEnabled(bool on);
    bool isEnabled();

    void setSessionId(const QString& sessionId);
    QString sessionId();

    QString auditDir();
    QString currentLogFilePath();
    void setAuditDirOverride(const QString& absoluteDirPath); // empty => use default

    void writeEvent(const QString& eventName, const QJsonObject& fields = QJsonObject());

    // Command metadata by mode: 0 = nothing, 1 = head + short hash, 2 = full text.
    QJsonObject commandFields(const QString& command, int timeoutMs, int mode);
}
