/*
 * ShellDeck: multi-session SSH/SFTP core
 *
 * Copyright (c) 2025 Timo Erkvaara / CPUNK
 *
 * Licensed under the Apache License, Version 2.0
 * http://www.apache.org/licenses/LICENSE-2.0
 */

#include <QCoreApplication>
#include <QCommandLineParser>
#include <QSettings>
#include <QJsonDocument>
#include <QJsonObject>
#include <QUuid>
#include <QFileInfo>
#include <QDebug>

#include <cstdio>
#include <memory>

#include "AppConfig.h"
#include "Logger.h"
#include "AuditLogger.h"
#include "LibsshTransport.h"
#include "SessionRegistry.h"
#include "Dispatcher.h"

// main.cpp
// --------
// shelldeck-cli: runs one core operation against one host.
//
// Responsibilities:
// - Set QCoreApplication metadata (org/app name/version) for QSettings and paths
// - Load AppConfig (default QSettings, or an INI file given with --config)
// - Install logging + audit logging (session id, session start event)
// - connect -> <op> -> disconnect through the Dispatcher, print each envelope
//
// Secrets never go on the command line: the password comes from
// SHELLDECK_PASSWORD, a key passphrase from SHELLDECK_PASSPHRASE.
//
// Exit codes: 0 ok, 1 bad input (VALIDATION_ERROR / usage), 2 handler error.

static QJsonObject parseJsonArg(const QString& text, const char* what, bool* ok)
{
    QJsonParseError pe;
    const QJsonDocument doc = QJsonDocument::fromJson(text.toUtf8(), &pe);
    if (pe.error != QJsonParseError::NoError || !doc.isObject()) {
        std::fprintf(stderr, "Invalid JSON for %s: %s\n", what,
                     pe.error != QJsonParseError::NoError ? pe.errorString().toUtf8().constData()
                                                          : "expected an object");
        *ok = false;
        return QJsonObject();
    }
    *ok = true;
    return doc.object();
}

static void printEnvelope(const QJsonObject& env)
{
    const QByteArray out = QJsonDocument(env).toJson(QJsonDocument::Indented);
    std::fwrite(out.constData(), 1, (size_t)out.size(), stdout);
    std::fflush(stdout);
}

static int exitCodeFor(const QJsonObject& env)
{
    if (env.value("success").toBool()) return 0;
    return env.value("code").toString() == "VALIDATION_ERROR" ? 1 : 2;
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    QCoreApplication::setOrganizationName("CPUNK");
    QCoreApplication::setApplicationName("shelldeck");
    QCoreApplication::setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("ShellDeck session core: connect, run one operation, disconnect.");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOpt("config", "INI file with settings (default: user settings).", "file");
    QCommandLineOption levelOpt("log-level", "0=errors only, 1=normal, 2=debug.", "level");
    QCommandLineOption verboseOpt("verbose", "Echo log records to stderr.");
    QCommandLineOption connectOpt("connect",
        "Connect request JSON, e.g. {\"host\":\"h\",\"username\":\"u\",\"privateKey\":\"/path\"}.", "json");
    QCommandLineOption opOpt("op", "Operation to run after connecting.", "name");
    QCommandLineOption argsOpt("args", "Operation request JSON (connectionId is filled in).", "json", "{}");
    QCommandLineOption listOpsOpt("list-ops", "Print the available operations and exit.");

    parser.addOption(configOpt);
    parser.addOption(levelOpt);
    parser.addOption(verboseOpt);
    parser.addOption(connectOpt);
    parser.addOption(opOpt);
    parser.addOption(argsOpt);
    parser.addOption(listOpsOpt);
    parser.process(app);

    std::unique_ptr<QSettings> settings;
    if (parser.isSet(configOpt)) {
        const QString path = parser.value(configOpt);
        if (!QFileInfo::exists(path)) {
            std::fprintf(stderr, "Config file not found: %s\n", path.toUtf8().constData());
            return 1;
        }
        settings.reset(new QSettings(path, QSettings::IniFormat));
    } else {
        settings.reset(new QSettings());
    }

    AppConfig cfg = AppConfig::load(*settings);
    if (parser.isSet(levelOpt))
        cfg.logLevel = qBound(0, parser.value(levelOpt).toInt(), 2);

    // Logging + audit: install sinks and begin an app session with a unique id.
    Logger::setLogLevel(cfg.logLevel);
    Logger::setEchoToStderr(parser.isSet(verboseOpt));
    Logger::install("shelldeck");
    if (!cfg.auditDir.isEmpty())
        AuditLogger::setAuditDirOverride(cfg.auditDir);
    AuditLogger::install("shelldeck");
    AuditLogger::setSessionId(QUuid::createUuid().toString(QUuid::WithoutBraces));
    AuditLogger::writeEvent("app.start");

    LibsshTransport::PassphraseProvider passphrase = [](const QString&, bool* ok) {
        const QByteArray env = qgetenv("SHELLDECK_PASSPHRASE");
        *ok = !env.isEmpty();
        return QString::fromUtf8(env);
    };

    SessionRegistry registry(cfg, LibsshTransport::factory(cfg, passphrase));
    Dispatcher dispatcher(&registry, cfg);

    if (parser.isSet(listOpsOpt)) {
        for (const QString& op : dispatcher.operations())
            std::printf("%s\n", op.toUtf8().constData());
        return 0;
    }

    if (!parser.isSet(connectOpt)) {
        std::fprintf(stderr, "--connect is required.\n\n%s", parser.helpText().toUtf8().constData());
        return 1;
    }

    bool ok = false;
    QJsonObject connectReq = parseJsonArg(parser.value(connectOpt), "--connect", &ok);
    if (!ok) return 1;

    if (!connectReq.contains("password") && !connectReq.contains("privateKey")) {
        const QByteArray pw = qgetenv("SHELLDECK_PASSWORD");
        if (!pw.isEmpty())
            connectReq.insert("password", QString::fromUtf8(pw));
    }
    if (connectReq.contains("privateKey") && !connectReq.contains("passphrase")) {
        const QByteArray pp = qgetenv("SHELLDECK_PASSPHRASE");
        if (!pp.isEmpty())
            connectReq.insert("passphrase", QString::fromUtf8(pp));
    }

    QJsonObject opArgs;
    if (parser.isSet(opOpt)) {
        opArgs = parseJsonArg(parser.value(argsOpt), "--args", &ok);
        if (!ok) return 1;
    }

    // Streamed command output goes straight to the terminal.
    QObject::connect(&dispatcher, &Dispatcher::commandOutput, &dispatcher,
                     [](const QString&, const QByteArray& chunk, bool isStderr) {
                         std::fwrite(chunk.constData(), 1, (size_t)chunk.size(), isStderr ? stderr : stdout);
                     }, Qt::DirectConnection);

    const QJsonObject connected = dispatcher.call("connect", connectReq);
    printEnvelope(connected);
    if (!connected.value("success").toBool()) {
        AuditLogger::writeEvent("app.exit");
        return exitCodeFor(connected);
    }

    const QString id = connected.value("data").toObject().value("connectionId").toString();

    int rc = 0;
    if (parser.isSet(opOpt)) {
        opArgs.insert("connectionId", id);
        const QJsonObject result = dispatcher.call(parser.value(opOpt), opArgs);
        printEnvelope(result);
        rc = exitCodeFor(result);
    }

    QJsonObject bye;
    bye.insert("connectionId", id);
    dispatcher.call("disconnect", bye);

    AuditLogger::writeEvent("app.exit");
    return rc;
}
