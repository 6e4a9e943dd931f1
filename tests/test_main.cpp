#include <QCoreApplication>
#include <gtest/gtest.h>

#include "AuditLogger.h"
#include "Logger.h"

// Timers and future watchers need a QCoreApplication; tests spin its
// event loop explicitly (see waitUntil()).
int main(int argc, char** argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("CPUNK");
    QCoreApplication::setApplicationName("shelldeck-tests");

    AuditLogger::setEnabled(false);
    Logger::setLogLevel(0);

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
