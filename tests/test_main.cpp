#include <QtTest/QtTest>
#include <QtCore/QCoreApplication>
#include <QtCore/QDebug>

#include "utils/TestUtils.hpp"
#include "../src/core/common/Logger.hpp"

// Test suites live in separate compilation units
extern int runTestExpected(int argc, char** argv);
extern int runTestSizeFormat(int argc, char** argv);
extern int runTestRetryManager(int argc, char** argv);
extern int runTestConfig(int argc, char** argv);
extern int runTestPathMapper(int argc, char** argv);
extern int runTestCatalogLoader(int argc, char** argv);
extern int runTestIntegrityClassifier(int argc, char** argv);
extern int runTestTransferExecutor(int argc, char** argv);
extern int runTestSyncOrchestrator(int argc, char** argv);
extern int runTestHttpRemoteStore(int argc, char** argv);
extern int runTestSyncController(int argc, char** argv);

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    ReelSync::Logger::instance().initialize("reelsync-tests.log", ReelSync::Logger::Level::Trace);
    ReelSync::Test::TestUtils::initializeTestEnvironment();

    int totalResult = 0;
    int testCount = 0;
    int passedTests = 0;

    struct TestInfo {
        const char* name;
        int (*function)(int, char**);
    };

    TestInfo tests[] = {
        {"Expected", runTestExpected},
        {"SizeFormat", runTestSizeFormat},
        {"RetryManager", runTestRetryManager},
        {"Config", runTestConfig},
        {"PathMapper", runTestPathMapper},
        {"CatalogLoader", runTestCatalogLoader},
        {"IntegrityClassifier", runTestIntegrityClassifier},
        {"TransferExecutor", runTestTransferExecutor},
        {"SyncOrchestrator", runTestSyncOrchestrator},
        {"HttpRemoteStore", runTestHttpRemoteStore},
        {"SyncController", runTestSyncController}
    };

    for (const auto& test : tests) {
        qDebug() << "\n========================================";
        qDebug() << "Running test suite:" << test.name;
        qDebug() << "========================================";

        testCount++;
        int result = test.function(argc, argv);

        if (result == 0) {
            qDebug() << "✓ Test suite" << test.name << "PASSED";
            passedTests++;
        } else {
            qDebug() << "✗ Test suite" << test.name << "FAILED with code" << result;
            totalResult |= result;
        }
    }

    ReelSync::Test::TestUtils::cleanupTestEnvironment();

    // Summary
    qDebug() << "\n========================================";
    qDebug() << "TEST SUMMARY";
    qDebug() << "========================================";
    qDebug() << "Total test suites:" << testCount;
    qDebug() << "Passed:" << passedTests;
    qDebug() << "Failed:" << (testCount - passedTests);
    qDebug() << "Overall result:" << (totalResult == 0 ? "PASS" : "FAIL");

    return totalResult;
}
