#include <QtTest/QtTest>
#include <QtCore/QTextStream>
#include "utils/TestUtils.hpp"
#include "utils/MockComponents.hpp"
#include "../src/app/ConsoleProgressSink.hpp"
#include "../src/app/SyncController.hpp"

using namespace ReelSync;
using namespace ReelSync::Test;

namespace {
const QString kFooKey = "/library/parts/20/file.mkv";
const QString kBarKey = "/library/parts/21/file.mkv";
const QString kSeparator(61, QLatin1Char('-'));
}

class TestSyncController : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testPreviewListsOnlyPendingItems();
    void testDeclinedPromptAborts();
    void testEndOfInputAtPromptAborts();
    void testConfirmedRunDownloads();
    void testAssumeYesSkipsPrompt();
    void testPartFailureExitCode();
    void testDryRunLeavesDiskUntouched();
    void testDestinationIsFile();
    void testInterruptDuringDownload();
    void testRenderProgressLine();

private:
    QList<MediaItem> makeItems() const;
    QString fooPath(const QString& root) const { return root + "/Movies/Foo (2020)/Foo (2020).mkv"; }
    QString barPath(const QString& root) const { return root + "/Movies/Bar (2019)/Bar.mkv"; }

    Config::TransferSettings settings_;
    QByteArray foo_;
    QByteArray bar_;
    std::unique_ptr<FakeRemoteStore> store_;
    CancellationToken token_;
};

void TestSyncController::initTestCase() {
    TestUtils::initializeTestEnvironment();
}

void TestSyncController::cleanupTestCase() {
    TestUtils::cleanupTestEnvironment();
}

void TestSyncController::init() {
    settings_ = Config::TransferSettings();
    settings_.probeBytes = 1024;
    settings_.probeRetryDelayMs = 1;

    foo_ = TestUtils::generateRandomData(20000);
    bar_ = TestUtils::generateRandomData(3000);
    store_ = std::make_unique<FakeRemoteStore>();
    store_->setContent(kFooKey, foo_);
    store_->setContent(kBarKey, bar_);
    token_.reset();
}

QList<MediaItem> TestSyncController::makeItems() const {
    RemotePart foo;
    foo.remoteKey = kFooKey;
    foo.declaredSize = foo_.size();
    foo.sourcePath = "/data/movies/Foo (2020)/Foo (2020).mkv";

    RemotePart bar;
    bar.remoteKey = kBarKey;
    bar.declaredSize = bar_.size();
    bar.sourcePath = "/data/movies/Bar (2019)/Bar.mkv";

    return {TestUtils::createTestItem("Foo (2020)", "Movies", "/data/movies", {foo}),
            TestUtils::createTestItem("Bar (2019)", "Movies", "/data/movies", {bar})};
}

void TestSyncController::testPreviewListsOnlyPendingItems() {
    TEST_SCOPE("testPreviewListsOnlyPendingItems");
    const QString root = _testScope.getTempDirectory();
    TestUtils::createTestFile(root, "Movies/Bar (2019)/Bar.mkv", bar_);

    QString output;
    QString input;
    QTextStream out(&output);
    QTextStream in(&input);
    SyncOrchestrator orchestrator(*store_, settings_);
    SyncController controller(orchestrator, out, in, token_);

    auto summary = controller.preview(makeItems(), root);

    ASSERT_EXPECTED_VALUE(summary);
    QCOMPARE(summary.value().itemsPending, 1);
    QCOMPARE(summary.value().bytesPending, qint64(20000));
    QCOMPARE(summary.value().issues, 0);
    QCOMPARE(output, QString("Items to download:\n"
                             "Foo (2020) (19.53 KiB)\n"
                             "Total: 1 items, 19.53 KiB\n") + kSeparator + '\n');
}

void TestSyncController::testDeclinedPromptAborts() {
    TEST_SCOPE("testDeclinedPromptAborts");
    const QString root = _testScope.getTempDirectory();

    QString output;
    QString input("n\n");
    QTextStream out(&output);
    QTextStream in(&input);
    SyncOrchestrator orchestrator(*store_, settings_);
    SyncController controller(orchestrator, out, in, token_);

    const int code = controller.run(makeItems(), SyncController::Options{root, false, false});

    QCOMPARE(code, static_cast<int>(ExitFailure));
    QVERIFY(output.contains("Press Y to continue downloading: "));
    QVERIFY(output.endsWith("Aborted.\n"));
    QCOMPARE(store_->openCount(), 0);
    ASSERT_FILE_NOT_EXISTS(fooPath(root));
}

void TestSyncController::testEndOfInputAtPromptAborts() {
    TEST_SCOPE("testEndOfInputAtPromptAborts");

    QString output;
    QString input;
    QTextStream out(&output);
    QTextStream in(&input);
    SyncOrchestrator orchestrator(*store_, settings_);
    SyncController controller(orchestrator, out, in, token_);

    const int code = controller.run(makeItems(),
                                    SyncController::Options{_testScope.getTempDirectory(), false, false});

    QCOMPARE(code, static_cast<int>(ExitFailure));
    QVERIFY(output.contains("Aborted."));
}

void TestSyncController::testConfirmedRunDownloads() {
    TEST_SCOPE("testConfirmedRunDownloads");
    const QString root = _testScope.getTempDirectory();

    QString output;
    QString input("Y\n");
    QTextStream out(&output);
    QTextStream in(&input);
    SyncOrchestrator orchestrator(*store_, settings_);
    SyncController controller(orchestrator, out, in, token_);

    const int code = controller.run(makeItems(), SyncController::Options{root, false, false});

    QCOMPARE(code, static_cast<int>(ExitSuccess));
    QVERIFY(output.contains("Finished: 2 items synced, 0 with errors, 22.46 KiB transferred\n"));
    QCOMPARE(TestUtils::readFile(fooPath(root)), foo_);
    QCOMPARE(TestUtils::readFile(barPath(root)), bar_);
}

void TestSyncController::testAssumeYesSkipsPrompt() {
    TEST_SCOPE("testAssumeYesSkipsPrompt");
    const QString root = _testScope.getTempDirectory();

    QString output;
    QString input;
    QTextStream out(&output);
    QTextStream in(&input);
    SyncOrchestrator orchestrator(*store_, settings_);
    SyncController controller(orchestrator, out, in, token_);

    const int code = controller.run(makeItems(), SyncController::Options{root, true, false});

    QCOMPARE(code, static_cast<int>(ExitSuccess));
    QVERIFY(!output.contains("Press Y"));
    ASSERT_FILE_EXISTS(fooPath(root));
}

void TestSyncController::testPartFailureExitCode() {
    TEST_SCOPE("testPartFailureExitCode");
    const QString root = _testScope.getTempDirectory();
    store_->setFailNextOpens(kFooKey, 1);

    QString output;
    QString input;
    QTextStream out(&output);
    QTextStream in(&input);
    SyncOrchestrator orchestrator(*store_, settings_);
    SyncController controller(orchestrator, out, in, token_);

    const int code = controller.run(makeItems(), SyncController::Options{root, true, false});

    QCOMPARE(code, static_cast<int>(ExitPartFailures));
    QVERIFY(output.contains("Finished: 1 items synced, 1 with errors"));
    QVERIFY(output.contains("NetworkError: /data/movies/Foo (2020)/Foo (2020).mkv"));
    ASSERT_FILE_EXISTS(barPath(root));
}

void TestSyncController::testDryRunLeavesDiskUntouched() {
    TEST_SCOPE("testDryRunLeavesDiskUntouched");
    const QString root = _testScope.getTempDirectory() + "/not-yet-created";

    QString output;
    QString input;
    QTextStream out(&output);
    QTextStream in(&input);
    SyncOrchestrator orchestrator(*store_, settings_);
    SyncController controller(orchestrator, out, in, token_);

    const int code = controller.run(makeItems(), SyncController::Options{root, false, true});

    QCOMPARE(code, static_cast<int>(ExitSuccess));
    QVERIFY(output.contains("Total: 2 items, 22.46 KiB"));
    QVERIFY(!output.contains("Press Y"));
    QCOMPARE(store_->openCount(), 0);
    ASSERT_FILE_NOT_EXISTS(root);
}

void TestSyncController::testDestinationIsFile() {
    TEST_SCOPE("testDestinationIsFile");
    const QString root = TestUtils::createTestFile(_testScope.getTempDirectory(), "plain-file", "x");

    QString output;
    QString input;
    QTextStream out(&output);
    QTextStream in(&input);
    SyncOrchestrator orchestrator(*store_, settings_);
    SyncController controller(orchestrator, out, in, token_);

    const int code = controller.run(makeItems(), SyncController::Options{root, true, false});

    QCOMPARE(code, static_cast<int>(ExitDestinationUnavailable));
    QVERIFY(output.contains("Destination unavailable"));
    QCOMPARE(store_->openCount(), 0);
}

void TestSyncController::testInterruptDuringDownload() {
    TEST_SCOPE("testInterruptDuringDownload");
    const QString root = _testScope.getTempDirectory();
    store_->setMaxReadSize(4096);
    store_->setReadObserver([this](qint64 served) {
        if (served >= 8192) {
            token_.cancel();
        }
    });

    QString output;
    QString input;
    QTextStream out(&output);
    QTextStream in(&input);
    SyncOrchestrator orchestrator(*store_, settings_);
    SyncController controller(orchestrator, out, in, token_);

    const int code = controller.run(makeItems(), SyncController::Options{root, true, false});

    QCOMPARE(code, static_cast<int>(ExitInterrupted));
    QVERIFY(output.endsWith("Stopped by user (Ctrl+C)\n"));
    QVERIFY(!output.contains("Finished:"));
    ASSERT_FILE_NOT_EXISTS(barPath(root));

    // Partial bytes stay on disk for the next run to resume
    QCOMPARE(QFileInfo(fooPath(root)).size(), qint64(8192));
}

void TestSyncController::testRenderProgressLine() {
    QCOMPARE(ConsoleProgressSink::render("[1/2] Foo", 512, 1024),
             QString("[1/2] Foo:  50% |###############---------------| 512.00 B/1.00 KiB"));
    QCOMPARE(ConsoleProgressSink::render("[2/2] Bar", 0, 0),
             QString("[2/2] Bar: 100% |##############################| 0B/0B"));
    QCOMPARE(ConsoleProgressSink::render("x", 0, 4096),
             QString("x:   0% |------------------------------| 0B/4.00 KiB"));
}

int runTestSyncController(int argc, char** argv) {
    TestSyncController test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_sync_controller.moc"
