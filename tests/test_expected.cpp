#include <QtTest/QtTest>
#include <memory>
#include "../src/core/common/Expected.hpp"
#include "../src/core/sync/SyncTypes.hpp"

using namespace ReelSync;

class TestExpected : public QObject {
    Q_OBJECT

private slots:
    void testValueConstruction() {
        Expected<int, QString> result(42);

        QVERIFY(result.hasValue());
        QVERIFY(!result.hasError());
        QVERIFY(static_cast<bool>(result));
        QCOMPARE(result.value(), 42);
    }

    void testErrorConstruction() {
        Expected<int, QString> result(QString("Error occurred"));

        QVERIFY(!result.hasValue());
        QVERIFY(result.hasError());
        QCOMPARE(result.error(), QString("Error occurred"));
    }

    void testUnexpectedConstruction() {
        Expected<QString, SyncFailure> result = makeUnexpected(
            SyncFailure{SyncError::MappingError, "not under any location"});

        QVERIFY(result.hasError());
        QCOMPARE(result.error().error, SyncError::MappingError);
        QCOMPARE(result.error().message, QString("not under any location"));
        QCOMPARE(result.error().toString(), QString("MappingError: not under any location"));
    }

    void testAccessingWrongAlternativeThrows() {
        Expected<int, QString> success(1);
        bool errorThrew = false;
        try {
            success.error();
        } catch (const std::logic_error&) {
            errorThrew = true;
        }
        QVERIFY(errorThrew);

        Expected<int, QString> failure(QString("nope"));
        bool valueThrew = false;
        try {
            failure.value();
        } catch (const std::logic_error&) {
            valueThrew = true;
        }
        QVERIFY(valueThrew);
    }

    void testMonadicOperations() {
        Expected<int, QString> success(10);

        auto doubled = success.transform([](int x) { return x * 2; });
        QVERIFY(doubled.hasValue());
        QCOMPARE(doubled.value(), 20);

        Expected<int, QString> failure("Failed");
        auto failedTransform = failure.transform([](int x) { return x * 2; });
        QVERIFY(failedTransform.hasError());
        QCOMPARE(failedTransform.error(), QString("Failed"));
    }

    void testValueOr() {
        Expected<int, QString> success(42);
        QCOMPARE(success.valueOr(0), 42);

        Expected<int, QString> failure("Error");
        QCOMPARE(failure.valueOr(99), 99);
    }

    void testCopySemantics() {
        Expected<int, QString> original(123);
        Expected<int, QString> copy = original;

        QVERIFY(copy.hasValue());
        QCOMPARE(copy.value(), 123);
        QVERIFY(original.hasValue());
        QCOMPARE(original.value(), 123);

        copy = Expected<int, QString>(QString("replaced"));
        QVERIFY(copy.hasError());
        QCOMPARE(original.value(), 123);
    }

    void testMoveOnlyValue() {
        Expected<std::unique_ptr<int>, SyncFailure> result(std::make_unique<int>(7));
        QVERIFY(result.hasValue());

        std::unique_ptr<int> owned = std::move(result).value();
        QVERIFY(owned != nullptr);
        QCOMPARE(*owned, 7);

        Expected<std::unique_ptr<int>, SyncFailure> moved(
            makeUnexpected(SyncFailure{SyncError::NetworkError, "HTTP 500"}));
        Expected<std::unique_ptr<int>, SyncFailure> target(std::move(moved));
        QVERIFY(target.hasError());
        QCOMPARE(target.error().error, SyncError::NetworkError);
    }

    void testBoolValueIsNotAnError() {
        Expected<bool, SyncFailure> verified(false);
        QVERIFY(verified.hasValue());
        QCOMPARE(verified.value(), false);
    }
};

int runTestExpected(int argc, char** argv) {
    TestExpected test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_expected.moc"
