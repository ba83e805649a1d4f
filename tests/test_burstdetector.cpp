#include <QtTest/QtTest>

#include <QDateTime>
#include <QFuture>
#include <QList>
#include <QString>

#include <atomic>

#include <QtConcurrent/QtConcurrentRun>

#ifndef Q_MOC_RUN
import sazman.core.burstdetector;
import sazman.core.models;
#endif

namespace {

QDateTime baseTime()
{
    return QDateTime(QDate(2026, 3, 14), QTime(10, 0, 0));
}

QDateTime at(int seconds)
{
    return baseTime().addSecs(seconds);
}

struct BurstCounter {
    int started = 0;
    int continued = 0;
    int ended = 0;
    BurstStatus lastEnded;

    void attach(BurstDetector& detector)
    {
        QObject::connect(&detector, &BurstDetector::burstStarted, [this](const BurstStatus&) { ++started; });
        QObject::connect(&detector, &BurstDetector::burstContinued, [this](const BurstStatus&) { ++continued; });
        QObject::connect(&detector, &BurstDetector::burstEnded, [this](const BurstStatus& status) {
            ++ended;
            lastEnded = status;
        });
    }
};

} // namespace

class TestBurstDetector : public QObject {
    Q_OBJECT

private slots:
    void testSingleFileIsNotABurst();
    void testTwoFilesWithinThresholdStartBurst();
    void testFilesFartherApartNeverShareWindow();
    void testBurstContinuesThenEnds();
    void testSweepEndsIdleBurst();
    void testMaxDurationForcesEnd();
    void testMinimumFilesRespected();
    void testIsBurstDoesNotMutate();
    void testConfidence();
    void testRemaining();
    void testResetEndsBurst();
    void testInvalidSettingsRejected();
    void testStatusIsIdempotent();
    void testConcurrentRecords();
};

void TestBurstDetector::testSingleFileIsNotABurst()
{
    BurstDetector detector;
    BurstCounter counter;
    counter.attach(detector);

    detector.record(QStringLiteral("a.pdf"), at(0));

    const BurstStatus status = detector.status();
    QVERIFY(!status.isActive);
    QCOMPARE(status.fileCount, 1);
    QCOMPARE(counter.started, 0);
    QCOMPARE(detector.currentCount(), 0);
}

void TestBurstDetector::testTwoFilesWithinThresholdStartBurst()
{
    BurstDetector detector;
    BurstCounter counter;
    counter.attach(detector);

    detector.record(QStringLiteral("a.pdf"), at(0));
    detector.record(QStringLiteral("b.pdf"), at(2));

    const BurstStatus status = detector.status();
    QVERIFY(status.isActive);
    QCOMPARE(status.fileCount, 2);
    QCOMPARE(status.burstStartTime.value(), at(0));
    QCOMPARE(status.lastFileTime.value(), at(2));
    QCOMPARE(status.fileNames, QStringList({ QStringLiteral("a.pdf"), QStringLiteral("b.pdf") }));
    QCOMPARE(counter.started, 1);
    QCOMPARE(detector.currentCount(), 2);
}

void TestBurstDetector::testFilesFartherApartNeverShareWindow()
{
    BurstDetector detector;
    detector.record(QStringLiteral("a.pdf"), at(0));
    detector.record(QStringLiteral("b.pdf"), at(6));

    const BurstStatus status = detector.status();
    QVERIFY(!status.isActive);
    QCOMPARE(status.fileCount, 1);
    QCOMPARE(status.fileNames.first(), QStringLiteral("b.pdf"));
}

void TestBurstDetector::testBurstContinuesThenEnds()
{
    BurstDetector detector;
    BurstCounter counter;
    counter.attach(detector);

    detector.record(QStringLiteral("a.pdf"), at(0));
    detector.record(QStringLiteral("b.pdf"), at(2));
    detector.record(QStringLiteral("c.pdf"), at(4));
    QCOMPARE(counter.started, 1);
    QCOMPARE(counter.continued, 1);

    detector.record(QStringLiteral("d.pdf"), at(20));
    QCOMPARE(counter.ended, 1);
    QVERIFY(!counter.lastEnded.isActive);
    QVERIFY(!detector.status().isActive);
    QCOMPARE(detector.status().fileCount, 1);
}

void TestBurstDetector::testSweepEndsIdleBurst()
{
    BurstDetector detector;
    BurstCounter counter;
    counter.attach(detector);

    detector.record(QStringLiteral("a.pdf"), at(0));
    detector.record(QStringLiteral("b.pdf"), at(1));
    detector.sweep(at(3));
    QCOMPARE(counter.ended, 0);

    detector.sweep(at(10));
    QCOMPARE(counter.ended, 1);
    QCOMPARE(detector.status().fileCount, 0);
    QVERIFY(!detector.status().isActive);
}

void TestBurstDetector::testMaxDurationForcesEnd()
{
    BurstDetector detector;
    detector.setMaxBurstDurationSeconds(10);
    BurstCounter counter;
    counter.attach(detector);

    for (int second = 0; second <= 9; second += 3) {
        detector.record(QStringLiteral("f%1.pdf").arg(second), at(second));
    }
    QVERIFY(detector.status().isActive);
    QCOMPARE(counter.ended, 0);
    QVERIFY(detector.isBurst(QStringLiteral("f10.pdf"), at(10)));

    QVERIFY(!detector.isBurst(QStringLiteral("f12.pdf"), at(12)));
    QVERIFY(detector.status().isActive);
    detector.record(QStringLiteral("f12.pdf"), at(12));
    QCOMPARE(counter.ended, 1);
    QVERIFY(!detector.status().isActive);
    QCOMPARE(detector.status().fileCount, 1);

    detector.record(QStringLiteral("f15.pdf"), at(15));
    QCOMPARE(counter.started, 2);
    QCOMPARE(detector.status().burstStartTime.value(), at(12));
}

void TestBurstDetector::testMinimumFilesRespected()
{
    BurstDetector detector;
    detector.setMinimumFilesForBurst(3);

    detector.record(QStringLiteral("a.pdf"), at(0));
    detector.record(QStringLiteral("b.pdf"), at(1));
    QVERIFY(!detector.status().isActive);

    detector.record(QStringLiteral("c.pdf"), at(2));
    QVERIFY(detector.status().isActive);
    QCOMPARE(detector.status().fileCount, 3);
}

void TestBurstDetector::testIsBurstDoesNotMutate()
{
    BurstDetector detector;
    QVERIFY(!detector.isBurst(QStringLiteral("a.pdf"), at(0)));

    detector.record(QStringLiteral("a.pdf"), at(0));
    QVERIFY(detector.isBurst(QStringLiteral("b.pdf"), at(3)));
    QVERIFY(!detector.isBurst(QStringLiteral("b.pdf"), at(30)));

    QCOMPARE(detector.status().fileCount, 1);
    QVERIFY(!detector.status().isActive);
}

void TestBurstDetector::testConfidence()
{
    BurstStatus single;
    single.fileCount = 1;
    QCOMPARE(single.confidence(), 0.0);

    BurstDetector detector;
    detector.record(QStringLiteral("a.pdf"), at(0));
    detector.record(QStringLiteral("b.pdf"), at(2));
    // count score 0.2, interval score 1 - 2/10
    QVERIFY(qAbs(detector.status().confidence() - 0.5) < 1e-9);

    BurstDetector fast;
    for (int i = 0; i < 10; ++i) fast.record(QStringLiteral("f%1").arg(i), at(i));
    QCOMPARE(fast.status().confidence(), 1.0);
}

void TestBurstDetector::testRemaining()
{
    BurstDetector detector;
    QVERIFY(!detector.remaining(at(0)).has_value());

    detector.record(QStringLiteral("a.pdf"), at(0));
    QVERIFY(!detector.remaining(at(1)).has_value());

    detector.record(QStringLiteral("b.pdf"), at(2));
    QVERIFY(qAbs(detector.remaining(at(3)).value() - 4.0) < 1e-9);
    QCOMPARE(detector.remaining(at(30)).value(), 0.0);
}

void TestBurstDetector::testResetEndsBurst()
{
    BurstDetector detector;
    BurstCounter counter;
    counter.attach(detector);

    detector.record(QStringLiteral("a.pdf"), at(0));
    detector.record(QStringLiteral("b.pdf"), at(1));
    detector.reset();

    QCOMPARE(counter.ended, 1);
    QCOMPARE(detector.currentCount(), 0);
    QCOMPARE(detector.status().fileCount, 0);
    QVERIFY(!detector.status().burstStartTime.has_value());
}

void TestBurstDetector::testInvalidSettingsRejected()
{
    BurstDetector detector;
    detector.setBurstThresholdSeconds(0);
    detector.setMinimumFilesForBurst(1);
    detector.setMaxBurstDurationSeconds(2);
    detector.setSaturationCount(1);

    QCOMPARE(detector.burstThresholdSeconds(), 5);
    QCOMPARE(detector.minimumFilesForBurst(), 2);
    QCOMPARE(detector.maxBurstDurationSeconds(), 60);
    QCOMPARE(detector.saturationCount(), 10);

    detector.setBurstThresholdSeconds(8);
    detector.setMaxBurstDurationSeconds(120);
    QCOMPARE(detector.burstThresholdSeconds(), 8);
    QCOMPARE(detector.maxBurstDurationSeconds(), 120);
}

void TestBurstDetector::testStatusIsIdempotent()
{
    BurstDetector detector;
    detector.record(QStringLiteral("a.pdf"), at(0));
    detector.record(QStringLiteral("b.pdf"), at(1));

    const BurstStatus first = detector.status();
    const BurstStatus second = detector.status();
    QCOMPARE(first.isActive, second.isActive);
    QCOMPARE(first.fileCount, second.fileCount);
    QCOMPARE(first.fileNames, second.fileNames);
    QVERIFY(first.burstStartTime == second.burstStartTime);
}

void TestBurstDetector::testConcurrentRecords()
{
    BurstDetector detector;
    std::atomic<int> started{ 0 };
    std::atomic<int> continued{ 0 };
    connect(&detector, &BurstDetector::burstStarted, [&started](const BurstStatus&) { ++started; });
    connect(&detector, &BurstDetector::burstContinued, [&continued](const BurstStatus&) { ++continued; });

    constexpr int files = 8;
    QList<QFuture<void>> running;
    for (int i = 0; i < files; ++i) {
        running.append(QtConcurrent::run([&detector, i]() { detector.record(QStringLiteral("f%1.pdf").arg(i), at(1)); }));
    }
    for (QFuture<void>& future : running) future.waitForFinished();

    QCOMPARE(started.load(), 1);
    QCOMPARE(continued.load(), files - 2);
    QCOMPARE(detector.currentCount(), files);
}

QTEST_MAIN(TestBurstDetector)
#include "test_burstdetector.moc"
