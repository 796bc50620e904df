#include <QElapsedTimer>
#include <QFuture>
#include <QList>
#include <QObject>
#include <QSignalSpy>
#include <QTest>
#include <QtConcurrent/QtConcurrentRun>
#include <atomic>

#ifndef Q_MOC_RUN
import rasta.core.ratelimiter;
#endif

class TestRateLimiter : public QObject {
    Q_OBJECT

private slots:
    void unlimitedGrantsImmediately();
    void firstBucketIsImmediate();
    void tokensStayWithinLimit();
    void paysForBytesBeyondTheBucket();
    void requestLargerThanLimitIsSliced();
    void fiveThousandBytesAtOneThousandTakeFourSeconds();
    void cancelPredicateAbortsWait();
    void resetClearsSpeed();
    void speedUsesActualSpan();
    void setSpeedLimitWakesBlockedWaiters();
    void concurrentAcquireRespectsLimit();
    void asyncCallbackIsQueued();
    void asyncWaitsForTokens();
    void asyncDroppedWithContext();
};

void TestRateLimiter::unlimitedGrantsImmediately()
{
    RateLimiter limiter(0);
    QElapsedTimer timer;
    timer.start();
    QVERIFY(limiter.acquire(10 * 1024 * 1024));
    QVERIFY(timer.elapsed() < 100);
    QCOMPARE(limiter.totalGranted(), qint64(10 * 1024 * 1024));
}

void TestRateLimiter::firstBucketIsImmediate()
{
    RateLimiter limiter(1000);
    QElapsedTimer timer;
    timer.start();
    QVERIFY(limiter.acquire(1000));
    QVERIFY(timer.elapsed() < 100);
    QVERIFY(limiter.availableTokens() < 100.0);
}

void TestRateLimiter::tokensStayWithinLimit()
{
    RateLimiter limiter(1000);
    const auto inBounds = [&limiter] {
        const double tokens = limiter.availableTokens();
        return tokens >= 0.0 && tokens <= 1000.0;
    };

    QVERIFY(inBounds());
    QCOMPARE(limiter.availableTokens(), 1000.0);

    QVERIFY(limiter.acquire(600));
    QVERIFY(inBounds());
    QVERIFY(limiter.availableTokens() < 500.0);

    // A sliced request drains the bucket without going negative.
    QVERIFY(limiter.acquire(1500));
    QVERIFY(inBounds());

    // Refill is capped at one second of budget.
    QTest::qWait(1500);
    QVERIFY(inBounds());
    QCOMPARE(limiter.availableTokens(), 1000.0);

    QVERIFY(limiter.acquire(250));
    QVERIFY(inBounds());
    QVERIFY(limiter.availableTokens() < 800.0);

    limiter.setSpeedLimit(400);
    QVERIFY(limiter.availableTokens() >= 0.0);
    QVERIFY(limiter.availableTokens() <= 400.0);
}

void TestRateLimiter::paysForBytesBeyondTheBucket()
{
    RateLimiter limiter(1000);
    QVERIFY(limiter.acquire(1000));
    QElapsedTimer timer;
    timer.start();
    QVERIFY(limiter.acquire(500));
    QVERIFY2(timer.elapsed() >= 400, qPrintable(QString::number(timer.elapsed())));
}

void TestRateLimiter::requestLargerThanLimitIsSliced()
{
    RateLimiter limiter(1000);
    QElapsedTimer timer;
    timer.start();
    QVERIFY(limiter.acquire(2500));
    // 1000 from the bucket, then 1000 after 1 s and 500 after another 0.5 s.
    QVERIFY2(timer.elapsed() >= 1400, qPrintable(QString::number(timer.elapsed())));
    QCOMPARE(limiter.totalGranted(), qint64(2500));
}

void TestRateLimiter::fiveThousandBytesAtOneThousandTakeFourSeconds()
{
    RateLimiter limiter(1000);
    QElapsedTimer timer;
    timer.start();
    for (int i = 0; i < 5; ++i) {
        QVERIFY(limiter.acquire(1000));
    }
    QVERIFY2(timer.elapsed() >= 3900, qPrintable(QString::number(timer.elapsed())));
    QVERIFY(timer.elapsed() < 6000);
}

void TestRateLimiter::cancelPredicateAbortsWait()
{
    RateLimiter limiter(100);
    QVERIFY(limiter.acquire(100));

    QElapsedTimer timer;
    timer.start();
    const bool granted = limiter.acquire(100, [&timer] { return timer.elapsed() > 150; });
    QVERIFY(!granted);
    QVERIFY(timer.elapsed() < 600);
    QCOMPARE(limiter.totalGranted(), qint64(100));
}

void TestRateLimiter::resetClearsSpeed()
{
    RateLimiter limiter(0);
    QVERIFY(limiter.acquire(4096));
    QVERIFY(limiter.currentSpeed() > 0.0);
    limiter.reset();
    QCOMPARE(limiter.currentSpeed(), 0.0);
}

void TestRateLimiter::speedUsesActualSpan()
{
    RateLimiter limiter(0, 1000);
    QVERIFY(limiter.acquire(1000));
    QTest::qSleep(200);
    QVERIFY(limiter.acquire(1000));
    // 2000 bytes over ~200 ms, not over the full one second window.
    const double speed = limiter.currentSpeed();
    QVERIFY2(speed > 5000.0, qPrintable(QString::number(speed)));

    QTest::qSleep(1100);
    QCOMPARE(limiter.currentSpeed(), 0.0);
}

void TestRateLimiter::setSpeedLimitWakesBlockedWaiters()
{
    RateLimiter limiter(10);
    QVERIFY(limiter.acquire(10));
    QSignalSpy spy(&limiter, &RateLimiter::speedLimitChanged);

    QElapsedTimer timer;
    timer.start();
    QFuture<bool> future = QtConcurrent::run([&limiter] { return limiter.acquire(10); });
    QTest::qWait(50);
    QVERIFY(!future.isFinished());
    limiter.setSpeedLimit(0);
    QTRY_VERIFY_WITH_TIMEOUT(future.isFinished(), 500);
    QVERIFY(future.result());
    QVERIFY(timer.elapsed() < 900);
    QCOMPARE(spy.count(), 1);
    QCOMPARE(limiter.speedLimit(), qint64(0));
}

void TestRateLimiter::concurrentAcquireRespectsLimit()
{
    RateLimiter limiter(4000);
    QElapsedTimer timer;
    timer.start();

    QList<QFuture<void>> workers;
    for (int i = 0; i < 4; ++i) {
        workers.append(QtConcurrent::run([&limiter] {
            for (int n = 0; n < 4; ++n) limiter.acquire(500);
        }));
    }
    for (QFuture<void>& worker : workers) worker.waitForFinished();

    // 8000 bytes: one bucket of 4000, then 4000 more at 4000 B/s.
    QCOMPARE(limiter.totalGranted(), qint64(8000));
    QVERIFY2(timer.elapsed() >= 900, qPrintable(QString::number(timer.elapsed())));
}

void TestRateLimiter::asyncCallbackIsQueued()
{
    RateLimiter limiter(0);
    bool called = false;
    limiter.acquireAsync(100, this, [&called] { called = true; });
    QVERIFY(!called);
    QTRY_VERIFY(called);
}

void TestRateLimiter::asyncWaitsForTokens()
{
    RateLimiter limiter(1000);
    QVERIFY(limiter.acquire(1000));

    QElapsedTimer timer;
    timer.start();
    qint64 elapsed = -1;
    limiter.acquireAsync(500, this, [&] { elapsed = timer.elapsed(); });
    QTRY_VERIFY_WITH_TIMEOUT(elapsed >= 0, 2000);
    QVERIFY2(elapsed >= 400, qPrintable(QString::number(elapsed)));
}

void TestRateLimiter::asyncDroppedWithContext()
{
    RateLimiter limiter(100);
    QVERIFY(limiter.acquire(100));

    auto* context = new QObject;
    std::atomic<bool> called{false};
    limiter.acquireAsync(100, context, [&called] { called = true; });
    delete context;
    QTest::qWait(1200);
    QVERIFY(!called);
}

QTEST_GUILESS_MAIN(TestRateLimiter)
#include "tst_ratelimiter.moc"
