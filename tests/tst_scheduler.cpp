#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QObject>
#include <QRegularExpression>
#include <QScopedPointer>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QTest>
#include <utility>

#include "fakesource.h"

#ifndef Q_MOC_RUN
import rasta.core.scheduler;
#endif

namespace {

QByteArray pattern(qint64 size, int seed = 0)
{
    QByteArray data(size, Qt::Uninitialized);
    for (qint64 i = 0; i < size; ++i) data[i] = static_cast<char>((i + seed) % 251);
    return data;
}

QByteArray readAll(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) return QByteArray();
    return file.readAll();
}

QUrl urlFor(int n)
{
    return QUrl(QStringLiteral("https://example.com/files/item%1.bin").arg(n));
}

FakeResource slowResource(qint64 size, int seed = 0)
{
    FakeResource resource;
    resource.data = pattern(size, seed);
    resource.pieceSize = 1000;
    resource.tickMs = 20;
    return resource;
}

} // namespace

class TestScheduler : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void cleanup();

    void admitsUpToConcurrencyLimit();
    void transientFailuresAreRetried();
    void givesUpAfterRetryBudget();
    void nonRetryableFailsWithoutRetry();
    void finalFailureReleasesPath();
    void samePathIsExclusive();
    void pauseFreesSlot();
    void pauseResumeKeepsRetryBudget();
    void cancelQueuedTask();
    void rejectsInvalidRequests();
    void resolvesFileNameFromUrl();
    void raisingConcurrencyAdmitsMore();
    void globalLimitIsShared();
    void sessionRestoresPausedTask();
    void bulkOperations();
    void taskLogRecordsLifecycle();
    void statisticsAndIdle();

private:
    EngineConfig config() const;
    DownloadRequest request(int n, const QString& destination = QString()) const;

    QScopedPointer<QTemporaryDir> m_dir;
    QScopedPointer<FakeSourceFactory> m_factory;
};

void TestScheduler::initTestCase()
{
    qRegisterMetaType<TransferError>();
    qRegisterMetaType<TransferStatus>();
}

void TestScheduler::init()
{
    m_dir.reset(new QTemporaryDir);
    QVERIFY(m_dir->isValid());
    m_factory.reset(new FakeSourceFactory);
}

void TestScheduler::cleanup()
{
    m_factory.reset();
    m_dir.reset();
}

EngineConfig TestScheduler::config() const
{
    EngineConfig cfg;
    cfg.concurrencyLimit = 3;
    cfg.maxRetries = 3;
    cfg.retryBaseDelayMs = 10;
    cfg.retryMaxDelayMs = 50;
    cfg.chunkSize = 1024;
    cfg.checkpointDir = m_dir->filePath(QStringLiteral("checkpoints"));
    cfg.attemptTimeoutMs = 5000;
    cfg.progressIntervalMs = 0;
    return cfg;
}

DownloadRequest TestScheduler::request(int n, const QString& destination) const
{
    DownloadRequest req;
    req.url = urlFor(n);
    req.destination = destination.isEmpty()
        ? m_dir->filePath(QStringLiteral("out/item%1.bin").arg(n))
        : destination;
    return req;
}

void TestScheduler::admitsUpToConcurrencyLimit()
{
    EngineConfig cfg = config();
    cfg.concurrencyLimit = 2;
    for (int n = 1; n <= 3; ++n) m_factory->setResource(urlFor(n), slowResource(10000, n));

    DownloadScheduler scheduler(cfg, m_factory.data());
    QStringList ids;
    for (int n = 1; n <= 3; ++n) ids << scheduler.submit(request(n));
    for (const QString& id : std::as_const(ids)) QVERIFY(!id.isEmpty());

    QCOMPARE(scheduler.activeCount(), 2);
    QCOMPARE(scheduler.queuedCount(), 1);
    QCOMPARE(m_factory->opens(urlFor(3)), 0);

    QTRY_COMPARE_WITH_TIMEOUT(scheduler.statistics().completed, 3, 10000);
    QCOMPARE(m_factory->maxOpenCount(), 2);
    QCOMPARE(m_factory->opens(urlFor(3)), 1);
    for (int n = 1; n <= 3; ++n) {
        QCOMPARE(readAll(m_dir->filePath(QStringLiteral("out/item%1.bin").arg(n))), pattern(10000, n));
    }
    QVERIFY(!scheduler.snapshot(ids.first()).has_value());
}

void TestScheduler::transientFailuresAreRetried()
{
    FakeResource resource;
    resource.data = pattern(6000);
    FakeFailure failure;
    failure.afterBytes = 2000;
    failure.kind = ErrorKind::TransientNetwork;
    resource.failures << failure << failure;
    m_factory->setResource(urlFor(1), resource);

    DownloadScheduler scheduler(config(), m_factory.data());
    QList<TransferEvent> events;
    connect(scheduler.bus(), &ProgressBus::eventPublished, this,
            [&events](const TransferEvent& e) { events.append(e); });

    const QString id = scheduler.submit(request(1));
    QTRY_COMPARE_WITH_TIMEOUT(scheduler.statistics().completed, 1, 5000);

    QCOMPARE(m_factory->offsets(urlFor(1)), (QList<qint64>{0, 2000, 4000}));
    QCOMPARE(readAll(m_dir->filePath(QStringLiteral("out/item1.bin"))), resource.data);
    QCOMPARE(scheduler.statistics().failed, 0);
    for (const TransferEvent& e : std::as_const(events)) {
        QVERIFY(!e.error.isError());
    }
    QVERIFY(events.last().status == TransferStatus::Completed);
    QCOMPARE(events.last().attempt, 3);
    QCOMPARE(events.last().taskId, id);
}

void TestScheduler::givesUpAfterRetryBudget()
{
    FakeResource resource;
    resource.data = pattern(1000);
    FakeFailure failure;
    failure.kind = ErrorKind::Timeout;
    for (int i = 0; i < 6; ++i) resource.failures << failure;
    m_factory->setResource(urlFor(1), resource);

    EngineConfig cfg = config();
    cfg.maxRetries = 2;
    DownloadScheduler scheduler(cfg, m_factory.data());
    QList<TransferEvent> failures;
    connect(scheduler.bus(), &ProgressBus::eventPublished, this, [&failures](const TransferEvent& e) {
        if (e.error.isError()) failures.append(e);
    });
    QSignalSpy idle(&scheduler, &DownloadScheduler::idle);

    const QString id = scheduler.submit(request(1));
    QTRY_COMPARE_WITH_TIMEOUT(scheduler.statistics().failed, 1, 5000);

    QCOMPARE(m_factory->opens(urlFor(1)), 3);
    QCOMPARE(failures.size(), 1);
    QVERIFY(failures.first().status == TransferStatus::Failed);
    QVERIFY(failures.first().error.kind == ErrorKind::Timeout);
    QTRY_COMPARE(idle.count(), 1);

    const auto snap = scheduler.snapshot(id);
    QVERIFY(snap.has_value());
    QVERIFY(snap->finalFailure);
    QVERIFY(snap->status == TransferStatus::Failed);
    QVERIFY(snap->lastError.kind == ErrorKind::Timeout);

    QVERIFY(scheduler.acknowledge(id));
    QVERIFY(!scheduler.snapshot(id).has_value());
    QVERIFY(!scheduler.acknowledge(id));
}

void TestScheduler::nonRetryableFailsWithoutRetry()
{
    FakeResource resource;
    resource.data = pattern(1000);
    FakeFailure failure;
    failure.kind = ErrorKind::Auth;
    failure.httpStatus = 401;
    resource.failures << failure;
    m_factory->setResource(urlFor(1), resource);

    DownloadScheduler scheduler(config(), m_factory.data());
    const QString id = scheduler.submit(request(1));
    QTRY_COMPARE(scheduler.statistics().failed, 1);
    QCOMPARE(m_factory->opens(urlFor(1)), 1);
    QCOMPARE(scheduler.snapshot(id)->attempt, 1);
}

void TestScheduler::finalFailureReleasesPath()
{
    FakeResource broken;
    broken.data = pattern(1000);
    FakeFailure failure;
    failure.kind = ErrorKind::Auth;
    broken.failures << failure;
    m_factory->setResource(urlFor(1), broken);
    m_factory->setResource(urlFor(2), slowResource(3000, 2));
    const QString target = m_dir->filePath(QStringLiteral("out/shared.bin"));

    DownloadScheduler scheduler(config(), m_factory.data());
    const QString failed = scheduler.submit(request(1, target));
    const QString second = scheduler.submit(request(2, target));
    QVERIFY(scheduler.snapshot(second)->status == TransferStatus::Queued);

    QTRY_COMPARE(scheduler.statistics().failed, 1);
    QVERIFY(scheduler.snapshot(failed)->finalFailure);
    QTRY_COMPARE_WITH_TIMEOUT(scheduler.statistics().completed, 1, 5000);
    QCOMPARE(readAll(target), pattern(3000, 2));
    QVERIFY(scheduler.snapshot(failed).has_value());
    QVERIFY(scheduler.acknowledge(failed));
}

void TestScheduler::samePathIsExclusive()
{
    m_factory->setResource(urlFor(1), slowResource(8000, 1));
    m_factory->setResource(urlFor(2), slowResource(5000, 2));
    const QString target = m_dir->filePath(QStringLiteral("out/shared.bin"));

    DownloadScheduler scheduler(config(), m_factory.data());
    const QString first = scheduler.submit(request(1, target));
    const QString second = scheduler.submit(request(2, target));
    QVERIFY(!first.isEmpty());
    QVERIFY(!second.isEmpty());

    QCOMPARE(scheduler.activeCount(), 1);
    QVERIFY(scheduler.snapshot(second)->status == TransferStatus::Queued);

    QTRY_COMPARE_WITH_TIMEOUT(scheduler.statistics().completed, 2, 10000);
    QCOMPARE(m_factory->maxOpenCount(), 1);
    QCOMPARE(readAll(target), pattern(5000, 2));
}

void TestScheduler::pauseFreesSlot()
{
    EngineConfig cfg = config();
    cfg.concurrencyLimit = 1;
    m_factory->setResource(urlFor(1), slowResource(20000, 1));
    m_factory->setResource(urlFor(2), slowResource(4000, 2));

    DownloadScheduler scheduler(cfg, m_factory.data());
    const QString first = scheduler.submit(request(1));
    const QString second = scheduler.submit(request(2));
    QTRY_VERIFY(scheduler.snapshot(first)->bytesTransferred > 0);
    QCOMPARE(m_factory->opens(urlFor(2)), 0);

    QVERIFY(scheduler.pause(first));
    const auto paused = scheduler.snapshot(first);
    QVERIFY(paused->status == TransferStatus::Paused);
    QVERIFY(paused->averageSpeed > 0.0);
    QVERIFY(paused->eta >= 0);
    QCOMPARE(m_factory->opens(urlFor(2)), 1);
    QVERIFY(!scheduler.resume(second));

    QVERIFY(scheduler.resume(first));
    QVERIFY(scheduler.snapshot(first)->status == TransferStatus::Queued);

    QTRY_COMPARE_WITH_TIMEOUT(scheduler.statistics().completed, 2, 10000);
    QCOMPARE(m_factory->maxOpenCount(), 1);
    const QList<qint64> offsets = m_factory->offsets(urlFor(1));
    QCOMPARE(offsets.size(), 2);
    QVERIFY(offsets.last() > 0);
    QCOMPARE(readAll(m_dir->filePath(QStringLiteral("out/item1.bin"))), pattern(20000, 1));
}

void TestScheduler::pauseResumeKeepsRetryBudget()
{
    EngineConfig cfg = config();
    cfg.maxRetries = 1;
    FakeResource resource = slowResource(20000, 1);
    m_factory->setResource(urlFor(1), resource);

    DownloadScheduler scheduler(cfg, m_factory.data());
    QList<TransferEvent> errors;
    connect(scheduler.bus(), &ProgressBus::eventPublished, this, [&errors](const TransferEvent& e) {
        if (e.error.isError()) errors.append(e);
    });

    const QString id = scheduler.submit(request(1));
    for (int cycle = 1; cycle <= 3; ++cycle) {
        const qint64 before = scheduler.snapshot(id)->bytesTransferred;
        QTRY_VERIFY(scheduler.snapshot(id)->bytesTransferred > before);
        QVERIFY(scheduler.pause(id));
        QCOMPARE(scheduler.snapshot(id)->attempt, 1);
        if (cycle == 3) {
            // The next connection drops after a few pieces.
            FakeFailure failure;
            failure.afterBytes = 2000;
            failure.kind = ErrorKind::TransientNetwork;
            FakeResource flaky = resource;
            flaky.failures << failure;
            m_factory->setResource(urlFor(1), flaky);
        }
        QVERIFY(scheduler.resume(id));
    }

    QTRY_COMPARE_WITH_TIMEOUT(scheduler.statistics().completed, 1, 10000);
    QCOMPARE(scheduler.statistics().failed, 0);
    QVERIFY(errors.isEmpty());
    QCOMPARE(m_factory->opens(urlFor(1)), 5);
    QCOMPARE(readAll(m_dir->filePath(QStringLiteral("out/item1.bin"))), pattern(20000, 1));
}

void TestScheduler::cancelQueuedTask()
{
    EngineConfig cfg = config();
    cfg.concurrencyLimit = 1;
    m_factory->setResource(urlFor(1), slowResource(5000, 1));
    m_factory->setResource(urlFor(2), slowResource(5000, 2));

    DownloadScheduler scheduler(cfg, m_factory.data());
    scheduler.submit(request(1));
    const QString second = scheduler.submit(request(2));
    QVERIFY(scheduler.cancel(second));
    QTRY_COMPARE(scheduler.statistics().cancelled, 1);
    QVERIFY(!scheduler.snapshot(second).has_value());

    QTRY_COMPARE_WITH_TIMEOUT(scheduler.statistics().completed, 1, 5000);
    QCOMPARE(m_factory->opens(urlFor(2)), 0);
    QVERIFY(!scheduler.cancel(QStringLiteral("no-such-task")));
}

void TestScheduler::rejectsInvalidRequests()
{
    DownloadScheduler scheduler(config(), m_factory.data());

    DownloadRequest bad;
    bad.url = QUrl(QStringLiteral("not a url"));
    bad.destination = m_dir->path();
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("Invalid URL")));
    QVERIFY(scheduler.submit(bad).isEmpty());

    DownloadRequest nameless;
    nameless.url = QUrl(QStringLiteral("https://example.com/"));
    nameless.destination = m_dir->path();
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("Cannot resolve a file name")));
    QVERIFY(scheduler.submit(nameless).isEmpty());

    m_factory->setResource(urlFor(1), slowResource(3000));
    DownloadRequest named = request(1);
    named.id = QStringLiteral("fixed");
    QCOMPARE(scheduler.submit(named), QStringLiteral("fixed"));
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("Duplicate task id")));
    QVERIFY(scheduler.submit(named).isEmpty());
    QCOMPARE(scheduler.statistics().submitted, 1);
}

void TestScheduler::resolvesFileNameFromUrl()
{
    FakeResource resource;
    resource.data = pattern(2000);
    m_factory->setResource(urlFor(7), resource);
    const QString dir = m_dir->filePath(QStringLiteral("downloads"));
    QVERIFY(QDir().mkpath(dir));

    DownloadScheduler scheduler(config(), m_factory.data());
    const QString id = scheduler.submit(request(7, dir));
    QCOMPARE(scheduler.snapshot(id)->destination,
             QDir::cleanPath(QDir(dir).filePath(QStringLiteral("item7.bin"))));
    QTRY_COMPARE(scheduler.statistics().completed, 1);
    QCOMPARE(readAll(QDir(dir).filePath(QStringLiteral("item7.bin"))), resource.data);
}

void TestScheduler::raisingConcurrencyAdmitsMore()
{
    EngineConfig cfg = config();
    cfg.concurrencyLimit = 1;
    for (int n = 1; n <= 3; ++n) m_factory->setResource(urlFor(n), slowResource(10000, n));

    DownloadScheduler scheduler(cfg, m_factory.data());
    QSignalSpy changed(&scheduler, &DownloadScheduler::concurrencyLimitChanged);
    for (int n = 1; n <= 3; ++n) scheduler.submit(request(n));
    QCOMPARE(scheduler.activeCount(), 1);

    scheduler.setConcurrencyLimit(3);
    QCOMPARE(changed.count(), 1);
    QCOMPARE(scheduler.activeCount(), 3);

    scheduler.setConcurrencyLimit(0);
    QCOMPARE(scheduler.concurrencyLimit(), 1);
    QTRY_COMPARE_WITH_TIMEOUT(scheduler.statistics().completed, 3, 10000);
}

void TestScheduler::globalLimitIsShared()
{
    EngineConfig cfg = config();
    cfg.globalSpeedLimit = 2000;
    FakeResource a;
    a.data = pattern(3000, 1);
    FakeResource b;
    b.data = pattern(3000, 2);
    m_factory->setResource(urlFor(1), a);
    m_factory->setResource(urlFor(2), b);

    DownloadScheduler scheduler(cfg, m_factory.data());
    QElapsedTimer timer;
    timer.start();
    scheduler.submit(request(1));
    scheduler.submit(request(2));
    QTRY_COMPARE_WITH_TIMEOUT(scheduler.statistics().completed, 2, 10000);

    // 6000 bytes: one 2000 byte bucket, then 4000 bytes at 2000 B/s.
    QVERIFY2(timer.elapsed() >= 1900, qPrintable(QString::number(timer.elapsed())));
    QCOMPARE(scheduler.limiter()->totalGranted(), qint64(6000));
    QCOMPARE(scheduler.statistics().bytes, qint64(6000));
}

void TestScheduler::sessionRestoresPausedTask()
{
    EngineConfig cfg = config();
    cfg.sessionFile = m_dir->filePath(QStringLiteral("session.json"));
    m_factory->setResource(urlFor(1), slowResource(20000, 1));

    QString id;
    qint64 paused = 0;
    {
        DownloadScheduler scheduler(cfg, m_factory.data());
        id = scheduler.submit(request(1));
        QTRY_VERIFY(scheduler.snapshot(id)->bytesTransferred >= 3000);
        QVERIFY(scheduler.pause(id));
        paused = scheduler.snapshot(id)->bytesTransferred;
        scheduler.saveSession();
    }
    QVERIFY(QFileInfo::exists(cfg.sessionFile));
    const int opensBefore = m_factory->opens(urlFor(1));

    DownloadScheduler restored(cfg, m_factory.data());
    restored.restoreSession();
    const auto snap = restored.snapshot(id);
    QVERIFY(snap.has_value());
    QVERIFY(snap->status == TransferStatus::Paused);
    QCOMPARE(m_factory->opens(urlFor(1)), opensBefore);

    QVERIFY(restored.resume(id));
    QTRY_COMPARE_WITH_TIMEOUT(restored.statistics().completed, 1, 5000);
    QCOMPARE(m_factory->offsets(urlFor(1)).last(), paused);
    QCOMPARE(readAll(m_dir->filePath(QStringLiteral("out/item1.bin"))), pattern(20000, 1));
}

void TestScheduler::bulkOperations()
{
    EngineConfig cfg = config();
    cfg.concurrencyLimit = 2;
    for (int n = 1; n <= 3; ++n) m_factory->setResource(urlFor(n), slowResource(20000, n));

    DownloadScheduler scheduler(cfg, m_factory.data());
    QStringList ids;
    for (int n = 1; n <= 3; ++n) ids << scheduler.submit(request(n));
    QCOMPARE(scheduler.activeCount(), 2);

    scheduler.pauseAll();
    QCOMPARE(scheduler.activeCount(), 0);
    QCOMPARE(scheduler.statistics().paused, 3);
    QCOMPARE(m_factory->opens(urlFor(3)), 0);
    QVERIFY(scheduler.isIdle());

    scheduler.resumeAll();
    QCOMPARE(scheduler.activeCount(), 2);
    QCOMPARE(scheduler.queuedCount(), 1);

    scheduler.cancelAll(true);
    QTRY_COMPARE(scheduler.statistics().cancelled, 3);
    QVERIFY(scheduler.snapshots().isEmpty());
    QVERIFY(scheduler.taskLog(ids.first()).isEmpty());
}

void TestScheduler::taskLogRecordsLifecycle()
{
    m_factory->setResource(urlFor(1), slowResource(20000, 1));

    DownloadScheduler scheduler(config(), m_factory.data());
    const QString id = scheduler.submit(request(1));
    QTRY_VERIFY(scheduler.snapshot(id)->bytesTransferred > 0);
    QVERIFY(scheduler.pause(id));

    const QStringList log = scheduler.taskLog(id);
    QVERIFY(!log.isEmpty());
    QVERIFY(log.first().contains(QStringLiteral("Queued")));
    QVERIFY(log.last().contains(QStringLiteral("Paused")));
    QVERIFY(scheduler.taskLog(QStringLiteral("no-such-task")).isEmpty());
}

void TestScheduler::statisticsAndIdle()
{
    m_factory->setResource(urlFor(1), slowResource(3000, 1));
    m_factory->setResource(urlFor(2), slowResource(3000, 2));

    DownloadScheduler scheduler(config(), m_factory.data());
    QSignalSpy idle(&scheduler, &DownloadScheduler::idle);
    QVERIFY(scheduler.isIdle());

    scheduler.submit(request(1));
    const QString second = scheduler.submit(request(2));
    QVERIFY(!scheduler.isIdle());
    QCOMPARE(scheduler.statistics().submitted, 2);
    QCOMPARE(scheduler.statistics().active, 2);
    QCOMPARE(scheduler.snapshots().size(), 2);

    scheduler.cancel(second, true);
    QTRY_COMPARE_WITH_TIMEOUT(idle.count(), 1, 5000);
    const SchedulerStats stats = scheduler.statistics();
    QCOMPARE(stats.completed, 1);
    QCOMPARE(stats.cancelled, 1);
    QCOMPARE(stats.active, 0);
    QCOMPARE(stats.queued, 0);
    QCOMPARE(stats.bytes, qint64(3000));
    QVERIFY(scheduler.isIdle());
    QVERIFY(!QFileInfo::exists(m_dir->filePath(QStringLiteral("out/item2.bin.part"))));
}

QTEST_GUILESS_MAIN(TestScheduler)
#include "tst_scheduler.moc"
