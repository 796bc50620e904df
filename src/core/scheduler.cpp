module;
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutexLocker>
#include <QPointer>
#include <QSaveFile>
#include <QTimer>
#include <QUuid>
#include <limits>
#include <optional>
#include <utility>

module rasta.core.scheduler;

import rasta.utils.download_utils;

namespace utils = rasta::utils;

namespace {

TransferOptions unitOptionsFor(const EngineConfig& config)
{
    TransferOptions options;
    options.chunkSize = config.chunkSize;
    options.attemptTimeoutMs = config.attemptTimeoutMs;
    options.userAgent = config.userAgent;
    options.defaultProxy = config.defaultProxy;
    return options;
}

EngineConfig clamped(EngineConfig config)
{
    config.clamp();
    return config;
}

bool isActive(TransferStatus status)
{
    return status == TransferStatus::Connecting || status == TransferStatus::Downloading;
}

} // namespace

DownloadScheduler::DownloadScheduler(const EngineConfig& config,
                                     TransferSourceFactory* factory,
                                     QObject* parent)
    : QObject(parent),
    m_config(clamped(config)),
    m_factory(factory),
    m_globalLimiter(m_config.globalSpeedLimit),
    m_bus(m_config.progressIntervalMs),
    m_checkpoints(m_config.checkpointDir),
    m_retry(m_config.maxRetries, m_config.retryBaseDelayMs, m_config.retryMaxDelayMs),
    m_unitOptions(unitOptionsFor(m_config)),
    m_concurrencyLimit(m_config.concurrencyLimit)
{
    m_saveTimer.setSingleShot(true);
    m_saveTimer.setInterval(400);
    connect(&m_saveTimer, &QTimer::timeout, this, &DownloadScheduler::saveSession);
    if (auto* app = QCoreApplication::instance()) {
        connect(app, &QCoreApplication::aboutToQuit, this, &DownloadScheduler::saveSession);
    }
}

DownloadScheduler::~DownloadScheduler()
{
    if (m_saveTimer.isActive()) {
        m_saveTimer.stop();
        saveSession();
    }
    QList<TransferUnit*> units;
    {
        QMutexLocker locker(&m_mutex);
        for (auto it = m_records.begin(); it != m_records.end(); ++it) {
            if (it->retryTimer) it->retryTimer->stop();
            units.append(it->unit);
        }
        m_records.clear();
        m_order.clear();
        m_pathOwner.clear();
    }
    for (TransferUnit* unit : units) {
        unit->disconnect(this);
        delete unit;
    }
}

QString DownloadScheduler::submit(const DownloadRequest& request)
{
    if (!request.url.isValid() || request.url.scheme().isEmpty()) {
        qWarning() << "Invalid URL:" << request.url.toString();
        return QString();
    }

    QString destination = request.destination;
    if (destination.trimmed().isEmpty()) destination = QDir::currentPath() + QLatin1Char('/');
    const QString path = utils::resolveDestination(destination, request.suggestedName, request.url);
    if (path.isEmpty()) {
        qWarning() << "Cannot resolve a file name for" << request.url.toString() << "in" << destination;
        return QString();
    }

    DownloadRequest accepted = request;
    accepted.destination = path;
    if (accepted.id.isEmpty()) accepted.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    if (accepted.speedLimit <= 0) accepted.speedLimit = m_config.perTaskSpeedLimit;

    {
        QMutexLocker locker(&m_mutex);
        if (m_records.contains(accepted.id)) {
            qWarning() << "Duplicate task id" << accepted.id;
            return QString();
        }
    }

    auto* unit = new TransferUnit(accepted, path, m_factory, &m_globalLimiter, &m_bus,
                                  &m_checkpoints, m_unitOptions, this);
    connect(unit, &TransferUnit::statusChanged, this, [this, unit](TransferStatus) {
        refresh(unit);
        scheduleSave();
        emit countsChanged();
    });
    connect(unit, &TransferUnit::progress, this, [this, unit](qint64, qint64) {
        refresh(unit);
    });
    connect(unit, &TransferUnit::attemptFailed, this, [this, unit](const TransferError& error) {
        onAttemptFailed(unit, error);
    });
    connect(unit, &TransferUnit::completed, this, [this, unit] {
        onUnitSettled(unit, true);
    });
    connect(unit, &TransferUnit::cancelled, this, [this, unit] {
        onUnitSettled(unit, false);
    });

    {
        QMutexLocker locker(&m_mutex);
        TaskRecord record;
        record.unit = unit;
        record.pathKey = utils::pathKey(path);
        m_records.insert(accepted.id, record);
        m_order.append(accepted.id);
        ++m_submitted;
    }
    refresh(unit);
    qInfo() << "Queued" << accepted.id << accepted.url.toString() << "->" << path;
    unit->appendLog(QStringLiteral("Queued: %1").arg(path));
    m_bus.publish(unit->makeEvent());

    scheduleSave();
    startQueued();
    emit countsChanged();
    return accepted.id;
}

void DownloadScheduler::startQueued()
{
    if (m_admitting) {
        m_admitAgain = true;
        return;
    }
    m_admitting = true;
    do {
        m_admitAgain = false;
        QList<TransferUnit*> admitted;
        {
            QMutexLocker locker(&m_mutex);
            int running = 0;
            for (const QString& id : std::as_const(m_order)) {
                if (isActive(m_records.value(id).snapshot.status)) ++running;
            }
            for (const QString& id : std::as_const(m_order)) {
                if (running >= m_concurrencyLimit) break;
                auto it = m_records.find(id);
                if (it == m_records.end() || it->snapshot.status != TransferStatus::Queued) continue;
                const QString owner = m_pathOwner.value(it->pathKey);
                if (!owner.isEmpty() && owner != id) continue;
                m_pathOwner.insert(it->pathKey, id);
                // Mark as active now so later candidates see the slot as taken.
                it->snapshot.status = TransferStatus::Connecting;
                admitted.append(it->unit);
                ++running;
            }
        }
        for (TransferUnit* unit : admitted) {
            unit->start();
            refresh(unit);
        }
    } while (m_admitAgain);
    m_admitting = false;
    emit countsChanged();
    checkIdle();
}

void DownloadScheduler::refresh(TransferUnit* unit)
{
    if (!unit) return;
    QMutexLocker locker(&m_mutex);
    auto it = m_records.find(unit->id());
    if (it == m_records.end() || it->unit != unit) return;
    TaskSnapshot& s = it->snapshot;
    s.id = unit->id();
    s.url = unit->request().url.toString();
    s.destination = unit->destinationPath();
    s.status = unit->status();
    s.bytesTransferred = unit->bytesTransferred();
    s.totalBytes = unit->totalBytes();
    s.speed = s.status == TransferStatus::Downloading ? unit->currentSpeed() : 0.0;
    s.averageSpeed = unit->averageSpeed();
    s.eta = unit->eta();
    s.attempt = unit->attempt();
    s.lastError = unit->lastError();
    s.retryPending = !it->retryTimer.isNull();
    s.finalFailure = it->finalFailure;
}

void DownloadScheduler::onAttemptFailed(TransferUnit* unit, const TransferError& error)
{
    const RetryDecision decision = m_retry.decide(error, unit->failures());
    const QString id = unit->id();

    if (decision.retry) {
        qWarning() << "Retrying" << id << "in" << decision.delayMs << "ms after"
                   << errorKindName(error.kind) << error.message;
        unit->appendLog(QStringLiteral("Retrying in %1 ms").arg(decision.delayMs));
        auto* timer = new QTimer(this);
        timer->setSingleShot(true);
        QPointer<TransferUnit> unitPtr(unit);
        connect(timer, &QTimer::timeout, this, [this, unitPtr, id, timer] {
            {
                QMutexLocker locker(&m_mutex);
                auto it = m_records.find(id);
                if (it != m_records.end() && it->retryTimer == timer) it->retryTimer = nullptr;
            }
            timer->deleteLater();
            if (!unitPtr || unitPtr->status() != TransferStatus::Failed) return;
            unitPtr->requeue();
            refresh(unitPtr);
            startQueued();
        });
        {
            QMutexLocker locker(&m_mutex);
            auto it = m_records.find(id);
            if (it != m_records.end()) it->retryTimer = timer;
        }
        timer->start(static_cast<int>(qMin<qint64>(decision.delayMs, std::numeric_limits<int>::max())));
        refresh(unit);
    } else {
        {
            QMutexLocker locker(&m_mutex);
            auto it = m_records.find(id);
            if (it != m_records.end()) {
                it->finalFailure = true;
                if (m_pathOwner.value(it->pathKey) == id) m_pathOwner.remove(it->pathKey);
            }
            ++m_failed;
        }
        unit->giveUp();
        refresh(unit);
        scheduleSave();
    }
    startQueued();
}

void DownloadScheduler::onUnitSettled(TransferUnit* unit, bool success)
{
    const QString id = unit->id();
    {
        QMutexLocker locker(&m_mutex);
        if (success) {
            ++m_completed;
            m_completedBytes += unit->bytesTransferred();
        } else if (!m_records.value(id).finalFailure) {
            ++m_cancelled;
        }
    }
    if (TransferUnit* taken = takeRecord(id)) {
        taken->disconnect(this);
        taken->deleteLater();
    }
    scheduleSave();
    startQueued();
}

TransferUnit* DownloadScheduler::takeRecord(const QString& id)
{
    QMutexLocker locker(&m_mutex);
    auto it = m_records.find(id);
    if (it == m_records.end()) return nullptr;
    TaskRecord record = it.value();
    m_records.erase(it);
    m_order.removeAll(id);
    if (m_pathOwner.value(record.pathKey) == id) m_pathOwner.remove(record.pathKey);
    if (record.retryTimer) {
        record.retryTimer->stop();
        record.retryTimer->deleteLater();
    }
    return record.unit;
}

bool DownloadScheduler::stopRetry(const QString& id)
{
    QPointer<QTimer> timer;
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_records.find(id);
        if (it == m_records.end() || !it->retryTimer) return false;
        timer = it->retryTimer;
        it->retryTimer = nullptr;
    }
    timer->stop();
    timer->deleteLater();
    return true;
}

TransferUnit* DownloadScheduler::unitFor(const QString& id) const
{
    QMutexLocker locker(&m_mutex);
    return m_records.value(id).unit;
}

bool DownloadScheduler::cancel(const QString& id, bool deletePartial)
{
    TransferUnit* unit = unitFor(id);
    if (!unit) return false;
    stopRetry(id);
    {
        QMutexLocker locker(&m_mutex);
        if (m_records.value(id).finalFailure) {
            locker.unlock();
            return acknowledge(id);
        }
    }
    unit->cancel(deletePartial);
    return true;
}

bool DownloadScheduler::pause(const QString& id)
{
    TransferUnit* unit = unitFor(id);
    if (!unit) return false;
    {
        QMutexLocker locker(&m_mutex);
        if (m_records.value(id).finalFailure) return false;
    }
    const TransferStatus before = unit->status();
    if (before == TransferStatus::Paused) return true;
    if (before == TransferStatus::Failed && !stopRetry(id)) return false;
    unit->pause();
    refresh(unit);
    if (unit->status() != TransferStatus::Paused) return false;
    startQueued();
    return true;
}

bool DownloadScheduler::resume(const QString& id)
{
    TransferUnit* unit = unitFor(id);
    if (!unit || unit->status() != TransferStatus::Paused) return false;
    unit->requeue();
    refresh(unit);
    startQueued();
    return true;
}

bool DownloadScheduler::acknowledge(const QString& id)
{
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_records.find(id);
        if (it == m_records.end() || !it->finalFailure) return false;
    }
    if (TransferUnit* unit = takeRecord(id)) {
        unit->disconnect(this);
        unit->deleteLater();
    }
    m_bus.forget(id);
    emit countsChanged();
    return true;
}

void DownloadScheduler::pauseAll()
{
    QStringList ids;
    {
        QMutexLocker locker(&m_mutex);
        ids = m_order;
    }
    // Newest first, so pausing an active task does not admit one about to be paused.
    for (auto it = ids.crbegin(); it != ids.crend(); ++it) pause(*it);
}

void DownloadScheduler::resumeAll()
{
    QStringList ids;
    {
        QMutexLocker locker(&m_mutex);
        ids = m_order;
    }
    for (const QString& id : std::as_const(ids)) resume(id);
}

void DownloadScheduler::cancelAll(bool deletePartial)
{
    QStringList ids;
    {
        QMutexLocker locker(&m_mutex);
        ids = m_order;
    }
    for (const QString& id : std::as_const(ids)) cancel(id, deletePartial);
}

int DownloadScheduler::concurrencyLimit() const
{
    QMutexLocker locker(&m_mutex);
    return m_concurrencyLimit;
}

void DownloadScheduler::setConcurrencyLimit(int limit)
{
    if (limit < 1) limit = 1;
    {
        QMutexLocker locker(&m_mutex);
        if (m_concurrencyLimit == limit) return;
        m_concurrencyLimit = limit;
    }
    m_config.concurrencyLimit = limit;
    emit concurrencyLimitChanged();
    startQueued();
}

qint64 DownloadScheduler::globalSpeedLimit() const
{
    return m_globalLimiter.speedLimit();
}

void DownloadScheduler::setGlobalSpeedLimit(qint64 bytesPerSecond)
{
    bytesPerSecond = qMax<qint64>(0, bytesPerSecond);
    m_config.globalSpeedLimit = bytesPerSecond;
    m_globalLimiter.setSpeedLimit(bytesPerSecond);
    qInfo() << "Global speed limit set to" << bytesPerSecond << "B/s";
    emit globalSpeedLimitChanged();
}

int DownloadScheduler::activeCount() const
{
    QMutexLocker locker(&m_mutex);
    int count = 0;
    for (const TaskRecord& r : m_records) {
        if (isActive(r.snapshot.status)) ++count;
    }
    return count;
}

int DownloadScheduler::queuedCount() const
{
    QMutexLocker locker(&m_mutex);
    int count = 0;
    for (const TaskRecord& r : m_records) {
        if (r.snapshot.status == TransferStatus::Queued) ++count;
    }
    return count;
}

bool DownloadScheduler::isIdle() const
{
    QMutexLocker locker(&m_mutex);
    for (const TaskRecord& r : m_records) {
        const TransferStatus s = r.snapshot.status;
        if (isActive(s) || s == TransferStatus::Queued || r.retryTimer) return false;
    }
    return true;
}

void DownloadScheduler::checkIdle()
{
    const bool idleNow = isIdle();
    if (idleNow && !m_wasIdle) {
        m_wasIdle = true;
        emit idle();
        return;
    }
    m_wasIdle = idleNow;
}

SchedulerStats DownloadScheduler::statistics() const
{
    SchedulerStats stats;
    {
        QMutexLocker locker(&m_mutex);
        stats.submitted = m_submitted;
        stats.completed = m_completed;
        stats.failed = m_failed;
        stats.cancelled = m_cancelled;
        stats.bytes = m_completedBytes;
        for (const TaskRecord& r : m_records) {
            const TransferStatus s = r.snapshot.status;
            if (isActive(s)) ++stats.active;
            else if (s == TransferStatus::Queued) ++stats.queued;
            else if (s == TransferStatus::Paused) ++stats.paused;
            if (r.retryTimer) ++stats.retryPending;
            stats.bytes += r.snapshot.bytesTransferred;
        }
    }
    stats.speed = m_globalLimiter.currentSpeed();
    return stats;
}

std::optional<TaskSnapshot> DownloadScheduler::snapshot(const QString& id) const
{
    QMutexLocker locker(&m_mutex);
    auto it = m_records.constFind(id);
    if (it == m_records.constEnd()) return std::nullopt;
    return it->snapshot;
}

QVector<TaskSnapshot> DownloadScheduler::snapshots() const
{
    QMutexLocker locker(&m_mutex);
    QVector<TaskSnapshot> out;
    out.reserve(m_order.size());
    for (const QString& id : m_order) {
        auto it = m_records.constFind(id);
        if (it != m_records.constEnd()) out.append(it->snapshot);
    }
    return out;
}

QStringList DownloadScheduler::taskLog(const QString& id) const
{
    TransferUnit* unit = unitFor(id);
    return unit ? unit->logLines() : QStringList();
}

void DownloadScheduler::scheduleSave()
{
    if (m_restoreInProgress || m_config.sessionFile.isEmpty()) return;
    if (!m_saveTimer.isActive()) {
        m_saveTimer.start();
    }
}

void DownloadScheduler::saveSession()
{
    if (m_restoreInProgress || m_config.sessionFile.isEmpty()) return;

    QJsonArray items;
    {
        QMutexLocker locker(&m_mutex);
        for (const QString& id : std::as_const(m_order)) {
            const TaskRecord record = m_records.value(id);
            if (!record.unit || record.finalFailure) continue;
            const TransferStatus s = record.snapshot.status;
            if (isTerminal(s)) continue;
            QJsonObject obj = record.unit->request().toJson();
            obj.insert("state", statusString(s == TransferStatus::Paused ? TransferStatus::Paused
                                                                          : TransferStatus::Queued));
            items.append(obj);
        }
    }

    QJsonObject root;
    root.insert("version", 1);
    root.insert("items", items);

    const QString path = utils::normalizeFilePath(m_config.sessionFile);
    QDir().mkpath(QFileInfo(path).absolutePath());
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "Cannot write session file" << path << file.errorString();
        return;
    }
    const QByteArray data = QJsonDocument(root).toJson(QJsonDocument::Indented);
    if (file.write(data) != data.size()) {
        qWarning() << "Cannot write session file" << path << file.errorString();
        file.cancelWriting();
        return;
    }
    if (!file.commit()) {
        qWarning() << "Cannot commit session file" << path << file.errorString();
    }
}

void DownloadScheduler::restoreSession()
{
    if (m_config.sessionFile.isEmpty()) return;
    QFile file(utils::normalizeFilePath(m_config.sessionFile));
    if (!file.exists()) return;
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "Cannot read session file" << file.fileName() << file.errorString();
        return;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "Corrupt session file" << file.fileName() << parseError.errorString();
        return;
    }

    // Hold admission so paused items never start.
    m_restoreInProgress = true;
    const bool wasAdmitting = m_admitting;
    m_admitting = true;
    int restored = 0;
    const QJsonArray items = doc.object().value("items").toArray();
    for (const auto& v : items) {
        if (!v.isObject()) continue;
        const QJsonObject obj = v.toObject();
        const DownloadRequest request = DownloadRequest::fromJson(obj);
        const QString id = submit(request);
        if (id.isEmpty()) continue;
        if (statusFromString(obj.value("state").toString()) == TransferStatus::Paused) {
            if (TransferUnit* unit = unitFor(id)) {
                unit->pause();
                refresh(unit);
            }
        }
        ++restored;
    }
    m_admitting = wasAdmitting;
    m_restoreInProgress = false;
    qInfo() << "Restored" << restored << "task(s) from" << file.fileName();
    startQueued();
    scheduleSave();
}
