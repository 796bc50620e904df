module;
#include <QDebug>
#include <QDir>
#include <QSettings>
#include <QStandardPaths>
#include <QStringList>
#include <memory>

module rasta.core.engineconfig;

static QString settingsGroup()
{
    return QStringLiteral("engine");
}

static std::unique_ptr<QSettings> openSettings(const QString& path)
{
    if (path.isEmpty()) return std::make_unique<QSettings>();
    return std::make_unique<QSettings>(path, QSettings::IniFormat);
}

QString EngineConfig::defaultCheckpointDir()
{
    QString base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (base.isEmpty()) base = QDir::temp().filePath(QStringLiteral("rasta"));
    return QDir(base).filePath(QStringLiteral("checkpoints"));
}

void EngineConfig::clamp()
{
    concurrencyLimit = qMax(1, concurrencyLimit);
    globalSpeedLimit = qMax<qint64>(0, globalSpeedLimit);
    perTaskSpeedLimit = qMax<qint64>(0, perTaskSpeedLimit);
    maxRetries = qMax(0, maxRetries);
    retryBaseDelayMs = qMax<qint64>(0, retryBaseDelayMs);
    retryMaxDelayMs = qMax(retryBaseDelayMs, retryMaxDelayMs);
    chunkSize = qBound(kMinChunkSize, chunkSize, kMaxChunkSize);
    attemptTimeoutMs = qMax(0, attemptTimeoutMs);
    progressIntervalMs = qMax(0, progressIntervalMs);
    if (checkpointDir.trimmed().isEmpty()) checkpointDir = defaultCheckpointDir();
    if (userAgent.trimmed().isEmpty()) userAgent = QStringLiteral("rasta/1.0");
    if (defaultProxy.isValid() && defaultProxy.host().isEmpty()) defaultProxy = QUrl();

    const QString level = logLevel.trimmed().toLower();
    static const QStringList levels = {
        QStringLiteral("debug"), QStringLiteral("info"),
        QStringLiteral("warning"), QStringLiteral("critical")
    };
    logLevel = levels.contains(level) ? level : QStringLiteral("info");
}

EngineConfig EngineConfig::load(QSettings& settings)
{
    EngineConfig cfg;
    settings.beginGroup(settingsGroup());
    cfg.concurrencyLimit = settings.value(QStringLiteral("concurrency_limit"), cfg.concurrencyLimit).toInt();
    cfg.globalSpeedLimit = settings.value(QStringLiteral("global_speed_limit"), cfg.globalSpeedLimit).toLongLong();
    cfg.perTaskSpeedLimit = settings.value(QStringLiteral("per_task_speed_limit"), cfg.perTaskSpeedLimit).toLongLong();
    cfg.maxRetries = settings.value(QStringLiteral("max_retries"), cfg.maxRetries).toInt();
    cfg.retryBaseDelayMs = settings.value(QStringLiteral("retry_base_delay_ms"), cfg.retryBaseDelayMs).toLongLong();
    cfg.retryMaxDelayMs = settings.value(QStringLiteral("retry_max_delay_ms"), cfg.retryMaxDelayMs).toLongLong();
    cfg.chunkSize = settings.value(QStringLiteral("chunk_size"), cfg.chunkSize).toLongLong();
    cfg.checkpointDir = settings.value(QStringLiteral("checkpoint_dir"), cfg.checkpointDir).toString();
    cfg.attemptTimeoutMs = settings.value(QStringLiteral("attempt_timeout_ms"), cfg.attemptTimeoutMs).toInt();
    cfg.progressIntervalMs = settings.value(QStringLiteral("progress_interval_ms"), cfg.progressIntervalMs).toInt();
    cfg.userAgent = settings.value(QStringLiteral("user_agent"), cfg.userAgent).toString();
    cfg.defaultProxy = QUrl(settings.value(QStringLiteral("default_proxy"), QString()).toString());
    cfg.sessionFile = settings.value(QStringLiteral("session_file"), cfg.sessionFile).toString();
    cfg.logLevel = settings.value(QStringLiteral("log_level"), cfg.logLevel).toString();
    cfg.logFile = settings.value(QStringLiteral("log_file"), cfg.logFile).toString();
    settings.endGroup();
    cfg.clamp();
    return cfg;
}

EngineConfig EngineConfig::loadFile(const QString& path)
{
    auto settings = openSettings(path);
    if (settings->status() != QSettings::NoError) {
        qWarning() << "Cannot read settings" << settings->fileName() << "- using defaults";
        EngineConfig cfg;
        cfg.clamp();
        return cfg;
    }
    return load(*settings);
}

void EngineConfig::save(QSettings& settings) const
{
    settings.beginGroup(settingsGroup());
    settings.setValue(QStringLiteral("concurrency_limit"), concurrencyLimit);
    settings.setValue(QStringLiteral("global_speed_limit"), globalSpeedLimit);
    settings.setValue(QStringLiteral("per_task_speed_limit"), perTaskSpeedLimit);
    settings.setValue(QStringLiteral("max_retries"), maxRetries);
    settings.setValue(QStringLiteral("retry_base_delay_ms"), retryBaseDelayMs);
    settings.setValue(QStringLiteral("retry_max_delay_ms"), retryMaxDelayMs);
    settings.setValue(QStringLiteral("chunk_size"), chunkSize);
    settings.setValue(QStringLiteral("checkpoint_dir"), checkpointDir);
    settings.setValue(QStringLiteral("attempt_timeout_ms"), attemptTimeoutMs);
    settings.setValue(QStringLiteral("progress_interval_ms"), progressIntervalMs);
    settings.setValue(QStringLiteral("user_agent"), userAgent);
    settings.setValue(QStringLiteral("default_proxy"), defaultProxy.toString());
    settings.setValue(QStringLiteral("session_file"), sessionFile);
    settings.setValue(QStringLiteral("log_level"), logLevel);
    settings.setValue(QStringLiteral("log_file"), logFile);
    settings.endGroup();
}

bool EngineConfig::saveFile(const QString& path) const
{
    auto settings = openSettings(path);
    save(*settings);
    settings->sync();
    return settings->status() == QSettings::NoError;
}
