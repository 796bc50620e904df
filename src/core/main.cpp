#include <QCoreApplication>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QTextStream>
#include <QTimer>
#include <QUrl>

import rasta.core.scheduler;
import rasta.network.httpsource;
import rasta.services.log_sink;

#ifndef APP_VERSION
#define APP_VERSION "0.1.0"
#endif

namespace {

QString formatBytes(qint64 bytes)
{
    if (bytes < 0) return QStringLiteral("?");
    if (bytes < 1024) return QStringLiteral("%1 B").arg(bytes);
    if (bytes < 1024 * 1024) return QStringLiteral("%1 KiB").arg(bytes / 1024.0, 0, 'f', 1);
    return QStringLiteral("%1 MiB").arg(bytes / (1024.0 * 1024.0), 0, 'f', 1);
}

QString describe(const TransferEvent& event)
{
    QString line = QStringLiteral("[%1] %2 %3/%4")
                       .arg(event.taskId.left(8), statusString(event.status),
                            formatBytes(event.bytesTransferred), formatBytes(event.totalBytes));
    if (event.status == TransferStatus::Downloading && event.speed > 0) {
        line += QStringLiteral(" %1/s").arg(formatBytes(static_cast<qint64>(event.speed)));
        if (event.eta >= 0) line += QStringLiteral(" eta %1s").arg(event.eta);
    }
    if (event.error.isError()) {
        line += QStringLiteral(" %1: %2").arg(errorKindName(event.error.kind), event.error.message);
    }
    return line;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Genyleap"));
    QCoreApplication::setApplicationName(QStringLiteral("Rasta"));
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Resumable, rate-limited download engine."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("url"), QStringLiteral("URL(s) to download."),
                                 QStringLiteral("<url>..."));

    const QCommandLineOption outputOption({QStringLiteral("o"), QStringLiteral("output")},
        QStringLiteral("Destination directory, or file for a single URL."), QStringLiteral("path"));
    const QCommandLineOption configOption({QStringLiteral("c"), QStringLiteral("config")},
        QStringLiteral("INI file with an [engine] group."), QStringLiteral("file"));
    const QCommandLineOption concurrencyOption({QStringLiteral("j"), QStringLiteral("concurrency")},
        QStringLiteral("Maximum parallel downloads."), QStringLiteral("n"));
    const QCommandLineOption globalLimitOption(QStringLiteral("limit"),
        QStringLiteral("Aggregate speed limit in bytes/sec (0 = unlimited)."), QStringLiteral("bps"));
    const QCommandLineOption taskLimitOption(QStringLiteral("task-limit"),
        QStringLiteral("Per-download speed limit in bytes/sec (0 = unlimited)."), QStringLiteral("bps"));
    const QCommandLineOption retriesOption(QStringLiteral("retries"),
        QStringLiteral("Maximum retries per download."), QStringLiteral("n"));
    const QCommandLineOption chunkOption(QStringLiteral("chunk-size"),
        QStringLiteral("Bytes per write."), QStringLiteral("bytes"));
    const QCommandLineOption checkpointOption(QStringLiteral("checkpoint-dir"),
        QStringLiteral("Directory for resume checkpoints."), QStringLiteral("dir"));
    const QCommandLineOption timeoutOption(QStringLiteral("timeout"),
        QStringLiteral("Stall timeout per attempt in ms (0 disables)."), QStringLiteral("ms"));
    const QCommandLineOption proxyOption(QStringLiteral("proxy"),
        QStringLiteral("Default proxy URL (http:// or socks5://)."), QStringLiteral("url"));
    const QCommandLineOption headerOption({QStringLiteral("H"), QStringLiteral("header")},
        QStringLiteral("Extra request header \"Name: value\" (repeatable)."), QStringLiteral("header"));
    const QCommandLineOption sessionOption(QStringLiteral("session"),
        QStringLiteral("Session file to resume unfinished downloads from."), QStringLiteral("file"));
    const QCommandLineOption logLevelOption(QStringLiteral("log-level"),
        QStringLiteral("debug, info, warning or critical."), QStringLiteral("level"));
    const QCommandLineOption logFileOption(QStringLiteral("log-file"),
        QStringLiteral("Append log lines to this file."), QStringLiteral("file"));

    parser.addOptions({outputOption, configOption, concurrencyOption, globalLimitOption,
                       taskLimitOption, retriesOption, chunkOption, checkpointOption,
                       timeoutOption, proxyOption, headerOption, sessionOption,
                       logLevelOption, logFileOption});
    parser.process(app);

    QTextStream err(stderr);
    const auto readNumber = [&](const QCommandLineOption& option, qint64& target) {
        if (!parser.isSet(option)) return true;
        bool ok = false;
        const qint64 value = parser.value(option).toLongLong(&ok);
        if (!ok || value < 0) {
            err << "Invalid value for --" << option.names().constLast() << ": "
                << parser.value(option) << Qt::endl;
            return false;
        }
        target = value;
        return true;
    };

    EngineConfig config = parser.isSet(configOption)
        ? EngineConfig::loadFile(parser.value(configOption))
        : EngineConfig();

    qint64 concurrency = config.concurrencyLimit;
    qint64 retries = config.maxRetries;
    qint64 timeout = config.attemptTimeoutMs;
    if (!readNumber(concurrencyOption, concurrency)
        || !readNumber(globalLimitOption, config.globalSpeedLimit)
        || !readNumber(taskLimitOption, config.perTaskSpeedLimit)
        || !readNumber(retriesOption, retries)
        || !readNumber(chunkOption, config.chunkSize)
        || !readNumber(timeoutOption, timeout)) {
        return 2;
    }
    config.concurrencyLimit = static_cast<int>(qMin<qint64>(concurrency, 1024));
    config.maxRetries = static_cast<int>(qMin<qint64>(retries, 1000));
    config.attemptTimeoutMs = static_cast<int>(qMin<qint64>(timeout, 24 * 3600 * 1000));
    if (parser.isSet(checkpointOption)) config.checkpointDir = parser.value(checkpointOption);
    if (parser.isSet(proxyOption)) config.defaultProxy = QUrl(parser.value(proxyOption));
    if (parser.isSet(sessionOption)) config.sessionFile = parser.value(sessionOption);
    if (parser.isSet(logLevelOption)) config.logLevel = parser.value(logLevelOption);
    if (parser.isSet(logFileOption)) config.logFile = parser.value(logFileOption);
    config.clamp();

    if (!LogSink::install(LogSink::levelFromName(config.logLevel), config.logFile)) {
        qWarning() << "Logging to" << config.logFile << "disabled";
    }

    const QStringList urls = parser.positionalArguments();
    if (urls.isEmpty() && config.sessionFile.isEmpty()) {
        err << "No URL given." << Qt::endl << Qt::endl << parser.helpText();
        return 2;
    }

    QString output = parser.isSet(outputOption) ? parser.value(outputOption) : QDir::currentPath();
    if (urls.size() > 1 && !output.endsWith(QLatin1Char('/')) && !QFileInfo(output).isFile()) {
        // Several URLs always go into a directory.
        output += QLatin1Char('/');
    }

    HttpSourceFactory factory;
    factory.setDefaultProxy(config.defaultProxy);
    DownloadScheduler scheduler(config, &factory);

    QTextStream out(stdout);
    QObject::connect(scheduler.bus(), &ProgressBus::eventPublished, &app,
                     [&out](const TransferEvent& event) {
                         out << describe(event) << Qt::endl;
                     });

    scheduler.restoreSession();

    int rejected = 0;
    for (const QString& arg : urls) {
        DownloadRequest request;
        request.url = QUrl::fromUserInput(arg);
        request.destination = output;
        request.headers = parser.values(headerOption);
        if (scheduler.submit(request).isEmpty()) {
            err << "Rejected: " << arg << Qt::endl;
            ++rejected;
        }
    }

    int exitCode = 0;
    bool finished = false;
    const auto finish = [&] {
        if (finished || !scheduler.isIdle()) return;
        finished = true;
        const SchedulerStats stats = scheduler.statistics();
        out << QStringLiteral("Done: %1 completed, %2 failed, %3 cancelled, %4")
                   .arg(stats.completed).arg(stats.failed).arg(stats.cancelled)
                   .arg(formatBytes(stats.bytes))
            << Qt::endl;
        exitCode = stats.failed > 0 ? 1 : (rejected > 0 ? 2 : 0);
        scheduler.saveSession();
        app.quit();
    };
    QObject::connect(&scheduler, &DownloadScheduler::idle, &app, finish, Qt::QueuedConnection);
    if (scheduler.isIdle()) QTimer::singleShot(0, &app, finish);

    const int loopResult = app.exec();
    LogSink::uninstall();
    return exitCode != 0 ? exitCode : loopResult;
}
