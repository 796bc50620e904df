module;
#include <QFile>
#include <QMessageLogContext>
#include <QMutex>
#include <QMutexLocker>
#include <QDateTime>
#include <QStringList>
#include <cstdio>
#include <memory>

module rasta.services.log_sink;

namespace {

struct SinkState {
    QMutex mutex;
    QtMsgType minimumLevel = QtInfoMsg;
    std::unique_ptr<QFile> file;
    QStringList lines;
    bool echo = true;
    bool installed = false;
    QtMessageHandler previous = nullptr;
};

SinkState& state()
{
    static SinkState s;
    return s;
}

const char* levelName(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg: return "DEBUG";
    case QtInfoMsg: return "INFO";
    case QtWarningMsg: return "WARN";
    case QtCriticalMsg: return "ERROR";
    case QtFatalMsg: return "FATAL";
    }
    return "INFO";
}

void handleMessage(QtMsgType type, const QMessageLogContext&, const QString& message)
{
    SinkState& s = state();
    QMutexLocker locker(&s.mutex);
    if (LogSink::severity(type) < LogSink::severity(s.minimumLevel)) return;

    const QString line = LogSink::formatLine(type, message, QDateTime::currentDateTime());
    const QByteArray bytes = line.toLocal8Bit() + '\n';

    if (s.echo) {
        std::fputs(bytes.constData(), stderr);
        std::fflush(stderr);
    }
    if (s.file && s.file->isOpen()) {
        s.file->write(bytes);
        s.file->flush();
    }

    s.lines.append(line);
    if (s.lines.size() > LogSink::kMaxLines) {
        s.lines.remove(0, s.lines.size() - LogSink::kMaxLines);
    }
}

bool openLogFile(SinkState& s, const QString& path)
{
    s.file.reset();
    if (path.isEmpty()) return true;
    auto file = std::make_unique<QFile>(path);
    if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "Cannot open log file %s: %s\n",
                     qPrintable(path), qPrintable(file->errorString()));
        return false;
    }
    s.file = std::move(file);
    return true;
}

} // namespace

bool LogSink::install(QtMsgType minimumLevel, const QString& filePath)
{
    SinkState& s = state();
    bool opened = true;
    {
        QMutexLocker locker(&s.mutex);
        s.minimumLevel = minimumLevel;
        opened = openLogFile(s, filePath);
        if (s.installed) return opened;
        s.installed = true;
    }
    s.previous = qInstallMessageHandler(handleMessage);
    return opened;
}

void LogSink::uninstall()
{
    SinkState& s = state();
    QtMessageHandler previous = nullptr;
    {
        QMutexLocker locker(&s.mutex);
        if (!s.installed) return;
        s.installed = false;
        previous = s.previous;
        s.previous = nullptr;
        s.file.reset();
    }
    qInstallMessageHandler(previous);
}

void LogSink::setMinimumLevel(QtMsgType level)
{
    QMutexLocker locker(&state().mutex);
    state().minimumLevel = level;
}

QtMsgType LogSink::minimumLevel()
{
    QMutexLocker locker(&state().mutex);
    return state().minimumLevel;
}

bool LogSink::setLogFile(const QString& path)
{
    QMutexLocker locker(&state().mutex);
    return openLogFile(state(), path);
}

void LogSink::setEchoToStderr(bool enabled)
{
    QMutexLocker locker(&state().mutex);
    state().echo = enabled;
}

QtMsgType LogSink::levelFromName(const QString& name)
{
    const QString n = name.trimmed().toLower();
    if (n == QStringLiteral("debug")) return QtDebugMsg;
    if (n == QStringLiteral("warning") || n == QStringLiteral("warn")) return QtWarningMsg;
    if (n == QStringLiteral("critical") || n == QStringLiteral("error")) return QtCriticalMsg;
    return QtInfoMsg;
}

int LogSink::severity(QtMsgType type)
{
    // QtInfoMsg was added after the others and sorts last in the enum.
    switch (type) {
    case QtDebugMsg: return 0;
    case QtInfoMsg: return 1;
    case QtWarningMsg: return 2;
    case QtCriticalMsg: return 3;
    case QtFatalMsg: return 4;
    }
    return 1;
}

QString LogSink::formatLine(QtMsgType type, const QString& message, const QDateTime& when)
{
    return QStringLiteral("[%1] %2 %3")
        .arg(when.toString(QStringLiteral("yyyy-MM-dd HH:mm:ss.zzz")),
             QString::fromLatin1(levelName(type)),
             message);
}

QStringList LogSink::lines()
{
    QMutexLocker locker(&state().mutex);
    return state().lines;
}

int LogSink::lineCount()
{
    QMutexLocker locker(&state().mutex);
    return static_cast<int>(state().lines.size());
}

void LogSink::clear()
{
    QMutexLocker locker(&state().mutex);
    state().lines.clear();
}
