module;
#include <QByteArray>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLocale>
#include <QRegularExpression>
#include <QTimeZone>
#include <QUrlQuery>
#include <QtGlobal>

module rasta.utils.download_utils;

namespace rasta::utils {

QString normalizeFilePath(const QString& path)
{
    if (path.startsWith("file://")) {
        QUrl url(path);
        if (url.isValid() && url.isLocalFile()) {
            return url.toLocalFile();
        }
    }
    return path;
}

QString pathKey(const QString& path)
{
    const QString normalized = normalizeFilePath(path);
    if (normalized.isEmpty()) return QString();
    return QDir::cleanPath(QFileInfo(normalized).absoluteFilePath());
}

QString partialFilePath(const QString& filePath)
{
    return normalizeFilePath(filePath) + ".part";
}

qint64 partialFileSize(const QString& filePath)
{
    const QString localPath = normalizeFilePath(filePath);
    if (localPath.isEmpty()) return 0;

    QFileInfo singlePart(partialFilePath(localPath));
    if (singlePart.exists() && singlePart.isFile()) {
        return singlePart.size();
    }
    return 0;
}

QString decodeQueryValue(const QString& value)
{
    QString v = value;
    v.replace('+', ' ');
    return QUrl::fromPercentEncoding(v.toUtf8());
}

QString filenameFromDisposition(const QString& value)
{
    const QString decoded = decodeQueryValue(value);
    if (decoded.isEmpty()) return QString();
    QRegularExpression re(QStringLiteral("filename\\*?=(?:UTF-8''|\"?)([^\";]+)"));
    auto match = re.match(decoded);
    if (match.hasMatch()) return match.captured(1).trimmed();
    return QString();
}

QString fileNameFromUrl(const QUrl& url)
{
    if (!url.isValid()) return QString();
    QUrlQuery query(url);
    QString disp = query.queryItemValue(QStringLiteral("response-content-disposition"));
    if (disp.isEmpty()) disp = query.queryItemValue(QStringLiteral("content-disposition"));
    if (disp.isEmpty()) disp = query.queryItemValue(QStringLiteral("rscd"));
    if (!disp.isEmpty()) {
        const QString fromDisp = filenameFromDisposition(disp);
        if (!fromDisp.isEmpty()) return fromDisp;
    }
    const QString filename = query.queryItemValue(QStringLiteral("filename"));
    if (!filename.isEmpty()) return decodeQueryValue(filename);

    const QString path = url.path();
    const QString base = QFileInfo(path).fileName();
    return base;
}

QString sanitizeFileName(const QString& name)
{
    QString out;
    out.reserve(name.size());
    for (const QChar c : name) {
        if (!c.isPrint()) continue;
        if (QStringLiteral("<>:\"/\\|?*").contains(c)) continue;
        out.append(c);
    }
    out = out.trimmed();
    if (out == QStringLiteral(".") || out == QStringLiteral("..")) return QString();
    return out;
}

QString resolveDestination(const QString& destination, const QString& suggestedName, const QUrl& url)
{
    const QString normalized = normalizeFilePath(destination);
    if (normalized.isEmpty()) return QString();

    const bool looksLikeDir = normalized.endsWith('/') || normalized.endsWith('\\')
                              || QFileInfo(normalized).isDir();
    if (!looksLikeDir) return QDir::cleanPath(normalized);

    QDir dir(normalized);
    if (!suggestedName.trimmed().isEmpty()) {
        // Subpaths from extractors are kept, but each component is sanitized.
        const QStringList parts = QDir::fromNativeSeparators(suggestedName).split('/', Qt::SkipEmptyParts);
        QStringList clean;
        for (const QString& part : parts) {
            const QString c = sanitizeFileName(part);
            if (!c.isEmpty()) clean.append(c);
        }
        if (!clean.isEmpty()) return QDir::cleanPath(dir.filePath(clean.join('/')));
    }

    const QString fromUrl = sanitizeFileName(fileNameFromUrl(url));
    if (fromUrl.isEmpty()) return QString();
    return QDir::cleanPath(dir.filePath(fromUrl));
}

ContentRange parseContentRange(const QByteArray& value)
{
    ContentRange out;
    QRegularExpression re(QStringLiteral("^\\s*bytes\\s+(?:(\\d+)-(\\d+)|\\*)/(\\d+|\\*)\\s*$"),
                          QRegularExpression::CaseInsensitiveOption);
    const auto match = re.match(QString::fromLatin1(value));
    if (!match.hasMatch()) return out;

    if (!match.captured(1).isEmpty()) {
        out.first = match.captured(1).toLongLong();
        out.last = match.captured(2).toLongLong();
        if (out.last < out.first) return out;
    }
    const QString total = match.captured(3);
    out.total = total == QStringLiteral("*") ? -1 : total.toLongLong();
    out.valid = true;
    return out;
}

qint64 parseRetryAfter(const QByteArray& value)
{
    const QByteArray trimmed = value.trimmed();
    if (trimmed.isEmpty()) return -1;

    bool ok = false;
    const qint64 seconds = trimmed.toLongLong(&ok);
    if (ok) return seconds >= 0 ? seconds * 1000 : -1;

    const QDateTime when = QLocale::c().toDateTime(QString::fromLatin1(trimmed),
                                                   QStringLiteral("ddd, dd MMM yyyy HH:mm:ss 'GMT'"));
    if (!when.isValid()) return -1;
    QDateTime utc = when;
    utc.setTimeZone(QTimeZone::UTC);
    const qint64 delta = QDateTime::currentDateTimeUtc().msecsTo(utc);
    return qMax<qint64>(0, delta);
}

bool fileExistsPath(const QString& path)
{
    const QString normalized = normalizeFilePath(path);
    if (normalized.isEmpty()) return false;
    QFileInfo info(normalized);
    return info.exists() && info.isFile();
}

} // namespace rasta::utils
