module;
#include <QJsonArray>
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QUrl>

module rasta.core.transferstate;

bool canTransition(TransferStatus from, TransferStatus to)
{
    using S = TransferStatus;
    switch (from) {
    case S::Queued:
        return to == S::Connecting || to == S::Paused || to == S::Cancelled;
    case S::Connecting:
        return to == S::Downloading || to == S::Failed || to == S::Cancelled || to == S::Paused;
    case S::Downloading:
        return to == S::Completed || to == S::Failed || to == S::Cancelled
               || to == S::Paused || to == S::Connecting;
    case S::Paused:
        return to == S::Queued || to == S::Cancelled;
    case S::Failed:
        return to == S::Queued || to == S::Paused || to == S::Cancelled;
    case S::Completed:
    case S::Cancelled:
        return false;
    }
    return false;
}

bool isTerminal(TransferStatus status)
{
    return status == TransferStatus::Completed || status == TransferStatus::Cancelled;
}

QString statusString(TransferStatus status)
{
    switch (status) {
    case TransferStatus::Queued: return QStringLiteral("Queued");
    case TransferStatus::Connecting: return QStringLiteral("Connecting");
    case TransferStatus::Downloading: return QStringLiteral("Downloading");
    case TransferStatus::Paused: return QStringLiteral("Paused");
    case TransferStatus::Completed: return QStringLiteral("Completed");
    case TransferStatus::Failed: return QStringLiteral("Failed");
    case TransferStatus::Cancelled: return QStringLiteral("Cancelled");
    }
    return QStringLiteral("Queued");
}

TransferStatus statusFromString(const QString& name)
{
    static const TransferStatus all[] = {
        TransferStatus::Queued, TransferStatus::Connecting, TransferStatus::Downloading,
        TransferStatus::Paused, TransferStatus::Completed, TransferStatus::Failed,
        TransferStatus::Cancelled
    };
    for (TransferStatus s : all) {
        if (statusString(s).compare(name, Qt::CaseInsensitive) == 0) return s;
    }
    return TransferStatus::Queued;
}

QJsonObject DownloadRequest::toJson() const
{
    QJsonObject obj;
    obj.insert("id", id);
    obj.insert("url", url.toString());
    obj.insert("destination", destination);
    obj.insert("resumeOffset", static_cast<double>(resumeOffset));
    obj.insert("speedLimit", static_cast<double>(speedLimit));
    obj.insert("expectedSize", static_cast<double>(expectedSize));
    if (!suggestedName.isEmpty()) obj.insert("suggestedName", suggestedName);
    if (!headers.isEmpty()) obj.insert("headers", QJsonArray::fromStringList(headers));
    if (!cookieHeader.isEmpty()) obj.insert("cookie", cookieHeader);
    if (!proxy.isEmpty()) obj.insert("proxy", proxy.toString());
    return obj;
}

DownloadRequest DownloadRequest::fromJson(const QJsonObject& obj)
{
    DownloadRequest req;
    req.id = obj.value("id").toString();
    req.url = QUrl(obj.value("url").toString());
    req.destination = obj.value("destination").toString();
    req.resumeOffset = static_cast<qint64>(obj.value("resumeOffset").toDouble(-1));
    req.speedLimit = qMax<qint64>(0, static_cast<qint64>(obj.value("speedLimit").toDouble(0)));
    req.expectedSize = static_cast<qint64>(obj.value("expectedSize").toDouble(-1));
    req.suggestedName = obj.value("suggestedName").toString();
    const QJsonArray headers = obj.value("headers").toArray();
    for (const auto& h : headers) {
        const QString line = h.toString();
        if (!line.isEmpty()) req.headers.append(line);
    }
    req.cookieHeader = obj.value("cookie").toString();
    const QString proxy = obj.value("proxy").toString();
    if (!proxy.isEmpty()) req.proxy = QUrl(proxy);
    return req;
}
