module;
#include <QCryptographicHash>
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>

module rasta.core.checkpoint;

import rasta.utils.download_utils;

namespace utils = rasta::utils;

QJsonObject Checkpoint::toJson() const
{
    QJsonObject obj;
    obj.insert("path", path);
    obj.insert("url", url.toString());
    obj.insert("bytes_written", static_cast<double>(bytesWritten));
    obj.insert("total_bytes", static_cast<double>(totalBytes));
    obj.insert("content_fingerprint", fingerprint);
    obj.insert("updated_at", static_cast<double>(updatedAt));
    return obj;
}

Checkpoint Checkpoint::fromJson(const QJsonObject& obj)
{
    Checkpoint cp;
    cp.path = obj.value("path").toString();
    cp.url = QUrl(obj.value("url").toString());
    cp.bytesWritten = qMax<qint64>(0, static_cast<qint64>(obj.value("bytes_written").toDouble(0)));
    cp.totalBytes = static_cast<qint64>(obj.value("total_bytes").toDouble(-1));
    cp.fingerprint = obj.value("content_fingerprint").toString();
    cp.updatedAt = static_cast<qint64>(obj.value("updated_at").toDouble(0));
    return cp;
}

CheckpointStore::CheckpointStore(const QString& directory)
    : m_directory(utils::normalizeFilePath(directory))
{
}

QString CheckpointStore::fileFor(const QString& path) const
{
    const QByteArray key = utils::pathKey(path).toUtf8();
    const QByteArray digest = QCryptographicHash::hash(key, QCryptographicHash::Sha1).toHex();
    return QDir(m_directory).filePath(QString::fromLatin1(digest) + QStringLiteral(".json"));
}

std::optional<Checkpoint> CheckpointStore::load(const QString& path) const
{
    QFile file(fileFor(path));
    if (!file.exists()) return std::nullopt;
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "Cannot read checkpoint" << file.fileName() << file.errorString();
        return std::nullopt;
    }
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "Corrupt checkpoint" << file.fileName() << parseError.errorString();
        return std::nullopt;
    }
    Checkpoint cp = Checkpoint::fromJson(doc.object());
    if (utils::pathKey(cp.path) != utils::pathKey(path)) {
        qWarning() << "Checkpoint path mismatch" << cp.path << path;
        return std::nullopt;
    }
    return cp;
}

std::optional<Checkpoint> CheckpointStore::loadVerified(const QString& path, const QString& partialPath) const
{
    std::optional<Checkpoint> cp = load(path);
    if (!cp) return std::nullopt;

    QFileInfo part(partialPath);
    const qint64 onDisk = part.exists() ? part.size() : 0;
    if (onDisk < cp->bytesWritten) {
        qWarning() << "Partial file shorter than checkpoint" << partialPath << onDisk << cp->bytesWritten;
        return std::nullopt;
    }
    if (onDisk > cp->bytesWritten) {
        QFile file(partialPath);
        if (!file.resize(cp->bytesWritten)) {
            qWarning() << "Cannot truncate partial file" << partialPath << file.errorString();
            return std::nullopt;
        }
    }
    return cp;
}

bool CheckpointStore::save(const Checkpoint& checkpoint) const
{
    if (!QDir().mkpath(m_directory)) {
        qWarning() << "Cannot create checkpoint directory" << m_directory;
        return false;
    }
    Checkpoint stamped = checkpoint;
    if (stamped.updatedAt <= 0) stamped.updatedAt = QDateTime::currentMSecsSinceEpoch();

    QSaveFile file(fileFor(checkpoint.path));
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "Cannot write checkpoint" << file.fileName() << file.errorString();
        return false;
    }
    const QByteArray data = QJsonDocument(stamped.toJson()).toJson(QJsonDocument::Compact);
    if (file.write(data) != data.size()) {
        file.cancelWriting();
        return false;
    }
    return file.commit();
}

bool CheckpointStore::remove(const QString& path) const
{
    const QString file = fileFor(path);
    if (!QFile::exists(file)) return true;
    return QFile::remove(file);
}
