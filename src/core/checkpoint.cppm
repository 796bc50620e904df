/*!
 * @file        checkpoint.cppm
 * @brief       Durable per-destination transfer checkpoints.
 * @details     A checkpoint records how many bytes of a destination have been
 *              durably written to its partial file, together with the remote
 *              fingerprint (ETag or Last-Modified) the bytes belong to. One JSON
 *              file per destination path is kept in the checkpoint directory;
 *              the file name is derived from a hash of the path.
 *
 *              Writes go through QSaveFile so a crash never leaves a truncated
 *              checkpoint behind.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 */

module;
#include <QJsonObject>
#include <QString>
#include <QUrl>
#include <optional>

#ifndef Q_MOC_RUN
export module rasta.core.checkpoint;
#endif

#ifdef Q_MOC_RUN
#define RASTA_MODULE_EXPORT
#else
#define RASTA_MODULE_EXPORT export
#endif

/**
 * @brief Persisted progress of one destination path.
 */
RASTA_MODULE_EXPORT struct Checkpoint {
    QString path;                   //!< Destination path.
    QUrl url;                       //!< Source URL.
    qint64 bytesWritten = 0;        //!< Bytes durably in the partial file.
    qint64 totalBytes = -1;         //!< Expected size, -1 if unknown.
    QString fingerprint;            //!< ETag, else Last-Modified.
    qint64 updatedAt = 0;           //!< Epoch ms of the last write.

    QJsonObject toJson() const;
    static Checkpoint fromJson(const QJsonObject& obj);
};

/**
 * @brief Directory-backed checkpoint storage.
 */
RASTA_MODULE_EXPORT class CheckpointStore {
public:
    /**
     * @brief Construct a store rooted at @p directory.
     * @param directory Checkpoint directory, created on first save.
     */
    explicit CheckpointStore(const QString& directory);

    //!< @brief Return the checkpoint directory.
    QString directory() const { return m_directory; }

    /**
     * @brief File that holds the checkpoint of @p path.
     * @param path Destination path.
     * @return Absolute JSON file path.
     */
    QString fileFor(const QString& path) const;

    /**
     * @brief Read the checkpoint of @p path.
     * @param path Destination path.
     * @return The checkpoint, or std::nullopt if absent or unreadable.
     */
    std::optional<Checkpoint> load(const QString& path) const;

    /**
     * @brief Read the checkpoint of @p path and reconcile it with the partial file.
     *
     * A partial file shorter than the recorded offset invalidates the
     * checkpoint. A longer one is truncated back to the recorded offset, so
     * the returned offset never exceeds the bytes on disk.
     *
     * @param path Destination path.
     * @param partialPath Partial file the transfer writes into.
     * @return A usable checkpoint, or std::nullopt.
     */
    std::optional<Checkpoint> loadVerified(const QString& path, const QString& partialPath) const;

    /**
     * @brief Persist a checkpoint atomically.
     * @param checkpoint Checkpoint to write.
     * @return true on success.
     */
    bool save(const Checkpoint& checkpoint) const;

    /**
     * @brief Delete the checkpoint of @p path.
     * @param path Destination path.
     * @return true if no checkpoint remains.
     */
    bool remove(const QString& path) const;

private:
    QString m_directory;    //!< Checkpoint directory.
};
