/*!
 * @file        transferstate.cppm
 * @brief       Request and state value types for a single transfer.
 * @details     Defines the immutable DownloadRequest handed to the scheduler,
 *              the TransferStatus lifecycle with its transition table, and the
 *              TransferState owned by each transfer unit.
 *
 *              Allowed transitions:
 *              - Queued      -> Connecting, Paused, Cancelled
 *              - Connecting  -> Downloading, Failed, Cancelled, Paused
 *              - Downloading -> Completed, Failed, Cancelled, Paused, Connecting
 *              - Paused      -> Queued, Cancelled
 *              - Failed      -> Queued, Paused, Cancelled
 *
 *              Downloading -> Connecting is the restart-from-zero path taken
 *              when a resumed range no longer matches the remote content.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 */

module;
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module rasta.core.transferstate;
export import rasta.core.transfererror;
#endif

#ifdef Q_MOC_RUN
#define RASTA_MODULE_EXPORT
#else
#define RASTA_MODULE_EXPORT export
#endif

/**
 * @brief Lifecycle status of a transfer unit.
 */
RASTA_MODULE_EXPORT enum class TransferStatus {
    Queued,         //!< Waiting for admission.
    Connecting,     //!< Reading checkpoint and opening the source.
    Downloading,    //!< Streaming bytes to the partial file.
    Paused,         //!< Stopped by the caller, resumable.
    Completed,      //!< Destination file finalized.
    Failed,         //!< Attempt failed, awaiting retry or reported as final.
    Cancelled       //!< Stopped by the caller, not resumable.
};

/**
 * @brief Check a status change against the transition table.
 * @param from Current status.
 * @param to Requested status.
 * @return true if the transition is allowed.
 */
RASTA_MODULE_EXPORT bool canTransition(TransferStatus from, TransferStatus to);

//!< @brief Whether the status is Completed or Cancelled.
RASTA_MODULE_EXPORT bool isTerminal(TransferStatus status);

//!< @brief Human-readable status name.
RASTA_MODULE_EXPORT QString statusString(TransferStatus status);

/**
 * @brief Inverse of statusString().
 * @param name Status name.
 * @return Matching status, or TransferStatus::Queued for unrecognized names.
 */
RASTA_MODULE_EXPORT TransferStatus statusFromString(const QString& name);

/**
 * @brief Immutable description of one download.
 *
 * Filled by the caller from extractor output and collaborator data. Headers
 * and cookie are forwarded verbatim; a proxy URL overrides the configured
 * default for this request only.
 */
RASTA_MODULE_EXPORT struct DownloadRequest {
    QString id;                     //!< Caller-supplied identifier, generated when empty.
    QUrl url;                       //!< Source URL.
    QString destination;            //!< Destination file or directory.
    qint64 resumeOffset = -1;       //!< Offset hint when no checkpoint exists, -1 for none.
    qint64 speedLimit = 0;          //!< Per-task cap in bytes/sec, 0 for none.
    qint64 expectedSize = -1;       //!< Size reported by the extractor, -1 if unknown.
    QString suggestedName;          //!< Extractor file name or subpath.
    QStringList headers;            //!< Extra "Name: value" request headers.
    QString cookieHeader;           //!< Cookie header value.
    QUrl proxy;                     //!< Per-request proxy, empty for the default.

    //!< @brief Serialize for session persistence.
    QJsonObject toJson() const;

    //!< @brief Deserialize a request stored by toJson().
    static DownloadRequest fromJson(const QJsonObject& obj);
};

/**
 * @brief Runtime state of a transfer, owned by its unit.
 */
RASTA_MODULE_EXPORT struct TransferState {
    TransferStatus status = TransferStatus::Queued;     //!< Current status.
    qint64 bytesTransferred = 0;                        //!< Bytes durably written.
    qint64 totalBytes = -1;                             //!< Expected size, -1 if unknown.
    TransferError lastError;                            //!< Last classified error.
    int attempt = 0;                                    //!< Current attempt, 0 before the first start.
    int failures = 0;                                   //!< Failed attempts so far.
};
