/*!
 * @file        transferunit.cppm
 * @brief       Execution of a single resumable, rate-limited download.
 * @details     A TransferUnit drives one DownloadRequest through its lifecycle.
 *              Each attempt reads the checkpoint of the destination, verifies
 *              it against the partial file and opens a TransferSource at the
 *              recorded offset with the stored fingerprint as validator. Bytes
 *              are then pulled in bounded chunks; before every write the unit
 *              acquires quota from its own limiter (per-task cap) and from the
 *              shared global limiter.
 *
 *              After each flushed chunk the checkpoint is updated, so the
 *              recorded offset never exceeds the bytes on disk. On success the
 *              partial file is renamed over the destination.
 *
 *              The unit does not decide about retries. A failed attempt leaves
 *              it in Failed and emits attemptFailed(); the owner either calls
 *              requeue() to run another attempt or giveUp() to report the
 *              failure on the progress bus.
 *
 *              All callbacks of an attempt carry its generation number, so work
 *              scheduled by an attempt that was paused, cancelled or restarted
 *              is dropped.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 */

module;
#include <QObject>
#include <QElapsedTimer>
#include <QFile>
#include <QPointer>
#include <QStringList>
#include <QTimer>
#include <QUrl>

#ifndef Q_MOC_RUN
export module rasta.core.transferunit;
export import rasta.core.transferstate;
export import rasta.core.transfersource;
export import rasta.core.ratelimiter;
export import rasta.core.progressbus;
export import rasta.core.checkpoint;
#endif

#ifdef Q_MOC_RUN
#define RASTA_MODULE_EXPORT
#else
#define RASTA_MODULE_EXPORT export
#endif

/**
 * @brief Per-unit knobs derived from the engine configuration.
 */
RASTA_MODULE_EXPORT struct TransferOptions {
    qint64 chunkSize = 8192;                            //!< Bytes per write.
    int attemptTimeoutMs = 30000;                       //!< Stall timeout, 0 disables.
    QString userAgent = QStringLiteral("rasta/1.0");    //!< User-Agent value.
    QUrl defaultProxy;                                  //!< Proxy when the request has none.
    int readAheadChunks = 4;                            //!< Source read buffer, in chunks.
};

/**
 * @brief Runs one download, one attempt at a time.
 *
 * Units live on the scheduler's thread and are driven by its event loop.
 */
RASTA_MODULE_EXPORT class TransferUnit : public QObject {

    Q_OBJECT

    //!< @brief Task identifier.
    Q_PROPERTY(QString id READ id CONSTANT)

    //!< @brief Current status string.
    Q_PROPERTY(QString statusString READ statusName NOTIFY statusChanged)

    //!< @brief Log lines for this unit.
    Q_PROPERTY(QStringList logLines READ logLines NOTIFY logLinesChanged)

public:
    /**
     * @brief Construct a unit in the Queued state.
     * @param request Request to execute.
     * @param destinationPath Resolved destination file.
     * @param factory Source factory, must outlive the unit.
     * @param globalLimiter Shared limiter, may be nullptr.
     * @param bus Progress bus, may be nullptr.
     * @param checkpoints Checkpoint store, must outlive the unit.
     * @param options Unit options.
     * @param parent Optional parent QObject.
     */
    TransferUnit(const DownloadRequest& request,
                 const QString& destinationPath,
                 TransferSourceFactory* factory,
                 RateLimiter* globalLimiter,
                 ProgressBus* bus,
                 CheckpointStore* checkpoints,
                 const TransferOptions& options,
                 QObject* parent = nullptr);
    ~TransferUnit() override;

    //!< @brief Start the next attempt (Queued -> Connecting).
    void start();

    //!< @brief Stop the running attempt and keep partial data (-> Paused).
    void pause();

    //!< @brief Return to the queue after a pause or a failed attempt.
    void requeue();

    /**
     * @brief Request cooperative cancellation.
     *
     * Takes effect at the next chunk boundary. The partial file and the
     * checkpoint are kept unless @p deletePartial is set.
     *
     * @param deletePartial Remove partial data.
     */
    void cancel(bool deletePartial = false);

    //!< @brief Report the last failed attempt as final.
    void giveUp();

    QString id() const { return m_request.id; }
    const DownloadRequest& request() const { return m_request; }
    QString destinationPath() const { return m_path; }
    QString partialPath() const { return m_partPath; }
    TransferState state() const { return m_state; }
    TransferStatus status() const { return m_state.status; }
    QString statusName() const { return statusString(m_state.status); }
    qint64 bytesTransferred() const { return m_state.bytesTransferred; }
    qint64 totalBytes() const { return m_state.totalBytes; }
    int attempt() const { return m_state.attempt; }
    int failures() const { return m_state.failures; }
    TransferError lastError() const { return m_state.lastError; }

    //!< @brief Observed throughput of this unit in bytes/sec.
    double currentSpeed() const;

    //!< @brief Bytes written by this unit divided by the time spent downloading.
    double averageSpeed() const;

    /**
     * @brief Estimated time to completion.
     *
     * Based on the current speed, or the average speed while no samples are
     * in the window.
     *
     * @return Seconds remaining, 0 once completed, -1 if the size or speed is unknown.
     */
    int eta() const;

    //!< @brief Per-task cap in bytes/sec (0 = unlimited).
    qint64 speedLimit() const;

    /**
     * @brief Change the per-task cap.
     * @param bytesPerSecond New cap, 0 for none.
     */
    void setSpeedLimit(qint64 bytesPerSecond);

    //!< @brief Return log lines.
    QStringList logLines() const { return m_logLines; }

    /**
     * @brief Append a log line.
     * @param line Log line.
     */
    void appendLog(const QString& line);

    //!< @brief Build an event from the current state.
    TransferEvent makeEvent(bool withError = false) const;

signals:
    /**
     * @brief Emitted after every accepted status change.
     * @param status New status.
     */
    void statusChanged(TransferStatus status);

    /**
     * @brief Emitted after each written chunk.
     * @param bytesTransferred Bytes written.
     * @param totalBytes Expected size, -1 if unknown.
     */
    void progress(qint64 bytesTransferred, qint64 totalBytes);

    /**
     * @brief Emitted when an attempt failed and the unit entered Failed.
     * @param error Classified error.
     */
    void attemptFailed(const TransferError& error);

    //!< @brief Emitted once the destination is finalized.
    void completed();

    //!< @brief Emitted once the unit is cancelled.
    void cancelled();

    //!< @brief Emitted when log lines change.
    void logLinesChanged();

private:
    /**
     * @brief Apply a status change if the transition table allows it.
     * @param next Requested status.
     * @return false if the transition was rejected.
     */
    bool transitionTo(TransferStatus next);

    //!< @brief Publish a status event on the bus.
    void publishStatus(bool withError = false);

    //!< @brief Read the checkpoint, open the partial file and the source.
    void openAttempt();

    /**
     * @brief Handle the source metadata of an attempt.
     * @param generation Attempt generation.
     * @param meta Served metadata.
     */
    void onMetaData(quint64 generation, const SourceMetaData& meta);

    /**
     * @brief Pull the next chunk if one is available.
     * @param generation Attempt generation.
     */
    void pump(quint64 generation);

    /**
     * @brief Write a chunk once quota has been granted.
     * @param generation Attempt generation.
     * @param size Granted bytes.
     */
    void writeChunk(quint64 generation, qint64 size);

    //!< @brief Verify length, finalize the destination and complete.
    void finishStream();

    /**
     * @brief End the attempt with an error.
     * @param generation Attempt generation.
     * @param error Classified error.
     */
    void failAttempt(quint64 generation, const TransferError& error);

    /**
     * @brief Discard partial data and reconnect from offset zero.
     * @param reason Log line.
     */
    void restartFromZero(const QString& reason);

    //!< @brief Apply a pending cancellation.
    void finishCancel();

    //!< @brief Invalidate callbacks and release the source and file.
    void stopAttempt();

    //!< @brief Persist the current offset.
    void saveCheckpoint();

    //!< @brief Restart the stall timer.
    void armStallTimer();

    DownloadRequest m_request;                      //!< Request being executed.
    QString m_path;                                 //!< Destination path.
    QString m_partPath;                             //!< Partial file path.
    TransferSourceFactory* m_factory = nullptr;     //!< Source factory.
    QPointer<RateLimiter> m_globalLimiter;          //!< Shared limiter.
    RateLimiter* m_taskLimiter = nullptr;           //!< Per-task limiter, owned.
    QPointer<ProgressBus> m_bus;                    //!< Event sink.
    CheckpointStore* m_checkpoints = nullptr;       //!< Checkpoint storage.
    TransferOptions m_options;                      //!< Unit options.

    TransferState m_state;                          //!< Public state.
    QPointer<TransferSource> m_source;              //!< Active source.
    QFile* m_file = nullptr;                        //!< Open partial file.
    QString m_fingerprint;                          //!< Fingerprint of the bytes on disk.
    QString m_validator;                            //!< Fingerprint sent with this attempt.
    qint64 m_offset = 0;                            //!< Offset requested by this attempt.
    quint64 m_generation = 0;                       //!< Attempt generation.
    bool m_lengthKnown = false;                     //!< Source reported the complete length.
    bool m_waitingQuota = false;                    //!< Quota acquisition pending.
    bool m_cancelRequested = false;                 //!< Cancellation pending.
    bool m_deletePartial = false;                   //!< Cancellation removes partial data.
    bool m_restarted = false;                       //!< Restart from zero already used.
    bool m_ignoreResumeHint = false;                //!< Request resume offset invalidated.
    QTimer m_stallTimer;                            //!< Per-attempt stall timeout.
    QElapsedTimer m_activeTimer;                    //!< Runs while Downloading.
    qint64 m_activeMs = 0;                          //!< Downloading time of earlier stretches.
    qint64 m_receivedBytes = 0;                     //!< Bytes written by this unit.
    QStringList m_logLines;                         //!< Log line list.
    int m_logLimit = 200;                           //!< Log line limit.
};

#include "transferunit.moc"
