/*!
 * @file        scheduler.cppm
 * @brief       Admission, concurrency and retry orchestration of transfers.
 * @details     DownloadScheduler is the entry point of the engine. It accepts
 *              requests, resolves their destination, and admits queued
 *              transfers in submission order while fewer than the concurrency
 *              limit are active. A destination path is owned by at most one
 *              live transfer; a request for a path that is owned by another
 *              active, paused or retry-pending transfer stays queued behind it.
 *
 *              Failed attempts are passed to the retry policy. A retry puts
 *              the transfer back into the queue after the backoff delay; a
 *              give-up reports the failure once and keeps the transfer until
 *              the caller acknowledges it. Completed and cancelled transfers
 *              are dropped right away.
 *
 *              The scheduler owns the global rate limiter, the progress bus
 *              and the checkpoint store shared by its transfers. Non-terminal
 *              requests are persisted to the session file (if configured) so
 *              interrupted work resumes from its checkpoints on restart.
 *
 *              Mutating operations must be called from the scheduler's thread.
 *              Queries (statistics, snapshots, counts) are guarded by a mutex
 *              and may be called from any thread.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 */

module;
#include <QObject>
#include <QHash>
#include <QMutex>
#include <QPointer>
#include <QStringList>
#include <QTimer>
#include <QVector>
#include <optional>

#ifndef Q_MOC_RUN
export module rasta.core.scheduler;
export import rasta.core.transferunit;
export import rasta.core.engineconfig;
import rasta.core.retrypolicy;
#endif

#ifdef Q_MOC_RUN
#define RASTA_MODULE_EXPORT
#else
#define RASTA_MODULE_EXPORT export
#endif

/**
 * @brief Point-in-time view of one task.
 */
RASTA_MODULE_EXPORT struct TaskSnapshot {
    QString id;                                     //!< Task identifier.
    QString url;                                    //!< Source URL.
    QString destination;                            //!< Resolved destination path.
    TransferStatus status = TransferStatus::Queued; //!< Current status.
    qint64 bytesTransferred = 0;                    //!< Bytes written.
    qint64 totalBytes = -1;                         //!< Expected size, -1 if unknown.
    double speed = 0.0;                             //!< Observed bytes/sec.
    double averageSpeed = 0.0;                      //!< Bytes/sec over the time spent downloading.
    int eta = -1;                                   //!< Seconds remaining, -1 if unknown.
    int attempt = 0;                                //!< Attempts started.
    TransferError lastError;                        //!< Last classified error.
    bool retryPending = false;                      //!< Waiting for a retry delay.
    bool finalFailure = false;                      //!< Failure reported, awaiting acknowledge.
};

/**
 * @brief Aggregate counters of a scheduler.
 */
RASTA_MODULE_EXPORT struct SchedulerStats {
    int submitted = 0;          //!< Requests accepted since start.
    int active = 0;             //!< Connecting or downloading.
    int queued = 0;             //!< Waiting for admission.
    int paused = 0;             //!< Paused by the caller.
    int retryPending = 0;       //!< Waiting for a retry delay.
    int completed = 0;          //!< Finished successfully.
    int failed = 0;             //!< Reported as failed.
    int cancelled = 0;          //!< Cancelled.
    double speed = 0.0;         //!< Aggregate observed bytes/sec.
    qint64 bytes = 0;           //!< Bytes written by live and completed tasks.
};

/**
 * @brief Queue and policy manager for transfer units.
 */
RASTA_MODULE_EXPORT class DownloadScheduler : public QObject {

    Q_OBJECT

    //!< @brief Maximum number of concurrently active transfers.
    Q_PROPERTY(int concurrencyLimit READ concurrencyLimit WRITE setConcurrencyLimit NOTIFY concurrencyLimitChanged)

    //!< @brief Aggregate speed limit in bytes/sec (0 = unlimited).
    Q_PROPERTY(qint64 globalSpeedLimit READ globalSpeedLimit WRITE setGlobalSpeedLimit NOTIFY globalSpeedLimitChanged)

    //!< @brief Number of active transfers.
    Q_PROPERTY(int activeCount READ activeCount NOTIFY countsChanged)

    //!< @brief Number of queued transfers.
    Q_PROPERTY(int queuedCount READ queuedCount NOTIFY countsChanged)

public:
    /**
     * @brief Construct a scheduler.
     * @param config Engine configuration (clamped on construction).
     * @param factory Source factory, must outlive the scheduler.
     * @param parent Optional parent QObject.
     */
    explicit DownloadScheduler(const EngineConfig& config,
                               TransferSourceFactory* factory,
                               QObject* parent = nullptr);
    ~DownloadScheduler() override;

    /**
     * @brief Accept a request.
     * @param request Request; an empty id is replaced by a generated one.
     * @return Task handle, or an empty string if the request was rejected.
     */
    QString submit(const DownloadRequest& request);

    /**
     * @brief Cancel a task.
     * @param id Task handle.
     * @param deletePartial Remove the partial file and checkpoint.
     * @return false if the handle is unknown.
     */
    bool cancel(const QString& id, bool deletePartial = false);

    /**
     * @brief Pause a task, keeping partial data and its path.
     * @param id Task handle.
     * @return false if the handle is unknown or the task cannot pause.
     */
    bool pause(const QString& id);

    /**
     * @brief Put a paused task back into the queue.
     * @param id Task handle.
     * @return false if the handle is unknown or the task is not paused.
     */
    bool resume(const QString& id);

    /**
     * @brief Drop a task whose failure has been reported.
     * @param id Task handle.
     * @return false if the task is unknown or not finally failed.
     */
    bool acknowledge(const QString& id);

    //!< @brief Pause every active, queued or retry-pending task.
    void pauseAll();

    //!< @brief Resume every paused task.
    void resumeAll();

    /**
     * @brief Cancel every live task.
     * @param deletePartial Remove partial files and checkpoints.
     */
    void cancelAll(bool deletePartial = false);

    int concurrencyLimit() const;

    /**
     * @brief Change the concurrency ceiling (values below 1 clamp to 1).
     * @param limit New ceiling.
     */
    void setConcurrencyLimit(int limit);

    qint64 globalSpeedLimit() const;

    /**
     * @brief Reset and reconfigure the shared limiter.
     * @param bytesPerSecond New limit, 0 for unlimited.
     */
    void setGlobalSpeedLimit(qint64 bytesPerSecond);

    //!< @brief Number of connecting or downloading tasks.
    int activeCount() const;

    //!< @brief Number of tasks waiting for admission.
    int queuedCount() const;

    //!< @brief True when nothing is active, queued or waiting for a retry.
    bool isIdle() const;

    //!< @brief Aggregate counters.
    SchedulerStats statistics() const;

    /**
     * @brief View of one task.
     * @param id Task handle.
     * @return Snapshot, or std::nullopt once the task was dropped.
     */
    std::optional<TaskSnapshot> snapshot(const QString& id) const;

    //!< @brief Views of all tasks in submission order.
    QVector<TaskSnapshot> snapshots() const;

    /**
     * @brief Log lines of one task.
     * @param id Task handle.
     * @return Lines, empty for unknown tasks.
     */
    QStringList taskLog(const QString& id) const;

    //!< @brief Event stream of all tasks.
    ProgressBus* bus() { return &m_bus; }

    //!< @brief Shared global limiter.
    RateLimiter* limiter() { return &m_globalLimiter; }

    //!< @brief Configuration in effect.
    const EngineConfig& config() const { return m_config; }

    //!< @brief Load and submit requests saved in the session file.
    void restoreSession();

    //!< @brief Write non-terminal requests to the session file now.
    void saveSession();

signals:
    //!< @brief Emitted when active/queued counts change.
    void countsChanged();

    //!< @brief Emitted when the concurrency ceiling changes.
    void concurrencyLimitChanged();

    //!< @brief Emitted when the global limit changes.
    void globalSpeedLimitChanged();

    //!< @brief Emitted when the last active, queued or retry-pending task settles.
    void idle();

private:
    /**
     * @brief Bookkeeping of one task.
     */
    struct TaskRecord {
        TransferUnit* unit = nullptr;       //!< Owned unit.
        QString pathKey;                    //!< Destination lock key.
        TaskSnapshot snapshot;              //!< Cached view for other threads.
        QPointer<QTimer> retryTimer;        //!< Pending retry delay.
        bool finalFailure = false;          //!< Failure already reported.
    };

    //!< @brief Admit queued tasks while below the ceiling.
    void startQueued();

    /**
     * @brief Copy the unit state into its record.
     * @param unit Unit to mirror.
     */
    void refresh(TransferUnit* unit);

    /**
     * @brief Apply the retry policy to a failed attempt.
     * @param unit Unit that failed.
     * @param error Classified error.
     */
    void onAttemptFailed(TransferUnit* unit, const TransferError& error);

    //!< @brief Drop a completed or cancelled unit.
    void onUnitSettled(TransferUnit* unit, bool success);

    /**
     * @brief Remove a record and release its path.
     * @param id Task handle.
     * @return The unit, or nullptr.
     */
    TransferUnit* takeRecord(const QString& id);

    /**
     * @brief Stop a pending retry delay.
     * @param id Task handle.
     * @return true if a retry was pending.
     */
    bool stopRetry(const QString& id);

    //!< @brief Look up a unit under the lock.
    TransferUnit* unitFor(const QString& id) const;

    //!< @brief Emit idle() if nothing is left to run.
    void checkIdle();

    //!< @brief Schedule a debounced session write.
    void scheduleSave();

    EngineConfig m_config;                          //!< Configuration.
    TransferSourceFactory* m_factory = nullptr;     //!< Source factory.
    RateLimiter m_globalLimiter;                    //!< Shared limiter.
    ProgressBus m_bus;                              //!< Event stream.
    CheckpointStore m_checkpoints;                  //!< Checkpoint storage.
    RetryPolicy m_retry;                            //!< Retry policy.
    TransferOptions m_unitOptions;                  //!< Options for new units.

    mutable QMutex m_mutex;                         //!< Guards the fields below.
    QHash<QString, TaskRecord> m_records;           //!< Records by handle.
    QStringList m_order;                            //!< Handles in submission order.
    QHash<QString, QString> m_pathOwner;            //!< Path key -> owning handle.
    int m_concurrencyLimit = 3;                     //!< Active ceiling.
    int m_submitted = 0;                            //!< Accepted requests.
    int m_completed = 0;                            //!< Completed tasks.
    int m_failed = 0;                               //!< Reported failures.
    int m_cancelled = 0;                            //!< Cancelled tasks.
    qint64 m_completedBytes = 0;                    //!< Bytes of completed tasks.

    bool m_admitting = false;                       //!< startQueued() is running.
    bool m_admitAgain = false;                      //!< startQueued() requested while running.
    bool m_wasIdle = true;                          //!< Last idle state reported.
    bool m_restoreInProgress = false;               //!< Suppresses saves during restore.
    QTimer m_saveTimer;                             //!< Debounced session save.
};

#include "scheduler.moc"
