/*!
 * @file        progressbus.cppm
 * @brief       Fan-out of transfer events to observers.
 * @details     Transfer units publish a TransferEvent on every status change
 *              and, at a throttled cadence, while bytes are flowing. Observers
 *              connect to eventPublished() or subscribe to a single task.
 *              Events of one task are delivered in emission order.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 */

module;
#include <QObject>
#include <QElapsedTimer>
#include <QHash>
#include <QMutex>
#include <QString>
#include <functional>

#ifndef Q_MOC_RUN
export module rasta.core.progressbus;
export import rasta.core.transferstate;
#endif

#ifdef Q_MOC_RUN
#define RASTA_MODULE_EXPORT
#else
#define RASTA_MODULE_EXPORT export
#endif

/**
 * @brief One observation of a transfer.
 *
 * `error.kind` is ErrorKind::None unless the event reports a final failure.
 */
RASTA_MODULE_EXPORT struct TransferEvent {
    QString taskId;                                 //!< Task identifier.
    TransferStatus status = TransferStatus::Queued; //!< Status at emission.
    qint64 bytesTransferred = 0;                    //!< Bytes written so far.
    qint64 totalBytes = -1;                         //!< Expected size, -1 if unknown.
    double speed = 0.0;                             //!< Observed bytes/sec.
    double averageSpeed = 0.0;                      //!< Bytes/sec over the time spent downloading.
    int eta = -1;                                   //!< Seconds remaining, -1 if unknown.
    int attempt = 0;                                //!< Current attempt number.
    TransferError error;                            //!< Final error, if any.
};

/**
 * @brief Event hub shared by a scheduler and its transfer units.
 */
RASTA_MODULE_EXPORT class ProgressBus : public QObject {

    Q_OBJECT

    //!< @brief Minimum spacing of progress events per task, in ms.
    Q_PROPERTY(int progressIntervalMs READ progressIntervalMs WRITE setProgressIntervalMs NOTIFY progressIntervalChanged)

public:
    /**
     * @brief Construct a bus.
     * @param progressIntervalMs Minimum spacing of progress events per task.
     * @param parent Optional parent QObject.
     */
    explicit ProgressBus(int progressIntervalMs = 250, QObject* parent = nullptr);

    /**
     * @brief Publish a status change. Never throttled.
     * @param event Event to deliver.
     */
    void publish(const TransferEvent& event);

    /**
     * @brief Publish a progress sample, dropped if the task published too recently.
     * @param event Event to deliver.
     * @return true if the event was delivered.
     */
    bool publishProgress(const TransferEvent& event);

    /**
     * @brief Observe the events of one task.
     * @param taskId Task identifier.
     * @param context Receiver; the connection dies with it.
     * @param handler Invoked for every event of @p taskId.
     * @return Connection handle.
     */
    QMetaObject::Connection subscribe(const QString& taskId,
                                      QObject* context,
                                      std::function<void(const TransferEvent&)> handler);

    //!< @brief Drop throttle bookkeeping of a finished task.
    void forget(const QString& taskId);

    int progressIntervalMs() const { return m_progressIntervalMs; }
    void setProgressIntervalMs(int ms);

signals:
    /**
     * @brief Emitted for every delivered event.
     * @param event The event.
     */
    void eventPublished(const TransferEvent& event);

    //!< @brief Emitted when the throttle interval changes.
    void progressIntervalChanged();

private:
    QElapsedTimer m_clock;                  //!< Throttle clock.
    QHash<QString, qint64> m_lastProgress;  //!< Last delivery per task, in ms.
    mutable QMutex m_mutex;                 //!< Guards m_lastProgress.
    int m_progressIntervalMs = 250;         //!< Throttle interval.
};

#include "progressbus.moc"
