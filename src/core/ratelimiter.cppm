/*!
 * @file        ratelimiter.cppm
 * @brief       Thread-safe token-bucket rate limiter.
 * @details     Bounds the aggregate byte rate of every transfer sharing the
 *              limiter. The bucket holds at most one second of budget and is
 *              refilled continuously from a monotonic clock. Each grant is
 *              recorded in a sliding window used to report the observed
 *              throughput.
 *
 *              Two acquisition styles are offered with identical effect:
 *              - acquire() blocks the calling thread on a wait condition and
 *                is meant for worker threads.
 *              - acquireAsync() re-validates on single-shot timers and resumes
 *                a callback from the event loop of a context object.
 *
 *              A limit of 0 disables throttling; grants are still sampled so
 *              currentSpeed() keeps reporting throughput.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 */

module;
#include <QObject>
#include <QElapsedTimer>
#include <QMutex>
#include <QWaitCondition>
#include <QQueue>
#include <functional>

#ifndef Q_MOC_RUN
export module rasta.core.ratelimiter;
#endif

#ifdef Q_MOC_RUN
#define RASTA_MODULE_EXPORT
#else
#define RASTA_MODULE_EXPORT export
#endif

/**
 * @brief Shared token bucket injected into every transfer that must honor it.
 *
 * One mutex guards refill, debit and sample bookkeeping. Blocking waiters
 * sleep on a wait condition that releases the mutex and are woken when the
 * limit changes.
 */
RASTA_MODULE_EXPORT class RateLimiter : public QObject {

    Q_OBJECT

    //!< @brief Configured limit in bytes/sec (0 = unlimited).
    Q_PROPERTY(qint64 speedLimit READ speedLimit WRITE setSpeedLimit NOTIFY speedLimitChanged)

public:
    /**
     * @brief Construct a limiter.
     * @param speedLimit Limit in bytes/sec (0 = unlimited).
     * @param windowMs Throughput sliding window in milliseconds.
     * @param parent Optional parent QObject.
     */
    explicit RateLimiter(qint64 speedLimit = 0, qint64 windowMs = 1000, QObject* parent = nullptr);

    /**
     * @brief Block until @p size bytes may be spent, then commit them.
     *
     * Requests larger than the limit are granted in limit-sized slices.
     *
     * @param size Number of bytes.
     * @param shouldCancel Optional predicate checked between waits.
     * @return false if @p shouldCancel aborted the wait (the remainder is not granted).
     */
    bool acquire(qint64 size, const std::function<bool()>& shouldCancel = {});

    /**
     * @brief Asynchronous variant of acquire().
     *
     * @p callback is always invoked from the event loop of @p context, never
     * synchronously. If @p context is destroyed while waiting, the callback is
     * dropped and the remaining bytes are not granted.
     *
     * @param size Number of bytes.
     * @param context Receiver whose thread runs the callback.
     * @param callback Continuation invoked once the bytes are granted.
     */
    void acquireAsync(qint64 size, QObject* context, std::function<void()> callback);

    /**
     * @brief Observed throughput over the sliding window.
     * @return Bytes/sec, 0 when no samples are in the window.
     */
    double currentSpeed() const;

    //!< @brief Refill the bucket and clear throughput samples.
    void reset();

    //!< @brief Return the configured limit in bytes/sec.
    qint64 speedLimit() const;

    /**
     * @brief Reset, then apply a new limit and wake blocked waiters.
     * @param bytesPerSecond New limit (0 = unlimited, negative clamps to 0).
     */
    void setSpeedLimit(qint64 bytesPerSecond);

    //!< @brief Current token count after refill.
    double availableTokens() const;

    //!< @brief Total bytes granted since construction.
    qint64 totalGranted() const;

signals:
    //!< @brief Emitted when the limit changes.
    void speedLimitChanged();

private:
    /**
     * @brief Sliding window sample.
     */
    struct Sample {
        qint64 atMs = 0;    //!< Grant time in ms on the limiter clock.
        qint64 bytes = 0;   //!< Bytes granted.
    };

    /**
     * @brief Grant as many slices of @p remaining as the bucket allows.
     * @param remaining Bytes still owed, decremented in place.
     * @return 0 when fully granted, otherwise the wait in ms before the next slice fits.
     */
    qint64 takeLocked(qint64& remaining);

    //!< @brief Add elapsed budget to the bucket, capped at the limit.
    void refillLocked() const;

    //!< @brief Record a grant and evict expired samples.
    void recordLocked(qint64 bytes);

    //!< @brief Drop samples older than the window.
    void evictLocked(qint64 nowMs) const;

    //!< @brief Continue an asynchronous acquisition.
    void continueAsync(qint64 remaining, QObject* context, std::function<void()> callback);

    mutable QMutex m_mutex;                 //!< Guards all fields below.
    QWaitCondition m_wakeup;                //!< Signalled on limit changes.
    QElapsedTimer m_clock;                  //!< Monotonic clock.
    qint64 m_limit = 0;                     //!< Limit in bytes/sec.
    mutable double m_tokens = 0.0;          //!< Current bucket level.
    mutable qint64 m_lastRefillNs = 0;      //!< Last refill time in ns.
    qint64 m_windowMs = 1000;               //!< Sliding window length.
    mutable QQueue<Sample> m_samples;       //!< Grants inside the window.
    mutable qint64 m_windowBytes = 0;       //!< Sum of bytes in m_samples.
    qint64 m_totalGranted = 0;              //!< Lifetime grant counter.
};

#include "ratelimiter.moc"
