/*!
 * @file        retrypolicy.cppm
 * @brief       Retry decision and exponential backoff for failed attempts.
 * @details     Given a classified error and the number of the attempt that
 *              failed, decides whether the transfer is re-admitted and after
 *              what delay. Backoff doubles per attempt from a base delay and
 *              is capped at a maximum. A server Retry-After hint replaces the
 *              computed delay, still subject to the cap.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 */

module;
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module rasta.core.retrypolicy;
export import rasta.core.transfererror;
#endif

#ifdef Q_MOC_RUN
#define RASTA_MODULE_EXPORT
#else
#define RASTA_MODULE_EXPORT export
#endif

/**
 * @brief Outcome of RetryPolicy::decide().
 */
RASTA_MODULE_EXPORT struct RetryDecision {
    bool retry = false;     //!< Re-admit the transfer.
    qint64 delayMs = 0;     //!< Delay before re-admission.
};

/**
 * @brief Stateless retry policy shared by all transfers of a scheduler.
 */
RASTA_MODULE_EXPORT class RetryPolicy {
public:
    /**
     * @brief Construct a policy.
     * @param maxRetries Retries allowed after the first attempt.
     * @param baseDelayMs Delay before the first retry.
     * @param maxDelayMs Upper bound for any delay.
     */
    explicit RetryPolicy(int maxRetries = 3, qint64 baseDelayMs = 1000, qint64 maxDelayMs = 30000);

    /**
     * @brief Decide what to do after a failed attempt.
     * @param error Classified error of the attempt.
     * @param attempt Failed attempts so far, including this one.
     * @return Retry with delay, or give up.
     */
    RetryDecision decide(const TransferError& error, int attempt) const;

    /**
     * @brief Backoff for a given attempt without considering the error.
     * @param attempt 1-based attempt number.
     * @return min(maxDelay, baseDelay * 2^(attempt-1)).
     */
    qint64 backoffDelay(int attempt) const;

    int maxRetries() const { return m_maxRetries; }
    qint64 baseDelayMs() const { return m_baseDelayMs; }
    qint64 maxDelayMs() const { return m_maxDelayMs; }

private:
    int m_maxRetries = 3;           //!< Retry budget.
    qint64 m_baseDelayMs = 1000;    //!< First retry delay.
    qint64 m_maxDelayMs = 30000;    //!< Delay cap.
};
