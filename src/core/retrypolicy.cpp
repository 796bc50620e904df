module;
#include <QtGlobal>

module rasta.core.retrypolicy;

RetryPolicy::RetryPolicy(int maxRetries, qint64 baseDelayMs, qint64 maxDelayMs)
    : m_maxRetries(qMax(0, maxRetries)),
    m_baseDelayMs(qMax<qint64>(0, baseDelayMs)),
    m_maxDelayMs(qMax(m_baseDelayMs, maxDelayMs))
{
}

qint64 RetryPolicy::backoffDelay(int attempt) const
{
    if (attempt < 1) attempt = 1;
    qint64 delay = m_baseDelayMs;
    for (int i = 1; i < attempt && delay < m_maxDelayMs; ++i) {
        delay *= 2;
    }
    return qMin(delay, m_maxDelayMs);
}

RetryDecision RetryPolicy::decide(const TransferError& error, int attempt) const
{
    RetryDecision decision;
    if (!isRetryable(error.kind)) return decision;
    if (attempt > m_maxRetries) return decision;

    decision.retry = true;
    decision.delayMs = error.retryAfterMs >= 0 ? qMin(error.retryAfterMs, m_maxDelayMs)
                                               : backoffDelay(attempt);
    return decision;
}
