module;
#include <QDebug>
#include <QMutexLocker>
#include <QPointer>
#include <QTimer>
#include <QtMath>
#include <utility>

module rasta.core.ratelimiter;

namespace {
// Upper bound of a single blocking wait when a cancel predicate must be polled.
constexpr qint64 kCancelCheckMs = 100;
}

RateLimiter::RateLimiter(qint64 speedLimit, qint64 windowMs, QObject* parent)
    : QObject(parent),
    m_limit(qMax<qint64>(0, speedLimit)),
    m_windowMs(qMax<qint64>(1, windowMs))
{
    m_clock.start();
    m_tokens = static_cast<double>(m_limit);
    m_lastRefillNs = m_clock.nsecsElapsed();
}

void RateLimiter::refillLocked() const
{
    const qint64 now = m_clock.nsecsElapsed();
    const qint64 elapsed = now - m_lastRefillNs;
    m_lastRefillNs = now;
    if (m_limit <= 0 || elapsed <= 0) return;
    m_tokens = qMin(static_cast<double>(m_limit),
                    m_tokens + static_cast<double>(elapsed) * static_cast<double>(m_limit) / 1e9);
}

void RateLimiter::evictLocked(qint64 nowMs) const
{
    while (!m_samples.isEmpty() && nowMs - m_samples.head().atMs > m_windowMs) {
        m_windowBytes -= m_samples.dequeue().bytes;
    }
}

void RateLimiter::recordLocked(qint64 bytes)
{
    const qint64 nowMs = m_clock.elapsed();
    m_samples.enqueue(Sample{nowMs, bytes});
    m_windowBytes += bytes;
    m_totalGranted += bytes;
    evictLocked(nowMs);
}

qint64 RateLimiter::takeLocked(qint64& remaining)
{
    while (remaining > 0) {
        if (m_limit <= 0) {
            recordLocked(remaining);
            remaining = 0;
            return 0;
        }
        const qint64 slice = qMin(remaining, m_limit);
        refillLocked();
        if (static_cast<double>(slice) <= m_tokens) {
            m_tokens -= static_cast<double>(slice);
            recordLocked(slice);
            remaining -= slice;
            continue;
        }
        const double missing = static_cast<double>(slice) - m_tokens;
        return qMax<qint64>(1, qCeil(missing * 1000.0 / static_cast<double>(m_limit)));
    }
    return 0;
}

bool RateLimiter::acquire(qint64 size, const std::function<bool()>& shouldCancel)
{
    if (size <= 0) return true;
    QMutexLocker locker(&m_mutex);
    qint64 remaining = size;
    for (;;) {
        const qint64 waitMs = takeLocked(remaining);
        if (waitMs == 0) return true;
        if (shouldCancel) {
            locker.unlock();
            const bool cancelled = shouldCancel();
            locker.relock();
            if (cancelled) return false;
            m_wakeup.wait(&m_mutex, static_cast<unsigned long>(qMin(waitMs, kCancelCheckMs)));
        } else {
            m_wakeup.wait(&m_mutex, static_cast<unsigned long>(waitMs));
        }
    }
}

void RateLimiter::acquireAsync(qint64 size, QObject* context, std::function<void()> callback)
{
    if (!context || !callback) {
        qWarning() << "RateLimiter::acquireAsync called without context or callback";
        return;
    }
    continueAsync(qMax<qint64>(0, size), context, std::move(callback));
}

void RateLimiter::continueAsync(qint64 remaining, QObject* context, std::function<void()> callback)
{
    qint64 waitMs = 0;
    {
        QMutexLocker locker(&m_mutex);
        waitMs = takeLocked(remaining);
    }
    if (waitMs == 0) {
        QMetaObject::invokeMethod(context, std::move(callback), Qt::QueuedConnection);
        return;
    }
    QPointer<RateLimiter> self(this);
    QPointer<QObject> ctx(context);
    QTimer::singleShot(waitMs, context, [self, ctx, remaining, cb = std::move(callback)]() mutable {
        if (!self || !ctx) return;
        self->continueAsync(remaining, ctx.data(), std::move(cb));
    });
}

double RateLimiter::currentSpeed() const
{
    QMutexLocker locker(&m_mutex);
    const qint64 nowMs = m_clock.elapsed();
    evictLocked(nowMs);
    if (m_samples.isEmpty()) return 0.0;
    qint64 spanMs = qMin(m_windowMs, nowMs - m_samples.head().atMs);
    if (spanMs <= 0) spanMs = m_windowMs;
    return static_cast<double>(m_windowBytes) * 1000.0 / static_cast<double>(spanMs);
}

void RateLimiter::reset()
{
    QMutexLocker locker(&m_mutex);
    m_tokens = static_cast<double>(m_limit);
    m_lastRefillNs = m_clock.nsecsElapsed();
    m_samples.clear();
    m_windowBytes = 0;
}

qint64 RateLimiter::speedLimit() const
{
    QMutexLocker locker(&m_mutex);
    return m_limit;
}

void RateLimiter::setSpeedLimit(qint64 bytesPerSecond)
{
    const qint64 limit = qMax<qint64>(0, bytesPerSecond);
    {
        QMutexLocker locker(&m_mutex);
        m_limit = limit;
        m_tokens = static_cast<double>(m_limit);
        m_lastRefillNs = m_clock.nsecsElapsed();
        m_samples.clear();
        m_windowBytes = 0;
        m_wakeup.wakeAll();
    }
    emit speedLimitChanged();
}

double RateLimiter::availableTokens() const
{
    QMutexLocker locker(&m_mutex);
    refillLocked();
    return m_tokens;
}

qint64 RateLimiter::totalGranted() const
{
    QMutexLocker locker(&m_mutex);
    return m_totalGranted;
}
