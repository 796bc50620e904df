module;
#include <QMutexLocker>
#include <utility>

module rasta.core.progressbus;

ProgressBus::ProgressBus(int progressIntervalMs, QObject* parent)
    : QObject(parent),
    m_progressIntervalMs(qMax(0, progressIntervalMs))
{
    m_clock.start();
}

void ProgressBus::publish(const TransferEvent& event)
{
    {
        QMutexLocker locker(&m_mutex);
        m_lastProgress.insert(event.taskId, m_clock.elapsed());
    }
    emit eventPublished(event);
}

bool ProgressBus::publishProgress(const TransferEvent& event)
{
    {
        QMutexLocker locker(&m_mutex);
        const qint64 now = m_clock.elapsed();
        const auto it = m_lastProgress.constFind(event.taskId);
        if (it != m_lastProgress.constEnd() && now - it.value() < m_progressIntervalMs) {
            return false;
        }
        m_lastProgress.insert(event.taskId, now);
    }
    emit eventPublished(event);
    return true;
}

QMetaObject::Connection ProgressBus::subscribe(const QString& taskId,
                                               QObject* context,
                                               std::function<void(const TransferEvent&)> handler)
{
    return connect(this, &ProgressBus::eventPublished, context,
                   [taskId, fn = std::move(handler)](const TransferEvent& event) {
                       if (event.taskId == taskId) fn(event);
                   });
}

void ProgressBus::forget(const QString& taskId)
{
    QMutexLocker locker(&m_mutex);
    m_lastProgress.remove(taskId);
}

void ProgressBus::setProgressIntervalMs(int ms)
{
    ms = qMax(0, ms);
    if (m_progressIntervalMs == ms) return;
    m_progressIntervalMs = ms;
    emit progressIntervalChanged();
}
