module;
#include <QDebug>
#include <QObject>
#include <QQueue>
#include <QtGlobal>

#include <functional>
#include <utility>

module ferry.core.throttler;

namespace ferry {

Throttler::Throttler(int maxConcurrent, QObject* parent)
    : QObject(parent),
    m_maxConcurrent(qMax(1, maxConcurrent))
{
}

void Throttler::setMaxConcurrent(int value)
{
    if (value < 1) value = 1;
    if (m_maxConcurrent == value) return;
    m_maxConcurrent = value;
    emit maxConcurrentChanged();
    drain();
}

void Throttler::submit(std::function<void()> job)
{
    if (m_active < m_maxConcurrent) {
        ++m_active;
        emit countsChanged();
        job();
        return;
    }
    m_pending.enqueue(std::move(job));
    qDebug() << "Throttler: queued operation," << m_pending.size() << "waiting," << m_active << "running";
    emit countsChanged();
}

void Throttler::release()
{
    if (m_active > 0) --m_active;
    emit countsChanged();
    drain();
}

void Throttler::drain()
{
    while (!m_pending.isEmpty() && m_active < m_maxConcurrent) {
        std::function<void()> job = m_pending.dequeue();
        ++m_active;
        emit countsChanged();
        job();
    }
}

} // namespace ferry
