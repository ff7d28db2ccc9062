module;
#include <QDebug>
#include <QList>
#include <QObject>
#include <QPointer>

#include <utility>

module ferry.core.loader;

namespace ferry {

Loader::Loader(QObject* parent)
    : QObject(parent)
{
}

Loader::~Loader()
{
    cleanup();
}

void Loader::registerTask(Task* task)
{
    if (!task) {
        qWarning() << "Loader: ignoring null task";
        return;
    }
    task->bindLoader(this);
    if (!task->parent()) {
        task->setParent(this);
    }
    m_tasks.append(task);
    if (m_aborted) {
        task->abort();
    }
}

void Loader::resetTasks()
{
    cleanup();
    updateProgress();
}

void Loader::abort()
{
    if (m_aborted) return;
    m_aborted = true;
    const QList<QPointer<Task>> snapshot = m_tasks;
    for (const QPointer<Task>& task : snapshot) {
        if (task) task->abort();
    }
    updateProgress();
}

void Loader::cleanup()
{
    for (const QPointer<Task>& task : std::as_const(m_tasks)) {
        if (task && task->loader() == this) {
            task->bindLoader(nullptr);
        }
    }
    m_tasks.clear();
}

void Loader::updateProgress()
{
    if (m_errored) return;
    emit progressChanged(progress());
}

double Loader::progress() const
{
    if (m_aborted) return 1.0;

    int total = 0;
    int completed = 0;
    for (const QPointer<Task>& task : m_tasks) {
        if (!task) continue;
        ++total;
        if (task->isComplete()) ++completed;
    }
    if (total == 0) return 0.0;
    return static_cast<double>(completed) / total;
}

void Loader::markErrored()
{
    m_errored = true;
}

QList<Task*> Loader::tasks() const
{
    QList<Task*> out;
    out.reserve(m_tasks.size());
    for (const QPointer<Task>& task : m_tasks) {
        if (task) out.append(task.data());
    }
    return out;
}

int Loader::taskCount() const
{
    return static_cast<int>(tasks().size());
}

} // namespace ferry
