module;
#include <QObject>

module ferry.core.task;

namespace ferry {

Task::Task(QObject* parent)
    : QObject(parent)
{
}

Task::~Task() = default;

void Task::bindLoader(ProgressListener* loader)
{
    m_loader = loader;
}

void Task::notifyProgress()
{
    emit changed();
    if (m_loader) {
        m_loader->updateProgress();
    }
}

} // namespace ferry
