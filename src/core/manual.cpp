module;
#include <QObject>

module ferry.core.manual;

namespace ferry {

Manual::Manual(QObject* parent)
    : Task(parent)
{
}

void Manual::markComplete()
{
    if (m_complete) return;
    m_complete = true;
    notifyProgress();
}

void Manual::abort()
{
    if (m_complete || m_aborted) return;
    m_aborted = true;
    emit changed();
}

} // namespace ferry
