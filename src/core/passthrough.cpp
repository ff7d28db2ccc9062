module;
#include <QDebug>
#include <QObject>
#include <QString>

#include <exception>

module ferry.core.passthrough;

import ferry.core.errors;

namespace ferry {

void PromisePassThrough::abort()
{
    if (m_complete || m_aborted) return;
    m_aborted = true;
    emit changed();
}

void PromisePassThrough::settle(const std::exception_ptr& error)
{
    m_settled = true;
    if (error) {
        m_failureMessage = describeError(error);
        qDebug() << "Pass-through task failed:" << m_failureMessage;
        emit changed();
        return;
    }
    m_complete = true;
    notifyProgress();
}

} // namespace ferry
