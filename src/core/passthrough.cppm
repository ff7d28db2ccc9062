/*!
 * @file        passthrough.cppm
 * @brief       Task mirroring an existing future.
 * @details     Lets any asynchronous operation that already produces a QFuture
 *              take part in loader progress. The task completes when the future
 *              finishes successfully; a failed or canceled future leaves it
 *              incomplete. No retries are attempted.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/ferry/blob/main/LICENSE.md
 */

module;
#include <QFuture>
#include <QObject>
#include <QString>
#include <QtGlobal>

#include <exception>

#ifndef Q_MOC_RUN
export module ferry.core.passthrough;
import ferry.core.task;
import ferry.core.futures;
#endif

#ifdef Q_MOC_RUN
#define FERRY_MODULE_EXPORT
#else
#define FERRY_MODULE_EXPORT export
#endif

FERRY_MODULE_EXPORT namespace ferry {

class PromisePassThrough : public Task {

    Q_OBJECT

public:
    /**
     * @brief Track a future of any result type.
     * @param future Observed future.
     * @param parent Optional parent QObject.
     */
    template <typename T>
    explicit PromisePassThrough(const QFuture<T>& future, QObject* parent = nullptr)
        : Task(parent)
    {
        futures::whenFinished(this, future, [this](QFuture<T> done) {
            settle(futures::failureOf(done));
        });
    }

    bool isComplete() const override { return m_complete; }
    bool isWorkComputable() const override { return false; }
    qint64 totalWork() const override { return 0; }
    qint64 completedWork() const override { return 0; }
    bool isAborted() const override { return m_aborted; }

    //!< @brief Only records the request; the wrapped future is left running.
    void abort() override;

    //!< @brief Return whether the wrapped future has finished.
    bool isSettled() const { return m_settled; }

    //!< @brief Return the failure description, empty on success or while pending.
    QString failureMessage() const { return m_failureMessage; }

private:
    /**
     * @brief Record the outcome of the wrapped future.
     * @param error Failure, or null on success.
     */
    void settle(const std::exception_ptr& error);

    bool m_complete = false;        //!< Future succeeded.
    bool m_aborted = false;         //!< abort() was called.
    bool m_settled = false;         //!< Future finished.
    QString m_failureMessage;       //!< Description of the failure.
};

} // namespace ferry

#include "passthrough.moc"
