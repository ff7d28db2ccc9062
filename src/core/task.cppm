/*!
 * @file        task.cppm
 * @brief       Capability contract shared by every loadable unit of work.
 * @details     A Task exposes completion, optional measurable work (total and
 *              completed units, usually bytes), abortability, and a
 *              non-owning back-reference to the loader that tracks it.
 *
 *              The back-reference is only used to push progress notifications;
 *              it never controls the task's lifecycle. Concrete kinds (Request,
 *              Img, Manual, PromisePassThrough) implement the contract directly
 *              and share no state beyond this binding.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/ferry/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module ferry.core.task;
#endif

#ifdef Q_MOC_RUN
#define FERRY_MODULE_EXPORT
#else
#define FERRY_MODULE_EXPORT export
#endif

FERRY_MODULE_EXPORT namespace ferry {

/**
 * @brief Receiver of task progress notifications.
 *
 * Implemented by Loader. Tasks call updateProgress() whenever their
 * completion state or work counters change.
 */
class ProgressListener {
public:
    virtual ~ProgressListener() = default;

    //!< @brief Recompute and publish aggregate progress.
    virtual void updateProgress() = 0;
};

/**
 * @brief Abstract unit of asynchronous work.
 *
 * Invariants every implementation keeps:
 * - if isWorkComputable() is false, totalWork() and completedWork() are 0
 * - if isComplete() and the work is computable, completedWork() == totalWork()
 * - abort() is idempotent and a no-op after completion
 */
class Task : public QObject {

    Q_OBJECT

    //!< @brief Whether the task has finished successfully.
    Q_PROPERTY(bool complete READ isComplete NOTIFY changed)

    //!< @brief Whether abort() has been requested.
    Q_PROPERTY(bool aborted READ isAborted NOTIFY changed)

public:
    /**
     * @brief Construct a task.
     * @param parent Optional parent QObject.
     */
    explicit Task(QObject* parent = nullptr);

    ~Task() override;

    //!< @brief Return whether the task is known to be complete.
    virtual bool isComplete() const = 0;

    //!< @brief Return whether totalWork() and completedWork() carry meaning.
    virtual bool isWorkComputable() const = 0;

    //!< @brief Return the total amount of work (0 if not computable).
    virtual qint64 totalWork() const = 0;

    //!< @brief Return the amount of work already performed (0 if not computable).
    virtual qint64 completedWork() const = 0;

    //!< @brief Return whether abort() has been requested.
    virtual bool isAborted() const = 0;

    //!< @brief Request cancellation of the task.
    virtual void abort() = 0;

    /**
     * @brief Bind the loader that receives progress notifications.
     *
     * Passing nullptr detaches the task; later state changes are then only
     * visible through the changed() signal.
     *
     * @param loader Non-owning listener, or nullptr.
     */
    void bindLoader(ProgressListener* loader);

    //!< @brief Return the bound listener, or nullptr.
    ProgressListener* loader() const { return m_loader; }

signals:
    //!< @brief Emitted whenever completion or work counters change.
    void changed();

protected:
    //!< @brief Emit changed() and notify the bound loader.
    void notifyProgress();

private:
    ProgressListener* m_loader = nullptr;   //!< Bound loader (non-owning).
};

} // namespace ferry

#include "task.moc"
