/*!
 * @file        loader.cppm
 * @brief       Aggregation of tasks into one observable progress value.
 * @details     A Loader registers tasks, binds itself as their progress
 *              listener and publishes completed/total through the
 *              progressChanged() signal. Progress counts tasks, not bytes.
 *
 *              Lifecycle flags:
 *              - aborted: every registered task was asked to abort and progress
 *                is pinned at 1.0
 *              - errored: the consumer reported a failure; progress
 *                notifications stop
 *
 *              Concrete loaders derive from TypedLoader<T> and implement load().
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/ferry/blob/main/LICENSE.md
 */

module;
#include <QFuture>
#include <QList>
#include <QObject>
#include <QPointer>

#include <type_traits>

#ifndef Q_MOC_RUN
export module ferry.core.loader;
import ferry.core.task;
#endif

#ifdef Q_MOC_RUN
#define FERRY_MODULE_EXPORT
#else
#define FERRY_MODULE_EXPORT export
#endif

FERRY_MODULE_EXPORT namespace ferry {

/**
 * @brief Progress aggregator over a set of tasks.
 *
 * Tasks without a QObject parent are adopted as children and live as long
 * as the loader. Registration order is preserved.
 */
class Loader : public QObject, public ProgressListener {

    Q_OBJECT

    //!< @brief Fraction of completed tasks, in [0, 1].
    Q_PROPERTY(double progress READ progress NOTIFY progressChanged)

public:
    /**
     * @brief Construct an empty loader.
     * @param parent Optional parent QObject.
     */
    explicit Loader(QObject* parent = nullptr);

    ~Loader() override;

    /**
     * @brief Register a task.
     *
     * The task is bound to this loader and, if it has no parent, adopted.
     * A task added after abort() is aborted right away.
     *
     * @param task Task to register.
     * @return The same task, for chaining.
     */
    template <typename T>
    T* addTask(T* task)
    {
        static_assert(std::is_base_of_v<Task, T>, "addTask() expects a ferry::Task");
        registerTask(task);
        return task;
    }

    //!< @brief Unbind and forget every task, then publish progress again.
    void resetTasks();

    //!< @brief Abort every registered task once and pin progress at 1.0.
    void abort();

    //!< @brief Unbind and forget every task. Idempotent.
    void cleanup();

    //!< @brief Publish the current progress unless the loader has errored.
    void updateProgress() override;

    //!< @brief Return 1.0 when aborted, 0 without tasks, completed/total otherwise.
    double progress() const;

    //!< @brief Stop progress notifications after a failure.
    void markErrored();

    //!< @brief Return whether markErrored() was called.
    bool hasErrored() const { return m_errored; }

    //!< @brief Return whether abort() was called.
    bool isAborted() const { return m_aborted; }

    //!< @brief Return the registered tasks that are still alive, in order.
    QList<Task*> tasks() const;

    //!< @brief Return the number of registered tasks that are still alive.
    int taskCount() const;

signals:
    /**
     * @brief Emitted whenever a task reports a change.
     * @param progress Current progress, in [0, 1].
     */
    void progressChanged(double progress);

private:
    //!< @brief Bind, adopt and store a task.
    void registerTask(Task* task);

    QList<QPointer<Task>> m_tasks;  //!< Registered tasks, in order.
    bool m_aborted = false;         //!< abort() was called.
    bool m_errored = false;         //!< markErrored() was called.
};

/**
 * @brief Loader producing a typed result.
 *
 * Implementations register their tasks and resolve the future once the
 * result is assembled.
 */
template <typename T>
class TypedLoader : public Loader {
public:
    using Loader::Loader;
    using ResultType = T;

    //!< @brief Start loading and resolve with the result.
    virtual QFuture<T> load() = 0;
};

} // namespace ferry

#include "loader.moc"
