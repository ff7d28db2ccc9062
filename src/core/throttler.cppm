/*!
 * @file        throttler.cppm
 * @brief       Bounded-concurrency executor for asynchronous operations.
 * @details     Runs at most maxConcurrent submitted operations at a time and
 *              queues the rest in submission order. Whenever a running
 *              operation settles (success, failure, cancellation or a
 *              synchronous throw) its slot is released and the next queued
 *              operation starts, so a failing operation never stalls the queue.
 *
 *              One instance is created at application start-up and handed by
 *              reference to every component issuing network or image work.
 *              Counters and queue are only touched from the owning thread's
 *              event loop; no locking is involved.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/ferry/blob/main/LICENSE.md
 */

module;
#include <QFuture>
#include <QObject>
#include <QPromise>
#include <QQueue>

#include <exception>
#include <functional>
#include <utility>

#ifndef Q_MOC_RUN
export module ferry.core.throttler;
import ferry.core.futures;
#endif

#ifdef Q_MOC_RUN
#define FERRY_MODULE_EXPORT
#else
#define FERRY_MODULE_EXPORT export
#endif

FERRY_MODULE_EXPORT namespace ferry {

/**
 * @brief Global concurrency limiter.
 *
 * Queued operations start in FIFO order relative to slots becoming free;
 * completion order is not guaranteed. Queued work cannot be prioritized or
 * withdrawn; destroying the throttler cancels the futures of queued work.
 */
class Throttler : public QObject {

    Q_OBJECT

    //!< @brief Maximum number of operations running at once.
    Q_PROPERTY(int maxConcurrent READ maxConcurrent WRITE setMaxConcurrent NOTIFY maxConcurrentChanged)

    //!< @brief Number of operations currently running.
    Q_PROPERTY(int activeCount READ activeCount NOTIFY countsChanged)

    //!< @brief Number of operations waiting for a slot.
    Q_PROPERTY(int pendingCount READ pendingCount NOTIFY countsChanged)

public:
    static constexpr int kDefaultMaxConcurrent = 20;

    /**
     * @brief Construct a throttler.
     * @param maxConcurrent Concurrency cap (clamped to at least 1).
     * @param parent Optional parent QObject.
     */
    explicit Throttler(int maxConcurrent = kDefaultMaxConcurrent, QObject* parent = nullptr);

    /**
     * @brief Run an operation once a slot is available.
     *
     * Starts the operation immediately when fewer than maxConcurrent
     * operations are running, otherwise queues it.
     *
     * @param operation Callable starting the work.
     * @return Future mirroring the operation's outcome.
     */
    template <typename T>
    QFuture<T> run(std::function<QFuture<T>()> operation);

    //!< @brief Return the concurrency cap.
    int maxConcurrent() const { return m_maxConcurrent; }

    /**
     * @brief Change the concurrency cap.
     *
     * Raising the cap starts queued operations immediately. Lowering it never
     * interrupts running operations; new ones wait until the count drops.
     *
     * @param value New cap (clamped to at least 1).
     */
    void setMaxConcurrent(int value);

    //!< @brief Return the number of running operations.
    int activeCount() const { return m_active; }

    //!< @brief Return the number of queued operations.
    int pendingCount() const { return static_cast<int>(m_pending.size()); }

signals:
    //!< @brief Emitted when the concurrency cap changes.
    void maxConcurrentChanged();

    //!< @brief Emitted when the running or queued counts change.
    void countsChanged();

private:
    /**
     * @brief Start a job now or append it to the queue.
     * @param job Closure starting the operation; must call release() when it settles.
     */
    void submit(std::function<void()> job);

    //!< @brief Free a slot and start the next queued job.
    void release();

    //!< @brief Start queued jobs while slots are free.
    void drain();

    int m_maxConcurrent = kDefaultMaxConcurrent;    //!< Concurrency cap.
    int m_active = 0;                               //!< Running operations.
    QQueue<std::function<void()>> m_pending;        //!< Jobs waiting for a slot.
};

template <typename T>
QFuture<T> Throttler::run(std::function<QFuture<T>()> operation)
{
    auto promise = futures::startedPromise<T>();
    QFuture<T> result = promise->future();

    submit([this, operation = std::move(operation), promise]() {
        QFuture<T> pending;
        try {
            pending = operation();
        } catch (...) {
            pending = futures::rejected<T>(std::current_exception());
        }
        futures::whenFinished(this, pending, [this, promise](QFuture<T> done) {
            release();
            futures::forward(done, *promise);
        });
    });
    return result;
}

} // namespace ferry

#include "throttler.moc"
