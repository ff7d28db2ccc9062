/*!
 * @file        retry.cppm
 * @brief       Bounded retry with exponential backoff and jitter.
 * @details     Wraps any fallible asynchronous operation (a callable returning
 *              QFuture<T>) and re-runs it on failure, up to a fixed number of
 *              attempts. Between attempts the wrapper waits on a QTimer for
 *              a delay chosen by the policy; the default grows exponentially
 *              with a multiplicative random factor and a fixed floor.
 *
 *              Abort requests are honoured before every retry decision and when
 *              a backoff delay elapses; an abort during the delay surfaces an
 *              AbortError. AbortError and UsageError failures are never retried.
 *              Aborting never cancels an operation that is already running;
 *              operations that support cancellation must do so themselves
 *              (see Request).
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/ferry/blob/main/LICENSE.md
 */

module;
#include <QDebug>
#include <QFuture>
#include <QObject>
#include <QPromise>
#include <QString>
#include <QTimer>
#include <QtGlobal>

#include <exception>
#include <functional>
#include <memory>
#include <utility>

#ifndef Q_MOC_RUN
export module ferry.core.retry;
import ferry.core.errors;
import ferry.core.futures;
#endif

#ifdef Q_MOC_RUN
#define FERRY_MODULE_EXPORT
#else
#define FERRY_MODULE_EXPORT export
#endif

FERRY_MODULE_EXPORT namespace ferry {

/**
 * @brief Default backoff delay for a failed attempt.
 *
 * Computes `2^attemptIndex * 500ms * uniform(0,1) + 50ms`.
 *
 * @param attemptIndex Zero-based index of the attempt that failed.
 * @return Delay in milliseconds, at least 50.
 */
int exponentialBackoff(int attemptIndex);

/**
 * @brief Retry configuration.
 */
struct RetryPolicy {
    //!< @brief Total number of attempts, including the first one.
    int maxAttempts = 4;

    //!< @brief Delay in milliseconds after the failed attempt with the given index.
    std::function<int(int)> backoff = exponentialBackoff;
};

namespace detail {

//!< @brief State shared between a Retry and the attempts it launched.
struct RetryState {
    bool aborted = false;   //!< Abort requested.
    bool used = false;      //!< attempt() already called.
    int attempt = 0;        //!< Attempts started so far.
};

/**
 * @brief One retried operation in flight.
 *
 * Kept alive by the callbacks it schedules on the context object; once
 * the context is destroyed the run is released and its future canceled.
 */
template <typename T>
class RetryRun : public std::enable_shared_from_this<RetryRun<T>> {
public:
    RetryRun(QObject* context,
             std::function<QFuture<T>()> operation,
             RetryPolicy policy,
             QString description,
             std::shared_ptr<RetryState> state)
        : m_context(context),
        m_operation(std::move(operation)),
        m_policy(std::move(policy)),
        m_description(std::move(description)),
        m_state(std::move(state))
    {
        m_promise.start();
    }

    QFuture<T> future() const { return m_promise.future(); }

    void launch(int index)
    {
        m_state->attempt = index + 1;
        QFuture<T> pending;
        try {
            pending = m_operation();
        } catch (...) {
            pending = futures::rejected<T>(std::current_exception());
        }
        auto self = this->shared_from_this();
        futures::whenFinished(m_context, pending, [self, index](QFuture<T> done) {
            self->settle(done, index);
        });
    }

private:
    void settle(const QFuture<T>& done, int index)
    {
        const std::exception_ptr error = futures::failureOf(done);
        if (!error) {
            futures::forward(done, m_promise);
            return;
        }
        if (m_state->aborted || !isRetryableError(error) || index + 1 >= m_policy.maxAttempts) {
            fail(error);
            return;
        }

        const int delay = m_policy.backoff ? qMax(0, m_policy.backoff(index)) : 0;
        qWarning().noquote() << QStringLiteral("Attempt #%1 to %2 failed, trying again in %3ms:")
                                    .arg(index + 1)
                                    .arg(m_description)
                                    .arg(delay)
                             << describeError(error);

        auto self = this->shared_from_this();
        QTimer::singleShot(delay, m_context, [self, index]() {
            // abort may arrive while sleeping
            if (self->m_state->aborted) {
                self->fail(std::make_exception_ptr(
                    AbortError(QStringLiteral("Cannot %1 -- aborted.").arg(self->m_description))));
                return;
            }
            self->launch(index + 1);
        });
    }

    void fail(const std::exception_ptr& error)
    {
        m_promise.setException(error);
        m_promise.finish();
    }

    QObject* m_context = nullptr;                   //!< Owner of callbacks and timers.
    std::function<QFuture<T>()> m_operation;        //!< Wrapped operation.
    RetryPolicy m_policy;                           //!< Attempt limit and backoff.
    QString m_description;                          //!< Used in warnings.
    std::shared_ptr<RetryState> m_state;            //!< Shared abort flag and counter.
    QPromise<T> m_promise;                          //!< Outcome reported to the caller.
};

} // namespace detail

/**
 * @brief Retry wrapper for a single fallible operation.
 *
 * A Retry is created per task and used for exactly one operation.
 * The last error is surfaced once all attempts failed; no delay follows
 * the final failure.
 */
class Retry {
public:
    /**
     * @brief Construct a retry wrapper.
     * @param description Short description used in warnings, e.g. "download <url>".
     * @param policy Attempt limit and backoff.
     */
    explicit Retry(const QString& description = QStringLiteral("complete task"),
                   RetryPolicy policy = {});

    /**
     * @brief Run an operation with retries.
     *
     * An operation that throws synchronously counts as a failed attempt.
     *
     * @param context Object owning the backoff timers and completion callbacks.
     * @param operation Callable producing one attempt.
     * @return Future resolving with the first successful result.
     */
    template <typename T>
    QFuture<T> attempt(QObject* context, std::function<QFuture<T>()> operation);

    //!< @brief Stop retrying; the next failure is surfaced immediately.
    void abort();

    //!< @brief Return whether abort() was called.
    bool isAborted() const;

    //!< @brief Return the number of attempts started so far.
    int attempts() const;

    //!< @brief Return the warning description.
    QString description() const { return m_description; }

    /**
     * @brief Set the warning description.
     * @param description Description text.
     */
    void setDescription(const QString& description);

    //!< @brief Return the policy.
    const RetryPolicy& policy() const { return m_policy; }

    /**
     * @brief Replace the policy; only affects operations started afterwards.
     * @param policy New policy.
     */
    void setPolicy(const RetryPolicy& policy);

private:
    QString m_description;                          //!< Warning description.
    RetryPolicy m_policy;                           //!< Attempt limit and backoff.
    std::shared_ptr<detail::RetryState> m_state;    //!< Shared with the running attempt.
};

template <typename T>
QFuture<T> Retry::attempt(QObject* context, std::function<QFuture<T>()> operation)
{
    if (!context || !operation) {
        return futures::rejected<T>(std::make_exception_ptr(
            UsageError(QStringLiteral("Retry to %1 needs a context object and an operation").arg(m_description))));
    }
    if (m_state->used) {
        return futures::rejected<T>(std::make_exception_ptr(
            UsageError(QStringLiteral("Retry to %1 was already used").arg(m_description))));
    }
    m_state->used = true;

    auto run = std::make_shared<detail::RetryRun<T>>(context, std::move(operation), m_policy, m_description, m_state);
    QFuture<T> future = run->future();
    run->launch(0);
    return future;
}

/**
 * @brief Run an operation with retries without keeping a Retry around.
 *
 * @param context Object owning the backoff timers and completion callbacks.
 * @param operation Callable producing one attempt.
 * @param policy Attempt limit and backoff.
 * @param description Short description used in warnings.
 * @return Future resolving with the first successful result.
 */
template <typename T>
QFuture<T> withRetry(QObject* context,
                     std::function<QFuture<T>()> operation,
                     const RetryPolicy& policy = {},
                     const QString& description = QStringLiteral("complete task"))
{
    Retry retry(description, policy);
    return retry.attempt<T>(context, std::move(operation));
}

} // namespace ferry
