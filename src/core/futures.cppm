/*!
 * @file        futures.cppm
 * @brief       QFuture / QPromise helpers used by the loading core.
 * @details     Small building blocks shared by the retry wrapper, the throttler,
 *              the concrete tasks and the loaders:
 *              - ready and rejected futures
 *              - completion callbacks delivered on the event loop through
 *                QFutureWatcher, bound to a context object
 *              - extraction of a failure from a finished future
 *              - forwarding an outcome into another promise
 *              - mapping a value into another type
 *
 *              Callbacks are always delivered through the event loop of the
 *              context object's thread, never synchronously, so every
 *              suspension point of the core is an event loop turn.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/ferry/blob/main/LICENSE.md
 */

module;
#include <QFuture>
#include <QFutureWatcher>
#include <QObject>
#include <QPromise>
#include <QString>

#include <exception>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

#ifndef Q_MOC_RUN
export module ferry.core.futures;
import ferry.core.errors;
#endif

#ifdef Q_MOC_RUN
#define FERRY_MODULE_EXPORT
#else
#define FERRY_MODULE_EXPORT export
#endif

FERRY_MODULE_EXPORT namespace ferry::futures {

/**
 * @brief Create a promise that has already reported its start.
 *
 * Shared ownership lets the promise be captured by copyable callbacks.
 * Dropping the last reference before finish() cancels the future.
 */
template <typename T>
std::shared_ptr<QPromise<T>> startedPromise()
{
    auto promise = std::make_shared<QPromise<T>>();
    promise->start();
    return promise;
}

/**
 * @brief Return a future that already holds a value.
 * @param value Result value.
 */
template <typename T>
QFuture<T> resolved(T value)
{
    QPromise<T> promise;
    QFuture<T> future = promise.future();
    promise.start();
    promise.addResult(std::move(value));
    promise.finish();
    return future;
}

/**
 * @brief Return a future that already failed with the given exception.
 * @param error Captured exception.
 */
template <typename T>
QFuture<T> rejected(std::exception_ptr error)
{
    QPromise<T> promise;
    QFuture<T> future = promise.future();
    promise.start();
    promise.setException(error);
    promise.finish();
    return future;
}

/**
 * @brief Extract the failure of a finished future.
 *
 * Must only be called once the future is finished; waiting on an
 * unfinished future would block the event loop thread.
 *
 * A canceled future without a stored exception, or a non-void future that
 * finished without a result, is reported as an AbortError.
 *
 * @param done Finished future.
 * @return The stored exception, or null on success.
 */
template <typename T>
std::exception_ptr failureOf(QFuture<T> done)
{
    try {
        done.waitForFinished();
    } catch (...) {
        return std::current_exception();
    }
    if (done.isCanceled()) {
        return std::make_exception_ptr(AbortError(QStringLiteral("Operation was canceled")));
    }
    if constexpr (!std::is_void_v<T>) {
        if (done.resultCount() == 0) {
            return std::make_exception_ptr(AbortError(QStringLiteral("Operation finished without a result")));
        }
    }
    return nullptr;
}

/**
 * @brief Invoke a handler on the event loop once a future finishes.
 *
 * The watcher is parented to the context; if the context is destroyed first
 * the handler is never invoked and is released with the watcher.
 *
 * @param context Context object whose thread runs the handler.
 * @param future Observed future.
 * @param handler Callable taking the finished QFuture<T>.
 */
template <typename T, typename Handler>
void whenFinished(QObject* context, const QFuture<T>& future, Handler handler)
{
    auto* watcher = new QFutureWatcher<T>(context);
    QObject::connect(watcher, &QFutureWatcherBase::finished, context,
                     [watcher, handler = std::move(handler)]() mutable {
        handler(watcher->future());
        watcher->deleteLater();
    });
    watcher->setFuture(future);
}

/**
 * @brief Settle a promise with the outcome of a finished future.
 * @param done Finished future.
 * @param promise Promise to settle; finished on return.
 */
template <typename T>
void forward(const QFuture<T>& done, QPromise<T>& promise)
{
    if (std::exception_ptr error = failureOf(done)) {
        promise.setException(error);
    } else {
        if constexpr (!std::is_void_v<T>) {
            promise.addResult(done.result());
        }
    }
    promise.finish();
}

/**
 * @brief Map the value of a future into another type.
 *
 * Failures of the source propagate unchanged. An exception thrown by the
 * mapping function rejects the returned future.
 *
 * @param context Context object whose thread runs the mapping.
 * @param future Source future.
 * @param mapping Conversion applied to the source value.
 */
template <typename T, typename U>
QFuture<U> transform(QObject* context, const QFuture<T>& future, std::function<U(const T&)> mapping)
{
    auto promise = startedPromise<U>();
    QFuture<U> result = promise->future();
    whenFinished(context, future, [promise, mapping](QFuture<T> done) {
        if (std::exception_ptr error = failureOf(done)) {
            promise->setException(error);
        } else {
            try {
                promise->addResult(mapping(done.result()));
            } catch (...) {
                promise->setException(std::current_exception());
            }
        }
        promise->finish();
    });
    return result;
}

} // namespace ferry::futures
