/*!
 * @file        errors.cppm
 * @brief       Failure taxonomy for asynchronous loads.
 * @details     Declares the exception types stored inside rejected futures
 *              produced by the loading core. Every type derives from LoadError
 *              so callers can handle all loading failures in one place, while
 *              the retry layer distinguishes cancellation (AbortError) and
 *              programmer errors (UsageError) from transient failures.
 *
 *              Exceptions travel through QPromise::setException and are
 *              rethrown by QFuture::waitForFinished() and QFuture::result().
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/ferry/blob/main/LICENSE.md
 */

module;
#include <QString>

#include <exception>
#include <stdexcept>

#ifndef Q_MOC_RUN
export module ferry.core.errors;
#endif

#ifdef Q_MOC_RUN
#define FERRY_MODULE_EXPORT
#else
#define FERRY_MODULE_EXPORT export
#endif

FERRY_MODULE_EXPORT namespace ferry {

/**
 * @brief Base class of every failure reported by the loading core.
 *
 * Keeps the original QString message next to the UTF-8 copy exposed
 * through std::exception::what().
 */
class LoadError : public std::runtime_error {
public:
    /**
     * @brief Construct a load error.
     * @param message Human-readable description.
     */
    explicit LoadError(const QString& message);

    //!< @brief Return the description as a QString.
    QString message() const { return m_message; }

private:
    QString m_message;  //!< Original message.
};

//!< @brief Transport failure without an HTTP status (DNS, refused, reset, missing file).
class TransferError : public LoadError {
public:
    using LoadError::LoadError;
};

/**
 * @brief The server answered with a status that is not accepted.
 */
class HttpError : public LoadError {
public:
    /**
     * @brief Construct an HTTP error.
     * @param status HTTP status code.
     * @param message Human-readable description.
     */
    HttpError(int status, const QString& message);

    //!< @brief Return the HTTP status code.
    int status() const { return m_status; }

private:
    int m_status = 0;  //!< HTTP status code.
};

//!< @brief Payload could not be decoded (image data, JSON document).
class DecodeError : public LoadError {
public:
    using LoadError::LoadError;
};

//!< @brief The operation was aborted or its future was canceled.
class AbortError : public LoadError {
public:
    using LoadError::LoadError;
};

//!< @brief An operation was used incorrectly; never retried.
class UsageError : public LoadError {
public:
    using LoadError::LoadError;
};

/**
 * @brief Produce a readable description of a captured exception.
 *
 * @param error Captured exception, may be null.
 * @return The LoadError message, the what() text, or a generic description.
 */
QString describeError(const std::exception_ptr& error);

/**
 * @brief Check whether a captured exception is an AbortError.
 * @param error Captured exception, may be null.
 * @return true if the exception is an AbortError.
 */
bool isAbortError(const std::exception_ptr& error);

/**
 * @brief Check whether another attempt may fix a captured exception.
 *
 * AbortError and UsageError are final; everything else is treated as transient.
 *
 * @param error Captured exception, may be null.
 * @return false for null, AbortError and UsageError.
 */
bool isRetryableError(const std::exception_ptr& error);

} // namespace ferry
