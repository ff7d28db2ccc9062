/*!
 * @file        io_context.cppm
 * @brief       Shared services handed to every network-backed task.
 * @details     Bundles the application-wide QNetworkAccessManager, the single
 *              Throttler and the retry policy. The context is created once at
 *              start-up and copied into each Request or Img; it holds
 *              non-owning pointers, so the network manager and the throttler
 *              must outlive every task built from it.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/ferry/blob/main/LICENSE.md
 */

module;
#include <QNetworkAccessManager>

#ifndef Q_MOC_RUN
export module ferry.core.io_context;
import ferry.core.retry;
import ferry.core.throttler;
#endif

#ifdef Q_MOC_RUN
#define FERRY_MODULE_EXPORT
#else
#define FERRY_MODULE_EXPORT export
#endif

FERRY_MODULE_EXPORT namespace ferry {

/**
 * @brief Non-owning handles to the shared I/O services.
 */
struct IoContext {
    //!< @brief Network access manager issuing every GET.
    QNetworkAccessManager* network = nullptr;

    //!< @brief Process-wide concurrency limiter.
    Throttler* throttler = nullptr;

    //!< @brief Retry policy applied to each task.
    RetryPolicy retryPolicy;

    //!< @brief Check that both services are present.
    bool isValid() const { return network != nullptr && throttler != nullptr; }
};

} // namespace ferry
