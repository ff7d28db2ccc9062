/*!
 * @file        io_config.cppm
 * @brief       Persisted configuration of the loading core.
 * @details     Reads and writes the "io" settings group through QSettings:
 *              - localPath: base prepended to asset sources
 *              - fallbackOrigin: base used when the hosting page is not served
 *                over http(s) and no explicit localPath is configured
 *              - maxConcurrentTasks: Throttler cap
 *              - maxAttempts: Retry attempt limit
 *
 *              Missing keys fall back to the defaults declared below.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/ferry/blob/main/LICENSE.md
 */

module;
#include <QSettings>
#include <QString>
#include <QUrl>

#ifndef Q_MOC_RUN
export module ferry.services.io_config;
import ferry.core.retry;
#endif

#ifdef Q_MOC_RUN
#define FERRY_MODULE_EXPORT
#else
#define FERRY_MODULE_EXPORT export
#endif

FERRY_MODULE_EXPORT namespace ferry {

/**
 * @brief I/O settings with their defaults.
 */
struct IoConfig {
    //!< @brief Explicit base path for asset sources; empty when unset.
    QString localPath;

    //!< @brief Base used for pages not served over http(s).
    QString fallbackOrigin = QStringLiteral("https://forkphorus.github.io");

    //!< @brief Throttler cap.
    int maxConcurrentTasks = 20;

    //!< @brief Attempts per task, including the first one.
    int maxAttempts = 4;
};

namespace services {

//!< @brief Name of the settings group holding the I/O keys.
QString ioSettingsGroup();

/**
 * @brief Read the configuration from the given settings.
 *
 * Numeric values below 1 are replaced by their defaults.
 *
 * @param settings Settings store.
 * @return Loaded configuration.
 */
IoConfig loadIoConfig(QSettings& settings);

//!< @brief Read the configuration from the application's default QSettings.
IoConfig loadIoConfig();

/**
 * @brief Write the configuration to the given settings.
 * @param settings Settings store.
 * @param config Configuration to persist.
 */
void saveIoConfig(QSettings& settings, const IoConfig& config);

/**
 * @brief Resolve the base path actually used for asset sources.
 *
 * An explicit localPath wins. Otherwise a host page served over anything
 * other than http(s) (for example file:) gets fallbackOrigin, and a web
 * host gets an empty base so sources resolve relative to it. Without a
 * host URL only localPath applies.
 *
 * @param config Configuration.
 * @param hostUrl Location of the hosting page or application; may be empty.
 * @return Base path without trailing slash.
 */
QString effectiveLocalPath(const IoConfig& config, const QUrl& hostUrl);

/**
 * @brief Build the retry policy described by the configuration.
 * @param config Configuration.
 * @return Policy with the configured attempt limit and the default backoff.
 */
RetryPolicy retryPolicyFor(const IoConfig& config);

} // namespace services

} // namespace ferry
