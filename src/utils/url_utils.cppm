/*!
 * @file        url_utils.cppm
 * @brief       Asset location helpers.
 * @details     Helpers for turning asset sources and command-line arguments into
 *              fetchable URLs, joining a configured base path with a relative
 *              source, and deriving local output file names from URLs.
 *
 *              All helpers are side-effect free except uniqueFilePath(), which
 *              inspects the filesystem.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/ferry/blob/main/LICENSE.md
 */

module;
#include <QString>
#include <QUrl>

#ifndef Q_MOC_RUN
export module ferry.utils.url_utils;
#endif

#ifdef Q_MOC_RUN
#define FERRY_MODULE_EXPORT
#else
#define FERRY_MODULE_EXPORT export
#endif

FERRY_MODULE_EXPORT namespace ferry::utils {

/**
 * @brief Checks whether a URL uses the http or https scheme.
 * @param url URL to inspect.
 * @return true for http/https URLs.
 */
bool isWebUrl(const QUrl& url);

/**
 * @brief Converts user input into a fetchable URL.
 *
 * Inputs carrying a known scheme (http, https, file, data, qrc) are parsed
 * as URLs; anything else is treated as a local path, resolved against the
 * current directory.
 *
 * @param input URL string or filesystem path.
 * @return Parsed URL (invalid if the input is empty).
 */
QUrl locationFromInput(const QString& input);

/**
 * @brief Joins a base path and an asset source.
 *
 * A trailing slash on the base and a leading slash on the source are merged
 * into one separator. With an empty base, the source is resolved like
 * locationFromInput().
 *
 * @param localPath Base path or origin, e.g. "https://example.org/assets".
 * @param src Asset source relative to the base.
 * @return Resolved URL.
 */
QUrl resolveAssetUrl(const QString& localPath, const QString& src);

/**
 * @brief Strips trailing slashes from a base path.
 * @param path Base path.
 * @return Path without trailing slashes.
 */
QString trimTrailingSlash(const QString& path);

/**
 * @brief Derives a file name from a URL.
 *
 * Uses the last path segment; falls back to "resource-<index>.bin" when
 * the URL has none (data: URLs, bare hosts).
 *
 * @param url Source URL.
 * @param index Position used in the fallback name.
 * @return File name without directory.
 */
QString fileNameFromUrl(const QUrl& url, int index);

/**
 * @brief Generates a unique file path if the given path already exists.
 *
 * Appends a numeric suffix to avoid overwriting existing files.
 *
 * @param path Desired file path.
 * @return A path that does not exist yet.
 */
QString uniqueFilePath(const QString& path);

} // namespace ferry::utils
