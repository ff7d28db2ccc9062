/*!
 * @file        mime_utils.cppm
 * @brief       Content-type inference for loaded payloads.
 * @details     Used when a transport reports no Content-Type (local files,
 *              some data: URLs) so that blobs still carry a meaningful type.
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
export module ferry.utils.mime_utils;
#endif

#ifdef Q_MOC_RUN
#define FERRY_MODULE_EXPORT
#else
#define FERRY_MODULE_EXPORT export
#endif

FERRY_MODULE_EXPORT namespace ferry::utils {

//!< @brief Content type used when nothing better is known.
inline constexpr const char* kDefaultContentType = "application/octet-stream";

/**
 * @brief Infers a content type from the extension of a URL path.
 *
 * A small table covers the asset types the loaders deal with most (fonts,
 * sounds, images, scripts); other extensions are looked up in QMimeDatabase.
 *
 * @param url Source URL.
 * @return Content type, or kDefaultContentType when unknown.
 */
QString mimeTypeForUrl(const QUrl& url);

/**
 * @brief Removes parameters from a Content-Type header value.
 *
 * "text/html; charset=utf-8" becomes "text/html".
 *
 * @param header Raw header value.
 * @return Lower-case media type, or an empty string.
 */
QString normalizeContentType(const QString& header);

} // namespace ferry::utils
