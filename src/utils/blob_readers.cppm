/*!
 * @file        blob_readers.cppm
 * @brief       Typed payload container and its readers.
 * @details     A Blob pairs the raw bytes of a loaded resource with its content
 *              type. The readers convert it to the representations consumers
 *              typically need: raw bytes, UTF-8 text, or a base64 data: URL that
 *              can be handed to components expecting a URL (font faces, media).
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/ferry/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QString>

#ifndef Q_MOC_RUN
export module ferry.utils.blob_readers;
#endif

#ifdef Q_MOC_RUN
#define FERRY_MODULE_EXPORT
#else
#define FERRY_MODULE_EXPORT export
#endif

FERRY_MODULE_EXPORT namespace ferry {

/**
 * @brief Loaded payload with its content type.
 */
struct Blob {
    QByteArray data;    //!< Raw payload.
    QString mimeType;   //!< Content type, may be empty.

    //!< @brief Return the payload size in bytes.
    qsizetype size() const { return data.size(); }

    bool operator==(const Blob& other) const = default;
};

namespace utils {

//!< @brief Return the raw bytes of a blob.
QByteArray toBytes(const Blob& blob);

/**
 * @brief Decode a blob as UTF-8 text.
 * @param blob Source blob.
 * @return Decoded text; invalid sequences become replacement characters.
 */
QString toText(const Blob& blob);

/**
 * @brief Encode a blob as a base64 data: URL.
 *
 * An empty content type is written as application/octet-stream.
 *
 * @param blob Source blob.
 * @return "data:<type>;base64,<payload>".
 */
QString toDataUrl(const Blob& blob);

} // namespace utils

} // namespace ferry
