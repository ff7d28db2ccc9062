module;
#include <QByteArray>
#include <QString>

module ferry.utils.blob_readers;

import ferry.utils.mime_utils;

namespace ferry::utils {

QByteArray toBytes(const Blob& blob)
{
    return blob.data;
}

QString toText(const Blob& blob)
{
    return QString::fromUtf8(blob.data);
}

QString toDataUrl(const Blob& blob)
{
    const QString type = blob.mimeType.isEmpty()
        ? QString::fromLatin1(kDefaultContentType)
        : blob.mimeType;
    return QStringLiteral("data:%1;base64,%2")
        .arg(type, QString::fromLatin1(blob.data.toBase64()));
}

} // namespace ferry::utils
