module;
#include <QFileInfo>
#include <QHash>
#include <QMimeDatabase>
#include <QMimeType>
#include <QString>
#include <QUrl>

module ferry.utils.mime_utils;

namespace ferry::utils {

QString mimeTypeForUrl(const QUrl& url)
{
    const QString ext = QFileInfo(url.path()).suffix().toLower();
    if (ext.isEmpty()) return QString::fromLatin1(kDefaultContentType);

    static const QHash<QString, QString> known = {
        { "html", "text/html" },
        { "css", "text/css" },
        { "js", "text/javascript" },
        { "json", "application/json" },
        { "md", "text/plain" },
        { "txt", "text/plain" },
        { "svg", "image/svg+xml" },
        { "ico", "image/vnd.microsoft.icon" },
        { "png", "image/png" },
        { "jpg", "image/jpeg" },
        { "jpeg", "image/jpeg" },
        { "gif", "image/gif" },
        { "wav", "audio/wav" },
        { "mp3", "audio/mpeg" },
        { "woff", "font/woff" },
        { "woff2", "font/woff2" },
        { "ttf", "font/ttf" },
        { "otf", "font/otf" }
    };
    const auto it = known.constFind(ext);
    if (it != known.constEnd()) return it.value();

    QMimeDatabase db;
    const QMimeType type = db.mimeTypeForFile(url.path(), QMimeDatabase::MatchExtension);
    if (!type.isValid() || type.isDefault()) return QString::fromLatin1(kDefaultContentType);
    return type.name();
}

QString normalizeContentType(const QString& header)
{
    QString value = header;
    const int semi = value.indexOf(';');
    if (semi >= 0) value = value.left(semi);
    return value.trimmed().toLower();
}

} // namespace ferry::utils
