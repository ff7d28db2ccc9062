module;
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QString>
#include <QStringList>
#include <QUrl>

module ferry.utils.url_utils;

namespace ferry::utils {

bool isWebUrl(const QUrl& url)
{
    const QString scheme = url.scheme().toLower();
    return scheme == QStringLiteral("http") || scheme == QStringLiteral("https");
}

QUrl locationFromInput(const QString& input)
{
    const QString trimmed = input.trimmed();
    if (trimmed.isEmpty()) return QUrl();

    static const QStringList schemes = { "http", "https", "file", "data", "qrc" };
    const int colon = trimmed.indexOf(':');
    if (colon > 1 && schemes.contains(trimmed.left(colon).toLower())) {
        return QUrl(trimmed);
    }
    return QUrl::fromLocalFile(QDir::current().absoluteFilePath(trimmed));
}

QString trimTrailingSlash(const QString& path)
{
    QString out = path.trimmed();
    while (out.endsWith('/')) out.chop(1);
    return out;
}

QUrl resolveAssetUrl(const QString& localPath, const QString& src)
{
    const QString base = trimTrailingSlash(localPath);
    if (base.isEmpty()) return locationFromInput(src);

    QString relative = src.trimmed();
    while (relative.startsWith('/')) relative.remove(0, 1);
    return locationFromInput(base + '/' + relative);
}

QString fileNameFromUrl(const QUrl& url, int index)
{
    const QString base = url.isValid() && url.scheme() != QStringLiteral("data")
        ? QFileInfo(url.path()).fileName()
        : QString();
    if (!base.isEmpty()) return base;
    return QStringLiteral("resource-%1.bin").arg(index);
}

QString uniqueFilePath(const QString& path)
{
    if (path.isEmpty() || !QFile::exists(path)) return path;

    QFileInfo info(path);
    const QString base = info.completeBaseName();
    const QString suffix = info.completeSuffix();
    QDir dir(info.absolutePath());
    for (int i = 1; i < 10000; ++i) {
        const QString name = suffix.isEmpty()
            ? QString("%1 (%2)").arg(base).arg(i)
            : QString("%1 (%2).%3").arg(base).arg(i).arg(suffix);
        const QString candidate = dir.filePath(name);
        if (!QFile::exists(candidate)) return candidate;
    }
    return path;
}

} // namespace ferry::utils
