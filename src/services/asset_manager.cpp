module;
#include <QByteArray>
#include <QFuture>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QUrl>

module ferry.services.asset_manager;

import ferry.core.futures;
import ferry.utils.url_utils;

namespace ferry {

namespace {
AssetManager* g_assetManager = nullptr;
}

AssetManager* assetManager()
{
    return g_assetManager;
}

void setAssetManager(AssetManager* manager)
{
    g_assetManager = manager;
}

FetchingAssetManager::FetchingAssetManager(const IoContext& context,
                                           const QString& localPath,
                                           QObject* parent)
    : QObject(parent),
    m_context(context),
    m_localPath(utils::trimTrailingSlash(localPath))
{
}

QFuture<Blob> FetchingAssetManager::loadFont(const QString& src)
{
    Request* request = createRequest(src);
    return releaseWhenDone(request, request->loadBlob());
}

QFuture<QByteArray> FetchingAssetManager::loadBinaryResource(const QString& src)
{
    Request* request = createRequest(src);
    return releaseWhenDone(request, request->loadBinary());
}

QUrl FetchingAssetManager::resolve(const QString& src) const
{
    return utils::resolveAssetUrl(m_localPath, src);
}

void FetchingAssetManager::setLocalPath(const QString& path)
{
    const QString trimmed = utils::trimTrailingSlash(path);
    if (m_localPath == trimmed) return;
    m_localPath = trimmed;
    emit localPathChanged();
}

Request* FetchingAssetManager::createRequest(const QString& src)
{
    return new Request(resolve(src), m_context, this);
}

template <typename T>
QFuture<T> FetchingAssetManager::releaseWhenDone(Request* request, QFuture<T> future)
{
    QPointer<Request> guard(request);
    futures::whenFinished(this, future, [guard](QFuture<T>) {
        if (guard) guard->deleteLater();
    });
    return future;
}

} // namespace ferry
