/*!
 * @file        asset_manager.cppm
 * @brief       Named-resource fetch operations built atop the loading core.
 * @details     AssetManager is the seam through which the runtime obtains its
 *              global assets (fonts, binary resources such as soundbank files).
 *              FetchingAssetManager implements it with one Request per call,
 *              resolving each source against a configurable base path; tests
 *              and embedders may install their own implementation with
 *              setAssetManager().
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/ferry/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QFuture>
#include <QObject>
#include <QString>
#include <QUrl>

#ifndef Q_MOC_RUN
export module ferry.services.asset_manager;
import ferry.core.io_context;
import ferry.core.request;
import ferry.utils.blob_readers;
#endif

#ifdef Q_MOC_RUN
#define FERRY_MODULE_EXPORT
#else
#define FERRY_MODULE_EXPORT export
#endif

FERRY_MODULE_EXPORT namespace ferry {

/**
 * @brief Source of the runtime's global assets.
 */
class AssetManager {
public:
    virtual ~AssetManager() = default;

    /**
     * @brief Load a font file.
     * @param src Source relative to the configured base path.
     * @return Future resolving with the font data and its content type.
     */
    virtual QFuture<Blob> loadFont(const QString& src) = 0;

    /**
     * @brief Load a binary resource.
     * @param src Source relative to the configured base path.
     * @return Future resolving with the raw bytes.
     */
    virtual QFuture<QByteArray> loadBinaryResource(const QString& src) = 0;
};

//!< @brief Return the installed asset manager, or nullptr.
AssetManager* assetManager();

/**
 * @brief Install the process-wide asset manager.
 * @param manager Non-owning pointer; nullptr uninstalls.
 */
void setAssetManager(AssetManager* manager);

/**
 * @brief AssetManager downloading every asset with a Request.
 */
class FetchingAssetManager : public QObject, public AssetManager {

    Q_OBJECT

    //!< @brief Base path prepended to every source.
    Q_PROPERTY(QString localPath READ localPath WRITE setLocalPath NOTIFY localPathChanged)

public:
    /**
     * @brief Construct a fetching asset manager.
     * @param context Shared network manager, throttler and retry policy.
     * @param localPath Base path prepended to sources; may be empty.
     * @param parent Optional parent QObject.
     */
    explicit FetchingAssetManager(const IoContext& context,
                                  const QString& localPath = QString(),
                                  QObject* parent = nullptr);

    QFuture<Blob> loadFont(const QString& src) override;
    QFuture<QByteArray> loadBinaryResource(const QString& src) override;

    /**
     * @brief Resolve a source against the base path.
     * @param src Asset source.
     * @return URL the asset is downloaded from.
     */
    QUrl resolve(const QString& src) const;

    //!< @brief Return the base path.
    QString localPath() const { return m_localPath; }

    /**
     * @brief Change the base path; affects later loads only.
     * @param path New base path (trailing slashes are removed).
     */
    void setLocalPath(const QString& path);

signals:
    //!< @brief Emitted when the base path changes.
    void localPathChanged();

private:
    //!< @brief Create a request for a source, owned by this manager.
    Request* createRequest(const QString& src);

    //!< @brief Schedule deletion of a request once its future settles.
    template <typename T>
    QFuture<T> releaseWhenDone(Request* request, QFuture<T> future);

    IoContext m_context;    //!< Shared services.
    QString m_localPath;    //!< Base path.
};

} // namespace ferry

#include "asset_manager.moc"
