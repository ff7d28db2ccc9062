/*!
 * @file        resource_batch.cppm
 * @brief       Loader downloading a list of URLs.
 * @details     Each added resource becomes a Request registered with the
 *              loader. load() starts every request at once (the Throttler
 *              decides how many actually run) and resolves with all payloads
 *              in registration order.
 *
 *              The first failure marks the loader errored and rejects the
 *              aggregate future; sibling requests keep running until they
 *              settle or the batch is aborted.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/ferry/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QFuture>
#include <QList>
#include <QObject>
#include <QUrl>

#ifndef Q_MOC_RUN
export module ferry.core.resource_batch;
import ferry.core.loader;
import ferry.core.request;
import ferry.core.io_context;
#endif

#ifdef Q_MOC_RUN
#define FERRY_MODULE_EXPORT
#else
#define FERRY_MODULE_EXPORT export
#endif

FERRY_MODULE_EXPORT namespace ferry {

//!< @brief Loader base resolving with one payload per resource.
using PayloadListLoader = TypedLoader<QList<QByteArray>>;

class ResourceBatch : public PayloadListLoader {

    Q_OBJECT

public:
    /**
     * @brief Construct an empty batch.
     * @param context Shared network manager, throttler and retry policy.
     * @param parent Optional parent QObject.
     */
    explicit ResourceBatch(const IoContext& context, QObject* parent = nullptr);

    /**
     * @brief Register a URL to download.
     * @param url Resource URL.
     * @param ignoreErrors Accept the body of any HTTP status.
     * @return The registered request, owned by the batch.
     */
    Request* addResource(const QUrl& url, bool ignoreErrors = false);

    //!< @brief Return the registered requests, in order.
    QList<Request*> requests() const;

    /**
     * @brief Start every request and collect their payloads.
     *
     * Rejects with UsageError when called a second time. An empty batch
     * resolves with an empty list.
     */
    QFuture<QList<QByteArray>> load() override;

private:
    IoContext m_context;    //!< Shared services handed to each request.
    bool m_loaded = false;  //!< load() was called.
};

} // namespace ferry

#include "resource_batch.moc"
