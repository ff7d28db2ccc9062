/*!
 * @file        request.cppm
 * @brief       Throttled, retried GET of a single URL.
 * @details     A Request downloads one URL through the shared
 *              QNetworkAccessManager and exposes the response in the
 *              representation chosen by the load call (bytes, UTF-8 text, a
 *              JSON document or a typed Blob).
 *
 *              Accepted responses:
 *              - status 0 (file:, qrc: and data: URLs report no HTTP status)
 *              - status 200
 *              - any HTTP status once ignoreErrors() was called
 *
 *              Transport failures without an HTTP status are always rejected.
 *              Every attempt runs inside the shared Throttler and the whole
 *              transfer is retried according to the context's RetryPolicy.
 *              Work is computable as soon as the transport reports a length.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/ferry/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QFuture>
#include <QJsonDocument>
#include <QNetworkReply>
#include <QObject>
#include <QPointer>
#include <QPromise>
#include <QString>
#include <QUrl>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module ferry.core.request;
import ferry.core.task;
import ferry.core.retry;
import ferry.core.io_context;
import ferry.utils.blob_readers;
#endif

#ifdef Q_MOC_RUN
#define FERRY_MODULE_EXPORT
#else
#define FERRY_MODULE_EXPORT export
#endif

FERRY_MODULE_EXPORT namespace ferry {

/**
 * @brief Network-backed task downloading one URL.
 *
 * A Request is loaded at most once; a second load call rejects with
 * UsageError. The Request must stay alive until its future settles;
 * destroying it earlier aborts the transfer and cancels the future.
 */
class Request : public Task {

    Q_OBJECT

    //!< @brief Requested URL.
    Q_PROPERTY(QUrl url READ url CONSTANT)

    //!< @brief Status of the last response (0 for non-HTTP URLs).
    Q_PROPERTY(int status READ status NOTIFY changed)

public:
    /**
     * @brief Construct a request.
     * @param url URL to download.
     * @param context Shared network manager, throttler and retry policy.
     * @param parent Optional parent QObject.
     */
    Request(const QUrl& url, const IoContext& context, QObject* parent = nullptr);

    ~Request() override;

    /**
     * @brief Accept the body of any HTTP response, whatever its status.
     * @return This request, for chaining.
     */
    Request* ignoreErrors();

    //!< @brief Return whether ignoreErrors() was called.
    bool ignoresErrors() const { return m_ignoreErrors; }

    //!< @brief Return the requested URL.
    QUrl url() const { return m_url; }

    //!< @brief Return the status of the last response, 0 if none.
    int status() const { return m_status; }

    //!< @brief Return the content type of the accepted response, without parameters.
    QString contentType() const { return m_contentType; }

    //!< @brief Return the number of attempts started so far.
    int attempts() const { return m_retry.attempts(); }

    //!< @brief Download the URL and resolve with the raw body.
    QFuture<QByteArray> loadBinary();

    //!< @brief Download the URL and resolve with the body decoded as UTF-8.
    QFuture<QString> loadText();

    /**
     * @brief Download the URL and parse the body as JSON.
     *
     * A parse failure rejects with DecodeError once the download has
     * succeeded; it does not trigger another attempt and the request
     * never becomes complete.
     */
    QFuture<QJsonDocument> loadJson();

    /**
     * @brief Download the URL and resolve with a typed Blob.
     *
     * The content type comes from the Content-Type header, or is inferred
     * from the URL path when the transport reports none.
     */
    QFuture<Blob> loadBlob();

    bool isComplete() const override { return m_complete; }
    bool isWorkComputable() const override { return m_workComputable; }
    qint64 totalWork() const override { return m_totalWork; }
    qint64 completedWork() const override { return m_completedWork; }
    bool isAborted() const override { return m_aborted; }

    /**
     * @brief Stop retrying and cancel the in-flight transfer.
     *
     * The pending load future rejects with AbortError. No-op once complete.
     */
    void abort() override;

signals:
    /**
     * @brief Raw transfer progress of the current attempt.
     * @param received Bytes received so far.
     * @param total Expected bytes, or -1/0 when unknown.
     */
    void progress(qint64 received, qint64 total);

private:
    //!< @brief Start the throttled, retried transfer (once).
    QFuture<QByteArray> fetch();

    //!< @brief Run a single attempt.
    QFuture<QByteArray> transfer();

    /**
     * @brief Settle an attempt from its finished reply.
     * @param reply Finished reply.
     * @param promise Promise of the attempt.
     */
    void settleReply(QNetworkReply* reply, QPromise<QByteArray>& promise);

    //!< @brief Track downloadProgress of the current reply.
    void onDownloadProgress(qint64 received, qint64 total);

    //!< @brief Forget the counters of a previous attempt.
    void resetProgress();

    //!< @brief Mark the load complete and report full progress.
    void markLoaded();

    QUrl m_url;                         //!< Requested URL.
    IoContext m_context;                //!< Shared services.
    Retry m_retry;                      //!< Retry state for the single load.
    QPointer<QNetworkReply> m_reply;    //!< Reply of the running attempt.
    bool m_ignoreErrors = false;        //!< Accept any HTTP status.
    bool m_started = false;             //!< A load call was made.
    bool m_complete = false;            //!< Accepted response received and decoded.
    bool m_deferCompletion = false;     //!< Completion waits for the body to decode.
    bool m_aborted = false;             //!< abort() was called.
    bool m_workComputable = false;      //!< Transport reported a length.
    qint64 m_totalWork = 0;             //!< Expected bytes.
    qint64 m_completedWork = 0;         //!< Received bytes.
    int m_status = 0;                   //!< Last HTTP status.
    QString m_contentType;              //!< Normalized Content-Type of the accepted response.
};

} // namespace ferry

#include "request.moc"
