module;
#include <QByteArray>
#include <QDebug>
#include <QFuture>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QPointer>
#include <QPromise>
#include <QString>
#include <QUrl>
#include <QVariant>
#include <QtGlobal>

#include <exception>
#include <functional>

module ferry.core.request;

import ferry.core.errors;
import ferry.core.futures;
import ferry.core.throttler;
import ferry.utils.mime_utils;

namespace ferry {

Request::Request(const QUrl& url, const IoContext& context, QObject* parent)
    : Task(parent),
    m_url(url),
    m_context(context),
    m_retry(QStringLiteral("download %1").arg(url.toString()), context.retryPolicy)
{
}

Request::~Request()
{
    if (m_reply) {
        m_reply->disconnect(this);
        m_reply->abort();
        m_reply->deleteLater();
    }
}

Request* Request::ignoreErrors()
{
    m_ignoreErrors = true;
    return this;
}

QFuture<QByteArray> Request::loadBinary()
{
    return fetch();
}

QFuture<QString> Request::loadText()
{
    return futures::transform<QByteArray, QString>(this, fetch(), [](const QByteArray& body) {
        return QString::fromUtf8(body);
    });
}

QFuture<QJsonDocument> Request::loadJson()
{
    if (!m_started) m_deferCompletion = true;
    return futures::transform<QByteArray, QJsonDocument>(this, fetch(), [this](const QByteArray& body) {
        QJsonParseError parseError;
        QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
        if (parseError.error != QJsonParseError::NoError) {
            throw DecodeError(QStringLiteral("Invalid JSON from %1: %2")
                                  .arg(m_url.toString(), parseError.errorString()));
        }
        markLoaded();
        return doc;
    });
}

QFuture<Blob> Request::loadBlob()
{
    return futures::transform<QByteArray, Blob>(this, fetch(), [this](const QByteArray& body) {
        Blob blob;
        blob.data = body;
        blob.mimeType = m_contentType.isEmpty() ? utils::mimeTypeForUrl(m_url) : m_contentType;
        return blob;
    });
}

void Request::abort()
{
    if (m_complete || m_aborted) return;
    m_aborted = true;
    m_retry.abort();
    if (m_reply) {
        m_reply->abort();
    }
    notifyProgress();
}

QFuture<QByteArray> Request::fetch()
{
    if (!m_context.isValid()) {
        return futures::rejected<QByteArray>(std::make_exception_ptr(
            UsageError(QStringLiteral("Cannot download %1: no network manager or throttler").arg(m_url.toString()))));
    }
    if (m_started) {
        return futures::rejected<QByteArray>(std::make_exception_ptr(
            UsageError(QStringLiteral("Cannot download %1: request was already loaded").arg(m_url.toString()))));
    }
    m_started = true;

    QPointer<Request> self(this);
    return m_context.throttler->run<QByteArray>([self]() -> QFuture<QByteArray> {
        if (!self) {
            return futures::rejected<QByteArray>(std::make_exception_ptr(
                AbortError(QStringLiteral("Request was destroyed before it started"))));
        }
        return self->m_retry.attempt<QByteArray>(self.data(), [self]() {
            return self->transfer();
        });
    });
}

QFuture<QByteArray> Request::transfer()
{
    if (m_aborted) {
        return futures::rejected<QByteArray>(std::make_exception_ptr(
            AbortError(QStringLiteral("Cannot download %1 -- aborted.").arg(m_url.toString()))));
    }

    QNetworkRequest req(m_url);
    req.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                     QNetworkRequest::NoLessSafeRedirectPolicy);

    resetProgress();
    auto promise = futures::startedPromise<QByteArray>();
    QFuture<QByteArray> result = promise->future();

    QNetworkReply* reply = m_context.network->get(req);
    m_reply = reply;
    connect(reply, &QNetworkReply::downloadProgress, this, &Request::onDownloadProgress);
    connect(reply, &QNetworkReply::finished, this, [this, reply, promise]() {
        if (m_reply == reply) m_reply = nullptr;
        reply->deleteLater();
        settleReply(reply, *promise);
    });
    return result;
}

void Request::settleReply(QNetworkReply* reply, QPromise<QByteArray>& promise)
{
    const QNetworkReply::NetworkError err = reply->error();
    const QVariant statusAttr = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);

    if (err == QNetworkReply::OperationCanceledError) {
        m_retry.abort();
        promise.setException(std::make_exception_ptr(
            AbortError(QStringLiteral("Download of %1 was aborted").arg(m_url.toString()))));
        promise.finish();
        return;
    }

    if (!statusAttr.isValid() && err != QNetworkReply::NoError) {
        qWarning() << "GET error:" << m_url.toString() << reply->errorString();
        promise.setException(std::make_exception_ptr(
            TransferError(QStringLiteral("Failed to download %1: %2").arg(m_url.toString(), reply->errorString()))));
        promise.finish();
        return;
    }

    m_status = statusAttr.isValid() ? statusAttr.toInt() : 0;
    const bool statusOk = m_status == 0 || m_status == 200;

    if (m_ignoreErrors || (statusOk && err == QNetworkReply::NoError)) {
        const QByteArray body = reply->readAll();
        m_contentType = utils::normalizeContentType(reply->header(QNetworkRequest::ContentTypeHeader).toString());
        if (!m_deferCompletion) markLoaded();
        promise.addResult(body);
        promise.finish();
        return;
    }

    if (statusOk) {
        qWarning() << "GET error:" << m_url.toString() << reply->errorString();
        promise.setException(std::make_exception_ptr(
            TransferError(QStringLiteral("Failed to download %1: %2").arg(m_url.toString(), reply->errorString()))));
    } else {
        promise.setException(std::make_exception_ptr(
            HttpError(m_status, QStringLiteral("HTTP Error %1 while downloading %2").arg(m_status).arg(m_url.toString()))));
    }
    emit changed();
    promise.finish();
}

void Request::onDownloadProgress(qint64 received, qint64 total)
{
    if (m_complete) return;
    if (total > 0) {
        m_workComputable = true;
        m_totalWork = total;
        m_completedWork = qMin(received, total);
    } else {
        m_workComputable = false;
        m_totalWork = 0;
        m_completedWork = 0;
    }
    emit progress(received, total);
    notifyProgress();
}

void Request::markLoaded()
{
    m_complete = true;
    if (m_workComputable) {
        m_completedWork = m_totalWork;
    }
    notifyProgress();
}

void Request::resetProgress()
{
    m_workComputable = false;
    m_totalWork = 0;
    m_completedWork = 0;
}

} // namespace ferry
