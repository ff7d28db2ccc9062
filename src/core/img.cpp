module;
#include <QBuffer>
#include <QByteArray>
#include <QDebug>
#include <QFuture>
#include <QImage>
#include <QImageReader>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QPointer>
#include <QString>
#include <QUrl>
#include <QVariant>

#include <exception>

module ferry.core.img;

import ferry.core.errors;
import ferry.core.futures;
import ferry.core.throttler;

namespace ferry {

Img::Img(const QUrl& source, const IoContext& context, QObject* parent)
    : Task(parent),
    m_source(source),
    m_context(context),
    m_retry(QStringLiteral("download image %1").arg(source.toString()), context.retryPolicy)
{
}

QFuture<QImage> Img::load()
{
    if (!m_context.isValid()) {
        return futures::rejected<QImage>(std::make_exception_ptr(
            UsageError(QStringLiteral("Cannot load image %1: no network manager or throttler").arg(m_source.toString()))));
    }

    QPointer<Img> self(this);
    return m_context.throttler->run<QImage>([self]() -> QFuture<QImage> {
        if (!self) {
            return futures::rejected<QImage>(std::make_exception_ptr(
                AbortError(QStringLiteral("Image task was destroyed before it started"))));
        }
        return self->m_retry.attempt<QImage>(self.data(), [self]() {
            return self->fetchOnce();
        });
    });
}

void Img::abort()
{
    if (m_complete || m_aborted) return;
    m_aborted = true;
    m_retry.abort();
    notifyProgress();
}

QFuture<QImage> Img::fetchOnce()
{
    if (m_aborted) {
        return futures::rejected<QImage>(std::make_exception_ptr(
            AbortError(QStringLiteral("Cannot load image %1 -- aborted.").arg(m_source.toString()))));
    }

    QNetworkRequest req(m_source);
    req.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                     QNetworkRequest::NoLessSafeRedirectPolicy);

    auto promise = futures::startedPromise<QImage>();
    QFuture<QImage> result = promise->future();

    QNetworkReply* reply = m_context.network->get(req);
    connect(reply, &QNetworkReply::finished, this, [this, reply, promise]() {
        reply->deleteLater();

        const QVariant statusAttr = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
        const int status = statusAttr.isValid() ? statusAttr.toInt() : 0;
        if (reply->error() != QNetworkReply::NoError || (status != 0 && status != 200)) {
            promise->setException(std::make_exception_ptr(
                TransferError(QStringLiteral("Failed to load image: %1 (%2)")
                                  .arg(m_source.toString(), reply->errorString()))));
            promise->finish();
            return;
        }

        QByteArray data = reply->readAll();
        QBuffer buffer(&data);
        buffer.open(QIODevice::ReadOnly);
        QImageReader reader(&buffer);
        const QImage image = reader.read();
        if (image.isNull()) {
            promise->setException(std::make_exception_ptr(
                DecodeError(QStringLiteral("Failed to load image: %1 (%2)")
                                .arg(m_source.toString(), reader.errorString()))));
            promise->finish();
            return;
        }

        m_complete = true;
        notifyProgress();
        promise->addResult(image);
        promise->finish();
    });
    return result;
}

} // namespace ferry
