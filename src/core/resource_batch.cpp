module;
#include <QByteArray>
#include <QDebug>
#include <QFuture>
#include <QList>
#include <QObject>
#include <QUrl>

#include <exception>
#include <memory>

module ferry.core.resource_batch;

import ferry.core.errors;
import ferry.core.futures;
import ferry.core.task;

namespace ferry {

namespace {

//!< @brief Collection state shared by the completion handlers of one load().
struct BatchState {
    QList<QByteArray> payloads;
    int remaining = 0;
    bool settled = false;
};

} // namespace

ResourceBatch::ResourceBatch(const IoContext& context, QObject* parent)
    : PayloadListLoader(parent),
    m_context(context)
{
}

Request* ResourceBatch::addResource(const QUrl& url, bool ignoreErrors)
{
    auto* request = new Request(url, m_context, this);
    if (ignoreErrors) request->ignoreErrors();
    return addTask(request);
}

QList<Request*> ResourceBatch::requests() const
{
    QList<Request*> out;
    for (Task* task : tasks()) {
        if (auto* request = qobject_cast<Request*>(task)) out.append(request);
    }
    return out;
}

QFuture<QList<QByteArray>> ResourceBatch::load()
{
    if (m_loaded) {
        return futures::rejected<QList<QByteArray>>(std::make_exception_ptr(
            UsageError(QStringLiteral("Resource batch was already loaded"))));
    }
    m_loaded = true;

    const QList<Request*> pending = requests();
    if (pending.isEmpty()) {
        updateProgress();
        return futures::resolved(QList<QByteArray>());
    }

    auto promise = futures::startedPromise<QList<QByteArray>>();
    QFuture<QList<QByteArray>> result = promise->future();

    auto state = std::make_shared<BatchState>();
    state->payloads.resize(pending.size());
    state->remaining = static_cast<int>(pending.size());

    for (int i = 0; i < pending.size(); ++i) {
        Request* request = pending.at(i);
        const QUrl url = request->url();
        futures::whenFinished(this, request->loadBinary(), [this, state, promise, i, url](QFuture<QByteArray> done) {
            if (state->settled) return;
            if (std::exception_ptr error = futures::failureOf(done)) {
                state->settled = true;
                markErrored();
                qWarning().noquote() << "Resource batch failed on" << url.toString() << ":" << describeError(error);
                promise->setException(error);
                promise->finish();
                return;
            }
            state->payloads[i] = done.result();
            if (--state->remaining == 0) {
                state->settled = true;
                promise->addResult(state->payloads);
                promise->finish();
            }
        });
    }
    return result;
}

} // namespace ferry
