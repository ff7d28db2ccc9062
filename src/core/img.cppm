/*!
 * @file        img.cppm
 * @brief       Throttled, retried image download and decode.
 * @details     Fetches an image source through the shared network manager and
 *              decodes it with QImageReader. A transfer or decode failure counts
 *              as a failed attempt and is retried with the context's policy.
 *              Image work is never computable; the task only reports completion.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/ferry/blob/main/LICENSE.md
 */

module;
#include <QFuture>
#include <QImage>
#include <QObject>
#include <QUrl>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module ferry.core.img;
import ferry.core.task;
import ferry.core.retry;
import ferry.core.io_context;
#endif

#ifdef Q_MOC_RUN
#define FERRY_MODULE_EXPORT
#else
#define FERRY_MODULE_EXPORT export
#endif

FERRY_MODULE_EXPORT namespace ferry {

/**
 * @brief Task loading one image.
 */
class Img : public Task {

    Q_OBJECT

    //!< @brief Image source locator.
    Q_PROPERTY(QUrl source READ source CONSTANT)

public:
    /**
     * @brief Construct an image task.
     * @param source Image URL.
     * @param context Shared network manager, throttler and retry policy.
     * @param parent Optional parent QObject.
     */
    Img(const QUrl& source, const IoContext& context, QObject* parent = nullptr);

    //!< @brief Return the image source.
    QUrl source() const { return m_source; }

    /**
     * @brief Fetch and decode the image.
     * @return Future resolving with the decoded image.
     */
    QFuture<QImage> load();

    //!< @brief Return the number of attempts started so far.
    int attempts() const { return m_retry.attempts(); }

    bool isComplete() const override { return m_complete; }
    bool isWorkComputable() const override { return false; }
    qint64 totalWork() const override { return 0; }
    qint64 completedWork() const override { return 0; }
    bool isAborted() const override { return m_aborted; }

    //!< @brief Stop retrying; a running fetch still finishes.
    void abort() override;

private:
    //!< @brief Fetch and decode once.
    QFuture<QImage> fetchOnce();

    QUrl m_source;              //!< Image source.
    IoContext m_context;        //!< Shared services.
    Retry m_retry;              //!< Retry state for the single load.
    bool m_complete = false;    //!< Image decoded.
    bool m_aborted = false;     //!< abort() was called.
};

} // namespace ferry

#include "img.moc"
