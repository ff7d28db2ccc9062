/*!
 * @file        manual.cppm
 * @brief       Task completed explicitly by its owner.
 * @details     Used to represent work the loading core cannot observe by itself,
 *              for example a compilation step that runs after downloads. Never
 *              work-computable.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/ferry/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module ferry.core.manual;
import ferry.core.task;
#endif

#ifdef Q_MOC_RUN
#define FERRY_MODULE_EXPORT
#else
#define FERRY_MODULE_EXPORT export
#endif

FERRY_MODULE_EXPORT namespace ferry {

class Manual : public Task {

    Q_OBJECT

public:
    /**
     * @brief Construct an incomplete manual task.
     * @param parent Optional parent QObject.
     */
    explicit Manual(QObject* parent = nullptr);

    //!< @brief Mark the task complete and notify the loader. Idempotent.
    void markComplete();

    bool isComplete() const override { return m_complete; }
    bool isWorkComputable() const override { return false; }
    qint64 totalWork() const override { return 0; }
    qint64 completedWork() const override { return 0; }
    bool isAborted() const override { return m_aborted; }

    //!< @brief Only records the request; the owner decides what to do with it.
    void abort() override;

private:
    bool m_complete = false;
    bool m_aborted = false;
};

} // namespace ferry

#include "manual.moc"
