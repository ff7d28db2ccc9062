// test_tasks.cpp

#include <catch2/catch.hpp>

#include <QFuture>
#include <QObject>
#include <QPromise>
#include <QString>

#include <exception>

#include "test_support.hpp"

import ferry.core.errors;
import ferry.core.futures;
import ferry.core.loader;
import ferry.core.manual;
import ferry.core.passthrough;
import ferry.core.task;

using namespace ferry;

TEST_CASE("manual task completes only when marked")
{
    Manual task;
    int changes = 0;
    QObject::connect(&task, &Task::changed, [&changes]() { ++changes; });

    REQUIRE_FALSE(task.isComplete());
    REQUIRE_FALSE(task.isWorkComputable());
    REQUIRE(task.totalWork() == 0);
    REQUIRE(task.completedWork() == 0);

    task.markComplete();
    REQUIRE(task.isComplete());
    REQUIRE(changes == 1);

    task.markComplete();
    REQUIRE(changes == 1);
}

TEST_CASE("manual task abort only records the request")
{
    Manual task;
    task.abort();
    REQUIRE(task.isAborted());
    REQUIRE_FALSE(task.isComplete());

    task.markComplete();
    REQUIRE(task.isComplete());

    Manual finished;
    finished.markComplete();
    finished.abort();
    REQUIRE_FALSE(finished.isAborted());
}

TEST_CASE("manual task notifies its bound loader")
{
    Loader loader;
    QList<double> published;
    QObject::connect(&loader, &Loader::progressChanged, [&published](double p) { published.append(p); });

    auto* task = loader.addTask(new Manual);
    REQUIRE(task->loader() == &loader);

    task->markComplete();
    REQUIRE(published == QList<double>{ 1.0 });
}

TEST_CASE("pass-through completes when its future succeeds")
{
    auto promise = futures::startedPromise<QString>();
    PromisePassThrough task(promise->future());

    REQUIRE_FALSE(task.isComplete());
    REQUIRE_FALSE(task.isWorkComputable());

    promise->addResult(QStringLiteral("done"));
    promise->finish();

    REQUIRE(test::waitUntil([&task]() { return task.isSettled(); }));
    REQUIRE(task.isComplete());
    REQUIRE(task.failureMessage().isEmpty());
}

TEST_CASE("pass-through stays incomplete when its future fails")
{
    PromisePassThrough task(futures::rejected<int>(
        std::make_exception_ptr(TransferError(QStringLiteral("network down")))));

    REQUIRE(test::waitUntil([&task]() { return task.isSettled(); }));
    REQUIRE_FALSE(task.isComplete());
    REQUIRE(task.failureMessage() == QStringLiteral("network down"));
}

TEST_CASE("pass-through accepts void futures and cancellation")
{
    auto done = futures::startedPromise<void>();
    PromisePassThrough succeeded(done->future());
    done->finish();

    auto dropped = futures::startedPromise<void>();
    PromisePassThrough canceled(dropped->future());
    dropped.reset();

    REQUIRE(test::waitUntil([&]() { return succeeded.isSettled() && canceled.isSettled(); }));
    REQUIRE(succeeded.isComplete());
    REQUIRE_FALSE(canceled.isComplete());
}

TEST_CASE("pass-through abort leaves the wrapped future running")
{
    auto promise = futures::startedPromise<int>();
    PromisePassThrough task(promise->future());

    task.abort();
    REQUIRE(task.isAborted());

    promise->addResult(1);
    promise->finish();
    REQUIRE(test::waitUntil([&task]() { return task.isSettled(); }));
    REQUIRE(task.isComplete());
}
