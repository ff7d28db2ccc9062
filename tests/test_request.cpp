// test_request.cpp

#include <catch2/catch.hpp>

#include <QByteArray>
#include <QDir>
#include <QFuture>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkProxy>
#include <QString>
#include <QTemporaryDir>
#include <QUrl>

#include "test_support.hpp"

import ferry.core.errors;
import ferry.core.futures;
import ferry.core.io_context;
import ferry.core.request;
import ferry.core.throttler;
import ferry.utils.blob_readers;

#include "io_fixture.hpp"

using namespace ferry;

TEST_CASE("request reads a local file as text")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    REQUIRE(test::writeFile(dir.filePath("hello.txt"), "hello, ferry"));

    test::IoFixture io;
    Request request(QUrl::fromLocalFile(dir.filePath("hello.txt")), io.context);
    QFuture<QString> text = request.loadText();

    REQUIRE(test::waitFor(text));
    REQUIRE(text.result() == QStringLiteral("hello, ferry"));
    REQUIRE(request.isComplete());
    REQUIRE(request.status() == 0);
    if (request.isWorkComputable()) {
        REQUIRE(request.completedWork() == request.totalWork());
    }
}

TEST_CASE("request decodes data URLs")
{
    test::IoFixture io;
    Request request(QUrl(QStringLiteral("data:text/plain;base64,aGk=")), io.context);
    QFuture<QString> text = request.loadText();

    REQUIRE(test::waitFor(text));
    REQUIRE(text.result() == QStringLiteral("hi"));
}

TEST_CASE("request downloads over HTTP and tracks byte progress")
{
    test::CannedHttpServer server;
    REQUIRE(server.isListening());
    const QByteArray payload(4096, 'x');
    server.route("/payload.bin", test::CannedResponse{ 200, payload, "application/x-test" });

    test::IoFixture io;
    Request request(server.url("/payload.bin"), io.context);
    QFuture<QByteArray> body = request.loadBinary();

    REQUIRE(test::waitFor(body));
    REQUIRE(body.result() == payload);
    REQUIRE(request.status() == 200);
    REQUIRE(request.contentType() == QStringLiteral("application/x-test"));
    REQUIRE(request.isComplete());
    REQUIRE(request.isWorkComputable());
    REQUIRE(request.totalWork() == payload.size());
    REQUIRE(request.completedWork() == payload.size());
    REQUIRE(server.hits("/payload.bin") == 1);
}

TEST_CASE("request retries an HTTP error and surfaces its status")
{
    test::CannedHttpServer server;
    test::IoFixture io(3);

    Request request(server.url("/missing"), io.context);
    QFuture<QByteArray> body = request.loadBinary();

    REQUIRE(test::waitFor(body));
    REQUIRE(server.hits("/missing") == 3);
    REQUIRE(request.attempts() == 3);
    REQUIRE_FALSE(request.isComplete());
    REQUIRE(request.status() == 404);

    try {
        body.waitForFinished();
        FAIL("expected an HttpError");
    } catch (const HttpError& e) {
        REQUIRE(e.status() == 404);
        REQUIRE(e.message().contains(QStringLiteral("HTTP Error 404")));
    }
}

TEST_CASE("request recovers when a later attempt succeeds")
{
    test::CannedHttpServer server;
    server.route("/flaky", QList<test::CannedResponse>{
        test::CannedResponse{ 500, "oops", "text/plain" },
        test::CannedResponse{ 200, "finally", "text/plain" } });

    test::IoFixture io(4);
    Request request(server.url("/flaky"), io.context);
    QFuture<QString> text = request.loadText();

    REQUIRE(test::waitFor(text));
    REQUIRE(text.result() == QStringLiteral("finally"));
    REQUIRE(server.hits("/flaky") == 2);
    REQUIRE(request.attempts() == 2);
}

TEST_CASE("ignoreErrors accepts the body of any status")
{
    test::CannedHttpServer server;
    server.route("/gone", test::CannedResponse{ 410, "tombstone", "text/plain" });

    test::IoFixture io;
    Request request(server.url("/gone"), io.context);
    REQUIRE(request.ignoreErrors() == &request);
    QFuture<QString> text = request.loadText();

    REQUIRE(test::waitFor(text));
    REQUIRE(text.result() == QStringLiteral("tombstone"));
    REQUIRE(request.status() == 410);
    REQUIRE(server.hits("/gone") == 1);
}

TEST_CASE("a missing local file is a transfer error")
{
    QTemporaryDir dir;
    test::IoFixture io(2);

    Request request(QUrl::fromLocalFile(dir.filePath("nope.bin")), io.context);
    request.ignoreErrors();
    QFuture<QByteArray> body = request.loadBinary();

    REQUIRE(test::waitFor(body));
    REQUIRE(test::failedWith<TransferError>(body));
    REQUIRE(request.attempts() == 2);
}

TEST_CASE("invalid JSON is a decode error and is not retried")
{
    test::CannedHttpServer server;
    server.route("/broken.json", test::CannedResponse{ 200, "{ not json", "application/json" });
    server.route("/ok.json", test::CannedResponse{ 200, "{\"name\":\"ferry\"}", "application/json" });

    test::IoFixture io(4);
    Request broken(server.url("/broken.json"), io.context);
    Request ok(server.url("/ok.json"), io.context);
    QFuture<QJsonDocument> bad = broken.loadJson();
    QFuture<QJsonDocument> good = ok.loadJson();

    REQUIRE(test::waitFor(bad));
    REQUIRE(test::waitFor(good));
    REQUIRE(test::failedWith<DecodeError>(bad));
    REQUIRE(server.hits("/broken.json") == 1);
    REQUIRE(good.result().object().value(QStringLiteral("name")).toString() == QStringLiteral("ferry"));

    // only the parsed document counts as loaded
    REQUIRE_FALSE(broken.isComplete());
    REQUIRE(ok.isComplete());
}

TEST_CASE("blobs carry the reported or inferred content type")
{
    test::CannedHttpServer server;
    server.route("/font", test::CannedResponse{ 200, "glyphs", "font/woff2; charset=binary" });

    QTemporaryDir dir;
    REQUIRE(test::writeFile(dir.filePath("icons.woff2"), "local glyphs"));

    test::IoFixture io;
    Request remote(server.url("/font"), io.context);
    Request local(QUrl::fromLocalFile(dir.filePath("icons.woff2")), io.context);
    QFuture<Blob> remoteBlob = remote.loadBlob();
    QFuture<Blob> localBlob = local.loadBlob();

    REQUIRE(test::waitFor(remoteBlob));
    REQUIRE(test::waitFor(localBlob));
    REQUIRE(remoteBlob.result().mimeType == QStringLiteral("font/woff2"));
    REQUIRE(remoteBlob.result().data == QByteArray("glyphs"));
    REQUIRE(localBlob.result().mimeType == QStringLiteral("font/woff2"));
    REQUIRE(localBlob.result().data == QByteArray("local glyphs"));
}

TEST_CASE("a request loads once")
{
    QTemporaryDir dir;
    REQUIRE(test::writeFile(dir.filePath("once.txt"), "once"));

    test::IoFixture io;
    Request request(QUrl::fromLocalFile(dir.filePath("once.txt")), io.context);
    QFuture<QByteArray> first = request.loadBinary();
    QFuture<QByteArray> second = request.loadBinary();

    REQUIRE(test::waitFor(first));
    REQUIRE(test::waitFor(second));
    REQUIRE(first.result() == QByteArray("once"));
    REQUIRE(test::failedWith<UsageError>(second));
}

TEST_CASE("a request without network services is a usage error")
{
    IoContext empty;
    Request request(QUrl(QStringLiteral("https://example.org/x")), empty);
    QFuture<QByteArray> body = request.loadBinary();

    REQUIRE(test::waitFor(body));
    REQUIRE(test::failedWith<UsageError>(body));
}

TEST_CASE("abort cancels an in-flight request without retrying")
{
    test::CannedHttpServer server;
    server.route("/slow", test::CannedResponse{ 200, {}, "text/plain", true });

    test::IoFixture io(4);
    Request request(server.url("/slow"), io.context);
    QFuture<QByteArray> body = request.loadBinary();

    REQUIRE(test::waitUntil([&server]() { return server.hits("/slow") == 1; }));
    request.abort();

    REQUIRE(test::waitFor(body));
    REQUIRE(test::failedWith<AbortError>(body));
    REQUIRE(request.isAborted());
    REQUIRE_FALSE(request.isComplete());
    REQUIRE(request.attempts() == 1);
    REQUIRE(server.hits("/slow") == 1);
}

TEST_CASE("abort during the backoff delay rejects with an abort error")
{
    test::CannedHttpServer server;
    server.route("/flaky", test::CannedResponse{ 500, "boom", "text/plain" });

    test::IoFixture io(4);
    io.context.retryPolicy.backoff = [](int) { return 500; };
    Request request(server.url("/flaky"), io.context);
    QFuture<QByteArray> body = request.loadBinary();

    REQUIRE(test::waitUntil([&request]() { return request.status() == 500; }));
    // let the retry layer observe the failure and start sleeping
    test::spin(50);
    REQUIRE(request.attempts() == 1);
    request.abort();

    REQUIRE(test::waitFor(body));
    REQUIRE(test::failedWith<AbortError>(body));
    REQUIRE(request.isAborted());
    REQUIRE(request.attempts() == 1);
    REQUIRE(server.hits("/flaky") == 1);
}

TEST_CASE("a request aborted while queued never reaches the network")
{
    test::CannedHttpServer server;
    server.route("/slow", test::CannedResponse{ 200, {}, "text/plain", true });
    server.route("/queued", test::CannedResponse{ 200, "late", "text/plain" });

    test::IoFixture io(4, 1);
    Request blocking(server.url("/slow"), io.context);
    Request queued(server.url("/queued"), io.context);
    QFuture<QByteArray> first = blocking.loadBinary();
    QFuture<QByteArray> second = queued.loadBinary();
    REQUIRE(io.throttler.pendingCount() == 1);

    queued.abort();
    blocking.abort();

    REQUIRE(test::waitFor(first));
    REQUIRE(test::waitFor(second));
    REQUIRE(test::failedWith<AbortError>(second));
    REQUIRE(server.hits("/queued") == 0);
    REQUIRE(io.throttler.activeCount() == 0);
}
