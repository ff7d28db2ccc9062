// test_asset_manager.cpp

#include <catch2/catch.hpp>

#include <QByteArray>
#include <QDir>
#include <QFuture>
#include <QNetworkAccessManager>
#include <QNetworkProxy>
#include <QTemporaryDir>
#include <QUrl>

#include "test_support.hpp"

import ferry.core.errors;
import ferry.core.futures;
import ferry.core.io_context;
import ferry.core.request;
import ferry.core.throttler;
import ferry.services.asset_manager;
import ferry.utils.blob_readers;

#include "io_fixture.hpp"

using namespace ferry;

namespace {

class StaticAssetManager : public AssetManager {
public:
    QFuture<Blob> loadFont(const QString& src) override
    {
        return futures::resolved(Blob{ src.toUtf8(), QStringLiteral("font/ttf") });
    }

    QFuture<QByteArray> loadBinaryResource(const QString& src) override
    {
        return futures::resolved(src.toUtf8());
    }
};

} // namespace

TEST_CASE("sources are joined to the base path with a single slash")
{
    test::IoFixture io;
    FetchingAssetManager manager(io.context, QStringLiteral("https://assets.example.org/"));

    REQUIRE(manager.localPath() == QStringLiteral("https://assets.example.org"));
    REQUIRE(manager.resolve(QStringLiteral("/fonts/Scratch.ttf"))
            == QUrl(QStringLiteral("https://assets.example.org/fonts/Scratch.ttf")));
    REQUIRE(manager.resolve(QStringLiteral("sounds/bank.sf2"))
            == QUrl(QStringLiteral("https://assets.example.org/sounds/bank.sf2")));

    manager.setLocalPath(QString());
    REQUIRE(manager.resolve(QStringLiteral("fonts/a.ttf")) == QUrl::fromLocalFile(QDir::current().absoluteFilePath("fonts/a.ttf")));
}

TEST_CASE("binary resources and fonts are fetched from the base path")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    REQUIRE(QDir(dir.path()).mkpath("fonts"));
    REQUIRE(test::writeFile(dir.filePath("bank.bin"), QByteArray("\x00\x01\x02", 3)));
    REQUIRE(test::writeFile(dir.filePath("fonts/Knewave.ttf"), "ttf bytes"));

    test::IoFixture io;
    FetchingAssetManager manager(io.context, QUrl::fromLocalFile(dir.path()).toString());

    QFuture<QByteArray> bank = manager.loadBinaryResource(QStringLiteral("bank.bin"));
    QFuture<Blob> font = manager.loadFont(QStringLiteral("/fonts/Knewave.ttf"));

    REQUIRE(test::waitFor(bank));
    REQUIRE(test::waitFor(font));
    REQUIRE(bank.result() == QByteArray("\x00\x01\x02", 3));
    REQUIRE(font.result().data == QByteArray("ttf bytes"));
    REQUIRE(font.result().mimeType == QStringLiteral("font/ttf"));

    // requests are released once their loads settle
    REQUIRE(test::waitUntil([&manager]() { return manager.findChildren<Request*>().isEmpty(); }));
}

TEST_CASE("asset manager failures propagate to the caller")
{
    test::CannedHttpServer server;
    test::IoFixture io(2);
    FetchingAssetManager manager(io.context, server.url(QString()).toString());

    QFuture<QByteArray> missing = manager.loadBinaryResource(QStringLiteral("/missing.sf2"));
    REQUIRE(test::waitFor(missing));
    REQUIRE(test::failedWith<HttpError>(missing));
    REQUIRE(server.hits("/missing.sf2") == 2);
}

TEST_CASE("the process-wide asset manager can be replaced")
{
    StaticAssetManager replacement;
    AssetManager* previous = assetManager();

    setAssetManager(&replacement);
    REQUIRE(assetManager() == &replacement);

    QFuture<QByteArray> data = assetManager()->loadBinaryResource(QStringLiteral("abc"));
    REQUIRE(test::waitFor(data));
    REQUIRE(data.result() == QByteArray("abc"));

    setAssetManager(previous);
}
