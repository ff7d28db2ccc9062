// test_utils.cpp

#include <catch2/catch.hpp>

#include <QByteArray>
#include <QDir>
#include <QString>
#include <QTemporaryDir>
#include <QUrl>

#include "test_support.hpp"

import ferry.utils.blob_readers;
import ferry.utils.mime_utils;
import ferry.utils.url_utils;

using namespace ferry;

TEST_CASE("blob readers expose bytes, text and data URLs")
{
    const Blob text{ QByteArray("hi"), QStringLiteral("text/plain") };
    REQUIRE(utils::toBytes(text) == QByteArray("hi"));
    REQUIRE(utils::toText(text) == QStringLiteral("hi"));
    REQUIRE(utils::toDataUrl(text) == QStringLiteral("data:text/plain;base64,aGk="));

    const Blob untyped{ QByteArray("\x01\x02", 2), QString() };
    REQUIRE(utils::toDataUrl(untyped) == QStringLiteral("data:application/octet-stream;base64,AQI="));

    const Blob utf8{ QString::fromUtf8("h\xC3\xA9llo").toUtf8(), QStringLiteral("text/plain") };
    REQUIRE(utils::toText(utf8) == QString::fromUtf8("h\xC3\xA9llo"));
}

TEST_CASE("content types are inferred from the URL extension")
{
    REQUIRE(utils::mimeTypeForUrl(QUrl(QStringLiteral("https://x.org/a/sprite.PNG"))) == QStringLiteral("image/png"));
    REQUIRE(utils::mimeTypeForUrl(QUrl(QStringLiteral("file:///fonts/icons.woff2"))) == QStringLiteral("font/woff2"));
    REQUIRE(utils::mimeTypeForUrl(QUrl(QStringLiteral("https://x.org/project.json?v=2"))) == QStringLiteral("application/json"));
    REQUIRE(utils::mimeTypeForUrl(QUrl(QStringLiteral("https://x.org/blob"))) == QStringLiteral("application/octet-stream"));
    REQUIRE(utils::mimeTypeForUrl(QUrl(QStringLiteral("https://x.org/file.zzqqxx"))) == QStringLiteral("application/octet-stream"));
}

TEST_CASE("content type headers lose their parameters")
{
    REQUIRE(utils::normalizeContentType(QStringLiteral("Text/HTML; charset=utf-8")) == QStringLiteral("text/html"));
    REQUIRE(utils::normalizeContentType(QStringLiteral("image/png")) == QStringLiteral("image/png"));
    REQUIRE(utils::normalizeContentType(QString()).isEmpty());
}

TEST_CASE("input locations become URLs")
{
    REQUIRE(utils::locationFromInput(QStringLiteral("https://x.org/a.bin")) == QUrl(QStringLiteral("https://x.org/a.bin")));
    REQUIRE(utils::locationFromInput(QStringLiteral("data:,hello")).scheme() == QStringLiteral("data"));
    REQUIRE(utils::locationFromInput(QStringLiteral("assets/a.bin"))
            == QUrl::fromLocalFile(QDir::current().absoluteFilePath(QStringLiteral("assets/a.bin"))));
    REQUIRE(utils::locationFromInput(QStringLiteral("   ")).isEmpty());

    REQUIRE(utils::isWebUrl(QUrl(QStringLiteral("HTTP://x.org"))));
    REQUIRE_FALSE(utils::isWebUrl(QUrl(QStringLiteral("file:///x"))));
}

TEST_CASE("asset sources are joined to a base path")
{
    REQUIRE(utils::resolveAssetUrl(QStringLiteral("https://x.org//"), QStringLiteral("//a/b.ttf"))
            == QUrl(QStringLiteral("https://x.org/a/b.ttf")));
    REQUIRE(utils::resolveAssetUrl(QString(), QStringLiteral("https://y.org/c.sf2"))
            == QUrl(QStringLiteral("https://y.org/c.sf2")));
    REQUIRE(utils::trimTrailingSlash(QStringLiteral(" /srv/x/ ")) == QStringLiteral("/srv/x"));
}

TEST_CASE("output file names come from the URL path")
{
    REQUIRE(utils::fileNameFromUrl(QUrl(QStringLiteral("https://x.org/a/sprite.png?v=1")), 0) == QStringLiteral("sprite.png"));
    REQUIRE(utils::fileNameFromUrl(QUrl(QStringLiteral("https://x.org/")), 3) == QStringLiteral("resource-3.bin"));
    REQUIRE(utils::fileNameFromUrl(QUrl(QStringLiteral("data:text/plain,hi")), 1) == QStringLiteral("resource-1.bin"));
}

TEST_CASE("unique file paths never overwrite existing files")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath("sprite.png");
    REQUIRE(utils::uniqueFilePath(path) == path);

    REQUIRE(test::writeFile(path, "taken"));
    REQUIRE(utils::uniqueFilePath(path) == dir.filePath("sprite (1).png"));

    REQUIRE(test::writeFile(dir.filePath("sprite (1).png"), "taken too"));
    REQUIRE(utils::uniqueFilePath(path) == dir.filePath("sprite (2).png"));
}
