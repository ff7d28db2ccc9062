#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFuture>
#include <QList>
#include <QNetworkAccessManager>
#include <QStringList>
#include <QUrl>

#include <exception>

import ferry.core.errors;
import ferry.core.futures;
import ferry.core.io_context;
import ferry.core.loader;
import ferry.core.request;
import ferry.core.resource_batch;
import ferry.core.throttler;
import ferry.services.io_config;
import ferry.utils.url_utils;

#ifndef APP_VERSION
#define APP_VERSION "0.1.0"
#endif

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

bool parsePositive(const QCommandLineParser& parser, const QCommandLineOption& option, int& out)
{
    if (!parser.isSet(option)) return true;
    bool ok = false;
    const int value = parser.value(option).toInt(&ok);
    if (!ok || value < 1) {
        qWarning().noquote() << QStringLiteral("Invalid value for --%1: %2")
                                    .arg(option.names().constFirst(), parser.value(option));
        return false;
    }
    out = value;
    return true;
}

QUrl sourceUrl(const QString& base, const QString& arg)
{
    // sources carrying their own scheme ignore the base path
    if (!base.isEmpty() && QUrl(arg).isRelative()) {
        return ferry::utils::resolveAssetUrl(base, arg);
    }
    return ferry::utils::locationFromInput(arg);
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Genyleap"));
    QCoreApplication::setApplicationName(QStringLiteral("Ferry"));
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Download resources with bounded concurrency and retries."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption maxConcurrentOption(QStringLiteral("max-concurrent"),
                                                 QStringLiteral("Maximum number of simultaneous downloads."),
                                                 QStringLiteral("N"));
    const QCommandLineOption attemptsOption(QStringLiteral("attempts"),
                                            QStringLiteral("Attempts per resource, including the first one."),
                                            QStringLiteral("N"));
    const QCommandLineOption localPathOption(QStringLiteral("local-path"),
                                             QStringLiteral("Base path prepended to relative sources."),
                                             QStringLiteral("P"));
    const QCommandLineOption ignoreErrorsOption(QStringLiteral("ignore-errors"),
                                                QStringLiteral("Accept the body of any HTTP status."));
    const QCommandLineOption hostOption(QStringLiteral("host"),
                                        QStringLiteral("Page the sources belong to; a non-web host without --local-path loads relative sources from the fallback origin."),
                                        QStringLiteral("URL"));
    const QCommandLineOption outputOption(QStringLiteral("output"),
                                          QStringLiteral("Directory receiving the downloaded files."),
                                          QStringLiteral("DIR"));
    parser.addOptions({ maxConcurrentOption, attemptsOption, localPathOption, hostOption, ignoreErrorsOption, outputOption });
    parser.addPositionalArgument(QStringLiteral("url"), QStringLiteral("Resources to download."), QStringLiteral("<url>..."));

    if (!parser.parse(QCoreApplication::arguments())) {
        qWarning().noquote() << parser.errorText();
        return kExitUsage;
    }
    if (parser.isSet(QStringLiteral("help"))) parser.showHelp(0);
    if (parser.isSet(QStringLiteral("version"))) parser.showVersion();

    ferry::IoConfig config = ferry::services::loadIoConfig();
    if (!parsePositive(parser, maxConcurrentOption, config.maxConcurrentTasks)) return kExitUsage;
    if (!parsePositive(parser, attemptsOption, config.maxAttempts)) return kExitUsage;
    if (parser.isSet(localPathOption)) config.localPath = parser.value(localPathOption);

    const QStringList sources = parser.positionalArguments();
    if (sources.isEmpty()) {
        qWarning().noquote() << "No resource given.";
        qWarning().noquote() << parser.helpText();
        return kExitUsage;
    }

    const QString outputDir = parser.value(outputOption);
    if (!outputDir.isEmpty() && !QDir().mkpath(outputDir)) {
        qWarning().noquote() << "Cannot create output directory" << outputDir;
        return kExitFailure;
    }

    QNetworkAccessManager network;
    ferry::Throttler throttler(config.maxConcurrentTasks);

    ferry::IoContext context;
    context.network = &network;
    context.throttler = &throttler;
    context.retryPolicy = ferry::services::retryPolicyFor(config);

    const QUrl hostUrl = parser.isSet(hostOption) ? ferry::utils::locationFromInput(parser.value(hostOption)) : QUrl();
    const QString base = ferry::services::effectiveLocalPath(config, hostUrl);
    ferry::ResourceBatch batch(context);
    for (const QString& source : sources) {
        batch.addResource(sourceUrl(base, source), parser.isSet(ignoreErrorsOption));
    }

    int lastPercent = -1;
    QObject::connect(&batch, &ferry::Loader::progressChanged, &app, [&lastPercent](double progress) {
        const int percent = static_cast<int>(progress * 100.0);
        if (percent == lastPercent) return;
        lastPercent = percent;
        qInfo().noquote() << QStringLiteral("Progress: %1%").arg(percent);
    });

    ferry::futures::whenFinished(&app, batch.load(), [&](QFuture<QList<QByteArray>> done) {
        if (std::exception_ptr error = ferry::futures::failureOf(done)) {
            qWarning().noquote() << "Download failed:" << ferry::describeError(error);
            QCoreApplication::exit(kExitFailure);
            return;
        }

        const QList<QByteArray> payloads = done.result();
        const QList<ferry::Request*> requests = batch.requests();
        int code = 0;
        for (int i = 0; i < payloads.size() && i < requests.size(); ++i) {
            const QUrl url = requests.at(i)->url();
            if (outputDir.isEmpty()) {
                qInfo().noquote() << url.toString() << payloads.at(i).size() << "bytes";
                continue;
            }
            const QString path = ferry::utils::uniqueFilePath(
                QDir(outputDir).filePath(ferry::utils::fileNameFromUrl(url, i)));
            QFile file(path);
            if (!file.open(QIODevice::WriteOnly) || file.write(payloads.at(i)) != payloads.at(i).size()) {
                qWarning().noquote() << "Cannot write" << path << ":" << file.errorString();
                code = kExitFailure;
                continue;
            }
            qInfo().noquote() << url.toString() << "->" << path;
        }
        QCoreApplication::exit(code);
    });

    return app.exec();
}
