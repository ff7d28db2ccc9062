module;
#include <QSettings>
#include <QString>
#include <QUrl>

module ferry.services.io_config;

import ferry.utils.url_utils;

namespace ferry::services {

QString ioSettingsGroup()
{
    return QStringLiteral("io");
}

IoConfig loadIoConfig(QSettings& settings)
{
    IoConfig config;
    settings.beginGroup(ioSettingsGroup());
    config.localPath = utils::trimTrailingSlash(settings.value(QStringLiteral("localPath"), config.localPath).toString());
    config.fallbackOrigin = utils::trimTrailingSlash(settings.value(QStringLiteral("fallbackOrigin"), config.fallbackOrigin).toString());
    const int concurrent = settings.value(QStringLiteral("maxConcurrentTasks"), config.maxConcurrentTasks).toInt();
    const int attempts = settings.value(QStringLiteral("maxAttempts"), config.maxAttempts).toInt();
    settings.endGroup();

    if (concurrent >= 1) config.maxConcurrentTasks = concurrent;
    if (attempts >= 1) config.maxAttempts = attempts;
    return config;
}

IoConfig loadIoConfig()
{
    QSettings settings;
    return loadIoConfig(settings);
}

void saveIoConfig(QSettings& settings, const IoConfig& config)
{
    settings.beginGroup(ioSettingsGroup());
    settings.setValue(QStringLiteral("localPath"), config.localPath);
    settings.setValue(QStringLiteral("fallbackOrigin"), config.fallbackOrigin);
    settings.setValue(QStringLiteral("maxConcurrentTasks"), config.maxConcurrentTasks);
    settings.setValue(QStringLiteral("maxAttempts"), config.maxAttempts);
    settings.endGroup();
}

QString effectiveLocalPath(const IoConfig& config, const QUrl& hostUrl)
{
    const QString explicitPath = utils::trimTrailingSlash(config.localPath);
    if (!explicitPath.isEmpty() || hostUrl.isEmpty()) return explicitPath;
    if (!utils::isWebUrl(hostUrl)) return utils::trimTrailingSlash(config.fallbackOrigin);
    return QString();
}

RetryPolicy retryPolicyFor(const IoConfig& config)
{
    RetryPolicy policy;
    policy.maxAttempts = config.maxAttempts < 1 ? 1 : config.maxAttempts;
    return policy;
}

} // namespace ferry::services
