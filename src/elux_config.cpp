#include "elux_config.h"

#include <algorithm>

#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QUrl>

namespace elux {

namespace {

int readInt(const QJsonObject &obj, const QString &key, int fallback)
{
    if (!obj.contains(key))
        return fallback;
    bool ok = false;
    const int value = obj.value(key).toVariant().toInt(&ok);
    return ok ? value : fallback;
}

QString readString(const QJsonObject &obj, const QString &key, const QString &fallback = QString())
{
    const QJsonValue value = obj.value(key);
    if (!value.isString())
        return fallback;
    return value.toString().trimmed();
}

} // namespace

bool PlatformConfig::fromJson(const QJsonObject &obj, PlatformConfig *out, QString *error)
{
    if (!out) {
        if (error)
            *error = QStringLiteral("Config output is null");
        return false;
    }

    PlatformConfig config;
    config.name = readString(obj, QStringLiteral("name"), config.name);
    if (config.name.isEmpty())
        config.name = QStringLiteral("Electrolux");
    config.refreshToken = readString(obj, QStringLiteral("refreshToken"));
    config.apiKey = readString(obj, QStringLiteral("apiKey"));
    config.clientId = readString(obj, QStringLiteral("clientId"));
    config.clientSecret = readString(obj, QStringLiteral("clientSecret"));
    config.storagePath = readString(obj, QStringLiteral("storagePath"));
    if (config.storagePath.isEmpty())
        config.storagePath = QDir::homePath() + QStringLiteral("/.elux-bridge");

    // A zero or missing interval means "use the default", matching the host's config UI.
    const int interval = readInt(obj, QStringLiteral("pollingInterval"), kDefaultPollingIntervalSec);
    config.pollingIntervalSec = interval > 0 ? std::clamp(interval, 1, 3600) : kDefaultPollingIntervalSec;
    config.requestTimeoutMs = std::clamp(readInt(obj, QStringLiteral("requestTimeoutMs"), kDefaultRequestTimeoutMs),
                                         1000,
                                         120000);

    const QString baseUrl = readString(obj, QStringLiteral("apiBaseUrl"), config.apiBaseUrl);
    if (!baseUrl.isEmpty())
        config.apiBaseUrl = baseUrl;
    while (config.apiBaseUrl.endsWith(QLatin1Char('/')))
        config.apiBaseUrl.chop(1);

    const QUrl url(config.apiBaseUrl);
    if (!url.isValid() || url.host().isEmpty()
        || (url.scheme() != QLatin1String("https") && url.scheme() != QLatin1String("http"))) {
        if (error)
            *error = QStringLiteral("Invalid apiBaseUrl: %1").arg(config.apiBaseUrl);
        return false;
    }

    *out = config;
    if (error)
        error->clear();
    return true;
}

bool PlatformConfig::fromFile(const QString &path, PlatformConfig *out, QString *error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error)
            *error = QStringLiteral("Cannot open config %1: %2").arg(path, file.errorString());
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (!doc.isObject()) {
        if (error) {
            *error = parseError.error != QJsonParseError::NoError
                ? QStringLiteral("Config %1 is not valid JSON: %2").arg(path, parseError.errorString())
                : QStringLiteral("Config %1 is not a JSON object").arg(path);
        }
        return false;
    }

    return fromJson(doc.object(), out, error);
}

} // namespace elux
