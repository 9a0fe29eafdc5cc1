#pragma once

#include <QJsonObject>
#include <QString>

namespace elux {

inline constexpr const char kDefaultApiBaseUrl[] = "https://api.developer.electrolux.one";
inline constexpr int kDefaultPollingIntervalSec = 10;
inline constexpr int kDefaultRequestTimeoutMs = 10000;

struct PlatformConfig {
    QString name = QStringLiteral("Electrolux");
    // Pre-supplied refresh token. When set the interactive sign-in is skipped.
    QString refreshToken;
    int pollingIntervalSec = kDefaultPollingIntervalSec;
    QString apiKey;
    QString clientId;
    QString clientSecret;
    QString apiBaseUrl = QString::fromLatin1(kDefaultApiBaseUrl);
    QString storagePath;
    int requestTimeoutMs = kDefaultRequestTimeoutMs;

    int pollingIntervalMs() const { return pollingIntervalSec * 1000; }

    static bool fromJson(const QJsonObject &obj, PlatformConfig *out, QString *error = nullptr);
    static bool fromFile(const QString &path, PlatformConfig *out, QString *error = nullptr);
};

} // namespace elux
