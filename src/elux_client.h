#pragma once

#include <QJsonObject>
#include <QList>
#include <QNetworkAccessManager>
#include <QString>

#include "elux_config.h"
#include "elux_http.h"
#include "elux_model.h"

namespace elux {

struct CapabilityLookup {
    bool ok = false;
    bool notFound = false;
    QJsonObject document;
    QString error;
};

// Cloud API used by the session, discovery and polling code.
class ApplianceClient
{
public:
    virtual ~ApplianceClient() = default;

    virtual QString baseUrl() const = 0;

    virtual bool signIn(TokenGrant *grant, QString *error = nullptr) = 0;
    virtual bool refresh(const QString &refreshToken, TokenGrant *grant, QString *error = nullptr) = 0;

    virtual bool listAppliances(const Session &session,
                                QList<ApplianceDescriptor> *out,
                                QString *error = nullptr) = 0;
    virtual CapabilityLookup getCapabilities(const QString &applianceId, const Session &session) = 0;
};

class ElectroluxApiClient final : public ApplianceClient
{
public:
    explicit ElectroluxApiClient(const PlatformConfig &config);

    QString baseUrl() const override;

    bool signIn(TokenGrant *grant, QString *error = nullptr) override;
    bool refresh(const QString &refreshToken, TokenGrant *grant, QString *error = nullptr) override;

    bool listAppliances(const Session &session,
                        QList<ApplianceDescriptor> *out,
                        QString *error = nullptr) override;
    CapabilityLookup getCapabilities(const QString &applianceId, const Session &session) override;

private:
    Endpoint endpoint(const Session *session = nullptr) const;
    bool exchangeToken(const QString &path, const QJsonObject &body, TokenGrant *grant, QString *error);

    static QString failureMessage(const HttpResult &result, const QString &fallback);

    PlatformConfig m_config;
    QNetworkAccessManager m_network;
    HttpClient m_http;
};

} // namespace elux
