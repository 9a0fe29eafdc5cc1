#pragma once

#include <functional>

#include <QHash>
#include <QJsonObject>
#include <QList>
#include <QSet>
#include <QString>
#include <QStringList>

#include "elux_client.h"
#include "elux_model.h"

namespace elux::testing {

inline ApplianceDescriptor makeAppliance(const QString &id,
                                         const QString &model,
                                         const QString &name,
                                         const QJsonObject &reported = {})
{
    QJsonObject data;
    data.insert(QStringLiteral("applianceName"), name);
    data.insert(QStringLiteral("modelName"), model);

    QJsonObject properties;
    properties.insert(QStringLiteral("reported"), reported);

    QJsonObject raw;
    raw.insert(QStringLiteral("applianceId"), id);
    raw.insert(QStringLiteral("applianceData"), data);
    raw.insert(QStringLiteral("connectionState"), QStringLiteral("Connected"));
    raw.insert(QStringLiteral("properties"), properties);
    return descriptorFromJson(raw);
}

// Scripted cloud API with call counters.
class FakeApplianceClient final : public ApplianceClient
{
public:
    QString baseUrl() const override { return QStringLiteral("https://api.example.test"); }

    bool signIn(TokenGrant *grant, QString *error = nullptr) override
    {
        ++signInCalls;
        if (signInFails) {
            if (error)
                *error = QStringLiteral("sign-in rejected");
            return false;
        }
        if (grant)
            *grant = nextGrant();
        return true;
    }

    bool refresh(const QString &refreshToken, TokenGrant *grant, QString *error = nullptr) override
    {
        ++refreshCalls;
        refreshTokensSeen.push_back(refreshToken);
        if (onRefresh)
            onRefresh();
        if (refreshFails) {
            if (error)
                *error = QStringLiteral("refresh token revoked");
            return false;
        }
        if (grant)
            *grant = nextGrant();
        return true;
    }

    bool listAppliances(const Session &session,
                        QList<ApplianceDescriptor> *out,
                        QString *error = nullptr) override
    {
        ++listCalls;
        lastListToken = session.accessToken;
        if (onList)
            onList();
        if (listFailuresRemaining > 0) {
            --listFailuresRemaining;
            if (error)
                *error = QStringLiteral("service unavailable");
            return false;
        }
        if (out)
            *out = appliances;
        return true;
    }

    CapabilityLookup getCapabilities(const QString &applianceId, const Session &) override
    {
        ++capabilityCalls;
        capabilityRequests.push_back(applianceId);

        CapabilityLookup lookup;
        if (capabilityNotFound.contains(applianceId)) {
            lookup.notFound = true;
            lookup.error = QStringLiteral("Appliance not found");
            return lookup;
        }
        if (capabilityFailures.contains(applianceId)) {
            lookup.error = QStringLiteral("gateway timeout");
            return lookup;
        }

        lookup.ok = true;
        lookup.document = capabilityDocuments.value(applianceId, defaultCapabilities());
        return lookup;
    }

    static QJsonObject defaultCapabilities()
    {
        QJsonObject caps;
        caps.insert(QStringLiteral("Workmode"), QJsonObject());
        caps.insert(QStringLiteral("Fanspeed"), QJsonObject());
        QJsonObject doc;
        doc.insert(QStringLiteral("capabilities"), caps);
        return doc;
    }

    QList<ApplianceDescriptor> appliances;
    QHash<QString, QJsonObject> capabilityDocuments;
    QSet<QString> capabilityFailures;
    QSet<QString> capabilityNotFound;
    int listFailuresRemaining = 0;
    bool signInFails = false;
    bool refreshFails = false;
    int expiresInSec = 3600;
    std::function<void()> onRefresh;
    // Runs inside listAppliances(), where a real request would spin a nested event loop.
    std::function<void()> onList;

    int signInCalls = 0;
    int refreshCalls = 0;
    int listCalls = 0;
    int capabilityCalls = 0;
    QStringList refreshTokensSeen;
    QStringList capabilityRequests;
    QString lastListToken;

private:
    TokenGrant nextGrant()
    {
        ++m_grants;
        TokenGrant grant;
        grant.accessToken = QStringLiteral("access-%1").arg(m_grants);
        grant.refreshToken = QStringLiteral("refresh-%1").arg(m_grants);
        grant.expiresInSec = expiresInSec;
        return grant;
    }

    int m_grants = 0;
};

} // namespace elux::testing
