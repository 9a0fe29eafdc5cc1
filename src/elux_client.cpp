#include "elux_client.h"

#include <QJsonDocument>
#include <QUrl>

#include "elux_logging.h"

namespace elux {

ElectroluxApiClient::ElectroluxApiClient(const PlatformConfig &config)
    : m_config(config)
    , m_http(&m_network)
{
}

QString ElectroluxApiClient::baseUrl() const
{
    return m_config.apiBaseUrl;
}

Endpoint ElectroluxApiClient::endpoint(const Session *session) const
{
    Endpoint out;
    out.baseUrl = m_config.apiBaseUrl;
    if (session && !session->regionalBaseUrl.isEmpty())
        out.baseUrl = session->regionalBaseUrl;
    out.apiKey = m_config.apiKey;
    out.timeoutMs = m_config.requestTimeoutMs;
    if (session)
        out.bearerToken = session->accessToken;
    return out;
}

QString ElectroluxApiClient::failureMessage(const HttpResult &result, const QString &fallback)
{
    QString message = extractApiError(result.payload);
    if (message.isEmpty())
        message = result.error;
    if (message.isEmpty())
        message = fallback;
    return message;
}

bool ElectroluxApiClient::exchangeToken(const QString &path,
                                        const QJsonObject &body,
                                        TokenGrant *grant,
                                        QString *error)
{
    const HttpResult result = m_http.postJson(endpoint(),
                                              path,
                                              QJsonDocument(body).toJson(QJsonDocument::Compact));
    if (!result.ok) {
        if (error)
            *error = failureMessage(result, QStringLiteral("Token exchange failed"));
        return false;
    }

    return parseTokenGrant(result.payload, grant, error);
}

bool ElectroluxApiClient::signIn(TokenGrant *grant, QString *error)
{
    if (m_config.clientId.isEmpty() || m_config.clientSecret.isEmpty()) {
        if (error)
            *error = QStringLiteral("Sign-in requires clientId and clientSecret, or a refreshToken");
        return false;
    }

    QJsonObject body;
    body.insert(QStringLiteral("clientId"), m_config.clientId);
    body.insert(QStringLiteral("clientSecret"), m_config.clientSecret);
    return exchangeToken(QStringLiteral("/api/v1/token/login"), body, grant, error);
}

bool ElectroluxApiClient::refresh(const QString &refreshToken, TokenGrant *grant, QString *error)
{
    QJsonObject body;
    body.insert(QStringLiteral("grantType"), QStringLiteral("refresh_token"));
    body.insert(QStringLiteral("refreshToken"), refreshToken);
    return exchangeToken(QStringLiteral("/api/v1/token/refresh"), body, grant, error);
}

bool ElectroluxApiClient::listAppliances(const Session &session,
                                         QList<ApplianceDescriptor> *out,
                                         QString *error)
{
    const HttpResult result = m_http.get(endpoint(&session), QStringLiteral("/api/v1/appliances"));
    if (!result.ok) {
        if (error)
            *error = failureMessage(result, QStringLiteral("Failed to list appliances"));
        return false;
    }

    return parseApplianceList(result.payload, out, error);
}

CapabilityLookup ElectroluxApiClient::getCapabilities(const QString &applianceId, const Session &session)
{
    CapabilityLookup lookup;

    const QString path = QStringLiteral("/api/v1/appliances/%1/info")
                             .arg(QString::fromLatin1(QUrl::toPercentEncoding(applianceId)));
    const HttpResult result = m_http.get(endpoint(&session), path);
    if (!result.ok) {
        lookup.notFound = result.statusCode == 404;
        lookup.error = failureMessage(result, QStringLiteral("Failed to fetch appliance info"));
        qCDebug(eluxClientLog) << "capabilities lookup failed for" << applianceId
                               << "status:" << result.statusCode << lookup.error;
        return lookup;
    }

    const QJsonDocument doc = QJsonDocument::fromJson(result.payload);
    if (!doc.isObject()) {
        lookup.error = QStringLiteral("Appliance info for %1 is not a JSON object").arg(applianceId);
        return lookup;
    }

    lookup.ok = true;
    lookup.document = doc.object();
    return lookup;
}

} // namespace elux
