#include "elux_model.h"

#include <QJsonArray>
#include <QJsonDocument>

namespace elux {

bool ApplianceDescriptor::isConnected() const
{
    return connectionState.compare(QLatin1String("connected"), Qt::CaseInsensitive) == 0;
}

QJsonObject ApplianceDescriptor::reportedProperties() const
{
    return raw.value(QStringLiteral("properties")).toObject().value(QStringLiteral("reported")).toObject();
}

Capabilities Capabilities::unsupported()
{
    Capabilities caps;
    caps.m_state = State::Unsupported;
    return caps;
}

Capabilities Capabilities::known(const QJsonObject &document)
{
    Capabilities caps;
    caps.m_state = State::Known;
    caps.m_document = document;
    return caps;
}

Capabilities Capabilities::fromJsonValue(const QJsonValue &value)
{
    if (value.isNull())
        return unsupported();
    if (value.isObject())
        return known(value.toObject());
    return {};
}

QJsonValue Capabilities::toJsonValue() const
{
    switch (m_state) {
    case State::Unsupported:
        return QJsonValue(QJsonValue::Null);
    case State::Known:
        return m_document;
    case State::Unknown:
        break;
    }
    return QJsonValue(QJsonValue::Undefined);
}

bool Capabilities::has(const QString &capability) const
{
    if (m_state != State::Known)
        return false;
    const QJsonObject nested = m_document.value(QStringLiteral("capabilities")).toObject();
    if (!nested.isEmpty())
        return nested.contains(capability);
    return m_document.contains(capability);
}

bool Capabilities::operator==(const Capabilities &other) const
{
    return m_state == other.m_state && m_document == other.m_document;
}

bool parseTokenGrant(const QByteArray &payload, TokenGrant *out, QString *error)
{
    const QJsonDocument doc = QJsonDocument::fromJson(payload);
    if (!doc.isObject()) {
        if (error)
            *error = QStringLiteral("Token response is not a JSON object");
        return false;
    }

    const QJsonObject obj = doc.object();
    TokenGrant grant;
    grant.accessToken = obj.value(QStringLiteral("accessToken")).toString().trimmed();
    grant.refreshToken = obj.value(QStringLiteral("refreshToken")).toString().trimmed();
    grant.expiresInSec = obj.value(QStringLiteral("expiresIn")).toVariant().toInt();

    if (grant.accessToken.isEmpty() || grant.refreshToken.isEmpty()) {
        if (error)
            *error = QStringLiteral("Token response is missing accessToken or refreshToken");
        return false;
    }

    if (out)
        *out = grant;
    return true;
}

ApplianceDescriptor descriptorFromJson(const QJsonObject &obj)
{
    ApplianceDescriptor descriptor;
    descriptor.applianceId = obj.value(QStringLiteral("applianceId")).toString().trimmed();
    descriptor.connectionState = obj.value(QStringLiteral("connectionState")).toString().trimmed();
    descriptor.raw = obj;

    const QJsonObject data = obj.value(QStringLiteral("applianceData")).toObject();
    descriptor.modelName = data.value(QStringLiteral("modelName")).toString().trimmed();

    QString name = data.value(QStringLiteral("applianceName")).toString().trimmed();
    if (name.isEmpty())
        name = obj.value(QStringLiteral("applianceName")).toString().trimmed();
    if (name.isEmpty())
        name = descriptor.applianceId;
    descriptor.displayName = name;

    return descriptor;
}

bool parseApplianceList(const QByteArray &payload, QList<ApplianceDescriptor> *out, QString *error)
{
    const QJsonDocument doc = QJsonDocument::fromJson(payload);

    QJsonArray entries;
    if (doc.isArray()) {
        entries = doc.array();
    } else if (doc.isObject() && doc.object().value(QStringLiteral("data")).isArray()) {
        entries = doc.object().value(QStringLiteral("data")).toArray();
    } else {
        if (error)
            *error = QStringLiteral("Appliance listing is not a JSON array");
        return false;
    }

    QList<ApplianceDescriptor> appliances;
    appliances.reserve(entries.size());
    for (const QJsonValue &entry : entries) {
        if (!entry.isObject())
            continue;
        ApplianceDescriptor descriptor = descriptorFromJson(entry.toObject());
        if (descriptor.applianceId.isEmpty())
            continue;
        appliances.push_back(descriptor);
    }

    if (out)
        *out = appliances;
    return true;
}

QString extractApiError(const QByteArray &payload)
{
    const QJsonDocument doc = QJsonDocument::fromJson(payload);
    if (!doc.isObject())
        return {};

    const QJsonObject obj = doc.object();
    for (const char *key : {"message", "detail", "error_description"}) {
        const QString text = obj.value(QLatin1String(key)).toString().trimmed();
        if (!text.isEmpty())
            return text;
    }

    const QJsonValue errorValue = obj.value(QStringLiteral("error"));
    if (errorValue.isString())
        return errorValue.toString().trimmed();
    if (errorValue.isObject())
        return errorValue.toObject().value(QStringLiteral("message")).toString().trimmed();

    return {};
}

} // namespace elux
