#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QList>
#include <QString>
#include <QtGlobal>

namespace elux {

struct Session {
    QString accessToken;
    QString refreshToken;
    qint64 expiresAtMs = 0; // 0 = unset
    QString regionalBaseUrl;

    bool hasTokens() const { return !accessToken.isEmpty() && !refreshToken.isEmpty(); }
};

// Result of a sign-in or refresh exchange.
struct TokenGrant {
    QString accessToken;
    QString refreshToken;
    int expiresInSec = 0;
};

struct ApplianceDescriptor {
    QString applianceId;
    QString modelName;
    QString displayName;
    QString connectionState;
    QJsonObject raw;

    bool isConnected() const;
    QJsonObject reportedProperties() const;
};

// Three-way capability classification. Unknown means "never fetched",
// Unsupported means the cloud had nothing to offer for this appliance.
class Capabilities
{
public:
    enum class State {
        Unknown,
        Unsupported,
        Known
    };

    Capabilities() = default;

    static Capabilities unsupported();
    static Capabilities known(const QJsonObject &document);

    // Host context encoding: undefined -> Unknown, null -> Unsupported,
    // object -> Known. Anything else is treated as Unknown so it gets refetched.
    static Capabilities fromJsonValue(const QJsonValue &value);
    QJsonValue toJsonValue() const;

    State state() const { return m_state; }
    bool isUnknown() const { return m_state == State::Unknown; }
    bool isUnsupported() const { return m_state == State::Unsupported; }
    bool isKnown() const { return m_state == State::Known; }
    const QJsonObject &document() const { return m_document; }

    bool has(const QString &capability) const;

    bool operator==(const Capabilities &other) const;
    bool operator!=(const Capabilities &other) const { return !(*this == other); }

private:
    State m_state = State::Unknown;
    QJsonObject m_document;
};

bool parseTokenGrant(const QByteArray &payload, TokenGrant *out, QString *error = nullptr);

ApplianceDescriptor descriptorFromJson(const QJsonObject &obj);
bool parseApplianceList(const QByteArray &payload, QList<ApplianceDescriptor> *out, QString *error = nullptr);

// Best-effort message from a structured API error body, empty if none.
QString extractApiError(const QByteArray &payload);

} // namespace elux
