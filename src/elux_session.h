#pragma once

#include <QMutex>
#include <QString>

#include "elux_model.h"

namespace elux {

class ApplianceClient;

// Owns the cloud session. Mutated only through signIn() and refresh();
// readers take a snapshot with session().
class TokenStore
{
public:
    explicit TokenStore(ApplianceClient &client);

    TokenStore(const TokenStore &) = delete;
    TokenStore &operator=(const TokenStore &) = delete;

    bool signIn(QString *error = nullptr);
    bool refresh(QString *error = nullptr);

    // Installs a pre-supplied refresh token. The access token is dropped so
    // the pair stays consistent until the next refresh.
    void seedRefreshToken(const QString &refreshToken);

    bool isExpired(qint64 nowMs) const;
    bool hasAccessToken() const;
    bool hasRefreshToken() const;
    Session session() const;

private:
    class ExchangeGuard;

    bool beginExchange(QString *error);
    void commit(const TokenGrant &grant, const QString *regionalBaseUrl);

    ApplianceClient &m_client;
    mutable QMutex m_mutex;
    Session m_session;
    bool m_exchangeInFlight = false;
};

} // namespace elux
