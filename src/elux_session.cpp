#include "elux_session.h"

#include <QDateTime>
#include <QMutexLocker>

#include "elux_client.h"
#include "elux_logging.h"

namespace elux {

// Clears the in-flight flag on every exit path of an exchange.
class TokenStore::ExchangeGuard
{
public:
    explicit ExchangeGuard(TokenStore &store)
        : m_store(store)
    {
    }

    ~ExchangeGuard()
    {
        QMutexLocker locker(&m_store.m_mutex);
        m_store.m_exchangeInFlight = false;
    }

private:
    TokenStore &m_store;
};

TokenStore::TokenStore(ApplianceClient &client)
    : m_client(client)
{
}

bool TokenStore::beginExchange(QString *error)
{
    QMutexLocker locker(&m_mutex);
    if (m_exchangeInFlight) {
        if (error)
            *error = QStringLiteral("Token exchange already in progress");
        return false;
    }
    m_exchangeInFlight = true;
    return true;
}

void TokenStore::commit(const TokenGrant &grant, const QString *regionalBaseUrl)
{
    QMutexLocker locker(&m_mutex);
    m_session.accessToken = grant.accessToken;
    m_session.refreshToken = grant.refreshToken;
    m_session.expiresAtMs = grant.expiresInSec > 0
        ? QDateTime::currentMSecsSinceEpoch() + qint64(grant.expiresInSec) * 1000
        : 0;
    if (regionalBaseUrl)
        m_session.regionalBaseUrl = *regionalBaseUrl;
}

bool TokenStore::signIn(QString *error)
{
    if (!beginExchange(error))
        return false;
    ExchangeGuard guard(*this);

    qCInfo(eluxSessionLog) << "Signing in to the appliance cloud";

    TokenGrant grant;
    QString exchangeError;
    if (!m_client.signIn(&grant, &exchangeError)) {
        if (error)
            *error = exchangeError;
        return false;
    }

    const QString baseUrl = m_client.baseUrl();
    commit(grant, &baseUrl);
    qCInfo(eluxSessionLog) << "Signed in, token valid for" << grant.expiresInSec << "s";
    return true;
}

bool TokenStore::refresh(QString *error)
{
    QString refreshToken;
    {
        QMutexLocker locker(&m_mutex);
        refreshToken = m_session.refreshToken;
    }
    if (refreshToken.isEmpty())
        return true;

    if (!beginExchange(error))
        return false;
    ExchangeGuard guard(*this);

    qCInfo(eluxSessionLog) << "Refreshing access token...";

    TokenGrant grant;
    QString exchangeError;
    if (!m_client.refresh(refreshToken, &grant, &exchangeError)) {
        if (error)
            *error = exchangeError;
        return false;
    }

    {
        QMutexLocker locker(&m_mutex);
        if (m_session.regionalBaseUrl.isEmpty())
            m_session.regionalBaseUrl = m_client.baseUrl();
    }
    commit(grant, nullptr);
    qCInfo(eluxSessionLog) << "Access token refreshed!";
    return true;
}

void TokenStore::seedRefreshToken(const QString &refreshToken)
{
    QMutexLocker locker(&m_mutex);
    m_session.accessToken.clear();
    m_session.refreshToken = refreshToken.trimmed();
    m_session.expiresAtMs = 0;
}

bool TokenStore::isExpired(qint64 nowMs) const
{
    QMutexLocker locker(&m_mutex);
    return m_session.expiresAtMs == 0 || nowMs >= m_session.expiresAtMs;
}

bool TokenStore::hasAccessToken() const
{
    QMutexLocker locker(&m_mutex);
    return !m_session.accessToken.isEmpty();
}

bool TokenStore::hasRefreshToken() const
{
    QMutexLocker locker(&m_mutex);
    return !m_session.refreshToken.isEmpty();
}

Session TokenStore::session() const
{
    QMutexLocker locker(&m_mutex);
    return m_session;
}

} // namespace elux
