#pragma once

#include <QString>
#include <QByteArray>

class QNetworkAccessManager;
class QNetworkRequest;

namespace elux {

struct Endpoint {
    QString baseUrl;
    QString apiKey;
    QString bearerToken;
    int timeoutMs = 10000;
};

// error is prefixed with the method and path; statusCode is 0 when no HTTP
// response arrived (timeout, connection failure).
struct HttpResult {
    bool ok = false;
    int statusCode = 0;
    QByteArray payload;
    QString error;
};

class HttpClient
{
public:
    explicit HttpClient(QNetworkAccessManager *manager);

    HttpResult get(const Endpoint &endpoint, const QString &path) const;

    HttpResult postJson(const Endpoint &endpoint,
                        const QString &path,
                        const QByteArray &payload) const;

private:
    bool buildRequest(const Endpoint &endpoint,
                      const QString &path,
                      bool hasJsonBody,
                      QNetworkRequest *request,
                      QString *error = nullptr) const;

    enum class Method {
        Get,
        Post
    };

    HttpResult request(const Endpoint &endpoint,
                       Method method,
                       const QString &path,
                       const QByteArray &payload) const;

    QNetworkAccessManager *m_manager = nullptr;
};

} // namespace elux
