#include "elux_http.h"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QScopeGuard>
#include <QTimer>
#include <QUrl>

namespace elux {

HttpClient::HttpClient(QNetworkAccessManager *manager)
    : m_manager(manager)
{
}

HttpResult HttpClient::get(const Endpoint &endpoint, const QString &path) const
{
    return request(endpoint, Method::Get, path, {});
}

HttpResult HttpClient::postJson(const Endpoint &endpoint,
                                const QString &path,
                                const QByteArray &payload) const
{
    return request(endpoint, Method::Post, path, payload);
}

bool HttpClient::buildRequest(const Endpoint &endpoint,
                              const QString &path,
                              bool hasJsonBody,
                              QNetworkRequest *request,
                              QString *error) const
{
    if (!request) {
        if (error)
            *error = QStringLiteral("Request object is null");
        return false;
    }

    QUrl url(endpoint.baseUrl.trimmed());
    if (!url.isValid() || url.host().isEmpty()) {
        if (error)
            *error = QStringLiteral("API base URL is invalid");
        return false;
    }

    QString fullPath = url.path();
    while (fullPath.endsWith(QLatin1Char('/')))
        fullPath.chop(1);
    if (!path.startsWith(QLatin1Char('/')))
        fullPath += QLatin1Char('/');
    fullPath += path;
    url.setPath(fullPath);

    QNetworkRequest out(url);
    out.setRawHeader("Accept", "application/json");
    out.setRawHeader("User-Agent", "elux-bridge/1.0");
    if (hasJsonBody)
        out.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    if (!endpoint.apiKey.isEmpty())
        out.setRawHeader("x-api-key", endpoint.apiKey.toUtf8());
    if (!endpoint.bearerToken.isEmpty())
        out.setRawHeader("Authorization", QByteArrayLiteral("Bearer ") + endpoint.bearerToken.toUtf8());

    *request = out;
    if (error)
        error->clear();
    return true;
}

HttpResult HttpClient::request(const Endpoint &endpoint,
                               Method method,
                               const QString &path,
                               const QByteArray &payload) const
{
    HttpResult result;
    const QString what = QStringLiteral("%1 %2")
                             .arg(method == Method::Get ? QStringLiteral("GET") : QStringLiteral("POST"), path);

    if (!m_manager) {
        result.error = what + QStringLiteral(": network manager unavailable");
        return result;
    }

    QNetworkRequest networkRequest;
    QString buildError;
    if (!buildRequest(endpoint, path, method == Method::Post, &networkRequest, &buildError)) {
        result.error = what + QStringLiteral(": ") + buildError;
        return result;
    }

    QNetworkReply *reply = method == Method::Get ? m_manager->get(networkRequest)
                                                 : m_manager->post(networkRequest, payload);
    if (!reply) {
        result.error = what + QStringLiteral(": request could not be created");
        return result;
    }
    const auto releaseReply = qScopeGuard([reply]() { reply->deleteLater(); });

    const int timeoutMs = endpoint.timeoutMs > 0 ? endpoint.timeoutMs : 10000;
    QTimer deadline;
    deadline.setSingleShot(true);
    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&deadline, &QTimer::timeout, reply, &QNetworkReply::abort);
    deadline.start(timeoutMs);
    if (!reply->isFinished())
        loop.exec();

    if (!deadline.isActive()) {
        result.error = what + QStringLiteral(": no response within %1 ms").arg(timeoutMs);
        return result;
    }
    deadline.stop();

    result.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    result.payload = reply->readAll();

    if (result.statusCode == 0) {
        result.error = what + QStringLiteral(": ") + reply->errorString();
        return result;
    }

    result.ok = result.statusCode >= 200 && result.statusCode < 300;
    if (!result.ok) {
        const QString reason = reply->attribute(QNetworkRequest::HttpReasonPhraseAttribute).toString();
        result.error = QStringLiteral("%1: HTTP %2").arg(what).arg(result.statusCode);
        if (!reason.isEmpty())
            result.error += QLatin1Char(' ') + reason;
    }
    return result;
}

} // namespace elux
