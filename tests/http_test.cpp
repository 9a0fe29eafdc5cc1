#include "elux_http.h"

#include <QNetworkAccessManager>

#include "gtest/gtest.h"

using elux::Endpoint;
using elux::HttpClient;
using elux::HttpResult;

TEST(HttpClientTest, MissingManagerNamesTheRequest)
{
    HttpClient http(nullptr);
    Endpoint endpoint;
    endpoint.baseUrl = QStringLiteral("https://api.example.test");

    const HttpResult result = http.get(endpoint, QStringLiteral("/api/v1/appliances"));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(0, result.statusCode);
    EXPECT_EQ(QStringLiteral("GET /api/v1/appliances: network manager unavailable"), result.error);
}

TEST(HttpClientTest, InvalidBaseUrlFailsBeforeSending)
{
    QNetworkAccessManager manager;
    HttpClient http(&manager);
    Endpoint endpoint;
    endpoint.baseUrl = QStringLiteral("not a url");

    const HttpResult result = http.postJson(endpoint, QStringLiteral("/api/v1/token/refresh"), QByteArrayLiteral("{}"));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(0, result.statusCode);
    EXPECT_TRUE(result.error.startsWith(QStringLiteral("POST /api/v1/token/refresh: ")));
    EXPECT_TRUE(result.error.contains(QStringLiteral("API base URL is invalid")));
}
