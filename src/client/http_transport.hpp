#pragma once

#include <QByteArray>
#include <QString>
#include <QUrl>

namespace intervals {

struct HttpRequest {
    QUrl url;
    QString username;
    QString password;
    int timeoutMs = 10000;
};

struct HttpResponse {
    // True only for a completed transfer with a 2xx status.
    bool ok = false;
    int statusCode = 0;
    QByteArray body;
    QString errorString;
};

// Blocking HTTP GET with basic authentication. Implementations must be
// callable from any thread and must not throw.
class HttpTransport
{
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse get(const HttpRequest &request) = 0;
};

// Qt Network implementation. Each call creates its own QNetworkAccessManager
// on the calling thread and spins a local event loop until the reply ends.
class QtHttpTransport : public HttpTransport
{
public:
    HttpResponse get(const HttpRequest &request) override;
};

QByteArray basicAuthHeader(const QString &username, const QString &password);

} // namespace intervals
