#include "client/http_transport.hpp"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>

#include <memory>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace intervals {

QByteArray basicAuthHeader(const QString &username, const QString &password)
{
    const QByteArray userPass = username.toUtf8() + ':' + password.toUtf8();
    return QByteArrayLiteral("Basic ") + userPass.toBase64();
}

HttpResponse QtHttpTransport::get(const HttpRequest &request)
{
    HttpResponse response;

    QNetworkAccessManager manager;
    QNetworkRequest networkRequest(request.url);
    networkRequest.setRawHeader("Authorization",
                                basicAuthHeader(request.username, request.password));
    networkRequest.setRawHeader("Accept", "application/json");
    networkRequest.setTransferTimeout(request.timeoutMs);

    ILOG_DEBUG(QStringLiteral("QtHttpTransport"),
               QStringLiteral("get"),
               QStringLiteral("http_get"),
               QStringLiteral("fetch"),
               QStringLiteral("qnetworkaccessmanager"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"url", request.url.toString().toStdString()},
                               {"timeoutMs", request.timeoutMs}}));

    std::unique_ptr<QNetworkReply> reply(manager.get(networkRequest));

    // Blocking request; the guard timer covers stalls that the transfer
    // timeout does not see (e.g. DNS).
    QEventLoop loop;
    QTimer guard;
    guard.setSingleShot(true);
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&guard, &QTimer::timeout, &loop, &QEventLoop::quit);
    guard.start(request.timeoutMs + 1000);
    if (!reply->isFinished()) {
        loop.exec();
    }

    if (!reply->isFinished()) {
        reply->abort();
        response.errorString = QStringLiteral("request timed out");
        return response;
    }

    response.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    response.body = reply->readAll();

    if (reply->error() != QNetworkReply::NoError) {
        response.errorString = reply->errorString();
        return response;
    }
    if (response.statusCode < 200 || response.statusCode > 299) {
        response.errorString = QStringLiteral("HTTP status %1").arg(response.statusCode);
        return response;
    }

    response.ok = true;
    return response;
}

} // namespace intervals
