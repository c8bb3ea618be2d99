#include "client/stats_client.hpp"

#include <QUrlQuery>
#include <QUuid>

#include <utility>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace intervals {

namespace {

const QString kComponent = QStringLiteral("StatsClient");

QString isoDate(const QDate &date)
{
    return date.toString(Qt::ISODate);
}

nlohmann::json parseBody(const QByteArray &body)
{
    return nlohmann::json::parse(body.constData(), body.constData() + body.size());
}

QString athletePath(const QString &apiBaseUrl, const Credentials &credentials)
{
    const QString athlete = QString::fromUtf8(
        QUrl::toPercentEncoding(QString::fromStdString(credentials.athleteId)));
    return apiBaseUrl + QStringLiteral("/athlete/") + athlete;
}

} // namespace

DailyStats parseWellness(const nlohmann::json &payload)
{
    if (!payload.is_object()) {
        throw PayloadError("wellness payload is not an object");
    }

    DailyStats stats;
    stats.ctl = integerOrZero(payload, "ctl");
    stats.atl = integerOrZero(payload, "atl");
    stats.form = roundTo2(static_cast<double>(stats.ctl - stats.atl));
    stats.rampRate = roundTo2(numberOrZero(payload, "rampRate"));
    const auto ramp = payload.find("rampRate");
    stats.rampRateIsFloat = ramp != payload.end() && ramp->is_number_float();
    stats.restingHR = integerOrZero(payload, "restingHR");
    stats.hrv = integerOrZero(payload, "hrv");
    stats.sleepScore = integerOrZero(payload, "sleepScore");
    stats.steps = integerOrZero(payload, "steps");
    return stats;
}

QString formatRounded(double value, bool fromFloat)
{
    QString text = QString::number(value, 'f', 2);
    while (text.endsWith(QLatin1Char('0'))) {
        text.chop(1);
    }
    if (text.endsWith(QLatin1Char('.'))) {
        if (fromFloat) {
            return text + QLatin1Char('0');
        }
        text.chop(1);
    }
    if (text == QStringLiteral("-0")) {
        return QStringLiteral("0");
    }
    return text;
}

QString renderStats(const DailyStats &stats)
{
    QString text;
    text += QStringLiteral("Today: ") + QString::fromStdString(stats.activityName);
    text += QStringLiteral("\n\n");
    text += QStringLiteral("CTL: %1\n").arg(stats.ctl);
    text += QStringLiteral("ATL: %1\n").arg(stats.atl);
    text += QStringLiteral("Form: %1\n").arg(formatRounded(stats.form));
    text += QStringLiteral("Ramp Rate: %1\n").arg(formatRounded(stats.rampRate, stats.rampRateIsFloat));
    text += QStringLiteral("Resting HR: %1\n").arg(stats.restingHR);
    text += QStringLiteral("HRV: %1\n").arg(stats.hrv);
    text += QStringLiteral("Sleep Score: %1\n").arg(stats.sleepScore);
    text += QStringLiteral("Steps: %1").arg(stats.steps);
    return text;
}

StatsClient::StatsClient(std::shared_ptr<HttpTransport> transport,
                         Credentials credentials,
                         QString apiBaseUrl,
                         int timeoutMs)
    : m_transport(std::move(transport))
    , m_apiBaseUrl(std::move(apiBaseUrl))
    , m_timeoutMs(timeoutMs)
    , m_dateProvider([]() { return QDate::currentDate(); })
    , m_credentials(std::move(credentials))
{
}

Credentials StatsClient::credentials() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_credentials;
}

void StatsClient::setCredentials(const Credentials &credentials)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_credentials = credentials;
}

void StatsClient::setDateProvider(DateProvider provider)
{
    m_dateProvider = std::move(provider);
}

QDate StatsClient::today() const
{
    return m_dateProvider();
}

QUrl StatsClient::wellnessUrl(const QDate &date) const
{
    return wellnessUrl(m_apiBaseUrl, credentials(), date);
}

QUrl StatsClient::eventsUrl(const QDate &date) const
{
    return eventsUrl(m_apiBaseUrl, credentials(), date);
}

QUrl StatsClient::wellnessUrl(const QString &apiBaseUrl,
                              const Credentials &credentials,
                              const QDate &date)
{
    return QUrl(athletePath(apiBaseUrl, credentials) + QStringLiteral("/wellness/") + isoDate(date));
}

QUrl StatsClient::eventsUrl(const QString &apiBaseUrl,
                            const Credentials &credentials,
                            const QDate &date)
{
    QUrl url(athletePath(apiBaseUrl, credentials) + QStringLiteral("/events"));
    QUrlQuery query;
    query.addQueryItem(QStringLiteral("oldest"), isoDate(date));
    query.addQueryItem(QStringLiteral("newest"), isoDate(date));
    url.setQuery(query);
    return url;
}

HttpRequest StatsClient::makeRequest(const QUrl &url, const Credentials &credentials) const
{
    HttpRequest request;
    request.url = url;
    request.username = QString::fromStdString(credentials.username);
    request.password = QString::fromStdString(credentials.password);
    request.timeoutMs = m_timeoutMs;
    return request;
}

QString StatsClient::fetchTodayActivity()
{
    return fetchActivity(credentials(), today());
}

QString StatsClient::fetchActivity(const Credentials &credentials, const QDate &date)
{
    const QUrl url = eventsUrl(m_apiBaseUrl, credentials, date);
    const HttpResponse response = m_transport->get(makeRequest(url, credentials));
    if (!response.ok) {
        ILOG_WARN(kComponent,
                  QStringLiteral("fetchTodayActivity"),
                  QStringLiteral("activity_fetch_failed"),
                  response.statusCode != 0 ? QStringLiteral("http_status")
                                           : QStringLiteral("transport_error"),
                  QStringLiteral("fallback_rest"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"status", response.statusCode},
                                  {"error", response.errorString.toStdString()}}));
        return QString::fromLatin1(kRestActivity);
    }

    try {
        const nlohmann::json events = parseBody(response.body);
        if (!events.is_array()) {
            throw PayloadError("events payload is not an array");
        }
        if (events.empty()) {
            return QString::fromLatin1(kRestActivity);
        }
        return QString::fromStdString(
            stringOr(events.front(), "name", kRestActivity));
    } catch (const nlohmann::json::exception &e) {
        ILOG_WARN(kComponent,
                  QStringLiteral("fetchTodayActivity"),
                  QStringLiteral("activity_fetch_failed"),
                  QStringLiteral("invalid_json"),
                  QStringLiteral("fallback_rest"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"error", e.what()}}));
    } catch (const PayloadError &e) {
        ILOG_WARN(kComponent,
                  QStringLiteral("fetchTodayActivity"),
                  QStringLiteral("activity_fetch_failed"),
                  QStringLiteral("unexpected_shape"),
                  QStringLiteral("fallback_rest"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"error", e.what()}}));
    }
    return QString::fromLatin1(kRestActivity);
}

QString StatsClient::fetchTodayStats()
{
    logging::CorrelationScope corr(QUuid::createUuid().toString(QUuid::WithoutBraces));

    // One snapshot for both requests so a concurrent settings save cannot
    // mix one athlete's URL with another's credentials.
    const Credentials current = credentials();
    const QDate date = today();
    const QUrl url = wellnessUrl(m_apiBaseUrl, current, date);
    const HttpResponse response = m_transport->get(makeRequest(url, current));
    if (!response.ok) {
        ILOG_WARN(kComponent,
                  QStringLiteral("fetchTodayStats"),
                  QStringLiteral("stats_fetch_failed"),
                  response.statusCode != 0 ? QStringLiteral("http_status")
                                           : QStringLiteral("transport_error"),
                  QStringLiteral("fallback_text"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"status", response.statusCode},
                                  {"error", response.errorString.toStdString()}}));
        return QString::fromLatin1(kFetchFailedText);
    }

    DailyStats stats;
    try {
        stats = parseWellness(parseBody(response.body));
    } catch (const nlohmann::json::exception &e) {
        ILOG_WARN(kComponent,
                  QStringLiteral("fetchTodayStats"),
                  QStringLiteral("stats_fetch_failed"),
                  QStringLiteral("invalid_json"),
                  QStringLiteral("fallback_text"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"error", e.what()}}));
        return QString::fromLatin1(kFetchFailedText);
    } catch (const PayloadError &e) {
        ILOG_WARN(kComponent,
                  QStringLiteral("fetchTodayStats"),
                  QStringLiteral("stats_fetch_failed"),
                  QStringLiteral("unexpected_shape"),
                  QStringLiteral("fallback_text"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"error", e.what()}}));
        return QString::fromLatin1(kFetchFailedText);
    }

    stats.activityName = fetchActivity(current, date).toStdString();

    ILOG_DEBUG(kComponent,
               QStringLiteral("fetchTodayStats"),
               QStringLiteral("stats_fetched"),
               QStringLiteral("fetch"),
               QStringLiteral("wellness_and_events"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"ctl", stats.ctl}, {"atl", stats.atl}}));
    return renderStats(stats);
}

} // namespace intervals
