#pragma once

#include <QDate>
#include <QString>
#include <QUrl>

#include <functional>
#include <memory>
#include <mutex>

#include <nlohmann/json.hpp>

#include "client/http_transport.hpp"
#include "common/models.hpp"

namespace intervals {

inline constexpr const char *kRestActivity = "Rest";
inline constexpr const char *kFetchFailedText = "Failed to fetch data";

// Parses a wellness object. Absent and null fields read as zero.
// Throws PayloadError or nlohmann::json::exception on a malformed payload.
DailyStats parseWellness(const nlohmann::json &payload);

// Fixed multi-line layout shown in the tooltip and the popup.
QString renderStats(const DailyStats &stats);

// Decimal form of a value already rounded to two places. Integral values
// print bare ("20"); values that came from a JSON float keep at least one
// decimal ("2.0", "1.5").
QString formatRounded(double value, bool fromFloat = false);

/**
 * StatsClient fetches today's wellness and planned activity for one athlete.
 *
 * Both fetch operations are single best-effort attempts: they never throw and
 * map every failure to a fixed fallback string. Credentials may be replaced
 * from the UI thread while a background fetch is running.
 */
class StatsClient
{
public:
    using DateProvider = std::function<QDate()>;

    StatsClient(std::shared_ptr<HttpTransport> transport,
                Credentials credentials,
                QString apiBaseUrl,
                int timeoutMs = 10000);

    Credentials credentials() const;
    void setCredentials(const Credentials &credentials);

    // Replaces the local-date source; tests pin the date with this.
    void setDateProvider(DateProvider provider);

    QUrl wellnessUrl(const QDate &date) const;
    QUrl eventsUrl(const QDate &date) const;
    static QUrl wellnessUrl(const QString &apiBaseUrl,
                            const Credentials &credentials,
                            const QDate &date);
    static QUrl eventsUrl(const QString &apiBaseUrl,
                          const Credentials &credentials,
                          const QDate &date);

    QString fetchTodayActivity();
    QString fetchTodayStats();

private:
    QString fetchActivity(const Credentials &credentials, const QDate &date);
    HttpRequest makeRequest(const QUrl &url, const Credentials &credentials) const;
    QDate today() const;

    std::shared_ptr<HttpTransport> m_transport;
    QString m_apiBaseUrl;
    int m_timeoutMs;
    DateProvider m_dateProvider;

    mutable std::mutex m_mutex;
    Credentials m_credentials;
};

} // namespace intervals
