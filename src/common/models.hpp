#pragma once

#include <string>

namespace intervals {

inline constexpr const char *kDefaultUsername = "API_KEY";
inline constexpr const char *kDefaultPassword = "";
inline constexpr const char *kDefaultAthleteId = "0";

// Static credentials for the intervals.icu API. Any string is accepted.
struct Credentials {
    std::string username = kDefaultUsername;
    std::string password = kDefaultPassword;
    std::string athleteId = kDefaultAthleteId;
};

inline bool operator==(const Credentials &a, const Credentials &b)
{
    return a.username == b.username
        && a.password == b.password
        && a.athleteId == b.athleteId;
}

inline bool operator!=(const Credentials &a, const Credentials &b)
{
    return !(a == b);
}

// One day's training load and wellness figures. Never persisted.
struct DailyStats {
    long long ctl = 0;
    long long atl = 0;
    double form = 0.0;
    double rampRate = 0.0;
    // Set when the payload carried rampRate as a JSON float.
    bool rampRateIsFloat = false;
    long long restingHR = 0;
    long long hrv = 0;
    long long sleepScore = 0;
    long long steps = 0;
    std::string activityName;
};

} // namespace intervals
