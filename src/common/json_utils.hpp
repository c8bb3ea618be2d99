#pragma once

#include <cmath>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace intervals {

// Raised when a payload has the wrong shape for the field being read.
class PayloadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Reads a numeric member, treating absent and null members as zero.
// Throws PayloadError when the member holds a non-number.
inline double numberOrZero(const nlohmann::json &object, const char *key)
{
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return 0.0;
    }
    if (!it->is_number()) {
        throw PayloadError(std::string("field '") + key + "' is not a number");
    }
    return it->get<double>();
}

// Integer coercion truncates toward zero. Values that do not fit a
// long long (or are not finite) are a malformed payload.
inline long long integerOrZero(const nlohmann::json &object, const char *key)
{
    const double truncated = std::trunc(numberOrZero(object, key));
    // 2^63 is exactly representable; the valid range is [-2^63, 2^63).
    constexpr double kLimit = 9223372036854775808.0;
    if (!std::isfinite(truncated) || truncated >= kLimit || truncated < -kLimit) {
        throw PayloadError(std::string("field '") + key + "' is out of integer range");
    }
    return static_cast<long long>(truncated);
}

inline double roundTo2(double value)
{
    return std::round(value * 100.0) / 100.0;
}

// Non-empty string member, or the fallback.
inline std::string stringOr(const nlohmann::json &object,
                            const char *key,
                            const std::string &fallback)
{
    if (!object.is_object()) {
        return fallback;
    }
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return fallback;
    }
    const std::string value = it->get<std::string>();
    return value.empty() ? fallback : value;
}

inline void to_json(nlohmann::json &j, const Credentials &credentials)
{
    j = nlohmann::json{
        {"username", credentials.username},
        {"password", credentials.password},
        {"athlete_id", credentials.athleteId}
    };
}

inline void from_json(const nlohmann::json &j, Credentials &credentials)
{
    credentials.username = stringOr(j, "username", kDefaultUsername);
    credentials.password = stringOr(j, "password", kDefaultPassword);
    credentials.athleteId = stringOr(j, "athlete_id", kDefaultAthleteId);
}

} // namespace intervals
