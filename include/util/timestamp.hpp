#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace canopy::util {

inline std::string timestampToString(const std::time_t ts) {
    std::ostringstream oss;
    std::tm tm{};
    gmtime_r(&ts, &tm);
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

inline std::time_t parseTimestampFromString(const std::string& iso) {
    std::tm tm = {};
    std::istringstream ss(iso);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (ss.fail()) throw std::runtime_error("Failed to parse timestamp: " + iso);
    return timegm(&tm);
}

// "20130524T000000Z", as used in X-Amz-Date
inline std::string amzTimestamp(const std::time_t ts) {
    std::tm tm{};
    gmtime_r(&ts, &tm);
    char buffer[17];
    strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%SZ", &tm);
    return {buffer};
}

// "20130524", the credential scope date
inline std::string amzDate(const std::time_t ts) {
    std::tm tm{};
    gmtime_r(&ts, &tm);
    char buffer[9];
    strftime(buffer, sizeof(buffer), "%Y%m%d", &tm);
    return {buffer};
}

inline std::time_t now() {
    return std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
}

} // namespace canopy::util
