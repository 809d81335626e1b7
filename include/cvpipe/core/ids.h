#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace cvpipe::core {

/**
 * Generate a prefixed processing ID: prefix-timestamp_ms-random6hex.
 */
inline std::string generateId(const std::string& prefix = "cv") {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  std::chrono::system_clock::now().time_since_epoch())
                  .count();

    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> dist(0, 0xFFFFFF);
    uint32_t r = dist(rng);

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s-%lld-%06x", prefix.c_str(), static_cast<long long>(ms), r);
    return std::string(buf);
}

/**
 * ISO 8601 UTC timestamp with millisecond precision, e.g. 2025-10-01T14:30:00.123Z
 */
inline std::string isoTimestamp(std::chrono::system_clock::time_point tp) {
    auto time_t_now = std::chrono::system_clock::to_time_t(tp);
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;

    std::tm tm_utc;
#ifdef _WIN32
    gmtime_s(&tm_utc, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis << 'Z';
    return oss.str();
}

} // namespace cvpipe::core
