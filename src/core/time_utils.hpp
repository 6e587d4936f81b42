#pragma once
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace wcl {
inline uint64_t monotonic_ns() {
    using namespace std::chrono;
    return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
}

// Local datetime with microseconds, e.g. 2026-10-18T14:03:07.123456
inline std::string local_time_iso8601(std::chrono::system_clock::time_point now) {
    using namespace std::chrono;
    auto t = system_clock::to_time_t(now);
    auto micros = duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000;
    if (micros < 0) micros += 1000000;
    std::tm tm_local{};
    localtime_r(&t, &tm_local);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_local);
    char out[48];
    std::snprintf(out, sizeof(out), "%s.%06lld", buf, static_cast<long long>(micros));
    return std::string(out);
}

inline std::string local_time_iso8601() {
    return local_time_iso8601(std::chrono::system_clock::now());
}

// Compact stamp used in artifact names: 20261018_140307
inline std::string file_stamp(std::chrono::system_clock::time_point now) {
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_local{};
    localtime_r(&t, &tm_local);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm_local);
    return std::string(buf);
}

// HH:MM:SS slice of an ISO-8601 timestamp, or the input if it is too short.
inline std::string clock_part(const std::string& iso) {
    if (iso.size() < 19) return iso;
    return iso.substr(11, 8);
}
}  // namespace wcl
