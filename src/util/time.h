// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#ifndef STVFUZZ_UTIL_TIME_H
#define STVFUZZ_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

inline int64_t GetTime() {
    return static_cast<int64_t>(time(nullptr));
}

/** Monotonic clock in seconds, for elapsed-time checks. */
inline double GetSteadySeconds() {
    using namespace std::chrono;
    return duration_cast<duration<double>>(steady_clock::now().time_since_epoch()).count();
}

/** UTC timestamp, e.g. 2026-10-19T08:15:02Z */
inline std::string FormatISO8601DateTime(int64_t nTime) {
    std::time_t t = static_cast<std::time_t>(nTime);
    std::tm tm_buf{};
    if (gmtime_r(&t, &tm_buf) == nullptr) {
        return {};
    }
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

/** Local-time run directory name, e.g. 20261019_081502 */
inline std::string FormatRunId(int64_t nTime) {
    std::time_t t = static_cast<std::time_t>(nTime);
    std::tm tm_buf{};
    if (localtime_r(&t, &tm_buf) == nullptr) {
        return {};
    }
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm_buf);
    return buf;
}

#endif
