// include/signal_ngin/core/time_utils.hpp
#pragma once

#include <time.h>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace signal_ngin {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Thread-safe wrapper for gmtime
 */
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Milliseconds since the Unix epoch
 */
inline int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline std::chrono::system_clock::time_point from_epoch_ms(int64_t ms) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds(ms)));
}

/**
 * @brief Format a time point as UTC ISO-8601 with millisecond precision
 *
 * Example: 2025-03-14T09:26:53.589Z
 */
inline std::string to_iso8601_utc(std::chrono::system_clock::time_point tp) {
    int64_t ms = to_epoch_ms(tp);
    int64_t secs = ms / 1000;
    int64_t millis = ms % 1000;
    if (millis < 0) {
        millis += 1000;
        secs -= 1;
    }
    std::time_t tt = static_cast<std::time_t>(secs);
    std::tm result;
    safe_gmtime(&tt, &result);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &result);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buffer, static_cast<int>(millis));
    return std::string(out);
}

/**
 * @brief Get a time point as a string with specified strftime format
 */
inline std::string format_time(std::chrono::system_clock::time_point tp, const char* format,
                               bool use_local_time = false) {
    auto tt = std::chrono::system_clock::to_time_t(tp);
    std::tm result;

    if (use_local_time) {
        safe_localtime(&tt, &result);
    } else {
        safe_gmtime(&tt, &result);
    }

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

/**
 * @brief First instant of the cadence grid strictly after `now`
 *
 * The grid is anchored at the Unix epoch, so every process using the same cadence
 * lands on the same instants.
 */
inline std::chrono::system_clock::time_point next_grid_instant(
    std::chrono::system_clock::time_point now, std::chrono::milliseconds cadence) {
    int64_t now_ms = to_epoch_ms(now);
    int64_t step = cadence.count();
    int64_t floored = now_ms - (((now_ms % step) + step) % step);
    return from_epoch_ms(floored + step);
}

}  // namespace core
}  // namespace signal_ngin
