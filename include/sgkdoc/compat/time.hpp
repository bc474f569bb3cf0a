/**
 * @file time.hpp
 * @brief Thread-safe calendar conversion for timestamps in file names,
 * PDF footers and the audit trail
 *
 * POSIX provides localtime_r(time_t*, tm*); Windows provides
 * localtime_s(tm*, time_t*) with the arguments swapped.
 *
 * Usage:
 *   #include <sgkdoc/compat/time.hpp>
 *   auto tm = sgkdoc::compat::to_local_tm(std::chrono::system_clock::now());
 */

#pragma once

#include <chrono>
#include <ctime>

namespace sgkdoc::compat {

/**
 * @return @p result on success, nullptr on failure
 */
inline std::tm* localtime_safe(const std::time_t* time, std::tm* result) {
#if defined(_WIN32) || defined(_WIN64)
    return localtime_s(result, time) == 0 ? result : nullptr;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @return @p result on success, nullptr on failure
 */
inline std::tm* gmtime_safe(const std::time_t* time, std::tm* result) {
#if defined(_WIN32) || defined(_WIN64)
    return gmtime_s(result, time) == 0 ? result : nullptr;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Local calendar time of @p when; a zeroed tm if conversion fails
 */
inline std::tm to_local_tm(std::chrono::system_clock::time_point when) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    std::tm result{};
    if (localtime_safe(&seconds, &result) == nullptr) {
        return std::tm{};
    }
    return result;
}

/**
 * @brief UTC calendar time of @p when; a zeroed tm if conversion fails
 */
inline std::tm to_utc_tm(std::chrono::system_clock::time_point when) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    std::tm result{};
    if (gmtime_safe(&seconds, &result) == nullptr) {
        return std::tm{};
    }
    return result;
}

}  // namespace sgkdoc::compat
