/**
 * @file time.hpp
 * @brief Compatibility header for cross-platform time functions
 *
 * POSIX uses localtime_r(time_t*, tm*) while Windows uses
 * localtime_s(tm*, time_t*). Both are wrapped here.
 */

#pragma once

#include <ctime>

namespace dbmigrate::compat {

/**
 * @brief Cross-platform thread-safe local time conversion
 *
 * @param time Pointer to the time_t value to convert
 * @param result Pointer to the tm structure to store the result
 * @return Pointer to the tm structure (result) on success, nullptr on failure
 */
inline std::tm* localtime_safe(const std::time_t* time, std::tm* result) {
#if defined(_WIN32) || defined(_WIN64)
    return localtime_s(result, time) == 0 ? result : nullptr;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Cross-platform thread-safe UTC time conversion
 *
 * @param time Pointer to the time_t value to convert
 * @param result Pointer to the tm structure to store the result
 * @return Pointer to the tm structure (result) on success, nullptr on failure
 */
inline std::tm* gmtime_safe(const std::time_t* time, std::tm* result) {
#if defined(_WIN32) || defined(_WIN64)
    return gmtime_s(result, time) == 0 ? result : nullptr;
#else
    return gmtime_r(time, result);
#endif
}

}  // namespace dbmigrate::compat
