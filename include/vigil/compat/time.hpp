/**
 * @file time.hpp
 * @brief Thread-safe UTC calendar conversion
 *
 * POSIX uses gmtime_r(time_t*, tm*) while Windows uses gmtime_s(tm*, time_t*).
 *
 * Usage:
 *   #include <vigil/compat/time.hpp>
 *   std::tm tm{};
 *   vigil::compat::gmtime_safe(&time_val, &tm);
 */

#pragma once

#include <ctime>

namespace vigil::compat {

/**
 * @brief Cross-platform thread-safe UTC time conversion
 * @param time Pointer to the time_t value to convert
 * @param result Pointer to the tm structure to store the result
 * @return result on success, nullptr on failure
 */
inline std::tm* gmtime_safe(const std::time_t* time, std::tm* result) {
#if defined(_WIN32) || defined(_WIN64)
    return gmtime_s(result, time) == 0 ? result : nullptr;
#else
    return gmtime_r(time, result);
#endif
}

}  // namespace vigil::compat
