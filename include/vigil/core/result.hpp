/**
 * @file result.hpp
 * @brief Result<T> type aliases and error codes for the durability core
 *
 * Provides the Result<T> types used by every vigil component, integrating
 * with common_system's Result pattern, plus the vigil-specific error code
 * range.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace vigil {

/**
 * @brief Result type alias for vigil operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief vigil-specific error codes
 *
 * Error code range: -900 to -999
 * Provides access to both common error codes and vigil-specific codes.
 */
namespace error_codes {
    // Import common error codes
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int vigil_base = -900;

    // Archive errors (-900 to -919)
    constexpr int archive_io_error = vigil_base - 0;
    constexpr int archive_disabled = vigil_base - 1;
    constexpr int invalid_partition_key = vigil_base - 2;
    constexpr int parse_error = vigil_base - 3;
    constexpr int lock_timeout_error = vigil_base - 4;

    // Canonical store errors (-920 to -939)
    constexpr int store_error = vigil_base - 20;
    constexpr int store_open_error = vigil_base - 21;
    constexpr int constraint_violation = vigil_base - 22;
    constexpr int record_not_found = vigil_base - 23;
    constexpr int transaction_error = vigil_base - 24;

    // Recovery errors (-940 to -959)
    constexpr int recovery_failed = vigil_base - 40;
    constexpr int recovery_cancelled = vigil_base - 41;
    constexpr int checkpoint_error = vigil_base - 42;

    // Migration errors (-960 to -979)
    constexpr int dependency_error = vigil_base - 60;
    constexpr int unknown_version = vigil_base - 61;
    constexpr int migration_failed = vigil_base - 62;
    constexpr int migration_validation_failed = vigil_base - 63;
    constexpr int migration_fail_closed = vigil_base - 64;
    constexpr int maintenance_required = vigil_base - 65;
    constexpr int invalid_version_state = vigil_base - 66;
    constexpr int session_continuity_error = vigil_base - 67;

    // Configuration errors (-980 to -989)
    constexpr int invalid_configuration = vigil_base - 80;
} // namespace error_codes

// Re-export common utility functions
using kcenon::common::ok;
using kcenon::common::make_error;

/**
 * @brief Create a vigil error result with module context
 * @tparam T The result value type
 * @param code Error code from vigil::error_codes
 * @param message Error message
 * @param module Originating component ("archive", "storage", ...)
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> vigil_error(int code, const std::string& message,
                             const std::string& module = "vigil") {
    return kcenon::common::make_error<T>(code, message, module);
}

/**
 * @brief Create a vigil void error result
 * @param code Error code from vigil::error_codes
 * @param message Error message
 * @param module Originating component
 * @return VoidResult containing the error
 */
inline VoidResult vigil_void_error(int code, const std::string& message,
                                   const std::string& module = "vigil") {
    return VoidResult(error_info{code, message, module});
}

} // namespace vigil
