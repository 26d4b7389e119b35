/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for metaview
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for metaview, integrating with common_system's Result pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace metaview {

/**
 * @brief Result type alias for metaview operations
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
 * @brief metaview error codes
 *
 * Error code range: -900 to -949
 */
namespace error_codes {
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int metaview_base = -900;

    // Decode errors (-900 to -909), reported by the external decoder
    constexpr int file_not_found = metaview_base - 0;
    constexpr int file_read_error = metaview_base - 1;
    constexpr int invalid_dicom_file = metaview_base - 2;
    constexpr int decode_error = metaview_base - 3;

    // Walk errors (-910 to -919)
    constexpr int structural_error = metaview_base - 10;
    constexpr int depth_limit_exceeded = metaview_base - 11;

    // Element errors (-920 to -929)
    constexpr int render_error = metaview_base - 20;
    constexpr int data_size_mismatch = metaview_base - 21;

    // Configuration errors (-930 to -939)
    constexpr int invalid_option = metaview_base - 30;
} // namespace error_codes

/**
 * @brief Check whether an error code belongs to the decode category
 * @param code Error code from metaview::error_codes
 * @return true for file and decode failures
 */
[[nodiscard]] constexpr auto is_decode_error(int code) noexcept -> bool {
    return code <= error_codes::file_not_found &&
           code >= error_codes::decode_error;
}

/**
 * @brief Check whether an error code belongs to the structural category
 * @param code Error code from metaview::error_codes
 * @return true for malformed trees and depth cap violations
 */
[[nodiscard]] constexpr auto is_structural_error(int code) noexcept -> bool {
    return code == error_codes::structural_error ||
           code == error_codes::depth_limit_exceeded;
}

using kcenon::common::ok;
using kcenon::common::make_error;

/**
 * @brief Create a metaview error result with module context
 * @tparam T The result value type
 * @param code Error code from metaview::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> metaview_error(int code, const std::string& message,
                                const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, "metaview");
    }
    return kcenon::common::make_error<T>(code, message, "metaview", details);
}

/**
 * @brief Create a metaview void error result
 * @param code Error code from metaview::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return VoidResult containing the error
 */
inline VoidResult metaview_void_error(int code, const std::string& message,
                                      const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, "metaview"});
    }
    return VoidResult(error_info{code, message, "metaview", details});
}

} // namespace metaview

