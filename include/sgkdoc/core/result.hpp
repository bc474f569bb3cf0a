/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for the SGK document pipeline
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for sgkdoc, integrating with common_system's Result pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace sgkdoc {

/**
 * @brief Result type alias for pipeline operations
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
 * @brief sgkdoc-specific error codes
 *
 * Error code range: -900 to -999
 */
namespace error_codes {
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int sgkdoc_base = -900;

    // Upload validation errors (-900 to -909)
    constexpr int unsupported_media_type = sgkdoc_base - 0;
    constexpr int file_too_large = sgkdoc_base - 1;
    constexpr int empty_file = sgkdoc_base - 2;

    // Imaging errors (-910 to -919)
    constexpr int image_decode_error = sgkdoc_base - 10;
    constexpr int image_encode_error = sgkdoc_base - 11;
    constexpr int unsupported_image_format = sgkdoc_base - 12;
    constexpr int invalid_image_dimensions = sgkdoc_base - 13;

    // Text extraction errors (-920 to -929)
    constexpr int ocr_failed = sgkdoc_base - 20;
    constexpr int ocr_timeout = sgkdoc_base - 21;
    constexpr int ocr_service_missing = sgkdoc_base - 22;

    // Packaging errors (-930 to -939)
    constexpr int pdf_render_error = sgkdoc_base - 30;

    // Storage errors (-940 to -959)
    constexpr int storage_quota_exceeded = sgkdoc_base - 40;
    constexpr int storage_write_failed = sgkdoc_base - 41;
    constexpr int storage_read_failed = sgkdoc_base - 42;
    constexpr int database_open_error = sgkdoc_base - 43;
    constexpr int artifact_not_found = sgkdoc_base - 44;
    constexpr int patient_not_found = sgkdoc_base - 45;

    // Pipeline errors (-960 to -969)
    constexpr int run_cancelled = sgkdoc_base - 60;
    constexpr int no_pending_commit = sgkdoc_base - 61;
    constexpr int invalid_argument = sgkdoc_base - 62;

    // Configuration errors (-970 to -979)
    constexpr int config_file_not_found = sgkdoc_base - 70;
    constexpr int config_parse_error = sgkdoc_base - 71;
    constexpr int config_invalid_value = sgkdoc_base - 72;
}  // namespace error_codes

using kcenon::common::ok;
using kcenon::common::make_error;
using kcenon::common::is_ok;
using kcenon::common::is_error;

/**
 * @brief Create an sgkdoc error result with module context
 * @tparam T The result value type
 * @param code Error code from sgkdoc::error_codes
 * @param message Error message (user-facing where the code is user-facing)
 * @param details Optional additional details
 */
template <typename T>
inline Result<T> sgkdoc_error(int code, const std::string& message,
                              const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, "sgkdoc");
    }
    return kcenon::common::make_error<T>(code, message, "sgkdoc", details);
}

/**
 * @brief Create an sgkdoc void error result
 */
inline VoidResult sgkdoc_void_error(int code, const std::string& message,
                                    const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, "sgkdoc"});
    }
    return VoidResult(error_info{code, message, "sgkdoc", details});
}

/**
 * @brief True for codes the pipeline treats as ValidationError
 */
[[nodiscard]] constexpr bool is_validation_error(int code) noexcept {
    return code <= error_codes::unsupported_media_type &&
           code > error_codes::unsupported_media_type - 10;
}

/**
 * @brief True for codes the pipeline treats as ExtractionFailure
 */
[[nodiscard]] constexpr bool is_extraction_failure(int code) noexcept {
    return code <= error_codes::ocr_failed && code > error_codes::ocr_failed - 10;
}

/**
 * @brief True for codes the pipeline treats as PersistenceError
 */
[[nodiscard]] constexpr bool is_persistence_error(int code) noexcept {
    return code == error_codes::storage_quota_exceeded ||
           code == error_codes::storage_write_failed;
}

}  // namespace sgkdoc

/**
 * @brief Return early if expression is an error
 */
#define SGKDOC_RETURN_IF_ERROR(expr) COMMON_RETURN_IF_ERROR(expr)

/**
 * @brief Assign value or return error
 */
#define SGKDOC_ASSIGN_OR_RETURN(decl, expr) COMMON_ASSIGN_OR_RETURN(decl, expr)
