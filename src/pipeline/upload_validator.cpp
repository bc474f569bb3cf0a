/**
 * @file upload_validator.cpp
 * @brief Implementation of upload validation
 */

#include "sgkdoc/pipeline/upload_validator.hpp"

#include "sgkdoc/text/turkish_text.hpp"
#include <sgkdoc/compat/format.hpp>

#include <algorithm>
#include <cctype>
#include <utility>

namespace sgkdoc::pipeline {

upload_validator::upload_validator(pipeline_config config) : config_(std::move(config)) {}

auto upload_validator::is_allowed(std::string_view media_type) const -> bool {
    // Media types are ASCII; Turkish casing rules must not apply here
    std::string normalized(text::trim(media_type));
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::any_of(config_.allowed_media_types.begin(), config_.allowed_media_types.end(),
                       [&](const std::string& allowed) { return allowed == normalized; });
}

auto upload_validator::validate(const uploaded_file& file) const -> VoidResult {
    if (!is_allowed(file.media_type)) {
        return sgkdoc_void_error(error_codes::unsupported_media_type,
                                 std::string(unsupported_type_message), file.media_type);
    }
    if (file.bytes.empty()) {
        return sgkdoc_void_error(error_codes::empty_file, std::string(empty_file_message),
                                 file.file_name);
    }
    if (file.size() > config_.max_upload_bytes) {
        return sgkdoc_void_error(
            error_codes::file_too_large, std::string(file_too_large_message),
            sgkdoc::compat::format("{} bytes > {} bytes", file.size(), config_.max_upload_bytes));
    }
    return ok();
}

auto upload_validator::effective_format(const uploaded_file& file) noexcept
    -> imaging::image_format {
    const auto sniffed = imaging::detect_format(file.bytes);
    if (sniffed != imaging::image_format::unknown) {
        return sniffed;
    }
    return imaging::format_from_media_type(file.media_type);
}

}  // namespace sgkdoc::pipeline
