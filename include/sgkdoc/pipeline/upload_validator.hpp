/**
 * @file upload_validator.hpp
 * @brief Media type and size checks performed before a run starts
 */

#ifndef SGKDOC_PIPELINE_UPLOAD_VALIDATOR_HPP
#define SGKDOC_PIPELINE_UPLOAD_VALIDATOR_HPP

#include "sgkdoc/imaging/image_codec.hpp"
#include "sgkdoc/pipeline/pipeline_config.hpp"
#include <sgkdoc/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sgkdoc::pipeline {

/**
 * @brief One file handed to the pipeline
 */
struct uploaded_file {
    std::vector<uint8_t> bytes;

    /// Declared media type ("image/jpeg", "application/pdf", ...)
    std::string media_type;

    std::string file_name;

    /// Identifies the run for idempotent commits; generated when empty
    std::string run_id;

    [[nodiscard]] std::size_t size() const noexcept { return bytes.size(); }
};

/// User-facing rejection messages
inline constexpr std::string_view unsupported_type_message =
    "Desteklenmeyen dosya formatı. Lütfen JPEG, PNG, TIFF veya PDF yükleyin.";
inline constexpr std::string_view file_too_large_message =
    "Dosya çok büyük. Maksimum 15MB boyutunda dosya yükleyebilirsiniz.";
inline constexpr std::string_view empty_file_message = "Dosya boş. Lütfen geçerli bir belge yükleyin.";

/**
 * @class upload_validator
 * @brief Rejects uploads outside the allow-list or above the size limit
 */
class upload_validator {
public:
    explicit upload_validator(pipeline_config config = {});

    /**
     * @return unsupported_media_type, file_too_large or empty_file with a
     *         user-facing message
     */
    [[nodiscard]] auto validate(const uploaded_file& file) const -> VoidResult;

    /**
     * @brief Container format of an accepted upload
     *
     * Magic bytes win over the declared type; the declared type is used
     * when the content is not recognised.
     */
    [[nodiscard]] static auto effective_format(const uploaded_file& file) noexcept
        -> imaging::image_format;

private:
    [[nodiscard]] auto is_allowed(std::string_view media_type) const -> bool;

    pipeline_config config_;
};

}  // namespace sgkdoc::pipeline

#endif  // SGKDOC_PIPELINE_UPLOAD_VALIDATOR_HPP
