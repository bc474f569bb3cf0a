#ifndef SGKDOC_IMAGING_IMAGE_CODEC_HPP
#define SGKDOC_IMAGING_IMAGE_CODEC_HPP

#include "sgkdoc/imaging/raster_image.hpp"
#include <sgkdoc/core/result.hpp>

#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

namespace sgkdoc::imaging {

/**
 * @brief Container formats accepted at upload.
 */
enum class image_format {
    jpeg,
    png,
    tiff,
    pdf,
    unknown
};

[[nodiscard]] std::string_view to_string(image_format format) noexcept;

/**
 * @brief Identify a container from its leading magic bytes.
 */
[[nodiscard]] image_format detect_format(std::span<const uint8_t> data) noexcept;

/**
 * @brief Map a declared media type ("image/jpeg", ...) to a format.
 */
[[nodiscard]] image_format format_from_media_type(std::string_view media_type) noexcept;

/**
 * @brief Options for lossy re-encoding.
 */
struct encode_options {
    /// Quality setting (1-100 for JPEG, ignored by PNG)
    int quality{85};

    /// Chroma subsampling for color JPEG
    /// 0 = 4:4:4, 1 = 4:2:2, 2 = 4:2:0 (default)
    int chroma_subsampling{2};
};

using decode_result = sgkdoc::Result<raster_image>;
using encode_result = sgkdoc::Result<std::vector<uint8_t>>;

/**
 * @brief Abstract raster codec.
 *
 * Implementations are stateless after construction and safe to share
 * between concurrent pipeline runs.
 */
class image_codec {
public:
    virtual ~image_codec() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    [[nodiscard]] virtual image_format format() const noexcept = 0;

    /**
     * @brief Decodes a complete file into an 8-bit gray or RGB raster.
     */
    [[nodiscard]] virtual decode_result decode(std::span<const uint8_t> data) const = 0;

    /**
     * @brief Encodes a raster into a complete file.
     */
    [[nodiscard]] virtual encode_result encode(const raster_image& image,
                                               const encode_options& options = {}) const = 0;

protected:
    image_codec() = default;
    image_codec(const image_codec&) = default;
    image_codec& operator=(const image_codec&) = default;
    image_codec(image_codec&&) = default;
    image_codec& operator=(image_codec&&) = default;
};

/**
 * @brief Returns the codec for a format, or nullptr when none is available.
 *
 * TIFF and PDF have no raster codec.
 */
[[nodiscard]] std::unique_ptr<image_codec> create_codec(image_format format);

/**
 * @brief Decodes by sniffing the magic bytes.
 *
 * @return unsupported_image_format for TIFF, PDF and unknown content
 */
[[nodiscard]] decode_result decode_image(std::span<const uint8_t> data);

}  // namespace sgkdoc::imaging

#endif  // SGKDOC_IMAGING_IMAGE_CODEC_HPP
