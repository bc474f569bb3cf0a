#ifndef SGKDOC_IMAGING_JPEG_CODEC_HPP
#define SGKDOC_IMAGING_JPEG_CODEC_HPP

#include "sgkdoc/imaging/image_codec.hpp"

#include <memory>

namespace sgkdoc::imaging {

/**
 * @brief JPEG codec backed by libjpeg(-turbo).
 *
 * Decoding converts any JPEG color space to RGB (three components) or keeps
 * grayscale. Encoding accepts gray or RGB rasters; quality is clamped to
 * 1..100. The packager relies on quality being monotone in output size.
 *
 * Thread Safety: instances are stateless; each call owns its libjpeg state.
 */
class jpeg_codec final : public image_codec {
public:
    jpeg_codec();
    ~jpeg_codec() override;

    jpeg_codec(const jpeg_codec&) = delete;
    jpeg_codec& operator=(const jpeg_codec&) = delete;
    jpeg_codec(jpeg_codec&&) noexcept;
    jpeg_codec& operator=(jpeg_codec&&) noexcept;

    [[nodiscard]] std::string_view name() const noexcept override;
    [[nodiscard]] image_format format() const noexcept override;

    [[nodiscard]] decode_result decode(std::span<const uint8_t> data) const override;

    [[nodiscard]] encode_result encode(const raster_image& image,
                                       const encode_options& options = {}) const override;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace sgkdoc::imaging

#endif  // SGKDOC_IMAGING_JPEG_CODEC_HPP
