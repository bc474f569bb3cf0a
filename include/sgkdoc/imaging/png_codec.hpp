#ifndef SGKDOC_IMAGING_PNG_CODEC_HPP
#define SGKDOC_IMAGING_PNG_CODEC_HPP

#include "sgkdoc/imaging/image_codec.hpp"

namespace sgkdoc::imaging {

/**
 * @brief PNG codec backed by libpng.
 *
 * Palette, 16-bit and gray+alpha inputs are normalized to 8-bit gray or RGB;
 * alpha is composited over white, which is what a scanned page shows through.
 */
class png_codec final : public image_codec {
public:
    png_codec() = default;
    ~png_codec() override = default;

    [[nodiscard]] std::string_view name() const noexcept override;
    [[nodiscard]] image_format format() const noexcept override;

    [[nodiscard]] decode_result decode(std::span<const uint8_t> data) const override;

    [[nodiscard]] encode_result encode(const raster_image& image,
                                       const encode_options& options = {}) const override;
};

}  // namespace sgkdoc::imaging

#endif  // SGKDOC_IMAGING_PNG_CODEC_HPP
