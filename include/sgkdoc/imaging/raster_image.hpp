#ifndef SGKDOC_IMAGING_RASTER_IMAGE_HPP
#define SGKDOC_IMAGING_RASTER_IMAGE_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace sgkdoc::imaging {

/**
 * @brief Decoded 8-bit raster with interleaved samples.
 *
 * Only grayscale (1 channel) and RGB (3 channels) layouts are produced by the
 * decoders; alpha is composited away at decode time.
 */
struct raster_image {
    uint32_t width{0};
    uint32_t height{0};

    /// 1 = grayscale, 3 = RGB
    uint16_t channels{3};

    /// Row-major, interleaved, no row padding
    std::vector<uint8_t> pixels;

    [[nodiscard]] bool empty() const noexcept {
        return width == 0 || height == 0 || pixels.empty();
    }

    [[nodiscard]] bool is_grayscale() const noexcept {
        return channels == 1;
    }

    [[nodiscard]] size_t row_stride() const noexcept {
        return static_cast<size_t>(width) * channels;
    }

    [[nodiscard]] size_t frame_size_bytes() const noexcept {
        return row_stride() * height;
    }

    /**
     * @brief Checks layout consistency (channel count and buffer size).
     */
    [[nodiscard]] bool valid() const noexcept {
        return width > 0 && height > 0 &&
               (channels == 1 || channels == 3) &&
               pixels.size() == frame_size_bytes();
    }

    [[nodiscard]] uint32_t longest_side() const noexcept {
        return width > height ? width : height;
    }
};

/**
 * @brief Single-channel 8-bit plane used by the edge analysis stages.
 */
struct gray_plane {
    uint32_t width{0};
    uint32_t height{0};
    std::vector<uint8_t> data;

    [[nodiscard]] uint8_t at(uint32_t x, uint32_t y) const noexcept {
        return data[static_cast<size_t>(y) * width + x];
    }
};

}  // namespace sgkdoc::imaging

#endif  // SGKDOC_IMAGING_RASTER_IMAGE_HPP
