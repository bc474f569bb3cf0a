#ifndef SGKDOC_IMAGING_IMAGE_OPS_HPP
#define SGKDOC_IMAGING_IMAGE_OPS_HPP

#include "sgkdoc/imaging/raster_image.hpp"

#include <cstdint>

namespace sgkdoc::imaging {

/**
 * @brief Luma plane: 0.299 R + 0.587 G + 0.114 B, rounded.
 */
[[nodiscard]] gray_plane to_grayscale(const raster_image& image);

/**
 * @brief Separable [1 4 6 4 1] / 16 blur with clamped borders.
 */
[[nodiscard]] gray_plane blur_5tap(const gray_plane& plane);

/**
 * @brief Sobel gradient magnitude classified into an edge map.
 *
 * Magnitudes above @p high_threshold become 255, above @p low_threshold 128,
 * everything else 0. The one-pixel border is always 0.
 */
[[nodiscard]] gray_plane sobel_edges(const gray_plane& plane,
                                     double low_threshold = 50.0,
                                     double high_threshold = 150.0);

/**
 * @brief Bilinear resample to the requested size (at least 1x1).
 */
[[nodiscard]] raster_image resize_bilinear(const raster_image& image,
                                           uint32_t width, uint32_t height);

/**
 * @brief Scale so the longest side is at most @p max_side; never upscales.
 * @param[out] scale Applied factor (1.0 when unchanged)
 */
[[nodiscard]] raster_image fit_within(const raster_image& image, uint32_t max_side,
                                      double& scale);

/**
 * @brief Copy of the clamped rectangle [x, x+w) x [y, y+h).
 */
[[nodiscard]] raster_image crop(const raster_image& image,
                                uint32_t x, uint32_t y,
                                uint32_t width, uint32_t height);

/**
 * @brief Expand a gray raster to RGB (RGB input is returned unchanged).
 */
[[nodiscard]] raster_image to_rgb(const raster_image& image);

}  // namespace sgkdoc::imaging

#endif  // SGKDOC_IMAGING_IMAGE_OPS_HPP
