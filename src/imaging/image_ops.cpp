#include "sgkdoc/imaging/image_ops.hpp"

#include <algorithm>
#include <cmath>

namespace sgkdoc::imaging {

gray_plane to_grayscale(const raster_image& image) {
    gray_plane plane;
    plane.width = image.width;
    plane.height = image.height;
    const size_t count = static_cast<size_t>(image.width) * image.height;
    plane.data.resize(count);

    if (image.is_grayscale()) {
        std::copy_n(image.pixels.begin(), count, plane.data.begin());
        return plane;
    }

    for (size_t i = 0; i < count; ++i) {
        const uint8_t* px = image.pixels.data() + i * 3;
        double luma = 0.299 * px[0] + 0.587 * px[1] + 0.114 * px[2];
        plane.data[i] = static_cast<uint8_t>(std::lround(std::min(luma, 255.0)));
    }
    return plane;
}

gray_plane blur_5tap(const gray_plane& plane) {
    static constexpr int kernel[5] = {1, 4, 6, 4, 1};

    const int w = static_cast<int>(plane.width);
    const int h = static_cast<int>(plane.height);
    std::vector<uint16_t> horizontal(static_cast<size_t>(w) * h);

    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            int sum = 0;
            for (int k = -2; k <= 2; ++k) {
                int sx = std::clamp(x + k, 0, w - 1);
                sum += kernel[k + 2] * plane.data[static_cast<size_t>(y) * w + sx];
            }
            horizontal[static_cast<size_t>(y) * w + x] = static_cast<uint16_t>(sum);
        }
    }

    gray_plane out;
    out.width = plane.width;
    out.height = plane.height;
    out.data.resize(plane.data.size());

    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            int sum = 0;
            for (int k = -2; k <= 2; ++k) {
                int sy = std::clamp(y + k, 0, h - 1);
                sum += kernel[k + 2] * horizontal[static_cast<size_t>(sy) * w + x];
            }
            // Both passes weigh 16
            out.data[static_cast<size_t>(y) * w + x] =
                static_cast<uint8_t>((sum + 128) / 256);
        }
    }
    return out;
}

gray_plane sobel_edges(const gray_plane& plane, double low_threshold,
                       double high_threshold) {
    gray_plane edges;
    edges.width = plane.width;
    edges.height = plane.height;
    edges.data.assign(plane.data.size(), 0);

    const int w = static_cast<int>(plane.width);
    const int h = static_cast<int>(plane.height);
    if (w < 3 || h < 3) {
        return edges;
    }

    auto px = [&](int x, int y) -> int {
        return plane.data[static_cast<size_t>(y) * w + x];
    };

    for (int y = 1; y < h - 1; ++y) {
        for (int x = 1; x < w - 1; ++x) {
            int gx = -px(x - 1, y - 1) + px(x + 1, y - 1)
                     - 2 * px(x - 1, y) + 2 * px(x + 1, y)
                     - px(x - 1, y + 1) + px(x + 1, y + 1);
            int gy = -px(x - 1, y - 1) - 2 * px(x, y - 1) - px(x + 1, y - 1)
                     + px(x - 1, y + 1) + 2 * px(x, y + 1) + px(x + 1, y + 1);
            double magnitude = std::sqrt(static_cast<double>(gx * gx + gy * gy));

            uint8_t value = 0;
            if (magnitude > high_threshold) {
                value = 255;
            } else if (magnitude > low_threshold) {
                value = 128;
            }
            edges.data[static_cast<size_t>(y) * w + x] = value;
        }
    }
    return edges;
}

raster_image resize_bilinear(const raster_image& image, uint32_t width, uint32_t height) {
    raster_image out;
    out.width = std::max<uint32_t>(width, 1);
    out.height = std::max<uint32_t>(height, 1);
    out.channels = image.channels;
    out.pixels.resize(out.frame_size_bytes());

    if (image.empty()) {
        return out;
    }

    const uint32_t src_width = image.width;
    const uint32_t src_height = image.height;
    const uint16_t spp = image.channels;
    const float x_ratio = static_cast<float>(src_width) / out.width;
    const float y_ratio = static_cast<float>(src_height) / out.height;

    for (uint32_t y = 0; y < out.height; ++y) {
        float src_y = y * y_ratio;
        uint32_t y0 = std::min(static_cast<uint32_t>(src_y), src_height - 1);
        uint32_t y1 = std::min(y0 + 1, src_height - 1);
        float y_diff = src_y - static_cast<float>(y0);

        for (uint32_t x = 0; x < out.width; ++x) {
            float src_x = x * x_ratio;
            uint32_t x0 = std::min(static_cast<uint32_t>(src_x), src_width - 1);
            uint32_t x1 = std::min(x0 + 1, src_width - 1);
            float x_diff = src_x - static_cast<float>(x0);

            for (uint16_t c = 0; c < spp; ++c) {
                float v00 = image.pixels[(static_cast<size_t>(y0) * src_width + x0) * spp + c];
                float v01 = image.pixels[(static_cast<size_t>(y0) * src_width + x1) * spp + c];
                float v10 = image.pixels[(static_cast<size_t>(y1) * src_width + x0) * spp + c];
                float v11 = image.pixels[(static_cast<size_t>(y1) * src_width + x1) * spp + c];

                float value = v00 * (1 - x_diff) * (1 - y_diff) +
                              v01 * x_diff * (1 - y_diff) +
                              v10 * (1 - x_diff) * y_diff +
                              v11 * x_diff * y_diff;

                out.pixels[(static_cast<size_t>(y) * out.width + x) * spp + c] =
                    static_cast<uint8_t>(std::clamp(value + 0.5f, 0.0f, 255.0f));
            }
        }
    }
    return out;
}

raster_image fit_within(const raster_image& image, uint32_t max_side, double& scale) {
    scale = 1.0;
    const uint32_t longest = image.longest_side();
    if (max_side == 0 || longest <= max_side) {
        return image;
    }

    scale = static_cast<double>(max_side) / longest;
    auto width = static_cast<uint32_t>(std::lround(image.width * scale));
    auto height = static_cast<uint32_t>(std::lround(image.height * scale));
    return resize_bilinear(image, width, height);
}

raster_image crop(const raster_image& image, uint32_t x, uint32_t y,
                  uint32_t width, uint32_t height) {
    raster_image out;
    out.channels = image.channels;

    if (x >= image.width || y >= image.height) {
        return out;
    }
    out.width = std::min(width, image.width - x);
    out.height = std::min(height, image.height - y);
    out.pixels.resize(out.frame_size_bytes());

    const size_t src_stride = image.row_stride();
    const size_t dst_stride = out.row_stride();
    for (uint32_t row = 0; row < out.height; ++row) {
        const uint8_t* src = image.pixels.data() + (static_cast<size_t>(y) + row) * src_stride +
                             static_cast<size_t>(x) * image.channels;
        std::copy_n(src, dst_stride, out.pixels.data() + row * dst_stride);
    }
    return out;
}

raster_image to_rgb(const raster_image& image) {
    if (!image.is_grayscale()) {
        return image;
    }
    raster_image out;
    out.width = image.width;
    out.height = image.height;
    out.channels = 3;
    out.pixels.resize(out.frame_size_bytes());
    for (size_t i = 0; i < image.pixels.size(); ++i) {
        out.pixels[i * 3 + 0] = image.pixels[i];
        out.pixels[i * 3 + 1] = image.pixels[i];
        out.pixels[i * 3 + 2] = image.pixels[i];
    }
    return out;
}

}  // namespace sgkdoc::imaging
