#include "sgkdoc/imaging/png_codec.hpp"

#include <png.h>

#include <csetjmp>
#include <cstring>
#include <string>

namespace sgkdoc::imaging {

namespace {

struct png_read_cursor {
    const uint8_t* data{nullptr};
    size_t size{0};
    size_t offset{0};
};

void read_callback(png_structp png_ptr, png_bytep out, png_size_t length) {
    auto* cursor = static_cast<png_read_cursor*>(png_get_io_ptr(png_ptr));
    if (cursor->offset + length > cursor->size) {
        png_error(png_ptr, "Read past end of PNG data");
    }
    std::memcpy(out, cursor->data + cursor->offset, length);
    cursor->offset += length;
}

void write_callback(png_structp png_ptr, png_bytep data, png_size_t length) {
    auto* buffer = static_cast<std::vector<uint8_t>*>(png_get_io_ptr(png_ptr));
    buffer->insert(buffer->end(), data, data + length);
}

void flush_callback(png_structp /*png_ptr*/) {}

uint8_t over_white(uint8_t value, uint8_t alpha) {
    return static_cast<uint8_t>((value * alpha + 255 * (255 - alpha) + 127) / 255);
}

}  // namespace

std::string_view png_codec::name() const noexcept {
    return "PNG (libpng)";
}

image_format png_codec::format() const noexcept {
    return image_format::png;
}

decode_result png_codec::decode(std::span<const uint8_t> data) const {
    if (data.size() < 8 || png_sig_cmp(data.data(), 0, 8) != 0) {
        return sgkdoc::sgkdoc_error<raster_image>(
            sgkdoc::error_codes::image_decode_error, "Invalid PNG signature");
    }

    png_structp png_ptr =
        png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (png_ptr == nullptr) {
        return sgkdoc::sgkdoc_error<raster_image>(
            sgkdoc::error_codes::image_decode_error, "Failed to create PNG read struct");
    }

    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (info_ptr == nullptr) {
        png_destroy_read_struct(&png_ptr, nullptr, nullptr);
        return sgkdoc::sgkdoc_error<raster_image>(
            sgkdoc::error_codes::image_decode_error, "Failed to create PNG info struct");
    }

    png_read_cursor cursor{data.data(), data.size(), 0};
    std::vector<uint8_t> decoded;
    std::vector<png_bytep> rows;

    if (setjmp(png_jmpbuf(png_ptr))) {
        png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
        return sgkdoc::sgkdoc_error<raster_image>(
            sgkdoc::error_codes::image_decode_error, "PNG decoding failed");
    }

    png_set_read_fn(png_ptr, &cursor, read_callback);
    png_read_info(png_ptr, info_ptr);

    png_set_palette_to_rgb(png_ptr);
    png_set_expand_gray_1_2_4_to_8(png_ptr);
    if (png_get_valid(png_ptr, info_ptr, PNG_INFO_tRNS)) {
        png_set_tRNS_to_alpha(png_ptr);
    }
    png_set_strip_16(png_ptr);
    png_set_interlace_handling(png_ptr);
    png_read_update_info(png_ptr, info_ptr);

    const png_uint_32 width = png_get_image_width(png_ptr, info_ptr);
    const png_uint_32 height = png_get_image_height(png_ptr, info_ptr);
    const int src_channels = png_get_channels(png_ptr, info_ptr);
    const size_t src_stride = png_get_rowbytes(png_ptr, info_ptr);

    decoded.resize(src_stride * height);
    rows.resize(height);
    for (png_uint_32 y = 0; y < height; ++y) {
        rows[y] = decoded.data() + static_cast<size_t>(y) * src_stride;
    }
    png_read_image(png_ptr, rows.data());
    png_read_end(png_ptr, nullptr);
    png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);

    raster_image image;
    image.width = width;
    image.height = height;
    image.channels = (src_channels <= 2) ? 1 : 3;
    image.pixels.resize(image.frame_size_bytes());

    for (png_uint_32 y = 0; y < height; ++y) {
        const uint8_t* src = decoded.data() + static_cast<size_t>(y) * src_stride;
        uint8_t* dst = image.pixels.data() + static_cast<size_t>(y) * image.row_stride();
        for (png_uint_32 x = 0; x < width; ++x) {
            const uint8_t* px = src + static_cast<size_t>(x) * src_channels;
            switch (src_channels) {
                case 1:
                    dst[x] = px[0];
                    break;
                case 2:
                    dst[x] = over_white(px[0], px[1]);
                    break;
                case 3:
                    dst[x * 3 + 0] = px[0];
                    dst[x * 3 + 1] = px[1];
                    dst[x * 3 + 2] = px[2];
                    break;
                default:
                    dst[x * 3 + 0] = over_white(px[0], px[3]);
                    dst[x * 3 + 1] = over_white(px[1], px[3]);
                    dst[x * 3 + 2] = over_white(px[2], px[3]);
                    break;
            }
        }
    }

    return image;
}

encode_result png_codec::encode(const raster_image& image,
                                const encode_options& /*options*/) const {
    if (!image.valid()) {
        return sgkdoc::sgkdoc_error<std::vector<uint8_t>>(
            sgkdoc::error_codes::image_encode_error, "Invalid raster for PNG");
    }

    std::vector<uint8_t> buffer;

    png_structp png_ptr =
        png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (png_ptr == nullptr) {
        return sgkdoc::sgkdoc_error<std::vector<uint8_t>>(
            sgkdoc::error_codes::image_encode_error, "Failed to create PNG write struct");
    }

    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (info_ptr == nullptr) {
        png_destroy_write_struct(&png_ptr, nullptr);
        return sgkdoc::sgkdoc_error<std::vector<uint8_t>>(
            sgkdoc::error_codes::image_encode_error, "Failed to create PNG info struct");
    }

    if (setjmp(png_jmpbuf(png_ptr))) {
        png_destroy_write_struct(&png_ptr, &info_ptr);
        return sgkdoc::sgkdoc_error<std::vector<uint8_t>>(
            sgkdoc::error_codes::image_encode_error, "PNG encoding failed");
    }

    png_set_write_fn(png_ptr, &buffer, write_callback, flush_callback);

    const int color_type = image.is_grayscale() ? PNG_COLOR_TYPE_GRAY : PNG_COLOR_TYPE_RGB;
    png_set_IHDR(png_ptr, info_ptr, image.width, image.height, 8, color_type,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT,
                 PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png_ptr, info_ptr);

    for (uint32_t y = 0; y < image.height; ++y) {
        auto row = const_cast<png_bytep>(
            image.pixels.data() + static_cast<size_t>(y) * image.row_stride());
        png_write_row(png_ptr, row);
    }

    png_write_end(png_ptr, nullptr);
    png_destroy_write_struct(&png_ptr, &info_ptr);

    return buffer;
}

}  // namespace sgkdoc::imaging
