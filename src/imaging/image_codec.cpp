#include "sgkdoc/imaging/image_codec.hpp"
#include "sgkdoc/imaging/jpeg_codec.hpp"
#include "sgkdoc/imaging/png_codec.hpp"

#include <string>

namespace sgkdoc::imaging {

std::string_view to_string(image_format format) noexcept {
    switch (format) {
        case image_format::jpeg: return "image/jpeg";
        case image_format::png: return "image/png";
        case image_format::tiff: return "image/tiff";
        case image_format::pdf: return "application/pdf";
        case image_format::unknown:
        default: return "application/octet-stream";
    }
}

image_format detect_format(std::span<const uint8_t> data) noexcept {
    if (data.size() >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF) {
        return image_format::jpeg;
    }
    if (data.size() >= 8 && data[0] == 0x89 && data[1] == 'P' && data[2] == 'N' &&
        data[3] == 'G' && data[4] == 0x0D && data[5] == 0x0A && data[6] == 0x1A &&
        data[7] == 0x0A) {
        return image_format::png;
    }
    if (data.size() >= 4 &&
        ((data[0] == 'I' && data[1] == 'I' && data[2] == 42 && data[3] == 0) ||
         (data[0] == 'M' && data[1] == 'M' && data[2] == 0 && data[3] == 42))) {
        return image_format::tiff;
    }
    if (data.size() >= 5 && data[0] == '%' && data[1] == 'P' && data[2] == 'D' &&
        data[3] == 'F' && data[4] == '-') {
        return image_format::pdf;
    }
    return image_format::unknown;
}

image_format format_from_media_type(std::string_view media_type) noexcept {
    if (media_type == "image/jpeg" || media_type == "image/jpg") return image_format::jpeg;
    if (media_type == "image/png") return image_format::png;
    if (media_type == "image/tiff" || media_type == "image/tif") return image_format::tiff;
    if (media_type == "application/pdf") return image_format::pdf;
    return image_format::unknown;
}

std::unique_ptr<image_codec> create_codec(image_format format) {
    switch (format) {
        case image_format::jpeg:
            return std::make_unique<jpeg_codec>();
        case image_format::png:
            return std::make_unique<png_codec>();
        default:
            return nullptr;
    }
}

decode_result decode_image(std::span<const uint8_t> data) {
    const auto format = detect_format(data);
    auto codec = create_codec(format);
    if (!codec) {
        return sgkdoc::sgkdoc_error<raster_image>(
            sgkdoc::error_codes::unsupported_image_format,
            "No raster decoder for " + std::string(to_string(format)));
    }
    return codec->decode(data);
}

}  // namespace sgkdoc::imaging
