#include "sgkdoc/imaging/jpeg_codec.hpp"

#include <algorithm>
#include <csetjmp>
#include <cstdio>
#include <cstdlib>
#include <string>

#include <jpeglib.h>
#include <jerror.h>

namespace sgkdoc::imaging {

namespace {

/**
 * @brief libjpeg error manager that longjmps back with the message.
 */
struct jpeg_error_handler {
    jpeg_error_mgr pub;          // must be first
    jmp_buf setjmp_buffer;
    std::string error_message;
};

void jpeg_error_exit(j_common_ptr cinfo) {
    auto* err = reinterpret_cast<jpeg_error_handler*>(cinfo->err);

    char buffer[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, buffer);
    err->error_message = buffer;

    std::longjmp(err->setjmp_buffer, 1);
}

// Warnings (corrupt-but-readable data) are not fatal for photographed pages
void jpeg_output_message([[maybe_unused]] j_common_ptr cinfo) {}

class jpeg_compressor {
public:
    jpeg_compressor() {
        cinfo_.err = jpeg_std_error(&jerr_.pub);
        jerr_.pub.error_exit = jpeg_error_exit;
        jerr_.pub.output_message = jpeg_output_message;
        jpeg_create_compress(&cinfo_);
    }

    ~jpeg_compressor() { jpeg_destroy_compress(&cinfo_); }

    jpeg_compressor(const jpeg_compressor&) = delete;
    jpeg_compressor& operator=(const jpeg_compressor&) = delete;

    jpeg_compress_struct* operator->() { return &cinfo_; }
    jpeg_compress_struct& get() { return cinfo_; }
    jpeg_error_handler& error() { return jerr_; }

private:
    jpeg_compress_struct cinfo_{};
    jpeg_error_handler jerr_{};
};

class jpeg_decompressor {
public:
    jpeg_decompressor() {
        cinfo_.err = jpeg_std_error(&jerr_.pub);
        jerr_.pub.error_exit = jpeg_error_exit;
        jerr_.pub.output_message = jpeg_output_message;
        jpeg_create_decompress(&cinfo_);
    }

    ~jpeg_decompressor() { jpeg_destroy_decompress(&cinfo_); }

    jpeg_decompressor(const jpeg_decompressor&) = delete;
    jpeg_decompressor& operator=(const jpeg_decompressor&) = delete;

    jpeg_decompress_struct* operator->() { return &cinfo_; }
    jpeg_decompress_struct& get() { return cinfo_; }
    jpeg_error_handler& error() { return jerr_; }

private:
    jpeg_decompress_struct cinfo_{};
    jpeg_error_handler jerr_{};
};

encode_result make_encode_error(const std::string& message) {
    return sgkdoc::sgkdoc_error<std::vector<uint8_t>>(
        sgkdoc::error_codes::image_encode_error, message);
}

decode_result make_decode_error(const std::string& message) {
    return sgkdoc::sgkdoc_error<raster_image>(
        sgkdoc::error_codes::image_decode_error, message);
}

void apply_subsampling(jpeg_compress_struct& cinfo, int mode) {
    int luma_h = 2;
    int luma_v = 2;
    switch (mode) {
        case 0:  // 4:4:4
            luma_h = 1;
            luma_v = 1;
            break;
        case 1:  // 4:2:2
            luma_h = 2;
            luma_v = 1;
            break;
        default:  // 4:2:0
            break;
    }
    cinfo.comp_info[0].h_samp_factor = luma_h;
    cinfo.comp_info[0].v_samp_factor = luma_v;
    for (int c = 1; c < 3; ++c) {
        cinfo.comp_info[c].h_samp_factor = 1;
        cinfo.comp_info[c].v_samp_factor = 1;
    }
}

}  // namespace

class jpeg_codec::impl {
public:
    [[nodiscard]] encode_result encode(const raster_image& image,
                                       const encode_options& options) const {
        if (!image.valid()) {
            return make_encode_error(
                "Invalid raster for JPEG: " + std::to_string(image.width) + "x" +
                std::to_string(image.height) + "x" + std::to_string(image.channels));
        }

        jpeg_compressor compressor;
        unsigned char* out_buffer = nullptr;
        unsigned long out_size = 0;

        if (setjmp(compressor.error().setjmp_buffer)) {
            std::free(out_buffer);
            return make_encode_error("JPEG compression failed: " +
                                     compressor.error().error_message);
        }

        jpeg_mem_dest(&compressor.get(), &out_buffer, &out_size);

        compressor->image_width = image.width;
        compressor->image_height = image.height;
        compressor->input_components = static_cast<int>(image.channels);
        compressor->in_color_space = image.is_grayscale() ? JCS_GRAYSCALE : JCS_RGB;

        jpeg_set_defaults(&compressor.get());
        jpeg_set_quality(&compressor.get(), std::clamp(options.quality, 1, 100), TRUE);
        if (!image.is_grayscale()) {
            apply_subsampling(compressor.get(), options.chroma_subsampling);
        }

        jpeg_start_compress(&compressor.get(), TRUE);

        const auto row_stride = image.row_stride();
        while (compressor->next_scanline < compressor->image_height) {
            auto row = const_cast<JSAMPROW>(
                image.pixels.data() + compressor->next_scanline * row_stride);
            jpeg_write_scanlines(&compressor.get(), &row, 1);
        }

        jpeg_finish_compress(&compressor.get());

        std::vector<uint8_t> result(out_buffer, out_buffer + out_size);
        std::free(out_buffer);

        return result;
    }

    [[nodiscard]] decode_result decode(std::span<const uint8_t> data) const {
        if (data.empty()) {
            return make_decode_error("Empty JPEG data");
        }

        jpeg_decompressor decompressor;

        if (setjmp(decompressor.error().setjmp_buffer)) {
            return make_decode_error("JPEG decompression failed: " +
                                     decompressor.error().error_message);
        }

        jpeg_mem_src(&decompressor.get(),
                     const_cast<unsigned char*>(data.data()),
                     static_cast<unsigned long>(data.size()));

        if (jpeg_read_header(&decompressor.get(), TRUE) != JPEG_HEADER_OK) {
            return make_decode_error("Invalid JPEG header");
        }

        if (decompressor->num_components != 1) {
            // CMYK/YCCK scans from some phone apps are converted as well
            decompressor->out_color_space = JCS_RGB;
        }

        jpeg_start_decompress(&decompressor.get());

        raster_image image;
        image.width = decompressor->output_width;
        image.height = decompressor->output_height;
        image.channels = static_cast<uint16_t>(decompressor->output_components);
        image.pixels.resize(image.frame_size_bytes());

        const auto row_stride = image.row_stride();
        while (decompressor->output_scanline < decompressor->output_height) {
            JSAMPROW row = image.pixels.data() +
                           static_cast<size_t>(decompressor->output_scanline) * row_stride;
            jpeg_read_scanlines(&decompressor.get(), &row, 1);
        }

        jpeg_finish_decompress(&decompressor.get());

        if (!image.valid()) {
            return make_decode_error("Unsupported JPEG component count: " +
                                     std::to_string(image.channels));
        }
        return image;
    }
};

jpeg_codec::jpeg_codec() : impl_(std::make_unique<impl>()) {}

jpeg_codec::~jpeg_codec() = default;

jpeg_codec::jpeg_codec(jpeg_codec&&) noexcept = default;

jpeg_codec& jpeg_codec::operator=(jpeg_codec&&) noexcept = default;

std::string_view jpeg_codec::name() const noexcept {
    return "JPEG (libjpeg)";
}

image_format jpeg_codec::format() const noexcept {
    return image_format::jpeg;
}

decode_result jpeg_codec::decode(std::span<const uint8_t> data) const {
    return impl_->decode(data);
}

encode_result jpeg_codec::encode(const raster_image& image,
                                 const encode_options& options) const {
    return impl_->encode(image, options);
}

}  // namespace sgkdoc::imaging
