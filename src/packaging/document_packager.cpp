/**
 * @file document_packager.cpp
 * @brief Implementation of budgeted PDF packaging
 */

#include "sgkdoc/packaging/document_packager.hpp"

#include "sgkdoc/imaging/image_ops.hpp"
#include <sgkdoc/compat/format.hpp>
#include <sgkdoc/compat/time.hpp>

#include <algorithm>
#include <cmath>
#include <exception>
#include <utility>

namespace sgkdoc::packaging {

namespace {

uint32_t shrink(uint32_t value, double factor) {
    if (value <= 1) {
        return 1;
    }
    auto next = static_cast<uint32_t>(std::floor(value * factor));
    if (next >= value) {
        next = value - 1;
    }
    return std::max<uint32_t>(next, 1);
}

pdf_footer make_footer(const filename_request& naming, const std::string& filename) {
    pdf_footer footer;
    footer.date = document_packager::format_date(naming.timestamp);
    footer.patient_name = !naming.matched_name.empty() ? naming.matched_name
                                                       : naming.extracted_name;
    footer.file_name = filename;
    return footer;
}

}  // namespace

document_packager::document_packager(packager_config config,
                                     std::shared_ptr<di::ILogger> logger)
    : config_(config),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

std::string document_packager::format_date(std::chrono::system_clock::time_point when) {
    const auto tm = compat::to_local_tm(when);
    return sgkdoc::compat::format("{:02}.{:02}.{:04}", tm.tm_mday, tm.tm_mon + 1,
                                  tm.tm_year + 1900);
}

std::vector<compression_attempt> document_packager::plan_compression(
    uint32_t width, uint32_t height, const packager_config& config) {
    std::vector<compression_attempt> plan;
    if (width == 0 || height == 0 || config.max_attempts <= 0) {
        return plan;
    }

    double quality = config.loop_start_quality;
    uint32_t w = std::min(config.loop_max_width, width);
    auto h = static_cast<uint32_t>(
        std::lround(static_cast<double>(w) * height / static_cast<double>(width)));
    h = std::max<uint32_t>(h, 1);

    for (int i = 0; i < config.max_attempts; ++i) {
        compression_attempt attempt;
        attempt.jpeg_quality = std::clamp(static_cast<int>(std::lround(quality * 100.0)), 1, 100);
        if (!plan.empty() && attempt.jpeg_quality >= plan.back().jpeg_quality) {
            attempt.jpeg_quality = std::max(plan.back().jpeg_quality - 1, 1);
        }
        if (plan.empty()) {
            attempt.width = w;
            attempt.height = h;
        } else {
            attempt.width = shrink(plan.back().width, config.dimension_factor);
            attempt.height = shrink(plan.back().height, config.dimension_factor);
        }
        plan.push_back(attempt);
        quality *= config.quality_factor;
    }
    return plan;
}

Result<std::vector<uint8_t>> document_packager::render(const imaging::raster_image& image,
                                                       int quality,
                                                       const pdf_footer& footer) const {
    auto codec = imaging::create_codec(imaging::image_format::jpeg);
    if (!codec) {
        return sgkdoc_error<std::vector<uint8_t>>(error_codes::image_encode_error,
                                                  "JPEG encoder unavailable");
    }

    imaging::encode_options options;
    options.quality = quality;
    auto jpeg = codec->encode(image, options);
    if (jpeg.is_err()) {
        return jpeg.error();
    }
    return writer_.render_image_page(image, jpeg.value(), footer);
}

packaged_document document_packager::package(const imaging::raster_image& image,
                                             const filename_request& naming) const {
    packaged_document result;
    result.filename = filename_builder::build(naming);

    try {
        if (!image.valid()) {
            logger_->warn("Packager received an invalid raster; emitting placeholder");
            return placeholder(naming);
        }

        const auto footer = make_footer(naming, result.filename);

        double scale = 1.0;
        const auto first_pass = imaging::fit_within(image, config_.initial_max_side, scale);
        auto initial = render(first_pass, config_.initial_quality, footer);
        if (initial.is_err()) {
            logger_->error_fmt("PDF conversion failed: {}", initial.error().message);
            return placeholder(naming);
        }

        result.initial_size = initial.value().size();
        if (result.initial_size <= config_.target_bytes) {
            result.bytes = std::move(initial.value());
            result.within_budget = true;
            logger_->debug_fmt("PDF {} fits budget at {} bytes", result.filename,
                               result.initial_size);
            return result;
        }

        logger_->info_fmt("PDF {} is {} KB, compressing to {} KB", result.filename,
                          result.initial_size / 1024, config_.target_bytes / 1024);

        std::vector<uint8_t> last;
        for (auto attempt : plan_compression(image.width, image.height, config_)) {
            const auto resized = imaging::resize_bilinear(image, attempt.width, attempt.height);
            auto rendered = render(resized, attempt.jpeg_quality, footer);
            if (rendered.is_err()) {
                logger_->warn_fmt("Compression attempt {} failed: {}",
                                  result.attempts.size() + 1, rendered.error().message);
                continue;
            }

            attempt.bytes = rendered.value().size();
            result.attempts.push_back(attempt);
            logger_->debug_fmt("Attempt {}: q{} {}x{} -> {} bytes", result.attempts.size(),
                               attempt.jpeg_quality, attempt.width, attempt.height,
                               attempt.bytes);

            last = std::move(rendered.value());
            if (attempt.bytes <= config_.target_bytes) {
                result.bytes = std::move(last);
                result.within_budget = true;
                return result;
            }
        }

        if (last.empty()) {
            logger_->error_fmt("Every compression attempt for {} failed", result.filename);
            return placeholder(naming);
        }

        logger_->warn_fmt("PDF {} still {} bytes after {} attempts; keeping last attempt",
                          result.filename, last.size(), result.attempts.size());
        result.bytes = std::move(last);
        return result;
    } catch (const std::exception& e) {
        logger_->error_fmt("Packaging failed, emitting placeholder: {}", e.what());
        return placeholder(naming);
    }
}

packaged_document document_packager::package_undecodable(std::span<const uint8_t> original,
                                                         imaging::image_format format,
                                                         const filename_request& naming) const {
    if (format == imaging::image_format::pdf && !original.empty() &&
        original.size() <= config_.target_bytes) {
        packaged_document result;
        result.filename = filename_builder::build(naming);
        result.bytes.assign(original.begin(), original.end());
        result.initial_size = result.bytes.size();
        result.within_budget = true;
        result.passthrough = true;
        logger_->info_fmt("Uploaded PDF stored unchanged ({} bytes)", result.initial_size);
        return result;
    }

    logger_->info_fmt("No raster decoder for {} ({} bytes); emitting placeholder",
                      imaging::to_string(format), original.size());
    return placeholder(naming);
}

packaged_document document_packager::placeholder(const filename_request& naming) const {
    packaged_document result;
    result.filename = filename_builder::build(naming);
    result.placeholder = true;

    const std::vector<std::string> lines = {
        "SGK Belgesi",
        "Dosya boyutu nedeniyle sıkıştırıldı",
        "Orijinal belge işlendi",
        "Yükleme tarihi: " + format_date(naming.timestamp),
    };

    auto rendered = writer_.render_text_page(lines);
    if (rendered.is_ok()) {
        result.bytes = std::move(rendered.value());
    } else {
        logger_->error_fmt("Placeholder rendering failed, using built-in PDF: {}",
                           rendered.error().message);
        result.bytes = pdf_writer::minimal_text_pdf(lines);
    }

    result.initial_size = result.bytes.size();
    result.within_budget = result.bytes.size() <= config_.target_bytes;
    return result;
}

Result<std::vector<uint8_t>> document_packager::make_preview(
    const imaging::raster_image& image) const {
    if (!image.valid()) {
        return sgkdoc_error<std::vector<uint8_t>>(error_codes::invalid_image_dimensions,
                                                  "Invalid raster for preview");
    }
    auto codec = imaging::create_codec(imaging::image_format::jpeg);
    if (!codec) {
        return sgkdoc_error<std::vector<uint8_t>>(error_codes::image_encode_error,
                                                  "JPEG encoder unavailable");
    }

    double scale = 1.0;
    const auto preview = imaging::fit_within(image, config_.preview_max_side, scale);
    imaging::encode_options options;
    options.quality = 80;
    return codec->encode(preview, options);
}

}  // namespace sgkdoc::packaging
