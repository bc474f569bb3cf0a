#include "sgkdoc/geometry/geometry_rectifier.hpp"

#include "sgkdoc/imaging/image_codec.hpp"
#include "sgkdoc/imaging/image_ops.hpp"

#include <cmath>
#include <exception>
#include <utility>

namespace sgkdoc::geometry {

std::string_view to_string(detection_method method) noexcept {
    switch (method) {
        case detection_method::boundary: return "automatic";
        case detection_method::margin_trim: return "fallback";
        case detection_method::none:
        default: return "none";
    }
}

geometry_rectifier::geometry_rectifier(rectifier_config config,
                                       std::shared_ptr<di::ILogger> logger)
    : geometry_rectifier(config, default_strategies(), std::move(logger)) {}

geometry_rectifier::geometry_rectifier(
    rectifier_config config,
    std::vector<std::unique_ptr<boundary_strategy>> strategies,
    std::shared_ptr<di::ILogger> logger)
    : config_(config),
      strategies_(std::move(strategies)),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

std::vector<std::unique_ptr<boundary_strategy>> geometry_rectifier::default_strategies() {
    std::vector<std::unique_ptr<boundary_strategy>> strategies;

    edge_scan_options bounds;
    bounds.name = "edge_bounds";
    bounds.line_fraction = 0.08;
    bounds.min_area_ratio = 0.15;
    bounds.max_area_ratio = 0.95;
    strategies.push_back(std::make_unique<edge_scan_strategy>(bounds));

    edge_scan_options contour;
    contour.name = "edge_contour";
    contour.line_fraction = 0.10;
    contour.min_area_ratio = 0.10;
    contour.max_area_ratio = 0.90;
    strategies.push_back(std::make_unique<edge_scan_strategy>(contour));

    strategies.push_back(std::make_unique<content_histogram_strategy>());
    return strategies;
}

double geometry_rectifier::score_candidate(const quadrilateral& quad,
                                           uint32_t frame_width,
                                           uint32_t frame_height) noexcept {
    const double frame_area = static_cast<double>(frame_width) * frame_height;
    if (frame_area <= 0.0) {
        return 0.0;
    }

    double score = 0.0;
    const double area_ratio = quad.area() / frame_area;
    if (area_ratio >= 0.2 && area_ratio <= 0.9) {
        score += 0.4;
    }
    const double aspect = quad.aspect_ratio();
    if (aspect >= 0.7 && aspect <= 1.5) {
        score += 0.3;
    }
    score += 0.3 * quad.rectangularity();
    return score;
}

bool geometry_rectifier::is_valid_document(const quadrilateral& quad,
                                           uint32_t frame_width,
                                           uint32_t frame_height) const noexcept {
    const double frame_area = static_cast<double>(frame_width) * frame_height;
    if (frame_area <= 0.0) {
        return false;
    }
    const double area_ratio = quad.area() / frame_area;
    if (area_ratio < config_.min_area_ratio || area_ratio > config_.max_area_ratio) {
        return false;
    }
    const double aspect = quad.aspect_ratio();
    return aspect >= config_.min_aspect_ratio && aspect <= config_.max_aspect_ratio;
}

rectified_image geometry_rectifier::margin_trim(const imaging::raster_image& image) const {
    rectified_image result;
    result.processing_applied = true;
    result.method = detection_method::margin_trim;

    const auto margin = static_cast<uint32_t>(
        std::floor(std::min(image.width, image.height) * config_.fallback_margin_fraction));
    if (margin == 0 || 2 * margin >= image.width || 2 * margin >= image.height) {
        result.image = image;
        return result;
    }

    result.image = imaging::crop(image, margin, margin,
                                 image.width - 2 * margin, image.height - 2 * margin);
    return result;
}

rectified_image geometry_rectifier::rectify(const imaging::raster_image& image) const noexcept {
    rectified_image result;

    try {
        if (!image.valid()) {
            result.image = image;
            result.error = "invalid raster";
            logger_->warn("Rectifier received an invalid raster; keeping input");
            return result;
        }

        double scale = 1.0;
        auto analysis = imaging::fit_within(image, config_.max_analysis_dimension, scale);

        analysis_frame frame;
        frame.gray = imaging::blur_5tap(imaging::to_grayscale(analysis));
        frame.edges = imaging::sobel_edges(frame.gray);

        std::optional<quadrilateral> best;
        std::string best_strategy;
        double best_score = 0.0;

        for (const auto& strategy : strategies_) {
            auto candidate = strategy->detect(frame);
            if (!candidate) {
                logger_->debug_fmt("Strategy {} found no outline", strategy->name());
                continue;
            }
            double score = score_candidate(*candidate, frame.width(), frame.height());
            logger_->debug_fmt("Strategy {} outline score {:.2f}", strategy->name(), score);
            if (!best || score > best_score) {
                best = candidate;
                best_score = score;
                best_strategy = std::string(strategy->name());
            }
        }

        if (best && best_score > config_.min_candidate_score &&
            is_valid_document(*best, frame.width(), frame.height())) {
            const auto outline = best->scaled(1.0 / scale);
            const auto rect = outline.bounding_rect(image.width, image.height);

            result.image = imaging::crop(image, rect.x, rect.y, rect.width, rect.height);
            if (result.image.valid()) {
                result.boundary_detected = true;
                result.processing_applied = true;
                result.method = detection_method::boundary;
                result.boundary = outline;
                result.strategy = best_strategy;
                result.score = best_score;

                logger_->info_fmt("Page outline detected by {} (score {:.2f}): {}x{} of {}x{}",
                                  best_strategy, best_score, rect.width, rect.height,
                                  image.width, image.height);
                return result;
            }
        }

        logger_->info_fmt("No confident page outline in {}x{}; trimming margins",
                          image.width, image.height);
        return margin_trim(image);
    } catch (const std::exception& e) {
        logger_->error_fmt("Rectification failed, keeping original: {}", e.what());
        rectified_image fallback;
        fallback.error = e.what();
        try {
            fallback.image = image;
        } catch (const std::bad_alloc&) {
            fallback.error += " (original not retained)";
        }
        return fallback;
    }
}

rectified_image geometry_rectifier::rectify_encoded(std::span<const uint8_t> data) const noexcept {
    try {
        auto decoded = imaging::decode_image(data);
        if (decoded.is_err()) {
            logger_->warn_fmt("Image not decodable for rectification: {}",
                              decoded.error().message);
            rectified_image result;
            result.error = decoded.error().message;
            return result;
        }
        return rectify(decoded.value());
    } catch (const std::exception& e) {
        logger_->error_fmt("Image decoding failed: {}", e.what());
        rectified_image result;
        result.error = e.what();
        return result;
    }
}

}  // namespace sgkdoc::geometry
