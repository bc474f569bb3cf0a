#ifndef SGKDOC_GEOMETRY_GEOMETRY_RECTIFIER_HPP
#define SGKDOC_GEOMETRY_GEOMETRY_RECTIFIER_HPP

#include "sgkdoc/geometry/boundary_strategy.hpp"
#include "sgkdoc/geometry/quadrilateral.hpp"
#include "sgkdoc/imaging/raster_image.hpp"
#include <sgkdoc/di/ilogger.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace sgkdoc::geometry {

/**
 * @brief Tunables for page detection.
 */
struct rectifier_config {
    /// Longest side of the analysis raster
    uint32_t max_analysis_dimension{1200};

    /// Fallback trim per side, as a fraction of min(width, height)
    double fallback_margin_fraction{0.05};

    /// Best candidate must score strictly above this
    double min_candidate_score{0.5};

    /// Final validation window for the accepted outline
    double min_area_ratio{0.20};
    double max_area_ratio{0.95};
    double min_aspect_ratio{0.5};
    double max_aspect_ratio{2.5};
};

/**
 * @brief How the output raster was obtained.
 */
enum class detection_method {
    boundary,     ///< page outline detected and cropped
    margin_trim,  ///< no confident outline; uniform margin removed
    none          ///< input could not be processed; original kept
};

[[nodiscard]] std::string_view to_string(detection_method method) noexcept;

/**
 * @brief Output of the rectifier. Always carries a usable image unless the
 * input itself could not be decoded.
 */
struct rectified_image {
    imaging::raster_image image;

    bool boundary_detected{false};

    /// False when the input could not be decoded or processed
    bool processing_applied{false};

    detection_method method{detection_method::none};

    /// Outline in source-resolution coordinates
    std::optional<quadrilateral> boundary;

    /// Strategy that produced the accepted outline
    std::string strategy;

    double score{0.0};

    /// Reason processing was skipped, for diagnostics
    std::string error;
};

/**
 * @class geometry_rectifier
 * @brief Finds the photographed page and crops it.
 *
 * Candidates from every registered strategy are scored:
 * +0.4 when the area ratio lies in [0.2, 0.9], +0.3 when the aspect ratio
 * lies in [0.7, 1.5], and +0.3 x rectangularity. The best candidate above
 * the configured minimum score that also passes the validation window is
 * cropped (bounding box, scaled back to source resolution). Otherwise a
 * uniform margin is trimmed.
 *
 * rectify() never throws and never returns an image larger than its input.
 *
 * Thread Safety: const methods may be called concurrently.
 */
class geometry_rectifier {
public:
    explicit geometry_rectifier(rectifier_config config = {},
                                std::shared_ptr<di::ILogger> logger = nullptr);

    geometry_rectifier(rectifier_config config,
                       std::vector<std::unique_ptr<boundary_strategy>> strategies,
                       std::shared_ptr<di::ILogger> logger = nullptr);

    geometry_rectifier(const geometry_rectifier&) = delete;
    geometry_rectifier& operator=(const geometry_rectifier&) = delete;
    geometry_rectifier(geometry_rectifier&&) noexcept = default;
    geometry_rectifier& operator=(geometry_rectifier&&) noexcept = default;

    /**
     * @brief edge_bounds (8%), edge_contour (10%) and content_histogram.
     */
    [[nodiscard]] static std::vector<std::unique_ptr<boundary_strategy>> default_strategies();

    [[nodiscard]] rectified_image rectify(const imaging::raster_image& image) const noexcept;

    /**
     * @brief Decodes then rectifies; undecodable input yields an empty image
     * with processing_applied = false.
     */
    [[nodiscard]] rectified_image rectify_encoded(std::span<const uint8_t> data) const noexcept;

    [[nodiscard]] static double score_candidate(const quadrilateral& quad,
                                                uint32_t frame_width,
                                                uint32_t frame_height) noexcept;

    [[nodiscard]] bool is_valid_document(const quadrilateral& quad,
                                         uint32_t frame_width,
                                         uint32_t frame_height) const noexcept;

    [[nodiscard]] const rectifier_config& config() const noexcept { return config_; }

private:
    [[nodiscard]] rectified_image margin_trim(const imaging::raster_image& image) const;

    rectifier_config config_;
    std::vector<std::unique_ptr<boundary_strategy>> strategies_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace sgkdoc::geometry

#endif  // SGKDOC_GEOMETRY_GEOMETRY_RECTIFIER_HPP
