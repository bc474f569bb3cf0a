#ifndef SGKDOC_GEOMETRY_BOUNDARY_STRATEGY_HPP
#define SGKDOC_GEOMETRY_BOUNDARY_STRATEGY_HPP

#include "sgkdoc/geometry/quadrilateral.hpp"
#include "sgkdoc/imaging/raster_image.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace sgkdoc::geometry {

/**
 * @brief Precomputed planes shared by all strategies for one image.
 *
 * All planes have the dimensions of the downscaled analysis raster.
 */
struct analysis_frame {
    imaging::gray_plane gray;
    imaging::gray_plane edges;

    [[nodiscard]] uint32_t width() const noexcept { return gray.width; }
    [[nodiscard]] uint32_t height() const noexcept { return gray.height; }
};

/**
 * @brief One way of locating the page outline in an analysis frame.
 *
 * A strategy returns a candidate only when it passes its own acceptance
 * window; the rectifier scores the candidates of all strategies and keeps
 * the best. Strategies must not throw for any input.
 */
class boundary_strategy {
public:
    virtual ~boundary_strategy() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    [[nodiscard]] virtual std::optional<quadrilateral> detect(
        const analysis_frame& frame) const = 0;

protected:
    boundary_strategy() = default;
};

/**
 * @brief Options for the border-inward edge density scan.
 */
struct edge_scan_options {
    std::string name{"edge_bounds"};

    /// A row/column is a border when its edge pixels exceed this fraction
    double line_fraction{0.08};

    /// Scan starts this fraction of min(w, h) inside each border
    double margin_fraction{0.05};

    /// Accepted area window as a fraction of the frame
    double min_area_ratio{0.15};
    double max_area_ratio{0.95};

    /// Candidate width and height must each exceed this fraction of the frame
    double min_extent_ratio{0.3};
};

/**
 * @brief Scans inward from each border for the first dense edge line.
 */
class edge_scan_strategy final : public boundary_strategy {
public:
    explicit edge_scan_strategy(edge_scan_options options = {});

    [[nodiscard]] std::string_view name() const noexcept override;

    [[nodiscard]] std::optional<quadrilateral> detect(
        const analysis_frame& frame) const override;

    [[nodiscard]] const edge_scan_options& options() const noexcept { return options_; }

private:
    edge_scan_options options_;
};

/**
 * @brief Thresholds the gray plane at the darkest histogram peak and scans
 * for rows/columns with enough "content" pixels.
 *
 * Works on low-contrast photos where the page edge is too soft for the
 * gradient scan.
 */
class content_histogram_strategy final : public boundary_strategy {
public:
    [[nodiscard]] std::string_view name() const noexcept override;

    [[nodiscard]] std::optional<quadrilateral> detect(
        const analysis_frame& frame) const override;

    /**
     * @brief Background threshold: darkest significant peak + 30, or 128.
     */
    [[nodiscard]] static int background_threshold(const imaging::gray_plane& gray);
};

}  // namespace sgkdoc::geometry

#endif  // SGKDOC_GEOMETRY_BOUNDARY_STRATEGY_HPP
