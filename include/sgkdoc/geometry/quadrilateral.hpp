#ifndef SGKDOC_GEOMETRY_QUADRILATERAL_HPP
#define SGKDOC_GEOMETRY_QUADRILATERAL_HPP

#include <array>
#include <cstdint>

namespace sgkdoc::geometry {

struct point {
    double x{0.0};
    double y{0.0};
};

/**
 * @brief Axis-aligned integer rectangle, [x, x+width) x [y, y+height).
 */
struct pixel_rect {
    uint32_t x{0};
    uint32_t y{0};
    uint32_t width{0};
    uint32_t height{0};
};

/**
 * @brief Page outline as four corners in clockwise order starting top-left.
 */
struct quadrilateral {
    std::array<point, 4> corners{};

    [[nodiscard]] static quadrilateral from_bounds(double left, double top,
                                                   double right, double bottom) noexcept;

    /// Shoelace area
    [[nodiscard]] double area() const noexcept;

    [[nodiscard]] double min_x() const noexcept;
    [[nodiscard]] double max_x() const noexcept;
    [[nodiscard]] double min_y() const noexcept;
    [[nodiscard]] double max_y() const noexcept;

    [[nodiscard]] double bounding_width() const noexcept { return max_x() - min_x(); }
    [[nodiscard]] double bounding_height() const noexcept { return max_y() - min_y(); }

    /// Bounding box width / height (0 when degenerate)
    [[nodiscard]] double aspect_ratio() const noexcept;

    /// min(side) / max(side) of the bounding box, in [0, 1]
    [[nodiscard]] double side_ratio() const noexcept;

    /// Interior angle at corner @p index, in degrees
    [[nodiscard]] double corner_angle(int index) const noexcept;

    /// 0.25 for each corner within @p tolerance_deg of 90 degrees
    [[nodiscard]] double rectangularity(double tolerance_deg = 15.0) const noexcept;

    /// Longest of each pair of opposite edges: {width, height}
    [[nodiscard]] std::array<double, 2> opposite_edge_extent() const noexcept;

    [[nodiscard]] quadrilateral scaled(double factor) const noexcept;

    /**
     * @brief Bounding box clamped to a frame of @p frame_width x @p frame_height.
     */
    [[nodiscard]] pixel_rect bounding_rect(uint32_t frame_width,
                                           uint32_t frame_height) const noexcept;
};

}  // namespace sgkdoc::geometry

#endif  // SGKDOC_GEOMETRY_QUADRILATERAL_HPP
