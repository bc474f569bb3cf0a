#include "sgkdoc/geometry/quadrilateral.hpp"

#include <algorithm>
#include <cmath>

namespace sgkdoc::geometry {

namespace {

constexpr double pi = 3.14159265358979323846;

double distance(const point& a, const point& b) noexcept {
    return std::hypot(a.x - b.x, a.y - b.y);
}

}  // namespace

quadrilateral quadrilateral::from_bounds(double left, double top,
                                         double right, double bottom) noexcept {
    quadrilateral quad;
    quad.corners = {point{left, top}, point{right, top},
                    point{right, bottom}, point{left, bottom}};
    return quad;
}

double quadrilateral::area() const noexcept {
    double sum = 0.0;
    for (int i = 0; i < 4; ++i) {
        const auto& a = corners[i];
        const auto& b = corners[(i + 1) % 4];
        sum += a.x * b.y - b.x * a.y;
    }
    return std::abs(sum) / 2.0;
}

double quadrilateral::min_x() const noexcept {
    return std::min({corners[0].x, corners[1].x, corners[2].x, corners[3].x});
}

double quadrilateral::max_x() const noexcept {
    return std::max({corners[0].x, corners[1].x, corners[2].x, corners[3].x});
}

double quadrilateral::min_y() const noexcept {
    return std::min({corners[0].y, corners[1].y, corners[2].y, corners[3].y});
}

double quadrilateral::max_y() const noexcept {
    return std::max({corners[0].y, corners[1].y, corners[2].y, corners[3].y});
}

double quadrilateral::aspect_ratio() const noexcept {
    const double h = bounding_height();
    return h > 0.0 ? bounding_width() / h : 0.0;
}

double quadrilateral::side_ratio() const noexcept {
    const double w = bounding_width();
    const double h = bounding_height();
    const double longest = std::max(w, h);
    return longest > 0.0 ? std::min(w, h) / longest : 0.0;
}

double quadrilateral::corner_angle(int index) const noexcept {
    const auto& prev = corners[(index + 3) % 4];
    const auto& here = corners[index % 4];
    const auto& next = corners[(index + 1) % 4];

    const double v1x = prev.x - here.x;
    const double v1y = prev.y - here.y;
    const double v2x = next.x - here.x;
    const double v2y = next.y - here.y;

    const double dot = v1x * v2x + v1y * v2y;
    const double cross = v1x * v2y - v1y * v2x;
    return std::abs(std::atan2(cross, dot) * 180.0 / pi);
}

double quadrilateral::rectangularity(double tolerance_deg) const noexcept {
    double score = 0.0;
    for (int i = 0; i < 4; ++i) {
        if (std::abs(corner_angle(i) - 90.0) <= tolerance_deg) {
            score += 0.25;
        }
    }
    return score;
}

std::array<double, 2> quadrilateral::opposite_edge_extent() const noexcept {
    const double top = distance(corners[0], corners[1]);
    const double bottom = distance(corners[3], corners[2]);
    const double left = distance(corners[0], corners[3]);
    const double right = distance(corners[1], corners[2]);
    return {std::max(top, bottom), std::max(left, right)};
}

quadrilateral quadrilateral::scaled(double factor) const noexcept {
    quadrilateral out = *this;
    for (auto& c : out.corners) {
        c.x *= factor;
        c.y *= factor;
    }
    return out;
}

pixel_rect quadrilateral::bounding_rect(uint32_t frame_width,
                                        uint32_t frame_height) const noexcept {
    pixel_rect rect;
    if (frame_width == 0 || frame_height == 0) {
        return rect;
    }

    const double left = std::clamp(std::floor(min_x()), 0.0, static_cast<double>(frame_width - 1));
    const double top = std::clamp(std::floor(min_y()), 0.0, static_cast<double>(frame_height - 1));
    const double right = std::clamp(std::ceil(max_x()), left + 1.0, static_cast<double>(frame_width));
    const double bottom = std::clamp(std::ceil(max_y()), top + 1.0, static_cast<double>(frame_height));

    rect.x = static_cast<uint32_t>(left);
    rect.y = static_cast<uint32_t>(top);
    rect.width = static_cast<uint32_t>(right - left);
    rect.height = static_cast<uint32_t>(bottom - top);
    return rect;
}

}  // namespace sgkdoc::geometry
