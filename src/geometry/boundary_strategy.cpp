#include "sgkdoc/geometry/boundary_strategy.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <utility>
#include <vector>

namespace sgkdoc::geometry {

namespace {

bool accept_bounds(double left, double top, double right, double bottom,
                   double frame_width, double frame_height,
                   double min_area, double max_area, double min_extent,
                   bool inclusive_window) {
    const double width = right - left;
    const double height = bottom - top;
    if (width <= 0.0 || height <= 0.0) {
        return false;
    }
    const double ratio = (width * height) / (frame_width * frame_height);
    const bool in_window = inclusive_window
                               ? (ratio >= min_area && ratio <= max_area)
                               : (ratio > min_area && ratio < max_area);
    return in_window &&
           width > frame_width * min_extent &&
           height > frame_height * min_extent;
}

}  // namespace

// =============================================================================
// edge_scan_strategy
// =============================================================================

edge_scan_strategy::edge_scan_strategy(edge_scan_options options)
    : options_(std::move(options)) {}

std::string_view edge_scan_strategy::name() const noexcept {
    return options_.name;
}

std::optional<quadrilateral> edge_scan_strategy::detect(const analysis_frame& frame) const {
    const auto& edges = frame.edges;
    const int w = static_cast<int>(edges.width);
    const int h = static_cast<int>(edges.height);
    if (w < 8 || h < 8) {
        return std::nullopt;
    }

    const int margin = static_cast<int>(std::min(w, h) * options_.margin_fraction);

    auto row_count = [&](int y) {
        int count = 0;
        for (int x = 0; x < w; ++x) {
            if (edges.at(x, y) > 0) ++count;
        }
        return count;
    };
    auto column_count = [&](int x, int y_from, int y_to) {
        int count = 0;
        for (int y = y_from; y <= y_to; ++y) {
            if (edges.at(x, y) > 0) ++count;
        }
        return count;
    };

    const double row_threshold = w * options_.line_fraction;

    std::optional<int> top;
    for (int y = margin; y < h / 2; ++y) {
        if (row_count(y) > row_threshold) {
            top = y;
            break;
        }
    }

    std::optional<int> bottom;
    for (int y = h - 1 - margin; y > h / 2; --y) {
        if (row_count(y) > row_threshold) {
            bottom = y;
            break;
        }
    }

    if (!top || !bottom) {
        return std::nullopt;
    }

    const double column_threshold = (*bottom - *top + 1) * options_.line_fraction;

    std::optional<int> left;
    for (int x = margin; x < w / 2; ++x) {
        if (column_count(x, *top, *bottom) > column_threshold) {
            left = x;
            break;
        }
    }

    std::optional<int> right;
    for (int x = w - 1 - margin; x > w / 2; --x) {
        if (column_count(x, *top, *bottom) > column_threshold) {
            right = x;
            break;
        }
    }

    if (!left || !right) {
        return std::nullopt;
    }

    // Detected lines are inclusive pixel positions
    const double l = *left;
    const double t = *top;
    const double r = *right + 1.0;
    const double b = *bottom + 1.0;

    if (!accept_bounds(l, t, r, b, w, h, options_.min_area_ratio,
                       options_.max_area_ratio, options_.min_extent_ratio, true)) {
        return std::nullopt;
    }
    return quadrilateral::from_bounds(l, t, r, b);
}

// =============================================================================
// content_histogram_strategy
// =============================================================================

std::string_view content_histogram_strategy::name() const noexcept {
    return "content_histogram";
}

int content_histogram_strategy::background_threshold(const imaging::gray_plane& gray) {
    std::array<double, 256> histogram{};
    for (uint8_t v : gray.data) {
        histogram[v] += 1.0;
    }

    constexpr int window = 5;
    std::array<double, 256> smoothed{};
    for (int i = 0; i < 256; ++i) {
        double sum = 0.0;
        int count = 0;
        for (int j = std::max(0, i - window); j <= std::min(255, i + window); ++j) {
            sum += histogram[j];
            ++count;
        }
        smoothed[i] = sum / count;
    }

    std::vector<int> peaks;
    for (int i = 1; i < 255; ++i) {
        if (smoothed[i] > smoothed[i - 1] && smoothed[i] > smoothed[i + 1] &&
            smoothed[i] > 100.0) {
            peaks.push_back(i);
        }
    }
    std::sort(peaks.begin(), peaks.end(),
              [&](int a, int b) { return smoothed[a] > smoothed[b]; });
    if (peaks.size() > 3) {
        peaks.resize(3);
    }

    if (peaks.size() > 1) {
        return *std::min_element(peaks.begin(), peaks.end()) + 30;
    }
    return 128;
}

std::optional<quadrilateral> content_histogram_strategy::detect(
    const analysis_frame& frame) const {
    const auto& gray = frame.gray;
    const int w = static_cast<int>(gray.width);
    const int h = static_cast<int>(gray.height);
    if (w < 8 || h < 8) {
        return std::nullopt;
    }

    constexpr double min_content_ratio = 0.15;
    constexpr int padding = 10;
    const int threshold = background_threshold(gray);

    auto is_content = [&](int x, int y) { return gray.at(x, y) < threshold; };

    int top = 0;
    int bottom = h - 1;
    int left = 0;
    int right = w - 1;

    for (int y = 0; y < h * 0.4; ++y) {
        int content = 0;
        for (int x = 0; x < w; ++x) content += is_content(x, y) ? 1 : 0;
        if (static_cast<double>(content) / w > min_content_ratio) {
            top = std::max(0, y - padding);
            break;
        }
    }

    for (int y = h - 1; y > h * 0.6; --y) {
        int content = 0;
        for (int x = 0; x < w; ++x) content += is_content(x, y) ? 1 : 0;
        if (static_cast<double>(content) / w > min_content_ratio) {
            bottom = std::min(h - 1, y + padding);
            break;
        }
    }

    const int span = bottom - top + 1;
    for (int x = 0; x < w * 0.4; ++x) {
        int content = 0;
        for (int y = top; y <= bottom; ++y) content += is_content(x, y) ? 1 : 0;
        if (static_cast<double>(content) / span > min_content_ratio) {
            left = std::max(0, x - padding);
            break;
        }
    }

    for (int x = w - 1; x > w * 0.6; --x) {
        int content = 0;
        for (int y = top; y <= bottom; ++y) content += is_content(x, y) ? 1 : 0;
        if (static_cast<double>(content) / span > min_content_ratio) {
            right = std::min(w - 1, x + padding);
            break;
        }
    }

    if (!accept_bounds(left, top, right, bottom, w, h, 0.10, 0.95, 0.3, false)) {
        return std::nullopt;
    }
    return quadrilateral::from_bounds(left, top, right, bottom);
}

}  // namespace sgkdoc::geometry
