/**
 * @file geometry_rectifier_test.cpp
 * @brief Unit tests for page outline detection and cropping
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <sgkdoc/geometry/geometry_rectifier.hpp>
#include <sgkdoc/geometry/quadrilateral.hpp>
#include <sgkdoc/imaging/png_codec.hpp>

#include <cmath>
#include <cstdint>
#include <vector>

using namespace sgkdoc::geometry;
using namespace sgkdoc::imaging;
using Catch::Matchers::WithinAbs;

namespace {

/// Light page on a dark table, both uniform
raster_image make_page_on_table(uint32_t width, uint32_t height,
                                uint32_t left, uint32_t top,
                                uint32_t right, uint32_t bottom) {
    raster_image image;
    image.width = width;
    image.height = height;
    image.channels = 1;
    image.pixels.assign(image.frame_size_bytes(), 30);
    for (uint32_t y = top; y < bottom; ++y) {
        for (uint32_t x = left; x < right; ++x) {
            image.pixels[static_cast<size_t>(y) * width + x] = 230;
        }
    }
    return image;
}

raster_image make_uniform(uint32_t width, uint32_t height, uint8_t value) {
    raster_image image;
    image.width = width;
    image.height = height;
    image.channels = 3;
    image.pixels.assign(image.frame_size_bytes(), value);
    return image;
}

}  // namespace

TEST_CASE("Quadrilateral measurements", "[geometry][quadrilateral]") {
    auto quad = quadrilateral::from_bounds(0.0, 0.0, 10.0, 20.0);

    CHECK_THAT(quad.area(), WithinAbs(200.0, 1e-9));
    CHECK_THAT(quad.aspect_ratio(), WithinAbs(0.5, 1e-9));
    CHECK_THAT(quad.side_ratio(), WithinAbs(0.5, 1e-9));
    CHECK_THAT(quad.rectangularity(), WithinAbs(1.0, 1e-9));
    CHECK_THAT(quad.corner_angle(0), WithinAbs(90.0, 1e-6));

    auto doubled = quad.scaled(2.0);
    CHECK_THAT(doubled.bounding_width(), WithinAbs(20.0, 1e-9));
    CHECK_THAT(doubled.bounding_height(), WithinAbs(40.0, 1e-9));

    auto rect = quadrilateral::from_bounds(-5.0, 2.5, 50.0, 7.2).bounding_rect(30, 30);
    CHECK(rect.x == 0);
    CHECK(rect.y == 2);
    CHECK(rect.width == 30);
    CHECK(rect.height == 6);
}

TEST_CASE("Detection method names", "[geometry]") {
    CHECK(to_string(detection_method::boundary) == "automatic");
    CHECK(to_string(detection_method::margin_trim) == "fallback");
    CHECK(to_string(detection_method::none) == "none");
}

TEST_CASE("Clear page outline is detected and cropped", "[geometry][rectifier]") {
    // 2000x3000 frame; the page covers 1550x2324 (60% of the frame)
    constexpr uint32_t left = 225;
    constexpr uint32_t top = 338;
    constexpr uint32_t right = 1775;
    constexpr uint32_t bottom = 2662;
    auto image = make_page_on_table(2000, 3000, left, top, right, bottom);

    geometry_rectifier rectifier;
    auto result = rectifier.rectify(image);

    REQUIRE(result.boundary_detected);
    CHECK(result.processing_applied);
    CHECK(result.method == detection_method::boundary);
    REQUIRE(result.boundary.has_value());
    CHECK(result.score > rectifier.config().min_candidate_score);

    // Cropped to the outline's bounding box, within 2% of the frame
    const double tolerance_x = 2000 * 0.02;
    const double tolerance_y = 3000 * 0.02;
    CHECK(std::abs(static_cast<double>(result.image.width) - (right - left)) <= tolerance_x);
    CHECK(std::abs(static_cast<double>(result.image.height) - (bottom - top)) <= tolerance_y);
    CHECK(std::abs(result.boundary->min_x() - left) <= tolerance_x);
    CHECK(std::abs(result.boundary->min_y() - top) <= tolerance_y);
    CHECK(result.image.valid());
}

TEST_CASE("Featureless input falls back to a margin trim", "[geometry][rectifier]") {
    auto image = make_uniform(1000, 800, 200);

    geometry_rectifier rectifier;
    auto result = rectifier.rectify(image);

    CHECK_FALSE(result.boundary_detected);
    CHECK(result.processing_applied);
    CHECK(result.method == detection_method::margin_trim);
    // 5% of the short side removed from every edge
    CHECK(result.image.width == 920);
    CHECK(result.image.height == 720);
}

TEST_CASE("Rectifier never fails", "[geometry][rectifier]") {
    geometry_rectifier rectifier;

    SECTION("invalid raster is returned as given") {
        raster_image broken;
        broken.width = 10;
        broken.height = 10;
        broken.channels = 3;
        broken.pixels.resize(5);

        auto result = rectifier.rectify(broken);
        CHECK_FALSE(result.processing_applied);
        CHECK(result.method == detection_method::none);
        CHECK(result.image.pixels.size() == 5);
        CHECK_FALSE(result.error.empty());
    }

    SECTION("undecodable bytes") {
        const std::vector<uint8_t> garbage = {0x00, 0x01, 0x02, 0x03, 0x04};
        auto result = rectifier.rectify_encoded(garbage);
        CHECK_FALSE(result.processing_applied);
        CHECK_FALSE(result.boundary_detected);
        CHECK_FALSE(result.error.empty());
    }

    SECTION("tiny image") {
        auto result = rectifier.rectify(make_uniform(4, 4, 128));
        CHECK(result.image.valid());
        CHECK_FALSE(result.boundary_detected);
    }
}

TEST_CASE("Encoded input is decoded before rectification", "[geometry][rectifier]") {
    auto page = make_page_on_table(400, 600, 60, 80, 340, 520);
    png_codec codec;
    auto encoded = codec.encode(page);
    REQUIRE(encoded.is_ok());

    geometry_rectifier rectifier;
    auto result = rectifier.rectify_encoded(encoded.value());
    CHECK(result.processing_applied);
    CHECK(result.image.valid());
    CHECK(result.image.width < 400);
}

TEST_CASE("Candidate scoring", "[geometry][rectifier]") {
    // Area 0.5 of the frame, portrait page, right angles
    auto page = quadrilateral::from_bounds(0.0, 0.0, 70.0, 71.4);
    CHECK_THAT(geometry_rectifier::score_candidate(page, 100, 100), WithinAbs(1.0, 1e-9));

    // Whole frame: area outside the preferred window
    auto frame = quadrilateral::from_bounds(0.0, 0.0, 100.0, 100.0);
    CHECK_THAT(geometry_rectifier::score_candidate(frame, 100, 100), WithinAbs(0.6, 1e-9));

    CHECK_THAT(geometry_rectifier::score_candidate(page, 0, 0), WithinAbs(0.0, 1e-9));
}
