/**
 * @file document_packager.hpp
 * @brief Packages a rectified page into a single-page PDF under a byte budget
 *
 * The first pass encodes the page at JPEG quality 85 (longest side capped at
 * 2480 px). When the PDF exceeds the budget, a bounded search re-encodes the
 * rectified page at decreasing quality and dimensions:
 *
 * | Attempt | JPEG quality | Width                 |
 * |---------|--------------|-----------------------|
 * | 1       | 30           | min(1200, w)          |
 * | 2       | 24           | previous x 0.9        |
 * | 3       | 19           | previous x 0.9        |
 * | 4       | 15           | previous x 0.9        |
 * | 5       | 12           | previous x 0.9        |
 *
 * The first attempt within budget is accepted, otherwise the last one.
 * Any rendering failure produces a text-only placeholder page instead.
 */

#ifndef SGKDOC_PACKAGING_DOCUMENT_PACKAGER_HPP
#define SGKDOC_PACKAGING_DOCUMENT_PACKAGER_HPP

#include "sgkdoc/imaging/image_codec.hpp"
#include "sgkdoc/imaging/raster_image.hpp"
#include "sgkdoc/packaging/filename_builder.hpp"
#include "sgkdoc/packaging/pdf_writer.hpp"
#include <sgkdoc/core/result.hpp>
#include <sgkdoc/di/ilogger.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace sgkdoc::packaging {

struct packager_config {
    /// Byte budget of the packaged PDF
    std::size_t target_bytes = 300 * 1024;

    int initial_quality = 85;
    uint32_t initial_max_side = 2480;

    /// Quality of the first loop attempt as a fraction (0.3 -> JPEG 30)
    double loop_start_quality = 0.30;
    uint32_t loop_max_width = 1200;
    double quality_factor = 0.8;
    double dimension_factor = 0.9;
    int max_attempts = 5;

    /// Longest side of the stored preview image
    uint32_t preview_max_side = 600;
};

/**
 * @brief One pass of the compression search
 */
struct compression_attempt {
    int jpeg_quality = 0;
    uint32_t width = 0;
    uint32_t height = 0;

    /// Resulting PDF size; zero while only planned
    std::size_t bytes = 0;
};

struct packaged_document {
    std::vector<uint8_t> bytes;
    std::string filename;

    /// Compression loop passes, in order (empty when the first pass fit)
    std::vector<compression_attempt> attempts;

    /// Size of the first (quality 85) rendering
    std::size_t initial_size = 0;

    bool within_budget = false;

    /// Text-only page emitted because the image could not be packaged
    bool placeholder = false;

    /// Uploaded PDF stored unchanged
    bool passthrough = false;

    [[nodiscard]] std::size_t size() const noexcept { return bytes.size(); }
};

/**
 * @class document_packager
 * @brief Turns rectified pages into budgeted PDF documents
 *
 * package() and package_undecodable() never fail: every error path ends in
 * a placeholder document so the caller always has something to persist.
 *
 * Thread Safety: const methods may be called concurrently.
 */
class document_packager {
public:
    explicit document_packager(packager_config config = {},
                               std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Quality and dimensions of every loop attempt for a source image
     *
     * Each entry is strictly smaller than its predecessor in quality and in
     * both dimensions (dimensions never drop below 1 px).
     */
    [[nodiscard]] static std::vector<compression_attempt> plan_compression(
        uint32_t width, uint32_t height, const packager_config& config);

    [[nodiscard]] packaged_document package(const imaging::raster_image& image,
                                            const filename_request& naming) const;

    /**
     * @brief Packages an upload without a raster decoder (PDF, TIFF)
     *
     * A PDF within budget is stored as uploaded; anything else becomes a
     * placeholder page.
     */
    [[nodiscard]] packaged_document package_undecodable(std::span<const uint8_t> original,
                                                        imaging::image_format format,
                                                        const filename_request& naming) const;

    /**
     * @brief JPEG preview with the longest side capped at preview_max_side
     */
    [[nodiscard]] Result<std::vector<uint8_t>> make_preview(
        const imaging::raster_image& image) const;

    [[nodiscard]] packaged_document placeholder(const filename_request& naming) const;

    [[nodiscard]] static std::string format_date(std::chrono::system_clock::time_point when);

    [[nodiscard]] const packager_config& config() const noexcept { return config_; }

private:
    [[nodiscard]] Result<std::vector<uint8_t>> render(const imaging::raster_image& image,
                                                      int quality,
                                                      const pdf_footer& footer) const;

    packager_config config_;
    pdf_writer writer_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace sgkdoc::packaging

#endif  // SGKDOC_PACKAGING_DOCUMENT_PACKAGER_HPP
