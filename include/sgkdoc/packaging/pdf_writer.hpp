/**
 * @file pdf_writer.hpp
 * @brief Single-page PDF output through cairo
 *
 * Image pages embed the JPEG stream unchanged (cairo JPEG MIME data), so the
 * PDF size follows the JPEG quality and dimensions chosen by the packager.
 *
 * @see https://www.cairographics.org/manual/cairo-PDF-Surfaces.html
 */

#ifndef SGKDOC_PACKAGING_PDF_WRITER_HPP
#define SGKDOC_PACKAGING_PDF_WRITER_HPP

#include "sgkdoc/imaging/raster_image.hpp"
#include <sgkdoc/core/result.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace sgkdoc::packaging {

/// A4 in PDF points (1/72 inch)
inline constexpr double a4_width_pt = 595.2756;
inline constexpr double a4_height_pt = 841.8898;

/// Millimetres to PDF points
[[nodiscard]] constexpr double mm_to_pt(double mm) noexcept {
    return mm * 72.0 / 25.4;
}

/**
 * @brief Placement of the image on the page, in points
 */
struct page_layout {
    double page_width = a4_width_pt;
    double page_height = a4_height_pt;
    double margin = mm_to_pt(10.0);
    bool landscape = false;

    double image_x = 0.0;
    double image_y = 0.0;
    double image_width = 0.0;
    double image_height = 0.0;
};

/**
 * @brief Footer lines printed at 8 pt under the image
 */
struct pdf_footer {
    std::string date;          ///< dd.mm.yyyy
    std::string patient_name;
    std::string file_name;
};

/**
 * @class pdf_writer
 * @brief Renders image and text pages into in-memory PDF documents
 *
 * Thread Safety: stateless; instances may be shared across threads.
 */
class pdf_writer {
public:
    /// Height reserved above the bottom margin for the footer
    static constexpr double footer_reserve_pt = 24.0;
    static constexpr double footer_font_pt = 8.0;

    /**
     * @brief A4 page, landscape when the image is wider than tall, image
     * fitted inside the margins above the footer and centred
     */
    [[nodiscard]] static page_layout compute_layout(uint32_t image_width,
                                                    uint32_t image_height) noexcept;

    /**
     * @brief One page showing @p image, embedded as the given JPEG stream
     *
     * @param image Pixels of the encoded JPEG (same dimensions)
     * @param jpeg Complete JPEG file for @p image
     * @param footer Footer text; empty lines are skipped
     */
    [[nodiscard]] Result<std::vector<uint8_t>> render_image_page(
        const imaging::raster_image& image,
        std::span<const uint8_t> jpeg,
        const pdf_footer& footer) const;

    /**
     * @brief One portrait A4 page of 12 pt text lines
     */
    [[nodiscard]] Result<std::vector<uint8_t>> render_text_page(
        const std::vector<std::string>& lines) const;

    /**
     * @brief Hand-assembled one-page PDF with Helvetica text
     *
     * Used when cairo itself fails. Turkish letters are folded to ASCII and
     * other non-ASCII characters become '?'. Never fails.
     */
    [[nodiscard]] static std::vector<uint8_t> minimal_text_pdf(
        const std::vector<std::string>& lines);
};

}  // namespace sgkdoc::packaging

#endif  // SGKDOC_PACKAGING_PDF_WRITER_HPP
