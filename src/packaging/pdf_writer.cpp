/**
 * @file pdf_writer.cpp
 * @brief cairo PDF surface rendering
 */

#include "sgkdoc/packaging/pdf_writer.hpp"

#include "sgkdoc/text/turkish_text.hpp"
#include <sgkdoc/compat/format.hpp>

#include <cairo-pdf.h>
#include <cairo.h>

#include <algorithm>
#include <cstring>
#include <memory>
#include <string_view>

namespace sgkdoc::packaging {

namespace {

// =============================================================================
// RAII wrappers for cairo objects
// =============================================================================

struct surface_deleter {
    void operator()(cairo_surface_t* surface) const noexcept {
        cairo_surface_destroy(surface);
    }
};

struct context_deleter {
    void operator()(cairo_t* cr) const noexcept {
        cairo_destroy(cr);
    }
};

using surface_ptr = std::unique_ptr<cairo_surface_t, surface_deleter>;
using context_ptr = std::unique_ptr<cairo_t, context_deleter>;

cairo_status_t append_to_buffer(void* closure, const unsigned char* data, unsigned int length) {
    auto* buffer = static_cast<std::vector<uint8_t>*>(closure);
    buffer->insert(buffer->end(), data, data + length);
    return CAIRO_STATUS_SUCCESS;
}

void release_mime_buffer(void* data) {
    delete static_cast<std::vector<uint8_t>*>(data);
}

Result<std::vector<uint8_t>> render_error(const std::string& what, cairo_status_t status) {
    return sgkdoc_error<std::vector<uint8_t>>(
        error_codes::pdf_render_error, "PDF rendering failed",
        what + ": " + cairo_status_to_string(status));
}

/**
 * @brief Copies an 8-bit gray/RGB raster into a CAIRO_FORMAT_RGB24 surface
 */
surface_ptr make_image_surface(const imaging::raster_image& image) {
    surface_ptr surface(cairo_image_surface_create(
        CAIRO_FORMAT_RGB24, static_cast<int>(image.width), static_cast<int>(image.height)));
    if (cairo_surface_status(surface.get()) != CAIRO_STATUS_SUCCESS) {
        return surface;
    }

    cairo_surface_flush(surface.get());
    unsigned char* data = cairo_image_surface_get_data(surface.get());
    const int stride = cairo_image_surface_get_stride(surface.get());

    for (uint32_t y = 0; y < image.height; ++y) {
        auto* row = reinterpret_cast<uint32_t*>(data + static_cast<size_t>(y) * stride);
        const uint8_t* src = image.pixels.data() + static_cast<size_t>(y) * image.row_stride();
        for (uint32_t x = 0; x < image.width; ++x) {
            uint32_t r = 0;
            uint32_t g = 0;
            uint32_t b = 0;
            if (image.channels == 1) {
                r = g = b = src[x];
            } else {
                r = src[x * 3];
                g = src[x * 3 + 1];
                b = src[x * 3 + 2];
            }
            row[x] = (r << 16) | (g << 8) | b;
        }
    }
    cairo_surface_mark_dirty(surface.get());
    return surface;
}

void show_text_at(cairo_t* cr, double x, double y, const std::string& line) {
    cairo_move_to(cr, x, y);
    cairo_show_text(cr, line.c_str());
}

std::string pdf_ascii(std::string_view utf8) {
    const auto folded = text::fold_diacritics(utf8);
    std::string out;
    out.reserve(folded.size());
    for (wchar_t c : text::to_wide(folded)) {
        if (c == L'(' || c == L')' || c == L'\\') {
            out.push_back('\\');
            out.push_back(static_cast<char>(c));
        } else if (c >= 0x20 && c < 0x7F) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('?');
        }
    }
    return out;
}

}  // namespace

// =============================================================================
// Layout
// =============================================================================

page_layout pdf_writer::compute_layout(uint32_t image_width, uint32_t image_height) noexcept {
    page_layout layout;
    layout.landscape = image_width > image_height;
    if (layout.landscape) {
        std::swap(layout.page_width, layout.page_height);
    }

    const double box_width = layout.page_width - 2.0 * layout.margin;
    const double box_height = layout.page_height - 2.0 * layout.margin - footer_reserve_pt;
    if (image_width == 0 || image_height == 0) {
        return layout;
    }

    const double aspect = static_cast<double>(image_width) / static_cast<double>(image_height);
    double width = box_width;
    double height = width / aspect;
    if (height > box_height) {
        height = box_height;
        width = height * aspect;
    }

    layout.image_width = width;
    layout.image_height = height;
    layout.image_x = (layout.page_width - width) / 2.0;
    layout.image_y = layout.margin + (box_height - height) / 2.0;
    return layout;
}

// =============================================================================
// Image page
// =============================================================================

Result<std::vector<uint8_t>> pdf_writer::render_image_page(
    const imaging::raster_image& image,
    std::span<const uint8_t> jpeg,
    const pdf_footer& footer) const {
    if (!image.valid()) {
        return sgkdoc_error<std::vector<uint8_t>>(error_codes::invalid_image_dimensions,
                                                  "Invalid raster for PDF page");
    }
    if (jpeg.empty()) {
        return sgkdoc_error<std::vector<uint8_t>>(error_codes::pdf_render_error,
                                                  "PDF rendering failed", "empty JPEG stream");
    }

    const auto layout = compute_layout(image.width, image.height);

    std::vector<uint8_t> output;
    surface_ptr pdf(cairo_pdf_surface_create_for_stream(append_to_buffer, &output,
                                                        layout.page_width, layout.page_height));
    if (auto status = cairo_surface_status(pdf.get()); status != CAIRO_STATUS_SUCCESS) {
        return render_error("pdf surface", status);
    }
    cairo_pdf_surface_set_metadata(pdf.get(), CAIRO_PDF_METADATA_TITLE, "SGK Belgesi");
    cairo_pdf_surface_set_metadata(pdf.get(), CAIRO_PDF_METADATA_CREATOR, "sgkdoc");

    auto picture = make_image_surface(image);
    if (auto status = cairo_surface_status(picture.get()); status != CAIRO_STATUS_SUCCESS) {
        return render_error("image surface", status);
    }

    // cairo frees the copy through release_mime_buffer only once it accepted it
    auto mime = std::make_unique<std::vector<uint8_t>>(jpeg.begin(), jpeg.end());
    if (auto status = cairo_surface_set_mime_data(picture.get(), CAIRO_MIME_TYPE_JPEG,
                                                  mime->data(), mime->size(),
                                                  release_mime_buffer, mime.get());
        status != CAIRO_STATUS_SUCCESS) {
        return render_error("jpeg mime data", status);
    }
    static_cast<void>(mime.release());

    context_ptr cr(cairo_create(pdf.get()));

    cairo_set_source_rgb(cr.get(), 1.0, 1.0, 1.0);
    cairo_paint(cr.get());

    cairo_save(cr.get());
    cairo_translate(cr.get(), layout.image_x, layout.image_y);
    cairo_scale(cr.get(), layout.image_width / image.width, layout.image_height / image.height);
    cairo_set_source_surface(cr.get(), picture.get(), 0, 0);
    cairo_paint(cr.get());
    cairo_restore(cr.get());

    cairo_set_source_rgb(cr.get(), 0.0, 0.0, 0.0);
    cairo_select_font_face(cr.get(), "Sans", CAIRO_FONT_SLANT_NORMAL, CAIRO_FONT_WEIGHT_NORMAL);
    cairo_set_font_size(cr.get(), footer_font_pt);

    const double left = layout.margin;
    const double bottom = layout.page_height - layout.margin;
    if (!footer.date.empty()) {
        show_text_at(cr.get(), left, bottom - 10.0, "Tarih: " + footer.date);
    }
    if (!footer.patient_name.empty()) {
        show_text_at(cr.get(), left, bottom - 1.0, "Hasta: " + footer.patient_name);
    }
    if (!footer.file_name.empty()) {
        const auto line = "Dosya: " + footer.file_name;
        cairo_text_extents_t extents{};
        cairo_text_extents(cr.get(), line.c_str(), &extents);
        show_text_at(cr.get(), layout.page_width - layout.margin - extents.x_advance,
                     bottom - 1.0, line);
    }

    cairo_show_page(cr.get());
    if (auto status = cairo_status(cr.get()); status != CAIRO_STATUS_SUCCESS) {
        return render_error("drawing", status);
    }

    cr.reset();
    cairo_surface_finish(pdf.get());
    if (auto status = cairo_surface_status(pdf.get()); status != CAIRO_STATUS_SUCCESS) {
        return render_error("finish", status);
    }
    pdf.reset();

    return output;
}

// =============================================================================
// Text page
// =============================================================================

Result<std::vector<uint8_t>> pdf_writer::render_text_page(
    const std::vector<std::string>& lines) const {
    std::vector<uint8_t> output;
    surface_ptr pdf(cairo_pdf_surface_create_for_stream(append_to_buffer, &output,
                                                        a4_width_pt, a4_height_pt));
    if (auto status = cairo_surface_status(pdf.get()); status != CAIRO_STATUS_SUCCESS) {
        return render_error("pdf surface", status);
    }

    context_ptr cr(cairo_create(pdf.get()));
    cairo_set_source_rgb(cr.get(), 0.0, 0.0, 0.0);
    cairo_select_font_face(cr.get(), "Sans", CAIRO_FONT_SLANT_NORMAL, CAIRO_FONT_WEIGHT_NORMAL);
    cairo_set_font_size(cr.get(), 12.0);

    double y = mm_to_pt(20.0);
    for (const auto& line : lines) {
        show_text_at(cr.get(), mm_to_pt(20.0), y, line);
        y += mm_to_pt(10.0);
    }

    cairo_show_page(cr.get());
    if (auto status = cairo_status(cr.get()); status != CAIRO_STATUS_SUCCESS) {
        return render_error("drawing", status);
    }

    cr.reset();
    cairo_surface_finish(pdf.get());
    if (auto status = cairo_surface_status(pdf.get()); status != CAIRO_STATUS_SUCCESS) {
        return render_error("finish", status);
    }
    pdf.reset();

    return output;
}

// =============================================================================
// Built-in minimal PDF
// =============================================================================

std::vector<uint8_t> pdf_writer::minimal_text_pdf(const std::vector<std::string>& lines) {
    std::string content = "BT\n/F1 12 Tf\n";
    double y = a4_height_pt - mm_to_pt(20.0);
    for (const auto& line : lines) {
        content += sgkdoc::compat::format("1 0 0 1 {:.2f} {:.2f} Tm ({}) Tj\n",
                                          mm_to_pt(20.0), y, pdf_ascii(line));
        y -= mm_to_pt(10.0);
    }
    content += "ET\n";

    const std::vector<std::string> objects = {
        "<< /Type /Catalog /Pages 2 0 R >>",
        "<< /Type /Pages /Kids [3 0 R] /Count 1 >>",
        sgkdoc::compat::format(
            "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 {:.4f} {:.4f}] "
            "/Resources << /Font << /F1 5 0 R >> >> /Contents 4 0 R >>",
            a4_width_pt, a4_height_pt),
        sgkdoc::compat::format("<< /Length {} >>\nstream\n{}endstream", content.size(), content),
        "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>",
    };

    std::string pdf = "%PDF-1.4\n";
    std::vector<std::size_t> offsets;
    offsets.reserve(objects.size());
    for (std::size_t i = 0; i < objects.size(); ++i) {
        offsets.push_back(pdf.size());
        pdf += sgkdoc::compat::format("{} 0 obj\n{}\nendobj\n", i + 1, objects[i]);
    }

    const std::size_t xref_offset = pdf.size();
    pdf += sgkdoc::compat::format("xref\n0 {}\n0000000000 65535 f \n", objects.size() + 1);
    for (auto offset : offsets) {
        pdf += sgkdoc::compat::format("{:010} 00000 n \n", offset);
    }
    pdf += sgkdoc::compat::format("trailer\n<< /Size {} /Root 1 0 R >>\nstartxref\n{}\n%%EOF\n",
                                  objects.size() + 1, xref_offset);

    return std::vector<uint8_t>(pdf.begin(), pdf.end());
}

}  // namespace sgkdoc::packaging
