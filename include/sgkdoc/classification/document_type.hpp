/**
 * @file document_type.hpp
 * @brief SGK document categories
 */

#ifndef SGKDOC_CLASSIFICATION_DOCUMENT_TYPE_HPP
#define SGKDOC_CLASSIFICATION_DOCUMENT_TYPE_HPP

#include <array>
#include <optional>
#include <string_view>

namespace sgkdoc::classification {

/**
 * @brief Document categories in rule priority order
 */
enum class document_type {
    battery_prescription,     ///< pil_recete
    device_prescription,      ///< cihaz_recete
    prescription,             ///< recete
    audiogram,                ///< odyogram
    eligibility_certificate,  ///< uygunluk_belgesi
    medical_report,           ///< sgk_raporu
    other                     ///< diger
};

inline constexpr std::array<document_type, 7> all_document_types = {
    document_type::battery_prescription, document_type::device_prescription,
    document_type::prescription,         document_type::audiogram,
    document_type::eligibility_certificate, document_type::medical_report,
    document_type::other,
};

/// Stable tag stored with artifacts ("pil_recete", ...)
[[nodiscard]] std::string_view to_tag(document_type type) noexcept;

/// Turkish display name ("Pil Reçete", ...)
[[nodiscard]] std::string_view display_name(document_type type) noexcept;

/// Inverse of to_tag()
[[nodiscard]] std::optional<document_type> parse_document_type(std::string_view tag) noexcept;

}  // namespace sgkdoc::classification

#endif  // SGKDOC_CLASSIFICATION_DOCUMENT_TYPE_HPP
