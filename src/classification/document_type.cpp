#include "sgkdoc/classification/document_type.hpp"

namespace sgkdoc::classification {

std::string_view to_tag(document_type type) noexcept {
    switch (type) {
        case document_type::battery_prescription: return "pil_recete";
        case document_type::device_prescription: return "cihaz_recete";
        case document_type::prescription: return "recete";
        case document_type::audiogram: return "odyogram";
        case document_type::eligibility_certificate: return "uygunluk_belgesi";
        case document_type::medical_report: return "sgk_raporu";
        case document_type::other:
        default: return "diger";
    }
}

std::string_view display_name(document_type type) noexcept {
    switch (type) {
        case document_type::battery_prescription: return "Pil Reçete";
        case document_type::device_prescription: return "Cihaz Reçete";
        case document_type::prescription: return "Reçete";
        case document_type::audiogram: return "Odyogram";
        case document_type::eligibility_certificate: return "Uygunluk Belgesi";
        case document_type::medical_report: return "SGK Raporu";
        case document_type::other:
        default: return "Diğer";
    }
}

std::optional<document_type> parse_document_type(std::string_view tag) noexcept {
    for (auto type : all_document_types) {
        if (to_tag(type) == tag) {
            return type;
        }
    }
    return std::nullopt;
}

}  // namespace sgkdoc::classification
