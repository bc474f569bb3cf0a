/**
 * @file filename_builder.cpp
 * @brief Implementation of packaged document naming
 */

#include "sgkdoc/packaging/filename_builder.hpp"

#include "sgkdoc/text/turkish_text.hpp"
#include <sgkdoc/compat/format.hpp>
#include <sgkdoc/compat/time.hpp>

#include <cctype>

namespace sgkdoc::packaging {

std::string filename_builder::sanitize(std::string_view text) {
    const auto folded = text::fold_upper(text);

    std::string out;
    out.reserve(folded.size());
    bool pending_separator = false;
    for (char c : folded) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) && uc < 0x80) {
            if (pending_separator && !out.empty()) {
                out.push_back('_');
            }
            pending_separator = false;
            out.push_back(static_cast<char>(std::toupper(uc)));
        } else if (std::isspace(uc) || c == '_') {
            pending_separator = true;
        }
    }
    return out;
}

std::string filename_builder::type_part(classification::document_type type) {
    using classification::document_type;
    switch (type) {
        case document_type::prescription: return "Recete";
        case document_type::battery_prescription: return "Pil_Recete";
        case document_type::device_prescription: return "Cihaz_Recete";
        default: return std::string(classification::to_tag(type));
    }
}

std::string_view filename_builder::indicator(const filename_request& request) noexcept {
    using matching::match_tier;
    if (!request.matched_name.empty()) {
        switch (request.tier) {
            case match_tier::high: return "";
            case match_tier::medium: return "_VERIFY";
            default: return "_MANUAL";
        }
    }
    if (!request.extracted_name.empty()) {
        return request.tier == match_tier::low ? "_MANUAL" : "_UNMATCHED";
    }
    return "";
}

std::string filename_builder::stem(const filename_request& request) {
    std::string name;
    if (!request.matched_name.empty()) {
        name = sanitize(request.matched_name);
    } else if (!request.extracted_name.empty()) {
        name = sanitize(request.extracted_name);
    }
    if (name.empty()) {
        name = unknown_patient;
    }

    auto type = type_part(request.type);
    if (request.classification_confidence < check_threshold) {
        type += "_CHECK";
    }

    const auto tm = compat::to_local_tm(request.timestamp);
    return sgkdoc::compat::format("{}_{}_{:04}{:02}{:02}_{:02}{:02}{}", name, type,
                                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                                  tm.tm_hour, tm.tm_min, indicator(request));
}

std::string filename_builder::build(const filename_request& request) {
    return stem(request) + std::string(extension);
}

}  // namespace sgkdoc::packaging
