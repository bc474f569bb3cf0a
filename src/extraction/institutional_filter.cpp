/**
 * @file institutional_filter.cpp
 * @brief Implementation of the institutional vocabulary blocklist
 */

#include "sgkdoc/extraction/institutional_filter.hpp"

#include "sgkdoc/text/turkish_text.hpp"

#include <algorithm>

namespace sgkdoc::extraction {

namespace {

constexpr std::size_t substring_match_min_length = 5;

std::vector<std::string> fold_keywords(const std::vector<std::string>& raw) {
    std::vector<std::string> folded;
    folded.reserve(raw.size());
    for (const auto& keyword : raw) {
        auto value = text::trim(text::fold_upper(keyword));
        if (value.empty()) {
            continue;
        }
        if (std::find(folded.begin(), folded.end(), value) == folded.end()) {
            folded.push_back(std::move(value));
        }
    }
    return folded;
}

}  // namespace

const std::vector<std::string>& institutional_filter::default_keywords() {
    static const std::vector<std::string> keywords = {
        // Government and official institutions
        "KURUMU", "KURUM", "HASTANE", "HOSPITAL",
        "SAĞLIK", "HEALTH", "MEDICAL",
        "SOSYAL", "SOCIAL", "GÜVENLİK", "SECURITY",
        "DEVLET", "STATE", "KAMU", "PUBLIC",
        "BAKANLIĞI", "MINISTRY",
        "MÜDÜRLÜĞÜ", "DIRECTORATE",
        "ÜNİVERSİTE", "UNIVERSITY",
        "FAKÜLTE", "FACULTY",
        "BÖLÜM", "DEPARTMENT",
        "MERKEZ", "CENTER", "CENTRE",
        "ENSTİTÜ", "INSTITUTE",
        "VAKIF", "VAKFI", "FOUNDATION",

        // Medical and administrative titles
        "DOKTOR", "DOCTOR", "DR", "HEKİM", "PHYSICIAN",
        "MÜDÜR", "MANAGER", "DIRECTOR",
        "SORUMLU", "RESPONSIBLE",
        "ODYOLOG", "AUDIOLOGIST", "TEKNİSYEN", "TECHNICIAN",
        "HEMŞİRE", "NURSE", "ASİSTAN", "ASSISTANT",
        "UZMAN", "SPECIALIST", "PROF", "PROFESSOR",

        // Business and company terms
        "KULLANICISI", "USER", "CLIENT", "CUSTOMER",
        "LTD", "LIMITED", "ŞTİ", "ANONİM", "ŞİRKET",
        "COMPANY", "CORPORATION", "FİRMA", "BUSINESS",
        "TIBBİ", "CİHAZLAR", "DEVICES", "EQUIPMENT",

        // Document and form vocabulary
        "RAPOR", "REPORT", "BELGE", "DOCUMENT",
        "FORM", "FORMÜL", "BAŞVURU", "APPLICATION",
        "ONAY", "APPROVAL", "ONAYLI", "APPROVED",
        "RUHSAT", "LICENSE", "İZİN", "PERMIT",
    };
    return keywords;
}

institutional_filter::institutional_filter()
    : keywords_(fold_keywords(default_keywords())) {}

institutional_filter::institutional_filter(const std::vector<std::string>& keywords)
    : keywords_(fold_keywords(keywords)) {}

bool institutional_filter::is_institutional(std::string_view value) const {
    if (value.empty()) {
        return false;
    }

    const auto folded = text::fold_upper(value);
    for (const auto& keyword : keywords_) {
        const bool hit = keyword.size() >= substring_match_min_length
                             ? folded.find(keyword) != std::string::npos
                             : text::contains_word(folded, keyword);
        if (hit) {
            return true;
        }
    }
    return false;
}

}  // namespace sgkdoc::extraction
