/**
 * @file entity_extractor.cpp
 * @brief Implementation of the rule-based entity extractor
 */

#include "sgkdoc/extraction/entity_extractor.hpp"

#include "sgkdoc/extraction/tc_validator.hpp"
#include "sgkdoc/text/turkish_text.hpp"
#include <sgkdoc/compat/format.hpp>

#include <algorithm>
#include <array>
#include <regex>
#include <set>
#include <utility>

namespace sgkdoc::extraction {

namespace {

// Letter classes for std::wregex. Plain 'I' is inside A-Z.
#define SGKDOC_TR_UPPER L"A-Z\u00C7\u011E\u0130\u00D6\u015E\u00DC"
#define SGKDOC_TR_LOWER L"a-z\u00E7\u011F\u0131\u00F6\u015F\u00FC"
#define SGKDOC_TR_LETTER SGKDOC_TR_UPPER SGKDOC_TR_LOWER

/// Tokens of a name are separated by spaces or tabs, never line breaks
const std::array<std::wregex, 4>& name_patterns() {
    static const std::array<std::wregex, 4> patterns = {
        // ALL-CAPS two or three tokens: "ONUR AYDOĞDU", "RAHİME ÇELİK"
        std::wregex(L"(?:^|[^" SGKDOC_TR_LETTER L"])"
                    L"([" SGKDOC_TR_UPPER L"]{2,}(?:[ \\t]+[" SGKDOC_TR_UPPER L"]{2,}){1,2})"
                    L"(?=[^" SGKDOC_TR_LETTER L"]|$)"),

        // "Hasta Ad Soyad : Name" and "HASTA ADI SOYADI: NAME"
        std::wregex(L"(?:[Hh]asta|HASTA)[ \\t]*(?:Ad[\u0131i]?|AD[I\u0130]?)[ \\t]*"
                    L"(?:Soyad[\u0131i]?|SOYAD[I\u0130]?)[ \\t]*:[ \\t]*"
                    L"([" SGKDOC_TR_LETTER L"]{2,}(?:[ \\t]+[" SGKDOC_TR_LETTER L"]{2,}){1,2})"
                    L"(?=[^" SGKDOC_TR_LETTER L"]|$)"),

        // Value after a colon: ": ONUR AYDOĞDU"
        std::wregex(L":[ \\t]*"
                    L"([" SGKDOC_TR_UPPER L"]{2,}(?:[ \\t]+[" SGKDOC_TR_UPPER L"]{2,}){1,2})"
                    L"(?=[^" SGKDOC_TR_LETTER L"]|$)"),

        // Proper case: "Onur Aydoğdu"
        std::wregex(L"(?:^|[^" SGKDOC_TR_LETTER L"])"
                    L"([" SGKDOC_TR_UPPER L"][" SGKDOC_TR_LOWER L"]{2,}"
                    L"(?:[ \\t]+[" SGKDOC_TR_UPPER L"][" SGKDOC_TR_LOWER L"]{2,}){1,2})"
                    L"(?=[^" SGKDOC_TR_LETTER L"]|$)"),
    };
    return patterns;
}

#undef SGKDOC_TR_LETTER
#undef SGKDOC_TR_LOWER
#undef SGKDOC_TR_UPPER

const std::set<std::string>& leading_labels() {
    static const std::set<std::string> labels = {
        "AD", "ADI", "SOYAD", "SOYADI", "ADSOYAD", "HASTA", "HASTANIN", "ISIM", "ISMI",
        "SAYIN", "BAY", "BAYAN",
    };
    return labels;
}

const std::set<std::string>& trailing_labels() {
    static const std::set<std::string> labels = {
        "CINSIYETI", "CINSIYET", "DOGUM", "DOGYUM", "TARIHI", "TARIH", "TARIHL",
        "ERKEK", "KADIN", "MALE", "FEMALE", "TESLIM", "KUB",
    };
    return labels;
}

constexpr std::array<std::string_view, 7> context_keywords = {
    "hasta", "patient", "ad", "name", "sayın", "bay", "bayan",
};

constexpr std::array<std::string_view, 10> turkish_name_endings = {
    "an", "en", "in", "un", "ay", "ey", "iye", "can", "han", "gül",
};

constexpr std::size_t context_window = 50;

int context_score(std::string_view name, const std::wstring& wide,
                  std::size_t wide_pos, std::size_t wide_len) {
    int score = 0;

    const auto words = text::split_words(name);
    score += words.size() == 2 ? 10 : words.size() == 3 ? 8 : 5;

    if (wide_pos != std::wstring::npos && wide_pos <= wide.size()) {
        const std::size_t before_start = wide_pos > context_window ? wide_pos - context_window : 0;
        const auto before = text::to_lower_tr(
            text::to_utf8(wide.substr(before_start, wide_pos - before_start)));
        const std::size_t after_start = std::min(wide.size(), wide_pos + wide_len);
        const auto after = text::to_lower_tr(
            text::to_utf8(wide.substr(after_start, context_window)));

        for (auto keyword : context_keywords) {
            if (before.find(keyword) != std::string::npos) score += 5;
            if (after.find(keyword) != std::string::npos) score += 3;
        }
    }

    if (entity_extractor::has_turkish_name_ending(name)) {
        score += 5;
    }

    const auto length = text::char_length(name);
    if (length < 6) score -= 2;
    if (length > 30) score -= 3;

    return score;
}

bool is_leap_year(int year) noexcept {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) noexcept {
    static constexpr std::array<int, 12> days = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return days[static_cast<std::size_t>(month - 1)];
}

int parse_int(std::string_view digits) noexcept {
    int value = 0;
    for (char c : digits) {
        value = value * 10 + (c - '0');
    }
    return value;
}

}  // namespace

std::string_view to_string(date_role role) noexcept {
    switch (role) {
        case date_role::birth: return "birth";
        case date_role::document: return "document";
        case date_role::other:
        default: return "other";
    }
}

std::optional<std::string> extracted_entities::birth_date() const {
    for (const auto& date : dates) {
        if (date.role == date_role::birth) {
            return date.iso;
        }
    }
    if (!dates.empty()) {
        return dates.front().iso;
    }
    return std::nullopt;
}

// =============================================================================
// Construction
// =============================================================================

entity_extractor::entity_extractor(std::shared_ptr<di::ILogger> logger)
    : entity_extractor(institutional_filter{}, std::move(logger)) {}

entity_extractor::entity_extractor(institutional_filter filter,
                                   std::shared_ptr<di::ILogger> logger)
    : filter_(std::move(filter)),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

// =============================================================================
// Names
// =============================================================================

std::string entity_extractor::clean_name(std::string_view raw) {
    auto tokens = text::split_words(raw);

    std::size_t first = 0;
    while (first < tokens.size() && leading_labels().count(text::fold_upper(tokens[first])) > 0) {
        ++first;
    }

    std::size_t last = first;
    while (last < tokens.size() && trailing_labels().count(text::fold_upper(tokens[last])) == 0) {
        ++last;
    }

    std::string cleaned;
    for (std::size_t i = first; i < last; ++i) {
        if (!cleaned.empty()) {
            cleaned.push_back(' ');
        }
        cleaned += tokens[i];
    }

    if (text::char_length(cleaned) < 4) {
        return {};
    }
    return cleaned;
}

bool entity_extractor::is_valid_name(std::string_view name) const {
    const auto words = text::split_words(name);
    if (words.size() < 2 || words.size() > 4) {
        return false;
    }

    for (const auto& word : words) {
        if (text::char_length(word) < 2) {
            return false;
        }
        for (wchar_t c : text::to_wide(word)) {
            if (!text::is_turkish_letter(c)) {
                return false;
            }
        }
    }

    return !filter_.is_institutional(name);
}

bool entity_extractor::has_turkish_name_ending(std::string_view name) {
    for (const auto& word : text::split_words(text::to_lower_tr(name))) {
        for (auto ending : turkish_name_endings) {
            if (word.size() >= ending.size() &&
                word.compare(word.size() - ending.size(), ending.size(), ending) == 0) {
                return true;
            }
        }
    }
    return false;
}

int entity_extractor::score_name(std::string_view name, std::string_view text,
                                 std::size_t position, std::size_t length) {
    const auto wide = text::to_wide(text);

    if (position == std::string_view::npos) {
        position = text.find(name);
        length = name.size();
    }
    if (position == std::string_view::npos || position > text.size()) {
        return context_score(name, wide, std::wstring::npos, 0);
    }

    const auto wide_pos = text::char_length(text.substr(0, position));
    const auto wide_len = text::char_length(text.substr(position, length));
    return context_score(name, wide, wide_pos, wide_len);
}

std::vector<name_candidate> entity_extractor::extract_names(std::string_view ocr_text) const {
    std::vector<name_candidate> candidates;
    if (ocr_text.empty()) {
        return candidates;
    }

    const auto wide = text::to_wide(ocr_text);

    for (const auto& pattern : name_patterns()) {
        for (std::wsregex_iterator it(wide.begin(), wide.end(), pattern), end; it != end; ++it) {
            const auto& match = *it;
            const auto raw = text::to_utf8(match.str(1));

            auto name = clean_name(raw);
            if (name.empty()) {
                continue;
            }
            if (name == text::to_upper_tr(name) && text::char_length(name) > 3) {
                name = text::to_proper_case(name);
            }
            if (!is_valid_name(name)) {
                logger_->debug_fmt("Rejected name candidate \"{}\"", name);
                continue;
            }

            const int score = context_score(name, wide,
                                            static_cast<std::size_t>(match.position(1)),
                                            static_cast<std::size_t>(match.length(1)));

            auto existing = std::find_if(candidates.begin(), candidates.end(),
                                         [&](const name_candidate& c) { return c.text == name; });
            if (existing != candidates.end()) {
                existing->score = std::max(existing->score, score);
                continue;
            }
            candidates.push_back(name_candidate{std::move(name), score, 0.0});
        }
    }

    for (auto& candidate : candidates) {
        candidate.confidence = std::clamp(candidate.score / 10.0, 0.0, 1.0);
    }
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const name_candidate& a, const name_candidate& b) {
                         return a.score > b.score;
                     });
    return candidates;
}

// =============================================================================
// Identity numbers
// =============================================================================

std::optional<national_id_candidate> entity_extractor::extract_national_id(
    std::string_view ocr_text) {
    // Labels are matched on folded upper-case text; digits are unchanged
    static const std::array<std::regex, 2> labelled = {
        std::regex(R"((?:^|[^A-Z])(?:TCKN|T\.C\.K\.N\.?|T\.C\.?|TC)[\s.:]*([0-9]{11})(?![0-9]))"),
        std::regex(R"((?:KIMLIK)(?:\s+(?:NO|NUMARASI))?[\s.:]*([0-9]{11})(?![0-9]))"),
    };
    static const std::regex bare(R"((?:^|[^0-9])([0-9]{11})(?![0-9]))");

    const auto folded = text::fold_upper(ocr_text);

    std::vector<national_id_candidate> found;
    for (const auto& pattern : labelled) {
        for (std::sregex_iterator it(folded.begin(), folded.end(), pattern), end; it != end; ++it) {
            found.push_back({(*it).str(1), false, true});
        }
    }
    for (std::sregex_iterator it(folded.begin(), folded.end(), bare), end; it != end; ++it) {
        found.push_back({(*it).str(1), false, false});
    }

    for (auto& candidate : found) {
        if (is_valid_tc_number(candidate.text)) {
            candidate.validated = true;
            return candidate;
        }
    }
    if (!found.empty()) {
        return found.front();
    }
    return std::nullopt;
}

// =============================================================================
// Dates
// =============================================================================

std::optional<std::string> entity_extractor::to_iso_date(std::string_view date) {
    std::array<std::string_view, 3> parts;
    std::size_t part = 0;
    std::size_t start = 0;
    for (std::size_t i = 0; i <= date.size(); ++i) {
        if (i == date.size() || date[i] == '.' || date[i] == '/' || date[i] == '-') {
            if (part >= parts.size()) {
                return std::nullopt;
            }
            parts[part++] = date.substr(start, i - start);
            start = i + 1;
        }
    }
    if (part != 3) {
        return std::nullopt;
    }
    for (auto p : parts) {
        if (p.empty() || p.size() > 4 ||
            !std::all_of(p.begin(), p.end(), [](char c) { return c >= '0' && c <= '9'; })) {
            return std::nullopt;
        }
    }

    int year = 0;
    int month = 0;
    int day = 0;
    if (parts[0].size() == 4) {
        year = parse_int(parts[0]);
        month = parse_int(parts[1]);
        day = parse_int(parts[2]);
    } else if (parts[2].size() == 4) {
        day = parse_int(parts[0]);
        month = parse_int(parts[1]);
        year = parse_int(parts[2]);
    } else {
        return std::nullopt;
    }

    if (year < 1900 || year > 2100 || month < 1 || month > 12 || day < 1 ||
        day > days_in_month(year, month)) {
        return std::nullopt;
    }
    return sgkdoc::compat::format("{:04}-{:02}-{:02}", year, month, day);
}

std::vector<date_candidate> entity_extractor::extract_dates(std::string_view ocr_text) {
    static const std::regex birth(
        R"((?:DOGUM\s*TARIHI?|BIRTH\s*DATE)[\s:]*([0-9]{1,2}[./-][0-9]{1,2}[./-][0-9]{4})(?![0-9]))");
    static const std::array<std::regex, 2> generic = {
        std::regex(R"((?:^|[^0-9])([0-9]{1,2}[./-][0-9]{1,2}[./-][0-9]{4})(?![0-9]))"),
        std::regex(R"((?:^|[^0-9])([0-9]{4}-[0-9]{1,2}-[0-9]{1,2})(?![0-9]))"),
    };

    const auto folded = text::fold_upper(ocr_text);
    std::vector<date_candidate> dates;
    std::set<std::ptrdiff_t> birth_positions;

    for (std::sregex_iterator it(folded.begin(), folded.end(), birth), end; it != end; ++it) {
        const auto raw = (*it).str(1);
        if (auto iso = to_iso_date(raw)) {
            birth_positions.insert((*it).position(1));
            dates.push_back({raw, std::move(*iso), date_role::birth});
        }
    }

    std::vector<std::pair<std::ptrdiff_t, std::string>> unlabelled;
    for (const auto& pattern : generic) {
        for (std::sregex_iterator it(folded.begin(), folded.end(), pattern), end; it != end; ++it) {
            const auto position = (*it).position(1);
            if (birth_positions.count(position) == 0) {
                unlabelled.emplace_back(position, (*it).str(1));
            }
        }
    }
    std::sort(unlabelled.begin(), unlabelled.end());

    bool document_assigned = false;
    for (auto& [position, raw] : unlabelled) {
        auto iso = to_iso_date(raw);
        if (!iso) {
            continue;
        }
        const bool duplicate = std::any_of(dates.begin(), dates.end(),
                                           [&](const date_candidate& d) { return d.iso == *iso; });
        if (duplicate) {
            continue;
        }
        const auto role = document_assigned ? date_role::other : date_role::document;
        document_assigned = true;
        dates.push_back({std::move(raw), std::move(*iso), role});
    }
    return dates;
}

std::string entity_extractor::extract_phone(std::string_view ocr_text) {
    static const std::regex mobile(
        R"((?:^|[^0-9+])((?:\+?90[ -]?)?0?5[0-9]{2}[ -]?[0-9]{3}[ -]?[0-9]{2}[ -]?[0-9]{2})(?![0-9]))");

    std::match_results<std::string_view::const_iterator> match;
    if (std::regex_search(ocr_text.begin(), ocr_text.end(), match, mobile)) {
        return match.str(1);
    }
    return {};
}

// =============================================================================
// Combined extraction
// =============================================================================

extracted_entities entity_extractor::extract(std::string_view ocr_text) const {
    extracted_entities entities;
    if (ocr_text.empty()) {
        logger_->debug("Empty OCR text; nothing to extract");
        return entities;
    }

    entities.names = extract_names(ocr_text);
    entities.national_id = extract_national_id(ocr_text);
    entities.dates = extract_dates(ocr_text);
    entities.phone = extract_phone(ocr_text);

    double confidence = 0.0;
    if (const auto* best = entities.best_name()) {
        confidence += std::clamp(best->score / 10.0, 0.0, 0.7);
    }
    if (entities.national_id && entities.national_id->validated) {
        confidence += 0.3;
    }
    if (!entities.dates.empty()) {
        confidence += 0.2;
    }
    entities.confidence = std::min(1.0, confidence);

    logger_->debug_fmt("Extracted {} name candidate(s), id {}, {} date(s), confidence {:.2f}",
                       entities.names.size(),
                       entities.national_id
                           ? (entities.national_id->validated ? "valid" : "invalid")
                           : "none",
                       entities.dates.size(), entities.confidence);
    return entities;
}

}  // namespace sgkdoc::extraction
