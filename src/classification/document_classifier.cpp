/**
 * @file document_classifier.cpp
 * @brief Implementation of rule-based and weighted-keyword classification
 */

#include "sgkdoc/classification/document_classifier.hpp"

#include "sgkdoc/text/turkish_text.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace sgkdoc::classification {

namespace {

bool contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

std::size_t count_occurrences(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) {
        return 0;
    }
    std::size_t count = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

std::string fold_lower(std::string_view value) {
    return text::fold_diacritics(text::to_lower_tr(value));
}

classification_result rule(document_type type, double confidence) {
    return {type, confidence, classification_method::pattern_match};
}

}  // namespace

std::string_view to_string(classification_method method) noexcept {
    switch (method) {
        case classification_method::delegated: return "delegated";
        case classification_method::pattern_match: return "pattern_match";
        case classification_method::fallback:
        default: return "default";
    }
}

// =============================================================================
// keyword_weight_classifier
// =============================================================================

keyword_weight_classifier::keyword_weight_classifier()
    : keyword_weight_classifier(std::vector<category>{
          {document_type::device_prescription,
           {{"işitme cihazı", 5}, {"hearing aid", 4}, {"cihaz reçete", 5},
            {"protez", 3}, {"aparey", 3}}},
          {document_type::battery_prescription,
           {{"pil", 4}, {"batarya", 3}, {"battery", 3}, {"pil reçete", 5},
            {"işitme cihazı pili", 5}}},
          {document_type::audiogram,
           {{"odyogram", 5}, {"audiogram", 5}, {"işitme testi", 4},
            {"hearing test", 4}, {"audiometri", 4}, {"tone audiometry", 4}}},
          {document_type::eligibility_certificate,
           {{"uygunluk belgesi", 5}, {"uygunluk", 3}, {"sağlık raporu", 4},
            {"hekim raporu", 4}, {"doktor raporu", 4}, {"tıbbi rapor", 4}}},
          {document_type::medical_report,
           {{"sgk", 4}, {"s.g.k", 4}, {"sosyal güvenlik", 3},
            {"sosyal güvenlik kurumu", 5}}},
          {document_type::prescription,
           {{"reçete", 3}, {"prescription", 2}, {"ilaç", 2}, {"doktor", 2},
            {"dr.", 2}, {"hastane", 1}}},
      }) {}

keyword_weight_classifier::keyword_weight_classifier(std::vector<category> categories)
    : categories_(std::move(categories)) {
    // Folded forms make "reçete" and "recete" one keyword
    for (auto& entry : categories_) {
        for (auto& keyword : entry.keywords) {
            keyword.keyword = fold_lower(keyword.keyword);
        }
    }
}

std::optional<external_classification> keyword_weight_classifier::classify(
    std::string_view value) {
    const auto normalized = fold_lower(value);

    std::optional<external_classification> best;
    for (const auto& entry : categories_) {
        if (entry.keywords.empty()) {
            continue;
        }

        double score = 0.0;
        std::size_t matched = 0;
        for (const auto& keyword : entry.keywords) {
            const auto occurrences = count_occurrences(normalized, keyword.keyword);
            if (occurrences > 0) {
                score += static_cast<double>(occurrences) * keyword.weight;
                ++matched;
            }
        }
        if (matched == 0) {
            continue;
        }

        const double confidence =
            std::min(1.0, score / 20.0 + static_cast<double>(matched) /
                                             static_cast<double>(entry.keywords.size()) * 0.3);
        if (!best || confidence > best->confidence) {
            best = external_classification{entry.type, confidence};
        }
    }
    return best;
}

// =============================================================================
// document_classifier
// =============================================================================

document_classifier::document_classifier(std::shared_ptr<external_classifier> delegate,
                                         std::shared_ptr<di::ILogger> logger)
    : delegate_(std::move(delegate)),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

classification_result document_classifier::classify_by_rules(std::string_view ocr_text,
                                                             std::string_view file_name) {
    // Folded forms: "REÇETE", "reçete" and "RECETE" all read "recete"
    const auto text_lower = fold_lower(ocr_text);
    const auto name_lower = fold_lower(file_name);

    if (contains(text_lower, "recete") || contains(name_lower, "recete")) {
        if (contains(text_lower, "pil") || contains(name_lower, "pil")) {
            return rule(document_type::battery_prescription, 0.9);
        }
        if (contains(text_lower, "cihaz") || contains(text_lower, "isitme") ||
            contains(name_lower, "cihaz")) {
            return rule(document_type::device_prescription, 0.9);
        }
        return rule(document_type::prescription, 0.8);
    }

    if (contains(text_lower, "odyogram") || contains(text_lower, "audiogram") ||
        contains(text_lower, "odyometri") || contains(text_lower, "audiometri") ||
        contains(name_lower, "odyo")) {
        return rule(document_type::audiogram, 0.95);
    }

    if (contains(text_lower, "uygunluk") ||
        (contains(text_lower, "rapor") &&
         (contains(text_lower, "sgk") || contains(name_lower, "sgk")))) {
        return rule(document_type::eligibility_certificate, 0.9);
    }

    if (contains(text_lower, "muayene") && contains(text_lower, "rapor")) {
        return rule(document_type::medical_report, 0.85);
    }

    return {document_type::other, 0.1, classification_method::fallback};
}

classification_result document_classifier::classify(std::string_view ocr_text,
                                                    std::string_view file_name) const {
    if (delegate_) {
        try {
            auto answer = delegate_->classify(ocr_text);
            if (answer && answer->confidence > delegate_min_confidence) {
                logger_->debug_fmt("External classifier: {} ({:.2f})",
                                   to_tag(answer->type), answer->confidence);
                return {answer->type, std::min(1.0, answer->confidence),
                        classification_method::delegated};
            }
        } catch (const std::exception& e) {
            logger_->warn_fmt("External classifier failed, using keyword rules: {}", e.what());
        }
    }

    auto result = classify_by_rules(ocr_text, file_name);
    logger_->debug_fmt("Keyword rules: {} ({:.2f}, {})", result.tag(), result.confidence,
                       to_string(result.method));
    return result;
}

}  // namespace sgkdoc::classification
