/**
 * @file identity_resolver.cpp
 * @brief Implementation of multi-signal patient matching
 */

#include "sgkdoc/matching/identity_resolver.hpp"

#include "sgkdoc/matching/string_similarity.hpp"
#include "sgkdoc/text/turkish_text.hpp"

#include <algorithm>
#include <numeric>
#include <set>
#include <utility>

namespace sgkdoc::matching {

namespace {

void rank(std::vector<match_candidate>& candidates) {
    std::sort(candidates.begin(), candidates.end(),
              [](const match_candidate& a, const match_candidate& b) {
                  if (a.confidence != b.confidence) {
                      return a.confidence > b.confidence;
                  }
                  return a.patient_id < b.patient_id;
              });
}

std::string normalized_birth_date(const std::string& value) {
    if (value.empty()) {
        return {};
    }
    auto iso = extraction::entity_extractor::to_iso_date(value);
    return iso ? *iso : value;
}

}  // namespace

std::string_view to_string(match_tier tier) noexcept {
    switch (tier) {
        case match_tier::high: return "high";
        case match_tier::medium: return "medium";
        case match_tier::low: return "low";
        case match_tier::none:
        default: return "none";
    }
}

std::string_view to_string(match_method method) noexcept {
    switch (method) {
        case match_method::fuzzy: return "fuzzy";
        case match_method::keyword_search: return "keyword_search";
        case match_method::none:
        default: return "none";
    }
}

identity_resolver::identity_resolver(resolver_config config,
                                     std::shared_ptr<di::ILogger> logger)
    : config_(config),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

match_tier identity_resolver::classify(double confidence) const noexcept {
    if (confidence >= config_.high_threshold) return match_tier::high;
    if (confidence >= config_.medium_threshold) return match_tier::medium;
    if (confidence >= config_.low_threshold) return match_tier::low;
    return match_tier::none;
}

bool identity_resolver::is_eligible(const patient& p) const {
    return !p.id.empty() && !text::trim(p.name).empty() && !filter_.is_institutional(p.name);
}

std::vector<match_candidate> identity_resolver::score_directory(
    const extraction::extracted_entities& entities,
    std::span<const patient> directory) const {
    std::string query_name;
    if (const auto* best = entities.best_name()) {
        if (!filter_.is_institutional(best->text)) {
            query_name = text::normalize_for_matching(best->text);
        } else {
            logger_->warn_fmt("Institutional text \"{}\" reached the resolver; ignored",
                              best->text);
        }
    }

    const auto national_id = entities.valid_national_id();
    const auto birth_date = entities.birth_date();

    std::vector<match_candidate> candidates;
    std::set<std::string> seen;

    for (const auto& p : directory) {
        if (!is_eligible(p) || !seen.insert(p.id).second) {
            continue;
        }

        match_candidate candidate;
        candidate.patient_id = p.id;
        candidate.patient_name = p.name;
        auto& signals = candidate.breakdown;

        double confidence = 0.0;

        if (!query_name.empty()) {
            const auto patient_name = text::normalize_for_matching(p.name);
            signals.name_scores = name_similarity_scores(query_name, patient_name);
            signals.name = std::accumulate(signals.name_scores.begin(),
                                           signals.name_scores.end(), 0.0) /
                           static_cast<double>(signals.name_scores.size());
            signals.exact_words = exact_word_overlap(query_name, patient_name);
            signals.name_order = name_order_score(query_name, patient_name);

            confidence += signals.name * config_.name_weight +
                          signals.exact_words * config_.exact_words_weight +
                          signals.name_order * config_.name_order_weight;
        }

        if (!national_id.empty() && !p.tc_number.empty()) {
            signals.national_id = national_id == p.tc_number ? 1.0 : 0.0;
            confidence += signals.national_id * config_.national_id_weight;
        }

        if (birth_date && !p.birth_date.empty()) {
            signals.birth_date = *birth_date == normalized_birth_date(p.birth_date) ? 1.0 : 0.0;
            confidence += signals.birth_date * config_.birth_date_weight;
        }

        if (!entities.phone.empty() && !p.phone.empty()) {
            signals.phone = phone_similarity(entities.phone, p.phone);
            confidence += signals.phone * config_.phone_weight;
        }

        if (confidence > 0.0) {
            candidate.confidence = std::min(confidence, 1.0);
            candidates.push_back(std::move(candidate));
        }
    }

    rank(candidates);
    return candidates;
}

std::vector<match_candidate> identity_resolver::keyword_search(
    std::span<const patient> directory,
    std::string_view raw_text) const {
    std::vector<match_candidate> hits;
    const auto haystack = text::normalize_for_matching(raw_text);
    if (haystack.empty()) {
        return hits;
    }

    std::set<std::string> seen;
    for (const auto& p : directory) {
        if (!is_eligible(p) || !seen.insert(p.id).second) {
            continue;
        }

        auto tokens = text::split_words(text::normalize_for_matching(p.name));
        tokens.erase(std::remove_if(tokens.begin(), tokens.end(),
                                    [&](const std::string& t) {
                                        return t.size() < config_.keyword_min_token_length;
                                    }),
                     tokens.end());
        if (tokens.size() < 2) {
            continue;
        }

        const bool all_present = std::all_of(tokens.begin(), tokens.end(),
                                             [&](const std::string& t) {
                                                 return text::contains_word(haystack, t);
                                             });
        if (all_present) {
            match_candidate hit;
            hit.patient_id = p.id;
            hit.patient_name = p.name;
            hits.push_back(std::move(hit));
        }
    }

    const double confidence = hits.size() == 1 ? config_.keyword_single_confidence
                                               : config_.keyword_multiple_confidence;
    for (auto& hit : hits) {
        hit.confidence = confidence;
    }
    rank(hits);
    return hits;
}

identity_resolution identity_resolver::resolve(const extraction::extracted_entities& entities,
                                               std::span<const patient> directory,
                                               std::string_view raw_text) const {
    identity_resolution result;

    if (const auto* best = entities.best_name(); best && !filter_.is_institutional(best->text)) {
        result.query_name = best->text;
    }

    std::vector<match_candidate> fuzzy;
    if (!result.query_name.empty() || !entities.valid_national_id().empty()) {
        fuzzy = score_directory(entities, directory);
    }

    const double best_fuzzy = fuzzy.empty() ? 0.0 : fuzzy.front().confidence;
    const auto fuzzy_tier = classify(best_fuzzy);

    if (fuzzy_tier != match_tier::none) {
        result.method = match_method::fuzzy;
        result.tier = fuzzy_tier;
        result.confidence = best_fuzzy;
        if (fuzzy.size() > config_.max_candidates) {
            fuzzy.resize(config_.max_candidates);
        }
        result.candidates = std::move(fuzzy);

        if (fuzzy_tier == match_tier::high || fuzzy_tier == match_tier::medium) {
            result.matched_patient_id = result.candidates.front().patient_id;
            result.requires_confirmation = fuzzy_tier == match_tier::medium;
        } else {
            result.reason = "Low confidence match requires manual verification";
        }

        logger_->debug_fmt("Fuzzy match tier {} confidence {:.3f} ({} candidate(s))",
                           to_string(result.tier), result.confidence, result.candidates.size());
        return result;
    }

    auto hits = keyword_search(directory, raw_text);
    if (!hits.empty()) {
        result.method = match_method::keyword_search;
        result.confidence = hits.front().confidence;
        if (hits.size() == 1) {
            result.tier = match_tier::high;
        } else {
            result.tier = match_tier::medium;
            result.requires_confirmation = true;
        }
        if (hits.size() > config_.max_candidates) {
            hits.resize(config_.max_candidates);
        }
        result.candidates = std::move(hits);
        result.matched_patient_id = result.candidates.front().patient_id;

        logger_->debug_fmt("Keyword fallback matched {} patient(s)", result.candidates.size());
        return result;
    }

    // Below-threshold fuzzy scores are still reported for manual assignment
    if (fuzzy.size() > config_.max_candidates) {
        fuzzy.resize(config_.max_candidates);
    }
    result.candidates = std::move(fuzzy);
    result.confidence = best_fuzzy;
    result.reason = result.query_name.empty() && entities.valid_national_id().empty()
                        ? "No name or TC number found in document"
                        : "No matching patient found";
    return result;
}

}  // namespace sgkdoc::matching
