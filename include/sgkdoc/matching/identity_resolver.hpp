/**
 * @file identity_resolver.hpp
 * @brief Matches extracted entities against the patient directory
 *
 * The resolver is a pure function of its inputs: it keeps no state between
 * calls, uses no clock and no randomness, so identical inputs always yield
 * identical rankings and scores.
 *
 * ## Signals
 * Computed on normalized text (text::normalize_for_matching):
 * - name: mean of Levenshtein, Jaro-Winkler, word and LCS similarity
 * - exact words: shared tokens over max(token counts)
 * - name order: aligned tokens with similarity above 0.8
 * - national id, birth date, phone (last seven digits): 0 or 1
 *
 * ## Fusion
 * @code
 * confidence = 0.80 * name + 0.15 * exact_words + 0.05 * name_order
 *            + 0.10 * national_id + 0.05 * birth_date + 0.02 * phone
 * @endcode
 * capped at 1.0.
 */

#ifndef SGKDOC_MATCHING_IDENTITY_RESOLVER_HPP
#define SGKDOC_MATCHING_IDENTITY_RESOLVER_HPP

#include "sgkdoc/core/patient.hpp"
#include "sgkdoc/extraction/entity_extractor.hpp"
#include "sgkdoc/extraction/institutional_filter.hpp"
#include <sgkdoc/di/ilogger.hpp>

#include <array>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sgkdoc::matching {

/**
 * @brief Discrete verdict derived from the top confidence
 */
enum class match_tier {
    high,    ///< Auto-assign
    medium,  ///< Assign, but the user must confirm
    low,     ///< Report candidates only
    none
};

[[nodiscard]] std::string_view to_string(match_tier tier) noexcept;

/**
 * @brief How the verdict was reached
 */
enum class match_method {
    fuzzy,           ///< Multi-signal directory scoring
    keyword_search,  ///< Patient name tokens found verbatim in the raw text
    none
};

[[nodiscard]] std::string_view to_string(match_method method) noexcept;

/**
 * @brief Thresholds and weights
 */
struct resolver_config {
    double high_threshold = 0.40;
    double medium_threshold = 0.25;
    double low_threshold = 0.15;

    /// Ranked candidates kept in the result
    std::size_t max_candidates = 5;

    double name_weight = 0.80;
    double exact_words_weight = 0.15;
    double name_order_weight = 0.05;
    double national_id_weight = 0.10;
    double birth_date_weight = 0.05;
    double phone_weight = 0.02;

    /// Keyword fallback: minimum token length and reported confidences
    std::size_t keyword_min_token_length = 3;
    double keyword_single_confidence = 0.95;
    double keyword_multiple_confidence = 0.25;
};

/**
 * @brief Per-signal scores of one candidate
 */
struct signal_breakdown {
    /// Levenshtein, Jaro-Winkler, word, LCS
    std::array<double, 4> name_scores{};
    double name = 0.0;
    double exact_words = 0.0;
    double name_order = 0.0;
    double national_id = 0.0;
    double birth_date = 0.0;
    double phone = 0.0;
};

struct match_candidate {
    std::string patient_id;
    std::string patient_name;
    double confidence = 0.0;
    signal_breakdown breakdown;
};

/**
 * @brief Resolution verdict and ranked candidates
 *
 * candidates is sorted by descending confidence (ties by patient id) and
 * holds at most one entry per patient id.
 */
struct identity_resolution {
    std::vector<match_candidate> candidates;
    match_tier tier = match_tier::none;
    match_method method = match_method::none;

    /// Top confidence, 0 when there is no candidate
    double confidence = 0.0;

    /// Set for tiers high and medium
    std::optional<std::string> matched_patient_id;

    bool requires_confirmation = false;

    /// Name used for fuzzy scoring, empty when none was usable
    std::string query_name;

    std::string reason;

    [[nodiscard]] bool matched() const noexcept { return matched_patient_id.has_value(); }
};

/**
 * @class identity_resolver
 * @brief Ranks directory patients against extracted entities
 *
 * When neither a usable name nor a valid national id was extracted, or the
 * best fuzzy score is below the low threshold, every patient's name tokens
 * are searched as whole words in the raw OCR text before giving up.
 *
 * Thread Safety: resolve() is const and may be called concurrently.
 */
class identity_resolver {
public:
    explicit identity_resolver(resolver_config config = {},
                               std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @param entities Output of the entity extractor
     * @param directory Snapshot of all patients
     * @param raw_text OCR text as received, for the keyword fallback
     */
    [[nodiscard]] identity_resolution resolve(const extraction::extracted_entities& entities,
                                              std::span<const patient> directory,
                                              std::string_view raw_text) const;

    /**
     * @brief Fuzzy-score every eligible patient (no tiering, no fallback)
     */
    [[nodiscard]] std::vector<match_candidate> score_directory(
        const extraction::extracted_entities& entities,
        std::span<const patient> directory) const;

    /**
     * @brief Patients whose name tokens all occur as words in @p raw_text
     */
    [[nodiscard]] std::vector<match_candidate> keyword_search(
        std::span<const patient> directory,
        std::string_view raw_text) const;

    [[nodiscard]] match_tier classify(double confidence) const noexcept;

    [[nodiscard]] const resolver_config& config() const noexcept { return config_; }

private:
    [[nodiscard]] bool is_eligible(const patient& p) const;

    resolver_config config_;
    extraction::institutional_filter filter_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace sgkdoc::matching

#endif  // SGKDOC_MATCHING_IDENTITY_RESOLVER_HPP
