/**
 * @file document_classifier.hpp
 * @brief Assigns a document type to OCR text
 *
 * An optional external classifier is consulted first; its answer is used when
 * the reported confidence exceeds 0.3. Otherwise ordered keyword rules run
 * over the lower-cased text and file name, and the first rule that fires
 * decides:
 *
 * | Priority | Type                    | Confidence |
 * |----------|-------------------------|------------|
 * | 1        | pil_recete              | 0.90       |
 * | 2        | cihaz_recete            | 0.90       |
 * | 3        | recete                  | 0.80       |
 * | 4        | odyogram                | 0.95       |
 * | 5        | uygunluk_belgesi        | 0.90       |
 * | 6        | sgk_raporu              | 0.85       |
 * | -        | diger (default)         | 0.10       |
 */

#ifndef SGKDOC_CLASSIFICATION_DOCUMENT_CLASSIFIER_HPP
#define SGKDOC_CLASSIFICATION_DOCUMENT_CLASSIFIER_HPP

#include "sgkdoc/classification/document_type.hpp"
#include <sgkdoc/di/ilogger.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sgkdoc::classification {

/**
 * @brief How a classification was produced
 */
enum class classification_method {
    delegated,      ///< External classifier answer accepted
    pattern_match,  ///< A keyword rule fired
    fallback        ///< Nothing matched; default type
};

[[nodiscard]] std::string_view to_string(classification_method method) noexcept;

struct classification_result {
    document_type type = document_type::other;
    double confidence = 0.1;
    classification_method method = classification_method::fallback;

    [[nodiscard]] std::string_view tag() const noexcept { return to_tag(type); }
    [[nodiscard]] std::string_view label() const noexcept { return display_name(type); }
};

/**
 * @brief Answer of an external classifier
 */
struct external_classification {
    document_type type = document_type::other;
    double confidence = 0.0;
};

/**
 * @brief Slot for a smarter classifier (NLP service, trained model)
 *
 * Implementations may block; they are called on the run's own thread.
 * Returning std::nullopt means "no opinion".
 */
class external_classifier {
public:
    virtual ~external_classifier() = default;

    [[nodiscard]] virtual std::optional<external_classification> classify(
        std::string_view text) = 0;
};

/**
 * @brief Weighted keyword scorer usable as the external classifier
 *
 * For every category: score = sum(occurrences * weight) over its keywords,
 * confidence = score / 20 + matched_keywords / keywords * 0.3, capped at 1.
 * The highest confidence wins (earlier category on ties). Text and keywords
 * are compared after Turkish lower-casing and diacritic folding.
 */
class keyword_weight_classifier final : public external_classifier {
public:
    struct weighted_keyword {
        std::string keyword;
        int weight = 1;
    };

    struct category {
        document_type type = document_type::other;
        std::vector<weighted_keyword> keywords;
    };

    /// Built-in SGK vocabulary
    keyword_weight_classifier();

    explicit keyword_weight_classifier(std::vector<category> categories);

    [[nodiscard]] std::optional<external_classification> classify(
        std::string_view text) override;

    [[nodiscard]] const std::vector<category>& categories() const noexcept {
        return categories_;
    }

private:
    std::vector<category> categories_;
};

/**
 * @class document_classifier
 * @brief Ordered keyword rules with optional delegation
 *
 * Thread Safety: classify() is safe to call concurrently when the injected
 * external classifier is.
 */
class document_classifier {
public:
    /// Delegate answers at or below this confidence are ignored
    static constexpr double delegate_min_confidence = 0.3;

    explicit document_classifier(std::shared_ptr<external_classifier> delegate = nullptr,
                                 std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @param ocr_text OCR output, may be empty
     * @param file_name Original upload name, a weak secondary signal
     */
    [[nodiscard]] classification_result classify(std::string_view ocr_text,
                                                 std::string_view file_name) const;

    /**
     * @brief The keyword rules alone, without delegation
     */
    [[nodiscard]] static classification_result classify_by_rules(std::string_view ocr_text,
                                                                 std::string_view file_name);

private:
    std::shared_ptr<external_classifier> delegate_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace sgkdoc::classification

#endif  // SGKDOC_CLASSIFICATION_DOCUMENT_CLASSIFIER_HPP
