/**
 * @file entity_extractor.hpp
 * @brief Patient name, TC number and date extraction from OCR text
 *
 * The extractor is rule based: regular expressions propose name candidates,
 * label cleaning and validity checks prune them, and a context score picks
 * the best one. Institutional filtering and the TC checksum are hard gates.
 *
 * @example
 * @code
 * entity_extractor extractor;
 * auto entities = extractor.extract("HASTA ADI SOYADI: ALİ VELİ\nTC: 12345678950");
 * // entities.best_name()->text == "Ali Veli"
 * // entities.national_id->validated == true
 * @endcode
 */

#ifndef SGKDOC_EXTRACTION_ENTITY_EXTRACTOR_HPP
#define SGKDOC_EXTRACTION_ENTITY_EXTRACTOR_HPP

#include "sgkdoc/extraction/institutional_filter.hpp"
#include <sgkdoc/di/ilogger.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sgkdoc::extraction {

// =============================================================================
// Extracted Entity Types
// =============================================================================

/**
 * @brief A person-name candidate that passed cleaning and validity checks
 */
struct name_candidate {
    std::string text;        ///< Proper-cased name, e.g. "Ali Veli"
    int score{0};            ///< Context score used for ranking
    double confidence{0.0};  ///< min(1, score / 10), never negative
};

/**
 * @brief An 11-digit identity number found in the text
 */
struct national_id_candidate {
    std::string text;
    bool validated{false};  ///< Checksum passed
    bool labelled{false};   ///< Preceded by a TC/KİMLİK label
};

/**
 * @brief Role inferred for a date from its surrounding label
 */
enum class date_role {
    birth,     ///< Labelled "doğum tarihi" / "birth date"
    document,  ///< First unlabelled date (issue or prescription date)
    other
};

[[nodiscard]] std::string_view to_string(date_role role) noexcept;

struct date_candidate {
    std::string text;  ///< As found, e.g. "03.07.1965"
    std::string iso;   ///< YYYY-MM-DD
    date_role role{date_role::other};
};

/**
 * @brief Everything the extractor found in one OCR text
 *
 * Names are ranked best first. national_id is the first checksum-valid
 * number; when none validates, the first 11-digit run is kept with
 * validated = false for diagnostics and must not be used for matching.
 */
struct extracted_entities {
    std::vector<name_candidate> names;
    std::optional<national_id_candidate> national_id;
    std::vector<date_candidate> dates;

    /// Mobile number as found ("0532 123 45 67"), or empty
    std::string phone;

    /// min(0.7, best name score / 10) + 0.3 (valid ID) + 0.2 (any date), capped at 1
    double confidence{0.0};

    [[nodiscard]] const name_candidate* best_name() const noexcept {
        return names.empty() ? nullptr : &names.front();
    }

    /// Validated ID text, or empty
    [[nodiscard]] std::string valid_national_id() const {
        return national_id && national_id->validated ? national_id->text : std::string{};
    }

    /// ISO birth date: a labelled birth date, else the first date found
    [[nodiscard]] std::optional<std::string> birth_date() const;

    /// True when neither a name nor a validated ID was found
    [[nodiscard]] bool empty() const noexcept {
        return names.empty() && !(national_id && national_id->validated);
    }
};

// =============================================================================
// Entity Extractor
// =============================================================================

/**
 * @class entity_extractor
 * @brief Extracts patient entities from OCR text
 *
 * Thread Safety: extract() is const and may be called concurrently.
 */
class entity_extractor {
public:
    explicit entity_extractor(std::shared_ptr<di::ILogger> logger = nullptr);

    entity_extractor(institutional_filter filter,
                     std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Run all extraction rules
     * @param ocr_text UTF-8 OCR output; may be empty
     */
    [[nodiscard]] extracted_entities extract(std::string_view ocr_text) const;

    /**
     * @brief Name candidates only, ranked best first
     */
    [[nodiscard]] std::vector<name_candidate> extract_names(std::string_view ocr_text) const;

    [[nodiscard]] static std::optional<national_id_candidate>
    extract_national_id(std::string_view ocr_text);

    [[nodiscard]] static std::vector<date_candidate> extract_dates(std::string_view ocr_text);

    /**
     * @brief First Turkish mobile number (05xx xxx xx xx, optional +90)
     */
    [[nodiscard]] static std::string extract_phone(std::string_view ocr_text);

    /**
     * @brief Strip leading field labels and everything from the first
     * trailing label on; returns empty when fewer than 4 characters remain
     */
    [[nodiscard]] static std::string clean_name(std::string_view raw);

    /**
     * @brief 2-4 tokens of at least 2 letters each, letters only,
     * not institutional
     */
    [[nodiscard]] bool is_valid_name(std::string_view name) const;

    /**
     * @brief Context score of a candidate found at @p position in @p text
     *
     * @param name Cleaned candidate
     * @param text Full OCR text
     * @param position Byte offset of the raw match, or npos when unknown
     * @param length Byte length of the raw match
     */
    [[nodiscard]] static int score_name(std::string_view name,
                                        std::string_view text,
                                        std::size_t position,
                                        std::size_t length);

    [[nodiscard]] static bool has_turkish_name_ending(std::string_view name);

    /**
     * @brief "3.7.1965", "03/07/1965", "1965-07-03" -> "1965-07-03"
     * @return std::nullopt for malformed input or an impossible day/month
     */
    [[nodiscard]] static std::optional<std::string> to_iso_date(std::string_view date);

    [[nodiscard]] const institutional_filter& filter() const noexcept { return filter_; }

private:
    institutional_filter filter_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace sgkdoc::extraction

#endif  // SGKDOC_EXTRACTION_ENTITY_EXTRACTOR_HPP
