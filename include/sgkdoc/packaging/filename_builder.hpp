/**
 * @file filename_builder.hpp
 * @brief Deterministic names for packaged SGK documents
 */

#ifndef SGKDOC_PACKAGING_FILENAME_BUILDER_HPP
#define SGKDOC_PACKAGING_FILENAME_BUILDER_HPP

#include "sgkdoc/classification/document_type.hpp"
#include "sgkdoc/matching/identity_resolver.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace sgkdoc::packaging {

/**
 * @brief Inputs of a generated file name
 */
struct filename_request {
    matching::match_tier tier = matching::match_tier::none;

    /// Directory name of the assigned patient; empty when unassigned
    std::string matched_name;

    /// Name read from the page; used when no patient is assigned
    std::string extracted_name;

    classification::document_type type = classification::document_type::other;
    double classification_confidence = 0.0;

    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

/**
 * @class filename_builder
 * @brief Builds `<NAME>_<TYPE>[_CHECK]_<YYYYMMDD>_<HHMM><INDICATOR>.pdf`
 *
 * Indicator: none for a high-tier assignment, `_VERIFY` for medium,
 * `_MANUAL` for low, `_UNMATCHED` when only an extracted name is known.
 * `_CHECK` follows the type when the classification confidence is below 0.8.
 */
class filename_builder {
public:
    static constexpr std::string_view unknown_patient = "BILINMEYEN_HASTA";
    static constexpr std::string_view extension = ".pdf";
    static constexpr double check_threshold = 0.8;

    /**
     * @brief File-system safe upper-case token
     *
     * Turkish letters are folded to ASCII, everything outside
     * `[A-Za-z0-9 ]` is dropped, whitespace runs become a single '_'.
     * "Ayşe Gül Öztürk" -> "AYSE_GUL_OZTURK"
     */
    [[nodiscard]] static std::string sanitize(std::string_view text);

    /// "Recete", "Pil_Recete", "Cihaz_Recete"; other types use their tag
    [[nodiscard]] static std::string type_part(classification::document_type type);

    [[nodiscard]] static std::string_view indicator(const filename_request& request) noexcept;

    /// Without extension
    [[nodiscard]] static std::string stem(const filename_request& request);

    [[nodiscard]] static std::string build(const filename_request& request);
};

}  // namespace sgkdoc::packaging

#endif  // SGKDOC_PACKAGING_FILENAME_BUILDER_HPP
