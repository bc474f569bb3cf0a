/**
 * @file institutional_filter.hpp
 * @brief Detects organisation, role and document vocabulary in name candidates
 *
 * OCR of SGK paperwork picks up hospital headers, ministry names and staff
 * titles in the same all-caps layout as patient names. Text flagged here is
 * never treated as a person name by the extractor or the resolver.
 */

#ifndef SGKDOC_EXTRACTION_INSTITUTIONAL_FILTER_HPP
#define SGKDOC_EXTRACTION_INSTITUTIONAL_FILTER_HPP

#include <string>
#include <string_view>
#include <vector>

namespace sgkdoc::extraction {

/**
 * @brief Keyword blocklist matcher
 *
 * Text is upper-cased with Turkish rules and folded to ASCII before matching.
 * Keywords of five or more letters match anywhere ("KURUMU" hits "KURUM");
 * shorter ones ("DR", "LTD", "FORM") only as whole words, so they do not fire
 * inside ordinary names.
 */
class institutional_filter {
public:
    /// Filter with the built-in Turkish/English blocklist
    institutional_filter();

    /// Filter with a custom keyword list (any case, Turkish letters allowed)
    explicit institutional_filter(const std::vector<std::string>& keywords);

    [[nodiscard]] bool is_institutional(std::string_view text) const;

    /// Folded, de-duplicated keywords in use
    [[nodiscard]] const std::vector<std::string>& keywords() const noexcept {
        return keywords_;
    }

    [[nodiscard]] static const std::vector<std::string>& default_keywords();

private:
    std::vector<std::string> keywords_;
};

}  // namespace sgkdoc::extraction

#endif  // SGKDOC_EXTRACTION_INSTITUTIONAL_FILTER_HPP
