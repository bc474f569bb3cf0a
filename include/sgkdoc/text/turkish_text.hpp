/**
 * @file turkish_text.hpp
 * @brief UTF-8 and Turkish-aware text helpers
 *
 * OCR output and patient names are UTF-8. Case mapping follows Turkish rules
 * (I <-> ı, İ <-> i), which the C locale functions do not. Wide strings are
 * UTF-32 on the supported platforms and are used where regular expressions
 * must see whole code points.
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sgkdoc::text {

/**
 * @brief Decode UTF-8 into code points; malformed sequences become U+FFFD
 */
[[nodiscard]] auto to_wide(std::string_view utf8) -> std::wstring;

/**
 * @brief Encode code points as UTF-8
 */
[[nodiscard]] auto to_utf8(std::wstring_view wide) -> std::string;

[[nodiscard]] auto is_turkish_letter(wchar_t c) noexcept -> bool;

[[nodiscard]] auto to_lower_tr(wchar_t c) noexcept -> wchar_t;
[[nodiscard]] auto to_upper_tr(wchar_t c) noexcept -> wchar_t;

[[nodiscard]] auto to_lower_tr(std::string_view utf8) -> std::string;
[[nodiscard]] auto to_upper_tr(std::string_view utf8) -> std::string;

/**
 * @brief Replace Turkish letters by their ASCII base letter, keeping case
 *
 * ç->c, ğ->g, ı->i, İ->I, ö->o, ş->s, ü->u (and upper-case forms).
 */
[[nodiscard]] auto fold_diacritics(std::string_view utf8) -> std::string;

/**
 * @brief Upper-case then fold to ASCII ("Sağlık" -> "SAGLIK")
 */
[[nodiscard]] auto fold_upper(std::string_view utf8) -> std::string;

/**
 * @brief Normalize text for fuzzy name comparison
 *
 * Lower-cases (Turkish rules), folds diacritics, folds common OCR digit
 * confusions (0->o, 1->i, 5->s, 8->b, 6->g), removes everything outside
 * [a-z0-9 ] and collapses whitespace.
 */
[[nodiscard]] auto normalize_for_matching(std::string_view utf8) -> std::string;

/**
 * @brief "ALİ VELİ" -> "Ali Veli"
 */
[[nodiscard]] auto to_proper_case(std::string_view utf8) -> std::string;

/**
 * @brief Split on ASCII whitespace, dropping empty tokens
 */
[[nodiscard]] auto split_words(std::string_view text) -> std::vector<std::string>;

/**
 * @brief Number of code points in a UTF-8 string
 */
[[nodiscard]] auto char_length(std::string_view utf8) -> std::size_t;

/**
 * @brief Trim ASCII whitespace on both ends
 */
[[nodiscard]] auto trim(std::string_view text) -> std::string;

/**
 * @brief True when @p word occurs in @p text bounded by non-alphanumerics
 *
 * Both arguments are expected to be ASCII (normalized or folded) text.
 */
[[nodiscard]] auto contains_word(std::string_view text, std::string_view word) noexcept -> bool;

}  // namespace sgkdoc::text
