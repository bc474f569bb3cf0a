/**
 * @file string_similarity.hpp
 * @brief String similarity measures used for patient name matching
 *
 * All measures return a value in [0, 1] and operate on bytes. Callers pass
 * text produced by text::normalize_for_matching(), which is ASCII, so a byte
 * is a character.
 */

#ifndef SGKDOC_MATCHING_STRING_SIMILARITY_HPP
#define SGKDOC_MATCHING_STRING_SIMILARITY_HPP

#include <array>
#include <cstddef>
#include <string_view>

namespace sgkdoc::matching {

/**
 * @brief Edit distance with unit insert, delete and substitute costs
 */
[[nodiscard]] std::size_t levenshtein_distance(std::string_view a, std::string_view b);

/**
 * @brief 1 - distance / max(len); two empty strings are identical (1.0)
 */
[[nodiscard]] double levenshtein_similarity(std::string_view a, std::string_view b);

/**
 * @brief Jaro-Winkler with match window max(len)/2 - 1, prefix scaling 0.1
 * over at most 4 leading characters
 */
[[nodiscard]] double jaro_winkler_similarity(std::string_view a, std::string_view b);

/**
 * @brief Order-independent token similarity
 *
 * Every token of @p a is paired with its most similar token of @p b
 * (Levenshtein similarity); the result is the mean over the tokens of @p a.
 */
[[nodiscard]] double word_similarity(std::string_view a, std::string_view b);

/**
 * @brief 2 * |LCS| / (len(a) + len(b))
 */
[[nodiscard]] double lcs_similarity(std::string_view a, std::string_view b);

/**
 * @brief The four name measures in fixed order:
 * Levenshtein, Jaro-Winkler, word, LCS
 */
[[nodiscard]] std::array<double, 4> name_similarity_scores(std::string_view a,
                                                           std::string_view b);

/**
 * @brief Tokens of @p a present verbatim in @p b, over max(token counts)
 */
[[nodiscard]] double exact_word_overlap(std::string_view a, std::string_view b);

/**
 * @brief Fraction of aligned token positions with similarity above 0.8
 *
 * Tokens of one character are ignored. Returns 0 when the token counts differ.
 */
[[nodiscard]] double name_order_score(std::string_view a, std::string_view b);

/**
 * @brief 1.0 when the last seven digits of both numbers agree
 *
 * Non-digits are ignored; numbers without digits never match.
 */
[[nodiscard]] double phone_similarity(std::string_view a, std::string_view b);

}  // namespace sgkdoc::matching

#endif  // SGKDOC_MATCHING_STRING_SIMILARITY_HPP
