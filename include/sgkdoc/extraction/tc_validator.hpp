/**
 * @file tc_validator.hpp
 * @brief Turkish national identity (TC kimlik) number checksum
 *
 * A TC number has 11 digits d0..d10 with d0 != 0 and two check digits:
 *   d9  = (7 * (d0 + d2 + d4 + d6 + d8) - (d1 + d3 + d5 + d7)) mod 10
 *   d10 = (d0 + d1 + ... + d9) mod 10
 * The subtraction is taken modulo 10 with a non-negative result.
 */

#ifndef SGKDOC_EXTRACTION_TC_VALIDATOR_HPP
#define SGKDOC_EXTRACTION_TC_VALIDATOR_HPP

#include <optional>
#include <string>
#include <string_view>

namespace sgkdoc::extraction {

/// Number of digits in a TC identity number
inline constexpr std::size_t tc_number_length = 11;

/**
 * @brief Validate an identity number
 *
 * @param value Candidate; must be exactly 11 ASCII digits, no separators
 * @return true when the length, leading digit and both check digits hold
 */
[[nodiscard]] bool is_valid_tc_number(std::string_view value) noexcept;

/**
 * @brief Complete a 9-digit prefix with its two check digits
 *
 * @param prefix The first nine digits (leading digit must not be 0)
 * @return The full 11-digit number, or std::nullopt for a malformed prefix
 */
[[nodiscard]] std::optional<std::string> complete_tc_number(std::string_view prefix);

}  // namespace sgkdoc::extraction

#endif  // SGKDOC_EXTRACTION_TC_VALIDATOR_HPP
