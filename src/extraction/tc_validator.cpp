/**
 * @file tc_validator.cpp
 * @brief Implementation of the TC identity number checksum
 */

#include "sgkdoc/extraction/tc_validator.hpp"

#include <algorithm>
#include <array>

namespace sgkdoc::extraction {

namespace {

bool all_digits(std::string_view value) noexcept {
    return std::all_of(value.begin(), value.end(),
                       [](char c) { return c >= '0' && c <= '9'; });
}

/// Returns {d9, d10} for the first nine digits
std::array<int, 2> check_digits(std::string_view first_nine) noexcept {
    int odd_sum = 0;
    int even_sum = 0;
    for (std::size_t i = 0; i < 9; ++i) {
        const int digit = first_nine[i] - '0';
        if (i % 2 == 0) {
            odd_sum += digit;
        } else {
            even_sum += digit;
        }
    }

    const int tenth = ((7 * odd_sum - even_sum) % 10 + 10) % 10;
    const int eleventh = (odd_sum + even_sum + tenth) % 10;
    return {tenth, eleventh};
}

}  // namespace

bool is_valid_tc_number(std::string_view value) noexcept {
    if (value.size() != tc_number_length || !all_digits(value) || value.front() == '0') {
        return false;
    }

    const auto expected = check_digits(value.substr(0, 9));
    return (value[9] - '0') == expected[0] && (value[10] - '0') == expected[1];
}

std::optional<std::string> complete_tc_number(std::string_view prefix) {
    if (prefix.size() != 9 || !all_digits(prefix) || prefix.front() == '0') {
        return std::nullopt;
    }

    const auto digits = check_digits(prefix);
    std::string result(prefix);
    result.push_back(static_cast<char>('0' + digits[0]));
    result.push_back(static_cast<char>('0' + digits[1]));
    return result;
}

}  // namespace sgkdoc::extraction
