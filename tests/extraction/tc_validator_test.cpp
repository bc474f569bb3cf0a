/**
 * @file tc_validator_test.cpp
 * @brief Unit tests for the TC identity number checksum
 */

#include <catch2/catch_test_macros.hpp>

#include <sgkdoc/extraction/tc_validator.hpp>

#include <cstdint>
#include <string>

using namespace sgkdoc::extraction;

namespace {

/// Deterministic 9-digit prefixes with a non-zero first digit
std::string prefix_from(uint32_t seed) {
    std::string prefix;
    uint32_t state = seed * 2654435761u + 1u;
    for (int i = 0; i < 9; ++i) {
        state = state * 1103515245u + 12345u;
        int digit = static_cast<int>((state >> 16) % 10);
        if (i == 0 && digit == 0) {
            digit = 1 + static_cast<int>(seed % 9);
        }
        prefix.push_back(static_cast<char>('0' + digit));
    }
    return prefix;
}

}  // namespace

TEST_CASE("Known TC numbers", "[extraction][tc]") {
    CHECK(is_valid_tc_number("12345678950"));
    CHECK(is_valid_tc_number("10000000146"));

    CHECK_FALSE(is_valid_tc_number("12345678951"));
    CHECK_FALSE(is_valid_tc_number("12345678940"));
}

TEST_CASE("Malformed TC numbers are rejected", "[extraction][tc]") {
    CHECK_FALSE(is_valid_tc_number(""));
    CHECK_FALSE(is_valid_tc_number("1234567895"));
    CHECK_FALSE(is_valid_tc_number("123456789500"));
    CHECK_FALSE(is_valid_tc_number("1234567895a"));
    CHECK_FALSE(is_valid_tc_number("02345678950"));
}

TEST_CASE("Completed prefixes always validate", "[extraction][tc]") {
    for (uint32_t seed = 0; seed < 500; ++seed) {
        const auto prefix = prefix_from(seed);
        auto completed = complete_tc_number(prefix);
        REQUIRE(completed.has_value());
        CHECK(completed->size() == tc_number_length);
        CHECK(completed->compare(0, 9, prefix) == 0);
        CHECK(is_valid_tc_number(*completed));
    }
}

TEST_CASE("Any single-digit change breaks the checksum", "[extraction][tc]") {
    for (uint32_t seed = 0; seed < 100; ++seed) {
        auto valid = complete_tc_number(prefix_from(seed));
        REQUIRE(valid.has_value());

        for (std::size_t pos = 0; pos < tc_number_length; ++pos) {
            for (char digit = '0'; digit <= '9'; ++digit) {
                if (digit == (*valid)[pos]) {
                    continue;
                }
                auto changed = *valid;
                changed[pos] = digit;
                CHECK_FALSE(is_valid_tc_number(changed));
            }
        }
    }
}

TEST_CASE("Prefix completion rejects bad input", "[extraction][tc]") {
    CHECK_FALSE(complete_tc_number("12345678").has_value());
    CHECK_FALSE(complete_tc_number("012345678").has_value());
    CHECK_FALSE(complete_tc_number("1234a6789").has_value());
    CHECK(complete_tc_number("123456789") == std::optional<std::string>("12345678950"));
}
