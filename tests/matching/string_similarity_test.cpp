/**
 * @file string_similarity_test.cpp
 * @brief Unit tests for the name similarity measures
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <sgkdoc/matching/string_similarity.hpp>

using namespace sgkdoc::matching;
using Catch::Matchers::WithinAbs;

TEST_CASE("Levenshtein distance and similarity", "[matching][similarity]") {
    CHECK(levenshtein_distance("kitten", "sitting") == 3);
    CHECK(levenshtein_distance("", "abc") == 3);
    CHECK(levenshtein_distance("ali", "ali") == 0);

    CHECK_THAT(levenshtein_similarity("", ""), WithinAbs(1.0, 1e-9));
    CHECK_THAT(levenshtein_similarity("abcd", "abcx"), WithinAbs(0.75, 1e-9));
    CHECK_THAT(levenshtein_similarity("abc", "xyz"), WithinAbs(0.0, 1e-9));
}

TEST_CASE("Jaro-Winkler rewards common prefixes", "[matching][similarity]") {
    CHECK_THAT(jaro_winkler_similarity("martha", "marhta"), WithinAbs(0.9611, 1e-3));
    CHECK_THAT(jaro_winkler_similarity("ali", "ali"), WithinAbs(1.0, 1e-9));
    CHECK_THAT(jaro_winkler_similarity("", "ali"), WithinAbs(0.0, 1e-9));
    CHECK_THAT(jaro_winkler_similarity("abc", "xyz"), WithinAbs(0.0, 1e-9));
}

TEST_CASE("Word and LCS similarity", "[matching][similarity]") {
    CHECK_THAT(word_similarity("ali veli", "veli ali"), WithinAbs(1.0, 1e-9));
    CHECK_THAT(word_similarity("", "ali"), WithinAbs(0.0, 1e-9));

    CHECK_THAT(lcs_similarity("abc", "abc"), WithinAbs(1.0, 1e-9));
    CHECK_THAT(lcs_similarity("abcd", "abxd"), WithinAbs(0.75, 1e-9));
    CHECK_THAT(lcs_similarity("", "abc"), WithinAbs(0.0, 1e-9));

    auto scores = name_similarity_scores("ali veli", "ali veli");
    for (double s : scores) {
        CHECK_THAT(s, WithinAbs(1.0, 1e-9));
    }
}

TEST_CASE("Exact word overlap and order", "[matching][similarity]") {
    CHECK_THAT(exact_word_overlap("ali veli", "veli ali"), WithinAbs(1.0, 1e-9));
    CHECK_THAT(exact_word_overlap("ali veli", "ali kaya"), WithinAbs(0.5, 1e-9));
    CHECK_THAT(exact_word_overlap("ali", "ali veli can"), WithinAbs(1.0 / 3.0, 1e-9));
    CHECK_THAT(exact_word_overlap("", ""), WithinAbs(0.0, 1e-9));

    CHECK_THAT(name_order_score("ali veli", "ali veli"), WithinAbs(1.0, 1e-9));
    CHECK_THAT(name_order_score("ali veli", "veli ali"), WithinAbs(0.0, 1e-9));
    CHECK_THAT(name_order_score("ali veli", "ali veli can"), WithinAbs(0.0, 1e-9));
}

TEST_CASE("Phone similarity compares the last seven digits", "[matching][similarity]") {
    CHECK_THAT(phone_similarity("0532 123 45 67", "+90 532 123 45 67"), WithinAbs(1.0, 1e-9));
    CHECK_THAT(phone_similarity("0532 123 45 67", "0532 123 45 68"), WithinAbs(0.0, 1e-9));
    CHECK_THAT(phone_similarity("", "0532 123 45 67"), WithinAbs(0.0, 1e-9));
}
