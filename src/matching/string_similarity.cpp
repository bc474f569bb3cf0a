/**
 * @file string_similarity.cpp
 * @brief Implementation of the name similarity measures
 */

#include "sgkdoc/matching/string_similarity.hpp"

#include "sgkdoc/text/turkish_text.hpp"

#include <algorithm>
#include <numeric>
#include <string>
#include <vector>

namespace sgkdoc::matching {

namespace {

std::vector<std::string> tokens_longer_than(std::string_view value, std::size_t min_length) {
    auto words = text::split_words(value);
    words.erase(std::remove_if(words.begin(), words.end(),
                               [&](const std::string& w) { return w.size() <= min_length; }),
                words.end());
    return words;
}

std::string digits_only(std::string_view value) {
    std::string digits;
    for (char c : value) {
        if (c >= '0' && c <= '9') {
            digits.push_back(c);
        }
    }
    return digits;
}

}  // namespace

std::size_t levenshtein_distance(std::string_view a, std::string_view b) {
    // Two-row dynamic programming
    std::vector<std::size_t> previous(b.size() + 1);
    std::vector<std::size_t> current(b.size() + 1);
    std::iota(previous.begin(), previous.end(), std::size_t{0});

    for (std::size_t i = 1; i <= a.size(); ++i) {
        current[0] = i;
        for (std::size_t j = 1; j <= b.size(); ++j) {
            const std::size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
            current[j] = std::min({previous[j] + 1, current[j - 1] + 1, previous[j - 1] + cost});
        }
        std::swap(previous, current);
    }
    return previous[b.size()];
}

double levenshtein_similarity(std::string_view a, std::string_view b) {
    const std::size_t longest = std::max(a.size(), b.size());
    if (longest == 0) {
        return 1.0;
    }
    return 1.0 - static_cast<double>(levenshtein_distance(a, b)) / static_cast<double>(longest);
}

double jaro_winkler_similarity(std::string_view a, std::string_view b) {
    if (a == b) {
        return 1.0;
    }
    const std::size_t len1 = a.size();
    const std::size_t len2 = b.size();
    if (len1 == 0 || len2 == 0) {
        return 0.0;
    }

    const auto half = static_cast<long>(std::max(len1, len2) / 2);
    const long window = std::max(0L, half - 1);

    std::vector<bool> a_matched(len1, false);
    std::vector<bool> b_matched(len2, false);

    std::size_t matches = 0;
    for (std::size_t i = 0; i < len1; ++i) {
        const auto start = static_cast<std::size_t>(std::max(0L, static_cast<long>(i) - window));
        const auto end = std::min(i + static_cast<std::size_t>(window) + 1, len2);
        for (std::size_t j = start; j < end; ++j) {
            if (b_matched[j] || a[i] != b[j]) {
                continue;
            }
            a_matched[i] = true;
            b_matched[j] = true;
            ++matches;
            break;
        }
    }

    if (matches == 0) {
        return 0.0;
    }

    std::size_t transpositions = 0;
    std::size_t k = 0;
    for (std::size_t i = 0; i < len1; ++i) {
        if (!a_matched[i]) {
            continue;
        }
        while (!b_matched[k]) {
            ++k;
        }
        if (a[i] != b[k]) {
            ++transpositions;
        }
        ++k;
    }

    const double m = static_cast<double>(matches);
    const double jaro = (m / static_cast<double>(len1) + m / static_cast<double>(len2) +
                         (m - static_cast<double>(transpositions) / 2.0) / m) / 3.0;

    std::size_t prefix = 0;
    const std::size_t prefix_limit = std::min({len1, len2, std::size_t{4}});
    while (prefix < prefix_limit && a[prefix] == b[prefix]) {
        ++prefix;
    }

    return jaro + 0.1 * static_cast<double>(prefix) * (1.0 - jaro);
}

double word_similarity(std::string_view a, std::string_view b) {
    const auto words_a = text::split_words(a);
    const auto words_b = text::split_words(b);
    if (words_a.empty() || words_b.empty()) {
        return 0.0;
    }

    double total = 0.0;
    for (const auto& word_a : words_a) {
        double best = 0.0;
        for (const auto& word_b : words_b) {
            best = std::max(best, levenshtein_similarity(word_a, word_b));
        }
        total += best;
    }
    return total / static_cast<double>(words_a.size());
}

double lcs_similarity(std::string_view a, std::string_view b) {
    if (a.empty() || b.empty()) {
        return 0.0;
    }

    std::vector<std::size_t> previous(b.size() + 1, 0);
    std::vector<std::size_t> current(b.size() + 1, 0);
    for (std::size_t i = 1; i <= a.size(); ++i) {
        for (std::size_t j = 1; j <= b.size(); ++j) {
            current[j] = a[i - 1] == b[j - 1] ? previous[j - 1] + 1
                                              : std::max(previous[j], current[j - 1]);
        }
        std::swap(previous, current);
    }

    const auto lcs = static_cast<double>(previous[b.size()]);
    return 2.0 * lcs / static_cast<double>(a.size() + b.size());
}

std::array<double, 4> name_similarity_scores(std::string_view a, std::string_view b) {
    return {levenshtein_similarity(a, b), jaro_winkler_similarity(a, b),
            word_similarity(a, b), lcs_similarity(a, b)};
}

double exact_word_overlap(std::string_view a, std::string_view b) {
    const auto words_a = text::split_words(a);
    const auto words_b = text::split_words(b);
    const std::size_t denominator = std::max(words_a.size(), words_b.size());
    if (denominator == 0) {
        return 0.0;
    }

    const auto matched = std::count_if(words_a.begin(), words_a.end(), [&](const std::string& w) {
        return std::find(words_b.begin(), words_b.end(), w) != words_b.end();
    });
    return static_cast<double>(matched) / static_cast<double>(denominator);
}

double name_order_score(std::string_view a, std::string_view b) {
    const auto words_a = tokens_longer_than(a, 1);
    const auto words_b = tokens_longer_than(b, 1);
    if (words_a.empty() || words_b.empty() || words_a.size() != words_b.size()) {
        return 0.0;
    }

    std::size_t aligned = 0;
    for (std::size_t i = 0; i < words_a.size(); ++i) {
        if (levenshtein_similarity(words_a[i], words_b[i]) > 0.8) {
            ++aligned;
        }
    }
    return static_cast<double>(aligned) / static_cast<double>(words_a.size());
}

double phone_similarity(std::string_view a, std::string_view b) {
    const auto digits_a = digits_only(a);
    const auto digits_b = digits_only(b);
    if (digits_a.empty() || digits_b.empty()) {
        return 0.0;
    }

    auto suffix = [](const std::string& digits) {
        return digits.size() > 7 ? digits.substr(digits.size() - 7) : digits;
    };
    return suffix(digits_a) == suffix(digits_b) ? 1.0 : 0.0;
}

}  // namespace sgkdoc::matching
