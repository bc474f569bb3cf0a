/**
 * @file identity_resolver_test.cpp
 * @brief Unit tests for patient ranking, tiering and the keyword fallback
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <sgkdoc/extraction/entity_extractor.hpp>
#include <sgkdoc/matching/identity_resolver.hpp>

#include <algorithm>
#include <set>
#include <vector>

using namespace sgkdoc;
using namespace sgkdoc::matching;
using Catch::Matchers::WithinAbs;

namespace {

std::vector<patient> sample_directory() {
    return {
        {"p1", "Ali Veli", "12345678950", "1965-07-03", "0532 123 45 67"},
        {"p2", "Ayşe Yılmaz", "", "", ""},
        {"p3", "Mehmet Kaya", "", "", ""},
    };
}

extraction::extracted_entities entities_with_name(const std::string& name) {
    extraction::extracted_entities entities;
    entities.names.push_back({name, 10, 1.0});
    return entities;
}

}  // namespace

TEST_CASE("Name and TC number resolve with high confidence", "[matching][resolver]") {
    const std::string text = "ALİ VELİ\nTC: 12345678950\nReçete";
    extraction::entity_extractor extractor;
    identity_resolver resolver;
    const auto directory = sample_directory();

    auto result = resolver.resolve(extractor.extract(text), directory, text);

    CHECK(result.tier == match_tier::high);
    CHECK(result.method == match_method::fuzzy);
    REQUIRE(result.matched());
    CHECK(*result.matched_patient_id == "p1");
    CHECK_FALSE(result.requires_confirmation);
    CHECK(result.query_name == "Ali Veli");
    CHECK_THAT(result.confidence, WithinAbs(1.0, 1e-9));

    REQUIRE_FALSE(result.candidates.empty());
    CHECK(result.candidates.front().patient_id == "p1");
    CHECK_THAT(result.candidates.front().breakdown.national_id, WithinAbs(1.0, 1e-9));
    CHECK(result.candidates.size() <= resolver.config().max_candidates);
}

TEST_CASE("Institutional text never resolves", "[matching][resolver]") {
    const std::string text = "SOSYAL GÜVENLİK KURUMU RAPORU";
    extraction::entity_extractor extractor;
    identity_resolver resolver;
    const auto directory = sample_directory();

    auto result = resolver.resolve(extractor.extract(text), directory, text);

    CHECK(result.tier == match_tier::none);
    CHECK(result.method == match_method::none);
    CHECK_FALSE(result.matched());
    CHECK(result.candidates.empty());
    CHECK(result.query_name.empty());
    CHECK(result.reason == "No name or TC number found in document");
}

TEST_CASE("Ranking is deterministic and ties break by id", "[matching][resolver]") {
    identity_resolver resolver;
    auto entities = entities_with_name("Ali Veli");

    std::vector<patient> directory = {
        {"p-b", "Ali Veli", "", "", ""},
        {"p-c", "Ali Kaya", "", "", ""},
        {"p-a", "Ali Veli", "", "", ""},
    };

    auto first = resolver.resolve(entities, directory, "");
    std::reverse(directory.begin(), directory.end());
    auto second = resolver.resolve(entities, directory, "");

    REQUIRE(first.candidates.size() == 3);
    REQUIRE(second.candidates.size() == 3);
    for (std::size_t i = 0; i < first.candidates.size(); ++i) {
        CHECK(first.candidates[i].patient_id == second.candidates[i].patient_id);
        CHECK(first.candidates[i].confidence == second.candidates[i].confidence);
    }

    CHECK(first.candidates[0].patient_id == "p-a");
    CHECK(first.candidates[1].patient_id == "p-b");
    CHECK(first.candidates[2].patient_id == "p-c");
    CHECK(*first.matched_patient_id == "p-a");
}

TEST_CASE("Directory entries are filtered before scoring", "[matching][resolver]") {
    identity_resolver resolver;
    auto entities = entities_with_name("Ali Veli");

    std::vector<patient> directory = {
        {"p1", "Ali Veli", "", "", ""},
        {"p1", "Ali Veli", "", "", ""},
        {"inst", "Devlet Hastanesi", "", "", ""},
        {"", "Ali Veli", "", "", ""},
        {"blank", "   ", "", "", ""},
    };

    auto candidates = resolver.score_directory(entities, directory);

    REQUIRE(candidates.size() == 1);
    CHECK(candidates.front().patient_id == "p1");
}

TEST_CASE("Tier thresholds", "[matching][resolver]") {
    identity_resolver resolver;

    CHECK(resolver.classify(1.0) == match_tier::high);
    CHECK(resolver.classify(0.40) == match_tier::high);
    CHECK(resolver.classify(0.39) == match_tier::medium);
    CHECK(resolver.classify(0.25) == match_tier::medium);
    CHECK(resolver.classify(0.20) == match_tier::low);
    CHECK(resolver.classify(0.15) == match_tier::low);
    CHECK(resolver.classify(0.10) == match_tier::none);
    CHECK(resolver.classify(0.0) == match_tier::none);
}

TEST_CASE("Medium and low tiers", "[matching][resolver]") {
    auto entities = entities_with_name("Ali Veli");
    std::vector<patient> directory = {{"p1", "Ali Kaya", "", "", ""}};

    SECTION("medium assigns but asks for confirmation") {
        resolver_config config;
        config.high_threshold = 0.99;
        config.medium_threshold = 0.30;
        config.low_threshold = 0.10;
        identity_resolver resolver(config);

        auto result = resolver.resolve(entities, directory, "");
        CHECK(result.tier == match_tier::medium);
        REQUIRE(result.matched());
        CHECK(*result.matched_patient_id == "p1");
        CHECK(result.requires_confirmation);
    }

    SECTION("low reports candidates without assigning") {
        resolver_config config;
        config.high_threshold = 0.99;
        config.medium_threshold = 0.98;
        config.low_threshold = 0.10;
        identity_resolver resolver(config);

        auto result = resolver.resolve(entities, directory, "");
        CHECK(result.tier == match_tier::low);
        CHECK(result.method == match_method::fuzzy);
        CHECK_FALSE(result.matched());
        CHECK_FALSE(result.requires_confirmation);
        REQUIRE(result.candidates.size() == 1);
        CHECK(result.candidates.front().patient_id == "p1");
        CHECK_FALSE(result.reason.empty());
    }
}

TEST_CASE("TC number alone is reported below threshold", "[matching][resolver]") {
    identity_resolver resolver;
    extraction::extracted_entities entities;
    entities.national_id = extraction::national_id_candidate{"12345678950", true, true};

    auto result = resolver.resolve(entities, sample_directory(), "");

    CHECK(result.tier == match_tier::none);
    CHECK_FALSE(result.matched());
    REQUIRE(result.candidates.size() == 1);
    CHECK(result.candidates.front().patient_id == "p1");
    CHECK_THAT(result.confidence, WithinAbs(0.10, 1e-9));
    CHECK(result.reason == "No matching patient found");
}

TEST_CASE("Keyword fallback searches the raw text", "[matching][resolver][keyword]") {
    identity_resolver resolver;
    extraction::extracted_entities no_entities;

    SECTION("single hit is a high-tier match") {
        auto result = resolver.resolve(no_entities, sample_directory(),
                                       "Teslim alan: ayşe yılmaz imza");

        CHECK(result.method == match_method::keyword_search);
        CHECK(result.tier == match_tier::high);
        CHECK_FALSE(result.requires_confirmation);
        REQUIRE(result.matched());
        CHECK(*result.matched_patient_id == "p2");
        CHECK_THAT(result.confidence, WithinAbs(0.95, 1e-9));
    }

    SECTION("several hits need confirmation") {
        auto directory = sample_directory();
        directory.push_back({"p4", "Yılmaz Ayşe", "", "", ""});

        auto result = resolver.resolve(no_entities, directory, "AYŞE YILMAZ");

        CHECK(result.method == match_method::keyword_search);
        CHECK(result.tier == match_tier::medium);
        CHECK(result.requires_confirmation);
        REQUIRE(result.candidates.size() == 2);
        CHECK(result.candidates[0].patient_id == "p2");
        CHECK(result.candidates[1].patient_id == "p4");
        CHECK_THAT(result.confidence, WithinAbs(0.25, 1e-9));
    }

    SECTION("partial names do not match") {
        auto result = resolver.resolve(no_entities, sample_directory(), "Ayşe hanım geldi");
        CHECK(result.tier == match_tier::none);
        CHECK(result.candidates.empty());
    }

    SECTION("short tokens are ignored") {
        // "Ay" is shorter than the minimum token length, leaving one token
        std::vector<patient> directory = {{"p9", "Ay Demir", "", "", ""}};
        auto result = resolver.resolve(no_entities, directory, "ay demir");
        CHECK(result.tier == match_tier::none);
        CHECK(result.candidates.empty());
    }
}
