/**
 * @file entity_extractor_test.cpp
 * @brief Unit tests for name, identity number, date and phone extraction
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <sgkdoc/extraction/entity_extractor.hpp>
#include <sgkdoc/extraction/institutional_filter.hpp>

using namespace sgkdoc::extraction;
using Catch::Matchers::WithinAbs;

TEST_CASE("Upper-case name with labelled TC number", "[extraction][entities]") {
    entity_extractor extractor;
    auto entities = extractor.extract("ALİ VELİ\nTC: 12345678950\nReçete");

    REQUIRE(entities.best_name() != nullptr);
    CHECK(entities.best_name()->text == "Ali Veli");
    CHECK_THAT(entities.best_name()->confidence, WithinAbs(1.0, 1e-9));

    REQUIRE(entities.national_id.has_value());
    CHECK(entities.national_id->text == "12345678950");
    CHECK(entities.national_id->validated);
    CHECK(entities.national_id->labelled);
    CHECK(entities.valid_national_id() == "12345678950");

    CHECK_THAT(entities.confidence, WithinAbs(1.0, 1e-9));
    CHECK_FALSE(entities.empty());
}

TEST_CASE("Institutional heading yields no name", "[extraction][entities]") {
    entity_extractor extractor;
    auto entities = extractor.extract("SOSYAL GÜVENLİK KURUMU RAPORU");

    CHECK(entities.names.empty());
    CHECK_FALSE(entities.national_id.has_value());
    CHECK(entities.empty());
    CHECK_THAT(entities.confidence, WithinAbs(0.0, 1e-9));
}

TEST_CASE("Empty text", "[extraction][entities]") {
    entity_extractor extractor;
    auto entities = extractor.extract("");
    CHECK(entities.empty());
    CHECK(entities.dates.empty());
    CHECK(entities.phone.empty());
}

TEST_CASE("Labelled patient name field", "[extraction][names]") {
    entity_extractor extractor;
    auto names = extractor.extract_names("HASTA ADI SOYADI: AYŞE YILMAZ\nProtokol: 123");

    REQUIRE_FALSE(names.empty());
    CHECK(names.front().text == "Ayşe Yılmaz");
    for (const auto& name : names) {
        CHECK(name.text != "Hasta Adi Soyadi");
    }
}

TEST_CASE("Proper-case names are kept as written", "[extraction][names]") {
    entity_extractor extractor;
    auto names = extractor.extract_names("Sayın Mehmet Kaya, randevunuz onaylandı.");

    REQUIRE_FALSE(names.empty());
    CHECK(names.front().text == "Mehmet Kaya");
}

TEST_CASE("Name cleaning strips field labels", "[extraction][names]") {
    CHECK(entity_extractor::clean_name("AD SOYAD ALİ VELİ DOĞUM TARİHİ") == "ALİ VELİ");
    CHECK(entity_extractor::clean_name("HASTA ALİ VELİ ERKEK") == "ALİ VELİ");
    CHECK(entity_extractor::clean_name("AD Ali").empty());
}

TEST_CASE("Name validity", "[extraction][names]") {
    entity_extractor extractor;
    CHECK(extractor.is_valid_name("Ali Veli"));
    CHECK(extractor.is_valid_name("Ayşe Gül Öztürk"));
    CHECK_FALSE(extractor.is_valid_name("Ali"));
    CHECK_FALSE(extractor.is_valid_name("Ali V"));
    CHECK_FALSE(extractor.is_valid_name("Ali Veli2"));
    CHECK_FALSE(extractor.is_valid_name("Ankara Devlet Hastanesi"));
    CHECK_FALSE(extractor.is_valid_name("A B C D E"));
}

TEST_CASE("Turkish name endings", "[extraction][names]") {
    CHECK(entity_extractor::has_turkish_name_ending("Ayşe Gül"));
    CHECK(entity_extractor::has_turkish_name_ending("Hakan Demir"));
    CHECK_FALSE(entity_extractor::has_turkish_name_ending("Ali Veli"));
}

TEST_CASE("Identity number selection", "[extraction][tc]") {
    SECTION("first checksum-valid number wins") {
        auto id = entity_extractor::extract_national_id("Protokol 12345678901\nTC 10000000146");
        REQUIRE(id.has_value());
        CHECK(id->text == "10000000146");
        CHECK(id->validated);
    }

    SECTION("invalid numbers are kept for diagnostics only") {
        entity_extractor extractor;
        auto entities = extractor.extract("Numara: 12345678901");
        REQUIRE(entities.national_id.has_value());
        CHECK_FALSE(entities.national_id->validated);
        CHECK(entities.valid_national_id().empty());
    }

    SECTION("KİMLİK label") {
        auto id = entity_extractor::extract_national_id("KİMLİK NO: 12345678950");
        REQUIRE(id.has_value());
        CHECK(id->labelled);
        CHECK(id->validated);
    }

    SECTION("longer digit runs are not identity numbers") {
        CHECK_FALSE(entity_extractor::extract_national_id("123456789501").has_value());
    }
}

TEST_CASE("Date extraction and roles", "[extraction][dates]") {
    auto dates = entity_extractor::extract_dates(
        "Doğum Tarihi: 03.07.1965\nRapor Tarihi 12/01/2024\nKontrol 2024-02-01");

    REQUIRE(dates.size() == 3);
    CHECK(dates[0].iso == "1965-07-03");
    CHECK(dates[0].role == date_role::birth);
    CHECK(dates[1].iso == "2024-01-12");
    CHECK(dates[1].role == date_role::document);
    CHECK(dates[2].iso == "2024-02-01");
    CHECK(dates[2].role == date_role::other);

    extracted_entities entities;
    entities.dates = dates;
    CHECK(entities.birth_date() == std::optional<std::string>("1965-07-03"));
}

TEST_CASE("ISO date conversion", "[extraction][dates]") {
    CHECK(entity_extractor::to_iso_date("3.7.1965") == std::optional<std::string>("1965-07-03"));
    CHECK(entity_extractor::to_iso_date("03/07/1965") == std::optional<std::string>("1965-07-03"));
    CHECK(entity_extractor::to_iso_date("1965-07-03") == std::optional<std::string>("1965-07-03"));
    CHECK(entity_extractor::to_iso_date("29.02.2020").has_value());

    CHECK_FALSE(entity_extractor::to_iso_date("29.02.2021").has_value());
    CHECK_FALSE(entity_extractor::to_iso_date("31.04.2020").has_value());
    CHECK_FALSE(entity_extractor::to_iso_date("1.1.65").has_value());
    CHECK_FALSE(entity_extractor::to_iso_date("13.13.2020").has_value());
    CHECK_FALSE(entity_extractor::to_iso_date("").has_value());
}

TEST_CASE("Mobile phone extraction", "[extraction][phone]") {
    CHECK(entity_extractor::extract_phone("Tel: 0532 123 45 67") == "0532 123 45 67");
    CHECK(entity_extractor::extract_phone("GSM +90 532 123 45 67") == "+90 532 123 45 67");
    CHECK(entity_extractor::extract_phone("Sabit: 0212 123 45 67").empty());
}

TEST_CASE("Institutional vocabulary filter", "[extraction][filter]") {
    institutional_filter filter;

    SECTION("long keywords match inside words") {
        CHECK(filter.is_institutional("ANKARA ŞEHİR HASTANESİ"));
        CHECK(filter.is_institutional("Sağlık Bakanlığı"));
    }

    SECTION("short keywords match whole words only") {
        CHECK(filter.is_institutional("Dr Mehmet Kaya"));
        CHECK_FALSE(filter.is_institutional("Andrew Kamuran"));
    }

    SECTION("ordinary names pass") {
        CHECK_FALSE(filter.is_institutional("Ali Veli"));
        CHECK_FALSE(filter.is_institutional(""));
    }

    SECTION("custom keyword lists are folded") {
        institutional_filter custom({"eczane", "  ", "ECZANE"});
        CHECK(custom.keywords().size() == 1);
        CHECK(custom.is_institutional("Merkez Eczanesi"));
        CHECK_FALSE(custom.is_institutional("Sağlık Bakanlığı"));
    }
}
