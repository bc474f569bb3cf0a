/**
 * @file turkish_text_test.cpp
 * @brief Unit tests for the UTF-8 and Turkish text helpers
 */

#include <catch2/catch_test_macros.hpp>

#include <sgkdoc/text/turkish_text.hpp>

using namespace sgkdoc::text;

TEST_CASE("UTF-8 round trip through wide strings", "[text][utf8]") {
    const std::string original = "Çağrı Şükrü Öğüt İı";
    CHECK(to_utf8(to_wide(original)) == original);
    CHECK(to_wide("ş").size() == 1);
}

TEST_CASE("Invalid UTF-8 bytes become replacement characters", "[text][utf8]") {
    const std::string broken = std::string("a") + static_cast<char>(0xFF) + "b";
    auto wide = to_wide(broken);
    REQUIRE(wide.size() == 3);
    CHECK(wide[1] == static_cast<wchar_t>(0xFFFD));
}

TEST_CASE("Turkish case mapping keeps dotted and dotless i apart", "[text][case]") {
    SECTION("upper case") {
        CHECK(to_upper_tr("ali veli") == "ALİ VELİ");
        CHECK(to_upper_tr("ışık") == "IŞIK");
    }

    SECTION("lower case") {
        CHECK(to_lower_tr("ALİ VELİ") == "ali veli");
        CHECK(to_lower_tr("IŞIK") == "ışık");
        CHECK(to_lower_tr("ÇÖĞÜ") == "çöğü");
    }
}

TEST_CASE("Diacritic folding", "[text][fold]") {
    CHECK(fold_diacritics("Ayşe Gül Öztürk") == "Ayse Gul Ozturk");
    CHECK(fold_upper("Ayşe Gül Öztürk") == "AYSE GUL OZTURK");
    CHECK(fold_upper("reçete") == "RECETE");
}

TEST_CASE("Normalization for matching", "[text][normalize]") {
    SECTION("case, diacritics and punctuation") {
        CHECK(normalize_for_matching("ALİ  VELİ!") == "ali veli");
        CHECK(normalize_for_matching("Mehmet-Öz") == "mehmetoz");
    }

    SECTION("OCR digit confusions") {
        CHECK(normalize_for_matching("A1i Ve1i") == "aii veii");
        CHECK(normalize_for_matching("Y0ld1z") == "yoldiz");
    }

    SECTION("whitespace collapses") {
        CHECK(normalize_for_matching("  ali \n\t veli  ") == "ali veli");
        CHECK(normalize_for_matching("").empty());
    }
}

TEST_CASE("Proper case", "[text][case]") {
    CHECK(to_proper_case("ALİ VELİ") == "Ali Veli");
    CHECK(to_proper_case("ayşe gül") == "Ayşe Gül");
    CHECK(to_proper_case("İPEK YILMAZ-KAYA") == "İpek Yılmaz-Kaya");
}

TEST_CASE("Word helpers", "[text][words]") {
    SECTION("split_words") {
        auto words = split_words("  Ali\tVeli \n Kaya ");
        REQUIRE(words.size() == 3);
        CHECK(words[0] == "Ali");
        CHECK(words[2] == "Kaya");
        CHECK(split_words("   ").empty());
    }

    SECTION("char_length counts code points") {
        CHECK(char_length("ğüş") == 3);
        CHECK(char_length("abc") == 3);
    }

    SECTION("trim") {
        CHECK(trim("  ali \n") == "ali");
        CHECK(trim("\t\t").empty());
    }

    SECTION("contains_word respects word boundaries") {
        CHECK(contains_word("ali veli", "ali"));
        CHECK(contains_word("rapor: ali", "ali"));
        CHECK_FALSE(contains_word("alive", "ali"));
        CHECK_FALSE(contains_word("ali", ""));
    }
}
