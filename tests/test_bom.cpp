#include <doctest/doctest.h>

#include "../src/bom.h"

#include <string>

using namespace textopen::detail;

TEST_CASE("BOM: table order puts UTF-16 before UTF-8") {
    REQUIRE(kBomTable.size() == 3);
    CHECK(kBomTable[0].charset == "UTF-16BE");
    CHECK(kBomTable[1].charset == "UTF-16LE");
    CHECK(kBomTable[2].charset == "UTF-8");
}

TEST_CASE("BOM: UTF-16BE") {
    const auto* sig = match_bom(std::string("\xFE\xFF\x00\x41", 4));
    REQUIRE(sig != nullptr);
    CHECK(sig->charset == "UTF-16BE");
    CHECK(sig->bytes.size() == 2);
}

TEST_CASE("BOM: UTF-16LE") {
    const auto* sig = match_bom(std::string("\xFF\xFE\x41\x00", 4));
    REQUIRE(sig != nullptr);
    CHECK(sig->charset == "UTF-16LE");
}

TEST_CASE("BOM: UTF-8") {
    const auto* sig = match_bom("\xEF\xBB\xBF" "abc");
    REQUIRE(sig != nullptr);
    CHECK(sig->charset == "UTF-8");
    CHECK(sig->bytes == kUtf8Bom);
}

TEST_CASE("BOM: signature alone matches") {
    CHECK(match_bom("\xFE\xFF") != nullptr);
    CHECK(match_bom("\xEF\xBB\xBF") != nullptr);
}

TEST_CASE("BOM: no match") {
    CHECK(match_bom("") == nullptr);
    CHECK(match_bom("abc") == nullptr);
    CHECK(match_bom("\xEF") == nullptr);
    CHECK(match_bom("\xEF\xBB") == nullptr);
    CHECK(match_bom("\xFE") == nullptr);
    CHECK(match_bom("a\xEF\xBB\xBF") == nullptr);
}
