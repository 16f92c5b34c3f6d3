#include <doctest/doctest.h>

#include <textopen/encoding.h>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <vector>

using namespace textopen;

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

// ---------------------------------------------------------------------------
// Encoding::lookup
// ---------------------------------------------------------------------------

TEST_CASE("Encoding: Latin-1 aliases") {
    auto e = Encoding::lookup("latin1");
    REQUIRE(e.has_value());
    CHECK(*e == Encoding::latin1());
    CHECK_FALSE(e->is_nop());

    auto spaced = Encoding::lookup("  ISO-8859-1\t");
    REQUIRE(spaced.has_value());
    CHECK(*spaced == Encoding::latin1());
}

TEST_CASE("Encoding: UTF-8 labels resolve to nop") {
    for (const char* label : {"utf-8", "UTF-8", "utf8"}) {
        auto e = Encoding::lookup(label);
        REQUIRE(e.has_value());
        CHECK(e->is_nop());
        CHECK(*e == Encoding::nop());
    }
    CHECK(Encoding::nop().name() == "UTF-8");
}

TEST_CASE("Encoding: aliases of one charset compare equal") {
    auto a = Encoding::lookup("ISO-8859-1");
    auto b = Encoding::lookup("csISOLatin1");
    auto c = Encoding::lookup("iso-ir-100");
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(c.has_value());
    CHECK(*a == *b);
    CHECK(*a == *c);

    auto w = Encoding::lookup("windows-1252");
    REQUIRE(w.has_value());
    CHECK_FALSE(w->name().empty());
    CHECK_FALSE(*w == Encoding::latin1());
}

TEST_CASE("Encoding: ICU-only converter names are not labels") {
    CHECK_FALSE(Encoding::lookup("ibm-5348_P100-1997").has_value());
    CHECK_FALSE(Encoding::lookup("UTF-8,swaplfnl").has_value());
    CHECK_FALSE(Encoding::lookup("ISO-8859-1,version=1").has_value());
}

TEST_CASE("Encoding: UTF-16 names") {
    auto le = Encoding::lookup("utf-16le");
    REQUIRE(le.has_value());
    CHECK(lower(le->name()) == "utf-16le");

    auto be = Encoding::lookup("UTF-16BE");
    REQUIRE(be.has_value());
    CHECK(lower(be->name()) == "utf-16be");
}

TEST_CASE("Encoding: unknown or empty labels") {
    CHECK_FALSE(Encoding::lookup("").has_value());
    CHECK_FALSE(Encoding::lookup("   ").has_value());
    CHECK_FALSE(Encoding::lookup("no-such-charset").has_value());
}

// ---------------------------------------------------------------------------
// detect_encoding
// ---------------------------------------------------------------------------

TEST_CASE("detect_encoding: UTF-8 BOM") {
    auto r = detect_encoding("\xEF\xBB\xBF" "abc");
    CHECK(r.encoding.is_nop());
    CHECK(r.certain);
    CHECK(r.name == r.encoding.name());
}

TEST_CASE("detect_encoding: UTF-16 BOMs") {
    auto be = detect_encoding(std::string_view("\xFE\xFF\x00\x41", 4));
    CHECK(lower(be.name) == "utf-16be");
    CHECK(be.certain);

    auto le = detect_encoding(std::string_view("\xFF\xFE\x41\x00", 4));
    CHECK(lower(le.name) == "utf-16le");
    CHECK(le.certain);
}

TEST_CASE("detect_encoding: declared content type") {
    auto r = detect_encoding("plain text", "text/plain; charset=koi8-r");
    CHECK(r.encoding == *Encoding::lookup("koi8-r"));
    CHECK(r.certain);
}

TEST_CASE("detect_encoding: BOM wins over declared content type") {
    auto r = detect_encoding("\xEF\xBB\xBF" "abc", "text/plain; charset=koi8-r");
    CHECK(r.encoding.is_nop());
    CHECK(r.certain);
}

TEST_CASE("detect_encoding: declared content type wins over <meta>") {
    auto r = detect_encoding("<meta charset=\"windows-1252\">",
                             "text/html; charset=koi8-r");
    CHECK(r.encoding == *Encoding::lookup("koi8-r"));
    CHECK(r.certain);
}

TEST_CASE("detect_encoding: unusable content type falls through") {
    auto r = detect_encoding("<meta charset=\"koi8-r\">", "text/html; charset=bogus-name");
    CHECK(r.encoding == *Encoding::lookup("koi8-r"));
    CHECK_FALSE(r.certain);

    r = detect_encoding("abc", "not a media type");
    CHECK(r.encoding == Encoding::latin1());
    CHECK_FALSE(r.certain);
}

TEST_CASE("detect_encoding: <meta> declaration is a guess") {
    auto r = detect_encoding("<html><meta charset=\"windows-1252\">caf\xE9");
    CHECK(r.encoding == *Encoding::lookup("windows-1252"));
    CHECK_FALSE(r.certain);
}

TEST_CASE("detect_encoding: valid UTF-8 with non-ASCII bytes") {
    auto r = detect_encoding("ping\xC3\xBC" "ino");
    CHECK(r.encoding.is_nop());
    CHECK(r.name == "UTF-8");
    CHECK_FALSE(r.certain);
}

TEST_CASE("detect_encoding: truncated sequence at the end is ignored") {
    // "ü€" with the last byte of the euro sign cut off
    auto r = detect_encoding("\xC3\xBC\xE2\x82");
    CHECK(r.encoding.is_nop());
}

TEST_CASE("detect_encoding: invalid UTF-8 falls back to Latin-1") {
    auto r = detect_encoding("caf\xE9 au lait");
    CHECK(r.encoding == Encoding::latin1());
    CHECK(r.name == "ISO-8859-1");
    CHECK_FALSE(r.certain);
}

TEST_CASE("detect_encoding: empty and ASCII input fall back to Latin-1") {
    CHECK(detect_encoding("").encoding == Encoding::latin1());
    CHECK(detect_encoding("just ascii\n").encoding == Encoding::latin1());
}

TEST_CASE("detect_encoding: byte span overload") {
    std::vector<std::byte> data = {std::byte{0xEF}, std::byte{0xBB}, std::byte{0xBF}};
    auto r = detect_encoding(std::span<const std::byte>(data));
    CHECK(r.encoding.is_nop());
    CHECK(r.certain);
}
