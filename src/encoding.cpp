#include <textopen/encoding.h>

#include "bom.h"
#include "content_type.h"
#include "meta_scanner.h"
#include "transcoding_source.h"

#include <unicode/uenum.h>
#include <unicode/ustring.h>

#include <cstdint>
#include <limits>
#include <memory>

namespace textopen {

namespace {

std::string_view trim_ascii_space(std::string_view s) {
    auto is_space = [](char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
    };
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

// Preferred public name for an ICU converter: MIME, then IANA, then ICU's own.
std::string standard_name(const char* converter) {
    for (const char* standard : {"MIME", "IANA"}) {
        UErrorCode err = U_ZERO_ERROR;
        const char* name = ucnv_getStandardName(converter, standard, &err);
        if (U_SUCCESS(err) && name != nullptr) {
            return name;
        }
    }
    return converter;
}

// Drop a multi-byte sequence cut off by the end of the lookahead.
std::string_view trim_partial_rune(std::string_view s) {
    for (size_t i = s.size(); i > 0 && i + 3 > s.size(); --i) {
        auto b = static_cast<uint8_t>(s[i - 1]);
        if (b < 0x80) break;
        if ((b & 0xC0) != 0x80) {
            size_t need = b >= 0xF0 ? 4 : b >= 0xE0 ? 3 : 2;
            if (s.size() - (i - 1) < need) {
                return s.substr(0, i - 1);
            }
            break;
        }
    }
    return s;
}

bool has_high_bit(std::string_view s) {
    for (char c : s) {
        if (static_cast<uint8_t>(c) >= 0x80) return true;
    }
    return false;
}

// u_strFromUTF8 takes an int32_t length.
constexpr std::size_t kMaxUtf8Check = std::numeric_limits<int32_t>::max();

bool is_valid_utf8(std::string_view s) {
    // Preflight only; ill-formed input fails with U_INVALID_CHAR_FOUND.
    UErrorCode err = U_ZERO_ERROR;
    int32_t u16_len = 0;
    u_strFromUTF8(nullptr, 0, &u16_len, s.data(), static_cast<int32_t>(s.size()), &err);
    return err == U_ZERO_ERROR || err == U_BUFFER_OVERFLOW_ERROR ||
           err == U_STRING_NOT_TERMINATED_WARNING;
}

struct EnumerationCloser {
    void operator()(UEnumeration* e) const { uenum_close(e); }
};

// ucnv_open() also accepts ICU's internal converter names and option
// suffixes ("UTF-8,swaplfnl"). Only aliases registered with IANA or MIME
// count as charset labels.
bool is_registered_label(const char* converter, const char* label) {
    for (const char* standard : {"IANA", "MIME"}) {
        UErrorCode err = U_ZERO_ERROR;
        std::unique_ptr<UEnumeration, EnumerationCloser> aliases(
            ucnv_openStandardNames(converter, standard, &err));
        if (U_FAILURE(err) || !aliases) continue;

        while (const char* alias = uenum_next(aliases.get(), nullptr, &err)) {
            if (ucnv_compareNames(alias, label) == 0) return true;
        }
    }
    return false;
}

Resolution resolved(Encoding encoding, bool certain) {
    std::string name = encoding.name();
    return {std::move(encoding), std::move(name), certain};
}

} // namespace

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------

Encoding::Encoding(std::string name, std::string converter, bool nop)
    : name_(std::move(name))
    , converter_(std::move(converter))
    , nop_(nop)
{}

Encoding Encoding::nop() {
    return Encoding("UTF-8", "UTF-8", true);
}

Encoding Encoding::latin1() {
    return Encoding("ISO-8859-1", "ISO-8859-1", false);
}

std::optional<Encoding> Encoding::lookup(std::string_view label) {
    label = trim_ascii_space(label);
    if (label.empty()) {
        return std::nullopt;  // ucnv_open("") would give the platform default
    }

    std::string label_str(label);
    UErrorCode err = U_ZERO_ERROR;
    detail::ConverterPtr cnv(ucnv_open(label_str.c_str(), &err));
    if (U_FAILURE(err) || !cnv) {
        return std::nullopt;
    }

    err = U_ZERO_ERROR;
    const char* converter = ucnv_getName(cnv.get(), &err);
    if (U_FAILURE(err) || converter == nullptr) {
        return std::nullopt;
    }

    if (!is_registered_label(converter, label_str.c_str())) {
        return std::nullopt;
    }

    std::string converter_name = converter;
    if (converter_name == "UTF-8") {
        return nop();
    }
    return Encoding(standard_name(converter), std::move(converter_name), false);
}

// ---------------------------------------------------------------------------
// Detection
// ---------------------------------------------------------------------------

Resolution detect_encoding(std::string_view content, std::string_view content_type) {
    if (const auto* bom = detail::match_bom(content)) {
        if (auto e = Encoding::lookup(bom->charset)) {
            return resolved(std::move(*e), true);
        }
    }

    if (auto charset = detail::charset_from_content_type(content_type)) {
        if (auto e = Encoding::lookup(*charset)) {
            return resolved(std::move(*e), true);
        }
    }

    if (!content.empty()) {
        if (auto e = detail::prescan_meta(content)) {
            return resolved(std::move(*e), false);
        }
    }

    content = trim_partial_rune(content.substr(0, kMaxUtf8Check));
    if (has_high_bit(content) && is_valid_utf8(content)) {
        return resolved(Encoding::nop(), false);
    }

    return resolved(Encoding::latin1(), false);
}

Resolution detect_encoding(std::span<const std::byte> content, std::string_view content_type) {
    std::string_view view(reinterpret_cast<const char*>(content.data()), content.size());
    return detect_encoding(view, content_type);
}

} // namespace textopen
