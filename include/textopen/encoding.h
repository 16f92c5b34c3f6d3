#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace textopen {

// Thrown while reading a transcoded stream whose bytes are not valid in the
// resolved encoding.
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A named charset that can be decoded into UTF-8. Encodings are plain
// values: two encodings are equal when they name the same converter.
class Encoding {
public:
    // Content that is already UTF-8 and needs no transcoding.
    static Encoding nop();

    // ISO-8859-1, the last-resort fallback.
    static Encoding latin1();

    // Resolve an IANA charset label ("latin1", "Windows-1252", "utf-16le").
    // Case-insensitive; surrounding ASCII whitespace is ignored. Returns
    // nullopt for empty or unknown labels. Labels naming UTF-8 resolve to
    // nop().
    static std::optional<Encoding> lookup(std::string_view label);

    // Canonical (MIME/IANA) name, e.g. "ISO-8859-1".
    const std::string& name() const { return name_; }

    // ICU converter name used to open a decoder.
    const std::string& converter_name() const { return converter_; }

    bool is_nop() const { return nop_; }

    bool operator==(const Encoding& other) const {
        return converter_ == other.converter_ && nop_ == other.nop_;
    }

private:
    Encoding(std::string name, std::string converter, bool nop);

    std::string name_;
    std::string converter_;
    bool nop_ = false;
};

struct Resolution {
    Encoding encoding;
    std::string name;
    bool certain = false;  // BOM or declared charset, as opposed to a guess
};

// Determine the encoding of `content` (a prefix of the document) and the
// optional declared Content-Type. Rules are tried in order and the first
// match wins: byte-order mark, declared charset, <meta> prescan, UTF-8
// validity, ISO-8859-1.
Resolution detect_encoding(std::span<const std::byte> content,
                           std::string_view content_type = {});

Resolution detect_encoding(std::string_view content,
                           std::string_view content_type = {});

} // namespace textopen
