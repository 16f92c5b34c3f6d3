#pragma once

#include <textopen/encoding.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace textopen::detail {

enum class TagKind {
    Start,
    SelfClosing,
    End,
};

struct Attribute {
    std::string name;   // lowercased
    std::string value;  // as written
};

struct Tag {
    TagKind                kind = TagKind::Start;
    std::string            name;  // lowercased
    std::vector<Attribute> attributes;
};

// Just enough of the HTML tokenizer to find tags in a document prefix.
// Text, comments, doctypes, processing instructions and the content of
// raw-text elements (<script>, <style>, ...) are skipped.
class TagTokenizer {
public:
    explicit TagTokenizer(std::string_view html) : html_(html) {}

    // Advance to the next tag. Returns false at the end of the input or
    // when markup is cut off before it is complete; the tokenizer then
    // stays exhausted.
    bool next(Tag& tag);

private:
    bool read_tag(Tag& tag, bool end_tag);
    bool skip_past(std::string_view terminator);
    bool skip_comment();
    bool skip_raw_text(std::string_view tag_name);
    void skip_space();

    std::string_view html_;
    size_t pos_ = 0;
    std::string raw_text_tag_;  // set after a start tag like <script>
    bool failed_ = false;
};

// Scan an HTML prefix for a <meta> charset declaration. Stops at the first
// accepted declaration or at the first incomplete piece of markup.
std::optional<Encoding> prescan_meta(std::string_view html);

// Extract the charset from a <meta content="..."> value such as
// "text/html; charset=windows-1252". Returns "" if there is none.
std::string charset_from_content(std::string_view content);

} // namespace textopen::detail
