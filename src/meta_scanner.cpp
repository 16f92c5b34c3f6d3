#include "meta_scanner.h"

#include <algorithm>
#include <array>
#include <unordered_set>

namespace textopen::detail {

namespace {

constexpr std::array<std::string_view, 10> kRawTextElements = {{
    "iframe", "noembed", "noframes", "noscript", "plaintext",
    "script", "style", "textarea", "title", "xmp",
}};

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

bool is_alpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

char to_lower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 0x20) : c;
}

void lower_in_place(std::string& s) {
    std::transform(s.begin(), s.end(), s.begin(), to_lower);
}

bool starts_with_ci(std::string_view s, std::string_view prefix) {
    if (s.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (to_lower(s[i]) != prefix[i]) return false;
    }
    return true;
}

bool is_raw_text_element(std::string_view name) {
    return std::find(kRawTextElements.begin(), kRawTextElements.end(), name)
           != kRawTextElements.end();
}

// Decides whether a <meta> tag's charset is honored.
enum class PragmaState {
    Unknown,      // no charset seen yet
    NeedsPragma,  // charset came from content=, http-equiv must confirm it
    Exempt,       // charset= attribute, accepted as is
};

} // namespace

// ---------------------------------------------------------------------------
// TagTokenizer
// ---------------------------------------------------------------------------

bool TagTokenizer::next(Tag& tag) {
    if (failed_) return false;

    if (!raw_text_tag_.empty()) {
        std::string name = std::move(raw_text_tag_);
        raw_text_tag_.clear();
        if (!skip_raw_text(name)) {
            failed_ = true;
            return false;
        }
    }

    while (pos_ < html_.size()) {
        size_t lt = html_.find('<', pos_);
        if (lt == std::string_view::npos) break;
        pos_ = lt + 1;
        if (pos_ >= html_.size()) break;

        char c = html_[pos_];
        if (c == '!') {
            ++pos_;
            bool ok = html_.substr(pos_).starts_with("--") ? skip_comment()
                                                           : skip_past(">");
            if (!ok) break;
            continue;
        }
        if (c == '?') {
            if (!skip_past(">")) break;
            continue;
        }

        bool end_tag = false;
        if (c == '/') {
            end_tag = true;
            ++pos_;
            if (pos_ >= html_.size()) break;
            c = html_[pos_];
            if (c == '>') {  // "</>" is dropped
                ++pos_;
                continue;
            }
            if (!is_alpha(c)) {  // bogus comment
                if (!skip_past(">")) break;
                continue;
            }
        } else if (!is_alpha(c)) {
            continue;  // a literal '<' in text
        }

        if (!read_tag(tag, end_tag)) break;
        if (tag.kind == TagKind::Start && is_raw_text_element(tag.name)) {
            raw_text_tag_ = tag.name;
        }
        return true;
    }

    failed_ = true;
    return false;
}

// pos_ is at the first character of the tag name.
bool TagTokenizer::read_tag(Tag& tag, bool end_tag) {
    tag.kind = end_tag ? TagKind::End : TagKind::Start;
    tag.name.clear();
    tag.attributes.clear();

    while (pos_ < html_.size()) {
        char c = html_[pos_];
        if (is_space(c) || c == '/' || c == '>') break;
        tag.name += to_lower(c);
        ++pos_;
    }

    while (true) {
        skip_space();
        if (pos_ >= html_.size()) return false;

        char c = html_[pos_];
        if (c == '>') {
            ++pos_;
            return true;
        }
        if (c == '/') {
            ++pos_;
            if (pos_ < html_.size() && html_[pos_] == '>') {
                if (!end_tag) tag.kind = TagKind::SelfClosing;
                ++pos_;
                return true;
            }
            continue;
        }

        // Attribute name. A leading '=' belongs to the name.
        Attribute attr;
        attr.name += to_lower(c);
        ++pos_;
        while (pos_ < html_.size()) {
            c = html_[pos_];
            if (is_space(c) || c == '/' || c == '>' || c == '=') break;
            attr.name += to_lower(c);
            ++pos_;
        }

        skip_space();
        if (pos_ < html_.size() && html_[pos_] == '=') {
            ++pos_;
            skip_space();
            if (pos_ >= html_.size()) return false;

            c = html_[pos_];
            if (c == '"' || c == '\'') {
                size_t close = html_.find(c, pos_ + 1);
                if (close == std::string_view::npos) return false;
                attr.value = html_.substr(pos_ + 1, close - pos_ - 1);
                pos_ = close + 1;
            } else {
                size_t start = pos_;
                while (pos_ < html_.size() && !is_space(html_[pos_]) && html_[pos_] != '>') {
                    ++pos_;
                }
                attr.value = html_.substr(start, pos_ - start);
            }
        }
        tag.attributes.push_back(std::move(attr));
    }
}

bool TagTokenizer::skip_past(std::string_view terminator) {
    size_t at = html_.find(terminator, pos_);
    if (at == std::string_view::npos) {
        pos_ = html_.size();
        return false;
    }
    pos_ = at + terminator.size();
    return true;
}

// pos_ is just past "<!" and at "--".
bool TagTokenizer::skip_comment() {
    pos_ += 2;
    auto rest = html_.substr(pos_);
    if (rest.starts_with(">")) {  // <!-->
        pos_ += 1;
        return true;
    }
    if (rest.starts_with("->")) {  // <!--->
        pos_ += 2;
        return true;
    }
    return skip_past("-->");
}

// Move to the "</name" that closes a raw-text element.
bool TagTokenizer::skip_raw_text(std::string_view tag_name) {
    if (tag_name == "plaintext") {
        pos_ = html_.size();
        return false;
    }
    while (true) {
        size_t lt = html_.find("</", pos_);
        if (lt == std::string_view::npos) {
            pos_ = html_.size();
            return false;
        }
        auto rest = html_.substr(lt + 2);
        if (starts_with_ci(rest, tag_name)) {
            if (rest.size() == tag_name.size()) {
                pos_ = html_.size();
                return false;
            }
            char after = rest[tag_name.size()];
            if (is_space(after) || after == '/' || after == '>') {
                pos_ = lt;
                return true;
            }
        }
        pos_ = lt + 2;
    }
}

void TagTokenizer::skip_space() {
    while (pos_ < html_.size() && is_space(html_[pos_])) ++pos_;
}

// ---------------------------------------------------------------------------
// Meta prescan
// ---------------------------------------------------------------------------

std::optional<Encoding> prescan_meta(std::string_view html) {
    TagTokenizer tokenizer(html);
    Tag tag;

    while (tokenizer.next(tag)) {
        if (tag.kind == TagKind::End || tag.name != "meta") continue;

        std::unordered_set<std::string> seen;
        bool got_pragma = false;
        PragmaState state = PragmaState::Unknown;
        std::optional<Encoding> encoding;

        for (auto& attr : tag.attributes) {
            if (!seen.insert(attr.name).second) continue;
            lower_in_place(attr.value);

            if (attr.name == "http-equiv") {
                if (attr.value == "content-type") got_pragma = true;
            } else if (attr.name == "content") {
                if (!encoding) {
                    std::string label = charset_from_content(attr.value);
                    if (!label.empty()) {
                        encoding = Encoding::lookup(label);
                        if (encoding) state = PragmaState::NeedsPragma;
                    }
                }
            } else if (attr.name == "charset") {
                encoding = Encoding::lookup(attr.value);
                state = PragmaState::Exempt;
            }
        }

        if (state == PragmaState::Unknown) continue;
        if (state == PragmaState::NeedsPragma && !got_pragma) continue;
        if (!encoding) continue;

        // UTF-16 declared in markup is read as UTF-8.
        std::string name = encoding->name();
        lower_in_place(name);
        if (name.starts_with("utf-16")) return Encoding::nop();

        return encoding;
    }
    return std::nullopt;
}

std::string charset_from_content(std::string_view s) {
    constexpr std::string_view kCharset = "charset";

    auto trim_left = [](std::string_view v) {
        while (!v.empty() && is_space(v.front())) v.remove_prefix(1);
        return v;
    };

    while (!s.empty()) {
        size_t at = s.find(kCharset);
        if (at == std::string_view::npos) return "";
        s = trim_left(s.substr(at + kCharset.size()));
        if (!s.starts_with('=')) continue;
        s = trim_left(s.substr(1));
        if (s.empty()) return "";

        char q = s.front();
        if (q == '"' || q == '\'') {
            s.remove_prefix(1);
            size_t close = s.find(q);
            if (close == std::string_view::npos) return "";
            return std::string(s.substr(0, close));
        }

        size_t end = s.find_first_of("; \t\n\f\r");
        return std::string(s.substr(0, end));
    }
    return "";
}

} // namespace textopen::detail
