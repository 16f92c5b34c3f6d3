#include "content_type.h"

#include <algorithm>
#include <cctype>
#include <map>

namespace textopen::detail {

namespace {

constexpr std::string_view kTSpecials = "()<>@,;:\\\"/[]?=";

bool is_token_char(char c) {
    auto b = static_cast<unsigned char>(c);
    return b > 0x20 && b < 0x7F && kTSpecials.find(c) == std::string_view::npos;
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

void skip_space(std::string_view& s) {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
}

std::string_view consume_token(std::string_view& s) {
    size_t n = 0;
    while (n < s.size() && is_token_char(s[n])) ++n;
    auto token = s.substr(0, n);
    s.remove_prefix(n);
    return token;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// token | quoted-string
std::optional<std::string> consume_value(std::string_view& s) {
    if (s.empty()) return std::nullopt;
    if (s.front() != '"') {
        auto token = consume_token(s);
        if (token.empty()) return std::nullopt;
        return std::string(token);
    }

    std::string value;
    for (size_t i = 1; i < s.size(); ++i) {
        char c = s[i];
        if (c == '"') {
            s.remove_prefix(i + 1);
            return value;
        }
        if (c == '\\' && i + 1 < s.size()) {
            c = s[++i];
        }
        value += c;
    }
    return std::nullopt;  // unterminated quote
}

bool valid_media_type(std::string_view type) {
    auto major = consume_token(type);
    if (major.empty()) return false;
    if (type.empty()) return true;
    if (type.front() != '/') return false;
    type.remove_prefix(1);
    auto minor = consume_token(type);
    return !minor.empty() && type.empty();
}

} // namespace

std::optional<std::string> charset_from_content_type(std::string_view content_type) {
    auto semi = content_type.find(';');
    std::string_view type = content_type.substr(0, semi);
    skip_space(type);
    while (!type.empty() && is_space(type.back())) type.remove_suffix(1);
    if (!valid_media_type(type)) return std::nullopt;

    std::map<std::string, std::string> params;
    std::string_view rest = semi == std::string_view::npos
                                ? std::string_view{}
                                : content_type.substr(semi);
    while (true) {
        skip_space(rest);
        if (rest.empty()) break;
        if (rest.front() != ';') return std::nullopt;
        rest.remove_prefix(1);
        skip_space(rest);
        if (rest.empty()) break;  // trailing semicolon

        auto key = to_lower(consume_token(rest));
        if (key.empty()) return std::nullopt;
        skip_space(rest);
        if (rest.empty() || rest.front() != '=') return std::nullopt;
        rest.remove_prefix(1);
        skip_space(rest);

        auto value = consume_value(rest);
        if (!value) return std::nullopt;
        if (!params.emplace(std::move(key), std::move(*value)).second) {
            return std::nullopt;  // duplicate parameter
        }
    }

    auto it = params.find("charset");
    if (it == params.end()) return std::nullopt;
    return it->second;
}

} // namespace textopen::detail
