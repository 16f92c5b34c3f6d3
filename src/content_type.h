#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace textopen::detail {

// Parse a media type such as `text/html; charset="ISO-8859-1"` and return
// the value of its charset parameter. Returns nullopt if the media type is
// malformed or carries no charset.
std::optional<std::string> charset_from_content_type(std::string_view content_type);

} // namespace textopen::detail
