#pragma once

#include <array>
#include <string_view>

namespace textopen::detail {

struct BomSignature {
    std::string_view bytes;
    std::string_view charset;
};

// Checked in order. FE FF and FF FE must be tested before EF BB BF.
inline constexpr std::array<BomSignature, 3> kBomTable = {{
    {"\xFE\xFF",     "UTF-16BE"},
    {"\xFF\xFE",     "UTF-16LE"},
    {"\xEF\xBB\xBF", "UTF-8"},
}};

inline constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

// Returns the first signature in kBomTable that prefixes `data`, or nullptr.
const BomSignature* match_bom(std::string_view data);

} // namespace textopen::detail
