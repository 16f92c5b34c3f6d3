#include "bom.h"

namespace textopen::detail {

const BomSignature* match_bom(std::string_view data) {
    for (const auto& sig : kBomTable) {
        if (data.starts_with(sig.bytes)) {
            return &sig;
        }
    }
    return nullptr;
}

} // namespace textopen::detail
