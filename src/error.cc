//
// NANBOX-CC
//

#include <fmt/core.h>

#include "error.hh"

namespace nanbox {

void Diagnostics::errorAt(size_t variant, std::string_view name,
                          std::string_view message) {
    err << fmt::format("[variant {} '{}'] Error: {}\n", variant, name, message);
    hadError = true;
    errorCount++;
}

void Diagnostics::error(std::string_view message) {
    err << fmt::format("Error: {}\n", message);
    hadError = true;
    errorCount++;
}

std::string_view statusName(BoxStatus status) {
    switch (status) {
    case BoxStatus::OK:
        return "ok";
    case BoxStatus::TOO_MANY_VARIANTS:
        return "too many variants";
    case BoxStatus::INVALID_WIDTH:
        return "invalid width";
    case BoxStatus::DUPLICATE_FLOAT:
        return "duplicate float variant";
    case BoxStatus::EMPTY_MANIFEST:
        return "empty manifest";
    case BoxStatus::OUT_OF_RANGE:
        return "out of range";
    case BoxStatus::UNKNOWN_VARIANT:
        return "unknown variant";
    case BoxStatus::KIND_MISMATCH:
        return "kind mismatch";
    case BoxStatus::INVALID_TAG:
        return "invalid tag";
    }
    return "unknown status"; // Unreachable.
}

} // namespace nanbox
