//
// NANBOX-CC
//

#pragma once

#include <string_view>

namespace nanbox {

enum class BoxStatus {
    OK,
    // layout
    TOO_MANY_VARIANTS,
    INVALID_WIDTH,
    DUPLICATE_FLOAT,
    EMPTY_MANIFEST,
    // encode
    OUT_OF_RANGE,
    UNKNOWN_VARIANT,
    KIND_MISMATCH,
    // decode
    INVALID_TAG
};

std::string_view statusName(BoxStatus status);

} // namespace nanbox
