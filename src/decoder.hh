//
// NANBOX-CC
//

#pragma once

#include "layout.hh"
#include "scalar.hh"
#include "word.hh"

namespace nanbox {

enum class WordClass : uint8_t { FLOAT, VARIANT, INVALID_TAG };

struct Classified {
    WordClass cls{WordClass::INVALID_TAG};
    size_t    variant{Layout::npos}; // the Float64 variant for floats, when declared
    Scalar    value{};

    [[nodiscard]] constexpr bool isFloat() const { return cls == WordClass::FLOAT; }
    [[nodiscard]] constexpr bool isVariant() const { return cls == WordClass::VARIANT; }
    [[nodiscard]] constexpr bool isInvalid() const { return cls == WordClass::INVALID_TAG; }
};

/**
 * @brief Classifies word against layout.
 *
 * Total over all 64-bit inputs. Boxed-shaped words come back INVALID_TAG when
 * the tag is unregistered or names the float variant, when the sign bit is
 * set, or when payload bits above the declared width are non-zero: none of
 * these can come out of encode().
 */
Classified decode(const Layout &layout, Word word);

} // namespace nanbox
