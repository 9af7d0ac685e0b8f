//
// NANBOX-CC
//

#pragma once

#include "layout.hh"
#include "scalar.hh"
#include "word.hh"

namespace nanbox {

/**
 * @brief Boxes value as the variant at index variant of layout.
 *
 * Floats are stored unboxed after NaN canonicalization. Integers and
 * addresses are range-checked against the declared width.
 *
 * @return OK and the word in *out, or OUT_OF_RANGE, UNKNOWN_VARIANT,
 * KIND_MISMATCH with *out untouched.
 */
BoxStatus encode(const Layout &layout, size_t variant, const Scalar &value, Word *out);

// Assembles a boxed word from raw tag and payload bits. No checks.
inline Word pack(const Layout &layout, uint64_t tag, uint64_t payload) {
    return Word(EXPONENT_MASK | BOXED_BIT | (tag << layout.payload_bits()) |
                (payload & low_mask(layout.payload_bits())));
}

bool fitsSigned(int64_t v, int width);
bool fitsUnsigned(uint64_t v, int width);

} // namespace nanbox
