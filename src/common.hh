//
// NANBOX-CC
//

#pragma once

#include <cstddef>
#include <cstdint>

namespace nanbox {

// Bit layout of a 64-bit word.
//
//  63  62 .. 52   51     50 .. 51-k   50-k .. 0
//  +--+---------+------+------------+-----------+
//  |s | exponent| boxed|    tag     |  payload  |
//  +--+---------+------+------------+-----------+

constexpr uint64_t SIGN_BIT = ((uint64_t)0x8000000000000000);
constexpr uint64_t EXPONENT_MASK = ((uint64_t)0x7ff0000000000000);
constexpr uint64_t MANTISSA_MASK = ((uint64_t)0x000fffffffffffff);
constexpr uint64_t BOXED_BIT = ((uint64_t)0x0008000000000000);

// The one NaN every real floating-point NaN is collapsed to. It sits in the
// signaling half of the NaN space (boxed bit clear); boxed words take the
// quiet half.
constexpr uint64_t CANONICAL_NAN = ((uint64_t)0x7ff4000000000000);

constexpr auto BOX_BITS = 51;      // tag + payload
constexpr auto ADDRESS_BITS = 48;  // meaningful bits of a virtual address
constexpr auto MAX_INT_WIDTH = 64;

constexpr uint64_t BOX_MASK = (((uint64_t)1 << BOX_BITS) - 1);

constexpr uint64_t low_mask(int width) {
    return width >= 64 ? ~(uint64_t)0 : (((uint64_t)1 << width) - 1);
}

} // namespace nanbox
