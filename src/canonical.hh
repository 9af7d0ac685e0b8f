//
// NANBOX-CC
//

#pragma once

#include "word.hh"

namespace nanbox {

// True for every word that decodes as a float: any non-NaN, and any NaN whose
// boxed bit is clear.
constexpr bool isCanonicalFloat(uint64_t bits) {
    return (bits & EXPONENT_MASK) != EXPONENT_MASK || (bits & BOXED_BIT) == 0;
}

constexpr bool isNaN(uint64_t bits) {
    return (bits & EXPONENT_MASK) == EXPONENT_MASK && (bits & MANTISSA_MASK) != 0;
}

// Collapses every NaN onto CANONICAL_NAN; other values pass through.
constexpr uint64_t canonicalBits(uint64_t bits) {
    return isNaN(bits) ? CANONICAL_NAN : bits;
}

inline double canonicalize(double d) {
    return Word(canonicalBits(Word::fromDouble(d).bits())).toDouble();
}

} // namespace nanbox
