//
// NANBOX-CC
//

#pragma once

#include <ostream>
#include <string.h>

#include "common.hh"

namespace nanbox {

/**
 * @brief A 64-bit word holding either a double or a boxed variant.
 *
 * Plain value, trivially copyable. Comparison and ordering are on the bit
 * pattern.
 */
class Word {
  public:
    constexpr Word() = default;
    explicit constexpr Word(uint64_t bits) : raw(bits){};

    static Word fromDouble(double d) {
        uint64_t bits;
        memcpy(&bits, &d, sizeof(double));
        return Word(bits);
    }

    [[nodiscard]] double toDouble() const {
        double d;
        memcpy(&d, &raw, sizeof(double));
        return d;
    }

    [[nodiscard]] constexpr uint64_t bits() const { return raw; }

    [[nodiscard]] constexpr bool sign() const { return (raw & SIGN_BIT) != 0; }
    [[nodiscard]] constexpr uint64_t exponent() const {
        return (raw & EXPONENT_MASK) >> 52;
    }
    [[nodiscard]] constexpr uint64_t mantissa() const { return raw & MANTISSA_MASK; }

    // Exponent all ones and the boxed bit set. Says nothing about whether the
    // tag is registered.
    [[nodiscard]] constexpr bool isBoxed() const {
        return (raw & (EXPONENT_MASK | BOXED_BIT)) == (EXPONENT_MASK | BOXED_BIT);
    }

    // Tag and payload bits below the boxed bit.
    [[nodiscard]] constexpr uint64_t boxField() const { return raw & BOX_MASK; }

    // Raw tag under a tag_bits wide tag. False, and *out untouched, for words
    // that are not boxed.
    constexpr bool tag(int tag_bits, uint64_t *out) const {
        if (!isBoxed()) {
            return false;
        }
        *out = boxField() >> (BOX_BITS - tag_bits);
        return true;
    }

    // Low payload_bits of the box field, whether or not the word is boxed.
    [[nodiscard]] constexpr uint64_t payload(int payload_bits) const {
        return boxField() & low_mask(payload_bits);
    }

    constexpr bool operator==(const Word &other) const { return raw == other.raw; }
    constexpr bool operator!=(const Word &other) const { return raw != other.raw; }
    constexpr bool operator<(const Word &other) const { return raw < other.raw; }

  private:
    uint64_t raw{0};
};

std::ostream &operator<<(std::ostream &os, const Word &word);

} // namespace nanbox
