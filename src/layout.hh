//
// NANBOX-CC
//

#pragma once

#include <string_view>
#include <vector>

#include "error.hh"
#include "manifest.hh"
#include "word.hh"

namespace nanbox {

// Minimal number of tag bits that distinguishes count variants, at least 1.
constexpr int tagWidth(size_t count) {
    int k = 1;
    while (k < 64 && ((uint64_t)1 << k) < count) {
        k++;
    }
    return k;
}

constexpr int payloadCapacity(int tag_bits) {
    return BOX_BITS - tag_bits;
}

struct VariantLayout {
    std::string name;
    PayloadKind kind;
    int         width;
    uint64_t    tag;
};

/**
 * @brief Tag and payload assignment for one manifest.
 *
 * Built once from a manifest and never changed afterwards; encode and decode
 * only read it.
 */
class Layout {
  public:
    static constexpr size_t npos = static_cast<size_t>(-1);

    Layout() = default;

    static BoxStatus build(const Manifest &manifest, Layout *out,
                           Diagnostics *diagnostics = nullptr);

    [[nodiscard]] int    tag_bits() const { return tagBits; }
    [[nodiscard]] int    payload_bits() const { return payloadCapacity(tagBits); }
    [[nodiscard]] size_t size() const { return variants.size(); }

    [[nodiscard]] const VariantLayout &get_variant(size_t n) const { return variants[n]; }

    // Index of the Float64 variant, npos when none is declared.
    [[nodiscard]] size_t float_variant() const { return floatIndex; }

    [[nodiscard]] size_t find(std::string_view name) const;

    [[nodiscard]] uint64_t tagOf(Word word) const {
        return word.boxField() >> payload_bits();
    }
    [[nodiscard]] uint64_t payloadOf(Word word) const {
        return word.payload(payload_bits());
    }

    // Index of the variant tagged tag, npos when the tag is unregistered.
    [[nodiscard]] size_t lookup(uint64_t tag) const {
        return tag < variants.size() ? static_cast<size_t>(tag) : npos;
    }

  private:
    int                        tagBits{1};
    size_t                     floatIndex{npos};
    std::vector<VariantLayout> variants;
};

} // namespace nanbox
