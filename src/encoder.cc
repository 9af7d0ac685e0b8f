//
// NANBOX-CC
//

#include "encoder.hh"
#include "canonical.hh"

namespace nanbox {

bool fitsSigned(int64_t v, int width) {
    if (width >= 64) {
        return true;
    }
    auto const min = -((int64_t)1 << (width - 1));
    auto const max = ((int64_t)1 << (width - 1)) - 1;
    return v >= min && v <= max;
}

bool fitsUnsigned(uint64_t v, int width) {
    return width >= 64 || (v >> width) == 0;
}

static bool kindAccepts(PayloadKind kind, ScalarType type) {
    switch (kind) {
    case PayloadKind::FLOAT64:
        return type == ScalarType::FLOAT;
    case PayloadKind::BOOL:
        return type == ScalarType::BOOL;
    case PayloadKind::SIGNED_INT:
        return type == ScalarType::SIGNED;
    case PayloadKind::UNSIGNED_INT:
        return type == ScalarType::UNSIGNED;
    case PayloadKind::ADDRESS:
        return type == ScalarType::ADDRESS;
    case PayloadKind::UNIT:
        return type == ScalarType::UNIT;
    }
    return false;
}

BoxStatus encode(const Layout &layout, size_t variant, const Scalar &value, Word *out) {
    if (variant >= layout.size()) {
        return BoxStatus::UNKNOWN_VARIANT;
    }
    auto const &v = layout.get_variant(variant);
    if (!kindAccepts(v.kind, value.type)) {
        return BoxStatus::KIND_MISMATCH;
    }

    uint64_t payload = 0;
    switch (v.kind) {
    case PayloadKind::FLOAT64:
        *out = Word(canonicalBits(Word::fromDouble(value.as.number).bits()));
        return BoxStatus::OK;
    case PayloadKind::BOOL:
        payload = value.as.boolean ? 1 : 0;
        break;
    case PayloadKind::UNIT:
        break;
    case PayloadKind::SIGNED_INT:
        if (!fitsSigned(value.as.integer, v.width)) {
            return BoxStatus::OUT_OF_RANGE;
        }
        payload = static_cast<uint64_t>(value.as.integer) & low_mask(v.width);
        break;
    case PayloadKind::UNSIGNED_INT:
        if (!fitsUnsigned(value.as.natural, v.width)) {
            return BoxStatus::OUT_OF_RANGE;
        }
        payload = value.as.natural;
        break;
    case PayloadKind::ADDRESS:
        if (!fitsUnsigned(static_cast<uint64_t>(value.as.address), v.width)) {
            return BoxStatus::OUT_OF_RANGE;
        }
        payload = static_cast<uint64_t>(value.as.address);
        break;
    }
    *out = pack(layout, v.tag, payload);
    return BoxStatus::OK;
}

} // namespace nanbox
