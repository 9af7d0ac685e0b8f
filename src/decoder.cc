//
// NANBOX-CC
//

#include "decoder.hh"

namespace nanbox {

static int64_t signExtend(uint64_t payload, int width) {
    if (width >= 64) {
        return static_cast<int64_t>(payload);
    }
    auto const sign = (uint64_t)1 << (width - 1);
    return static_cast<int64_t>((payload ^ sign) - sign);
}

static Classified invalid() {
    return Classified{WordClass::INVALID_TAG, Layout::npos, unitScalar()};
}

Classified decode(const Layout &layout, Word word) {
    if (!word.isBoxed()) {
        return Classified{WordClass::FLOAT, layout.float_variant(),
                          floatScalar(word.toDouble())};
    }
    if (word.sign()) {
        return invalid();
    }

    auto const index = layout.lookup(layout.tagOf(word));
    if (index == Layout::npos) {
        return invalid();
    }
    auto const &v = layout.get_variant(index);
    auto const  payload = layout.payloadOf(word);
    if ((payload & ~low_mask(v.width)) != 0) {
        return invalid();
    }

    Scalar value;
    switch (v.kind) {
    case PayloadKind::FLOAT64:
        return invalid();
    case PayloadKind::BOOL:
        value = boolScalar(payload != 0);
        break;
    case PayloadKind::UNIT:
        value = unitScalar();
        break;
    case PayloadKind::SIGNED_INT:
        value = signedScalar(signExtend(payload, v.width));
        break;
    case PayloadKind::UNSIGNED_INT:
        value = unsignedScalar(payload);
        break;
    case PayloadKind::ADDRESS:
        value = addressScalar(static_cast<uintptr_t>(payload));
        break;
    }
    return Classified{WordClass::VARIANT, index, value};
}

} // namespace nanbox
