//
// NANBOX-CC
//

#pragma once

#include "common.hh"

namespace nanbox {

enum class ScalarType : uint8_t { FLOAT, BOOL, SIGNED, UNSIGNED, ADDRESS, UNIT };

// A native value on its way into, or out of, a word.
struct Scalar {
    ScalarType type{ScalarType::UNIT};
    union {
        double    number;
        bool      boolean;
        int64_t   integer;
        uint64_t  natural;
        uintptr_t address;
    } as{};

    bool operator==(const Scalar &other) const;
};

inline Scalar floatScalar(double v) {
    Scalar s;
    s.type = ScalarType::FLOAT;
    s.as.number = v;
    return s;
}

inline Scalar boolScalar(bool v) {
    Scalar s;
    s.type = ScalarType::BOOL;
    s.as.boolean = v;
    return s;
}

inline Scalar signedScalar(int64_t v) {
    Scalar s;
    s.type = ScalarType::SIGNED;
    s.as.integer = v;
    return s;
}

inline Scalar unsignedScalar(uint64_t v) {
    Scalar s;
    s.type = ScalarType::UNSIGNED;
    s.as.natural = v;
    return s;
}

inline Scalar addressScalar(uintptr_t v) {
    Scalar s;
    s.type = ScalarType::ADDRESS;
    s.as.address = v;
    return s;
}

template <typename T> inline Scalar addressScalar(T *p) {
    return addressScalar((uintptr_t)p);
}

inline Scalar unitScalar() {
    return Scalar{};
}

} // namespace nanbox
