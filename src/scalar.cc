//
// NANBOX-CC
//

#include "scalar.hh"
#include "word.hh"

namespace nanbox {

// Floats compare by bit pattern, so -0.0 != 0.0 and a NaN equals itself.
bool Scalar::operator==(const Scalar &other) const {
    if (type != other.type) {
        return false;
    }
    switch (type) {
    case ScalarType::FLOAT:
        return Word::fromDouble(as.number) == Word::fromDouble(other.as.number);
    case ScalarType::BOOL:
        return as.boolean == other.as.boolean;
    case ScalarType::SIGNED:
        return as.integer == other.as.integer;
    case ScalarType::UNSIGNED:
        return as.natural == other.as.natural;
    case ScalarType::ADDRESS:
        return as.address == other.as.address;
    case ScalarType::UNIT:
        return true;
    }
    return false; // Unreachable.
}

} // namespace nanbox
