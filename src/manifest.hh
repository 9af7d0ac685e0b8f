//
// NANBOX-CC
//

#pragma once

#include <string>
#include <vector>

#include "common.hh"

namespace nanbox {

enum class PayloadKind : uint8_t { FLOAT64, BOOL, SIGNED_INT, UNSIGNED_INT, ADDRESS, UNIT };

struct VariantDecl {
    std::string name;
    PayloadKind kind;
    int         width{0}; // only read for integers and addresses
};

// Tags are assigned by position.
using Manifest = std::vector<VariantDecl>;

inline VariantDecl floatVariant(std::string name) {
    return {std::move(name), PayloadKind::FLOAT64, 0};
}

inline VariantDecl boolVariant(std::string name) {
    return {std::move(name), PayloadKind::BOOL, 1};
}

inline VariantDecl signedVariant(std::string name, int width) {
    return {std::move(name), PayloadKind::SIGNED_INT, width};
}

inline VariantDecl unsignedVariant(std::string name, int width) {
    return {std::move(name), PayloadKind::UNSIGNED_INT, width};
}

inline VariantDecl addressVariant(std::string name, int width = ADDRESS_BITS) {
    return {std::move(name), PayloadKind::ADDRESS, width};
}

inline VariantDecl unitVariant(std::string name) {
    return {std::move(name), PayloadKind::UNIT, 0};
}

} // namespace nanbox
