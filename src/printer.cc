//
// NANBOX-CC
//

#include <fmt/core.h>

#include "printer.hh"

namespace nanbox {

std::string_view kindName(PayloadKind kind) {
    switch (kind) {
    case PayloadKind::FLOAT64:
        return "float64";
    case PayloadKind::BOOL:
        return "bool";
    case PayloadKind::SIGNED_INT:
        return "int";
    case PayloadKind::UNSIGNED_INT:
        return "uint";
    case PayloadKind::ADDRESS:
        return "address";
    case PayloadKind::UNIT:
        return "unit";
    }
    return "?";
}

void printScalar(std::ostream &os, const Scalar &value) {
    switch (value.type) {
    case ScalarType::FLOAT:
        os << fmt::format("{:g}", value.as.number);
        break;
    case ScalarType::BOOL:
        os << (value.as.boolean ? "true" : "false");
        break;
    case ScalarType::SIGNED:
        os << fmt::format("{}", value.as.integer);
        break;
    case ScalarType::UNSIGNED:
        os << fmt::format("{}", value.as.natural);
        break;
    case ScalarType::ADDRESS:
        os << fmt::format("{:#x}", value.as.address);
        break;
    case ScalarType::UNIT:
        os << "()";
        break;
    }
}

void printClassified(std::ostream &os, const Layout &layout, const Classified &c) {
    switch (c.cls) {
    case WordClass::FLOAT:
        if (c.variant != Layout::npos) {
            os << layout.get_variant(c.variant).name << '(';
            printScalar(os, c.value);
            os << ')';
        } else {
            printScalar(os, c.value);
        }
        break;
    case WordClass::VARIANT: {
        auto const &v = layout.get_variant(c.variant);
        os << v.name;
        if (v.kind != PayloadKind::UNIT) {
            os << '(';
            printScalar(os, c.value);
            os << ')';
        }
        break;
    }
    case WordClass::INVALID_TAG:
        os << "<invalid>";
        break;
    }
}

void printWord(std::ostream &os, const Layout &layout, Word word) {
    auto c = decode(layout, word);
    if (c.isInvalid()) {
        os << fmt::format("<invalid tag {}>", layout.tagOf(word));
        return;
    }
    printClassified(os, layout, c);
}

void dumpLayout(std::ostream &os, const Layout &layout, std::string_view title) {
    os << fmt::format("== {} ==\n", title);
    os << fmt::format("tag bits {:d}, payload bits {:d}\n", layout.tag_bits(),
                      layout.payload_bits());
    for (size_t i = 0; i < layout.size(); i++) {
        auto const &v = layout.get_variant(i);
        if (v.kind == PayloadKind::FLOAT64) {
            os << fmt::format("{:>{}} {:<8} {:4}  {}\n", "-", layout.tag_bits(),
                              kindName(v.kind), "", v.name);
            continue;
        }
        os << fmt::format("{:0{}b} {:<8} {:4d}  {}\n", v.tag, layout.tag_bits(),
                          kindName(v.kind), v.width, v.name);
    }
}

void dumpWord(std::ostream &os, const Layout &layout, Word word) {
    os << fmt::format("{:#018x} ", word.bits());
    if (word.isBoxed()) {
        os << fmt::format("sign {:d} tag {:d} payload {:#x} ", word.sign() ? 1 : 0,
                          layout.tagOf(word), layout.payloadOf(word));
    } else {
        os << fmt::format("sign {:d} exp {:#05x} mantissa {:#x} ", word.sign() ? 1 : 0,
                          word.exponent(), word.mantissa());
    }
    printWord(os, layout, word);
    os << '\n';
}

std::ostream &operator<<(std::ostream &os, const Word &word) {
    if (word.isBoxed()) {
        os << fmt::format("Word {{ boxed: {:#x} }}", word.boxField());
    } else {
        os << fmt::format("Word {{ float: {:g} }}", word.toDouble());
    }
    return os;
}

} // namespace nanbox
