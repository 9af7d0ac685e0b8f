//
// NANBOX-CC
//

#pragma once

#include <concepts>
#include <type_traits>

#include <fmt/core.h>

#include "decoder.hh"
#include "encoder.hh"
#include "layout.hh"
#include "manifest.hh"

namespace nanbox {

// Payload-less variant.
struct Unit {
    constexpr bool operator==(const Unit &) const { return true; }
};

template <typename T> struct payload_traits;

template <> struct payload_traits<double> {
    static constexpr PayloadKind kind = PayloadKind::FLOAT64;
    static constexpr int         width = 0;
};

template <> struct payload_traits<bool> {
    static constexpr PayloadKind kind = PayloadKind::BOOL;
    static constexpr int         width = 1;
};

template <> struct payload_traits<Unit> {
    static constexpr PayloadKind kind = PayloadKind::UNIT;
    static constexpr int         width = 0;
};

template <std::signed_integral T> struct payload_traits<T> {
    static constexpr PayloadKind kind = PayloadKind::SIGNED_INT;
    static constexpr int         width = sizeof(T) * 8;
};

template <std::unsigned_integral T> struct payload_traits<T> {
    static constexpr PayloadKind kind = PayloadKind::UNSIGNED_INT;
    static constexpr int         width = sizeof(T) * 8;
};

template <typename T> struct payload_traits<T *> {
    static constexpr PayloadKind kind = PayloadKind::ADDRESS;
    static constexpr int         width = ADDRESS_BITS;
};

template <typename T> Scalar toScalar(T v) {
    constexpr auto kind = payload_traits<T>::kind;
    if constexpr (kind == PayloadKind::FLOAT64) {
        return floatScalar(v);
    } else if constexpr (kind == PayloadKind::BOOL) {
        return boolScalar(v);
    } else if constexpr (kind == PayloadKind::UNIT) {
        return unitScalar();
    } else if constexpr (kind == PayloadKind::SIGNED_INT) {
        return signedScalar(static_cast<int64_t>(v));
    } else if constexpr (kind == PayloadKind::UNSIGNED_INT) {
        return unsignedScalar(static_cast<uint64_t>(v));
    } else {
        return addressScalar(v);
    }
}

template <typename T> T fromScalar(const Scalar &s) {
    constexpr auto kind = payload_traits<T>::kind;
    if constexpr (kind == PayloadKind::FLOAT64) {
        return s.as.number;
    } else if constexpr (kind == PayloadKind::BOOL) {
        return s.as.boolean;
    } else if constexpr (kind == PayloadKind::UNIT) {
        return Unit{};
    } else if constexpr (kind == PayloadKind::SIGNED_INT) {
        return static_cast<T>(s.as.integer);
    } else if constexpr (kind == PayloadKind::UNSIGNED_INT) {
        return static_cast<T>(s.as.natural);
    } else {
        return (T)(s.as.address);
    }
}

template <typename T> std::string variantName() {
    constexpr auto kind = payload_traits<T>::kind;
    if constexpr (kind == PayloadKind::FLOAT64) {
        return "f64";
    } else if constexpr (kind == PayloadKind::BOOL) {
        return "bool";
    } else if constexpr (kind == PayloadKind::UNIT) {
        return "unit";
    } else if constexpr (kind == PayloadKind::SIGNED_INT) {
        return fmt::format("i{}", payload_traits<T>::width);
    } else if constexpr (kind == PayloadKind::UNSIGNED_INT) {
        return fmt::format("u{}", payload_traits<T>::width);
    } else {
        return "ptr";
    }
}

template <typename T, typename... Ts> constexpr size_t countOf() {
    return (static_cast<size_t>(std::is_same_v<T, Ts>) + ... + 0);
}

template <typename T, typename... Ts> constexpr size_t indexOf() {
    constexpr bool matches[] = {std::is_same_v<T, Ts>...};
    for (size_t i = 0; i < sizeof...(Ts); i++) {
        if (matches[i]) {
            return i;
        }
    }
    return Layout::npos;
}

/**
 * @brief A word restricted to the types Ts, one variant per type.
 *
 * The manifest is derived from Ts in order: double is the float variant,
 * bool, Unit, fixed-width integers and pointers are boxed. Capacity is
 * checked at compile time, so the layout cannot fail to build.
 *
 * A default constructed BoxedUnion holds +0.0; when double is not one of Ts
 * it matches no variant and index() is npos.
 */
template <typename... Ts> class BoxedUnion {
    static_assert(sizeof...(Ts) > 0, "BoxedUnion needs at least one type");
    static_assert(((countOf<Ts, Ts...>() == 1) && ...), "BoxedUnion types must be distinct");
    static_assert(((payload_traits<Ts>::width <= payloadCapacity(tagWidth(sizeof...(Ts)))) &&
                   ...),
                  "payload too wide for the tag space");

  public:
    static constexpr size_t npos = Layout::npos;

    template <typename T>
    static constexpr bool holds = countOf<T, Ts...>() == 1;

    constexpr BoxedUnion() = default;

    static Manifest manifest() {
        return {VariantDecl{variantName<Ts>(), payload_traits<Ts>::kind,
                            payload_traits<Ts>::width}...};
    }

    static const Layout &layout() {
        static const Layout instance = buildLayout();
        return instance;
    }

    template <typename T>
        requires holds<T>
    static BoxStatus from(T v, BoxedUnion *out) {
        Word word;
        auto status = encode(layout(), indexOf<T, Ts...>(), toScalar(v), &word);
        if (status == BoxStatus::OK) {
            out->value = word;
        }
        return status;
    }

    // Only for types whose whole range fits the payload.
    template <typename T>
        requires holds<T> && (!std::is_pointer_v<T>)
    static BoxedUnion make(T v) {
        BoxedUnion b;
        auto       status = from(v, &b);
        if (status != BoxStatus::OK) {
            throw std::logic_error(
                fmt::format("{} cannot be boxed: {}", variantName<T>(), statusName(status)));
        }
        return b;
    }

    // Accepts only words that decode to one of Ts.
    static BoxStatus fromWord(Word word, BoxedUnion *out) {
        auto c = decode(layout(), word);
        if (c.variant == npos) {
            return BoxStatus::INVALID_TAG;
        }
        out->value = word;
        return BoxStatus::OK;
    }

    [[nodiscard]] size_t index() const { return decode(layout(), value).variant; }

    template <typename T>
        requires holds<T>
    [[nodiscard]] bool is() const {
        return index() == indexOf<T, Ts...>();
    }

    // Unchecked: the result is undefined unless is<T>(). Use get() when the
    // type is not known.
    template <typename T>
        requires holds<T>
    [[nodiscard]] T as() const {
        return fromScalar<T>(decode(layout(), value).value);
    }

    // Checked access: false, and *out untouched, unless the word holds a T.
    template <typename T>
        requires holds<T>
    bool get(T *out) const {
        auto c = decode(layout(), value);
        if (c.variant != indexOf<T, Ts...>()) {
            return false;
        }
        *out = fromScalar<T>(c.value);
        return true;
    }

    [[nodiscard]] constexpr Word word() const { return value; }

    constexpr bool operator==(const BoxedUnion &other) const { return value == other.value; }

  private:
    static Layout buildLayout() {
        Layout result;
        auto   status = Layout::build(manifest(), &result);
        if (status != BoxStatus::OK) {
            throw LayoutError(status, fmt::format("typed union cannot be laid out: {}",
                                                  statusName(status)));
        }
        return result;
    }

    Word value{};
};

} // namespace nanbox
