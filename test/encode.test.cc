//
// NANBOX-CC
//

#include <cmath>
#include <limits>

#include <fmt/core.h>
#include <gtest/gtest.h>

#include "canonical.hh"
#include "decoder.hh"
#include "encoder.hh"

using namespace nanbox;

struct EncodeTests {
    size_t    variant;
    Scalar    value;
    BoxStatus status;
};

enum Var : size_t { FLOAT, BYTE, I8, INT, ADDR, FLAG, NIL };

static Layout make_layout() {
    Layout layout;
    auto   status = Layout::build({floatVariant("Float"), unsignedVariant("Byte", 8),
                                   signedVariant("I8", 8), signedVariant("Int", 32),
                                   addressVariant("Pointer"), boolVariant("Flag"),
                                   unitVariant("Nil")},
                                  &layout);
    if (status != BoxStatus::OK) {
        throw std::runtime_error("layout");
    }
    return layout;
}

void do_encode_tests(const std::vector<EncodeTests> &tests);

TEST(Encode, roundTrip) { // NOLINT
    std::vector<EncodeTests> tests = {
        {BYTE, unsignedScalar(0), BoxStatus::OK},
        {BYTE, unsignedScalar(255), BoxStatus::OK},
        {I8, signedScalar(0), BoxStatus::OK},
        {I8, signedScalar(-128), BoxStatus::OK},
        {I8, signedScalar(127), BoxStatus::OK},
        {I8, signedScalar(-1), BoxStatus::OK},
        {INT, signedScalar(123), BoxStatus::OK},
        {INT, signedScalar(std::numeric_limits<int32_t>::min()), BoxStatus::OK},
        {INT, signedScalar(std::numeric_limits<int32_t>::max()), BoxStatus::OK},
        {ADDR, addressScalar(uintptr_t(0)), BoxStatus::OK},
        {ADDR, addressScalar(uintptr_t(3000)), BoxStatus::OK},
        {ADDR, addressScalar(uintptr_t(0x0000ffffffffffff)), BoxStatus::OK},
        {FLAG, boolScalar(true), BoxStatus::OK},
        {FLAG, boolScalar(false), BoxStatus::OK},
        {NIL, unitScalar(), BoxStatus::OK},
    };
    do_encode_tests(tests);
}

TEST(Encode, range) { // NOLINT
    std::vector<EncodeTests> tests = {
        {BYTE, unsignedScalar(256), BoxStatus::OUT_OF_RANGE},
        {I8, signedScalar(128), BoxStatus::OUT_OF_RANGE},
        {I8, signedScalar(-129), BoxStatus::OUT_OF_RANGE},
        {INT, signedScalar(int64_t(1) << 31), BoxStatus::OUT_OF_RANGE},
        {INT, signedScalar(-(int64_t(1) << 31) - 1), BoxStatus::OUT_OF_RANGE},
        {ADDR, addressScalar(uintptr_t(1) << 48), BoxStatus::OUT_OF_RANGE},
        {ADDR, addressScalar(uintptr_t(0x0001000000000bb8)), BoxStatus::OUT_OF_RANGE},
        {ADDR, addressScalar(~uintptr_t(0)), BoxStatus::OUT_OF_RANGE},
    };
    do_encode_tests(tests);
}

TEST(Encode, errors) { // NOLINT
    std::vector<EncodeTests> tests = {
        {7, unitScalar(), BoxStatus::UNKNOWN_VARIANT},
        {1000, signedScalar(1), BoxStatus::UNKNOWN_VARIANT},
        {INT, unsignedScalar(1), BoxStatus::KIND_MISMATCH},
        {BYTE, signedScalar(1), BoxStatus::KIND_MISMATCH},
        {FLOAT, signedScalar(1), BoxStatus::KIND_MISMATCH},
        {NIL, boolScalar(false), BoxStatus::KIND_MISMATCH},
    };
    do_encode_tests(tests);
}

TEST(Encode, signedBoundaries) { // NOLINT
    auto layout = make_layout();
    for (int64_t v = -200; v <= 200; v++) {
        Word word;
        auto status = encode(layout, I8, signedScalar(v), &word);
        if (v >= -128 && v <= 127) {
            ASSERT_EQ(status, BoxStatus::OK) << v;
            EXPECT_EQ(decode(layout, word).value.as.integer, v);
        } else {
            EXPECT_EQ(status, BoxStatus::OUT_OF_RANGE) << v;
        }
    }
}

TEST(Encode, addressBits) { // NOLINT
    auto layout = make_layout();
    for (int bit = 0; bit < 64; bit++) {
        Word word;
        auto status = encode(layout, ADDR, addressScalar(uintptr_t(1) << bit), &word);
        EXPECT_EQ(status, bit < 48 ? BoxStatus::OK : BoxStatus::OUT_OF_RANGE) << bit;
    }
}

TEST(Encode, wordLayout) { // NOLINT
    Layout layout;
    ASSERT_EQ(Layout::build({floatVariant("Float"), signedVariant("Int", 32),
                             addressVariant("Pointer")},
                            &layout),
              BoxStatus::OK);

    Word word;
    ASSERT_EQ(encode(layout, 1, signedScalar(123), &word), BoxStatus::OK);
    EXPECT_EQ(word.bits(), 0x7ffa00000000007bULL);
    ASSERT_EQ(encode(layout, 1, signedScalar(-1), &word), BoxStatus::OK);
    EXPECT_EQ(word.bits(), 0x7ffa0000ffffffffULL);
    ASSERT_EQ(encode(layout, 2, addressScalar(uintptr_t(3000)), &word), BoxStatus::OK);
    EXPECT_EQ(word.bits(), 0x7ffc000000000bb8ULL);
    EXPECT_EQ(layout.tagOf(word), 2U);
    EXPECT_EQ(layout.payloadOf(word), 3000U);
    EXPECT_EQ(pack(layout, 2, 3000), word);

    uint64_t tag = 0;
    EXPECT_TRUE(word.tag(layout.tag_bits(), &tag));
    EXPECT_EQ(tag, 2U);
    EXPECT_EQ(word.payload(layout.payload_bits()), 3000U);

    tag = 77;
    EXPECT_FALSE(Word::fromDouble(1.0).tag(layout.tag_bits(), &tag));
    EXPECT_FALSE(Word(CANONICAL_NAN).tag(layout.tag_bits(), &tag));
    EXPECT_EQ(tag, 77U);

    ASSERT_EQ(encode(layout, 1, signedScalar(-1), &word), BoxStatus::OK);
    EXPECT_TRUE(word.tag(layout.tag_bits(), &tag));
    EXPECT_EQ(tag, 1U);
    EXPECT_EQ(word.payload(layout.payload_bits()), 0xffffffffU);
}

// 10 variants leave a 4-bit tag and 47 payload bits.
TEST(Encode, wideUnsigned) { // NOLINT
    Manifest manifest;
    for (int i = 0; i < 10; i++) {
        manifest.push_back(unsignedVariant(fmt::format("u{}", i), 47));
    }
    Layout layout;
    ASSERT_EQ(Layout::build(manifest, &layout), BoxStatus::OK);
    ASSERT_EQ(layout.payload_bits(), 47);

    auto const max = low_mask(47);
    std::vector<uint64_t> tests = {0, 1, max - 1, max};
    for (size_t variant = 0; variant < layout.size(); variant++) {
        for (auto v : tests) {
            Word word;
            ASSERT_EQ(encode(layout, variant, unsignedScalar(v), &word), BoxStatus::OK) << v;
            EXPECT_EQ(layout.tagOf(word), variant);
            EXPECT_EQ(layout.payloadOf(word), v);
            auto c = decode(layout, word);
            ASSERT_TRUE(c.isVariant());
            EXPECT_EQ(c.variant, variant);
            EXPECT_EQ(c.value, unsignedScalar(v));
        }
        Word word(0x1234);
        EXPECT_EQ(encode(layout, variant, unsignedScalar(max + 1), &word),
                  BoxStatus::OUT_OF_RANGE);
        EXPECT_EQ(word.bits(), 0x1234U);
    }
    // the top tag's payload runs right up to the tag field
    Word top;
    ASSERT_EQ(encode(layout, 9, unsignedScalar(max), &top), BoxStatus::OK);
    EXPECT_EQ(top.bits(), EXPONENT_MASK | BOXED_BIT | ((uint64_t)9 << 47) | max);
}

TEST(Encode, floats) { // NOLINT
    auto layout = make_layout();
    std::vector<double> tests = {
        0.0,
        -0.0,
        1.0,
        -1.0,
        3.14,
        1e300,
        -1e-300,
        std::numeric_limits<double>::denorm_min(),
        -std::numeric_limits<double>::denorm_min(),
        std::numeric_limits<double>::min(),
        std::numeric_limits<double>::max(),
        std::numeric_limits<double>::lowest(),
        std::numeric_limits<double>::infinity(),
        -std::numeric_limits<double>::infinity(),
    };
    for (auto d : tests) {
        Word word;
        ASSERT_EQ(encode(layout, FLOAT, floatScalar(d), &word), BoxStatus::OK);
        EXPECT_EQ(word, Word::fromDouble(d)) << d;
        auto c = decode(layout, word);
        EXPECT_TRUE(c.isFloat());
        EXPECT_EQ(c.variant, size_t(FLOAT));
        EXPECT_EQ(c.value, floatScalar(d)) << d;
    }
}

TEST(Encode, nanCanonicalization) { // NOLINT
    auto layout = make_layout();

    volatile double zero = 0.0;
    std::vector<double> nans = {
        std::numeric_limits<double>::quiet_NaN(),
        -std::numeric_limits<double>::quiet_NaN(),
        std::numeric_limits<double>::signaling_NaN(),
        zero / zero,
        std::sqrt(-1.0 + zero),
        std::numeric_limits<double>::infinity() - std::numeric_limits<double>::infinity(),
        Word(0x7ff8000000000001ULL).toDouble(),
        Word(0xfffa00000000007bULL).toDouble(),
        Word(0x7ff0000000000001ULL).toDouble(),
        Word(CANONICAL_NAN).toDouble(),
    };
    for (auto d : nans) {
        ASSERT_TRUE(std::isnan(d));
        Word word;
        ASSERT_EQ(encode(layout, FLOAT, floatScalar(d), &word), BoxStatus::OK);
        EXPECT_EQ(word.bits(), CANONICAL_NAN)
            << fmt::format("{:#018x}", Word::fromDouble(d).bits());
        auto c = decode(layout, word);
        EXPECT_TRUE(c.isFloat());
        EXPECT_TRUE(std::isnan(c.value.as.number));
        EXPECT_EQ(Word::fromDouble(c.value.as.number).bits(), CANONICAL_NAN);
    }
}

TEST(Encode, canonicalFilter) { // NOLINT
    EXPECT_TRUE(isCanonicalFloat(Word::fromDouble(1.5).bits()));
    EXPECT_TRUE(isCanonicalFloat(Word::fromDouble(-0.0).bits()));
    EXPECT_TRUE(isCanonicalFloat(0x7ff0000000000000ULL)); // +inf
    EXPECT_TRUE(isCanonicalFloat(0xfff0000000000000ULL)); // -inf
    EXPECT_TRUE(isCanonicalFloat(CANONICAL_NAN));
    EXPECT_TRUE(isCanonicalFloat(0x7ff0000000000001ULL));
    EXPECT_FALSE(isCanonicalFloat(0x7ff8000000000000ULL));
    EXPECT_FALSE(isCanonicalFloat(0xfff8000000000000ULL));
    EXPECT_FALSE(isCanonicalFloat(0x7ffa00000000007bULL));

    EXPECT_EQ(canonicalBits(0x7ff8000000000000ULL), CANONICAL_NAN);
    EXPECT_EQ(canonicalBits(0x7ff0000000000000ULL), 0x7ff0000000000000ULL);
    EXPECT_EQ(canonicalBits(0), 0U);

    EXPECT_EQ(Word::fromDouble(canonicalize(std::nan("7"))).bits(), CANONICAL_NAN);
    EXPECT_EQ(canonicalize(2.5), 2.5);
}

void do_encode_tests(const std::vector<EncodeTests> &tests) {
    auto layout = make_layout();
    for (auto const &t : tests) {
        Word word(0x1234);
        auto status = encode(layout, t.variant, t.value, &word);
        std::cout << fmt::format("variant {} -> {} {:#018x}\n", t.variant, statusName(status),
                                 word.bits());
        EXPECT_EQ(status, t.status);
        if (status != BoxStatus::OK) {
            EXPECT_EQ(word.bits(), 0x1234U);
            continue;
        }
        EXPECT_TRUE(word.isBoxed());
        EXPECT_FALSE(word.sign());
        auto c = decode(layout, word);
        EXPECT_TRUE(c.isVariant());
        EXPECT_EQ(c.variant, t.variant);
        EXPECT_EQ(c.value, t.value);
    }
}
