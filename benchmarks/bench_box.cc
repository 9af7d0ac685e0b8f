//
// NANBOX-CC
//

#include <benchmark/benchmark.h>

#include "nanbox.hh"

using namespace nanbox;

static Layout make_layout() {
    Layout layout;
    auto   status = Layout::build({floatVariant("Float"), signedVariant("Int", 32),
                                   addressVariant("Pointer"), boolVariant("Flag")},
                                  &layout);
    if (status != BoxStatus::OK) {
        throw LayoutError(status, "benchmark layout");
    }
    return layout;
}

template <typename... ExtraArgs>
static void BM_Encode(benchmark::State &state, ExtraArgs &&...extra_args) {
    auto layout = make_layout();
    Word word;

    for (auto _ : state) {
        benchmark::DoNotOptimize(encode(layout, extra_args..., &word));
        benchmark::DoNotOptimize(word);
    }
}

template <typename... ExtraArgs>
static void BM_Decode(benchmark::State &state, ExtraArgs &&...extra_args) {
    auto layout = make_layout();
    Word word;
    if (encode(layout, extra_args..., &word) != BoxStatus::OK) {
        state.SkipWithError("encode failed");
        return;
    }

    for (auto _ : state) {
        benchmark::DoNotOptimize(decode(layout, word));
    }
}

static void BM_Typed(benchmark::State &state) {
    using Value = BoxedUnion<double, int32_t, void *>;
    int32_t i = 0;

    for (auto _ : state) {
        auto v = Value::make(i++);
        benchmark::DoNotOptimize(v.as<int32_t>());
    }
}

BENCHMARK_CAPTURE(BM_Encode, f64, size_t{0}, floatScalar(3.14));
BENCHMARK_CAPTURE(BM_Encode, i32, size_t{1}, signedScalar(-123));
BENCHMARK_CAPTURE(BM_Encode, ptr, size_t{2}, addressScalar(uintptr_t(0x7fff0000)));
BENCHMARK_CAPTURE(BM_Decode, f64, size_t{0}, floatScalar(3.14));
BENCHMARK_CAPTURE(BM_Decode, i32, size_t{1}, signedScalar(-123));
BENCHMARK_CAPTURE(BM_Decode, ptr, size_t{2}, addressScalar(uintptr_t(0x7fff0000)));
BENCHMARK(BM_Typed);

// Run the benchmark
BENCHMARK_MAIN();
