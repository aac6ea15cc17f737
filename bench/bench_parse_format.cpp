// bench/bench_parse_format.cpp — Benchmarks for fraclib parsing and formatting.

#include <array>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include <benchmark/benchmark.h>

#include <frac/fraclib.hpp>
#include <frac/util/random.hpp>

namespace {

std::vector<std::string> make_inputs(unsigned frac, int radix) {
    std::mt19937_64 rng(0x5eedc0de);
    std::vector<std::string> inputs;
    inputs.reserve(256);
    for (int index = 0; index < 256; ++index) {
        inputs.push_back(frac::format(frac::util::random_scaled(rng), frac, radix));
    }
    return inputs;
}

static void BM_ParseDecimal(benchmark::State& state) {
    const auto inputs = make_inputs(2, 10);
    std::size_t index = 0;
    for (auto _ : state) {
        const auto value = frac::parse_dec(inputs[index++ & 255], 2);
        benchmark::DoNotOptimize(value);
    }
}
BENCHMARK(BM_ParseDecimal);

static void BM_TryParseRadix(benchmark::State& state) {
    const int radix = static_cast<int>(state.range(0));
    const auto inputs = make_inputs(4, radix);
    std::size_t index = 0;
    for (auto _ : state) {
        const auto result = frac::try_parse(inputs[index++ & 255], 4, radix);
        benchmark::DoNotOptimize(result.value);
    }
}
BENCHMARK(BM_TryParseRadix)->Arg(2)->Arg(10)->Arg(16)->Arg(36);

static void BM_FormatDecimal(benchmark::State& state) {
    std::mt19937_64 rng(0x5eedc0de);
    std::vector<std::int64_t> values(256);
    for (auto& value : values) {
        value = frac::util::random_scaled(rng);
    }
    std::size_t index = 0;
    for (auto _ : state) {
        auto text = frac::format_dec(values[index++ & 255], 2);
        benchmark::DoNotOptimize(text.data());
    }
}
BENCHMARK(BM_FormatDecimal);

static void BM_FormatToBuffer(benchmark::State& state) {
    const int radix = static_cast<int>(state.range(0));
    std::mt19937_64 rng(0x5eedc0de + radix);
    std::vector<std::int64_t> values(256);
    for (auto& value : values) {
        value = frac::util::random_scaled(rng);
    }
    std::array<char, 128> buffer{};
    std::size_t index = 0;
    for (auto _ : state) {
        const auto result = frac::format_to(buffer.data(), buffer.data() + buffer.size(),
                                            values[index++ & 255], 4, radix);
        benchmark::DoNotOptimize(result.ptr);
        benchmark::ClobberMemory();
    }
}
BENCHMARK(BM_FormatToBuffer)->Arg(2)->Arg(10)->Arg(16)->Arg(36);

static void BM_AppendReusedBuffer(benchmark::State& state) {
    std::string buffer;
    buffer.reserve(128);
    std::int64_t value = -1234567890123;
    for (auto _ : state) {
        buffer.clear();
        frac::append_hex(buffer, value++, 3);
        benchmark::DoNotOptimize(buffer.data());
    }
}
BENCHMARK(BM_AppendReusedBuffer);

} // namespace

BENCHMARK_MAIN();
