/**
 * @file bench_checksum.cpp
 * @brief Benchmarks for MD5 and CRC64 over block-sized payloads
 */

#include <benchmark/benchmark.h>

#include <kcenon/blob_transfer/core/checksum.h>

#include "utils/benchmark_helpers.h"

#include <algorithm>
#include <span>

namespace kcenon::blob_transfer::benchmark {

static void BM_Md5_Base64(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto data = test_data_generator::generate_random_data(size, 42);

    for (auto _ : state) {
        auto digest = checksum::md5_base64(data);
        if (!digest) {
            state.SkipWithError("MD5 failed");
            return;
        }
        ::benchmark::DoNotOptimize(digest.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

static void BM_Crc64(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto data = test_data_generator::generate_random_data(size, 42);

    for (auto _ : state) {
        auto value = checksum::crc64(data);
        ::benchmark::DoNotOptimize(value);
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Incremental MD5 + CRC64 fed in block-sized pieces, as uploads do
 */
static void BM_ChecksumCalculator_Blocks(::benchmark::State& state) {
    const auto total = sizes::large_payload;
    const auto block = static_cast<std::size_t>(state.range(0));
    auto data = test_data_generator::generate_random_data(total, 7);
    std::span<const std::byte> view(data);

    for (auto _ : state) {
        checksum_calculator calculator(true, true);
        for (std::size_t offset = 0; offset < total; offset += block) {
            auto piece = view.subspan(offset, std::min(block, total - offset));
            if (!calculator.update(piece)) {
                state.SkipWithError("update failed");
                return;
            }
        }
        auto values = calculator.finish();
        if (!values) {
            state.SkipWithError("finish failed");
            return;
        }
        ::benchmark::DoNotOptimize(values.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(total) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Md5_Base64)
    ->Arg(static_cast<int64_t>(sizes::small_block))
    ->Arg(static_cast<int64_t>(sizes::default_block))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Crc64)
    ->Arg(static_cast<int64_t>(sizes::small_block))
    ->Arg(static_cast<int64_t>(sizes::default_block))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_ChecksumCalculator_Blocks)
    ->Arg(static_cast<int64_t>(sizes::small_block))
    ->Arg(static_cast<int64_t>(sizes::default_block))
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::blob_transfer::benchmark
