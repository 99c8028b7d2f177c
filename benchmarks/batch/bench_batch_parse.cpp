/**
 * @file bench_batch_parse.cpp
 * @brief Benchmarks for batch response demultiplexing
 */

#include <benchmark/benchmark.h>

#include <kcenon/blob_transfer/batch/batch_response_parser.h>

#include "utils/benchmark_helpers.h"

#include <string>

namespace kcenon::blob_transfer::benchmark {

namespace {
constexpr const char* boundary = "batchresponse_66925e24-b8d2-4bc2-8a9b-36c7b8e0a8f3";
}  // namespace

static void BM_BatchResponse_Parse(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    const auto failure_every = static_cast<std::size_t>(state.range(1));
    const auto body = test_data_generator::generate_batch_response(boundary, count,
                                                                   failure_every);
    const std::string content_type = std::string("multipart/mixed; boundary=") + boundary;

    for (auto _ : state) {
        batch_response_parser parser(count);
        auto outcome = parser.parse(content_type, body);
        if (!outcome) {
            state.SkipWithError("parse failed");
            return;
        }
        ::benchmark::DoNotOptimize(outcome.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(body.size()) *
                            static_cast<int64_t>(state.iterations()));
    state.SetItemsProcessed(static_cast<int64_t>(count) *
                            static_cast<int64_t>(state.iterations()));
}

static void BM_BatchResult_Aggregate(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    const auto body = test_data_generator::generate_batch_response(boundary, count, 10);
    const std::string content_type = std::string("multipart/mixed; boundary=") + boundary;

    batch_response_parser parser(count);
    auto parsed = parser.parse(content_type, body);
    if (!parsed) {
        state.SkipWithError("parse failed");
        return;
    }

    for (auto _ : state) {
        auto aggregated = batch_result_aggregator::aggregate(parsed.value());
        ::benchmark::DoNotOptimize(aggregated);
    }
}

BENCHMARK(BM_BatchResponse_Parse)
    ->Args({16, 0})
    ->Args({256, 0})
    ->Args({256, 4})
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_BatchResult_Aggregate)->Arg(16)->Arg(256);

}  // namespace kcenon::blob_transfer::benchmark
