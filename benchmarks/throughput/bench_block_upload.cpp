/**
 * @file bench_block_upload.cpp
 * @brief Benchmarks for chunked uploads and downloads against the in-memory service
 */

#include <benchmark/benchmark.h>

#include <kcenon/blob_transfer/blob_transfer.h>

#include "in_memory_blob_service.h"
#include "utils/benchmark_helpers.h"

#include <memory>

namespace kcenon::blob_transfer::benchmark {

namespace {

auto make_client(std::shared_ptr<test::in_memory_blob_service> service)
    -> std::unique_ptr<blob_service_client> {
    auto config = blob_client_config_builder().with_account("benchaccount").build();
    auto credentials = storage_credentials::shared_key("benchaccount", "YmVuY2gta2V5");
    if (!config || !credentials) {
        return nullptr;
    }
    auto client = blob_service_client::create(config.value(), credentials.value(),
                                              std::move(service));
    return client ? std::move(client.value()) : nullptr;
}

auto block_options(std::size_t parallelism) -> blob_request_options {
    blob_request_options options;
    options.block_size = sizes::small_block * 4;
    options.single_shot_threshold = 0;
    options.parallelism = parallelism;
    options.use_transactional_md5 = true;
    return options;
}

}  // namespace

static void BM_Upload_Blocks(::benchmark::State& state) {
    const auto parallelism = static_cast<std::size_t>(state.range(0));
    auto payload = test_data_generator::generate_random_data(sizes::large_payload, 42);

    auto service = std::make_shared<test::in_memory_blob_service>();
    auto client = make_client(service);
    if (!client) {
        state.SkipWithError("client setup failed");
        return;
    }
    auto blob = client->get_block_blob_client("bench", "upload.bin");
    const auto options = block_options(parallelism);

    for (auto _ : state) {
        auto summary = blob.upload_from_bytes(payload, {}, options);
        if (!summary) {
            state.SkipWithError(summary.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(summary.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(payload.size()) *
                            static_cast<int64_t>(state.iterations()));
}

static void BM_Download_Ranges(::benchmark::State& state) {
    const auto parallelism = static_cast<std::size_t>(state.range(0));
    auto payload = test_data_generator::generate_random_data(sizes::large_payload, 42);

    auto service = std::make_shared<test::in_memory_blob_service>();
    service->seed_blob("bench", "download.bin", payload);
    auto client = make_client(service);
    if (!client) {
        state.SkipWithError("client setup failed");
        return;
    }
    auto blob = client->get_block_blob_client("bench", "download.bin");
    const auto options = block_options(parallelism);

    for (auto _ : state) {
        auto bytes = blob.download_to_bytes({}, options);
        if (!bytes) {
            state.SkipWithError(bytes.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(bytes.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(payload.size()) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Upload_Blocks)->Arg(1)->Arg(4)->Arg(8)->Unit(::benchmark::kMillisecond);
BENCHMARK(BM_Download_Ranges)->Arg(1)->Arg(4)->Arg(8)->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::blob_transfer::benchmark
