/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_BLOB_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_BLOB_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace kcenon::blob_transfer::benchmark {

/**
 * @brief Helper class for generating test data for benchmarks
 */
class test_data_generator {
public:
    /**
     * @brief Generate random binary data
     * @param size Size in bytes
     * @param seed Random seed (0 for random)
     */
    static auto generate_random_data(std::size_t size, uint32_t seed = 0)
        -> std::vector<std::byte>;

    /**
     * @brief Build a batch response body with @p count parts
     * @param failure_every Every n-th part is a 404 (0 for none)
     */
    static auto generate_batch_response(const std::string& boundary, std::size_t count,
                                        std::size_t failure_every = 0) -> std::string;
};

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_block = 64 * KB;
constexpr std::size_t default_block = 4 * MB;
constexpr std::size_t large_payload = 32 * MB;
}  // namespace sizes

}  // namespace kcenon::blob_transfer::benchmark

#endif  // KCENON_BLOB_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
