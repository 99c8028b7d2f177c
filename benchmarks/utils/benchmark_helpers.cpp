/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <kcenon/blob_transfer/http/multipart.h>

namespace kcenon::blob_transfer::benchmark {

auto test_data_generator::generate_random_data(std::size_t size, uint32_t seed)
    -> std::vector<std::byte> {
    std::vector<std::byte> data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }

    return data;
}

auto test_data_generator::generate_batch_response(const std::string& boundary,
                                                  std::size_t count,
                                                  std::size_t failure_every) -> std::string {
    multipart_writer writer(boundary);
    for (std::size_t i = 0; i < count; ++i) {
        http_headers mime;
        mime["Content-Type"] = "application/http";
        mime["Content-ID"] = std::to_string(i);

        const bool failed = failure_every != 0 && (i + 1) % failure_every == 0;
        if (failed) {
            writer.add_part(mime, "HTTP/1.1 404 The specified blob does not exist.",
                            {{"x-ms-error-code", "BlobNotFound"},
                             {"x-ms-request-id", "req-" + std::to_string(i)},
                             {"Content-Type", "application/xml"}},
                            "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n<Error><Code>"
                            "BlobNotFound</Code><Message>The specified blob does not "
                            "exist.</Message></Error>");
        } else {
            writer.add_part(mime, "HTTP/1.1 202 Accepted",
                            {{"x-ms-delete-type-permanent", "true"},
                             {"x-ms-request-id", "req-" + std::to_string(i)},
                             {"x-ms-version", "2019-02-02"}});
        }
    }
    return writer.finish();
}

}  // namespace kcenon::blob_transfer::benchmark
