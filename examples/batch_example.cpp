/**
 * @file batch_example.cpp
 * @brief Deleting or re-tiering many blobs in one batch request
 */

#include <kcenon/blob_transfer/blob_transfer.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace kcenon::blob_transfer;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " <delete|hot|cool|archive> <container> <blob>..."
              << std::endl;
    std::cout << std::endl;
    std::cout << "Up to 256 blobs are sent in one request." << std::endl;
    std::cout << "The connection string is read from AZURE_STORAGE_CONNECTION_STRING." << std::endl;
}

auto parse_tier(const std::string& name) -> std::optional<standard_blob_tier> {
    if (name == "hot") return standard_blob_tier::hot;
    if (name == "cool") return standard_blob_tier::cool;
    if (name == "archive") return standard_blob_tier::archive;
    return std::nullopt;
}

void print_outcome(const batch_outcome& outcome, const std::vector<std::string>& blobs) {
    for (const auto& ok : outcome.successes) {
        std::cout << "  [" << ok.status_code << "] " << blobs[ok.operation_index] << std::endl;
    }
    for (const auto& failed : outcome.errors) {
        std::cout << "  [" << failed.status_code << "] " << blobs[failed.operation_index] << ": "
                  << failed.error_code << " " << failed.message << std::endl;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string action = argv[1];
    const std::string container = argv[2];
    std::vector<std::string> blobs(argv + 3, argv + argc);

    std::unique_ptr<blob_batch> batch;
    if (action == "delete") {
        auto deletes = std::make_unique<blob_delete_batch>();
        for (const auto& name : blobs) {
            if (auto added = deletes->add_delete(container, name,
                                                 delete_snapshots_option::include_snapshots);
                !added) {
                std::cerr << "Cannot queue " << name << ": " << added.error().message << std::endl;
                return 1;
            }
        }
        batch = std::move(deletes);
    } else if (auto tier = parse_tier(action)) {
        auto tiers = std::make_unique<blob_set_tier_batch>();
        for (const auto& name : blobs) {
            if (auto added = tiers->add_set_tier(container, name, *tier); !added) {
                std::cerr << "Cannot queue " << name << ": " << added.error().message << std::endl;
                return 1;
            }
        }
        batch = std::move(tiers);
    } else {
        print_usage(argv[0]);
        return 1;
    }

    const char* connection_string = std::getenv("AZURE_STORAGE_CONNECTION_STRING");
    if (connection_string == nullptr) {
        std::cerr << "Error: AZURE_STORAGE_CONNECTION_STRING is not set" << std::endl;
        return 1;
    }

    auto client = blob_service_client::from_connection_string(connection_string);
    if (!client) {
        std::cerr << "Failed to create client: " << client.error().message << std::endl;
        return 1;
    }

    auto results = client.value()->execute_batch(*batch);
    if (results) {
        std::cout << "All " << results->size() << " operations succeeded" << std::endl;
        return 0;
    }

    if (const auto* outcome = results.error().batch_failure()) {
        std::cout << outcome->errors.size() << " of " << outcome->total()
                  << " operations failed" << std::endl;
        print_outcome(*outcome, blobs);
    } else {
        std::cerr << "Batch request failed: " << results.error().message << std::endl;
    }
    return 1;
}
