/**
 * @file write_stream_example.cpp
 * @brief Appending log lines to a blob through a buffered write stream
 *
 * Lines read from stdin are buffered and uploaded as blocks whenever the
 * buffer fills. Closing the stream commits the block list.
 */

#include <kcenon/blob_transfer/blob_transfer.h>

#include <cstdlib>
#include <iostream>
#include <string>

using namespace kcenon::blob_transfer;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [--if-not-exists] <container> <blob> < input" << std::endl;
    std::cout << std::endl;
    std::cout << "The connection string is read from AZURE_STORAGE_CONNECTION_STRING." << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string container;
    std::string blob_name;
    access_condition condition = access_condition::none();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--if-not-exists") {
            condition = access_condition::if_not_exists();
        } else if (container.empty()) {
            container = arg;
        } else if (blob_name.empty()) {
            blob_name = arg;
        }
    }

    if (container.empty() || blob_name.empty()) {
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

    blob_request_options options;
    options.stream_write_size = 256 * 1024;
    options.parallelism = 2;
    options.store_content_md5 = true;

    auto blob = client.value()->get_block_blob_client(container, blob_name);
    auto stream = blob.open_write(condition, options);
    if (!stream) {
        std::cerr << "Failed to open stream: " << stream.error().message << std::endl;
        return 1;
    }

    std::string line;
    while (std::getline(std::cin, line)) {
        line.push_back('\n');
        if (auto written = stream.value()->write(line); !written) {
            std::cerr << "Write failed: " << written.error().message << std::endl;
            return 1;
        }
    }

    auto etag = stream.value()->commit();
    if (!etag) {
        std::cerr << "Commit failed: " << etag.error().message << std::endl;
        return 1;
    }

    std::cout << "Wrote " << stream.value()->position() << " bytes in "
              << stream.value()->manifest().size() << " block(s), ETag " << etag.value()
              << std::endl;
    return 0;
}
