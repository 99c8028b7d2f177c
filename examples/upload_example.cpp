/**
 * @file upload_example.cpp
 * @brief Chunked block blob upload and verified download
 *
 * This example demonstrates:
 * - Creating a client from a connection string
 * - Uploading a local file in parallel blocks with progress reporting
 * - Downloading the blob back to disk with MD5 validation
 * - Reading transfer statistics
 */

#include <kcenon/blob_transfer/blob_transfer.h>

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

using namespace kcenon::blob_transfer;

namespace {

/**
 * @brief Format bytes into human-readable string
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

auto parse_size(const std::string& size_str) -> uint64_t {
    std::size_t pos = 0;
    double value = std::stod(size_str, &pos);
    if (pos < size_str.size()) {
        switch (std::toupper(static_cast<unsigned char>(size_str[pos]))) {
            case 'K': return static_cast<uint64_t>(value * 1024);
            case 'M': return static_cast<uint64_t>(value * 1024 * 1024);
            default: break;
        }
    }
    return static_cast<uint64_t>(value);
}

void print_error(const char* what, const error& err) {
    std::cerr << what << ": " << err.message;
    if (err.status_code() != 0) {
        std::cerr << " (HTTP " << err.status_code() << ")";
    }
    std::cerr << std::endl;
}

void print_usage(const char* program) {
    std::cout << "Upload Example - Blob Transfer System" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <local_file> <container> <blob>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -b, --block-size <size>   Block size (default: 4M)" << std::endl;
    std::cout << "  -j, --parallel <n>        Blocks in flight (default: 4)" << std::endl;
    std::cout << "  -d, --download <path>     Download the blob back to <path>" << std::endl;
    std::cout << "  --md5                     Send a transactional MD5 with every block" << std::endl;
    std::cout << "  --help                    Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "The connection string is read from AZURE_STORAGE_CONNECTION_STRING." << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    blob_request_options options;
    options.parallelism = 4;
    options.store_content_md5 = true;
    std::string local_path;
    std::string container;
    std::string blob_name;
    std::string download_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-b" || arg == "--block-size") {
            if (++i >= argc) {
                std::cerr << "Error: --block-size requires an argument" << std::endl;
                return 1;
            }
            options.block_size = parse_size(argv[i]);
        } else if (arg == "-j" || arg == "--parallel") {
            if (++i >= argc) {
                std::cerr << "Error: --parallel requires an argument" << std::endl;
                return 1;
            }
            options.parallelism = static_cast<std::size_t>(std::stoul(argv[i]));
        } else if (arg == "-d" || arg == "--download") {
            if (++i >= argc) {
                std::cerr << "Error: --download requires an argument" << std::endl;
                return 1;
            }
            download_path = argv[i];
        } else if (arg == "--md5") {
            options.use_transactional_md5 = true;
        } else if (arg[0] != '-') {
            if (local_path.empty()) {
                local_path = arg;
            } else if (container.empty()) {
                container = arg;
            } else if (blob_name.empty()) {
                blob_name = arg;
            }
        }
    }

    if (local_path.empty() || container.empty() || blob_name.empty()) {
        std::cerr << "Error: local_file, container and blob are required" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    const char* connection_string = std::getenv("AZURE_STORAGE_CONNECTION_STRING");
    if (connection_string == nullptr) {
        std::cerr << "Error: AZURE_STORAGE_CONNECTION_STRING is not set" << std::endl;
        return 1;
    }

    if (auto valid = options.validate(); !valid) {
        print_error("Invalid options", valid.error());
        return 1;
    }

    auto client = blob_service_client::from_connection_string(connection_string);
    if (!client) {
        print_error("Failed to create client", client.error());
        return 1;
    }

    auto source = file_byte_source::open(local_path);
    if (!source) {
        print_error("Failed to open local file", source.error());
        return 1;
    }
    const uint64_t file_size = source.value()->size();

    options.on_progress = [](uint64_t transferred, std::optional<uint64_t> total) {
        std::cout << "\r  " << format_bytes(transferred);
        if (total) {
            std::cout << " / " << format_bytes(*total);
        }
        std::cout << std::flush;
    };

    auto blob = client.value()->get_block_blob_client(container, blob_name);
    std::cout << "Uploading " << local_path << " (" << format_bytes(file_size) << ") to "
              << blob.url() << std::endl;

    auto uploaded = blob.upload_from_stream(*source.value(),
                                            stream_descriptor::seekable_of(file_size),
                                            access_condition::none(), options);
    std::cout << std::endl;
    if (!uploaded) {
        print_error("Upload failed", uploaded.error());
        return 1;
    }

    std::cout << "Upload complete" << std::endl;
    std::cout << "  Mode:   " << (uploaded->single_shot ? "single request" : "blocks") << std::endl;
    std::cout << "  Blocks: " << uploaded->manifest.size() << std::endl;
    std::cout << "  ETag:   " << uploaded->etag << std::endl;
    if (uploaded->content_md5) {
        std::cout << "  MD5:    " << *uploaded->content_md5 << std::endl;
    }

    if (!download_path.empty()) {
        auto sink = file_byte_sink::open(download_path);
        if (!sink) {
            print_error("Failed to create download file", sink.error());
            return 1;
        }

        // Pin the download to the version just written
        auto downloaded = blob.download_to_sink(
            *sink.value(), access_condition::if_match_etag(uploaded->etag), options);
        std::cout << std::endl;
        if (!downloaded) {
            print_error("Download failed", downloaded.error());
            return 1;
        }
        std::cout << "Downloaded " << format_bytes(downloaded->bytes_downloaded) << " in "
                  << downloaded->range_count << " range(s) to " << download_path << std::endl;
    }

    auto stats = client.value()->statistics();
    std::cout << "Requests: " << stats.requests_sent << ", retries: " << stats.retries
              << ", failed: " << stats.failed_requests << std::endl;
    return 0;
}
