/**
 * @file block_blob_client.cpp
 * @brief Block blob wire operations
 */

#include "kcenon/blob_transfer/blob/block_blob_client.h"
#include "kcenon/blob_transfer/core/blob_utils.h"
#include "kcenon/blob_transfer/core/checksum.h"
#include "kcenon/blob_transfer/core/logging.h"
#include "kcenon/blob_transfer/stream/blob_write_stream.h"
#include "kcenon/blob_transfer/transfer/transfer_scheduler.h"

#include <charconv>
#include <system_error>

namespace kcenon::blob_transfer {

namespace {

auto parse_u64(std::string_view text) -> std::optional<uint64_t> {
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto to_body(std::span<const std::byte> data) -> std::vector<std::byte> {
    return std::vector<std::byte>(data.begin(), data.end());
}

auto parse_block_items(std::string_view section, bool committed)
    -> result<std::vector<block_list_item>> {
    std::vector<block_list_item> items;
    for (const auto& block : blob_utils::extract_xml_elements(section, "Block")) {
        auto name = blob_utils::extract_xml_element(block, "Name");
        auto size_text = blob_utils::extract_xml_element(block, "Size");
        if (!name || !size_text) {
            return unexpected{error{error_code::malformed_response,
                "Block entry without Name or Size"}};
        }
        auto size = parse_u64(*size_text);
        if (!size) {
            return unexpected{error{error_code::malformed_response,
                "Invalid block size '" + *size_text + "'"}};
        }
        items.push_back({blob_utils::xml_unescape(*name), *size, committed});
    }
    return items;
}

auto validate_metadata(const std::map<std::string, std::string>& metadata) -> result<void> {
    for (const auto& [name, value] : metadata) {
        if (name.empty() || blob_utils::trim(value).empty()) {
            return unexpected{error{error_code::invalid_metadata,
                "Metadata '" + name + "' has an empty name or value"}};
        }
    }
    return {};
}

}  // namespace

// ============================================================================
// Response parsing
// ============================================================================

auto parse_blob_properties(const http_response& response) -> blob_properties {
    blob_properties props;
    if (auto length = response.get_header("Content-Length")) {
        props.content_length = parse_u64(*length).value_or(0);
    }
    props.etag = response.get_header("ETag").value_or("");
    if (auto modified = response.get_header("Last-Modified")) {
        props.last_modified = blob_utils::parse_rfc1123(*modified);
    }
    props.content_md5 = response.get_header("Content-MD5");
    props.content_type = response.get_header("Content-Type");
    props.content_encoding = response.get_header("Content-Encoding");
    props.content_language = response.get_header("Content-Language");
    props.content_disposition = response.get_header("Content-Disposition");
    props.cache_control = response.get_header("Cache-Control");
    if (auto tier = response.get_header("x-ms-access-tier")) {
        props.access_tier = parse_blob_tier(*tier);
    }
    if (auto type = response.get_header("x-ms-blob-type")) {
        props.blob_type = *type;
    }

    constexpr std::string_view meta_prefix = "x-ms-meta-";
    for (const auto& [name, value] : response.headers) {
        auto lower = blob_utils::to_lower(name);
        if (lower.starts_with(meta_prefix)) {
            props.metadata[name.substr(meta_prefix.size())] = value;
        }
    }
    props.copy = parse_copy_state(response);
    return props;
}

auto parse_copy_state(const http_response& response) -> std::optional<copy_state> {
    auto id = response.get_header("x-ms-copy-id");
    if (!id) {
        return std::nullopt;
    }

    copy_state state;
    state.copy_id = *id;
    if (auto status = response.get_header("x-ms-copy-status")) {
        if (auto parsed = parse_copy_status(*status)) {
            state.status = *parsed;
        }
    }
    state.source = response.get_header("x-ms-copy-source").value_or("");
    if (auto progress = response.get_header("x-ms-copy-progress")) {
        // "<bytes copied>/<total bytes>"
        std::string_view text(*progress);
        if (auto slash = text.find('/'); slash != std::string_view::npos) {
            state.bytes_copied = parse_u64(text.substr(0, slash));
            state.total_bytes = parse_u64(text.substr(slash + 1));
        }
    }
    state.status_description = response.get_header("x-ms-copy-status-description");
    return state;
}

auto parse_block_list(const std::string& xml) -> result<block_list> {
    if (xml.find("<BlockList") == std::string::npos) {
        return unexpected{error{error_code::malformed_response, "Missing <BlockList> element"}};
    }

    block_list list;
    if (auto committed = blob_utils::extract_xml_element(xml, "CommittedBlocks")) {
        auto items = parse_block_items(*committed, true);
        if (!items.has_value()) {
            return unexpected{items.error()};
        }
        list.committed_blocks = std::move(items.value());
    }
    if (auto uncommitted = blob_utils::extract_xml_element(xml, "UncommittedBlocks")) {
        auto items = parse_block_items(*uncommitted, false);
        if (!items.has_value()) {
            return unexpected{items.error()};
        }
        list.uncommitted_blocks = std::move(items.value());
    }
    return list;
}

// ============================================================================
// block_blob_client
// ============================================================================

block_blob_client::block_blob_client(std::shared_ptr<service_context> context,
                                     std::string container,
                                     std::string blob)
    : context_(std::move(context)), container_(std::move(container)), blob_(std::move(blob)) {}

auto block_blob_client::url() const -> std::string {
    std::string query;
    if (!snapshot_.empty()) {
        query = "snapshot=" + blob_utils::url_encode(snapshot_);
    }
    return context_->resource_url(storage_location::primary, container_, blob_, query);
}

auto block_blob_client::with_snapshot(std::string snapshot) const -> block_blob_client {
    block_blob_client copy = *this;
    copy.snapshot_ = std::move(snapshot);
    return copy;
}

auto block_blob_client::resolve_options(options_ref options) const -> blob_request_options {
    if (options) {
        return *options;
    }
    return context_->config().default_request_options;
}

auto block_blob_client::retry_for(const blob_request_options& options) const -> retry_policy {
    return options.retry.value_or(context_->config().retry);
}

auto block_blob_client::make_request(http_method method, storage_location location,
                                     const std::string& query) const -> http_request {
    std::string full_query = query;
    if (!snapshot_.empty()) {
        if (!full_query.empty()) {
            full_query += "&";
        }
        full_query += "snapshot=" + blob_utils::url_encode(snapshot_);
    }

    http_request request;
    request.method = method;
    request.url = context_->resource_url(location, container_, blob_, full_query);
    return request;
}

auto block_blob_client::put_block(const std::string& block_id,
                                  std::span<const std::byte> data,
                                  options_ref options) const -> result<void> {
    auto opts = resolve_options(options);
    if (auto valid = block_manifest::validate_block_id(block_id); !valid.has_value()) {
        return valid;
    }
    if (data.size() > max_block_size) {
        return unexpected{error{error_code::invalid_block_size,
            "Block of " + std::to_string(data.size()) + " bytes exceeds the maximum"}};
    }

    std::optional<std::string> md5;
    std::optional<std::string> crc64;
    if (opts.use_transactional_md5) {
        auto digest = checksum::md5_base64(data);
        if (!digest.has_value()) {
            return unexpected{digest.error()};
        }
        md5 = std::move(digest.value());
    } else if (opts.use_transactional_crc64) {
        crc64 = checksum::crc64_base64(checksum::crc64(data));
    }

    const auto query = "comp=block&blockid=" + blob_utils::url_encode(block_id);
    auto response = context_->execute(
        [&](storage_location location) {
            auto request = make_request(http_method::put, location, query);
            request.body = to_body(data);
            if (md5) request.set_header("Content-MD5", *md5);
            if (crc64) request.set_header("x-ms-content-crc64", *crc64);
            return request;
        },
        {201}, retry_for(opts));
    if (!response.has_value()) {
        return unexpected{response.error()};
    }
    return {};
}

auto block_blob_client::put_block_list(const block_manifest& manifest,
                                       const access_condition& condition,
                                       const std::optional<std::string>& content_md5,
                                       options_ref options) const -> result<std::string> {
    auto opts = resolve_options(options);
    if (auto valid = manifest.validate(); !valid.has_value()) {
        return unexpected{valid.error()};
    }

    const auto body = blob_utils::to_bytes(manifest.to_xml());
    auto response = context_->execute(
        [&](storage_location location) {
            auto request = make_request(http_method::put, location, "comp=blocklist");
            request.body = body;
            request.set_header("Content-Type", "application/xml");
            if (content_md5) request.set_header("x-ms-blob-content-md5", *content_md5);
            condition.apply_to(request.headers);
            return request;
        },
        {201}, retry_for(opts));
    if (!response.has_value()) {
        return unexpected{response.error()};
    }

    BT_LOG_DEBUG(log_category::transfer,
                 "Committed " + std::to_string(manifest.size()) + " blocks to " + blob_);
    return response.value().get_header("ETag").value_or("");
}

auto block_blob_client::get_block_list(block_listing_filter filter,
                                       const access_condition& condition,
                                       options_ref options) const -> result<block_list> {
    auto opts = resolve_options(options);
    const auto query = std::string("comp=blocklist&blocklisttype=") + to_string(filter);
    auto response = context_->execute(
        [&](storage_location location) {
            auto request = make_request(http_method::get, location, query);
            condition.apply_read_conditions_to(request.headers);
            return request;
        },
        {200}, retry_for(opts), opts.location);
    if (!response.has_value()) {
        return unexpected{response.error()};
    }
    return parse_block_list(response.value().body_string());
}

auto block_blob_client::put_blob(std::span<const std::byte> data,
                                 const access_condition& condition,
                                 options_ref options) const -> result<std::string> {
    auto opts = resolve_options(options);
    if (data.size() > max_single_shot_threshold) {
        return unexpected{error{error_code::invalid_argument,
            "Put Blob payload of " + std::to_string(data.size()) + " bytes is too large"}};
    }

    std::optional<std::string> md5;
    std::optional<std::string> crc64;
    if (opts.store_content_md5 || opts.use_transactional_md5) {
        auto digest = checksum::md5_base64(data);
        if (!digest.has_value()) {
            return unexpected{digest.error()};
        }
        md5 = std::move(digest.value());
    }
    if (opts.use_transactional_crc64) {
        crc64 = checksum::crc64_base64(checksum::crc64(data));
    }

    auto response = context_->execute(
        [&](storage_location location) {
            auto request = make_request(http_method::put, location);
            request.body = to_body(data);
            request.set_header("x-ms-blob-type", "BlockBlob");
            if (md5) request.set_header("Content-MD5", *md5);
            if (crc64) request.set_header("x-ms-content-crc64", *crc64);
            condition.apply_to(request.headers);
            return request;
        },
        {201}, retry_for(opts));
    if (!response.has_value()) {
        return unexpected{response.error()};
    }
    return response.value().get_header("ETag").value_or("");
}

// ============================================================================
// Uploads
// ============================================================================

auto block_blob_client::upload_from_stream(byte_source& source,
                                           const stream_descriptor& descriptor,
                                           const access_condition& condition,
                                           options_ref options) const
    -> result<upload_summary> {
    transfer_scheduler scheduler(*this, resolve_options(options));
    return scheduler.upload(source, descriptor, condition);
}

auto block_blob_client::upload_from_bytes(std::span<const std::byte> data,
                                          const access_condition& condition,
                                          options_ref options) const
    -> result<upload_summary> {
    memory_byte_source source(to_body(data));
    return upload_from_stream(source, stream_descriptor::seekable_of(data.size()), condition,
                              options);
}

auto block_blob_client::upload_text(std::string_view text,
                                    const access_condition& condition,
                                    options_ref options) const -> result<upload_summary> {
    auto bytes = blob_utils::to_bytes(text);
    return upload_from_bytes(bytes, condition, options);
}

auto block_blob_client::upload_from_file(const std::filesystem::path& path,
                                         const access_condition& condition,
                                         options_ref options) const -> result<upload_summary> {
    auto source = file_byte_source::open(path);
    if (!source.has_value()) {
        return unexpected{source.error()};
    }
    const uint64_t size = source.value()->size();
    return upload_from_stream(*source.value(), stream_descriptor::seekable_of(size), condition,
                              options);
}

auto block_blob_client::open_write(const access_condition& condition,
                                   options_ref options) const
    -> result<std::unique_ptr<blob_write_stream>> {
    auto opts = resolve_options(options);
    if (auto valid = opts.validate(); !valid.has_value()) {
        return unexpected{valid.error()};
    }

    if (!condition.empty()) {
        access_condition existing = condition;
        if (condition.is_if_not_exists()) {
            // Existence is checked without the condition; a match would read as 304
            existing.if_none_match.reset();
        }
        auto props = get_properties(existing, opts);
        if (props.has_value()) {
            if (condition.is_if_not_exists()) {
                return unexpected{error{error_code::conflict,
                    "Blob " + blob_ + " already exists"}};
            }
        } else {
            const auto& err = props.error();
            const bool tolerated =
                (err.code == error_code::blob_not_found && !condition.if_match) ||
                err.code == error_code::authentication_failed;
            if (!tolerated) {
                return unexpected{err};
            }
            BT_LOG_DEBUG(log_category::stream,
                         "open_write precheck ignored: " + err.message);
        }
    }

    return blob_write_stream::create(*this, condition, std::move(opts));
}

// ============================================================================
// Downloads
// ============================================================================

auto block_blob_client::download_to_sink(byte_sink& sink,
                                         const access_condition& condition,
                                         options_ref options) const
    -> result<download_summary> {
    transfer_scheduler scheduler(*this, resolve_options(options));
    return scheduler.download(sink, condition);
}

auto block_blob_client::download_to_bytes(const access_condition& condition,
                                          options_ref options) const
    -> result<std::vector<std::byte>> {
    memory_byte_sink sink;
    auto summary = download_to_sink(sink, condition, options);
    if (!summary.has_value()) {
        return unexpected{summary.error()};
    }
    return sink.release();
}

auto block_blob_client::download_text(const access_condition& condition,
                                      options_ref options) const -> result<std::string> {
    auto bytes = download_to_bytes(condition, options);
    if (!bytes.has_value()) {
        return unexpected{bytes.error()};
    }
    return std::string(blob_utils::as_string_view(bytes.value()));
}

auto block_blob_client::download_to_file(const std::filesystem::path& path,
                                         const access_condition& condition,
                                         options_ref options) const
    -> result<download_summary> {
    auto sink = file_byte_sink::open(path);
    if (!sink.has_value()) {
        return unexpected{sink.error()};
    }

    auto summary = download_to_sink(*sink.value(), condition, options);
    if (!summary.has_value()) {
        sink.value().reset();
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            BT_LOG_WARN(log_category::client,
                        "Cannot remove partial download " + path.string() + ": " + ec.message());
        }
    }
    return summary;
}

auto block_blob_client::download_range(uint64_t offset, uint64_t length,
                                       const access_condition& condition,
                                       options_ref options) const
    -> result<std::vector<std::byte>> {
    auto opts = resolve_options(options);
    if (length == 0) {
        return std::vector<std::byte>{};
    }

    const bool want_md5 = opts.use_transactional_md5 && length <= max_transactional_md5_range;
    const auto range = "bytes=" + std::to_string(offset) + "-" +
                       std::to_string(offset + length - 1);

    auto response = context_->execute(
        [&](storage_location location) {
            auto request = make_request(http_method::get, location);
            request.set_header("x-ms-range", range);
            if (want_md5) request.set_header("x-ms-range-get-content-md5", "true");
            condition.apply_read_conditions_to(request.headers);
            return request;
        },
        {200, 206}, retry_for(opts), opts.location);
    if (!response.has_value()) {
        return unexpected{response.error()};
    }

    auto& body = response.value().body;
    if (want_md5) {
        if (auto expected = response.value().get_header("Content-MD5")) {
            if (!checksum::verify_md5(body, *expected)) {
                return unexpected{error{error_code::checksum_mismatch,
                    "Range " + range + " of " + blob_ + " failed MD5 validation"}};
            }
        }
    }
    return std::move(body);
}

// ============================================================================
// Properties and management
// ============================================================================

auto block_blob_client::get_properties(const access_condition& condition,
                                       options_ref options) const -> result<blob_properties> {
    auto opts = resolve_options(options);
    auto response = context_->execute(
        [&](storage_location location) {
            auto request = make_request(http_method::head, location);
            condition.apply_read_conditions_to(request.headers);
            return request;
        },
        {200}, retry_for(opts), opts.location);
    if (!response.has_value()) {
        return unexpected{response.error()};
    }
    return parse_blob_properties(response.value());
}

auto block_blob_client::exists(options_ref options) const -> result<bool> {
    auto props = get_properties({}, options);
    if (props.has_value()) {
        return true;
    }
    if (props.error().code == error_code::blob_not_found) {
        return false;
    }
    return unexpected{props.error()};
}

auto block_blob_client::set_metadata(const std::map<std::string, std::string>& metadata,
                                     const access_condition& condition,
                                     options_ref options) const -> result<void> {
    auto opts = resolve_options(options);
    if (auto valid = validate_metadata(metadata); !valid.has_value()) {
        return valid;
    }

    auto response = context_->execute(
        [&](storage_location location) {
            auto request = make_request(http_method::put, location, "comp=metadata");
            for (const auto& [name, value] : metadata) {
                request.set_header("x-ms-meta-" + name, value);
            }
            condition.apply_to(request.headers);
            return request;
        },
        {200}, retry_for(opts));
    if (!response.has_value()) {
        return unexpected{response.error()};
    }
    return {};
}

auto block_blob_client::delete_blob(delete_snapshots_option snapshots,
                                    const access_condition& condition,
                                    options_ref options) const -> result<void> {
    auto opts = resolve_options(options);
    auto response = context_->execute(
        [&](storage_location location) {
            auto request = make_request(http_method::del, location);
            if (const char* value = to_header_value(snapshots)) {
                request.set_header("x-ms-delete-snapshots", value);
            }
            condition.apply_to(request.headers);
            return request;
        },
        {202}, retry_for(opts));
    if (!response.has_value()) {
        return unexpected{response.error()};
    }
    return {};
}

auto block_blob_client::set_tier(standard_blob_tier tier,
                                 std::optional<rehydrate_priority> priority,
                                 options_ref options) const -> result<void> {
    auto opts = resolve_options(options);
    auto response = context_->execute(
        [&](storage_location location) {
            auto request = make_request(http_method::put, location, "comp=tier");
            request.set_header("x-ms-access-tier", to_string(tier));
            if (priority) request.set_header("x-ms-rehydrate-priority", to_string(*priority));
            return request;
        },
        {200, 202}, retry_for(opts));
    if (!response.has_value()) {
        return unexpected{response.error()};
    }
    return {};
}

auto block_blob_client::set_properties(const blob_http_headers& headers,
                                       const access_condition& condition,
                                       options_ref options) const -> result<std::string> {
    auto opts = resolve_options(options);
    auto response = context_->execute(
        [&](storage_location location) {
            auto request = make_request(http_method::put, location, "comp=properties");
            if (headers.content_type) {
                request.set_header("x-ms-blob-content-type", *headers.content_type);
            }
            if (headers.content_encoding) {
                request.set_header("x-ms-blob-content-encoding", *headers.content_encoding);
            }
            if (headers.content_language) {
                request.set_header("x-ms-blob-content-language", *headers.content_language);
            }
            if (headers.content_disposition) {
                request.set_header("x-ms-blob-content-disposition", *headers.content_disposition);
            }
            if (headers.cache_control) {
                request.set_header("x-ms-blob-cache-control", *headers.cache_control);
            }
            if (headers.content_md5) {
                request.set_header("x-ms-blob-content-md5", *headers.content_md5);
            }
            condition.apply_to(request.headers);
            return request;
        },
        {200}, retry_for(opts));
    if (!response.has_value()) {
        return unexpected{response.error()};
    }
    return response.value().get_header("ETag").value_or("");
}

// ============================================================================
// Snapshots and copies
// ============================================================================

auto block_blob_client::create_snapshot(const std::map<std::string, std::string>& metadata,
                                        const access_condition& condition,
                                        options_ref options) const -> result<std::string> {
    auto opts = resolve_options(options);
    if (auto valid = validate_metadata(metadata); !valid.has_value()) {
        return unexpected{valid.error()};
    }

    auto response = context_->execute(
        [&](storage_location location) {
            auto request = make_request(http_method::put, location, "comp=snapshot");
            for (const auto& [name, value] : metadata) {
                request.set_header("x-ms-meta-" + name, value);
            }
            condition.apply_read_conditions_to(request.headers);
            return request;
        },
        {201}, retry_for(opts));
    if (!response.has_value()) {
        return unexpected{response.error()};
    }

    auto snapshot = response.value().get_header("x-ms-snapshot");
    if (!snapshot) {
        return unexpected{error{error_code::malformed_response,
            "Snapshot response without x-ms-snapshot"}};
    }
    BT_LOG_DEBUG(log_category::client, "Snapshot " + *snapshot + " of " + blob_);
    return *snapshot;
}

auto block_blob_client::start_copy(const std::string& source_url,
                                   const access_condition& source_condition,
                                   const access_condition& condition,
                                   const std::map<std::string, std::string>& metadata,
                                   options_ref options) const -> result<copy_state> {
    auto opts = resolve_options(options);
    if (auto valid = validate_metadata(metadata); !valid.has_value()) {
        return unexpected{valid.error()};
    }

    auto response = context_->execute(
        [&](storage_location location) {
            auto request = make_request(http_method::put, location);
            request.set_header("x-ms-copy-source", source_url);
            for (const auto& [name, value] : metadata) {
                request.set_header("x-ms-meta-" + name, value);
            }
            source_condition.apply_source_conditions_to(request.headers);
            condition.apply_to(request.headers);
            return request;
        },
        {202}, retry_for(opts));
    if (!response.has_value()) {
        return unexpected{response.error()};
    }

    auto state = parse_copy_state(response.value());
    if (!state) {
        return unexpected{error{error_code::malformed_response,
            "Copy response without x-ms-copy-id"}};
    }
    if (state->source.empty()) {
        state->source = source_url;
    }
    BT_LOG_DEBUG(log_category::client, "Copy " + state->copy_id + " into " + blob_ + " is " +
                                           to_string(state->status));
    return std::move(*state);
}

auto block_blob_client::start_copy(const block_blob_client& source,
                                   const access_condition& source_condition,
                                   const access_condition& condition,
                                   const std::map<std::string, std::string>& metadata,
                                   options_ref options) const -> result<copy_state> {
    return start_copy(source.url(), source_condition, condition, metadata, options);
}

auto block_blob_client::abort_copy(const std::string& copy_id,
                                   const access_condition& condition,
                                   options_ref options) const -> result<void> {
    auto opts = resolve_options(options);
    if (copy_id.empty()) {
        return unexpected{error{error_code::invalid_argument, "Copy id must not be empty"}};
    }

    const auto query = "comp=copy&copyid=" + blob_utils::url_encode(copy_id);
    auto response = context_->execute(
        [&](storage_location location) {
            auto request = make_request(http_method::put, location, query);
            request.set_header("x-ms-copy-action", "abort");
            condition.apply_read_conditions_to(request.headers);
            return request;
        },
        {204}, retry_for(opts));
    if (!response.has_value()) {
        return unexpected{response.error()};
    }
    return {};
}

}  // namespace kcenon::blob_transfer
