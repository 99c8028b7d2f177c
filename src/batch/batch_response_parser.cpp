/**
 * @file batch_response_parser.cpp
 * @brief Batch response demultiplexing
 */

#include "kcenon/blob_transfer/batch/batch_response_parser.h"
#include "kcenon/blob_transfer/core/blob_utils.h"
#include "kcenon/blob_transfer/core/logging.h"

#include <charconv>

namespace kcenon::blob_transfer {

namespace {

auto parse_index(std::string_view text) -> std::optional<std::size_t> {
    text = blob_utils::trim(text);
    std::size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

batch_response_parser::batch_response_parser(std::size_t operation_count)
    : operation_count_(operation_count) {}

auto batch_response_parser::parse(const http_response& response) -> result<batch_outcome> {
    auto content_type = response.get_header("Content-Type");
    if (!content_type) {
        return unexpected{error{error_code::malformed_response,
            "Batch response has no Content-Type"}};
    }
    return parse(*content_type, response.body_string());
}

auto batch_response_parser::parse(std::string_view content_type, std::string_view body)
    -> result<batch_outcome> {
    auto boundary = extract_boundary(content_type);
    if (!boundary) {
        return unexpected{error{error_code::malformed_response,
            "No boundary in batch response Content-Type '" + std::string(content_type) + "'"}};
    }

    batch_outcome outcome;
    multipart_reader reader(*boundary);
    auto parsed = reader.parse(body, [&](multipart_part&& part) {
        return handle_part(std::move(part), outcome);
    });
    state_ = reader.state();
    if (!parsed.has_value()) {
        BT_LOG_WARN(log_category::batch, "Batch response rejected: " + parsed.error().message);
        return unexpected{parsed.error()};
    }

    BT_LOG_DEBUG(log_category::batch,
                 "Parsed batch response: " + std::to_string(outcome.successes.size()) +
                     " succeeded, " + std::to_string(outcome.errors.size()) + " failed");
    return outcome;
}

auto batch_response_parser::accept(std::size_t index) -> result<void> {
    if (index >= operation_count_) {
        return unexpected{error{error_code::protocol_error,
            "Batch response names operation " + std::to_string(index) + " but only " +
            std::to_string(operation_count_) + " were sent"}};
    }
    if (last_index_ && index <= *last_index_) {
        return unexpected{error{error_code::batch_index_out_of_order,
            "Batch operation " + std::to_string(index) + " follows operation " +
            std::to_string(*last_index_)}};
    }
    last_index_ = index;
    return {};
}

auto batch_response_parser::handle_part(multipart_part&& part, batch_outcome& outcome)
    -> result<void> {
    auto content_id = part.mime_headers.find("Content-ID");
    if (content_id == part.mime_headers.end()) {
        return unexpected{error{error_code::protocol_error,
            "Batch response part without Content-ID"}};
    }
    auto index = parse_index(content_id->second);
    if (!index) {
        return unexpected{error{error_code::protocol_error,
            "Invalid Content-ID '" + content_id->second + "'"}};
    }
    if (auto accepted = accept(*index); !accepted.has_value()) {
        return accepted;
    }

    auto status = parse_status_line(part.start_line);
    if (!status) {
        return unexpected{error{error_code::malformed_multipart,
            "Invalid status line '" + part.start_line + "' for operation " +
            std::to_string(*index)}};
    }
    const auto [code, reason] = *status;

    if (code >= 200 && code < 300) {
        outcome.successes.push_back({*index, code, std::move(part.headers)});
        return {};
    }

    std::string error_code_text;
    if (auto header = part.headers.find("x-ms-error-code"); header != part.headers.end()) {
        error_code_text = std::string(blob_utils::trim(header->second));
    }
    if (error_code_text.empty()) {
        error_code_text = blob_utils::extract_xml_element(part.body, "Code").value_or("");
    }

    std::string message = blob_utils::extract_xml_element(part.body, "Message").value_or("");
    if (message.empty()) {
        message = std::string(blob_utils::trim(reason));
    }

    if (error_code_text.empty() || message.empty()) {
        return unexpected{error{error_code::missing_error_detail,
            "Failed batch operation " + std::to_string(*index) + " (status " +
            std::to_string(code) + ") has no " +
            (error_code_text.empty() ? "error code" : "error message")}};
    }

    outcome.errors.push_back({*index, code, std::move(error_code_text),
                              blob_utils::xml_unescape(message)});
    return {};
}

}  // namespace kcenon::blob_transfer
