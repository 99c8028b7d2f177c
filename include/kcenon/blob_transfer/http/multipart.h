/**
 * @file multipart.h
 * @brief multipart/mixed codec for embedded HTTP messages
 *
 * Each part carries MIME headers, followed by one embedded HTTP message
 * (a request line or a status line, its headers and an optional body).
 */

#ifndef KCENON_BLOB_TRANSFER_HTTP_MULTIPART_H
#define KCENON_BLOB_TRANSFER_HTTP_MULTIPART_H

#include "http_types.h"
#include "kcenon/blob_transfer/core/types.h"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::blob_transfer {

/**
 * @brief One part of a multipart/mixed body
 */
struct multipart_part {
    http_headers mime_headers;
    std::string start_line;  ///< "DELETE /c/b HTTP/1.1" or "HTTP/1.1 202 Accepted"
    http_headers headers;
    std::string body;
};

/**
 * @brief Serializes parts into a multipart/mixed body
 */
class multipart_writer {
public:
    explicit multipart_writer(std::string boundary);

    void add_part(const http_headers& mime_headers,
                  std::string_view start_line,
                  const http_headers& headers,
                  std::string_view body = {});

    /**
     * @brief Append the closing delimiter and return the body
     *
     * The writer is left empty afterwards.
     */
    [[nodiscard]] auto finish() -> std::string;

    [[nodiscard]] auto boundary() const -> const std::string& { return boundary_; }
    [[nodiscard]] auto content_type() const -> std::string;
    [[nodiscard]] auto part_count() const noexcept -> std::size_t { return parts_; }

private:
    std::string boundary_;
    std::string buffer_;
    std::size_t parts_ = 0;
};

/**
 * @brief Reader states
 */
enum class multipart_parse_state {
    expect_boundary,
    parse_part_headers,
    parse_status_line,
    parse_headers,
    parse_body,
    done,
};

[[nodiscard]] constexpr auto to_string(multipart_parse_state state) -> const char* {
    switch (state) {
        case multipart_parse_state::expect_boundary: return "expect_boundary";
        case multipart_parse_state::parse_part_headers: return "parse_part_headers";
        case multipart_parse_state::parse_status_line: return "parse_status_line";
        case multipart_parse_state::parse_headers: return "parse_headers";
        case multipart_parse_state::parse_body: return "parse_body";
        case multipart_parse_state::done: return "done";
        default: return "unknown";
    }
}

/**
 * @brief Line-oriented multipart/mixed reader
 *
 * Accepts CRLF and bare LF line endings. Each completed part is handed to
 * the handler in wire order; a handler error stops the parse and is
 * returned unchanged.
 */
class multipart_reader {
public:
    using part_handler = std::function<result<void>(multipart_part&&)>;

    explicit multipart_reader(std::string boundary);

    [[nodiscard]] auto parse(std::string_view body, const part_handler& handler) -> result<void>;

    /**
     * @brief Parse and collect all parts
     */
    [[nodiscard]] auto parse_all(std::string_view body) -> result<std::vector<multipart_part>>;

    [[nodiscard]] auto state() const noexcept -> multipart_parse_state { return state_; }

private:
    std::string boundary_;
    multipart_parse_state state_ = multipart_parse_state::expect_boundary;
};

/**
 * @brief Extract the boundary parameter of a multipart Content-Type
 */
[[nodiscard]] auto extract_boundary(std::string_view content_type) -> std::optional<std::string>;

/**
 * @brief Parse "HTTP/1.1 202 Accepted" into status and reason
 */
[[nodiscard]] auto parse_status_line(std::string_view line)
    -> std::optional<std::pair<int, std::string>>;

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_HTTP_MULTIPART_H
