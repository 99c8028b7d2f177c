/**
 * @file multipart.cpp
 * @brief multipart/mixed writer and reader
 */

#include "kcenon/blob_transfer/http/multipart.h"
#include "kcenon/blob_transfer/core/blob_utils.h"

#include <charconv>
#include <utility>

namespace kcenon::blob_transfer {

namespace {

constexpr std::string_view crlf = "\r\n";

auto parse_header_line(std::string_view line, http_headers& headers) -> bool {
    auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return false;
    }
    headers[std::string(blob_utils::trim(line.substr(0, colon)))] =
        std::string(blob_utils::trim(line.substr(colon + 1)));
    return true;
}

auto malformed(multipart_parse_state state, std::string_view detail) -> unexpected {
    return unexpected{error{error_code::malformed_multipart,
        std::string(detail) + " (state " + to_string(state) + ")"}};
}

}  // namespace

// ============================================================================
// multipart_writer
// ============================================================================

multipart_writer::multipart_writer(std::string boundary)
    : boundary_(std::move(boundary)) {}

void multipart_writer::add_part(const http_headers& mime_headers,
                                std::string_view start_line,
                                const http_headers& headers,
                                std::string_view body) {
    buffer_.append("--").append(boundary_).append(crlf);
    for (const auto& [name, value] : mime_headers) {
        buffer_.append(name).append(": ").append(value).append(crlf);
    }
    buffer_.append(crlf);

    buffer_.append(start_line).append(crlf);
    for (const auto& [name, value] : headers) {
        buffer_.append(name).append(": ").append(value).append(crlf);
    }
    buffer_.append(crlf);

    if (!body.empty()) {
        buffer_.append(body).append(crlf);
    }
    ++parts_;
}

auto multipart_writer::finish() -> std::string {
    buffer_.append("--").append(boundary_).append("--").append(crlf);
    parts_ = 0;
    return std::exchange(buffer_, std::string{});
}

auto multipart_writer::content_type() const -> std::string {
    return "multipart/mixed; boundary=" + boundary_;
}

// ============================================================================
// multipart_reader
// ============================================================================

multipart_reader::multipart_reader(std::string boundary)
    : boundary_(std::move(boundary)) {}

auto multipart_reader::parse(std::string_view body, const part_handler& handler)
    -> result<void> {
    if (boundary_.empty()) {
        return unexpected{error{error_code::malformed_multipart, "Empty multipart boundary"}};
    }

    const std::string delimiter = "--" + boundary_;
    const std::string close_delimiter = delimiter + "--";

    state_ = multipart_parse_state::expect_boundary;
    multipart_part current;
    std::vector<std::string_view> body_lines;

    auto emit = [&]() -> result<void> {
        while (!body_lines.empty() && body_lines.back().empty()) {
            body_lines.pop_back();
        }
        for (std::size_t i = 0; i < body_lines.size(); ++i) {
            if (i > 0) current.body.append(crlf);
            current.body.append(body_lines[i]);
        }
        body_lines.clear();
        auto r = handler(std::move(current));
        current = multipart_part{};
        return r;
    };

    std::size_t pos = 0;
    while (pos < body.size() && state_ != multipart_parse_state::done) {
        auto nl = body.find('\n', pos);
        auto line = body.substr(pos, nl == std::string_view::npos ? std::string_view::npos
                                                                  : nl - pos);
        pos = nl == std::string_view::npos ? body.size() : nl + 1;
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        const bool is_close = line == close_delimiter;
        const bool is_delim = line == delimiter;

        switch (state_) {
            case multipart_parse_state::expect_boundary:
                // Preamble lines before the first delimiter are ignored
                if (is_close) {
                    state_ = multipart_parse_state::done;
                } else if (is_delim) {
                    state_ = multipart_parse_state::parse_part_headers;
                }
                break;

            case multipart_parse_state::parse_part_headers:
                if (is_delim || is_close) {
                    return malformed(state_, "Delimiter inside part headers");
                }
                if (line.empty()) {
                    state_ = multipart_parse_state::parse_status_line;
                } else if (!parse_header_line(line, current.mime_headers)) {
                    return malformed(state_, "Invalid part header '" + std::string(line) + "'");
                }
                break;

            case multipart_parse_state::parse_status_line:
                if (is_delim || is_close) {
                    return malformed(state_, "Part without embedded message");
                }
                if (!line.empty()) {
                    current.start_line = std::string(line);
                    state_ = multipart_parse_state::parse_headers;
                }
                break;

            case multipart_parse_state::parse_headers:
                if (is_delim || is_close) {
                    if (auto r = emit(); !r.has_value()) return r;
                    state_ = is_close ? multipart_parse_state::done
                                      : multipart_parse_state::parse_part_headers;
                } else if (line.empty()) {
                    state_ = multipart_parse_state::parse_body;
                } else if (!parse_header_line(line, current.headers)) {
                    return malformed(state_, "Invalid header '" + std::string(line) + "'");
                }
                break;

            case multipart_parse_state::parse_body:
                if (is_delim || is_close) {
                    if (auto r = emit(); !r.has_value()) return r;
                    state_ = is_close ? multipart_parse_state::done
                                      : multipart_parse_state::parse_part_headers;
                } else {
                    body_lines.push_back(line);
                }
                break;

            case multipart_parse_state::done:
                break;
        }
    }

    if (state_ != multipart_parse_state::done) {
        return malformed(state_, "Missing closing delimiter");
    }
    return {};
}

auto multipart_reader::parse_all(std::string_view body)
    -> result<std::vector<multipart_part>> {
    std::vector<multipart_part> parts;
    auto r = parse(body, [&parts](multipart_part&& part) -> result<void> {
        parts.push_back(std::move(part));
        return {};
    });
    if (!r.has_value()) {
        return unexpected{r.error()};
    }
    return parts;
}

// ============================================================================
// Helpers
// ============================================================================

auto extract_boundary(std::string_view content_type) -> std::optional<std::string> {
    auto lower = blob_utils::to_lower(std::string(content_type));
    auto key = lower.find("boundary=");
    if (key == std::string::npos) {
        return std::nullopt;
    }
    auto value = content_type.substr(key + 9);
    auto end = value.find(';');
    value = value.substr(0, end);
    auto boundary = std::string(blob_utils::trim(value));
    if (boundary.size() >= 2 && boundary.front() == '"' && boundary.back() == '"') {
        boundary = boundary.substr(1, boundary.size() - 2);
    }
    if (boundary.empty()) {
        return std::nullopt;
    }
    return boundary;
}

auto parse_status_line(std::string_view line) -> std::optional<std::pair<int, std::string>> {
    if (line.substr(0, 5) != "HTTP/") {
        return std::nullopt;
    }
    auto sp = line.find(' ');
    if (sp == std::string_view::npos) {
        return std::nullopt;
    }
    auto rest = line.substr(sp + 1);
    auto sp2 = rest.find(' ');
    auto code_text = rest.substr(0, sp2);

    int status = 0;
    auto [ptr, ec] = std::from_chars(code_text.data(), code_text.data() + code_text.size(), status);
    if (ec != std::errc{} || ptr != code_text.data() + code_text.size() ||
        status < 100 || status > 599) {
        return std::nullopt;
    }

    std::string reason;
    if (sp2 != std::string_view::npos) {
        reason = std::string(blob_utils::trim(rest.substr(sp2 + 1)));
    }
    return std::make_pair(status, reason);
}

}  // namespace kcenon::blob_transfer
