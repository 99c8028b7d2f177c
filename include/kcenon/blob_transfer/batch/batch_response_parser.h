/**
 * @file batch_response_parser.h
 * @brief Demultiplexes a batch response into per-operation outcomes
 */

#ifndef KCENON_BLOB_TRANSFER_BATCH_BATCH_RESPONSE_PARSER_H
#define KCENON_BLOB_TRANSFER_BATCH_BATCH_RESPONSE_PARSER_H

#include "batch_result.h"
#include "kcenon/blob_transfer/core/types.h"
#include "kcenon/blob_transfer/http/http_types.h"
#include "kcenon/blob_transfer/http/multipart.h"

#include <cstddef>
#include <optional>
#include <string_view>

namespace kcenon::blob_transfer {

/**
 * @brief Parser for the multipart body of a 202 batch response
 *
 * Parts are consumed in wire order. Each part's Content-ID is its
 * operation index, which must be strictly greater than the previous one
 * (gaps are allowed) and below the number of operations sent. Failed
 * parts must yield a status, an error code and a message. Any violation
 * fails the whole parse with a protocol error.
 *
 * A parser instance handles one response.
 */
class batch_response_parser {
public:
    explicit batch_response_parser(std::size_t operation_count);

    [[nodiscard]] auto parse(const http_response& response) -> result<batch_outcome>;

    [[nodiscard]] auto parse(std::string_view content_type, std::string_view body)
        -> result<batch_outcome>;

    /**
     * @brief Multipart reader state where the last parse stopped
     */
    [[nodiscard]] auto state() const noexcept -> multipart_parse_state { return state_; }

private:
    /**
     * @brief Monotonic index check applied to every part
     */
    [[nodiscard]] auto accept(std::size_t index) -> result<void>;

    [[nodiscard]] auto handle_part(multipart_part&& part, batch_outcome& outcome)
        -> result<void>;

    std::size_t operation_count_;
    std::optional<std::size_t> last_index_;
    multipart_parse_state state_ = multipart_parse_state::expect_boundary;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_BATCH_BATCH_RESPONSE_PARSER_H
