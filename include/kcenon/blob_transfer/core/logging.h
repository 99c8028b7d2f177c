// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include "../config/feature_flags.h"

#if BLOB_TRANSFER_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::blob_transfer {

/**
 * @brief Log categories for blob transfer system
 */
struct log_category {
    static constexpr std::string_view client = "blob_transfer.client";
    static constexpr std::string_view transfer = "blob_transfer.transfer";
    static constexpr std::string_view stream = "blob_transfer.stream";
    static constexpr std::string_view batch = "blob_transfer.batch";
    static constexpr std::string_view checksum = "blob_transfer.checksum";
    static constexpr std::string_view http = "blob_transfer.http";
    static constexpr std::string_view auth = "blob_transfer.auth";
};

/**
 * @brief Log levels for blob transfer system
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

/**
 * @brief Convert log level to string
 */
inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Configuration for secret masking
 *
 * Secrets are SAS signatures (the sig= query value), SharedKey signatures
 * in Authorization headers, and AccountKey= values of connection strings.
 */
struct masking_config {
    bool mask_secrets = true;
    bool mask_urls = false;
    std::string mask_char = "*";

    static masking_config all_masked() {
        return {true, true, "*"};
    }

    static masking_config none() {
        return {false, false, "*"};
    }
};

/**
 * @brief Utility class for masking credentials in log messages
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config{})
        : config_(std::move(config)) {}

    /**
     * @brief Mask sensitive information in a string
     */
    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_secrets && !config_.mask_urls) {
            return input;
        }

        std::string result = input;

        if (config_.mask_secrets) {
            static const std::regex sas_sig(R"((sig=)[^&\s"]+)", std::regex::icase);
            static const std::regex shared_key(R"((SharedKey [^:\s]+:)[A-Za-z0-9+/=]+)");
            static const std::regex account_key(R"((AccountKey=)[^;\s]+)");
            const std::string masked = "$1" + std::string(8, config_.mask_char[0]);
            result = std::regex_replace(result, sas_sig, masked);
            result = std::regex_replace(result, shared_key, masked);
            result = std::regex_replace(result, account_key, masked);
        }

        if (config_.mask_urls) {
            static const std::regex query(R"((https?://[^\s?]+)\?[^\s]*)");
            result = std::regex_replace(result, query, "$1?" + std::string(3, config_.mask_char[0]));
        }

        return result;
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    masking_config config_;
};

/**
 * @brief Structured log context for blob operations
 */
struct transfer_log_context {
    std::string blob_name;
    std::optional<uint64_t> total_bytes;
    std::optional<uint64_t> bytes_transferred;
    std::optional<uint64_t> block_index;
    std::optional<uint64_t> block_count;
    std::optional<std::size_t> operation_index;
    std::optional<int> status_code;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> request_id;
    std::optional<std::string> error_message;

    /**
     * @brief Convert context to JSON string
     */
    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << escape_json_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!blob_name.empty()) add_field("blob", blob_name);
        if (total_bytes) add_uint("total_bytes", *total_bytes);
        if (bytes_transferred) add_uint("bytes_transferred", *bytes_transferred);
        if (block_index) add_uint("block_index", *block_index);
        if (block_count) add_uint("block_count", *block_count);
        if (operation_index) add_uint("operation_index", *operation_index);
        if (status_code) add_uint("status_code", static_cast<uint64_t>(*status_code));
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (request_id) add_field("request_id", *request_id);
        if (error_message) {
            add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
        }

        oss << "}";
        return oss.str();
    }

    [[nodiscard]] static auto escape_json_string(const std::string& input) -> std::string {
        std::string output;
        output.reserve(input.size() + 16);
        for (char c : input) {
            switch (c) {
                case '"':  output += "\\\""; break;
                case '\\': output += "\\\\"; break;
                case '\n': output += "\\n";  break;
                case '\r': output += "\\r";  break;
                case '\t': output += "\\t";  break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                        output += buf;
                    } else {
                        output += c;
                    }
            }
        }
        return output;
    }
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Traditional text format
    json    ///< JSON format for structured logging
};

/**
 * @brief Blob transfer logging facade
 *
 * Routes to logger_system when it is linked, otherwise writes to stderr.
 */
class blob_transfer_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const transfer_log_context*)>;

    blob_transfer_logger() = default;
    ~blob_transfer_logger() = default;

    blob_transfer_logger(const blob_transfer_logger&) = delete;
    blob_transfer_logger& operator=(const blob_transfer_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times; called by client construction.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if BLOB_TRANSFER_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(kcenon::logger::log_level::info)
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if BLOB_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if BLOB_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    /**
     * @brief Set custom log callback, invoked before the backend
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    /**
     * @brief Log a message
     */
    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr,
             [[maybe_unused]] int line = 0,
             [[maybe_unused]] const char* function = nullptr) {

        if (!is_enabled(level)) return;

        log_output_format format;
        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        std::string masked = current_masker.mask(std::string(message));

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, masked, context);
            }
        }

        std::string line_text = format == log_output_format::json
            ? format_json(level, category, masked, context, current_masker)
            : format_text(category, masked, context, current_masker);

#if BLOB_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), line_text, file, line, function);
            } else {
                logger_->log(to_logger_level(level), line_text);
            }
        }
#else
        if (format == log_output_format::text) {
            line_text = get_timestamp() + " [" + std::string(log_level_to_string(level)) +
                        "] " + line_text;
        }
        output_to_stderr(line_text);
#endif
    }

    void flush() {
#if BLOB_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    static auto format_text(std::string_view category,
                            const std::string& message,
                            const transfer_log_context* context,
                            const sensitive_info_masker& masker) -> std::string {
        std::ostringstream oss;
        oss << "[" << category << "] " << message;
        if (context) {
            oss << " " << context->to_json(&masker);
        }
        return oss.str();
    }

    static auto format_json(log_level level,
                            std::string_view category,
                            const std::string& message,
                            const transfer_log_context* context,
                            const sensitive_info_masker& masker) -> std::string {
        std::ostringstream oss;
        oss << "{\"timestamp\":\"" << get_timestamp() << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";
        oss << ",\"message\":\"" << transfer_log_context::escape_json_string(message) << "\"";
        if (context) {
            auto ctx_json = context->to_json(&masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }
        oss << "}";
        return oss.str();
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#if BLOB_TRANSFER_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline blob_transfer_logger& get_logger() {
    static blob_transfer_logger instance;
    return instance;
}

// Logging macros for convenience
#define BT_LOG(level, category, message) \
    kcenon::blob_transfer::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define BT_LOG_CTX(level, category, message, context) \
    kcenon::blob_transfer::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define BT_LOG_TRACE(category, message) \
    BT_LOG(kcenon::blob_transfer::log_level::trace, category, message)

#define BT_LOG_DEBUG(category, message) \
    BT_LOG(kcenon::blob_transfer::log_level::debug, category, message)

#define BT_LOG_INFO(category, message) \
    BT_LOG(kcenon::blob_transfer::log_level::info, category, message)

#define BT_LOG_WARN(category, message) \
    BT_LOG(kcenon::blob_transfer::log_level::warn, category, message)

#define BT_LOG_ERROR(category, message) \
    BT_LOG(kcenon::blob_transfer::log_level::error, category, message)

#define BT_LOG_FATAL(category, message) \
    BT_LOG(kcenon::blob_transfer::log_level::fatal, category, message)

#define BT_LOG_DEBUG_CTX(category, message, ctx) \
    BT_LOG_CTX(kcenon::blob_transfer::log_level::debug, category, message, ctx)

#define BT_LOG_INFO_CTX(category, message, ctx) \
    BT_LOG_CTX(kcenon::blob_transfer::log_level::info, category, message, ctx)

#define BT_LOG_WARN_CTX(category, message, ctx) \
    BT_LOG_CTX(kcenon::blob_transfer::log_level::warn, category, message, ctx)

#define BT_LOG_ERROR_CTX(category, message, ctx) \
    BT_LOG_CTX(kcenon::blob_transfer::log_level::error, category, message, ctx)

}  // namespace kcenon::blob_transfer
