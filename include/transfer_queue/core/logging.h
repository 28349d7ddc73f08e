// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include "transfer_queue/config/feature_flags.h"

#if TQ_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace transfer_queue {

/**
 * @brief Log categories used across the orchestrator
 */
struct log_category {
    static constexpr std::string_view scheduler = "transfer_queue.scheduler";
    static constexpr std::string_view worker = "transfer_queue.worker";
    static constexpr std::string_view session = "transfer_queue.session";
    static constexpr std::string_view reconnect = "transfer_queue.reconnect";
    static constexpr std::string_view persistence = "transfer_queue.persistence";
    static constexpr std::string_view checksum = "transfer_queue.checksum";
    static constexpr std::string_view settings = "transfer_queue.settings";
};

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

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

namespace detail {

inline auto escape_log_string(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 8);
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

}  // namespace detail

/**
 * @brief Structured context attached to a log line about one transfer record
 */
struct transfer_log_context {
    std::optional<std::uint64_t> record_id;
    std::string remote_path;
    std::string local_path;
    std::optional<std::uint64_t> size_bytes;
    std::optional<std::uint64_t> bytes_transferred;
    std::optional<std::uint32_t> retry_count;
    std::optional<std::uint64_t> session_generation;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_string = [&](const char* name, std::string_view value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_log_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, std::uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (record_id) add_uint("record_id", *record_id);
        if (!remote_path.empty()) add_string("remote_path", remote_path);
        if (!local_path.empty()) add_string("local_path", local_path);
        if (size_bytes) add_uint("size_bytes", *size_bytes);
        if (bytes_transferred) add_uint("bytes_transferred", *bytes_transferred);
        if (retry_count) add_uint("retry_count", *retry_count);
        if (session_generation) add_uint("session_generation", *session_generation);
        if (error_message) add_string("error_message", *error_message);

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief A complete log record, as handed to JSON sinks
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<transfer_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;

    [[nodiscard]] auto to_json() const -> std::string {
        std::ostringstream oss;
        oss << "{";
        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";
        oss << ",\"message\":\"" << detail::escape_log_string(message) << "\"";

        if (context) {
            auto ctx_json = context->to_json();
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{\"file\":\"" << detail::escape_log_string(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

enum class log_output_format {
    text,
    json
};

/**
 * @brief Process-wide logger for the transfer queue
 *
 * Writes to stderr unless built against logger_system. A callback sink
 * receives every accepted message regardless of the output backend, which
 * is how tests observe log traffic.
 */
class transfer_queue_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const transfer_log_context*)>;

    transfer_queue_logger() = default;
    ~transfer_queue_logger() = default;

    transfer_queue_logger(const transfer_queue_logger&) = delete;
    transfer_queue_logger& operator=(const transfer_queue_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times; subsequent calls are no-ops.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if TQ_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if TQ_USE_LOGGER_SYSTEM
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
#if TQ_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) { output_format_.store(format); }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        return output_format_.load();
    }

    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    /**
     * @brief Stop echoing to stderr; the callback sink still fires
     */
    void set_console_enabled(bool enabled) { console_enabled_.store(enabled); }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        if (output_format_.load() == log_output_format::json) {
            structured_log_entry entry;
            entry.timestamp = iso8601_timestamp();
            entry.level = level;
            entry.category = std::string(category);
            entry.message = std::string(message);
            if (context) entry.context = *context;
            if (file) entry.source_file = std::string(file);
            if (line > 0) entry.source_line = line;
            emit(level, entry.to_json());
            return;
        }

        std::ostringstream oss;
#if !TQ_USE_LOGGER_SYSTEM
        oss << local_timestamp() << " [" << log_level_to_string(level) << "] ";
#endif
        oss << "[" << category << "] " << message;
        if (context) {
            oss << " " << context->to_json();
        }
        emit(level, oss.str());
    }

    void flush() {
#if TQ_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void emit(log_level level, const std::string& line) {
#if TQ_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->log(to_logger_level(level), line);
            return;
        }
#else
        (void)level;
#endif
        if (!console_enabled_.load()) {
            return;
        }
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << line << "\n";
    }

#if TQ_USE_LOGGER_SYSTEM
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

    static auto local_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    static auto iso8601_timestamp() -> std::string {
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
    std::atomic<log_output_format> output_format_{log_output_format::text};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> console_enabled_{true};
    log_callback callback_;
    std::mutex callback_mutex_;
};

inline transfer_queue_logger& get_logger() {
    static transfer_queue_logger instance;
    return instance;
}

#define TQ_LOG(level, category, message) \
    transfer_queue::get_logger().log(level, category, message, nullptr, __FILE__, __LINE__)

#define TQ_LOG_CTX(level, category, message, context) \
    transfer_queue::get_logger().log(level, category, message, &context, __FILE__, __LINE__)

#define TQ_LOG_TRACE(category, message) \
    TQ_LOG(transfer_queue::log_level::trace, category, message)

#define TQ_LOG_DEBUG(category, message) \
    TQ_LOG(transfer_queue::log_level::debug, category, message)

#define TQ_LOG_INFO(category, message) \
    TQ_LOG(transfer_queue::log_level::info, category, message)

#define TQ_LOG_WARN(category, message) \
    TQ_LOG(transfer_queue::log_level::warn, category, message)

#define TQ_LOG_ERROR(category, message) \
    TQ_LOG(transfer_queue::log_level::error, category, message)

#define TQ_LOG_DEBUG_CTX(category, message, ctx) \
    TQ_LOG_CTX(transfer_queue::log_level::debug, category, message, ctx)

#define TQ_LOG_INFO_CTX(category, message, ctx) \
    TQ_LOG_CTX(transfer_queue::log_level::info, category, message, ctx)

#define TQ_LOG_WARN_CTX(category, message, ctx) \
    TQ_LOG_CTX(transfer_queue::log_level::warn, category, message, ctx)

#define TQ_LOG_ERROR_CTX(category, message, ctx) \
    TQ_LOG_CTX(transfer_queue::log_level::error, category, message, ctx)

}  // namespace transfer_queue
