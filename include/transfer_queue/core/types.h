/**
 * @file types.h
 * @brief Core type definitions for transfer_queue
 */

#ifndef TRANSFER_QUEUE_CORE_TYPES_H
#define TRANSFER_QUEUE_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace transfer_queue {

/**
 * @brief Error codes for queue, session and transfer operations
 */
enum class error_code {
    success = 0,

    // Local file errors (-100 to -119)
    file_not_found = -100,
    file_access_denied = -101,
    invalid_file_path = -104,
    file_read_error = -105,
    file_write_error = -106,
    disk_full = -107,

    // Remote errors (-120 to -139)
    remote_not_found = -120,
    remote_permission_denied = -121,
    remote_io_error = -122,
    remote_unexpected_eof = -123,
    remote_not_a_file = -124,

    // Integrity errors (-140 to -159)
    checksum_mismatch = -140,
    unsupported_algorithm = -141,
    manifest_parse_error = -142,

    // Configuration errors (-160 to -179)
    invalid_configuration = -160,
    config_parse_error = -161,

    // Connection errors (-180 to -199)
    connection_failed = -180,
    connection_timeout = -181,
    connection_lost = -182,
    not_connected = -183,
    session_stale = -184,
    reconnect_exhausted = -185,

    // Queue errors (-200 to -219)
    transfer_not_found = -200,
    transfer_in_progress = -201,
    transfer_already_exists = -202,
    invalid_state_transition = -203,
    queue_state_corrupted = -204,

    // Internal errors (-220 to -239)
    internal_error = -220,
    not_initialized = -221,
    already_initialized = -222,
    operation_cancelled = -223,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_access_denied:
            return "file access denied";
        case error_code::invalid_file_path:
            return "invalid file path";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::disk_full:
            return "disk full";
        case error_code::remote_not_found:
            return "remote file not found";
        case error_code::remote_permission_denied:
            return "remote permission denied";
        case error_code::remote_io_error:
            return "remote i/o error";
        case error_code::remote_unexpected_eof:
            return "unexpected end of remote file";
        case error_code::remote_not_a_file:
            return "remote path is not a regular file";
        case error_code::checksum_mismatch:
            return "checksum mismatch";
        case error_code::unsupported_algorithm:
            return "unsupported checksum algorithm";
        case error_code::manifest_parse_error:
            return "manifest parse error";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::config_parse_error:
            return "configuration parse error";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::connection_lost:
            return "connection lost";
        case error_code::not_connected:
            return "not connected";
        case error_code::session_stale:
            return "session replaced";
        case error_code::reconnect_exhausted:
            return "reconnect attempts exhausted";
        case error_code::transfer_not_found:
            return "transfer not found";
        case error_code::transfer_in_progress:
            return "transfer in progress";
        case error_code::transfer_already_exists:
            return "transfer already queued";
        case error_code::invalid_state_transition:
            return "invalid state transition";
        case error_code::queue_state_corrupted:
            return "queue state corrupted";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        case error_code::already_initialized:
            return "already initialized";
        case error_code::operation_cancelled:
            return "operation cancelled";
        default:
            return "unknown error";
    }
}

/**
 * @brief How the scheduler reacts to a failed operation
 */
enum class error_class {
    none,          ///< Not an error
    transient,     ///< Retried automatically up to the retry cap
    connectivity,  ///< Session-wide; demote active work and reconnect
    terminal,      ///< Fails the record immediately without consuming retries
    fatal,         ///< Session-wide and unrecoverable without user action
};

/**
 * @brief Classify an error code for retry and reconnect handling
 */
[[nodiscard]] constexpr auto classify(error_code code) noexcept -> error_class {
    switch (code) {
        case error_code::success:
            return error_class::none;
        case error_code::remote_io_error:
        case error_code::remote_unexpected_eof:
            return error_class::transient;
        case error_code::connection_failed:
        case error_code::connection_timeout:
        case error_code::connection_lost:
        case error_code::not_connected:
        case error_code::session_stale:
            return error_class::connectivity;
        case error_code::reconnect_exhausted:
            return error_class::fatal;
        default:
            return error_class::terminal;
    }
}

[[nodiscard]] constexpr auto is_transient(error_code code) noexcept -> bool {
    return classify(code) == error_class::transient;
}

[[nodiscard]] constexpr auto is_connectivity(error_code code) noexcept -> bool {
    return classify(code) == error_class::connectivity;
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }

    [[nodiscard]] auto operator==(const error& other) const -> bool = default;
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an error, in the manner of
 * std::expected (C++23).
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Identifier of a queued transfer record
 *
 * Assigned monotonically at enqueue time and never reused.
 */
using record_id = std::uint64_t;

}  // namespace transfer_queue

#endif  // TRANSFER_QUEUE_CORE_TYPES_H
