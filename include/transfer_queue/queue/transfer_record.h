/**
 * @file transfer_record.h
 * @brief Queue entities: transfer_record and queue_snapshot
 */

#ifndef TRANSFER_QUEUE_QUEUE_TRANSFER_RECORD_H
#define TRANSFER_QUEUE_QUEUE_TRANSFER_RECORD_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "transfer_queue/core/checksum.h"
#include "transfer_queue/core/types.h"
#include "transfer_queue/session/reconnect_supervisor.h"

namespace transfer_queue {

/**
 * @brief Lifecycle state of a download
 *
 * @code
 *   queued -> active -> verifying -> completed
 *      |        |  \        \
 *      v        v   \        -> failed
 *   paused <- active  -> failed | cancelled
 * @endcode
 */
enum class record_state {
    queued,
    active,
    paused,
    verifying,
    completed,
    failed,
    cancelled
};

[[nodiscard]] constexpr auto to_string(record_state state) -> const char* {
    switch (state) {
        case record_state::queued: return "queued";
        case record_state::active: return "active";
        case record_state::paused: return "paused";
        case record_state::verifying: return "verifying";
        case record_state::completed: return "completed";
        case record_state::failed: return "failed";
        case record_state::cancelled: return "cancelled";
        default: return "unknown";
    }
}

[[nodiscard]] auto record_state_from_string(std::string_view name) -> std::optional<record_state>;

/**
 * @brief completed, failed and cancelled records are never scheduled again
 *        without an explicit retry
 */
[[nodiscard]] constexpr auto is_terminal(record_state state) noexcept -> bool {
    return state == record_state::completed || state == record_state::failed ||
           state == record_state::cancelled;
}

/**
 * @brief One download in the queue
 */
struct transfer_record {
    using clock = std::chrono::system_clock;

    record_id id{0};
    std::string remote_path;
    std::filesystem::path local_path;
    std::optional<std::uint64_t> size_bytes;
    std::uint64_t bytes_transferred{0};
    record_state state{record_state::queued};
    std::size_t order{0};

    std::optional<checksum_algorithm> checksum_algo;
    std::optional<std::string> checksum_expected;  ///< Lowercase hex

    std::uint32_t retry_count{0};
    std::optional<error> last_error;

    clock::time_point created_at{};
    std::optional<clock::time_point> started_at;
    std::optional<clock::time_point> completed_at;

    // Display only; not persisted
    double speed_bps{0.0};
    std::optional<std::chrono::seconds> eta;

    /**
     * @brief Completion ratio in [0, 1]; nullopt while the size is unknown
     */
    [[nodiscard]] auto progress() const -> std::optional<double> {
        if (!size_bytes) {
            return std::nullopt;
        }
        if (*size_bytes == 0) {
            return 1.0;
        }
        return static_cast<double>(bytes_transferred) / static_cast<double>(*size_bytes);
    }

    [[nodiscard]] auto is_terminal() const noexcept -> bool {
        return transfer_queue::is_terminal(state);
    }
};

/**
 * @brief Immutable view of the whole queue
 *
 * Records are ordered non-terminal first by order, then terminal by id.
 */
struct queue_snapshot {
    std::vector<transfer_record> records;
    bool queue_stopped{false};
    connection_state connection{connection_state::disconnected};
    std::optional<error> connection_error;
    std::size_t concurrency_limit{10};
    record_id next_id{1};

    [[nodiscard]] auto find(record_id id) const -> const transfer_record*;

    [[nodiscard]] auto count(record_state state) const -> std::size_t;
};

/**
 * @brief Sort records into snapshot order
 */
auto sort_for_display(std::vector<transfer_record>& records) -> void;

}  // namespace transfer_queue

#endif  // TRANSFER_QUEUE_QUEUE_TRANSFER_RECORD_H
