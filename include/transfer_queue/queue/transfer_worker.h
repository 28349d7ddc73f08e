/**
 * @file transfer_worker.h
 * @brief Executes one download from stat to verification
 *
 * A worker never touches the canonical queue records. It reads an
 * immutable transfer_job, reports what it learns through worker_callbacks,
 * and returns a worker_result. The scheduler turns those into state
 * transitions.
 *
 * Control signals are observed at chunk boundaries only; a chunk that has
 * been read is always written and flushed before the worker stops, so the
 * partial file is never shorter than the last reported byte count.
 */

#ifndef TRANSFER_QUEUE_QUEUE_TRANSFER_WORKER_H
#define TRANSFER_QUEUE_QUEUE_TRANSFER_WORKER_H

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "transfer_queue/core/bandwidth_limiter.h"
#include "transfer_queue/core/checksum_verifier.h"
#include "transfer_queue/core/types.h"
#include "transfer_queue/session/reconnect_supervisor.h"

namespace transfer_queue {

/**
 * @brief Cooperative stop request, ordered by precedence
 */
enum class control_signal : std::uint8_t {
    none = 0,
    pause = 1,
    cancel = 2,
    interrupt = 3  ///< Session lost or scheduler stopping; record state is left alone
};

/**
 * @brief Per-worker signal slot shared between scheduler and worker
 *
 * A request only ever raises the signal: a pending cancel is not
 * downgraded by a later pause. The one way down is withdraw_pause().
 */
class transfer_control {
public:
    auto request(control_signal signal) noexcept -> void {
        auto current = signal_.load();
        while (static_cast<std::uint8_t>(current) < static_cast<std::uint8_t>(signal) &&
               !signal_.compare_exchange_weak(current, signal)) {
        }
    }

    /**
     * @brief Drop a pending pause; cancel and interrupt are never withdrawn
     * @return true if a pause was pending and is now cleared
     */
    auto withdraw_pause() noexcept -> bool {
        auto expected = control_signal::pause;
        return signal_.compare_exchange_strong(expected, control_signal::none);
    }

    [[nodiscard]] auto current() const noexcept -> control_signal { return signal_.load(); }

    [[nodiscard]] auto is_set() const noexcept -> bool {
        return signal_.load() != control_signal::none;
    }

private:
    std::atomic<control_signal> signal_{control_signal::none};
};

/**
 * @brief Immutable input of one worker invocation
 */
struct transfer_job {
    record_id id{0};
    std::string remote_path;
    std::filesystem::path local_path;
    std::optional<std::uint64_t> size_bytes;
    std::uint64_t bytes_transferred{0};
    std::optional<checksum_algorithm> checksum_algo;
    std::optional<std::string> checksum_expected;
    bool restart_from_zero{false};
};

struct worker_options {
    std::size_t chunk_size = 256 * 1024;
    bool verify_checksums = true;
    bool resume_transfers = true;
    std::size_t manifest_size_limit = 1024 * 1024;
};

/**
 * @brief Notifications a worker emits while running
 *
 * Called on the worker thread. Any member may be empty.
 */
struct worker_callbacks {
    std::function<void(std::uint64_t size)> on_size_known;
    std::function<void(const manifest_entry& entry)> on_checksum_found;
    std::function<void(std::uint64_t bytes_transferred)> on_progress;
    std::function<void()> on_verifying;
};

enum class worker_outcome {
    completed,
    paused,
    cancelled,
    interrupted,
    failed
};

[[nodiscard]] constexpr auto to_string(worker_outcome outcome) -> const char* {
    switch (outcome) {
        case worker_outcome::completed: return "completed";
        case worker_outcome::paused: return "paused";
        case worker_outcome::cancelled: return "cancelled";
        case worker_outcome::interrupted: return "interrupted";
        case worker_outcome::failed: return "failed";
        default: return "unknown";
    }
}

struct worker_result {
    worker_outcome outcome{worker_outcome::failed};
    std::uint64_t bytes_transferred{0};
    std::optional<std::uint64_t> size_bytes;
    std::optional<error> failure;
    std::uint64_t generation{0};  ///< Session generation the attempt ran under
};

class transfer_worker {
public:
    transfer_worker(std::shared_ptr<reconnect_supervisor> supervisor,
                    std::shared_ptr<bandwidth_limiter> limiter,
                    worker_options options);

    /**
     * @brief Run @p job to completion or until a control signal is observed
     *
     * Connectivity failures are reported to the supervisor under the
     * lease generation before returning.
     */
    [[nodiscard]] auto execute(const transfer_job& job,
                               const transfer_control& control,
                               const worker_callbacks& callbacks) const -> worker_result;

    [[nodiscard]] auto options() const -> const worker_options& { return options_; }

private:
    [[nodiscard]] auto discover_checksum(const session_lease& lease,
                                         const std::string& remote_path) const
        -> result<std::optional<manifest_entry>>;

    [[nodiscard]] auto prepare_local_file(const transfer_job& job, std::uint64_t remote_size) const
        -> result<std::uint64_t>;

    auto report_if_connectivity(const session_lease& lease, const error& cause) const -> void;

    std::shared_ptr<reconnect_supervisor> supervisor_;
    std::shared_ptr<bandwidth_limiter> limiter_;
    worker_options options_;
    checksum_verifier verifier_;
};

}  // namespace transfer_queue

#endif  // TRANSFER_QUEUE_QUEUE_TRANSFER_WORKER_H
