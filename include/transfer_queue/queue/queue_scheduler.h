/**
 * @file queue_scheduler.h
 * @brief Transfer queue orchestrator
 *
 * The scheduler owns the canonical transfer_record set. It admits queued
 * records into a bounded pool of transfer workers, applies the messages
 * those workers post back, reacts to connection changes, persists the
 * queue (debounced) and publishes immutable snapshots together with an
 * event feed for the presentation layer.
 *
 * @code
 * auto scheduler = queue_scheduler::builder()
 *     .with_session_factory([] { return std::make_shared<local_directory_session>("/mnt/share"); })
 *     .with_download_directory("/home/me/Downloads")
 *     .with_state_file(app_settings::state_directory() / "queue.json")
 *     .with_concurrency_limit(3)
 *     .build();
 * if (!scheduler) { ... }
 *
 * auto& queue = scheduler.value();
 * (void)queue.start();
 * auto rec = queue.enqueue("/pub/image.iso");
 * queue.wait_until_idle(std::chrono::minutes(5));
 * (void)queue.stop();
 * @endcode
 */

#ifndef TRANSFER_QUEUE_QUEUE_QUEUE_SCHEDULER_H
#define TRANSFER_QUEUE_QUEUE_QUEUE_SCHEDULER_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "transfer_queue/adapters/thread_pool_adapter.h"
#include "transfer_queue/config/app_settings.h"
#include "transfer_queue/core/checksum.h"
#include "transfer_queue/core/types.h"
#include "transfer_queue/queue/transfer_record.h"
#include "transfer_queue/session/reconnect_supervisor.h"
#include "transfer_queue/session/remote_session.h"

namespace transfer_queue {

/**
 * @brief Scheduler tuning
 */
struct scheduler_config {
    static constexpr std::size_t min_concurrency = 1;
    static constexpr std::size_t max_concurrency = 50;

    std::size_t concurrency_limit = 10;
    std::size_t chunk_size = 256 * 1024;
    std::uint32_t max_retries = 3;
    std::chrono::milliseconds retry_delay{1000};
    std::chrono::milliseconds persist_interval{500};
    std::filesystem::path download_directory;  ///< Empty = ~/Downloads
    std::optional<std::filesystem::path> state_file;  ///< No persistence when unset
    bool verify_checksums = true;
    bool resume_transfers = true;
    bool retry_on_checksum_mismatch = false;  ///< Restart from zero automatically
    std::size_t bandwidth_limit = 0;  ///< Bytes per second across all workers
    std::size_t manifest_size_limit = 1024 * 1024;

    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Map user settings onto a config; the state file goes to the
     *        settings state directory
     */
    [[nodiscard]] static auto from_settings(const app_settings& settings) -> scheduler_config;
};

/**
 * @brief Optional details for enqueue()
 */
struct enqueue_options {
    std::filesystem::path local_path;  ///< Empty = download directory / basename
    std::optional<std::uint64_t> expected_size;
    std::optional<checksum_algorithm> checksum_algo;  ///< Inferred from the hex length if unset
    std::optional<std::string> checksum_expected;
};

struct directory_enqueue_result {
    std::vector<record_id> records;
    std::vector<std::pair<std::string, error>> failed_directories;
    std::size_t skipped_duplicates{0};
    std::size_t skipped_unsafe{0};  ///< Entries whose names cannot map onto a local path
};

enum class queue_event_kind {
    record_added,
    record_removed,
    state_changed,
    progress,
    connection_changed,
    queue_flags_changed
};

[[nodiscard]] constexpr auto to_string(queue_event_kind kind) -> const char* {
    switch (kind) {
        case queue_event_kind::record_added: return "record_added";
        case queue_event_kind::record_removed: return "record_removed";
        case queue_event_kind::state_changed: return "state_changed";
        case queue_event_kind::progress: return "progress";
        case queue_event_kind::connection_changed: return "connection_changed";
        case queue_event_kind::queue_flags_changed: return "queue_flags_changed";
        default: return "unknown";
    }
}

struct queue_event {
    queue_event_kind kind{queue_event_kind::state_changed};
    record_id id{0};  ///< 0 for queue-level events
    std::optional<transfer_record> record;  ///< Record as of the event
    connection_state connection{connection_state::disconnected};
};

class queue_scheduler {
public:
    using event_listener = std::function<void(const queue_event&)>;
    using subscription_id = std::uint64_t;

    class builder {
    public:
        builder();

        auto with_config(scheduler_config config) -> builder&;

        /**
         * @brief Required; called once per connection attempt
         */
        auto with_session_factory(session_factory factory) -> builder&;

        auto with_reconnect_policy(reconnect_policy policy) -> builder&;

        /**
         * @brief Worker executor; defaults to transfer_executor_factory::create()
         */
        auto with_executor(std::shared_ptr<adapters::transfer_executor_interface> executor)
            -> builder&;

        auto with_concurrency_limit(std::size_t limit) -> builder&;
        auto with_download_directory(std::filesystem::path dir) -> builder&;
        auto with_state_file(std::filesystem::path path) -> builder&;
        auto with_chunk_size(std::size_t size) -> builder&;
        auto with_max_retries(std::uint32_t retries) -> builder&;
        auto with_retry_delay(std::chrono::milliseconds delay) -> builder&;
        auto with_persist_interval(std::chrono::milliseconds interval) -> builder&;
        auto with_checksum_verification(bool enable) -> builder&;
        auto with_resume(bool enable) -> builder&;
        auto with_retry_on_checksum_mismatch(bool enable) -> builder&;
        auto with_bandwidth_limit(std::size_t bytes_per_second) -> builder&;

        /**
         * @brief Validate and construct; restores persisted state if a
         *        state file is configured
         */
        [[nodiscard]] auto build() -> result<queue_scheduler>;

    private:
        scheduler_config config_;
        session_factory factory_;
        reconnect_policy policy_;
        std::shared_ptr<adapters::transfer_executor_interface> executor_;
    };

    ~queue_scheduler();

    queue_scheduler(queue_scheduler&&) noexcept;
    auto operator=(queue_scheduler&&) noexcept -> queue_scheduler&;

    queue_scheduler(const queue_scheduler&) = delete;
    auto operator=(const queue_scheduler&) -> queue_scheduler& = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Start the control loop and connect the session
     *
     * A failed first connection does not fail start(); the supervisor
     * keeps retrying and snapshot().connection reports progress.
     */
    [[nodiscard]] auto start() -> result<void>;

    /**
     * @brief Interrupt workers, wait for them, persist and stop the loop
     *
     * Active records return to queued with their progress kept.
     */
    [[nodiscard]] auto stop() -> result<void>;

    [[nodiscard]] auto is_running() const -> bool;

    // ========================================================================
    // Queue mutation
    // ========================================================================

    [[nodiscard]] auto enqueue(const std::string& remote_path,
                               const std::filesystem::path& local_path = {},
                               std::optional<std::uint64_t> expected_size = std::nullopt)
        -> result<transfer_record>;

    [[nodiscard]] auto enqueue(const std::string& remote_path, const enqueue_options& options)
        -> result<transfer_record>;

    /**
     * @brief Expand a remote directory into one record per file
     *
     * The subtree layout is preserved under @p local_dir (default: the
     * download directory / the remote directory's name). A listing failure
     * below the root skips that subtree only.
     */
    [[nodiscard]] auto enqueue_directory(const std::string& remote_dir,
                                         const std::filesystem::path& local_dir = {})
        -> result<directory_enqueue_result>;

    /**
     * @brief Move a queued record by @p delta positions among queued records
     *
     * Clamped at both ends; records in other states keep their order.
     */
    [[nodiscard]] auto reorder(record_id id, int delta) -> result<void>;

    [[nodiscard]] auto pause(record_id id) -> result<void>;
    [[nodiscard]] auto resume(record_id id) -> result<void>;
    [[nodiscard]] auto cancel(record_id id) -> result<void>;

    /**
     * @brief Requeue a failed or cancelled record at the end of the queue
     */
    [[nodiscard]] auto retry(record_id id) -> result<void>;

    [[nodiscard]] auto remove(record_id id, bool delete_local_file = false) -> result<void>;

    /**
     * @brief Remove every completed record
     * @return Number of records removed
     */
    auto clear_finished() -> std::size_t;

    auto stop_all() -> void;
    auto resume_all() -> void;

    [[nodiscard]] auto set_concurrency_limit(std::size_t limit) -> result<void>;
    [[nodiscard]] auto concurrency_limit() const -> std::size_t;

    auto set_bandwidth_limit(std::size_t bytes_per_second) -> void;

    /**
     * @brief Reconnect now, including after reconnect_exhausted
     */
    [[nodiscard]] auto reconnect() -> result<void>;

    // ========================================================================
    // Observation
    // ========================================================================

    /**
     * @brief Last published view; never blocks on the scheduler lock
     */
    [[nodiscard]] auto snapshot() const -> std::shared_ptr<const queue_snapshot>;

    [[nodiscard]] auto get(record_id id) const -> result<transfer_record>;

    auto subscribe(event_listener listener) -> subscription_id;
    auto unsubscribe(subscription_id id) -> void;

    /**
     * @brief Wait until nothing is queued, active or verifying
     * @return false on timeout
     */
    auto wait_until_idle(std::chrono::milliseconds timeout) -> bool;

    /**
     * @brief Sum of the current rates of all active records, bytes per second
     */
    [[nodiscard]] auto total_speed() const -> double;

    [[nodiscard]] auto connection() const -> connection_state;

    /**
     * @brief Configuration as built; live changes made through the setters
     *        are reported by snapshot()
     */
    [[nodiscard]] auto config() const -> const scheduler_config&;

private:
    struct impl;
    explicit queue_scheduler(std::unique_ptr<impl> state);

    std::unique_ptr<impl> impl_;
};

}  // namespace transfer_queue

#endif  // TRANSFER_QUEUE_QUEUE_QUEUE_SCHEDULER_H
