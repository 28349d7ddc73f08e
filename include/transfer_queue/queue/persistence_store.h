/**
 * @file persistence_store.h
 * @brief Durable queue state in a JSON file
 *
 * File layout:
 * @code
 * {
 *   "version": 1,
 *   "queue_stopped": false,
 *   "next_id": 4,
 *   "concurrency_limit": 10,
 *   "records": [
 *     { "id": 1, "remote_path": "/pub/a.iso", "local_path": "/home/u/Downloads/a.iso",
 *       "size_bytes": 1048576, "bytes_transferred": 65536, "state": "paused",
 *       "order": 0, "checksum_algorithm": "sha256", "checksum_expected": "ab12...",
 *       "retry_count": 0, "last_error_code": null, "last_error": null,
 *       "created_at": 1700000000000, "started_at": null, "completed_at": null }
 *   ]
 * }
 * @endcode
 *
 * Timestamps are milliseconds since the Unix epoch.
 */

#ifndef TRANSFER_QUEUE_QUEUE_PERSISTENCE_STORE_H
#define TRANSFER_QUEUE_QUEUE_PERSISTENCE_STORE_H

#include <filesystem>
#include <string>
#include <string_view>

#include "transfer_queue/core/types.h"
#include "transfer_queue/queue/transfer_record.h"

namespace transfer_queue {

class persistence_store {
public:
    static constexpr int format_version = 1;

    explicit persistence_store(std::filesystem::path path);

    /**
     * @brief Write the snapshot to `<path>.tmp`, then rename it over `<path>`
     */
    [[nodiscard]] auto save(const queue_snapshot& snapshot) const -> result<void>;

    /**
     * @brief Read the persisted queue
     *
     * A missing file yields an empty snapshot. Records persisted as active
     * or verifying come back as queued with their byte count intact, and
     * live orders are re-densified.
     *
     * @return queue_state_corrupted if the content cannot be parsed
     */
    [[nodiscard]] auto load() const -> result<queue_snapshot>;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

    [[nodiscard]] static auto serialize(const queue_snapshot& snapshot) -> std::string;

    [[nodiscard]] static auto deserialize(std::string_view text) -> result<queue_snapshot>;

private:
    std::filesystem::path path_;
};

}  // namespace transfer_queue

#endif  // TRANSFER_QUEUE_QUEUE_PERSISTENCE_STORE_H
