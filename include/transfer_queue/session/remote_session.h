/**
 * @file remote_session.h
 * @brief Capability interface to one logical remote file-transfer connection
 *
 * The orchestrator never speaks a wire protocol itself. Everything it needs
 * from the remote side goes through remote_session, so an SFTP client, a
 * mounted directory or a test double can back the queue interchangeably.
 *
 * Error contract for implementations:
 * - connection-level failures (dropped link, timeout, closed handle) are
 *   reported with a connectivity error_code (connection_lost,
 *   connection_timeout, not_connected)
 * - missing paths report remote_not_found, access problems
 *   remote_permission_denied, anything else remote_io_error
 * - after close(), every operation and every stream it opened fails with
 *   not_connected or connection_lost
 */

#ifndef TRANSFER_QUEUE_SESSION_REMOTE_SESSION_H
#define TRANSFER_QUEUE_SESSION_REMOTE_SESSION_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "transfer_queue/core/types.h"

namespace transfer_queue {

/**
 * @brief Result of a remote stat
 */
struct remote_stat {
    std::uint64_t size{0};
    std::chrono::system_clock::time_point modified{};
    bool is_directory{false};
};

/**
 * @brief One entry of a remote directory listing
 */
struct remote_entry {
    std::string name;  ///< Base name
    std::string path;  ///< Absolute remote path
    bool is_directory{false};
    std::uint64_t size{0};
    std::chrono::system_clock::time_point modified{};
};

/**
 * @brief Sequential reader over a remote file, positioned at open time
 */
class remote_read_stream {
public:
    virtual ~remote_read_stream() = default;

    /**
     * @brief Read up to buffer.size() bytes
     * @return Bytes read; 0 at end of file
     */
    [[nodiscard]] virtual auto read(std::span<std::byte> buffer) -> result<std::size_t> = 0;
};

/**
 * @brief One logical connection to the remote host
 *
 * Implementations document whether concurrent calls are safe; the queue
 * makes no assumption and tolerates either model.
 */
class remote_session {
public:
    virtual ~remote_session() = default;

    [[nodiscard]] virtual auto connect() -> result<void> = 0;

    /**
     * @brief Close the connection; idempotent
     */
    virtual auto close() -> void = 0;

    [[nodiscard]] virtual auto is_open() const -> bool = 0;

    [[nodiscard]] virtual auto stat(const std::string& path) -> result<remote_stat> = 0;

    [[nodiscard]] virtual auto list_dir(const std::string& path)
        -> result<std::vector<remote_entry>> = 0;

    [[nodiscard]] virtual auto open_read(const std::string& path, std::uint64_t offset)
        -> result<std::unique_ptr<remote_read_stream>> = 0;

    /**
     * @brief Read a small file whole
     *
     * The default implementation streams through open_read() and fails
     * with remote_io_error when the file exceeds @p max_bytes.
     */
    [[nodiscard]] virtual auto read_file(const std::string& path, std::size_t max_bytes)
        -> result<std::string>;
};

/**
 * @brief Creates unconnected sessions; called once per (re)connect
 */
using session_factory = std::function<std::shared_ptr<remote_session>()>;

// ============================================================================
// Remote path helpers (POSIX-style, '/' separated)
// ============================================================================

/**
 * @brief Join a directory and a name with exactly one '/'
 */
[[nodiscard]] auto join_remote_path(std::string_view directory, std::string_view name)
    -> std::string;

/**
 * @brief Final component of a remote path ("" for "/")
 */
[[nodiscard]] auto remote_basename(std::string_view path) -> std::string;

/**
 * @brief Parent directory of a remote path ("/" for top-level entries)
 */
[[nodiscard]] auto remote_parent(std::string_view path) -> std::string;

/**
 * @brief True if a path component is safe to map onto the local filesystem
 *
 * Rejects empty names, "." and "..", and names containing a separator.
 */
[[nodiscard]] auto is_safe_path_component(std::string_view component) -> bool;

}  // namespace transfer_queue

#endif  // TRANSFER_QUEUE_SESSION_REMOTE_SESSION_H
