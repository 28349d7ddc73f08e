/**
 * @file local_directory_session.h
 * @brief remote_session served from a directory on the local filesystem
 *
 * Remote path "/a/b" maps to "<root>/a/b". Useful for mounted shares and
 * for driving the queue end to end without a network.
 */

#ifndef TRANSFER_QUEUE_SESSION_LOCAL_DIRECTORY_SESSION_H
#define TRANSFER_QUEUE_SESSION_LOCAL_DIRECTORY_SESSION_H

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>

#include "transfer_queue/session/remote_session.h"

namespace transfer_queue {

/**
 * @brief Session over a local directory tree
 *
 * All operations are serialized on an internal mutex. Streams opened by
 * the session fail with connection_lost once close() has been called.
 */
class local_directory_session : public remote_session {
public:
    explicit local_directory_session(std::filesystem::path root);
    ~local_directory_session() override;

    local_directory_session(const local_directory_session&) = delete;
    auto operator=(const local_directory_session&) -> local_directory_session& = delete;

    [[nodiscard]] auto connect() -> result<void> override;
    auto close() -> void override;
    [[nodiscard]] auto is_open() const -> bool override;

    [[nodiscard]] auto stat(const std::string& path) -> result<remote_stat> override;
    [[nodiscard]] auto list_dir(const std::string& path)
        -> result<std::vector<remote_entry>> override;
    [[nodiscard]] auto open_read(const std::string& path, std::uint64_t offset)
        -> result<std::unique_ptr<remote_read_stream>> override;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }

private:
    [[nodiscard]] auto resolve(const std::string& path) const -> result<std::filesystem::path>;
    [[nodiscard]] auto require_open() const -> result<void>;

    std::filesystem::path root_;
    mutable std::mutex mutex_;
    std::shared_ptr<std::atomic<bool>> alive_;
};

}  // namespace transfer_queue

#endif  // TRANSFER_QUEUE_SESSION_LOCAL_DIRECTORY_SESSION_H
