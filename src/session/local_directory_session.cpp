/**
 * @file local_directory_session.cpp
 * @brief Local directory backed remote_session
 */

#include "transfer_queue/session/local_directory_session.h"
#include "transfer_queue/core/logging.h"

#include <fstream>

namespace transfer_queue {

namespace {

auto to_system_time(std::filesystem::file_time_type ftime) -> std::chrono::system_clock::time_point {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
}

auto map_fs_error(const std::error_code& ec, const std::string& path) -> error {
    if (ec == std::errc::no_such_file_or_directory) {
        return error(error_code::remote_not_found, "no such file: " + path);
    }
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return error(error_code::remote_permission_denied, "permission denied: " + path);
    }
    if (ec == std::errc::not_a_directory) {
        return error(error_code::remote_not_found, "not a directory: " + path);
    }
    return error(error_code::remote_io_error, path + ": " + ec.message());
}

class local_read_stream : public remote_read_stream {
public:
    local_read_stream(std::ifstream file, std::shared_ptr<std::atomic<bool>> alive)
        : file_(std::move(file)), alive_(std::move(alive)) {}

    auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
        if (!alive_->load()) {
            return unexpected(error(error_code::connection_lost, "session closed"));
        }
        file_.read(reinterpret_cast<char*>(buffer.data()),
                   static_cast<std::streamsize>(buffer.size()));
        auto n = file_.gcount();
        if (file_.bad()) {
            return unexpected(error(error_code::remote_io_error, "read failed"));
        }
        return static_cast<std::size_t>(n);
    }

private:
    std::ifstream file_;
    std::shared_ptr<std::atomic<bool>> alive_;
};

}  // namespace

local_directory_session::local_directory_session(std::filesystem::path root)
    : root_(std::move(root)), alive_(std::make_shared<std::atomic<bool>>(false)) {}

local_directory_session::~local_directory_session() {
    close();
}

auto local_directory_session::connect() -> result<void> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec)) {
        return unexpected(error(error_code::connection_failed,
            "root is not a directory: " + root_.string()));
    }
    alive_ = std::make_shared<std::atomic<bool>>(true);
    TQ_LOG_DEBUG(log_category::session, "Opened local session at " + root_.string());
    return {};
}

auto local_directory_session::close() -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    alive_->store(false);
}

auto local_directory_session::is_open() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return alive_->load();
}

auto local_directory_session::require_open() const -> result<void> {
    if (!alive_->load()) {
        return unexpected(error(error_code::not_connected, "session is not open"));
    }
    return {};
}

auto local_directory_session::resolve(const std::string& path) const
    -> result<std::filesystem::path> {
    std::filesystem::path relative(path);
    for (const auto& part : relative) {
        if (part == "..") {
            return unexpected(error(error_code::invalid_file_path,
                "path escapes session root: " + path));
        }
    }
    return root_ / relative.relative_path();
}

auto local_directory_session::stat(const std::string& path) -> result<remote_stat> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto open = require_open(); !open) {
        return unexpected(open.error());
    }
    auto local = resolve(path);
    if (!local) {
        return unexpected(local.error());
    }

    std::error_code ec;
    auto status = std::filesystem::status(local.value(), ec);
    if (ec) {
        return unexpected(map_fs_error(ec, path));
    }

    remote_stat info;
    info.is_directory = std::filesystem::is_directory(status);
    if (!info.is_directory) {
        info.size = std::filesystem::file_size(local.value(), ec);
        if (ec) {
            return unexpected(map_fs_error(ec, path));
        }
    }
    auto mtime = std::filesystem::last_write_time(local.value(), ec);
    if (!ec) {
        info.modified = to_system_time(mtime);
    }
    return info;
}

auto local_directory_session::list_dir(const std::string& path)
    -> result<std::vector<remote_entry>> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto open = require_open(); !open) {
        return unexpected(open.error());
    }
    auto local = resolve(path);
    if (!local) {
        return unexpected(local.error());
    }

    std::error_code ec;
    std::filesystem::directory_iterator it(local.value(), ec);
    if (ec) {
        return unexpected(map_fs_error(ec, path));
    }

    std::vector<remote_entry> entries;
    std::filesystem::directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        const auto& dirent = *it;
        std::error_code entry_ec;
        remote_entry entry;
        entry.name = dirent.path().filename().string();
        entry.path = join_remote_path(path, entry.name);
        entry.is_directory = dirent.is_directory(entry_ec);
        if (entry_ec == std::errc::no_such_file_or_directory) {
            continue;  // removed while listing
        }
        if (!entry.is_directory) {
            auto size = dirent.file_size(entry_ec);
            entry.size = entry_ec ? 0 : size;
        }
        auto mtime = dirent.last_write_time(entry_ec);
        if (!entry_ec) {
            entry.modified = to_system_time(mtime);
        }
        entries.push_back(std::move(entry));
    }
    if (ec) {
        return unexpected(map_fs_error(ec, path));
    }
    return entries;
}

auto local_directory_session::open_read(const std::string& path, std::uint64_t offset)
    -> result<std::unique_ptr<remote_read_stream>> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto open = require_open(); !open) {
        return unexpected(open.error());
    }
    auto local = resolve(path);
    if (!local) {
        return unexpected(local.error());
    }

    std::error_code ec;
    auto status = std::filesystem::status(local.value(), ec);
    if (ec) {
        return unexpected(map_fs_error(ec, path));
    }
    if (std::filesystem::is_directory(status)) {
        return unexpected(error(error_code::remote_not_a_file, "is a directory: " + path));
    }

    std::ifstream file(local.value(), std::ios::binary);
    if (!file) {
        return unexpected(error(error_code::remote_permission_denied,
            "cannot open for reading: " + path));
    }
    if (offset > 0) {
        file.seekg(static_cast<std::streamoff>(offset));
        if (!file) {
            return unexpected(error(error_code::remote_io_error,
                "cannot seek to offset " + std::to_string(offset) + ": " + path));
        }
    }
    return std::unique_ptr<remote_read_stream>(
        std::make_unique<local_read_stream>(std::move(file), alive_));
}

}  // namespace transfer_queue
