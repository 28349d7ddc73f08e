/**
 * @file remote_session.cpp
 * @brief Default remote_session behaviour and remote path helpers
 */

#include "transfer_queue/session/remote_session.h"

#include <array>

namespace transfer_queue {

auto remote_session::read_file(const std::string& path, std::size_t max_bytes)
    -> result<std::string> {
    auto stream = open_read(path, 0);
    if (!stream) {
        return unexpected(stream.error());
    }

    std::string content;
    std::array<std::byte, 16 * 1024> buffer{};
    while (true) {
        auto n = stream.value()->read(buffer);
        if (!n) {
            return unexpected(n.error());
        }
        if (n.value() == 0) {
            break;
        }
        if (content.size() + n.value() > max_bytes) {
            return unexpected(error(error_code::remote_io_error,
                "file exceeds " + std::to_string(max_bytes) + " bytes: " + path));
        }
        content.append(reinterpret_cast<const char*>(buffer.data()), n.value());
    }
    return content;
}

auto join_remote_path(std::string_view directory, std::string_view name) -> std::string {
    std::string joined(directory);
    while (joined.size() > 1 && joined.back() == '/') {
        joined.pop_back();
    }
    while (!name.empty() && name.front() == '/') {
        name.remove_prefix(1);
    }
    if (joined.empty() || joined.back() != '/') {
        joined += '/';
    }
    joined += name;
    return joined;
}

auto remote_basename(std::string_view path) -> std::string {
    while (path.size() > 1 && path.back() == '/') {
        path.remove_suffix(1);
    }
    auto pos = path.find_last_of('/');
    if (pos == std::string_view::npos) {
        return std::string(path);
    }
    return std::string(path.substr(pos + 1));
}

auto remote_parent(std::string_view path) -> std::string {
    while (path.size() > 1 && path.back() == '/') {
        path.remove_suffix(1);
    }
    auto pos = path.find_last_of('/');
    if (pos == std::string_view::npos) {
        return ".";
    }
    if (pos == 0) {
        return "/";
    }
    return std::string(path.substr(0, pos));
}

auto is_safe_path_component(std::string_view component) -> bool {
    if (component.empty() || component == "." || component == "..") {
        return false;
    }
    return component.find('/') == std::string_view::npos &&
           component.find('\\') == std::string_view::npos &&
           component.find('\0') == std::string_view::npos;
}

}  // namespace transfer_queue
