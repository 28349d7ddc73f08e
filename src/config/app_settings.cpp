// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file app_settings.cpp
 * @brief Settings JSON load/save
 */

#include "transfer_queue/config/app_settings.h"
#include "transfer_queue/core/logging.h"

#include "../core/json_helpers.h"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace transfer_queue {

namespace {

auto home_directory() -> std::filesystem::path {
    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        return home;
    }
    return std::filesystem::temp_directory_path();
}

auto xdg_directory(const char* variable, const char* fallback) -> std::filesystem::path {
    if (const char* value = std::getenv(variable); value != nullptr && *value != '\0') {
        return std::filesystem::path(value) / "transfer_queue";
    }
    return home_directory() / fallback / "transfer_queue";
}

}  // namespace

auto expand_user(const std::filesystem::path& path) -> std::filesystem::path {
    auto text = path.string();
    if (text == "~") {
        return home_directory();
    }
    if (text.rfind("~/", 0) == 0) {
        return home_directory() / text.substr(2);
    }
    return path;
}

auto app_settings::validate() const -> result<void> {
    if (max_concurrent_transfers < min_concurrent_transfers ||
        max_concurrent_transfers > max_concurrent_transfers_limit) {
        return unexpected(error(error_code::invalid_configuration,
            "max_concurrent_transfers must be between 1 and 50, got " +
            std::to_string(max_concurrent_transfers)));
    }
    if (auto_refresh_interval.count() < 0) {
        return unexpected(error(error_code::invalid_configuration,
            "auto_refresh_interval must not be negative"));
    }
    if (download_dir.empty()) {
        return unexpected(error(error_code::invalid_configuration,
            "download_dir must not be empty"));
    }
    return {};
}

auto app_settings::resolved_download_dir() const -> std::filesystem::path {
    return expand_user(download_dir);
}

auto app_settings::load(const std::filesystem::path& path) -> result<app_settings> {
    app_settings settings;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        TQ_LOG_DEBUG(log_category::settings,
            "No settings file at " + path.string() + ", using defaults");
        return settings;
    }

    std::ifstream file(path);
    if (!file) {
        return unexpected(error(error_code::file_read_error,
            "cannot open settings file: " + path.string()));
    }
    std::ostringstream oss;
    oss << file.rdbuf();

    auto parsed = detail::parse_json_object(oss.str());
    if (!parsed) {
        TQ_LOG_ERROR(log_category::settings,
            "Malformed settings file " + path.string() + ": " + parsed.error().message);
        return unexpected(parsed.error());
    }
    const auto& obj = parsed.value();

    if (auto v = detail::json_int(obj, "max_concurrent_transfers")) {
        if (*v < 0) {
            return unexpected(error(error_code::invalid_configuration,
                "max_concurrent_transfers must be between 1 and 50"));
        }
        settings.max_concurrent_transfers = static_cast<std::size_t>(*v);
    }
    if (auto v = detail::json_string(obj, "download_dir")) {
        settings.download_dir = *v;
    }
    if (auto v = detail::json_int(obj, "auto_refresh_interval")) {
        settings.auto_refresh_interval = std::chrono::seconds(*v);
    }
    if (auto v = detail::json_bool(obj, "verify_checksums")) {
        settings.verify_checksums = *v;
    }
    if (auto v = detail::json_bool(obj, "resume_transfers")) {
        settings.resume_transfers = *v;
    }
    if (detail::json_is_null(obj, "bandwidth_limit")) {
        settings.bandwidth_limit = 0;
    } else if (auto v = detail::json_uint(obj, "bandwidth_limit")) {
        settings.bandwidth_limit = static_cast<std::size_t>(*v);
    } else {
        return unexpected(error(error_code::invalid_configuration,
            "bandwidth_limit must be a non-negative integer or null"));
    }

    auto valid = settings.validate();
    if (!valid) {
        TQ_LOG_ERROR(log_category::settings, valid.error().message);
        return unexpected(valid.error());
    }

    TQ_LOG_DEBUG(log_category::settings, "Loaded settings from " + path.string());
    return settings;
}

auto app_settings::save(const std::filesystem::path& path) const -> result<void> {
    auto valid = validate();
    if (!valid) {
        return valid;
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return unexpected(error(error_code::file_write_error,
                "cannot create settings directory: " + ec.message()));
        }
    }

    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"max_concurrent_transfers\": " << max_concurrent_transfers << ",\n";
    oss << "  \"download_dir\": \"" << detail::escape_json_string(download_dir.string()) << "\",\n";
    oss << "  \"auto_refresh_interval\": " << auto_refresh_interval.count() << ",\n";
    oss << "  \"verify_checksums\": " << (verify_checksums ? "true" : "false") << ",\n";
    oss << "  \"resume_transfers\": " << (resume_transfers ? "true" : "false") << ",\n";
    if (bandwidth_limit == 0) {
        oss << "  \"bandwidth_limit\": null\n";
    } else {
        oss << "  \"bandwidth_limit\": " << bandwidth_limit << "\n";
    }
    oss << "}\n";

    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        return unexpected(error(error_code::file_write_error,
            "cannot open settings file for writing: " + path.string()));
    }
    file << oss.str();
    if (!file) {
        return unexpected(error(error_code::file_write_error,
            "failed to write settings file: " + path.string()));
    }
    return {};
}

auto app_settings::config_directory() -> std::filesystem::path {
    return xdg_directory("XDG_CONFIG_HOME", ".config");
}

auto app_settings::state_directory() -> std::filesystem::path {
    return xdg_directory("XDG_CACHE_HOME", ".cache");
}

}  // namespace transfer_queue
