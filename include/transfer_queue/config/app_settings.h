// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file app_settings.h
 * @brief User settings consumed by the transfer queue
 *
 * Stored as a flat JSON object. Keys missing from the file take their
 * defaults; unknown keys are ignored.
 *
 * @code
 * auto settings = app_settings::load(app_settings::default_path());
 * if (settings) {
 *     auto dir = settings.value().resolved_download_dir();
 * }
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>

#include "transfer_queue/core/types.h"

namespace transfer_queue {

struct app_settings {
    static constexpr std::size_t min_concurrent_transfers = 1;
    static constexpr std::size_t max_concurrent_transfers_limit = 50;

    std::size_t max_concurrent_transfers = 10;
    std::filesystem::path download_dir = "~/Downloads";
    std::chrono::seconds auto_refresh_interval{30};  ///< 0 disables refresh
    bool verify_checksums = true;
    bool resume_transfers = true;
    std::size_t bandwidth_limit = 0;  ///< Bytes per second, 0 = unlimited

    /**
     * @brief Check value ranges
     * @return invalid_configuration naming the first offending key
     */
    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief download_dir with a leading `~` expanded to $HOME
     */
    [[nodiscard]] auto resolved_download_dir() const -> std::filesystem::path;

    /**
     * @brief Read settings; a missing file yields defaults
     */
    [[nodiscard]] static auto load(const std::filesystem::path& path) -> result<app_settings>;

    /**
     * @brief Write settings, creating parent directories
     */
    [[nodiscard]] auto save(const std::filesystem::path& path) const -> result<void>;

    /**
     * @brief $XDG_CONFIG_HOME/transfer_queue, falling back to ~/.config/transfer_queue
     */
    [[nodiscard]] static auto config_directory() -> std::filesystem::path;

    /**
     * @brief $XDG_CACHE_HOME/transfer_queue, falling back to ~/.cache/transfer_queue
     *
     * Holds queue.json.
     */
    [[nodiscard]] static auto state_directory() -> std::filesystem::path;

    [[nodiscard]] static auto default_path() -> std::filesystem::path {
        return config_directory() / "settings.json";
    }

    [[nodiscard]] auto operator==(const app_settings& other) const -> bool = default;
};

/**
 * @brief Expand a leading `~` or `~/` using $HOME
 */
[[nodiscard]] auto expand_user(const std::filesystem::path& path) -> std::filesystem::path;

}  // namespace transfer_queue
