// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker executor used by the queue scheduler to run transfers
 *
 * Each admitted transfer runs as one long-lived task. The scheduler bounds
 * concurrency itself, so the executor only has to provide at least as many
 * threads as the concurrency ceiling.
 *
 * Two implementations are available:
 * - thread_system_executor wraps kcenon::thread::thread_pool when the
 *   library is built with thread_system
 * - async_transfer_executor starts one std::async task per transfer
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace transfer_queue::adapters {

/**
 * @brief Executor abstraction for transfer tasks
 *
 * Tasks carry a label ("download", "verify", ...) so that per-kind counts
 * can be reported while the tasks run.
 */
class transfer_executor_interface {
public:
    virtual ~transfer_executor_interface() = default;

    /**
     * @brief Run @p task on a worker thread
     *
     * An exception escaping the task is stored in the returned future.
     */
    virtual auto submit(std::function<void()> task, const std::string& label)
        -> std::future<void> = 0;

    [[nodiscard]] virtual auto worker_count() const -> std::size_t = 0;

    [[nodiscard]] virtual auto is_running() const -> bool = 0;

    /**
     * @brief Tasks submitted and not yet finished
     */
    [[nodiscard]] virtual auto active_tasks() const -> std::size_t = 0;

    [[nodiscard]] virtual auto active_tasks(const std::string& label) const -> std::size_t = 0;
};

/**
 * @brief Per-label running task counter shared by the executors
 */
class task_label_counter {
public:
    auto increment(const std::string& label) -> void;
    auto decrement(const std::string& label) -> void;
    [[nodiscard]] auto count(const std::string& label) const -> std::size_t;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::size_t> counts_;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Executor backed by thread_system's thread_pool
 */
class thread_system_executor : public transfer_executor_interface {
public:
    thread_system_executor(std::shared_ptr<kcenon::thread::thread_pool> pool,
                           std::string pool_name, std::size_t worker_count);
    ~thread_system_executor() override;

    thread_system_executor(const thread_system_executor&) = delete;
    auto operator=(const thread_system_executor&) -> thread_system_executor& = delete;

    /**
     * @brief Create and start a pool with @p worker_count workers
     */
    [[nodiscard]] static auto create(std::size_t worker_count, const std::string& pool_name)
        -> std::shared_ptr<thread_system_executor>;

    auto submit(std::function<void()> task, const std::string& label)
        -> std::future<void> override;

    [[nodiscard]] auto worker_count() const -> std::size_t override;
    [[nodiscard]] auto is_running() const -> bool override;
    [[nodiscard]] auto active_tasks() const -> std::size_t override;
    [[nodiscard]] auto active_tasks(const std::string& label) const -> std::size_t override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Executor that starts each task with std::async
 *
 * No queueing: every submitted task gets its own thread immediately.
 */
class async_transfer_executor : public transfer_executor_interface {
public:
    explicit async_transfer_executor(std::size_t nominal_workers = 0);
    ~async_transfer_executor() override;

    async_transfer_executor(const async_transfer_executor&) = delete;
    auto operator=(const async_transfer_executor&) -> async_transfer_executor& = delete;

    auto submit(std::function<void()> task, const std::string& label)
        -> std::future<void> override;

    [[nodiscard]] auto worker_count() const -> std::size_t override;
    [[nodiscard]] auto is_running() const -> bool override;
    [[nodiscard]] auto active_tasks() const -> std::size_t override;
    [[nodiscard]] auto active_tasks(const std::string& label) const -> std::size_t override;

private:
    struct impl;
    std::shared_ptr<impl> pimpl_;
};

/**
 * @brief Picks thread_system when available, std::async otherwise
 */
class transfer_executor_factory {
public:
    [[nodiscard]] static auto create(std::size_t worker_count,
                                     const std::string& pool_name = "transfer_queue_workers")
        -> std::shared_ptr<transfer_executor_interface>;

    [[nodiscard]] static constexpr auto has_thread_system() noexcept -> bool {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace transfer_queue::adapters
