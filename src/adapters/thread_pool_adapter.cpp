// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Transfer executor implementations
 */

#include "transfer_queue/adapters/thread_pool_adapter.h"

#include <exception>
#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace transfer_queue::adapters {

namespace {

auto default_worker_count() -> std::size_t {
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

/**
 * @brief Runs a task, releases its counters, then settles its promise
 */
template <typename OnDone>
auto run_task(const std::function<void()>& task, std::promise<void>& promise,
              OnDone&& on_done) -> void {
    std::exception_ptr failure;
    try {
        task();
    } catch (...) {
        failure = std::current_exception();
    }
    on_done();
    if (failure) {
        promise.set_exception(failure);
    } else {
        promise.set_value();
    }
}

}  // namespace

// ============================================================================
// task_label_counter
// ============================================================================

auto task_label_counter::increment(const std::string& label) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    ++counts_[label];
}

auto task_label_counter::decrement(const std::string& label) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counts_.find(label);
    if (it != counts_.end() && it->second > 0) {
        --it->second;
    }
}

auto task_label_counter::count(const std::string& label) const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counts_.find(label);
    return it != counts_.end() ? it->second : 0;
}

// ============================================================================
// thread_system_executor
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

class pooled_job : public kcenon::thread::job {
public:
    pooled_job(std::function<void()> func, const std::string& name)
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_executor::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    std::size_t worker_count{0};
    std::atomic<std::size_t> active{0};
    task_label_counter labels;
};

thread_system_executor::thread_system_executor(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    std::string pool_name,
    std::size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = std::move(pool_name);
    pimpl_->worker_count = worker_count;
}

thread_system_executor::~thread_system_executor() = default;

auto thread_system_executor::create(std::size_t worker_count, const std::string& pool_name)
    -> std::shared_ptr<thread_system_executor> {
    if (worker_count == 0) {
        worker_count = default_worker_count();
    }

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (std::size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_executor>(std::move(pool), pool_name, worker_count);
}

auto thread_system_executor::submit(std::function<void()> task, const std::string& label)
    -> std::future<void> {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    pimpl_->active.fetch_add(1, std::memory_order_relaxed);
    pimpl_->labels.increment(label);

    // The scheduler joins every future before the executor is released.
    auto* state = pimpl_.get();
    auto wrapped = [task = std::move(task), promise, state, label]() {
        run_task(task, *promise, [state, &label] {
            state->labels.decrement(label);
            state->active.fetch_sub(1, std::memory_order_relaxed);
        });
    };

    pimpl_->pool->enqueue(std::make_unique<pooled_job>(std::move(wrapped), label));
    return future;
}

auto thread_system_executor::worker_count() const -> std::size_t {
    return pimpl_->worker_count;
}

auto thread_system_executor::is_running() const -> bool {
    return pimpl_->pool != nullptr;
}

auto thread_system_executor::active_tasks() const -> std::size_t {
    return pimpl_->active.load(std::memory_order_relaxed);
}

auto thread_system_executor::active_tasks(const std::string& label) const -> std::size_t {
    return pimpl_->labels.count(label);
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_transfer_executor
// ============================================================================

struct async_transfer_executor::impl {
    std::size_t nominal_workers{0};
    std::atomic<std::size_t> active{0};
    task_label_counter labels;
};

async_transfer_executor::async_transfer_executor(std::size_t nominal_workers)
    : pimpl_(std::make_shared<impl>()) {
    pimpl_->nominal_workers = nominal_workers > 0 ? nominal_workers : default_worker_count();
}

async_transfer_executor::~async_transfer_executor() = default;

auto async_transfer_executor::submit(std::function<void()> task, const std::string& label)
    -> std::future<void> {
    pimpl_->active.fetch_add(1, std::memory_order_relaxed);
    pimpl_->labels.increment(label);

    auto state = pimpl_;
    return std::async(std::launch::async, [state, task = std::move(task), label]() {
        std::promise<void> promise;
        auto inner = promise.get_future();
        run_task(task, promise, [&state, &label] {
            state->labels.decrement(label);
            state->active.fetch_sub(1, std::memory_order_relaxed);
        });
        inner.get();
    });
}

auto async_transfer_executor::worker_count() const -> std::size_t {
    return pimpl_->nominal_workers;
}

auto async_transfer_executor::is_running() const -> bool { return true; }

auto async_transfer_executor::active_tasks() const -> std::size_t {
    return pimpl_->active.load(std::memory_order_relaxed);
}

auto async_transfer_executor::active_tasks(const std::string& label) const -> std::size_t {
    return pimpl_->labels.count(label);
}

// ============================================================================
// transfer_executor_factory
// ============================================================================

auto transfer_executor_factory::create(std::size_t worker_count, const std::string& pool_name)
    -> std::shared_ptr<transfer_executor_interface> {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_executor::create(worker_count, pool_name);
#else
    (void)pool_name;
    return std::make_shared<async_transfer_executor>(worker_count);
#endif
}

}  // namespace transfer_queue::adapters
