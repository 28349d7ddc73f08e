/**
 * @file bandwidth_limiter.cpp
 * @brief Token bucket rate limiter
 */

#include "transfer_queue/core/bandwidth_limiter.h"

#include <algorithm>
#include <cstdint>

namespace transfer_queue {

bandwidth_limiter::bandwidth_limiter(std::size_t bytes_per_second)
    : bytes_per_second_(bytes_per_second)
    , last_refill_(std::chrono::steady_clock::now()) {
    if (bytes_per_second > 0) {
        capacity_ = static_cast<double>(bytes_per_second);
        tokens_ = capacity_;
    }
}

bandwidth_limiter::~bandwidth_limiter() {
    release_all();
}

auto bandwidth_limiter::acquire(std::size_t bytes) -> void {
    if (bytes == 0 || bytes_per_second_.load(std::memory_order_relaxed) == 0) {
        return;
    }

    std::unique_lock lock(mutex_);

    while (!released_ && bytes_per_second_.load(std::memory_order_relaxed) > 0) {
        refill_tokens();

        // Oversized requests wait for a full bucket, then go into debt.
        double needed = std::min(static_cast<double>(bytes), capacity_);
        if (tokens_ >= needed) {
            tokens_ -= static_cast<double>(bytes);
            return;
        }

        cv_.wait_for(lock, wait_time_for(needed));
    }
}

auto bandwidth_limiter::try_acquire(std::size_t bytes) -> bool {
    if (bytes == 0 || bytes_per_second_.load(std::memory_order_relaxed) == 0) {
        return true;
    }

    std::lock_guard lock(mutex_);
    if (released_) {
        return true;
    }
    refill_tokens();

    if (tokens_ >= static_cast<double>(bytes)) {
        tokens_ -= static_cast<double>(bytes);
        return true;
    }
    return false;
}

auto bandwidth_limiter::set_limit(std::size_t bytes_per_second) -> void {
    {
        std::lock_guard lock(mutex_);
        refill_tokens();

        auto old_capacity = capacity_;
        bytes_per_second_.store(bytes_per_second);

        if (bytes_per_second > 0) {
            capacity_ = static_cast<double>(bytes_per_second);
            if (old_capacity > 0.0) {
                tokens_ = std::min(tokens_ * (capacity_ / old_capacity), capacity_);
            } else {
                tokens_ = capacity_;
            }
            released_ = false;
        } else {
            capacity_ = 0.0;
            tokens_ = 0.0;
        }
        last_refill_ = std::chrono::steady_clock::now();
    }
    cv_.notify_all();
}

auto bandwidth_limiter::get_limit() const noexcept -> std::size_t {
    return bytes_per_second_.load(std::memory_order_relaxed);
}

auto bandwidth_limiter::is_enabled() const noexcept -> bool {
    return bytes_per_second_.load(std::memory_order_relaxed) > 0;
}

auto bandwidth_limiter::release_all() -> void {
    {
        std::lock_guard lock(mutex_);
        released_ = true;
    }
    cv_.notify_all();
}

auto bandwidth_limiter::available_tokens() const -> double {
    std::lock_guard lock(mutex_);
    auto elapsed = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - last_refill_).count();
    auto rate = static_cast<double>(bytes_per_second_.load(std::memory_order_relaxed));
    return std::min(tokens_ + elapsed * rate, capacity_);
}

auto bandwidth_limiter::refill_tokens() -> void {
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration<double>(now - last_refill_).count();

    if (elapsed > 0.0) {
        auto rate = static_cast<double>(bytes_per_second_.load(std::memory_order_relaxed));
        tokens_ = std::min(tokens_ + elapsed * rate, capacity_);
        last_refill_ = now;
    }
}

auto bandwidth_limiter::wait_time_for(double needed) const -> std::chrono::microseconds {
    auto rate = static_cast<double>(bytes_per_second_.load(std::memory_order_relaxed));
    if (rate <= 0.0) {
        return std::chrono::microseconds::zero();
    }

    double missing = std::max(needed - tokens_, 0.0);
    auto micros = static_cast<std::int64_t>(missing / rate * 1'000'000.0);
    return std::chrono::microseconds(std::max<std::int64_t>(micros, 1000));
}

}  // namespace transfer_queue
