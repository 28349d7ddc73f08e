/**
 * @file bandwidth_limiter.h
 * @brief Global download rate limiting using a token bucket
 *
 * One limiter is shared by every transfer worker, so the configured rate
 * bounds the aggregate throughput of the queue rather than each transfer.
 */

#ifndef TRANSFER_QUEUE_CORE_BANDWIDTH_LIMITER_H
#define TRANSFER_QUEUE_CORE_BANDWIDTH_LIMITER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace transfer_queue {

/**
 * @brief Token bucket bandwidth limiter
 *
 * The bucket holds one second worth of tokens. A request larger than the
 * bucket is admitted once the bucket is full and leaves it in debt, so
 * chunk sizes above the configured rate still make progress at that rate.
 *
 * @code
 * bandwidth_limiter limiter(10 * 1024 * 1024);  // 10 MB/s across all workers
 *
 * limiter.acquire(chunk.size());  // blocks while the rate is exceeded
 * limiter.set_limit(0);           // unlimited, wakes blocked workers
 * @endcode
 */
class bandwidth_limiter {
public:
    /**
     * @param bytes_per_second Maximum rate; 0 means unlimited
     */
    explicit bandwidth_limiter(std::size_t bytes_per_second = 0);

    ~bandwidth_limiter();

    bandwidth_limiter(const bandwidth_limiter&) = delete;
    auto operator=(const bandwidth_limiter&) -> bandwidth_limiter& = delete;

    /**
     * @brief Block until @p bytes may be transferred
     */
    auto acquire(std::size_t bytes) -> void;

    /**
     * @brief Take tokens only if available right now
     */
    [[nodiscard]] auto try_acquire(std::size_t bytes) -> bool;

    /**
     * @brief Change the rate; takes effect for waiting and future callers
     * @param bytes_per_second New rate (0 = unlimited)
     */
    auto set_limit(std::size_t bytes_per_second) -> void;

    [[nodiscard]] auto get_limit() const noexcept -> std::size_t;

    [[nodiscard]] auto is_enabled() const noexcept -> bool;

    /**
     * @brief Release every blocked caller and stop limiting
     *
     * Used on shutdown so workers never stay parked on the bucket.
     */
    auto release_all() -> void;

    [[nodiscard]] auto available_tokens() const -> double;

private:
    auto refill_tokens() -> void;

    [[nodiscard]] auto wait_time_for(double needed) const -> std::chrono::microseconds;

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::atomic<std::size_t> bytes_per_second_;
    bool released_{false};

    double tokens_{0.0};
    double capacity_{0.0};
    std::chrono::steady_clock::time_point last_refill_;
};

}  // namespace transfer_queue

#endif  // TRANSFER_QUEUE_CORE_BANDWIDTH_LIMITER_H
