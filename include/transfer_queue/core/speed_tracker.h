/**
 * @file speed_tracker.h
 * @brief Windowed transfer rate and smoothed time-to-completion
 */

#ifndef TRANSFER_QUEUE_CORE_SPEED_TRACKER_H
#define TRANSFER_QUEUE_CORE_SPEED_TRACKER_H

#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>

namespace transfer_queue {

/**
 * @brief Tracks the rate of one transfer from periodic byte counts
 *
 * The rate is the byte delta across samples in a sliding window. The ETA
 * is an exponential moving average of remaining / rate so the displayed
 * value does not jump on every chunk. Not thread-safe; owned by the
 * scheduler control loop.
 */
class speed_tracker {
public:
    using clock = std::chrono::steady_clock;

    static constexpr std::chrono::milliseconds default_window{2000};
    static constexpr double default_smoothing = 0.15;

    explicit speed_tracker(std::chrono::milliseconds window = default_window,
                           double smoothing = default_smoothing);

    /**
     * @brief Record the absolute byte count of the transfer
     * @return Current rate in bytes per second
     */
    auto update(std::uint64_t total_bytes, clock::time_point now = clock::now()) -> double;

    [[nodiscard]] auto bytes_per_second() const noexcept -> double { return rate_; }

    /**
     * @brief Smoothed seconds until @p remaining_bytes are transferred
     * @return nullopt while no rate is known
     */
    auto eta(std::uint64_t remaining_bytes) -> std::optional<std::chrono::seconds>;

    /**
     * @brief Forget all samples, e.g. when a transfer is re-admitted
     */
    void reset();

private:
    struct sample {
        clock::time_point at;
        std::uint64_t total_bytes;
    };

    std::chrono::milliseconds window_;
    double smoothing_;
    std::deque<sample> samples_;
    double rate_{0.0};
    std::optional<double> smoothed_eta_;
};

}  // namespace transfer_queue

#endif  // TRANSFER_QUEUE_CORE_SPEED_TRACKER_H
