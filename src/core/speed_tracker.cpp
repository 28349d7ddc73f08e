/**
 * @file speed_tracker.cpp
 * @brief Windowed transfer rate tracking
 */

#include "transfer_queue/core/speed_tracker.h"

#include <cmath>

namespace transfer_queue {

speed_tracker::speed_tracker(std::chrono::milliseconds window, double smoothing)
    : window_(window), smoothing_(smoothing) {}

auto speed_tracker::update(std::uint64_t total_bytes, clock::time_point now) -> double {
    // A byte count below the last sample means the transfer restarted.
    if (!samples_.empty() && total_bytes < samples_.back().total_bytes) {
        reset();
    }

    samples_.push_back(sample{now, total_bytes});
    while (samples_.size() > 1 && now - samples_.front().at > window_) {
        samples_.pop_front();
    }

    if (samples_.size() < 2) {
        rate_ = 0.0;
        return rate_;
    }

    auto span = std::chrono::duration<double>(samples_.back().at - samples_.front().at).count();
    if (span <= 0.0) {
        return rate_;
    }

    auto delta = samples_.back().total_bytes - samples_.front().total_bytes;
    rate_ = static_cast<double>(delta) / span;
    return rate_;
}

auto speed_tracker::eta(std::uint64_t remaining_bytes) -> std::optional<std::chrono::seconds> {
    if (rate_ <= 0.0) {
        return std::nullopt;
    }

    double raw = static_cast<double>(remaining_bytes) / rate_;
    if (smoothed_eta_) {
        smoothed_eta_ = smoothing_ * raw + (1.0 - smoothing_) * *smoothed_eta_;
    } else {
        smoothed_eta_ = raw;
    }
    return std::chrono::seconds(static_cast<std::int64_t>(std::llround(*smoothed_eta_)));
}

void speed_tracker::reset() {
    samples_.clear();
    rate_ = 0.0;
    smoothed_eta_.reset();
}

}  // namespace transfer_queue
