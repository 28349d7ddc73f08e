/**
 * @file reconnect_supervisor.cpp
 * @brief Session ownership and backoff loop
 */

#include "transfer_queue/session/reconnect_supervisor.h"
#include "transfer_queue/core/logging.h"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <condition_variable>
#include <map>
#include <mutex>
#include <random>
#include <thread>
#include <vector>

namespace transfer_queue {

auto reconnect_policy::validate() const -> result<void> {
    if (initial_delay.count() < 0 || max_delay < initial_delay) {
        return unexpected(error(error_code::invalid_configuration,
            "reconnect delays must satisfy 0 <= initial_delay <= max_delay"));
    }
    if (backoff_multiplier < 1.0) {
        return unexpected(error(error_code::invalid_configuration,
            "backoff_multiplier must be at least 1.0"));
    }
    if (jitter_ratio < 0.0 || jitter_ratio >= 1.0) {
        return unexpected(error(error_code::invalid_configuration,
            "jitter_ratio must be in [0, 1)"));
    }
    return {};
}

struct reconnect_supervisor::impl {
    struct state_event {
        connection_state state;
        std::optional<error> cause;
    };

    session_factory factory;
    reconnect_policy policy;

    mutable std::mutex mutex;
    std::condition_variable cv;
    std::shared_ptr<remote_session> session;
    std::uint64_t generation{0};
    std::atomic<connection_state> state{connection_state::disconnected};
    std::optional<error> last_error;

    bool reconnect_requested{false};
    bool skip_delay{false};
    bool shutting_down{false};
    std::vector<state_event> pending_events;

    std::mutex listener_mutex;
    std::map<listener_id, state_listener> listeners;
    listener_id next_listener_id{1};

    std::mt19937 rng{std::random_device{}()};
    std::thread loop;

    impl(session_factory f, reconnect_policy p)
        : factory(std::move(f)), policy(p) {}

    // Caller holds mutex.
    void transition(connection_state next, std::optional<error> cause = std::nullopt) {
        state.store(next);
        pending_events.push_back({next, std::move(cause)});
        cv.notify_all();
    }

    void deliver_events(std::unique_lock<std::mutex>& lock) {
        while (!pending_events.empty()) {
            auto events = std::move(pending_events);
            pending_events.clear();
            lock.unlock();
            {
                std::vector<state_listener> targets;
                {
                    std::lock_guard<std::mutex> guard(listener_mutex);
                    for (const auto& [id, listener] : listeners) {
                        targets.push_back(listener);
                    }
                }
                for (const auto& event : events) {
                    for (const auto& listener : targets) {
                        listener(event.state, event.cause);
                    }
                }
            }
            lock.lock();
        }
    }

    auto jittered(std::chrono::milliseconds base) -> std::chrono::milliseconds {
        if (policy.jitter_ratio <= 0.0 || base.count() == 0) {
            return base;
        }
        std::uniform_real_distribution<double> dist(-policy.jitter_ratio, policy.jitter_ratio);
        auto scaled = static_cast<double>(base.count()) * (1.0 + dist(rng));
        return std::chrono::milliseconds(static_cast<std::int64_t>(std::max(0.0, scaled)));
    }

    void run() {
        std::unique_lock<std::mutex> lock(mutex);
        while (true) {
            cv.wait(lock, [this] {
                return shutting_down || reconnect_requested || !pending_events.empty();
            });
            deliver_events(lock);
            if (shutting_down) {
                break;
            }
            if (reconnect_requested) {
                reconnect_requested = false;
                run_backoff(lock);
                deliver_events(lock);
            }
        }
    }

    void run_backoff(std::unique_lock<std::mutex>& lock) {
        transition(connection_state::reconnecting, last_error);
        deliver_events(lock);

        std::size_t attempt = 0;
        while (policy.max_attempts == 0 || attempt < policy.max_attempts) {
            auto delay = jittered(backoff_delay(policy, attempt));
            TQ_LOG_INFO(log_category::reconnect,
                "Reconnect attempt " + std::to_string(attempt + 1) + " in " +
                std::to_string(delay.count()) + "ms");

            cv.wait_for(lock, delay, [this] { return shutting_down || skip_delay; });
            if (shutting_down) {
                return;
            }
            skip_delay = false;
            ++attempt;

            lock.unlock();
            auto candidate = factory ? factory() : nullptr;
            result<void> outcome = candidate
                ? candidate->connect()
                : result<void>(unexpected(error(error_code::connection_failed,
                                                "session factory produced no session")));
            lock.lock();

            if (shutting_down) {
                if (candidate) {
                    candidate->close();
                }
                return;
            }

            if (outcome) {
                session = std::move(candidate);
                ++generation;
                last_error.reset();
                TQ_LOG_INFO(log_category::reconnect,
                    "Reconnected (generation " + std::to_string(generation) + ")");
                transition(connection_state::connected);
                return;
            }

            last_error = outcome.error();
            TQ_LOG_WARN(log_category::reconnect,
                "Reconnect attempt " + std::to_string(attempt) + " failed: " +
                outcome.error().message);
        }

        auto cause = error(error_code::reconnect_exhausted,
            "gave up after " + std::to_string(attempt) + " attempts" +
            (last_error ? ": " + last_error->message : std::string()));
        TQ_LOG_ERROR(log_category::reconnect, cause.message);
        last_error = cause;
        transition(connection_state::disconnected, cause);
    }
};

reconnect_supervisor::reconnect_supervisor(session_factory factory, reconnect_policy policy)
    : impl_(std::make_unique<impl>(std::move(factory), policy)) {
    impl_->loop = std::thread([state = impl_.get()] { state->run(); });
}

reconnect_supervisor::~reconnect_supervisor() {
    shutdown();
}

auto reconnect_supervisor::connect() -> result<void> {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    if (impl_->shutting_down) {
        return unexpected(error(error_code::not_initialized, "supervisor is shut down"));
    }
    auto current = impl_->state.load();
    if (current == connection_state::connected) {
        return {};
    }
    if (current != connection_state::disconnected) {
        return unexpected(error(error_code::not_connected, "connection attempt in progress"));
    }
    impl_->transition(connection_state::connecting);
    lock.unlock();

    auto candidate = impl_->factory ? impl_->factory() : nullptr;
    result<void> outcome = candidate
        ? candidate->connect()
        : result<void>(unexpected(error(error_code::connection_failed,
                                        "session factory produced no session")));

    lock.lock();
    if (impl_->shutting_down) {
        if (candidate) {
            candidate->close();
        }
        return unexpected(error(error_code::not_initialized, "supervisor is shut down"));
    }

    if (outcome) {
        impl_->session = std::move(candidate);
        ++impl_->generation;
        impl_->last_error.reset();
        TQ_LOG_INFO(log_category::reconnect, "Connected");
        impl_->transition(connection_state::connected);
        return {};
    }

    impl_->last_error = outcome.error();
    TQ_LOG_WARN(log_category::reconnect, "Connect failed: " + outcome.error().message);
    impl_->transition(connection_state::disconnected, outcome.error());
    if (is_connectivity(outcome.error().code)) {
        impl_->reconnect_requested = true;
        impl_->cv.notify_all();
    }
    return outcome;
}

auto reconnect_supervisor::acquire() const -> session_lease {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->state.load() != connection_state::connected || !impl_->session) {
        return {};
    }
    return session_lease{impl_->session, impl_->generation};
}

auto reconnect_supervisor::current_generation() const -> std::uint64_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->generation;
}

auto reconnect_supervisor::is_connected() const noexcept -> bool {
    return impl_->state.load() == connection_state::connected;
}

auto reconnect_supervisor::state() const noexcept -> connection_state {
    return impl_->state.load();
}

auto reconnect_supervisor::last_error() const -> std::optional<error> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->last_error;
}

auto reconnect_supervisor::report_failure(std::uint64_t generation, const error& cause) -> void {
    std::shared_ptr<remote_session> dead;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->shutting_down) {
            return;
        }
        if (generation != impl_->generation ||
            impl_->state.load() != connection_state::connected) {
            TQ_LOG_DEBUG(log_category::reconnect,
                "Ignoring stale failure report from generation " + std::to_string(generation) +
                ": " + cause.message);
            return;
        }

        TQ_LOG_WARN(log_category::reconnect,
            "Session generation " + std::to_string(generation) + " lost: " + cause.message);
        dead = std::move(impl_->session);
        impl_->last_error = cause;
        impl_->transition(connection_state::disconnected, cause);
        impl_->reconnect_requested = true;
        impl_->cv.notify_all();
    }
    if (dead) {
        dead->close();
    }
}

auto reconnect_supervisor::reconnect_now() -> void {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->shutting_down) {
        return;
    }
    switch (impl_->state.load()) {
        case connection_state::reconnecting:
            impl_->skip_delay = true;
            break;
        case connection_state::disconnected:
            impl_->reconnect_requested = true;
            impl_->skip_delay = true;
            break;
        default:
            return;
    }
    TQ_LOG_INFO(log_category::reconnect, "Manual reconnect requested");
    impl_->cv.notify_all();
}

auto reconnect_supervisor::shutdown() -> void {
    std::shared_ptr<remote_session> closing;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->shutting_down) {
            return;
        }
        impl_->shutting_down = true;
        closing = std::move(impl_->session);
        impl_->state.store(connection_state::disconnected);
        impl_->cv.notify_all();
    }
    if (impl_->loop.joinable() && impl_->loop.get_id() != std::this_thread::get_id()) {
        impl_->loop.join();
    }
    if (closing) {
        closing->close();
    }
}

auto reconnect_supervisor::add_listener(state_listener listener) -> listener_id {
    std::lock_guard<std::mutex> lock(impl_->listener_mutex);
    auto id = impl_->next_listener_id++;
    impl_->listeners.emplace(id, std::move(listener));
    return id;
}

auto reconnect_supervisor::remove_listener(listener_id id) -> void {
    std::lock_guard<std::mutex> lock(impl_->listener_mutex);
    impl_->listeners.erase(id);
}

auto reconnect_supervisor::policy() const -> const reconnect_policy& {
    return impl_->policy;
}

auto reconnect_supervisor::backoff_delay(const reconnect_policy& policy, std::size_t attempt)
    -> std::chrono::milliseconds {
    auto base = static_cast<double>(policy.initial_delay.count());
    auto scaled = base * std::pow(policy.backoff_multiplier, static_cast<double>(attempt));
    auto capped = std::min(scaled, static_cast<double>(policy.max_delay.count()));
    return std::chrono::milliseconds(static_cast<std::int64_t>(capped));
}

}  // namespace transfer_queue
