/**
 * @file reconnect_supervisor.h
 * @brief Owns the live remote_session and re-establishes it after failures
 *
 * State machine:
 * @code
 *   disconnected --connect()--> connecting --ok--> connected
 *   connected --report_failure()--> disconnected --> reconnecting
 *   reconnecting --ok--> connected
 *   reconnecting --max_attempts exhausted--> disconnected (reconnect_exhausted)
 * @endcode
 *
 * Workers never hold the session itself across operations. They take a
 * session_lease, which pins the session instance together with the
 * generation it was issued under. A reconnect replaces the instance and
 * bumps the generation; the old instance is closed so any stream still
 * reading from it fails fast.
 */

#ifndef TRANSFER_QUEUE_SESSION_RECONNECT_SUPERVISOR_H
#define TRANSFER_QUEUE_SESSION_RECONNECT_SUPERVISOR_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include "transfer_queue/core/types.h"
#include "transfer_queue/session/remote_session.h"

namespace transfer_queue {

enum class connection_state {
    disconnected,
    connecting,
    connected,
    reconnecting
};

[[nodiscard]] constexpr auto to_string(connection_state state) -> const char* {
    switch (state) {
        case connection_state::disconnected: return "disconnected";
        case connection_state::connecting: return "connecting";
        case connection_state::connected: return "connected";
        case connection_state::reconnecting: return "reconnecting";
        default: return "unknown";
    }
}

/**
 * @brief Backoff parameters for automatic reconnection
 */
struct reconnect_policy {
    std::size_t max_attempts = 5;  ///< 0 retries forever
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    double backoff_multiplier = 2.0;
    double jitter_ratio = 0.2;  ///< Delay varies by +/- this fraction

    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief A session pinned to the generation it was issued under
 */
struct session_lease {
    std::shared_ptr<remote_session> session;
    std::uint64_t generation{0};

    [[nodiscard]] explicit operator bool() const noexcept { return session != nullptr; }
};

class reconnect_supervisor {
public:
    using state_listener =
        std::function<void(connection_state, const std::optional<error>&)>;
    using listener_id = std::uint64_t;

    explicit reconnect_supervisor(session_factory factory, reconnect_policy policy = {});
    ~reconnect_supervisor();

    reconnect_supervisor(const reconnect_supervisor&) = delete;
    auto operator=(const reconnect_supervisor&) -> reconnect_supervisor& = delete;

    /**
     * @brief Make one synchronous connection attempt
     *
     * On a connectivity failure the error is returned and the backoff loop
     * keeps trying in the background.
     */
    [[nodiscard]] auto connect() -> result<void>;

    /**
     * @brief Current session and generation; empty unless connected
     */
    [[nodiscard]] auto acquire() const -> session_lease;

    [[nodiscard]] auto current_generation() const -> std::uint64_t;

    [[nodiscard]] auto is_connected() const noexcept -> bool;

    [[nodiscard]] auto state() const noexcept -> connection_state;

    /**
     * @brief Most recent connection error, cleared on success
     */
    [[nodiscard]] auto last_error() const -> std::optional<error>;

    /**
     * @brief Report that an operation on a leased session failed
     *
     * Reports carrying a generation other than the current one are
     * ignored; the session they refer to has already been replaced.
     */
    auto report_failure(std::uint64_t generation, const error& cause) -> void;

    /**
     * @brief Skip the current backoff wait, or restart after exhaustion
     */
    auto reconnect_now() -> void;

    /**
     * @brief Close the session and stop the background loop; idempotent
     */
    auto shutdown() -> void;

    /**
     * @brief Register for state changes
     *
     * Listeners run on the supervisor's background thread, in transition
     * order, with no supervisor lock held.
     */
    auto add_listener(state_listener listener) -> listener_id;

    auto remove_listener(listener_id id) -> void;

    [[nodiscard]] auto policy() const -> const reconnect_policy&;

    /**
     * @brief Un-jittered delay before attempt @p attempt (0-based)
     */
    [[nodiscard]] static auto backoff_delay(const reconnect_policy& policy, std::size_t attempt)
        -> std::chrono::milliseconds;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace transfer_queue

#endif  // TRANSFER_QUEUE_SESSION_RECONNECT_SUPERVISOR_H
