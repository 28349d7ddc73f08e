/**
 * @file queue_scheduler.cpp
 * @brief Transfer queue orchestrator implementation
 *
 * Threading:
 * - public calls mutate records under impl::mutex and poke the control loop
 * - workers never take impl::mutex; they post worker_messages to the
 *   mailbox, which the control loop drains, applies and follows with
 *   admission, snapshot publication, debounced persistence and event
 *   dispatch
 * - the supervisor's listener only posts to the mailbox
 */

#include "transfer_queue/queue/queue_scheduler.h"
#include "transfer_queue/core/bandwidth_limiter.h"
#include "transfer_queue/core/logging.h"
#include "transfer_queue/core/speed_tracker.h"
#include "transfer_queue/queue/persistence_store.h"
#include "transfer_queue/queue/transfer_worker.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <future>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace transfer_queue {

namespace {

using steady_clock = std::chrono::steady_clock;

constexpr auto loop_tick = std::chrono::milliseconds(50);

auto lowercase(std::string text) -> std::string {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

auto record_context(const transfer_record& rec) -> transfer_log_context {
    transfer_log_context ctx;
    ctx.record_id = rec.id;
    ctx.remote_path = rec.remote_path;
    ctx.local_path = rec.local_path.string();
    ctx.size_bytes = rec.size_bytes;
    ctx.bytes_transferred = rec.bytes_transferred;
    ctx.retry_count = rec.retry_count;
    if (rec.last_error) {
        ctx.error_message = rec.last_error->message;
    }
    return ctx;
}

struct worker_message {
    enum class kind { size_known, checksum_found, progress, verifying, finished, connection };

    kind type{kind::progress};
    record_id id{0};
    std::uint64_t value{0};
    std::optional<manifest_entry> checksum;
    std::optional<worker_result> outcome;
    connection_state connection{connection_state::disconnected};
};

/**
 * @brief Inbox of the control loop, shared with workers and the supervisor
 */
struct mailbox {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<worker_message> messages;
    bool wake{false};
    bool exit{false};

    void post(worker_message message) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            messages.push_back(std::move(message));
        }
        cv.notify_one();
    }

    void poke() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            wake = true;
        }
        cv.notify_one();
    }
};

}  // namespace

// ============================================================================
// scheduler_config
// ============================================================================

auto scheduler_config::validate() const -> result<void> {
    if (concurrency_limit < min_concurrency || concurrency_limit > max_concurrency) {
        return unexpected(error(error_code::invalid_configuration,
            "concurrency_limit must be between 1 and 50, got " +
            std::to_string(concurrency_limit)));
    }
    if (chunk_size == 0) {
        return unexpected(error(error_code::invalid_configuration, "chunk_size must be positive"));
    }
    if (retry_delay.count() < 0 || persist_interval.count() < 0) {
        return unexpected(error(error_code::invalid_configuration,
            "retry_delay and persist_interval must not be negative"));
    }
    if (manifest_size_limit == 0) {
        return unexpected(error(error_code::invalid_configuration,
            "manifest_size_limit must be positive"));
    }
    return {};
}

auto scheduler_config::from_settings(const app_settings& settings) -> scheduler_config {
    scheduler_config config;
    config.concurrency_limit = settings.max_concurrent_transfers;
    config.download_directory = settings.resolved_download_dir();
    config.verify_checksums = settings.verify_checksums;
    config.resume_transfers = settings.resume_transfers;
    config.bandwidth_limit = settings.bandwidth_limit;
    config.state_file = app_settings::state_directory() / "queue.json";
    return config;
}

// ============================================================================
// impl
// ============================================================================

struct queue_scheduler::impl {
    struct binding {
        std::shared_ptr<transfer_control> control;
        std::future<void> future;
    };

    struct runtime {
        steady_clock::time_point not_before{};
        bool restart_from_zero{false};
        bool resume_pending{false};  ///< A paused outcome requeues instead
        speed_tracker speed;
    };

    scheduler_config config;
    std::shared_ptr<reconnect_supervisor> supervisor;
    std::shared_ptr<bandwidth_limiter> limiter;
    std::shared_ptr<adapters::transfer_executor_interface> executor;
    std::shared_ptr<transfer_worker> worker;
    std::optional<persistence_store> store;
    reconnect_supervisor::listener_id supervisor_listener{0};

    // Canonical state, guarded by mutex
    mutable std::mutex mutex;
    std::condition_variable state_cv;
    std::map<record_id, transfer_record> records;
    std::unordered_map<record_id, binding> bindings;
    std::unordered_map<record_id, runtime> runtimes;
    record_id next_id{1};
    std::size_t limit{10};
    bool queue_stopped{false};
    bool running{false};
    bool stopping{false};
    connection_state last_connection{connection_state::disconnected};
    bool dirty{false};
    steady_clock::time_point last_persist{};
    std::vector<queue_event> pending_events;
    std::vector<std::future<void>> reaped;

    std::shared_ptr<mailbox> inbox = std::make_shared<mailbox>();
    std::thread loop;
    std::mutex lifecycle_mutex;

    std::atomic<std::shared_ptr<const queue_snapshot>> published;

    std::recursive_mutex dispatch_mutex;
    std::mutex listener_mutex;
    std::map<subscription_id, event_listener> listeners;
    subscription_id next_subscription{1};

    // ------------------------------------------------------------------------
    // Helpers; *_locked functions require mutex
    // ------------------------------------------------------------------------

    auto find_locked(record_id id) -> transfer_record* {
        auto it = records.find(id);
        return it != records.end() ? &it->second : nullptr;
    }

    auto live_count_locked() const -> std::size_t {
        return static_cast<std::size_t>(std::count_if(
            records.begin(), records.end(),
            [](const auto& entry) { return !entry.second.is_terminal(); }));
    }

    void densify_locked() {
        std::vector<transfer_record*> live;
        for (auto& [id, rec] : records) {
            if (!rec.is_terminal()) {
                live.push_back(&rec);
            }
        }
        std::sort(live.begin(), live.end(), [](const transfer_record* a, const transfer_record* b) {
            return a->order != b->order ? a->order < b->order : a->id < b->id;
        });
        for (std::size_t i = 0; i < live.size(); ++i) {
            live[i]->order = i;
        }
    }

    void signal_locked(record_id id, control_signal signal) {
        if (auto it = bindings.find(id); it != bindings.end()) {
            it->second.control->request(signal);
        }
    }

    // Resume of a record whose worker may not have honoured its pause yet.
    void withdraw_pause_locked(record_id id) {
        auto it = bindings.find(id);
        if (it == bindings.end()) {
            return;
        }
        it->second.control->withdraw_pause();
        runtimes[id].resume_pending = true;
    }

    void emit_locked(queue_event_kind kind, record_id id = 0) {
        queue_event event;
        event.kind = kind;
        event.id = id;
        event.connection = last_connection;
        if (id != 0) {
            if (auto* rec = find_locked(id)) {
                event.record = *rec;
            }
        }
        pending_events.push_back(std::move(event));
    }

    void set_state_locked(transfer_record& rec, record_state next) {
        if (rec.state == next) {
            return;
        }
        auto was_terminal = rec.is_terminal();
        rec.state = next;
        if (is_terminal(next)) {
            rec.completed_at = transfer_record::clock::now();
            rec.speed_bps = 0.0;
            rec.eta.reset();
        }
        if (was_terminal != rec.is_terminal()) {
            densify_locked();
        }
        dirty = true;
        emit_locked(queue_event_kind::state_changed, rec.id);
    }

    auto make_snapshot_locked() const -> std::shared_ptr<const queue_snapshot> {
        auto snap = std::make_shared<queue_snapshot>();
        snap->records.reserve(records.size());
        for (const auto& [id, rec] : records) {
            snap->records.push_back(rec);
        }
        sort_for_display(snap->records);
        snap->queue_stopped = queue_stopped;
        snap->connection = last_connection;
        if (last_connection != connection_state::connected) {
            snap->connection_error = supervisor->last_error();
        }
        snap->concurrency_limit = limit;
        snap->next_id = next_id;
        return snap;
    }

    void publish_locked() {
        published.store(make_snapshot_locked());
        state_cv.notify_all();
    }

    auto is_idle_locked() const -> bool {
        if (!bindings.empty()) {
            return false;
        }
        return std::none_of(records.begin(), records.end(), [](const auto& entry) {
            auto state = entry.second.state;
            return state == record_state::queued || state == record_state::active ||
                   state == record_state::verifying;
        });
    }

    void flush_events() {
        std::lock_guard<std::recursive_mutex> dispatch(dispatch_mutex);
        std::vector<queue_event> events;
        {
            std::lock_guard<std::mutex> lock(mutex);
            events.swap(pending_events);
        }
        if (events.empty()) {
            return;
        }
        std::vector<event_listener> targets;
        {
            std::lock_guard<std::mutex> lock(listener_mutex);
            for (const auto& [id, listener] : listeners) {
                targets.push_back(listener);
            }
        }
        for (const auto& event : events) {
            for (const auto& listener : targets) {
                listener(event);
            }
        }
    }

    auto persist(bool force) -> result<void> {
        std::shared_ptr<const queue_snapshot> snap;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!store || (!dirty && !force)) {
                return {};
            }
            auto now = steady_clock::now();
            if (!force && now - last_persist < config.persist_interval) {
                return {};
            }
            dirty = false;
            last_persist = now;
            snap = make_snapshot_locked();
        }

        auto saved = store->save(*snap);
        if (!saved) {
            TQ_LOG_ERROR(log_category::persistence,
                "Failed to persist queue: " + saved.error().message);
            std::lock_guard<std::mutex> lock(mutex);
            dirty = true;
        }
        return saved;
    }

    static void reap(std::vector<std::future<void>>& futures) {
        for (auto& future : futures) {
            if (!future.valid()) {
                continue;
            }
            try {
                future.get();
            } catch (const std::exception& e) {
                TQ_LOG_ERROR(log_category::scheduler,
                    std::string("Worker task raised: ") + e.what());
            }
        }
        futures.clear();
    }

    // ------------------------------------------------------------------------
    // Worker lifecycle
    // ------------------------------------------------------------------------

    void launch_locked(transfer_record& rec) {
        auto& rt = runtimes[rec.id];

        transfer_job job;
        job.id = rec.id;
        job.remote_path = rec.remote_path;
        job.local_path = rec.local_path;
        job.size_bytes = rec.size_bytes;
        job.bytes_transferred = rec.bytes_transferred;
        job.checksum_algo = rec.checksum_algo;
        job.checksum_expected = rec.checksum_expected;
        job.restart_from_zero = rt.restart_from_zero;
        rt.resume_pending = false;

        auto control = std::make_shared<transfer_control>();
        auto box = inbox;
        auto id = rec.id;

        worker_callbacks callbacks;
        callbacks.on_size_known = [box, id](std::uint64_t size) {
            worker_message m;
            m.type = worker_message::kind::size_known;
            m.id = id;
            m.value = size;
            box->post(std::move(m));
        };
        callbacks.on_checksum_found = [box, id](const manifest_entry& entry) {
            worker_message m;
            m.type = worker_message::kind::checksum_found;
            m.id = id;
            m.checksum = entry;
            box->post(std::move(m));
        };
        callbacks.on_progress = [box, id](std::uint64_t bytes) {
            worker_message m;
            m.type = worker_message::kind::progress;
            m.id = id;
            m.value = bytes;
            box->post(std::move(m));
        };
        callbacks.on_verifying = [box, id]() {
            worker_message m;
            m.type = worker_message::kind::verifying;
            m.id = id;
            box->post(std::move(m));
        };

        rt.speed.reset();
        rec.started_at = transfer_record::clock::now();
        set_state_locked(rec, record_state::active);

        auto ctx = record_context(rec);
        TQ_LOG_INFO_CTX(log_category::scheduler, "Admitted transfer", ctx);

        auto& slot = bindings[id];
        slot.control = control;
        slot.future = executor->submit(
            [box, id, runner = worker, job = std::move(job), control,
             callbacks = std::move(callbacks)]() {
                worker_result res;
                try {
                    res = runner->execute(job, *control, callbacks);
                } catch (const std::exception& e) {
                    res.outcome = worker_outcome::failed;
                    res.failure = error(error_code::internal_error, e.what());
                }
                worker_message m;
                m.type = worker_message::kind::finished;
                m.id = id;
                m.outcome = std::move(res);
                box->post(std::move(m));
            },
            "download");
    }

    void admit_locked() {
        if (!running || stopping || queue_stopped ||
            last_connection != connection_state::connected || !supervisor->is_connected()) {
            return;
        }

        auto now = steady_clock::now();
        while (bindings.size() < limit) {
            transfer_record* best = nullptr;
            for (auto& [id, rec] : records) {
                if (rec.state != record_state::queued || bindings.count(id) != 0) {
                    continue;
                }
                auto rt = runtimes.find(id);
                if (rt != runtimes.end() && rt->second.not_before > now) {
                    continue;
                }
                if (best == nullptr || rec.order < best->order) {
                    best = &rec;
                }
            }
            if (best == nullptr) {
                break;
            }
            launch_locked(*best);
        }
    }

    void demote_active_locked() {
        for (auto& [id, slot] : bindings) {
            auto requested = slot.control->current();
            slot.control->request(control_signal::interrupt);
            auto* rec = find_locked(id);
            if (rec == nullptr || rec->state != record_state::active) {
                continue;
            }
            rec->speed_bps = 0.0;
            rec->eta.reset();
            // A pending pause or cancel outlives the interruption.
            switch (requested) {
                case control_signal::pause:
                    set_state_locked(*rec, record_state::paused);
                    break;
                case control_signal::cancel:
                    set_state_locked(*rec, record_state::cancelled);
                    break;
                default:
                    set_state_locked(*rec, record_state::queued);
                    break;
            }
        }
    }

    void handle_connection_locked(connection_state state) {
        if (state == last_connection) {
            return;
        }
        TQ_LOG_INFO(log_category::scheduler,
            std::string("Connection ") + to_string(last_connection) + " -> " + to_string(state));
        last_connection = state;
        if (state != connection_state::connected) {
            demote_active_locked();
        }
        emit_locked(queue_event_kind::connection_changed);
    }

    void apply_failure_locked(transfer_record& rec, runtime& rt, const error& cause) {
        if (rec.state == record_state::cancelled) {
            rec.last_error = cause;
            return;
        }
        bool user_paused = rec.state == record_state::paused;
        auto requeue = [&](std::chrono::milliseconds delay) {
            rt.not_before = steady_clock::now() + delay;
            if (!user_paused) {
                set_state_locked(rec, record_state::queued);
            }
        };

        switch (classify(cause.code)) {
            case error_class::connectivity:
                // A host that keeps timing out on one file would otherwise loop forever.
                if (cause.code == error_code::connection_timeout) {
                    rec.last_error = cause;
                    if (++rec.retry_count > config.max_retries) {
                        set_state_locked(rec, record_state::failed);
                        return;
                    }
                }
                if (rec.state == record_state::active || rec.state == record_state::verifying) {
                    set_state_locked(rec, record_state::queued);
                }
                return;

            case error_class::transient:
                rec.last_error = cause;
                ++rec.retry_count;
                if (rec.retry_count > config.max_retries) {
                    set_state_locked(rec, record_state::failed);
                } else {
                    requeue(config.retry_delay);
                }
                return;

            default:
                break;
        }

        rec.last_error = cause;
        if (cause.code == error_code::checksum_mismatch && config.retry_on_checksum_mismatch &&
            rec.retry_count < config.max_retries) {
            ++rec.retry_count;
            rec.bytes_transferred = 0;
            rt.restart_from_zero = true;
            requeue(config.retry_delay);
            return;
        }
        set_state_locked(rec, record_state::failed);
    }

    void apply_finished_locked(record_id id, const worker_result& res) {
        if (auto it = bindings.find(id); it != bindings.end()) {
            reaped.push_back(std::move(it->second.future));
            bindings.erase(it);
        }

        auto* rec = find_locked(id);
        if (rec == nullptr) {
            return;
        }
        auto& rt = runtimes[id];

        rec->bytes_transferred = res.bytes_transferred;
        if (res.size_bytes) {
            rec->size_bytes = res.size_bytes;
        }
        rt.speed.reset();
        rec->speed_bps = 0.0;
        rec->eta.reset();
        dirty = true;

        switch (res.outcome) {
            case worker_outcome::completed:
                if (rec->state != record_state::cancelled) {
                    rec->last_error.reset();
                    set_state_locked(*rec, record_state::completed);
                }
                break;
            case worker_outcome::paused:
                if (rec->state == record_state::active) {
                    set_state_locked(*rec, rt.resume_pending ? record_state::queued
                                                             : record_state::paused);
                }
                break;
            case worker_outcome::cancelled:
                if (!rec->is_terminal()) {
                    set_state_locked(*rec, record_state::cancelled);
                }
                break;
            case worker_outcome::interrupted:
                if (rec->state == record_state::active || rec->state == record_state::verifying) {
                    set_state_locked(*rec, record_state::queued);
                }
                break;
            case worker_outcome::failed:
                apply_failure_locked(*rec, rt,
                    res.failure.value_or(error(error_code::internal_error, "worker failed")));
                break;
        }
        rt.resume_pending = false;

        auto ctx = record_context(*rec);
        TQ_LOG_DEBUG_CTX(log_category::scheduler,
            std::string("Worker finished: ") + to_string(res.outcome) + ", record " +
            to_string(rec->state), ctx);
        emit_locked(queue_event_kind::progress, id);
    }

    void apply_message_locked(const worker_message& m) {
        if (m.type == worker_message::kind::connection) {
            handle_connection_locked(m.connection);
            return;
        }
        if (m.type == worker_message::kind::finished) {
            if (m.outcome) {
                apply_finished_locked(m.id, *m.outcome);
            }
            return;
        }

        auto* rec = find_locked(m.id);
        if (rec == nullptr || bindings.count(m.id) == 0) {
            return;
        }

        switch (m.type) {
            case worker_message::kind::size_known:
                rec->size_bytes = m.value;
                rec->bytes_transferred = std::min(rec->bytes_transferred, m.value);
                dirty = true;
                break;

            case worker_message::kind::checksum_found:
                if (m.checksum && !rec->checksum_expected) {
                    rec->checksum_algo = m.checksum->algorithm;
                    rec->checksum_expected = lowercase(m.checksum->expected_hex);
                    dirty = true;
                }
                break;

            case worker_message::kind::progress: {
                auto& rt = runtimes[m.id];
                rt.restart_from_zero = false;
                rec->bytes_transferred = m.value;
                if (rec->state == record_state::active) {
                    rec->speed_bps = rt.speed.update(m.value);
                    if (rec->size_bytes && *rec->size_bytes >= m.value) {
                        rec->eta = rt.speed.eta(*rec->size_bytes - m.value);
                    }
                }
                dirty = true;
                emit_locked(queue_event_kind::progress, m.id);
                break;
            }

            case worker_message::kind::verifying:
                if (rec->state == record_state::active) {
                    rec->speed_bps = 0.0;
                    rec->eta.reset();
                    set_state_locked(*rec, record_state::verifying);
                }
                break;

            default:
                break;
        }
    }

    // ------------------------------------------------------------------------
    // Control loop
    // ------------------------------------------------------------------------

    void run_loop() {
        TQ_LOG_DEBUG(log_category::scheduler, "Control loop started");
        while (true) {
            std::vector<worker_message> batch;
            bool exiting = false;
            {
                std::unique_lock<std::mutex> lock(inbox->mutex);
                inbox->cv.wait_for(lock, loop_tick, [this] {
                    return !inbox->messages.empty() || inbox->wake || inbox->exit;
                });
                batch.swap(inbox->messages);
                inbox->wake = false;
                exiting = inbox->exit;
            }

            std::vector<std::future<void>> finished;
            {
                std::lock_guard<std::mutex> lock(mutex);
                for (const auto& message : batch) {
                    apply_message_locked(message);
                }
                handle_connection_locked(supervisor->state());
                admit_locked();
                publish_locked();
                finished.swap(reaped);
            }

            reap(finished);
            (void)persist(false);
            flush_events();

            if (exiting && batch.empty()) {
                break;
            }
        }
        TQ_LOG_DEBUG(log_category::scheduler, "Control loop stopped");
    }

    // ------------------------------------------------------------------------
    // Queue operations
    // ------------------------------------------------------------------------

    auto add_record_locked(const std::string& remote_path,
                           std::filesystem::path local_path,
                           std::optional<std::uint64_t> size,
                           std::optional<checksum_algorithm> algo,
                           std::optional<std::string> expected) -> transfer_record& {
        transfer_record rec;
        rec.id = next_id++;
        rec.remote_path = remote_path;
        rec.local_path = std::move(local_path);
        rec.size_bytes = size;
        rec.order = live_count_locked();
        rec.checksum_algo = algo;
        rec.checksum_expected = std::move(expected);
        rec.created_at = transfer_record::clock::now();
        if (queue_stopped) {
            rec.state = record_state::paused;
        }

        auto id = rec.id;
        auto& stored = records.emplace(id, std::move(rec)).first->second;
        runtimes.try_emplace(id);
        dirty = true;
        emit_locked(queue_event_kind::record_added, id);
        return stored;
    }

    auto has_live_duplicate_locked(const std::string& remote_path) const -> bool {
        return std::any_of(records.begin(), records.end(), [&](const auto& entry) {
            return !entry.second.is_terminal() && entry.second.remote_path == remote_path;
        });
    }

    // Two live records appending to one file would interleave their bytes.
    auto live_local_owner_locked(const std::filesystem::path& local_path,
                                 record_id except = 0) const -> const transfer_record* {
        for (const auto& [id, rec] : records) {
            if (id != except && !rec.is_terminal() && rec.local_path == local_path) {
                return &rec;
            }
        }
        return nullptr;
    }

    auto absolute_local(const std::filesystem::path& path) const -> std::filesystem::path {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(path, ec);
        return ec ? path : absolute.lexically_normal();
    }
};

// ============================================================================
// builder
// ============================================================================

queue_scheduler::builder::builder() = default;

auto queue_scheduler::builder::with_config(scheduler_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto queue_scheduler::builder::with_session_factory(session_factory factory) -> builder& {
    factory_ = std::move(factory);
    return *this;
}

auto queue_scheduler::builder::with_reconnect_policy(reconnect_policy policy) -> builder& {
    policy_ = policy;
    return *this;
}

auto queue_scheduler::builder::with_executor(
    std::shared_ptr<adapters::transfer_executor_interface> executor) -> builder& {
    executor_ = std::move(executor);
    return *this;
}

auto queue_scheduler::builder::with_concurrency_limit(std::size_t limit) -> builder& {
    config_.concurrency_limit = limit;
    return *this;
}

auto queue_scheduler::builder::with_download_directory(std::filesystem::path dir) -> builder& {
    config_.download_directory = std::move(dir);
    return *this;
}

auto queue_scheduler::builder::with_state_file(std::filesystem::path path) -> builder& {
    config_.state_file = std::move(path);
    return *this;
}

auto queue_scheduler::builder::with_chunk_size(std::size_t size) -> builder& {
    config_.chunk_size = size;
    return *this;
}

auto queue_scheduler::builder::with_max_retries(std::uint32_t retries) -> builder& {
    config_.max_retries = retries;
    return *this;
}

auto queue_scheduler::builder::with_retry_delay(std::chrono::milliseconds delay) -> builder& {
    config_.retry_delay = delay;
    return *this;
}

auto queue_scheduler::builder::with_persist_interval(std::chrono::milliseconds interval)
    -> builder& {
    config_.persist_interval = interval;
    return *this;
}

auto queue_scheduler::builder::with_checksum_verification(bool enable) -> builder& {
    config_.verify_checksums = enable;
    return *this;
}

auto queue_scheduler::builder::with_resume(bool enable) -> builder& {
    config_.resume_transfers = enable;
    return *this;
}

auto queue_scheduler::builder::with_retry_on_checksum_mismatch(bool enable) -> builder& {
    config_.retry_on_checksum_mismatch = enable;
    return *this;
}

auto queue_scheduler::builder::with_bandwidth_limit(std::size_t bytes_per_second) -> builder& {
    config_.bandwidth_limit = bytes_per_second;
    return *this;
}

auto queue_scheduler::builder::build() -> result<queue_scheduler> {
    if (auto valid = config_.validate(); !valid) {
        return unexpected(valid.error());
    }
    if (auto valid = policy_.validate(); !valid) {
        return unexpected(valid.error());
    }
    if (!factory_) {
        return unexpected(error(error_code::invalid_configuration,
            "a session factory is required"));
    }

    auto state = std::make_unique<impl>();
    state->config = config_;
    if (state->config.download_directory.empty()) {
        state->config.download_directory = expand_user("~/Downloads");
    }
    state->limit = config_.concurrency_limit;

    state->supervisor = std::make_shared<reconnect_supervisor>(factory_, policy_);
    state->limiter = std::make_shared<bandwidth_limiter>(config_.bandwidth_limit);
    state->executor = executor_ ? executor_
                                : adapters::transfer_executor_factory::create(
                                      scheduler_config::max_concurrency);

    worker_options options;
    options.chunk_size = config_.chunk_size;
    options.verify_checksums = config_.verify_checksums;
    options.resume_transfers = config_.resume_transfers;
    options.manifest_size_limit = config_.manifest_size_limit;
    state->worker = std::make_shared<transfer_worker>(state->supervisor, state->limiter, options);

    if (config_.state_file) {
        state->store.emplace(*config_.state_file);
        auto loaded = state->store->load();
        if (!loaded) {
            return unexpected(loaded.error());
        }
        auto& restored = loaded.value();
        for (auto& rec : restored.records) {
            auto id = rec.id;
            state->records.emplace(id, std::move(rec));
            state->runtimes.try_emplace(id);
        }
        state->next_id = std::max<record_id>(restored.next_id, 1);
        state->queue_stopped = restored.queue_stopped;
    }

    auto box = state->inbox;
    state->supervisor_listener = state->supervisor->add_listener(
        [box](connection_state s, const std::optional<error>&) {
            worker_message m;
            m.type = worker_message::kind::connection;
            m.connection = s;
            box->post(std::move(m));
        });

    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->publish_locked();
    }

    TQ_LOG_INFO(log_category::scheduler,
        "Scheduler ready: " + std::to_string(state->records.size()) + " records, limit " +
        std::to_string(state->limit));
    return queue_scheduler(std::move(state));
}

// ============================================================================
// queue_scheduler
// ============================================================================

queue_scheduler::queue_scheduler(std::unique_ptr<impl> state) : impl_(std::move(state)) {}

queue_scheduler::~queue_scheduler() {
    if (!impl_) {
        return;
    }
    if (auto stopped = stop(); !stopped) {
        TQ_LOG_ERROR(log_category::scheduler,
            "Shutdown persistence failed: " + stopped.error().message);
    }
    bool pending = false;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        pending = impl_->dirty;
    }
    if (auto saved = pending ? impl_->persist(true) : result<void>{}; !saved) {
        TQ_LOG_ERROR(log_category::scheduler, "Final save failed: " + saved.error().message);
    }
    impl_->supervisor->remove_listener(impl_->supervisor_listener);
    impl_->supervisor->shutdown();
}

queue_scheduler::queue_scheduler(queue_scheduler&&) noexcept = default;

auto queue_scheduler::operator=(queue_scheduler&& other) noexcept -> queue_scheduler& {
    if (this != &other) {
        queue_scheduler discarded(std::move(*this));
        impl_ = std::move(other.impl_);
    }
    return *this;
}

auto queue_scheduler::start() -> result<void> {
    std::lock_guard<std::mutex> lifecycle(impl_->lifecycle_mutex);
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->running) {
            return unexpected(error(error_code::already_initialized, "scheduler already running"));
        }
        impl_->running = true;
    }
    {
        std::lock_guard<std::mutex> lock(impl_->inbox->mutex);
        impl_->inbox->exit = false;
    }

    impl_->loop = std::thread([state = impl_.get()] { state->run_loop(); });

    if (auto connected = impl_->supervisor->connect(); !connected) {
        TQ_LOG_WARN(log_category::scheduler,
            "Initial connection failed: " + connected.error().message);
    }
    impl_->inbox->poke();
    return {};
}

auto queue_scheduler::stop() -> result<void> {
    std::lock_guard<std::mutex> lifecycle(impl_->lifecycle_mutex);
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (!impl_->running) {
            return {};
        }
        impl_->running = false;
        impl_->stopping = true;
        impl_->demote_active_locked();
    }
    impl_->limiter->release_all();
    impl_->inbox->poke();

    {
        std::unique_lock<std::mutex> lock(impl_->mutex);
        impl_->state_cv.wait(lock, [this] { return impl_->bindings.empty(); });
    }

    {
        std::lock_guard<std::mutex> lock(impl_->inbox->mutex);
        impl_->inbox->exit = true;
    }
    impl_->inbox->cv.notify_one();
    if (impl_->loop.joinable()) {
        impl_->loop.join();
    }

    std::vector<std::future<void>> leftovers;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        leftovers.swap(impl_->reaped);
        impl_->stopping = false;
        impl_->publish_locked();
    }
    impl::reap(leftovers);

    // Re-arm the limiter for a later start().
    impl_->limiter->set_limit(impl_->limiter->get_limit());

    auto saved = impl_->persist(true);
    impl_->flush_events();
    TQ_LOG_INFO(log_category::scheduler, "Scheduler stopped");
    return saved;
}

auto queue_scheduler::is_running() const -> bool {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->running;
}

auto queue_scheduler::enqueue(const std::string& remote_path,
                              const std::filesystem::path& local_path,
                              std::optional<std::uint64_t> expected_size)
    -> result<transfer_record> {
    enqueue_options options;
    options.local_path = local_path;
    options.expected_size = expected_size;
    return enqueue(remote_path, options);
}

auto queue_scheduler::enqueue(const std::string& remote_path, const enqueue_options& options)
    -> result<transfer_record> {
    if (remote_path.empty() || remote_path.front() != '/') {
        return unexpected(error(error_code::invalid_file_path,
            "remote path must be absolute: " + remote_path));
    }
    auto name = remote_basename(remote_path);
    if (options.local_path.empty() && !is_safe_path_component(name)) {
        return unexpected(error(error_code::invalid_file_path,
            "cannot derive a local name from " + remote_path));
    }

    std::optional<checksum_algorithm> algo = options.checksum_algo;
    std::optional<std::string> expected;
    if (options.checksum_expected) {
        expected = lowercase(*options.checksum_expected);
        if (!algo) {
            algo = algorithm_for_hex_length(expected->size(), true);
        }
        if (!algo) {
            return unexpected(error(error_code::unsupported_algorithm,
                "cannot infer algorithm from a " + std::to_string(expected->size()) +
                "-digit checksum"));
        }
        if (expected->size() != hex_length(*algo)) {
            return unexpected(error(error_code::invalid_configuration,
                std::string("checksum length does not match ") + to_string(*algo)));
        }
    } else {
        algo.reset();
    }

    transfer_record added;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->has_live_duplicate_locked(remote_path)) {
            return unexpected(error(error_code::transfer_already_exists,
                "already queued: " + remote_path));
        }
        auto local = impl_->absolute_local(options.local_path.empty()
            ? impl_->config.download_directory / name
            : options.local_path);
        if (const auto* owner = impl_->live_local_owner_locked(local)) {
            return unexpected(error(error_code::transfer_already_exists,
                local.string() + " is already the target of transfer " +
                std::to_string(owner->id)));
        }
        added = impl_->add_record_locked(remote_path, std::move(local),
                                         options.expected_size, algo, std::move(expected));
        impl_->publish_locked();
    }

    auto ctx = record_context(added);
    TQ_LOG_INFO_CTX(log_category::scheduler, "Enqueued", ctx);
    impl_->inbox->poke();
    impl_->flush_events();
    return added;
}

auto queue_scheduler::enqueue_directory(const std::string& remote_dir,
                                        const std::filesystem::path& local_dir)
    -> result<directory_enqueue_result> {
    if (remote_dir.empty() || remote_dir.front() != '/') {
        return unexpected(error(error_code::invalid_file_path,
            "remote path must be absolute: " + remote_dir));
    }

    auto lease = impl_->supervisor->acquire();
    if (!lease) {
        return unexpected(error(error_code::not_connected, "no live session"));
    }

    std::filesystem::path local_root = local_dir;
    if (local_root.empty()) {
        auto name = remote_basename(remote_dir);
        local_root = is_safe_path_component(name)
            ? impl_->config.download_directory / name
            : impl_->config.download_directory;
    }
    local_root = impl_->absolute_local(local_root);

    struct pending_file {
        std::string remote;
        std::filesystem::path local;
        std::uint64_t size;
    };

    directory_enqueue_result outcome;
    std::vector<pending_file> files;
    std::vector<std::pair<std::string, std::filesystem::path>> worklist{{remote_dir, local_root}};
    bool root = true;

    while (!worklist.empty()) {
        auto [remote, local] = std::move(worklist.back());
        worklist.pop_back();

        auto listing = lease.session->list_dir(remote);
        if (!listing) {
            if (is_connectivity(listing.error().code)) {
                impl_->supervisor->report_failure(lease.generation, listing.error());
            }
            if (root) {
                return unexpected(listing.error());
            }
            TQ_LOG_WARN(log_category::scheduler,
                "Skipping " + remote + ": " + listing.error().message);
            outcome.failed_directories.emplace_back(remote, listing.error());
            continue;
        }
        root = false;

        auto entries = std::move(listing.value());
        std::sort(entries.begin(), entries.end(),
                  [](const remote_entry& a, const remote_entry& b) { return a.name < b.name; });

        std::vector<std::pair<std::string, std::filesystem::path>> subdirs;
        for (const auto& entry : entries) {
            if (!is_safe_path_component(entry.name)) {
                TQ_LOG_WARN(log_category::scheduler,
                    "Refusing unsafe entry name under " + remote + ": '" + entry.name + "'");
                ++outcome.skipped_unsafe;
                continue;
            }
            auto child_remote = entry.path.empty() ? join_remote_path(remote, entry.name)
                                                   : entry.path;
            if (entry.is_directory) {
                subdirs.emplace_back(std::move(child_remote), local / entry.name);
            } else {
                files.push_back({std::move(child_remote), local / entry.name, entry.size});
            }
        }
        // Reverse so the worklist pops subdirectories in name order.
        worklist.insert(worklist.end(), subdirs.rbegin(), subdirs.rend());
    }

    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        for (auto& file : files) {
            if (impl_->has_live_duplicate_locked(file.remote) ||
                impl_->live_local_owner_locked(file.local) != nullptr) {
                ++outcome.skipped_duplicates;
                continue;
            }
            auto& rec = impl_->add_record_locked(file.remote, std::move(file.local), file.size,
                                                 std::nullopt, std::nullopt);
            outcome.records.push_back(rec.id);
        }
        impl_->publish_locked();
    }

    TQ_LOG_INFO(log_category::scheduler,
        "Expanded " + remote_dir + " into " + std::to_string(outcome.records.size()) +
        " transfers (" + std::to_string(outcome.skipped_duplicates) + " duplicates, " +
        std::to_string(outcome.failed_directories.size()) + " unreadable directories)");
    impl_->inbox->poke();
    impl_->flush_events();
    return outcome;
}

auto queue_scheduler::reorder(record_id id, int delta) -> result<void> {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto* target = impl_->find_locked(id);
        if (target == nullptr) {
            return unexpected(error(error_code::transfer_not_found,
                "no transfer " + std::to_string(id)));
        }
        if (target->state != record_state::queued || delta == 0) {
            return {};
        }

        std::vector<transfer_record*> queued;
        for (auto& [rid, rec] : impl_->records) {
            if (rec.state == record_state::queued) {
                queued.push_back(&rec);
            }
        }
        std::sort(queued.begin(), queued.end(),
                  [](const transfer_record* a, const transfer_record* b) {
                      return a->order < b->order;
                  });

        std::vector<std::size_t> slots;
        slots.reserve(queued.size());
        for (const auto* rec : queued) {
            slots.push_back(rec->order);
        }

        auto from = static_cast<long>(std::find(queued.begin(), queued.end(), target) -
                                      queued.begin());
        auto to = std::clamp(from + static_cast<long>(delta), 0L,
                             static_cast<long>(queued.size()) - 1);
        if (to == from) {
            return {};
        }
        queued.erase(queued.begin() + from);
        queued.insert(queued.begin() + to, target);

        for (std::size_t i = 0; i < queued.size(); ++i) {
            if (queued[i]->order != slots[i]) {
                queued[i]->order = slots[i];
                impl_->emit_locked(queue_event_kind::state_changed, queued[i]->id);
            }
        }
        impl_->dirty = true;
        impl_->publish_locked();
    }
    impl_->flush_events();
    return {};
}

auto queue_scheduler::pause(record_id id) -> result<void> {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto* rec = impl_->find_locked(id);
        if (rec == nullptr) {
            return unexpected(error(error_code::transfer_not_found,
                "no transfer " + std::to_string(id)));
        }
        switch (rec->state) {
            case record_state::queued:
                impl_->set_state_locked(*rec, record_state::paused);
                break;
            case record_state::active:
                impl_->runtimes[id].resume_pending = false;
                impl_->signal_locked(id, control_signal::pause);
                break;
            case record_state::paused:
                return {};
            case record_state::verifying:
                return unexpected(error(error_code::transfer_in_progress,
                    "transfer " + std::to_string(id) + " is verifying"));
            default:
                return unexpected(error(error_code::invalid_state_transition,
                    std::string("cannot pause a ") + to_string(rec->state) + " transfer"));
        }
        impl_->publish_locked();
    }
    impl_->flush_events();
    return {};
}

auto queue_scheduler::resume(record_id id) -> result<void> {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto* rec = impl_->find_locked(id);
        if (rec == nullptr) {
            return unexpected(error(error_code::transfer_not_found,
                "no transfer " + std::to_string(id)));
        }
        if (rec->is_terminal()) {
            return unexpected(error(error_code::invalid_state_transition,
                std::string("cannot resume a ") + to_string(rec->state) + " transfer"));
        }
        if (rec->state == record_state::active) {
            impl_->withdraw_pause_locked(id);
            return {};
        }
        if (rec->state != record_state::paused) {
            return {};
        }
        impl_->runtimes[id].not_before = {};
        impl_->set_state_locked(*rec, record_state::queued);
        impl_->publish_locked();
    }
    impl_->inbox->poke();
    impl_->flush_events();
    return {};
}

auto queue_scheduler::cancel(record_id id) -> result<void> {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto* rec = impl_->find_locked(id);
        if (rec == nullptr) {
            return unexpected(error(error_code::transfer_not_found,
                "no transfer " + std::to_string(id)));
        }
        switch (rec->state) {
            case record_state::queued:
            case record_state::paused:
                impl_->signal_locked(id, control_signal::cancel);
                impl_->set_state_locked(*rec, record_state::cancelled);
                break;
            case record_state::active:
                impl_->signal_locked(id, control_signal::cancel);
                break;
            case record_state::cancelled:
                return {};
            case record_state::verifying:
                return unexpected(error(error_code::transfer_in_progress,
                    "transfer " + std::to_string(id) + " is verifying"));
            default:
                return unexpected(error(error_code::invalid_state_transition,
                    std::string("cannot cancel a ") + to_string(rec->state) + " transfer"));
        }
        impl_->publish_locked();
    }
    impl_->flush_events();
    return {};
}

auto queue_scheduler::retry(record_id id) -> result<void> {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto* rec = impl_->find_locked(id);
        if (rec == nullptr) {
            return unexpected(error(error_code::transfer_not_found,
                "no transfer " + std::to_string(id)));
        }
        if (rec->state != record_state::failed && rec->state != record_state::cancelled) {
            return unexpected(error(error_code::invalid_state_transition,
                std::string("cannot retry a ") + to_string(rec->state) + " transfer"));
        }
        if (impl_->has_live_duplicate_locked(rec->remote_path)) {
            return unexpected(error(error_code::transfer_already_exists,
                "already queued: " + rec->remote_path));
        }
        if (const auto* owner = impl_->live_local_owner_locked(rec->local_path, id)) {
            return unexpected(error(error_code::transfer_already_exists,
                rec->local_path.string() + " is already the target of transfer " +
                std::to_string(owner->id)));
        }

        auto& rt = impl_->runtimes[id];
        if (rec->last_error && rec->last_error->code == error_code::checksum_mismatch) {
            rt.restart_from_zero = true;
            rec->bytes_transferred = 0;
        }
        rt.not_before = {};
        rec->retry_count = 0;
        rec->last_error.reset();
        rec->completed_at.reset();
        rec->order = impl_->live_count_locked();
        impl_->set_state_locked(*rec, impl_->queue_stopped ? record_state::paused
                                                           : record_state::queued);

        auto ctx = record_context(*rec);
        TQ_LOG_INFO_CTX(log_category::scheduler, "Manual retry", ctx);
        impl_->publish_locked();
    }
    impl_->inbox->poke();
    impl_->flush_events();
    return {};
}

auto queue_scheduler::remove(record_id id, bool delete_local_file) -> result<void> {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto* rec = impl_->find_locked(id);
        if (rec == nullptr) {
            return unexpected(error(error_code::transfer_not_found,
                "no transfer " + std::to_string(id)));
        }
        if (rec->state == record_state::active || rec->state == record_state::verifying ||
            impl_->bindings.count(id) != 0) {
            return unexpected(error(error_code::transfer_in_progress,
                "transfer " + std::to_string(id) + " is running"));
        }

        if (delete_local_file) {
            std::error_code ec;
            std::filesystem::remove(rec->local_path, ec);
            if (ec && ec != std::errc::no_such_file_or_directory) {
                return unexpected(error(error_code::file_write_error,
                    "cannot delete " + rec->local_path.string() + ": " + ec.message()));
            }
        }

        impl_->emit_locked(queue_event_kind::record_removed, id);
        impl_->records.erase(id);
        impl_->runtimes.erase(id);
        impl_->densify_locked();
        impl_->dirty = true;
        impl_->publish_locked();
    }
    impl_->flush_events();
    return {};
}

auto queue_scheduler::clear_finished() -> std::size_t {
    std::size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        for (auto it = impl_->records.begin(); it != impl_->records.end();) {
            if (it->second.state == record_state::completed) {
                impl_->emit_locked(queue_event_kind::record_removed, it->first);
                impl_->runtimes.erase(it->first);
                it = impl_->records.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        if (removed > 0) {
            impl_->dirty = true;
            impl_->publish_locked();
        }
    }
    impl_->flush_events();
    return removed;
}

auto queue_scheduler::stop_all() -> void {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->queue_stopped = true;
        for (auto& [id, rec] : impl_->records) {
            if (rec.state == record_state::queued) {
                impl_->set_state_locked(rec, record_state::paused);
            } else if (rec.state == record_state::active) {
                impl_->runtimes[id].resume_pending = false;
                impl_->signal_locked(id, control_signal::pause);
            }
        }
        impl_->dirty = true;
        impl_->emit_locked(queue_event_kind::queue_flags_changed);
        impl_->publish_locked();
    }
    TQ_LOG_INFO(log_category::scheduler, "Queue stopped");
    impl_->flush_events();
}

auto queue_scheduler::resume_all() -> void {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->queue_stopped = false;
        for (auto& [id, rec] : impl_->records) {
            if (rec.state == record_state::paused) {
                impl_->runtimes[id].not_before = {};
                impl_->set_state_locked(rec, record_state::queued);
            } else if (rec.state == record_state::active) {
                impl_->withdraw_pause_locked(id);
            }
        }
        impl_->dirty = true;
        impl_->emit_locked(queue_event_kind::queue_flags_changed);
        impl_->publish_locked();
    }
    TQ_LOG_INFO(log_category::scheduler, "Queue resumed");
    impl_->inbox->poke();
    impl_->flush_events();
}

auto queue_scheduler::set_concurrency_limit(std::size_t limit) -> result<void> {
    if (limit < scheduler_config::min_concurrency || limit > scheduler_config::max_concurrency) {
        return unexpected(error(error_code::invalid_configuration,
            "concurrency limit must be between 1 and 50, got " + std::to_string(limit)));
    }
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->limit = limit;
        impl_->dirty = true;
        impl_->emit_locked(queue_event_kind::queue_flags_changed);
        impl_->publish_locked();
    }
    TQ_LOG_INFO(log_category::scheduler, "Concurrency limit set to " + std::to_string(limit));
    impl_->inbox->poke();
    impl_->flush_events();
    return {};
}

auto queue_scheduler::concurrency_limit() const -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->limit;
}

auto queue_scheduler::set_bandwidth_limit(std::size_t bytes_per_second) -> void {
    impl_->limiter->set_limit(bytes_per_second);
    TQ_LOG_INFO(log_category::scheduler,
        bytes_per_second == 0 ? std::string("Bandwidth limit removed")
                              : "Bandwidth limit set to " + std::to_string(bytes_per_second) +
                                " B/s");
}

auto queue_scheduler::reconnect() -> result<void> {
    if (impl_->supervisor->is_connected()) {
        return {};
    }
    impl_->supervisor->reconnect_now();
    return {};
}

auto queue_scheduler::snapshot() const -> std::shared_ptr<const queue_snapshot> {
    return impl_->published.load();
}

auto queue_scheduler::get(record_id id) const -> result<transfer_record> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->records.find(id);
    if (it == impl_->records.end()) {
        return unexpected(error(error_code::transfer_not_found,
            "no transfer " + std::to_string(id)));
    }
    return it->second;
}

auto queue_scheduler::subscribe(event_listener listener) -> subscription_id {
    std::lock_guard<std::mutex> lock(impl_->listener_mutex);
    auto id = impl_->next_subscription++;
    impl_->listeners.emplace(id, std::move(listener));
    return id;
}

auto queue_scheduler::unsubscribe(subscription_id id) -> void {
    std::lock_guard<std::mutex> lock(impl_->listener_mutex);
    impl_->listeners.erase(id);
}

auto queue_scheduler::wait_until_idle(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    return impl_->state_cv.wait_for(lock, timeout, [this] { return impl_->is_idle_locked(); });
}

auto queue_scheduler::total_speed() const -> double {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    double total = 0.0;
    for (const auto& [id, rec] : impl_->records) {
        if (rec.state == record_state::active) {
            total += rec.speed_bps;
        }
    }
    return total;
}

auto queue_scheduler::connection() const -> connection_state {
    return impl_->supervisor->state();
}

auto queue_scheduler::config() const -> const scheduler_config& {
    return impl_->config;
}

}  // namespace transfer_queue
