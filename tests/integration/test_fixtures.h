/**
 * @file test_fixtures.h
 * @brief Test fixtures for integration tests
 */

#ifndef TRANSFER_QUEUE_TEST_FIXTURES_H
#define TRANSFER_QUEUE_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <transfer_queue/transfer_queue.h>

#include "fixtures/mock_remote_session.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace transfer_queue::test {

using namespace std::chrono_literals;

/**
 * @brief Poll @p predicate until it holds or @p timeout passes
 */
inline auto wait_for(const std::function<bool()>& predicate,
                     std::chrono::milliseconds timeout = 10000ms) -> bool {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

inline auto random_bytes(std::size_t size, unsigned seed) -> std::string {
    std::string data(size, '\0');
    std::mt19937 gen(seed);
    std::uniform_int_distribution<> dis(0, 255);
    for (auto& c : data) {
        c = static_cast<char>(dis(gen));
    }
    return data;
}

inline auto read_file(const std::filesystem::path& path) -> std::string {
    std::ifstream file(path, std::ios::binary);
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

/**
 * @brief Test fixture for temporary directory management
 *
 * remote_root_ backs local_directory_session; download_dir_ receives files.
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("transfer_queue_test_" + std::to_string(std::random_device{}()));
        remote_root_ = test_dir_ / "remote";
        download_dir_ = test_dir_ / "downloads";
        state_file_ = test_dir_ / "state" / "queue.json";
        std::filesystem::create_directories(remote_root_);
        std::filesystem::create_directories(download_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    /// Writes random content under remote_root_ and returns it
    auto create_remote_file(const std::string& relative, std::size_t size, unsigned seed = 42)
        -> std::string {
        auto path = remote_root_ / relative;
        std::filesystem::create_directories(path.parent_path());
        auto content = random_bytes(size, seed);
        std::ofstream file(path, std::ios::binary);
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        return content;
    }

    auto local_session_factory() -> session_factory {
        auto root = remote_root_;
        return [root] { return std::make_shared<local_directory_session>(root); };
    }

    std::filesystem::path test_dir_;
    std::filesystem::path remote_root_;
    std::filesystem::path download_dir_;
    std::filesystem::path state_file_;
};

/**
 * @brief Fixture with a mock host whose link and read speed can be controlled
 */
class MockHostFixture : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        host_ = std::make_shared<mock_remote_host>();

        policy_.max_attempts = 0;
        policy_.initial_delay = 20ms;
        policy_.max_delay = 50ms;
        policy_.jitter_ratio = 0.0;
    }

    auto add_remote(const std::string& path, std::size_t size, unsigned seed) -> std::string {
        auto content = random_bytes(size, seed);
        host_->add_file(path, content);
        return content;
    }

    auto make_builder() -> queue_scheduler::builder {
        queue_scheduler::builder b;
        b.with_session_factory(host_->factory())
            .with_reconnect_policy(policy_)
            .with_download_directory(download_dir_)
            .with_retry_delay(20ms)
            .with_persist_interval(0ms);
        return b;
    }

    auto build(queue_scheduler::builder b) -> std::unique_ptr<queue_scheduler> {
        auto built = b.build();
        EXPECT_TRUE(built) << built.error().message;
        if (!built) {
            return nullptr;
        }
        return std::make_unique<queue_scheduler>(std::move(built).value());
    }

    std::shared_ptr<mock_remote_host> host_;
    reconnect_policy policy_;
};

/**
 * @brief Tracks record states from scheduler events
 */
class state_recorder {
public:
    auto attach(queue_scheduler& scheduler) -> queue_scheduler::subscription_id {
        return scheduler.subscribe([this](const queue_event& event) { on_event(event); });
    }

    [[nodiscard]] auto max_running() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return max_running_;
    }

    [[nodiscard]] auto progress_of(record_id id) const -> std::vector<std::uint64_t> {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = progress_.find(id);
        return it != progress_.end() ? it->second : std::vector<std::uint64_t>{};
    }

    [[nodiscard]] auto connection_changes() const -> std::vector<connection_state> {
        std::lock_guard<std::mutex> lock(mutex_);
        return connections_;
    }

private:
    void on_event(const queue_event& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (event.kind == queue_event_kind::connection_changed) {
            connections_.push_back(event.connection);
            return;
        }
        if (!event.record) {
            return;
        }
        states_[event.id] = event.record->state;
        if (event.kind == queue_event_kind::progress) {
            progress_[event.id].push_back(event.record->bytes_transferred);
        }

        std::size_t running = 0;
        for (const auto& [id, state] : states_) {
            if (state == record_state::active || state == record_state::verifying) {
                ++running;
            }
        }
        max_running_ = std::max(max_running_, running);
    }

    mutable std::mutex mutex_;
    std::map<record_id, record_state> states_;
    std::map<record_id, std::vector<std::uint64_t>> progress_;
    std::vector<connection_state> connections_;
    std::size_t max_running_{0};
};

}  // namespace transfer_queue::test

#endif  // TRANSFER_QUEUE_TEST_FIXTURES_H
