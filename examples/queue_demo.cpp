/**
 * @file queue_demo.cpp
 * @brief Download queue driven from the command line
 *
 * This example demonstrates:
 * - Loading application settings and building a scheduler from them
 * - Serving a local directory through local_directory_session
 * - Enqueueing single files and whole directories
 * - Following progress through queue events
 * - Persisting the queue so an interrupted run resumes where it stopped
 */

#include <transfer_queue/transfer_queue.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace transfer_queue;

namespace {

std::atomic<bool> running{true};

/**
 * @brief Format bytes into human-readable string
 */
auto format_bytes(std::uint64_t bytes) -> std::string {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = KB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

auto describe(const transfer_record& rec) -> std::string {
    std::ostringstream oss;
    oss << "#" << rec.id << " " << rec.remote_path << " [" << to_string(rec.state) << "] "
        << format_bytes(rec.bytes_transferred);
    if (rec.size_bytes) {
        oss << " / " << format_bytes(*rec.size_bytes);
    }
    if (auto ratio = rec.progress()) {
        oss << " (" << std::fixed << std::setprecision(1) << *ratio * 100.0 << "%)";
    }
    if (rec.speed_bps > 0.0) {
        oss << " " << format_bytes(static_cast<std::uint64_t>(rec.speed_bps)) << "/s";
    }
    if (rec.last_error) {
        oss << " error: " << rec.last_error->message;
    }
    return oss.str();
}

}  // namespace

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        running = false;
    }
}

void print_usage(const char* program) {
    std::cout << "Queue Demo - Transfer Queue" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " --root <dir> [options] [remote paths...]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --root <dir>            Directory served as the remote host" << std::endl;
    std::cout << "  --settings <file>       Settings file (default: user config directory)"
              << std::endl;
    std::cout << "  --download-dir <dir>    Override the download directory" << std::endl;
    std::cout << "  --concurrency <n>       Concurrent transfers (1-50)" << std::endl;
    std::cout << "  --limit <bytes/s>       Bandwidth limit, 0 = unlimited" << std::endl;
    std::cout << "  --verbose               Log at debug level" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "A remote path ending in '/' is downloaded recursively." << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " --root /srv/files /pub/image.iso" << std::endl;
    std::cout << "  " << program << " --root /srv/files --concurrency 2 /releases/" << std::endl;
}

int main(int argc, char* argv[]) {
    std::filesystem::path root;
    std::filesystem::path settings_path = app_settings::default_path();
    std::optional<std::filesystem::path> download_dir;
    std::optional<std::size_t> concurrency;
    std::optional<std::size_t> limit;
    std::vector<std::string> remote_paths;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--root" || arg == "--settings" || arg == "--download-dir" ||
                   arg == "--concurrency" || arg == "--limit") {
            if (++i >= argc) {
                std::cerr << "Error: " << arg << " requires an argument" << std::endl;
                return 1;
            }
            std::string value = argv[i];
            try {
                if (arg == "--root") {
                    root = value;
                } else if (arg == "--settings") {
                    settings_path = value;
                } else if (arg == "--download-dir") {
                    download_dir = value;
                } else if (arg == "--concurrency") {
                    concurrency = static_cast<std::size_t>(std::stoul(value));
                } else {
                    limit = static_cast<std::size_t>(std::stoull(value));
                }
            } catch (const std::exception&) {
                std::cerr << "Error: invalid value for " << arg << ": " << value << std::endl;
                return 1;
            }
        } else if (arg == "--verbose") {
            get_logger().set_level(log_level::debug);
        } else {
            remote_paths.push_back(arg);
        }
    }

    if (root.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    get_logger().initialize();
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto settings = app_settings::load(settings_path);
    if (!settings) {
        std::cerr << "Failed to load settings: " << settings.error().message << std::endl;
        return 1;
    }
    auto config = scheduler_config::from_settings(settings.value());
    if (download_dir) {
        config.download_directory = *download_dir;
    }
    if (concurrency) {
        config.concurrency_limit = *concurrency;
    }
    if (limit) {
        config.bandwidth_limit = *limit;
    }

    std::cout << "Remote root:   " << root.string() << std::endl;
    std::cout << "Downloads:     " << config.download_directory.string() << std::endl;
    if (config.state_file) {
        std::cout << "State file:    " << config.state_file->string() << std::endl;
    }
    std::cout << "Concurrency:   " << config.concurrency_limit << std::endl;

    auto built = queue_scheduler::builder()
                     .with_config(config)
                     .with_session_factory(
                         [root] { return std::make_shared<local_directory_session>(root); })
                     .build();
    if (!built) {
        std::cerr << "Failed to create queue: " << built.error().message << std::endl;
        return 1;
    }
    auto scheduler = std::move(built).value();

    std::mutex print_mutex;
    scheduler.subscribe([&print_mutex](const queue_event& event) {
        std::lock_guard<std::mutex> lock(print_mutex);
        switch (event.kind) {
            case queue_event_kind::state_changed:
            case queue_event_kind::record_added:
                if (event.record) {
                    std::cout << describe(*event.record) << std::endl;
                }
                break;
            case queue_event_kind::connection_changed:
                std::cout << "Connection: " << to_string(event.connection) << std::endl;
                break;
            default:
                break;
        }
    });

    if (auto started = scheduler.start(); !started) {
        std::cerr << "Failed to start queue: " << started.error().message << std::endl;
        return 1;
    }

    for (const auto& path : remote_paths) {
        if (path.size() > 1 && path.back() == '/') {
            auto expanded = scheduler.enqueue_directory(path.substr(0, path.size() - 1));
            if (!expanded) {
                std::cerr << "Cannot enqueue " << path << ": " << expanded.error().message
                          << std::endl;
                continue;
            }
            std::cout << "Queued " << expanded.value().records.size() << " files from " << path
                      << std::endl;
            for (const auto& [dir, err] : expanded.value().failed_directories) {
                std::cerr << "  skipped " << dir << ": " << err.message << std::endl;
            }
        } else if (auto rec = scheduler.enqueue(path); !rec) {
            std::cerr << "Cannot enqueue " << path << ": " << rec.error().message << std::endl;
        }
    }

    auto last_report = std::chrono::steady_clock::now();
    while (running && !scheduler.wait_until_idle(std::chrono::milliseconds{250})) {
        auto now = std::chrono::steady_clock::now();
        if (now - last_report < std::chrono::seconds{2}) {
            continue;
        }
        last_report = now;

        auto snap = scheduler.snapshot();
        auto speed = static_cast<std::uint64_t>(scheduler.total_speed());
        std::lock_guard<std::mutex> lock(print_mutex);
        std::cout << "--- " << snap->count(record_state::active) << " active, "
                  << snap->count(record_state::queued) << " queued, "
                  << format_bytes(speed) << "/s"
                  << std::endl;
        for (const auto& rec : snap->records) {
            if (rec.state == record_state::active) {
                std::cout << "  " << describe(rec) << std::endl;
            }
        }
    }

    if (auto stopped = scheduler.stop(); !stopped) {
        std::cerr << "Failed to save queue: " << stopped.error().message << std::endl;
    }

    auto snap = scheduler.snapshot();
    std::cout << std::endl;
    std::cout << "Completed: " << snap->count(record_state::completed)
              << ", failed: " << snap->count(record_state::failed)
              << ", remaining: "
              << snap->count(record_state::queued) + snap->count(record_state::paused)
              << std::endl;

    get_logger().shutdown();
    return snap->count(record_state::failed) == 0 ? 0 : 2;
}
