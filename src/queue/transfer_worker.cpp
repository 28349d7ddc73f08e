/**
 * @file transfer_worker.cpp
 * @brief Single-record download execution
 */

#include "transfer_queue/queue/transfer_worker.h"
#include "transfer_queue/core/logging.h"

#include <algorithm>
#include <fstream>
#include <vector>

namespace transfer_queue {

namespace {

auto stopped_outcome(control_signal signal) -> worker_outcome {
    switch (signal) {
        case control_signal::pause: return worker_outcome::paused;
        case control_signal::cancel: return worker_outcome::cancelled;
        default: return worker_outcome::interrupted;
    }
}

auto make_context(const transfer_job& job, std::uint64_t bytes) -> transfer_log_context {
    transfer_log_context ctx;
    ctx.record_id = job.id;
    ctx.remote_path = job.remote_path;
    ctx.local_path = job.local_path.string();
    ctx.size_bytes = job.size_bytes;
    ctx.bytes_transferred = bytes;
    return ctx;
}

}  // namespace

transfer_worker::transfer_worker(std::shared_ptr<reconnect_supervisor> supervisor,
                                 std::shared_ptr<bandwidth_limiter> limiter,
                                 worker_options options)
    : supervisor_(std::move(supervisor))
    , limiter_(std::move(limiter))
    , options_(options) {
    if (options_.chunk_size == 0) {
        options_.chunk_size = 256 * 1024;
    }
}

auto transfer_worker::report_if_connectivity(const session_lease& lease, const error& cause) const
    -> void {
    if (lease && is_connectivity(cause.code)) {
        supervisor_->report_failure(lease.generation, cause);
    }
}

auto transfer_worker::execute(const transfer_job& job,
                              const transfer_control& control,
                              const worker_callbacks& callbacks) const -> worker_result {
    worker_result res;
    res.bytes_transferred = job.bytes_transferred;
    res.size_bytes = job.size_bytes;

    session_lease lease;
    auto fail = [&](error cause) -> worker_result {
        report_if_connectivity(lease, cause);
        auto ctx = make_context(job, res.bytes_transferred);
        ctx.error_message = cause.message;
        TQ_LOG_WARN_CTX(log_category::worker, "Transfer failed", ctx);
        res.outcome = worker_outcome::failed;
        res.failure = std::move(cause);
        return res;
    };
    auto stop = [&](control_signal signal) -> worker_result {
        res.outcome = stopped_outcome(signal);
        auto ctx = make_context(job, res.bytes_transferred);
        TQ_LOG_DEBUG_CTX(log_category::worker,
            std::string("Transfer stopped: ") + to_string(res.outcome), ctx);
        return res;
    };

    lease = supervisor_->acquire();
    if (!lease) {
        return fail(error(error_code::not_connected, "no live session"));
    }
    res.generation = lease.generation;

    // 1. Stat
    auto info = lease.session->stat(job.remote_path);
    if (!info) {
        return fail(info.error());
    }
    if (info.value().is_directory) {
        return fail(error(error_code::invalid_file_path,
            "remote path is a directory: " + job.remote_path));
    }
    const auto remote_size = info.value().size;
    res.size_bytes = remote_size;
    if (callbacks.on_size_known) {
        callbacks.on_size_known(remote_size);
    }

    // 2. Manifest discovery
    auto algo = job.checksum_algo;
    auto expected = job.checksum_expected;
    if (options_.verify_checksums && !expected) {
        auto found = discover_checksum(lease, job.remote_path);
        if (!found) {
            return fail(found.error());
        }
        if (found.value()) {
            algo = found.value()->algorithm;
            expected = found.value()->expected_hex;
            if (callbacks.on_checksum_found) {
                callbacks.on_checksum_found(*found.value());
            }
        }
    }

    if (control.is_set()) {
        return stop(control.current());
    }

    // 3. Resume offset
    auto offset = prepare_local_file(job, remote_size);
    if (!offset) {
        return fail(offset.error());
    }
    res.bytes_transferred = offset.value();
    if (callbacks.on_progress) {
        callbacks.on_progress(res.bytes_transferred);
    }

    // 4-5. Chunked copy
    if (res.bytes_transferred < remote_size) {
        auto stream = lease.session->open_read(job.remote_path, res.bytes_transferred);
        if (!stream) {
            return fail(stream.error());
        }

        std::ofstream out(job.local_path, std::ios::binary | std::ios::app);
        if (!out) {
            return fail(error(error_code::file_write_error,
                "cannot open for writing: " + job.local_path.string()));
        }

        auto ctx = make_context(job, res.bytes_transferred);
        TQ_LOG_DEBUG_CTX(log_category::worker,
            "Transfer started at offset " + std::to_string(res.bytes_transferred), ctx);

        std::vector<std::byte> buffer(options_.chunk_size);
        while (res.bytes_transferred < remote_size) {
            if (control.is_set()) {
                return stop(control.current());
            }
            if (supervisor_->current_generation() != lease.generation) {
                return fail(error(error_code::session_stale,
                    "session replaced during transfer"));
            }

            auto want = static_cast<std::size_t>(std::min<std::uint64_t>(
                options_.chunk_size, remote_size - res.bytes_transferred));
            if (limiter_) {
                limiter_->acquire(want);
            }

            auto n = stream.value()->read(std::span<std::byte>(buffer.data(), want));
            if (!n) {
                return fail(n.error());
            }
            if (n.value() == 0) {
                return fail(error(error_code::remote_unexpected_eof,
                    "remote file ended at " + std::to_string(res.bytes_transferred) + " of " +
                    std::to_string(remote_size) + " bytes"));
            }

            out.write(reinterpret_cast<const char*>(buffer.data()),
                      static_cast<std::streamsize>(n.value()));
            out.flush();
            if (!out) {
                return fail(error(error_code::file_write_error,
                    "write failed: " + job.local_path.string()));
            }

            res.bytes_transferred += n.value();
            if (callbacks.on_progress) {
                callbacks.on_progress(res.bytes_transferred);
            }
        }
    }

    // 6-7. Verification
    if (options_.verify_checksums && algo && expected) {
        if (callbacks.on_verifying) {
            callbacks.on_verifying();
        }
        auto matched = verifier_.verify(job.local_path, *algo, *expected);
        if (!matched) {
            return fail(matched.error());
        }
        if (!matched.value()) {
            return fail(error(error_code::checksum_mismatch,
                std::string(to_string(*algo)) + " mismatch for " + job.local_path.string()));
        }
    }

    res.outcome = worker_outcome::completed;
    auto ctx = make_context(job, res.bytes_transferred);
    TQ_LOG_INFO_CTX(log_category::worker, "Transfer completed", ctx);
    return res;
}

auto transfer_worker::discover_checksum(const session_lease& lease,
                                        const std::string& remote_path) const
    -> result<std::optional<manifest_entry>> {
    auto parent = remote_parent(remote_path);
    auto listing = lease.session->list_dir(parent);
    if (!listing) {
        if (is_connectivity(listing.error().code)) {
            return unexpected(listing.error());
        }
        TQ_LOG_DEBUG(log_category::checksum,
            "Cannot list " + parent + " for manifests: " + listing.error().message);
        return std::optional<manifest_entry>{};
    }

    auto entries = std::move(listing.value());
    std::sort(entries.begin(), entries.end(),
              [](const remote_entry& a, const remote_entry& b) { return a.name < b.name; });

    for (const auto& entry : entries) {
        if (entry.is_directory || !checksum_verifier::dialect_for(entry.name)) {
            continue;
        }
        if (entry.size > options_.manifest_size_limit) {
            TQ_LOG_DEBUG(log_category::checksum, "Skipping oversized manifest " + entry.path);
            continue;
        }

        auto content = lease.session->read_file(entry.path, options_.manifest_size_limit);
        if (!content) {
            if (is_connectivity(content.error().code)) {
                return unexpected(content.error());
            }
            TQ_LOG_DEBUG(log_category::checksum,
                "Cannot read manifest " + entry.path + ": " + content.error().message);
            continue;
        }

        auto parsed = checksum_verifier::load_manifest(entry.name, content.value());
        if (!parsed) {
            continue;
        }
        if (auto hit = checksum_verifier::lookup(parsed.value(), remote_path)) {
            TQ_LOG_DEBUG(log_category::checksum,
                "Found " + std::string(to_string(hit->algorithm)) + " for " + remote_path +
                " in " + entry.path);
            return std::optional<manifest_entry>(std::move(*hit));
        }
    }
    return std::optional<manifest_entry>{};
}

auto transfer_worker::prepare_local_file(const transfer_job& job, std::uint64_t remote_size) const
    -> result<std::uint64_t> {
    std::error_code ec;
    if (job.local_path.has_parent_path()) {
        std::filesystem::create_directories(job.local_path.parent_path(), ec);
        if (ec) {
            return unexpected(error(error_code::file_write_error,
                "cannot create " + job.local_path.parent_path().string() + ": " + ec.message()));
        }
    }

    bool exists = std::filesystem::exists(job.local_path, ec);
    if (exists && std::filesystem::is_directory(job.local_path, ec)) {
        return unexpected(error(error_code::invalid_file_path,
            "local path is a directory: " + job.local_path.string()));
    }

    if (!exists || !options_.resume_transfers || job.restart_from_zero) {
        std::ofstream truncate(job.local_path, std::ios::binary | std::ios::trunc);
        if (!truncate) {
            return unexpected(error(error_code::file_write_error,
                "cannot create " + job.local_path.string()));
        }
        return std::uint64_t{0};
    }

    auto local_size = std::filesystem::file_size(job.local_path, ec);
    if (ec) {
        return unexpected(error(error_code::file_read_error,
            "cannot stat " + job.local_path.string() + ": " + ec.message()));
    }
    if (local_size > remote_size) {
        std::filesystem::resize_file(job.local_path, remote_size, ec);
        if (ec) {
            return unexpected(error(error_code::file_write_error,
                "cannot truncate " + job.local_path.string() + ": " + ec.message()));
        }
        local_size = remote_size;
    }
    return static_cast<std::uint64_t>(local_size);
}

}  // namespace transfer_queue
