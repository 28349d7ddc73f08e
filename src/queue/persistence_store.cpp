/**
 * @file persistence_store.cpp
 * @brief Queue state serialization
 */

#include "transfer_queue/queue/persistence_store.h"
#include "transfer_queue/core/logging.h"

#include "../core/json_helpers.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace transfer_queue {

namespace {

using record_clock = transfer_record::clock;

auto to_epoch_ms(record_clock::time_point tp) -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

auto from_epoch_ms(std::int64_t ms) -> record_clock::time_point {
    return record_clock::time_point(std::chrono::duration_cast<record_clock::duration>(
        std::chrono::milliseconds(ms)));
}

auto corrupted(const std::string& what) -> unexpected {
    return unexpected(error(error_code::queue_state_corrupted, what));
}

auto write_optional_time(std::ostringstream& oss,
                         const std::optional<record_clock::time_point>& tp) -> void {
    if (tp) {
        oss << to_epoch_ms(*tp);
    } else {
        oss << "null";
    }
}

auto write_record(std::ostringstream& oss, const transfer_record& r) -> void {
    using detail::escape_json_string;

    oss << "    {\"id\": " << r.id;
    oss << ", \"remote_path\": \"" << escape_json_string(r.remote_path) << "\"";
    oss << ", \"local_path\": \"" << escape_json_string(r.local_path.string()) << "\"";
    oss << ", \"size_bytes\": ";
    if (r.size_bytes) {
        oss << *r.size_bytes;
    } else {
        oss << "null";
    }
    oss << ", \"bytes_transferred\": " << r.bytes_transferred;
    oss << ", \"state\": \"" << to_string(r.state) << "\"";
    oss << ", \"order\": " << r.order;
    if (r.checksum_algo && r.checksum_expected) {
        oss << ", \"checksum_algorithm\": \"" << to_string(*r.checksum_algo) << "\"";
        oss << ", \"checksum_expected\": \"" << escape_json_string(*r.checksum_expected) << "\"";
    } else {
        oss << ", \"checksum_algorithm\": null, \"checksum_expected\": null";
    }
    oss << ", \"retry_count\": " << r.retry_count;
    if (r.last_error) {
        oss << ", \"last_error_code\": " << static_cast<int>(r.last_error->code);
        oss << ", \"last_error\": \"" << escape_json_string(r.last_error->message) << "\"";
    } else {
        oss << ", \"last_error_code\": null, \"last_error\": null";
    }
    oss << ", \"created_at\": " << to_epoch_ms(r.created_at);
    oss << ", \"started_at\": ";
    write_optional_time(oss, r.started_at);
    oss << ", \"completed_at\": ";
    write_optional_time(oss, r.completed_at);
    oss << "}";
}

auto read_record(const detail::json_object& obj) -> result<transfer_record> {
    transfer_record r;

    auto id = detail::json_uint(obj, "id");
    if (!id || *id == 0) {
        return corrupted("record without a valid id");
    }
    r.id = *id;

    auto remote = detail::json_string(obj, "remote_path");
    if (!remote || remote->empty()) {
        return corrupted("record " + std::to_string(r.id) + " has no remote_path");
    }
    r.remote_path = std::move(*remote);

    auto local = detail::json_string(obj, "local_path");
    if (!local || local->empty()) {
        return corrupted("record " + std::to_string(r.id) + " has no local_path");
    }
    r.local_path = std::move(*local);

    if (!detail::json_is_null(obj, "size_bytes")) {
        auto size = detail::json_uint(obj, "size_bytes");
        if (!size) {
            return corrupted("record " + std::to_string(r.id) + " has an invalid size_bytes");
        }
        r.size_bytes = *size;
    }

    r.bytes_transferred = detail::json_uint(obj, "bytes_transferred").value_or(0);
    if (r.size_bytes && r.bytes_transferred > *r.size_bytes) {
        r.bytes_transferred = *r.size_bytes;
    }

    auto state_name = detail::json_string(obj, "state");
    auto state = state_name ? record_state_from_string(*state_name) : std::nullopt;
    if (!state) {
        return corrupted("record " + std::to_string(r.id) + " has an unknown state");
    }
    r.state = *state;
    r.order = static_cast<std::size_t>(detail::json_uint(obj, "order").value_or(0));

    auto algo_name = detail::json_string(obj, "checksum_algorithm");
    auto expected = detail::json_string(obj, "checksum_expected");
    if (algo_name && expected) {
        auto algo = checksum_algorithm_from_string(*algo_name);
        if (!algo) {
            return corrupted("record " + std::to_string(r.id) + " has an unknown checksum algorithm");
        }
        r.checksum_algo = *algo;
        r.checksum_expected = std::move(*expected);
    }

    r.retry_count = static_cast<std::uint32_t>(detail::json_uint(obj, "retry_count").value_or(0));

    if (auto code = detail::json_int(obj, "last_error_code")) {
        r.last_error = error(static_cast<error_code>(*code),
                             detail::json_string(obj, "last_error").value_or(""));
    }

    if (auto created = detail::json_int(obj, "created_at")) {
        r.created_at = from_epoch_ms(*created);
    }
    if (auto started = detail::json_int(obj, "started_at")) {
        r.started_at = from_epoch_ms(*started);
    }
    if (auto completed = detail::json_int(obj, "completed_at")) {
        r.completed_at = from_epoch_ms(*completed);
    }
    return r;
}

}  // namespace

persistence_store::persistence_store(std::filesystem::path path) : path_(std::move(path)) {}

auto persistence_store::serialize(const queue_snapshot& snapshot) -> std::string {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"version\": " << format_version << ",\n";
    oss << "  \"queue_stopped\": " << (snapshot.queue_stopped ? "true" : "false") << ",\n";
    oss << "  \"next_id\": " << snapshot.next_id << ",\n";
    oss << "  \"concurrency_limit\": " << snapshot.concurrency_limit << ",\n";
    oss << "  \"records\": [";
    bool first = true;
    for (const auto& record : snapshot.records) {
        oss << (first ? "\n" : ",\n");
        write_record(oss, record);
        first = false;
    }
    oss << (first ? "]\n" : "\n  ]\n");
    oss << "}\n";
    return oss.str();
}

auto persistence_store::deserialize(std::string_view text) -> result<queue_snapshot> {
    auto top = detail::parse_json_object(text);
    if (!top) {
        return corrupted(top.error().message);
    }
    const auto& obj = top.value();

    auto version = detail::json_int(obj, "version");
    if (!version || *version != format_version) {
        return corrupted("unsupported state file version");
    }

    queue_snapshot snapshot;
    snapshot.queue_stopped = detail::json_bool(obj, "queue_stopped").value_or(false);
    snapshot.next_id = detail::json_uint(obj, "next_id").value_or(1);
    auto limit = detail::json_uint(obj, "concurrency_limit").value_or(10);
    snapshot.concurrency_limit = static_cast<std::size_t>(std::clamp<std::uint64_t>(limit, 1, 50));

    auto records_it = obj.find("records");
    if (records_it == obj.end() || records_it->second.type != detail::json_value::kind::array) {
        return corrupted("missing records array");
    }
    auto items = detail::parse_json_array(records_it->second.text);
    if (!items) {
        return corrupted(items.error().message);
    }

    std::unordered_set<record_id> seen;
    for (const auto& item : items.value()) {
        if (item.type != detail::json_value::kind::object) {
            return corrupted("record entry is not an object");
        }
        auto fields = detail::parse_json_object(item.text);
        if (!fields) {
            return corrupted(fields.error().message);
        }
        auto record = read_record(fields.value());
        if (!record) {
            return unexpected(record.error());
        }
        if (!seen.insert(record.value().id).second) {
            return corrupted("duplicate record id " + std::to_string(record.value().id));
        }
        snapshot.next_id = std::max<record_id>(snapshot.next_id, record.value().id + 1);
        snapshot.records.push_back(std::move(record.value()));
    }

    // No worker survives a restart.
    for (auto& record : snapshot.records) {
        if (record.state == record_state::active || record.state == record_state::verifying) {
            record.state = record_state::queued;
        }
    }

    sort_for_display(snapshot.records);
    std::size_t order = 0;
    for (auto& record : snapshot.records) {
        if (!record.is_terminal()) {
            record.order = order++;
        }
    }
    return snapshot;
}

auto persistence_store::save(const queue_snapshot& snapshot) const -> result<void> {
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            return unexpected(error(error_code::file_write_error,
                "cannot create state directory: " + ec.message()));
        }
    }

    auto tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file) {
            return unexpected(error(error_code::file_write_error,
                "cannot open " + tmp.string() + " for writing"));
        }
        file << serialize(snapshot);
        file.flush();
        if (!file) {
            return unexpected(error(error_code::file_write_error,
                "failed to write " + tmp.string()));
        }
    }

    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return unexpected(error(error_code::file_write_error,
            "cannot replace " + path_.string() + ": " + ec.message()));
    }

    TQ_LOG_TRACE(log_category::persistence,
        "Saved " + std::to_string(snapshot.records.size()) + " records to " + path_.string());
    return {};
}

auto persistence_store::load() const -> result<queue_snapshot> {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        TQ_LOG_DEBUG(log_category::persistence, "No queue state at " + path_.string());
        return queue_snapshot{};
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file) {
        return unexpected(error(error_code::file_read_error,
            "cannot open " + path_.string()));
    }
    std::ostringstream oss;
    oss << file.rdbuf();

    auto snapshot = deserialize(oss.str());
    if (!snapshot) {
        TQ_LOG_ERROR(log_category::persistence,
            "Queue state " + path_.string() + " is corrupted: " + snapshot.error().message);
        return snapshot;
    }
    TQ_LOG_INFO(log_category::persistence,
        "Restored " + std::to_string(snapshot.value().records.size()) + " records from " +
        path_.string());
    return snapshot;
}

}  // namespace transfer_queue
