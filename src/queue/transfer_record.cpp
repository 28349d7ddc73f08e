/**
 * @file transfer_record.cpp
 * @brief transfer_record and queue_snapshot helpers
 */

#include "transfer_queue/queue/transfer_record.h"

#include <algorithm>
#include <array>

namespace transfer_queue {

auto record_state_from_string(std::string_view name) -> std::optional<record_state> {
    constexpr std::array states{
        record_state::queued, record_state::active, record_state::paused,
        record_state::verifying, record_state::completed, record_state::failed,
        record_state::cancelled,
    };
    for (auto state : states) {
        if (name == to_string(state)) {
            return state;
        }
    }
    return std::nullopt;
}

auto queue_snapshot::find(record_id id) const -> const transfer_record* {
    auto it = std::find_if(records.begin(), records.end(),
                           [id](const transfer_record& r) { return r.id == id; });
    return it != records.end() ? &*it : nullptr;
}

auto queue_snapshot::count(record_state state) const -> std::size_t {
    return static_cast<std::size_t>(std::count_if(
        records.begin(), records.end(),
        [state](const transfer_record& r) { return r.state == state; }));
}

auto sort_for_display(std::vector<transfer_record>& records) -> void {
    std::stable_sort(records.begin(), records.end(),
                     [](const transfer_record& a, const transfer_record& b) {
                         bool a_term = a.is_terminal();
                         bool b_term = b.is_terminal();
                         if (a_term != b_term) {
                             return !a_term;
                         }
                         if (!a_term) {
                             return a.order < b.order;
                         }
                         return a.id < b.id;
                     });
}

}  // namespace transfer_queue
