/**
 * @file json_helpers.h
 * @brief Minimal JSON reading and writing for state and settings files
 *
 * Internal to the library. Objects are parsed one level at a time: nested
 * arrays and objects are returned as raw text for a second pass.
 */

#ifndef TRANSFER_QUEUE_SRC_CORE_JSON_HELPERS_H
#define TRANSFER_QUEUE_SRC_CORE_JSON_HELPERS_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <transfer_queue/core/types.h>

namespace transfer_queue::detail {

struct json_value {
    enum class kind { null, boolean, number, string, array, object };

    kind type{kind::null};
    std::string text;  ///< Unescaped for strings, raw source text otherwise
};

using json_object = std::unordered_map<std::string, json_value>;

[[nodiscard]] auto escape_json_string(std::string_view input) -> std::string;

[[nodiscard]] auto parse_json_object(std::string_view text) -> result<json_object>;

[[nodiscard]] auto parse_json_array(std::string_view text) -> result<std::vector<json_value>>;

[[nodiscard]] auto json_string(const json_object& obj, const std::string& key)
    -> std::optional<std::string>;

[[nodiscard]] auto json_uint(const json_object& obj, const std::string& key)
    -> std::optional<std::uint64_t>;

[[nodiscard]] auto json_int(const json_object& obj, const std::string& key)
    -> std::optional<std::int64_t>;

[[nodiscard]] auto json_bool(const json_object& obj, const std::string& key)
    -> std::optional<bool>;

[[nodiscard]] auto json_is_null(const json_object& obj, const std::string& key) -> bool;

}  // namespace transfer_queue::detail

#endif  // TRANSFER_QUEUE_SRC_CORE_JSON_HELPERS_H
