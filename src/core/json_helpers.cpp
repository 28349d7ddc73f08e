/**
 * @file json_helpers.cpp
 * @brief Minimal JSON reading and writing
 */

#include "json_helpers.h"

#include <charconv>
#include <cstdio>

namespace transfer_queue::detail {

namespace {

auto parse_failure(const std::string& what, std::size_t pos) -> unexpected {
    return unexpected(error(error_code::config_parse_error,
        what + " at offset " + std::to_string(pos)));
}

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

class json_scanner {
public:
    explicit json_scanner(std::string_view text) : text_(text) {}

    void skip_ws() {
        while (pos_ < text_.size() &&
               (text_[pos_] == ' ' || text_[pos_] == '\t' ||
                text_[pos_] == '\n' || text_[pos_] == '\r')) {
            ++pos_;
        }
    }

    [[nodiscard]] auto at_end() const -> bool { return pos_ >= text_.size(); }
    [[nodiscard]] auto peek() const -> char { return at_end() ? '\0' : text_[pos_]; }
    [[nodiscard]] auto position() const -> std::size_t { return pos_; }

    auto consume(char expected) -> bool {
        skip_ws();
        if (peek() != expected) {
            return false;
        }
        ++pos_;
        return true;
    }

    auto read_string() -> result<std::string> {
        skip_ws();
        if (peek() != '"') {
            return parse_failure("expected string", pos_);
        }
        ++pos_;

        std::string out;
        while (!at_end()) {
            char c = text_[pos_++];
            if (c == '"') {
                return out;
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (at_end()) {
                break;
            }
            char esc = text_[pos_++];
            switch (esc) {
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                case '/': out += '/'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'u': {
                    auto cp = read_hex4();
                    if (!cp) {
                        return unexpected(cp.error());
                    }
                    std::uint32_t code = cp.value();
                    if (code >= 0xD800 && code <= 0xDBFF &&
                        text_.substr(pos_, 2) == "\\u") {
                        pos_ += 2;
                        auto low = read_hex4();
                        if (!low) {
                            return unexpected(low.error());
                        }
                        code = 0x10000 + ((code - 0xD800) << 10) + (low.value() - 0xDC00);
                    }
                    append_utf8(out, code);
                    break;
                }
                default:
                    return parse_failure("invalid escape sequence", pos_ - 1);
            }
        }
        return parse_failure("unterminated string", pos_);
    }

    auto read_value() -> result<json_value> {
        skip_ws();
        json_value value;
        char c = peek();

        if (c == '"') {
            auto s = read_string();
            if (!s) {
                return unexpected(s.error());
            }
            value.type = json_value::kind::string;
            value.text = std::move(s.value());
            return value;
        }

        if (c == '{' || c == '[') {
            auto start = pos_;
            auto skipped = skip_container();
            if (!skipped) {
                return unexpected(skipped.error());
            }
            value.type = c == '{' ? json_value::kind::object : json_value::kind::array;
            value.text = std::string(text_.substr(start, pos_ - start));
            return value;
        }

        if (text_.substr(pos_, 4) == "null") {
            pos_ += 4;
            value.type = json_value::kind::null;
            return value;
        }
        if (text_.substr(pos_, 4) == "true") {
            pos_ += 4;
            value.type = json_value::kind::boolean;
            value.text = "true";
            return value;
        }
        if (text_.substr(pos_, 5) == "false") {
            pos_ += 5;
            value.type = json_value::kind::boolean;
            value.text = "false";
            return value;
        }

        auto start = pos_;
        while (!at_end()) {
            char n = text_[pos_];
            if ((n >= '0' && n <= '9') || n == '-' || n == '+' || n == '.' ||
                n == 'e' || n == 'E') {
                ++pos_;
            } else {
                break;
            }
        }
        if (start == pos_) {
            return parse_failure("unexpected character", pos_);
        }
        value.type = json_value::kind::number;
        value.text = std::string(text_.substr(start, pos_ - start));
        return value;
    }

private:
    auto read_hex4() -> result<std::uint32_t> {
        if (pos_ + 4 > text_.size()) {
            return parse_failure("truncated unicode escape", pos_);
        }
        std::uint32_t code = 0;
        auto digits = text_.substr(pos_, 4);
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + 4, code, 16);
        if (ec != std::errc{} || ptr != digits.data() + 4) {
            return parse_failure("invalid unicode escape", pos_);
        }
        pos_ += 4;
        return code;
    }

    auto skip_container() -> result<void> {
        std::vector<char> stack;
        while (!at_end()) {
            char c = text_[pos_];
            if (c == '"') {
                auto s = read_string();
                if (!s) {
                    return unexpected(s.error());
                }
                continue;
            }
            ++pos_;
            if (c == '{' || c == '[') {
                stack.push_back(c == '{' ? '}' : ']');
            } else if (c == '}' || c == ']') {
                if (stack.empty() || stack.back() != c) {
                    return parse_failure("mismatched bracket", pos_ - 1);
                }
                stack.pop_back();
                if (stack.empty()) {
                    return {};
                }
            }
        }
        return parse_failure("unterminated container", pos_);
    }

    std::string_view text_;
    std::size_t pos_{0};
};

}  // namespace

auto escape_json_string(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 8);
    for (char c : input) {
        switch (c) {
            case '"': output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b"; break;
            case '\f': output += "\\f"; break;
            case '\n': output += "\\n"; break;
            case '\r': output += "\\r"; break;
            case '\t': output += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

auto parse_json_object(std::string_view text) -> result<json_object> {
    json_scanner scanner(text);
    json_object fields;

    if (!scanner.consume('{')) {
        return parse_failure("expected '{'", scanner.position());
    }
    if (scanner.consume('}')) {
        return fields;
    }

    while (true) {
        auto key = scanner.read_string();
        if (!key) {
            return unexpected(key.error());
        }
        if (!scanner.consume(':')) {
            return parse_failure("expected ':'", scanner.position());
        }
        auto value = scanner.read_value();
        if (!value) {
            return unexpected(value.error());
        }
        fields[std::move(key.value())] = std::move(value.value());

        if (scanner.consume(',')) {
            continue;
        }
        if (scanner.consume('}')) {
            break;
        }
        return parse_failure("expected ',' or '}'", scanner.position());
    }

    scanner.skip_ws();
    if (!scanner.at_end()) {
        return parse_failure("trailing characters", scanner.position());
    }
    return fields;
}

auto parse_json_array(std::string_view text) -> result<std::vector<json_value>> {
    json_scanner scanner(text);
    std::vector<json_value> items;

    if (!scanner.consume('[')) {
        return parse_failure("expected '['", scanner.position());
    }
    if (scanner.consume(']')) {
        return items;
    }

    while (true) {
        auto value = scanner.read_value();
        if (!value) {
            return unexpected(value.error());
        }
        items.push_back(std::move(value.value()));

        if (scanner.consume(',')) {
            continue;
        }
        if (scanner.consume(']')) {
            break;
        }
        return parse_failure("expected ',' or ']'", scanner.position());
    }
    return items;
}

auto json_string(const json_object& obj, const std::string& key) -> std::optional<std::string> {
    auto it = obj.find(key);
    if (it == obj.end() || it->second.type != json_value::kind::string) {
        return std::nullopt;
    }
    return it->second.text;
}

auto json_uint(const json_object& obj, const std::string& key) -> std::optional<std::uint64_t> {
    auto it = obj.find(key);
    if (it == obj.end() || it->second.type != json_value::kind::number) {
        return std::nullopt;
    }
    const auto& text = it->second.text;
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto json_int(const json_object& obj, const std::string& key) -> std::optional<std::int64_t> {
    auto it = obj.find(key);
    if (it == obj.end() || it->second.type != json_value::kind::number) {
        return std::nullopt;
    }
    const auto& text = it->second.text;
    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto json_bool(const json_object& obj, const std::string& key) -> std::optional<bool> {
    auto it = obj.find(key);
    if (it == obj.end() || it->second.type != json_value::kind::boolean) {
        return std::nullopt;
    }
    return it->second.text == "true";
}

auto json_is_null(const json_object& obj, const std::string& key) -> bool {
    auto it = obj.find(key);
    return it == obj.end() || it->second.type == json_value::kind::null;
}

}  // namespace transfer_queue::detail
