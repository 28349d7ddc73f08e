/**
 * @file checksum_verifier.cpp
 * @brief Implementation of manifest parsing and verification
 */

#include <transfer_queue/core/checksum_verifier.h>
#include <transfer_queue/core/logging.h>

#include <algorithm>
#include <cctype>

namespace transfer_queue {

namespace {

auto is_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

auto trim(std::string_view s) -> std::string_view {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

auto is_hex(std::string_view s) -> bool {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
        return std::isxdigit(static_cast<unsigned char>(c)) != 0;
    });
}

auto to_lower(std::string_view s) -> std::string {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });
    return out;
}

auto ends_with(std::string_view s, std::string_view suffix) -> bool {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

auto last_component(std::string_view path) -> std::string_view {
    auto pos = path.find_last_of("/\\");
    if (pos == std::string_view::npos) {
        return path;
    }
    return path.substr(pos + 1);
}

// filename  HEXCRC
auto parse_sfv_line(std::string_view line, manifest& out) -> bool {
    line = trim(line);
    if (line.empty() || line.front() == ';') {
        return true;
    }

    auto split = line.find_last_of(" \t");
    if (split == std::string_view::npos) {
        return false;
    }

    auto crc = line.substr(split + 1);
    auto name = trim(line.substr(0, split));
    if (name.empty() || crc.size() != 8 || !is_hex(crc)) {
        return false;
    }

    out[std::string(name)] = manifest_entry{checksum_algorithm::crc32, to_lower(crc)};
    return true;
}

// HEXDIGEST  filename | HEXDIGEST *filename
auto parse_digest_line(std::string_view line, manifest& out) -> bool {
    line = trim(line);
    if (line.empty() || line.front() == '#') {
        return true;
    }

    std::size_t pos = 0;
    while (pos < line.size() && !is_space(line[pos])) ++pos;
    auto digest = line.substr(0, pos);
    if (!is_hex(digest)) {
        return false;
    }

    auto algorithm = algorithm_for_hex_length(digest.size());
    if (!algorithm) {
        return false;
    }

    while (pos < line.size() && is_space(line[pos])) ++pos;
    if (pos < line.size() && line[pos] == '*') ++pos;

    auto name = line.substr(pos);
    if (name.empty()) {
        return false;
    }

    out[std::string(name)] = manifest_entry{*algorithm, to_lower(digest)};
    return true;
}

}  // namespace

checksum_verifier::checksum_verifier(std::size_t block_size)
    : block_size_(block_size == 0 ? default_block_size : block_size) {}

auto checksum_verifier::dialect_for(std::string_view manifest_name)
    -> std::optional<manifest_dialect> {
    auto name = to_lower(manifest_name);
    if (ends_with(name, ".sfv")) {
        return manifest_dialect::crc32_sfv;
    }
    if (ends_with(name, ".md5") || ends_with(name, ".sha1") ||
        ends_with(name, ".sha256") || ends_with(name, ".sha512")) {
        return manifest_dialect::digest;
    }
    return std::nullopt;
}

auto checksum_verifier::load_manifest(const std::vector<std::string>& lines,
                                      manifest_dialect dialect) -> manifest {
    manifest entries;
    std::size_t skipped = 0;

    for (const auto& line : lines) {
        bool parsed = dialect == manifest_dialect::crc32_sfv
            ? parse_sfv_line(line, entries)
            : parse_digest_line(line, entries);
        if (!parsed) {
            ++skipped;
        }
    }

    if (skipped > 0) {
        TQ_LOG_DEBUG(log_category::checksum,
            "Skipped " + std::to_string(skipped) + " malformed manifest line(s)");
    }
    return entries;
}

auto checksum_verifier::load_manifest(std::string_view content, manifest_dialect dialect)
    -> manifest {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start <= content.size()) {
        auto end = content.find('\n', start);
        if (end == std::string_view::npos) {
            lines.emplace_back(content.substr(start));
            break;
        }
        lines.emplace_back(content.substr(start, end - start));
        start = end + 1;
    }
    return load_manifest(lines, dialect);
}

auto checksum_verifier::load_manifest(std::string_view manifest_name, std::string_view content)
    -> result<manifest> {
    auto dialect = dialect_for(manifest_name);
    if (!dialect) {
        return unexpected(error(error_code::manifest_parse_error,
            "not a recognised manifest: " + std::string(manifest_name)));
    }
    return load_manifest(content, *dialect);
}

auto checksum_verifier::lookup(const manifest& entries, std::string_view remote_path)
    -> std::optional<manifest_entry> {
    auto base = last_component(remote_path);
    if (base.empty()) {
        return std::nullopt;
    }

    auto exact = entries.find(std::string(base));
    if (exact != entries.end()) {
        return exact->second;
    }

    for (const auto& [name, entry] : entries) {
        if (last_component(name) == base) {
            return entry;
        }
    }
    return std::nullopt;
}

auto checksum_verifier::verify(const std::filesystem::path& local_path,
                               checksum_algorithm algorithm,
                               std::string_view expected_hex) const -> result<bool> {
    auto computed = checksum::compute_file(local_path, algorithm, block_size_);
    if (!computed) {
        TQ_LOG_WARN(log_category::checksum,
            "Cannot hash " + local_path.string() + ": " + computed.error().message);
        return unexpected(computed.error());
    }

    auto expected = to_lower(trim(expected_hex));
    bool match = computed.value() == expected;

    if (match) {
        TQ_LOG_DEBUG(log_category::checksum,
            std::string(to_string(algorithm)) + " verified for " + local_path.string());
    } else {
        TQ_LOG_WARN(log_category::checksum,
            std::string(to_string(algorithm)) + " mismatch for " + local_path.string() +
            ": expected " + expected + ", got " + computed.value());
    }
    return match;
}

}  // namespace transfer_queue
