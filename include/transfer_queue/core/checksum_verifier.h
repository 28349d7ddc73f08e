/**
 * @file checksum_verifier.h
 * @brief Integrity manifest parsing and post-download verification
 *
 * Two manifest dialects are recognised:
 * - CRC32 (SFV): `filename  HEXCRC`, `;` starts a comment line
 * - Digest (md5sum / sha*sum): `HEXDIGEST  filename`, an optional `*`
 *   binary marker before the filename, `#` starts a comment line. The
 *   algorithm is inferred from the digest length.
 */

#ifndef TRANSFER_QUEUE_CORE_CHECKSUM_VERIFIER_H
#define TRANSFER_QUEUE_CORE_CHECKSUM_VERIFIER_H

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "transfer_queue/core/checksum.h"
#include "transfer_queue/core/types.h"

namespace transfer_queue {

enum class manifest_dialect {
    crc32_sfv,
    digest,
};

/**
 * @brief Expected checksum for one file named in a manifest
 */
struct manifest_entry {
    checksum_algorithm algorithm{checksum_algorithm::crc32};
    std::string expected_hex;

    [[nodiscard]] auto operator==(const manifest_entry& other) const -> bool = default;
};

/**
 * @brief Filename (as written in the manifest) to expected checksum
 */
using manifest = std::unordered_map<std::string, manifest_entry>;

/**
 * @brief Parses manifests and verifies downloaded files against them
 *
 * Stateless apart from the read block size; safe to share between workers.
 */
class checksum_verifier {
public:
    static constexpr std::size_t default_block_size = 64 * 1024;

    explicit checksum_verifier(std::size_t block_size = default_block_size);

    /**
     * @brief Select the dialect from a manifest file name
     * @return Dialect for `.sfv`, `.md5`, `.sha1`, `.sha256`, `.sha512`, nullopt otherwise
     */
    [[nodiscard]] static auto dialect_for(std::string_view manifest_name)
        -> std::optional<manifest_dialect>;

    /**
     * @brief Parse manifest lines
     *
     * Malformed lines are skipped. When a filename appears twice the later
     * line wins.
     */
    [[nodiscard]] static auto load_manifest(const std::vector<std::string>& lines,
                                            manifest_dialect dialect) -> manifest;

    /**
     * @brief Parse the full text of a manifest
     */
    [[nodiscard]] static auto load_manifest(std::string_view content, manifest_dialect dialect)
        -> manifest;

    /**
     * @brief Parse a manifest whose dialect follows from its file name
     */
    [[nodiscard]] static auto load_manifest(std::string_view manifest_name,
                                            std::string_view content) -> result<manifest>;

    /**
     * @brief Find the entry for a downloaded file
     *
     * Matches the base name of @p remote_path case-sensitively against the
     * manifest filenames. Entries written with a relative directory prefix
     * (`sub/name.bin`) match on their final component.
     */
    [[nodiscard]] static auto lookup(const manifest& entries, std::string_view remote_path)
        -> std::optional<manifest_entry>;

    /**
     * @brief Hash @p local_path and compare it with @p expected_hex
     *
     * The file is streamed in blocks, never loaded whole. The comparison
     * is case-insensitive.
     *
     * @return true on match, false on mismatch, an error if the file cannot be read
     */
    [[nodiscard]] auto verify(const std::filesystem::path& local_path,
                              checksum_algorithm algorithm,
                              std::string_view expected_hex) const -> result<bool>;

private:
    std::size_t block_size_;
};

}  // namespace transfer_queue

#endif  // TRANSFER_QUEUE_CORE_CHECKSUM_VERIFIER_H
