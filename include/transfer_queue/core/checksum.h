/**
 * @file checksum.h
 * @brief CRC32 and message digest computation
 */

#ifndef TRANSFER_QUEUE_CORE_CHECKSUM_H
#define TRANSFER_QUEUE_CORE_CHECKSUM_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "transfer_queue/core/types.h"

namespace transfer_queue {

/**
 * @brief Integrity algorithms understood by manifests
 */
enum class checksum_algorithm {
    crc32,
    md5,
    sha1,
    sha256,
    sha512,
};

[[nodiscard]] constexpr auto to_string(checksum_algorithm algorithm) -> const char* {
    switch (algorithm) {
        case checksum_algorithm::crc32: return "crc32";
        case checksum_algorithm::md5: return "md5";
        case checksum_algorithm::sha1: return "sha1";
        case checksum_algorithm::sha256: return "sha256";
        case checksum_algorithm::sha512: return "sha512";
        default: return "unknown";
    }
}

/**
 * @brief Parse an algorithm name as produced by to_string()
 */
[[nodiscard]] auto checksum_algorithm_from_string(std::string_view name)
    -> std::optional<checksum_algorithm>;

/**
 * @brief Number of hex characters in a digest of the given algorithm
 */
[[nodiscard]] constexpr auto hex_length(checksum_algorithm algorithm) -> std::size_t {
    switch (algorithm) {
        case checksum_algorithm::crc32: return 8;
        case checksum_algorithm::md5: return 32;
        case checksum_algorithm::sha1: return 40;
        case checksum_algorithm::sha256: return 64;
        case checksum_algorithm::sha512: return 128;
        default: return 0;
    }
}

/**
 * @brief Infer a digest algorithm from the length of its hex form
 *
 * 8 characters map to CRC32 only when @p allow_crc32 is set, since digest
 * manifests never carry CRC values.
 */
[[nodiscard]] auto algorithm_for_hex_length(std::size_t length, bool allow_crc32 = false)
    -> std::optional<checksum_algorithm>;

/**
 * @brief Incremental hasher for one algorithm
 *
 * CRC32 is computed with a table-driven IEEE 802.3 implementation; the
 * digests are computed through OpenSSL EVP.
 *
 * @code
 * auto hasher = checksum_context::create(checksum_algorithm::md5);
 * if (hasher) {
 *     hasher.value().update(block);
 *     auto hex = hasher.value().finish();
 * }
 * @endcode
 */
class checksum_context {
public:
    [[nodiscard]] static auto create(checksum_algorithm algorithm) -> result<checksum_context>;

    checksum_context(checksum_context&&) noexcept;
    auto operator=(checksum_context&&) noexcept -> checksum_context&;
    ~checksum_context();

    checksum_context(const checksum_context&) = delete;
    auto operator=(const checksum_context&) -> checksum_context& = delete;

    [[nodiscard]] auto algorithm() const noexcept -> checksum_algorithm;

    auto update(std::span<const std::byte> data) -> result<void>;

    /**
     * @brief Finalize and return the lowercase hex digest
     *
     * The context cannot be updated after finish().
     */
    [[nodiscard]] auto finish() -> result<std::string>;

private:
    struct impl;
    explicit checksum_context(std::unique_ptr<impl> state);

    std::unique_ptr<impl> impl_;
};

/**
 * @brief One-shot checksum helpers
 */
class checksum {
public:
    /**
     * @brief CRC32 (IEEE 802.3) of a buffer
     */
    [[nodiscard]] static auto crc32(std::span<const std::byte> data) -> std::uint32_t;

    /**
     * @brief Continue a CRC32 computation
     * @param crc Value returned by a previous crc32()/crc32_update() call, 0 to start
     */
    [[nodiscard]] static auto crc32_update(std::uint32_t crc, std::span<const std::byte> data)
        -> std::uint32_t;

    [[nodiscard]] static auto compute(std::span<const std::byte> data, checksum_algorithm algorithm)
        -> result<std::string>;

    /**
     * @brief Hash a file by streaming it in fixed-size blocks
     */
    [[nodiscard]] static auto compute_file(const std::filesystem::path& path,
                                           checksum_algorithm algorithm,
                                           std::size_t block_size = 64 * 1024)
        -> result<std::string>;

    [[nodiscard]] static auto to_hex(std::uint32_t crc) -> std::string;
};

}  // namespace transfer_queue

#endif  // TRANSFER_QUEUE_CORE_CHECKSUM_H
