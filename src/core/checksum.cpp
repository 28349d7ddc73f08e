/**
 * @file checksum.cpp
 * @brief Implementation of checksum utilities
 */

#include <transfer_queue/core/checksum.h>

#include <openssl/err.h>
#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <vector>

namespace transfer_queue {

namespace {

// CRC32 polynomial (IEEE 802.3)
constexpr std::uint32_t CRC32_POLYNOMIAL = 0xEDB88320;

constexpr auto generate_crc32_table() -> std::array<std::uint32_t, 256> {
    std::array<std::uint32_t, 256> table{};

    for (std::uint32_t i = 0; i < 256; ++i) {
        std::uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            if (crc & 1) {
                crc = (crc >> 1) ^ CRC32_POLYNOMIAL;
            } else {
                crc >>= 1;
            }
        }
        table[i] = crc;
    }

    return table;
}

constexpr auto CRC32_TABLE = generate_crc32_table();

auto get_openssl_error() -> std::string {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "unknown OpenSSL error";
    }
    std::array<char, 256> buffer{};
    ERR_error_string_n(err, buffer.data(), buffer.size());
    return std::string(buffer.data());
}

auto digest_for(checksum_algorithm algorithm) -> const EVP_MD* {
    switch (algorithm) {
        case checksum_algorithm::md5: return EVP_md5();
        case checksum_algorithm::sha1: return EVP_sha1();
        case checksum_algorithm::sha256: return EVP_sha256();
        case checksum_algorithm::sha512: return EVP_sha512();
        default: return nullptr;
    }
}

auto bytes_to_hex(const unsigned char* data, std::size_t length) -> std::string {
    static constexpr char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        hex += digits[data[i] >> 4];
        hex += digits[data[i] & 0x0F];
    }
    return hex;
}

/**
 * @brief RAII wrapper for EVP_MD_CTX
 */
class evp_md_ctx_wrapper {
public:
    evp_md_ctx_wrapper() : ctx_(EVP_MD_CTX_new()) {}

    ~evp_md_ctx_wrapper() {
        if (ctx_) {
            EVP_MD_CTX_free(ctx_);
        }
    }

    evp_md_ctx_wrapper(const evp_md_ctx_wrapper&) = delete;
    auto operator=(const evp_md_ctx_wrapper&) -> evp_md_ctx_wrapper& = delete;
    evp_md_ctx_wrapper(evp_md_ctx_wrapper&&) = delete;
    auto operator=(evp_md_ctx_wrapper&&) -> evp_md_ctx_wrapper& = delete;

    [[nodiscard]] auto get() const -> EVP_MD_CTX* { return ctx_; }
    [[nodiscard]] explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

}  // namespace

auto checksum_algorithm_from_string(std::string_view name) -> std::optional<checksum_algorithm> {
    if (name == "crc32") return checksum_algorithm::crc32;
    if (name == "md5") return checksum_algorithm::md5;
    if (name == "sha1") return checksum_algorithm::sha1;
    if (name == "sha256") return checksum_algorithm::sha256;
    if (name == "sha512") return checksum_algorithm::sha512;
    return std::nullopt;
}

auto algorithm_for_hex_length(std::size_t length, bool allow_crc32)
    -> std::optional<checksum_algorithm> {
    switch (length) {
        case 8:
            if (allow_crc32) return checksum_algorithm::crc32;
            return std::nullopt;
        case 32: return checksum_algorithm::md5;
        case 40: return checksum_algorithm::sha1;
        case 64: return checksum_algorithm::sha256;
        case 128: return checksum_algorithm::sha512;
        default: return std::nullopt;
    }
}

// ============================================================================
// checksum_context
// ============================================================================

struct checksum_context::impl {
    checksum_algorithm algorithm{checksum_algorithm::crc32};
    std::uint32_t crc{0};
    evp_md_ctx_wrapper md;
    bool finished{false};
};

checksum_context::checksum_context(std::unique_ptr<impl> state) : impl_(std::move(state)) {}

checksum_context::checksum_context(checksum_context&&) noexcept = default;
auto checksum_context::operator=(checksum_context&&) noexcept -> checksum_context& = default;
checksum_context::~checksum_context() = default;

auto checksum_context::create(checksum_algorithm algorithm) -> result<checksum_context> {
    auto state = std::make_unique<impl>();
    state->algorithm = algorithm;

    if (algorithm != checksum_algorithm::crc32) {
        const EVP_MD* md = digest_for(algorithm);
        if (md == nullptr) {
            return unexpected(error(error_code::unsupported_algorithm,
                std::string("unsupported checksum algorithm: ") + to_string(algorithm)));
        }
        if (!state->md) {
            return unexpected(error(error_code::internal_error,
                "failed to allocate digest context"));
        }
        if (EVP_DigestInit_ex(state->md.get(), md, nullptr) != 1) {
            return unexpected(error(error_code::internal_error,
                "EVP_DigestInit_ex failed: " + get_openssl_error()));
        }
    }

    return checksum_context(std::move(state));
}

auto checksum_context::algorithm() const noexcept -> checksum_algorithm {
    return impl_->algorithm;
}

auto checksum_context::update(std::span<const std::byte> data) -> result<void> {
    if (impl_->finished) {
        return unexpected(error(error_code::invalid_state_transition,
            "checksum context already finished"));
    }
    if (data.empty()) {
        return {};
    }

    if (impl_->algorithm == checksum_algorithm::crc32) {
        impl_->crc = checksum::crc32_update(impl_->crc, data);
        return {};
    }

    if (EVP_DigestUpdate(impl_->md.get(), data.data(), data.size()) != 1) {
        return unexpected(error(error_code::internal_error,
            "EVP_DigestUpdate failed: " + get_openssl_error()));
    }
    return {};
}

auto checksum_context::finish() -> result<std::string> {
    if (impl_->finished) {
        return unexpected(error(error_code::invalid_state_transition,
            "checksum context already finished"));
    }
    impl_->finished = true;

    if (impl_->algorithm == checksum_algorithm::crc32) {
        return checksum::to_hex(impl_->crc);
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(impl_->md.get(), digest.data(), &length) != 1) {
        return unexpected(error(error_code::internal_error,
            "EVP_DigestFinal_ex failed: " + get_openssl_error()));
    }
    return bytes_to_hex(digest.data(), length);
}

// ============================================================================
// checksum
// ============================================================================

auto checksum::crc32(std::span<const std::byte> data) -> std::uint32_t {
    return crc32_update(0, data);
}

auto checksum::crc32_update(std::uint32_t crc, std::span<const std::byte> data) -> std::uint32_t {
    crc ^= 0xFFFFFFFF;

    for (std::byte b : data) {
        auto index = static_cast<std::uint8_t>(crc ^ static_cast<std::uint8_t>(b));
        crc = CRC32_TABLE[index] ^ (crc >> 8);
    }

    return crc ^ 0xFFFFFFFF;
}

auto checksum::compute(std::span<const std::byte> data, checksum_algorithm algorithm)
    -> result<std::string> {
    auto ctx = checksum_context::create(algorithm);
    if (!ctx) {
        return unexpected(ctx.error());
    }
    auto updated = ctx.value().update(data);
    if (!updated) {
        return unexpected(updated.error());
    }
    return ctx.value().finish();
}

auto checksum::compute_file(const std::filesystem::path& path,
                            checksum_algorithm algorithm,
                            std::size_t block_size) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(
            error{error_code::file_read_error, "cannot open file: " + path.string()});
    }

    auto ctx = checksum_context::create(algorithm);
    if (!ctx) {
        return unexpected(ctx.error());
    }

    std::vector<std::byte> buffer(block_size == 0 ? 64 * 1024 : block_size);
    while (file) {
        file.read(reinterpret_cast<char*>(buffer.data()),
                  static_cast<std::streamsize>(buffer.size()));
        auto bytes_read = static_cast<std::size_t>(file.gcount());
        if (bytes_read == 0) {
            break;
        }
        auto updated = ctx.value().update(std::span<const std::byte>(buffer.data(), bytes_read));
        if (!updated) {
            return unexpected(updated.error());
        }
    }

    if (file.bad()) {
        return unexpected(
            error{error_code::file_read_error, "read failed: " + path.string()});
    }

    return ctx.value().finish();
}

auto checksum::to_hex(std::uint32_t crc) -> std::string {
    std::array<unsigned char, 4> bytes{
        static_cast<unsigned char>(crc >> 24),
        static_cast<unsigned char>(crc >> 16),
        static_cast<unsigned char>(crc >> 8),
        static_cast<unsigned char>(crc),
    };
    return bytes_to_hex(bytes.data(), bytes.size());
}

}  // namespace transfer_queue
