/**
 * @file test_checksum.cpp
 * @brief Unit tests for checksum utilities
 */

#include <gtest/gtest.h>

#include <transfer_queue/core/checksum.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace transfer_queue::test {

namespace {

auto to_bytes(const std::string& text) -> std::vector<std::byte> {
    std::vector<std::byte> bytes(text.size());
    if (!text.empty()) {
        std::memcpy(bytes.data(), text.data(), text.size());
    }
    return bytes;
}

}  // namespace

class ChecksumTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "transfer_queue_test_checksum";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_test_file(const std::string& name, const std::vector<std::byte>& content)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);
        file.write(reinterpret_cast<const char*>(content.data()),
                   static_cast<std::streamsize>(content.size()));
        return path;
    }

    std::filesystem::path test_dir_;
};

// CRC32 Tests

TEST_F(ChecksumTest, CRC32_EmptyData) {
    std::vector<std::byte> empty;
    EXPECT_EQ(checksum::crc32(empty), 0x00000000u);
}

TEST_F(ChecksumTest, CRC32_KnownValue) {
    // "123456789" -> 0xCBF43926
    EXPECT_EQ(checksum::crc32(to_bytes("123456789")), 0xCBF43926u);
}

TEST_F(ChecksumTest, CRC32_IncrementalMatchesOneShot) {
    auto data = to_bytes("The quick brown fox jumps over the lazy dog");
    auto whole = checksum::crc32(data);

    std::span<const std::byte> view(data);
    auto crc = checksum::crc32_update(0, view.subspan(0, 10));
    crc = checksum::crc32_update(crc, view.subspan(10));
    EXPECT_EQ(crc, whole);
}

TEST_F(ChecksumTest, CRC32_HexIsEightLowercaseDigits) {
    EXPECT_EQ(checksum::to_hex(0xCBF43926u), "cbf43926");
    EXPECT_EQ(checksum::to_hex(0x1u), "00000001");
}

// Digest Tests

TEST_F(ChecksumTest, Compute_KnownDigests) {
    auto data = to_bytes("abc");

    auto md5 = checksum::compute(data, checksum_algorithm::md5);
    ASSERT_TRUE(md5);
    EXPECT_EQ(md5.value(), "900150983cd24fb0d6963f7d28e17f72");

    auto sha1 = checksum::compute(data, checksum_algorithm::sha1);
    ASSERT_TRUE(sha1);
    EXPECT_EQ(sha1.value(), "a9993e364706816aba3e25717850c26c9cd0d89d");

    auto sha256 = checksum::compute(data, checksum_algorithm::sha256);
    ASSERT_TRUE(sha256);
    EXPECT_EQ(sha256.value(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    auto crc = checksum::compute(to_bytes("123456789"), checksum_algorithm::crc32);
    ASSERT_TRUE(crc);
    EXPECT_EQ(crc.value(), "cbf43926");
}

TEST_F(ChecksumTest, Compute_EmptySha256) {
    auto hash = checksum::compute({}, checksum_algorithm::sha256);
    ASSERT_TRUE(hash);
    EXPECT_EQ(hash.value(),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(ChecksumTest, Compute_DigestLengthMatchesAlgorithm) {
    auto data = to_bytes("payload");
    for (auto algo : {checksum_algorithm::crc32, checksum_algorithm::md5,
                      checksum_algorithm::sha1, checksum_algorithm::sha256,
                      checksum_algorithm::sha512}) {
        auto hash = checksum::compute(data, algo);
        ASSERT_TRUE(hash) << to_string(algo);
        EXPECT_EQ(hash.value().size(), hex_length(algo)) << to_string(algo);
    }
}

TEST_F(ChecksumTest, Context_StreamingMatchesOneShot) {
    std::vector<std::byte> data(300 * 1024);
    std::mt19937 rng(42);
    for (auto& b : data) {
        b = static_cast<std::byte>(rng() & 0xFF);
    }

    auto ctx = checksum_context::create(checksum_algorithm::sha256);
    ASSERT_TRUE(ctx);
    std::span<const std::byte> view(data);
    for (std::size_t offset = 0; offset < data.size(); offset += 7000) {
        auto len = std::min<std::size_t>(7000, data.size() - offset);
        ASSERT_TRUE(ctx.value().update(view.subspan(offset, len)));
    }
    auto streamed = ctx.value().finish();
    ASSERT_TRUE(streamed);

    auto oneshot = checksum::compute(data, checksum_algorithm::sha256);
    ASSERT_TRUE(oneshot);
    EXPECT_EQ(streamed.value(), oneshot.value());
}

TEST_F(ChecksumTest, Context_UpdateAfterFinishFails) {
    auto ctx = checksum_context::create(checksum_algorithm::md5);
    ASSERT_TRUE(ctx);
    ASSERT_TRUE(ctx.value().finish());

    auto data = to_bytes("late");
    EXPECT_FALSE(ctx.value().update(data));
}

// File Tests

TEST_F(ChecksumTest, ComputeFile_MatchesMemoryHash) {
    std::vector<std::byte> data(1024 * 1024 + 17);
    for (std::size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<std::byte>(i % 251);
    }
    auto path = create_test_file("large.bin", data);

    for (auto algo : {checksum_algorithm::crc32, checksum_algorithm::sha256}) {
        auto memory = checksum::compute(data, algo);
        auto file = checksum::compute_file(path, algo, 4096);
        ASSERT_TRUE(memory);
        ASSERT_TRUE(file);
        EXPECT_EQ(memory.value(), file.value()) << to_string(algo);
    }
}

TEST_F(ChecksumTest, ComputeFile_NonExistent) {
    auto missing = checksum::compute_file(test_dir_ / "missing.bin", checksum_algorithm::sha256);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, error_code::file_read_error);
}

// Algorithm Helpers

TEST_F(ChecksumTest, AlgorithmNamesRoundTrip) {
    for (auto algo : {checksum_algorithm::crc32, checksum_algorithm::md5,
                      checksum_algorithm::sha1, checksum_algorithm::sha256,
                      checksum_algorithm::sha512}) {
        auto parsed = checksum_algorithm_from_string(to_string(algo));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, algo);
    }
    EXPECT_FALSE(checksum_algorithm_from_string("blake3").has_value());
}

TEST_F(ChecksumTest, AlgorithmForHexLength) {
    EXPECT_EQ(algorithm_for_hex_length(32), checksum_algorithm::md5);
    EXPECT_EQ(algorithm_for_hex_length(40), checksum_algorithm::sha1);
    EXPECT_EQ(algorithm_for_hex_length(64), checksum_algorithm::sha256);
    EXPECT_EQ(algorithm_for_hex_length(128), checksum_algorithm::sha512);
    EXPECT_FALSE(algorithm_for_hex_length(8).has_value());
    EXPECT_EQ(algorithm_for_hex_length(8, true), checksum_algorithm::crc32);
    EXPECT_FALSE(algorithm_for_hex_length(33).has_value());
}

}  // namespace transfer_queue::test
