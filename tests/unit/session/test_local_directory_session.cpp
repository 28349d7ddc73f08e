/**
 * @file test_local_directory_session.cpp
 * @brief Unit tests for the local directory backed session
 */

#include <gtest/gtest.h>

#include <transfer_queue/session/local_directory_session.h>

#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <thread>

namespace transfer_queue::test {

class LocalDirectorySessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() / "transfer_queue_test_local_session";
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_ / "pub" / "nested");
        write_file("pub/hello.txt", "hello world");
        write_file("pub/nested/deep.bin", std::string(100, 'x'));
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    void write_file(const std::string& relative, const std::string& content) {
        std::ofstream file(root_ / relative, std::ios::binary);
        file << content;
    }

    auto read_all(remote_read_stream& stream) -> std::string {
        std::string content;
        std::array<std::byte, 4> buffer{};
        while (true) {
            auto n = stream.read(buffer);
            EXPECT_TRUE(n);
            if (!n || n.value() == 0) {
                break;
            }
            content.append(reinterpret_cast<const char*>(buffer.data()), n.value());
        }
        return content;
    }

    std::filesystem::path root_;
};

TEST_F(LocalDirectorySessionTest, Connect_FailsForMissingRoot) {
    local_directory_session session(root_ / "does_not_exist");
    auto connected = session.connect();
    ASSERT_FALSE(connected);
    EXPECT_EQ(connected.error().code, error_code::connection_failed);
    EXPECT_FALSE(session.is_open());
}

TEST_F(LocalDirectorySessionTest, Operations_RequireConnect) {
    local_directory_session session(root_);
    auto info = session.stat("/pub/hello.txt");
    ASSERT_FALSE(info);
    EXPECT_EQ(info.error().code, error_code::not_connected);
}

TEST_F(LocalDirectorySessionTest, Stat_FileAndDirectory) {
    local_directory_session session(root_);
    ASSERT_TRUE(session.connect());
    EXPECT_TRUE(session.is_open());

    auto file = session.stat("/pub/hello.txt");
    ASSERT_TRUE(file);
    EXPECT_FALSE(file.value().is_directory);
    EXPECT_EQ(file.value().size, 11u);

    auto dir = session.stat("/pub");
    ASSERT_TRUE(dir);
    EXPECT_TRUE(dir.value().is_directory);
}

TEST_F(LocalDirectorySessionTest, Stat_MissingIsNotFound) {
    local_directory_session session(root_);
    ASSERT_TRUE(session.connect());
    auto info = session.stat("/pub/missing.txt");
    ASSERT_FALSE(info);
    EXPECT_EQ(info.error().code, error_code::remote_not_found);
}

TEST_F(LocalDirectorySessionTest, ParentTraversalRejected) {
    local_directory_session session(root_);
    ASSERT_TRUE(session.connect());
    auto info = session.stat("/pub/../../etc/passwd");
    ASSERT_FALSE(info);
    EXPECT_EQ(info.error().code, error_code::invalid_file_path);
}

TEST_F(LocalDirectorySessionTest, ListDir_ReturnsJoinedPaths) {
    local_directory_session session(root_);
    ASSERT_TRUE(session.connect());

    auto listing = session.list_dir("/pub");
    ASSERT_TRUE(listing);
    auto entries = listing.value();
    std::sort(entries.begin(), entries.end(),
              [](const remote_entry& a, const remote_entry& b) { return a.name < b.name; });

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, "hello.txt");
    EXPECT_EQ(entries[0].path, "/pub/hello.txt");
    EXPECT_FALSE(entries[0].is_directory);
    EXPECT_EQ(entries[0].size, 11u);
    EXPECT_EQ(entries[1].name, "nested");
    EXPECT_EQ(entries[1].path, "/pub/nested");
    EXPECT_TRUE(entries[1].is_directory);
}

TEST_F(LocalDirectorySessionTest, ListDir_RemovedDirectoryIsNotFound) {
    local_directory_session session(root_);
    ASSERT_TRUE(session.connect());
    std::filesystem::remove_all(root_ / "pub" / "nested");

    auto listing = session.list_dir("/pub/nested");
    ASSERT_FALSE(listing);
    EXPECT_EQ(listing.error().code, error_code::remote_not_found);
}

TEST_F(LocalDirectorySessionTest, ListDir_UnreadableDirectoryIsAnError) {
    local_directory_session session(root_);
    ASSERT_TRUE(session.connect());
    auto locked = root_ / "pub" / "nested";
    std::filesystem::permissions(locked, std::filesystem::perms::none);

    std::error_code access_ec;
    std::filesystem::directory_iterator readable(locked, access_ec);
    if (!access_ec) {
        std::filesystem::permissions(locked, std::filesystem::perms::owner_all);
        GTEST_SKIP() << "permissions are not enforced for this user";
    }

    std::optional<result<std::vector<remote_entry>>> listing;
    EXPECT_NO_THROW(listing.emplace(session.list_dir("/pub/nested")));
    std::filesystem::permissions(locked, std::filesystem::perms::owner_all);
    ASSERT_TRUE(listing.has_value());
    ASSERT_FALSE(*listing);
    EXPECT_EQ(listing->error().code, error_code::remote_permission_denied);
}

TEST_F(LocalDirectorySessionTest, ListDir_ToleratesEntriesRemovedWhileListing) {
    auto crowded = root_ / "pub" / "crowded";
    std::filesystem::create_directories(crowded);
    for (int i = 0; i < 500; ++i) {
        write_file("pub/crowded/f" + std::to_string(i), "x");
    }
    local_directory_session session(root_);
    ASSERT_TRUE(session.connect());

    std::thread remover([&] {
        for (int i = 0; i < 500; ++i) {
            std::error_code ec;
            std::filesystem::remove(crowded / ("f" + std::to_string(i)), ec);
        }
    });
    std::optional<result<std::vector<remote_entry>>> listing;
    EXPECT_NO_THROW(listing.emplace(session.list_dir("/pub/crowded")));
    remover.join();

    ASSERT_TRUE(listing.has_value());
    ASSERT_TRUE(*listing);
    EXPECT_LE(listing->value().size(), 500u);
}

TEST_F(LocalDirectorySessionTest, OpenRead_WholeFile) {
    local_directory_session session(root_);
    ASSERT_TRUE(session.connect());

    auto stream = session.open_read("/pub/hello.txt", 0);
    ASSERT_TRUE(stream);
    EXPECT_EQ(read_all(*stream.value()), "hello world");
}

TEST_F(LocalDirectorySessionTest, OpenRead_FromOffset) {
    local_directory_session session(root_);
    ASSERT_TRUE(session.connect());

    auto stream = session.open_read("/pub/hello.txt", 6);
    ASSERT_TRUE(stream);
    EXPECT_EQ(read_all(*stream.value()), "world");
}

TEST_F(LocalDirectorySessionTest, OpenRead_DirectoryIsNotAFile) {
    local_directory_session session(root_);
    ASSERT_TRUE(session.connect());

    auto stream = session.open_read("/pub/nested", 0);
    ASSERT_FALSE(stream);
    EXPECT_EQ(stream.error().code, error_code::remote_not_a_file);
}

TEST_F(LocalDirectorySessionTest, Stream_FailsAfterClose) {
    local_directory_session session(root_);
    ASSERT_TRUE(session.connect());

    auto stream = session.open_read("/pub/nested/deep.bin", 0);
    ASSERT_TRUE(stream);
    session.close();
    EXPECT_FALSE(session.is_open());

    std::array<std::byte, 16> buffer{};
    auto n = stream.value()->read(buffer);
    ASSERT_FALSE(n);
    EXPECT_EQ(n.error().code, error_code::connection_lost);
}

TEST_F(LocalDirectorySessionTest, ReadFile_RespectsLimit) {
    local_directory_session session(root_);
    ASSERT_TRUE(session.connect());

    auto small = session.read_file("/pub/hello.txt", 64);
    ASSERT_TRUE(small);
    EXPECT_EQ(small.value(), "hello world");

    auto large = session.read_file("/pub/nested/deep.bin", 10);
    ASSERT_FALSE(large);
    EXPECT_EQ(large.error().code, error_code::remote_io_error);
}

}  // namespace transfer_queue::test
