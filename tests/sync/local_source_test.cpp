#include "scanguard/sync/local_source.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using scanguard::errors::SourceType;
using scanguard::sync::DirectoryListing;
using scanguard::sync::LocalDirectorySource;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto id = timestamp ^ (counter.fetch_add(1) << 8);
    auto unique = fs::temp_directory_path() / fs::path("scanguard_local_test_" + std::to_string(id));
    fs::create_directories(unique);
    return unique;
}

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << content;
}

std::vector<std::string> directory_names(const DirectoryListing& listing) {
    std::vector<std::string> names;
    for (const auto& entry : listing.directories) {
        names.push_back(fs::path(entry.path).filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace

class LocalDirectorySourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::canonical(create_temp_dir());
        fs::create_directories(root_ / "alpha" / "nested");
        fs::create_directories(root_ / "beta");
        write_file(root_ / "notes.txt", "hello");
    }

    void TearDown() override {
        if (!root_.empty()) {
            fs::remove_all(root_);
        }
    }

    fs::path root_;
};

TEST_F(LocalDirectorySourceTest, ListsOneLevel) {
    LocalDirectorySource source;
    EXPECT_EQ(source.source_type(), SourceType::Local);

    auto listing = source.list_directory(root_.string());
    ASSERT_TRUE(listing.is_ok()) << listing.error().describe();

    const auto& directory = listing.value();
    EXPECT_EQ(directory.path, root_.string());
    EXPECT_FALSE(directory.etag.empty());
    EXPECT_EQ(directory.server_type, std::optional<std::string>("local"));
    EXPECT_EQ(directory_names(directory), (std::vector<std::string>{"alpha", "beta"}));

    ASSERT_EQ(directory.files.size(), 1u);
    EXPECT_EQ(directory.files[0].path, (root_ / "notes.txt").generic_string());
    EXPECT_EQ(directory.files[0].size, 5u);
    EXPECT_FALSE(directory.files[0].etag.empty());

    // Children carry full paths that can be listed in turn.
    const auto alpha = std::find_if(directory.directories.begin(), directory.directories.end(),
                                    [](const auto& entry) { return fs::path(entry.path).filename() == "alpha"; });
    ASSERT_NE(alpha, directory.directories.end());
    auto nested = source.list_directory(alpha->path);
    ASSERT_TRUE(nested.is_ok());
    EXPECT_EQ(directory_names(nested.value()), std::vector<std::string>{"nested"});
}

TEST_F(LocalDirectorySourceTest, MissingDirectoryReportsOsError) {
    LocalDirectorySource source;
    const auto missing = (root_ / "does-not-exist").string();

    auto listing = source.list_directory(missing);
    ASSERT_TRUE(listing.is_error());
    EXPECT_EQ(listing.error().os_error, std::optional<int>(ENOENT));
    EXPECT_NE(listing.error().message.find(missing), std::string::npos);
}

TEST_F(LocalDirectorySourceTest, FileIsNotADirectory) {
    LocalDirectorySource source;

    auto listing = source.list_directory((root_ / "notes.txt").string());
    ASSERT_TRUE(listing.is_error());
    EXPECT_EQ(listing.error().os_error, std::optional<int>(ENOTDIR));
}

TEST_F(LocalDirectorySourceTest, SymlinksFollowedOnlyWhenEnabled) {
    std::error_code ec;
    fs::create_directory_symlink(root_ / "alpha", root_ / "shortcut", ec);
    if (ec) {
        GTEST_SKIP() << "symlinks unavailable: " << ec.message();
    }

    LocalDirectorySource plain;
    auto listing = plain.list_directory(root_.string());
    ASSERT_TRUE(listing.is_ok());
    EXPECT_EQ(directory_names(listing.value()), (std::vector<std::string>{"alpha", "beta"}));

    LocalDirectorySource following(true);
    listing = following.list_directory(root_.string());
    ASSERT_TRUE(listing.is_ok());
    // The link is reported under its target's canonical path.
    EXPECT_EQ(directory_names(listing.value()), (std::vector<std::string>{"alpha", "alpha", "beta"}));
}

TEST_F(LocalDirectorySourceTest, EtagForMissingPathIsEmpty) {
    EXPECT_TRUE(LocalDirectorySource::etag_for(root_ / "missing").empty());
    EXPECT_EQ(LocalDirectorySource::etag_for(root_ / "notes.txt"),
              LocalDirectorySource::etag_for(root_ / "notes.txt"));
}
