#include "scanguard/config/config.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using nlohmann::json;
using scanguard::config::AppConfig;
using scanguard::config::config_from_json;
using scanguard::config::load_config;
using scanguard::errors::SourceType;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto id = timestamp ^ (counter.fetch_add(1) << 8);
    auto unique = fs::temp_directory_path() / fs::path("scanguard_config_test_" + std::to_string(id));
    fs::create_directories(unique);
    return unique;
}

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << content;
}

} // namespace

TEST(ConfigTest, EmptyDocumentKeepsDefaults) {
    auto config = config_from_json(json::object());
    ASSERT_TRUE(config.is_ok()) << config.error();

    const auto& value = config.value();
    EXPECT_EQ(value.log_level, "info");
    EXPECT_EQ(value.crawl.worker_threads, 4u);
    EXPECT_EQ(value.crawl.source_type, SourceType::Local);
    EXPECT_FALSE(value.crawl.source_id.has_value());
    EXPECT_EQ(value.tracker.max_backoff_secs, 86400u);
    EXPECT_EQ(value.loop_detection.max_access_count, 3u);
    EXPECT_TRUE(value.validate().is_ok());
}

TEST(ConfigTest, SectionsOverrideDefaults) {
    auto config = config_from_json(json::parse(R"({
        "log_level": "debug",
        "loop_detection": {"max_access_count": 7, "reject_on_pattern": true},
        "tracker": {"store_path": "/var/lib/scanguard/failures.json", "max_backoff_secs": 3600},
        "crawl": {"worker_threads": 8, "source_type": "webdav", "source_id": "nas", "follow_symlinks": true}
    })"));
    ASSERT_TRUE(config.is_ok()) << config.error();

    const auto& value = config.value();
    EXPECT_EQ(value.log_level, "debug");
    EXPECT_EQ(value.loop_detection.max_access_count, 7u);
    EXPECT_TRUE(value.loop_detection.reject_on_pattern);
    EXPECT_EQ(value.loop_detection.time_window_secs, 300u);
    EXPECT_EQ(value.tracker.store_path, "/var/lib/scanguard/failures.json");
    EXPECT_EQ(value.tracker.max_backoff_secs, 3600u);
    EXPECT_EQ(value.crawl.worker_threads, 8u);
    EXPECT_EQ(value.crawl.source_type, SourceType::WebDAV);
    EXPECT_EQ(value.crawl.source_id, std::optional<std::string>("nas"));
    EXPECT_TRUE(value.crawl.follow_symlinks);
}

TEST(ConfigTest, PresetIsAppliedBeforeOverrides) {
    auto config = config_from_json(json::parse(R"({
        "loop_detection": {"preset": "development", "min_scan_interval_secs": 0}
    })"));
    ASSERT_TRUE(config.is_ok()) << config.error();

    EXPECT_EQ(config.value().loop_detection.max_access_count, 5u);
    EXPECT_EQ(config.value().loop_detection.log_level, "debug");
    EXPECT_EQ(config.value().loop_detection.min_scan_interval_secs, 0u);
}

TEST(ConfigTest, RejectsBadValues) {
    auto negative = config_from_json(json::parse(R"({"crawl": {"worker_threads": -2}})"));
    ASSERT_TRUE(negative.is_error());
    EXPECT_EQ(negative.error(), "config key 'crawl.worker_threads' must be a non-negative integer");

    auto wrong_type = config_from_json(json::parse(R"({"log_level": 3})"));
    ASSERT_TRUE(wrong_type.is_error());
    EXPECT_EQ(wrong_type.error(), "config key 'log_level' must be a string");

    auto not_section = config_from_json(json::parse(R"({"tracker": []})"));
    ASSERT_TRUE(not_section.is_error());
    EXPECT_EQ(not_section.error(), "config key 'tracker' must be an object");

    auto preset = config_from_json(json::parse(R"({"loop_detection": {"preset": "turbo"}})"));
    ASSERT_TRUE(preset.is_error());
    EXPECT_EQ(preset.error(), "unknown loop_detection.preset 'turbo'");

    auto source = config_from_json(json::parse(R"({"crawl": {"source_type": "ftp"}})"));
    ASSERT_TRUE(source.is_error());
    EXPECT_EQ(source.error(), "unknown crawl.source_type 'ftp'");

    EXPECT_TRUE(config_from_json(json::array()).is_error());
}

TEST(ConfigTest, RejectsIntegersWiderThanTheField) {
    auto wrapped = config_from_json(json::parse(R"({"loop_detection": {"max_access_count": 4294967297}})"));
    ASSERT_TRUE(wrapped.is_error());
    EXPECT_EQ(wrapped.error(), "config key 'loop_detection.max_access_count' must be at most 4294967295");

    auto backoff = config_from_json(json::parse(R"({"tracker": {"max_backoff_secs": 4294967296}})"));
    ASSERT_TRUE(backoff.is_error());
    EXPECT_NE(backoff.error().find("tracker.max_backoff_secs"), std::string::npos);

    auto largest = config_from_json(json::parse(R"({"loop_detection": {"max_access_count": 4294967295}})"));
    ASSERT_TRUE(largest.is_ok()) << largest.error();
    EXPECT_EQ(largest.value().loop_detection.max_access_count, 4294967295u);

    // 64-bit fields take the whole range.
    auto window = config_from_json(json::parse(R"({"loop_detection": {"time_window_secs": 4294967297}})"));
    ASSERT_TRUE(window.is_ok()) << window.error();
    EXPECT_EQ(window.value().loop_detection.time_window_secs, 4294967297u);
}

TEST(ConfigTest, ValidateChecksRanges) {
    AppConfig config;
    config.crawl.worker_threads = 0;
    EXPECT_EQ(config.validate().error(), "crawl.worker_threads must be at least 1");

    config = AppConfig{};
    config.log_level = "chatty";
    EXPECT_EQ(config.validate().error(), "unknown log_level 'chatty'");

    config = AppConfig{};
    config.log_level = "off";
    EXPECT_TRUE(config.validate().is_ok());

    config = AppConfig{};
    config.loop_detection.time_window_secs = 0;
    auto invalid = config.validate();
    ASSERT_TRUE(invalid.is_error());
    EXPECT_EQ(invalid.error().rfind("loop_detection: ", 0), 0u);
}

TEST(ConfigTest, ToJsonFeedsBackIntoParser) {
    AppConfig config;
    config.crawl.source_type = SourceType::S3;
    config.crawl.source_id = "bucket-eu";
    config.tracker.retry_candidate_limit = 10;

    auto reparsed = config_from_json(config.to_json());
    ASSERT_TRUE(reparsed.is_ok()) << reparsed.error();
    EXPECT_EQ(reparsed.value().crawl.source_type, SourceType::S3);
    EXPECT_EQ(reparsed.value().crawl.source_id, std::optional<std::string>("bucket-eu"));
    EXPECT_EQ(reparsed.value().tracker.retry_candidate_limit, 10u);
}

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override { root_ = create_temp_dir(); }
    void TearDown() override { fs::remove_all(root_); }

    fs::path root_;
};

TEST_F(ConfigFileTest, LoadsFromDisk) {
    const auto path = root_ / "scanguard.json";
    write_file(path, R"({"crawl": {"user_id": "alice", "max_depth": 3}})");

    auto config = load_config(path);
    ASSERT_TRUE(config.is_ok()) << config.error();
    EXPECT_EQ(config.value().crawl.user_id, "alice");
    EXPECT_EQ(config.value().crawl.max_depth, 3u);
}

TEST_F(ConfigFileTest, ReportsMissingAndMalformedFiles) {
    auto missing = load_config(root_ / "absent.json");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().rfind("Failed to open config file: ", 0), 0u);

    const auto broken = root_ / "broken.json";
    write_file(broken, "{ \"crawl\": ");
    auto malformed = load_config(broken);
    ASSERT_TRUE(malformed.is_error());
    EXPECT_EQ(malformed.error().rfind("Config file is not valid JSON: ", 0), 0u);

    const auto typed = root_ / "typed.json";
    write_file(typed, R"({"crawl": {"max_depth": "deep"}})");
    auto wrong = load_config(typed);
    ASSERT_TRUE(wrong.is_error());
    EXPECT_NE(wrong.error().find("crawl.max_depth"), std::string::npos);
    EXPECT_EQ(wrong.error().rfind(typed.string(), 0), 0u);
}
