#pragma once

#include "scanguard/core/result.hpp"
#include "scanguard/errors/retry_policy.hpp"
#include "scanguard/errors/types.hpp"
#include "scanguard/loop/types.hpp"
#include "scanguard/store/failure_store.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace scanguard::config {

struct TrackerSettings {
    std::string store_path = "scanguard-failures.json";
    std::size_t retry_candidate_limit = store::kDefaultRetryCandidateLimit;
    std::uint32_t max_backoff_secs = errors::kMaxRetryDelaySeconds;
};

struct CrawlSettings {
    std::size_t worker_threads = 4;
    std::size_t max_depth = 64;
    bool follow_symlinks = false;
    std::string user_id = "local";
    errors::SourceType source_type = errors::SourceType::Local;
    std::optional<std::string> source_id;
};

/**
 * @brief Everything a crawl process needs, loadable from one JSON file
 *
 * {
 *   "log_level": "info",
 *   "loop_detection": { "preset": "production", "min_scan_interval_secs": 2 },
 *   "tracker": { "store_path": "failures.json", "max_backoff_secs": 3600 },
 *   "crawl": { "worker_threads": 8, "max_depth": 32, "user_id": "alice" }
 * }
 *
 * Missing keys keep their defaults and unknown keys are ignored. A key
 * holding the wrong JSON type is an error naming the key.
 */
struct AppConfig {
    std::string log_level = "info";
    loop::LoopDetectionConfig loop_detection;
    TrackerSettings tracker;
    CrawlSettings crawl;

    [[nodiscard]] Result<void> validate() const;
    [[nodiscard]] nlohmann::json to_json() const;
};

/// Build from an already parsed document, starting at the defaults
[[nodiscard]] Result<AppConfig> config_from_json(const nlohmann::json& document);

[[nodiscard]] Result<AppConfig> load_config(const std::filesystem::path& path);

} // namespace scanguard::config
