#include "scanguard/loop/types.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <array>

namespace scanguard::loop {
namespace {

constexpr std::array<const char*, 7> kLogLevels {
    "trace", "debug", "info", "warn", "error", "critical", "off",
};

bool is_known_log_level(const std::string& level) {
    return std::find(kLogLevels.begin(), kLogLevels.end(), level) != kLogLevels.end();
}

} // namespace

LoopDetectionConfig LoopDetectionConfig::production() {
    LoopDetectionConfig config;
    config.max_access_count = 3;
    config.time_window_secs = 300;
    config.max_scan_duration_secs = 120;
    config.min_scan_interval_secs = 10;
    config.max_pattern_depth = 5;
    config.max_tracked_directories = 500;
    config.enable_pattern_analysis = true;
    config.log_level = "warn";
    return config;
}

LoopDetectionConfig LoopDetectionConfig::development() {
    LoopDetectionConfig config;
    config.max_access_count = 5;
    config.time_window_secs = 180;
    config.max_scan_duration_secs = 60;
    config.min_scan_interval_secs = 2;
    config.max_pattern_depth = 10;
    config.max_tracked_directories = 100;
    config.enable_pattern_analysis = true;
    config.log_level = "debug";
    return config;
}

LoopDetectionConfig LoopDetectionConfig::minimal() {
    LoopDetectionConfig config;
    config.max_access_count = 10;
    config.time_window_secs = 600;
    config.max_scan_duration_secs = 300;
    config.min_scan_interval_secs = 1;
    config.max_pattern_depth = 3;
    config.max_tracked_directories = 50;
    config.enable_pattern_analysis = false;
    config.log_level = "warn";
    return config;
}

std::optional<LoopDetectionConfig> LoopDetectionConfig::preset(const std::string& name) {
    if (name == "production") {
        return production();
    }
    if (name == "development") {
        return development();
    }
    if (name == "minimal") {
        return minimal();
    }
    return std::nullopt;
}

Result<void> LoopDetectionConfig::validate() const {
    if (max_access_count < 1) {
        return Err<void>(std::string("max_access_count must be at least 1"));
    }
    if (time_window_secs == 0) {
        return Err<void>(std::string("time_window_secs must be greater than 0"));
    }
    if (max_tracked_directories < 1) {
        return Err<void>(std::string("max_tracked_directories must be at least 1"));
    }
    if (enable_pattern_analysis && max_pattern_depth < 2) {
        return Err<void>(std::string("max_pattern_depth must be at least 2 when pattern analysis is enabled"));
    }
    if (!is_known_log_level(log_level)) {
        return Err<void>("unknown log_level '" + log_level + "'");
    }
    return Ok();
}

nlohmann::json config_to_json(const LoopDetectionConfig& config) {
    return nlohmann::json{
        {"enabled", config.enabled},
        {"max_access_count", config.max_access_count},
        {"time_window_secs", config.time_window_secs},
        {"max_scan_duration_secs", config.max_scan_duration_secs},
        {"min_scan_interval_secs", config.min_scan_interval_secs},
        {"max_pattern_depth", config.max_pattern_depth},
        {"max_tracked_directories", config.max_tracked_directories},
        {"enable_pattern_analysis", config.enable_pattern_analysis},
        {"reject_on_pattern", config.reject_on_pattern},
        {"log_level", config.log_level},
    };
}

const char* to_string(LoopErrorKind kind) noexcept {
    switch (kind) {
        case LoopErrorKind::ConcurrentAccess: return "concurrent_access";
        case LoopErrorKind::TooSoon: return "too_soon";
        case LoopErrorKind::TooFrequent: return "too_frequent";
        case LoopErrorKind::PatternCycle: return "pattern_cycle";
        case LoopErrorKind::UnknownHandle: return "unknown_handle";
        case LoopErrorKind::AlreadyCompleted: return "already_completed";
    }
    return "unknown";
}

std::string LoopError::message() const {
    switch (kind) {
        case LoopErrorKind::ConcurrentAccess:
            return fmt::format("Concurrent access to '{}': another scan of this directory is still open", path);
        case LoopErrorKind::TooSoon:
            return fmt::format("Directory '{}' re-scanned {:.1f}s after its last scan completed",
                               path, static_cast<double>(elapsed.count()) / 1000.0);
        case LoopErrorKind::TooFrequent:
            return fmt::format("Directory '{}' accessed {} times within the frequency window", path, count);
        case LoopErrorKind::PatternCycle: {
            std::string chain;
            for (const auto& step : cycle) {
                if (!chain.empty()) {
                    chain += " -> ";
                }
                chain += step;
            }
            return fmt::format("Circular traversal pattern at '{}': {}", path, chain);
        }
        case LoopErrorKind::UnknownHandle:
            return fmt::format("No open access matches the handle for '{}'", path);
        case LoopErrorKind::AlreadyCompleted:
            return fmt::format("Access to '{}' was already completed", path);
    }
    return "loop detection error";
}

nlohmann::json LoopMetrics::to_json() const {
    return nlohmann::json{
        {"enabled", enabled},
        {"total_accesses", total_accesses},
        {"total_loops_detected", total_loops_detected},
        {"total_pattern_alerts", total_pattern_alerts},
        {"slow_scans", slow_scans},
        {"active_accesses", active_accesses},
        {"history_size", history_size},
        {"tracked_paths", tracked_paths},
        {"tracked_patterns", tracked_patterns},
        {"config", config_to_json(config)},
    };
}

} // namespace scanguard::loop
