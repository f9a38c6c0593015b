#pragma once

#include "scanguard/core/result.hpp"
#include "scanguard/core/time.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace scanguard::loop {

/**
 * @brief Thresholds for one LoopDetector instance
 *
 * Values are hot-swappable through LoopDetector::update_config and take
 * effect on the next start_access call.
 */
struct LoopDetectionConfig {
    bool enabled = true;
    std::uint32_t max_access_count = 3;        ///< Accesses per path within the window before rejecting
    std::uint64_t time_window_secs = 300;
    std::uint64_t max_scan_duration_secs = 60; ///< Advisory per-access timeout for the caller
    std::uint64_t min_scan_interval_secs = 5;  ///< Minimum gap between completed and next visit of a path
    std::size_t max_pattern_depth = 10;
    std::size_t max_tracked_directories = 1000;
    bool enable_pattern_analysis = true;
    bool reject_on_pattern = false;            ///< Turn cycle alerts into PatternCycle rejections
    std::string log_level = "warn";

    /// Conservative thresholds for long-running servers
    [[nodiscard]] static LoopDetectionConfig production();
    /// Relaxed thresholds for local iteration
    [[nodiscard]] static LoopDetectionConfig development();
    /// Lowest overhead: large limits, no pattern tracking
    [[nodiscard]] static LoopDetectionConfig minimal();

    /// Look up a preset by name ("production", "development", "minimal")
    [[nodiscard]] static std::optional<LoopDetectionConfig> preset(const std::string& name);

    [[nodiscard]] Result<void> validate() const;
};

[[nodiscard]] nlohmann::json config_to_json(const LoopDetectionConfig& config);

/**
 * @brief Opaque ticket for one accepted traversal step
 *
 * Returned by start_access and consumed by complete_access.
 */
struct AccessHandle {
    std::uint64_t id = 0;
    std::string path;
    std::string scan_label;
    TimePoint started_at{};
};

/**
 * @brief Bookkeeping for one traversal of a path
 */
struct AccessRecord {
    std::uint64_t access_id = 0;
    std::string path;
    std::string scan_id;
    TimePoint start_time{};
    std::optional<TimePoint> end_time;
    std::size_t files_found = 0;
    std::size_t dirs_found = 0;
    std::optional<std::string> error;

    [[nodiscard]] bool is_open() const noexcept { return !end_time.has_value(); }
};

enum class LoopErrorKind {
    ConcurrentAccess,
    TooSoon,
    TooFrequent,
    PatternCycle,
    UnknownHandle,     ///< complete_access with a foreign handle
    AlreadyCompleted   ///< complete_access called twice
};

[[nodiscard]] const char* to_string(LoopErrorKind kind) noexcept;

struct LoopError {
    LoopErrorKind kind = LoopErrorKind::ConcurrentAccess;
    std::string path;
    std::chrono::milliseconds elapsed{0};  ///< TooSoon: time since last completion
    std::uint32_t count = 0;               ///< TooFrequent: accesses in window
    std::vector<std::string> cycle;        ///< PatternCycle: repeating sequence

    [[nodiscard]] bool is_rejection() const noexcept {
        return kind != LoopErrorKind::UnknownHandle && kind != LoopErrorKind::AlreadyCompleted;
    }

    [[nodiscard]] std::string message() const;
};

/**
 * @brief Snapshot returned by LoopDetector::get_metrics
 */
struct LoopMetrics {
    bool enabled = true;
    std::uint64_t total_accesses = 0;
    std::uint64_t total_loops_detected = 0;
    std::uint64_t total_pattern_alerts = 0;
    std::uint64_t slow_scans = 0;
    std::size_t active_accesses = 0;
    std::size_t history_size = 0;
    std::size_t tracked_paths = 0;
    std::size_t tracked_patterns = 0;
    LoopDetectionConfig config;

    [[nodiscard]] nlohmann::json to_json() const;
};

} // namespace scanguard::loop
