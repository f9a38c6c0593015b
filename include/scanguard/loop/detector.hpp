#pragma once

#include "scanguard/core/result.hpp"
#include "scanguard/core/time.hpp"
#include "scanguard/loop/types.hpp"

#include <spdlog/common.h>

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace scanguard::events {
class EventBus;
}

namespace scanguard::loop {

/**
 * @brief Detects traversal loops while a crawl descends into directories
 *
 * One instance is shared by every task of a sync run. Callers bracket each
 * directory listing with start_access / complete_access; a rejected
 * start_access means "skip this path this round".
 *
 * Checks, in order, against the path's own history:
 * - an open access for the same path (ConcurrentAccess)
 * - last completion less than min_scan_interval_secs ago (TooSoon)
 * - max_access_count starts within time_window_secs (TooFrequent)
 * - the scan label returning to a path it visited earlier (PatternCycle,
 *   advisory unless reject_on_pattern is set)
 *
 * All state sits behind one mutex held only for the check-and-insert; the
 * caller's I/O between start and complete happens outside of it.
 */
class LoopDetector {
public:
    explicit LoopDetector(LoopDetectionConfig config = {},
                          ClockFn clock = system_clock_fn(),
                          events::EventBus* bus = nullptr);

    LoopDetector(const LoopDetector&) = delete;
    LoopDetector& operator=(const LoopDetector&) = delete;

    /**
     * @brief Register a traversal of @p path, or reject it as a loop
     *
     * Accepted accesses increment total_accesses, rejections increment
     * total_loops_detected. Always succeeds when detection is disabled.
     */
    Result<AccessHandle, LoopError> start_access(const std::string& path,
                                                 const std::string& scan_label);

    /**
     * @brief Close the access opened by start_access
     *
     * Fails with UnknownHandle or AlreadyCompleted instead of touching history.
     */
    Result<void, LoopError> complete_access(const AccessHandle& handle,
                                            std::size_t files_found,
                                            std::size_t dirs_found,
                                            std::optional<std::string> error = std::nullopt);

    [[nodiscard]] LoopMetrics get_metrics() const;
    [[nodiscard]] LoopDetectionConfig config() const;
    [[nodiscard]] bool is_enabled() const;

    /// Replace thresholds; invalid configs are rejected and the old one kept
    Result<void> update_config(LoopDetectionConfig new_config);

    /// Drop all history, open accesses and counters
    void clear_state();

    /// Open accesses running longer than max_scan_duration_secs
    [[nodiscard]] std::vector<AccessRecord> find_stuck_accesses() const;

    /// Completed records still retained for @p path, oldest first
    [[nodiscard]] std::vector<AccessRecord> path_history(const std::string& path) const;

private:
    struct PathState {
        std::deque<TimePoint> window_starts;   ///< Start times inside the frequency window
        std::deque<AccessRecord> completed;
        std::optional<TimePoint> last_completed_at;
        TimePoint last_activity{};
        std::size_t open_count = 0;
    };

    /// Completed paths of one scan label, newest last
    struct PatternState {
        std::deque<std::string> sequence;
        TimePoint last_activity{};
    };

    std::optional<LoopError> check_locked(const std::string& path,
                                          const std::string& scan_label,
                                          TimePoint now,
                                          std::optional<std::vector<std::string>>& cycle_alert);
    AccessHandle register_locked(const std::string& path, const std::string& scan_label, TimePoint now);
    void prune_window_locked(PathState& state, TimePoint now) const;
    void record_pattern_locked(const AccessRecord& record, TimePoint now);
    void enforce_capacity_locked(TimePoint now);

    void report_rejection(const LoopError& error, const std::string& scan_label,
                          spdlog::level::level_enum level) const;
    void report_cycle_alert(const std::string& path, const std::string& scan_label,
                            const std::vector<std::string>& cycle,
                            spdlog::level::level_enum level) const;

    mutable std::mutex mutex_;
    LoopDetectionConfig config_;
    spdlog::level::level_enum log_level_;
    ClockFn clock_;
    events::EventBus* bus_ = nullptr;

    std::unordered_map<std::string, PathState> paths_;
    std::unordered_map<std::uint64_t, AccessRecord> open_;
    std::unordered_map<std::string, PatternState> patterns_;

    std::uint64_t next_access_id_ = 1;
    std::uint64_t first_live_id_ = 1;   ///< Handles below this predate the last clear_state
    std::size_t history_size_ = 0;
    std::uint64_t total_accesses_ = 0;
    std::uint64_t total_loops_detected_ = 0;
    std::uint64_t total_pattern_alerts_ = 0;
    std::uint64_t slow_scans_ = 0;
};

/**
 * @brief Completes an access when it goes out of scope
 *
 * Keeps early returns and exceptions from leaving an access open forever,
 * which would make every later visit of the path a ConcurrentAccess.
 */
class ScopedAccess {
public:
    ScopedAccess(LoopDetector& detector, AccessHandle handle) noexcept;
    ~ScopedAccess();

    ScopedAccess(ScopedAccess&& other) noexcept;
    ScopedAccess& operator=(ScopedAccess&&) = delete;
    ScopedAccess(const ScopedAccess&) = delete;
    ScopedAccess& operator=(const ScopedAccess&) = delete;

    Result<void, LoopError> complete(std::size_t files_found,
                                     std::size_t dirs_found,
                                     std::optional<std::string> error = std::nullopt);

    [[nodiscard]] const AccessHandle& handle() const noexcept { return handle_; }
    [[nodiscard]] bool active() const noexcept { return detector_ != nullptr; }

private:
    LoopDetector* detector_;
    AccessHandle handle_;
};

} // namespace scanguard::loop
