/**
 * @file events.hpp
 * @brief Event types emitted by the crawl reliability core
 *
 * WHY THIS FILE EXISTS:
 * Loop rejections, recorded failures and skipped directories are the
 * signals operators watch. Defining them as plain structs lets the
 * LoggerComponent and MetricsComponent react without the core knowing
 * they exist.
 *
 * NAMING CONVENTION:
 * Events are past-tense: LoopDetectedEvent, ScanFailureResolvedEvent
 */

#pragma once

#include "scanguard/core/time.hpp"
#include "scanguard/errors/types.hpp"
#include "scanguard/loop/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace scanguard::events {

// ════════════════════════════════════════════════════════
// Loop Detection
// ════════════════════════════════════════════════════════

/**
 * @brief A loop condition was found for a path
 *
 * WHO EMITS: LoopDetector (start_access)
 * WHO SUBSCRIBES: Logger, Metrics
 *
 * rejected == false means an advisory cycle alert; the access went ahead.
 */
struct LoopDetectedEvent {
    std::string path;
    std::string scan_label;
    loop::LoopErrorKind kind = loop::LoopErrorKind::ConcurrentAccess;
    std::string description;
    bool rejected = true;
    std::vector<std::string> cycle;
    TimePoint timestamp = Clock::now();
};

/**
 * @brief An access outlived max_scan_duration_secs
 *
 * WHO EMITS: LoopDetector (complete_access)
 */
struct SlowScanDetectedEvent {
    std::string path;
    std::string scan_label;
    std::chrono::milliseconds duration{0};
    std::uint64_t limit_secs = 0;
    TimePoint timestamp = Clock::now();
};

// ════════════════════════════════════════════════════════
// Failure Tracking
// ════════════════════════════════════════════════════════

/**
 * @brief A scan failure was classified and persisted
 *
 * WHO EMITS: FailureTracker (track_scan_error)
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct ScanFailureRecordedEvent {
    std::string user_id;
    errors::SourceType source_type = errors::SourceType::WebDAV;
    std::string resource_path;
    errors::SourceErrorType error_type = errors::SourceErrorType::Unknown;
    errors::Severity severity = errors::Severity::Medium;
    std::uint32_t failure_count = 0;
    std::uint32_t consecutive_failures = 0;
    std::optional<TimePoint> next_retry_at;
    TimePoint timestamp = Clock::now();
};

/**
 * @brief An open failure was closed
 *
 * WHO EMITS: FailureTracker (mark_scan_successful)
 */
struct ScanFailureResolvedEvent {
    std::string user_id;
    errors::SourceType source_type = errors::SourceType::WebDAV;
    std::string resource_path;
    std::string resolution_method;
    TimePoint timestamp = Clock::now();
};

// ════════════════════════════════════════════════════════
// Crawl
// ════════════════════════════════════════════════════════

enum class SkipReason {
    RetryBackoff,
    UserExcluded,
    LoopRejected
};

[[nodiscard]] inline const char* to_string(SkipReason reason) noexcept {
    switch (reason) {
        case SkipReason::RetryBackoff: return "retry_backoff";
        case SkipReason::UserExcluded: return "user_excluded";
        case SkipReason::LoopRejected: return "loop_rejected";
    }
    return "unknown";
}

/**
 * @brief The crawler did not descend into a directory
 *
 * WHO EMITS: SmartSyncService (crawl)
 */
struct DirectorySkippedEvent {
    std::string crawl_id;
    std::string resource_path;
    SkipReason reason = SkipReason::RetryBackoff;
    std::string detail;
    TimePoint timestamp = Clock::now();
};

/**
 * @brief Summary of one crawl
 *
 * WHO EMITS: SmartSyncService (crawl)
 */
struct CrawlCompletedEvent {
    std::string crawl_id;
    errors::SourceType source_type = errors::SourceType::WebDAV;
    std::size_t directories_scanned = 0;
    std::size_t directories_skipped = 0;
    std::size_t loops_rejected = 0;
    std::size_t directories_failed = 0;
    std::size_t files_found = 0;
    std::chrono::milliseconds duration{0};
    TimePoint timestamp = Clock::now();
};

} // namespace scanguard::events
