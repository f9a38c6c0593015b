#pragma once

#include "scanguard/core/result.hpp"
#include "scanguard/events/event_bus.hpp"
#include "scanguard/events/events.hpp"
#include "scanguard/loop/detector.hpp"
#include "scanguard/sync/directory_state_store.hpp"
#include "scanguard/sync/source.hpp"
#include "scanguard/tracking/failure_tracker.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scanguard::sync {

enum class SyncStrategyKind {
    FullDeepScan,   ///< First sync, large changes, deletions or evaluation failure
    TargetedScan    ///< Only the listed directories changed
};

[[nodiscard]] const char* to_string(SyncStrategyKind kind) noexcept;

struct SmartSyncStrategy {
    SyncStrategyKind kind = SyncStrategyKind::FullDeepScan;
    std::vector<std::string> target_directories;

    [[nodiscard]] static SmartSyncStrategy full_deep_scan() { return {}; }
    [[nodiscard]] static SmartSyncStrategy targeted(std::vector<std::string> directories) {
        return {SyncStrategyKind::TargetedScan, std::move(directories)};
    }

    [[nodiscard]] nlohmann::json to_json() const;
};

/**
 * @brief Outcome of evaluate_sync_need
 *
 * Either nothing changed (skip) or a strategy to run.
 */
struct SmartSyncDecision {
    bool skip = false;
    SmartSyncStrategy strategy;

    [[nodiscard]] static SmartSyncDecision skip_sync() { return {true, {}}; }
    [[nodiscard]] static SmartSyncDecision requires_sync(SmartSyncStrategy strategy) {
        return {false, std::move(strategy)};
    }
};

/**
 * @brief Everything one crawl saw
 *
 * directories holds every directory listed successfully, with the ETag
 * from its own listing. Directories that were skipped, loop-rejected or
 * failed are in unscanned_directories.
 */
struct CrawlResult {
    std::string crawl_id;
    std::vector<FileEntry> files;
    std::vector<DirectoryEntry> directories;
    std::vector<std::string> unscanned_directories;
    std::size_t directories_scanned = 0;
    std::size_t directories_skipped = 0;    ///< Tracker backoff or user exclusion
    std::size_t loops_rejected = 0;
    std::size_t directories_failed = 0;
    std::chrono::milliseconds duration{0};

    [[nodiscard]] nlohmann::json to_json() const;
};

struct SmartSyncResult {
    SmartSyncStrategy strategy_used;
    CrawlResult crawl;

    [[nodiscard]] nlohmann::json to_json() const;
};

struct SmartSyncOptions {
    std::size_t worker_threads = 4;
    std::size_t max_depth = 64;              ///< Levels below a crawl root; 0 lists the root only
    double full_scan_change_ratio = 0.3;     ///< Changed share of known children forcing a deep scan
    std::size_t full_scan_new_directories = 5;
};

/**
 * @brief Decides how much of a tree needs listing and crawls it safely
 *
 * A shallow listing of the root is compared against the ETags stored by
 * the last deep scan to pick skip, targeted or full. Crawls fan out over
 * a Boost.Asio thread_pool; every directory goes through the failure
 * tracker (backoff and exclusions) and the loop detector before it is
 * listed, and the outcome is reported back to both.
 *
 * EXAMPLE:
 * SmartSyncService sync(source, detector, tracker, directories);
 * if (auto result = sync.evaluate_and_sync("alice", "/data")) {
 *     spdlog::info("{} files", result->crawl.files.size());
 * }
 */
class SmartSyncService {
public:
    SmartSyncService(std::shared_ptr<RemoteSource> source,
                     std::shared_ptr<loop::LoopDetector> detector,
                     std::shared_ptr<tracking::FailureTracker> tracker,
                     std::shared_ptr<DirectoryStateStore> directories,
                     SmartSyncOptions options = {},
                     std::optional<std::string> source_id = std::nullopt,
                     events::EventBus* event_bus = nullptr);

    /**
     * @brief Compare a shallow listing of @p root with the stored ETags
     *
     * Never fails: when the root cannot be listed the error is recorded
     * with the tracker and a full deep scan is requested.
     */
    [[nodiscard]] SmartSyncDecision evaluate_sync_need(const std::string& user_id, const std::string& root);

    /// Run @p strategy; a deep scan replaces the stored ETags below @p root
    SmartSyncResult perform_smart_sync(const std::string& user_id,
                                       const std::string& root,
                                       const SmartSyncStrategy& strategy);

    /// evaluate_sync_need then perform_smart_sync; nullopt when nothing changed
    std::optional<SmartSyncResult> evaluate_and_sync(const std::string& user_id, const std::string& root);

    /**
     * @brief List @p roots and everything below them, up to @p max_depth levels
     *
     * Does not touch the directory state; see perform_smart_sync.
     */
    CrawlResult crawl(const std::string& user_id,
                      const std::vector<std::string>& roots,
                      std::optional<std::size_t> max_depth = std::nullopt);

    [[nodiscard]] tracking::SourceScanTracker& scan_tracker() noexcept { return scan_tracker_; }
    [[nodiscard]] const SmartSyncOptions& options() const noexcept { return options_; }

private:
    struct CrawlState;

    void schedule(const std::shared_ptr<CrawlState>& state, std::string path, std::size_t depth);
    void visit(const std::shared_ptr<CrawlState>& state, const std::string& path, std::size_t depth);
    void emit_skipped(const CrawlState& state, const std::string& path,
                      events::SkipReason reason, const std::string& detail) const;
    std::string next_crawl_id();

    std::shared_ptr<RemoteSource> source_;
    std::shared_ptr<loop::LoopDetector> detector_;
    tracking::SourceScanTracker scan_tracker_;
    std::shared_ptr<DirectoryStateStore> directories_;
    SmartSyncOptions options_;
    std::optional<std::string> source_id_;
    events::EventBus* event_bus_;
    std::atomic<std::uint64_t> crawl_sequence_{0};
};

} // namespace scanguard::sync
