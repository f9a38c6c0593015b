#include "scanguard/sync/smart_sync.hpp"

#include "scanguard/errors/context.hpp"
#include "scanguard/sync/etag.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <map>
#include <mutex>
#include <set>
#include <unordered_set>

namespace scanguard::sync {

namespace {

using SteadyClock = std::chrono::steady_clock;

bool is_direct_child(const std::string& root, const std::string& path) {
    const auto parent = parent_of(path);
    return is_within(root, path) && !is_within(path, root)
        && is_within(parent, root) && is_within(root, parent);
}

std::chrono::milliseconds elapsed_since(SteadyClock::time_point started) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - started);
}

/// Listed directories win over unscanned ones; unscanned keep an empty ETag so they read as changed
std::vector<DirectoryEntry> directory_state_from(const CrawlResult& crawl) {
    std::map<std::string, std::string> merged;
    for (const auto& path : crawl.unscanned_directories) {
        merged.emplace(path, std::string());
    }
    for (const auto& entry : crawl.directories) {
        merged[entry.path] = entry.etag;
    }

    std::vector<DirectoryEntry> entries;
    entries.reserve(merged.size());
    for (auto& [path, etag] : merged) {
        entries.push_back({path, etag});
    }
    return entries;
}

} // namespace

const char* to_string(SyncStrategyKind kind) noexcept {
    switch (kind) {
        case SyncStrategyKind::FullDeepScan: return "full_deep_scan";
        case SyncStrategyKind::TargetedScan: return "targeted_scan";
    }
    return "full_deep_scan";
}

nlohmann::json SmartSyncStrategy::to_json() const {
    nlohmann::json result{{"kind", to_string(kind)}};
    if (kind == SyncStrategyKind::TargetedScan) {
        result["target_directories"] = target_directories;
    }
    return result;
}

nlohmann::json CrawlResult::to_json() const {
    return {
        {"crawl_id", crawl_id},
        {"files_found", files.size()},
        {"directories_scanned", directories_scanned},
        {"directories_skipped", directories_skipped},
        {"loops_rejected", loops_rejected},
        {"directories_failed", directories_failed},
        {"unscanned_directories", unscanned_directories},
        {"duration_ms", duration.count()},
    };
}

nlohmann::json SmartSyncResult::to_json() const {
    return {
        {"strategy", strategy_used.to_json()},
        {"crawl", crawl.to_json()},
    };
}

struct SmartSyncService::CrawlState {
    std::string user_id;
    std::string crawl_id;
    std::size_t max_depth = 0;
    boost::asio::thread_pool* pool = nullptr;

    std::mutex mutex;
    CrawlResult result;
};

SmartSyncService::SmartSyncService(std::shared_ptr<RemoteSource> source,
                                   std::shared_ptr<loop::LoopDetector> detector,
                                   std::shared_ptr<tracking::FailureTracker> tracker,
                                   std::shared_ptr<DirectoryStateStore> directories,
                                   SmartSyncOptions options,
                                   std::optional<std::string> source_id,
                                   events::EventBus* event_bus)
    : source_(std::move(source)),
      detector_(std::move(detector)),
      scan_tracker_(std::move(tracker), source_->source_type(), source_id),
      directories_(std::move(directories)),
      options_(options),
      source_id_(std::move(source_id)),
      event_bus_(event_bus) {
    if (options_.worker_threads == 0) {
        options_.worker_threads = 1;
    }
}

SmartSyncDecision SmartSyncService::evaluate_sync_need(const std::string& user_id, const std::string& root) {
    const auto started = SteadyClock::now();

    const auto known = directories_->list_under(user_id, root);
    if (known.empty()) {
        spdlog::info("[SmartSync] no known directories under '{}', full deep scan required", root);
        return SmartSyncDecision::requires_sync(SmartSyncStrategy::full_deep_scan());
    }

    auto listing = source_->list_directory(root);
    if (listing.is_error()) {
        const auto& error = listing.error();
        spdlog::warn("[SmartSync] evaluation of '{}' failed after {}ms, falling back to deep scan: {}",
                     root, elapsed_since(started).count(), error.describe());

        auto context = errors::ErrorContext(root, scan_tracker_.tracker().now()).with_operation("evaluate_sync_need");
        if (source_id_) {
            context = context.with_source_id(*source_id_);
        }
        auto tracked = scan_tracker_.tracker().track_error(user_id, source_->source_type(), source_id_, error, context);
        if (tracked.is_error()) {
            spdlog::warn("[SmartSync] failed to track evaluation error for '{}': {}", root, tracked.error());
        }
        return SmartSyncDecision::requires_sync(SmartSyncStrategy::full_deep_scan());
    }

    std::set<std::string> known_children;
    std::optional<std::string> known_root_etag;
    for (const auto& entry : known) {
        if (is_direct_child(root, entry.path)) {
            known_children.insert(entry.path);
        } else if (is_within(entry.path, root)) {
            known_root_etag = entry.etag;
        }
    }

    std::vector<std::string> changed;
    std::vector<std::string> added;
    std::unordered_set<std::string> listed;
    for (const auto& directory : listing.value().directories) {
        listed.insert(directory.path);
        const auto known_etag = directories_->etag(user_id, directory.path);
        if (!known_etag) {
            spdlog::debug("[SmartSync] new directory '{}'", directory.path);
            added.push_back(directory.path);
        } else if (!compare_etags(*known_etag, directory.etag)) {
            spdlog::debug("[SmartSync] directory changed '{}' ({} -> {})", directory.path, *known_etag, directory.etag);
            changed.push_back(directory.path);
        }
    }

    std::vector<std::string> deleted;
    for (const auto& path : known_children) {
        if (listed.count(path) == 0) {
            spdlog::debug("[SmartSync] directory deleted '{}'", path);
            deleted.push_back(path);
        }
    }

    const bool root_changed = known_root_etag && !compare_etags(*known_root_etag, listing.value().etag);

    if (changed.empty() && added.empty() && deleted.empty()) {
        if (root_changed) {
            spdlog::info("[SmartSync] entries directly under '{}' changed, full deep scan required", root);
            return SmartSyncDecision::requires_sync(SmartSyncStrategy::full_deep_scan());
        }
        spdlog::info("[SmartSync] no directory changes under '{}', sync skipped (evaluated in {}ms)",
                     root, elapsed_since(started).count());
        return SmartSyncDecision::skip_sync();
    }

    const auto total_changes = changed.size() + added.size() + deleted.size();
    const auto change_ratio = static_cast<double>(total_changes)
                            / static_cast<double>(std::max<std::size_t>(known_children.size(), 1));

    if (change_ratio > options_.full_scan_change_ratio
        || added.size() > options_.full_scan_new_directories
        || !deleted.empty()) {
        spdlog::info("[SmartSync] large changes under '{}' ({} changed, {} new, {} deleted, {:.1f}% change ratio), "
                     "full deep scan required",
                     root, changed.size(), added.size(), deleted.size(), change_ratio * 100.0);
        return SmartSyncDecision::requires_sync(SmartSyncStrategy::full_deep_scan());
    }

    auto targets = std::move(changed);
    targets.insert(targets.end(), added.begin(), added.end());
    spdlog::info("[SmartSync] targeted changes under '{}', scanning {} directories (evaluated in {}ms)",
                 root, targets.size(), elapsed_since(started).count());
    return SmartSyncDecision::requires_sync(SmartSyncStrategy::targeted(std::move(targets)));
}

SmartSyncResult SmartSyncService::perform_smart_sync(const std::string& user_id,
                                                     const std::string& root,
                                                     const SmartSyncStrategy& strategy) {
    SmartSyncResult result;
    result.strategy_used = strategy;

    if (strategy.kind == SyncStrategyKind::FullDeepScan) {
        spdlog::info("[SmartSync] full deep scan of '{}'", root);
        result.crawl = crawl(user_id, {root});

        const bool root_listed = std::any_of(result.crawl.directories.begin(), result.crawl.directories.end(),
                                             [&](const DirectoryEntry& entry) {
                                                 return is_within(entry.path, root) && is_within(root, entry.path);
                                             });
        if (!root_listed) {
            spdlog::warn("[SmartSync] '{}' was not listed, keeping the previous directory state", root);
            return result;
        }

        const auto dropped = directories_->replace_under(user_id, root, directory_state_from(result.crawl));
        if (dropped > 0) {
            spdlog::info("[SmartSync] dropped {} directories no longer present under '{}'", dropped, root);
        }
        return result;
    }

    spdlog::info("[SmartSync] targeted scan of {} directories under '{}'", strategy.target_directories.size(), root);
    result.crawl = crawl(user_id, strategy.target_directories);
    directories_->upsert(user_id, directory_state_from(result.crawl));
    return result;
}

std::optional<SmartSyncResult> SmartSyncService::evaluate_and_sync(const std::string& user_id,
                                                                   const std::string& root) {
    const auto started = SteadyClock::now();

    const auto decision = evaluate_sync_need(user_id, root);
    if (decision.skip) {
        return std::nullopt;
    }

    auto result = perform_smart_sync(user_id, root, decision.strategy);
    spdlog::info("[SmartSync] sync of '{}' completed: {} files, {} directories scanned in {}ms",
                 root, result.crawl.files.size(), result.crawl.directories_scanned, elapsed_since(started).count());
    return result;
}

CrawlResult SmartSyncService::crawl(const std::string& user_id,
                                    const std::vector<std::string>& roots,
                                    std::optional<std::size_t> max_depth) {
    const auto started = SteadyClock::now();

    auto state = std::make_shared<CrawlState>();
    state->user_id = user_id;
    state->crawl_id = next_crawl_id();
    state->max_depth = max_depth.value_or(options_.max_depth);
    state->result.crawl_id = state->crawl_id;

    spdlog::debug("[SmartSync] crawl {} started with {} roots on {} workers",
                  state->crawl_id, roots.size(), options_.worker_threads);

    {
        boost::asio::thread_pool pool(options_.worker_threads);
        state->pool = &pool;
        for (const auto& root : roots) {
            schedule(state, root, 0);
        }
        pool.join();
        state->pool = nullptr;
    }

    CrawlResult result = std::move(state->result);
    result.duration = elapsed_since(started);

    std::sort(result.files.begin(), result.files.end(),
              [](const FileEntry& a, const FileEntry& b) { return a.path < b.path; });
    std::sort(result.directories.begin(), result.directories.end(),
              [](const DirectoryEntry& a, const DirectoryEntry& b) { return a.path < b.path; });
    std::sort(result.unscanned_directories.begin(), result.unscanned_directories.end());

    spdlog::info("[SmartSync] crawl {} done: {} scanned, {} skipped, {} loops rejected, {} failed, {} files in {}ms",
                 result.crawl_id, result.directories_scanned, result.directories_skipped,
                 result.loops_rejected, result.directories_failed, result.files.size(), result.duration.count());

    if (event_bus_) {
        events::CrawlCompletedEvent event;
        event.crawl_id = result.crawl_id;
        event.source_type = source_->source_type();
        event.directories_scanned = result.directories_scanned;
        event.directories_skipped = result.directories_skipped;
        event.loops_rejected = result.loops_rejected;
        event.directories_failed = result.directories_failed;
        event.files_found = result.files.size();
        event.duration = result.duration;
        event_bus_->emit(event);
    }
    return result;
}

void SmartSyncService::schedule(const std::shared_ptr<CrawlState>& state, std::string path, std::size_t depth) {
    boost::asio::post(*state->pool, [this, state, path = std::move(path), depth] {
        try {
            visit(state, path, depth);
        } catch (const std::exception& e) {
            spdlog::error("[SmartSync] crawl {} aborted '{}': {}", state->crawl_id, path, e.what());
            std::lock_guard lock(state->mutex);
            ++state->result.directories_failed;
            state->result.unscanned_directories.push_back(path);
        }
    });
}

void SmartSyncService::visit(const std::shared_ptr<CrawlState>& state, const std::string& path, std::size_t depth) {
    const auto skip = scan_tracker_.skip_decision(state->user_id, path);
    if (skip.should_skip) {
        {
            std::lock_guard lock(state->mutex);
            ++state->result.directories_skipped;
            state->result.unscanned_directories.push_back(path);
        }
        emit_skipped(*state, path,
                     skip.user_excluded ? events::SkipReason::UserExcluded : events::SkipReason::RetryBackoff,
                     skip.reason);
        return;
    }

    auto access = detector_->start_access(path, state->crawl_id);
    if (access.is_error()) {
        {
            std::lock_guard lock(state->mutex);
            ++state->result.loops_rejected;
        }
        emit_skipped(*state, path, events::SkipReason::LoopRejected, access.error().message());
        return;
    }

    loop::ScopedAccess guard(*detector_, access.value());
    auto listing = source_->list_directory(path);

    if (listing.is_error()) {
        const auto& error = listing.error();
        if (auto completed = guard.complete(0, 0, error.describe()); completed.is_error()) {
            spdlog::debug("[SmartSync] {}", completed.error().message());
        }
        scan_tracker_.track_scan_error(state->user_id, path, error);
        std::lock_guard lock(state->mutex);
        ++state->result.directories_failed;
        state->result.unscanned_directories.push_back(path);
        return;
    }

    auto& directory = listing.value();
    if (auto completed = guard.complete(directory.files.size(), directory.directories.size()); completed.is_error()) {
        spdlog::debug("[SmartSync] {}", completed.error().message());
    }
    scan_tracker_.mark_scan_successful(state->user_id, path);

    {
        std::lock_guard lock(state->mutex);
        ++state->result.directories_scanned;
        state->result.directories.push_back({path, directory.etag});
        state->result.files.insert(state->result.files.end(),
                                   std::make_move_iterator(directory.files.begin()),
                                   std::make_move_iterator(directory.files.end()));
    }

    if (depth >= state->max_depth) {
        return;
    }
    for (auto& child : directory.directories) {
        schedule(state, std::move(child.path), depth + 1);
    }
}

void SmartSyncService::emit_skipped(const CrawlState& state,
                                    const std::string& path,
                                    events::SkipReason reason,
                                    const std::string& detail) const {
    spdlog::debug("[SmartSync] crawl {} skipped '{}' ({}): {}", state.crawl_id, path, events::to_string(reason), detail);
    if (!event_bus_) {
        return;
    }
    events::DirectorySkippedEvent event;
    event.crawl_id = state.crawl_id;
    event.resource_path = path;
    event.reason = reason;
    event.detail = detail;
    event_bus_->emit(event);
}

std::string SmartSyncService::next_crawl_id() {
    const auto sequence = ++crawl_sequence_;
    return "crawl-" + std::to_string(to_epoch_ms(Clock::now())) + "-" + std::to_string(sequence);
}

} // namespace scanguard::sync
