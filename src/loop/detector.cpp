#include "scanguard/loop/detector.hpp"

#include "scanguard/events/event_bus.hpp"
#include "scanguard/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

namespace scanguard::loop {
namespace {

using std::chrono::duration_cast;
using std::chrono::milliseconds;
using std::chrono::seconds;

LoopError make_error(LoopErrorKind kind, const std::string& path) {
    LoopError error;
    error.kind = kind;
    error.path = path;
    return error;
}

// A label that returns to a path it completed earlier, with at least one
// other path in between, has walked a cycle. Immediate re-visits are left
// to the TooSoon check.
std::optional<std::vector<std::string>> find_cycle(const std::deque<std::string>& sequence,
                                                   const std::string& path) {
    auto found = std::find(sequence.rbegin(), sequence.rend(), path);
    if (found == sequence.rend() || found == sequence.rbegin()) {
        return std::nullopt;
    }
    auto first = std::prev(found.base());
    std::vector<std::string> cycle(first, sequence.end());
    cycle.push_back(path);
    return cycle;
}

} // namespace

LoopDetector::LoopDetector(LoopDetectionConfig config, ClockFn clock, events::EventBus* bus)
    : config_(std::move(config)),
      log_level_(spdlog::level::from_str(config_.log_level)),
      clock_(clock ? std::move(clock) : system_clock_fn()),
      bus_(bus) {
    if (auto valid = config_.validate(); valid.is_error()) {
        spdlog::warn("[LoopDetector] invalid config ({}), using defaults", valid.error());
        config_ = LoopDetectionConfig{};
        log_level_ = spdlog::level::from_str(config_.log_level);
    }
}

Result<AccessHandle, LoopError> LoopDetector::start_access(const std::string& path,
                                                          const std::string& scan_label) {
    const auto now = clock_();

    std::optional<LoopError> rejection;
    std::optional<std::vector<std::string>> cycle_alert;
    AccessHandle handle;
    spdlog::level::level_enum level;
    {
        std::lock_guard lock(mutex_);
        level = log_level_;
        if (config_.enabled) {
            rejection = check_locked(path, scan_label, now, cycle_alert);
        }
        if (rejection) {
            ++total_loops_detected_;
        } else {
            handle = register_locked(path, scan_label, now);
        }
    }

    if (rejection) {
        report_rejection(*rejection, scan_label, level);
        return Err<AccessHandle>(std::move(*rejection));
    }
    if (cycle_alert) {
        report_cycle_alert(path, scan_label, *cycle_alert, level);
    }

    spdlog::debug("[LoopDetector] access started id={} path={} scan={}", handle.id, path, scan_label);
    return Ok<AccessHandle, LoopError>(std::move(handle));
}

std::optional<LoopError> LoopDetector::check_locked(const std::string& path,
                                                    const std::string& scan_label,
                                                    TimePoint now,
                                                    std::optional<std::vector<std::string>>& cycle_alert) {
    auto it = paths_.find(path);
    if (it != paths_.end()) {
        auto& state = it->second;

        if (state.open_count > 0) {
            return make_error(LoopErrorKind::ConcurrentAccess, path);
        }

        if (state.last_completed_at) {
            const auto elapsed = now - *state.last_completed_at;
            if (elapsed < seconds(config_.min_scan_interval_secs)) {
                auto error = make_error(LoopErrorKind::TooSoon, path);
                error.elapsed = std::max(milliseconds(0), duration_cast<milliseconds>(elapsed));
                return error;
            }
        }

        prune_window_locked(state, now);
        if (state.window_starts.size() >= config_.max_access_count) {
            auto error = make_error(LoopErrorKind::TooFrequent, path);
            error.count = static_cast<std::uint32_t>(state.window_starts.size());
            return error;
        }
    }

    if (config_.enable_pattern_analysis) {
        auto pattern = patterns_.find(scan_label);
        if (pattern != patterns_.end()) {
            if (auto cycle = find_cycle(pattern->second.sequence, path)) {
                ++total_pattern_alerts_;
                if (config_.reject_on_pattern) {
                    auto error = make_error(LoopErrorKind::PatternCycle, path);
                    error.cycle = std::move(*cycle);
                    return error;
                }
                cycle_alert = std::move(cycle);
            }
        }
    }

    return std::nullopt;
}

AccessHandle LoopDetector::register_locked(const std::string& path,
                                           const std::string& scan_label,
                                           TimePoint now) {
    AccessHandle handle;
    handle.id = next_access_id_++;
    handle.path = path;
    handle.scan_label = scan_label;
    handle.started_at = now;

    auto& state = paths_[path];
    prune_window_locked(state, now);
    state.window_starts.push_back(now);
    while (state.window_starts.size() > config_.max_access_count) {
        state.window_starts.pop_front();
    }
    state.open_count++;
    state.last_activity = now;

    AccessRecord record;
    record.access_id = handle.id;
    record.path = path;
    record.scan_id = scan_label;
    record.start_time = now;
    open_.emplace(handle.id, std::move(record));

    ++total_accesses_;
    enforce_capacity_locked(now);
    return handle;
}

void LoopDetector::prune_window_locked(PathState& state, TimePoint now) const {
    const auto horizon = now - seconds(config_.time_window_secs);
    while (!state.window_starts.empty() && state.window_starts.front() <= horizon) {
        state.window_starts.pop_front();
    }
}

Result<void, LoopError> LoopDetector::complete_access(const AccessHandle& handle,
                                                      std::size_t files_found,
                                                      std::size_t dirs_found,
                                                      std::optional<std::string> error) {
    const auto now = clock_();

    std::optional<milliseconds> slow_duration;
    std::uint64_t duration_limit = 0;
    {
        std::lock_guard lock(mutex_);

        auto it = open_.find(handle.id);
        if (it == open_.end()) {
            const bool issued_here = handle.id >= first_live_id_ && handle.id < next_access_id_;
            return Err<void>(make_error(
                issued_here ? LoopErrorKind::AlreadyCompleted : LoopErrorKind::UnknownHandle,
                handle.path));
        }

        AccessRecord record = std::move(it->second);
        open_.erase(it);

        record.end_time = now;
        record.files_found = files_found;
        record.dirs_found = dirs_found;
        record.error = std::move(error);

        auto& state = paths_[record.path];
        if (state.open_count > 0) {
            state.open_count--;
        }
        state.last_completed_at = now;
        state.last_activity = now;

        const auto elapsed = duration_cast<milliseconds>(now - record.start_time);
        duration_limit = config_.max_scan_duration_secs;
        if (elapsed > seconds(duration_limit)) {
            ++slow_scans_;
            slow_duration = elapsed;
        }

        if (config_.enable_pattern_analysis) {
            record_pattern_locked(record, now);
        }

        state.completed.push_back(std::move(record));
        ++history_size_;
        const std::size_t per_path_limit = std::max<std::size_t>(config_.max_access_count, 1);
        while (state.completed.size() > per_path_limit) {
            state.completed.pop_front();
            --history_size_;
        }

        enforce_capacity_locked(now);
    }

    if (slow_duration) {
        spdlog::warn("[LoopDetector] slow scan path={} duration={}ms limit={}s",
                     handle.path, slow_duration->count(), duration_limit);
        if (bus_) {
            events::SlowScanDetectedEvent event;
            event.path = handle.path;
            event.scan_label = handle.scan_label;
            event.duration = *slow_duration;
            event.limit_secs = duration_limit;
            bus_->emit(event);
        }
    }

    spdlog::debug("[LoopDetector] access completed id={} path={} files={} dirs={}",
                  handle.id, handle.path, files_found, dirs_found);
    return Ok<LoopError>();
}

void LoopDetector::record_pattern_locked(const AccessRecord& record, TimePoint now) {
    auto it = patterns_.find(record.scan_id);
    if (it == patterns_.end()) {
        // Full: the label that completed an access least recently makes room
        while (!patterns_.empty() && patterns_.size() >= config_.max_tracked_directories) {
            auto oldest = std::min_element(patterns_.begin(), patterns_.end(),
                                           [](const auto& a, const auto& b) {
                                               return a.second.last_activity < b.second.last_activity;
                                           });
            spdlog::debug("[LoopDetector] pattern table full, dropping scan={}", oldest->first);
            patterns_.erase(oldest);
        }
        it = patterns_.emplace(record.scan_id, PatternState{}).first;
    }

    auto& pattern = it->second;
    pattern.last_activity = now;
    pattern.sequence.push_back(record.path);
    while (pattern.sequence.size() > config_.max_pattern_depth) {
        pattern.sequence.pop_front();
    }
}

void LoopDetector::enforce_capacity_locked(TimePoint now) {
    if (paths_.size() <= config_.max_tracked_directories) {
        return;
    }

    // Idle longer than every threshold: the entry can no longer influence a check
    const auto horizon = seconds(std::max(config_.time_window_secs, config_.min_scan_interval_secs));
    for (auto it = paths_.begin(); it != paths_.end();) {
        const auto& state = it->second;
        if (state.open_count == 0 && now - state.last_activity > horizon) {
            history_size_ -= state.completed.size();
            it = paths_.erase(it);
        } else {
            ++it;
        }
    }

    while (paths_.size() > config_.max_tracked_directories) {
        auto oldest = paths_.end();
        for (auto it = paths_.begin(); it != paths_.end(); ++it) {
            if (it->second.open_count > 0) {
                continue;
            }
            if (oldest == paths_.end() || it->second.last_activity < oldest->second.last_activity) {
                oldest = it;
            }
        }
        if (oldest == paths_.end()) {
            break;  // every tracked path has an open access
        }
        history_size_ -= oldest->second.completed.size();
        paths_.erase(oldest);
    }
}

LoopMetrics LoopDetector::get_metrics() const {
    std::lock_guard lock(mutex_);
    LoopMetrics metrics;
    metrics.enabled = config_.enabled;
    metrics.total_accesses = total_accesses_;
    metrics.total_loops_detected = total_loops_detected_;
    metrics.total_pattern_alerts = total_pattern_alerts_;
    metrics.slow_scans = slow_scans_;
    metrics.active_accesses = open_.size();
    metrics.history_size = history_size_;
    metrics.tracked_paths = paths_.size();
    metrics.tracked_patterns = patterns_.size();
    metrics.config = config_;
    return metrics;
}

LoopDetectionConfig LoopDetector::config() const {
    std::lock_guard lock(mutex_);
    return config_;
}

bool LoopDetector::is_enabled() const {
    std::lock_guard lock(mutex_);
    return config_.enabled;
}

Result<void> LoopDetector::update_config(LoopDetectionConfig new_config) {
    if (auto valid = new_config.validate(); valid.is_error()) {
        spdlog::error("[LoopDetector] rejected config update: {}", valid.error());
        return valid;
    }

    {
        std::lock_guard lock(mutex_);
        config_ = std::move(new_config);
        log_level_ = spdlog::level::from_str(config_.log_level);
        if (!config_.enable_pattern_analysis) {
            patterns_.clear();
        }
    }
    spdlog::info("[LoopDetector] config updated");
    return Ok();
}

void LoopDetector::clear_state() {
    std::lock_guard lock(mutex_);
    paths_.clear();
    open_.clear();
    patterns_.clear();
    first_live_id_ = next_access_id_;
    history_size_ = 0;
    total_accesses_ = 0;
    total_loops_detected_ = 0;
    total_pattern_alerts_ = 0;
    slow_scans_ = 0;
}

std::vector<AccessRecord> LoopDetector::find_stuck_accesses() const {
    const auto now = clock_();
    std::lock_guard lock(mutex_);
    std::vector<AccessRecord> stuck;
    const auto limit = seconds(config_.max_scan_duration_secs);
    for (const auto& [id, record] : open_) {
        if (now - record.start_time > limit) {
            stuck.push_back(record);
        }
    }
    std::sort(stuck.begin(), stuck.end(), [](const AccessRecord& lhs, const AccessRecord& rhs) {
        return lhs.start_time < rhs.start_time;
    });
    return stuck;
}

std::vector<AccessRecord> LoopDetector::path_history(const std::string& path) const {
    std::lock_guard lock(mutex_);
    auto it = paths_.find(path);
    if (it == paths_.end()) {
        return {};
    }
    return {it->second.completed.begin(), it->second.completed.end()};
}

void LoopDetector::report_rejection(const LoopError& error,
                                    const std::string& scan_label,
                                    spdlog::level::level_enum level) const {
    spdlog::log(level, "[LoopDetector] {} rejected scan={}: {}",
                to_string(error.kind), scan_label, error.message());
    if (!bus_) {
        return;
    }
    events::LoopDetectedEvent event;
    event.path = error.path;
    event.scan_label = scan_label;
    event.kind = error.kind;
    event.description = error.message();
    event.rejected = true;
    event.cycle = error.cycle;
    bus_->emit(event);
}

void LoopDetector::report_cycle_alert(const std::string& path,
                                      const std::string& scan_label,
                                      const std::vector<std::string>& cycle,
                                      spdlog::level::level_enum level) const {
    spdlog::log(level, "[LoopDetector] advisory cycle at path={} scan={} length={}",
                path, scan_label, cycle.size());
    if (!bus_) {
        return;
    }
    events::LoopDetectedEvent event;
    event.path = path;
    event.scan_label = scan_label;
    event.kind = LoopErrorKind::PatternCycle;
    event.description = "cycle observed, access allowed";
    event.rejected = false;
    event.cycle = cycle;
    bus_->emit(event);
}

// ──────────────────────────────────────────────────────────
// ScopedAccess
// ──────────────────────────────────────────────────────────

ScopedAccess::ScopedAccess(LoopDetector& detector, AccessHandle handle) noexcept
    : detector_(&detector), handle_(std::move(handle)) {}

ScopedAccess::ScopedAccess(ScopedAccess&& other) noexcept
    : detector_(other.detector_), handle_(std::move(other.handle_)) {
    other.detector_ = nullptr;
}

ScopedAccess::~ScopedAccess() {
    if (!detector_) {
        return;
    }
    auto result = detector_->complete_access(handle_, 0, 0, std::string("access abandoned before completion"));
    if (result.is_error()) {
        spdlog::debug("[LoopDetector] scoped release for {}: {}", handle_.path, result.error().message());
    }
}

Result<void, LoopError> ScopedAccess::complete(std::size_t files_found,
                                               std::size_t dirs_found,
                                               std::optional<std::string> error) {
    if (!detector_) {
        return Err<void>(make_error(LoopErrorKind::AlreadyCompleted, handle_.path));
    }
    auto* detector = detector_;
    detector_ = nullptr;
    return detector->complete_access(handle_, files_found, dirs_found, std::move(error));
}

} // namespace scanguard::loop
