#include "scanguard/tracking/failure_tracker.hpp"

#include "scanguard/errors/diagnostics.hpp"
#include "scanguard/errors/generic_classifier.hpp"
#include "scanguard/events/events.hpp"

#include <spdlog/spdlog.h>

namespace scanguard::tracking {

using errors::FailureKey;
using errors::Severity;
using errors::SourceScanFailure;

namespace {

constexpr const char* kSuccessfulScan = "successful_scan";

std::chrono::minutes ceil_minutes(std::chrono::nanoseconds span) {
    auto minutes = std::chrono::duration_cast<std::chrono::minutes>(span);
    if (minutes < span) {
        minutes += std::chrono::minutes(1);
    }
    return minutes;
}

} // namespace

const char* to_string(FailureStatus status) noexcept {
    switch (status) {
        case FailureStatus::Recent: return "recent";
        case FailureStatus::Recurring: return "recurring";
        case FailureStatus::Persistent: return "persistent";
        case FailureStatus::Chronic: return "chronic";
    }
    return "recent";
}

const char* to_string(ActionStatus status) noexcept {
    switch (status) {
        case ActionStatus::ReadyForRetry: return "ready_for_retry";
        case ActionStatus::Excluded: return "excluded";
        case ActionStatus::NeedsIntervention: return "needs_intervention";
        case ActionStatus::Resolved: return "resolved";
        case ActionStatus::Scheduled: return "scheduled";
    }
    return "scheduled";
}

FailureStatus failure_status_for(std::uint32_t failure_count) noexcept {
    if (failure_count > 20) return FailureStatus::Chronic;
    if (failure_count > 10) return FailureStatus::Persistent;
    if (failure_count > 3) return FailureStatus::Recurring;
    return FailureStatus::Recent;
}

ActionStatus action_status_for(const SourceScanFailure& failure, TimePoint now) noexcept {
    if (failure.resolved) return ActionStatus::Resolved;
    if (failure.user_excluded) return ActionStatus::Excluded;
    if (failure.error_severity == Severity::Critical) return ActionStatus::NeedsIntervention;
    if (failure.next_retry_at && *failure.next_retry_at <= now) return ActionStatus::ReadyForRetry;
    return ActionStatus::Scheduled;
}

nlohmann::json FailureResponse::to_json() const {
    auto j = errors::failure_to_json(failure);
    j["failure_status"] = to_string(failure_status);
    j["action_status"] = to_string(action_status);
    j["user_friendly_message"] = user_friendly_message;
    j["recommended_action"] = recommended_action;

    nlohmann::json summary{
        {"resource_depth", diagnostic_summary.resource_depth},
        {"recommended_action", diagnostic_summary.recommended_action},
        {"can_retry", diagnostic_summary.can_retry},
        {"user_action_required", diagnostic_summary.user_action_required},
        {"source_specific_info", diagnostic_summary.source_specific_info},
    };
    if (diagnostic_summary.estimated_item_count) {
        summary["estimated_item_count"] = *diagnostic_summary.estimated_item_count;
    }
    if (diagnostic_summary.response_time_ms) {
        summary["response_time_ms"] = *diagnostic_summary.response_time_ms;
    }
    if (diagnostic_summary.response_size_mb) {
        summary["response_size_mb"] = *diagnostic_summary.response_size_mb;
    }
    j["diagnostic_summary"] = std::move(summary);
    return j;
}

FailureTracker::FailureTracker(std::shared_ptr<store::FailureStore> store,
                               std::shared_ptr<const errors::ClassifierRegistry> classifiers,
                               ClockFn clock,
                               events::EventBus* event_bus)
    : store_(std::move(store)),
      classifiers_(classifiers ? std::move(classifiers) : errors::ClassifierRegistry::with_defaults()),
      clock_(clock ? std::move(clock) : system_clock_fn()),
      event_bus_(event_bus) {}

Result<SourceScanFailure> FailureTracker::track_error(const std::string& user_id,
                                                      errors::SourceType source_type,
                                                      const std::optional<std::string>& source_id,
                                                      const errors::SourceError& error,
                                                      const errors::ErrorContext& context) {
    const auto classifier = classifiers_->classifier_for(source_type);
    const auto classification = classifier->classify_error(error, context);

    errors::CreateSourceScanFailure create;
    create.key = FailureKey{user_id, source_type, context.resource_path()};
    create.source_id = source_id ? source_id : context.source_id();
    create.error_type = classification.error_type;
    create.error_severity = classification.severity;
    create.error_message = error.message;
    create.error_code = errors::extract_error_code(error.describe());
    create.http_status_code = errors::extract_http_status(error);
    if (context.response_time()) {
        create.response_time_ms = static_cast<std::uint64_t>(context.response_time()->count());
    }
    create.response_size_bytes = context.response_size();
    create.estimated_item_count = errors::estimate_item_count(error.message);
    create.diagnostic_data = classification.diagnostic_data;
    create.retry_strategy = classification.retry_strategy;
    create.retry_delay_seconds = classification.retry_delay_seconds;
    create.max_retries = classification.max_retries;

    auto recorded = store_->record_failure(create, clock_());
    if (recorded.is_error()) {
        spdlog::error("[FailureTracker] failed to record {} failure for '{}': {}",
                      errors::to_string(source_type), context.resource_path(), recorded.error());
        return recorded;
    }

    const auto& failure = recorded.value();
    spdlog::warn("[FailureTracker] recorded {} scan failure for '{}': {} (id={}, type={}, severity={}, consecutive={})",
                 errors::to_string(source_type), failure.resource_path(), error.message, failure.id,
                 errors::to_string(failure.error_type), errors::to_string(failure.error_severity),
                 failure.consecutive_failures);

    if (event_bus_) {
        events::ScanFailureRecordedEvent event;
        event.user_id = user_id;
        event.source_type = source_type;
        event.resource_path = failure.resource_path();
        event.error_type = failure.error_type;
        event.severity = failure.error_severity;
        event.failure_count = failure.failure_count;
        event.consecutive_failures = failure.consecutive_failures;
        event.next_retry_at = failure.next_retry_at;
        event.timestamp = failure.last_failure_at;
        event_bus_->emit(event);
    }
    return recorded;
}

SkipDecision FailureTracker::should_skip_with_details(const std::string& user_id,
                                                      errors::SourceType source_type,
                                                      const std::string& resource_path) const {
    SkipDecision decision;

    auto found = store_->find(FailureKey{user_id, source_type, resource_path});
    if (found.is_error()) {
        spdlog::warn("[FailureTracker] failed to check failure status for {} resource '{}': {}",
                     errors::to_string(source_type), resource_path, found.error());
        decision.reason = "Error checking failure status: " + found.error();
        return decision;
    }
    if (!found.value()) {
        decision.reason = "No previous failures recorded";
        return decision;
    }

    const auto& failure = *found.value();
    const auto now = clock_();
    decision.failure_count = failure.failure_count;
    decision.user_excluded = failure.user_excluded;
    decision.time_since_last_failure =
        std::chrono::duration_cast<std::chrono::minutes>(now - failure.last_failure_at);

    if (failure.resolved) {
        decision.reason = "Previous failures resolved";
        return decision;
    }

    if (failure.user_excluded) {
        decision.should_skip = true;
        decision.reason = failure.user_notes ? "Excluded by user: " + *failure.user_notes
                                             : std::string("Excluded by user");
    } else if (failure.next_retry_at && *failure.next_retry_at > now) {
        decision.should_skip = true;
        decision.cooldown_remaining = ceil_minutes(*failure.next_retry_at - now);
        decision.reason = std::to_string(failure.consecutive_failures) + " consecutive failures, next retry at "
            + to_iso8601(*failure.next_retry_at);
    } else {
        decision.reason = "Retry is due";
        return decision;
    }

    spdlog::debug("[FailureTracker] skipping {} resource '{}': {}",
                  errors::to_string(source_type), resource_path, decision.reason);
    return decision;
}

bool FailureTracker::should_skip(const std::string& user_id,
                                 errors::SourceType source_type,
                                 const std::string& resource_path) const {
    return should_skip_with_details(user_id, source_type, resource_path).should_skip;
}

void FailureTracker::mark_success(const std::string& user_id,
                                  errors::SourceType source_type,
                                  const std::string& resource_path) {
    const auto now = clock_();
    auto resolved = store_->resolve(FailureKey{user_id, source_type, resource_path}, kSuccessfulScan, now);
    if (resolved.is_error()) {
        spdlog::debug("[FailureTracker] failed to mark {} resource '{}' successful: {}",
                      errors::to_string(source_type), resource_path, resolved.error());
        return;
    }
    if (!resolved.value()) {
        return;
    }

    spdlog::info("[FailureTracker] resolved previous scan failures for {} resource '{}'",
                 errors::to_string(source_type), resource_path);
    if (event_bus_) {
        events::ScanFailureResolvedEvent event;
        event.user_id = user_id;
        event.source_type = source_type;
        event.resource_path = resource_path;
        event.resolution_method = kSuccessfulScan;
        event.timestamp = now;
        event_bus_->emit(event);
    }
}

Result<std::vector<SourceScanFailure>> FailureTracker::get_retry_candidates(
    const std::string& user_id,
    std::optional<errors::SourceType> source_type,
    std::size_t limit) const {
    return store_->retry_candidates(user_id, source_type, limit, clock_());
}

Result<std::vector<FailureResponse>> FailureTracker::list_failures(const std::string& user_id,
                                                                   const store::ListFailuresQuery& query) const {
    auto failures = store_->list(user_id, query, clock_());
    if (failures.is_error()) {
        return Err<std::vector<FailureResponse>>(failures.error());
    }

    std::vector<FailureResponse> responses;
    responses.reserve(failures.value().size());
    for (const auto& failure : failures.value()) {
        responses.push_back(describe(failure));
    }
    return Ok(std::move(responses));
}

Result<std::optional<FailureResponse>> FailureTracker::get_failure_details(const std::string& user_id,
                                                                           std::uint64_t failure_id) const {
    auto found = store_->find_by_id(user_id, failure_id);
    if (found.is_error()) {
        return Err<std::optional<FailureResponse>>(found.error());
    }
    if (!found.value()) {
        return Ok(std::optional<FailureResponse>());
    }
    return Ok(std::optional<FailureResponse>(describe(*found.value())));
}

Result<bool> FailureTracker::retry_failure(const std::string& user_id, std::uint64_t failure_id) {
    auto found = store_->find_by_id(user_id, failure_id);
    if (found.is_error()) {
        return Err<bool>(found.error());
    }
    if (!found.value()) {
        return Ok(false);
    }

    const auto& failure = *found.value();
    auto reset = store_->reset_for_retry(failure.key, clock_());
    if (reset.is_ok() && reset.value()) {
        spdlog::info("[FailureTracker] reset {} resource '{}' for retry",
                     errors::to_string(failure.key.source_type), failure.resource_path());
    }
    return reset;
}

Result<bool> FailureTracker::exclude_resource(const std::string& user_id,
                                              std::uint64_t failure_id,
                                              const std::string& reason) {
    auto found = store_->find_by_id(user_id, failure_id);
    if (found.is_error()) {
        return Err<bool>(found.error());
    }
    if (!found.value()) {
        return Ok(false);
    }

    const auto& failure = *found.value();
    auto excluded = store_->exclude(failure.key, reason, clock_());
    if (excluded.is_ok() && excluded.value()) {
        spdlog::info("[FailureTracker] excluded {} resource '{}' from scanning: {}",
                     errors::to_string(failure.key.source_type), failure.resource_path(), reason);
    }
    return excluded;
}

Result<store::FailureStats> FailureTracker::get_stats(const std::string& user_id,
                                                      std::optional<errors::SourceType> source_type) const {
    return store_->stats(user_id, source_type, clock_());
}

std::string FailureTracker::build_user_friendly_message(const SourceScanFailure& failure) const {
    if (!classifiers_->has_classifier(failure.key.source_type)) {
        return errors::GenericErrorClassifier(failure.key.source_type).build_user_friendly_message_at(failure, clock_());
    }
    return classifiers_->classifier_for(failure.key.source_type)->build_user_friendly_message(failure);
}

FailureResponse FailureTracker::describe(const SourceScanFailure& failure) const {
    const auto classifier = classifiers_->classifier_for(failure.key.source_type);

    FailureResponse response;
    response.failure = failure;
    response.failure_status = failure_status_for(failure.failure_count);
    response.action_status = action_status_for(failure, clock_());
    response.user_friendly_message = build_user_friendly_message(failure);
    response.recommended_action = classifier->build_recommended_action(failure);

    auto& summary = response.diagnostic_summary;
    summary.resource_depth = failure.resource_depth;
    summary.estimated_item_count = failure.estimated_item_count;
    summary.response_time_ms = failure.response_time_ms;
    if (failure.response_size_bytes) {
        summary.response_size_mb = static_cast<double>(*failure.response_size_bytes) / 1048576.0;
    }
    summary.recommended_action = response.recommended_action;
    summary.can_retry = !failure.resolved && !failure.user_excluded && classifier->should_retry(failure);
    summary.user_action_required = failure.error_severity == Severity::Critical
        || failure.error_type == errors::SourceErrorType::PermissionDenied;
    if (failure.diagnostic_data.is_object()) {
        summary.source_specific_info = failure.diagnostic_data;
    }
    return response;
}

SourceScanTracker::SourceScanTracker(std::shared_ptr<FailureTracker> tracker,
                                     errors::SourceType source_type,
                                     std::optional<std::string> source_id)
    : tracker_(std::move(tracker)), source_type_(source_type), source_id_(std::move(source_id)) {}

Result<void> SourceScanTracker::track_scan_error(const std::string& user_id,
                                                 const std::string& path,
                                                 const errors::SourceError& error,
                                                 std::optional<std::chrono::milliseconds> response_time,
                                                 std::optional<std::uint64_t> response_size,
                                                 std::optional<std::string> server_type) {
    auto context = errors::ErrorContext(path, tracker_->now()).with_operation("list_directory");
    if (source_id_) {
        context = context.with_source_id(*source_id_);
    }
    if (response_time) {
        context = context.with_response_time(*response_time);
    }
    if (response_size) {
        context = context.with_response_size(*response_size);
    }
    if (server_type) {
        context = context.with_server_info(*server_type);
    }

    // track_error already logged a store fault; the scan itself carries on
    if (auto recorded = tracker_->track_error(user_id, source_type_, source_id_, error, context);
        recorded.is_ok()) {
        spdlog::debug("[FailureTracker] scan failure for '{}' tracked as id={}", path, recorded.value().id);
    }
    return Ok();
}

bool SourceScanTracker::should_skip_directory(const std::string& user_id, const std::string& path) const {
    return tracker_->should_skip(user_id, source_type_, path);
}

SkipDecision SourceScanTracker::skip_decision(const std::string& user_id, const std::string& path) const {
    return tracker_->should_skip_with_details(user_id, source_type_, path);
}

void SourceScanTracker::mark_scan_successful(const std::string& user_id, const std::string& path) {
    tracker_->mark_success(user_id, source_type_, path);
}

std::vector<std::string> SourceScanTracker::get_retry_candidates(const std::string& user_id) const {
    std::vector<std::string> paths;
    auto candidates = tracker_->get_retry_candidates(user_id, source_type_);
    if (candidates.is_error()) {
        spdlog::warn("[FailureTracker] failed to load retry candidates for {}: {}",
                     errors::to_string(source_type_), candidates.error());
        return paths;
    }
    for (const auto& failure : candidates.value()) {
        paths.push_back(failure.resource_path());
    }
    return paths;
}

} // namespace scanguard::tracking
