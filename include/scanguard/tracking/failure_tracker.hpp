#pragma once

#include "scanguard/core/result.hpp"
#include "scanguard/core/time.hpp"
#include "scanguard/errors/context.hpp"
#include "scanguard/errors/failure.hpp"
#include "scanguard/errors/registry.hpp"
#include "scanguard/events/event_bus.hpp"
#include "scanguard/store/failure_store.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scanguard::tracking {

/// How long a resource has been failing, by lifetime failure_count
enum class FailureStatus {
    Recent,      ///< up to 3 failures
    Recurring,   ///< more than 3
    Persistent,  ///< more than 10
    Chronic      ///< more than 20
};

/// What happens next for a failure record
enum class ActionStatus {
    ReadyForRetry,
    Excluded,
    NeedsIntervention,
    Resolved,
    Scheduled
};

[[nodiscard]] const char* to_string(FailureStatus status) noexcept;
[[nodiscard]] const char* to_string(ActionStatus status) noexcept;

[[nodiscard]] FailureStatus failure_status_for(std::uint32_t failure_count) noexcept;
[[nodiscard]] ActionStatus action_status_for(const errors::SourceScanFailure& failure, TimePoint now) noexcept;

/**
 * @brief Answer to "should this resource be skipped right now?"
 */
struct SkipDecision {
    bool should_skip = false;
    std::string reason;
    std::uint32_t failure_count = 0;
    std::optional<std::chrono::minutes> time_since_last_failure;
    std::optional<std::chrono::minutes> cooldown_remaining;
    bool user_excluded = false;
};

/**
 * @brief Display-oriented digest of one failure record
 */
struct FailureDiagnostics {
    std::uint32_t resource_depth = 0;
    std::optional<std::uint64_t> estimated_item_count;
    std::optional<std::uint64_t> response_time_ms;
    std::optional<double> response_size_mb;
    std::string recommended_action;
    bool can_retry = false;
    bool user_action_required = false;
    nlohmann::json source_specific_info = nlohmann::json::object();
};

struct FailureResponse {
    errors::SourceScanFailure failure;
    FailureStatus failure_status = FailureStatus::Recent;
    ActionStatus action_status = ActionStatus::Scheduled;
    std::string user_friendly_message;
    std::string recommended_action;
    FailureDiagnostics diagnostic_summary;

    [[nodiscard]] nlohmann::json to_json() const;
};

/**
 * @brief Classifies source errors and keeps the failure store current
 *
 * Bookkeeping problems never stop a crawl: skip checks fail open (scan
 * anyway) and mark_success swallows store errors after logging them.
 * track_error reports store errors to the caller, already logged.
 *
 * Thread-safe; concurrent track_error calls for one key are serialized by
 * the store's upsert.
 */
class FailureTracker {
public:
    FailureTracker(std::shared_ptr<store::FailureStore> store,
                   std::shared_ptr<const errors::ClassifierRegistry> classifiers,
                   ClockFn clock = system_clock_fn(),
                   events::EventBus* event_bus = nullptr);

    /// Classify @p error with the source's classifier and upsert the record
    Result<errors::SourceScanFailure> track_error(const std::string& user_id,
                                                  errors::SourceType source_type,
                                                  const std::optional<std::string>& source_id,
                                                  const errors::SourceError& error,
                                                  const errors::ErrorContext& context);

    /**
     * @brief Skip while a retry is scheduled in the future or the user excluded it
     *
     * Resolved records and store errors never cause a skip.
     */
    [[nodiscard]] SkipDecision should_skip_with_details(const std::string& user_id,
                                                        errors::SourceType source_type,
                                                        const std::string& resource_path) const;

    [[nodiscard]] bool should_skip(const std::string& user_id,
                                   errors::SourceType source_type,
                                   const std::string& resource_path) const;

    /// Resolve any open failure with method "successful_scan"
    void mark_success(const std::string& user_id,
                      errors::SourceType source_type,
                      const std::string& resource_path);

    Result<std::vector<errors::SourceScanFailure>> get_retry_candidates(
        const std::string& user_id,
        std::optional<errors::SourceType> source_type = std::nullopt,
        std::size_t limit = store::kDefaultRetryCandidateLimit) const;

    Result<std::vector<FailureResponse>> list_failures(const std::string& user_id,
                                                       const store::ListFailuresQuery& query = {}) const;

    Result<std::optional<FailureResponse>> get_failure_details(const std::string& user_id,
                                                               std::uint64_t failure_id) const;

    /// Reset consecutive failures, clear exclusion and make the record due now
    Result<bool> retry_failure(const std::string& user_id, std::uint64_t failure_id);

    Result<bool> exclude_resource(const std::string& user_id,
                                  std::uint64_t failure_id,
                                  const std::string& reason);

    Result<store::FailureStats> get_stats(const std::string& user_id,
                                          std::optional<errors::SourceType> source_type = std::nullopt) const;

    /// Message from the record alone, via the source's classifier
    [[nodiscard]] std::string build_user_friendly_message(const errors::SourceScanFailure& failure) const;

    [[nodiscard]] FailureResponse describe(const errors::SourceScanFailure& failure) const;

    [[nodiscard]] TimePoint now() const { return clock_(); }

private:
    std::shared_ptr<store::FailureStore> store_;
    std::shared_ptr<const errors::ClassifierRegistry> classifiers_;
    ClockFn clock_;
    events::EventBus* event_bus_;
};

/**
 * @brief FailureTracker bound to one source (type plus optional source id)
 *
 * This is the surface a crawl uses: record a listing error, ask whether to
 * descend, resolve on success, fetch the paths due for retry.
 */
class SourceScanTracker {
public:
    SourceScanTracker(std::shared_ptr<FailureTracker> tracker,
                      errors::SourceType source_type,
                      std::optional<std::string> source_id = std::nullopt);

    /// Always Ok: a store fault is logged by the tracker and never fails the scan
    Result<void> track_scan_error(const std::string& user_id,
                                  const std::string& path,
                                  const errors::SourceError& error,
                                  std::optional<std::chrono::milliseconds> response_time = std::nullopt,
                                  std::optional<std::uint64_t> response_size = std::nullopt,
                                  std::optional<std::string> server_type = std::nullopt);

    [[nodiscard]] bool should_skip_directory(const std::string& user_id, const std::string& path) const;

    [[nodiscard]] SkipDecision skip_decision(const std::string& user_id, const std::string& path) const;

    void mark_scan_successful(const std::string& user_id, const std::string& path);

    [[nodiscard]] std::vector<std::string> get_retry_candidates(const std::string& user_id) const;

    [[nodiscard]] errors::SourceType source_type() const noexcept { return source_type_; }
    [[nodiscard]] FailureTracker& tracker() noexcept { return *tracker_; }

private:
    std::shared_ptr<FailureTracker> tracker_;
    errors::SourceType source_type_;
    std::optional<std::string> source_id_;
};

} // namespace scanguard::tracking
