#include "scanguard/tracking/failure_tracker.hpp"

#include "scanguard/events/events.hpp"
#include "scanguard/store/memory_failure_store.hpp"
#include "support/manual_clock.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace std::chrono_literals;
using scanguard::Err;
using scanguard::Result;
using scanguard::TimePoint;
using scanguard::errors::ClassifierRegistry;
using scanguard::errors::CreateSourceScanFailure;
using scanguard::errors::ErrorContext;
using scanguard::errors::FailureKey;
using scanguard::errors::Severity;
using scanguard::errors::SourceError;
using scanguard::errors::SourceErrorType;
using scanguard::errors::SourceScanFailure;
using scanguard::errors::SourceType;
using scanguard::events::EventBus;
using scanguard::events::ScanFailureRecordedEvent;
using scanguard::events::ScanFailureResolvedEvent;
using scanguard::store::FailureStats;
using scanguard::store::FailureStore;
using scanguard::store::ListFailuresQuery;
using scanguard::store::MemoryFailureStore;
using scanguard::test::ManualClock;
using scanguard::tracking::ActionStatus;
using scanguard::tracking::FailureStatus;
using scanguard::tracking::FailureTracker;
using scanguard::tracking::SourceScanTracker;

namespace {

/// Store whose every operation fails, as a broken database would
class UnavailableStore : public FailureStore {
public:
    Result<SourceScanFailure> record_failure(const CreateSourceScanFailure&, TimePoint) override {
        return Err<SourceScanFailure>(std::string("database is locked"));
    }
    Result<std::optional<SourceScanFailure>> find(const FailureKey&) const override {
        return Err<std::optional<SourceScanFailure>>(std::string("database is locked"));
    }
    Result<std::optional<SourceScanFailure>> find_by_id(const std::string&, std::uint64_t) const override {
        return Err<std::optional<SourceScanFailure>>(std::string("database is locked"));
    }
    Result<bool> resolve(const FailureKey&, const std::string&, TimePoint) override {
        return Err<bool>(std::string("database is locked"));
    }
    Result<bool> reset_for_retry(const FailureKey&, TimePoint) override {
        return Err<bool>(std::string("database is locked"));
    }
    Result<bool> exclude(const FailureKey&, const std::string&, TimePoint) override {
        return Err<bool>(std::string("database is locked"));
    }
    Result<std::vector<SourceScanFailure>> list(const std::string&, const ListFailuresQuery&, TimePoint) const override {
        return Err<std::vector<SourceScanFailure>>(std::string("database is locked"));
    }
    Result<std::vector<SourceScanFailure>> retry_candidates(const std::string&,
                                                            std::optional<SourceType>,
                                                            std::size_t,
                                                            TimePoint) const override {
        return Err<std::vector<SourceScanFailure>>(std::string("database is locked"));
    }
    Result<FailureStats> stats(const std::string&, std::optional<SourceType>, TimePoint) const override {
        return Err<FailureStats>(std::string("database is locked"));
    }
};

} // namespace

class FailureTrackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<MemoryFailureStore>();
        tracker_ = std::make_shared<FailureTracker>(store_, ClassifierRegistry::with_defaults(), clock_.fn(), &bus_);
    }

    SourceScanFailure track_timeout(const std::string& path) {
        auto result = tracker_->track_error("alice", SourceType::WebDAV, std::nullopt,
                                            SourceError("Request timeout after 30s"),
                                            ErrorContext(path, clock_.now()).with_operation("list_directory"));
        EXPECT_TRUE(result.is_ok());
        return result.value();
    }

    ManualClock clock_;
    EventBus bus_;
    std::shared_ptr<MemoryFailureStore> store_;
    std::shared_ptr<FailureTracker> tracker_;
};

TEST_F(FailureTrackerTest, TrackErrorStoresClassification) {
    std::vector<ScanFailureRecordedEvent> recorded;
    bus_.subscribe<ScanFailureRecordedEvent>([&](const ScanFailureRecordedEvent& e) { recorded.push_back(e); });

    auto failure = track_timeout("/remote/big");

    EXPECT_EQ(failure.key.user_id, "alice");
    EXPECT_EQ(failure.key.source_type, SourceType::WebDAV);
    EXPECT_EQ(failure.error_type, SourceErrorType::Timeout);
    EXPECT_EQ(failure.error_severity, Severity::Medium);
    EXPECT_EQ(failure.error_message, "Request timeout after 30s");
    EXPECT_EQ(failure.consecutive_failures, 1u);
    EXPECT_EQ(failure.max_retries, 5u);
    EXPECT_EQ(failure.next_retry_at, std::optional<TimePoint>(clock_.now() + 900s));

    ASSERT_EQ(recorded.size(), 1u);
    EXPECT_EQ(recorded[0].resource_path, "/remote/big");
    EXPECT_EQ(recorded[0].consecutive_failures, 1u);
    EXPECT_EQ(recorded[0].severity, Severity::Medium);
}

TEST_F(FailureTrackerTest, UnknownResourceIsNotSkipped) {
    auto decision = tracker_->should_skip_with_details("alice", SourceType::WebDAV, "/remote/fresh");
    EXPECT_FALSE(decision.should_skip);
    EXPECT_EQ(decision.reason, "No previous failures recorded");
    EXPECT_EQ(decision.failure_count, 0u);
    EXPECT_FALSE(decision.time_since_last_failure.has_value());
}

TEST_F(FailureTrackerTest, SkipsDuringCooldownOnly) {
    track_timeout("/remote/big");

    auto during = tracker_->should_skip_with_details("alice", SourceType::WebDAV, "/remote/big");
    EXPECT_TRUE(during.should_skip);
    EXPECT_EQ(during.failure_count, 1u);
    EXPECT_EQ(during.cooldown_remaining, std::optional<std::chrono::minutes>(15min));
    EXPECT_NE(during.reason.find("1 consecutive failures, next retry at "), std::string::npos);

    clock_.advance(10min);
    auto later = tracker_->should_skip_with_details("alice", SourceType::WebDAV, "/remote/big");
    EXPECT_TRUE(later.should_skip);
    EXPECT_EQ(later.cooldown_remaining, std::optional<std::chrono::minutes>(5min));
    EXPECT_EQ(later.time_since_last_failure, std::optional<std::chrono::minutes>(10min));

    clock_.advance(5min);
    auto due = tracker_->should_skip_with_details("alice", SourceType::WebDAV, "/remote/big");
    EXPECT_FALSE(due.should_skip);
    EXPECT_EQ(due.reason, "Retry is due");

    // Other users and source types never share the record.
    EXPECT_FALSE(tracker_->should_skip("bob", SourceType::WebDAV, "/remote/big"));
    EXPECT_FALSE(tracker_->should_skip("alice", SourceType::S3, "/remote/big"));
}

TEST_F(FailureTrackerTest, SuccessResolvesAndClearsSchedule) {
    std::vector<ScanFailureResolvedEvent> resolved;
    bus_.subscribe<ScanFailureResolvedEvent>([&](const ScanFailureResolvedEvent& e) { resolved.push_back(e); });

    for (int i = 0; i < 3; ++i) {
        track_timeout("/remote/big");
        clock_.advance(1h);
    }
    tracker_->mark_success("alice", SourceType::WebDAV, "/remote/big");

    auto record = store_->find(FailureKey{"alice", SourceType::WebDAV, "/remote/big"}).value();
    ASSERT_TRUE(record.has_value());
    EXPECT_TRUE(record->resolved);
    EXPECT_EQ(record->failure_count, 3u);
    EXPECT_EQ(record->consecutive_failures, 0u);
    EXPECT_FALSE(record->next_retry_at.has_value());
    EXPECT_EQ(record->resolution_method, std::optional<std::string>("successful_scan"));

    ASSERT_EQ(resolved.size(), 1u);
    EXPECT_EQ(resolved[0].resource_path, "/remote/big");
    EXPECT_EQ(resolved[0].resolution_method, "successful_scan");

    auto decision = tracker_->should_skip_with_details("alice", SourceType::WebDAV, "/remote/big");
    EXPECT_FALSE(decision.should_skip);
    EXPECT_EQ(decision.reason, "Previous failures resolved");

    // Nothing left to resolve.
    tracker_->mark_success("alice", SourceType::WebDAV, "/remote/big");
    tracker_->mark_success("alice", SourceType::WebDAV, "/remote/never-failed");
    EXPECT_EQ(resolved.size(), 1u);
}

TEST_F(FailureTrackerTest, ExcludeThenRetry) {
    const auto failure = track_timeout("/remote/huge");

    auto excluded = tracker_->exclude_resource("alice", failure.id, "too big to sync");
    ASSERT_TRUE(excluded.is_ok());
    EXPECT_TRUE(excluded.value());

    // Exclusion holds even after the cooldown has passed.
    clock_.advance(1h);
    auto decision = tracker_->should_skip_with_details("alice", SourceType::WebDAV, "/remote/huge");
    EXPECT_TRUE(decision.should_skip);
    EXPECT_TRUE(decision.user_excluded);
    EXPECT_EQ(decision.reason, "Excluded by user: too big to sync");

    auto retried = tracker_->retry_failure("alice", failure.id);
    ASSERT_TRUE(retried.is_ok());
    EXPECT_TRUE(retried.value());

    decision = tracker_->should_skip_with_details("alice", SourceType::WebDAV, "/remote/huge");
    EXPECT_FALSE(decision.should_skip);
    EXPECT_FALSE(decision.user_excluded);
    EXPECT_EQ(decision.reason, "Retry is due");

    auto candidates = tracker_->get_retry_candidates("alice");
    ASSERT_TRUE(candidates.is_ok());
    ASSERT_EQ(candidates.value().size(), 1u);
    EXPECT_EQ(candidates.value()[0].consecutive_failures, 0u);
}

TEST_F(FailureTrackerTest, ForeignIdsAreNotTouched) {
    const auto failure = track_timeout("/remote/huge");

    EXPECT_FALSE(tracker_->exclude_resource("bob", failure.id, "not yours").value());
    EXPECT_FALSE(tracker_->retry_failure("bob", failure.id).value());
    EXPECT_FALSE(tracker_->retry_failure("alice", failure.id + 100).value());

    auto details = tracker_->get_failure_details("bob", failure.id);
    ASSERT_TRUE(details.is_ok());
    EXPECT_FALSE(details.value().has_value());
}

TEST_F(FailureTrackerTest, DescribeDerivesStatuses) {
    auto missing = tracker_->track_error("alice", SourceType::WebDAV, std::nullopt,
                                         SourceError::from_http(404, "Not Found"),
                                         ErrorContext("/remote/gone", clock_.now()));
    ASSERT_TRUE(missing.is_ok());
    auto critical = tracker_->describe(missing.value());
    EXPECT_EQ(critical.action_status, ActionStatus::NeedsIntervention);
    EXPECT_EQ(critical.failure_status, FailureStatus::Recent);
    EXPECT_TRUE(critical.diagnostic_summary.user_action_required);
    EXPECT_FALSE(critical.user_friendly_message.empty());
    EXPECT_FALSE(critical.recommended_action.empty());

    auto scheduled = tracker_->describe(track_timeout("/remote/slow"));
    EXPECT_EQ(scheduled.action_status, ActionStatus::Scheduled);
    EXPECT_TRUE(scheduled.diagnostic_summary.can_retry);
    EXPECT_FALSE(scheduled.diagnostic_summary.user_action_required);
    EXPECT_EQ(scheduled.diagnostic_summary.resource_depth, 2u);

    clock_.advance(1h);
    auto ready = tracker_->describe(scheduled.failure);
    EXPECT_EQ(ready.action_status, ActionStatus::ReadyForRetry);

    auto json = ready.to_json();
    EXPECT_EQ(json["action_status"], "ready_for_retry");
    EXPECT_EQ(json["failure_status"], "recent");
    EXPECT_EQ(json["resource_path"], "/remote/slow");
    EXPECT_TRUE(json["diagnostic_summary"]["can_retry"].get<bool>());
}

TEST(FailureStatusTest, ThresholdsFollowLifetimeCount) {
    using scanguard::tracking::failure_status_for;
    EXPECT_EQ(failure_status_for(1), FailureStatus::Recent);
    EXPECT_EQ(failure_status_for(3), FailureStatus::Recent);
    EXPECT_EQ(failure_status_for(4), FailureStatus::Recurring);
    EXPECT_EQ(failure_status_for(11), FailureStatus::Persistent);
    EXPECT_EQ(failure_status_for(21), FailureStatus::Chronic);
}

TEST_F(FailureTrackerTest, ListAndStatsGoThroughStore) {
    track_timeout("/remote/a");
    track_timeout("/remote/b");
    tracker_->track_error("alice", SourceType::WebDAV, std::nullopt,
                          SourceError::from_http(404, "Not Found"),
                          ErrorContext("/remote/c", clock_.now()));

    auto listed = tracker_->list_failures("alice");
    ASSERT_TRUE(listed.is_ok());
    ASSERT_EQ(listed.value().size(), 3u);
    EXPECT_EQ(listed.value()[0].failure.resource_path(), "/remote/c");

    auto stats = tracker_->get_stats("alice");
    ASSERT_TRUE(stats.is_ok());
    EXPECT_EQ(stats.value().active_failures, 3u);
    EXPECT_EQ(stats.value().critical_failures, 1u);
}

TEST(FailureTrackerFaultTest, StoreFaultsFailOpen) {
    ManualClock clock;
    FailureTracker tracker(std::make_shared<UnavailableStore>(), ClassifierRegistry::with_defaults(), clock.fn());

    auto decision = tracker.should_skip_with_details("alice", SourceType::Local, "/data/a");
    EXPECT_FALSE(decision.should_skip);
    EXPECT_EQ(decision.reason, "Error checking failure status: database is locked");

    auto tracked = tracker.track_error("alice", SourceType::Local, std::nullopt,
                                       SourceError("Permission denied"), ErrorContext("/data/a", clock.now()));
    ASSERT_TRUE(tracked.is_error());
    EXPECT_EQ(tracked.error(), "database is locked");

    EXPECT_NO_THROW(tracker.mark_success("alice", SourceType::Local, "/data/a"));
    EXPECT_TRUE(tracker.get_retry_candidates("alice").is_error());
    EXPECT_TRUE(tracker.retry_failure("alice", 1).is_error());
}

TEST(FailureTrackerFaultTest, ScanErrorsNeverFailTheScan) {
    ManualClock clock;
    auto tracker = std::make_shared<FailureTracker>(std::make_shared<UnavailableStore>(),
                                                    ClassifierRegistry::with_defaults(), clock.fn());
    SourceScanTracker scans(tracker, SourceType::WebDAV, std::string("nas"));

    auto tracked = scans.track_scan_error("alice", "/remote/x", SourceError("Request timeout"));
    EXPECT_TRUE(tracked.is_ok());

    // The detailed call still reports the store fault.
    auto detailed = tracker->track_error("alice", SourceType::WebDAV, std::nullopt,
                                         SourceError("Request timeout"), ErrorContext("/remote/x", clock.now()));
    ASSERT_TRUE(detailed.is_error());
    EXPECT_EQ(detailed.error(), "database is locked");

    EXPECT_FALSE(scans.should_skip_directory("alice", "/remote/x"));
    EXPECT_TRUE(scans.get_retry_candidates("alice").empty());
}

TEST_F(FailureTrackerTest, SourceScanTrackerBindsSourceType) {
    SourceScanTracker scans(tracker_, SourceType::WebDAV, std::string("nas"));

    auto tracked = scans.track_scan_error("alice", "/remote/photos", SourceError("Request timeout after 30s"),
                                          std::chrono::milliseconds(31000), 2048u, std::string("nextcloud"));
    ASSERT_TRUE(tracked.is_ok());

    auto record = store_->find(FailureKey{"alice", SourceType::WebDAV, "/remote/photos"}).value();
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->source_id, std::optional<std::string>("nas"));
    EXPECT_EQ(record->response_time_ms, std::optional<std::uint64_t>(31000));
    EXPECT_EQ(record->response_size_bytes, std::optional<std::uint64_t>(2048));

    EXPECT_TRUE(scans.should_skip_directory("alice", "/remote/photos"));
    EXPECT_TRUE(scans.skip_decision("alice", "/remote/photos").should_skip);
    EXPECT_TRUE(scans.get_retry_candidates("alice").empty());

    clock_.advance(16min);
    EXPECT_FALSE(scans.should_skip_directory("alice", "/remote/photos"));
    EXPECT_EQ(scans.get_retry_candidates("alice"), std::vector<std::string>{"/remote/photos"});

    scans.mark_scan_successful("alice", "/remote/photos");
    EXPECT_TRUE(scans.get_retry_candidates("alice").empty());
    EXPECT_EQ(scans.source_type(), SourceType::WebDAV);
}
