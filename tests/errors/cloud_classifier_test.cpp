#include "scanguard/errors/cloud_classifiers.hpp"
#include "scanguard/errors/generic_classifier.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

using scanguard::from_epoch_ms;
using scanguard::errors::DropboxErrorClassifier;
using scanguard::errors::ErrorContext;
using scanguard::errors::GDriveErrorClassifier;
using scanguard::errors::GenericErrorClassifier;
using scanguard::errors::OneDriveErrorClassifier;
using scanguard::errors::RetryStrategy;
using scanguard::errors::Severity;
using scanguard::errors::SourceError;
using scanguard::errors::SourceErrorType;
using scanguard::errors::SourceScanFailure;
using scanguard::errors::SourceType;

namespace {

const auto kNow = from_epoch_ms(1'700'000'000'000);

ErrorContext context_for(const std::string& path) {
    return ErrorContext(path, kNow).with_operation("list_folder");
}

} // namespace

TEST(CloudClassifierTest, ReportsOwnSourceType) {
    EXPECT_EQ(DropboxErrorClassifier().source_type(), SourceType::Dropbox);
    EXPECT_EQ(GDriveErrorClassifier().source_type(), SourceType::GDrive);
    EXPECT_EQ(OneDriveErrorClassifier().source_type(), SourceType::OneDrive);
}

TEST(CloudClassifierTest, DropboxMissingRootIsCritical) {
    DropboxErrorClassifier classifier;
    const SourceError error("path/not_found/");

    auto root = classifier.classify_error(error, context_for("/Apps"));
    EXPECT_EQ(root.error_type, SourceErrorType::NotFound);
    EXPECT_EQ(root.severity, Severity::Critical);
    EXPECT_EQ(root.max_retries, 1u);

    auto nested = classifier.classify_error(error, context_for("/Apps/sync/docs"));
    EXPECT_EQ(nested.severity, Severity::Medium);
    EXPECT_NE(nested.user_friendly_message.find("Dropbox"), std::string::npos);
}

TEST(CloudClassifierTest, RetryAfterHintLengthensDelay) {
    DropboxErrorClassifier classifier;

    auto hinted = classifier.classify_error(SourceError("too_many_requests/ Retry-After: 1800"),
                                            context_for("/Apps/sync"));
    EXPECT_EQ(hinted.error_type, SourceErrorType::RateLimited);
    EXPECT_EQ(hinted.severity, Severity::Low);
    EXPECT_EQ(hinted.retry_strategy, RetryStrategy::Exponential);
    EXPECT_EQ(hinted.retry_delay_seconds, 1800u);
    EXPECT_EQ(hinted.max_retries, 10u);
    EXPECT_EQ(hinted.diagnostic_data["retry_after_seconds"], 1800);
    EXPECT_EQ(hinted.diagnostic_data["provider"], "Dropbox");

    auto short_hint = classifier.classify_error(SourceError("too_many_requests/ Retry-After: 10"),
                                                context_for("/Apps/sync"));
    EXPECT_EQ(short_hint.retry_delay_seconds, 900u);

    auto huge_hint = classifier.classify_error(SourceError("too_many_requests/ retry-after: 999999"),
                                               context_for("/Apps/sync"));
    EXPECT_EQ(huge_hint.retry_delay_seconds, 86400u);
}

TEST(CloudClassifierTest, GDriveQuotaAndRateLimitReasons) {
    GDriveErrorClassifier classifier;

    auto quota = classifier.classify_error(SourceError("storageQuotaExceeded"), context_for("/My Drive/a"));
    EXPECT_EQ(quota.error_type, SourceErrorType::QuotaExceeded);
    EXPECT_EQ(quota.severity, Severity::High);
    EXPECT_EQ(quota.retry_strategy, RetryStrategy::Fixed);
    EXPECT_EQ(quota.retry_delay_seconds, 3600u);
    EXPECT_NE(quota.user_friendly_message.find("Google Drive"), std::string::npos);

    auto rate = classifier.classify_error(SourceError::from_http(403, "userRateLimitExceeded"),
                                          context_for("/My Drive/a"));
    EXPECT_EQ(rate.error_type, SourceErrorType::RateLimited);
    EXPECT_EQ(rate.diagnostic_data["http_status"], 403);
}

TEST(CloudClassifierTest, FallsBackToHttpVocabulary) {
    GDriveErrorClassifier gdrive;
    auto unauthorized = gdrive.classify_error(SourceError::from_http(401, "Unauthorized"), context_for("/My Drive/a"));
    EXPECT_EQ(unauthorized.error_type, SourceErrorType::PermissionDenied);
    EXPECT_EQ(unauthorized.severity, Severity::High);
    EXPECT_EQ(unauthorized.max_retries, 3u);

    OneDriveErrorClassifier onedrive;
    auto network = onedrive.classify_error(SourceError("connection reset"), context_for("/Documents/a"));
    EXPECT_EQ(network.error_type, SourceErrorType::NetworkError);
    EXPECT_EQ(network.retry_strategy, RetryStrategy::Linear);
    EXPECT_EQ(network.retry_delay_seconds, 30u);

    auto timeout = onedrive.classify_error(SourceError("request timed out"), context_for("/Documents/a"));
    EXPECT_EQ(timeout.error_type, SourceErrorType::Timeout);
    EXPECT_EQ(timeout.retry_delay_seconds, 600u);
}

TEST(CloudClassifierTest, OneDriveGraphCodes) {
    OneDriveErrorClassifier classifier;

    EXPECT_EQ(classifier.classify_error(SourceError("itemNotFound"), context_for("/Documents/a")).error_type,
              SourceErrorType::NotFound);
    EXPECT_EQ(classifier.classify_error(SourceError("activityLimitReached"), context_for("/Documents/a")).error_type,
              SourceErrorType::RateLimited);
    EXPECT_EQ(classifier.classify_error(SourceError("pathIsTooLong"), context_for("/Documents/a")).severity,
              Severity::Critical);
}

TEST(GenericClassifierTest, BasicVocabulary) {
    GenericErrorClassifier classifier(SourceType::WebDAV);

    auto missing = classifier.classify_error(SourceError::from_http(404, "Not Found"), context_for("/x/y"));
    EXPECT_EQ(missing.error_type, SourceErrorType::NotFound);
    EXPECT_EQ(missing.severity, Severity::Critical);

    auto denied = classifier.classify_error(SourceError("permission denied"), context_for("/x/y"));
    EXPECT_EQ(denied.severity, Severity::High);

    auto limited = classifier.classify_error(SourceError("rate limit reached"), context_for("/x/y"));
    EXPECT_EQ(limited.error_type, SourceErrorType::RateLimited);
    EXPECT_EQ(limited.severity, Severity::Low);
    EXPECT_EQ(limited.retry_strategy, RetryStrategy::Linear);
}

TEST(GenericClassifierTest, MessageReflectsRetryState) {
    GenericErrorClassifier classifier(SourceType::S3);

    SourceScanFailure failure;
    failure.key.source_type = SourceType::S3;
    failure.key.resource_path = "/bucket/a";
    failure.error_type = SourceErrorType::Timeout;
    failure.consecutive_failures = 3;
    failure.next_retry_at = kNow + std::chrono::minutes(10);

    auto pending = classifier.build_user_friendly_message_at(failure, kNow);
    EXPECT_NE(pending.find("This has failed 3 times."), std::string::npos);
    EXPECT_NE(pending.find("Will retry in 10 minutes."), std::string::npos);

    auto due = classifier.build_user_friendly_message_at(failure, kNow + std::chrono::minutes(11));
    EXPECT_NE(due.find("Ready for retry."), std::string::npos);

    failure.user_excluded = true;
    auto excluded = classifier.build_user_friendly_message_at(failure, kNow);
    EXPECT_EQ(excluded.find("retry"), std::string::npos);
}
