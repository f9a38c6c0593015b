#include "scanguard/errors/s3_classifier.hpp"

#include "scanguard/errors/diagnostics.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <optional>
#include <regex>

namespace scanguard::errors {
namespace {

SourceErrorType classify_type(const std::string& text) {
    if (contains_any(text, {"nosuchbucket", "no such bucket", "nosuchkey", "no such key"})) {
        return SourceErrorType::NotFound;
    }
    if (contains_any(text, {"accessdenied", "access denied"})) {
        return SourceErrorType::PermissionDenied;
    }
    if (contains_any(text, {"invalidbucketname", "invalid bucket name"})) {
        return SourceErrorType::InvalidCharacters;
    }
    if (contains_any(text, {"requesttimeout", "timeout"})) {
        return SourceErrorType::Timeout;
    }
    if (contains_any(text, {"slowdown", "throttling"})) {
        return SourceErrorType::RateLimited;
    }
    if (contains_any(text, {"serviceunavailable", "service unavailable", "internalerror", "internal error"})) {
        return SourceErrorType::ServerError;
    }
    if (contains_any(text, {"invalidsecurity", "signaturemismatch"})) {
        return SourceErrorType::PermissionDenied;
    }
    if (contains_any(text, {"quotaexceeded", "quota exceeded"})) {
        return SourceErrorType::QuotaExceeded;
    }
    if (contains_any(text, {"entitytoolarge", "too large"})) {
        return SourceErrorType::SizeLimit;
    }
    if (contains_any(text, {"network", "connection"})) {
        return SourceErrorType::NetworkError;
    }
    if (contains_any(text, {"json", "xml", "parse"})) {
        return SourceErrorType::JsonParseError;
    }
    if (contains_any(text, {"conflict"})) {
        return SourceErrorType::Conflict;
    }
    if (contains_any(text, {"unsupported", "not implemented"})) {
        return SourceErrorType::UnsupportedOperation;
    }
    return SourceErrorType::Unknown;
}

// A missing bucket is fatal; a missing key may reappear.
Severity severity_for(SourceErrorType type, bool mentions_bucket) {
    switch (type) {
        case SourceErrorType::NotFound:
            return mentions_bucket ? Severity::Critical : Severity::Medium;
        case SourceErrorType::InvalidCharacters:
        case SourceErrorType::UnsupportedOperation:
            return Severity::Critical;
        case SourceErrorType::PermissionDenied:
        case SourceErrorType::QuotaExceeded:
        case SourceErrorType::SizeLimit:
            return Severity::High;
        case SourceErrorType::RateLimited:
        case SourceErrorType::NetworkError:
            return Severity::Low;
        default:
            return Severity::Medium;
    }
}

std::uint32_t max_retries_for(Severity severity) {
    switch (severity) {
        case Severity::Critical: return 1;
        case Severity::High: return 2;
        case Severity::Medium: return 5;
        case Severity::Low: return 10;
    }
    return 5;
}

std::uint32_t delay_for(SourceErrorType type) {
    switch (type) {
        case SourceErrorType::RateLimited: return 1200;
        case SourceErrorType::NetworkError: return 30;
        case SourceErrorType::Timeout: return 300;
        case SourceErrorType::ServerError: return 180;
        default: return 300;
    }
}

std::string message_for(SourceErrorType type, Severity severity,
                        const std::string& path, const std::string& error_message) {
    switch (type) {
        case SourceErrorType::NotFound:
            if (severity == Severity::Critical) {
                return fmt::format("S3 bucket for path '{}' does not exist or is not accessible.", path);
            }
            return fmt::format("S3 object '{}' was not found. It may have been deleted or moved.", path);
        case SourceErrorType::PermissionDenied:
            return fmt::format("Access denied to S3 resource '{}'. Check your AWS credentials and bucket permissions.", path);
        case SourceErrorType::InvalidCharacters:
            return fmt::format("S3 path '{}' contains invalid characters. Please use valid S3 key naming conventions.", path);
        case SourceErrorType::QuotaExceeded:
            return "AWS quota exceeded for S3 operations. Please check your AWS service limits.";
        case SourceErrorType::RateLimited:
            return "S3 requests are being rate limited. Operations will be retried with exponential backoff.";
        case SourceErrorType::Timeout:
            return fmt::format("S3 request for '{}' timed out. This may be due to large object size or network issues.", path);
        case SourceErrorType::NetworkError:
            return fmt::format("Network error accessing S3 resource '{}'. Check your internet connection.", path);
        case SourceErrorType::ServerError:
            return fmt::format("AWS S3 service error for resource '{}'. This is usually temporary.", path);
        case SourceErrorType::SizeLimit:
            return fmt::format("S3 object '{}' exceeds size limits for processing.", path);
        default:
            return fmt::format("Error accessing S3 resource '{}': {}", path, error_message);
    }
}

std::string action_for(SourceErrorType type, Severity severity) {
    switch (type) {
        case SourceErrorType::NotFound:
            if (severity == Severity::Critical) {
                return "Verify the S3 bucket name and region configuration.";
            }
            break;
        case SourceErrorType::PermissionDenied:
            return "Check AWS IAM permissions and S3 bucket policies. Ensure read access is granted.";
        case SourceErrorType::InvalidCharacters:
            return "Rename S3 objects to use valid characters and naming conventions.";
        case SourceErrorType::QuotaExceeded:
            return "Contact AWS support to increase service limits or reduce usage.";
        case SourceErrorType::RateLimited:
            return "Reduce request rate or enable request throttling. Will retry automatically.";
        case SourceErrorType::SizeLimit:
            return "Consider splitting large objects or excluding them from processing.";
        case SourceErrorType::NetworkError:
            return "Check network connectivity to AWS S3 endpoints.";
        default:
            break;
    }
    if (severity == Severity::Critical) {
        return "Manual intervention required. This S3 error cannot be resolved automatically.";
    }
    return "S3 operations will be retried automatically with appropriate delays.";
}

std::optional<std::string> capture(const std::string& text, const std::regex& pattern) {
    std::smatch match;
    if (std::regex_search(text, match, pattern)) {
        return match[1].str();
    }
    return std::nullopt;
}

std::optional<std::string> aws_error_code(const std::string& text) {
    static const std::regex code_pattern(
        "(NoSuchBucket|NoSuchKey|AccessDenied|InvalidBucketName|RequestTimeout|Throttling|SlowDown|"
        "ServiceUnavailable|InternalError|InvalidSecurity|SignatureMismatch|QuotaExceeded|EntityTooLarge)",
        std::regex::icase);
    if (auto code = capture(text, code_pattern)) {
        return code;
    }
    static const std::regex status_pattern(R"(status[:\s]+(\d{3}))", std::regex::icase);
    if (auto status = capture(text, status_pattern)) {
        return "HTTP_" + *status;
    }
    return std::nullopt;
}

} // namespace

ErrorClassification S3ErrorClassifier::classify_error(const SourceError& error,
                                                      const ErrorContext& context) const {
    const auto text = to_lower(error.describe());
    const bool mentions_bucket = text.find("bucket") != std::string::npos
        || to_lower(context.resource_path()).find("bucket") != std::string::npos;

    ErrorClassification classification;
    classification.error_type = classify_type(text);
    classification.severity = severity_for(classification.error_type, mentions_bucket);
    classification.retry_strategy = classification.error_type == SourceErrorType::NetworkError
        ? RetryStrategy::Linear
        : RetryStrategy::Exponential;
    classification.retry_delay_seconds = delay_for(classification.error_type);
    classification.max_retries = max_retries_for(classification.severity);
    classification.user_friendly_message = message_for(classification.error_type, classification.severity,
                                                       context.resource_path(), error.message);
    classification.recommended_action = action_for(classification.error_type, classification.severity);
    classification.diagnostic_data = extract_diagnostics(error, context);
    return classification;
}

nlohmann::json S3ErrorClassifier::extract_diagnostics(const SourceError& error,
                                                      const ErrorContext& context) const {
    auto diagnostics = base_diagnostics(error, context);
    diagnostics["s3_specific"] = true;

    const auto described = error.describe();
    const auto lowered = to_lower(described);

    static const std::regex bucket_pattern(R"(bucket[:\s]+([a-z0-9.-]+))");
    static const std::regex region_pattern(R"(region[:\s]+([a-z0-9-]+))");
    if (auto bucket = capture(lowered, bucket_pattern)) {
        diagnostics["bucket_name"] = *bucket;
    }
    if (auto region = capture(lowered, region_pattern)) {
        diagnostics["aws_region"] = *region;
    }
    if (auto code = aws_error_code(described)) {
        diagnostics["aws_error_code"] = *code;
    }

    const auto& key = context.resource_path();
    diagnostics["key_length"] = key.size();
    diagnostics["key_depth"] = std::count(key.begin(), key.end(), '/');
    return diagnostics;
}

std::string S3ErrorClassifier::build_user_friendly_message(const SourceScanFailure& failure) const {
    return message_for(failure.error_type, failure.error_severity,
                       failure.resource_path(), failure.error_message);
}

std::string S3ErrorClassifier::build_recommended_action(const SourceScanFailure& failure) const {
    return action_for(failure.error_type, failure.error_severity);
}

} // namespace scanguard::errors
