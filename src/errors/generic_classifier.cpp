#include "scanguard/errors/generic_classifier.hpp"

#include "scanguard/errors/diagnostics.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>

namespace scanguard::errors {
namespace {

SourceErrorType classify_type(const std::string& text) {
    if (contains_any(text, {"timeout", "timed out"})) {
        return SourceErrorType::Timeout;
    }
    if (contains_any(text, {"permission denied", "forbidden", "401", "403"})) {
        return SourceErrorType::PermissionDenied;
    }
    if (contains_any(text, {"not found", "404"})) {
        return SourceErrorType::NotFound;
    }
    if (contains_any(text, {"connection refused", "network", "dns"})) {
        return SourceErrorType::NetworkError;
    }
    if (contains_any(text, {"500", "502", "503", "504"})) {
        return SourceErrorType::ServerError;
    }
    if (contains_any(text, {"too many", "rate limit"})) {
        return SourceErrorType::RateLimited;
    }
    return SourceErrorType::Unknown;
}

Severity severity_for(SourceErrorType type) {
    switch (type) {
        case SourceErrorType::NotFound: return Severity::Critical;
        case SourceErrorType::PermissionDenied: return Severity::High;
        case SourceErrorType::NetworkError:
        case SourceErrorType::RateLimited: return Severity::Low;
        default: return Severity::Medium;
    }
}

std::uint32_t delay_for(SourceErrorType type) {
    switch (type) {
        case SourceErrorType::RateLimited: return 600;
        case SourceErrorType::NetworkError: return 60;
        case SourceErrorType::Timeout: return 900;
        default: return 300;
    }
}

std::string base_message(SourceType source, SourceErrorType type,
                         const std::string& path, const std::string& error_message) {
    switch (type) {
        case SourceErrorType::Timeout:
            return fmt::format("The {} resource '{}' is taking too long to access. This might be due to a large size or slow connection.",
                               to_string(source), path);
        case SourceErrorType::PermissionDenied:
            return fmt::format("Access denied to {} resource '{}'. Please check your permissions.", to_string(source), path);
        case SourceErrorType::NotFound:
            return fmt::format("{} resource '{}' was not found. It may have been deleted or moved.", to_string(source), path);
        case SourceErrorType::NetworkError:
            return fmt::format("Network error accessing {} resource '{}'. Will retry automatically.", to_string(source), path);
        default:
            return fmt::format("Error accessing {} resource '{}': {}", to_string(source), path,
                               error_message.empty() ? std::string("Unknown error") : error_message);
    }
}

std::string action_for(SourceErrorType type, Severity severity, std::uint32_t failure_count) {
    switch (type) {
        case SourceErrorType::NotFound:
            return "Resource not found. It may have been deleted or moved.";
        case SourceErrorType::PermissionDenied:
            return "Access denied. Check permissions for this resource.";
        case SourceErrorType::Timeout:
            if (failure_count > 3) {
                return "Repeated timeouts. Resource may be too large or source is slow.";
            }
            break;
        case SourceErrorType::NetworkError:
            return "Network error. Will retry automatically.";
        case SourceErrorType::RateLimited:
            return "Rate limited. Will retry with longer delays.";
        default:
            break;
    }
    if (severity == Severity::Critical) {
        return "Critical error that requires manual intervention.";
    }
    return "Temporary error. Will retry automatically.";
}

} // namespace

ErrorClassification GenericErrorClassifier::classify_error(const SourceError& error,
                                                           const ErrorContext& context) const {
    ErrorClassification classification;
    classification.error_type = classify_type(to_lower(error.describe()));
    classification.severity = severity_for(classification.error_type);
    classification.retry_strategy = classification.error_type == SourceErrorType::RateLimited
        ? RetryStrategy::Linear
        : RetryStrategy::Exponential;
    classification.retry_delay_seconds = delay_for(classification.error_type);
    classification.max_retries = default_max_retries(classification.severity);
    classification.user_friendly_message =
        base_message(source_type_, classification.error_type, context.resource_path(), error.message);
    classification.recommended_action = action_for(classification.error_type, classification.severity, 1);
    classification.diagnostic_data = extract_diagnostics(error, context);
    return classification;
}

nlohmann::json GenericErrorClassifier::extract_diagnostics(const SourceError& error,
                                                           const ErrorContext& context) const {
    auto diagnostics = base_diagnostics(error, context);
    if (auto status = extract_http_status(error)) {
        diagnostics["http_status"] = *status;
    }
    return diagnostics;
}

std::string GenericErrorClassifier::build_user_friendly_message(const SourceScanFailure& failure) const {
    return build_user_friendly_message_at(failure, Clock::now());
}

std::string GenericErrorClassifier::build_user_friendly_message_at(const SourceScanFailure& failure,
                                                                   TimePoint now) const {
    auto message = base_message(failure.key.source_type, failure.error_type,
                                failure.resource_path(), failure.error_message);

    if (failure.consecutive_failures > 1) {
        message += fmt::format(" This has failed {} times.", failure.consecutive_failures);
    }

    if (failure.next_retry_at && !failure.user_excluded && !failure.resolved) {
        const auto remaining = std::chrono::duration_cast<std::chrono::seconds>(*failure.next_retry_at - now);
        if (remaining.count() > 0) {
            const auto minutes = std::max<long long>(
                std::chrono::duration_cast<std::chrono::minutes>(remaining).count(), 1);
            message += fmt::format(" Will retry in {} minutes.", minutes);
        } else {
            message += " Ready for retry.";
        }
    }
    return message;
}

std::string GenericErrorClassifier::build_recommended_action(const SourceScanFailure& failure) const {
    return action_for(failure.error_type, failure.error_severity, failure.failure_count);
}

} // namespace scanguard::errors
