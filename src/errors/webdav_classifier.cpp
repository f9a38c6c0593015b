#include "scanguard/errors/webdav_classifier.hpp"

#include "scanguard/errors/diagnostics.hpp"

#include <spdlog/fmt/fmt.h>

namespace scanguard::errors {
namespace {

SourceErrorType classify_type(const std::string& text) {
    if (contains_any(text, {"timeout", "timed out"})) {
        return SourceErrorType::Timeout;
    }
    if (contains_any(text, {"name too long", "path too long"})) {
        return SourceErrorType::PathTooLong;
    }
    if (contains_any(text, {"permission denied", "forbidden", "401", "403"})) {
        return SourceErrorType::PermissionDenied;
    }
    if (contains_any(text, {"invalid character", "illegal character"})) {
        return SourceErrorType::InvalidCharacters;
    }
    if (contains_any(text, {"connection refused", "network", "dns"})) {
        return SourceErrorType::NetworkError;
    }
    if (contains_any(text, {"500", "502", "503", "504"})) {
        return SourceErrorType::ServerError;
    }
    if (contains_any(text, {"xml", "parse", "malformed"})) {
        return SourceErrorType::XmlParseError;
    }
    if (contains_any(text, {"too many", "limit exceeded"})) {
        return SourceErrorType::TooManyItems;
    }
    if (contains_any(text, {"depth", "nested"})) {
        return SourceErrorType::DepthLimit;
    }
    if (contains_any(text, {"size", "too large"})) {
        return SourceErrorType::SizeLimit;
    }
    if (contains_any(text, {"404", "not found"})) {
        return SourceErrorType::NotFound;
    }
    return SourceErrorType::Unknown;
}

Severity severity_for(SourceErrorType type) {
    switch (type) {
        case SourceErrorType::PathTooLong:
        case SourceErrorType::InvalidCharacters:
        case SourceErrorType::NotFound:
            return Severity::Critical;
        case SourceErrorType::PermissionDenied:
        case SourceErrorType::XmlParseError:
        case SourceErrorType::TooManyItems:
        case SourceErrorType::DepthLimit:
        case SourceErrorType::SizeLimit:
            return Severity::High;
        case SourceErrorType::NetworkError:
            return Severity::Low;
        default:
            return Severity::Medium;
    }
}

std::uint32_t delay_for(SourceErrorType type) {
    switch (type) {
        case SourceErrorType::NetworkError: return 60;
        case SourceErrorType::Timeout: return 900;
        case SourceErrorType::ServerError: return 300;
        case SourceErrorType::XmlParseError: return 600;
        default: return 300;
    }
}

std::string message_for(SourceErrorType type, const std::string& path) {
    switch (type) {
        case SourceErrorType::Timeout:
            return fmt::format("The WebDAV directory '{}' is taking too long to scan. This might be due to a large number of files or slow server response.", path);
        case SourceErrorType::PathTooLong:
            return fmt::format("The WebDAV path '{}' exceeds system limits. Consider shortening directory names.", path);
        case SourceErrorType::PermissionDenied:
            return fmt::format("Access denied to WebDAV directory '{}'. Please check your WebDAV permissions.", path);
        case SourceErrorType::InvalidCharacters:
            return fmt::format("The WebDAV path '{}' contains characters the server does not accept.", path);
        case SourceErrorType::TooManyItems:
            return fmt::format("WebDAV directory '{}' contains too many items. Consider organizing into subdirectories.", path);
        case SourceErrorType::NotFound:
            return fmt::format("WebDAV directory '{}' was not found on the server. It may have been deleted or moved.", path);
        case SourceErrorType::XmlParseError:
            return fmt::format("Malformed XML response from WebDAV server for directory '{}'. Server may be incompatible.", path);
        case SourceErrorType::NetworkError:
            return fmt::format("Network error accessing WebDAV directory '{}'. Check your connection.", path);
        default:
            return fmt::format("Failed to scan WebDAV directory '{}'. Error will be retried automatically.", path);
    }
}

std::string action_for(SourceErrorType type, Severity severity) {
    switch (type) {
        case SourceErrorType::PathTooLong:
            return "Shorten directory names or reorganize the directory structure.";
        case SourceErrorType::InvalidCharacters:
            return "Remove or rename directories with invalid characters.";
        case SourceErrorType::PermissionDenied:
            return "Check WebDAV server permissions and authentication credentials.";
        case SourceErrorType::TooManyItems:
            return "Split large directories into smaller subdirectories.";
        case SourceErrorType::XmlParseError:
            return "Check WebDAV server compatibility or contact server administrator.";
        case SourceErrorType::NotFound:
            return "Verify the directory still exists on the server or remove it from the sync folders.";
        case SourceErrorType::NetworkError:
            return "Check network connectivity to WebDAV server.";
        case SourceErrorType::Timeout:
            if (severity >= Severity::High) {
                return "Consider excluding this directory from scanning due to repeated timeouts.";
            }
            break;
        default:
            break;
    }
    if (severity == Severity::Critical) {
        return "Manual intervention required. This error cannot be resolved automatically.";
    }
    return "The system will retry this operation automatically with increasing delays.";
}

} // namespace

ErrorClassification WebDAVErrorClassifier::classify_error(const SourceError& error,
                                                          const ErrorContext& context) const {
    const auto text = to_lower(error.describe());

    ErrorClassification classification;
    classification.error_type = classify_type(text);
    classification.severity = severity_for(classification.error_type);
    classification.retry_strategy = classification.error_type == SourceErrorType::XmlParseError
        ? RetryStrategy::Linear
        : RetryStrategy::Exponential;
    classification.retry_delay_seconds = delay_for(classification.error_type);
    classification.max_retries = default_max_retries(classification.severity);
    classification.user_friendly_message = message_for(classification.error_type, context.resource_path());
    classification.recommended_action = action_for(classification.error_type, classification.severity);
    classification.diagnostic_data = extract_diagnostics(error, context);
    return classification;
}

nlohmann::json WebDAVErrorClassifier::extract_diagnostics(const SourceError& error,
                                                          const ErrorContext& context) const {
    auto diagnostics = base_diagnostics(error, context);
    diagnostics["webdav_specific"] = true;

    const auto text = error.describe();
    if (auto status = extract_http_status(error)) {
        diagnostics["http_status"] = *status;
    }
    if (auto code = extract_error_code(text)) {
        diagnostics["error_code"] = *code;
    }
    if (auto items = estimate_item_count(text)) {
        diagnostics["estimated_item_count"] = *items;
    }
    return diagnostics;
}

std::string WebDAVErrorClassifier::build_user_friendly_message(const SourceScanFailure& failure) const {
    return message_for(failure.error_type, failure.resource_path());
}

std::string WebDAVErrorClassifier::build_recommended_action(const SourceScanFailure& failure) const {
    return action_for(failure.error_type, failure.error_severity);
}

} // namespace scanguard::errors
