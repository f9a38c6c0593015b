#include "scanguard/errors/cloud_classifiers.hpp"

#include "scanguard/errors/diagnostics.hpp"
#include "scanguard/errors/retry_policy.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <optional>
#include <regex>

namespace scanguard::errors {
namespace {

using Type = SourceErrorType;

SourceErrorType classify_http_vocabulary(const std::string& text) {
    if (contains_any(text, {"timeout", "timed out"})) {
        return Type::Timeout;
    }
    if (contains_any(text, {"429", "too many requests", "rate limit", "throttl"})) {
        return Type::RateLimited;
    }
    if (contains_any(text, {"401", "403", "unauthorized", "forbidden", "permission denied", "access denied"})) {
        return Type::PermissionDenied;
    }
    if (contains_any(text, {"404", "not found"})) {
        return Type::NotFound;
    }
    if (contains_any(text, {"409", "conflict"})) {
        return Type::Conflict;
    }
    if (contains_any(text, {"413", "too large"})) {
        return Type::SizeLimit;
    }
    if (contains_any(text, {"507", "quota", "insufficient storage"})) {
        return Type::QuotaExceeded;
    }
    if (contains_any(text, {"500", "502", "503", "504", "service unavailable", "internal server error"})) {
        return Type::ServerError;
    }
    if (contains_any(text, {"network", "connection", "dns"})) {
        return Type::NetworkError;
    }
    if (contains_any(text, {"json", "parse"})) {
        return Type::JsonParseError;
    }
    if (contains_any(text, {"path too long", "name too long"})) {
        return Type::PathTooLong;
    }
    if (contains_any(text, {"invalid character", "illegal character"})) {
        return Type::InvalidCharacters;
    }
    if (contains_any(text, {"not supported", "unsupported", "not implemented"})) {
        return Type::UnsupportedOperation;
    }
    return Type::Unknown;
}

// The sync root itself vanishing needs a human; anything below it may just have moved.
Severity severity_for(SourceErrorType type, const std::string& path) {
    switch (type) {
        case Type::PathTooLong:
        case Type::InvalidCharacters:
        case Type::UnsupportedOperation:
            return Severity::Critical;
        case Type::NotFound:
            return path_depth(path) <= 1 ? Severity::Critical : Severity::Medium;
        case Type::PermissionDenied:
        case Type::QuotaExceeded:
        case Type::SizeLimit:
        case Type::TooManyItems:
            return Severity::High;
        case Type::RateLimited:
        case Type::NetworkError:
            return Severity::Low;
        default:
            return Severity::Medium;
    }
}

RetryStrategy strategy_for(SourceErrorType type) {
    switch (type) {
        case Type::NetworkError: return RetryStrategy::Linear;
        case Type::QuotaExceeded: return RetryStrategy::Fixed;
        default: return RetryStrategy::Exponential;
    }
}

std::uint32_t delay_for(SourceErrorType type) {
    switch (type) {
        case Type::RateLimited: return 900;
        case Type::NetworkError: return 30;
        case Type::Timeout: return 600;
        case Type::QuotaExceeded: return 3600;
        default: return 300;
    }
}

std::optional<std::uint32_t> retry_after_seconds(const std::string& lowered) {
    static const std::regex pattern(R"(retry[- _]?after[":\s=]+(\d{1,6}))");
    std::smatch match;
    if (std::regex_search(lowered, match, pattern)) {
        return static_cast<std::uint32_t>(std::stoul(match[1].str()));
    }
    return std::nullopt;
}

std::string message_for(std::string_view provider, SourceErrorType type,
                        const std::string& path, const std::string& error_message) {
    switch (type) {
        case Type::NotFound:
            return fmt::format("{} item '{}' was not found. It may have been deleted, moved or unshared.", provider, path);
        case Type::PermissionDenied:
            return fmt::format("Access denied to {} item '{}'. The app authorization may have expired or been revoked.", provider, path);
        case Type::RateLimited:
            return fmt::format("{} is rate limiting requests. Scanning of '{}' will resume after the provider's cooldown.", provider, path);
        case Type::QuotaExceeded:
            return fmt::format("The {} account storage quota is exhausted.", provider);
        case Type::Timeout:
            return fmt::format("{} request for '{}' timed out.", provider, path);
        case Type::NetworkError:
            return fmt::format("Network error reaching {} for '{}'. Check your internet connection.", provider, path);
        case Type::ServerError:
            return fmt::format("{} reported a service error for '{}'. This is usually temporary.", provider, path);
        case Type::Conflict:
            return fmt::format("{} item '{}' changed while it was being read.", provider, path);
        case Type::TooManyItems:
            return fmt::format("{} folder '{}' holds more items than the API allows in one listing.", provider, path);
        case Type::PathTooLong:
        case Type::InvalidCharacters:
            return fmt::format("{} rejected the path '{}' as malformed.", provider, path);
        default:
            return fmt::format("Error accessing {} item '{}': {}", provider, path, error_message);
    }
}

std::string action_for(std::string_view provider, SourceErrorType type, Severity severity) {
    switch (type) {
        case Type::PermissionDenied:
            return fmt::format("Reconnect the {} account and confirm the folder is still shared with it.", provider);
        case Type::QuotaExceeded:
            return fmt::format("Free up space in {} or upgrade the storage plan.", provider);
        case Type::RateLimited:
            return "Reduce sync frequency or the number of parallel workers. Will retry automatically.";
        case Type::NotFound:
            if (severity == Severity::Critical) {
                return fmt::format("Verify the sync root still exists in {} and update the source configuration.", provider);
            }
            break;
        case Type::TooManyItems:
            return "Split the folder into smaller subfolders or exclude it from scanning.";
        case Type::NetworkError:
            return fmt::format("Check network connectivity to {}.", provider);
        default:
            break;
    }
    if (severity == Severity::Critical) {
        return "Manual intervention required. This error cannot be resolved automatically.";
    }
    return "The system will retry this operation automatically.";
}

} // namespace

SourceErrorType CloudDriveErrorClassifier::classify_type(const std::string& lowered) const {
    const auto& table = vocabulary();
    auto it = std::find_if(table.begin(), table.end(), [&lowered](const auto& entry) {
        return lowered.find(entry.first) != std::string::npos;
    });
    if (it != table.end()) {
        return it->second;
    }
    return classify_http_vocabulary(lowered);
}

ErrorClassification CloudDriveErrorClassifier::classify_error(const SourceError& error,
                                                              const ErrorContext& context) const {
    const auto lowered = to_lower(error.describe());
    const auto& path = context.resource_path();

    ErrorClassification classification;
    classification.error_type = classify_type(lowered);
    classification.severity = severity_for(classification.error_type, path);
    classification.retry_strategy = strategy_for(classification.error_type);
    classification.retry_delay_seconds = delay_for(classification.error_type);
    if (classification.error_type == Type::RateLimited) {
        if (auto hint = retry_after_seconds(lowered)) {
            classification.retry_delay_seconds =
                std::min(std::max(classification.retry_delay_seconds, *hint), kMaxRetryDelaySeconds);
        }
    }
    classification.max_retries = default_max_retries(classification.severity);
    classification.user_friendly_message = message_for(display_name(), classification.error_type, path, error.message);
    classification.recommended_action = action_for(display_name(), classification.error_type, classification.severity);
    classification.diagnostic_data = extract_diagnostics(error, context);
    return classification;
}

nlohmann::json CloudDriveErrorClassifier::extract_diagnostics(const SourceError& error,
                                                              const ErrorContext& context) const {
    auto diagnostics = base_diagnostics(error, context);
    diagnostics["provider"] = std::string(display_name());

    const auto described = error.describe();
    if (auto status = extract_http_status(error)) {
        diagnostics["http_status"] = *status;
    }
    if (auto code = extract_error_code(described)) {
        diagnostics["error_code"] = *code;
    }
    if (auto hint = retry_after_seconds(to_lower(described))) {
        diagnostics["retry_after_seconds"] = *hint;
    }
    return diagnostics;
}

std::string CloudDriveErrorClassifier::build_user_friendly_message(const SourceScanFailure& failure) const {
    return message_for(display_name(), failure.error_type, failure.resource_path(), failure.error_message);
}

std::string CloudDriveErrorClassifier::build_recommended_action(const SourceScanFailure& failure) const {
    return action_for(display_name(), failure.error_type, failure.error_severity);
}

// Dropbox API v2 error tags, e.g. "path/not_found/..", "too_many_requests/..".
const CloudDriveErrorClassifier::Vocabulary& DropboxErrorClassifier::vocabulary() const {
    static const Vocabulary table {
        {"too_many_requests", Type::RateLimited},
        {"too_many_write_operations", Type::RateLimited},
        {"not_found", Type::NotFound},
        {"insufficient_space", Type::QuotaExceeded},
        {"malformed_path", Type::InvalidCharacters},
        {"disallowed_name", Type::InvalidCharacters},
        {"invalid_access_token", Type::PermissionDenied},
        {"expired_access_token", Type::PermissionDenied},
        {"no_write_permission", Type::PermissionDenied},
        {"too_many_files", Type::TooManyItems},
    };
    return table;
}

// Drive API v3 "reason" values.
const CloudDriveErrorClassifier::Vocabulary& GDriveErrorClassifier::vocabulary() const {
    static const Vocabulary table {
        {"userratelimitexceeded", Type::RateLimited},
        {"ratelimitexceeded", Type::RateLimited},
        {"sharingratelimitexceeded", Type::RateLimited},
        {"dailylimitexceeded", Type::RateLimited},
        {"filenotfound", Type::NotFound},
        {"storagequotaexceeded", Type::QuotaExceeded},
        {"insufficientfilepermissions", Type::PermissionDenied},
        {"insufficientpermissions", Type::PermissionDenied},
        {"autherror", Type::PermissionDenied},
        {"numchildreninnonrootlimitexceeded", Type::TooManyItems},
        {"teamdrivefilelimitexceeded", Type::TooManyItems},
        {"backenderror", Type::ServerError},
    };
    return table;
}

// Microsoft Graph error codes.
const CloudDriveErrorClassifier::Vocabulary& OneDriveErrorClassifier::vocabulary() const {
    static const Vocabulary table {
        {"activitylimitreached", Type::RateLimited},
        {"throttledrequest", Type::RateLimited},
        {"itemnotfound", Type::NotFound},
        {"quotalimitreached", Type::QuotaExceeded},
        {"insufficientstorage", Type::QuotaExceeded},
        {"accessdenied", Type::PermissionDenied},
        {"unauthenticated", Type::PermissionDenied},
        {"pathistoolong", Type::PathTooLong},
        {"namealreadyexists", Type::Conflict},
        {"resourcemodified", Type::Conflict},
        {"servicenotavailable", Type::ServerError},
        {"generalexception", Type::ServerError},
        {"notsupported", Type::UnsupportedOperation},
    };
    return table;
}

} // namespace scanguard::errors
