#include "scanguard/errors/local_classifier.hpp"

#include "scanguard/errors/diagnostics.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <optional>
#include <regex>

namespace scanguard::errors {
namespace {

bool starts_with(const std::string& text, std::string_view prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

SourceErrorType classify_type(const std::string& text) {
    if (contains_any(text, {"permission denied", "access denied"})) {
        return SourceErrorType::PermissionDenied;
    }
    if (contains_any(text, {"no such file", "not found", "does not exist"})) {
        return SourceErrorType::NotFound;
    }
    if (contains_any(text, {"file name too long", "path too long", "name too long"})) {
        return SourceErrorType::PathTooLong;
    }
    if (contains_any(text, {"invalid filename", "invalid characters", "illegal character"})) {
        return SourceErrorType::InvalidCharacters;
    }
    if (contains_any(text, {"too many files", "too many entries"})) {
        return SourceErrorType::TooManyItems;
    }
    if (contains_any(text, {"directory not empty", "file exists"})) {
        return SourceErrorType::Conflict;
    }
    if (contains_any(text, {"no space", "disk full", "quota exceeded"})) {
        return SourceErrorType::QuotaExceeded;
    }
    if (contains_any(text, {"file too large", "size limit"})) {
        return SourceErrorType::SizeLimit;
    }
    if (contains_any(text, {"too many links", "link count"})) {
        return SourceErrorType::DepthLimit;
    }
    if (contains_any(text, {"device busy", "resource busy"})) {
        return SourceErrorType::Conflict;
    }
    if (contains_any(text, {"operation not supported", "function not implemented"})) {
        return SourceErrorType::UnsupportedOperation;
    }
    if (contains_any(text, {"timeout", "timed out"})) {
        return SourceErrorType::Timeout;
    }
    if (contains_any(text, {"network", "connection"})) {
        return SourceErrorType::NetworkError;
    }
    return SourceErrorType::Unknown;
}

bool is_system_path(const std::string& path) {
    return starts_with(path, "/etc/") || starts_with(path, "/sys/") || starts_with(path, "/proc/");
}

// "/", "/data", "/mnt/usb" and the like: a base directory, not an entry inside one.
bool is_root_level(const std::string& path) {
    return path.size() < 10 && std::count(path.begin(), path.end(), '/') <= 2;
}

Severity severity_for(SourceErrorType type, const std::string& path) {
    switch (type) {
        case SourceErrorType::PathTooLong:
        case SourceErrorType::InvalidCharacters:
        case SourceErrorType::UnsupportedOperation:
            return Severity::Critical;
        case SourceErrorType::PermissionDenied:
            return is_system_path(path) ? Severity::Critical : Severity::High;
        case SourceErrorType::NotFound:
            return is_root_level(path) ? Severity::Critical : Severity::Medium;
        case SourceErrorType::QuotaExceeded:
        case SourceErrorType::TooManyItems:
        case SourceErrorType::SizeLimit:
        case SourceErrorType::DepthLimit:
            return Severity::High;
        case SourceErrorType::Conflict:
        case SourceErrorType::Timeout:
        case SourceErrorType::NetworkError:
            return Severity::Medium;
        default:
            return Severity::Low;
    }
}

RetryStrategy strategy_for(SourceErrorType type) {
    switch (type) {
        case SourceErrorType::NetworkError: return RetryStrategy::Exponential;
        case SourceErrorType::Timeout:
        case SourceErrorType::Conflict: return RetryStrategy::Linear;
        default: return RetryStrategy::Fixed;
    }
}

std::uint32_t delay_for(SourceErrorType type) {
    switch (type) {
        case SourceErrorType::NetworkError: return 60;
        case SourceErrorType::Timeout: return 30;
        case SourceErrorType::Conflict: return 10;
        case SourceErrorType::QuotaExceeded: return 300;
        default: return 5;
    }
}

std::optional<std::string> filesystem_kind(const std::string& path) {
    if (starts_with(path, "/proc/")) return "procfs";
    if (starts_with(path, "/sys/")) return "sysfs";
    if (starts_with(path, "/dev/")) return "devfs";
    if (starts_with(path, "/tmp/") || starts_with(path, "/var/tmp/")) return "tmpfs";
    if (path.size() >= 3 && path[1] == ':') return "ntfs";
    if (starts_with(path, "/")) return "unix";
    return std::nullopt;
}

std::optional<std::string> os_error_code(const std::string& text) {
    static const std::regex os_pattern(R"(os error (\d+))", std::regex::icase);
    static const std::regex errno_pattern(R"(errno[:\s]+(\d+))", std::regex::icase);
    static const std::regex win_pattern(R"(error[:\s]+(\d+))", std::regex::icase);

    std::smatch match;
    if (std::regex_search(text, match, os_pattern)) {
        return "OS_" + match[1].str();
    }
    if (std::regex_search(text, match, errno_pattern)) {
        return "ERRNO_" + match[1].str();
    }
    if (std::regex_search(text, match, win_pattern)) {
        return "WIN_" + match[1].str();
    }
    return std::nullopt;
}

std::string message_for(SourceErrorType type, const std::string& path, const std::string& error_message) {
    switch (type) {
        case SourceErrorType::NotFound:
            return fmt::format("Local path '{}' does not exist. It may have been deleted or moved.", path);
        case SourceErrorType::PermissionDenied:
            return fmt::format("Access denied to local path '{}'. Check file/directory permissions.", path);
        case SourceErrorType::PathTooLong:
            return fmt::format("Local path '{}' exceeds filesystem limits. Consider shortening the path.", path);
        case SourceErrorType::InvalidCharacters:
            return fmt::format("Local path '{}' contains invalid characters for this filesystem.", path);
        case SourceErrorType::TooManyItems:
            return fmt::format("Directory '{}' contains too many files for efficient processing.", path);
        case SourceErrorType::QuotaExceeded:
            return fmt::format("Disk quota exceeded for path '{}'. Free up space or increase quota.", path);
        case SourceErrorType::SizeLimit:
            return fmt::format("File '{}' exceeds size limits for processing.", path);
        case SourceErrorType::Conflict:
            return fmt::format("File or directory conflict at '{}'. Resource may be in use.", path);
        case SourceErrorType::UnsupportedOperation:
            return fmt::format("Operation not supported on filesystem for path '{}'.", path);
        case SourceErrorType::Timeout:
            return fmt::format("Filesystem operation timed out for path '{}'. This may indicate slow storage.", path);
        case SourceErrorType::NetworkError:
            return fmt::format("Network filesystem error for path '{}'. Check network connectivity.", path);
        default:
            return fmt::format("Error accessing local path '{}': {}", path, error_message);
    }
}

std::string action_for(SourceErrorType type, Severity severity) {
    switch (type) {
        case SourceErrorType::NotFound:
            if (severity == Severity::Critical) {
                return "Verify the base directory path exists and is accessible.";
            }
            break;
        case SourceErrorType::PermissionDenied:
            return "Check file/directory permissions and user access rights.";
        case SourceErrorType::PathTooLong:
            return "Shorten the path by reorganizing directory structure or using shorter names.";
        case SourceErrorType::InvalidCharacters:
            return "Rename files/directories to remove invalid characters for this filesystem.";
        case SourceErrorType::TooManyItems:
            return "Consider organizing files into subdirectories or excluding this directory from processing.";
        case SourceErrorType::QuotaExceeded:
            return "Free up disk space or contact administrator to increase quota limits.";
        case SourceErrorType::SizeLimit:
            return "Consider excluding large files from processing or splitting them if possible.";
        case SourceErrorType::UnsupportedOperation:
            return "This filesystem type does not support the required operation.";
        case SourceErrorType::NetworkError:
            return "Check network connection for network filesystem mounts.";
        default:
            break;
    }
    if (severity == Severity::Critical) {
        return "Manual intervention required. This filesystem error cannot be resolved automatically.";
    }
    return "Filesystem operations will be retried automatically after a brief delay.";
}

} // namespace

ErrorClassification LocalErrorClassifier::classify_error(const SourceError& error,
                                                         const ErrorContext& context) const {
    const auto& path = context.resource_path();

    ErrorClassification classification;
    classification.error_type = classify_type(to_lower(error.describe()));
    classification.severity = severity_for(classification.error_type, path);
    classification.retry_strategy = strategy_for(classification.error_type);
    classification.retry_delay_seconds = delay_for(classification.error_type);
    classification.max_retries = default_max_retries(classification.severity);
    classification.user_friendly_message = message_for(classification.error_type, path, error.message);
    classification.recommended_action = action_for(classification.error_type, classification.severity);
    classification.diagnostic_data = extract_diagnostics(error, context);
    return classification;
}

nlohmann::json LocalErrorClassifier::extract_diagnostics(const SourceError& error,
                                                         const ErrorContext& context) const {
    auto diagnostics = base_diagnostics(error, context);
    diagnostics["local_filesystem"] = true;

    if (auto kind = filesystem_kind(context.resource_path())) {
        diagnostics["filesystem_type"] = *kind;
    }
    if (auto code = os_error_code(error.describe())) {
        diagnostics["os_error_code"] = *code;
    }
    return diagnostics;
}

std::string LocalErrorClassifier::build_user_friendly_message(const SourceScanFailure& failure) const {
    return message_for(failure.error_type, failure.resource_path(), failure.error_message);
}

std::string LocalErrorClassifier::build_recommended_action(const SourceScanFailure& failure) const {
    return action_for(failure.error_type, failure.error_severity);
}

} // namespace scanguard::errors
