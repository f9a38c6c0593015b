#include "scanguard/errors/types.hpp"

#include "scanguard/errors/diagnostics.hpp"

#include <string>

namespace scanguard::errors {
namespace {

template<typename Enum>
std::optional<Enum> parse_enum(std::string_view text, const std::vector<Enum>& values) {
    const auto lowered = to_lower(text);
    for (auto value : values) {
        if (lowered == to_string(value)) {
            return value;
        }
    }
    return std::nullopt;
}

} // namespace

const char* to_string(SourceType type) noexcept {
    switch (type) {
        case SourceType::WebDAV: return "webdav";
        case SourceType::S3: return "s3";
        case SourceType::Local: return "local";
        case SourceType::Dropbox: return "dropbox";
        case SourceType::GDrive: return "gdrive";
        case SourceType::OneDrive: return "onedrive";
    }
    return "unknown";
}

const char* to_string(SourceErrorType type) noexcept {
    switch (type) {
        case SourceErrorType::Timeout: return "timeout";
        case SourceErrorType::PermissionDenied: return "permission_denied";
        case SourceErrorType::NetworkError: return "network_error";
        case SourceErrorType::ServerError: return "server_error";
        case SourceErrorType::PathTooLong: return "path_too_long";
        case SourceErrorType::InvalidCharacters: return "invalid_characters";
        case SourceErrorType::TooManyItems: return "too_many_items";
        case SourceErrorType::DepthLimit: return "depth_limit";
        case SourceErrorType::SizeLimit: return "size_limit";
        case SourceErrorType::XmlParseError: return "xml_parse_error";
        case SourceErrorType::JsonParseError: return "json_parse_error";
        case SourceErrorType::QuotaExceeded: return "quota_exceeded";
        case SourceErrorType::RateLimited: return "rate_limited";
        case SourceErrorType::NotFound: return "not_found";
        case SourceErrorType::Conflict: return "conflict";
        case SourceErrorType::UnsupportedOperation: return "unsupported_operation";
        case SourceErrorType::Unknown: return "unknown";
    }
    return "unknown";
}

const char* to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::Low: return "low";
        case Severity::Medium: return "medium";
        case Severity::High: return "high";
        case Severity::Critical: return "critical";
    }
    return "medium";
}

const char* to_string(RetryStrategy strategy) noexcept {
    switch (strategy) {
        case RetryStrategy::Exponential: return "exponential";
        case RetryStrategy::Linear: return "linear";
        case RetryStrategy::Fixed: return "fixed";
    }
    return "exponential";
}

const std::vector<SourceType>& all_source_types() {
    static const std::vector<SourceType> values {
        SourceType::WebDAV, SourceType::S3, SourceType::Local,
        SourceType::Dropbox, SourceType::GDrive, SourceType::OneDrive,
    };
    return values;
}

const std::vector<SourceErrorType>& all_error_types() {
    static const std::vector<SourceErrorType> values {
        SourceErrorType::Timeout, SourceErrorType::PermissionDenied,
        SourceErrorType::NetworkError, SourceErrorType::ServerError,
        SourceErrorType::PathTooLong, SourceErrorType::InvalidCharacters,
        SourceErrorType::TooManyItems, SourceErrorType::DepthLimit,
        SourceErrorType::SizeLimit, SourceErrorType::XmlParseError,
        SourceErrorType::JsonParseError, SourceErrorType::QuotaExceeded,
        SourceErrorType::RateLimited, SourceErrorType::NotFound,
        SourceErrorType::Conflict, SourceErrorType::UnsupportedOperation,
        SourceErrorType::Unknown,
    };
    return values;
}

std::optional<SourceType> parse_source_type(std::string_view text) {
    return parse_enum(text, all_source_types());
}

std::optional<SourceErrorType> parse_error_type(std::string_view text) {
    return parse_enum(text, all_error_types());
}

std::optional<Severity> parse_severity(std::string_view text) {
    static const std::vector<Severity> values {
        Severity::Low, Severity::Medium, Severity::High, Severity::Critical,
    };
    return parse_enum(text, values);
}

std::optional<RetryStrategy> parse_retry_strategy(std::string_view text) {
    static const std::vector<RetryStrategy> values {
        RetryStrategy::Exponential, RetryStrategy::Linear, RetryStrategy::Fixed,
    };
    return parse_enum(text, values);
}

SourceError SourceError::from_http(int status, std::string msg) {
    SourceError error(std::move(msg));
    error.http_status = status;
    return error;
}

SourceError SourceError::from_error_code(const std::error_code& ec, const std::string& path) {
    SourceError error(ec.message() + ": " + path);
    error.os_error = ec.value();
    return error;
}

std::string SourceError::describe() const {
    std::string text = message;
    if (http_status) {
        const auto status = std::to_string(*http_status);
        if (text.find(status) == std::string::npos) {
            text += " (HTTP " + status + ")";
        }
    }
    if (os_error) {
        const auto marker = "os error " + std::to_string(*os_error);
        if (text.find(marker) == std::string::npos) {
            text += " (" + marker + ")";
        }
    }
    return text;
}

bool ErrorClassification::operator==(const ErrorClassification& other) const {
    return error_type == other.error_type
        && severity == other.severity
        && retry_strategy == other.retry_strategy
        && retry_delay_seconds == other.retry_delay_seconds
        && max_retries == other.max_retries
        && user_friendly_message == other.user_friendly_message
        && recommended_action == other.recommended_action
        && diagnostic_data == other.diagnostic_data;
}

} // namespace scanguard::errors
