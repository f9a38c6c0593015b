#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace scanguard::errors {

enum class SourceType {
    WebDAV,
    S3,
    Local,
    Dropbox,
    GDrive,
    OneDrive
};

enum class SourceErrorType {
    Timeout,
    PermissionDenied,
    NetworkError,
    ServerError,
    PathTooLong,
    InvalidCharacters,
    TooManyItems,
    DepthLimit,
    SizeLimit,
    XmlParseError,
    JsonParseError,
    QuotaExceeded,
    RateLimited,
    NotFound,
    Conflict,
    UnsupportedOperation,
    Unknown
};

/// Ordered: comparisons rank Low < Medium < High < Critical
enum class Severity {
    Low,
    Medium,
    High,
    Critical
};

enum class RetryStrategy {
    Exponential,
    Linear,
    Fixed
};

// Persisted string forms ("webdav", "permission_denied", "critical", ...)
[[nodiscard]] const char* to_string(SourceType type) noexcept;
[[nodiscard]] const char* to_string(SourceErrorType type) noexcept;
[[nodiscard]] const char* to_string(Severity severity) noexcept;
[[nodiscard]] const char* to_string(RetryStrategy strategy) noexcept;

[[nodiscard]] std::optional<SourceType> parse_source_type(std::string_view text);
[[nodiscard]] std::optional<SourceErrorType> parse_error_type(std::string_view text);
[[nodiscard]] std::optional<Severity> parse_severity(std::string_view text);
[[nodiscard]] std::optional<RetryStrategy> parse_retry_strategy(std::string_view text);

[[nodiscard]] const std::vector<SourceType>& all_source_types();
[[nodiscard]] const std::vector<SourceErrorType>& all_error_types();

/**
 * @brief Raw failure reported by a remote I/O layer
 *
 * Classifiers only look at the text and the optional status codes, so any
 * client (HTTP, SDK, filesystem) can report through this one shape.
 */
struct SourceError {
    std::string message;
    std::optional<int> http_status;
    std::optional<int> os_error;

    SourceError() = default;
    explicit SourceError(std::string msg) : message(std::move(msg)) {}

    [[nodiscard]] static SourceError from_http(int status, std::string msg);
    [[nodiscard]] static SourceError from_error_code(const std::error_code& ec, const std::string& path);

    /// Message with status codes appended when the text does not already carry them
    [[nodiscard]] std::string describe() const;
};

/**
 * @brief Normalized outcome of classifying one failure
 */
struct ErrorClassification {
    SourceErrorType error_type = SourceErrorType::Unknown;
    Severity severity = Severity::Medium;
    RetryStrategy retry_strategy = RetryStrategy::Exponential;
    std::uint32_t retry_delay_seconds = 300;
    std::uint32_t max_retries = 5;
    std::string user_friendly_message;
    std::string recommended_action;
    nlohmann::json diagnostic_data = nlohmann::json::object();

    bool operator==(const ErrorClassification& other) const;
    bool operator!=(const ErrorClassification& other) const { return !(*this == other); }
};

} // namespace scanguard::errors
