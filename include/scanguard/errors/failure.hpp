#pragma once

#include "scanguard/core/result.hpp"
#include "scanguard/core/time.hpp"
#include "scanguard/errors/types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace scanguard::errors {

/**
 * @brief Identity of a durable failure record
 */
struct FailureKey {
    std::string user_id;
    SourceType source_type = SourceType::WebDAV;
    std::string resource_path;

    bool operator==(const FailureKey& other) const {
        return user_id == other.user_id
            && source_type == other.source_type
            && resource_path == other.resource_path;
    }
    bool operator!=(const FailureKey& other) const { return !(*this == other); }
};

struct FailureKeyHash {
    std::size_t operator()(const FailureKey& key) const noexcept {
        std::size_t seed = std::hash<std::string>{}(key.user_id);
        seed ^= std::hash<int>{}(static_cast<int>(key.source_type)) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        seed ^= std::hash<std::string>{}(key.resource_path) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        return seed;
    }
};

/**
 * @brief Input to FailureStore::record_failure (one classified failure)
 */
struct CreateSourceScanFailure {
    FailureKey key;
    std::optional<std::string> source_id;
    SourceErrorType error_type = SourceErrorType::Unknown;
    Severity error_severity = Severity::Medium;
    std::string error_message;
    std::optional<std::string> error_code;
    std::optional<int> http_status_code;
    std::optional<std::uint64_t> response_time_ms;
    std::optional<std::uint64_t> response_size_bytes;
    std::optional<std::uint64_t> estimated_item_count;
    nlohmann::json diagnostic_data = nlohmann::json::object();
    RetryStrategy retry_strategy = RetryStrategy::Exponential;
    std::uint32_t retry_delay_seconds = 300;
    std::uint32_t max_retries = 5;
};

/**
 * @brief Durable failure record for one (user, source type, path)
 *
 * next_retry_at only means something while the record is unresolved and
 * not excluded by the user.
 */
struct SourceScanFailure {
    std::uint64_t id = 0;
    FailureKey key;
    std::optional<std::string> source_id;

    SourceErrorType error_type = SourceErrorType::Unknown;
    Severity error_severity = Severity::Medium;
    std::uint32_t failure_count = 0;
    std::uint32_t consecutive_failures = 0;

    TimePoint first_failure_at{};
    TimePoint last_failure_at{};
    std::optional<TimePoint> last_retry_at;
    std::optional<TimePoint> next_retry_at;

    std::string error_message;
    std::optional<std::string> error_code;
    std::optional<int> http_status_code;
    std::optional<std::uint64_t> response_time_ms;
    std::optional<std::uint64_t> response_size_bytes;
    std::uint32_t resource_depth = 0;
    std::optional<std::uint64_t> estimated_item_count;
    nlohmann::json diagnostic_data = nlohmann::json::object();

    bool user_excluded = false;
    std::optional<std::string> user_notes;

    RetryStrategy retry_strategy = RetryStrategy::Exponential;
    std::uint32_t max_retries = 5;
    std::uint32_t retry_delay_seconds = 300;

    bool resolved = false;
    std::optional<TimePoint> resolved_at;
    std::optional<std::string> resolution_method;

    TimePoint created_at{};
    TimePoint updated_at{};

    [[nodiscard]] const std::string& resource_path() const noexcept { return key.resource_path; }
};

/// Number of path segments below the root ("/a/b/c" -> 3)
[[nodiscard]] std::uint32_t path_depth(const std::string& path) noexcept;

[[nodiscard]] nlohmann::json failure_to_json(const SourceScanFailure& failure);
[[nodiscard]] Result<SourceScanFailure> failure_from_json(const nlohmann::json& j);

} // namespace scanguard::errors
