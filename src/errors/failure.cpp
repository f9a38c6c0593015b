#include "scanguard/errors/failure.hpp"

namespace scanguard::errors {
namespace {

using json = nlohmann::json;

template<typename T>
void put_optional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

void put_time(json& j, const char* key, const std::optional<TimePoint>& value) {
    if (value) {
        j[key] = to_epoch_ms(*value);
    } else {
        j[key] = nullptr;
    }
}

template<typename T>
std::optional<T> get_optional(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

std::optional<TimePoint> get_time(const json& j, const char* key) {
    if (auto ms = get_optional<std::int64_t>(j, key)) {
        return from_epoch_ms(*ms);
    }
    return std::nullopt;
}

} // namespace

std::uint32_t path_depth(const std::string& path) noexcept {
    std::uint32_t depth = 0;
    bool in_segment = false;
    for (char c : path) {
        if (c == '/' || c == '\\') {
            in_segment = false;
        } else if (!in_segment) {
            in_segment = true;
            ++depth;
        }
    }
    return depth;
}

json failure_to_json(const SourceScanFailure& failure) {
    json j;
    j["id"] = failure.id;
    j["user_id"] = failure.key.user_id;
    j["source_type"] = to_string(failure.key.source_type);
    j["resource_path"] = failure.key.resource_path;
    put_optional(j, "source_id", failure.source_id);
    j["error_type"] = to_string(failure.error_type);
    j["error_severity"] = to_string(failure.error_severity);
    j["failure_count"] = failure.failure_count;
    j["consecutive_failures"] = failure.consecutive_failures;
    j["first_failure_at"] = to_epoch_ms(failure.first_failure_at);
    j["last_failure_at"] = to_epoch_ms(failure.last_failure_at);
    put_time(j, "last_retry_at", failure.last_retry_at);
    put_time(j, "next_retry_at", failure.next_retry_at);
    j["error_message"] = failure.error_message;
    put_optional(j, "error_code", failure.error_code);
    put_optional(j, "http_status_code", failure.http_status_code);
    put_optional(j, "response_time_ms", failure.response_time_ms);
    put_optional(j, "response_size_bytes", failure.response_size_bytes);
    j["resource_depth"] = failure.resource_depth;
    put_optional(j, "estimated_item_count", failure.estimated_item_count);
    j["diagnostic_data"] = failure.diagnostic_data;
    j["user_excluded"] = failure.user_excluded;
    put_optional(j, "user_notes", failure.user_notes);
    j["retry_strategy"] = to_string(failure.retry_strategy);
    j["max_retries"] = failure.max_retries;
    j["retry_delay_seconds"] = failure.retry_delay_seconds;
    j["resolved"] = failure.resolved;
    put_time(j, "resolved_at", failure.resolved_at);
    put_optional(j, "resolution_method", failure.resolution_method);
    j["created_at"] = to_epoch_ms(failure.created_at);
    j["updated_at"] = to_epoch_ms(failure.updated_at);
    return j;
}

Result<SourceScanFailure> failure_from_json(const json& j) {
    if (!j.is_object()) {
        return Err<SourceScanFailure>(std::string("failure record is not an object"));
    }

    try {
        SourceScanFailure failure;
        failure.id = j.at("id").get<std::uint64_t>();
        failure.key.user_id = j.at("user_id").get<std::string>();
        failure.key.resource_path = j.at("resource_path").get<std::string>();

        const auto source_type = parse_source_type(j.at("source_type").get<std::string>());
        const auto error_type = parse_error_type(j.at("error_type").get<std::string>());
        const auto severity = parse_severity(j.at("error_severity").get<std::string>());
        const auto strategy = parse_retry_strategy(j.value("retry_strategy", std::string("exponential")));
        if (!source_type || !error_type || !severity || !strategy) {
            return Err<SourceScanFailure>("unrecognized enum value in failure record " + std::to_string(failure.id));
        }
        failure.key.source_type = *source_type;
        failure.error_type = *error_type;
        failure.error_severity = *severity;
        failure.retry_strategy = *strategy;

        failure.source_id = get_optional<std::string>(j, "source_id");
        failure.failure_count = j.value("failure_count", 1u);
        failure.consecutive_failures = j.value("consecutive_failures", 0u);
        failure.first_failure_at = from_epoch_ms(j.at("first_failure_at").get<std::int64_t>());
        failure.last_failure_at = from_epoch_ms(j.at("last_failure_at").get<std::int64_t>());
        failure.last_retry_at = get_time(j, "last_retry_at");
        failure.next_retry_at = get_time(j, "next_retry_at");
        failure.error_message = j.value("error_message", std::string());
        failure.error_code = get_optional<std::string>(j, "error_code");
        failure.http_status_code = get_optional<int>(j, "http_status_code");
        failure.response_time_ms = get_optional<std::uint64_t>(j, "response_time_ms");
        failure.response_size_bytes = get_optional<std::uint64_t>(j, "response_size_bytes");
        failure.resource_depth = j.value("resource_depth", path_depth(failure.key.resource_path));
        failure.estimated_item_count = get_optional<std::uint64_t>(j, "estimated_item_count");
        failure.diagnostic_data = j.value("diagnostic_data", json::object());
        failure.user_excluded = j.value("user_excluded", false);
        failure.user_notes = get_optional<std::string>(j, "user_notes");
        failure.max_retries = j.value("max_retries", 5u);
        failure.retry_delay_seconds = j.value("retry_delay_seconds", 300u);
        failure.resolved = j.value("resolved", false);
        failure.resolved_at = get_time(j, "resolved_at");
        failure.resolution_method = get_optional<std::string>(j, "resolution_method");
        failure.created_at = get_time(j, "created_at").value_or(failure.first_failure_at);
        failure.updated_at = get_time(j, "updated_at").value_or(failure.last_failure_at);
        return Ok(std::move(failure));
    } catch (const json::exception& e) {
        return Err<SourceScanFailure>(std::string("malformed failure record: ") + e.what());
    }
}

} // namespace scanguard::errors
