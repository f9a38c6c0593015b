#pragma once

#include "scanguard/core/time.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace scanguard::errors {

/**
 * @brief Per-operation input to classification
 *
 * Built with chained with_* calls and passed by value; never persisted
 * directly, only folded into the diagnostic bundle.
 *
 * @code
 * auto context = ErrorContext("/remote/docs")
 *     .with_operation("list_directory")
 *     .with_response_time(std::chrono::milliseconds(4200))
 *     .with_server_info("nextcloud", "27.1");
 * @endcode
 */
class ErrorContext {
public:
    explicit ErrorContext(std::string resource_path, TimePoint occurred_at = Clock::now())
        : resource_path_(std::move(resource_path)), occurred_at_(occurred_at) {}

    ErrorContext with_source_id(std::string source_id) const {
        auto copy = *this;
        copy.source_id_ = std::move(source_id);
        return copy;
    }

    ErrorContext with_operation(std::string operation) const {
        auto copy = *this;
        copy.operation_ = std::move(operation);
        return copy;
    }

    ErrorContext with_response_time(std::chrono::milliseconds response_time) const {
        auto copy = *this;
        copy.response_time_ = response_time;
        return copy;
    }

    ErrorContext with_response_size(std::uint64_t bytes) const {
        auto copy = *this;
        copy.response_size_ = bytes;
        return copy;
    }

    ErrorContext with_server_info(std::string server_type, std::optional<std::string> server_version = std::nullopt) const {
        auto copy = *this;
        copy.server_type_ = std::move(server_type);
        copy.server_version_ = std::move(server_version);
        return copy;
    }

    ErrorContext with_context(const std::string& key, nlohmann::json value) const {
        auto copy = *this;
        copy.additional_context_[key] = std::move(value);
        return copy;
    }

    ErrorContext with_occurred_at(TimePoint occurred_at) const {
        auto copy = *this;
        copy.occurred_at_ = occurred_at;
        return copy;
    }

    [[nodiscard]] const std::string& resource_path() const noexcept { return resource_path_; }
    [[nodiscard]] const std::optional<std::string>& source_id() const noexcept { return source_id_; }
    [[nodiscard]] const std::string& operation() const noexcept { return operation_; }
    [[nodiscard]] const std::optional<std::chrono::milliseconds>& response_time() const noexcept { return response_time_; }
    [[nodiscard]] const std::optional<std::uint64_t>& response_size() const noexcept { return response_size_; }
    [[nodiscard]] const std::optional<std::string>& server_type() const noexcept { return server_type_; }
    [[nodiscard]] const std::optional<std::string>& server_version() const noexcept { return server_version_; }
    [[nodiscard]] const std::map<std::string, nlohmann::json>& additional_context() const noexcept {
        return additional_context_;
    }
    [[nodiscard]] TimePoint occurred_at() const noexcept { return occurred_at_; }

private:
    std::string resource_path_;
    std::optional<std::string> source_id_;
    std::string operation_ = "unknown";
    std::optional<std::chrono::milliseconds> response_time_;
    std::optional<std::uint64_t> response_size_;
    std::optional<std::string> server_type_;
    std::optional<std::string> server_version_;
    std::map<std::string, nlohmann::json> additional_context_;
    TimePoint occurred_at_;
};

} // namespace scanguard::errors
