#include "scanguard/errors/diagnostics.hpp"

#include "scanguard/errors/failure.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace scanguard::errors {
namespace {

std::optional<std::string> first_capture(const std::string& text, const std::regex& pattern) {
    std::smatch match;
    if (std::regex_search(text, match, pattern) && match.size() > 1) {
        return match[1].str();
    }
    return std::nullopt;
}

} // namespace

std::string to_lower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

bool contains_any(std::string_view haystack, std::initializer_list<std::string_view> needles) {
    return std::any_of(needles.begin(), needles.end(), [haystack](std::string_view needle) {
        return haystack.find(needle) != std::string_view::npos;
    });
}

std::optional<int> extract_http_status(const SourceError& error) {
    if (error.http_status) {
        return error.http_status;
    }
    static const std::regex status_pattern(R"(\b([45]\d{2})\b)");
    if (auto status = first_capture(error.message, status_pattern)) {
        return std::stoi(*status);
    }
    return std::nullopt;
}

std::optional<std::string> extract_error_code(std::string_view text) {
    const std::string subject(text);

    static const std::regex os_pattern(R"(os error (\d+))", std::regex::icase);
    if (auto code = first_capture(subject, os_pattern)) {
        return "OS_" + *code;
    }

    static const std::regex code_pattern(R"(error[:\s]+([A-Z0-9_]+))", std::regex::icase);
    return first_capture(subject, code_pattern);
}

std::optional<std::uint64_t> estimate_item_count(std::string_view text) {
    static const std::regex count_pattern(R"((\d+)\s*(?:items?|files?|directories|folders?|entries))",
                                          std::regex::icase);
    const std::string subject(text);
    if (auto count = first_capture(subject, count_pattern)) {
        if (count->size() <= 18) {
            return std::stoull(*count);
        }
    }
    return std::nullopt;
}

nlohmann::json base_diagnostics(const SourceError& error, const ErrorContext& context) {
    nlohmann::json diagnostics{
        {"operation", context.operation()},
        {"timestamp", to_iso8601(context.occurred_at())},
        {"error_message", error.message},
        {"resource_path", context.resource_path()},
        {"path_length", context.resource_path().size()},
        {"path_depth", path_depth(context.resource_path())},
    };

    if (context.source_id()) {
        diagnostics["source_id"] = *context.source_id();
    }
    if (context.response_time()) {
        diagnostics["response_time_ms"] = context.response_time()->count();
    }
    if (context.response_size()) {
        diagnostics["response_size_bytes"] = *context.response_size();
    }
    if (context.server_type()) {
        diagnostics["server_type"] = *context.server_type();
    }
    if (context.server_version()) {
        diagnostics["server_version"] = *context.server_version();
    }
    if (!context.additional_context().empty()) {
        nlohmann::json extra = nlohmann::json::object();
        for (const auto& [key, value] : context.additional_context()) {
            extra[key] = value;
        }
        diagnostics["additional_context"] = std::move(extra);
    }
    return diagnostics;
}

} // namespace scanguard::errors
