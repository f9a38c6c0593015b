#pragma once

#include "scanguard/errors/context.hpp"
#include "scanguard/errors/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace scanguard::errors {

// Text helpers shared by the per-source classifiers.

[[nodiscard]] std::string to_lower(std::string_view text);

/// True when @p haystack contains any of @p needles
[[nodiscard]] bool contains_any(std::string_view haystack, std::initializer_list<std::string_view> needles);

/// First 4xx/5xx number in the text, or the explicit status on the error
[[nodiscard]] std::optional<int> extract_http_status(const SourceError& error);

/// "error: CODE" style identifiers, then "os error N" as "OS_N"
[[nodiscard]] std::optional<std::string> extract_error_code(std::string_view text);

/// Counts such as "1000 items" or "contains 500 files"
[[nodiscard]] std::optional<std::uint64_t> estimate_item_count(std::string_view text);

/**
 * @brief Fields every diagnostic bundle carries
 *
 * operation, timestamp (from the context), error_message, resource_path,
 * path_length, path_depth, plus response metrics, server info and the
 * caller's additional context when present.
 */
[[nodiscard]] nlohmann::json base_diagnostics(const SourceError& error, const ErrorContext& context);

} // namespace scanguard::errors
