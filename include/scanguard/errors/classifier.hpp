#pragma once

#include "scanguard/errors/context.hpp"
#include "scanguard/errors/failure.hpp"
#include "scanguard/errors/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace scanguard::errors {

/**
 * @brief Source-specific mapping from raw failures to the shared taxonomy
 *
 * Implementations must be pure: the same error and context always yield
 * the same ErrorClassification, and unrecognized input resolves to
 * SourceErrorType::Unknown instead of failing.
 */
class SourceErrorClassifier {
public:
    virtual ~SourceErrorClassifier() = default;

    [[nodiscard]] virtual SourceType source_type() const noexcept = 0;

    [[nodiscard]] virtual ErrorClassification classify_error(const SourceError& error,
                                                             const ErrorContext& context) const = 0;

    [[nodiscard]] virtual nlohmann::json extract_diagnostics(const SourceError& error,
                                                             const ErrorContext& context) const = 0;

    /// Rebuilt from the persisted record alone, no live error required
    [[nodiscard]] virtual std::string build_user_friendly_message(const SourceScanFailure& failure) const = 0;

    [[nodiscard]] virtual std::string build_recommended_action(const SourceScanFailure& failure) const = 0;

    /**
     * @brief Retry eligibility shared by every source
     *
     * Critical never retries; High, Medium and Low retry while
     * failure_count stays below 2, 5 and 10.
     */
    [[nodiscard]] virtual bool should_retry(const SourceScanFailure& failure) const;
};

[[nodiscard]] bool default_should_retry(Severity severity, std::uint32_t failure_count) noexcept;

/// Attempts allowed for a severity: Critical 1, High 3, Medium 5, Low 10
[[nodiscard]] std::uint32_t default_max_retries(Severity severity) noexcept;

} // namespace scanguard::errors
