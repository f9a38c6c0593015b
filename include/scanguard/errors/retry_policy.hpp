#pragma once

#include "scanguard/core/time.hpp"
#include "scanguard/errors/types.hpp"

#include <chrono>
#include <cstdint>

namespace scanguard::errors {

/// Upper bound on any computed backoff (24 hours)
constexpr std::uint32_t kMaxRetryDelaySeconds = 86400;

/**
 * @brief Delay before the next retry after @p failure_count failures
 *
 * Exponential: base * 2^min(n - 1, 10). Linear: base * n. Fixed: base.
 * Every strategy is capped at @p max_delay_seconds.
 */
[[nodiscard]] std::chrono::seconds compute_retry_delay(RetryStrategy strategy,
                                                       std::uint32_t base_delay_seconds,
                                                       std::uint32_t failure_count,
                                                       std::uint32_t max_delay_seconds = kMaxRetryDelaySeconds) noexcept;

[[nodiscard]] inline TimePoint next_retry_time(TimePoint now,
                                               RetryStrategy strategy,
                                               std::uint32_t base_delay_seconds,
                                               std::uint32_t failure_count,
                                               std::uint32_t max_delay_seconds = kMaxRetryDelaySeconds) noexcept {
    return now + compute_retry_delay(strategy, base_delay_seconds, failure_count, max_delay_seconds);
}

} // namespace scanguard::errors
