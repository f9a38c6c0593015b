#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace scanguard {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/// Injectable time source; tests pass a manual clock instead of sleeping
using ClockFn = std::function<TimePoint()>;

[[nodiscard]] inline ClockFn system_clock_fn() {
    return [] { return Clock::now(); };
}

[[nodiscard]] std::int64_t to_epoch_ms(TimePoint tp) noexcept;
[[nodiscard]] TimePoint from_epoch_ms(std::int64_t ms) noexcept;

/**
 * @brief Format as RFC 3339 UTC with millisecond precision
 *        (e.g. "2024-03-01T10:15:30.250Z")
 */
[[nodiscard]] std::string to_iso8601(TimePoint tp);

} // namespace scanguard
