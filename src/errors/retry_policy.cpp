#include "scanguard/errors/retry_policy.hpp"

#include <algorithm>

namespace scanguard::errors {

std::chrono::seconds compute_retry_delay(RetryStrategy strategy,
                                         std::uint32_t base_delay_seconds,
                                         std::uint32_t failure_count,
                                         std::uint32_t max_delay_seconds) noexcept {
    const std::uint64_t base = base_delay_seconds;
    const std::uint64_t attempts = std::max<std::uint32_t>(failure_count, 1);

    std::uint64_t delay = base;
    switch (strategy) {
        case RetryStrategy::Exponential:
            delay = base << std::min<std::uint64_t>(attempts - 1, 10);
            break;
        case RetryStrategy::Linear:
            delay = base * attempts;
            break;
        case RetryStrategy::Fixed:
            delay = base;
            break;
    }
    return std::chrono::seconds(std::min<std::uint64_t>(delay, max_delay_seconds));
}

} // namespace scanguard::errors
