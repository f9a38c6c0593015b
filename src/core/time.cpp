#include "scanguard/core/time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace scanguard {

std::int64_t to_epoch_ms(TimePoint tp) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint from_epoch_ms(std::int64_t ms) noexcept {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

std::string to_iso8601(TimePoint tp) {
    const auto ms_total = to_epoch_ms(tp);
    auto seconds = static_cast<std::time_t>(ms_total / 1000);
    auto millis = ms_total % 1000;
    if (millis < 0) {
        millis += 1000;
        seconds -= 1;
    }

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

} // namespace scanguard
