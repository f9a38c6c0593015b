#pragma once

#include "scanguard/core/time.hpp"

#include <chrono>
#include <memory>
#include <mutex>

namespace scanguard::test {

/**
 * @brief Clock the test moves by hand
 *
 * fn() hands out a ClockFn sharing this clock's state, so advancing the
 * clock after constructing the component under test is visible to it.
 */
class ManualClock {
public:
    explicit ManualClock(TimePoint start = from_epoch_ms(1'700'000'000'000))
        : state_(std::make_shared<State>()) {
        state_->now = start;
    }

    [[nodiscard]] TimePoint now() const {
        std::lock_guard lock(state_->mutex);
        return state_->now;
    }

    void advance(std::chrono::milliseconds step) {
        std::lock_guard lock(state_->mutex);
        state_->now += step;
    }

    void set(TimePoint tp) {
        std::lock_guard lock(state_->mutex);
        state_->now = tp;
    }

    [[nodiscard]] ClockFn fn() const {
        auto state = state_;
        return [state] {
            std::lock_guard lock(state->mutex);
            return state->now;
        };
    }

private:
    struct State {
        std::mutex mutex;
        TimePoint now{};
    };

    std::shared_ptr<State> state_;
};

} // namespace scanguard::test
