#pragma once

#include "ports/output/IClock.hpp"
#include <chrono>
#include <ctime>
#include <mutex>

namespace session::tests::mocks {

/**
 * @brief Управляемые часы для unit-тестов
 *
 * Стартуют с фиксированного момента и двигаются только через advance().
 */
class FakeClock : public ports::output::IClock {
public:
    FakeClock()
        : now_(domain::Clock::from_time_t(static_cast<std::time_t>(1700000000)))
    {}

    domain::TimePoint now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    template <typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += std::chrono::duration_cast<domain::Clock::duration>(delta);
    }

    void set(domain::TimePoint value) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = value;
    }

private:
    mutable std::mutex mutex_;
    domain::TimePoint now_;
};

} // namespace session::tests::mocks
