#pragma once

#include "ports/output/IClock.hpp"

namespace session::adapters::secondary {

class SystemClock : public ports::output::IClock {
public:
    domain::TimePoint now() const override {
        return domain::Clock::now();
    }
};

} // namespace session::adapters::secondary
