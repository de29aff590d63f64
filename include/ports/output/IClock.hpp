#pragma once

#include "domain/SessionRecord.hpp"

namespace session::ports::output {

/**
 * @brief Источник текущего времени
 *
 * Позволяет тестам управлять временем истечения сессий.
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual domain::TimePoint now() const = 0;
};

} // namespace session::ports::output
