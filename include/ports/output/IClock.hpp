#pragma once

#include "domain/CalendarDate.hpp"
#include "domain/Timestamp.hpp"

namespace penny::ports::output {

/**
 * @brief Источник текущего времени
 *
 * "Сегодня": календарная дата UTC.
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual domain::Timestamp now() const = 0;

    virtual domain::CalendarDate today() const {
        return now().date();
    }
};

} // namespace penny::ports::output
