#pragma once

#include "enums/PeriodType.hpp"
#include "CalendarDate.hpp"

namespace penny::domain {

/**
 * @brief Календарные границы периода (обе включительно)
 */
struct PeriodRange {
    CalendarDate start;
    CalendarDate end;

    bool contains(const CalendarDate& date) const {
        return start <= date && date <= end;
    }

    /// Первый день после периода (для полуоткрытых диапазонов)
    CalendarDate endExclusive() const { return end.addDays(1); }
};

/**
 * @brief Период, содержащий дату
 *
 * weekly: с воскресенья по субботу, monthly: с 1-го по последний
 * день месяца, yearly: с 1 января по 31 декабря.
 */
inline PeriodRange currentPeriod(PeriodType type, const CalendarDate& reference) {
    switch (type) {
        case PeriodType::WEEKLY: {
            auto start = reference.addDays(-static_cast<int>(reference.weekday()));
            return {start, start.addDays(6)};
        }
        case PeriodType::MONTHLY:
            return {reference.firstDayOfMonth(), reference.lastDayOfMonth()};
        case PeriodType::YEARLY:
            return {CalendarDate(reference.year(), 1, 1), CalendarDate(reference.year(), 12, 31)};
    }
    throw ValidationError("Invalid period type: " + std::to_string(static_cast<int>(type)));
}

/**
 * @brief Сдвиг начала периода на n единиц (неделя, календарный месяц, год)
 */
inline CalendarDate shiftPeriodStart(PeriodType type, const CalendarDate& start, int n) {
    switch (type) {
        case PeriodType::WEEKLY:  return start.addDays(7 * n);
        case PeriodType::MONTHLY: return start.addMonths(n);
        case PeriodType::YEARLY:  return start.addYears(n);
    }
    throw ValidationError("Invalid period type: " + std::to_string(static_cast<int>(type)));
}

inline PeriodRange nextPeriod(PeriodType type, const CalendarDate& reference) {
    return currentPeriod(type, shiftPeriodStart(type, currentPeriod(type, reference).start, 1));
}

inline PeriodRange previousPeriod(PeriodType type, const CalendarDate& reference) {
    return currentPeriod(type, shiftPeriodStart(type, currentPeriod(type, reference).start, -1));
}

} // namespace penny::domain
