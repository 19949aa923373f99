#pragma once

#include "errors/LedgerError.hpp"
#include <chrono>
#include <string>
#include <cstdio>

namespace penny::domain {

/**
 * @brief Календарная дата без времени (YYYY-MM-DD)
 *
 * Используется для дат операций, снимков баланса и границ периодов.
 * Все сдвиги календарные: месяц и год учитывают разную длину
 * месяцев и високосные годы.
 */
class CalendarDate {
public:
    CalendarDate() : ymd_(std::chrono::year{1970}, std::chrono::month{1}, std::chrono::day{1}) {}

    CalendarDate(int year, unsigned month, unsigned day)
        : ymd_(std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day})
    {
        if (!ymd_.ok()) {
            throw ValidationError("Invalid date: " + std::to_string(year) + "-" +
                                  std::to_string(month) + "-" + std::to_string(day));
        }
    }

    explicit CalendarDate(std::chrono::sys_days days) : ymd_(days) {}

    /**
     * @brief Разобрать строку "YYYY-MM-DD"
     *
     * Допускается суффикс времени ("2025-01-15T10:00:00Z"), он отбрасывается.
     * @throws ValidationError если дата некорректна
     */
    static CalendarDate fromString(const std::string& str) {
        int year = 0;
        unsigned month = 0;
        unsigned day = 0;
        int consumed = 0;

        if (str.size() < 10 ||
            std::sscanf(str.c_str(), "%4d-%2u-%2u%n", &year, &month, &day, &consumed) != 3 ||
            consumed != 10) {
            throw ValidationError("Invalid date: '" + str + "'");
        }
        return CalendarDate(year, month, day);
    }

    std::string toString() const {
        char buffer[16];
        std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", year(), month(), day());
        return buffer;
    }

    int year() const { return static_cast<int>(ymd_.year()); }
    unsigned month() const { return static_cast<unsigned>(ymd_.month()); }
    unsigned day() const { return static_cast<unsigned>(ymd_.day()); }

    /// День недели: 0 = воскресенье ... 6 = суббота
    unsigned weekday() const {
        return std::chrono::weekday{days()}.c_encoding();
    }

    std::chrono::sys_days days() const { return std::chrono::sys_days{ymd_}; }

    CalendarDate addDays(int n) const {
        return CalendarDate(days() + std::chrono::days{n});
    }

    /**
     * @brief Сдвиг на n календарных месяцев
     *
     * Если такого дня в целевом месяце нет (31 января + 1 месяц),
     * берётся последний день месяца.
     */
    CalendarDate addMonths(int n) const {
        auto shifted = ymd_ + std::chrono::months{n};
        if (!shifted.ok()) {
            shifted = std::chrono::year_month_day_last(shifted.year(),
                                                       std::chrono::month_day_last(shifted.month()));
        }
        return CalendarDate(std::chrono::sys_days{shifted});
    }

    CalendarDate addYears(int n) const {
        auto shifted = ymd_ + std::chrono::years{n};
        if (!shifted.ok()) {
            // 29 февраля в невисокосный год
            shifted = std::chrono::year_month_day_last(shifted.year(),
                                                       std::chrono::month_day_last(shifted.month()));
        }
        return CalendarDate(std::chrono::sys_days{shifted});
    }

    CalendarDate firstDayOfMonth() const {
        return CalendarDate(year(), month(), 1);
    }

    CalendarDate lastDayOfMonth() const {
        std::chrono::year_month_day_last last(ymd_.year(), std::chrono::month_day_last(ymd_.month()));
        return CalendarDate(std::chrono::sys_days{last});
    }

    /// Количество дней от other до this
    int daysSince(const CalendarDate& other) const {
        return static_cast<int>((days() - other.days()).count());
    }

    bool operator==(const CalendarDate& other) const { return days() == other.days(); }
    bool operator!=(const CalendarDate& other) const { return days() != other.days(); }
    bool operator<(const CalendarDate& other) const { return days() < other.days(); }
    bool operator>(const CalendarDate& other) const { return days() > other.days(); }
    bool operator<=(const CalendarDate& other) const { return days() <= other.days(); }
    bool operator>=(const CalendarDate& other) const { return days() >= other.days(); }

private:
    std::chrono::year_month_day ymd_;
};

} // namespace penny::domain
