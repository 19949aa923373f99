#pragma once

#include "enums/PeriodType.hpp"
#include "Money.hpp"
#include "CalendarDate.hpp"
#include "Timestamp.hpp"
#include <string>
#include <optional>

namespace penny::domain {

/**
 * @brief Бюджет расходов по категории
 *
 * Активен в окне [startDate, endDate), endDate пусто: бессрочно.
 */
struct Budget {
    std::string id;
    std::string categoryId;
    Money amount;
    std::string currency;
    PeriodType periodType = PeriodType::MONTHLY;
    CalendarDate startDate;
    std::optional<CalendarDate> endDate;
    bool isRecurring = true;
    bool rolloverEnabled = false;
    Timestamp createdAt;
    Timestamp updatedAt;

    bool isActiveOn(const CalendarDate& date) const {
        return startDate <= date && (!endDate || date < *endDate);
    }
};

/**
 * @brief Черновик бюджета из UI (до валидации)
 */
struct BudgetRequest {
    std::optional<std::string> id;
    std::string categoryId;
    std::string amount;
    std::string currency;
    std::string periodType;
    std::string startDate;
    std::optional<std::string> endDate;
    bool isRecurring = true;
    bool rolloverEnabled = false;
};

/**
 * @brief Частичное изменение бюджета
 */
struct BudgetUpdate {
    std::optional<std::string> categoryId;
    std::optional<std::string> amount;
    std::optional<std::string> currency;
    std::optional<std::string> periodType;
    std::optional<std::string> startDate;
    /// nullopt: не менять; пустая строка: сделать бессрочным
    std::optional<std::string> endDate;
    std::optional<bool> isRecurring;
    std::optional<bool> rolloverEnabled;
};

} // namespace penny::domain
