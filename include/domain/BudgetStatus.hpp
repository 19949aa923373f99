#pragma once

#include "enums/BudgetHealth.hpp"
#include "Money.hpp"
#include "CalendarDate.hpp"
#include <string>

namespace penny::domain {

/**
 * @brief Состояние бюджета в текущем периоде
 */
struct BudgetStatus {
    std::string budgetId;
    Money amount;
    Money spent;
    Money remaining;            ///< amount - spent (может быть отрицательным)
    long percentage = 0;        ///< round(100 * spent / amount)
    bool isExceeded = false;    ///< spent > amount
    CalendarDate periodStart;   ///< Включительно
    CalendarDate periodEnd;     ///< Включительно
    BudgetHealth status = BudgetHealth::SAFE;
};

} // namespace penny::domain
