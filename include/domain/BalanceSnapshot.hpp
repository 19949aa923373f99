#pragma once

#include "Money.hpp"
#include "CalendarDate.hpp"
#include "Timestamp.hpp"
#include <string>

namespace penny::domain {

/**
 * @brief Баланс счёта на конец календарного дня
 *
 * Уникален по (accountId, date). Это кэш: его можно удалить
 * и восстановить из журнала и текущих балансов.
 */
struct BalanceSnapshot {
    std::string accountId;
    CalendarDate date;
    Money balance;
    Timestamp createdAt;
};

/**
 * @brief Снимок баланса вместе с данными счёта (для сводки на дату)
 */
struct AccountBalanceOnDate {
    std::string accountId;
    std::string name;
    std::string currency;
    Money balance;
};

} // namespace penny::domain
