#pragma once

#include "enums/OperationType.hpp"
#include "Money.hpp"
#include "CalendarDate.hpp"
#include "Timestamp.hpp"
#include <string>
#include <optional>
#include <map>

namespace penny::domain {

/**
 * @brief Запись журнала операций
 *
 * Расход/доход затрагивает один счёт, перевод: два.
 * Для мультивалютного перевода destinationAmount: сумма,
 * зачисленная на счёт получателя.
 */
struct Operation {
    std::string id;
    OperationType type = OperationType::EXPENSE;
    Money amount;
    std::string accountId;                          ///< Счёт списания/зачисления
    std::optional<std::string> categoryId;          ///< Пусто у переводов
    std::optional<std::string> toAccountId;         ///< Только у переводов
    CalendarDate date;                              ///< Дата операции
    Timestamp createdAt;
    std::string description;

    // Мультивалютный перевод
    std::optional<std::string> exchangeRate;
    std::optional<Money> destinationAmount;
    std::optional<std::string> sourceCurrency;
    std::optional<std::string> destinationCurrency;

    bool touches(const std::string& account) const {
        return accountId == account || (toAccountId && *toAccountId == account);
    }
};

/**
 * @brief Влияние операции на баланс конкретного счёта
 *
 * Расход: -amount, доход: +amount, перевод: -amount у источника,
 * +(destinationAmount или amount) у получателя. Если источник и
 * получатель совпадают (после переноса операций между счетами),
 * учитываются обе стороны.
 */
inline Money effectOn(const Operation& op, const std::string& accountId) {
    Money effect;
    switch (op.type) {
        case OperationType::EXPENSE:
            if (op.accountId == accountId) effect -= op.amount;
            break;
        case OperationType::INCOME:
            if (op.accountId == accountId) effect += op.amount;
            break;
        case OperationType::TRANSFER:
            if (op.accountId == accountId) {
                effect -= op.amount;
            }
            if (op.toAccountId && *op.toAccountId == accountId) {
                effect += op.destinationAmount ? *op.destinationAmount : op.amount;
            }
            break;
    }
    return effect;
}

/**
 * @brief Изменения балансов всех затронутых счетов
 */
inline std::map<std::string, Money> balanceChanges(const Operation& op) {
    std::map<std::string, Money> changes;
    changes[op.accountId] = effectOn(op, op.accountId);
    if (op.type == OperationType::TRANSFER && op.toAccountId && *op.toAccountId != op.accountId) {
        changes[*op.toAccountId] = effectOn(op, *op.toAccountId);
    }
    return changes;
}

} // namespace penny::domain
