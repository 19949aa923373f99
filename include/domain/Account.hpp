#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include <string>
#include <optional>

namespace penny::domain {

/**
 * @brief Счёт пользователя (кошелёк, карта, наличные)
 *
 * Баланс меняется только через AccountLedger, чтобы каждое
 * изменение было объяснено записью журнала.
 */
struct Account {
    std::string id;                         ///< ID счёта
    std::string name;                       ///< Название ("Наличные", "Visa")
    Money balance;                          ///< Текущий баланс
    std::string currency = "USD";           ///< Код валюты (ISO)
    int displayOrder = 0;                   ///< Порядок в списке
    bool hidden = false;                    ///< Скрыт из списков
    std::optional<Money> monthlyTarget;     ///< Цель на месяц (необязательно)
    Timestamp createdAt;
    Timestamp updatedAt;

    Account() = default;

    Account(
        const std::string& id,
        const std::string& name,
        const Money& balance,
        const std::string& currency,
        int displayOrder = 0
    ) : id(id), name(name), balance(balance), currency(currency),
        displayOrder(displayOrder), createdAt(Timestamp::now()), updatedAt(createdAt) {}
};

} // namespace penny::domain
