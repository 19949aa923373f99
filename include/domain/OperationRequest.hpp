#pragma once

#include <string>
#include <optional>

namespace penny::domain {

/**
 * @brief Запрос на создание или замену операции журнала
 *
 * Суммы и дата приходят из UI строками и разбираются сервисом.
 */
struct OperationRequest {
    std::optional<std::string> id;
    std::string type;                               ///< expense / income / transfer
    std::string amount;
    std::string accountId;
    std::optional<std::string> categoryId;
    std::optional<std::string> toAccountId;
    std::string date;                               ///< YYYY-MM-DD
    std::string description;
    std::optional<std::string> exchangeRate;
    std::optional<std::string> destinationAmount;
    std::optional<std::string> sourceCurrency;
    std::optional<std::string> destinationCurrency;
};

} // namespace penny::domain
