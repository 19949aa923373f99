#pragma once

#include <string>
#include <stdexcept>

namespace penny::domain {

/**
 * @brief Тип операции журнала
 */
enum class OperationType {
    EXPENSE,    ///< Расход со счёта
    INCOME,     ///< Доход на счёт
    TRANSFER    ///< Перевод между двумя счетами
};

inline std::string toString(OperationType type) {
    switch (type) {
        case OperationType::EXPENSE:  return "expense";
        case OperationType::INCOME:   return "income";
        case OperationType::TRANSFER: return "transfer";
    }
    return "unknown";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline OperationType operationTypeFromString(const std::string& str) {
    if (str == "expense")  return OperationType::EXPENSE;
    if (str == "income")   return OperationType::INCOME;
    if (str == "transfer") return OperationType::TRANSFER;
    throw std::invalid_argument("Unknown OperationType: " + str);
}

} // namespace penny::domain
