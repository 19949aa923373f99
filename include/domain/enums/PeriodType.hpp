#pragma once

#include "domain/errors/LedgerError.hpp"
#include <string>

namespace penny::domain {

/**
 * @brief Период бюджета
 */
enum class PeriodType {
    WEEKLY,     ///< Воскресенье - суббота
    MONTHLY,    ///< 1-е - последний день месяца
    YEARLY      ///< 1 января - 31 декабря
};

inline std::string toString(PeriodType type) {
    switch (type) {
        case PeriodType::WEEKLY:  return "weekly";
        case PeriodType::MONTHLY: return "monthly";
        case PeriodType::YEARLY:  return "yearly";
    }
    return "unknown";
}

/**
 * @brief Создать из строки
 * @throws ValidationError с названием неизвестного значения
 */
inline PeriodType periodTypeFromString(const std::string& str) {
    if (str == "weekly")  return PeriodType::WEEKLY;
    if (str == "monthly") return PeriodType::MONTHLY;
    if (str == "yearly")  return PeriodType::YEARLY;
    throw ValidationError("Invalid period type: " + str);
}

inline bool isValidPeriodType(const std::string& str) {
    return str == "weekly" || str == "monthly" || str == "yearly";
}

} // namespace penny::domain
