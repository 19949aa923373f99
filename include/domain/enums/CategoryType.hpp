#pragma once

#include <string>
#include <stdexcept>

namespace penny::domain {

/**
 * @brief Направление категории: расходная или доходная
 */
enum class CategoryType {
    EXPENSE,
    INCOME
};

inline std::string toString(CategoryType type) {
    switch (type) {
        case CategoryType::EXPENSE: return "expense";
        case CategoryType::INCOME:  return "income";
    }
    return "unknown";
}

inline CategoryType categoryTypeFromString(const std::string& str) {
    if (str == "expense") return CategoryType::EXPENSE;
    if (str == "income")  return CategoryType::INCOME;
    throw std::invalid_argument("Unknown CategoryType: " + str);
}

} // namespace penny::domain
