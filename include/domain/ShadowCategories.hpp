#pragma once

#include <string>

namespace penny::domain {

/**
 * @brief Пара теневых категорий для корректировок баланса
 *
 * Разрешается один раз при инициализации и явно передаётся
 * в AccountLedger::adjustAccountBalance.
 */
struct ShadowCategories {
    static constexpr const char* EXPENSE_ID = "shadow-adjustment-expense";
    static constexpr const char* INCOME_ID = "shadow-adjustment-income";

    std::string expenseId;
    std::string incomeId;

    bool isComplete() const {
        return !expenseId.empty() && !incomeId.empty();
    }

    bool contains(const std::string& categoryId) const {
        return categoryId == expenseId || categoryId == incomeId;
    }
};

} // namespace penny::domain
