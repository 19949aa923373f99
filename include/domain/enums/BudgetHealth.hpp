#pragma once

#include <string>

namespace penny::domain {

/**
 * @brief Состояние бюджета по проценту израсходованного
 *
 * < 70: SAFE, 70..89: WARNING, 90..99: DANGER, >= 100: EXCEEDED
 */
enum class BudgetHealth {
    SAFE,
    WARNING,
    DANGER,
    EXCEEDED
};

inline std::string toString(BudgetHealth health) {
    switch (health) {
        case BudgetHealth::SAFE:     return "safe";
        case BudgetHealth::WARNING:  return "warning";
        case BudgetHealth::DANGER:   return "danger";
        case BudgetHealth::EXCEEDED: return "exceeded";
    }
    return "unknown";
}

/**
 * @brief Ступенчатая функция от процента (нижняя граница полосы включительно)
 */
inline BudgetHealth budgetHealthFor(long percentage, bool isExceeded) {
    if (isExceeded || percentage >= 100) return BudgetHealth::EXCEEDED;
    if (percentage >= 90) return BudgetHealth::DANGER;
    if (percentage >= 70) return BudgetHealth::WARNING;
    return BudgetHealth::SAFE;
}

} // namespace penny::domain
