#pragma once

#include "domain/Budget.hpp"
#include "domain/BudgetStatus.hpp"
#include "domain/BudgetPeriod.hpp"
#include <string>
#include <optional>
#include <vector>
#include <map>

namespace penny::ports::input {

/**
 * @brief Интерфейс бюджетов и расчёта периодов
 */
class IBudgetService {
public:
    virtual ~IBudgetService() = default;

    /// Текст первой ошибки или nullopt
    virtual std::optional<std::string> validateBudget(const domain::BudgetRequest& request) = 0;

    virtual domain::Budget createBudget(const domain::BudgetRequest& request) = 0;
    virtual domain::Budget updateBudget(const std::string& budgetId, const domain::BudgetUpdate& update) = 0;
    virtual void deleteBudget(const std::string& budgetId) = 0;

    virtual std::optional<domain::Budget> getBudgetById(const std::string& budgetId) = 0;
    virtual std::vector<domain::Budget> getAllBudgets() = 0;
    virtual std::vector<domain::Budget> getActiveBudgets(const domain::CalendarDate& date) = 0;
    virtual std::vector<domain::Budget> getBudgetsByCategory(const std::string& categoryId) = 0;

    // ========== Периоды ==========

    /// @throws ValidationError для неизвестного periodType
    virtual domain::PeriodRange getCurrentPeriodDates(const std::string& periodType, const domain::CalendarDate& reference) = 0;
    virtual domain::PeriodRange getNextPeriodDates(const std::string& periodType, const domain::CalendarDate& reference) = 0;
    virtual domain::PeriodRange getPreviousPeriodDates(const std::string& periodType, const domain::CalendarDate& reference) = 0;

    // ========== Расходы и статус ==========

    /**
     * @brief Сумма расходов в [start, endExclusive)
     * @param includeChildren Учитывать все подкатегории
     */
    virtual domain::Money calculateSpendingForBudget(
        const std::string& categoryId,
        const std::string& currency,
        const domain::CalendarDate& start,
        const domain::CalendarDate& endExclusive,
        bool includeChildren = true) = 0;

    /// @throws NotFoundError если бюджета нет
    virtual domain::BudgetStatus calculateBudgetStatus(const std::string& budgetId) = 0;

    /// Статусы всех активных бюджетов; сбойные бюджеты пропускаются
    virtual std::map<std::string, domain::BudgetStatus> calculateAllBudgetStatuses() = 0;

    // ========== Поиск ==========

    virtual std::optional<domain::Budget> findDuplicateBudget(
        const std::string& categoryId,
        const std::string& currency,
        const std::string& periodType,
        const std::optional<std::string>& excludeId = std::nullopt) = 0;

    /// Есть ли бюджет категории, активный сегодня
    virtual bool hasActiveBudget(const std::string& categoryId) = 0;
    virtual bool budgetExists(const std::string& budgetId) = 0;
};

} // namespace penny::ports::input
