#pragma once

#include "domain/Budget.hpp"
#include <string>
#include <optional>
#include <vector>

namespace penny::ports::output {

/**
 * @brief Интерфейс репозитория бюджетов
 */
class IBudgetRepository {
public:
    virtual ~IBudgetRepository() = default;

    virtual domain::Budget save(const domain::Budget& budget) = 0;
    virtual bool update(const domain::Budget& budget) = 0;
    virtual bool deleteById(const std::string& budgetId) = 0;

    virtual std::optional<domain::Budget> findById(const std::string& budgetId) = 0;
    virtual std::vector<domain::Budget> findAll() = 0;
    virtual std::vector<domain::Budget> findByCategory(const std::string& categoryId) = 0;

    /// Бюджеты, активные на дату: startDate <= date < endDate (или без endDate)
    virtual std::vector<domain::Budget> findActive(const domain::CalendarDate& date) = 0;

    /// Бюджет с той же категорией, валютой и периодом (кроме excludeId)
    virtual std::optional<domain::Budget> findDuplicate(
        const std::string& categoryId,
        const std::string& currency,
        domain::PeriodType periodType,
        const std::optional<std::string>& excludeId) = 0;
};

} // namespace penny::ports::output
