#pragma once

#include "domain/Operation.hpp"
#include <string>
#include <optional>
#include <vector>

namespace penny::ports::output {

/**
 * @brief Интерфейс журнала операций
 */
class IOperationRepository {
public:
    virtual ~IOperationRepository() = default;

    virtual domain::Operation save(const domain::Operation& operation) = 0;
    virtual bool update(const domain::Operation& operation) = 0;
    virtual bool deleteById(const std::string& operationId) = 0;

    virtual std::optional<domain::Operation> findById(const std::string& operationId) = 0;

    /// Операции, где счёт: источник или получатель (date DESC, createdAt DESC)
    virtual std::vector<domain::Operation> findByAccount(const std::string& accountId) = 0;

    /// Операции в [start, end] включительно (date DESC, createdAt DESC)
    virtual std::vector<domain::Operation> findByDateRange(
        const domain::CalendarDate& start,
        const domain::CalendarDate& end) = 0;

    /// Операции счёта с датой строго позже after
    virtual std::vector<domain::Operation> findByAccountAfter(
        const std::string& accountId,
        const domain::CalendarDate& after) = 0;

    /// Количество операций, где счёт: источник или получатель
    virtual int countByAccount(const std::string& accountId) = 0;
    virtual int countByCategory(const std::string& categoryId) = 0;

    /// accountId: from -> to, возвращает число перенесённых строк
    virtual int reassignSourceAccount(const std::string& fromAccountId, const std::string& toAccountId) = 0;

    /// toAccountId: from -> to, возвращает число перенесённых строк
    virtual int reassignDestinationAccount(const std::string& fromAccountId, const std::string& toAccountId) = 0;

    /**
     * @brief Последняя (по createdAt) операция счёта за дату в одной из категорий
     */
    virtual std::optional<domain::Operation> findLatestInCategoriesOn(
        const std::string& accountId,
        const domain::CalendarDate& date,
        const std::vector<std::string>& categoryIds) = 0;

    /**
     * @brief Расходы в категориях за [start, endExclusive)
     *
     * Валюта сверяется с валютой счёта операции.
     */
    virtual std::vector<domain::Operation> findExpenses(
        const std::vector<std::string>& categoryIds,
        const std::string& currency,
        const domain::CalendarDate& start,
        const domain::CalendarDate& endExclusive) = 0;
};

} // namespace penny::ports::output
