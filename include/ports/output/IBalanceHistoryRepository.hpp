#pragma once

#include "domain/BalanceSnapshot.hpp"
#include <string>
#include <optional>
#include <vector>

namespace penny::ports::output {

/**
 * @brief Интерфейс таблицы снимков баланса
 */
class IBalanceHistoryRepository {
public:
    virtual ~IBalanceHistoryRepository() = default;

    /// Вставка, только если снимка (accountId, date) ещё нет
    virtual bool insertIfAbsent(const domain::BalanceSnapshot& snapshot) = 0;
    virtual void upsert(const domain::BalanceSnapshot& snapshot) = 0;

    /// Снимки в [start, end] включительно, date ASC
    virtual std::vector<domain::BalanceSnapshot> findRange(
        const std::string& accountId,
        const domain::CalendarDate& start,
        const domain::CalendarDate& end) = 0;

    virtual std::optional<domain::BalanceSnapshot> findOn(
        const std::string& accountId,
        const domain::CalendarDate& date) = 0;

    virtual std::optional<domain::CalendarDate> findLastDate(const std::string& accountId) = 0;

    /// Снимки всех счетов на дату (в порядке displayOrder счетов)
    virtual std::vector<domain::AccountBalanceOnDate> findAllOnDate(const domain::CalendarDate& date) = 0;

    virtual bool deleteEntry(const std::string& accountId, const domain::CalendarDate& date) = 0;
    virtual int deleteByAccount(const std::string& accountId) = 0;
};

} // namespace penny::ports::output
