#pragma once

#include "domain/BalanceSnapshot.hpp"
#include "ports/output/ITransactionManager.hpp"
#include <string>
#include <optional>
#include <vector>

namespace penny::ports::input {

/**
 * @brief Интерфейс истории балансов
 *
 * Снимки: производный кэш: журнал + текущие балансы.
 */
class IBalanceHistoryService {
public:
    virtual ~IBalanceHistoryService() = default;

    /**
     * @brief Восстановить снимки текущего месяца обратным проходом по журналу
     *
     * Конфликт вложенной транзакции: пропуск без изменений.
     * @param tx Уже открытая транзакция: ошибки логируются и не пробрасываются
     */
    virtual void populateCurrentMonthHistory(output::ITransaction* tx = nullptr) = 0;

    /**
     * @brief Обновить снимок за сегодня (ошибки никогда не пробрасываются)
     */
    virtual void updateTodayBalance(
        const std::string& accountId,
        const domain::Money& balance,
        output::ITransaction* tx = nullptr) = 0;

    virtual std::vector<domain::BalanceSnapshot> getBalanceHistory(
        const std::string& accountId,
        const domain::CalendarDate& start,
        const domain::CalendarDate& end) = 0;

    virtual std::optional<domain::Money> getAccountBalanceOnDate(
        const std::string& accountId,
        const domain::CalendarDate& date) = 0;

    virtual std::vector<domain::AccountBalanceOnDate> getAllAccountsBalanceOnDate(const domain::CalendarDate& date) = 0;

    virtual std::optional<domain::CalendarDate> getLastSnapshotDate(const std::string& accountId) = 0;

    // ========== Ручная правка ==========

    virtual void upsertBalanceHistory(
        const std::string& accountId,
        const domain::CalendarDate& date,
        const domain::Money& balance) = 0;

    virtual void deleteBalanceHistory(const std::string& accountId, const domain::CalendarDate& date) = 0;

    /// Удалить все снимки счёта, возвращает число удалённых
    virtual int deleteAccountHistory(const std::string& accountId) = 0;
};

} // namespace penny::ports::input
