#pragma once

#include "domain/Account.hpp"
#include "domain/AccountRequest.hpp"
#include "domain/ShadowCategories.hpp"
#include "ports/output/ITransactionManager.hpp"
#include <string>
#include <optional>
#include <vector>
#include <map>

namespace penny::ports::input {

/**
 * @brief Интерфейс учёта счетов
 *
 * Единственная точка изменения балансов. Каждое изменение
 * объясняется записью журнала или корректировкой.
 */
class IAccountLedger {
public:
    virtual ~IAccountLedger() = default;

    // ========== Счета ==========

    virtual domain::Account createAccount(const domain::AccountRequest& request) = 0;

    /**
     * @brief Изменить свойства счёта (не баланс)
     * @throws NotFoundError если счёта нет
     */
    virtual domain::Account updateAccount(const std::string& accountId, const domain::AccountUpdate& update) = 0;

    virtual std::vector<domain::Account> getAllAccounts() = 0;
    virtual std::optional<domain::Account> getAccountById(const std::string& accountId) = 0;
    virtual void reorderAccounts(const std::vector<domain::AccountOrder>& order) = 0;

    // ========== Балансы ==========

    /**
     * @brief Прибавить delta к балансу (в одной транзакции)
     * @return Новый баланс
     * @throws NotFoundError если счёта нет
     */
    virtual domain::Money updateAccountBalance(const std::string& accountId, const domain::Money& delta) = 0;

    /**
     * @brief Применить набор изменений балансов в одной транзакции
     *
     * Нулевые изменения пропускаются без чтения и записи; если
     * ненулевых нет, транзакция не открывается.
     * Отсутствующие счета логируются и пропускаются.
     *
     * С внешней транзакцией события об изменении баланса не публикуются:
     * это делает владелец транзакции после commit через publishBalanceChanges.
     *
     * @param tx Уже открытая транзакция (nullptr: открыть свою)
     * @return Новые балансы изменённых счетов
     */
    virtual std::map<std::string, domain::Money> batchUpdateBalances(
        const std::map<std::string, domain::Money>& deltas,
        output::ITransaction* tx = nullptr) = 0;

    /**
     * @brief Опубликовать ACCOUNT_BALANCE_CHANGED для каждого счёта
     */
    virtual void publishBalanceChanges(const std::map<std::string, domain::Money>& balances) = 0;

    /**
     * @brief Перенести все операции счёта на другой счёт
     * @return Общее число перенесённых строк
     * @throws NotFoundError, IntegrityError (разные валюты)
     */
    virtual int transferOperations(const std::string& fromAccountId, const std::string& toAccountId) = 0;

    /**
     * @brief Установить абсолютный баланс через корректирующую запись
     * @return Новый баланс (= targetBalance)
     * @throws IntegrityError если теневые категории не заданы
     */
    virtual domain::Money adjustAccountBalance(
        const std::string& accountId,
        const domain::Money& targetBalance,
        const domain::ShadowCategories& shadow,
        const std::string& description = "") = 0;

    /**
     * @brief Удалить счёт
     * @param transferToAccountId Куда перенести операции перед удалением
     * @throws IntegrityError (с количеством операций), если операции есть,
     *         а счёт для переноса не указан
     */
    virtual void deleteAccount(
        const std::string& accountId,
        const std::optional<std::string>& transferToAccountId = std::nullopt) = 0;

    // ========== Чтение (без ошибок для отсутствующих счетов) ==========

    virtual domain::Money getAccountBalance(const std::string& accountId) = 0;
    virtual bool accountExists(const std::string& accountId) = 0;
    virtual int getOperationCount(const std::string& accountId) = 0;
};

} // namespace penny::ports::input
