#pragma once

#include "ports/input/IAccountLedger.hpp"
#include "ports/input/IBalanceHistoryService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/IOperationRepository.hpp"
#include "ports/output/ITransactionManager.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "application/events/LedgerEvents.hpp"
#include "settings/LedgerSettings.hpp"
#include "domain/errors/LedgerError.hpp"
#include "utils/IdGenerator.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace penny::application {

/**
 * @brief Учёт счетов и балансов
 *
 * Все многошаговые изменения выполняются в одной транзакции.
 * После изменения баланса обновляется снимок за сегодня
 * (best effort, в той же транзакции).
 *
 * Ручная установка баланса не перезаписывает его молча, а пишет
 * корректирующую операцию в теневую категорию: так любое изменение
 * баланса объясняется журналом, на что опирается BalanceHistoryService.
 */
class AccountLedger : public ports::input::IAccountLedger {
public:
    AccountLedger(
        std::shared_ptr<ports::output::IAccountRepository> accountRepo,
        std::shared_ptr<ports::output::IOperationRepository> operationRepo,
        std::shared_ptr<ports::input::IBalanceHistoryService> history,
        std::shared_ptr<ports::output::ITransactionManager> txManager,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : accountRepo_(std::move(accountRepo))
      , operationRepo_(std::move(operationRepo))
      , history_(std::move(history))
      , txManager_(std::move(txManager))
      , clock_(std::move(clock))
      , eventPublisher_(std::move(eventPublisher))
      , settings_(std::move(settings))
    {
        std::cout << "[AccountLedger] Created" << std::endl;
    }

    // ================================================================
    // Счета
    // ================================================================

    domain::Account createAccount(const domain::AccountRequest& request) override {
        if (request.name.empty()) {
            throw domain::ValidationError("Account name is required");
        }

        domain::Account account;
        account.id = request.id ? *request.id : utils::IdGenerator::newId("acc");
        account.name = request.name;
        account.balance = domain::Money::parse(request.balance.empty() ? "0" : request.balance);
        account.currency = request.currency.empty() ? settings_->getDefaultCurrency() : request.currency;
        account.displayOrder = request.displayOrder ? *request.displayOrder : accountRepo_->maxDisplayOrder() + 1;
        account.hidden = request.hidden;
        if (request.monthlyTarget && !request.monthlyTarget->empty()) {
            account.monthlyTarget = domain::Money::parse(*request.monthlyTarget);
        }
        account.createdAt = clock_->now();
        account.updatedAt = account.createdAt;

        if (accountRepo_->findById(account.id)) {
            throw domain::IntegrityError("Account " + account.id + " already exists");
        }

        accountRepo_->save(account);
        std::cout << "[AccountLedger] Created account " << account.id << " (" << account.name
                  << ", " << account.balance.toString() << " " << account.currency << ")" << std::endl;

        publishAccountChanged(account.id, "created");
        return account;
    }

    domain::Account updateAccount(const std::string& accountId, const domain::AccountUpdate& update) override {
        auto account = requireAccount(accountId);

        if (update.name) {
            if (update.name->empty()) {
                throw domain::ValidationError("Account name is required");
            }
            account.name = *update.name;
        }
        if (update.currency) {
            if (update.currency->empty()) {
                throw domain::ValidationError("Currency is required");
            }
            account.currency = *update.currency;
        }
        if (update.hidden) {
            account.hidden = *update.hidden;
        }
        if (update.monthlyTarget) {
            if (update.monthlyTarget->empty()) {
                account.monthlyTarget.reset();
            } else {
                account.monthlyTarget = domain::Money::parse(*update.monthlyTarget);
            }
        }
        account.updatedAt = clock_->now();

        accountRepo_->update(account);
        publishAccountChanged(account.id, "updated");
        return account;
    }

    std::vector<domain::Account> getAllAccounts() override {
        return accountRepo_->findAll();
    }

    std::optional<domain::Account> getAccountById(const std::string& accountId) override {
        return accountRepo_->findById(accountId);
    }

    void reorderAccounts(const std::vector<domain::AccountOrder>& order) override {
        txManager_->runInTransaction([&](ports::output::ITransaction&) {
            for (const auto& item : order) {
                accountRepo_->updateDisplayOrder(item.id, item.displayOrder);
            }
        });
        std::cout << "[AccountLedger] Reordered " << order.size() << " account(s)" << std::endl;
    }

    // ================================================================
    // Балансы
    // ================================================================

    domain::Money updateAccountBalance(const std::string& accountId, const domain::Money& delta) override {
        domain::Money newBalance;

        txManager_->runInTransaction([&](ports::output::ITransaction& tx) {
            auto account = requireAccount(accountId);
            newBalance = account.balance + delta;

            accountRepo_->updateBalance(accountId, newBalance);
            history_->updateTodayBalance(accountId, newBalance, &tx);
        });

        std::cout << "[AccountLedger] Balance of " << accountId << " -> " << newBalance.toString() << std::endl;
        publishBalanceChanged(accountId, newBalance);
        return newBalance;
    }

    std::map<std::string, domain::Money> batchUpdateBalances(
        const std::map<std::string, domain::Money>& deltas,
        ports::output::ITransaction* tx = nullptr) override
    {
        std::map<std::string, domain::Money> pending;
        for (const auto& [accountId, delta] : deltas) {
            if (!delta.isZero()) {
                pending.emplace(accountId, delta);
            }
        }

        std::map<std::string, domain::Money> updated;
        if (pending.empty()) {
            return updated;
        }

        auto apply = [&](ports::output::ITransaction& active) {
            for (const auto& [accountId, delta] : pending) {
                auto account = accountRepo_->findById(accountId);
                if (!account) {
                    std::cerr << "[AccountLedger] Warning: Account " << accountId
                              << " not found, skipping balance update" << std::endl;
                    continue;
                }

                auto newBalance = account->balance + delta;
                accountRepo_->updateBalance(accountId, newBalance);
                history_->updateTodayBalance(accountId, newBalance, &active);
                updated[accountId] = newBalance;
            }
        };

        if (tx) {
            apply(*tx);
            return updated;
        }

        txManager_->runInTransaction(apply);
        publishBalanceChanges(updated);
        return updated;
    }

    void publishBalanceChanges(const std::map<std::string, domain::Money>& balances) override {
        for (const auto& [accountId, balance] : balances) {
            publishBalanceChanged(accountId, balance);
        }
    }

    int transferOperations(const std::string& fromAccountId, const std::string& toAccountId) override {
        requireTransferable(fromAccountId, toAccountId);

        int moved = 0;
        txManager_->runInTransaction([&](ports::output::ITransaction&) {
            moved = moveOperations(fromAccountId, toAccountId);
        });

        std::cout << "[AccountLedger] Transferred " << moved << " operation(s) from "
                  << fromAccountId << " to " << toAccountId << std::endl;
        return moved;
    }

    domain::Money adjustAccountBalance(
        const std::string& accountId,
        const domain::Money& targetBalance,
        const domain::ShadowCategories& shadow,
        const std::string& description = "") override
    {
        if (!shadow.isComplete()) {
            throw domain::IntegrityError("Shadow categories not found");
        }

        txManager_->runInTransaction([&](ports::output::ITransaction& tx) {
            auto account = requireAccount(accountId);
            const auto today = clock_->today();
            const auto current = account.balance;

            auto existing = operationRepo_->findLatestInCategoriesOn(
                accountId, today, {shadow.expenseId, shadow.incomeId});

            // Корректировки за день накапливаются в одной записи
            const auto previous = existing ? domain::effectOn(*existing, accountId) : domain::Money();
            const auto cumulative = previous + (targetBalance - current);
            const auto text = adjustmentDescription(current - previous, targetBalance, description);

            if (existing && cumulative.isZero()) {
                operationRepo_->deleteById(existing->id);
                std::cout << "[AccountLedger] Cumulative adjustment is zero, removed " << existing->id << std::endl;
            } else if (existing) {
                auto operation = *existing;
                fillAdjustment(operation, cumulative, shadow, text);
                operationRepo_->update(operation);
                std::cout << "[AccountLedger] Updated adjustment " << operation.id << ": "
                          << domain::toString(operation.type) << " " << operation.amount.toString() << std::endl;
            } else if (!cumulative.isZero()) {
                domain::Operation operation;
                operation.id = utils::IdGenerator::newId("op");
                operation.accountId = accountId;
                operation.date = today;
                operation.createdAt = clock_->now();
                fillAdjustment(operation, cumulative, shadow, text);
                operationRepo_->save(operation);
                std::cout << "[AccountLedger] Created adjustment " << operation.id << ": "
                          << domain::toString(operation.type) << " " << operation.amount.toString() << std::endl;
            }

            if (targetBalance != current) {
                accountRepo_->updateBalance(accountId, targetBalance);
                history_->updateTodayBalance(accountId, targetBalance, &tx);
            }
        });

        publishBalanceChanged(accountId, targetBalance);
        return targetBalance;
    }

    void deleteAccount(
        const std::string& accountId,
        const std::optional<std::string>& transferToAccountId = std::nullopt) override
    {
        requireAccount(accountId);

        const int count = operationRepo_->countByAccount(accountId);
        if (count > 0) {
            if (!transferToAccountId) {
                throw domain::IntegrityError(
                    "Cannot delete account: " + std::to_string(count) +
                    " transaction(s) are associated with this account. "
                    "Please delete or reassign the transactions first.",
                    count);
            }
            if (*transferToAccountId == accountId) {
                throw domain::IntegrityError("Cannot transfer operations to the account being deleted");
            }
            requireTransferable(accountId, *transferToAccountId);
        }

        txManager_->runInTransaction([&](ports::output::ITransaction&) {
            if (count > 0) {
                int moved = moveOperations(accountId, *transferToAccountId);
                std::cout << "[AccountLedger] Transferred " << moved
                          << " operation(s) before deleting " << accountId << std::endl;
            }
            accountRepo_->deleteById(accountId);
        });

        std::cout << "[AccountLedger] Deleted account " << accountId << std::endl;
        publishAccountChanged(accountId, "deleted");
    }

    // ================================================================
    // Чтение
    // ================================================================

    domain::Money getAccountBalance(const std::string& accountId) override {
        auto account = accountRepo_->findById(accountId);
        return account ? account->balance : domain::Money();
    }

    bool accountExists(const std::string& accountId) override {
        return accountRepo_->findById(accountId).has_value();
    }

    int getOperationCount(const std::string& accountId) override {
        return operationRepo_->countByAccount(accountId);
    }

private:
    std::shared_ptr<ports::output::IAccountRepository> accountRepo_;
    std::shared_ptr<ports::output::IOperationRepository> operationRepo_;
    std::shared_ptr<ports::input::IBalanceHistoryService> history_;
    std::shared_ptr<ports::output::ITransactionManager> txManager_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    domain::Account requireAccount(const std::string& accountId) {
        auto account = accountRepo_->findById(accountId);
        if (!account) {
            throw domain::NotFoundError("Account " + accountId + " not found");
        }
        return *account;
    }

    void requireTransferable(const std::string& fromAccountId, const std::string& toAccountId) {
        auto from = requireAccount(fromAccountId);
        auto to = requireAccount(toAccountId);

        if (from.currency != to.currency) {
            throw domain::IntegrityError(
                "Cannot transfer operations: accounts have different currencies (" +
                from.currency + " → " + to.currency + ")");
        }
    }

    int moveOperations(const std::string& fromAccountId, const std::string& toAccountId) {
        return operationRepo_->reassignSourceAccount(fromAccountId, toAccountId)
             + operationRepo_->reassignDestinationAccount(fromAccountId, toAccountId);
    }

    static void fillAdjustment(
        domain::Operation& operation,
        const domain::Money& cumulative,
        const domain::ShadowCategories& shadow,
        const std::string& text)
    {
        const bool negative = cumulative.isNegative();
        operation.type = negative ? domain::OperationType::EXPENSE : domain::OperationType::INCOME;
        operation.categoryId = negative ? shadow.expenseId : shadow.incomeId;
        operation.amount = cumulative.abs();
        operation.toAccountId.reset();
        operation.description = text;
    }

    static std::string adjustmentDescription(
        const domain::Money& original,
        const domain::Money& target,
        const std::string& description)
    {
        std::string text = "Balance adjusted from " + original.toString() + " → " + target.toString();
        return description.empty() ? text : description + "\n" + text;
    }

    void publishBalanceChanged(const std::string& accountId, const domain::Money& balance) {
        nlohmann::json event;
        event["account_id"] = accountId;
        event["balance"] = balance.toString();
        events::publishEvent(eventPublisher_, "AccountLedger", events::ACCOUNT_BALANCE_CHANGED, event);
    }

    void publishAccountChanged(const std::string& accountId, const std::string& action) {
        nlohmann::json event;
        event["account_id"] = accountId;
        event["action"] = action;
        events::publishEvent(eventPublisher_, "AccountLedger",
                             action == "deleted" ? events::ACCOUNT_DELETED : events::ACCOUNT_CHANGED,
                             event);
    }
};

} // namespace penny::application
