#pragma once

#include "ports/input/IBalanceHistoryService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/IOperationRepository.hpp"
#include "ports/output/IBalanceHistoryRepository.hpp"
#include "ports/output/ITransactionManager.hpp"
#include "ports/output/IClock.hpp"
#include "domain/errors/LedgerError.hpp"
#include <memory>
#include <map>
#include <optional>
#include <iostream>

namespace penny::application {

/**
 * @brief Восстановление истории балансов
 *
 * В хранилище есть только текущие балансы и журнал. Баланс на конец
 * прошедшего дня получается откатом операций от текущего баланса
 * назад, день за днём. Снимок за сегодня ведётся отдельно через
 * updateTodayBalance после каждой мутации.
 */
class BalanceHistoryService : public ports::input::IBalanceHistoryService {
public:
    BalanceHistoryService(
        std::shared_ptr<ports::output::IAccountRepository> accountRepo,
        std::shared_ptr<ports::output::IOperationRepository> operationRepo,
        std::shared_ptr<ports::output::IBalanceHistoryRepository> historyRepo,
        std::shared_ptr<ports::output::ITransactionManager> txManager,
        std::shared_ptr<ports::output::IClock> clock
    ) : accountRepo_(std::move(accountRepo))
      , operationRepo_(std::move(operationRepo))
      , historyRepo_(std::move(historyRepo))
      , txManager_(std::move(txManager))
      , clock_(std::move(clock))
    {
        std::cout << "[BalanceHistoryService] Created" << std::endl;
    }

    void populateCurrentMonthHistory(ports::output::ITransaction* tx = nullptr) override {
        try {
            if (tx) {
                populate();
            } else {
                txManager_->runInTransaction([this](ports::output::ITransaction&) {
                    populate();
                });
            }
            std::cout << "[BalanceHistoryService] Current month balance history populated" << std::endl;

        } catch (const domain::TransactionConflictError& e) {
            std::cout << "[BalanceHistoryService] Skipping balance history population: "
                      << e.what() << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[BalanceHistoryService] Failed to populate current month history: "
                      << e.what() << std::endl;
            if (tx) {
                std::cerr << "[BalanceHistoryService] Warning: Population failed during migration, but continuing"
                          << std::endl;
                return;
            }
            throw;
        }
    }

    void updateTodayBalance(
        const std::string& accountId,
        const domain::Money& balance,
        ports::output::ITransaction* tx = nullptr) override
    {
        try {
            domain::BalanceSnapshot snapshot{accountId, clock_->today(), balance, clock_->now()};

            if (tx) {
                historyRepo_->upsert(snapshot);
            } else {
                txManager_->runInTransaction([&](ports::output::ITransaction&) {
                    historyRepo_->upsert(snapshot);
                });
            }
        } catch (const std::exception& e) {
            std::cerr << "[BalanceHistoryService] Warning: Failed to update today's balance for "
                      << accountId << ": " << e.what() << std::endl;
        }
    }

    std::vector<domain::BalanceSnapshot> getBalanceHistory(
        const std::string& accountId,
        const domain::CalendarDate& start,
        const domain::CalendarDate& end) override
    {
        return historyRepo_->findRange(accountId, start, end);
    }

    std::optional<domain::Money> getAccountBalanceOnDate(
        const std::string& accountId,
        const domain::CalendarDate& date) override
    {
        auto snapshot = historyRepo_->findOn(accountId, date);
        if (!snapshot) {
            return std::nullopt;
        }
        return snapshot->balance;
    }

    std::vector<domain::AccountBalanceOnDate> getAllAccountsBalanceOnDate(const domain::CalendarDate& date) override {
        return historyRepo_->findAllOnDate(date);
    }

    std::optional<domain::CalendarDate> getLastSnapshotDate(const std::string& accountId) override {
        return historyRepo_->findLastDate(accountId);
    }

    void upsertBalanceHistory(
        const std::string& accountId,
        const domain::CalendarDate& date,
        const domain::Money& balance) override
    {
        domain::BalanceSnapshot snapshot{accountId, date, balance, clock_->now()};
        txManager_->runInTransaction([&](ports::output::ITransaction&) {
            historyRepo_->upsert(snapshot);
        });
        std::cout << "[BalanceHistoryService] Snapshot " << accountId << " @ " << date.toString()
                  << " set to " << balance.toString() << std::endl;
    }

    void deleteBalanceHistory(const std::string& accountId, const domain::CalendarDate& date) override {
        if (!historyRepo_->deleteEntry(accountId, date)) {
            std::cout << "[BalanceHistoryService] No snapshot " << accountId << " @ "
                      << date.toString() << " to delete" << std::endl;
        }
    }

    int deleteAccountHistory(const std::string& accountId) override {
        int removed = historyRepo_->deleteByAccount(accountId);
        std::cout << "[BalanceHistoryService] Removed " << removed << " snapshot(s) of " << accountId << std::endl;
        return removed;
    }

private:
    std::shared_ptr<ports::output::IAccountRepository> accountRepo_;
    std::shared_ptr<ports::output::IOperationRepository> operationRepo_;
    std::shared_ptr<ports::output::IBalanceHistoryRepository> historyRepo_;
    std::shared_ptr<ports::output::ITransactionManager> txManager_;
    std::shared_ptr<ports::output::IClock> clock_;

    void populate() {
        const auto today = clock_->today();
        const auto monthStart = today.firstDayOfMonth();

        for (const auto& account : accountRepo_->findAll()) {
            int written = populateAccount(account, today, monthStart);
            if (written > 0) {
                std::cout << "[BalanceHistoryService] " << account.id << ": "
                          << written << " snapshot(s) written" << std::endl;
            }
        }
    }

    /**
     * @brief Обратный проход для одного счёта
     *
     * Снимки пишутся за даты [max(создание счёта, 1-е число), сегодня).
     * Снимок за день пропускается, если баланс совпадает с последним
     * записанным. Существующие снимки не перезаписываются.
     */
    int populateAccount(
        const domain::Account& account,
        const domain::CalendarDate& today,
        const domain::CalendarDate& monthStart)
    {
        const auto created = account.createdAt.date();
        const auto floor = created > monthStart ? created : monthStart;
        if (floor >= today) {
            return 0;
        }

        domain::Money balance = account.balance;
        std::map<domain::CalendarDate, domain::Money> effectsByDay;

        for (const auto& op : operationRepo_->findByAccountAfter(account.id, floor)) {
            auto effect = domain::effectOn(op, account.id);
            if (op.date > today) {
                // Будущие операции уже учтены в текущем балансе
                balance -= effect;
            } else {
                effectsByDay[op.date] += effect;
            }
        }

        std::optional<domain::Money> lastWritten;
        int written = 0;

        for (auto day = today; day > floor; day = day.addDays(-1)) {
            auto it = effectsByDay.find(day);
            if (it != effectsByDay.end()) {
                balance -= it->second;
            }

            // balance: баланс на конец предыдущего дня
            if (lastWritten && *lastWritten == balance) {
                continue;
            }

            domain::BalanceSnapshot snapshot{account.id, day.addDays(-1), balance, clock_->now()};
            if (historyRepo_->insertIfAbsent(snapshot)) {
                ++written;
            }
            lastWritten = balance;
        }

        return written;
    }
};

} // namespace penny::application
