#pragma once

#include "ports/input/IOperationJournal.hpp"
#include "ports/input/IAccountLedger.hpp"
#include "ports/output/IOperationRepository.hpp"
#include "ports/output/ICategoryRepository.hpp"
#include "ports/output/ITransactionManager.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "application/events/LedgerEvents.hpp"
#include "domain/errors/LedgerError.hpp"
#include "utils/IdGenerator.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace penny::application {

/**
 * @brief Журнал операций
 *
 * Запись операции и применение её влияния на балансы
 * (через AccountLedger::batchUpdateBalances) идут в одной транзакции.
 * События об изменении балансов публикуются после commit.
 */
class OperationJournal : public ports::input::IOperationJournal {
public:
    OperationJournal(
        std::shared_ptr<ports::output::IOperationRepository> operationRepo,
        std::shared_ptr<ports::output::ICategoryRepository> categoryRepo,
        std::shared_ptr<ports::input::IAccountLedger> ledger,
        std::shared_ptr<ports::output::ITransactionManager> txManager,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher
    ) : operationRepo_(std::move(operationRepo))
      , categoryRepo_(std::move(categoryRepo))
      , ledger_(std::move(ledger))
      , txManager_(std::move(txManager))
      , clock_(std::move(clock))
      , eventPublisher_(std::move(eventPublisher))
    {
        std::cout << "[OperationJournal] Created" << std::endl;
    }

    domain::Operation createOperation(const domain::OperationRequest& request) override {
        auto operation = buildOperation(request);
        operation.id = request.id ? *request.id : utils::IdGenerator::newId("op");
        operation.createdAt = clock_->now();

        std::map<std::string, domain::Money> balances;
        txManager_->runInTransaction([&](ports::output::ITransaction& tx) {
            operationRepo_->save(operation);
            balances = ledger_->batchUpdateBalances(domain::balanceChanges(operation), &tx);
        });
        ledger_->publishBalanceChanges(balances);

        std::cout << "[OperationJournal] Created " << domain::toString(operation.type) << " "
                  << operation.id << ": " << operation.amount.toString() << std::endl;
        publishOperationChanged(operation.id, "created");
        return operation;
    }

    domain::Operation updateOperation(const std::string& operationId, const domain::OperationRequest& request) override {
        auto existing = requireOperation(operationId);

        auto operation = buildOperation(request);
        operation.id = existing.id;
        operation.createdAt = existing.createdAt;

        // Новое влияние минус старое
        auto changes = domain::balanceChanges(operation);
        for (const auto& [accountId, effect] : domain::balanceChanges(existing)) {
            changes[accountId] -= effect;
        }

        std::map<std::string, domain::Money> balances;
        txManager_->runInTransaction([&](ports::output::ITransaction& tx) {
            operationRepo_->update(operation);
            balances = ledger_->batchUpdateBalances(changes, &tx);
        });
        ledger_->publishBalanceChanges(balances);

        std::cout << "[OperationJournal] Updated " << operation.id << std::endl;
        publishOperationChanged(operation.id, "updated");
        return operation;
    }

    void deleteOperation(const std::string& operationId) override {
        auto existing = requireOperation(operationId);

        std::map<std::string, domain::Money> changes;
        for (const auto& [accountId, effect] : domain::balanceChanges(existing)) {
            changes[accountId] = -effect;
        }

        std::map<std::string, domain::Money> balances;
        txManager_->runInTransaction([&](ports::output::ITransaction& tx) {
            operationRepo_->deleteById(operationId);
            balances = ledger_->batchUpdateBalances(changes, &tx);
        });
        ledger_->publishBalanceChanges(balances);

        std::cout << "[OperationJournal] Deleted " << operationId << std::endl;
        publishOperationChanged(operationId, "deleted");
    }

    std::optional<domain::Operation> getOperationById(const std::string& operationId) override {
        return operationRepo_->findById(operationId);
    }

    std::vector<domain::Operation> getOperationsByAccount(const std::string& accountId) override {
        return operationRepo_->findByAccount(accountId);
    }

    std::vector<domain::Operation> getOperationsByDateRange(
        const domain::CalendarDate& start,
        const domain::CalendarDate& end) override
    {
        return operationRepo_->findByDateRange(start, end);
    }

private:
    std::shared_ptr<ports::output::IOperationRepository> operationRepo_;
    std::shared_ptr<ports::output::ICategoryRepository> categoryRepo_;
    std::shared_ptr<ports::input::IAccountLedger> ledger_;
    std::shared_ptr<ports::output::ITransactionManager> txManager_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;

    domain::Operation requireOperation(const std::string& operationId) {
        auto operation = operationRepo_->findById(operationId);
        if (!operation) {
            throw domain::NotFoundError("Operation " + operationId + " not found");
        }
        return *operation;
    }

    /**
     * @brief Разобрать и проверить запрос (без id и createdAt)
     * @throws ValidationError, NotFoundError
     */
    domain::Operation buildOperation(const domain::OperationRequest& request) {
        domain::Operation operation;

        try {
            operation.type = domain::operationTypeFromString(request.type);
        } catch (const std::invalid_argument&) {
            throw domain::ValidationError("Invalid operation type: " + request.type);
        }

        operation.amount = domain::Money::parse(request.amount);
        if (!operation.amount.isPositive()) {
            throw domain::ValidationError("Amount must be greater than zero");
        }

        if (request.accountId.empty()) {
            throw domain::ValidationError("Account is required");
        }
        if (!ledger_->accountExists(request.accountId)) {
            throw domain::NotFoundError("Account " + request.accountId + " not found");
        }
        operation.accountId = request.accountId;

        if (operation.type == domain::OperationType::TRANSFER) {
            if (!request.toAccountId || request.toAccountId->empty()) {
                throw domain::ValidationError("Destination account is required for transfers");
            }
            if (*request.toAccountId == request.accountId) {
                throw domain::ValidationError("Cannot transfer to the same account");
            }
            if (!ledger_->accountExists(*request.toAccountId)) {
                throw domain::NotFoundError("Account " + *request.toAccountId + " not found");
            }
            operation.toAccountId = request.toAccountId;

            if (request.destinationAmount && !request.destinationAmount->empty()) {
                auto destination = domain::Money::parse(*request.destinationAmount);
                if (!destination.isPositive()) {
                    throw domain::ValidationError("Destination amount must be greater than zero");
                }
                operation.destinationAmount = destination;
            }
            operation.exchangeRate = request.exchangeRate;
            operation.sourceCurrency = request.sourceCurrency;
            operation.destinationCurrency = request.destinationCurrency;
        } else {
            if (!request.categoryId || request.categoryId->empty()) {
                throw domain::ValidationError("Category is required");
            }
            if (!categoryRepo_->findById(*request.categoryId)) {
                throw domain::NotFoundError("Category " + *request.categoryId + " not found");
            }
            operation.categoryId = request.categoryId;
        }

        operation.date = request.date.empty() ? clock_->today() : domain::CalendarDate::fromString(request.date);
        operation.description = request.description;
        return operation;
    }

    void publishOperationChanged(const std::string& operationId, const std::string& action) {
        nlohmann::json event;
        event["operation_id"] = operationId;
        event["action"] = action;
        events::publishEvent(eventPublisher_, "OperationJournal", events::OPERATION_CHANGED, event);
    }
};

} // namespace penny::application
