#pragma once

#include "ports/output/ITransactionManager.hpp"
#include "domain/errors/LedgerError.hpp"
#include "InMemoryLedgerStore.hpp"
#include <memory>
#include <iostream>

namespace penny::adapters::secondary {

/**
 * @brief Транзакции поверх InMemoryLedgerStore
 *
 * Перед работой снимается копия таблиц, при исключении она
 * восстанавливается. Вложенная транзакция запрещена, как в реальном
 * хранилище.
 */
class InMemoryTransactionManager : public ports::output::ITransactionManager {
public:
    explicit InMemoryTransactionManager(std::shared_ptr<InMemoryLedgerStore> store)
        : store_(std::move(store)) {}

    void runInTransaction(const std::function<void(ports::output::ITransaction&)>& work) override {
        InMemoryLedgerStore::Tables backup;
        {
            std::lock_guard<std::mutex> lock(store_->mutex);
            if (store_->inTransaction) {
                throw domain::TransactionConflictError(domain::ConflictKind::NESTED_TRANSACTION);
            }
            store_->inTransaction = true;
            backup = store_->tables;
        }

        Transaction tx;
        try {
            work(tx);
        } catch (...) {
            {
                std::lock_guard<std::mutex> lock(store_->mutex);
                store_->tables = std::move(backup);
                store_->inTransaction = false;
            }
            tx.active = false;
            std::cout << "[InMemoryTransactionManager] Rolled back" << std::endl;
            throw;
        }

        std::lock_guard<std::mutex> lock(store_->mutex);
        store_->inTransaction = false;
        tx.active = false;
    }

    bool inTransaction() const override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        return store_->inTransaction;
    }

private:
    struct Transaction : ports::output::ITransaction {
        bool active = true;
        bool isActive() const override { return active; }
    };

    std::shared_ptr<InMemoryLedgerStore> store_;
};

} // namespace penny::adapters::secondary
