#pragma once

#include "ports/output/ITransactionManager.hpp"
#include "PgSession.hpp"
#include <memory>
#include <iostream>

namespace penny::adapters::secondary {

/**
 * @brief Транзакции PostgreSQL поверх общей PgSession
 */
class PostgresTransactionManager : public ports::output::ITransactionManager {
public:
    explicit PostgresTransactionManager(std::shared_ptr<PgSession> session)
        : session_(std::move(session)) {}

    void runInTransaction(const std::function<void(ports::output::ITransaction&)>& work) override {
        session_->begin();

        Transaction tx;
        try {
            work(tx);
        } catch (...) {
            tx.active = false;
            try {
                session_->rollback();
            } catch (const std::exception& rollbackError) {
                std::cerr << "[PostgresTransactionManager] Rollback failed: "
                          << rollbackError.what() << std::endl;
            }
            throw;
        }

        tx.active = false;
        session_->commit();
    }

    bool inTransaction() const override {
        return session_->inTransaction();
    }

private:
    struct Transaction : ports::output::ITransaction {
        bool active = true;
        bool isActive() const override { return active; }
    };

    std::shared_ptr<PgSession> session_;
};

} // namespace penny::adapters::secondary
