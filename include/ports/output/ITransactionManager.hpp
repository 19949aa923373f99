#pragma once

#include <functional>

namespace penny::ports::output {

/**
 * @brief Открытая транзакция хранилища
 *
 * Репозитории автоматически работают внутри активной транзакции.
 * Наличие ссылки на ITransaction у вызывающего означает, что
 * открывать новую транзакцию нельзя.
 */
class ITransaction {
public:
    virtual ~ITransaction() = default;

    virtual bool isActive() const = 0;
};

/**
 * @brief Менеджер транзакций (run-in-transaction примитив хранилища)
 *
 * Хранилище не поддерживает вложенные транзакции: повторный вызов
 * runInTransaction внутри открытой транзакции бросает
 * TransactionConflictError(NESTED_TRANSACTION).
 */
class ITransactionManager {
public:
    virtual ~ITransactionManager() = default;

    /**
     * @brief Выполнить work атомарно
     *
     * Исключение из work откатывает транзакцию и пробрасывается дальше.
     */
    virtual void runInTransaction(const std::function<void(ITransaction&)>& work) = 0;

    virtual bool inTransaction() const = 0;
};

} // namespace penny::ports::output
