#pragma once

#include <stdexcept>
#include <string>

namespace penny::domain {

/**
 * @brief Базовое исключение ядра учёта
 *
 * Все ошибки сервисов наследуются от него, чтобы UI-слой мог
 * показать сообщение пользователю одним catch.
 */
class LedgerError : public std::runtime_error {
public:
    explicit LedgerError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Некорректные входные данные (бюджет, категория, сумма)
 *
 * Обнаруживаются до любой записи в хранилище.
 */
class ValidationError : public LedgerError {
public:
    explicit ValidationError(const std::string& message)
        : LedgerError(message) {}
};

/**
 * @brief Нарушение ограничения целостности
 *
 * Удаление используемого счёта/категории, цикл в дереве категорий,
 * перенос операций между счетами в разных валютах.
 */
class IntegrityError : public LedgerError {
public:
    explicit IntegrityError(const std::string& message, int count = 0)
        : LedgerError(message), count_(count) {}

    /// Количество связанных записей (0, если неприменимо)
    int count() const { return count_; }

private:
    int count_;
};

/**
 * @brief Сущность с указанным ID не найдена
 */
class NotFoundError : public LedgerError {
public:
    explicit NotFoundError(const std::string& message)
        : LedgerError(message) {}
};

/**
 * @brief Известные (восстановимые) конфликты транзакций
 *
 * Хранилище не поддерживает вложенные транзакции. Такие ошибки
 * означают "попробовать позже", а не поломку данных.
 */
enum class ConflictKind {
    NESTED_TRANSACTION,     ///< Попытка открыть транзакцию внутри транзакции
    CANNOT_ROLLBACK,        ///< Откат невозможен (транзакция уже закрыта драйвером)
    NO_ACTIVE_TRANSACTION   ///< commit/rollback без открытой транзакции
};

inline std::string toString(ConflictKind kind) {
    switch (kind) {
        case ConflictKind::NESTED_TRANSACTION:    return "transaction within a transaction";
        case ConflictKind::CANNOT_ROLLBACK:       return "cannot rollback";
        case ConflictKind::NO_ACTIVE_TRANSACTION: return "no transaction is active";
    }
    return "unknown transaction conflict";
}

/**
 * @brief Восстановимый конфликт транзакций с типизированным тегом
 */
class TransactionConflictError : public LedgerError {
public:
    explicit TransactionConflictError(ConflictKind kind, const std::string& details = "")
        : LedgerError(details.empty()
              ? "Transaction conflict: " + toString(kind)
              : "Transaction conflict: " + toString(kind) + " (" + details + ")")
        , kind_(kind) {}

    ConflictKind kind() const { return kind_; }

private:
    ConflictKind kind_;
};

} // namespace penny::domain
