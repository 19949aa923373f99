#pragma once

#include "domain/Account.hpp"
#include <string>
#include <optional>
#include <vector>

namespace penny::ports::output {

/**
 * @brief Интерфейс репозитория счетов
 */
class IAccountRepository {
public:
    virtual ~IAccountRepository() = default;

    /// Все счета: displayOrder ASC, createdAt DESC
    virtual std::vector<domain::Account> findAll() = 0;
    virtual std::optional<domain::Account> findById(const std::string& accountId) = 0;

    virtual domain::Account save(const domain::Account& account) = 0;
    virtual bool update(const domain::Account& account) = 0;
    virtual bool updateBalance(const std::string& accountId, const domain::Money& balance) = 0;
    virtual bool updateDisplayOrder(const std::string& accountId, int displayOrder) = 0;
    virtual bool deleteById(const std::string& accountId) = 0;

    /// -1, если счетов нет
    virtual int maxDisplayOrder() = 0;
};

} // namespace penny::ports::output
