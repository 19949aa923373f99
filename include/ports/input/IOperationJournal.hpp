#pragma once

#include "domain/Operation.hpp"
#include "domain/OperationRequest.hpp"
#include <string>
#include <optional>
#include <vector>

namespace penny::ports::input {

/**
 * @brief Интерфейс журнала операций
 *
 * Запись операции и изменение балансов выполняются в одной транзакции.
 */
class IOperationJournal {
public:
    virtual ~IOperationJournal() = default;

    virtual domain::Operation createOperation(const domain::OperationRequest& request) = 0;

    /// Откатывает влияние старой версии и применяет новую
    virtual domain::Operation updateOperation(const std::string& operationId, const domain::OperationRequest& request) = 0;

    virtual void deleteOperation(const std::string& operationId) = 0;

    virtual std::optional<domain::Operation> getOperationById(const std::string& operationId) = 0;
    virtual std::vector<domain::Operation> getOperationsByAccount(const std::string& accountId) = 0;
    virtual std::vector<domain::Operation> getOperationsByDateRange(
        const domain::CalendarDate& start,
        const domain::CalendarDate& end) = 0;
};

} // namespace penny::ports::input
