#pragma once

#include "ports/output/IEventPublisher.hpp"
#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <iostream>

namespace penny::application::events {

// Ключи маршрутизации
inline constexpr const char* ACCOUNT_BALANCE_CHANGED = "account.balance_changed";
inline constexpr const char* ACCOUNT_CHANGED = "account.changed";
inline constexpr const char* ACCOUNT_DELETED = "account.deleted";
inline constexpr const char* OPERATION_CHANGED = "operation.changed";
inline constexpr const char* CATEGORY_CHANGED = "category.changed";
inline constexpr const char* BUDGET_CHANGED = "budget.changed";

/**
 * @brief Опубликовать событие об изменении
 *
 * Событие: только сигнал обновить UI. Ошибка публикации логируется
 * и не влияет на уже выполненную операцию.
 */
inline void publishEvent(
    const std::shared_ptr<ports::output::IEventPublisher>& publisher,
    const std::string& component,
    const std::string& routingKey,
    nlohmann::json event)
{
    if (!publisher) return;

    try {
        event["timestamp"] = domain::Timestamp::now().toString();
        publisher->publish(routingKey, event.dump());
    } catch (const std::exception& e) {
        std::cerr << "[" << component << "] Failed to publish " << routingKey
                  << ": " << e.what() << std::endl;
    }
}

} // namespace penny::application::events
