#pragma once

#include <string>

namespace penny::ports::output {

/**
 * @brief Интерфейс для публикации событий об изменениях
 *
 * Используется только как триггер обновления UI, логика ядра
 * от доставки не зависит.
 */
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    /**
     * @brief Опубликовать событие
     * @param routingKey Ключ маршрутизации (например, "account.balance_changed")
     * @param message JSON-сообщение
     */
    virtual void publish(const std::string& routingKey, const std::string& message) = 0;
};

} // namespace penny::ports::output
