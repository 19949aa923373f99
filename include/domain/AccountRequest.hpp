#pragma once

#include <string>
#include <optional>

namespace penny::domain {

/**
 * @brief Запрос на создание счёта
 */
struct AccountRequest {
    std::optional<std::string> id;          ///< Если не задан: генерируется
    std::string name;
    std::string balance = "0";              ///< Начальный баланс
    std::string currency;                   ///< Пусто: валюта по умолчанию из настроек
    std::optional<int> displayOrder;        ///< Пусто: в конец списка
    bool hidden = false;
    std::optional<std::string> monthlyTarget;
};

/**
 * @brief Изменение свойств счёта (баланс здесь не меняется)
 *
 * Незаданные поля не трогаются.
 */
struct AccountUpdate {
    std::optional<std::string> name;
    std::optional<std::string> currency;
    std::optional<bool> hidden;
    std::optional<std::string> monthlyTarget;   ///< Пустая строка: сбросить цель
};

/**
 * @brief Новая позиция счёта в списке
 */
struct AccountOrder {
    std::string id;
    int displayOrder = 0;
};

} // namespace penny::domain
