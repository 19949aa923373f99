#pragma once

#include <memory>

// Forward declarations - Ports
namespace penny::ports::input {
    class IAccountLedger;
    class ICategoryService;
    class IBalanceHistoryService;
    class IBudgetService;
}

namespace penny::settings {
    class LedgerSettings;
}

/**
 * @class PennyApp
 * @brief Загрузочное приложение ядра учёта
 *
 * Template Method:
 * 1. loadEnvironment() - аргументы командной строки и LedgerSettings
 * 2. configureInjection() - Boost.DI: хранилище (memory | postgres) и сервисы
 * 3. start() - теневые категории, восстановление истории, статусы бюджетов
 *
 * Архитектура: Hexagonal (Ports & Adapters)
 * - Secondary Adapters: InMemory* / Postgres*, SystemClock, LoggingEventPublisher
 * - Application Services: AccountLedger, CategoryService,
 *   BalanceHistoryService, BudgetService
 */
class PennyApp
{
public:
    PennyApp();
    ~PennyApp();

    void run(int argc, char* argv[]);

protected:
    /**
     * @brief Прочитать аргументы (--storage memory|postgres) и настройки
     */
    void loadEnvironment(int argc, char* argv[]);

    /**
     * @brief Собрать Boost.DI injector под выбранное хранилище
     *        и получить из него сервисы
     */
    void configureInjection();

    void start();

private:
    template <typename Injector>
    void resolveServices(Injector& injector);

    void printStartupBanner();

    std::shared_ptr<penny::settings::LedgerSettings> settings_;

    std::shared_ptr<penny::ports::input::IAccountLedger> ledger_;
    std::shared_ptr<penny::ports::input::ICategoryService> categories_;
    std::shared_ptr<penny::ports::input::IBalanceHistoryService> history_;
    std::shared_ptr<penny::ports::input::IBudgetService> budgets_;
};
