#include "PennyApp.hpp"

// Application Services
#include "application/AccountLedger.hpp"
#include "application/CategoryService.hpp"
#include "application/BalanceHistoryService.hpp"
#include "application/BudgetService.hpp"

// Secondary Adapters
#include "adapters/secondary/SystemClock.hpp"
#include "adapters/secondary/events/LoggingEventPublisher.hpp"
#include "adapters/secondary/persistence/memory/InMemoryLedgerStore.hpp"
#include "adapters/secondary/persistence/memory/InMemoryTransactionManager.hpp"
#include "adapters/secondary/persistence/memory/InMemoryAccountRepository.hpp"
#include "adapters/secondary/persistence/memory/InMemoryOperationRepository.hpp"
#include "adapters/secondary/persistence/memory/InMemoryCategoryRepository.hpp"
#include "adapters/secondary/persistence/memory/InMemoryBalanceHistoryRepository.hpp"
#include "adapters/secondary/persistence/memory/InMemoryBudgetRepository.hpp"
#include "adapters/secondary/persistence/postgres/PgSession.hpp"
#include "adapters/secondary/persistence/postgres/PostgresTransactionManager.hpp"
#include "adapters/secondary/persistence/postgres/PostgresAccountRepository.hpp"
#include "adapters/secondary/persistence/postgres/PostgresOperationRepository.hpp"
#include "adapters/secondary/persistence/postgres/PostgresCategoryRepository.hpp"
#include "adapters/secondary/persistence/postgres/PostgresBalanceHistoryRepository.hpp"
#include "adapters/secondary/persistence/postgres/PostgresBudgetRepository.hpp"

// Settings
#include "settings/DbSettings.hpp"
#include "settings/LedgerSettings.hpp"

#include <boost/di.hpp>
#include <cstdlib>
#include <string>
#include <iostream>

namespace di = boost::di;

using namespace penny;

namespace
{
    /**
     * @brief Биндинги, общие для любого хранилища
     *
     * Часы, публикация событий и Application Services (Input Ports).
     */
    auto serviceBindings()
    {
        return di::make_injector(
            di::bind<ports::output::IClock>()
                .to<adapters::secondary::SystemClock>()
                .in(di::singleton),

            di::bind<ports::output::IEventPublisher>()
                .to<adapters::secondary::LoggingEventPublisher>()
                .in(di::singleton),

            di::bind<ports::input::ICategoryService>()
                .to<application::CategoryService>()
                .in(di::singleton),

            di::bind<ports::input::IBalanceHistoryService>()
                .to<application::BalanceHistoryService>()
                .in(di::singleton),

            di::bind<ports::input::IAccountLedger>()
                .to<application::AccountLedger>()
                .in(di::singleton),

            di::bind<ports::input::IBudgetService>()
                .to<application::BudgetService>()
                .in(di::singleton));
    }
}

// ============================================================================
// PennyApp Implementation
// ============================================================================

PennyApp::PennyApp()
{
    std::cout << "[PennyApp] Application created" << std::endl;
}

PennyApp::~PennyApp()
{
    std::cout << "[PennyApp] Application destroyed" << std::endl;
}

void PennyApp::run(int argc, char* argv[])
{
    loadEnvironment(argc, argv);
    configureInjection();
    start();
}

void PennyApp::loadEnvironment(int argc, char* argv[])
{
    std::cout << "[PennyApp] Loading environment..." << std::endl;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--storage" && i + 1 < argc)
        {
            ::setenv("PENNY_STORAGE", argv[++i], 1);
        }
        else
        {
            std::cerr << "[PennyApp] Warning: Unknown argument " << arg << std::endl;
        }
    }

    settings_ = std::make_shared<settings::LedgerSettings>();

    std::cout << "[PennyApp] Environment loaded: storage=" << settings_->getStorage()
              << ", default currency=" << settings_->getDefaultCurrency() << std::endl;
}

void PennyApp::configureInjection()
{
    printStartupBanner();

    std::cout << "[PennyApp] Configuring Boost.DI injection..." << std::endl;

    if (settings_->useInMemoryStorage())
    {
        auto store = std::make_shared<adapters::secondary::InMemoryLedgerStore>();

        auto injector = di::make_injector(
            serviceBindings(),

            di::bind<settings::LedgerSettings>().to(settings_),
            di::bind<adapters::secondary::InMemoryLedgerStore>().to(store),

            di::bind<ports::output::ITransactionManager>()
                .to<adapters::secondary::InMemoryTransactionManager>()
                .in(di::singleton),

            di::bind<ports::output::IAccountRepository>()
                .to<adapters::secondary::InMemoryAccountRepository>()
                .in(di::singleton),

            di::bind<ports::output::IOperationRepository>()
                .to<adapters::secondary::InMemoryOperationRepository>()
                .in(di::singleton),

            di::bind<ports::output::ICategoryRepository>()
                .to<adapters::secondary::InMemoryCategoryRepository>()
                .in(di::singleton),

            di::bind<ports::output::IBalanceHistoryRepository>()
                .to<adapters::secondary::InMemoryBalanceHistoryRepository>()
                .in(di::singleton),

            di::bind<ports::output::IBudgetRepository>()
                .to<adapters::secondary::InMemoryBudgetRepository>()
                .in(di::singleton));

        resolveServices(injector);
    }
    else
    {
        auto session = std::make_shared<adapters::secondary::PgSession>(
            std::make_shared<settings::DbSettings>());

        auto injector = di::make_injector(
            serviceBindings(),

            di::bind<settings::LedgerSettings>().to(settings_),
            di::bind<adapters::secondary::PgSession>().to(session),

            di::bind<ports::output::ITransactionManager>()
                .to<adapters::secondary::PostgresTransactionManager>()
                .in(di::singleton),

            di::bind<ports::output::IAccountRepository>()
                .to<adapters::secondary::PostgresAccountRepository>()
                .in(di::singleton),

            di::bind<ports::output::IOperationRepository>()
                .to<adapters::secondary::PostgresOperationRepository>()
                .in(di::singleton),

            di::bind<ports::output::ICategoryRepository>()
                .to<adapters::secondary::PostgresCategoryRepository>()
                .in(di::singleton),

            di::bind<ports::output::IBalanceHistoryRepository>()
                .to<adapters::secondary::PostgresBalanceHistoryRepository>()
                .in(di::singleton),

            di::bind<ports::output::IBudgetRepository>()
                .to<adapters::secondary::PostgresBudgetRepository>()
                .in(di::singleton));

        resolveServices(injector);
    }

    std::cout << "\n📦 Boost.DI Injector configured:" << std::endl;
    std::cout << "  ✓ Secondary Adapters (" << settings_->getStorage() << ")" << std::endl;
    std::cout << "  ✓ Application Services (4 bindings)" << std::endl;
}

template <typename Injector>
void PennyApp::resolveServices(Injector& injector)
{
    categories_ = injector.template create<std::shared_ptr<ports::input::ICategoryService>>();
    history_ = injector.template create<std::shared_ptr<ports::input::IBalanceHistoryService>>();
    ledger_ = injector.template create<std::shared_ptr<ports::input::IAccountLedger>>();
    budgets_ = injector.template create<std::shared_ptr<ports::input::IBudgetService>>();
}

void PennyApp::start()
{
    auto shadow = categories_->ensureShadowCategories();
    std::cout << "[PennyApp] Shadow categories: " << shadow.expenseId
              << ", " << shadow.incomeId << std::endl;

    if (settings_->populateHistoryOnStart())
    {
        history_->populateCurrentMonthHistory();
    }

    auto accounts = ledger_->getAllAccounts();
    std::cout << "\n[PennyApp] Accounts: " << accounts.size() << std::endl;
    for (const auto& account : accounts)
    {
        std::cout << "  " << account.name << ": " << account.balance.toString()
                  << " " << account.currency
                  << " (" << ledger_->getOperationCount(account.id) << " operation(s))" << std::endl;
    }

    auto statuses = budgets_->calculateAllBudgetStatuses();
    std::cout << "\n[PennyApp] Active budgets: " << statuses.size() << std::endl;
    for (const auto& [budgetId, status] : statuses)
    {
        std::cout << "  " << budgetId << ": " << status.spent.toString()
                  << " / " << status.amount.toString()
                  << " (" << status.percentage << "%, " << domain::toString(status.status) << ")"
                  << " [" << status.periodStart.toString() << " .. " << status.periodEnd.toString() << "]"
                  << std::endl;
    }
}

void PennyApp::printStartupBanner()
{
    std::cout << R"(
    ____
   / __ \___  ____  ____  __  __
  / /_/ / _ \/ __ \/ __ \/ / / /
 / ____/  __/ / / / / / / /_/ /
/_/    \___/_/ /_/_/ /_/\__, /
                       /____/   Ledger
)" << std::endl;
}
