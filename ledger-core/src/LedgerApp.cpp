#include "LedgerApp.hpp"

// Application Services
#include "application/StockService.hpp"
#include "application/JournalService.hpp"
#include "application/LedgerCoordinator.hpp"
#include "application/PublishGate.hpp"

// Secondary Adapters
#include "adapters/secondary/InMemoryMovementStore.hpp"
#include "adapters/secondary/InMemoryJournalStore.hpp"
#include "adapters/secondary/InMemoryAuditSink.hpp"
#include "adapters/secondary/InMemoryLotRegistry.hpp"
#include "adapters/secondary/InMemoryAccountRepository.hpp"
#include "adapters/secondary/InMemoryAccountResolver.hpp"
#include "adapters/secondary/PostgresAuditSink.hpp"

// Settings
#include "settings/LedgerSettings.hpp"
#include "settings/DbSettings.hpp"

#include <boost/di.hpp>
#include <iostream>

namespace di = boost::di;

// ============================================================================
// LedgerApp Implementation
// ============================================================================

LedgerApp::LedgerApp()
    : LedgerApp(std::make_shared<ledger::settings::LedgerSettings>())
{
}

LedgerApp::LedgerApp(std::shared_ptr<ledger::settings::ILedgerSettings> settings)
    : settings_(std::move(settings))
{
    std::cout << "[LedgerApp] Application created" << std::endl;
    configureInjection();
}

LedgerApp::~LedgerApp()
{
    std::cout << "[LedgerApp] Application destroyed" << std::endl;
}

void LedgerApp::configureInjection()
{
    std::cout << "[LedgerApp] Configuring Boost.DI injection..." << std::endl;

    auditSink_ = createAuditSink();
    lotRegistry_ = std::make_shared<ledger::adapters::secondary::InMemoryLotRegistry>();
    accountResolver_ = std::make_shared<ledger::adapters::secondary::InMemoryAccountResolver>();

    // Одна точка публикации на оба хранилища
    auto publishGate = std::make_shared<ledger::application::PublishGate>();

    // ========================================================================
    // Layer 1: Secondary Adapters + Application Services
    // ========================================================================

    auto injector = di::make_injector(
        di::bind<ledger::settings::ILedgerSettings>().to(settings_),
        di::bind<ledger::application::PublishGate>().to(publishGate),

        // IAuditSink - выбран по LEDGER_AUDIT_BACKEND
        di::bind<ledger::ports::output::IAuditSink>().to(auditSink_),

        // Внешние справочники
        di::bind<ledger::ports::output::ILotRegistry>().to(lotRegistry_),
        di::bind<ledger::ports::output::IAccountResolver>().to(accountResolver_),

        // Stores - in-memory хранилища
        di::bind<ledger::ports::output::IMovementStore>()
            .to<ledger::adapters::secondary::InMemoryMovementStore>()
            .in(di::singleton),

        di::bind<ledger::ports::output::IJournalStore>()
            .to<ledger::adapters::secondary::InMemoryJournalStore>()
            .in(di::singleton),

        di::bind<ledger::ports::output::IAccountRepository>()
            .to<ledger::adapters::secondary::InMemoryAccountRepository>()
            .in(di::singleton)
    );

    accountRepository_ = injector.create<std::shared_ptr<ledger::ports::output::IAccountRepository>>();
    stock_ = injector.create<std::shared_ptr<ledger::application::StockService>>();
    journal_ = injector.create<std::shared_ptr<ledger::application::JournalService>>();

    // ========================================================================
    // Layer 2: Coordinator поверх уже созданных сервисов
    // ========================================================================

    auto coordinatorInjector = di::make_injector(
        di::bind<ledger::application::StockService>().to(stock_),
        di::bind<ledger::application::JournalService>().to(journal_),
        di::bind<ledger::ports::output::IAccountResolver>().to(accountResolver_),
        di::bind<ledger::ports::output::IAuditSink>().to(auditSink_)
    );

    coordinator_ = coordinatorInjector.create<std::shared_ptr<ledger::application::LedgerCoordinator>>();

    std::cout << "[LedgerApp] Boost.DI injection configured (currency="
              << settings_->getCurrency() << ", audit=" << settings_->getAuditBackend()
              << ")" << std::endl;
}

std::shared_ptr<ledger::ports::output::IAuditSink> LedgerApp::createAuditSink() const
{
    const auto backend = settings_->getAuditBackend();
    if (backend == "memory")
    {
        return std::make_shared<ledger::adapters::secondary::InMemoryAuditSink>();
    }
    if (backend == "postgres")
    {
        return std::make_shared<ledger::adapters::secondary::PostgresAuditSink>(
            std::make_shared<ledger::settings::DbSettings>());
    }
    throw ledger::domain::ValidationError("Unknown audit backend: " + backend);
}

std::shared_ptr<ledger::ports::input::IStockService> LedgerApp::stockService() const
{
    return stock_;
}

std::shared_ptr<ledger::ports::input::IJournalService> LedgerApp::journalService() const
{
    return journal_;
}

std::shared_ptr<ledger::ports::input::ILedgerCoordinator> LedgerApp::coordinator() const
{
    return coordinator_;
}

std::shared_ptr<ledger::ports::output::IAccountRepository> LedgerApp::accountRepository() const
{
    return accountRepository_;
}

std::shared_ptr<ledger::ports::output::IAuditSink> LedgerApp::auditSink() const
{
    return auditSink_;
}

std::shared_ptr<ledger::adapters::secondary::InMemoryLotRegistry> LedgerApp::lotRegistry() const
{
    return lotRegistry_;
}

std::shared_ptr<ledger::adapters::secondary::InMemoryAccountResolver> LedgerApp::accountResolver() const
{
    return accountResolver_;
}
