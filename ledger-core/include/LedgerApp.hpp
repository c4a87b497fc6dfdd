#pragma once

#include <memory>

// Forward declarations - Ports
namespace ledger::ports::input {
    class IStockService;
    class IJournalService;
    class ILedgerCoordinator;
}

namespace ledger::ports::output {
    class IAuditSink;
    class IAccountRepository;
}

namespace ledger::settings {
    class ILedgerSettings;
}

namespace ledger::application {
    class StockService;
    class JournalService;
    class LedgerCoordinator;
}

namespace ledger::adapters::secondary {
    class InMemoryLotRegistry;
    class InMemoryAccountResolver;
}

/**
 * @class LedgerApp
 * @brief Корень композиции ядра учёта
 *
 * Архитектура: Hexagonal (Ports & Adapters)
 * - Input Ports: IStockService, IJournalService, ILedgerCoordinator
 * - Secondary Adapters: InMemory* хранилища, InMemory/Postgres аудит
 *
 * Dependency Injection: Boost.DI. Хранилища - singleton в рамках одного
 * LedgerApp, поэтому сервисы видят одно и то же состояние.
 *
 * Реестр партий и привязка счетов держателей - внешние справочники;
 * приложение отдаёт их in-memory реализации для наполнения.
 */
class LedgerApp
{
public:
    /**
     * @brief Настройки из окружения (LedgerSettings)
     */
    LedgerApp();

    explicit LedgerApp(std::shared_ptr<ledger::settings::ILedgerSettings> settings);
    ~LedgerApp();

    std::shared_ptr<ledger::ports::input::IStockService> stockService() const;
    std::shared_ptr<ledger::ports::input::IJournalService> journalService() const;
    std::shared_ptr<ledger::ports::input::ILedgerCoordinator> coordinator() const;

    std::shared_ptr<ledger::ports::output::IAccountRepository> accountRepository() const;
    std::shared_ptr<ledger::ports::output::IAuditSink> auditSink() const;
    std::shared_ptr<ledger::adapters::secondary::InMemoryLotRegistry> lotRegistry() const;
    std::shared_ptr<ledger::adapters::secondary::InMemoryAccountResolver> accountResolver() const;

private:
    std::shared_ptr<ledger::settings::ILedgerSettings> settings_;
    std::shared_ptr<ledger::ports::output::IAuditSink> auditSink_;
    std::shared_ptr<ledger::ports::output::IAccountRepository> accountRepository_;
    std::shared_ptr<ledger::adapters::secondary::InMemoryLotRegistry> lotRegistry_;
    std::shared_ptr<ledger::adapters::secondary::InMemoryAccountResolver> accountResolver_;
    std::shared_ptr<ledger::application::StockService> stock_;
    std::shared_ptr<ledger::application::JournalService> journal_;
    std::shared_ptr<ledger::application::LedgerCoordinator> coordinator_;

    /**
     * @brief Настроить Boost.DI и создать сервисы
     */
    void configureInjection();

    /**
     * @brief Выбрать приёмник аудита по LEDGER_AUDIT_BACKEND
     * @throws ValidationError для неизвестного значения
     */
    std::shared_ptr<ledger::ports::output::IAuditSink> createAuditSink() const;
};
