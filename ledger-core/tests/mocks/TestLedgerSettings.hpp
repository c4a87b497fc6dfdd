#pragma once

#include "settings/ILedgerSettings.hpp"

namespace ledger::tests {

/**
 * @brief Настройки для тестов без чтения окружения
 */
class TestLedgerSettings : public settings::ILedgerSettings {
public:
    std::string currency = "BIF";
    std::chrono::milliseconds lockTimeout{2000};
    int conflictRetries = 1;
    std::string auditBackend = "memory";

    std::string getCurrency() const override { return currency; }
    std::chrono::milliseconds getLockTimeout() const override { return lockTimeout; }
    int getConflictRetries() const override { return conflictRetries; }
    std::string getAuditBackend() const override { return auditBackend; }
};

} // namespace ledger::tests
