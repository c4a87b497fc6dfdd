#pragma once

#include "settings/ILedgerSettings.hpp"
#include <cstdlib>
#include <string>

namespace ledger::settings {

/**
 * @brief Настройки ядра учёта
 *
 * Читает из ENV:
 * - LEDGER_CURRENCY (default: BIF)
 * - LEDGER_LOCK_TIMEOUT_MS (default: 2000)
 * - LEDGER_CONFLICT_RETRIES (default: 1)
 * - LEDGER_AUDIT_BACKEND (memory | postgres, default: memory)
 */
class LedgerSettings : public ILedgerSettings {
public:
    LedgerSettings() {
        if (const char* val = std::getenv("LEDGER_CURRENCY")) {
            currency_ = val;
        }
        if (const char* val = std::getenv("LEDGER_LOCK_TIMEOUT_MS")) {
            lockTimeout_ = std::chrono::milliseconds(std::stoi(val));
        }
        if (const char* val = std::getenv("LEDGER_CONFLICT_RETRIES")) {
            conflictRetries_ = std::stoi(val);
        }
        if (const char* val = std::getenv("LEDGER_AUDIT_BACKEND")) {
            auditBackend_ = val;
        }
    }

    std::string getCurrency() const override { return currency_; }
    std::chrono::milliseconds getLockTimeout() const override { return lockTimeout_; }
    int getConflictRetries() const override { return conflictRetries_; }
    std::string getAuditBackend() const override { return auditBackend_; }

private:
    std::string currency_ = "BIF";
    std::chrono::milliseconds lockTimeout_{2000};
    int conflictRetries_ = 1;
    std::string auditBackend_ = "memory";
};

} // namespace ledger::settings
