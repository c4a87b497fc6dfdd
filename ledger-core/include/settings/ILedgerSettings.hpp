#pragma once

#include <string>
#include <chrono>

namespace ledger::settings {

/**
 * @brief Интерфейс настроек ядра учёта
 */
class ILedgerSettings {
public:
    virtual ~ILedgerSettings() = default;

    virtual std::string getCurrency() const = 0;
    virtual std::chrono::milliseconds getLockTimeout() const = 0;
    virtual int getConflictRetries() const = 0;
    virtual std::string getAuditBackend() const = 0;
};

} // namespace ledger::settings
