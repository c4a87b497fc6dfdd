#pragma once

#include "domain/Errors.hpp"
#include <string>
#include <cstdlib>
#include <regex>

namespace ledger::settings {

/**
 * @brief Строка подключения журнала аудита к PostgreSQL
 *
 * LEDGER_AUDIT_DSN задаёт строку целиком (libpq conninfo или URI).
 * Без неё строка собирается из LEDGER_DB_HOST, LEDGER_DB_PORT,
 * LEDGER_DB_NAME, LEDGER_DB_USER, LEDGER_DB_PASSWORD.
 */
class DbSettings {
public:
    DbSettings() : connectionString_(readConnectionString()) {}

    const std::string& getConnectionString() const { return connectionString_; }

    /**
     * @brief Строка подключения для логов, пароль скрыт
     */
    std::string getRedactedConnectionString() const {
        static const std::regex conninfoPassword(R"(password=\S*)");
        static const std::regex uriPassword(R"(://([^:/@]*):[^@]*@)");
        auto redacted = std::regex_replace(connectionString_, conninfoPassword, "password=***");
        return std::regex_replace(redacted, uriPassword, "://$1:***@");
    }

private:
    std::string connectionString_;

    static std::string readConnectionString() {
        if (const char* dsn = std::getenv("LEDGER_AUDIT_DSN")) {
            if (*dsn != '\0') {
                return dsn;
            }
        }

        auto port = env("LEDGER_DB_PORT", "5432");
        if (port.empty() || port.find_first_not_of("0123456789") != std::string::npos) {
            throw domain::ValidationError("LEDGER_DB_PORT must be numeric: " + port);
        }
        return "host=" + env("LEDGER_DB_HOST", "ledger-postgres") +
               " port=" + port +
               " dbname=" + env("LEDGER_DB_NAME", "ledger_db") +
               " user=" + env("LEDGER_DB_USER", "ledger_user") +
               " password=" + env("LEDGER_DB_PASSWORD", "");
    }

    static std::string env(const char* name, const char* fallback) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(fallback);
    }
};

} // namespace ledger::settings
