#pragma once

#include "ports/output/IAuditSink.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <optional>
#include <iostream>

namespace ledger::adapters::secondary
{

    /**
     * @brief Журнал аудита в PostgreSQL (таблица audit_log)
     *
     * Пачка пишется одной транзакцией. Любая ошибка БД пробрасывается,
     * и вызывающая операция откатывается.
     */
    class PostgresAuditSink : public ledger::ports::output::IAuditSink
    {
    public:
        explicit PostgresAuditSink(std::shared_ptr<ledger::settings::DbSettings> s) : settings_(std::move(s))
        {
            // Проверяем соединение, но не создаём таблицу (см. migrations/)
            pqxx::connection c(settings_->getConnectionString());
            std::cout << "[PostgresAuditSink] Connected to " << settings_->getRedactedConnectionString() << std::endl;
        }

        void record(const ledger::domain::AuditRecord &record) override
        {
            recordAll({record});
        }

        void recordAll(const std::vector<ledger::domain::AuditRecord> &records) override
        {
            try
            {
                pqxx::connection c(settings_->getConnectionString());
                pqxx::work t(c);
                for (const auto &r : records)
                {
                    t.exec_params(
                        "INSERT INTO audit_log (actor_id, action, entity_type, entity_id, "
                        "old_values, new_values, created_at) "
                        "VALUES ($1, $2, $3, $4, $5::jsonb, $6::jsonb, $7::timestamptz)",
                        r.actorId,
                        r.action,
                        r.entityType,
                        r.entityId,
                        toJsonb(r.before),
                        toJsonb(r.after),
                        r.timestamp.toString());
                }
                t.commit();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[PostgresAuditSink] recordAll() failed: " << e.what() << std::endl;
                throw;
            }
        }

    private:
        std::shared_ptr<ledger::settings::DbSettings> settings_;

        static std::optional<std::string> toJsonb(const nlohmann::json &snapshot)
        {
            if (snapshot.is_null())
                return std::nullopt;
            return snapshot.dump();
        }
    };

} // namespace ledger::adapters::secondary
