#pragma once

#include "Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace ledger::domain {

/**
 * @brief Запись аудита: кто, что, над чем, состояние до и после
 *
 * before/after - JSON-снимки; null для создаваемых объектов.
 */
struct AuditRecord {
    std::string actorId;
    std::string action;             ///< CREATE, UPDATE, DELETE, STATUS_CHANGE
    std::string entityType;         ///< "Movement", "JournalEntry"
    std::string entityId;
    nlohmann::json before;
    nlohmann::json after;
    Timestamp timestamp;
};

} // namespace ledger::domain
