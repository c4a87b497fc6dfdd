#pragma once

#include "domain/AuditRecord.hpp"
#include "domain/Movement.hpp"
#include "domain/JournalEntry.hpp"
#include <nlohmann/json.hpp>

namespace ledger::application::audit {

inline nlohmann::json snapshot(const domain::Movement& m) {
    nlohmann::json json;
    json["id"] = m.id();
    json["entity_kind"] = domain::toString(m.entity().kind);
    json["entity_id"] = m.entity().id;
    json["lot_id"] = m.lotId();
    json["movement_kind"] = domain::toString(m.kind());
    json["quantity"] = m.quantity();
    json["reference_id"] = m.reference().id;
    json["reference_kind"] = m.reference().kind;
    json["actor_id"] = m.actorId();
    json["created_at"] = m.createdAt().toString();
    return json;
}

inline nlohmann::json snapshot(const domain::JournalEntry& e) {
    nlohmann::json json;
    json["id"] = e.id;
    json["date"] = e.date;
    json["reference"] = e.reference;
    json["description"] = e.description;
    json["status"] = domain::toString(e.status);
    json["created_by"] = e.createdBy;
    json["posted_by"] = e.postedBy ? nlohmann::json(*e.postedBy) : nlohmann::json();
    json["posted_at"] = e.postedAt ? nlohmann::json(e.postedAt->toString()) : nlohmann::json();
    json["reversal_of"] = e.reversalOf ? nlohmann::json(*e.reversalOf) : nlohmann::json();

    nlohmann::json lines = nlohmann::json::array();
    for (const auto& line : e.lines) {
        lines.push_back({
            {"account_id", line.accountId},
            {"debit", line.debit.toString()},
            {"credit", line.credit.toString()},
            {"currency", line.debit.currency}
        });
    }
    json["lines"] = lines;
    return json;
}

inline domain::AuditRecord movementCreated(const domain::Movement& m) {
    return domain::AuditRecord{
        m.actorId(), "CREATE", "Movement", m.id(),
        nullptr, snapshot(m), domain::Timestamp::now()};
}

inline domain::AuditRecord entryCreated(const domain::JournalEntry& e) {
    auto draft = e;
    draft.status = domain::EntryStatus::DRAFT;
    draft.postedBy.reset();
    draft.postedAt.reset();
    return domain::AuditRecord{
        e.createdBy, "CREATE", "JournalEntry", e.id,
        nullptr, snapshot(draft), domain::Timestamp::now()};
}

inline domain::AuditRecord entryReplaced(
    const domain::JournalEntry& before,
    const domain::JournalEntry& after)
{
    return domain::AuditRecord{
        after.createdBy, "UPDATE", "JournalEntry", after.id,
        snapshot(before), snapshot(after), domain::Timestamp::now()};
}

inline domain::AuditRecord entryDiscarded(const domain::JournalEntry& before, const std::string& actorId) {
    return domain::AuditRecord{
        actorId, "DELETE", "JournalEntry", before.id,
        snapshot(before), nullptr, domain::Timestamp::now()};
}

/**
 * @brief Переход DRAFT -> POSTED; before восстанавливается из after
 */
inline domain::AuditRecord entryPosted(const domain::JournalEntry& after) {
    auto before = after;
    before.status = domain::EntryStatus::DRAFT;
    before.postedBy.reset();
    before.postedAt.reset();
    return domain::AuditRecord{
        after.postedBy.value_or(""), "STATUS_CHANGE", "JournalEntry", after.id,
        snapshot(before), snapshot(after), domain::Timestamp::now()};
}

} // namespace ledger::application::audit
