#pragma once

#include "domain/JournalEntry.hpp"
#include "domain/Timestamp.hpp"
#include <vector>
#include <optional>
#include <string>

namespace ledger::ports::output {

/**
 * @brief Хранилище записей журнала
 *
 * Черновики можно заменять и удалять целиком. Проведённые записи
 * не меняются: для них есть только чтение.
 */
class IJournalStore {
public:
    virtual ~IJournalStore() = default;

    /**
     * @throws ValidationError если строк нет или в строке не ровно одна положительная сумма
     */
    virtual std::string append(const domain::JournalEntry& entry) = 0;

    virtual std::optional<domain::JournalEntry> get(const std::string& id) const = 0;

    /**
     * @throws ImmutableRecordViolation если запись уже проведена
     */
    virtual void replaceDraft(const domain::JournalEntry& entry) = 0;

    /**
     * @throws ImmutableRecordViolation если запись уже проведена
     */
    virtual void removeDraft(const std::string& id) = 0;

    /**
     * @brief Убрать запись, чья единица работы не была опубликована
     *
     * Вызывается только внутри той же публикации, что и append().
     */
    virtual void retract(const std::string& id) = 0;

    /**
     * @brief DRAFT -> POSTED
     * @throws ImmutableRecordViolation если запись уже проведена
     */
    virtual domain::JournalEntry markPosted(
        const std::string& id,
        const std::string& posterId,
        const domain::Timestamp& postedAt) = 0;

    virtual std::vector<domain::JournalLine> postedLinesForAccount(const std::string& accountId) const = 0;
    virtual std::vector<domain::JournalEntry> postedEntries() const = 0;
    virtual std::optional<domain::JournalEntry> findReversalOf(const std::string& entryId) const = 0;
    virtual size_t count() const = 0;
};

} // namespace ledger::ports::output
