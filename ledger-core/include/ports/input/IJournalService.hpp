#pragma once

#include "domain/JournalEntry.hpp"
#include "domain/Money.hpp"
#include <string>

namespace ledger::ports::input {

/**
 * @brief Итоги оборотной ведомости по проведённым записям
 */
struct TrialBalance {
    domain::Money debitTotal;
    domain::Money creditTotal;

    bool isBalanced() const { return debitTotal == creditTotal; }
};

/**
 * @brief Двойная запись: черновики, проведение, сторно
 */
class IJournalService {
public:
    virtual ~IJournalService() = default;

    /**
     * @brief Создать черновик
     * @throws UnbalancedEntryError до любой записи в хранилище
     */
    virtual domain::JournalEntry createEntry(const domain::JournalEntryRequest& request) = 0;

    /**
     * @brief Заменить черновик целиком (id сохраняется)
     */
    virtual domain::JournalEntry replaceDraft(
        const std::string& entryId,
        const domain::JournalEntryRequest& request) = 0;

    virtual void discardDraft(const std::string& entryId, const std::string& actorId) = 0;

    /**
     * @brief DRAFT -> POSTED
     * @throws ImmutableRecordViolation если запись уже проведена
     */
    virtual domain::JournalEntry post(const std::string& entryId, const std::string& posterId) = 0;

    /**
     * @brief Сторно: новая проведённая запись с переставленными дебетом и кредитом
     */
    virtual domain::JournalEntry reverse(const std::string& entryId, const std::string& posterId) = 0;

    virtual domain::JournalEntry getEntry(const std::string& entryId) = 0;

    /**
     * @brief Дебет минус кредит по проведённым строкам счёта
     */
    virtual domain::Money getAccountBalance(const std::string& accountId) = 0;

    virtual TrialBalance getTrialBalance() = 0;
};

} // namespace ledger::ports::input
