#pragma once

#include "ports/input/IJournalService.hpp"
#include "ports/output/IJournalStore.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/IAuditSink.hpp"
#include "settings/ILedgerSettings.hpp"
#include "application/AuditRecords.hpp"
#include "application/PublishGate.hpp"
#include "domain/Errors.hpp"
#include "utils/UuidGenerator.hpp"
#include <memory>
#include <mutex>
#include <regex>
#include <unordered_set>
#include <iostream>

namespace ledger::application {

/**
 * @brief Сервис журнала проводок
 *
 * Каждая операция: валидация -> аудит -> запись в хранилище.
 * Ошибка аудита означает, что хранилище не тронуто.
 *
 * Мутации одной записи сериализуются "захватом" её id: второй
 * параллельный вызов получает ConcurrencyConflict, а не ждёт.
 */
class JournalService : public ports::input::IJournalService {
public:
    JournalService(
        std::shared_ptr<ports::output::IJournalStore> store,
        std::shared_ptr<ports::output::IAccountRepository> accounts,
        std::shared_ptr<ports::output::IAuditSink> auditSink,
        std::shared_ptr<settings::ILedgerSettings> settings,
        std::shared_ptr<PublishGate> gate
    ) : store_(std::move(store))
      , accounts_(std::move(accounts))
      , auditSink_(std::move(auditSink))
      , settings_(std::move(settings))
      , gate_(std::move(gate))
    {
        std::cout << "[JournalService] Created" << std::endl;
    }

    domain::JournalEntry createEntry(const domain::JournalEntryRequest& request) override {
        auto entry = buildEntry(utils::UuidGenerator::generateWithPrefix("je"), request);

        auditSink_->record(audit::entryCreated(entry));
        store_->append(entry);

        std::cout << "[JournalService] Draft created: " << entry.id
                  << " total=" << entry.debitTotal().toString() << std::endl;
        return entry;
    }

    domain::JournalEntry replaceDraft(
        const std::string& entryId,
        const domain::JournalEntryRequest& request) override
    {
        EntryClaim claim(*this, entryId);

        auto before = requireEntry(entryId);
        if (before.isPosted()) {
            throw domain::ImmutableRecordViolation("Posted entry cannot be replaced: " + entryId);
        }
        auto after = buildEntry(entryId, request);
        if (after.createdBy.empty()) {
            after.createdBy = before.createdBy;
        }

        auditSink_->record(audit::entryReplaced(before, after));
        store_->replaceDraft(after);

        std::cout << "[JournalService] Draft replaced: " << entryId << std::endl;
        return after;
    }

    void discardDraft(const std::string& entryId, const std::string& actorId) override {
        EntryClaim claim(*this, entryId);

        auto before = requireEntry(entryId);
        if (before.isPosted()) {
            throw domain::ImmutableRecordViolation("Posted entry cannot be discarded: " + entryId);
        }

        auditSink_->record(audit::entryDiscarded(before, actorId));
        store_->removeDraft(entryId);

        std::cout << "[JournalService] Draft discarded: " << entryId << std::endl;
    }

    domain::JournalEntry post(const std::string& entryId, const std::string& posterId) override {
        EntryClaim claim(*this, entryId);

        auto entry = requireEntry(entryId);
        if (entry.isPosted()) {
            std::cerr << "[JournalService] REJECTED: entry already posted: " << entryId << std::endl;
            throw domain::ImmutableRecordViolation("Journal entry is already posted: " + entryId);
        }
        requireActor(posterId);
        validateLines(entry.lines);

        auto postedAt = domain::Timestamp::now();
        entry.status = domain::EntryStatus::POSTED;
        entry.postedBy = posterId;
        entry.postedAt = postedAt;

        auditSink_->record(audit::entryPosted(entry));
        auto posted = store_->markPosted(entryId, posterId, postedAt);

        std::cout << "[JournalService] Posted: " << entryId << " by " << posterId << std::endl;
        return posted;
    }

    domain::JournalEntry reverse(const std::string& entryId, const std::string& posterId) override {
        EntryClaim claim(*this, entryId);

        auto original = requireEntry(entryId);
        if (!original.isPosted()) {
            throw domain::ValidationError("Only posted entries can be reversed: " + entryId);
        }
        if (auto existing = store_->findReversalOf(entryId)) {
            throw domain::ValidationError(
                "Journal entry " + entryId + " is already reversed by " + existing->id);
        }
        requireActor(posterId);

        domain::JournalEntry reversal;
        reversal.id = utils::UuidGenerator::generateWithPrefix("je");
        reversal.date = domain::Timestamp::now().toDateString();
        reversal.reference = original.id;
        reversal.description = "Reversal of " + original.id;
        if (!original.description.empty()) {
            reversal.description += ": " + original.description;
        }
        reversal.createdBy = posterId;
        reversal.reversalOf = original.id;
        for (const auto& line : original.lines) {
            reversal.lines.push_back(domain::JournalLine{line.accountId, line.credit, line.debit});
        }
        stampPosted(reversal, posterId);

        auditSink_->recordAll({audit::entryCreated(reversal), audit::entryPosted(reversal)});
        store_->append(reversal);

        std::cout << "[JournalService] Reversed: " << entryId << " -> " << reversal.id << std::endl;
        return reversal;
    }

    domain::JournalEntry getEntry(const std::string& entryId) override {
        auto reading = gate_->read();
        return requireEntry(entryId);
    }

    domain::Money getAccountBalance(const std::string& accountId) override {
        if (!accounts_->findById(accountId)) {
            throw domain::ResourceNotFoundError("Account not found: " + accountId);
        }
        auto balance = domain::Money::zero(settings_->getCurrency());
        auto reading = gate_->read();
        for (const auto& line : store_->postedLinesForAccount(accountId)) {
            balance += line.debit;
            balance = balance - line.credit;
        }
        return balance;
    }

    ports::input::TrialBalance getTrialBalance() override {
        ports::input::TrialBalance result{
            domain::Money::zero(settings_->getCurrency()),
            domain::Money::zero(settings_->getCurrency())
        };
        auto reading = gate_->read();
        for (const auto& entry : store_->postedEntries()) {
            result.debitTotal += entry.debitTotal();
            result.creditTotal += entry.creditTotal();
        }
        return result;
    }

    // ========================================================================
    // Двухфазный API для LedgerCoordinator
    // ========================================================================

    /**
     * @brief Собрать и проверить проведённую запись, ничего не записывая
     */
    domain::JournalEntry preparePostedEntry(
        const domain::JournalEntryRequest& request,
        const std::string& posterId)
    {
        requireActor(posterId);
        auto entry = buildEntry(utils::UuidGenerator::generateWithPrefix("je"), request);
        stampPosted(entry, posterId);
        return entry;
    }

    /**
     * @brief Записать запись, подготовленную preparePostedEntry (аудит уже сделан)
     *
     * Вызывается под PublishGate::publish() вызывающего.
     */
    void commitPostedEntry(const domain::JournalEntry& entry) {
        store_->append(entry);
        std::cout << "[JournalService] Posted: " << entry.id
                  << " total=" << entry.debitTotal().toString() << std::endl;
    }

    /**
     * @brief Откатить commitPostedEntry() в той же публикации
     */
    void retractPostedEntry(const std::string& entryId) {
        store_->retract(entryId);
        std::cerr << "[JournalService] Retracted unpublished entry: " << entryId << std::endl;
    }

private:
    std::shared_ptr<ports::output::IJournalStore> store_;
    std::shared_ptr<ports::output::IAccountRepository> accounts_;
    std::shared_ptr<ports::output::IAuditSink> auditSink_;
    std::shared_ptr<settings::ILedgerSettings> settings_;
    std::shared_ptr<PublishGate> gate_;

    std::mutex claimsMutex_;
    std::unordered_set<std::string> claims_;

    class EntryClaim {
    public:
        EntryClaim(JournalService& service, const std::string& entryId)
            : service_(service), entryId_(entryId)
        {
            std::lock_guard<std::mutex> lock(service_.claimsMutex_);
            if (!service_.claims_.insert(entryId_).second) {
                throw domain::ConcurrencyConflict("Journal entry is being modified: " + entryId_);
            }
        }

        ~EntryClaim() {
            std::lock_guard<std::mutex> lock(service_.claimsMutex_);
            service_.claims_.erase(entryId_);
        }

        EntryClaim(const EntryClaim&) = delete;
        EntryClaim& operator=(const EntryClaim&) = delete;

    private:
        JournalService& service_;
        std::string entryId_;
    };

    domain::JournalEntry requireEntry(const std::string& entryId) const {
        auto entry = store_->get(entryId);
        if (!entry) {
            throw domain::ResourceNotFoundError("Journal entry not found: " + entryId);
        }
        return *entry;
    }

    domain::JournalEntry buildEntry(const std::string& id, const domain::JournalEntryRequest& request) const {
        static const std::regex datePattern(R"(^\d{4}-\d{2}-\d{2}$)");
        if (!std::regex_match(request.date, datePattern)) {
            throw domain::ValidationError("Entry date must be YYYY-MM-DD: " + request.date);
        }
        validateLines(request.lines);

        domain::JournalEntry entry;
        entry.id = id;
        entry.date = request.date;
        entry.reference = request.reference;
        entry.description = request.description;
        entry.status = domain::EntryStatus::DRAFT;
        entry.createdBy = request.createdBy;
        entry.lines = request.lines;
        return entry;
    }

    /**
     * @brief Проверка строк до любой записи
     * @throws ValidationError, UnbalancedEntryError
     */
    void validateLines(const std::vector<domain::JournalLine>& lines) const {
        if (lines.empty()) {
            throw domain::ValidationError("Journal entry must have at least one line");
        }
        const auto currency = settings_->getCurrency();
        auto debitTotal = domain::Money::zero(currency);
        auto creditTotal = domain::Money::zero(currency);

        for (const auto& line : lines) {
            if (line.accountId.empty() || !accounts_->findById(line.accountId)) {
                throw domain::ValidationError("Unknown account: " + line.accountId);
            }
            if (line.debit.currency != currency || line.credit.currency != currency) {
                throw domain::ValidationError("Line currency must be " + currency + ": " + line.accountId);
            }
            bool debit = line.debit.isPositive();
            bool credit = line.credit.isPositive();
            if (line.debit.isNegative() || line.credit.isNegative() || debit == credit) {
                throw domain::ValidationError(
                    "Journal line must carry exactly one positive amount: " + line.accountId);
            }
            debitTotal += line.debit;
            creditTotal += line.credit;
        }

        if (debitTotal != creditTotal) {
            std::cerr << "[JournalService] REJECTED: unbalanced entry debit=" << debitTotal.toString()
                      << " credit=" << creditTotal.toString() << std::endl;
            throw domain::UnbalancedEntryError(debitTotal.toString(), creditTotal.toString());
        }
    }

    static void requireActor(const std::string& actorId) {
        if (actorId.empty()) {
            throw domain::ValidationError("Poster id is required");
        }
    }

    static void stampPosted(domain::JournalEntry& entry, const std::string& posterId) {
        entry.status = domain::EntryStatus::POSTED;
        entry.postedBy = posterId;
        entry.postedAt = domain::Timestamp::now();
    }
};

} // namespace ledger::application
