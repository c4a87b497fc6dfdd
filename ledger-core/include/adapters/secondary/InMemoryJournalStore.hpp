#pragma once

#include "ports/output/IJournalStore.hpp"
#include "domain/Errors.hpp"
#include <unordered_map>
#include <shared_mutex>
#include <mutex>
#include <algorithm>
#include <iostream>

namespace ledger::adapters::secondary {

/**
 * @brief In-memory хранилище журнала
 *
 * Повторно проверяет баланс строк при каждой записи, хотя JournalService
 * уже проверил его до обращения к хранилищу.
 */
class InMemoryJournalStore : public ports::output::IJournalStore {
public:
    InMemoryJournalStore() {
        std::cout << "[InMemoryJournalStore] Created" << std::endl;
    }

    std::string append(const domain::JournalEntry& entry) override {
        validate(entry);

        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (entries_.count(entry.id) > 0) {
            throw domain::ImmutableRecordViolation("Journal entry already exists: " + entry.id);
        }
        entries_[entry.id] = entry;
        order_.push_back(entry.id);
        if (entry.reversalOf) {
            reversals_[*entry.reversalOf] = entry.id;
        }
        return entry.id;
    }

    std::optional<domain::JournalEntry> get(const std::string& id) const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) return std::nullopt;
        return it->second;
    }

    void replaceDraft(const domain::JournalEntry& entry) override {
        validate(entry);

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto& existing = requireDraft(entry.id);
        if (entry.isPosted()) {
            throw domain::ValidationError("Replacement must be a draft: " + entry.id);
        }
        existing = entry;
    }

    void removeDraft(const std::string& id) override {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        requireDraft(id);
        entries_.erase(id);
        order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    }

    void retract(const std::string& id) override {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            throw domain::ResourceNotFoundError("Journal entry not found: " + id);
        }
        if (it->second.reversalOf) {
            reversals_.erase(*it->second.reversalOf);
        }
        entries_.erase(it);
        order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    }

    domain::JournalEntry markPosted(
        const std::string& id,
        const std::string& posterId,
        const domain::Timestamp& postedAt) override
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto& entry = requireDraft(id);
        entry.status = domain::EntryStatus::POSTED;
        entry.postedBy = posterId;
        entry.postedAt = postedAt;
        return entry;
    }

    std::vector<domain::JournalLine> postedLinesForAccount(const std::string& accountId) const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<domain::JournalLine> result;
        for (const auto& id : order_) {
            const auto& entry = entries_.at(id);
            if (!entry.isPosted()) continue;
            for (const auto& line : entry.lines) {
                if (line.accountId == accountId) {
                    result.push_back(line);
                }
            }
        }
        return result;
    }

    std::vector<domain::JournalEntry> postedEntries() const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<domain::JournalEntry> result;
        for (const auto& id : order_) {
            const auto& entry = entries_.at(id);
            if (entry.isPosted()) {
                result.push_back(entry);
            }
        }
        return result;
    }

    std::optional<domain::JournalEntry> findReversalOf(const std::string& entryId) const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = reversals_.find(entryId);
        if (it == reversals_.end()) return std::nullopt;
        return entries_.at(it->second);
    }

    size_t count() const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return entries_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, domain::JournalEntry> entries_;
    std::vector<std::string> order_;
    std::unordered_map<std::string, std::string> reversals_;

    domain::JournalEntry& requireDraft(const std::string& id) {
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            throw domain::ResourceNotFoundError("Journal entry not found: " + id);
        }
        if (it->second.isPosted()) {
            throw domain::ImmutableRecordViolation("Journal entry is posted: " + id);
        }
        return it->second;
    }

    static void validate(const domain::JournalEntry& entry) {
        if (entry.id.empty()) {
            throw domain::ValidationError("Journal entry id is required");
        }
        if (entry.lines.empty()) {
            throw domain::ValidationError("Journal entry must have at least one line");
        }
        for (const auto& line : entry.lines) {
            bool debit = line.debit.isPositive();
            bool credit = line.credit.isPositive();
            if (line.debit.isNegative() || line.credit.isNegative() || debit == credit) {
                throw domain::ValidationError(
                    "Journal line must carry exactly one positive amount: " + line.accountId);
            }
        }
        auto debitTotal = entry.debitTotal();
        auto creditTotal = entry.creditTotal();
        if (debitTotal != creditTotal) {
            throw domain::UnbalancedEntryError(debitTotal.toString(), creditTotal.toString());
        }
    }
};

} // namespace ledger::adapters::secondary
