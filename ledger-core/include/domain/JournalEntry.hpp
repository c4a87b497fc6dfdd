#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include "enums/EntryStatus.hpp"
#include <string>
#include <vector>
#include <optional>

namespace ledger::domain {

/**
 * @brief Строка проводки
 *
 * Ровно одна из сумм строго положительна, вторая равна нулю.
 */
struct JournalLine {
    std::string accountId;
    Money debit;
    Money credit;

    static JournalLine debitLine(const std::string& accountId, const Money& amount) {
        return JournalLine{accountId, amount, Money::zero(amount.currency)};
    }

    static JournalLine creditLine(const std::string& accountId, const Money& amount) {
        return JournalLine{accountId, Money::zero(amount.currency), amount};
    }
};

/**
 * @brief Запись журнала (заголовок + строки)
 */
struct JournalEntry {
    std::string id;
    std::string date;                       ///< Бизнес-дата YYYY-MM-DD
    std::string reference;
    std::string description;
    EntryStatus status = EntryStatus::DRAFT;
    std::string createdBy;
    std::optional<std::string> postedBy;
    std::optional<Timestamp> postedAt;
    std::optional<std::string> reversalOf;  ///< ID сторнируемой записи
    std::vector<JournalLine> lines;

    bool isPosted() const { return status == EntryStatus::POSTED; }

    Money debitTotal() const {
        Money total = Money::zero(currency());
        for (const auto& line : lines) {
            total += line.debit;
        }
        return total;
    }

    Money creditTotal() const {
        Money total = Money::zero(currency());
        for (const auto& line : lines) {
            total += line.credit;
        }
        return total;
    }

private:
    std::string currency() const {
        return lines.empty() ? Money().currency : lines.front().debit.currency;
    }
};

/**
 * @brief Запрос на создание черновика записи
 */
struct JournalEntryRequest {
    std::string date;
    std::string reference;
    std::string description;
    std::vector<JournalLine> lines;
    std::string createdBy;
};

} // namespace ledger::domain
