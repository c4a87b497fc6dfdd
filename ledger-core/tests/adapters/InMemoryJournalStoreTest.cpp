#include <gtest/gtest.h>
#include "adapters/secondary/InMemoryJournalStore.hpp"

using namespace ledger;
using namespace ledger::adapters::secondary;

class InMemoryJournalStoreTest : public ::testing::Test {
protected:
    InMemoryJournalStore store;

    domain::JournalEntry makeDraft(const std::string& id, const std::string& amount = "100") {
        domain::JournalEntry entry;
        entry.id = id;
        entry.date = "2026-03-01";
        entry.reference = "REF-1";
        entry.createdBy = "clerk";
        entry.lines = {
            domain::JournalLine::debitLine("acc-inventory", domain::Money::fromString(amount)),
            domain::JournalLine::creditLine("acc-revenue", domain::Money::fromString(amount))
        };
        return entry;
    }
};

// ============================================================================
// VALIDATION
// ============================================================================

TEST_F(InMemoryJournalStoreTest, Append_RejectsEmptyLines) {
    auto entry = makeDraft("je-1");
    entry.lines.clear();
    EXPECT_THROW(store.append(entry), domain::ValidationError);
    EXPECT_EQ(store.count(), 0u);
}

TEST_F(InMemoryJournalStoreTest, Append_RejectsLineWithBothSides) {
    auto entry = makeDraft("je-1");
    entry.lines[0].credit = domain::Money::fromString("1");
    EXPECT_THROW(store.append(entry), domain::ValidationError);
}

TEST_F(InMemoryJournalStoreTest, Append_RejectsLineWithNeitherSide) {
    auto entry = makeDraft("je-1");
    entry.lines.push_back(domain::JournalLine{"acc-x", domain::Money::zero(), domain::Money::zero()});
    EXPECT_THROW(store.append(entry), domain::ValidationError);
}

TEST_F(InMemoryJournalStoreTest, Append_RejectsUnbalanced) {
    auto entry = makeDraft("je-1");
    entry.lines[1].credit = domain::Money::fromString("99");
    EXPECT_THROW(store.append(entry), domain::UnbalancedEntryError);
}

// ============================================================================
// DRAFT LIFECYCLE
// ============================================================================

TEST_F(InMemoryJournalStoreTest, ReplaceDraft_ChangesLines) {
    store.append(makeDraft("je-1", "100"));
    store.replaceDraft(makeDraft("je-1", "250"));

    auto entry = store.get("je-1");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->debitTotal().toString(), "250.00");
}

TEST_F(InMemoryJournalStoreTest, RemoveDraft_DeletesEntry) {
    store.append(makeDraft("je-1"));
    store.removeDraft("je-1");
    EXPECT_FALSE(store.get("je-1").has_value());
    EXPECT_EQ(store.count(), 0u);
}

TEST_F(InMemoryJournalStoreTest, PostedEntry_IsImmutable) {
    store.append(makeDraft("je-1"));
    auto posted = store.markPosted("je-1", "accountant", domain::Timestamp::now());
    EXPECT_TRUE(posted.isPosted());
    EXPECT_EQ(posted.postedBy.value(), "accountant");

    EXPECT_THROW(store.replaceDraft(makeDraft("je-1", "1")), domain::ImmutableRecordViolation);
    EXPECT_THROW(store.removeDraft("je-1"), domain::ImmutableRecordViolation);
    EXPECT_THROW(store.markPosted("je-1", "other", domain::Timestamp::now()), domain::ImmutableRecordViolation);
    EXPECT_THROW(store.append(makeDraft("je-1")), domain::ImmutableRecordViolation);
}

TEST_F(InMemoryJournalStoreTest, UnknownEntry_NotFound) {
    EXPECT_FALSE(store.get("je-missing").has_value());
    EXPECT_THROW(store.removeDraft("je-missing"), domain::ResourceNotFoundError);
}

// ============================================================================
// POSTED QUERIES
// ============================================================================

TEST_F(InMemoryJournalStoreTest, PostedLinesForAccount_SkipsDrafts) {
    store.append(makeDraft("je-1", "100"));
    store.append(makeDraft("je-2", "40"));
    store.markPosted("je-2", "accountant", domain::Timestamp::now());

    auto lines = store.postedLinesForAccount("acc-inventory");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].debit.toString(), "40.00");
    EXPECT_EQ(store.postedEntries().size(), 1u);
}

TEST_F(InMemoryJournalStoreTest, FindReversalOf) {
    store.append(makeDraft("je-1"));
    store.markPosted("je-1", "accountant", domain::Timestamp::now());

    auto reversal = makeDraft("je-2");
    std::swap(reversal.lines[0].debit, reversal.lines[0].credit);
    std::swap(reversal.lines[1].debit, reversal.lines[1].credit);
    reversal.reversalOf = "je-1";
    reversal.status = domain::EntryStatus::POSTED;
    store.append(reversal);

    auto found = store.findReversalOf("je-1");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, "je-2");
    EXPECT_FALSE(store.findReversalOf("je-2").has_value());
}

TEST_F(InMemoryJournalStoreTest, Retract_RemovesPostedEntryAndReversalLink) {
    auto entry = makeDraft("je-1", "40");
    entry.status = domain::EntryStatus::POSTED;
    entry.reversalOf = "je-0";
    store.append(entry);

    store.retract("je-1");

    EXPECT_EQ(store.count(), 0u);
    EXPECT_FALSE(store.get("je-1").has_value());
    EXPECT_TRUE(store.postedLinesForAccount("acc-inventory").empty());
    EXPECT_FALSE(store.findReversalOf("je-0").has_value());
    EXPECT_THROW(store.retract("je-1"), domain::ResourceNotFoundError);
}
