#include <gtest/gtest.h>
#include "adapters/secondary/InMemoryMovementStore.hpp"
#include <chrono>

using namespace ledger;
using namespace ledger::adapters::secondary;

class InMemoryMovementStoreTest : public ::testing::Test {
protected:
    InMemoryMovementStore store;

    const domain::StockKey KEY{{domain::EntityKind::RETAIL_PHARMACY, "P1"}, "L1"};

    domain::Movement makeMovement(const std::string& id,
                                  domain::MovementKind kind,
                                  int64_t qty,
                                  domain::Timestamp at = domain::Timestamp::now(),
                                  const std::string& ref = "REF-1") {
        return domain::Movement(id, KEY, kind, qty, domain::Reference{ref, "Test"}, "tester", at);
    }
};

// ============================================================================
// APPEND
// ============================================================================

TEST_F(InMemoryMovementStoreTest, Append_ReturnsId) {
    auto id = store.append(makeMovement("mov-1", domain::MovementKind::IMPORT, 10));
    EXPECT_EQ(id, "mov-1");
    EXPECT_EQ(store.count(), 1u);
    ASSERT_TRUE(store.findById("mov-1").has_value());
}

TEST_F(InMemoryMovementStoreTest, Append_RejectsNonPositiveQuantity) {
    EXPECT_THROW(store.append(makeMovement("mov-1", domain::MovementKind::SALE, 0)), domain::ValidationError);
    EXPECT_THROW(store.append(makeMovement("mov-2", domain::MovementKind::IMPORT, -3)), domain::ValidationError);
    EXPECT_EQ(store.count(), 0u);
}

TEST_F(InMemoryMovementStoreTest, Append_RejectsUnknownKind) {
    EXPECT_THROW(store.append(makeMovement("mov-1", static_cast<domain::MovementKind>(42), 1)),
                 domain::ValidationError);
}

TEST_F(InMemoryMovementStoreTest, Append_AdjustmentMayBeNegativeButNotZero) {
    EXPECT_NO_THROW(store.append(makeMovement("mov-1", domain::MovementKind::ADJUSTMENT, -2)));
    EXPECT_THROW(store.append(makeMovement("mov-2", domain::MovementKind::ADJUSTMENT, 0)), domain::ValidationError);
}

TEST_F(InMemoryMovementStoreTest, Append_SameIdIsImmutableViolation) {
    store.append(makeMovement("mov-1", domain::MovementKind::IMPORT, 10));

    EXPECT_THROW(store.append(makeMovement("mov-1", domain::MovementKind::IMPORT, 99)),
                 domain::ImmutableRecordViolation);

    EXPECT_EQ(store.findById("mov-1")->quantity(), 10);
}

TEST_F(InMemoryMovementStoreTest, AppendAll_IsAllOrNothing) {
    store.append(makeMovement("mov-1", domain::MovementKind::IMPORT, 10));

    std::vector<domain::Movement> batch{
        makeMovement("mov-2", domain::MovementKind::SALE, 1),
        makeMovement("mov-1", domain::MovementKind::SALE, 1)
    };
    EXPECT_THROW(store.appendAll(batch), domain::ImmutableRecordViolation);

    EXPECT_EQ(store.count(), 1u);
    EXPECT_FALSE(store.findById("mov-2").has_value());
}

TEST_F(InMemoryMovementStoreTest, AppendAll_RejectsEmptyBatch) {
    EXPECT_THROW(store.appendAll({}), domain::ValidationError);
}

// ============================================================================
// QUERIES
// ============================================================================

TEST_F(InMemoryMovementStoreTest, QueryOrdered_ByCreationTime) {
    auto t0 = domain::Timestamp::now();
    auto later = domain::Timestamp(t0.value + std::chrono::seconds(5));

    store.append(makeMovement("mov-late", domain::MovementKind::SALE, 1, later));
    store.append(makeMovement("mov-early", domain::MovementKind::IMPORT, 10, t0));

    auto history = store.queryOrdered(KEY);
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].id(), "mov-early");
    EXPECT_EQ(history[1].id(), "mov-late");
}

TEST_F(InMemoryMovementStoreTest, QueryOrdered_IsRestartable) {
    store.append(makeMovement("mov-1", domain::MovementKind::IMPORT, 10));
    auto first = store.queryOrdered(KEY);

    store.append(makeMovement("mov-2", domain::MovementKind::SALE, 1));
    auto second = store.queryOrdered(KEY);

    EXPECT_EQ(first.size(), 1u);
    EXPECT_EQ(second.size(), 2u);
}

TEST_F(InMemoryMovementStoreTest, QueryOrdered_OtherKeyIsEmpty) {
    store.append(makeMovement("mov-1", domain::MovementKind::IMPORT, 10));

    domain::StockKey other{{domain::EntityKind::RETAIL_PHARMACY, "P1"}, "L2"};
    EXPECT_TRUE(store.queryOrdered(other).empty());
}

TEST_F(InMemoryMovementStoreTest, FindByReference) {
    auto now = domain::Timestamp::now();
    store.append(makeMovement("mov-1", domain::MovementKind::IMPORT, 10, now, "IMP-1"));
    store.append(makeMovement("mov-2", domain::MovementKind::SALE, 1, now, "RCPT-1"));
    store.append(makeMovement("mov-3", domain::MovementKind::SALE, 2, now, "RCPT-1"));

    auto found = store.findByReference("RCPT-1");
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0].id(), "mov-2");
    EXPECT_EQ(found[1].id(), "mov-3");
    EXPECT_TRUE(store.findByReference("UNKNOWN").empty());
}
