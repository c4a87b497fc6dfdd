#include <gtest/gtest.h>
#include "domain/Movement.hpp"
#include <map>

using namespace ledger::domain;

namespace {

Movement makeMovement(MovementKind kind, int64_t qty) {
    return Movement("mov-1",
                    StockKey{{EntityKind::RETAIL_PHARMACY, "P1"}, "L1"},
                    kind, qty, Reference{"REF-1", "Test"}, "tester", Timestamp::now());
}

} // namespace

TEST(MovementTest, SignedQuantity_ByKind) {
    EXPECT_EQ(makeMovement(MovementKind::IMPORT, 5).signedQuantity(), 5);
    EXPECT_EQ(makeMovement(MovementKind::TRANSFER_IN, 5).signedQuantity(), 5);
    EXPECT_EQ(makeMovement(MovementKind::RETURN, 5).signedQuantity(), 5);

    EXPECT_EQ(makeMovement(MovementKind::TRANSFER_OUT, 5).signedQuantity(), -5);
    EXPECT_EQ(makeMovement(MovementKind::SALE, 5).signedQuantity(), -5);
    EXPECT_EQ(makeMovement(MovementKind::RECALL_REMOVAL, 5).signedQuantity(), -5);

    EXPECT_EQ(makeMovement(MovementKind::ADJUSTMENT, 7).signedQuantity(), 7);
    EXPECT_EQ(makeMovement(MovementKind::ADJUSTMENT, -7).signedQuantity(), -7);
}

TEST(MovementTest, ParseMovementKind) {
    EXPECT_EQ(parseMovementKind("RECALL_REMOVAL"), MovementKind::RECALL_REMOVAL);
    EXPECT_EQ(toString(MovementKind::TRANSFER_OUT), "TRANSFER_OUT");
    EXPECT_THROW(parseMovementKind("THEFT"), ValidationError);
}

TEST(MovementTest, ParseEntityKind) {
    EXPECT_EQ(parseEntityKind("PUBLIC_FACILITY"), EntityKind::PUBLIC_FACILITY);
    EXPECT_THROW(parseEntityKind("HOSPITAL"), ValidationError);
}

TEST(MovementTest, EntityOrder_KindThenId) {
    EntityRef wholesale{EntityKind::WHOLESALE_PHARMACY, "Z9"};
    EntityRef retailA{EntityKind::RETAIL_PHARMACY, "A1"};
    EntityRef retailB{EntityKind::RETAIL_PHARMACY, "B1"};

    EXPECT_TRUE(wholesale < retailA);
    EXPECT_TRUE(retailA < retailB);
    EXPECT_FALSE(retailB < retailA);
}

TEST(MovementTest, StockKey_Hashable) {
    std::hash<StockKey> hasher;
    StockKey a{{EntityKind::RETAIL_PHARMACY, "P1"}, "L1"};
    StockKey b{{EntityKind::RETAIL_PHARMACY, "P1"}, "L1"};
    EXPECT_EQ(a, b);
    EXPECT_EQ(hasher(a), hasher(b));
    EXPECT_EQ(a.toString(), "RETAIL_PHARMACY:P1/L1");
}
