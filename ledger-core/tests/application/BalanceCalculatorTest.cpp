#include <gtest/gtest.h>
#include "application/BalanceCalculator.hpp"
#include "adapters/secondary/InMemoryMovementStore.hpp"
#include <limits>

using namespace ledger;
using namespace ledger::application;

class BalanceCalculatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<adapters::secondary::InMemoryMovementStore>();
        calculator_ = std::make_unique<BalanceCalculator>(store_);
    }

    void add(domain::MovementKind kind, int64_t qty, const std::string& lot = "L1") {
        store_->append(domain::Movement(
            "mov-" + std::to_string(++seq_),
            domain::StockKey{ENTITY, lot}, kind, qty,
            domain::Reference{}, "tester", domain::Timestamp::now()));
    }

    const domain::EntityRef ENTITY{domain::EntityKind::WHOLESALE_PHARMACY, "S1"};

    std::shared_ptr<adapters::secondary::InMemoryMovementStore> store_;
    std::unique_ptr<BalanceCalculator> calculator_;
    int seq_ = 0;
};

TEST_F(BalanceCalculatorTest, EmptyHistory_IsZero) {
    EXPECT_EQ(calculator_->computeBalance(ENTITY, "L1"), 0);
}

TEST_F(BalanceCalculatorTest, InboundMinusOutbound) {
    add(domain::MovementKind::IMPORT, 100);
    add(domain::MovementKind::TRANSFER_IN, 20);
    add(domain::MovementKind::RETURN, 3);
    add(domain::MovementKind::TRANSFER_OUT, 40);
    add(domain::MovementKind::SALE, 5);
    add(domain::MovementKind::RECALL_REMOVAL, 8);

    EXPECT_EQ(calculator_->computeBalance(ENTITY, "L1"), 100 + 20 + 3 - 40 - 5 - 8);
}

TEST_F(BalanceCalculatorTest, Adjustments_UseTheirOwnSign) {
    add(domain::MovementKind::IMPORT, 10);
    add(domain::MovementKind::ADJUSTMENT, 4);
    add(domain::MovementKind::ADJUSTMENT, -6);

    EXPECT_EQ(calculator_->computeBalance(ENTITY, "L1"), 8);
}

TEST_F(BalanceCalculatorTest, LotsAreIndependent) {
    add(domain::MovementKind::IMPORT, 10, "L1");
    add(domain::MovementKind::IMPORT, 7, "L2");
    add(domain::MovementKind::SALE, 2, "L2");

    EXPECT_EQ(calculator_->computeBalance(ENTITY, "L1"), 10);
    EXPECT_EQ(calculator_->computeBalance(ENTITY, "L2"), 5);
}

TEST_F(BalanceCalculatorTest, RepeatedCalls_AreStable) {
    add(domain::MovementKind::IMPORT, 10);
    EXPECT_EQ(calculator_->computeBalance(ENTITY, "L1"), 10);
    EXPECT_EQ(calculator_->computeBalance(ENTITY, "L1"), 10);
    EXPECT_EQ(store_->count(), 1u);
}

// Хранилище принимает любые движения; переполнение суммы не должно
// превращаться в отрицательный остаток
TEST_F(BalanceCalculatorTest, SumBeyondInt64_Throws) {
    add(domain::MovementKind::IMPORT, std::numeric_limits<int64_t>::max());
    add(domain::MovementKind::IMPORT, 1);

    EXPECT_THROW(calculator_->computeBalance(ENTITY, "L1"), domain::ValidationError);
}
