#include <gtest/gtest.h>
#include "adapters/secondary/InMemoryAccountRepository.hpp"

using namespace ledger;
using namespace ledger::adapters::secondary;

class InMemoryAccountRepositoryTest : public ::testing::Test {
protected:
    InMemoryAccountRepository repo;

    const domain::EntityRef OWNER{domain::EntityKind::RETAIL_PHARMACY, "R1"};
};

TEST_F(InMemoryAccountRepositoryTest, SaveAndFind) {
    repo.save({"acc-1300-R1", domain::AccountClass::ASSET, "1300-R1", OWNER});

    auto byId = repo.findById("acc-1300-R1");
    ASSERT_TRUE(byId.has_value());
    EXPECT_EQ(byId->code, "1300-R1");

    auto byCode = repo.findByCode("1300-R1");
    ASSERT_TRUE(byCode.has_value());
    EXPECT_EQ(byCode->id, "acc-1300-R1");

    EXPECT_FALSE(repo.findById("acc-missing").has_value());
    EXPECT_FALSE(repo.findByCode("9999").has_value());
}

TEST_F(InMemoryAccountRepositoryTest, DuplicateCodeRejected) {
    repo.save({"acc-a", domain::AccountClass::ASSET, "1300", std::nullopt});
    EXPECT_THROW(repo.save({"acc-b", domain::AccountClass::ASSET, "1300", std::nullopt}),
                 domain::ValidationError);
}

TEST_F(InMemoryAccountRepositoryTest, ResaveMovesCode) {
    repo.save({"acc-a", domain::AccountClass::ASSET, "1300", std::nullopt});
    repo.save({"acc-a", domain::AccountClass::ASSET, "1310", std::nullopt});

    EXPECT_FALSE(repo.findByCode("1300").has_value());
    EXPECT_EQ(repo.findByCode("1310")->id, "acc-a");
}

TEST_F(InMemoryAccountRepositoryTest, FindByOwner) {
    repo.save({"acc-1300-R1", domain::AccountClass::ASSET, "1300-R1", OWNER});
    repo.save({"acc-4000-R1", domain::AccountClass::REVENUE, "4000-R1", OWNER});
    repo.save({"acc-cash", domain::AccountClass::ASSET, "1000", std::nullopt});

    EXPECT_EQ(repo.findByOwner(OWNER).size(), 2u);
    EXPECT_TRUE(repo.findByOwner({domain::EntityKind::PUBLIC_FACILITY, "H1"}).empty());
}

TEST_F(InMemoryAccountRepositoryTest, MissingIdOrCodeRejected) {
    EXPECT_THROW(repo.save({"", domain::AccountClass::ASSET, "1300", std::nullopt}), domain::ValidationError);
    EXPECT_THROW(repo.save({"acc-a", domain::AccountClass::ASSET, "", std::nullopt}), domain::ValidationError);
}
