/**
 * @file RoleShopServiceTest.cpp
 * @brief Unit tests for RoleShopService
 */

#include "LedgerTestFixture.hpp"
#include "application/RoleShopService.hpp"
#include "../mocks/MockMemberDirectory.hpp"
#include <stdexcept>

using namespace ledger;
using namespace ledger::tests;
using ::testing::_;
using ::testing::NiceMock;

class RoleShopServiceTest : public LedgerTestFixture {
protected:
    void SetUp() override {
        LedgerTestFixture::SetUp();
        members_ = std::make_shared<NiceMock<MockMemberDirectory>>();
        shop_ = std::make_shared<application::RoleShopService>(ledger_, members_);

        panelId_ = shop_->createPanel(kTenant, "VIP", "Temporary perks");
        planId_ = shop_->addPlan(kTenant, panelId_, "VIP day", "role-vip", "GOLD", amt("30"), 24, "One day");
        fund("alice", "100");
    }

    std::shared_ptr<NiceMock<MockMemberDirectory>> members_;
    std::shared_ptr<application::RoleShopService> shop_;
    int64_t panelId_ = 0;
    int64_t planId_ = 0;
};

// ============================================================================
// PANELS / PLANS
// ============================================================================

TEST_F(RoleShopServiceTest, ListPanelsAndPlans) {
    auto panels = shop_->listPanels(kTenant);
    ASSERT_EQ(panels.size(), 1u);
    EXPECT_EQ(panels[0].name, "VIP");

    auto plans = shop_->listPlans(kTenant, panelId_);
    ASSERT_EQ(plans.size(), 1u);
    EXPECT_EQ(plans[0].roleId, "role-vip");
    EXPECT_EQ(plans[0].price, amt("30"));
    EXPECT_EQ(plans[0].durationHours, 24);
}

TEST_F(RoleShopServiceTest, AddPlan_InvalidInput_Throws) {
    EXPECT_THROW(shop_->addPlan(kTenant, panelId_, "x", "r", "GOLD", amt("1.001"), 1, ""), domain::InvalidAmount);
    EXPECT_THROW(shop_->addPlan(kTenant, panelId_, "x", "r", "GOLD", amt("0"), 1, ""), domain::InvalidAmount);
    EXPECT_THROW(shop_->addPlan(kTenant, panelId_, "x", "r", "GOLD", amt("1"), 0, ""), domain::InvalidState);
    EXPECT_THROW(shop_->addPlan(kTenant, 999999, "x", "r", "GOLD", amt("1"), 1, ""), domain::NotFound);
}

TEST_F(RoleShopServiceTest, ForeignTenant_SeesNotFound) {
    EXPECT_THROW(shop_->listPlans("guild-2", panelId_), domain::NotFound);
    EXPECT_THROW(shop_->deletePlan("guild-2", planId_), domain::NotFound);
    EXPECT_THROW(shop_->purchase("guild-2", "alice", planId_), domain::NotFound);
}

TEST_F(RoleShopServiceTest, DeletePanel_RemovesPlans) {
    shop_->deletePanel(kTenant, panelId_);
    EXPECT_TRUE(shop_->listPanels(kTenant).empty());
    EXPECT_THROW(shop_->purchase(kTenant, "alice", planId_), domain::NotFound);
}

// ============================================================================
// PURCHASE
// ============================================================================

TEST_F(RoleShopServiceTest, Purchase_ChargesAndGrantsRole) {
    EXPECT_CALL(*members_, grantRole(std::string(kTenant), std::string("alice"), std::string("role-vip"))).Times(1);

    auto purchase = shop_->purchase(kTenant, "alice", planId_);

    EXPECT_EQ(purchase.roleId, "role-vip");
    EXPECT_EQ(purchase.expiresAt.epochSeconds() - purchase.purchasedAt.epochSeconds(), 24 * 3600);
    EXPECT_EQ(balanceOf("alice"), amt("70"));
    EXPECT_EQ(shop_->activePurchases(kTenant, "alice").size(), 1u);
}

TEST_F(RoleShopServiceTest, Purchase_InsufficientBalance_NoRole) {
    EXPECT_CALL(*members_, grantRole(_, _, _)).Times(0);

    EXPECT_THROW(shop_->purchase(kTenant, "bob", planId_), domain::InsufficientBalance);
    EXPECT_TRUE(shop_->activePurchases(kTenant, "bob").empty());
}

TEST_F(RoleShopServiceTest, Purchase_GrantFailure_KeepsCommittedCharge) {
    EXPECT_CALL(*members_, grantRole(std::string(kTenant), std::string("alice"), std::string("role-vip")))
        .WillOnce(::testing::Throw(std::runtime_error("platform unavailable")));

    domain::RolePurchase purchase;
    EXPECT_NO_THROW(purchase = shop_->purchase(kTenant, "alice", planId_));

    EXPECT_GT(purchase.id, 0);
    EXPECT_EQ(purchase.roleId, "role-vip");
    EXPECT_EQ(balanceOf("alice"), amt("70"));
    EXPECT_EQ(shop_->activePurchases(kTenant, "alice").size(), 1u);
}

TEST_F(RoleShopServiceTest, Purchase_SurvivesPlanDeletion) {
    shop_->purchase(kTenant, "alice", planId_);
    shop_->deletePlan(kTenant, planId_);

    EXPECT_CALL(*members_, revokeRole(std::string(kTenant), std::string("alice"), std::string("role-vip"))).Times(1);
    clock_->advanceHours(25);
    EXPECT_EQ(shop_->sweepExpired(clock_->now(), 100), 1);
}

// ============================================================================
// EXPIRY
// ============================================================================

TEST_F(RoleShopServiceTest, SweepExpired_BeforeExpiry_DoesNothing) {
    shop_->purchase(kTenant, "alice", planId_);
    EXPECT_CALL(*members_, revokeRole(_, _, _)).Times(0);

    clock_->advanceHours(23);
    EXPECT_EQ(shop_->sweepExpired(clock_->now(), 100), 0);
    EXPECT_EQ(storage_->snapshot().purchases.size(), 1u);
}

TEST_F(RoleShopServiceTest, SweepExpired_RevokesAndDeletes) {
    shop_->purchase(kTenant, "alice", planId_);
    EXPECT_CALL(*members_, revokeRole(std::string(kTenant), std::string("alice"), std::string("role-vip"))).Times(1);

    clock_->advanceHours(24);
    EXPECT_EQ(shop_->sweepExpired(clock_->now(), 100), 1);
    EXPECT_TRUE(storage_->snapshot().purchases.empty());

    // Повторный обход ничего не находит
    EXPECT_EQ(shop_->sweepExpired(clock_->now(), 100), 0);
}

TEST_F(RoleShopServiceTest, SweepExpired_KeepsRoleWhileAnotherPurchaseActive) {
    shop_->purchase(kTenant, "alice", planId_);
    clock_->advanceHours(12);
    shop_->purchase(kTenant, "alice", planId_);

    EXPECT_CALL(*members_, revokeRole(_, _, _)).Times(0);
    clock_->advanceHours(13);
    EXPECT_EQ(shop_->sweepExpired(clock_->now(), 100), 1);
    EXPECT_EQ(storage_->snapshot().purchases.size(), 1u);
    ::testing::Mock::VerifyAndClearExpectations(members_.get());

    EXPECT_CALL(*members_, revokeRole(_, std::string("alice"), std::string("role-vip"))).Times(1);
    clock_->advanceHours(12);
    EXPECT_EQ(shop_->sweepExpired(clock_->now(), 100), 1);
}

TEST_F(RoleShopServiceTest, SweepExpired_RespectsLimit) {
    fund("bob", "100");
    fund("carol", "100");
    shop_->purchase(kTenant, "alice", planId_);
    shop_->purchase(kTenant, "bob", planId_);
    shop_->purchase(kTenant, "carol", planId_);

    clock_->advanceHours(48);
    EXPECT_EQ(shop_->sweepExpired(clock_->now(), 2), 2);
    EXPECT_EQ(shop_->sweepExpired(clock_->now(), 2), 1);
}

TEST_F(RoleShopServiceTest, SweepExpired_RevokeFailure_DoesNotStopSweep) {
    fund("bob", "100");
    shop_->purchase(kTenant, "alice", planId_);
    shop_->purchase(kTenant, "bob", planId_);

    EXPECT_CALL(*members_, revokeRole(_, std::string("alice"), _))
        .WillOnce(::testing::Throw(std::runtime_error("platform unavailable")));
    EXPECT_CALL(*members_, revokeRole(_, std::string("bob"), _)).Times(1);

    clock_->advanceHours(30);
    EXPECT_EQ(shop_->sweepExpired(clock_->now(), 100), 1);
}
