/**
 * @file AutoRewardServiceTest.cpp
 * @brief Unit tests for AutoRewardService
 */

#include "LedgerTestFixture.hpp"
#include "application/AutoRewardService.hpp"

using namespace ledger;
using namespace ledger::tests;

class AutoRewardServiceTest : public LedgerTestFixture {
protected:
    void SetUp() override {
        LedgerTestFixture::SetUp();
        rewards_ = std::make_shared<application::AutoRewardService>(ledger_);
        configId_ = rewards_->configure(kTenant, "welcome", "hello guild", "GOLD", amt("25"));
    }

    std::shared_ptr<application::AutoRewardService> rewards_;
    int64_t configId_ = 0;
};

// ============================================================================
// CONFIGURATION
// ============================================================================

TEST_F(AutoRewardServiceTest, Configure_ReplacesChannelConfig) {
    auto again = rewards_->configure(kTenant, "welcome", "gm", "GOLD", amt("1.005"));

    EXPECT_EQ(again, configId_);
    auto list = rewards_->list(kTenant);
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].triggerPhrase, "gm");
    EXPECT_EQ(list[0].rewardAmount, amt("1.00"));
}

TEST_F(AutoRewardServiceTest, Configure_EmptyPhrase_Throws) {
    EXPECT_THROW(rewards_->configure(kTenant, "other", "", "GOLD", amt("1")), domain::InvalidState);
}

TEST_F(AutoRewardServiceTest, Configure_NonPositiveReward_Throws) {
    EXPECT_THROW(rewards_->configure(kTenant, "other", "hi", "GOLD", amt("0.001")), domain::InvalidAmount);
}

TEST_F(AutoRewardServiceTest, ForeignTenant_SeesNotFound) {
    EXPECT_THROW(rewards_->setEnabled("guild-2", configId_, false), domain::NotFound);
    EXPECT_THROW(rewards_->remove("guild-2", configId_), domain::NotFound);
    EXPECT_THROW(rewards_->claim("guild-2", configId_, "alice"), domain::NotFound);
}

// ============================================================================
// CLAIM
// ============================================================================

TEST_F(AutoRewardServiceTest, Claim_PaysFromTreasury) {
    auto receipt = rewards_->claim(kTenant, configId_, "alice");

    EXPECT_GT(receipt.transactionId, 0);
    EXPECT_EQ(balanceOf("alice"), amt("25"));
    EXPECT_EQ(systemBalance("treasury"), amt("975"));
    EXPECT_EQ(storage_->snapshot().transactions.at(receipt.transactionId).header.kind, "auto_reward");
}

TEST_F(AutoRewardServiceTest, Claim_Twice_ThrowsDuplicateClaimAndPaysOnce) {
    rewards_->claim(kTenant, configId_, "alice");
    auto entriesAfterFirst = storage_->snapshot().entries.size();

    EXPECT_THROW(rewards_->claim(kTenant, configId_, "alice"), domain::DuplicateClaim);

    EXPECT_EQ(balanceOf("alice"), amt("25"));
    EXPECT_EQ(storage_->snapshot().entries.size(), entriesAfterFirst);
}

TEST_F(AutoRewardServiceTest, Claim_Disabled_Throws) {
    rewards_->setEnabled(kTenant, configId_, false);
    EXPECT_THROW(rewards_->claim(kTenant, configId_, "alice"), domain::InvalidState);
    EXPECT_TRUE(balanceOf("alice").isZero());
}

TEST_F(AutoRewardServiceTest, Stats_CountsClaims) {
    rewards_->claim(kTenant, configId_, "alice");
    rewards_->claim(kTenant, configId_, "bob");

    auto stats = rewards_->stats(kTenant, configId_);
    EXPECT_EQ(stats.claims, 2);
    EXPECT_EQ(stats.totalPaid, amt("50"));
}

TEST_F(AutoRewardServiceTest, Remove_DeletesConfigAndClaims) {
    rewards_->claim(kTenant, configId_, "alice");
    rewards_->remove(kTenant, configId_);

    EXPECT_TRUE(rewards_->list(kTenant).empty());
    EXPECT_TRUE(storage_->snapshot().rewardClaims.empty());
    EXPECT_EQ(balanceOf("alice"), amt("25"));
}

// ============================================================================
// ON MESSAGE
// ============================================================================

TEST_F(AutoRewardServiceTest, OnMessage_MatchingPhrase_Claims) {
    auto receipt = rewards_->onMessage(kTenant, "welcome", "alice", "well hello guild!");
    ASSERT_TRUE(receipt.has_value());
    EXPECT_EQ(balanceOf("alice"), amt("25"));
}

TEST_F(AutoRewardServiceTest, OnMessage_NoMatch_ReturnsNullopt) {
    EXPECT_FALSE(rewards_->onMessage(kTenant, "welcome", "alice", "good morning").has_value());
    EXPECT_FALSE(rewards_->onMessage(kTenant, "random", "alice", "hello guild").has_value());
    EXPECT_TRUE(balanceOf("alice").isZero());
}

TEST_F(AutoRewardServiceTest, OnMessage_Disabled_ReturnsNullopt) {
    rewards_->setEnabled(kTenant, configId_, false);
    EXPECT_FALSE(rewards_->onMessage(kTenant, "welcome", "alice", "hello guild").has_value());
}

TEST_F(AutoRewardServiceTest, OnMessage_Repeat_ThrowsDuplicateClaim) {
    rewards_->onMessage(kTenant, "welcome", "alice", "hello guild");
    EXPECT_THROW(rewards_->onMessage(kTenant, "welcome", "alice", "hello guild again"), domain::DuplicateClaim);
}
