/**
 * @file BettingServiceTest.cpp
 * @brief Unit tests for BettingService: odds, escrow, settlement
 */

#include "LedgerTestFixture.hpp"
#include "application/BettingService.hpp"

using namespace ledger;
using namespace ledger::tests;
using application::BettingService;

class BettingServiceTest : public LedgerTestFixture {
protected:
    void SetUp() override {
        LedgerTestFixture::SetUp();
        betting_ = std::make_shared<BettingService>(ledger_);
        fund("alice", "100");
        fund("bob", "100");
        fund("carol", "100");

        betting_->createEvent(kTenant, "Grand Final", "GOLD");
        betting_->addPlayer(kTenant, "red");
        betting_->addPlayer(kTenant, "blue");
    }

    domain::Amount oddsFor(const domain::UserId& player) {
        for (const auto& o : betting_->odds(kTenant)) {
            if (o.playerId == player) return o.odds;
        }
        ADD_FAILURE() << "no odds for " << player;
        return domain::Amount();
    }

    std::shared_ptr<BettingService> betting_;
};

// ============================================================================
// ODDS
// ============================================================================

TEST(BettingOddsTest, NoBets_DefaultsToTwo) {
    EXPECT_EQ(BettingService::computeOdds(domain::Amount(), domain::Amount()), domain::Amount::parse("2.00"));
    EXPECT_EQ(BettingService::computeOdds(domain::Amount::whole(50), domain::Amount()), domain::Amount::parse("2.00"));
}

TEST(BettingOddsTest, PoolOverStake_RoundedHalfEven) {
    EXPECT_EQ(BettingService::computeOdds(domain::Amount::whole(40), domain::Amount::whole(30)),
              domain::Amount::parse("1.33"));
    EXPECT_EQ(BettingService::computeOdds(domain::Amount::whole(40), domain::Amount::whole(10)),
              domain::Amount::parse("4.00"));
    // 1.125 -> 1.12
    EXPECT_EQ(BettingService::computeOdds(domain::Amount::whole(9), domain::Amount::whole(8)),
              domain::Amount::parse("1.12"));
}

TEST(BettingOddsTest, FloorAtOnePointOne) {
    EXPECT_EQ(BettingService::computeOdds(domain::Amount::whole(101), domain::Amount::whole(100)),
              domain::Amount::parse("1.10"));
    EXPECT_EQ(BettingService::computeOdds(domain::Amount::whole(10), domain::Amount::whole(10)),
              domain::Amount::parse("1.10"));
}

TEST_F(BettingServiceTest, Odds_ReflectCurrentBets) {
    EXPECT_EQ(oddsFor("red"), amt("2.00"));

    betting_->placeBet(kTenant, "alice", "red", amt("30"));
    betting_->placeBet(kTenant, "bob", "blue", amt("10"));

    EXPECT_EQ(oddsFor("red"), amt("1.33"));
    EXPECT_EQ(oddsFor("blue"), amt("4.00"));
}

// ============================================================================
// EVENTS / PLAYERS
// ============================================================================

TEST_F(BettingServiceTest, CreateEvent_SecondActive_Throws) {
    EXPECT_THROW(betting_->createEvent(kTenant, "Another", "GOLD"), domain::InvalidState);
}

TEST_F(BettingServiceTest, RemovePlayer_WithBets_Throws) {
    betting_->placeBet(kTenant, "alice", "red", amt("5"));
    EXPECT_THROW(betting_->removePlayer(kTenant, "red"), domain::InvalidState);

    betting_->removePlayer(kTenant, "blue");
    EXPECT_THROW(betting_->removePlayer(kTenant, "blue"), domain::NotFound);
}

TEST_F(BettingServiceTest, NoActiveEvent_Throws) {
    betting_->cancel(kTenant);
    EXPECT_THROW(betting_->placeBet(kTenant, "alice", "red", amt("1")), domain::NotFound);
    EXPECT_THROW(betting_->odds(kTenant), domain::NotFound);
}

// ============================================================================
// BETS
// ============================================================================

TEST_F(BettingServiceTest, PlaceBet_MovesStakeToEscrow) {
    auto bet = betting_->placeBet(kTenant, "alice", "red", amt("30"));

    EXPECT_GT(bet.transactionId, 0);
    EXPECT_EQ(balanceOf("alice"), amt("70"));
    EXPECT_EQ(systemBalance("escrow"), amt("30"));
}

TEST_F(BettingServiceTest, PlaceBet_Invalid_Throws) {
    EXPECT_THROW(betting_->placeBet(kTenant, "alice", "red", amt("1.5")), domain::InvalidAmount);
    EXPECT_THROW(betting_->placeBet(kTenant, "alice", "red", amt("0")), domain::InvalidAmount);
    EXPECT_THROW(betting_->placeBet(kTenant, "alice", "green", amt("1")), domain::NotFound);
    EXPECT_THROW(betting_->placeBet(kTenant, "alice", "red", amt("101")), domain::InsufficientBalance);

    EXPECT_EQ(balanceOf("alice"), amt("100"));
    EXPECT_TRUE(systemBalance("escrow").isZero());
}

// ============================================================================
// SETTLEMENT
// ============================================================================

TEST_F(BettingServiceTest, Settle_RemainderGoesToTreasury) {
    betting_->placeBet(kTenant, "alice", "red", amt("30"));
    betting_->placeBet(kTenant, "bob", "blue", amt("10"));
    auto treasuryBefore = systemBalance("treasury");

    auto result = betting_->settle(kTenant, "red");

    EXPECT_EQ(result.pool, amt("40"));
    EXPECT_EQ(result.odds, amt("1.33"));
    ASSERT_EQ(result.payouts.size(), 1u);
    EXPECT_EQ(result.payouts[0].userId, "alice");
    EXPECT_EQ(result.payouts[0].amount, amt("39"));   // trunc(39.9)
    EXPECT_EQ(result.treasuryDelta, amt("1"));

    EXPECT_EQ(balanceOf("alice"), amt("109"));
    EXPECT_EQ(balanceOf("bob"), amt("90"));
    EXPECT_TRUE(systemBalance("escrow").isZero());
    EXPECT_EQ(systemBalance("treasury"), treasuryBefore + amt("1"));
    EXPECT_TRUE(totalSupply(goldId_).isZero());
}

TEST_F(BettingServiceTest, Settle_ExactPool_NoTreasuryLeg) {
    betting_->placeBet(kTenant, "alice", "red", amt("30"));
    betting_->placeBet(kTenant, "bob", "blue", amt("10"));
    auto treasuryBefore = systemBalance("treasury");

    auto result = betting_->settle(kTenant, "blue");

    EXPECT_EQ(result.odds, amt("4.00"));
    EXPECT_EQ(result.totalPaid, amt("40"));
    EXPECT_TRUE(result.treasuryDelta.isZero());
    EXPECT_EQ(balanceOf("bob"), amt("130"));
    EXPECT_EQ(systemBalance("treasury"), treasuryBefore);
}

TEST_F(BettingServiceTest, Settle_MinimumOdds_TreasuryTopsUp) {
    betting_->placeBet(kTenant, "alice", "red", amt("100"));
    betting_->placeBet(kTenant, "bob", "blue", amt("1"));
    auto treasuryBefore = systemBalance("treasury");

    auto result = betting_->settle(kTenant, "red");

    EXPECT_EQ(result.odds, amt("1.10"));
    EXPECT_EQ(result.totalPaid, amt("110"));
    EXPECT_EQ(result.treasuryDelta, amt("-9"));
    EXPECT_EQ(balanceOf("alice"), amt("110"));
    EXPECT_EQ(systemBalance("treasury"), treasuryBefore - amt("9"));
    EXPECT_TRUE(systemBalance("escrow").isZero());
    EXPECT_TRUE(totalSupply(goldId_).isZero());
}

TEST_F(BettingServiceTest, Settle_SeveralWinners) {
    betting_->placeBet(kTenant, "alice", "red", amt("20"));
    betting_->placeBet(kTenant, "carol", "red", amt("13"));
    betting_->placeBet(kTenant, "bob", "blue", amt("17"));

    auto result = betting_->settle(kTenant, "red");

    // 50 / 33 = 1.5151.. -> 1.52
    EXPECT_EQ(result.odds, amt("1.52"));
    EXPECT_EQ(result.totalPaid, amt("30") + amt("19"));   // trunc(30.4) + trunc(19.76)
    EXPECT_EQ(result.treasuryDelta, amt("1"));
    EXPECT_TRUE(systemBalance("escrow").isZero());
}

TEST_F(BettingServiceTest, Settle_NoWinningBets_Throws) {
    betting_->placeBet(kTenant, "alice", "red", amt("10"));

    EXPECT_THROW(betting_->settle(kTenant, "blue"), domain::InvalidState);
    EXPECT_EQ(systemBalance("escrow"), amt("10"));
}

TEST_F(BettingServiceTest, Settle_ClosesEvent) {
    betting_->placeBet(kTenant, "alice", "red", amt("10"));
    betting_->settle(kTenant, "red");

    EXPECT_THROW(betting_->settle(kTenant, "red"), domain::NotFound);
    EXPECT_NO_THROW(betting_->createEvent(kTenant, "Rematch", "GOLD"));
}

// ============================================================================
// CANCEL
// ============================================================================

TEST_F(BettingServiceTest, Cancel_RefundsEveryStake) {
    betting_->placeBet(kTenant, "alice", "red", amt("30"));
    betting_->placeBet(kTenant, "alice", "blue", amt("5"));
    betting_->placeBet(kTenant, "bob", "blue", amt("10"));

    EXPECT_EQ(betting_->cancel(kTenant), 3);

    EXPECT_EQ(balanceOf("alice"), amt("100"));
    EXPECT_EQ(balanceOf("bob"), amt("100"));
    EXPECT_TRUE(systemBalance("escrow").isZero());
}

TEST_F(BettingServiceTest, Cancel_WithoutBets_ClosesEvent) {
    EXPECT_EQ(betting_->cancel(kTenant), 0);
    EXPECT_THROW(betting_->cancel(kTenant), domain::NotFound);
}
