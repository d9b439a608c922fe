/**
 * @file BankServiceTest.cpp
 * @brief Unit tests for BankService
 */

#include "LedgerTestFixture.hpp"
#include "application/BankService.hpp"

using namespace ledger;
using namespace ledger::tests;

class BankServiceTest : public LedgerTestFixture {
protected:
    void SetUp() override {
        LedgerTestFixture::SetUp();
        bank_ = std::make_shared<application::BankService>(ledger_);
        fund("alice", "100");
    }

    std::shared_ptr<ports::input::IBankService> bank_;
};

// ============================================================================
// DEPOSIT / WITHDRAW
// ============================================================================

TEST_F(BankServiceTest, Deposit_MovesWalletToBank) {
    auto record = bank_->deposit(kTenant, "alice", "GOLD", amt("40"));

    EXPECT_EQ(record.operation, domain::BankOperation::DEPOSIT);
    EXPECT_EQ(record.amount, amt("40"));
    EXPECT_EQ(record.balanceAfter, amt("40"));
    EXPECT_GT(record.transactionId, 0);

    EXPECT_EQ(balanceOf("alice"), amt("60"));
    EXPECT_EQ(systemBalance("bank"), amt("40"));
    EXPECT_EQ(bank_->balance(kTenant, "alice", "GOLD"), amt("40"));
}

TEST_F(BankServiceTest, Deposit_MoreThanWallet_Throws) {
    EXPECT_THROW(bank_->deposit(kTenant, "alice", "GOLD", amt("100.01")), domain::InsufficientBalance);

    EXPECT_EQ(balanceOf("alice"), amt("100"));
    EXPECT_TRUE(bank_->balance(kTenant, "alice", "GOLD").isZero());
    EXPECT_TRUE(bank_->history(kTenant, "alice", "GOLD").empty());
}

TEST_F(BankServiceTest, Deposit_TruncatesToAssetPrecision) {
    auto record = bank_->deposit(kTenant, "alice", "GOLD", amt("10.559"));
    EXPECT_EQ(record.amount, amt("10.55"));
}

TEST_F(BankServiceTest, Deposit_NonPositive_Throws) {
    EXPECT_THROW(bank_->deposit(kTenant, "alice", "GOLD", amt("0.001")), domain::InvalidAmount);
    EXPECT_THROW(bank_->deposit(kTenant, "alice", "GOLD", amt("-1")), domain::InvalidAmount);
}

TEST_F(BankServiceTest, Withdraw_ReturnsToWallet) {
    bank_->deposit(kTenant, "alice", "GOLD", amt("40"));
    auto record = bank_->withdraw(kTenant, "alice", "GOLD", amt("15"));

    EXPECT_EQ(record.operation, domain::BankOperation::WITHDRAW);
    EXPECT_EQ(record.balanceAfter, amt("25"));
    EXPECT_EQ(balanceOf("alice"), amt("75"));
    EXPECT_EQ(systemBalance("bank"), amt("25"));
}

TEST_F(BankServiceTest, Withdraw_MoreThanSavings_Throws) {
    bank_->deposit(kTenant, "alice", "GOLD", amt("10"));
    fund("bob", "50");
    bank_->deposit(kTenant, "bob", "GOLD", amt("50"));

    // На счёте bank 60, но вклад alice только 10
    EXPECT_THROW(bank_->withdraw(kTenant, "alice", "GOLD", amt("20")), domain::InsufficientBalance);
    EXPECT_EQ(bank_->balance(kTenant, "alice", "GOLD"), amt("10"));
    EXPECT_EQ(systemBalance("bank"), amt("60"));
}

TEST_F(BankServiceTest, Withdraw_WithoutSavings_Throws) {
    EXPECT_THROW(bank_->withdraw(kTenant, "alice", "GOLD", amt("1")), domain::InsufficientBalance);
}

// ============================================================================
// HISTORY / RECONCILE
// ============================================================================

TEST_F(BankServiceTest, History_NewestFirstWithLimit) {
    bank_->deposit(kTenant, "alice", "GOLD", amt("10"));
    bank_->deposit(kTenant, "alice", "GOLD", amt("20"));
    bank_->withdraw(kTenant, "alice", "GOLD", amt("5"));

    auto all = bank_->history(kTenant, "alice", "GOLD");
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].operation, domain::BankOperation::WITHDRAW);
    EXPECT_EQ(all[0].balanceAfter, amt("25"));
    EXPECT_EQ(all[2].amount, amt("10"));

    auto limited = bank_->history(kTenant, "alice", "GOLD", 2);
    EXPECT_EQ(limited.size(), 2u);
}

TEST_F(BankServiceTest, Reconcile_SavingsMatchBankAccount) {
    fund("bob", "30");
    bank_->deposit(kTenant, "alice", "GOLD", amt("12.34"));
    bank_->deposit(kTenant, "bob", "GOLD", amt("30"));
    bank_->withdraw(kTenant, "alice", "GOLD", amt("2.34"));

    auto result = bank_->reconcile(kTenant, "GOLD");
    EXPECT_TRUE(result.balanced());
    EXPECT_EQ(result.ledgerBalance, amt("40"));
    EXPECT_EQ(result.depositsTotal, amt("40"));
    EXPECT_TRUE(totalSupply(goldId_).isZero());
}
