/**
 * @file MonthlyAllowanceServiceTest.cpp
 * @brief Unit tests for MonthlyAllowanceService
 */

#include "LedgerTestFixture.hpp"
#include "application/MonthlyAllowanceService.hpp"
#include "../mocks/MockMemberDirectory.hpp"

using namespace ledger;
using namespace ledger::tests;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

namespace {
// 2026-01-28T00:00:00+09:00
const int64_t kPaydayJst = 1769526000;
}

class MonthlyAllowanceServiceTest : public LedgerTestFixture {
protected:
    void SetUp() override {
        LedgerTestFixture::SetUp();
        members_ = std::make_shared<NiceMock<MockMemberDirectory>>();
        ON_CALL(*members_, membersWithRole(std::string(kTenant), std::string("role-member")))
            .WillByDefault(Return(std::vector<domain::UserId>{"alice", "bob"}));

        allowances_ = std::make_shared<application::MonthlyAllowanceService>(ledger_, members_, settings_);
        configId_ = allowances_->configure(kTenant, "role-member", "GOLD", amt("50"));
    }

    std::shared_ptr<NiceMock<MockMemberDirectory>> members_;
    std::shared_ptr<ports::input::IMonthlyAllowanceService> allowances_;
    int64_t configId_ = 0;
};

// ============================================================================
// CONFIGURATION
// ============================================================================

TEST_F(MonthlyAllowanceServiceTest, Configure_UpsertsByRoleAndAsset) {
    auto again = allowances_->configure(kTenant, "role-member", "GOLD", amt("75"));
    EXPECT_EQ(again, configId_);

    auto configs = allowances_->listConfigs(kTenant);
    ASSERT_EQ(configs.size(), 1u);
    EXPECT_EQ(configs[0].amount, amt("75"));
}

TEST_F(MonthlyAllowanceServiceTest, Configure_OverPrecise_Throws) {
    EXPECT_THROW(allowances_->configure(kTenant, "role-x", "GOLD", amt("1.234")), domain::InvalidAmount);
}

TEST_F(MonthlyAllowanceServiceTest, Remove_ForeignTenant_Throws) {
    EXPECT_THROW(allowances_->remove("guild-2", configId_), domain::NotFound);
    allowances_->remove(kTenant, configId_);
    EXPECT_TRUE(allowances_->listConfigs(kTenant).empty());
}

// ============================================================================
// RUN
// ============================================================================

TEST_F(MonthlyAllowanceServiceTest, RunMonth_PaysEveryMember) {
    auto summary = allowances_->runMonth("2026-01");

    EXPECT_EQ(summary.paid, 2);
    EXPECT_EQ(summary.skipped, 0);
    EXPECT_EQ(summary.failed, 0);
    EXPECT_EQ(balanceOf("alice"), amt("50"));
    EXPECT_EQ(balanceOf("bob"), amt("50"));

    auto records = allowances_->history(kTenant, "2026-01");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_GT(records[0].transactionId, 0);
}

TEST_F(MonthlyAllowanceServiceTest, RunMonth_Twice_PaysOnce) {
    allowances_->runMonth("2026-01");
    auto entries = storage_->snapshot().entries.size();

    auto summary = allowances_->runMonth("2026-01");

    EXPECT_EQ(summary.paid, 0);
    EXPECT_EQ(summary.skipped, 2);
    EXPECT_EQ(storage_->snapshot().entries.size(), entries);
    EXPECT_EQ(balanceOf("alice"), amt("50"));
}

TEST_F(MonthlyAllowanceServiceTest, RunMonth_NextPeriod_PaysAgain) {
    allowances_->runMonth("2026-01");
    allowances_->runMonth("2026-02");
    EXPECT_EQ(balanceOf("alice"), amt("100"));
}

TEST_F(MonthlyAllowanceServiceTest, RunMonth_DisabledConfig_Skipped) {
    allowances_->configure(kTenant, "role-member", "GOLD", amt("50"), false);
    auto summary = allowances_->runMonth("2026-01");

    EXPECT_EQ(summary.paid, 0);
    EXPECT_TRUE(balanceOf("alice").isZero());
}

TEST_F(MonthlyAllowanceServiceTest, RunMonth_FailureInOneTenant_DoesNotStopOthers) {
    // guild-2 без системных счетов: выплата падает, guild-1 платится
    assets_->createAsset("guild-2", "GOLD", "Their Gold", 2);
    ON_CALL(*members_, membersWithRole(std::string("guild-2"), _))
        .WillByDefault(Return(std::vector<domain::UserId>{"mallory"}));
    allowances_->configure("guild-2", "role-member", "GOLD", amt("10"));

    auto summary = allowances_->runMonth("2026-01");

    EXPECT_EQ(summary.paid, 2);
    EXPECT_EQ(summary.failed, 1);
}

TEST_F(MonthlyAllowanceServiceTest, RunIfPayday_OnlyOnPayday) {
    auto payday = domain::Timestamp::fromEpochSeconds(kPaydayJst);

    EXPECT_FALSE(allowances_->runIfPayday(payday.addMinutes(-1), 28).has_value());

    auto summary = allowances_->runIfPayday(payday, 28);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->paid, 2);
    EXPECT_EQ(allowances_->history(kTenant, "2026-01").size(), 2u);

    // Повторные тики в тот же день ничего не платят
    auto again = allowances_->runIfPayday(payday.addHours(5), 28);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->paid, 0);
    EXPECT_EQ(again->skipped, 2);
}
