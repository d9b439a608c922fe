/**
 * @file ScheduledJobsTest.cpp
 * @brief Background sweeps driven through ScheduledJobs against the in-memory ledger
 */

#include "../application/LedgerTestFixture.hpp"
#include "adapters/primary/ScheduledJobs.hpp"
#include "adapters/secondary/EventingMemberDirectory.hpp"
#include "application/MonthlyAllowanceService.hpp"
#include "application/RoleShopService.hpp"
#include "application/VcEarningService.hpp"

using namespace ledger;
using namespace ledger::tests;

namespace {
// 2026-01-28T00:00:00+09:00
const int64_t kPaydayJst = 1769526000;
}

class ScheduledJobsTest : public LedgerTestFixture {
protected:
    void SetUp() override {
        LedgerTestFixture::SetUp();
        members_ = std::make_shared<adapters::secondary::EventingMemberDirectory>(publisher_);
        shop_ = std::make_shared<application::RoleShopService>(ledger_, members_);
        allowances_ = std::make_shared<application::MonthlyAllowanceService>(ledger_, members_, settings_);
        voice_ = std::make_shared<application::VcEarningService>(ledger_, settings_);

        jobs_ = std::make_unique<adapters::primary::ScheduledJobs>(
            shop_, allowances_, voice_, clock_, std::make_shared<settings::SchedulerSettings>());
    }

    std::shared_ptr<adapters::secondary::EventingMemberDirectory> members_;
    std::shared_ptr<application::RoleShopService> shop_;
    std::shared_ptr<application::MonthlyAllowanceService> allowances_;
    std::shared_ptr<application::VcEarningService> voice_;
    std::unique_ptr<adapters::primary::ScheduledJobs> jobs_;
};

TEST_F(ScheduledJobsTest, RoleExpiry_RevokesAfterDuration) {
    auto panel = shop_->createPanel(kTenant, "VIP", "");
    auto plan = shop_->addPlan(kTenant, panel, "VIP hour", "role-vip", "GOLD", amt("10"), 1, "");
    fund("alice", "10");
    shop_->purchase(kTenant, "alice", plan);
    publisher_->clearMessages();

    jobs_->roleExpiry().runOnce();
    EXPECT_TRUE(publisher_->messagesWithKey("role.revoke").empty());

    clock_->advanceHours(2);
    jobs_->roleExpiry().runOnce();

    EXPECT_EQ(publisher_->messagesWithKey("role.revoke").size(), 1u);
    EXPECT_TRUE(members_->membersWithRole(kTenant, "role-vip").empty());
    EXPECT_TRUE(storage_->snapshot().purchases.empty());
}

TEST_F(ScheduledJobsTest, Allowance_PaysOnlyOnPayday) {
    members_->setMembers(kTenant, "role-member", {"alice", "bob"});
    allowances_->configure(kTenant, "role-member", "GOLD", amt("50"), true);

    clock_->set(domain::Timestamp::fromEpochSeconds(kPaydayJst - 86400));
    jobs_->allowance().runOnce();
    EXPECT_TRUE(balanceOf("alice").isZero());

    clock_->set(domain::Timestamp::fromEpochSeconds(kPaydayJst));
    jobs_->allowance().runOnce();
    jobs_->allowance().runOnce();

    EXPECT_EQ(balanceOf("alice"), amt("50"));
    EXPECT_EQ(balanceOf("bob"), amt("50"));
    EXPECT_EQ(jobs_->allowance().failureCount(), 0u);
}

TEST_F(ScheduledJobsTest, VcPayout_CreditsActiveSessions) {
    voice_->setRate(kTenant, "cat-lounge", "GOLD", amt("1"));
    voice_->startSession(kTenant, "alice", "lounge-1", "cat-lounge");

    jobs_->vcPayout().runOnce();
    jobs_->vcPayout().runOnce();

    EXPECT_EQ(balanceOf("alice"), amt("2"));
    EXPECT_EQ(jobs_->vcPayout().runCount(), 2u);
}

TEST_F(ScheduledJobsTest, StartStop_AllTasks) {
    jobs_->start();
    EXPECT_TRUE(jobs_->roleExpiry().isRunning());
    EXPECT_TRUE(jobs_->vcCleanup().isRunning());

    jobs_->stop();
    EXPECT_FALSE(jobs_->allowance().isRunning());
    EXPECT_FALSE(jobs_->vcPayout().isRunning());
}
