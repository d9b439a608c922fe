/**
 * @file AccountDirectoryTest.cpp
 * @brief Unit tests for AccountDirectory
 */

#include "LedgerTestFixture.hpp"
#include <set>
#include <thread>
#include <vector>

using namespace ledger;
using namespace ledger::tests;

class AccountDirectoryTest : public LedgerTestFixture {};

TEST_F(AccountDirectoryTest, EnsureSystemAccounts_CreatesAllFive) {
    std::set<domain::AccountId> ids;
    for (const auto* name : {"treasury", "burn", "mint", "bank", "escrow"}) {
        ids.insert(accounts_->accountIdByName(kTenant, name));
    }
    EXPECT_EQ(ids.size(), 5u);
}

TEST_F(AccountDirectoryTest, EnsureSystemAccounts_Idempotent) {
    auto treasury = accounts_->accountIdByName(kTenant, "treasury");
    auto countBefore = storage_->snapshot().accounts.size();

    accounts_->ensureSystemAccounts(kTenant);

    EXPECT_EQ(accounts_->accountIdByName(kTenant, "treasury"), treasury);
    EXPECT_EQ(storage_->snapshot().accounts.size(), countBefore);
}

TEST_F(AccountDirectoryTest, AccountIdByName_UninitializedTenant_Throws) {
    EXPECT_THROW(accounts_->accountIdByName("guild-unknown", "treasury"), domain::AccountNotFound);
}

TEST_F(AccountDirectoryTest, AccountIdByName_UnknownName_Throws) {
    EXPECT_THROW(accounts_->accountIdByName(kTenant, "vault"), domain::AccountNotFound);
    EXPECT_THROW(accounts_->accountIdByName(kTenant, "user"), domain::AccountNotFound);
}

TEST_F(AccountDirectoryTest, EnsureUserAccount_StableAndPerTenant) {
    auto first = accounts_->ensureUserAccount(kTenant, "alice");
    auto second = accounts_->ensureUserAccount(kTenant, "alice");
    auto other = accounts_->ensureUserAccount("guild-2", "alice");

    EXPECT_EQ(first, second);
    EXPECT_NE(first, other);

    auto account = storage_->snapshot().accounts.at(first);
    EXPECT_EQ(account.name, "user:alice:guild-1");
    EXPECT_EQ(account.type, domain::AccountType::USER);
    ASSERT_TRUE(account.ownerId.has_value());
    EXPECT_EQ(*account.ownerId, "alice");
}

TEST_F(AccountDirectoryTest, EnsureUserAccount_ConcurrentCallsReturnOneId) {
    const int threads = 16;
    std::vector<domain::AccountId> ids(threads);
    std::vector<std::thread> workers;

    for (int i = 0; i < threads; ++i) {
        workers.emplace_back([this, &ids, i]() {
            ids[i] = accounts_->ensureUserAccount(kTenant, "carol");
        });
    }
    for (auto& w : workers) w.join();

    std::set<domain::AccountId> unique(ids.begin(), ids.end());
    EXPECT_EQ(unique.size(), 1u);

    int named = 0;
    for (const auto& [id, account] : storage_->snapshot().accounts) {
        if (account.name == "user:carol:guild-1") ++named;
    }
    EXPECT_EQ(named, 1);
}
