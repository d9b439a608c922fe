/**
 * @file EventingMemberDirectoryTest.cpp
 * @brief Unit tests for EventingMemberDirectory
 */

#include <gtest/gtest.h>
#include "adapters/secondary/EventingMemberDirectory.hpp"
#include "../mocks/MockEventPublisher.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

using namespace ledger;
using namespace ledger::adapters::secondary;
using ledger::tests::MockEventPublisher;

class EventingMemberDirectoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        publisher_ = std::make_shared<MockEventPublisher>();
        directory_ = std::make_unique<EventingMemberDirectory>(publisher_);
    }

    static bool contains(const std::vector<domain::UserId>& members, const domain::UserId& userId) {
        return std::find(members.begin(), members.end(), userId) != members.end();
    }

    std::shared_ptr<MockEventPublisher> publisher_;
    std::unique_ptr<EventingMemberDirectory> directory_;
};

TEST_F(EventingMemberDirectoryTest, UnknownRole_Empty) {
    EXPECT_TRUE(directory_->membersWithRole("guild-1", "role-x").empty());
}

TEST_F(EventingMemberDirectoryTest, SetMembers_ReplacesSnapshot) {
    directory_->setMembers("guild-1", "role-member", {"alice", "bob"});
    directory_->setMembers("guild-1", "role-member", {"carol"});

    auto members = directory_->membersWithRole("guild-1", "role-member");
    ASSERT_EQ(members.size(), 1u);
    EXPECT_EQ(members[0], "carol");

    EXPECT_TRUE(directory_->membersWithRole("guild-2", "role-member").empty());
    EXPECT_EQ(publisher_->publishCallCount(), 0);
}

TEST_F(EventingMemberDirectoryTest, GrantRole_UpdatesSnapshotAndPublishes) {
    directory_->setMembers("guild-1", "role-vip", {"bob"});

    directory_->grantRole("guild-1", "alice", "role-vip");

    auto members = directory_->membersWithRole("guild-1", "role-vip");
    EXPECT_EQ(members.size(), 2u);
    EXPECT_TRUE(contains(members, "alice"));

    auto grants = publisher_->messagesWithKey("role.grant");
    ASSERT_EQ(grants.size(), 1u);
    auto json = nlohmann::json::parse(grants[0].message);
    EXPECT_EQ(json["tenantId"], "guild-1");
    EXPECT_EQ(json["userId"], "alice");
    EXPECT_EQ(json["roleId"], "role-vip");
    EXPECT_EQ(json["reason"], "purchase");
}

TEST_F(EventingMemberDirectoryTest, RevokeRole_UpdatesSnapshotAndPublishes) {
    directory_->setMembers("guild-1", "role-vip", {"alice", "bob"});

    directory_->revokeRole("guild-1", "alice", "role-vip");

    auto members = directory_->membersWithRole("guild-1", "role-vip");
    EXPECT_FALSE(contains(members, "alice"));
    EXPECT_TRUE(contains(members, "bob"));

    auto revokes = publisher_->messagesWithKey("role.revoke");
    ASSERT_EQ(revokes.size(), 1u);
    EXPECT_EQ(nlohmann::json::parse(revokes[0].message)["reason"], "expired");
}

TEST_F(EventingMemberDirectoryTest, GrantRole_WithoutSnapshot_CreatesRole) {
    directory_->grantRole("guild-1", "alice", "role-new");

    auto members = directory_->membersWithRole("guild-1", "role-new");
    ASSERT_EQ(members.size(), 1u);
    EXPECT_EQ(members[0], "alice");
}
