#include <gtest/gtest.h>
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <atomic>

using Members = std::set<std::string>;

class ThreadSafeMapTest : public ::testing::Test {
protected:
    ThreadSafeMap<std::string, Members> map;
};

// ============================================================================
// Базовые операции
// ============================================================================

TEST_F(ThreadSafeMapTest, InsertAndFind) {
    map.insert("g1/vip", std::make_shared<Members>(Members{"alice", "bob"}));

    auto found = map.find("g1/vip");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->size(), 2u);
    EXPECT_TRUE(found->count("alice"));
}

TEST_F(ThreadSafeMapTest, FindNonExistent) {
    EXPECT_EQ(map.find("g1/none"), nullptr);
    EXPECT_FALSE(map.contains("g1/none"));
}

TEST_F(ThreadSafeMapTest, Erase) {
    map.insert("g1/vip", std::make_shared<Members>());

    EXPECT_TRUE(map.erase("g1/vip"));
    EXPECT_FALSE(map.erase("g1/vip"));
    EXPECT_FALSE(map.contains("g1/vip"));
}

TEST_F(ThreadSafeMapTest, Update_CreatesMissingValue) {
    map.update("g1/vip", [](Members& m) { m.insert("alice"); });

    auto found = map.find("g1/vip");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(*found, Members{"alice"});
}

TEST_F(ThreadSafeMapTest, Update_DoesNotTouchHeldSnapshot) {
    map.insert("g1/vip", std::make_shared<Members>(Members{"alice"}));
    auto snapshot = map.find("g1/vip");

    map.update("g1/vip", [](Members& m) { m.insert("bob"); });

    EXPECT_EQ(snapshot->size(), 1u);
    EXPECT_EQ(map.find("g1/vip")->size(), 2u);
}

TEST_F(ThreadSafeMapTest, KeysAndSize) {
    map.insert("g1/a", std::make_shared<Members>());
    map.insert("g2/b", std::make_shared<Members>());

    auto keys = map.keys();
    std::sort(keys.begin(), keys.end());
    EXPECT_EQ(keys, (std::vector<std::string>{"g1/a", "g2/b"}));
    EXPECT_EQ(map.size(), 2u);
}

// ============================================================================
// Многопоточность
// ============================================================================

TEST_F(ThreadSafeMapTest, ConcurrentUpdates_NoLostWrites) {
    const int NUM_WRITERS = 5;
    const int USERS_PER_WRITER = 100;

    std::vector<std::thread> threads;
    for (int writer = 0; writer < NUM_WRITERS; ++writer) {
        threads.emplace_back([this, writer]() {
            for (int i = 0; i < USERS_PER_WRITER; ++i) {
                std::string user = "w" + std::to_string(writer) + "_u" + std::to_string(i);
                map.update("g1/vip", [&user](Members& m) { m.insert(user); });
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    auto found = map.find("g1/vip");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->size(), static_cast<size_t>(NUM_WRITERS * USERS_PER_WRITER));
}

TEST_F(ThreadSafeMapTest, ConcurrentReadWrite_ReadersAlwaysSeeValue) {
    map.insert("g1/vip", std::make_shared<Members>(Members{"seed"}));

    std::vector<std::thread> threads;
    std::atomic<int> readCount(0);

    for (int writer = 0; writer < 5; ++writer) {
        threads.emplace_back([this, writer]() {
            for (int i = 0; i < 50; ++i) {
                map.update("g1/vip", [&](Members& m) { m.insert(std::to_string(writer * 100 + i)); });
            }
        });
    }
    for (int reader = 0; reader < 5; ++reader) {
        threads.emplace_back([this, &readCount]() {
            for (int i = 0; i < 100; ++i) {
                auto found = map.find("g1/vip");
                ASSERT_NE(found, nullptr);
                EXPECT_TRUE(found->count("seed"));
                readCount++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(readCount, 500);
    EXPECT_EQ(map.find("g1/vip")->size(), 251u);
}
