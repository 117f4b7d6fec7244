/**
 * @file test_random.cpp
 * @brief Unit tests for the system random source
 */

#include <gtest/gtest.h>
#include <bsonuuid/utils/random.hpp>

#include <set>
#include <thread>
#include <vector>

using namespace bsonuuid::utils;

TEST(SystemRandomSourceTest, ReturnsRequestedLength) {
    SystemRandomSource source;

    EXPECT_EQ(source.randomBytes(0).size(), 0u);
    EXPECT_EQ(source.randomBytes(1).size(), 1u);
    EXPECT_EQ(source.randomBytes(16).size(), 16u);
    EXPECT_EQ(source.randomBytes(33).size(), 33u);
}

TEST(SystemRandomSourceTest, OutputVaries) {
    SystemRandomSource source;
    std::set<std::vector<uint8_t>> seen;

    for (int i = 0; i < 100; ++i) {
        seen.insert(source.randomBytes(16));
    }

    EXPECT_EQ(seen.size(), 100u);
}

TEST(SystemRandomSourceTest, SharedInstanceIsStable) {
    EXPECT_EQ(systemRandomSource().get(), systemRandomSource().get());
}

TEST(SystemRandomSourceTest, ConcurrentUse) {
    auto source = systemRandomSource();
    std::vector<std::thread> threads;

    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([source]() {
            for (int j = 0; j < 200; ++j) {
                EXPECT_EQ(source->randomBytes(16).size(), 16u);
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }
}
