/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inferline/logger.hpp"
#include "inferline/result_store.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>

using namespace inferline;

class ResultStoreTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::setLevel(LogLevel::ERROR); }

    ResultStore store_;
};

TEST_F(ResultStoreTest, GetDoesNotConsume) {
    store_.put("r1", R"({"text":"hello"})", std::string(R"({"tokens":5})"));

    auto first = store_.get("r1");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->requestId, "r1");
    EXPECT_EQ(first->payload, R"({"text":"hello"})");
    EXPECT_TRUE(store_.get("r1").has_value());
    EXPECT_EQ(store_.size(), 1u);
}

TEST_F(ResultStoreTest, TakeAndDeleteDeliversOnce) {
    store_.put("r1", "payload", std::nullopt);

    auto taken = store_.takeAndDelete("r1");
    ASSERT_TRUE(taken.has_value());
    EXPECT_EQ(taken->payload, "payload");
    EXPECT_FALSE(taken->usage.has_value());

    EXPECT_FALSE(store_.takeAndDelete("r1").has_value());
    EXPECT_FALSE(store_.get("r1").has_value());
}

TEST_F(ResultStoreTest, MissingIdIsEmpty) {
    EXPECT_FALSE(store_.get("nope").has_value());
    EXPECT_FALSE(store_.takeAndDelete("nope").has_value());
    store_.erase("nope");
    EXPECT_EQ(store_.size(), 0u);
}

TEST_F(ResultStoreTest, RacingReadersGetOneCopy) {
    for (int round = 0; round < 50; ++round) {
        const std::string id = "r" + std::to_string(round);
        store_.put(id, "payload", std::nullopt);

        std::atomic<int> delivered{0};
        std::vector<std::thread> readers;
        for (int t = 0; t < 6; ++t) {
            readers.emplace_back([&] {
                if (store_.takeAndDelete(id)) {
                    ++delivered;
                }
            });
        }
        for (auto& reader : readers) {
            reader.join();
        }
        EXPECT_EQ(delivered.load(), 1);
    }
    EXPECT_EQ(store_.size(), 0u);
}
