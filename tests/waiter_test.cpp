/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inferline/broker.hpp"
#include "inferline/logger.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <thread>

using namespace inferline;
using namespace std::chrono_literals;

class WaiterTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::setLevel(LogLevel::ERROR); }

    static ProviderCapabilities caps() {
        ProviderCapabilities c;
        c.models = {"m1"};
        c.kinds = {"completion"};
        return c;
    }

    // Polls until the waiter's request shows up, the way a provider would.
    static MatchResult pollUntilClaimed(Broker& broker, const ProviderId& providerId) {
        auto deadline = std::chrono::steady_clock::now() + 5s;
        while (std::chrono::steady_clock::now() < deadline) {
            MatchResult result = broker.poll(providerId, caps());
            if (result) {
                return result;
            }
            std::this_thread::sleep_for(5ms);
        }
        return {};
    }
};

TEST_F(WaiterTest, CompletionUnblocksWaiterAndConsumesRequest) {
    Broker broker;
    WaitResult waited;

    std::thread client([&] {
        waited = broker.submitAndWait("completion", "m1", R"({"prompt":"hi"})", 10s);
    });

    MatchResult claimed = pollUntilClaimed(broker, "P1");
    ASSERT_TRUE(claimed);
    RequestId id = claimed.request->id;
    ASSERT_TRUE(broker.submitResult(id, R"({"text":"hello"})", std::string(R"({"tokens":5})")));
    client.join();

    ASSERT_TRUE(waited) << waited.message;
    EXPECT_EQ(waited.id, id);
    EXPECT_EQ(waited.payload, R"({"text":"hello"})");
    EXPECT_EQ(waited.usage.value_or(""), R"({"tokens":5})");

    StatusResult after = broker.status(id);
    EXPECT_FALSE(after);
    EXPECT_EQ(after.error, ErrorCode::NotFound);
}

TEST_F(WaiterTest, ProviderFailureReachesWaiter) {
    Broker broker;
    WaitResult waited;

    std::thread client([&] {
        waited = broker.submitAndWait("completion", "m1", "{}", 10s);
    });

    MatchResult claimed = pollUntilClaimed(broker, "P1");
    ASSERT_TRUE(claimed);
    RequestId id = claimed.request->id;
    ASSERT_TRUE(broker.submitError(id, "model overloaded"));
    client.join();

    EXPECT_FALSE(waited);
    EXPECT_EQ(waited.error, ErrorCode::UpstreamFailure);
    EXPECT_EQ(waited.message, "model overloaded");
    EXPECT_FALSE(broker.requests().get(id).has_value());
}

TEST_F(WaiterTest, TimeoutRetainsPendingRequest) {
    Broker broker;

    auto start = std::chrono::steady_clock::now();
    WaitResult waited = broker.submitAndWait("completion", "m1", "{}", 2s);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(waited);
    EXPECT_EQ(waited.error, ErrorCode::Timeout);
    EXPECT_GE(elapsed, 2s);
    EXPECT_LT(elapsed, 4s);

    StatusResult status = broker.status(waited.id);
    ASSERT_TRUE(status);
    EXPECT_EQ(status.status, Status::Pending);
}

TEST_F(WaiterTest, TimeoutWithRemovePolicyDropsRequest) {
    BrokerConfig config;
    config.timeoutPolicy = OrphanPolicy::Remove;
    Broker broker(config);

    WaitResult waited = broker.submitAndWait("completion", "m1", "{}", 50ms);
    EXPECT_EQ(waited.error, ErrorCode::Timeout);
    EXPECT_FALSE(broker.requests().get(waited.id).has_value());
}

TEST_F(WaiterTest, CancellationRemovesRequest) {
    BrokerConfig config;
    config.cancelCheckInterval = 10ms;
    Broker broker(config);
    std::atomic<bool> gone{false};

    std::thread disconnect([&] {
        std::this_thread::sleep_for(50ms);
        gone.store(true);
    });

    auto start = std::chrono::steady_clock::now();
    WaitResult waited = broker.submitAndWait("completion", "m1", "{}", 10s, [&] { return gone.load(); });
    auto elapsed = std::chrono::steady_clock::now() - start;
    disconnect.join();

    EXPECT_EQ(waited.error, ErrorCode::Cancelled);
    EXPECT_LT(elapsed, 5s);
    EXPECT_FALSE(broker.requests().get(waited.id).has_value());
    EXPECT_EQ(broker.stats().requests.total(), 0u);
}

TEST_F(WaiterTest, CancellationWithRetainPolicyKeepsRequest) {
    BrokerConfig config;
    config.cancelPolicy = OrphanPolicy::Retain;
    Broker broker(config);

    WaitResult waited = broker.submitAndWait("completion", "m1", "{}", 10s, [] { return true; });
    EXPECT_EQ(waited.error, ErrorCode::Cancelled);
    ASSERT_TRUE(broker.requests().get(waited.id).has_value());
    EXPECT_EQ(broker.requests().get(waited.id)->status, Status::Pending);
}

TEST_F(WaiterTest, RejectedSubmissionNeverWaits) {
    Broker broker;
    WaitResult waited = broker.submitAndWait("completion", "", "{}", 10s);
    EXPECT_EQ(waited.error, ErrorCode::InvalidRequest);
    EXPECT_TRUE(waited.id.empty());
}

TEST_F(WaiterTest, SecondResultAfterWaiterConsumedRequestIsInvalidState) {
    Broker broker;
    WaitResult waited;

    std::thread client([&] {
        waited = broker.submitAndWait("completion", "m1", R"({"prompt":"hi"})", 10s);
    });

    MatchResult claimed = pollUntilClaimed(broker, "P1");
    RequestId id = claimed ? claimed.request->id : RequestId{};
    OpResult first = broker.submitResult(id, R"({"text":"one"})");
    client.join();

    ASSERT_TRUE(claimed);
    ASSERT_TRUE(first) << first.message;
    ASSERT_TRUE(waited) << waited.message;

    OpResult second = broker.submitResult(id, R"({"text":"two"})");
    EXPECT_FALSE(second);
    EXPECT_EQ(second.error, ErrorCode::InvalidState);
    EXPECT_EQ(broker.submitError(id, "late").error, ErrorCode::InvalidState);
    EXPECT_EQ(broker.stats().requests.total(), 0u);
}

TEST_F(WaiterTest, HugeTimeoutIsClampedAndStillCompletes) {
    Broker broker;
    WaitResult waited;
    const auto huge = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(10000000000LL));

    std::thread client([&] {
        waited = broker.submitAndWait("completion", "m1", R"({"prompt":"hi"})", huge);
    });

    MatchResult claimed = pollUntilClaimed(broker, "P1");
    if (claimed) {
        (void)broker.submitResult(claimed.request->id, R"({"text":"late but fine"})");
    }
    client.join();

    ASSERT_TRUE(claimed);
    ASSERT_TRUE(waited) << toString(waited.error) << ": " << waited.message;
    EXPECT_EQ(waited.payload, R"({"text":"late but fine"})");
}

TEST_F(WaiterTest, NonPositiveTimeoutExpiresImmediately) {
    Broker broker;

    auto start = std::chrono::steady_clock::now();
    WaitResult waited = broker.submitAndWait("completion", "m1", "{}", std::chrono::milliseconds(-5000));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(waited.error, ErrorCode::Timeout);
    EXPECT_LT(elapsed, 1s);

    StatusResult status = broker.status(waited.id);
    ASSERT_TRUE(status);
    EXPECT_EQ(status.status, Status::Pending);
}
