/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inferline/broker.hpp"
#include "inferline/logger.hpp"
#include <gtest/gtest.h>

using namespace inferline;
using namespace std::chrono_literals;

class BrokerTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::setLevel(LogLevel::ERROR); }

    static ProviderCapabilities caps(std::set<std::string> models, std::set<std::string> kinds = {}) {
        ProviderCapabilities c;
        c.models = std::move(models);
        c.kinds = std::move(kinds);
        return c;
    }

    Broker broker_;
};

TEST_F(BrokerTest, SubmitRejectsEmptyKindOrModel) {
    SubmitResult noKind = broker_.submit("", "m1", "{}");
    EXPECT_FALSE(noKind);
    EXPECT_EQ(noKind.error, ErrorCode::InvalidRequest);

    SubmitResult noModel = broker_.submit("completion", "", "{}");
    EXPECT_FALSE(noModel);
    EXPECT_EQ(noModel.error, ErrorCode::InvalidRequest);

    EXPECT_EQ(broker_.requests().size(), 0u);
}

TEST_F(BrokerTest, SubmitRejectsOversizedPayload) {
    BrokerConfig config;
    config.maxPayloadBytes = 16;
    Broker small(config);

    SubmitResult result = small.submit("completion", "m1", std::string(17, 'x'));
    EXPECT_EQ(result.error, ErrorCode::InvalidRequest);
    EXPECT_TRUE(small.submit("completion", "m1", std::string(16, 'x')));
}

TEST_F(BrokerTest, SubmittedRequestIsPending) {
    SubmitResult submitted = broker_.submit("completion", "m1", "{}");
    ASSERT_TRUE(submitted);
    EXPECT_FALSE(submitted.id.empty());

    StatusResult status = broker_.status(submitted.id);
    ASSERT_TRUE(status);
    EXPECT_EQ(status.status, Status::Pending);
    // Non-terminal lookups do not consume
    EXPECT_TRUE(broker_.status(submitted.id));
}

TEST_F(BrokerTest, PollRequiresProviderId) {
    MatchResult result = broker_.poll("", caps({"m1"}));
    EXPECT_EQ(result.error, ErrorCode::InvalidRequest);
    EXPECT_EQ(broker_.registry().size(), 0u);
}

TEST_F(BrokerTest, PollWithoutKindsServesDefaultKind) {
    SubmitResult submitted = broker_.submit("completion", "m1", "{}");
    ASSERT_TRUE(submitted);

    MatchResult result = broker_.poll("P1", caps({"m1"}));
    ASSERT_TRUE(result);
    EXPECT_EQ(result.request->id, submitted.id);
    EXPECT_EQ(result.request->claimedBy.value_or(""), "P1");

    auto record = broker_.registry().get("P1");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->kinds, (std::set<std::string>{"completion"}));
}

TEST_F(BrokerTest, PollIgnoresCallerSuppliedLastSeen) {
    ProviderCapabilities stale = caps({"m1"});
    stale.lastSeen = Clock::now() - 1h;
    (void)broker_.submit("completion", "m1", "{}");

    EXPECT_TRUE(broker_.poll("P1", stale));
}

TEST_F(BrokerTest, RegisterMakesModelsVisible) {
    ASSERT_TRUE(broker_.registerProvider("P1", caps({"llama", "qwen"})));

    EXPECT_TRUE(broker_.serves("llama"));
    EXPECT_FALSE(broker_.serves("mistral"));
    ASSERT_EQ(broker_.models().size(), 2u);
    ASSERT_EQ(broker_.providers().size(), 1u);
    EXPECT_EQ(broker_.providers()[0].providerId, "P1");

    EXPECT_EQ(broker_.registerProvider("", caps({"m1"})).error, ErrorCode::InvalidRequest);
}

TEST_F(BrokerTest, ExpiredProvidersStopServing) {
    auto then = Clock::now() - 10min;
    ASSERT_TRUE(broker_.registerProvider("P1", caps({"llama"}), then));

    EXPECT_TRUE(broker_.serves("llama", then));
    EXPECT_FALSE(broker_.serves("llama"));
    EXPECT_TRUE(broker_.models().empty());
}

TEST_F(BrokerTest, CompletedStatusIsConsumed) {
    SubmitResult submitted = broker_.submit("completion", "m1", "{}");
    ASSERT_TRUE(broker_.poll("P1", caps({"m1"})));
    ASSERT_TRUE(broker_.submitResult(submitted.id, R"({"text":"hi"})", std::string(R"({"total_tokens":3})")));

    StatusResult first = broker_.status(submitted.id);
    ASSERT_TRUE(first);
    EXPECT_EQ(first.status, Status::Completed);
    EXPECT_EQ(first.payload, R"({"text":"hi"})");
    EXPECT_EQ(first.usage.value_or(""), R"({"total_tokens":3})");

    StatusResult second = broker_.status(submitted.id);
    EXPECT_EQ(second.error, ErrorCode::NotFound);
    EXPECT_EQ(broker_.results().size(), 0u);
}

TEST_F(BrokerTest, FailedStatusCarriesProviderMessage) {
    SubmitResult submitted = broker_.submit("completion", "m1", "{}");
    ASSERT_TRUE(broker_.poll("P1", caps({"m1"})));
    ASSERT_TRUE(broker_.submitError(submitted.id, "model overloaded"));

    StatusResult status = broker_.status(submitted.id);
    ASSERT_TRUE(status);
    EXPECT_EQ(status.status, Status::Failed);
    EXPECT_EQ(status.error, ErrorCode::UpstreamFailure);
    EXPECT_EQ(status.message, "model overloaded");
    EXPECT_EQ(broker_.status(submitted.id).error, ErrorCode::NotFound);
}

TEST_F(BrokerTest, ResultForUnclaimedRequestIsInvalidState) {
    SubmitResult submitted = broker_.submit("completion", "m1", "{}");
    EXPECT_EQ(broker_.submitResult(submitted.id, "{}").error, ErrorCode::InvalidState);
    EXPECT_EQ(broker_.submitResult("unknown", "{}").error, ErrorCode::InvalidState);
    EXPECT_EQ(broker_.submitError("unknown", "x").error, ErrorCode::InvalidState);
}

TEST_F(BrokerTest, StatsCountEveryState) {
    SubmitResult a = broker_.submit("completion", "m1", "{}");
    SubmitResult b = broker_.submit("completion", "m1", "{}");
    (void)broker_.submit("completion", "m1", "{}");
    SubmitResult d = broker_.submit("completion", "m2", "{}");

    ASSERT_TRUE(broker_.poll("P1", caps({"m1"})));
    ASSERT_TRUE(broker_.poll("P1", caps({"m1"})));
    ASSERT_TRUE(broker_.submitResult(a.id, "{}"));
    ASSERT_TRUE(broker_.submitError(d.id, "no provider for m2"));
    (void)b;

    BrokerStats stats = broker_.stats();
    EXPECT_EQ(stats.requests.pending, 1u);
    EXPECT_EQ(stats.requests.processing, 1u);
    EXPECT_EQ(stats.requests.completed, 1u);
    EXPECT_EQ(stats.requests.failed, 1u);
    EXPECT_EQ(stats.requests.total(), 4u);
    EXPECT_EQ(stats.providers, 1u);
    EXPECT_EQ(stats.results, 1u);
}

TEST_F(BrokerTest, SweepUsesConfiguredRetention) {
    BrokerConfig config;
    config.retention = 60s;
    Broker broker(config);
    SubmitResult submitted = broker.submit("completion", "m1", "{}");
    ASSERT_TRUE(submitted);

    EXPECT_EQ(broker.sweep(Clock::now() + 30s), 0u);
    EXPECT_EQ(broker.sweep(Clock::now() + 2min), 1u);
    EXPECT_EQ(broker.status(submitted.id).error, ErrorCode::NotFound);
}

TEST_F(BrokerTest, SweepPurgesExpiredProviders) {
    BrokerConfig config;
    config.providerTtl = 60s;
    Broker broker(config);
    auto now = Clock::now();
    ASSERT_TRUE(broker.registerProvider("P1", caps({"m1"}), now));
    ASSERT_TRUE(broker.registerProvider("P2", caps({"m1"}), now + 90s));

    EXPECT_EQ(broker.sweep(now + 30s), 0u);
    EXPECT_EQ(broker.registry().size(), 2u);

    (void)broker.sweep(now + 2min);
    EXPECT_EQ(broker.registry().size(), 1u);
    EXPECT_FALSE(broker.registry().get("P1").has_value());
    EXPECT_TRUE(broker.registry().get("P2").has_value());
}
