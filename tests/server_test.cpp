/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inferline/broker.hpp"
#include "inferline/client.hpp"
#include "inferline/generation.hpp"
#include "inferline/logger.hpp"
#include "inferline/server.hpp"
#include "inferline/wire.hpp"
#include <gtest/gtest.h>
#include <httplib.h>
#include <atomic>
#include <memory>
#include <thread>

using namespace inferline;
using namespace std::chrono_literals;
using wire::json;

class ServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setLevel(LogLevel::ERROR);

        BrokerConfig brokerConfig;
        brokerConfig.cancelCheckInterval = 20ms;
        broker_ = std::make_unique<Broker>(brokerConfig);

        ServerConfig serverConfig;
        serverConfig.host = "127.0.0.1";
        serverConfig.port = 0;
        serverConfig.httpThreads = 4;
        server_ = std::make_unique<Server>(*broker_, serverConfig);
        ASSERT_TRUE(server_->start());
        ASSERT_GT(server_->port(), 0);

        client_ = std::make_unique<Client>(baseUrl(), 10s);
    }

    void TearDown() override {
        client_.reset();
        if (server_) {
            server_->shutdown();
        }
        server_.reset();
        broker_.reset();
    }

    std::string baseUrl() const {
        return "http://127.0.0.1:" + std::to_string(server_->port());
    }

    static ProviderCapabilities provider(const std::string& id) {
        ProviderCapabilities caps;
        caps.providerId = id;
        caps.models = {"m1"};
        caps.kinds = {kKindCompletion, kKindChatCompletion};
        return caps;
    }

    std::unique_ptr<Broker> broker_;
    std::unique_ptr<Server> server_;
    std::unique_ptr<Client> client_;
};

TEST_F(ServerTest, HealthEndpoint) {
    EXPECT_TRUE(server_->isRunning());
    EXPECT_TRUE(client_->healthy());
}

TEST_F(ServerTest, QueueRoundTrip) {
    SubmitResult submitted = client_->submit(kKindCompletion, R"({"model":"m1","prompt":"hi"})");
    ASSERT_TRUE(submitted) << submitted.message;

    StatusResult pending = client_->status(submitted.id);
    ASSERT_TRUE(pending) << pending.message;
    EXPECT_EQ(pending.status, Status::Pending);

    MatchResult claimed = client_->poll(provider("P1"));
    ASSERT_TRUE(claimed) << claimed.message;
    EXPECT_EQ(claimed.request->id, submitted.id);
    EXPECT_EQ(claimed.request->model, "m1");
    EXPECT_EQ(json::parse(claimed.request->payload)["prompt"], "hi");

    ASSERT_TRUE(client_->submitResult(submitted.id, R"({"text":"hello"})", std::string(R"({"tokens":5})")));

    StatusResult done = client_->status(submitted.id);
    ASSERT_TRUE(done) << done.message;
    EXPECT_EQ(done.status, Status::Completed);
    EXPECT_EQ(json::parse(done.payload)["text"], "hello");
    EXPECT_EQ(json::parse(done.usage.value_or("{}"))["tokens"], 5);

    StatusResult gone = client_->status(submitted.id);
    EXPECT_EQ(gone.error, ErrorCode::NotFound);
}

TEST_F(ServerTest, NextWithoutWorkIsNoContent) {
    MatchResult result = client_->poll(provider("P1"));
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, ErrorCode::NoPendingWork);
    EXPECT_TRUE(broker_->registry().isActive("P1", Clock::now()));
}

TEST_F(ServerTest, DuplicateResultIsConflict) {
    SubmitResult submitted = client_->submit(kKindCompletion, R"({"model":"m1","prompt":"hi"})");
    ASSERT_TRUE(submitted);
    ASSERT_TRUE(client_->poll(provider("P1")));
    ASSERT_TRUE(client_->submitResult(submitted.id, R"({"text":"one"})", std::nullopt));

    OpResult again = client_->submitResult(submitted.id, R"({"text":"two"})", std::nullopt);
    EXPECT_FALSE(again);
    EXPECT_EQ(again.error, ErrorCode::InvalidState);
}

TEST_F(ServerTest, ProviderErrorSurfacesInStatus) {
    SubmitResult submitted = client_->submit(kKindCompletion, R"({"model":"m1","prompt":"hi"})");
    ASSERT_TRUE(submitted);
    ASSERT_TRUE(client_->poll(provider("P1")));
    ASSERT_TRUE(client_->submitError(submitted.id, "model overloaded"));

    StatusResult status = client_->status(submitted.id);
    EXPECT_EQ(status.status, Status::Failed);
    EXPECT_EQ(status.error, ErrorCode::UpstreamFailure);
    EXPECT_EQ(status.message, "model overloaded");
}

TEST_F(ServerTest, UnknownRequestStatusIsNotFoundAndResultIsConflict) {
    StatusResult status = client_->status("does-not-exist");
    EXPECT_FALSE(status);
    EXPECT_EQ(status.error, ErrorCode::NotFound);

    OpResult result = client_->submitResult("does-not-exist", "{}", std::nullopt);
    EXPECT_EQ(result.error, ErrorCode::InvalidState);
}

TEST_F(ServerTest, SubmitWithoutModelIsBadRequest) {
    SubmitResult submitted = client_->submit(kKindCompletion, R"({"prompt":"hi"})");
    EXPECT_FALSE(submitted);
    EXPECT_EQ(submitted.error, ErrorCode::InvalidRequest);
}

TEST_F(ServerTest, CompletionForUnservedModelIsNotFound) {
    WaitResult result = client_->complete(kKindCompletion, R"({"model":"nobody","prompt":"hi"})");
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, ErrorCode::NotFound);
    EXPECT_EQ(result.message, "Model 'nobody' not found");
    EXPECT_EQ(broker_->stats().requests.total(), 0u);
}

TEST_F(ServerTest, CompletionValidatesBody) {
    ASSERT_TRUE(client_->registerProvider(provider("P1")));

    WaitResult noPrompt = client_->complete(kKindCompletion, R"({"model":"m1"})");
    EXPECT_EQ(noPrompt.error, ErrorCode::InvalidRequest);

    WaitResult streaming = client_->complete(kKindChatCompletion,
        R"({"model":"m1","messages":[{"role":"user","content":"hi"}],"stream":true})");
    EXPECT_EQ(streaming.error, ErrorCode::InvalidRequest);
}

TEST_F(ServerTest, CompletionIsServedByPollingProvider) {
    Client providerClient(baseUrl(), 10s);
    ASSERT_TRUE(providerClient.registerProvider(provider("P1")));

    std::atomic<bool> stop{false};
    std::thread worker([&] {
        while (!stop.load()) {
            MatchResult match = providerClient.poll(provider("P1"));
            if (!match) {
                std::this_thread::sleep_for(10ms);
                continue;
            }
            json body = json::parse(match.request->payload);
            Generation generation;
            generation.text = "echo: " + body["prompt"].get<std::string>();
            generation.promptTokens = 1;
            generation.completionTokens = 2;
            json response = wire::completionResponse(match.request->model, generation, Clock::now());
            (void)providerClient.submitResult(match.request->id, response.dump(),
                                              wire::usage(generation).dump());
            return;
        }
    });

    WaitResult result = client_->complete(kKindCompletion, R"({"model":"m1","prompt":"ping"})", 5s);
    stop.store(true);
    worker.join();

    ASSERT_TRUE(result) << result.message;
    EXPECT_FALSE(result.id.empty());
    json response = json::parse(result.payload);
    EXPECT_EQ(wire::responseText(response).value_or(""), "echo: ping");
    EXPECT_EQ(response["usage"]["total_tokens"], 3);
    EXPECT_EQ(broker_->stats().requests.total(), 0u);
}

TEST_F(ServerTest, CompletionTimesOutWithoutProvider) {
    // Registered but never polls, so the request stays pending
    ASSERT_TRUE(client_->registerProvider(provider("P1")));

    WaitResult result = client_->complete(kKindCompletion, R"({"model":"m1","prompt":"hi"})", 1s);
    EXPECT_EQ(result.error, ErrorCode::Timeout);
    EXPECT_FALSE(result.id.empty());

    StatusResult status = client_->status(result.id);
    ASSERT_TRUE(status);
    EXPECT_EQ(status.status, Status::Pending);
}

TEST_F(ServerTest, CompletionTimeoutMustBeInRange) {
    ASSERT_TRUE(client_->registerProvider(provider("P1")));
    httplib::Client http("127.0.0.1", server_->port());
    const std::string body = R"({"model":"m1","prompt":"hi"})";

    for (const std::string value : {"-5", "0", "99999999999", "soon"}) {
        auto response = http.Post("/completions?timeout=" + value, body, wire::kJsonMime);
        ASSERT_TRUE(response) << value;
        EXPECT_EQ(response->status, 400) << value;
        EXPECT_EQ(json::parse(response->body)["error"]["type"], "invalid_request") << value;
    }
    EXPECT_EQ(broker_->stats().requests.total(), 0u);
}

TEST_F(ServerTest, BlockedCompletionsLeaveQueueRoutesServed) {
    BrokerConfig brokerConfig;
    brokerConfig.cancelCheckInterval = 20ms;
    Broker broker(brokerConfig);

    ServerConfig serverConfig;
    serverConfig.host = "127.0.0.1";
    serverConfig.port = 0;
    serverConfig.httpThreads = 2;
    Server server(broker, serverConfig);
    ASSERT_TRUE(server.start());
    const std::string url = "http://127.0.0.1:" + std::to_string(server.port());
    const std::string body = R"({"model":"m1","prompt":"hi"})";

    Client providerClient(url, 10s);
    ASSERT_TRUE(providerClient.registerProvider(provider("P1")));

    WaitResult first;
    std::thread blocked([&] {
        Client caller(url, 10s);
        first = caller.complete(kKindCompletion, body, 5s);
    });

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (broker.stats().requests.pending == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }

    // Both HTTP threads would be held by waits without the cap
    httplib::Client http("127.0.0.1", server.port());
    http.set_read_timeout(10, 0);
    auto second = http.Post("/completions?timeout=5", body, wire::kJsonMime);
    auto third = http.Post("/completions?timeout=5", body, wire::kJsonMime);

    MatchResult claimed = providerClient.poll(provider("P1"));
    OpResult accepted;
    if (claimed) {
        accepted = providerClient.submitResult(claimed.request->id, R"({"text":"served"})", std::nullopt);
    }
    blocked.join();
    server.shutdown();

    ASSERT_TRUE(second);
    EXPECT_EQ(second->status, 503);
    ASSERT_TRUE(third);
    EXPECT_EQ(third->status, 503);
    ASSERT_TRUE(claimed) << claimed.message;
    EXPECT_TRUE(accepted) << accepted.message;
    ASSERT_TRUE(first) << first.message;
    EXPECT_EQ(json::parse(first.payload)["text"], "served");
}

TEST_F(ServerTest, StatsModelsAndProvidersRoutes) {
    ASSERT_TRUE(client_->registerProvider(provider("P1")));
    ASSERT_TRUE(client_->submit(kKindCompletion, R"({"model":"m1","prompt":"a"})"));

    httplib::Client http("127.0.0.1", server_->port());

    auto stats = http.Get("/queue/stats");
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats->status, 200);
    json statsBody = json::parse(stats->body);
    EXPECT_EQ(statsBody["pending"], 1);
    EXPECT_EQ(statsBody["total"], 1);
    EXPECT_EQ(statsBody["active_providers"], 1);

    auto models = http.Get("/models");
    ASSERT_TRUE(models);
    json modelsBody = json::parse(models->body);
    EXPECT_EQ(modelsBody["object"], "list");
    ASSERT_EQ(modelsBody["data"].size(), 1u);
    EXPECT_EQ(modelsBody["data"][0]["id"], "m1");

    auto providers = http.Get("/providers");
    ASSERT_TRUE(providers);
    json providersBody = json::parse(providers->body);
    ASSERT_EQ(providersBody["data"].size(), 1u);
    EXPECT_EQ(providersBody["data"][0]["provider_id"], "P1");
}

TEST_F(ServerTest, MalformedBodiesAreBadRequests) {
    httplib::Client http("127.0.0.1", server_->port());

    auto next = http.Post("/queue/next", "not json", wire::kJsonMime);
    ASSERT_TRUE(next);
    EXPECT_EQ(next->status, 400);
    EXPECT_EQ(json::parse(next->body)["error"]["type"], "invalid_request");

    auto result = http.Post("/queue/result", R"({"result_data":{}})", wire::kJsonMime);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->status, 400);

    auto completion = http.Post("/completions", "[]", wire::kJsonMime);
    ASSERT_TRUE(completion);
    EXPECT_EQ(completion->status, 400);
}

TEST_F(ServerTest, ShutdownIsIdempotent) {
    server_->shutdown();
    EXPECT_FALSE(server_->isRunning());
    server_->shutdown();
    EXPECT_FALSE(client_->healthy());
}
