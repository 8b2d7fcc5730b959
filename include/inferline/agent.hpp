/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <thread>

#include "inferline/types.hpp"

namespace inferline {

class Client;
class Pool;
class Processor;

struct AgentConfig {
    std::string brokerUrl = "http://localhost:8000";
    ProviderId providerId;      // defaults to <hostname>-<pid>
    std::string modelPath;
    std::string modelId;        // defaults to the model file name without extension
    std::set<std::string> kinds{"completion", "chat.completion"};
    int workers = 1;
    std::chrono::milliseconds pollInterval{1000};

    [[nodiscard]] static AgentConfig fromEnv();
};

[[nodiscard]] std::string defaultProviderId();
[[nodiscard]] std::string modelIdFromPath(const std::string& modelPath);

// Provider process: polls the broker whenever a worker is idle and runs
// claimed requests on the local model.
class Agent final {
public:
    explicit Agent(AgentConfig config);
    ~Agent();

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;
    Agent(Agent&&) = delete;
    Agent& operator=(Agent&&) = delete;

    [[nodiscard]] bool start();
    void shutdown() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] const AgentConfig& config() const noexcept { return config_; }

private:
    void pollLoop();
    void sleepFor(std::chrono::milliseconds duration) const;
    [[nodiscard]] ProviderCapabilities capabilities() const;

    AgentConfig config_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    std::unique_ptr<Client> client_;
    std::unique_ptr<Pool> pool_;
    std::unique_ptr<Processor> processor_;

    std::thread pollThread_;
};

}
