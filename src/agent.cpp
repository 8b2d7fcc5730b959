/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inferline/agent.hpp"
#include "inferline/client.hpp"
#include "inferline/config.hpp"
#include "inferline/logger.hpp"
#include "inferline/pool.hpp"
#include "inferline/processor.hpp"
#include <filesystem>
#include <unistd.h>

namespace inferline {

// Signal handling is done by the CLI (inferline-provider.cpp)

AgentConfig AgentConfig::fromEnv() {
    AgentConfig config;
    config.brokerUrl = envString("INFERLINE_BROKER_URL", config.brokerUrl);
    config.pollInterval = std::chrono::milliseconds(
        envInt("INFERLINE_POLL_INTERVAL_MS", static_cast<int>(config.pollInterval.count())));
    return config;
}

std::string defaultProviderId() {
    char host[256] = {0};
    if (gethostname(host, sizeof(host) - 1) != 0 || host[0] == '\0') {
        return "provider-" + std::to_string(getpid());
    }
    return std::string(host) + "-" + std::to_string(getpid());
}

std::string modelIdFromPath(const std::string& modelPath) {
    return std::filesystem::path(modelPath).stem().string();
}

Agent::Agent(AgentConfig config) : config_(std::move(config)) {
    if (config_.providerId.empty()) {
        config_.providerId = defaultProviderId();
    }
    if (config_.modelId.empty()) {
        config_.modelId = modelIdFromPath(config_.modelPath);
    }
    if (config_.workers < 1) {
        config_.workers = 1;
    }
    LOG_DEBUG("Agent created - provider: " + config_.providerId + ", model: " + config_.modelId +
              ", broker: " + config_.brokerUrl + ", workers: " + std::to_string(config_.workers));
}

Agent::~Agent() {
    shutdown();
}

ProviderCapabilities Agent::capabilities() const {
    ProviderCapabilities caps;
    caps.providerId = config_.providerId;
    caps.models.insert(config_.modelId);
    caps.kinds = config_.kinds;
    return caps;
}

bool Agent::start() {
    if (running_.load()) {
        LOG_WARN("Agent already running");
        return false;
    }

    LOG_INFO("Starting inferline provider...");
    setThreadName("Main");
    shutdown_.store(false);

    try {
        client_ = std::make_unique<Client>(config_.brokerUrl);
        pool_ = std::make_unique<Pool>(config_.workers);
        processor_ = std::make_unique<Processor>(*client_, config_.modelPath, config_.modelId);

        LOG_DEBUG("Pre-initializing " + std::to_string(config_.workers) + " Runner instances...");
        if (!processor_->initializeRunners(config_.workers)) {
            LOG_ERROR("Failed to initialize runners");
            return false;
        }

        if (!pool_->start([this](const InferenceRequest& request, int workerId) {
            (void)processor_->process(request, workerId);
        })) {
            LOG_ERROR("Failed to start worker pool");
            return false;
        }

        // Not fatal: the poll loop keeps retrying and every poll re-registers
        OpResult registered = client_->registerProvider(capabilities());
        if (registered) {
            LOG_INFO("Registered with broker " + config_.brokerUrl + " as " + config_.providerId);
        } else {
            LOG_WARN("Registration failed: " + registered.message);
        }

        running_.store(true);
        pollThread_ = std::thread(&Agent::pollLoop, this);

        LOG_DEBUG("Agent started successfully");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start agent: " + std::string(e.what()));
        return false;
    }
}

void Agent::shutdown() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("Shutting down provider...");

    shutdown_.store(true);
    running_.store(false);

    if (pollThread_.joinable()) {
        pollThread_.join();
    }

    // In-flight requests finish; claimed ones that never started are handed back as failures
    if (pool_) {
        auto unstarted = pool_->stop();
        for (const auto& request : unstarted) {
            OpResult reported = client_->submitError(request.id, "Provider shutting down");
            if (!reported) {
                LOG_WARN("Could not release request " + request.id + ": " + reported.message);
            }
        }
    }

    processor_.reset();
    pool_.reset();
    client_.reset();

    LOG_INFO("Provider shutdown complete");
}

void Agent::sleepFor(std::chrono::milliseconds duration) const {
    auto sleepEnd = std::chrono::steady_clock::now() + duration;
    while (std::chrono::steady_clock::now() < sleepEnd && !shutdown_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

void Agent::pollLoop() {
    setThreadName("Poller");
    LOG_DEBUG("Poll loop started");

    const ProviderCapabilities caps = capabilities();
    bool brokerReachable = true;

    while (!shutdown_.load()) {
        try {
            if (pool_->idleWorkers() == 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                continue;
            }

            MatchResult polled = client_->poll(caps);
            if (polled && polled.request) {
                brokerReachable = true;
                LOG_DEBUG("Claimed request: " + polled.request->id);
                RequestId id = polled.request->id;
                if (!pool_->submit(std::move(*polled.request))) {
                    (void)client_->submitError(id, "Provider could not accept request");
                }
                continue;
            }

            if (polled.error == ErrorCode::Unavailable) {
                if (brokerReachable) {
                    LOG_WARN(polled.message);
                }
                brokerReachable = false;
            } else {
                if (!brokerReachable) {
                    LOG_INFO("Broker reachable again");
                }
                brokerReachable = true;
                if (polled.error != ErrorCode::NoPendingWork) {
                    LOG_WARN("Poll failed: " + polled.message);
                }
            }

            sleepFor(config_.pollInterval);

        } catch (const std::exception& e) {
            LOG_ERROR("Poll loop error: " + std::string(e.what()));
            sleepFor(config_.pollInterval);
        }
    }

    LOG_DEBUG("Poll loop stopped");
}

}
