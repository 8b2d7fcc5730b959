/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "inferline/types.hpp"

namespace httplib {
class Server;
struct Request;
struct Response;
}

namespace inferline {

class Broker;

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8000;            // 0 binds an ephemeral port
    int httpThreads = 32;
    int maxWaiters = 0;         // blocking completions at once; 0 means httpThreads - 1
    std::chrono::seconds sweepInterval{30};

    [[nodiscard]] static ServerConfig fromEnv();
};

// HTTP front of the broker. Blocking handlers (completions) occupy one
// HTTP thread each for the duration of the wait, so at most maxWaiters of
// them run at once and at least one thread stays free for the queue routes.
class Server final {
public:
    Server(Broker& broker, ServerConfig config);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    [[nodiscard]] bool start();
    void shutdown() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] int port() const noexcept { return boundPort_; }

private:
    void setupRoutes();
    void janitorLoop();

    void handleHealth(const httplib::Request& req, httplib::Response& res);
    void handleModels(const httplib::Request& req, httplib::Response& res);
    void handleCompletion(const httplib::Request& req, httplib::Response& res, const char* kind);
    void handleQueueSubmit(const httplib::Request& req, httplib::Response& res);
    void handleQueueNext(const httplib::Request& req, httplib::Response& res);
    void handleQueueResult(const httplib::Request& req, httplib::Response& res);
    void handleQueueStatus(const httplib::Request& req, httplib::Response& res);
    void handleQueueStats(const httplib::Request& req, httplib::Response& res);
    void handleProviderRegister(const httplib::Request& req, httplib::Response& res);
    void handleProviders(const httplib::Request& req, httplib::Response& res);

    static void sendError(httplib::Response& res, ErrorCode error, const std::string& message);

    Broker& broker_;
    ServerConfig config_;
    std::unique_ptr<httplib::Server> http_;
    int boundPort_ = 0;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::atomic<int> activeWaiters_{0};

    std::thread listenThread_;
    std::thread janitorThread_;
};

}
