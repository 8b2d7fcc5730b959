/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inferline/server.hpp"
#include "inferline/broker.hpp"
#include "inferline/config.hpp"
#include "inferline/generation.hpp"
#include "inferline/logger.hpp"
#include "inferline/wire.hpp"

#include <httplib.h>

#include <algorithm>
#include <exception>
#include <stdexcept>

namespace inferline {

using wire::json;

namespace {
// Releases a completion slot however the handler exits
class WaiterSlot {
public:
    explicit WaiterSlot(std::atomic<int>& count) noexcept : count_(count) {}
    ~WaiterSlot() { count_.fetch_sub(1); }

    WaiterSlot(const WaiterSlot&) = delete;
    WaiterSlot& operator=(const WaiterSlot&) = delete;

private:
    std::atomic<int>& count_;
};
}

ServerConfig ServerConfig::fromEnv() {
    ServerConfig config;
    config.host = envString("INFERLINE_HOST", config.host);
    config.port = envInt("INFERLINE_PORT", config.port);
    config.httpThreads = envInt("INFERLINE_HTTP_THREADS", config.httpThreads);
    config.maxWaiters = envInt("INFERLINE_MAX_WAITERS", config.maxWaiters);
    config.sweepInterval = std::chrono::seconds(
        envInt("INFERLINE_SWEEP_INTERVAL", static_cast<int>(config.sweepInterval.count())));
    return config;
}

Server::Server(Broker& broker, ServerConfig config)
    : broker_(broker), config_(std::move(config)), http_(std::make_unique<httplib::Server>()) {
    if (config_.httpThreads < 1) {
        config_.httpThreads = 1;
    }
    const int ceiling = std::max(1, config_.httpThreads - 1);
    if (config_.maxWaiters <= 0) {
        config_.maxWaiters = ceiling;
    } else if (config_.maxWaiters > ceiling) {
        LOG_WARN("max waiters " + std::to_string(config_.maxWaiters) + " would starve the queue routes, using " +
                 std::to_string(ceiling));
        config_.maxWaiters = ceiling;
    }
    if (config_.httpThreads == 1) {
        LOG_WARN("A single HTTP thread is shared by completions and the queue routes");
    }
    LOG_DEBUG("Server created - host: " + config_.host + ", port: " + std::to_string(config_.port) +
              ", http threads: " + std::to_string(config_.httpThreads) +
              ", max waiters: " + std::to_string(config_.maxWaiters));
}

Server::~Server() {
    shutdown();
}

bool Server::start() {
    if (running_.load()) {
        LOG_WARN("Server already running");
        return false;
    }

    LOG_INFO("Starting inferline broker...");
    shutdown_.store(false);

    try {
        const auto threads = static_cast<std::size_t>(config_.httpThreads);
        http_->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
        setupRoutes();

        if (config_.port == 0) {
            boundPort_ = http_->bind_to_any_port(config_.host);
            if (boundPort_ <= 0) {
                LOG_ERROR("Failed to bind an ephemeral port on " + config_.host);
                return false;
            }
        } else {
            if (!http_->bind_to_port(config_.host, config_.port)) {
                LOG_ERROR("Failed to bind " + config_.host + ":" + std::to_string(config_.port));
                return false;
            }
            boundPort_ = config_.port;
        }

        running_.store(true);

        listenThread_ = std::thread([this] {
            setThreadName("HTTP");
            if (!http_->listen_after_bind() && !shutdown_.load()) {
                LOG_ERROR("HTTP listener stopped unexpectedly");
            }
            running_.store(false);
        });
        janitorThread_ = std::thread(&Server::janitorLoop, this);

        LOG_INFO("Listening on " + config_.host + ":" + std::to_string(boundPort_));
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start server: " + std::string(e.what()));
        running_.store(false);
        return false;
    }
}

void Server::shutdown() noexcept {
    if (shutdown_.exchange(true)) {
        return;
    }
    if (!listenThread_.joinable() && !janitorThread_.joinable()) {
        return;
    }

    LOG_INFO("Shutting down server...");

    // Blocked completion handlers watch shutdown_ and return within one
    // cancellation slice, which lets the HTTP thread pool drain.
    http_->stop();

    if (listenThread_.joinable()) {
        listenThread_.join();
    }
    if (janitorThread_.joinable()) {
        janitorThread_.join();
    }
    running_.store(false);

    LOG_INFO("Server shutdown complete");
}

void Server::janitorLoop() {
    setThreadName("Janitor");
    LOG_DEBUG("Janitor loop started - interval: " + std::to_string(config_.sweepInterval.count()) + "s");

    while (!shutdown_.load()) {
        auto sleepEnd = std::chrono::steady_clock::now() + config_.sweepInterval;
        while (std::chrono::steady_clock::now() < sleepEnd && !shutdown_.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        if (shutdown_.load()) {
            break;
        }

        try {
            std::size_t removed = broker_.sweep();
            if (removed > 0) {
                LOG_INFO("Janitor removed " + std::to_string(removed) + " orphaned request(s)");
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Janitor error: " + std::string(e.what()));
        }
    }

    LOG_DEBUG("Janitor loop stopped");
}

void Server::setupRoutes() {
    http_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        LOG_DEBUG(req.method + " " + req.path + " -> " + std::to_string(res.status));
    });

    http_->set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string message = "Unknown server error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            message = std::string("Server error: ") + e.what();
        } catch (...) {
            LOG_ERROR("Non-standard exception in handler for " + req.path);
        }
        LOG_ERROR(req.method + " " + req.path + ": " + message);
        res.status = 500;
        json body = {{"error", {{"message", message}, {"type", "server_error"}, {"code", 500}}}};
        res.set_content(body.dump(), wire::kJsonMime);
    });

    http_->Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        handleHealth(req, res);
    });
    http_->Get("/models", [this](const httplib::Request& req, httplib::Response& res) {
        handleModels(req, res);
    });
    http_->Post("/completions", [this](const httplib::Request& req, httplib::Response& res) {
        handleCompletion(req, res, kKindCompletion);
    });
    http_->Post("/chat/completions", [this](const httplib::Request& req, httplib::Response& res) {
        handleCompletion(req, res, kKindChatCompletion);
    });
    http_->Post("/queue/submit", [this](const httplib::Request& req, httplib::Response& res) {
        handleQueueSubmit(req, res);
    });
    http_->Post("/queue/next", [this](const httplib::Request& req, httplib::Response& res) {
        handleQueueNext(req, res);
    });
    http_->Post("/queue/result", [this](const httplib::Request& req, httplib::Response& res) {
        handleQueueResult(req, res);
    });
    http_->Get(R"(/queue/status/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        handleQueueStatus(req, res);
    });
    http_->Get("/queue/stats", [this](const httplib::Request& req, httplib::Response& res) {
        handleQueueStats(req, res);
    });
    http_->Post("/providers/register", [this](const httplib::Request& req, httplib::Response& res) {
        handleProviderRegister(req, res);
    });
    http_->Get("/providers", [this](const httplib::Request& req, httplib::Response& res) {
        handleProviders(req, res);
    });
}

void Server::sendError(httplib::Response& res, ErrorCode error, const std::string& message) {
    res.status = wire::httpStatus(error);
    res.set_content(wire::errorBody(error, message).dump(), wire::kJsonMime);
}

void Server::handleHealth(const httplib::Request&, httplib::Response& res) {
    json body = {{"status", "healthy"}, {"timestamp", wire::toUnixSeconds(Clock::now())}};
    res.set_content(body.dump(), wire::kJsonMime);
}

void Server::handleModels(const httplib::Request&, httplib::Response& res) {
    auto now = Clock::now();
    res.set_content(wire::modelList(broker_.models(now), now).dump(), wire::kJsonMime);
}

void Server::handleCompletion(const httplib::Request& req, httplib::Response& res, const char* kind) {
    json body = json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        sendError(res, ErrorCode::InvalidRequest, "Request body must be a JSON object");
        return;
    }
    if (!body.contains("model") || !body["model"].is_string() || body["model"].get<std::string>().empty()) {
        sendError(res, ErrorCode::InvalidRequest, "'model' is required");
        return;
    }

    const std::string model = body["model"].get<std::string>();
    const char* required = std::string(kind) == kKindChatCompletion ? "messages" : "prompt";
    if (!body.contains(required)) {
        sendError(res, ErrorCode::InvalidRequest, std::string("'") + required + "' is required");
        return;
    }
    if (body.value("stream", false)) {
        sendError(res, ErrorCode::InvalidRequest, "Streaming is not supported");
        return;
    }
    if (!broker_.serves(model)) {
        sendError(res, ErrorCode::NotFound, "Model '" + model + "' not found");
        return;
    }

    std::optional<std::chrono::milliseconds> timeout;
    if (req.has_param("timeout")) {
        long seconds = 0;
        try {
            seconds = std::stol(req.get_param_value("timeout"));
        } catch (const std::exception&) {
            sendError(res, ErrorCode::InvalidRequest, "'timeout' must be a number of seconds");
            return;
        }
        if (seconds <= 0 || seconds > kMaxWaitTimeout.count()) {
            sendError(res, ErrorCode::InvalidRequest,
                      "'timeout' must be between 1 and " + std::to_string(kMaxWaitTimeout.count()) + " seconds");
            return;
        }
        timeout = std::chrono::seconds(seconds);
    }

    if (activeWaiters_.fetch_add(1) >= config_.maxWaiters) {
        activeWaiters_.fetch_sub(1);
        LOG_WARN("Rejecting completion, " + std::to_string(config_.maxWaiters) + " waiter(s) already blocked");
        sendError(res, ErrorCode::Unavailable, "Too many waiting requests, retry later");
        return;
    }
    WaiterSlot slot(activeWaiters_);

    WaitResult result = broker_.submitAndWait(kind, model, body.dump(), timeout, [this, &req] {
        return shutdown_.load() || req.is_connection_closed();
    });

    if (!result.id.empty()) {
        res.set_header("X-Request-Id", result.id);
    }
    if (!result) {
        if (result.error == ErrorCode::Cancelled) {
            LOG_DEBUG("Caller went away: " + result.id);
        }
        sendError(res, result.error, result.message);
        return;
    }

    res.status = 200;
    res.set_content(wire::payloadToJson(result.payload).dump(), wire::kJsonMime);
}

void Server::handleQueueSubmit(const httplib::Request& req, httplib::Response& res) {
    json body = json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        sendError(res, ErrorCode::InvalidRequest, "Request body must be a JSON object");
        return;
    }

    const std::string kind = body.value("request_type", std::string(kKindCompletion));
    json data = body.contains("request_data") ? body["request_data"] : json::object();
    std::string model;
    if (body.contains("model") && body["model"].is_string()) {
        model = body["model"].get<std::string>();
    } else if (data.is_object() && data.contains("model") && data["model"].is_string()) {
        model = data["model"].get<std::string>();
    }

    SubmitResult submitted = broker_.submit(kind, model, data.dump());
    if (!submitted) {
        sendError(res, submitted.error, submitted.message);
        return;
    }

    json out = {{"request_id", submitted.id}, {"status", toString(Status::Pending)}};
    res.set_content(out.dump(), wire::kJsonMime);
}

void Server::handleQueueNext(const httplib::Request& req, httplib::Response& res) {
    ProviderCapabilities capabilities;
    try {
        capabilities = wire::capabilitiesFromJson(json::parse(req.body));
    } catch (const std::exception& e) {
        sendError(res, ErrorCode::InvalidRequest, std::string("Invalid capabilities: ") + e.what());
        return;
    }

    MatchResult match = broker_.poll(capabilities.providerId, capabilities);
    if (!match) {
        if (match.error == ErrorCode::NoPendingWork) {
            res.status = 204;
            return;
        }
        sendError(res, match.error, match.message);
        return;
    }

    res.set_content(wire::toJson(*match.request).dump(), wire::kJsonMime);
}

void Server::handleQueueResult(const httplib::Request& req, httplib::Response& res) {
    json body = json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object() || !body.contains("request_id") ||
        !body["request_id"].is_string()) {
        sendError(res, ErrorCode::InvalidRequest, "'request_id' is required");
        return;
    }

    const std::string id = body["request_id"].get<std::string>();
    OpResult result;
    if (body.contains("error_message") && body["error_message"].is_string()) {
        result = broker_.submitError(id, body["error_message"].get<std::string>());
    } else {
        json data = body.contains("result_data") ? body["result_data"] : json::object();
        std::optional<std::string> usage;
        if (body.contains("usage") && !body["usage"].is_null()) {
            usage = body["usage"].dump();
        }
        result = broker_.submitResult(id, data.dump(), std::move(usage));
    }

    if (!result) {
        sendError(res, result.error, result.message);
        return;
    }

    json out = {{"request_id", id}, {"status", "accepted"}};
    res.set_content(out.dump(), wire::kJsonMime);
}

void Server::handleQueueStatus(const httplib::Request& req, httplib::Response& res) {
    const std::string id = req.matches[1];
    StatusResult status = broker_.status(id);
    if (!status) {
        sendError(res, status.error, status.message);
        return;
    }
    res.set_content(wire::toJson(status).dump(), wire::kJsonMime);
}

void Server::handleQueueStats(const httplib::Request&, httplib::Response& res) {
    res.set_content(wire::toJson(broker_.stats()).dump(), wire::kJsonMime);
}

void Server::handleProviderRegister(const httplib::Request& req, httplib::Response& res) {
    ProviderCapabilities capabilities;
    try {
        capabilities = wire::capabilitiesFromJson(json::parse(req.body));
    } catch (const std::exception& e) {
        sendError(res, ErrorCode::InvalidRequest, std::string("Invalid capabilities: ") + e.what());
        return;
    }

    OpResult result = broker_.registerProvider(capabilities.providerId, capabilities);
    if (!result) {
        sendError(res, result.error, result.message);
        return;
    }

    LOG_INFO("Provider registered: " + capabilities.providerId);
    json out = {{"provider_id", capabilities.providerId}, {"status", "registered"}};
    res.set_content(out.dump(), wire::kJsonMime);
}

void Server::handleProviders(const httplib::Request&, httplib::Response& res) {
    json data = json::array();
    for (const auto& provider : broker_.providers()) {
        data.push_back(wire::toJson(provider));
    }
    res.set_content(json{{"object", "list"}, {"data", data}}.dump(), wire::kJsonMime);
}

}
