/*
 * inferline - Broker daemon (inferlined)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inferline/broker.hpp"
#include "inferline/config.hpp"
#include "inferline/logger.hpp"
#include "inferline/server.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

using namespace inferline;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage() {
    std::cout << "Usage: inferlined [options]\n\n";
    std::cout << "  --host <addr>             bind address (default 0.0.0.0)\n";
    std::cout << "  --port <n>                listen port (default 8000)\n";
    std::cout << "  --threads <n>             HTTP worker threads (default 32)\n";
    std::cout << "  --max-waiters <n>         concurrent blocking completions (default threads - 1)\n";
    std::cout << "  --provider-ttl <s>        provider liveness window (default 300)\n";
    std::cout << "  --wait-timeout <s>        completion wait bound (default 300)\n";
    std::cout << "  --timeout-policy <p>      retain|remove on wait timeout (default retain)\n";
    std::cout << "  --cancel-policy <p>       retain|remove on caller disconnect (default remove)\n";
    std::cout << "  --retention <s>           janitor retention window (default 3600)\n";
    std::cout << "  --sweep-interval <s>      janitor period (default 30)\n";
    std::cout << "  --log-level <level>       error|warn|info|debug|trace\n";
    std::cout << "  -v, --version\n";
    std::cout << "  -h, --help\n";
}

int parseInt(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + flag + ": " + value);
    }
}

OrphanPolicy parsePolicy(const std::string& flag, const std::string& value) {
    auto policy = parseOrphanPolicy(value);
    if (!policy) {
        throw std::invalid_argument("Invalid value for " + flag + ": " + value + " (retain|remove)");
    }
    return *policy;
}

int main(int argc, char* argv[]) {
    Logger::setLevel(LogLevel::INFO);
    Logger::initFromEnv();

    BrokerConfig brokerConfig = BrokerConfig::fromEnv();
    ServerConfig serverConfig = ServerConfig::fromEnv();

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto next = [&]() -> std::string {
                if (i + 1 >= argc) {
                    throw std::invalid_argument("Missing value for " + arg);
                }
                return argv[++i];
            };

            if (arg == "-h" || arg == "--help") {
                printUsage();
                return 0;
            } else if (arg == "-v" || arg == "--version") {
                std::cout << VERSION << "\n";
                return 0;
            } else if (arg == "--host") {
                serverConfig.host = next();
            } else if (arg == "--port") {
                serverConfig.port = parseInt(arg, next());
            } else if (arg == "--threads") {
                serverConfig.httpThreads = parseInt(arg, next());
            } else if (arg == "--max-waiters") {
                serverConfig.maxWaiters = parseInt(arg, next());
            } else if (arg == "--provider-ttl") {
                brokerConfig.providerTtl = std::chrono::seconds(parseInt(arg, next()));
            } else if (arg == "--wait-timeout") {
                brokerConfig.waitTimeout = std::chrono::seconds(parseInt(arg, next()));
            } else if (arg == "--timeout-policy") {
                brokerConfig.timeoutPolicy = parsePolicy(arg, next());
            } else if (arg == "--cancel-policy") {
                brokerConfig.cancelPolicy = parsePolicy(arg, next());
            } else if (arg == "--retention") {
                brokerConfig.retention = std::chrono::seconds(parseInt(arg, next()));
            } else if (arg == "--sweep-interval") {
                serverConfig.sweepInterval = std::chrono::seconds(parseInt(arg, next()));
            } else if (arg == "--log-level") {
                std::string name = next();
                auto level = Logger::parseLevel(name);
                if (!level) {
                    throw std::invalid_argument("Invalid log level: " + name);
                }
                Logger::setLevel(*level);
            } else {
                throw std::invalid_argument("Unknown option: " + arg);
            }
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        printUsage();
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    setThreadName("Main");

    try {
        Broker broker(brokerConfig);
        Server server(broker, serverConfig);

        if (!server.start()) {
            std::cout << "  \033[31mFailed to start\033[0m\n";
            return 1;
        }

        std::cout << "\n";
        std::cout << "  \033[1minferline\033[0m " << VERSION << "                    \033[90mpull · dispatch · broker\033[0m\n";
        std::cout << "  \033[90m─────────────────────────────────────────────────────────────────\033[0m\n";
        std::cout << "\n";
        std::cout << "  \033[1mRUNNING\033[0m\n\n";
        std::cout << "    Listen          " << serverConfig.host << ":" << server.port() << "\n";
        std::cout << "    HTTP threads    " << serverConfig.httpThreads << "\n";
        std::cout << "    Provider TTL    " << brokerConfig.providerTtl.count() << "s\n";
        std::cout << "    Wait timeout    " << brokerConfig.waitTimeout.count() << "s ("
                  << toString(brokerConfig.timeoutPolicy) << ")\n";
        std::cout << "    Cancel policy   " << toString(brokerConfig.cancelPolicy) << "\n";
        std::cout << "    Retention       " << brokerConfig.retention.count() << "s\n";
        std::cout << "\n";
        std::cout << "  \033[90m─────────────────────────────────────────────────────────────────\033[0m\n";
        std::cout << "\n";
        std::cout << "  Provider: ./inferline-provider <model.gguf> --broker http://<host>:" << server.port() << "\n";
        std::cout << "  Submit:   ./inferline-submit <model> \"prompt\" --wait\n";
        std::cout << "\n" << std::flush;

        while (!g_shutdown_requested && server.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (g_shutdown_requested) {
            std::cout << "\nShutdown requested, stopping broker..." << std::endl;
        }
        server.shutdown();

    } catch (const std::exception& e) {
        LOG_ERROR("Broker error: " + std::string(e.what()));
        return 1;
    }

    LOG_DEBUG("inferline daemon stopped");
    return 0;
}
