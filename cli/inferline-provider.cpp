/*
 * inferline - Provider agent (inferline-provider)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inferline/agent.hpp"
#include "inferline/logger.hpp"
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <thread>

using namespace inferline;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "inferline Provider Agent v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <model.gguf> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --broker <url>      Broker address (default $INFERLINE_BROKER_URL or http://localhost:8000)\n";
    std::cout << "  --id <provider>     Provider id (default <hostname>-<pid>)\n";
    std::cout << "  --model-id <name>   Model id announced to the broker (default file stem)\n";
    std::cout << "  --kinds <list>      Comma separated request kinds (default completion,chat.completion)\n";
    std::cout << "  -w, --workers <n>   Worker threads (default 1)\n";
    std::cout << "  --poll-ms <n>       Idle poll interval (default 1000)\n";
    std::cout << "  -h, --help          Show this help message\n";
    std::cout << "  -v, --version       Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  INFERLINE_LOG_LEVEL   Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  INFERLINE_TEMP, INFERLINE_TOP_K, INFERLINE_TOP_P, INFERLINE_MIN_P,\n";
    std::cout << "  INFERLINE_PREDICT, INFERLINE_MAX_CTX, INFERLINE_GPU_LAYERS   sampling defaults\n";
}

std::set<std::string> splitKinds(const std::string& list) {
    std::set<std::string> kinds;
    std::stringstream stream(list);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            kinds.insert(item);
        }
    }
    return kinds;
}

int main(int argc, char* argv[]) {
    Logger::setLevel(LogLevel::INFO);
    Logger::initFromEnv();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    AgentConfig config = AgentConfig::fromEnv();
    config.modelPath = argv[1];

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (i + 1 >= argc) {
            std::cerr << "Error: Unknown or incomplete option: " << arg << "\n";
            return 1;
        }
        std::string value = argv[++i];
        try {
            if (arg == "--broker") {
                config.brokerUrl = value;
            } else if (arg == "--id") {
                config.providerId = value;
            } else if (arg == "--model-id") {
                config.modelId = value;
            } else if (arg == "--kinds") {
                config.kinds = splitKinds(value);
            } else if (arg == "-w" || arg == "--workers") {
                config.workers = std::stoi(value);
            } else if (arg == "--poll-ms") {
                config.pollInterval = std::chrono::milliseconds(std::stoi(value));
            } else {
                std::cerr << "Error: Unknown option: " << arg << "\n";
                return 1;
            }
        } catch (const std::exception&) {
            std::cerr << "Error: Invalid value for " << arg << ": " << value << "\n";
            return 1;
        }
    }

    if (!std::filesystem::exists(std::filesystem::path(config.modelPath))) {
        std::cerr << "Error: Model not found: " << config.modelPath << "\n";
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::string modelName = std::filesystem::path(config.modelPath).filename().string();
    std::cout << "\n";
    std::cout << "  \033[1minferline\033[0m " << VERSION << "                    \033[90mpull · dispatch · broker\033[0m\n";
    std::cout << "  \033[90m─────────────────────────────────────────────────────────────────\033[0m\n";
    std::cout << "\n";
    std::cout << "  Loading " << modelName << "\n" << std::flush;

    try {
        Agent agent(config);

        if (!agent.start()) {
            std::cout << "  \033[31mFailed to start\033[0m\n";
            return 1;
        }

        const AgentConfig& active = agent.config();
        std::cout << "\n";
        std::cout << "  \033[1mPROVIDING\033[0m\n\n";
        std::cout << "    Model      " << active.modelId << "  \033[90m" << modelName << "\033[0m\n";
        std::cout << "    Provider   " << active.providerId << "\n";
        std::cout << "    Broker     " << active.brokerUrl << "\n";
        std::cout << "    Workers    " << active.workers << "\n";
        std::cout << "\n";
        std::cout << "  \033[90m─────────────────────────────────────────────────────────────────\033[0m\n";
        std::cout << "\n" << std::flush;

        while (!g_shutdown_requested && agent.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (g_shutdown_requested) {
            std::cout << "\nShutdown requested, stopping provider..." << std::endl;
        }
        agent.shutdown();

    } catch (const std::exception& e) {
        LOG_ERROR("Provider error: " + std::string(e.what()));
        return 1;
    }

    LOG_DEBUG("inferline provider stopped");
    return 0;
}
