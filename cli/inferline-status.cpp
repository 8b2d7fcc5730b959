/*
 * inferline - Request status tool (inferline-status)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inferline/client.hpp"
#include "inferline/config.hpp"
#include "inferline/logger.hpp"
#include "inferline/wire.hpp"
#include <chrono>
#include <iostream>
#include <thread>
#include <unistd.h>

using namespace inferline;
using wire::json;

void printUsage(const char* progName) {
    std::cout << "inferline Request Status Tool\n\n";
    std::cout << "Usage: " << progName << " <request_id> [--wait] [--broker <url>]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  request_id    Id printed by inferline-submit (read from stdin if omitted)\n\n";
    std::cout << "Behavior:\n";
    std::cout << "  - Prints the generated text once the request has completed\n";
    std::cout << "  - A finished request is handed out once, then forgotten by the broker\n\n";
    std::cout << "Exit codes:\n";
    std::cout << "  0  completed   1  failed or not found   2  not ready\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " 0001731808123456_12345_00000001\n";
    std::cout << "  inferline-submit qwen \"Hello\" | " << progName << " --wait\n";
}

int main(int argc, char* argv[]) {
    // Silence logs for CLI tool usage
    Logger::setLevel(LogLevel::WARN);
    Logger::initFromEnv();

    std::string requestId;
    std::string brokerUrl = envString("INFERLINE_BROKER_URL", "http://localhost:8000");
    bool wait = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "-w" || arg == "--wait") {
            wait = true;
        } else if (arg == "--broker" && i + 1 < argc) {
            brokerUrl = argv[++i];
        } else {
            requestId = arg;
        }
    }

    // Check piped input for the id if not provided
    if (requestId.empty() && !isatty(fileno(stdin))) {
        std::cin >> requestId;
    }
    if (requestId.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        Client client(brokerUrl);

        StatusResult status = client.status(requestId);
        while (wait && status && !isTerminal(status.status)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            status = client.status(requestId);
        }

        if (!status) {
            if (status.error == ErrorCode::NotFound) {
                std::cerr << "Request not found: " << requestId << std::endl;
            } else {
                std::cerr << "Error: " << status.message << std::endl;
            }
            return 1;
        }

        switch (status.status) {
            case Status::Completed: {
                json response = json::parse(status.payload, nullptr, false);
                auto text = wire::responseText(response);
                std::cout << (text ? *text : status.payload) << std::endl;
                return 0;
            }
            case Status::Failed:
                std::cerr << "Request failed: " << requestId << std::endl;
                if (!status.message.empty()) {
                    std::cerr << "Error: " << status.message << std::endl;
                }
                return 1;
            default:
                std::cerr << "Request not ready: " << requestId << " (status: "
                          << toString(status.status) << ")" << std::endl;
                return 2;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
