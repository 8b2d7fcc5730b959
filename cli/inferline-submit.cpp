/*
 * inferline - Request submission tool (inferline-submit)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inferline/client.hpp"
#include "inferline/config.hpp"
#include "inferline/generation.hpp"
#include "inferline/logger.hpp"
#include "inferline/wire.hpp"
#include <iostream>
#include <iterator>
#include <sstream>
#include <unistd.h>

using namespace inferline;
using wire::json;

constexpr const char* VERSION = "0.1.0";
constexpr std::chrono::seconds kReadMargin{30};

void printUsage(const char* progName) {
    std::cout << "inferline Request Submission Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <model> <prompt...> [options]\n";
    std::cout << "       " << progName << " <model> -     (read prompt from stdin)\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  model         Model id served by a provider\n";
    std::cout << "  prompt        Text prompt (can be multiple words)\n";
    std::cout << "  -             Read prompt from stdin\n\n";
    std::cout << "Options:\n";
    std::cout << "  --wait            Block until the result is ready and print it\n";
    std::cout << "  --timeout <s>     Wait bound in seconds (with --wait)\n";
    std::cout << "  --chat            Submit as a chat completion\n";
    std::cout << "  --max-tokens <n>  Generation limit\n";
    std::cout << "  --broker <url>    Broker address (default $INFERLINE_BROKER_URL or http://localhost:8000)\n";
    std::cout << "  -h, --help        Show this help message\n";
    std::cout << "  -v, --version     Show version\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " qwen \"What is the capital of France?\"\n";
    std::cout << "  " << progName << " qwen Write a haiku --chat --wait\n";
    std::cout << "  echo \"Hello\" | " << progName << " qwen - --wait\n";
}

int main(int argc, char* argv[]) {
    // Default to WARN for clean piping; INFERLINE_LOG_LEVEL overrides
    Logger::setLevel(LogLevel::WARN);
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

    std::string model = argv[1];
    std::string brokerUrl = envString("INFERLINE_BROKER_URL", "http://localhost:8000");
    std::optional<std::chrono::seconds> timeout;
    std::optional<int> maxTokens;
    bool wait = false;
    bool chat = false;
    bool readStdin = false;
    std::vector<std::string> words;

    try {
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--wait" || arg == "-w") {
                wait = true;
            } else if (arg == "--chat") {
                chat = true;
            } else if (arg == "--timeout" || arg == "--max-tokens" || arg == "--broker") {
                if (i + 1 >= argc) {
                    std::cerr << "Error: " << arg << " requires a value\n";
                    return 1;
                }
                std::string value = argv[++i];
                if (arg == "--timeout") {
                    timeout = std::chrono::seconds(std::stol(value));
                } else if (arg == "--max-tokens") {
                    maxTokens = std::stoi(value);
                } else {
                    brokerUrl = value;
                }
            } else if (arg == "-") {
                readStdin = true;
            } else {
                words.push_back(arg);
            }
        }
    } catch (const std::exception&) {
        std::cerr << "Error: Invalid numeric option\n";
        return 1;
    }

    if (words.empty() && !isatty(fileno(stdin))) {
        readStdin = true;
    }

    std::string prompt;
    if (readStdin) {
        prompt.assign((std::istreambuf_iterator<char>(std::cin)),
                       std::istreambuf_iterator<char>());
        if (!prompt.empty() && prompt.back() == '\n') {
            prompt.pop_back();
        }
    } else {
        std::ostringstream promptStream;
        for (size_t i = 0; i < words.size(); ++i) {
            if (i > 0) promptStream << " ";
            promptStream << words[i];
        }
        prompt = promptStream.str();
    }

    if (prompt.empty()) {
        std::cerr << "Error: Empty prompt provided\n";
        return 1;
    }

    json body = {{"model", model}};
    if (chat) {
        body["messages"] = json::array({{{"role", "user"}, {"content", prompt}}});
    } else {
        body["prompt"] = prompt;
    }
    if (maxTokens) {
        body["max_tokens"] = *maxTokens;
    }
    const std::string kind = chat ? kKindChatCompletion : kKindCompletion;

    try {
        // The read must outlast the broker-side wait or a slow answer is lost
        const std::chrono::seconds readTimeout =
            timeout ? *timeout + kReadMargin : Client::kDefaultReadTimeout;
        Client client(brokerUrl, readTimeout);

        if (!wait) {
            SubmitResult result = client.submit(kind, body.dump());
            if (!result) {
                std::cerr << "Error: " << result.message << std::endl;
                return 1;
            }
            // Just the request ID - clean for piping
            std::cout << result.id << std::endl;
            return 0;
        }

        WaitResult result = client.complete(kind, body.dump(), timeout);
        if (!result) {
            std::cerr << "Error (" << toString(result.error) << "): " << result.message << std::endl;
            return 1;
        }

        json response = json::parse(result.payload, nullptr, false);
        auto text = wire::responseText(response);
        std::cout << (text ? *text : result.payload) << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
