/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inferline/processor.hpp"
#include "inferline/client.hpp"
#include "inferline/generation.hpp"
#include "inferline/logger.hpp"
#include "inferline/runner.hpp"
#include "inferline/wire.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {
std::mutex g_output_mutex;

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
    return buf;
}

void printStatus(const std::string& id, const char* color, const char* state, const std::string& detail) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cout << "    \033[90m" << timestamp() << "\033[0m  " << id << "  " << color << state << "\033[0m";
    if (!detail.empty()) {
        std::cout << "  " << detail;
    }
    std::cout << "\n" << std::flush;
}

std::string seconds(std::chrono::steady_clock::time_point start) {
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << elapsed << "s";
    return out.str();
}

}

namespace inferline {

using wire::json;

Processor::Processor(Client& client, const std::string& modelPath, const std::string& modelId)
    : client_(client), modelPath_(modelPath), modelId_(modelId) {
    LOG_DEBUG("Processor created for model: " + modelId_ + " (" + modelPath_ + ")");
}

Processor::~Processor() = default;

ProcessResult Processor::process(const InferenceRequest& request, int workerId) noexcept {
    LOG_DEBUG("Processing request: " + request.id);

    try {
        if (request.model != modelId_) {
            printStatus(request.id, "\033[31m", "rejected", "model " + request.model);
            (void)finalizeFailure(request, "Model '" + request.model + "' not available on this provider");
            return ProcessResult::Rejected;
        }
        if (request.kind != kKindCompletion && request.kind != kKindChatCompletion) {
            printStatus(request.id, "\033[31m", "rejected", "kind " + request.kind);
            (void)finalizeFailure(request, "Unsupported request type: " + request.kind);
            return ProcessResult::Rejected;
        }

        json body = json::parse(request.payload, nullptr, false);
        if (body.is_discarded() || !body.is_object()) {
            printStatus(request.id, "\033[31m", "failed", "bad payload");
            (void)finalizeFailure(request, "Request payload is not a JSON object");
            return ProcessResult::Failed;
        }

        GenerationParams params;
        std::vector<ChatMessage> messages;
        std::string prompt;
        try {
            params = wire::generationParams(body);
            if (request.kind == kKindChatCompletion) {
                messages = wire::chatMessages(body);
            } else if (body.contains("prompt") && body["prompt"].is_string()) {
                prompt = body["prompt"].get<std::string>();
            } else {
                throw std::invalid_argument("'prompt' must be a string");
            }
        } catch (const std::exception& e) {
            printStatus(request.id, "\033[31m", "failed", "invalid request");
            (void)finalizeFailure(request, std::string("Invalid request: ") + e.what());
            return ProcessResult::Failed;
        }

        Runner& runner = getRunnerForWorker(workerId);

        printStatus(request.id, "\033[33m", "running", "");
        auto startTime = std::chrono::steady_clock::now();

        RunResult result = request.kind == kKindChatCompletion
            ? runner.chat(messages, params)
            : runner.complete(prompt, params);

        if (!result.ok) {
            printStatus(request.id, "\033[31m", "failed", seconds(startTime));
            (void)finalizeFailure(request, result.error);
            LOG_WARN("Request failed during inference: " + request.id + " - " + result.error);
            return ProcessResult::Failed;
        }

        auto now = Clock::now();
        json response = request.kind == kKindChatCompletion
            ? wire::chatCompletionResponse(request.model, result.generation, now)
            : wire::completionResponse(request.model, result.generation, now);

        if (!finalizeSuccess(request, response.dump(), wire::usage(result.generation).dump())) {
            LOG_ERROR("Failed to report result for request: " + request.id);
            return ProcessResult::SystemError;
        }

        printStatus(request.id, "\033[32m", "done", seconds(startTime));
        LOG_INFO("REQUEST COMPLETED: " + request.id + " -> " +
                 std::to_string(result.generation.completionTokens) + " tokens");
        return ProcessResult::Success;

    } catch (const std::exception& e) {
        LOG_ERROR("Exception processing request " + request.id + ": " + std::string(e.what()));
        (void)finalizeFailure(request, "Internal processing error: " + std::string(e.what()));
        return ProcessResult::SystemError;
    }
}

bool Processor::finalizeSuccess(const InferenceRequest& request, const std::string& body,
                                const std::string& usage) noexcept {
    try {
        OpResult reported = client_.submitResult(request.id, body, usage);
        if (!reported) {
            LOG_ERROR("Broker rejected result for " + request.id + ": " + reported.message);
            return false;
        }
        LOG_DEBUG("Result reported: " + request.id);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to report result for " + request.id + ": " + std::string(e.what()));
        return false;
    }
}

bool Processor::finalizeFailure(const InferenceRequest& request, const std::string& error) noexcept {
    try {
        OpResult reported = client_.submitError(request.id, error);
        if (!reported) {
            LOG_ERROR("Broker rejected failure for " + request.id + ": " + reported.message);
            return false;
        }
        LOG_DEBUG("Failure reported: " + request.id);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to report failure for " + request.id + ": " + std::string(e.what()));
        return false;
    }
}

// Runners are created on the main thread before the workers start
bool Processor::initializeRunners(int numWorkers) {
    std::lock_guard<std::mutex> lock(runnersMutex_);

    try {
        for (int i = 0; i < numWorkers; ++i) {
            LOG_DEBUG("Pre-creating Runner instance for worker " + std::to_string(i));
            runners_[i] = std::make_unique<Runner>(modelPath_);
        }
        LOG_DEBUG("All " + std::to_string(numWorkers) + " Runner instances initialized");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to initialize runners: " + std::string(e.what()));
        return false;
    }
}

Runner& Processor::getRunnerForWorker(int workerId) {
    std::lock_guard<std::mutex> lock(runnersMutex_);

    auto it = runners_.find(workerId);
    if (it == runners_.end() || !it->second) {
        throw std::runtime_error("Runner not initialized for worker " + std::to_string(workerId));
    }
    return *it->second;
}

}
