/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "inferline/types.hpp"

namespace inferline {

class Client;
class Runner;

enum class ProcessResult : uint8_t {
    Success,
    Failed,
    Rejected,
    SystemError
};

// Executes one claimed request on the worker's runner and reports the
// outcome back to the broker.
class Processor {
public:
    Processor(Client& client, const std::string& modelPath, const std::string& modelId);
    ~Processor();

    Processor(const Processor&) = delete;
    Processor& operator=(const Processor&) = delete;
    Processor(Processor&&) = delete;
    Processor& operator=(Processor&&) = delete;

    // Pre-initialize runners for all worker threads (MUST be called before threads start)
    bool initializeRunners(int numWorkers);

    [[nodiscard]] ProcessResult process(const InferenceRequest& request, int workerId) noexcept;

private:
    Client& client_;
    std::string modelPath_;
    std::string modelId_;

    std::unordered_map<int, std::unique_ptr<Runner>> runners_;
    std::mutex runnersMutex_;

    [[nodiscard]] bool finalizeSuccess(const InferenceRequest& request, const std::string& body,
                                       const std::string& usage) noexcept;
    [[nodiscard]] bool finalizeFailure(const InferenceRequest& request, const std::string& error) noexcept;

    Runner& getRunnerForWorker(int workerId);
};

}
