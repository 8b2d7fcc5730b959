/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "inferline/generation.hpp"

struct llama_model;
struct llama_context;
struct llama_context_params;
struct llama_sampler;

namespace inferline {

struct RunResult {
    bool ok = false;
    Generation generation;
    std::string error;
};

class Runner final {
public:
    explicit Runner(const std::string& modelPath);
    ~Runner();

    Runner(const Runner&) = delete;
    Runner& operator=(const Runner&) = delete;
    Runner(Runner&&) = delete;
    Runner& operator=(Runner&&) = delete;

    // Raw prompt, no chat template.
    [[nodiscard]] RunResult complete(const std::string& prompt, const GenerationParams& params);
    // Messages rendered through the model's chat template.
    [[nodiscard]] RunResult chat(const std::vector<ChatMessage>& messages, const GenerationParams& params);

private:
    struct SamplingConfig {
        int n_predict = 0;
        int max_ctx = 0;
        float temp = 0.8f;
        int top_k = 40;
        float top_p = 0.9f;
        float min_p = 0.05f;
        float repeat_penalty = 1.1f;
        int repeat_last_n = 64;
        uint32_t seed = 0;
    };

    // One model per process, shared by all workers; contexts are per run.
    static std::shared_ptr<llama_model> shared_model_;
    static std::string current_model_path_;
    static std::mutex model_mutex_;

    SamplingConfig buildSamplingConfig(const GenerationParams& params) const;
    void buildContextParams(int n_prompt, const SamplingConfig& config, llama_context_params& params) const;
    llama_sampler* buildSampler(const SamplingConfig& config) const;
    std::string formatChat(const std::vector<ChatMessage>& messages) const;
    RunResult generate(const std::string& prompt, const GenerationParams& params);

    llama_context* context_ = nullptr;
};

}
