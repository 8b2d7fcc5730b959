/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inferline/runner.hpp"
#include "inferline/config.hpp"
#include "inferline/logger.hpp"
#include "llama.h"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace inferline {

std::shared_ptr<llama_model> Runner::shared_model_ = nullptr;
std::string Runner::current_model_path_ = "";
std::mutex Runner::model_mutex_;

// llama.cpp output goes to stderr only at or above LLAMA_LOG_LEVEL (default error)
static void filtered_llama_log(enum ggml_log_level level, const char* text, void* /*user_data*/) {
    if (!text || text[0] == '.' || text[0] == '\n' || text[0] == '\0') {
        return;
    }

    static int filter_level = -1;

    if (filter_level == -1) {
        const char* env = std::getenv("LLAMA_LOG_LEVEL");
        filter_level = env ?
            (std::string(env) == "info" ? GGML_LOG_LEVEL_INFO :
             std::string(env) == "warn" ? GGML_LOG_LEVEL_WARN :
             std::string(env) == "debug" ? GGML_LOG_LEVEL_DEBUG :
             GGML_LOG_LEVEL_ERROR) : GGML_LOG_LEVEL_ERROR;
    }

    if (level >= filter_level) {
        fprintf(stderr, "%s", text);
    }
}

Runner::Runner(const std::string& modelPath) {
    llama_log_set(filtered_llama_log, nullptr);
    ggml_backend_load_all();

    std::lock_guard<std::mutex> lock(model_mutex_);
    if (!shared_model_ || current_model_path_ != modelPath) {
        LOG_INFO("Loading model: " + modelPath);

        llama_model_params model_params = llama_model_default_params();

        #if defined(__APPLE__)
            model_params.n_gpu_layers = envInt("INFERLINE_GPU_LAYERS", 99);
        #else
            model_params.n_gpu_layers = envInt("INFERLINE_GPU_LAYERS", 0);
        #endif

        llama_model* model = llama_model_load_from_file(modelPath.c_str(), model_params);
        if (!model) {
            LOG_ERROR("Failed to load model: " + modelPath);
            throw std::runtime_error("Failed to load model: " + modelPath);
        }

        shared_model_ = std::shared_ptr<llama_model>(model, llama_model_free);
        current_model_path_ = modelPath;
        LOG_INFO("Model loaded successfully");
    }
}

Runner::~Runner() {
    if (context_) {
        llama_free(context_);
        context_ = nullptr;
    }
}

Runner::SamplingConfig Runner::buildSamplingConfig(const GenerationParams& params) const {
    SamplingConfig config;
    const int n_ctx_train = llama_model_n_ctx_train(shared_model_.get());

    config.temp = params.temperature.value_or(envFloat("INFERLINE_TEMP", 0.8f));
    config.top_k = params.topK.value_or(envInt("INFERLINE_TOP_K", 40));
    config.top_p = params.topP.value_or(envFloat("INFERLINE_TOP_P", 0.9f));
    config.min_p = params.minP.value_or(envFloat("INFERLINE_MIN_P", 0.05f));
    config.repeat_penalty = params.repetitionPenalty.value_or(envFloat("INFERLINE_REPEAT_PENALTY", 1.1f));
    config.repeat_last_n = envInt("INFERLINE_REPEAT_LAST_N", 64);
    config.seed = params.seed.value_or(static_cast<uint32_t>(envInt("INFERLINE_SEED", 0)));

    config.max_ctx = std::min(n_ctx_train, envInt("INFERLINE_MAX_CTX", 8192));
    config.n_predict = params.maxTokens.value_or(envInt("INFERLINE_PREDICT", 2048));
    if (config.n_predict < 1) {
        config.n_predict = 1;
    }

    LOG_DEBUG("Model context: " + std::to_string(n_ctx_train) +
              ", using max_ctx=" + std::to_string(config.max_ctx) +
              ", n_predict=" + std::to_string(config.n_predict) +
              ", temp=" + std::to_string(config.temp));

    return config;
}

void Runner::buildContextParams(int n_prompt, const SamplingConfig& config, llama_context_params& params) const {
    params = llama_context_default_params();
    params.n_ctx = std::min(n_prompt + config.n_predict + 64, config.max_ctx);
    params.n_batch = envInt("INFERLINE_BATCH", 2048);
    params.no_perf = true;
}

llama_sampler* Runner::buildSampler(const SamplingConfig& config) const {
    auto sparams = llama_sampler_chain_default_params();
    sparams.no_perf = true;
    llama_sampler* smpl = llama_sampler_chain_init(sparams);

    llama_sampler_chain_add(smpl, llama_sampler_init_penalties(
        config.repeat_last_n,
        config.repeat_penalty,
        0.0f,
        0.0f
    ));

    if (config.temp <= 0.0f) {
        llama_sampler_chain_add(smpl, llama_sampler_init_greedy());
        return smpl;
    }

    llama_sampler_chain_add(smpl, llama_sampler_init_top_k(config.top_k));
    llama_sampler_chain_add(smpl, llama_sampler_init_top_p(config.top_p, 1));
    llama_sampler_chain_add(smpl, llama_sampler_init_min_p(config.min_p, 1));
    llama_sampler_chain_add(smpl, llama_sampler_init_temp(config.temp));
    llama_sampler_chain_add(smpl, llama_sampler_init_dist(config.seed));

    return smpl;
}

RunResult Runner::complete(const std::string& prompt, const GenerationParams& params) {
    return generate(prompt, params);
}

RunResult Runner::chat(const std::vector<ChatMessage>& messages, const GenerationParams& params) {
    if (!shared_model_) {
        return {false, {}, "Model not loaded"};
    }
    return generate(formatChat(messages), params);
}

RunResult Runner::generate(const std::string& prompt, const GenerationParams& params) {
    if (!shared_model_) {
        return {false, {}, "Model not loaded"};
    }

    llama_sampler* smpl = nullptr;
    try {
        SamplingConfig config = buildSamplingConfig(params);
        const llama_vocab* vocab = llama_model_get_vocab(shared_model_.get());
        const int n_prompt = -llama_tokenize(vocab, prompt.c_str(), prompt.size(), NULL, 0, true, true);
        if (n_prompt <= 0) {
            return {false, {}, "Failed to tokenize input"};
        }

        int max_predict = config.max_ctx - n_prompt - 64;
        if (max_predict <= 0) {
            return {false, {}, "Prompt of " + std::to_string(n_prompt) +
                               " tokens exceeds the context window of " + std::to_string(config.max_ctx)};
        }
        if (config.n_predict > max_predict) {
            config.n_predict = max_predict;
        }

        std::vector<llama_token> prompt_tokens(n_prompt);
        if (llama_tokenize(vocab, prompt.c_str(), prompt.size(), prompt_tokens.data(), prompt_tokens.size(), true, true) < 0) {
            return {false, {}, "Failed to tokenize the prompt"};
        }

        llama_context_params ctx_params;
        buildContextParams(n_prompt, config, ctx_params);
        context_ = llama_init_from_model(shared_model_.get(), ctx_params);
        if (!context_) {
            return {false, {}, "Failed to create context"};
        }

        LOG_DEBUG("Context: " + std::to_string(ctx_params.n_ctx) + " tokens");

        smpl = buildSampler(config);
        llama_batch batch = llama_batch_get_one(prompt_tokens.data(), prompt_tokens.size());

        llama_token decoder_start_token_id = 0;
        if (llama_model_has_encoder(shared_model_.get())) {
            if (llama_encode(context_, batch)) {
                LOG_ERROR("Failed to encode");
                llama_sampler_free(smpl);
                llama_free(context_);
                context_ = nullptr;
                return {false, {}, "Failed to encode"};
            }

            decoder_start_token_id = llama_model_decoder_start_token(shared_model_.get());
            if (decoder_start_token_id == LLAMA_TOKEN_NULL) {
                decoder_start_token_id = llama_vocab_bos(vocab);
            }

            batch = llama_batch_get_one(&decoder_start_token_id, 1);
        }

        Generation generation;
        generation.promptTokens = n_prompt;
        generation.finishReason = "length";

        std::string output;
        llama_token new_token_id;
        bool decodeFailed = false;

        while (generation.completionTokens < config.n_predict) {
            if (llama_decode(context_, batch)) {
                LOG_ERROR("Failed to decode");
                decodeFailed = true;
                break;
            }

            new_token_id = llama_sampler_sample(smpl, context_, -1);
            llama_sampler_accept(smpl, new_token_id);

            if (llama_vocab_is_eog(vocab, new_token_id)) {
                generation.finishReason = "stop";
                break;
            }
            ++generation.completionTokens;

            char buf[128];
            int n = llama_token_to_piece(vocab, new_token_id, buf, sizeof(buf), 0, true);
            if (n < 0) {
                LOG_ERROR("Failed to convert token to piece");
                decodeFailed = true;
                break;
            }
            output.append(buf, n);

            std::size_t stopAt = findStop(output, params.stop);
            if (stopAt != std::string::npos) {
                output.resize(stopAt);
                generation.finishReason = "stop";
                break;
            }

            batch = llama_batch_get_one(&new_token_id, 1);
        }

        llama_sampler_free(smpl);
        smpl = nullptr;
        llama_free(context_);
        context_ = nullptr;

        if (decodeFailed && output.empty()) {
            return {false, {}, "Failed to decode"};
        }

        LOG_INFO("Generated " + std::to_string(generation.completionTokens) + " tokens (" +
                 std::to_string(output.size()) + " bytes), finish: " + generation.finishReason);
        generation.text = stripThinkBlocks(output);
        return {true, std::move(generation), ""};

    } catch (const std::exception& e) {
        if (smpl) {
            llama_sampler_free(smpl);
        }
        if (context_) {
            llama_free(context_);
            context_ = nullptr;
        }
        LOG_ERROR("Inference error: " + std::string(e.what()));
        return {false, {}, "Inference error: " + std::string(e.what())};
    }
}

std::string Runner::formatChat(const std::vector<ChatMessage>& messages) const {
    // Base models without a template get a plain role-prefixed transcript
    const char* tmpl = llama_model_chat_template(shared_model_.get(), nullptr);

    std::vector<llama_chat_message> chat;
    chat.reserve(messages.size());
    for (const auto& message : messages) {
        chat.push_back({message.role.c_str(), message.content.c_str()});
    }

    if (tmpl) {
        int len = llama_chat_apply_template(tmpl, chat.data(), chat.size(), true, nullptr, 0);
        if (len > 0) {
            std::vector<char> buf(len + 1);
            int res = llama_chat_apply_template(tmpl, chat.data(), chat.size(), true, buf.data(), buf.size());
            if (res > 0) {
                return std::string(buf.data(), res);
            }
        }
        LOG_WARN("Chat template could not be applied, using plain transcript");
    }

    std::string transcript;
    for (const auto& message : messages) {
        transcript += message.role + ": " + message.content + "\n";
    }
    transcript += "assistant:";
    return transcript;
}

}
