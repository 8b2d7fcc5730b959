/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace inferline {

// Request kinds understood by the bundled provider.
inline constexpr const char* kKindCompletion = "completion";
inline constexpr const char* kKindChatCompletion = "chat.completion";

struct ChatMessage {
    std::string role;
    std::string content;
};

// Per-request overrides of the provider's sampling defaults.
struct GenerationParams {
    std::optional<int> maxTokens;
    std::optional<float> temperature;
    std::optional<float> topP;
    std::optional<int> topK;
    std::optional<float> minP;
    std::optional<float> repetitionPenalty;
    std::optional<uint32_t> seed;
    std::vector<std::string> stop;
};

struct Generation {
    std::string text;
    std::string finishReason = "stop";
    int promptTokens = 0;
    int completionTokens = 0;
};

// Removes <think>...</think> blocks emitted by reasoning models.
[[nodiscard]] std::string stripThinkBlocks(const std::string& text);

// Earliest occurrence of any stop sequence, or npos.
[[nodiscard]] std::size_t findStop(const std::string& text, const std::vector<std::string>& stops) noexcept;

}
