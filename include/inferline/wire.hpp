/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "inferline/broker.hpp"
#include "inferline/generation.hpp"
#include "inferline/types.hpp"

namespace inferline {
namespace wire {

using json = nlohmann::json;

inline constexpr const char* kJsonMime = "application/json";

[[nodiscard]] std::int64_t toUnixSeconds(TimePoint tp) noexcept;
[[nodiscard]] TimePoint fromUnixSeconds(std::int64_t seconds) noexcept;

// Payloads are stored as JSON text. Text that does not parse is emitted as a string.
[[nodiscard]] json payloadToJson(const std::string& payload);

// Queue wire format, field names shared with the provider side.
[[nodiscard]] json toJson(const InferenceRequest& request);
[[nodiscard]] InferenceRequest requestFromJson(const json& body);

[[nodiscard]] json toJson(const ProviderCapabilities& capabilities);
[[nodiscard]] ProviderCapabilities capabilitiesFromJson(const json& body);

[[nodiscard]] json toJson(const StatusResult& status);
[[nodiscard]] StatusResult statusFromJson(const json& body);

[[nodiscard]] json toJson(const BrokerStats& stats);
[[nodiscard]] json modelList(const std::vector<ModelInfo>& models, TimePoint now);

// OpenAI style error envelope.
[[nodiscard]] json errorBody(ErrorCode error, const std::string& message);
[[nodiscard]] std::string errorMessage(const std::string& body);

[[nodiscard]] int httpStatus(ErrorCode error) noexcept;
[[nodiscard]] ErrorCode errorFromHttpStatus(int status) noexcept;

// Provider side helpers for OpenAI style request bodies.
[[nodiscard]] GenerationParams generationParams(const json& body);
[[nodiscard]] std::vector<ChatMessage> chatMessages(const json& body);
[[nodiscard]] json completionResponse(const std::string& model, const Generation& generation, TimePoint now);
[[nodiscard]] json chatCompletionResponse(const std::string& model, const Generation& generation, TimePoint now);
[[nodiscard]] json usage(const Generation& generation);

// First choice text of a completion or chat completion response.
[[nodiscard]] std::optional<std::string> responseText(const json& response);

}
}
