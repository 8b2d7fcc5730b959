/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inferline/wire.hpp"

#include <stdexcept>

namespace inferline {
namespace wire {

namespace {

std::optional<Status> parseStatus(const std::string& name) noexcept {
    if (name == "pending") return Status::Pending;
    if (name == "processing") return Status::Processing;
    if (name == "completed") return Status::Completed;
    if (name == "failed") return Status::Failed;
    if (name == "missing") return Status::Missing;
    return std::nullopt;
}

std::string requireString(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw std::invalid_argument(std::string("'") + key + "' is required and must be a non-empty string");
    }
    return it->get<std::string>();
}

template <typename T>
std::optional<T> optionalNumber(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_number()) {
        throw std::invalid_argument(std::string("'") + key + "' must be a number");
    }
    return it->get<T>();
}

std::set<std::string> stringSet(const json& body, const char* key) {
    std::set<std::string> out;
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return out;
    }
    if (!it->is_array()) {
        throw std::invalid_argument(std::string("'") + key + "' must be an array of strings");
    }
    for (const auto& item : *it) {
        if (!item.is_string()) {
            throw std::invalid_argument(std::string("'") + key + "' must be an array of strings");
        }
        out.insert(item.get<std::string>());
    }
    return out;
}

json choiceFinish(const Generation& generation) {
    return generation.finishReason.empty() ? json("stop") : json(generation.finishReason);
}

}

std::int64_t toUnixSeconds(TimePoint tp) noexcept {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

TimePoint fromUnixSeconds(std::int64_t seconds) noexcept {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::seconds(seconds)));
}

json payloadToJson(const std::string& payload) {
    if (payload.empty()) {
        return json::object();
    }
    json parsed = json::parse(payload, nullptr, false);
    if (parsed.is_discarded()) {
        return json(payload);
    }
    return parsed;
}

json toJson(const InferenceRequest& request) {
    json out = {
        {"request_id", request.id},
        {"request_type", request.kind},
        {"model", request.model},
        {"request_data", payloadToJson(request.payload)},
        {"status", toString(request.status)},
        {"created_at", toUnixSeconds(request.createdAt)},
        {"started_at", nullptr}
    };
    if (request.startedAt) {
        out["started_at"] = toUnixSeconds(*request.startedAt);
    }
    if (request.claimedBy) {
        out["provider_id"] = *request.claimedBy;
    }
    return out;
}

InferenceRequest requestFromJson(const json& body) {
    if (!body.is_object()) {
        throw std::invalid_argument("request must be a JSON object");
    }

    InferenceRequest request;
    request.id = requireString(body, "request_id");
    request.kind = body.value("request_type", std::string(kKindCompletion));

    auto data = body.find("request_data");
    if (data != body.end() && !data->is_null()) {
        request.payload = data->dump();
        if (data->is_object()) {
            request.model = data->value("model", std::string());
        }
    }
    if (body.contains("model") && body["model"].is_string()) {
        request.model = body["model"].get<std::string>();
    }

    auto status = parseStatus(body.value("status", std::string("processing")));
    request.status = status.value_or(Status::Processing);
    if (auto created = optionalNumber<std::int64_t>(body, "created_at")) {
        request.createdAt = fromUnixSeconds(*created);
    }
    if (auto started = optionalNumber<std::int64_t>(body, "started_at")) {
        request.startedAt = fromUnixSeconds(*started);
    }
    if (body.contains("provider_id") && body["provider_id"].is_string()) {
        request.claimedBy = body["provider_id"].get<std::string>();
    }
    return request;
}

json toJson(const ProviderCapabilities& capabilities) {
    json out = {
        {"provider_id", capabilities.providerId},
        {"supported_models", capabilities.models},
        {"supported_kinds", capabilities.kinds}
    };
    if (capabilities.lastSeen != TimePoint{}) {
        out["last_seen"] = toUnixSeconds(capabilities.lastSeen);
    }
    return out;
}

ProviderCapabilities capabilitiesFromJson(const json& body) {
    if (!body.is_object()) {
        throw std::invalid_argument("capabilities must be a JSON object");
    }

    ProviderCapabilities capabilities;
    capabilities.providerId = requireString(body, "provider_id");
    capabilities.models = stringSet(body, "supported_models");
    capabilities.kinds = stringSet(body, "supported_kinds");
    return capabilities;
}

json toJson(const StatusResult& status) {
    json out = {
        {"request_id", status.id},
        {"status", toString(status.status)}
    };
    if (status.status == Status::Completed) {
        out["result"] = payloadToJson(status.payload);
        out["usage"] = status.usage ? payloadToJson(*status.usage) : json(nullptr);
    } else if (status.status == Status::Failed) {
        out["error"] = status.message;
    }
    return out;
}

StatusResult statusFromJson(const json& body) {
    if (!body.is_object()) {
        throw std::invalid_argument("status must be a JSON object");
    }

    StatusResult out;
    out.id = body.value("request_id", std::string());
    auto status = parseStatus(body.value("status", std::string()));
    if (!status) {
        throw std::invalid_argument("unknown status in response");
    }

    out.ok = true;
    out.status = *status;
    if (out.status == Status::Completed) {
        out.payload = body.contains("result") ? body["result"].dump() : std::string("{}");
        if (body.contains("usage") && !body["usage"].is_null()) {
            out.usage = body["usage"].dump();
        }
    } else if (out.status == Status::Failed) {
        out.error = ErrorCode::UpstreamFailure;
        out.message = body.value("error", std::string());
    }
    return out;
}

json toJson(const BrokerStats& stats) {
    return {
        {"pending", stats.requests.pending},
        {"processing", stats.requests.processing},
        {"completed", stats.requests.completed},
        {"failed", stats.requests.failed},
        {"total", stats.requests.total()},
        {"active_providers", stats.providers},
        {"stored_results", stats.results}
    };
}

json modelList(const std::vector<ModelInfo>& models, TimePoint now) {
    json data = json::array();
    for (const auto& model : models) {
        data.push_back({
            {"id", model.id},
            {"object", "model"},
            {"created", toUnixSeconds(now)},
            {"owned_by", "inferline"},
            {"providers", model.providers}
        });
    }
    return {{"object", "list"}, {"data", data}};
}

json errorBody(ErrorCode error, const std::string& message) {
    return {
        {"error", {
            {"message", message},
            {"type", toString(error)},
            {"code", httpStatus(error)}
        }}
    };
}

std::string errorMessage(const std::string& body) {
    json parsed = json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        auto it = parsed.find("error");
        if (it != parsed.end()) {
            if (it->is_object() && it->contains("message") && (*it)["message"].is_string()) {
                return (*it)["message"].get<std::string>();
            }
            if (it->is_string()) {
                return it->get<std::string>();
            }
        }
    }
    return body;
}

int httpStatus(ErrorCode error) noexcept {
    switch (error) {
        case ErrorCode::None:            return 200;
        case ErrorCode::NoPendingWork:   return 204;
        case ErrorCode::InvalidRequest:  return 400;
        case ErrorCode::NotFound:        return 404;
        case ErrorCode::InvalidState:    return 409;
        case ErrorCode::Cancelled:       return 499;
        case ErrorCode::UpstreamFailure: return 502;
        case ErrorCode::Unavailable:     return 503;
        case ErrorCode::Timeout:         return 504;
    }
    return 500;
}

ErrorCode errorFromHttpStatus(int status) noexcept {
    switch (status) {
        case 200: return ErrorCode::None;
        case 204: return ErrorCode::NoPendingWork;
        case 400: return ErrorCode::InvalidRequest;
        case 404: return ErrorCode::NotFound;
        case 409: return ErrorCode::InvalidState;
        case 499: return ErrorCode::Cancelled;
        case 503: return ErrorCode::Unavailable;
        case 504: return ErrorCode::Timeout;
        default:  return ErrorCode::UpstreamFailure;
    }
}

GenerationParams generationParams(const json& body) {
    GenerationParams params;
    if (!body.is_object()) {
        return params;
    }

    params.maxTokens = optionalNumber<int>(body, "max_tokens");
    params.temperature = optionalNumber<float>(body, "temperature");
    params.topP = optionalNumber<float>(body, "top_p");
    params.topK = optionalNumber<int>(body, "top_k");
    params.minP = optionalNumber<float>(body, "min_p");
    params.repetitionPenalty = optionalNumber<float>(body, "repetition_penalty");
    params.seed = optionalNumber<uint32_t>(body, "seed");

    auto stop = body.find("stop");
    if (stop != body.end() && !stop->is_null()) {
        if (stop->is_string()) {
            params.stop.push_back(stop->get<std::string>());
        } else if (stop->is_array()) {
            for (const auto& item : *stop) {
                if (!item.is_string()) {
                    throw std::invalid_argument("'stop' must be a string or an array of strings");
                }
                if (!item.get<std::string>().empty()) {
                    params.stop.push_back(item.get<std::string>());
                }
            }
        } else {
            throw std::invalid_argument("'stop' must be a string or an array of strings");
        }
    }
    return params;
}

std::vector<ChatMessage> chatMessages(const json& body) {
    auto it = body.find("messages");
    if (it == body.end() || !it->is_array() || it->empty()) {
        throw std::invalid_argument("'messages' must be a non-empty array");
    }

    std::vector<ChatMessage> messages;
    messages.reserve(it->size());
    for (const auto& item : *it) {
        if (!item.is_object() || !item.contains("role") || !item["role"].is_string() ||
            !item.contains("content") || !item["content"].is_string()) {
            throw std::invalid_argument("each message needs string 'role' and 'content'");
        }
        messages.push_back({item["role"].get<std::string>(), item["content"].get<std::string>()});
    }
    return messages;
}

json usage(const Generation& generation) {
    return {
        {"prompt_tokens", generation.promptTokens},
        {"completion_tokens", generation.completionTokens},
        {"total_tokens", generation.promptTokens + generation.completionTokens}
    };
}

json completionResponse(const std::string& model, const Generation& generation, TimePoint now) {
    return {
        {"id", "cmpl-" + std::to_string(toUnixSeconds(now))},
        {"object", "text_completion"},
        {"created", toUnixSeconds(now)},
        {"model", model},
        {"choices", json::array({
            {
                {"text", generation.text},
                {"index", 0},
                {"logprobs", nullptr},
                {"finish_reason", choiceFinish(generation)}
            }
        })},
        {"usage", usage(generation)}
    };
}

json chatCompletionResponse(const std::string& model, const Generation& generation, TimePoint now) {
    return {
        {"id", "chatcmpl-" + std::to_string(toUnixSeconds(now))},
        {"object", "chat.completion"},
        {"created", toUnixSeconds(now)},
        {"model", model},
        {"choices", json::array({
            {
                {"index", 0},
                {"message", {{"role", "assistant"}, {"content", generation.text}}},
                {"finish_reason", choiceFinish(generation)}
            }
        })},
        {"usage", usage(generation)}
    };
}

std::optional<std::string> responseText(const json& response) {
    if (!response.is_object()) {
        return std::nullopt;
    }
    auto choices = response.find("choices");
    if (choices == response.end() || !choices->is_array() || choices->empty()) {
        return std::nullopt;
    }
    const json& first = choices->front();
    if (first.contains("text") && first["text"].is_string()) {
        return first["text"].get<std::string>();
    }
    if (first.contains("message") && first["message"].is_object()) {
        const json& message = first["message"];
        if (message.contains("content") && message["content"].is_string()) {
            return message["content"].get<std::string>();
        }
    }
    return std::nullopt;
}

}
}
