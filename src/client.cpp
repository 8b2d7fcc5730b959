/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inferline/client.hpp"
#include "inferline/generation.hpp"
#include "inferline/logger.hpp"
#include "inferline/wire.hpp"

#include <httplib.h>

namespace inferline {

using wire::json;

namespace {

std::string transportError(const httplib::Result& res) {
    return "Broker unreachable: " + httplib::to_string(res.error());
}

}

Client::Client(const std::string& baseUrl, std::chrono::seconds readTimeout)
    : baseUrl_(baseUrl), http_(std::make_unique<httplib::Client>(baseUrl)) {
    http_->set_connection_timeout(5, 0);
    http_->set_read_timeout(static_cast<time_t>(readTimeout.count()), 0);
    http_->set_write_timeout(30, 0);
    LOG_DEBUG("Client created for " + baseUrl_);
}

Client::~Client() = default;

bool Client::healthy() {
    auto res = http_->Get("/health");
    return res && res->status == 200;
}

OpResult Client::registerProvider(const ProviderCapabilities& capabilities) {
    auto res = http_->Post("/providers/register", wire::toJson(capabilities).dump(), wire::kJsonMime);
    if (!res) {
        return {false, ErrorCode::Unavailable, transportError(res)};
    }
    if (res->status != 200) {
        return {false, wire::errorFromHttpStatus(res->status), wire::errorMessage(res->body)};
    }
    return {true, ErrorCode::None, ""};
}

MatchResult Client::poll(const ProviderCapabilities& capabilities) {
    auto res = http_->Post("/queue/next", wire::toJson(capabilities).dump(), wire::kJsonMime);
    if (!res) {
        return {false, std::nullopt, ErrorCode::Unavailable, transportError(res)};
    }
    if (res->status == 204) {
        return {false, std::nullopt, ErrorCode::NoPendingWork, "No pending request"};
    }
    if (res->status != 200) {
        return {false, std::nullopt, wire::errorFromHttpStatus(res->status), wire::errorMessage(res->body)};
    }

    try {
        return {true, wire::requestFromJson(json::parse(res->body)), ErrorCode::None, ""};
    } catch (const std::exception& e) {
        LOG_ERROR("Malformed request from broker: " + std::string(e.what()));
        return {false, std::nullopt, ErrorCode::UpstreamFailure,
                std::string("Malformed request from broker: ") + e.what()};
    }
}

OpResult Client::postResult(const std::string& body) {
    auto res = http_->Post("/queue/result", body, wire::kJsonMime);
    if (!res) {
        return {false, ErrorCode::Unavailable, transportError(res)};
    }
    if (res->status != 200) {
        return {false, wire::errorFromHttpStatus(res->status), wire::errorMessage(res->body)};
    }
    return {true, ErrorCode::None, ""};
}

OpResult Client::submitResult(const RequestId& id, const std::string& payload,
                              const std::optional<std::string>& usage) {
    json body = {
        {"request_id", id},
        {"result_data", wire::payloadToJson(payload)},
        {"usage", usage ? wire::payloadToJson(*usage) : json(nullptr)},
        {"error_message", nullptr}
    };
    return postResult(body.dump());
}

OpResult Client::submitError(const RequestId& id, const std::string& message) {
    json body = {
        {"request_id", id},
        {"result_data", json::object()},
        {"usage", nullptr},
        {"error_message", message}
    };
    return postResult(body.dump());
}

SubmitResult Client::submit(const std::string& kind, const std::string& body) {
    json data = json::parse(body, nullptr, false);
    if (data.is_discarded()) {
        return {false, "", ErrorCode::InvalidRequest, "Request body is not valid JSON"};
    }

    json envelope = {{"request_type", kind}, {"request_data", data}};
    auto res = http_->Post("/queue/submit", envelope.dump(), wire::kJsonMime);
    if (!res) {
        return {false, "", ErrorCode::Unavailable, transportError(res)};
    }
    if (res->status != 200) {
        return {false, "", wire::errorFromHttpStatus(res->status), wire::errorMessage(res->body)};
    }

    json out = json::parse(res->body, nullptr, false);
    if (out.is_discarded() || !out.contains("request_id") || !out["request_id"].is_string()) {
        return {false, "", ErrorCode::UpstreamFailure, "Malformed submit response"};
    }
    return {true, out["request_id"].get<std::string>(), ErrorCode::None, ""};
}

StatusResult Client::status(const RequestId& id) {
    StatusResult out;
    out.id = id;

    auto res = http_->Get("/queue/status/" + id);
    if (!res) {
        out.error = ErrorCode::Unavailable;
        out.message = transportError(res);
        return out;
    }
    if (res->status != 200) {
        out.error = wire::errorFromHttpStatus(res->status);
        out.message = wire::errorMessage(res->body);
        return out;
    }

    try {
        return wire::statusFromJson(json::parse(res->body));
    } catch (const std::exception& e) {
        out.error = ErrorCode::UpstreamFailure;
        out.message = std::string("Malformed status response: ") + e.what();
        return out;
    }
}

WaitResult Client::complete(const std::string& kind, const std::string& body,
                            std::optional<std::chrono::seconds> timeout) {
    std::string path = kind == kKindChatCompletion ? "/chat/completions" : "/completions";
    if (timeout) {
        path += "?timeout=" + std::to_string(timeout->count());
    }

    WaitResult out;
    auto res = http_->Post(path, body, wire::kJsonMime);
    if (!res) {
        out.error = ErrorCode::Unavailable;
        out.message = transportError(res);
        return out;
    }

    out.id = res->get_header_value("X-Request-Id");
    if (res->status != 200) {
        out.error = wire::errorFromHttpStatus(res->status);
        out.message = wire::errorMessage(res->body);
        return out;
    }

    out.ok = true;
    out.payload = res->body;
    return out;
}

}
