/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inferline/broker.hpp"
#include "inferline/logger.hpp"

namespace inferline {

Broker::Broker(BrokerConfig config)
    : config_(std::move(config)),
      requests_(results_),
      providers_(config_.providerTtl),
      matcher_(requests_, providers_),
      waiter_(requests_, results_, config_) {
    LOG_DEBUG("Broker created - provider ttl: " + std::to_string(config_.providerTtl.count()) +
              "s, wait timeout: " + std::to_string(config_.waitTimeout.count()) +
              "s, timeout policy: " + toString(config_.timeoutPolicy) +
              ", cancel policy: " + toString(config_.cancelPolicy));
}

SubmitResult Broker::validate(const std::string& kind, const std::string& model, const std::string& payload) const {
    if (kind.empty()) {
        return {false, "", ErrorCode::InvalidRequest, "Request kind is empty"};
    }
    if (model.empty()) {
        return {false, "", ErrorCode::InvalidRequest, "Model is empty"};
    }
    if (payload.size() > config_.maxPayloadBytes) {
        LOG_DEBUG("Payload exceeds size limit: " + std::to_string(payload.size()) + " > " +
                  std::to_string(config_.maxPayloadBytes));
        return {false, "", ErrorCode::InvalidRequest,
                "Payload exceeds maximum size limit (" + std::to_string(config_.maxPayloadBytes) + " bytes)"};
    }
    return {true, "", ErrorCode::None, ""};
}

SubmitResult Broker::submit(std::string kind, std::string model, std::string payload) {
    SubmitResult checked = validate(kind, model, payload);
    if (!checked) {
        return checked;
    }

    RequestId id = requests_.enqueue(std::move(kind), std::move(model), std::move(payload));
    LOG_INFO("Request submitted: " + id);
    return {true, id, ErrorCode::None, ""};
}

WaitResult Broker::submitAndWait(std::string kind, std::string model, std::string payload,
                                 std::optional<std::chrono::milliseconds> timeout,
                                 const CancelCheck& cancelled) {
    SubmitResult submitted = submit(std::move(kind), std::move(model), std::move(payload));
    if (!submitted) {
        WaitResult rejected;
        rejected.error = submitted.error;
        rejected.message = submitted.message;
        return rejected;
    }

    auto bound = timeout.value_or(std::chrono::duration_cast<std::chrono::milliseconds>(config_.waitTimeout));
    return waiter_.wait(submitted.id, bound, cancelled);
}

void Broker::normalize(const ProviderId& providerId, ProviderCapabilities& capabilities, TimePoint now) const {
    capabilities.providerId = providerId;
    capabilities.lastSeen = now;
    if (capabilities.kinds.empty()) {
        capabilities.kinds.insert(config_.defaultKind);
    }
}

MatchResult Broker::poll(const ProviderId& providerId, ProviderCapabilities capabilities, TimePoint now) {
    if (providerId.empty()) {
        return {false, std::nullopt, ErrorCode::InvalidRequest, "Provider id is empty"};
    }
    normalize(providerId, capabilities, now);
    return matcher_.match(capabilities, now);
}

OpResult Broker::registerProvider(const ProviderId& providerId, ProviderCapabilities capabilities, TimePoint now) {
    if (providerId.empty()) {
        return {false, ErrorCode::InvalidRequest, "Provider id is empty"};
    }
    normalize(providerId, capabilities, now);
    providers_.upsert(providerId, capabilities, now);
    return {true, ErrorCode::None, ""};
}

OpResult Broker::submitResult(const RequestId& id, std::string payload, std::optional<std::string> usage) {
    OpResult result = requests_.complete(id, std::move(payload), std::move(usage));
    if (result) {
        LOG_INFO("Result accepted: " + id);
    } else {
        LOG_WARN("Result rejected for " + id + ": " + result.message);
    }
    return result;
}

OpResult Broker::submitError(const RequestId& id, const std::string& message) {
    OpResult result = requests_.fail(id, message);
    if (result) {
        LOG_INFO("Failure recorded: " + id + " - " + message);
    } else {
        LOG_WARN("Failure rejected for " + id + ": " + result.message);
    }
    return result;
}

StatusResult Broker::status(const RequestId& id) {
    StatusResult out;
    out.id = id;

    auto request = requests_.get(id);
    if (!request) {
        out.error = ErrorCode::NotFound;
        out.message = "Request not found: " + id;
        return out;
    }

    switch (request->status) {
        case Status::Completed: {
            auto result = results_.takeAndDelete(id);
            requests_.remove(id);
            if (!result) {
                out.error = ErrorCode::NotFound;
                out.message = "Result already consumed: " + id;
                return out;
            }
            out.ok = true;
            out.status = Status::Completed;
            out.payload = std::move(result->payload);
            out.usage = std::move(result->usage);
            return out;
        }
        case Status::Failed: {
            auto taken = requests_.take(id);
            if (!taken) {
                out.error = ErrorCode::NotFound;
                out.message = "Failure already consumed: " + id;
                return out;
            }
            out.ok = true;
            out.status = Status::Failed;
            out.error = ErrorCode::UpstreamFailure;
            out.message = taken->error.value_or("");
            return out;
        }
        default:
            out.ok = true;
            out.status = request->status;
            return out;
    }
}

BrokerStats Broker::stats(TimePoint now) {
    BrokerStats stats;
    stats.requests = requests_.counts();
    stats.providers = providers_.activeSnapshot(now).size();
    stats.results = results_.size();
    return stats;
}

std::vector<ModelInfo> Broker::models(TimePoint now) {
    return providers_.models(now);
}

std::vector<ProviderCapabilities> Broker::providers(TimePoint now) {
    return providers_.activeSnapshot(now);
}

bool Broker::serves(const std::string& model, TimePoint now) {
    for (const auto& provider : providers_.activeSnapshot(now)) {
        if (provider.models.count(model) > 0) {
            return true;
        }
    }
    return false;
}

std::size_t Broker::sweep(TimePoint now) {
    std::size_t removed = requests_.sweep(now, config_.retention);
    std::size_t expired = providers_.purgeExpired(now);
    if (expired > 0) {
        LOG_INFO("Purged " + std::to_string(expired) + " expired provider(s)");
    }
    return removed;
}

}
