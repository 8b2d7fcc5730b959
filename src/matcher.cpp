/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inferline/matcher.hpp"
#include "inferline/provider_registry.hpp"
#include "inferline/request_store.hpp"
#include "inferline/logger.hpp"

namespace inferline {

Matcher::Matcher(RequestStore& requests, ProviderRegistry& providers) noexcept
    : requests_(requests), providers_(providers) {
}

bool Matcher::eligible(const InferenceRequest& request, const ProviderCapabilities& capabilities) noexcept {
    return request.status == Status::Pending &&
           capabilities.models.count(request.model) > 0 &&
           capabilities.kinds.count(request.kind) > 0;
}

MatchResult Matcher::match(const ProviderCapabilities& capabilities, TimePoint now) {
    const ProviderId& providerId = capabilities.providerId;

    // Polling is the liveness signal: the record carries the time of this poll
    providers_.upsert(providerId, capabilities, capabilities.lastSeen);
    if (!providers_.isActive(providerId, now)) {
        LOG_DEBUG("Provider " + providerId + " is past its TTL, not dispatching");
        return {false, std::nullopt, ErrorCode::NoPendingWork, "Provider is not active"};
    }

    // Selection and claim share one critical section, so concurrent polls
    // never see the same candidate
    auto claimed = requests_.claimOldest(
        [&capabilities](const InferenceRequest& request) { return eligible(request, capabilities); },
        providerId, now);
    if (!claimed) {
        LOG_TRACE("No pending work for provider " + providerId);
        return {false, std::nullopt, ErrorCode::NoPendingWork, "No pending work"};
    }

    LOG_INFO("Provider " + providerId + " claimed request: " + claimed->id);
    return {true, std::move(claimed), ErrorCode::None, ""};
}

}
