/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inferline/provider_registry.hpp"
#include "inferline/logger.hpp"
#include <algorithm>
#include <map>

namespace inferline {

ProviderRegistry::ProviderRegistry(std::chrono::seconds ttl) noexcept : ttl_(ttl) {
}

void ProviderRegistry::upsert(const ProviderId& providerId, const ProviderCapabilities& capabilities,
                              TimePoint now) {
    ProviderCapabilities record = capabilities;
    record.providerId = providerId;
    record.lastSeen = now;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = providers_.find(providerId);
    if (it == providers_.end()) {
        LOG_INFO("Provider registered: " + providerId + " (" + std::to_string(record.models.size()) +
                 " model(s))");
        providers_.emplace(providerId, std::move(record));
    } else {
        it->second = std::move(record);
        LOG_TRACE("Provider refreshed: " + providerId);
    }
}

std::vector<ProviderCapabilities> ProviderRegistry::activeSnapshot(TimePoint now) {
    return activeSnapshot(now, ttl_);
}

std::vector<ProviderCapabilities> ProviderRegistry::activeSnapshot(TimePoint now, std::chrono::seconds ttl) {
    std::vector<ProviderCapabilities> active;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = providers_.begin(); it != providers_.end(); ) {
        if (now - it->second.lastSeen > ttl) {
            LOG_INFO("Provider expired: " + it->first);
            it = providers_.erase(it);
            continue;
        }
        active.push_back(it->second);
        ++it;
    }

    std::sort(active.begin(), active.end(), [](const ProviderCapabilities& a, const ProviderCapabilities& b) {
        return a.providerId < b.providerId;
    });
    return active;
}

std::size_t ProviderRegistry::purgeExpired(TimePoint now) {
    std::size_t purged = 0;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = providers_.begin(); it != providers_.end(); ) {
        if (now - it->second.lastSeen > ttl_) {
            LOG_INFO("Provider expired: " + it->first);
            it = providers_.erase(it);
            ++purged;
        } else {
            ++it;
        }
    }
    return purged;
}

bool ProviderRegistry::isActive(const ProviderId& providerId, TimePoint now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = providers_.find(providerId);
    return it != providers_.end() && now - it->second.lastSeen <= ttl_;
}

std::optional<ProviderCapabilities> ProviderRegistry::get(const ProviderId& providerId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = providers_.find(providerId);
    if (it == providers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ModelInfo> ProviderRegistry::models(TimePoint now) {
    std::map<std::string, std::vector<ProviderId>> byModel;
    for (const auto& provider : activeSnapshot(now)) {
        for (const auto& model : provider.models) {
            byModel[model].push_back(provider.providerId);
        }
    }

    std::vector<ModelInfo> out;
    out.reserve(byModel.size());
    for (auto& entry : byModel) {
        out.push_back({entry.first, std::move(entry.second)});
    }
    return out;
}

bool ProviderRegistry::remove(const ProviderId& providerId) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return providers_.erase(providerId) > 0;
}

std::size_t ProviderRegistry::size() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return providers_.size();
}

}
