/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "inferline/types.hpp"

namespace inferline {

struct ModelInfo {
    std::string id;
    std::vector<ProviderId> providers;
};

// Liveness is purely poll-driven: a provider is active while its last poll
// is at most `ttl` old. Expired records are purged lazily by the readers.
class ProviderRegistry final {
public:
    static constexpr std::chrono::seconds kDefaultTtl{300};

    explicit ProviderRegistry(std::chrono::seconds ttl = kDefaultTtl) noexcept;

    ProviderRegistry(const ProviderRegistry&) = delete;
    ProviderRegistry& operator=(const ProviderRegistry&) = delete;
    ProviderRegistry(ProviderRegistry&&) = delete;
    ProviderRegistry& operator=(ProviderRegistry&&) = delete;

    // Replaces (never merges) the provider's record.
    void upsert(const ProviderId& providerId, const ProviderCapabilities& capabilities, TimePoint now);

    [[nodiscard]] std::vector<ProviderCapabilities> activeSnapshot(TimePoint now);
    [[nodiscard]] std::vector<ProviderCapabilities> activeSnapshot(TimePoint now, std::chrono::seconds ttl);
    // Drops every record past the TTL. Returns how many went.
    std::size_t purgeExpired(TimePoint now);

    [[nodiscard]] bool isActive(const ProviderId& providerId, TimePoint now) const;
    [[nodiscard]] std::optional<ProviderCapabilities> get(const ProviderId& providerId) const;
    [[nodiscard]] std::vector<ModelInfo> models(TimePoint now);

    bool remove(const ProviderId& providerId) noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::chrono::seconds ttl() const noexcept { return ttl_; }

private:
    std::chrono::seconds ttl_;

    mutable std::mutex mutex_;
    std::unordered_map<ProviderId, ProviderCapabilities> providers_;
};

}
