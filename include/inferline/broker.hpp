/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "inferline/config.hpp"
#include "inferline/matcher.hpp"
#include "inferline/provider_registry.hpp"
#include "inferline/request_store.hpp"
#include "inferline/result_store.hpp"
#include "inferline/types.hpp"
#include "inferline/waiter.hpp"

namespace inferline {

struct SubmitResult {
    bool ok = false;
    RequestId id;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// A lookup of a terminal request consumes it: completed requests hand out
// their result, failed ones their error, and both are then gone.
struct StatusResult {
    bool ok = false;
    RequestId id;
    Status status = Status::Missing;
    std::string payload;
    std::optional<std::string> usage;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

struct BrokerStats {
    StatusCounts requests;
    std::size_t providers = 0;
    std::size_t results = 0;
};

class Broker final {
public:
    explicit Broker(BrokerConfig config = BrokerConfig{});

    Broker(const Broker&) = delete;
    Broker& operator=(const Broker&) = delete;
    Broker(Broker&&) = delete;
    Broker& operator=(Broker&&) = delete;

    [[nodiscard]] SubmitResult submit(std::string kind, std::string model, std::string payload);

    // Uses the configured wait timeout when none is given.
    [[nodiscard]] WaitResult submitAndWait(std::string kind, std::string model, std::string payload,
                                           std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                                           const CancelCheck& cancelled = {});

    [[nodiscard]] MatchResult poll(const ProviderId& providerId, ProviderCapabilities capabilities,
                                   TimePoint now = Clock::now());
    [[nodiscard]] OpResult registerProvider(const ProviderId& providerId, ProviderCapabilities capabilities,
                                            TimePoint now = Clock::now());

    [[nodiscard]] OpResult submitResult(const RequestId& id, std::string payload,
                                        std::optional<std::string> usage = std::nullopt);
    [[nodiscard]] OpResult submitError(const RequestId& id, const std::string& message);

    [[nodiscard]] StatusResult status(const RequestId& id);
    [[nodiscard]] BrokerStats stats(TimePoint now = Clock::now());

    [[nodiscard]] std::vector<ModelInfo> models(TimePoint now = Clock::now());
    [[nodiscard]] std::vector<ProviderCapabilities> providers(TimePoint now = Clock::now());
    [[nodiscard]] bool serves(const std::string& model, TimePoint now = Clock::now());

    std::size_t sweep(TimePoint now = Clock::now());

    [[nodiscard]] const BrokerConfig& config() const noexcept { return config_; }
    [[nodiscard]] RequestStore& requests() noexcept { return requests_; }
    [[nodiscard]] ResultStore& results() noexcept { return results_; }
    [[nodiscard]] ProviderRegistry& registry() noexcept { return providers_; }

private:
    BrokerConfig config_;
    ResultStore results_;
    RequestStore requests_;
    ProviderRegistry providers_;
    Matcher matcher_;
    Waiter waiter_;

    [[nodiscard]] SubmitResult validate(const std::string& kind, const std::string& model,
                                        const std::string& payload) const;
    void normalize(const ProviderId& providerId, ProviderCapabilities& capabilities, TimePoint now) const;
};

}
