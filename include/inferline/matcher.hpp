/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <optional>
#include <string>

#include "inferline/types.hpp"

namespace inferline {

class RequestStore;
class ProviderRegistry;

struct MatchResult {
    bool ok = false;
    std::optional<InferenceRequest> request;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

class Matcher final {
public:
    Matcher(RequestStore& requests, ProviderRegistry& providers) noexcept;

    Matcher(const Matcher&) = delete;
    Matcher& operator=(const Matcher&) = delete;

    // Claims the oldest pending request the provider can serve. An empty
    // queue is reported as NoPendingWork, which is not a failure.
    [[nodiscard]] MatchResult match(const ProviderCapabilities& capabilities, TimePoint now);

    [[nodiscard]] static bool eligible(const InferenceRequest& request,
                                       const ProviderCapabilities& capabilities) noexcept;

private:
    RequestStore& requests_;
    ProviderRegistry& providers_;
};

}
