/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "inferline/broker.hpp"
#include "inferline/types.hpp"

namespace httplib {
class Client;
}

namespace inferline {

// HTTP client for the broker's queue and completion routes. Transport
// failures are reported as ErrorCode::Unavailable.
class Client final {
public:
    // Covers the broker's default 300 s wait plus transfer slack
    static constexpr std::chrono::seconds kDefaultReadTimeout{330};

    explicit Client(const std::string& baseUrl, std::chrono::seconds readTimeout = kDefaultReadTimeout);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    [[nodiscard]] bool healthy();

    // Provider side
    [[nodiscard]] OpResult registerProvider(const ProviderCapabilities& capabilities);
    [[nodiscard]] MatchResult poll(const ProviderCapabilities& capabilities);
    [[nodiscard]] OpResult submitResult(const RequestId& id, const std::string& payload,
                                        const std::optional<std::string>& usage);
    [[nodiscard]] OpResult submitError(const RequestId& id, const std::string& message);

    // Caller side
    [[nodiscard]] SubmitResult submit(const std::string& kind, const std::string& body);
    [[nodiscard]] StatusResult status(const RequestId& id);
    [[nodiscard]] WaitResult complete(const std::string& kind, const std::string& body,
                                      std::optional<std::chrono::seconds> timeout = std::nullopt);

    [[nodiscard]] const std::string& baseUrl() const noexcept { return baseUrl_; }

private:
    [[nodiscard]] OpResult postResult(const std::string& body);

    std::string baseUrl_;
    std::unique_ptr<httplib::Client> http_;
};

}
