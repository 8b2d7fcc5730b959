/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include "inferline/config.hpp"
#include "inferline/types.hpp"

namespace inferline {

class RequestStore;
class ResultStore;

// Returns true once the caller has gone away.
using CancelCheck = std::function<bool()>;

struct WaitResult {
    bool ok = false;
    RequestId id;
    std::string payload;
    std::optional<std::string> usage;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

class Waiter final {
public:
    Waiter(RequestStore& requests, ResultStore& results, BrokerConfig config) noexcept;

    Waiter(const Waiter&) = delete;
    Waiter& operator=(const Waiter&) = delete;

    [[nodiscard]] WaitResult submitAndWait(std::string kind, std::string model, std::string payload,
                                           std::chrono::milliseconds timeout,
                                           const CancelCheck& cancelled = {});

    // Blocks on an already enqueued request. The timeout is clamped to
    // [0, kMaxWaitTimeout]. Completed and failed requests
    // are consumed; a timed out or cancelled one is handled per policy.
    [[nodiscard]] WaitResult wait(const RequestId& id, std::chrono::milliseconds timeout,
                                  const CancelCheck& cancelled = {});

private:
    RequestStore& requests_;
    ResultStore& results_;
    BrokerConfig config_;

    void abandon(const RequestId& id, OrphanPolicy policy, const char* reason);
};

}
