/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace inferline {

// Request lifecycle states. Missing is only ever reported, never stored.
enum class Status : std::uint8_t { Pending, Processing, Completed, Failed, Missing };

enum class ErrorCode : std::uint8_t {
    None = 0,
    NotFound,
    InvalidState,
    InvalidRequest,
    NoPendingWork,
    Timeout,
    UpstreamFailure,
    Cancelled,
    Unavailable
};

using RequestId = std::string;
using ProviderId = std::string;
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

struct InferenceRequest {
    RequestId id;
    std::string kind;
    std::string model;
    std::string payload;
    Status status = Status::Pending;
    TimePoint createdAt;
    std::optional<TimePoint> startedAt;
    std::optional<TimePoint> completedAt;
    std::optional<std::string> error;
    std::optional<ProviderId> claimedBy;
};

struct InferenceResult {
    RequestId requestId;
    std::string payload;
    std::optional<std::string> usage;
    std::optional<std::string> error;
};

struct ProviderCapabilities {
    ProviderId providerId;
    std::set<std::string> models;
    std::set<std::string> kinds;
    TimePoint lastSeen;
};

struct OpResult {
    bool ok = false;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

[[nodiscard]] const char* toString(Status status) noexcept;
[[nodiscard]] const char* toString(ErrorCode error) noexcept;
[[nodiscard]] bool isTerminal(Status status) noexcept;

}
