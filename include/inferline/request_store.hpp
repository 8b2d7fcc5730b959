/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "inferline/types.hpp"

namespace inferline {

class ResultStore;

struct StatusCounts {
    std::size_t pending = 0;
    std::size_t processing = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;

    [[nodiscard]] std::size_t total() const noexcept { return pending + processing + completed + failed; }
};

// Owns every in-flight request. All transitions happen under one mutex;
// completing a request publishes its result to the ResultStore inside the
// same critical section, so a waiter that sees Completed always finds it.
class RequestStore final {
public:
    using Predicate = std::function<bool(const InferenceRequest&)>;

    explicit RequestStore(ResultStore& results) noexcept;

    RequestStore(const RequestStore&) = delete;
    RequestStore& operator=(const RequestStore&) = delete;
    RequestStore(RequestStore&&) = delete;
    RequestStore& operator=(RequestStore&&) = delete;

    [[nodiscard]] RequestId enqueue(std::string kind, std::string model, std::string payload,
                                    TimePoint now = Clock::now());

    // pending -> processing. Returns the claimed request, or nullopt when the
    // id is unknown or someone else got there first.
    [[nodiscard]] std::optional<InferenceRequest> claim(const RequestId& id,
                                                        const ProviderId& providerId = {},
                                                        TimePoint now = Clock::now());

    // Finds the oldest pending request accepted by `eligible` (ties by id) and
    // claims it in the same critical section. Only the winner is copied out.
    [[nodiscard]] std::optional<InferenceRequest> claimOldest(const Predicate& eligible,
                                                              const ProviderId& providerId = {},
                                                              TimePoint now = Clock::now());

    // Both fail with InvalidState when the id is unknown or in the wrong state.
    [[nodiscard]] OpResult complete(const RequestId& id, std::string payload,
                                    std::optional<std::string> usage, TimePoint now = Clock::now());
    [[nodiscard]] OpResult fail(const RequestId& id, const std::string& message,
                                TimePoint now = Clock::now());

    [[nodiscard]] std::optional<InferenceRequest> get(const RequestId& id) const;
    [[nodiscard]] std::optional<InferenceRequest> take(const RequestId& id);
    void remove(const RequestId& id);

    [[nodiscard]] std::vector<InferenceRequest> snapshot() const;
    [[nodiscard]] std::vector<InferenceRequest> snapshot(Status status) const;
    [[nodiscard]] StatusCounts counts() const;
    [[nodiscard]] std::size_t size() const noexcept;

    // Blocks until the request is terminal or gone, or until `until`.
    // Returns the last observed status (Missing if the entry disappeared).
    [[nodiscard]] Status awaitTerminal(const RequestId& id,
                                       std::chrono::steady_clock::time_point until) const;

    // Drops entries created more than `retention` ago. Returns how many went.
    std::size_t sweep(TimePoint now, std::chrono::seconds retention);

    [[nodiscard]] static RequestId generateId();

private:
    ResultStore& results_;

    mutable std::mutex mutex_;
    mutable std::condition_variable changed_;
    std::unordered_map<RequestId, InferenceRequest> requests_;
};

}
