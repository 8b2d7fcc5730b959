/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "inferline/types.hpp"

namespace inferline {

class ResultStore final {
public:
    ResultStore() = default;

    ResultStore(const ResultStore&) = delete;
    ResultStore& operator=(const ResultStore&) = delete;
    ResultStore(ResultStore&&) = delete;
    ResultStore& operator=(ResultStore&&) = delete;

    void put(const RequestId& id, std::string payload, std::optional<std::string> usage);
    [[nodiscard]] std::optional<InferenceResult> get(const RequestId& id) const;

    // At-most-once delivery: of two racing readers exactly one gets the result.
    [[nodiscard]] std::optional<InferenceResult> takeAndDelete(const RequestId& id);

    void erase(const RequestId& id) noexcept;
    [[nodiscard]] std::size_t size() const noexcept;

private:
    mutable std::mutex mutex_;
    std::unordered_map<RequestId, InferenceResult> results_;
};

}
