/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inferline/result_store.hpp"
#include "inferline/logger.hpp"

namespace inferline {

void ResultStore::put(const RequestId& id, std::string payload, std::optional<std::string> usage) {
    InferenceResult result{id, std::move(payload), std::move(usage), std::nullopt};

    std::lock_guard<std::mutex> lock(mutex_);
    results_[id] = std::move(result);
    LOG_TRACE("Result stored: " + id);
}

std::optional<InferenceResult> ResultStore::get(const RequestId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = results_.find(id);
    if (it == results_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<InferenceResult> ResultStore::takeAndDelete(const RequestId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = results_.find(id);
    if (it == results_.end()) {
        return std::nullopt;
    }
    InferenceResult result = std::move(it->second);
    results_.erase(it);
    return result;
}

void ResultStore::erase(const RequestId& id) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    results_.erase(id);
}

std::size_t ResultStore::size() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_.size();
}

}
