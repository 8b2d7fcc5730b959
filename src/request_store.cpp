/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inferline/request_store.hpp"
#include "inferline/result_store.hpp"
#include "inferline/logger.hpp"
#include <atomic>
#include <iomanip>
#include <sstream>
#include <unistd.h>

namespace inferline {

namespace {
std::string wrongState(const RequestId& id, Status actual, const char* expected) {
    return "Request " + id + " is " + toString(actual) + ", expected " + expected;
}
}

RequestStore::RequestStore(ResultStore& results) noexcept : results_(results) {
}

RequestId RequestStore::generateId() {
    static std::atomic<uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        Clock::now().time_since_epoch()).count();
    uint64_t unique_counter = counter.fetch_add(1);

    // Fixed-width fields keep lexical order equal to creation order within a process
    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(16) << now << "_" << getpid() << "_"
       << std::setw(8) << unique_counter;
    return ss.str();
}

RequestId RequestStore::enqueue(std::string kind, std::string model, std::string payload, TimePoint now) {
    InferenceRequest request;
    request.id = generateId();
    request.kind = std::move(kind);
    request.model = std::move(model);
    request.payload = std::move(payload);
    request.status = Status::Pending;
    request.createdAt = now;

    RequestId id = request.id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.emplace(id, std::move(request));
    }

    LOG_DEBUG("Request enqueued: " + id);
    return id;
}

std::optional<InferenceRequest> RequestStore::claim(const RequestId& id, const ProviderId& providerId,
                                                    TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(id);
    if (it == requests_.end() || it->second.status != Status::Pending) {
        LOG_DEBUG("Request already claimed or missing: " + id);
        return std::nullopt;
    }

    it->second.status = Status::Processing;
    it->second.startedAt = now;
    if (!providerId.empty()) {
        it->second.claimedBy = providerId;
    }
    return it->second;
}

OpResult RequestStore::complete(const RequestId& id, std::string payload,
                                std::optional<std::string> usage, TimePoint now) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = requests_.find(id);
        if (it == requests_.end()) {
            return {false, ErrorCode::InvalidState, "Request " + id + " is not known, expected processing"};
        }
        if (it->second.status != Status::Processing) {
            return {false, ErrorCode::InvalidState, wrongState(id, it->second.status, "processing")};
        }

        results_.put(id, std::move(payload), std::move(usage));
        it->second.status = Status::Completed;
        it->second.completedAt = now;
    }
    changed_.notify_all();

    LOG_DEBUG("Request completed: " + id);
    return {true, ErrorCode::None, ""};
}

OpResult RequestStore::fail(const RequestId& id, const std::string& message, TimePoint now) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = requests_.find(id);
        if (it == requests_.end()) {
            return {false, ErrorCode::InvalidState, "Request " + id + " is not known, expected pending or processing"};
        }
        // Pending may fail directly when a request is rejected before dispatch
        if (isTerminal(it->second.status)) {
            return {false, ErrorCode::InvalidState, wrongState(id, it->second.status, "pending or processing")};
        }

        it->second.status = Status::Failed;
        it->second.completedAt = now;
        it->second.error = message;
    }
    changed_.notify_all();

    LOG_DEBUG("Request failed: " + id + " - " + message);
    return {true, ErrorCode::None, ""};
}

std::optional<InferenceRequest> RequestStore::claimOldest(const Predicate& eligible, const ProviderId& providerId,
                                                          TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    InferenceRequest* oldest = nullptr;
    for (auto& entry : requests_) {
        InferenceRequest& candidate = entry.second;
        if (candidate.status != Status::Pending || !eligible(candidate)) {
            continue;
        }
        if (!oldest || candidate.createdAt < oldest->createdAt ||
            (candidate.createdAt == oldest->createdAt && candidate.id < oldest->id)) {
            oldest = &candidate;
        }
    }
    if (!oldest) {
        return std::nullopt;
    }

    oldest->status = Status::Processing;
    oldest->startedAt = now;
    if (!providerId.empty()) {
        oldest->claimedBy = providerId;
    }
    return *oldest;
}

std::optional<InferenceRequest> RequestStore::get(const RequestId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(id);
    if (it == requests_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<InferenceRequest> RequestStore::take(const RequestId& id) {
    std::optional<InferenceRequest> taken;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = requests_.find(id);
        if (it == requests_.end()) {
            return std::nullopt;
        }
        taken = std::move(it->second);
        requests_.erase(it);
        results_.erase(id);
    }
    changed_.notify_all();
    return taken;
}

void RequestStore::remove(const RequestId& id) {
    bool erased = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        erased = requests_.erase(id) > 0;
        results_.erase(id);
    }
    if (erased) {
        changed_.notify_all();
        LOG_TRACE("Request removed: " + id);
    }
}

std::vector<InferenceRequest> RequestStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<InferenceRequest> out;
    out.reserve(requests_.size());
    for (const auto& entry : requests_) {
        out.push_back(entry.second);
    }
    return out;
}

std::vector<InferenceRequest> RequestStore::snapshot(Status status) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<InferenceRequest> out;
    for (const auto& entry : requests_) {
        if (entry.second.status == status) {
            out.push_back(entry.second);
        }
    }
    return out;
}

StatusCounts RequestStore::counts() const {
    StatusCounts counts;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : requests_) {
        switch (entry.second.status) {
            case Status::Pending: ++counts.pending; break;
            case Status::Processing: ++counts.processing; break;
            case Status::Completed: ++counts.completed; break;
            case Status::Failed: ++counts.failed; break;
            default: break;
        }
    }
    return counts;
}

std::size_t RequestStore::size() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

Status RequestStore::awaitTerminal(const RequestId& id, std::chrono::steady_clock::time_point until) const {
    std::unique_lock<std::mutex> lock(mutex_);
    Status observed = Status::Missing;

    // wait_until releases the mutex while suspended
    changed_.wait_until(lock, until, [&] {
        auto it = requests_.find(id);
        observed = (it == requests_.end()) ? Status::Missing : it->second.status;
        return observed == Status::Missing || isTerminal(observed);
    });
    return observed;
}

std::size_t RequestStore::sweep(TimePoint now, std::chrono::seconds retention) {
    std::size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = requests_.begin(); it != requests_.end(); ) {
            if (now - it->second.createdAt > retention) {
                LOG_WARN("Sweeping orphaned request: " + it->first + " (" + toString(it->second.status) + ")");
                results_.erase(it->first);
                it = requests_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }

    if (removed > 0) {
        changed_.notify_all();
        LOG_INFO("Swept " + std::to_string(removed) + " orphaned request(s)");
    }
    return removed;
}

}
