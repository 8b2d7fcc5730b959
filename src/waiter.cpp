/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inferline/waiter.hpp"
#include "inferline/request_store.hpp"
#include "inferline/result_store.hpp"
#include "inferline/logger.hpp"
#include <algorithm>

namespace inferline {

Waiter::Waiter(RequestStore& requests, ResultStore& results, BrokerConfig config) noexcept
    : requests_(requests), results_(results), config_(std::move(config)) {
}

WaitResult Waiter::submitAndWait(std::string kind, std::string model, std::string payload,
                                 std::chrono::milliseconds timeout, const CancelCheck& cancelled) {
    RequestId id = requests_.enqueue(std::move(kind), std::move(model), std::move(payload));
    return wait(id, timeout, cancelled);
}

WaitResult Waiter::wait(const RequestId& id, std::chrono::milliseconds timeout, const CancelCheck& cancelled) {
    using SteadyClock = std::chrono::steady_clock;
    const auto bound = std::clamp(timeout, std::chrono::milliseconds::zero(),
                                  std::chrono::duration_cast<std::chrono::milliseconds>(kMaxWaitTimeout));
    if (bound != timeout) {
        LOG_DEBUG("Wait bound clamped to " + std::to_string(bound.count()) + "ms: " + id);
    }
    const auto deadline = SteadyClock::now() + bound;

    WaitResult out;
    out.id = id;

    while (true) {
        if (cancelled && cancelled()) {
            LOG_INFO("Wait cancelled by caller: " + id);
            abandon(id, config_.cancelPolicy, "cancelled");
            out.error = ErrorCode::Cancelled;
            out.message = "Request cancelled by caller";
            return out;
        }

        auto now = SteadyClock::now();
        if (now >= deadline) {
            LOG_WARN("Wait timed out: " + id);
            abandon(id, config_.timeoutPolicy, "timed out");
            out.error = ErrorCode::Timeout;
            out.message = "Timed out waiting for a provider";
            return out;
        }

        // Without a cancel check the only wake-ups are transitions and the deadline
        auto until = cancelled ? std::min(deadline, now + config_.cancelCheckInterval) : deadline;
        Status status = requests_.awaitTerminal(id, until);

        if (status == Status::Completed) {
            auto result = results_.takeAndDelete(id);
            requests_.remove(id);
            if (!result) {
                // A status lookup consumed it first
                out.error = ErrorCode::NotFound;
                out.message = "Result already consumed: " + id;
                return out;
            }
            out.ok = true;
            out.payload = std::move(result->payload);
            out.usage = std::move(result->usage);
            LOG_DEBUG("Wait completed: " + id);
            return out;
        }

        if (status == Status::Failed) {
            auto request = requests_.take(id);
            if (!request) {
                out.error = ErrorCode::NotFound;
                out.message = "Failure already consumed: " + id;
                return out;
            }
            out.error = ErrorCode::UpstreamFailure;
            out.message = request->error.value_or("");
            LOG_DEBUG("Wait observed failure: " + id + " - " + out.message);
            return out;
        }

        if (status == Status::Missing) {
            out.error = ErrorCode::NotFound;
            out.message = "Request disappeared while waiting: " + id;
            return out;
        }
    }
}

void Waiter::abandon(const RequestId& id, OrphanPolicy policy, const char* reason) {
    if (policy == OrphanPolicy::Remove) {
        requests_.remove(id);
        LOG_DEBUG(std::string("Removed ") + reason + " request: " + id);
    } else {
        LOG_DEBUG(std::string("Retained ") + reason + " request: " + id);
    }
}

}
