/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inferline/types.hpp"

namespace inferline {

const char* toString(Status status) noexcept {
    switch (status) {
        case Status::Pending: return "pending";
        case Status::Processing: return "processing";
        case Status::Completed: return "completed";
        case Status::Failed: return "failed";
        case Status::Missing: return "missing";
        default: return "unknown";
    }
}

const char* toString(ErrorCode error) noexcept {
    switch (error) {
        case ErrorCode::None: return "none";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::InvalidState: return "invalid_state";
        case ErrorCode::InvalidRequest: return "invalid_request";
        case ErrorCode::NoPendingWork: return "no_pending_work";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::UpstreamFailure: return "upstream_failure";
        case ErrorCode::Cancelled: return "cancelled";
        case ErrorCode::Unavailable: return "unavailable";
        default: return "unknown";
    }
}

bool isTerminal(Status status) noexcept {
    return status == Status::Completed || status == Status::Failed;
}

}
