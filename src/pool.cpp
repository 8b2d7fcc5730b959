/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inferline/pool.hpp"
#include "inferline/logger.hpp"

namespace inferline {

Pool::Pool(int workers) noexcept : workers_(workers > 0 ? workers : 1) {
    LOG_DEBUG("Pool created with " + std::to_string(workers_) + " workers");
}

Pool::~Pool() {
    auto dropped = stop();
    if (!dropped.empty()) {
        LOG_WARN("Pool destroyed with " + std::to_string(dropped.size()) + " unstarted request(s)");
    }
}

bool Pool::start(RequestProcessor processor) {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    if (!processor) {
        LOG_ERROR("Invalid request processor provided");
        return false;
    }

    processor_ = std::move(processor);
    running_.store(true);
    shutdown_.store(false);

    try {
        workerThreads_.reserve(workers_);
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }

        LOG_INFO("Pool started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        (void)stop();
        return false;
    }
}

std::vector<InferenceRequest> Pool::stop() noexcept {
    std::vector<InferenceRequest> unstarted;
    if (!running_.load()) {
        return unstarted;
    }

    LOG_DEBUG("Stopping pool...");

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
        running_.store(false);
    }
    requestAvailable_.notify_all();

    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workerThreads_.clear();

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        while (!queue_.empty()) {
            unstarted.push_back(std::move(queue_.front()));
            queue_.pop();
        }
    }

    LOG_INFO("Pool stopped");
    return unstarted;
}

bool Pool::submit(InferenceRequest request) noexcept {
    if (!running_.load() || shutdown_.load()) {
        LOG_DEBUG("Cannot submit request to stopped pool: " + request.id);
        return false;
    }

    try {
        RequestId id = request.id;
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            queue_.push(std::move(request));
        }

        requestAvailable_.notify_one();
        LOG_DEBUG("Request queued: " + id);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to queue request: " + std::string(e.what()));
        return false;
    }
}

std::size_t Pool::queueSize() const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return queue_.size();
}

int Pool::idleWorkers() const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    int idle = workers_ - busy_ - static_cast<int>(queue_.size());
    return idle > 0 ? idle : 0;
}

void Pool::workerLoop(int workerId) {
    setThreadName(getThreadName(workerId));
    LOG_DEBUG(getThreadName(workerId) + " thread started");

    while (true) {
        InferenceRequest request;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            requestAvailable_.wait(lock, [this] {
                return !queue_.empty() || shutdown_.load();
            });

            if (shutdown_.load()) {
                break;
            }

            request = std::move(queue_.front());
            queue_.pop();
            ++busy_;
        }

        // Process outside the lock
        LOG_INFO(getThreadName(workerId) + " started request: " + request.id);
        try {
            processor_(request, workerId);
        } catch (const std::exception& e) {
            LOG_ERROR("Worker " + std::to_string(workerId) + " processing error: " +
                      std::string(e.what()) + " (request: " + request.id + ")");
        }

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            --busy_;
        }
    }

    LOG_DEBUG("Worker " + std::to_string(workerId) + " stopped");
}

}
