/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inferline/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_map>

namespace inferline {

static LogLevel g_level = LogLevel::INFO;
static std::mutex g_log_mutex;
static bool g_level_initialized = false;
static std::unordered_map<std::thread::id, std::string> g_thread_names;

void Logger::setLevel(LogLevel level) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
    g_level_initialized = true;
}

// Leaves an explicitly set level alone unless INFERLINE_LOG_LEVEL is given
void Logger::initFromEnv() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    const char* env_val = std::getenv("INFERLINE_LOG_LEVEL");
    if (env_val) {
        if (auto parsed = parseLevel(env_val)) {
            g_level = *parsed;
            g_level_initialized = true;
            return;
        }
    }
    if (!g_level_initialized) {
        g_level = LogLevel::INFO;
        g_level_initialized = true;
    }
}

LogLevel Logger::level() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_level_initialized) {
        g_level = parseEnvLevel();
        g_level_initialized = true;
    }
    return g_level;
}

std::optional<LogLevel> Logger::parseLevel(const std::string& name) noexcept {
    std::string value = name;
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (value == "error") return LogLevel::ERROR;
    if (value == "warn" || value == "warning") return LogLevel::WARN;
    if (value == "info") return LogLevel::INFO;
    if (value == "debug") return LogLevel::DEBUG;
    if (value == "trace") return LogLevel::TRACE;
    return std::nullopt;
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (static_cast<uint8_t>(level) > static_cast<uint8_t>(Logger::level())) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        std::tm local{};
        localtime_r(&time_t, &local);

        std::ostringstream ss;
        ss << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
        ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
        ss << " [" << levelToString(level) << "]";

        // One lock for name lookup and write keeps lines from interleaving
        std::lock_guard<std::mutex> lock(g_log_mutex);
        auto it = g_thread_names.find(std::this_thread::get_id());
        if (it != g_thread_names.end()) {
            ss << " [" << it->second << "]";
        } else {
            ss << " [T" << std::this_thread::get_id() << "]";
        }
        ss << " " << message;

        // stdout belongs to the CLI tools
        std::cerr << ss.str() << std::endl;
    } catch (...) {
        // Logging must never throw into the caller
    }
}

LogLevel Logger::parseEnvLevel() noexcept {
    const char* env_val = std::getenv("INFERLINE_LOG_LEVEL");
    if (!env_val) return LogLevel::INFO;
    return parseLevel(env_val).value_or(LogLevel::INFO);
}

const char* Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "UNKN ";
    }
}

void setThreadName(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_thread_names[std::this_thread::get_id()] = name;
}

std::string getThreadName(int worker_id) {
    return "Worker-" + std::to_string(worker_id);
}

}
