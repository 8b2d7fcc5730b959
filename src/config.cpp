/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inferline/config.hpp"
#include "inferline/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace inferline {

namespace {
std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

OrphanPolicy envPolicy(const char* name, OrphanPolicy defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    if (auto parsed = parseOrphanPolicy(val)) {
        return *parsed;
    }
    LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val + " (expected retain or remove)");
    return defv;
}
}

int envInt(const char* name, int defv) noexcept {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        return defv;
    }
}

float envFloat(const char* name, float defv) noexcept {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        return std::stof(val);
    } catch (const std::exception&) {
        return defv;
    }
}

std::size_t envSize(const char* name, std::size_t defv) noexcept {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        std::size_t parsed = static_cast<std::size_t>(std::stoull(val));
        return parsed == 0 ? defv : parsed;
    } catch (const std::exception&) {
        return defv;
    }
}

std::string envString(const char* name, const std::string& defv) {
    const char* val = std::getenv(name);
    return (val && *val) ? std::string(val) : defv;
}

std::optional<OrphanPolicy> parseOrphanPolicy(const std::string& name) noexcept {
    std::string value = toLowerCopy(name);
    if (value == "retain") return OrphanPolicy::Retain;
    if (value == "remove") return OrphanPolicy::Remove;
    return std::nullopt;
}

const char* toString(OrphanPolicy policy) noexcept {
    return policy == OrphanPolicy::Remove ? "remove" : "retain";
}

BrokerConfig BrokerConfig::fromEnv() {
    BrokerConfig config;
    config.providerTtl = std::chrono::seconds(
        envSize("INFERLINE_PROVIDER_TTL", static_cast<std::size_t>(config.providerTtl.count())));
    config.waitTimeout = std::chrono::seconds(
        envSize("INFERLINE_WAIT_TIMEOUT", static_cast<std::size_t>(config.waitTimeout.count())));
    config.cancelCheckInterval = std::chrono::milliseconds(
        envSize("INFERLINE_CANCEL_CHECK_MS", static_cast<std::size_t>(config.cancelCheckInterval.count())));
    config.timeoutPolicy = envPolicy("INFERLINE_TIMEOUT_POLICY", config.timeoutPolicy);
    config.cancelPolicy = envPolicy("INFERLINE_CANCEL_POLICY", config.cancelPolicy);
    config.retention = std::chrono::seconds(
        envSize("INFERLINE_RETENTION", static_cast<std::size_t>(config.retention.count())));
    config.maxPayloadBytes = envSize("INFERLINE_MAX_PAYLOAD", config.maxPayloadBytes);
    config.defaultKind = envString("INFERLINE_DEFAULT_KIND", config.defaultKind);
    return config;
}

}
