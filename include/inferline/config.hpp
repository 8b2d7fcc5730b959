/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace inferline {

// What happens to a request whose waiter gave up on it.
enum class OrphanPolicy : uint8_t {
    Retain,   // left in the store for a late provider or a status lookup
    Remove    // dropped together with any result
};

// Upper bound on any single synchronous wait. Longer requested bounds are
// rejected at the HTTP edge and clamped in the core.
inline constexpr std::chrono::seconds kMaxWaitTimeout{24 * 3600};

struct BrokerConfig {
    std::chrono::seconds providerTtl{300};
    std::chrono::seconds waitTimeout{300};
    std::chrono::milliseconds cancelCheckInterval{100};
    OrphanPolicy timeoutPolicy = OrphanPolicy::Retain;
    OrphanPolicy cancelPolicy = OrphanPolicy::Remove;
    std::chrono::seconds retention{3600};
    std::size_t maxPayloadBytes = 10'000'000; // 10MB
    std::string defaultKind = "completion";

    [[nodiscard]] static BrokerConfig fromEnv();
};

// Environment lookups fall back to the default on unset, empty or unparsable values.
[[nodiscard]] int envInt(const char* name, int defv) noexcept;
[[nodiscard]] float envFloat(const char* name, float defv) noexcept;
[[nodiscard]] std::size_t envSize(const char* name, std::size_t defv) noexcept;
[[nodiscard]] std::string envString(const char* name, const std::string& defv);

[[nodiscard]] std::optional<OrphanPolicy> parseOrphanPolicy(const std::string& name) noexcept;
[[nodiscard]] const char* toString(OrphanPolicy policy) noexcept;

}
