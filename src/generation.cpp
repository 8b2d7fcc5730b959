/*
 * inferline - Pull-based Inference Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inferline/generation.hpp"

#include <regex>

namespace inferline {

std::string stripThinkBlocks(const std::string& text) {
    static const std::regex thinkRegex("<think>[\\s\\S]*?</think>\\s*");
    std::string result = std::regex_replace(text, thinkRegex, "");
    // Trim leading whitespace left behind
    size_t start = result.find_first_not_of(" \t\n\r");
    return (start == std::string::npos) ? "" : result.substr(start);
}

std::size_t findStop(const std::string& text, const std::vector<std::string>& stops) noexcept {
    std::size_t earliest = std::string::npos;
    for (const auto& stop : stops) {
        if (stop.empty()) {
            continue;
        }
        std::size_t pos = text.find(stop);
        if (pos < earliest) {
            earliest = pos;
        }
    }
    return earliest;
}

}
