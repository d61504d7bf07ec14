// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DebugConfig.cpp
 * @brief Debug configuration storage, naming and parsing
 */

#include "DebugConfig.h"
#include "../utils/Log.h"

#include <cctype>
#include <cstdio>

namespace caninesense {
namespace config {

namespace {

DebugConfig s_debugConfig;

constexpr uint8_t LEVEL_COUNT = static_cast<uint8_t>(DebugLevel::TRACE) + 1;

constexpr const char* LEVEL_NAMES[LEVEL_COUNT] = {
    "OFF", "ERROR", "WARN", "INFO", "VERBOSE", "TRACE"
};

constexpr const char* DOMAIN_LABELS[DEBUG_DOMAIN_COUNT] = {
    "PROFILE", "SESSION", "AUDIO", "VISION", "SYSTEM"
};

bool equalsIgnoreCase(const char* a, const char* b) {
    while (*a && *b) {
        if (std::tolower(static_cast<unsigned char>(*a)) !=
            std::tolower(static_cast<unsigned char>(*b))) {
            return false;
        }
        ++a;
        ++b;
    }
    return *a == *b;
}

} // namespace

DebugConfig& getDebugConfig() {
    return s_debugConfig;
}

void resetDebugConfig() {
    s_debugConfig = DebugConfig();
}

const char* DebugConfig::domainName(DebugDomain domain) {
    const uint8_t idx = static_cast<uint8_t>(domain);
    return idx < DEBUG_DOMAIN_COUNT ? DOMAIN_LABELS[idx] : "UNKNOWN";
}

const char* DebugConfig::levelName(DebugLevel level) {
    return levelName(static_cast<uint8_t>(level));
}

const char* DebugConfig::levelName(uint8_t level) {
    return level < LEVEL_COUNT ? LEVEL_NAMES[level] : "INVALID";
}

bool DebugConfig::parseDomain(const char* str, DebugDomain& out) {
    if (str == nullptr) return false;
    for (uint8_t i = 0; i < DEBUG_DOMAIN_COUNT; ++i) {
        if (equalsIgnoreCase(str, DEBUG_DOMAIN_NAMES[i])) {
            out = static_cast<DebugDomain>(i);
            return true;
        }
    }
    return false;
}

bool DebugConfig::parseLevel(const char* str, DebugLevel& out) {
    if (str == nullptr || *str == '\0') return false;

    if (str[1] == '\0' && str[0] >= '0' && str[0] < static_cast<char>('0' + LEVEL_COUNT)) {
        out = static_cast<DebugLevel>(str[0] - '0');
        return true;
    }
    for (uint8_t i = 0; i < LEVEL_COUNT; ++i) {
        if (equalsIgnoreCase(str, LEVEL_NAMES[i])) {
            out = static_cast<DebugLevel>(i);
            return true;
        }
    }
    return false;
}

void printDebugConfig() {
    const DebugConfig& cfg = getDebugConfig();
    FILE* out = utils::logStream();

    fprintf(out, "\n--- CanineSense log levels ---\n");
    fprintf(out, "global   %s\n", DebugConfig::levelName(cfg.globalLevel));
    for (uint8_t i = 0; i < DEBUG_DOMAIN_COUNT; ++i) {
        const DebugDomain domain = static_cast<DebugDomain>(i);
        fprintf(out, "%-8s %s%s\n",
               DEBUG_DOMAIN_NAMES[i],
               DebugConfig::levelName(cfg.effectiveLevel(domain)),
               cfg.getDomainLevel(domain) >= 0 ? " (override)" : "");
    }
}

} // namespace config
} // namespace caninesense
