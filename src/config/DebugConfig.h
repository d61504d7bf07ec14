// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DebugConfig.h
 * @brief Runtime log levels, one global and one optional override per domain
 *
 * Default is WARN everywhere: registry build failures and rejected
 * configuration. INFO adds phase and stress transitions, VERBOSE adds
 * per-evaluation values, TRACE adds per-band and LUT detail.
 */

#pragma once

#include <cstdint>

namespace caninesense {
namespace config {

enum class DebugDomain : uint8_t {
    PROFILE = 0,    ///< Registry build, lookups, configuration decoding
    SESSION = 1,    ///< Phase and stress transitions
    AUDIO = 2,
    VISION = 3,
    SYSTEM = 4,     ///< Driver, sinks, governor
    _COUNT = 5
};

// VERBOSE rather than DEBUG, which platform headers may define as a macro.
enum class DebugLevel : uint8_t {
    OFF = 0,
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    VERBOSE = 4,
    TRACE = 5
};

constexpr uint8_t DEBUG_DOMAIN_COUNT = static_cast<uint8_t>(DebugDomain::_COUNT);

/// Lowercase names accepted by parseDomain, indexed by DebugDomain
constexpr const char* DEBUG_DOMAIN_NAMES[DEBUG_DOMAIN_COUNT] = {
    "profile",
    "session",
    "audio",
    "vision",
    "system"
};

struct DebugConfig {
    static constexpr int8_t USE_GLOBAL = -1;

    uint8_t globalLevel = static_cast<uint8_t>(DebugLevel::WARN);
    int8_t domainLevels[DEBUG_DOMAIN_COUNT] = {
        USE_GLOBAL, USE_GLOBAL, USE_GLOBAL, USE_GLOBAL, USE_GLOBAL
    };

    /// Override when set, global level otherwise
    uint8_t effectiveLevel(DebugDomain domain) const {
        const int8_t level = getDomainLevel(domain);
        return (level >= 0) ? static_cast<uint8_t>(level) : globalLevel;
    }

    /// USE_GLOBAL (-1) removes the override
    void setDomainLevel(DebugDomain domain, int8_t level) {
        const uint8_t idx = static_cast<uint8_t>(domain);
        if (idx < DEBUG_DOMAIN_COUNT) {
            domainLevels[idx] = level;
        }
    }

    int8_t getDomainLevel(DebugDomain domain) const {
        const uint8_t idx = static_cast<uint8_t>(domain);
        return idx < DEBUG_DOMAIN_COUNT ? domainLevels[idx] : USE_GLOBAL;
    }

    bool shouldLog(DebugDomain domain, DebugLevel level) const {
        return effectiveLevel(domain) >= static_cast<uint8_t>(level);
    }

    void clearOverrides() {
        for (uint8_t i = 0; i < DEBUG_DOMAIN_COUNT; ++i) {
            domainLevels[i] = USE_GLOBAL;
        }
    }

    static const char* domainName(DebugDomain domain);
    static const char* levelName(DebugLevel level);
    static const char* levelName(uint8_t level);

    /// Case-insensitive parse of "profile", "session", ... Returns false if unknown.
    static bool parseDomain(const char* str, DebugDomain& out);

    /// Accepts a level name ("warn") or a digit 0-5.
    static bool parseLevel(const char* str, DebugLevel& out);
};

DebugConfig& getDebugConfig();

/// Restore WARN with no overrides
void resetDebugConfig();

/// Writes the global level and each domain's effective level to the log stream
void printDebugConfig();

} // namespace config
} // namespace caninesense
