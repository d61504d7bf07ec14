// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file PerformanceCeiling.h
 * @brief Advisory frame-rate / shader ceilings per device thermal tier
 *
 * The engine never reads device state. An embedding application that knows
 * its thermal tier applies these ceilings to a snapshot before rendering;
 * the engine's frameRateCap is an upper bound that can only be lowered here.
 */

#pragma once

#include <cstdint>
#include <cstring>

#include "AdaptationParameters.h"
#include "SafetyLimits.h"

namespace caninesense {
namespace core {

enum class ThermalTier : uint8_t {
    NOMINAL = 0,
    FAIR = 1,
    SERIOUS = 2,
    CRITICAL = 3
};

struct PerformanceLimits {
    float maxFrameRate;
    float shaderComplexity;     ///< 0-1 fraction of full shader work
};

static constexpr PerformanceLimits THERMAL_LIMITS[] = {
    { 120.0f, 1.0f },   // NOMINAL
    {  90.0f, 0.8f },   // FAIR
    {  60.0f, 0.6f },   // SERIOUS
    {  30.0f, 0.3f },   // CRITICAL
};

inline const PerformanceLimits& limitsFor(ThermalTier tier) {
    uint8_t idx = static_cast<uint8_t>(tier);
    if (idx > static_cast<uint8_t>(ThermalTier::CRITICAL)) {
        idx = static_cast<uint8_t>(ThermalTier::CRITICAL);
    }
    return THERMAL_LIMITS[idx];
}

inline const char* thermalTierName(ThermalTier tier) {
    switch (tier) {
        case ThermalTier::NOMINAL:  return "nominal";
        case ThermalTier::FAIR:     return "fair";
        case ThermalTier::SERIOUS:  return "serious";
        case ThermalTier::CRITICAL: return "critical";
        default:                    return "invalid";
    }
}

inline bool parseThermalTier(const char* str, ThermalTier& out) {
    if (str == nullptr) return false;
    for (uint8_t i = 0; i <= static_cast<uint8_t>(ThermalTier::CRITICAL); ++i) {
        ThermalTier t = static_cast<ThermalTier>(i);
        if (strcmp(str, thermalTierName(t)) == 0) {
            out = t;
            return true;
        }
    }
    return false;
}

/**
 * @brief Copy of params with frameRateCap lowered to the tier ceiling
 */
inline AdaptationParameters applyPerformanceCeiling(const AdaptationParameters& params, ThermalTier tier) {
    AdaptationParameters out = params;
    const float ceiling = limitsFor(tier).maxFrameRate;
    if (out.frameRateCap > ceiling) {
        out.frameRateCap = ceiling;
    }
    out.frameRateCap = clampf(out.frameRateCap, MIN_FRAME_RATE, MAX_FRAME_RATE);
    return out;
}

} // namespace core
} // namespace caninesense
