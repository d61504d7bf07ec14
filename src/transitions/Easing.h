// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Easing.h
 * @brief Easing curves for phase-to-phase parameter interpolation
 *
 * Easing functions transform linear progress (0-1) into curved progress.
 * Used by PhaseController to glide stimulation intensity from one relaxation
 * phase level toward the next.
 */

#pragma once

#include <cstdint>
#include <cstring>

namespace caninesense {
namespace transitions {

// ==================== Easing Curve Types ====================

enum class EasingCurve : uint8_t {
    LINEAR = 0,
    IN_QUAD = 1,
    OUT_QUAD = 2,
    IN_OUT_QUAD = 3,
    IN_CUBIC = 4,
    OUT_CUBIC = 5,
    IN_OUT_CUBIC = 6,
    CURVE_COUNT = 7
};

// ==================== Easing Function Names ====================

inline const char* getEasingName(EasingCurve curve) {
    switch (curve) {
        case EasingCurve::LINEAR:       return "linear";
        case EasingCurve::IN_QUAD:      return "inQuad";
        case EasingCurve::OUT_QUAD:     return "outQuad";
        case EasingCurve::IN_OUT_QUAD:  return "inOutQuad";
        case EasingCurve::IN_CUBIC:     return "inCubic";
        case EasingCurve::OUT_CUBIC:    return "outCubic";
        case EasingCurve::IN_OUT_CUBIC: return "inOutCubic";
        default: return "unknown";
    }
}

inline bool parseEasingCurve(const char* str, EasingCurve& out) {
    if (str == nullptr) return false;
    for (uint8_t i = 0; i < static_cast<uint8_t>(EasingCurve::CURVE_COUNT); ++i) {
        EasingCurve c = static_cast<EasingCurve>(i);
        if (strcmp(str, getEasingName(c)) == 0) {
            out = c;
            return true;
        }
    }
    return false;
}

// ==================== Easing Implementation ====================

/**
 * @brief Apply easing curve to linear progress
 * @param t Linear progress (0.0 to 1.0)
 * @param curve Easing curve type
 * @return Eased progress (0.0 to 1.0)
 */
inline float ease(float t, EasingCurve curve) {
    // Clamp input to valid range (NaN collapses to 0)
    if (!(t > 0.0f)) t = 0.0f;
    if (t > 1.0f) t = 1.0f;

    switch (curve) {
        case EasingCurve::LINEAR:
            return t;

        case EasingCurve::IN_QUAD:
            return t * t;

        case EasingCurve::OUT_QUAD:
            return t * (2.0f - t);

        case EasingCurve::IN_OUT_QUAD:
            return (t < 0.5f) ? (2.0f * t * t) : (-1.0f + (4.0f - 2.0f * t) * t);

        case EasingCurve::IN_CUBIC:
            return t * t * t;

        case EasingCurve::OUT_CUBIC: {
            float f = t - 1.0f;
            return f * f * f + 1.0f;
        }

        case EasingCurve::IN_OUT_CUBIC:
            return (t < 0.5f)
                ? (4.0f * t * t * t)
                : ((t - 1.0f) * (2.0f * t - 2.0f) * (2.0f * t - 2.0f) + 1.0f);

        default:
            return t;
    }
}

/**
 * @brief Interpolate between two values with easing
 */
inline float lerpEased(float from, float to, float t, EasingCurve curve) {
    return from + (to - from) * ease(t, curve);
}

} // namespace transitions
} // namespace caninesense
