// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file SafetyLimits.h
 * @brief Closed output ranges and the clamps that enforce them
 *
 * Every numeric field of AdaptationParameters has a documented range here.
 * Shapers clamp their own subsets; the orchestrator clamps the merged
 * snapshot again before returning it. MAX_VOLUME_DB is a welfare ceiling and
 * is never exceeded.
 */

#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>

#include "AdaptationParameters.h"

namespace caninesense {
namespace core {

// ==================== Audio ====================

static constexpr float MAX_VOLUME_DB = 65.0f;
static constexpr float MIN_VOLUME_DB = 0.0f;
static constexpr float MIN_BAND_GAIN_DB = -12.0f;
static constexpr float MAX_BAND_GAIN_DB = 6.0f;
static constexpr int16_t MIN_BPM = 30;
static constexpr int16_t MAX_BPM = 120;
static constexpr float MIN_TONE_HZ = 20.0f;
static constexpr float MAX_TONE_HZ = 65000.0f;
static constexpr float MAX_SPATIAL_EXTENT = 10.0f;   ///< Metres per axis

// ==================== Video ====================

static constexpr float MIN_FRAME_RATE = 10.0f;
static constexpr float MAX_FRAME_RATE = 120.0f;
static constexpr float MAX_VISUAL_SPEED = 2.0f;
static constexpr float MIN_MOTION_DAMPING = 0.1f;
static constexpr float MAX_MOTION_DAMPING = 1.0f;
static constexpr float MIN_CONTRAST_EXPONENT = 1.0f;
static constexpr float MAX_CONTRAST_EXPONENT = 3.0f;

/**
 * @brief Clamp with NaN collapsing to the lower bound
 */
inline float clampf(float v, float lo, float hi) {
    if (!(v >= lo)) return lo;
    return std::min(v, hi);
}

inline int16_t clampBpm(int v) {
    return static_cast<int16_t>(std::min(std::max(v, static_cast<int>(MIN_BPM)),
                                         static_cast<int>(MAX_BPM)));
}

inline bool isFiniteVec(const Vec3& v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

/**
 * @brief Clamp each axis to +/-MAX_SPATIAL_EXTENT; a non-finite vector is center
 */
inline Vec3 clampSpatial(const Vec3& v) {
    Vec3 out;
    if (!isFiniteVec(v)) {
        return out;
    }
    out.x = clampf(v.x, -MAX_SPATIAL_EXTENT, MAX_SPATIAL_EXTENT);
    out.y = clampf(v.y, -MAX_SPATIAL_EXTENT, MAX_SPATIAL_EXTENT);
    out.z = clampf(v.z, -MAX_SPATIAL_EXTENT, MAX_SPATIAL_EXTENT);
    return out;
}

inline DichromaticCoefficients clampDichromatic(const DichromaticCoefficients& in) {
    DichromaticCoefficients out = in;
    out.blueWeight = clampf(out.blueWeight, 0.0f, 1.0f);
    out.yellowWeight = clampf(out.yellowWeight, 0.0f, 1.0f);
    out.redWeight = clampf(out.redWeight, 0.0f, 1.0f);
    out.greenWeight = clampf(out.greenWeight, 0.0f, 1.0f - out.redWeight);
    out.contrastExponent = clampf(out.contrastExponent, MIN_CONTRAST_EXPONENT, MAX_CONTRAST_EXPONENT);
    return out;
}

inline FrequencyBand clampBand(const FrequencyBand& in) {
    FrequencyBand out = in;
    out.gainDb = clampf(out.gainDb, MIN_BAND_GAIN_DB, MAX_BAND_GAIN_DB);
    out.stressWeight = clampf(out.stressWeight, 0.0f, 1.0f);
    return out;
}

inline ToneGenerator clampTone(const ToneGenerator& in) {
    ToneGenerator out;
    out.frequencyHz = clampf(in.frequencyHz, MIN_TONE_HZ, MAX_TONE_HZ);
    out.amplitude = clampf(in.amplitude, 0.0f, 1.0f);
    return out;
}

/**
 * @brief Clamp every numeric field of a snapshot into its safe range
 */
inline AdaptationParameters clampAdaptationParameters(const AdaptationParameters& in) {
    AdaptationParameters out = in;

    out.visualSpeed = clampf(out.visualSpeed, 0.0f, MAX_VISUAL_SPEED);
    out.colorContrast = clampf(out.colorContrast, 0.0f, 1.0f);
    out.motionDamping = clampf(out.motionDamping, MIN_MOTION_DAMPING, MAX_MOTION_DAMPING);
    out.frameRateCap = clampf(out.frameRateCap, MIN_FRAME_RATE, MAX_FRAME_RATE);
    out.dichromatic = clampDichromatic(out.dichromatic);

    out.audioBPM = clampBpm(out.audioBPM);
    for (uint8_t i = 0; i < BAND_COUNT; i++) {
        out.frequencyBands[i] = clampBand(out.frequencyBands[i]);
    }
    if (out.toneCount > MAX_TONE_GENERATORS) {
        out.toneCount = MAX_TONE_GENERATORS;
    }
    for (uint8_t i = 0; i < out.toneCount; i++) {
        out.toneGenerators[i] = clampTone(out.toneGenerators[i]);
    }
    out.spatialBias = clampSpatial(out.spatialBias);
    out.volumeCeilingDb = clampf(out.volumeCeilingDb, MIN_VOLUME_DB, MAX_VOLUME_DB);

    out.phaseProgress = clampf(out.phaseProgress, 0.0f, 1.0f);
    out.intensity = clampf(out.intensity, 0.0f, 1.0f);
    if (out.contentCategory == nullptr) {
        out.contentCategory = "";
    }
    return out;
}

// ============================================================================
// Range Validation
// ============================================================================

/**
 * @brief Outcome of a range audit; field names the first violation
 *
 * A failed check means a coefficient table produced a value the clamps
 * should have made impossible.
 */
struct RangeCheckResult {
    bool ok = true;
    const char* field = "";
    float value = 0.0f;
};

inline bool inRange(float v, float lo, float hi) {
    return v >= lo && v <= hi;
}

inline RangeCheckResult validateAdaptationParameters(const AdaptationParameters& p) {
    RangeCheckResult r;
    auto fail = [&r](const char* field, float value) {
        r.ok = false;
        r.field = field;
        r.value = value;
        return r;
    };

    if (!inRange(p.visualSpeed, 0.0f, MAX_VISUAL_SPEED)) return fail("visualSpeed", p.visualSpeed);
    if (!inRange(p.colorContrast, 0.0f, 1.0f)) return fail("colorContrast", p.colorContrast);
    if (!inRange(p.motionDamping, MIN_MOTION_DAMPING, MAX_MOTION_DAMPING)) return fail("motionDamping", p.motionDamping);
    if (!inRange(p.frameRateCap, MIN_FRAME_RATE, MAX_FRAME_RATE)) return fail("frameRateCap", p.frameRateCap);
    if (!inRange(p.dichromatic.blueWeight, 0.0f, 1.0f)) return fail("dichromatic.blueWeight", p.dichromatic.blueWeight);
    if (!inRange(p.dichromatic.yellowWeight, 0.0f, 1.0f)) return fail("dichromatic.yellowWeight", p.dichromatic.yellowWeight);
    if (!inRange(p.dichromatic.redWeight + p.dichromatic.greenWeight, 0.0f, 1.0f)) {
        return fail("dichromatic.redWeight+greenWeight", p.dichromatic.redWeight + p.dichromatic.greenWeight);
    }
    if (!inRange(p.dichromatic.contrastExponent, MIN_CONTRAST_EXPONENT, MAX_CONTRAST_EXPONENT)) {
        return fail("dichromatic.contrastExponent", p.dichromatic.contrastExponent);
    }
    if (p.audioBPM < MIN_BPM || p.audioBPM > MAX_BPM) return fail("audioBPM", static_cast<float>(p.audioBPM));
    for (uint8_t i = 0; i < BAND_COUNT; i++) {
        const FrequencyBand& b = p.frequencyBands[i];
        if (!inRange(b.gainDb, MIN_BAND_GAIN_DB, MAX_BAND_GAIN_DB)) return fail("frequencyBands.gainDb", b.gainDb);
        if (!inRange(b.stressWeight, 0.0f, 1.0f)) return fail("frequencyBands.stressWeight", b.stressWeight);
    }
    if (p.toneCount > MAX_TONE_GENERATORS) return fail("toneCount", static_cast<float>(p.toneCount));
    for (uint8_t i = 0; i < p.toneCount; i++) {
        if (!inRange(p.toneGenerators[i].amplitude, 0.0f, 1.0f)) return fail("toneGenerators.amplitude", p.toneGenerators[i].amplitude);
        if (!inRange(p.toneGenerators[i].frequencyHz, MIN_TONE_HZ, MAX_TONE_HZ)) return fail("toneGenerators.frequencyHz", p.toneGenerators[i].frequencyHz);
    }
    if (!inRange(p.spatialBias.x, -MAX_SPATIAL_EXTENT, MAX_SPATIAL_EXTENT) ||
        !inRange(p.spatialBias.y, -MAX_SPATIAL_EXTENT, MAX_SPATIAL_EXTENT) ||
        !inRange(p.spatialBias.z, -MAX_SPATIAL_EXTENT, MAX_SPATIAL_EXTENT)) {
        return fail("spatialBias", p.spatialBias.x);
    }
    if (!inRange(p.volumeCeilingDb, MIN_VOLUME_DB, MAX_VOLUME_DB)) return fail("volumeCeilingDb", p.volumeCeilingDb);
    if (!inRange(p.phaseProgress, 0.0f, 1.0f)) return fail("phaseProgress", p.phaseProgress);
    if (!inRange(p.intensity, 0.0f, 1.0f)) return fail("intensity", p.intensity);
    return r;
}

} // namespace core
} // namespace caninesense
