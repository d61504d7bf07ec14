// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file AdaptationParameters.h
 * @brief Output snapshot consumed by external audio and video renderers
 *
 * Plain values only. Fixed-size arrays keep a snapshot trivially copyable so
 * it can be handed to renderers whole, and so the session history needs no
 * allocation.
 */

#pragma once

#include <cstdint>
#include <cstring>

#include "Vec3.h"
#include "../session/RelaxationPhase.h"
#include "../session/StressMetrics.h"

namespace caninesense {

static constexpr uint8_t BAND_COUNT = 10;
static constexpr uint8_t MAX_TONE_GENERATORS = 3;

/**
 * @brief One equalizer band
 */
struct FrequencyBand {
    float centerHz = 0.0f;
    float bandwidthHz = 0.0f;
    float gainDb = 0.0f;
    float stressWeight = 0.0f;      ///< 0-1, weight of the stress-response boost
};

/**
 * @brief Sine tone the audio renderer mixes under the programme
 */
struct ToneGenerator {
    float frequencyHz = 0.0f;
    float amplitude = 0.0f;         ///< 0-1
};

/**
 * @brief Coefficients for the per-pixel dichromatic transform
 *
 * blue'   = blue * blueWeight
 * yellow' = (red * redWeight + green * greenWeight) * yellowWeight
 * Both channels are then pushed through an S-curve with contrastExponent.
 */
struct DichromaticCoefficients {
    float blueWeight = 0.75f;
    float yellowWeight = 0.85f;
    float redWeight = 0.30f;
    float greenWeight = 0.50f;
    float contrastExponent = 1.2f;

    bool operator==(const DichromaticCoefficients& o) const {
        return blueWeight == o.blueWeight && yellowWeight == o.yellowWeight &&
               redWeight == o.redWeight && greenWeight == o.greenWeight &&
               contrastExponent == o.contrastExponent;
    }
};

// ============================================================================
// Shaper Subsets
// ============================================================================

struct AudioParameters {
    int16_t audioBPM = 55;
    FrequencyBand frequencyBands[BAND_COUNT];
    ToneGenerator toneGenerators[MAX_TONE_GENERATORS];
    uint8_t toneCount = 0;
    Vec3 spatialBias;
    float volumeCeilingDb = 0.0f;
};

struct VisualParameters {
    float visualSpeed = 0.0f;
    float colorContrast = 0.0f;
    float motionDamping = 1.0f;
    float frameRateCap = 30.0f;
    DichromaticCoefficients dichromatic;
};

// ============================================================================
// Full Snapshot
// ============================================================================

struct AdaptationParameters {
    // Video renderer
    float visualSpeed = 0.3f;
    float colorContrast = 0.5f;
    float motionDamping = 1.0f;
    float frameRateCap = 30.0f;
    DichromaticCoefficients dichromatic;

    // Audio renderer
    int16_t audioBPM = 55;
    FrequencyBand frequencyBands[BAND_COUNT];
    ToneGenerator toneGenerators[MAX_TONE_GENERATORS];
    uint8_t toneCount = 0;
    Vec3 spatialBias;
    float volumeCeilingDb = 0.0f;

    // Session context
    const char* contentCategory = "";   ///< Static string, never owned
    session::PhaseKind phase = session::PhaseKind::INITIAL;
    float phaseProgress = 0.0f;
    float intensity = 1.0f;             ///< Stress-scaled stimulation level, 0-1
    session::StressLevel stressLevel = session::StressLevel::MODERATE;

    bool operator==(const AdaptationParameters& o) const {
        if (visualSpeed != o.visualSpeed || colorContrast != o.colorContrast ||
            motionDamping != o.motionDamping || frameRateCap != o.frameRateCap ||
            !(dichromatic == o.dichromatic) || audioBPM != o.audioBPM ||
            toneCount != o.toneCount || spatialBias != o.spatialBias ||
            volumeCeilingDb != o.volumeCeilingDb || phase != o.phase ||
            phaseProgress != o.phaseProgress || intensity != o.intensity ||
            stressLevel != o.stressLevel) {
            return false;
        }
        if (strcmp(contentCategory, o.contentCategory) != 0) {
            return false;
        }
        for (uint8_t i = 0; i < BAND_COUNT; i++) {
            const FrequencyBand& a = frequencyBands[i];
            const FrequencyBand& b = o.frequencyBands[i];
            if (a.centerHz != b.centerHz || a.bandwidthHz != b.bandwidthHz ||
                a.gainDb != b.gainDb || a.stressWeight != b.stressWeight) {
                return false;
            }
        }
        for (uint8_t i = 0; i < toneCount && i < MAX_TONE_GENERATORS; i++) {
            if (toneGenerators[i].frequencyHz != o.toneGenerators[i].frequencyHz ||
                toneGenerators[i].amplitude != o.toneGenerators[i].amplitude) {
                return false;
            }
        }
        return true;
    }
    bool operator!=(const AdaptationParameters& o) const { return !(*this == o); }
};

} // namespace caninesense
