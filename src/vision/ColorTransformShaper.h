// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ColorTransformShaper.h
 * @brief Phase + breed + age + stress -> visual parameter subset
 *
 * - Base contrast and visual speed per phase (INITIAL moderate, DEEPENING
 *   reduced, MAINTENANCE minimal)
 * - Dichromatic coefficients from the breed's color preference and contrast
 *   preference
 * - motionDamping = 1 - clamp(motionSensitivity * stressAdjustedFactor, 0, 0.9)
 * - frameRateCap in [MIN_FRAME_RATE, MAX_FRAME_RATE], lower for sensitive
 *   breeds, later phases, seniors and higher stress (advisory ceiling)
 */

#pragma once

#include <cstdint>

#include "../core/AdaptationParameters.h"
#include "../profiles/AgeProfile.h"
#include "../profiles/BreedProfile.h"
#include "../session/PhaseController.h"
#include "../session/StressMetrics.h"

namespace caninesense {
namespace vision {

struct PhaseVisualBase {
    float contrast;
    float visualSpeed;
    float frameCeiling;     ///< fps before sensitivity/age/stress scaling
};

static constexpr PhaseVisualBase PHASE_VISUAL_BASE[session::PHASE_COUNT] = {
    { 0.7f, 0.5f, 60.0f },  // INITIAL
    { 0.5f, 0.2f, 40.0f },  // DEEPENING
    { 0.3f, 0.1f, 24.0f },  // MAINTENANCE
};

/// Visual speed scale per stress level (non-increasing)
static constexpr float STRESS_SPEED_SCALE[3] = { 1.0f, 0.75f, 0.5f };

/// Frame-rate scale per stress level (non-increasing)
static constexpr float STRESS_FRAME_SCALE[3] = { 1.0f, 0.8f, 0.6f };

/// Base of stressAdjustedFactor per stress level; movement adds up to 0.25
static constexpr float STRESS_MOTION_FACTOR[3] = { 0.5f, 0.75f, 1.0f };

static constexpr float MAX_MOTION_REDUCTION = 0.9f;

class ColorTransformShaper {
public:
    VisualParameters shape(const session::PhaseReading& phase,
                           const profiles::BreedProfile& profile,
                           profiles::AgeProfile age,
                           const session::StressMetrics& stress) const;

    // ==================== Pure Steps ====================

    static DichromaticCoefficients coefficientsFor(const profiles::BreedProfile& profile);

    static float stressAdjustedFactor(const session::StressMetrics& stress);
    static float computeMotionDamping(const profiles::BreedProfile& profile,
                                      const session::StressMetrics& stress);

    static float computeVisualSpeed(session::PhaseKind phase,
                                    const profiles::BreedProfile& profile,
                                    profiles::AgeProfile age,
                                    session::StressLevel stress);

    static float computeContrast(session::PhaseKind phase,
                                 const profiles::BreedProfile& profile,
                                 session::StressLevel stress);

    static float computeFrameRateCap(session::PhaseKind phase,
                                     const profiles::BreedProfile& profile,
                                     profiles::AgeProfile age,
                                     session::StressLevel stress);
};

} // namespace vision
} // namespace caninesense
