// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ColorTransformShaper.cpp
 * @brief Visual parameter shaping implementation
 */

#include "ColorTransformShaper.h"
#include "../core/SafetyLimits.h"

#define CS_LOG_TAG "ColorShaper"
#include "../utils/Log.h"

namespace caninesense {
namespace vision {

using core::clampf;
using profiles::AgeProfile;
using profiles::BreedProfile;
using profiles::ColorPreference;
using profiles::EnergyLevel;
using session::PhaseKind;
using session::StressLevel;

namespace {

uint8_t stressIndex(StressLevel stress) {
    uint8_t idx = static_cast<uint8_t>(stress);
    return idx > static_cast<uint8_t>(StressLevel::HIGH) ? static_cast<uint8_t>(StressLevel::HIGH) : idx;
}

const PhaseVisualBase& phaseBase(PhaseKind phase) {
    uint8_t idx = static_cast<uint8_t>(phase);
    if (idx >= session::PHASE_COUNT) {
        idx = static_cast<uint8_t>(PhaseKind::MAINTENANCE);
    }
    return PHASE_VISUAL_BASE[idx];
}

float energyScale(EnergyLevel level) {
    switch (level) {
        case EnergyLevel::HIGH: return 1.1f;
        case EnergyLevel::LOW:  return 0.9f;
        default:                return 1.0f;
    }
}

} // namespace

// ============================================================================
// Dichromatic Coefficients
// ============================================================================

DichromaticCoefficients ColorTransformShaper::coefficientsFor(const BreedProfile& profile) {
    DichromaticCoefficients c;

    switch (profile.colorPreference) {
        case ColorPreference::BLUE_DOMINANT:
            c.blueWeight = 0.80f;
            c.yellowWeight = 0.80f;
            break;
        case ColorPreference::YELLOW_DOMINANT:
            c.blueWeight = 0.70f;
            c.yellowWeight = 0.90f;
            break;
        case ColorPreference::HIGH_CONTRAST:
        case ColorPreference::BALANCED:
        default:
            c.blueWeight = 0.75f;
            c.yellowWeight = 0.85f;
            break;
    }

    // Long-wavelength channels contribute weakly
    c.redWeight = 0.30f;
    c.greenWeight = 0.50f;

    c.contrastExponent = 1.1f + 0.4f * clampf(profile.contrastPreference, 0.0f, 1.0f);
    if (profile.colorPreference == ColorPreference::HIGH_CONTRAST) {
        c.contrastExponent += 0.2f;
    }
    return core::clampDichromatic(c);
}

// ============================================================================
// Motion
// ============================================================================

float ColorTransformShaper::stressAdjustedFactor(const session::StressMetrics& stress) {
    return STRESS_MOTION_FACTOR[stressIndex(stress.stressLevel)] +
           0.25f * clampf(stress.movementRate, 0.0f, 1.0f);
}

float ColorTransformShaper::computeMotionDamping(const BreedProfile& profile,
                                                 const session::StressMetrics& stress) {
    float reduction = clampf(profile.motionSensitivity, 0.0f, 1.0f) * stressAdjustedFactor(stress);
    return 1.0f - clampf(reduction, 0.0f, MAX_MOTION_REDUCTION);
}

// ============================================================================
// Speed, Contrast, Frame Rate
// ============================================================================

float ColorTransformShaper::computeVisualSpeed(PhaseKind phase, const BreedProfile& profile,
                                               AgeProfile age, StressLevel stress) {
    float speed = phaseBase(phase).visualSpeed;
    speed *= profiles::ageTraits(age).visualSpeedMultiplier;
    speed *= energyScale(profile.energyLevel);
    speed *= STRESS_SPEED_SCALE[stressIndex(stress)];
    return clampf(speed, 0.0f, core::MAX_VISUAL_SPEED);
}

float ColorTransformShaper::computeContrast(PhaseKind phase, const BreedProfile& profile,
                                            StressLevel stress) {
    float contrast = phaseBase(phase).contrast;
    contrast *= 0.8f + 0.4f * clampf(profile.contrastPreference, 0.0f, 1.0f);
    contrast -= 0.1f * session::stressResponseWeight(stress);
    return clampf(contrast, 0.0f, 1.0f);
}

float ColorTransformShaper::computeFrameRateCap(PhaseKind phase, const BreedProfile& profile,
                                                AgeProfile age, StressLevel stress) {
    float fps = phaseBase(phase).frameCeiling;
    fps *= profiles::ageTraits(age).frameRateBias;
    fps *= STRESS_FRAME_SCALE[stressIndex(stress)];
    fps *= 1.0f - 0.4f * clampf(profile.motionSensitivity, 0.0f, 1.0f);
    return clampf(fps, core::MIN_FRAME_RATE, core::MAX_FRAME_RATE);
}

// ============================================================================
// Shape
// ============================================================================

VisualParameters ColorTransformShaper::shape(const session::PhaseReading& phase,
                                             const BreedProfile& profile,
                                             AgeProfile age,
                                             const session::StressMetrics& stress) const {
    VisualParameters out;
    const PhaseKind kind = phase.phase.kind();

    out.visualSpeed = computeVisualSpeed(kind, profile, age, stress.stressLevel);
    out.colorContrast = computeContrast(kind, profile, stress.stressLevel);
    out.motionDamping = computeMotionDamping(profile, stress);
    out.frameRateCap = computeFrameRateCap(kind, profile, age, stress.stressLevel);
    out.dichromatic = coefficientsFor(profile);

    CS_VISION_LOGD("%s/%s: speed=%.3f contrast=%.2f damping=%.2f fps=%.1f",
                   profile.name.c_str(), phase.phase.name(),
                   out.visualSpeed, out.colorContrast, out.motionDamping, out.frameRateCap);
    return out;
}

} // namespace vision
} // namespace caninesense
