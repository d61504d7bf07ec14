// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file EngineTuning.h
 * @brief Runtime-adjustable engine tuning with safe clamps
 *
 * Defaults reproduce the standard 300 s / 600 s / 3600 s relaxation programme.
 * Values loaded from JSON pass through clampEngineTuning() before use.
 */

#pragma once

#include "../core/SafetyLimits.h"
#include "../session/RelaxationPhase.h"
#include "../transitions/Easing.h"

namespace caninesense {
namespace config {

struct EngineTuning {
    // Phase timing
    session::PhaseDurations phaseDurations;
    transitions::EasingCurve phaseCurve = transitions::EasingCurve::IN_OUT_QUAD;

    // Audio shaping
    float stressBoostDb = 4.0f;         ///< Gain added to stress-response bands at full weight
    float preferenceBoostDb = 1.0f;     ///< Gain added to preferred-frequency bands at full intensity
};

static constexpr float MIN_PHASE_SECONDS = 1.0f;
static constexpr float MAX_PHASE_SECONDS = 86400.0f;

inline EngineTuning clampEngineTuning(const EngineTuning& in) {
    using core::clampf;
    EngineTuning out = in;

    out.phaseDurations.initialSec = clampf(out.phaseDurations.initialSec, MIN_PHASE_SECONDS, MAX_PHASE_SECONDS);
    out.phaseDurations.deepeningSec = clampf(out.phaseDurations.deepeningSec, MIN_PHASE_SECONDS, MAX_PHASE_SECONDS);
    out.phaseDurations.maintenanceSec = clampf(out.phaseDurations.maintenanceSec, MIN_PHASE_SECONDS, MAX_PHASE_SECONDS);

    if (static_cast<uint8_t>(out.phaseCurve) >= static_cast<uint8_t>(transitions::EasingCurve::CURVE_COUNT)) {
        out.phaseCurve = transitions::EasingCurve::IN_OUT_QUAD;
    }

    out.stressBoostDb = clampf(out.stressBoostDb, 0.0f, core::MAX_BAND_GAIN_DB);
    out.preferenceBoostDb = clampf(out.preferenceBoostDb, 0.0f, 3.0f);
    return out;
}

} // namespace config
} // namespace caninesense
