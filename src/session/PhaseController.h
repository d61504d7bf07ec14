// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file PhaseController.h
 * @brief Session clock and relaxation phase state machine
 *
 * INITIAL -> DEEPENING -> MAINTENANCE, advanced by cumulative elapsed time
 * only. MAINTENANCE is terminal until reset().
 *
 * Stimulation intensity glides from one phase level toward the next with the
 * configured easing curve, then scales by the current stress level. A change
 * of stress level re-derives the intensity on the same tick without moving
 * the phase.
 *
 * tick() with deltaSeconds == 0 and an unchanged stress level is a no-op, so
 * repeated calls for the same cumulative time return the same phase.
 */

#pragma once

#include <cstdint>

#include "RelaxationPhase.h"
#include "StressMetrics.h"
#include "../transitions/Easing.h"

namespace caninesense {
namespace session {

/**
 * @brief Phase state handed to the shapers
 */
struct PhaseReading {
    RelaxationPhase phase;
    float progress = 0.0f;          ///< 0-1 through the current phase
    float phaseIntensity = 1.0f;    ///< Time-driven stimulation level, 0-1
};

class PhaseController {
public:
    /// Stimulation level at the start of each phase
    static constexpr float PHASE_LEVELS[PHASE_COUNT] = { 1.0f, 0.6f, 0.3f };

    /// Intensity scale per stress level (non-increasing)
    static constexpr float STRESS_INTENSITY_SCALE[3] = { 1.0f, 0.8f, 0.6f };

    explicit PhaseController(const PhaseDurations& durations = PhaseDurations(),
                             transitions::EasingCurve curve = transitions::EasingCurve::IN_OUT_QUAD);

    // ==================== Core Update ====================

    /**
     * @brief Advance the session clock and record the latest stress level
     * @param deltaSeconds Time since the previous tick (negative/NaN treated as 0)
     * @param stress Latest observed stress level
     * @return Phase current after the update
     */
    RelaxationPhase tick(float deltaSeconds, StressLevel stress);

    /**
     * @brief Return to the start of INITIAL with no recorded stress
     */
    void reset();

    // ==================== Query Methods ====================

    float elapsedSeconds() const { return m_elapsed; }
    const RelaxationPhase& phase() const { return m_phase; }
    float phaseProgress() const { return m_progress; }
    float phaseIntensity() const { return m_phaseIntensity; }

    /**
     * @brief Phase intensity scaled by the last stress level (0-1)
     */
    float intensity() const { return m_intensity; }

    /**
     * @brief True if the last tick saw a different stress level than the one before
     */
    bool stressChanged() const { return m_stressChanged; }

    /**
     * @brief True if the last tick entered a new phase (or started the session)
     */
    bool justEntered() const { return m_justEntered; }

    bool hasStress() const { return m_hasStress; }
    StressLevel lastStress() const { return m_lastStress; }
    uint32_t tickCount() const { return m_tickCount; }

    const PhaseDurations& durations() const { return m_durations; }

    PhaseReading reading() const;

private:
    void deriveIntensity();

    PhaseDurations m_durations;
    transitions::EasingCurve m_curve;

    float m_elapsed = 0.0f;
    RelaxationPhase m_phase;
    float m_progress = 0.0f;
    float m_phaseIntensity = 1.0f;
    float m_intensity = 1.0f;

    StressLevel m_lastStress = StressLevel::MODERATE;
    bool m_hasStress = false;
    bool m_stressChanged = false;
    bool m_justEntered = false;
    uint32_t m_tickCount = 0;
};

} // namespace session
} // namespace caninesense
