// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file PhaseController.cpp
 * @brief Relaxation phase state machine implementation
 */

#include "PhaseController.h"

#include <cmath>

#define CS_LOG_TAG "Phase"
#include "../utils/Log.h"

namespace caninesense {
namespace session {

PhaseController::PhaseController(const PhaseDurations& durations, transitions::EasingCurve curve)
    : m_durations(durations)
    , m_curve(curve)
    , m_phase(RelaxationPhase::of(PhaseKind::INITIAL, durations)) {
    reset();
}

void PhaseController::reset() {
    m_elapsed = 0.0f;
    m_phase = RelaxationPhase::of(PhaseKind::INITIAL, m_durations);
    m_progress = 0.0f;
    m_lastStress = StressLevel::MODERATE;
    m_hasStress = false;
    m_stressChanged = false;
    m_justEntered = false;
    m_tickCount = 0;
    deriveIntensity();
}

RelaxationPhase PhaseController::tick(float deltaSeconds, StressLevel stress) {
    if (!std::isfinite(deltaSeconds) || deltaSeconds < 0.0f) {
        deltaSeconds = 0.0f;
    }

    const bool firstTick = (m_tickCount == 0);
    m_tickCount++;

    // Stress edge: compare against the previously recorded level
    m_stressChanged = m_hasStress && (stress != m_lastStress);
    if (m_stressChanged) {
        CS_SESSION_LOGI("Stress %s -> %s at %.1fs",
                        stressLevelName(m_lastStress), stressLevelName(stress), m_elapsed);
    }
    m_lastStress = stress;
    m_hasStress = true;

    // Time drives the phase bucket
    PhaseKind previous = m_phase.kind();
    m_elapsed += deltaSeconds;
    PhaseKind current = phaseKindForElapsed(m_elapsed, m_durations);
    m_phase = RelaxationPhase::of(current, m_durations);
    m_progress = phaseProgressForElapsed(m_elapsed, m_durations);

    m_justEntered = firstTick || (current != previous);
    if (m_justEntered && !firstTick) {
        CS_SESSION_LOGI("Phase %s -> %s at %.1fs",
                        phaseKindName(previous), phaseKindName(current), m_elapsed);
    }

    // Intensity follows time and is re-derived out of band on a stress change
    if (firstTick || deltaSeconds > 0.0f || m_stressChanged) {
        deriveIntensity();
    }

    return m_phase;
}

void PhaseController::deriveIntensity() {
    const PhaseKind kind = m_phase.kind();
    const uint8_t idx = static_cast<uint8_t>(kind);
    const uint8_t nextIdx = static_cast<uint8_t>(nextPhaseKind(kind));

    m_phaseIntensity = transitions::lerpEased(PHASE_LEVELS[idx], PHASE_LEVELS[nextIdx],
                                              m_progress, m_curve);

    uint8_t stressIdx = static_cast<uint8_t>(m_lastStress);
    if (stressIdx > static_cast<uint8_t>(StressLevel::HIGH)) {
        stressIdx = static_cast<uint8_t>(StressLevel::HIGH);
    }
    m_intensity = m_phaseIntensity * STRESS_INTENSITY_SCALE[stressIdx];

    CS_SESSION_LOGT("Intensity phase=%.3f stress=%.3f", m_phaseIntensity, m_intensity);
}

PhaseReading PhaseController::reading() const {
    PhaseReading r;
    r.phase = m_phase;
    r.progress = m_progress;
    r.phaseIntensity = m_phaseIntensity;
    return r;
}

} // namespace session
} // namespace caninesense
