// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file AdaptationOrchestrator.cpp
 * @brief Session evaluation pipeline
 */

#include "AdaptationOrchestrator.h"
#include "ContentCategory.h"
#include "SafetyLimits.h"
#include "../audio/FrequencyBandTable.h"

#define CS_LOG_TAG "Orchestrator"
#include "../utils/Log.h"

namespace caninesense {
namespace core {

AdaptationOrchestrator::AdaptationOrchestrator(const profiles::ProfileRegistry& registry,
                                               const config::EngineTuning& tuning)
    : m_registry(&registry)
    , m_tuning(config::clampEngineTuning(tuning))
    , m_phase(m_tuning.phaseDurations, m_tuning.phaseCurve)
    , m_audio(m_tuning)
    , m_visual()
    , m_current(initialSnapshot()) {
    reset();
}

AdaptationParameters AdaptationOrchestrator::initialSnapshot() {
    AdaptationParameters p;
    for (uint8_t i = 0; i < BAND_COUNT; i++) {
        p.frequencyBands[i].centerHz = audio::BAND_TABLE[i].centerHz;
        p.frequencyBands[i].bandwidthHz = audio::BAND_TABLE[i].bandwidthHz;
    }
    p.volumeCeilingDb = MIN_VOLUME_DB;
    p.contentCategory = CONTENT_CALM_RELAX;
    return clampAdaptationParameters(p);
}

void AdaptationOrchestrator::reset() {
    m_phase.reset();
    m_state = SessionState();
    m_state.currentPhase = m_phase.phase();
    m_current = initialSnapshot();
    CS_SESSION_LOGI("Session reset");
}

AdaptationParameters AdaptationOrchestrator::merge(const AudioParameters& audio,
                                                   const VisualParameters& visual) {
    AdaptationParameters p;

    p.visualSpeed = visual.visualSpeed;
    p.colorContrast = visual.colorContrast;
    p.motionDamping = visual.motionDamping;
    p.frameRateCap = visual.frameRateCap;
    p.dichromatic = visual.dichromatic;

    p.audioBPM = audio.audioBPM;
    for (uint8_t i = 0; i < BAND_COUNT; i++) {
        p.frequencyBands[i] = audio.frequencyBands[i];
    }
    p.toneCount = audio.toneCount;
    for (uint8_t i = 0; i < MAX_TONE_GENERATORS; i++) {
        p.toneGenerators[i] = audio.toneGenerators[i];
    }
    p.spatialBias = audio.spatialBias;
    p.volumeCeilingDb = audio.volumeCeilingDb;
    return p;
}

AdaptationParameters AdaptationOrchestrator::evaluate(const std::string& profileName,
                                                      profiles::AgeProfile age,
                                                      const session::StressMetrics& stress,
                                                      float deltaSeconds) {
    // 1. Resolve profile
    const profiles::BreedProfile& profile = m_registry->lookup(profileName);

    // 2. Advance phase
    m_phase.tick(deltaSeconds, stress.stressLevel);
    const session::PhaseReading reading = m_phase.reading();

    if (stress.hasSubjectLocation) {
        m_state.hasSubjectLocation = true;
        m_state.lastSubjectLocation = stress.subjectLocation;
    }
    const Vec3* location = m_state.hasSubjectLocation ? &m_state.lastSubjectLocation : nullptr;

    // 3. Shape
    const AudioParameters audioSubset = m_audio.shape(reading, profile, age, stress, location);
    const VisualParameters visualSubset = m_visual.shape(reading, profile, age, stress);

    // 4. Merge
    AdaptationParameters merged = merge(audioSubset, visualSubset);
    merged.contentCategory = contentCategoryFor(reading.phase.kind(), stress.stressLevel);
    merged.phase = reading.phase.kind();
    merged.phaseProgress = reading.progress;
    merged.intensity = m_phase.intensity();
    merged.stressLevel = stress.stressLevel;

    // 5. Final clamp
    RangeCheckResult check = validateAdaptationParameters(merged);
    if (!check.ok) {
        CS_SESSION_LOGW("Clamped out-of-range %s=%.3f (%s)", check.field, check.value, profile.name.c_str());
    }
    AdaptationParameters snapshot = clampAdaptationParameters(merged);

    // 6. Record
    m_state.elapsedSeconds = m_phase.elapsedSeconds();
    m_state.currentPhase = m_phase.phase();
    m_state.lastStressLevel = m_phase.lastStress();
    m_state.evaluationCount++;
    m_state.history.push(snapshot);
    m_current = snapshot;

    CS_SESSION_LOGD("#%lu %s %s %.1fs bpm=%d speed=%.3f fps=%.1f vol=%.1fdB",
                    static_cast<unsigned long>(m_state.evaluationCount),
                    profile.name.c_str(), reading.phase.name(), m_state.elapsedSeconds,
                    snapshot.audioBPM, snapshot.visualSpeed, snapshot.frameRateCap,
                    snapshot.volumeCeilingDb);
    return snapshot;
}

} // namespace core
} // namespace caninesense
