// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file AdaptationOrchestrator.h
 * @brief Single entry point that turns subject + feedback into a snapshot
 *
 * evaluate():
 *   1. Resolve the breed profile (unknown names fall back to the default)
 *   2. Advance the PhaseController with deltaSeconds and the stress level
 *   3. Run the audio and color shapers
 *   4. Merge both subsets into one AdaptationParameters value
 *   5. Clamp every numeric field against SafetyLimits
 *   6. Append to the bounded history and return the snapshot by value
 *
 * One orchestrator owns one session. evaluate() and reset() must be called
 * serially; independent subjects use independent orchestrators sharing one
 * const ProfileRegistry. The orchestrator performs no I/O, no scheduling and
 * no blocking, and is a copyable value: a copy evolves independently.
 */

#pragma once

#include <cstdint>
#include <string>

#include "AdaptationParameters.h"
#include "SessionState.h"
#include "../audio/AudioParameterShaper.h"
#include "../config/EngineTuning.h"
#include "../profiles/AgeProfile.h"
#include "../profiles/ProfileRegistry.h"
#include "../session/PhaseController.h"
#include "../session/StressMetrics.h"
#include "../vision/ColorTransformShaper.h"

namespace caninesense {
namespace core {

class AdaptationOrchestrator {
public:
    /**
     * @param registry Profile table; must outlive the orchestrator
     * @param tuning Engine tuning (clamped on construction)
     */
    explicit AdaptationOrchestrator(const profiles::ProfileRegistry& registry,
                                    const config::EngineTuning& tuning = config::EngineTuning());

    /**
     * @brief Produce the snapshot for one evaluation tick
     * @param profileName Breed name (any case, whitespace ignored)
     * @param age Subject age profile
     * @param stress Behavior sample for this tick
     * @param deltaSeconds Time since the previous evaluation
     */
    AdaptationParameters evaluate(const std::string& profileName,
                                  profiles::AgeProfile age,
                                  const session::StressMetrics& stress,
                                  float deltaSeconds);

    /**
     * @brief Start a new session: clock, phase, stress and history cleared
     */
    void reset();

    // ==================== Accessors ====================

    /**
     * @brief Latest snapshot (safe defaults before the first evaluation)
     */
    const AdaptationParameters& current() const { return m_current; }

    const SessionState& session() const { return m_state; }
    const session::PhaseController& phaseController() const { return m_phase; }
    const profiles::ProfileRegistry& registry() const { return *m_registry; }
    const config::EngineTuning& tuning() const { return m_tuning; }

    /**
     * @brief Combine the shaper subsets into one snapshot (unclamped)
     */
    static AdaptationParameters merge(const AudioParameters& audio,
                                      const VisualParameters& visual);

private:
    static AdaptationParameters initialSnapshot();

    const profiles::ProfileRegistry* m_registry;
    config::EngineTuning m_tuning;
    session::PhaseController m_phase;
    audio::AudioParameterShaper m_audio;
    vision::ColorTransformShaper m_visual;

    SessionState m_state;
    AdaptationParameters m_current;
};

} // namespace core
} // namespace caninesense
