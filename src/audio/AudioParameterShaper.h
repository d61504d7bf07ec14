// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file AudioParameterShaper.h
 * @brief Phase + breed + age + stress -> audio parameter subset
 *
 * Pipeline:
 * 1. Base BPM and per-band gains from the phase table
 * 2. Age and stress BPM offsets; volume ceiling attenuated by the breed's
 *    volume sensitivity and by stress, hard-capped at MAX_VOLUME_DB
 * 3. Band gain = base * phase intensity + preference boost + stress boost
 * 4. Spatial bias from the breed's spatial preference
 * 5. Every band gain clamped to [MIN_BAND_GAIN_DB, MAX_BAND_GAIN_DB]
 *
 * Total over all enum inputs. Stateless; shape() is const.
 */

#pragma once

#include <cstdint>

#include "../config/EngineTuning.h"
#include "../core/AdaptationParameters.h"
#include "../core/Vec3.h"
#include "../profiles/AgeProfile.h"
#include "../profiles/BreedProfile.h"
#include "../session/PhaseController.h"
#include "../session/StressMetrics.h"

namespace caninesense {
namespace audio {

/// BPM offset per stress level (non-increasing)
static constexpr int8_t STRESS_BPM_OFFSET[3] = { 0, -2, -5 };

/// Volume ceiling scale per stress level (non-increasing)
static constexpr float STRESS_VOLUME_SCALE[3] = { 1.0f, 0.95f, 0.9f };

/// Fraction of the ceiling removed at volumeSensitivity == 1
static constexpr float SENSITIVITY_ATTENUATION = 0.3f;

class AudioParameterShaper {
public:
    explicit AudioParameterShaper(const config::EngineTuning& tuning = config::EngineTuning());

    /**
     * @brief Build the audio subset for one evaluation
     * @param phase Phase reading from the PhaseController
     * @param profile Resolved breed profile
     * @param age Subject age profile
     * @param stress Current behavior sample
     * @param lastKnownLocation Subject location for ADAPTIVE spatial preference (nullable)
     */
    AudioParameters shape(const session::PhaseReading& phase,
                          const profiles::BreedProfile& profile,
                          profiles::AgeProfile age,
                          const session::StressMetrics& stress,
                          const Vec3* lastKnownLocation = nullptr) const;

    // ==================== Pure Steps ====================

    static int16_t computeBpm(session::PhaseKind phase, profiles::AgeProfile age,
                              session::StressLevel stress);

    static float computeVolumeCeiling(session::PhaseKind phase,
                                      const profiles::BreedProfile& profile,
                                      session::StressLevel stress);

    static Vec3 spatialBiasFor(profiles::SpatialPreference pref, const Vec3* lastKnownLocation);

    void computeBands(const session::PhaseReading& phase,
                      const profiles::BreedProfile& profile,
                      session::StressLevel stress,
                      FrequencyBand (&bands)[BAND_COUNT]) const;

    static uint8_t computeTones(const session::PhaseReading& phase,
                                const profiles::BreedProfile& profile,
                                profiles::AgeProfile age,
                                session::StressLevel stress,
                                ToneGenerator (&tones)[MAX_TONE_GENERATORS]);

    const config::EngineTuning& tuning() const { return m_tuning; }

private:
    config::EngineTuning m_tuning;
};

} // namespace audio
} // namespace caninesense
