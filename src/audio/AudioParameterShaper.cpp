// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file AudioParameterShaper.cpp
 * @brief Audio parameter shaping implementation
 */

#include "AudioParameterShaper.h"
#include "FrequencyBandTable.h"
#include "../core/ContentCategory.h"
#include "../core/SafetyLimits.h"

#include <cstring>

#define CS_LOG_TAG "AudioShaper"
#include "../utils/Log.h"

namespace caninesense {
namespace audio {

using core::clampf;
using profiles::AgeProfile;
using profiles::BreedProfile;
using profiles::SpatialPreference;
using session::PhaseKind;
using session::PhaseReading;
using session::StressLevel;

namespace {

// Content-category tones
constexpr float CALM_TONE_HZ = 220.0f;
constexpr float CALM_TONE_AMP = 0.5f;
constexpr float STIMULATION_TONE_HZ = 880.0f;
constexpr float STIMULATION_TONE_AMP = 0.3f;

// Age and breed tones
constexpr float AGE_TONE_AMP = 0.5f;
constexpr float PREFERRED_TONE_AMP = 0.4f;

uint8_t stressIndex(StressLevel stress) {
    uint8_t idx = static_cast<uint8_t>(stress);
    return idx > static_cast<uint8_t>(StressLevel::HIGH) ? static_cast<uint8_t>(StressLevel::HIGH) : idx;
}

uint8_t phaseIndex(PhaseKind phase) {
    uint8_t idx = static_cast<uint8_t>(phase);
    return idx >= session::PHASE_COUNT ? static_cast<uint8_t>(PhaseKind::MAINTENANCE) : idx;
}

} // namespace

AudioParameterShaper::AudioParameterShaper(const config::EngineTuning& tuning)
    : m_tuning(config::clampEngineTuning(tuning)) {
}

// ============================================================================
// Pure Steps
// ============================================================================

int16_t AudioParameterShaper::computeBpm(PhaseKind phase, AgeProfile age, StressLevel stress) {
    int bpm = PHASE_BASE_BPM[phaseIndex(phase)];
    bpm += profiles::ageTraits(age).bpmOffset;
    bpm += STRESS_BPM_OFFSET[stressIndex(stress)];
    return core::clampBpm(bpm);
}

float AudioParameterShaper::computeVolumeCeiling(PhaseKind phase, const BreedProfile& profile,
                                                 StressLevel stress) {
    float sensitivity = clampf(profile.volumeSensitivity, 0.0f, 1.0f);
    float ceiling = PHASE_BASE_VOLUME_DB[phaseIndex(phase)];
    ceiling *= (1.0f - SENSITIVITY_ATTENUATION * sensitivity);
    ceiling *= STRESS_VOLUME_SCALE[stressIndex(stress)];
    return clampf(ceiling, core::MIN_VOLUME_DB, core::MAX_VOLUME_DB);
}

Vec3 AudioParameterShaper::spatialBiasFor(SpatialPreference pref, const Vec3* lastKnownLocation) {
    Vec3 bias;
    switch (pref) {
        case SpatialPreference::SURROUND:
            break;
        case SpatialPreference::FRONT_FOCUSED:
            bias.z = -1.0f;
            break;
        case SpatialPreference::SIDE_FOCUSED:
            bias.x = 1.0f;
            break;
        case SpatialPreference::OVERHEAD:
            bias.y = 1.0f;
            break;
        case SpatialPreference::ADAPTIVE:
            if (lastKnownLocation != nullptr && core::isFiniteVec(*lastKnownLocation)) {
                bias = *lastKnownLocation;
            }
            break;
        default:
            break;
    }
    return core::clampSpatial(bias);
}

void AudioParameterShaper::computeBands(const PhaseReading& phase,
                                        const BreedProfile& profile,
                                        StressLevel stress,
                                        FrequencyBand (&bands)[BAND_COUNT]) const {
    const uint8_t p = phaseIndex(phase.phase.kind());
    const float intensity = clampf(phase.phaseIntensity, 0.0f, 1.0f);
    const float weight = session::stressResponseWeight(stress);

    for (uint8_t i = 0; i < BAND_COUNT; i++) {
        const BandSpec& entry = BAND_TABLE[i];
        FrequencyBand& band = bands[i];

        band.centerHz = entry.centerHz;
        band.bandwidthHz = entry.bandwidthHz;

        float gain = PHASE_BASE_GAIN_DB[p][i] * intensity;
        if (bandContainsAny(entry, profile.preferredFrequencies)) {
            gain += m_tuning.preferenceBoostDb * intensity;
        }

        band.stressWeight = bandContainsAny(entry, profile.stressResponseFrequencies) ? weight : 0.0f;
        gain += band.stressWeight * m_tuning.stressBoostDb;

        band.gainDb = clampf(gain, core::MIN_BAND_GAIN_DB, core::MAX_BAND_GAIN_DB);
        CS_AUDIO_LOGT("Band %u %.0fHz gain=%.2fdB w=%.2f", static_cast<unsigned>(i), band.centerHz, band.gainDb, band.stressWeight);
    }
}

uint8_t AudioParameterShaper::computeTones(const PhaseReading& phase,
                                           const BreedProfile& profile,
                                           AgeProfile age,
                                           StressLevel stress,
                                           ToneGenerator (&tones)[MAX_TONE_GENERATORS]) {
    const profiles::AgeTraits& traits = profiles::ageTraits(age);
    const float intensity = clampf(phase.phaseIntensity, 0.0f, 1.0f);
    const float attenuation = 1.0f - SENSITIVITY_ATTENUATION * clampf(profile.volumeSensitivity, 0.0f, 1.0f);
    const float scale = traits.audioEngagement * attenuation;

    uint8_t count = 0;

    // Programme tone follows the content category
    const char* category = core::contentCategoryFor(phase.phase.kind(), stress);
    const bool stimulating = (strcmp(category, core::CONTENT_MENTAL_STIMULATION) == 0);
    tones[count].frequencyHz = stimulating ? STIMULATION_TONE_HZ : CALM_TONE_HZ;
    tones[count].amplitude = (stimulating ? STIMULATION_TONE_AMP : CALM_TONE_AMP) * scale;
    count++;

    tones[count].frequencyHz = traits.toneHz;
    tones[count].amplitude = AGE_TONE_AMP * intensity * scale;
    count++;

    if (!profile.preferredFrequencies.empty()) {
        tones[count].frequencyHz = profile.preferredFrequencies.front();
        tones[count].amplitude = PREFERRED_TONE_AMP * intensity * scale;
        count++;
    }

    for (uint8_t i = 0; i < count; i++) {
        tones[i] = core::clampTone(tones[i]);
    }
    return count;
}

// ============================================================================
// Shape
// ============================================================================

AudioParameters AudioParameterShaper::shape(const PhaseReading& phase,
                                            const BreedProfile& profile,
                                            AgeProfile age,
                                            const session::StressMetrics& stress,
                                            const Vec3* lastKnownLocation) const {
    AudioParameters out;
    const PhaseKind kind = phase.phase.kind();

    out.audioBPM = computeBpm(kind, age, stress.stressLevel);
    out.volumeCeilingDb = computeVolumeCeiling(kind, profile, stress.stressLevel);
    computeBands(phase, profile, stress.stressLevel, out.frequencyBands);
    out.toneCount = computeTones(phase, profile, age, stress.stressLevel, out.toneGenerators);
    out.spatialBias = spatialBiasFor(profile.spatialPreference, lastKnownLocation);

    CS_AUDIO_LOGD("%s/%s/%s: bpm=%d ceiling=%.1fdB tones=%u",
                  profile.name.c_str(), phase.phase.name(),
                  session::stressLevelName(stress.stressLevel),
                  out.audioBPM, out.volumeCeilingDb, static_cast<unsigned>(out.toneCount));
    return out;
}

} // namespace audio
} // namespace caninesense
