// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
#pragma once

#include <cstdint>
#include <cstring>

namespace caninesense::profiles {

enum class AgeProfile : uint8_t {
    PUPPY = 0,
    ADULT = 1,
    SENIOR = 2
};

/**
 * @brief Per-age multipliers applied by both shapers
 */
struct AgeTraits {
    float visualSpeedMultiplier;   ///< Scales phase visual speed
    float audioEngagement;         ///< Scales tone generator amplitude
    float frameRateBias;           ///< Scales the frame-rate cap
    int8_t bpmOffset;              ///< Added to the phase base BPM
    float toneHz;                  ///< Age-targeted synthesis tone
};

static constexpr AgeTraits AGE_TRAITS[] = {
    { 1.2f, 1.10f, 1.10f,  5, 600.0f },   // PUPPY
    { 1.0f, 1.00f, 1.00f,  0, 400.0f },   // ADULT
    { 0.8f, 0.85f, 0.85f, -5, 200.0f },   // SENIOR
};

inline const AgeTraits& ageTraits(AgeProfile age) {
    uint8_t idx = static_cast<uint8_t>(age);
    if (idx > static_cast<uint8_t>(AgeProfile::SENIOR)) {
        idx = static_cast<uint8_t>(AgeProfile::ADULT);
    }
    return AGE_TRAITS[idx];
}

inline const char* ageProfileName(AgeProfile age) {
    switch (age) {
        case AgeProfile::PUPPY:  return "puppy";
        case AgeProfile::ADULT:  return "adult";
        case AgeProfile::SENIOR: return "senior";
        default:                 return "invalid";
    }
}

inline bool parseAgeProfile(const char* str, AgeProfile& out) {
    if (str == nullptr) return false;
    if (strcmp(str, "puppy") == 0)  { out = AgeProfile::PUPPY;  return true; }
    if (strcmp(str, "adult") == 0)  { out = AgeProfile::ADULT;  return true; }
    if (strcmp(str, "senior") == 0) { out = AgeProfile::SENIOR; return true; }
    return false;
}

} // namespace caninesense::profiles
