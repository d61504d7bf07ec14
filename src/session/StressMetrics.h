// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file StressMetrics.h
 * @brief Behavior feedback sample consumed once per evaluation
 *
 * Produced by an external behavior-sensing collaborator at the evaluation
 * cadence. The engine reads a sample during one evaluate() call and keeps
 * nothing from it except the stress level and the last known location.
 */

#pragma once

#include <cstdint>
#include <cstring>

#include "../core/Vec3.h"

namespace caninesense::session {

/**
 * @brief Observed stress, ordered LOW < MODERATE < HIGH
 */
enum class StressLevel : uint8_t {
    LOW = 0,
    MODERATE = 1,
    HIGH = 2
};

struct StressMetrics {
    StressLevel stressLevel = StressLevel::MODERATE;
    float movementRate = 0.5f;          ///< [0, 1]

    bool hasHeartRate = false;
    float heartRate = 0.0f;             ///< BPM, valid when hasHeartRate

    bool hasSubjectLocation = false;
    Vec3 subjectLocation;               ///< Valid when hasSubjectLocation
};

inline const char* stressLevelName(StressLevel level) {
    switch (level) {
        case StressLevel::LOW:      return "low";
        case StressLevel::MODERATE: return "moderate";
        case StressLevel::HIGH:     return "high";
        default:                    return "invalid";
    }
}

inline bool parseStressLevel(const char* str, StressLevel& out) {
    if (str == nullptr) return false;
    if (strcmp(str, "low") == 0)      { out = StressLevel::LOW;      return true; }
    if (strcmp(str, "moderate") == 0) { out = StressLevel::MODERATE; return true; }
    if (strcmp(str, "high") == 0)     { out = StressLevel::HIGH;     return true; }
    return false;
}

/**
 * @brief Weight (0, 0.5, 1) applied to stress-response bands
 *
 * Non-decreasing in stress level.
 */
inline float stressResponseWeight(StressLevel level) {
    switch (level) {
        case StressLevel::LOW:      return 0.0f;
        case StressLevel::MODERATE: return 0.5f;
        case StressLevel::HIGH:     return 1.0f;
        default:                    return 1.0f;
    }
}

} // namespace caninesense::session
