// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ProfileCodec.h
 * @brief JSON codec for breed profile tables and engine tuning
 *
 * Single canonical parser for profile configuration. Decoders validate types
 * and ranges and report the first problem in errorMsg; nothing throws.
 *
 * Profile table document:
 * @code
 * {
 *   "profiles": [
 *     {
 *       "name": "labrador",
 *       "category": "sporting",            // optional, default "companion"
 *       "energyLevel": "high",             // optional, default "medium"
 *       "preferredFrequencies": [250, 500, 8000],
 *       "volumeSensitivity": 0.7,
 *       "spatialPreference": "surround",
 *       "stressResponseFrequencies": [220, 440],   // optional
 *       "colorPreference": "blueDominant",
 *       "motionSensitivity": 0.7,
 *       "contrastPreference": 0.8
 *     }
 *   ]
 * }
 * @endcode
 */

#pragma once

#include <ArduinoJson.h>
#include <cstddef>
#include <cstring>

#include "../config/EngineTuning.h"
#include "../profiles/BreedProfile.h"
#include "../profiles/ProfileRegistry.h"

namespace caninesense {
namespace codec {

/**
 * @brief Maximum length for error messages
 */
static constexpr size_t MAX_ERROR_MSG = 128;

// ============================================================================
// Decode Results
// ============================================================================

struct BreedProfileDecodeResult {
    bool success;
    profiles::BreedProfile profile;
    char errorMsg[MAX_ERROR_MSG];

    BreedProfileDecodeResult() : success(false) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

struct ProfileTableDecodeResult {
    bool success;
    profiles::RegistryResult registryResult;
    size_t profileCount;
    char errorMsg[MAX_ERROR_MSG];

    ProfileTableDecodeResult()
        : success(false), registryResult(profiles::RegistryResult::OK), profileCount(0) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

struct EngineTuningDecodeResult {
    bool success;
    config::EngineTuning tuning;
    char errorMsg[MAX_ERROR_MSG];

    EngineTuningDecodeResult() : success(false) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

// ============================================================================
// Codec
// ============================================================================

class ProfileCodec {
public:
    /**
     * @brief Decode one profile object
     */
    static BreedProfileDecodeResult decodeBreedProfile(JsonObjectConst obj);

    /**
     * @brief Decode {"profiles": [...]} and build a registry from it
     * @param root Document root
     * @param out Receives the registry only when every entry is valid
     */
    static ProfileTableDecodeResult decodeProfileTable(JsonObjectConst root, profiles::ProfileRegistry& out);

    /**
     * @brief Parse JSON text and decode it as a profile table
     */
    static ProfileTableDecodeResult decodeProfileTableJson(const char* json, profiles::ProfileRegistry& out);

    /**
     * @brief Decode engine tuning; every key optional, values clamped
     *
     * Keys: phaseDurations{initial,deepening,maintenance}, phaseCurve,
     * stressBoostDb, preferenceBoostDb.
     */
    static EngineTuningDecodeResult decodeEngineTuning(JsonObjectConst root);

    static void encodeBreedProfile(const profiles::BreedProfile& profile, JsonObject& data);
    static void encodeEngineTuning(const config::EngineTuning& tuning, JsonObject& data);
};

} // namespace codec
} // namespace caninesense
