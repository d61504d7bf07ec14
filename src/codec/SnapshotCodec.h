// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file SnapshotCodec.h
 * @brief JSON encoding of snapshots and decoding of behavior samples
 *
 * Renderers running out of process receive snapshots as JSON; behavior
 * sensing collaborators post StressMetrics the same way:
 * @code
 * { "stressLevel": "high", "movementRate": 0.8,
 *   "heartRate": 110, "subjectLocation": { "x": 0.5, "y": 0, "z": -1 } }
 * @endcode
 * Only stressLevel is required. movementRate defaults to 0.5.
 *
 * Subject identity arrives as { "breedName": "Border Collie", "age": "senior" }.
 */

#pragma once

#include <ArduinoJson.h>
#include <cstring>
#include <string>

#include "ProfileCodec.h"
#include "../core/AdaptationParameters.h"
#include "../profiles/AgeProfile.h"
#include "../session/StressMetrics.h"

namespace caninesense {
namespace codec {

struct StressMetricsDecodeResult {
    bool success;
    session::StressMetrics metrics;
    char errorMsg[MAX_ERROR_MSG];

    StressMetricsDecodeResult() : success(false) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

struct SubjectDecodeResult {
    bool success;
    std::string breedName;
    profiles::AgeProfile age;
    char errorMsg[MAX_ERROR_MSG];

    SubjectDecodeResult() : success(false), age(profiles::AgeProfile::ADULT) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

class SnapshotCodec {
public:
    /**
     * @brief Write every snapshot field into data
     */
    static void encodeSnapshot(const AdaptationParameters& params, JsonObject& data);

    static StressMetricsDecodeResult decodeStressMetrics(JsonObjectConst root);

    /**
     * @brief Decode breed name and age group
     *
     * breedName is kept as given; the registry normalizes it on lookup.
     * age is optional and defaults to adult.
     */
    static SubjectDecodeResult decodeSubject(JsonObjectConst root);
};

} // namespace codec
} // namespace caninesense
