// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file SnapshotCodec.cpp
 * @brief Snapshot codec implementation
 */

#include "SnapshotCodec.h"

#include <cstdio>

namespace caninesense {
namespace codec {

// ============================================================================
// Encoding
// ============================================================================

static void encodeVec3(const Vec3& v, JsonObject obj) {
    obj["x"] = v.x;
    obj["y"] = v.y;
    obj["z"] = v.z;
}

void SnapshotCodec::encodeSnapshot(const AdaptationParameters& params, JsonObject& data) {
    data["phase"] = session::phaseKindName(params.phase);
    data["phaseProgress"] = params.phaseProgress;
    data["intensity"] = params.intensity;
    data["stressLevel"] = session::stressLevelName(params.stressLevel);
    data["contentCategory"] = params.contentCategory;

    JsonObject audio = data["audio"].to<JsonObject>();
    audio["bpm"] = params.audioBPM;
    audio["volumeCeilingDb"] = params.volumeCeilingDb;
    encodeVec3(params.spatialBias, audio["spatialBias"].to<JsonObject>());

    JsonArray bands = audio["bands"].to<JsonArray>();
    for (uint8_t i = 0; i < BAND_COUNT; i++) {
        const FrequencyBand& band = params.frequencyBands[i];
        JsonObject b = bands.add<JsonObject>();
        b["centerHz"] = band.centerHz;
        b["bandwidthHz"] = band.bandwidthHz;
        b["gainDb"] = band.gainDb;
        b["stressWeight"] = band.stressWeight;
    }

    JsonArray tones = audio["tones"].to<JsonArray>();
    for (uint8_t i = 0; i < params.toneCount && i < MAX_TONE_GENERATORS; i++) {
        JsonObject t = tones.add<JsonObject>();
        t["frequencyHz"] = params.toneGenerators[i].frequencyHz;
        t["amplitude"] = params.toneGenerators[i].amplitude;
    }

    JsonObject visual = data["visual"].to<JsonObject>();
    visual["visualSpeed"] = params.visualSpeed;
    visual["colorContrast"] = params.colorContrast;
    visual["motionDamping"] = params.motionDamping;
    visual["frameRateCap"] = params.frameRateCap;

    JsonObject dichromatic = visual["dichromatic"].to<JsonObject>();
    dichromatic["blueWeight"] = params.dichromatic.blueWeight;
    dichromatic["yellowWeight"] = params.dichromatic.yellowWeight;
    dichromatic["redWeight"] = params.dichromatic.redWeight;
    dichromatic["greenWeight"] = params.dichromatic.greenWeight;
    dichromatic["contrastExponent"] = params.dichromatic.contrastExponent;
}

// ============================================================================
// Decoding
// ============================================================================

StressMetricsDecodeResult SnapshotCodec::decodeStressMetrics(JsonObjectConst root) {
    StressMetricsDecodeResult result;
    result.metrics = session::StressMetrics();

    if (!root["stressLevel"].is<const char*>()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Missing required field 'stressLevel'");
        return result;
    }
    const char* level = root["stressLevel"].as<const char*>();
    if (!session::parseStressLevel(level, result.metrics.stressLevel)) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Invalid stressLevel: %s", level);
        return result;
    }

    if (root.containsKey("movementRate")) {
        if (!root["movementRate"].is<float>()) {
            snprintf(result.errorMsg, MAX_ERROR_MSG, "Field 'movementRate' must be a number");
            return result;
        }
        float rate = root["movementRate"].as<float>();
        if (!(rate >= 0.0f && rate <= 1.0f)) {
            snprintf(result.errorMsg, MAX_ERROR_MSG, "movementRate out of range: %.3f (must be 0-1)", rate);
            return result;
        }
        result.metrics.movementRate = rate;
    }

    if (root.containsKey("heartRate")) {
        if (!root["heartRate"].is<float>()) {
            snprintf(result.errorMsg, MAX_ERROR_MSG, "Field 'heartRate' must be a number");
            return result;
        }
        float bpm = root["heartRate"].as<float>();
        if (!(bpm > 0.0f && bpm < 400.0f)) {
            snprintf(result.errorMsg, MAX_ERROR_MSG, "heartRate out of range: %.1f", bpm);
            return result;
        }
        result.metrics.hasHeartRate = true;
        result.metrics.heartRate = bpm;
    }

    if (root.containsKey("subjectLocation")) {
        if (!root["subjectLocation"].is<JsonObjectConst>()) {
            snprintf(result.errorMsg, MAX_ERROR_MSG, "Field 'subjectLocation' must be an object");
            return result;
        }
        JsonObjectConst loc = root["subjectLocation"].as<JsonObjectConst>();
        if (!loc["x"].is<float>() || !loc["y"].is<float>() || !loc["z"].is<float>()) {
            snprintf(result.errorMsg, MAX_ERROR_MSG, "subjectLocation requires numeric x, y, z");
            return result;
        }
        result.metrics.hasSubjectLocation = true;
        result.metrics.subjectLocation.x = loc["x"].as<float>();
        result.metrics.subjectLocation.y = loc["y"].as<float>();
        result.metrics.subjectLocation.z = loc["z"].as<float>();
    }

    result.success = true;
    return result;
}

SubjectDecodeResult SnapshotCodec::decodeSubject(JsonObjectConst root) {
    SubjectDecodeResult result;

    if (!root["breedName"].is<const char*>()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Missing required field 'breedName'");
        return result;
    }
    result.breedName = root["breedName"].as<const char*>();

    if (root.containsKey("age")) {
        const char* age = root["age"].is<const char*>() ? root["age"].as<const char*>() : nullptr;
        if (!profiles::parseAgeProfile(age, result.age)) {
            snprintf(result.errorMsg, MAX_ERROR_MSG, "Invalid age: %s", age != nullptr ? age : "(not a string)");
            return result;
        }
    }

    result.success = true;
    return result;
}

} // namespace codec
} // namespace caninesense
