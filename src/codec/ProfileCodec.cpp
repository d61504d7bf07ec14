// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ProfileCodec.cpp
 * @brief Profile table and engine tuning codec implementation
 */

#include "ProfileCodec.h"

#include <cstdio>
#include <cstring>

#define CS_LOG_TAG "ProfileCodec"
#include "../utils/Log.h"

namespace caninesense {
namespace codec {

using profiles::BreedProfile;
using profiles::ProfileRegistry;
using profiles::RegistryResult;

// ============================================================================
// Allowed Keys
// ============================================================================

static constexpr const char* ALLOWED_PROFILE_KEYS[] = {
    "name",
    "category",
    "energyLevel",
    "preferredFrequencies",
    "volumeSensitivity",
    "spatialPreference",
    "stressResponseFrequencies",
    "colorPreference",
    "motionSensitivity",
    "contrastPreference"
};
static constexpr size_t ALLOWED_PROFILE_KEYS_COUNT = sizeof(ALLOWED_PROFILE_KEYS) / sizeof(ALLOWED_PROFILE_KEYS[0]);

static constexpr size_t MAX_FREQUENCIES = 16;

static bool isAllowedKey(const char* key, const char* const* allowedKeys, size_t count) {
    for (size_t i = 0; i < count; i++) {
        if (strcmp(key, allowedKeys[i]) == 0) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Field Helpers
// ============================================================================

static bool decodeFrequencyList(JsonObjectConst obj, const char* key, bool required,
                                std::vector<float>& out, char* errorMsg) {
    if (!obj.containsKey(key)) {
        if (required) {
            snprintf(errorMsg, MAX_ERROR_MSG, "Missing required field '%s'", key);
            return false;
        }
        out.clear();
        return true;
    }
    if (!obj[key].is<JsonArrayConst>()) {
        snprintf(errorMsg, MAX_ERROR_MSG, "Field '%s' must be an array", key);
        return false;
    }
    JsonArrayConst arr = obj[key].as<JsonArrayConst>();
    if (arr.size() > MAX_FREQUENCIES) {
        snprintf(errorMsg, MAX_ERROR_MSG, "Too many entries in '%s' (max %u)", key,
                 static_cast<unsigned>(MAX_FREQUENCIES));
        return false;
    }

    out.clear();
    size_t index = 0;
    for (JsonVariantConst v : arr) {
        if (!v.is<float>()) {
            snprintf(errorMsg, MAX_ERROR_MSG, "Field '%s[%u]' must be a number", key,
                     static_cast<unsigned>(index));
            return false;
        }
        out.push_back(v.as<float>());
        index++;
    }
    return true;
}

static bool decodeUnitFloat(JsonObjectConst obj, const char* key, float& out, char* errorMsg) {
    if (!obj.containsKey(key)) {
        snprintf(errorMsg, MAX_ERROR_MSG, "Missing required field '%s'", key);
        return false;
    }
    if (!obj[key].is<float>()) {
        snprintf(errorMsg, MAX_ERROR_MSG, "Field '%s' must be a number", key);
        return false;
    }
    out = obj[key].as<float>();
    return true;
}

// ============================================================================
// Breed Profile
// ============================================================================

BreedProfileDecodeResult ProfileCodec::decodeBreedProfile(JsonObjectConst obj) {
    BreedProfileDecodeResult result;
    result.profile = BreedProfile();

    if (obj.isNull()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Profile must be an object");
        return result;
    }

    for (JsonPairConst kv : obj) {
        if (!isAllowedKey(kv.key().c_str(), ALLOWED_PROFILE_KEYS, ALLOWED_PROFILE_KEYS_COUNT)) {
            snprintf(result.errorMsg, MAX_ERROR_MSG, "Unknown key '%s' in profile", kv.key().c_str());
            return result;
        }
    }

    // name (required string)
    if (!obj["name"].is<const char*>()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Missing required field 'name'");
        return result;
    }
    result.profile.name = profiles::normalizeBreedName(obj["name"].as<const char*>());
    if (result.profile.name.empty()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Profile name must not be empty");
        return result;
    }

    // category / energyLevel (optional)
    if (obj.containsKey("category")) {
        const char* category = obj["category"].as<const char*>();
        if (!profiles::parseBreedCategory(category, result.profile.category)) {
            snprintf(result.errorMsg, MAX_ERROR_MSG, "Invalid category: %s", category ? category : "(null)");
            return result;
        }
    }
    if (obj.containsKey("energyLevel")) {
        const char* energy = obj["energyLevel"].as<const char*>();
        if (!profiles::parseEnergyLevel(energy, result.profile.energyLevel)) {
            snprintf(result.errorMsg, MAX_ERROR_MSG, "Invalid energyLevel: %s", energy ? energy : "(null)");
            return result;
        }
    }

    if (!decodeFrequencyList(obj, "preferredFrequencies", true, result.profile.preferredFrequencies, result.errorMsg)) {
        return result;
    }
    if (!decodeFrequencyList(obj, "stressResponseFrequencies", false, result.profile.stressResponseFrequencies, result.errorMsg)) {
        return result;
    }

    if (!decodeUnitFloat(obj, "volumeSensitivity", result.profile.volumeSensitivity, result.errorMsg) ||
        !decodeUnitFloat(obj, "motionSensitivity", result.profile.motionSensitivity, result.errorMsg) ||
        !decodeUnitFloat(obj, "contrastPreference", result.profile.contrastPreference, result.errorMsg)) {
        return result;
    }

    // spatialPreference / colorPreference (required strings)
    if (!obj["spatialPreference"].is<const char*>()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Missing required field 'spatialPreference'");
        return result;
    }
    const char* spatial = obj["spatialPreference"].as<const char*>();
    if (!profiles::parseSpatialPreference(spatial, result.profile.spatialPreference)) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Invalid spatialPreference: %s", spatial);
        return result;
    }

    if (!obj["colorPreference"].is<const char*>()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Missing required field 'colorPreference'");
        return result;
    }
    const char* color = obj["colorPreference"].as<const char*>();
    if (!profiles::parseColorPreference(color, result.profile.colorPreference)) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Invalid colorPreference: %s", color);
        return result;
    }

    // Range checks are owned by the registry
    if (!profiles::validateBreedProfile(result.profile, result.errorMsg, MAX_ERROR_MSG)) {
        return result;
    }

    result.success = true;
    return result;
}

// ============================================================================
// Profile Table
// ============================================================================

ProfileTableDecodeResult ProfileCodec::decodeProfileTable(JsonObjectConst root, ProfileRegistry& out) {
    ProfileTableDecodeResult result;

    if (!root["profiles"].is<JsonArrayConst>()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Missing required field 'profiles'");
        return result;
    }
    JsonArrayConst entries = root["profiles"].as<JsonArrayConst>();
    if (entries.size() > ProfileRegistry::MAX_PROFILES) {
        result.registryResult = RegistryResult::CAPACITY_EXCEEDED;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Too many profiles (max %u)",
                 static_cast<unsigned>(ProfileRegistry::MAX_PROFILES));
        return result;
    }

    ProfileRegistry::Builder builder;
    size_t index = 0;
    for (JsonVariantConst entry : entries) {
        if (!entry.is<JsonObjectConst>()) {
            result.registryResult = RegistryResult::INVALID_PROFILE;
            snprintf(result.errorMsg, MAX_ERROR_MSG, "profiles[%u] must be an object", static_cast<unsigned>(index));
            return result;
        }

        BreedProfileDecodeResult decoded = decodeBreedProfile(entry.as<JsonObjectConst>());
        if (!decoded.success) {
            result.registryResult = RegistryResult::INVALID_PROFILE;
            snprintf(result.errorMsg, MAX_ERROR_MSG, "profiles[%u]: %s", static_cast<unsigned>(index), decoded.errorMsg);
            return result;
        }

        RegistryResult reg = builder.registerProfile(decoded.profile);
        if (reg != RegistryResult::OK) {
            result.registryResult = reg;
            snprintf(result.errorMsg, MAX_ERROR_MSG, "profiles[%u]: %s", static_cast<unsigned>(index), builder.errorMsg());
            return result;
        }
        index++;
    }

    result.registryResult = builder.build(out);
    if (result.registryResult != RegistryResult::OK) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "%s", builder.errorMsg());
        return result;
    }

    result.profileCount = out.size();
    result.success = true;
    CS_PROFILE_LOGI("Loaded %u breed profiles", static_cast<unsigned>(result.profileCount));
    return result;
}

ProfileTableDecodeResult ProfileCodec::decodeProfileTableJson(const char* json, ProfileRegistry& out) {
    if (json == nullptr) {
        ProfileTableDecodeResult result;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "No JSON input");
        return result;
    }

    JsonDocument doc;
    DeserializationError error = deserializeJson(doc, json);
    if (error) {
        ProfileTableDecodeResult result;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "JSON parse error: %s", error.c_str());
        CS_PROFILE_LOGW("%s", result.errorMsg);
        return result;
    }

    ProfileTableDecodeResult result = decodeProfileTable(doc.as<JsonObjectConst>(), out);
    if (!result.success) {
        CS_PROFILE_LOGW("Profile table rejected: %s", result.errorMsg);
    }
    return result;
}

// ============================================================================
// Engine Tuning
// ============================================================================

EngineTuningDecodeResult ProfileCodec::decodeEngineTuning(JsonObjectConst root) {
    EngineTuningDecodeResult result;
    config::EngineTuning tuning;

    if (root.containsKey("phaseDurations")) {
        if (!root["phaseDurations"].is<JsonObjectConst>()) {
            snprintf(result.errorMsg, MAX_ERROR_MSG, "Field 'phaseDurations' must be an object");
            return result;
        }
        JsonObjectConst durations = root["phaseDurations"].as<JsonObjectConst>();

        static constexpr const char* PHASE_KEYS[] = { "initial", "deepening", "maintenance" };
        float* targets[] = {
            &tuning.phaseDurations.initialSec,
            &tuning.phaseDurations.deepeningSec,
            &tuning.phaseDurations.maintenanceSec
        };
        for (size_t i = 0; i < 3; i++) {
            if (!durations.containsKey(PHASE_KEYS[i])) {
                continue;
            }
            if (!durations[PHASE_KEYS[i]].is<float>()) {
                snprintf(result.errorMsg, MAX_ERROR_MSG, "Field 'phaseDurations.%s' must be a number", PHASE_KEYS[i]);
                return result;
            }
            *targets[i] = durations[PHASE_KEYS[i]].as<float>();
        }
    }

    if (root.containsKey("phaseCurve")) {
        const char* curve = root["phaseCurve"].as<const char*>();
        if (!transitions::parseEasingCurve(curve, tuning.phaseCurve)) {
            snprintf(result.errorMsg, MAX_ERROR_MSG, "Invalid phaseCurve: %s", curve ? curve : "(null)");
            return result;
        }
    }

    if (root.containsKey("stressBoostDb")) {
        if (!root["stressBoostDb"].is<float>()) {
            snprintf(result.errorMsg, MAX_ERROR_MSG, "Field 'stressBoostDb' must be a number");
            return result;
        }
        tuning.stressBoostDb = root["stressBoostDb"].as<float>();
    }

    if (root.containsKey("preferenceBoostDb")) {
        if (!root["preferenceBoostDb"].is<float>()) {
            snprintf(result.errorMsg, MAX_ERROR_MSG, "Field 'preferenceBoostDb' must be a number");
            return result;
        }
        tuning.preferenceBoostDb = root["preferenceBoostDb"].as<float>();
    }

    result.tuning = config::clampEngineTuning(tuning);
    result.success = true;
    return result;
}

// ============================================================================
// Encoders
// ============================================================================

void ProfileCodec::encodeBreedProfile(const BreedProfile& profile, JsonObject& data) {
    data["name"] = profile.name;
    data["category"] = profiles::breedCategoryName(profile.category);
    data["energyLevel"] = profiles::energyLevelName(profile.energyLevel);

    JsonArray preferred = data["preferredFrequencies"].to<JsonArray>();
    for (float hz : profile.preferredFrequencies) {
        preferred.add(hz);
    }

    data["volumeSensitivity"] = profile.volumeSensitivity;
    data["spatialPreference"] = profiles::spatialPreferenceName(profile.spatialPreference);

    JsonArray stress = data["stressResponseFrequencies"].to<JsonArray>();
    for (float hz : profile.stressResponseFrequencies) {
        stress.add(hz);
    }

    data["colorPreference"] = profiles::colorPreferenceName(profile.colorPreference);
    data["motionSensitivity"] = profile.motionSensitivity;
    data["contrastPreference"] = profile.contrastPreference;
}

void ProfileCodec::encodeEngineTuning(const config::EngineTuning& tuning, JsonObject& data) {
    JsonObject durations = data["phaseDurations"].to<JsonObject>();
    durations["initial"] = tuning.phaseDurations.initialSec;
    durations["deepening"] = tuning.phaseDurations.deepeningSec;
    durations["maintenance"] = tuning.phaseDurations.maintenanceSec;

    data["phaseCurve"] = transitions::getEasingName(tuning.phaseCurve);
    data["stressBoostDb"] = tuning.stressBoostDb;
    data["preferenceBoostDb"] = tuning.preferenceBoostDb;
}

} // namespace codec
} // namespace caninesense
