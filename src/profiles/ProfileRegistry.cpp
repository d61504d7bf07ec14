// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ProfileRegistry.cpp
 * @brief Breed profile table build, validation and lookup
 */

#include "ProfileRegistry.h"
#include "DefaultProfiles.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <utility>

#define CS_LOG_TAG "Registry"
#include "../utils/Log.h"

namespace caninesense {
namespace profiles {

namespace {

bool byName(const BreedProfile& a, const BreedProfile& b) {
    return a.name < b.name;
}

bool frequenciesValid(const std::vector<float>& freqs) {
    float prev = 0.0f;
    for (float hz : freqs) {
        if (!std::isfinite(hz) || hz <= 0.0f || hz < prev) {
            return false;
        }
        prev = hz;
    }
    return true;
}

bool inUnitRange(float v) {
    return std::isfinite(v) && v >= 0.0f && v <= 1.0f;
}

} // namespace

// ============================================================================
// Free Functions
// ============================================================================

const char* registryResultToString(RegistryResult result) {
    switch (result) {
        case RegistryResult::OK:                return "OK";
        case RegistryResult::DUPLICATE_PROFILE: return "Duplicate Profile";
        case RegistryResult::INVALID_PROFILE:   return "Invalid Profile";
        case RegistryResult::CAPACITY_EXCEEDED: return "Capacity Exceeded";
        case RegistryResult::BUILD_FAILED:      return "Build Failed";
        default:                                return "Unknown";
    }
}

std::string normalizeBreedName(const std::string& name) {
    size_t start = 0;
    size_t end = name.size();
    while (start < end && std::isspace(static_cast<unsigned char>(name[start]))) {
        start++;
    }
    while (end > start && std::isspace(static_cast<unsigned char>(name[end - 1]))) {
        end--;
    }

    std::string out;
    out.reserve(end - start);
    for (size_t i = start; i < end; i++) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(name[i]))));
    }
    return out;
}

bool validateBreedProfile(const BreedProfile& profile, char* errorMsg, size_t errorMsgSize) {
    const char* problem = nullptr;

    if (normalizeBreedName(profile.name).empty()) {
        problem = "name is empty";
    } else if (profile.preferredFrequencies.empty()) {
        problem = "preferredFrequencies is empty";
    } else if (!frequenciesValid(profile.preferredFrequencies)) {
        problem = "preferredFrequencies must be positive and ascending";
    } else if (!frequenciesValid(profile.stressResponseFrequencies)) {
        problem = "stressResponseFrequencies must be positive and ascending";
    } else if (!std::isfinite(profile.volumeSensitivity) ||
               profile.volumeSensitivity <= 0.0f || profile.volumeSensitivity > 1.0f) {
        problem = "volumeSensitivity must be in (0, 1]";
    } else if (!inUnitRange(profile.motionSensitivity)) {
        problem = "motionSensitivity must be in [0, 1]";
    } else if (!inUnitRange(profile.contrastPreference)) {
        problem = "contrastPreference must be in [0, 1]";
    }

    if (problem == nullptr) {
        return true;
    }
    if (errorMsg != nullptr && errorMsgSize > 0) {
        snprintf(errorMsg, errorMsgSize, "'%s': %s", profile.name.c_str(), problem);
    }
    return false;
}

// ============================================================================
// Builder
// ============================================================================

ProfileRegistry::Builder::Builder()
    : m_default(makeDefaultBreedProfile()) {
    memset(m_errorMsg, 0, sizeof(m_errorMsg));
}

void ProfileRegistry::Builder::recordError(RegistryResult result, const char* msg) {
    CS_PROFILE_LOGE("%s: %s", registryResultToString(result), msg);
    if (m_firstError == RegistryResult::OK) {
        m_firstError = result;
        snprintf(m_errorMsg, sizeof(m_errorMsg), "%s", msg);
    }
}

RegistryResult ProfileRegistry::Builder::registerProfile(const BreedProfile& profile) {
    char msg[MAX_ERROR_MSG];

    if (!validateBreedProfile(profile, msg, sizeof(msg))) {
        recordError(RegistryResult::INVALID_PROFILE, msg);
        return RegistryResult::INVALID_PROFILE;
    }

    BreedProfile canonical = profile;
    canonical.name = normalizeBreedName(profile.name);

    if (canonical.name == DEFAULT_PROFILE_NAME) {
        if (m_hasCustomDefault) {
            snprintf(msg, sizeof(msg), "'%s' registered twice", canonical.name.c_str());
            recordError(RegistryResult::DUPLICATE_PROFILE, msg);
            return RegistryResult::DUPLICATE_PROFILE;
        }
        m_default = canonical;
        m_hasCustomDefault = true;
        return RegistryResult::OK;
    }

    for (const BreedProfile& existing : m_profiles) {
        if (existing.name == canonical.name) {
            snprintf(msg, sizeof(msg), "'%s' registered twice", canonical.name.c_str());
            recordError(RegistryResult::DUPLICATE_PROFILE, msg);
            return RegistryResult::DUPLICATE_PROFILE;
        }
    }

    if (m_profiles.size() >= MAX_PROFILES) {
        snprintf(msg, sizeof(msg), "'%s' exceeds %u profiles",
                 canonical.name.c_str(), static_cast<unsigned>(MAX_PROFILES));
        recordError(RegistryResult::CAPACITY_EXCEEDED, msg);
        return RegistryResult::CAPACITY_EXCEEDED;
    }

    CS_PROFILE_LOGD("Registered '%s' (%s)", canonical.name.c_str(),
                    breedCategoryName(canonical.category));
    m_profiles.push_back(std::move(canonical));
    return RegistryResult::OK;
}

RegistryResult ProfileRegistry::Builder::build(ProfileRegistry& out) const {
    if (m_firstError != RegistryResult::OK) {
        CS_PROFILE_LOGE("Refusing to build registry: %s (%s)",
                        registryResultToString(m_firstError), m_errorMsg);
        return m_firstError;
    }

    ProfileRegistry built;
    built.m_profiles = m_profiles;
    built.m_default = m_default;
    std::sort(built.m_profiles.begin(), built.m_profiles.end(), byName);

    out = std::move(built);
    CS_PROFILE_LOGI("Registry built: %u profiles + default",
                    static_cast<unsigned>(out.m_profiles.size()));
    return RegistryResult::OK;
}

// ============================================================================
// Registry Queries
// ============================================================================

ProfileRegistry::ProfileRegistry()
    : m_default(makeDefaultBreedProfile()) {
}

const BreedProfile* ProfileRegistry::find(const std::string& canonicalName) const {
    BreedProfile key;
    key.name = canonicalName;
    auto it = std::lower_bound(m_profiles.begin(), m_profiles.end(), key, byName);
    if (it != m_profiles.end() && it->name == canonicalName) {
        return &(*it);
    }
    return nullptr;
}

const BreedProfile& ProfileRegistry::lookup(const std::string& name) const {
    std::string canonical = normalizeBreedName(name);
    const BreedProfile* profile = find(canonical);
    if (profile != nullptr) {
        return *profile;
    }
    CS_PROFILE_LOGD("No profile for '%s', using default", canonical.c_str());
    return m_default;
}

bool ProfileRegistry::contains(const std::string& name) const {
    return find(normalizeBreedName(name)) != nullptr;
}

std::vector<std::string> ProfileRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(m_profiles.size());
    for (const BreedProfile& p : m_profiles) {
        out.push_back(p.name);
    }
    return out;
}

std::vector<std::string> ProfileRegistry::namesInCategory(BreedCategory category) const {
    std::vector<std::string> out;
    for (const BreedProfile& p : m_profiles) {
        if (p.category == category) {
            out.push_back(p.name);
        }
    }
    return out;
}

std::vector<std::string> ProfileRegistry::suggest(const std::string& input) const {
    const std::string canonical = normalizeBreedName(input);
    std::vector<std::string> out;
    // m_profiles is sorted, so matches come out in order
    for (const BreedProfile& p : m_profiles) {
        if (p.name.find(canonical) != std::string::npos ||
            canonical.find(p.name) != std::string::npos) {
            out.push_back(p.name);
        }
    }
    return out;
}

} // namespace profiles
} // namespace caninesense
