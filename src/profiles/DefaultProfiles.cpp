// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DefaultProfiles.cpp
 * @brief Built-in breed coefficient table
 *
 * Values are configuration data. Deployments that adopt a different research
 * source replace this table with a JSON table loaded through ProfileCodec.
 */

#include "DefaultProfiles.h"

#include <string>
#include <utility>

namespace caninesense {
namespace profiles {

namespace {

BreedProfile makeProfile(const char* name,
                         BreedCategory category,
                         EnergyLevel energy,
                         std::vector<float> preferred,
                         float volumeSensitivity,
                         SpatialPreference spatial,
                         std::vector<float> stressResponse,
                         ColorPreference color,
                         float motionSensitivity,
                         float contrastPreference) {
    BreedProfile p;
    p.name = name;
    p.category = category;
    p.energyLevel = energy;
    p.preferredFrequencies = std::move(preferred);
    p.volumeSensitivity = volumeSensitivity;
    p.spatialPreference = spatial;
    p.stressResponseFrequencies = std::move(stressResponse);
    p.colorPreference = color;
    p.motionSensitivity = motionSensitivity;
    p.contrastPreference = contrastPreference;
    return p;
}

} // namespace

BreedProfile makeDefaultBreedProfile() {
    return makeProfile(ProfileRegistry::DEFAULT_PROFILE_NAME,
                       BreedCategory::COMPANION, EnergyLevel::MEDIUM,
                       {300.0f, 1000.0f, 8000.0f}, 0.7f,
                       SpatialPreference::SURROUND,
                       {220.0f, 440.0f},
                       ColorPreference::BALANCED, 0.5f, 0.6f);
}

std::vector<BreedProfile> builtInBreedProfiles() {
    std::vector<BreedProfile> table;
    table.reserve(7);

    table.push_back(makeProfile("labrador", BreedCategory::SPORTING, EnergyLevel::HIGH,
                                {250.0f, 500.0f, 8000.0f}, 0.70f, SpatialPreference::SURROUND,
                                {220.0f, 440.0f}, ColorPreference::BLUE_DOMINANT, 0.7f, 0.8f));
    table.push_back(makeProfile("golden retriever", BreedCategory::SPORTING, EnergyLevel::MEDIUM,
                                {200.0f, 400.0f, 8000.0f}, 0.60f, SpatialPreference::FRONT_FOCUSED,
                                {200.0f, 400.0f}, ColorPreference::YELLOW_DOMINANT, 0.6f, 0.7f));
    table.push_back(makeProfile("border collie", BreedCategory::HERDING, EnergyLevel::HIGH,
                                {500.0f, 1000.0f, 12000.0f}, 0.80f, SpatialPreference::ADAPTIVE,
                                {250.0f, 500.0f}, ColorPreference::HIGH_CONTRAST, 0.9f, 0.9f));
    table.push_back(makeProfile("german shepherd", BreedCategory::WORKING, EnergyLevel::HIGH,
                                {300.0f, 1000.0f, 10000.0f}, 0.75f, SpatialPreference::ADAPTIVE,
                                {220.0f, 440.0f}, ColorPreference::BALANCED, 0.8f, 0.8f));
    table.push_back(makeProfile("bulldog", BreedCategory::BRACHYCEPHALIC, EnergyLevel::LOW,
                                {150.0f, 300.0f, 4000.0f}, 0.90f, SpatialPreference::SIDE_FOCUSED,
                                {150.0f, 300.0f}, ColorPreference::BALANCED, 0.3f, 0.5f));
    table.push_back(makeProfile("pug", BreedCategory::BRACHYCEPHALIC, EnergyLevel::LOW,
                                {200.0f, 400.0f, 5000.0f}, 0.85f, SpatialPreference::FRONT_FOCUSED,
                                {180.0f, 360.0f}, ColorPreference::YELLOW_DOMINANT, 0.4f, 0.6f));
    table.push_back(makeProfile("siberian husky", BreedCategory::WORKING, EnergyLevel::HIGH,
                                {400.0f, 800.0f, 16000.0f}, 0.65f, SpatialPreference::SURROUND,
                                {250.0f, 500.0f}, ColorPreference::BLUE_DOMINANT, 0.75f, 0.75f));
    return table;
}

RegistryResult buildBuiltInRegistry(ProfileRegistry& out) {
    ProfileRegistry::Builder builder;
    for (const BreedProfile& p : builtInBreedProfiles()) {
        RegistryResult r = builder.registerProfile(p);
        if (r != RegistryResult::OK) {
            return r;
        }
    }
    return builder.build(out);
}

} // namespace profiles
} // namespace caninesense
