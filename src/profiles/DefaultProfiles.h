// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DefaultProfiles.h
 * @brief Built-in breed table used when no JSON profile table is supplied
 */

#pragma once

#include <vector>

#include "BreedProfile.h"
#include "ProfileRegistry.h"

namespace caninesense {
namespace profiles {

/**
 * @brief Fallback profile returned for unknown breeds
 */
BreedProfile makeDefaultBreedProfile();

/**
 * @brief The built-in breed entries (excluding the default)
 */
std::vector<BreedProfile> builtInBreedProfiles();

/**
 * @brief Build a registry from the built-in table
 */
RegistryResult buildBuiltInRegistry(ProfileRegistry& out);

} // namespace profiles
} // namespace caninesense
