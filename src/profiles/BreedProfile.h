// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file BreedProfile.h
 * @brief Immutable per-breed audio/visual preference record
 *
 * A BreedProfile is built once when the ProfileRegistry is constructed and is
 * shared by const reference across every session afterwards.
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace caninesense {
namespace profiles {

/**
 * @brief Preferred placement of audio sources relative to the subject
 */
enum class SpatialPreference : uint8_t {
    SURROUND = 0,
    FRONT_FOCUSED = 1,
    SIDE_FOCUSED = 2,
    OVERHEAD = 3,
    ADAPTIVE = 4        ///< Follow the last known subject location
};

/**
 * @brief Dominant hue family for the dichromatic transform
 */
enum class ColorPreference : uint8_t {
    BLUE_DOMINANT = 0,
    YELLOW_DOMINANT = 1,
    BALANCED = 2,
    HIGH_CONTRAST = 3
};

enum class BreedCategory : uint8_t {
    WORKING = 0,
    COMPANION = 1,
    TERRIER = 2,
    BRACHYCEPHALIC = 3,
    GIANT = 4,
    SPORTING = 5,
    HERDING = 6,
    TOY = 7
};

enum class EnergyLevel : uint8_t {
    LOW = 0,
    MEDIUM = 1,
    HIGH = 2
};

struct BreedProfile {
    std::string name;                               ///< Canonical lowercase name
    BreedCategory category = BreedCategory::COMPANION;
    EnergyLevel energyLevel = EnergyLevel::MEDIUM;
    std::vector<float> preferredFrequencies;        ///< Hz, ascending, non-empty
    float volumeSensitivity = 0.7f;                 ///< (0, 1]
    SpatialPreference spatialPreference = SpatialPreference::SURROUND;
    std::vector<float> stressResponseFrequencies;   ///< Hz, ascending
    ColorPreference colorPreference = ColorPreference::BALANCED;
    float motionSensitivity = 0.5f;                 ///< [0, 1]
    float contrastPreference = 0.5f;                ///< [0, 1]
};

// ============================================================================
// Enum Names
// ============================================================================

inline const char* spatialPreferenceName(SpatialPreference pref) {
    switch (pref) {
        case SpatialPreference::SURROUND:      return "surround";
        case SpatialPreference::FRONT_FOCUSED: return "frontFocused";
        case SpatialPreference::SIDE_FOCUSED:  return "sideFocused";
        case SpatialPreference::OVERHEAD:      return "overhead";
        case SpatialPreference::ADAPTIVE:      return "adaptive";
        default:                               return "invalid";
    }
}

inline const char* colorPreferenceName(ColorPreference pref) {
    switch (pref) {
        case ColorPreference::BLUE_DOMINANT:   return "blueDominant";
        case ColorPreference::YELLOW_DOMINANT: return "yellowDominant";
        case ColorPreference::BALANCED:        return "balanced";
        case ColorPreference::HIGH_CONTRAST:   return "highContrast";
        default:                               return "invalid";
    }
}

inline const char* breedCategoryName(BreedCategory category) {
    switch (category) {
        case BreedCategory::WORKING:        return "working";
        case BreedCategory::COMPANION:      return "companion";
        case BreedCategory::TERRIER:        return "terrier";
        case BreedCategory::BRACHYCEPHALIC: return "brachycephalic";
        case BreedCategory::GIANT:          return "giant";
        case BreedCategory::SPORTING:       return "sporting";
        case BreedCategory::HERDING:        return "herding";
        case BreedCategory::TOY:            return "toy";
        default:                            return "invalid";
    }
}

inline const char* energyLevelName(EnergyLevel level) {
    switch (level) {
        case EnergyLevel::LOW:    return "low";
        case EnergyLevel::MEDIUM: return "medium";
        case EnergyLevel::HIGH:   return "high";
        default:                  return "invalid";
    }
}

// ============================================================================
// Name Parsing (configuration input)
// ============================================================================

inline bool parseSpatialPreference(const char* str, SpatialPreference& out) {
    if (str == nullptr) return false;
    for (uint8_t i = 0; i <= static_cast<uint8_t>(SpatialPreference::ADAPTIVE); ++i) {
        SpatialPreference p = static_cast<SpatialPreference>(i);
        if (strcmp(str, spatialPreferenceName(p)) == 0) {
            out = p;
            return true;
        }
    }
    return false;
}

inline bool parseColorPreference(const char* str, ColorPreference& out) {
    if (str == nullptr) return false;
    for (uint8_t i = 0; i <= static_cast<uint8_t>(ColorPreference::HIGH_CONTRAST); ++i) {
        ColorPreference p = static_cast<ColorPreference>(i);
        if (strcmp(str, colorPreferenceName(p)) == 0) {
            out = p;
            return true;
        }
    }
    return false;
}

inline bool parseBreedCategory(const char* str, BreedCategory& out) {
    if (str == nullptr) return false;
    for (uint8_t i = 0; i <= static_cast<uint8_t>(BreedCategory::TOY); ++i) {
        BreedCategory c = static_cast<BreedCategory>(i);
        if (strcmp(str, breedCategoryName(c)) == 0) {
            out = c;
            return true;
        }
    }
    return false;
}

inline bool parseEnergyLevel(const char* str, EnergyLevel& out) {
    if (str == nullptr) return false;
    for (uint8_t i = 0; i <= static_cast<uint8_t>(EnergyLevel::HIGH); ++i) {
        EnergyLevel e = static_cast<EnergyLevel>(i);
        if (strcmp(str, energyLevelName(e)) == 0) {
            out = e;
            return true;
        }
    }
    return false;
}

} // namespace profiles
} // namespace caninesense
