// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ProfileRegistry.h
 * @brief Immutable breed profile table with graceful fallback
 *
 * The registry is assembled once through ProfileRegistry::Builder and is
 * read-only afterwards. All query methods are const and touch no shared
 * mutable state, so one registry can serve any number of sessions and threads.
 *
 * Lookup normalizes the requested name (trim + lowercase). Unknown names
 * resolve to the designated default profile; lookup never fails.
 *
 * Usage:
 * @code
 * ProfileRegistry::Builder builder;
 * builder.registerProfile(labrador);
 * builder.registerProfile(bulldog);
 *
 * ProfileRegistry registry;
 * if (builder.build(registry) != RegistryResult::OK) {
 *     // duplicate or invalid profile: the table is unusable
 * }
 * const BreedProfile& p = registry.lookup("  Labrador ");
 * @endcode
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "BreedProfile.h"

namespace caninesense {
namespace profiles {

/**
 * @brief Registry build result codes
 */
enum class RegistryResult : uint8_t {
    OK = 0,                 // Operation successful
    DUPLICATE_PROFILE,      // Canonical name already registered
    INVALID_PROFILE,        // Field outside its documented range
    CAPACITY_EXCEEDED,      // More than MAX_PROFILES entries
    BUILD_FAILED            // An earlier registration failed
};

const char* registryResultToString(RegistryResult result);

/**
 * @brief Canonical form of a breed name (trimmed, lowercase ASCII)
 */
std::string normalizeBreedName(const std::string& name);

/**
 * @brief Check that every profile field is inside its documented range
 * @param profile Profile to validate
 * @param errorMsg Optional buffer receiving the first violation
 * @param errorMsgSize Size of errorMsg
 */
bool validateBreedProfile(const BreedProfile& profile, char* errorMsg = nullptr, size_t errorMsgSize = 0);

class ProfileRegistry {
public:
    static constexpr size_t MAX_PROFILES = 64;
    static constexpr const char* DEFAULT_PROFILE_NAME = "default";
    static constexpr size_t MAX_ERROR_MSG = 128;

    /**
     * @brief Collects profiles before the registry is sealed
     *
     * The first failed registration is sticky: build() refuses to produce a
     * registry from a table that contained a duplicate or invalid entry.
     */
    class Builder {
    public:
        Builder();

        /**
         * @brief Add a profile to the table
         *
         * A profile named "default" replaces the built-in fallback profile.
         * @return OK, DUPLICATE_PROFILE, INVALID_PROFILE or CAPACITY_EXCEEDED
         */
        RegistryResult registerProfile(const BreedProfile& profile);

        /**
         * @brief Seal the table into a registry
         * @param out Receives the registry on success, untouched on failure
         * @return OK or the first registration error
         */
        RegistryResult build(ProfileRegistry& out) const;

        size_t size() const { return m_profiles.size(); }
        RegistryResult firstError() const { return m_firstError; }
        const char* errorMsg() const { return m_errorMsg; }

    private:
        void recordError(RegistryResult result, const char* msg);

        std::vector<BreedProfile> m_profiles;
        BreedProfile m_default;
        bool m_hasCustomDefault = false;
        RegistryResult m_firstError = RegistryResult::OK;
        char m_errorMsg[MAX_ERROR_MSG];
    };

    /**
     * @brief Empty registry holding only the built-in default profile
     */
    ProfileRegistry();

    // ==================== Queries ====================

    /**
     * @brief Resolve a breed name to its profile
     * @param name Any case, surrounding whitespace ignored
     * @return Matching profile, or the default profile when unknown
     */
    const BreedProfile& lookup(const std::string& name) const;

    /**
     * @brief True if the name resolves to a registered (non-default) profile
     */
    bool contains(const std::string& name) const;

    const BreedProfile& defaultProfile() const { return m_default; }

    /**
     * @brief Number of registered profiles, excluding the default
     */
    size_t size() const { return m_profiles.size(); }

    /**
     * @brief All registered canonical names, sorted
     */
    std::vector<std::string> names() const;

    std::vector<std::string> namesInCategory(BreedCategory category) const;

    /**
     * @brief Registered names matching partial user input
     *
     * Every name that contains the normalized input or is contained in it,
     * sorted. Empty when nothing matches; empty input matches every name.
     */
    std::vector<std::string> suggest(const std::string& input) const;

private:
    const BreedProfile* find(const std::string& canonicalName) const;

    std::vector<BreedProfile> m_profiles;   // sorted by name
    BreedProfile m_default;
};

} // namespace profiles
} // namespace caninesense
