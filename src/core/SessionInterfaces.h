// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file SessionInterfaces.h
 * @brief Collaborator interfaces at the session boundary
 *
 * Behavior sensing and rendering live outside the engine. The SessionDriver
 * polls one IBehaviorFeedbackSource per tick and hands each finished snapshot
 * to every registered IAdaptationSink.
 */

#pragma once

#include "AdaptationParameters.h"
#include "../session/StressMetrics.h"

namespace caninesense {
namespace core {

/**
 * @brief Source of behavior samples (camera/microphone analysis, wearables)
 */
class IBehaviorFeedbackSource {
public:
    virtual ~IBehaviorFeedbackSource() = default;

    /**
     * @brief Fetch the newest sample, if one arrived since the last poll
     * @param out Receives the sample when available
     * @return true if out was written
     */
    virtual bool poll(session::StressMetrics& out) = 0;
};

/**
 * @brief Consumer of snapshots (audio engine, video renderer, telemetry)
 */
class IAdaptationSink {
public:
    virtual ~IAdaptationSink() = default;

    /**
     * @brief Apply a complete snapshot; never called with a partial one
     */
    virtual void apply(const AdaptationParameters& params) = 0;

    /**
     * @brief Short name for diagnostics
     */
    virtual const char* name() const = 0;
};

} // namespace core
} // namespace caninesense
