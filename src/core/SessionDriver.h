// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file SessionDriver.h
 * @brief Polling boundary between collaborators and one orchestrator
 *
 * The embedding application calls tick() on its own timer (1-5 s cadence).
 * Each tick polls the feedback source once, evaluates, and publishes the
 * snapshot to every sink. When no fresh sample arrived the previous one is
 * reused; before the first sample the engine assumes moderate stress.
 *
 * Usage:
 * @code
 * AdaptationOrchestrator orchestrator(registry);
 * SessionDriver driver(orchestrator, &feedback);
 * driver.setSubject("Border Collie", AgeProfile::ADULT);
 * driver.addSink(&audioRenderer);
 * driver.addSink(&videoRenderer);
 * // every 2 s:
 * driver.tick(2.0f);
 * @endcode
 */

#pragma once

#include <cstdint>
#include <string>

#include "AdaptationOrchestrator.h"
#include "SessionInterfaces.h"

namespace caninesense {
namespace core {

class SessionDriver {
public:
    static constexpr uint8_t MAX_SINKS = 4;

    /**
     * @param orchestrator Session engine; must outlive the driver
     * @param source Feedback source (nullable: stays on the default sample)
     */
    SessionDriver(AdaptationOrchestrator& orchestrator, IBehaviorFeedbackSource* source);

    // Non-copyable (holds collaborator pointers)
    SessionDriver(const SessionDriver&) = delete;
    SessionDriver& operator=(const SessionDriver&) = delete;

    /**
     * @brief Set or change the subject; takes effect on the next tick
     */
    void setSubject(const std::string& breedName, profiles::AgeProfile age);

    /**
     * @return false if sink is null, already registered, or MAX_SINKS reached
     */
    bool addSink(IAdaptationSink* sink);
    bool removeSink(IAdaptationSink* sink);
    uint8_t sinkCount() const { return m_sinkCount; }

    /**
     * @brief Poll, evaluate and publish
     * @return The published snapshot
     */
    AdaptationParameters tick(float deltaSeconds);

    /**
     * @brief New session: orchestrator reset and sample history forgotten
     */
    void reset();

    const std::string& breedName() const { return m_breedName; }
    profiles::AgeProfile age() const { return m_age; }
    const session::StressMetrics& lastMetrics() const { return m_lastMetrics; }
    bool lastSampleFresh() const { return m_lastSampleFresh; }
    uint32_t staleTicks() const { return m_staleTicks; }

private:
    AdaptationOrchestrator* m_orchestrator;
    IBehaviorFeedbackSource* m_source;
    IAdaptationSink* m_sinks[MAX_SINKS];
    uint8_t m_sinkCount = 0;

    std::string m_breedName;
    profiles::AgeProfile m_age = profiles::AgeProfile::ADULT;

    session::StressMetrics m_lastMetrics;
    bool m_lastSampleFresh = false;
    uint32_t m_staleTicks = 0;
};

} // namespace core
} // namespace caninesense
