// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file SessionDriver.cpp
 * @brief Session boundary implementation
 */

#include "SessionDriver.h"

#define CS_LOG_TAG "Driver"
#include "../utils/Log.h"

namespace caninesense {
namespace core {

SessionDriver::SessionDriver(AdaptationOrchestrator& orchestrator, IBehaviorFeedbackSource* source)
    : m_orchestrator(&orchestrator)
    , m_source(source)
    , m_breedName(profiles::ProfileRegistry::DEFAULT_PROFILE_NAME) {
    for (uint8_t i = 0; i < MAX_SINKS; i++) {
        m_sinks[i] = nullptr;
    }
}

void SessionDriver::setSubject(const std::string& breedName, profiles::AgeProfile age) {
    if (breedName != m_breedName || age != m_age) {
        CS_SYS_LOGI("Subject -> '%s' (%s)", breedName.c_str(), profiles::ageProfileName(age));
    }
    m_breedName = breedName;
    m_age = age;
}

bool SessionDriver::addSink(IAdaptationSink* sink) {
    if (sink == nullptr) {
        return false;
    }
    for (uint8_t i = 0; i < m_sinkCount; i++) {
        if (m_sinks[i] == sink) {
            return false;
        }
    }
    if (m_sinkCount >= MAX_SINKS) {
        CS_SYS_LOGW("Sink '%s' rejected: %u sinks already registered", sink->name(), MAX_SINKS);
        return false;
    }
    m_sinks[m_sinkCount++] = sink;
    return true;
}

bool SessionDriver::removeSink(IAdaptationSink* sink) {
    for (uint8_t i = 0; i < m_sinkCount; i++) {
        if (m_sinks[i] == sink) {
            for (uint8_t j = i; j + 1 < m_sinkCount; j++) {
                m_sinks[j] = m_sinks[j + 1];
            }
            m_sinks[--m_sinkCount] = nullptr;
            return true;
        }
    }
    return false;
}

AdaptationParameters SessionDriver::tick(float deltaSeconds) {
    session::StressMetrics sample;
    m_lastSampleFresh = (m_source != nullptr) && m_source->poll(sample);

    if (m_lastSampleFresh) {
        m_lastMetrics = sample;
        m_staleTicks = 0;
    } else {
        // Location reports are one-shot; the orchestrator keeps the last known one
        m_lastMetrics.hasSubjectLocation = false;
        m_staleTicks++;
        if (m_staleTicks == 10) {
            CS_SYS_LOGW("No fresh behavior sample for %lu ticks", static_cast<unsigned long>(m_staleTicks));
        }
    }

    AdaptationParameters snapshot = m_orchestrator->evaluate(m_breedName, m_age, m_lastMetrics, deltaSeconds);

    for (uint8_t i = 0; i < m_sinkCount; i++) {
        m_sinks[i]->apply(snapshot);
    }
    return snapshot;
}

void SessionDriver::reset() {
    m_orchestrator->reset();
    m_lastMetrics = session::StressMetrics();
    m_lastSampleFresh = false;
    m_staleTicks = 0;
}

} // namespace core
} // namespace caninesense
