// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file RelaxationPhase.h
 * @brief Relaxation phase variant and pure phase-timing functions
 *
 * A session moves INITIAL -> DEEPENING -> MAINTENANCE. Each phase carries its
 * nominal duration; MAINTENANCE is terminal. Which phase is current is a pure
 * function of cumulative elapsed time and the configured durations.
 */

#pragma once

#include <cstdint>

namespace caninesense {
namespace session {

enum class PhaseKind : uint8_t {
    INITIAL = 0,
    DEEPENING = 1,
    MAINTENANCE = 2
};

static constexpr uint8_t PHASE_COUNT = 3;

inline const char* phaseKindName(PhaseKind kind) {
    switch (kind) {
        case PhaseKind::INITIAL:     return "initial";
        case PhaseKind::DEEPENING:   return "deepening";
        case PhaseKind::MAINTENANCE: return "maintenance";
        default:                     return "invalid";
    }
}

/**
 * @brief Nominal phase durations in seconds
 */
struct PhaseDurations {
    float initialSec = 300.0f;
    float deepeningSec = 600.0f;
    float maintenanceSec = 3600.0f;

    float of(PhaseKind kind) const {
        switch (kind) {
            case PhaseKind::INITIAL:     return initialSec;
            case PhaseKind::DEEPENING:   return deepeningSec;
            case PhaseKind::MAINTENANCE: return maintenanceSec;
            default:                     return maintenanceSec;
        }
    }
};

/**
 * @brief Tagged phase value: kind plus the duration it was defined with
 */
class RelaxationPhase {
public:
    static RelaxationPhase initial(float durationSec) { return RelaxationPhase(PhaseKind::INITIAL, durationSec); }
    static RelaxationPhase deepening(float durationSec) { return RelaxationPhase(PhaseKind::DEEPENING, durationSec); }
    static RelaxationPhase maintenance(float durationSec) { return RelaxationPhase(PhaseKind::MAINTENANCE, durationSec); }

    static RelaxationPhase of(PhaseKind kind, const PhaseDurations& durations) {
        return RelaxationPhase(kind, durations.of(kind));
    }

    RelaxationPhase() : m_kind(PhaseKind::INITIAL), m_duration(PhaseDurations().initialSec) {}

    PhaseKind kind() const { return m_kind; }
    float duration() const { return m_duration; }
    const char* name() const { return phaseKindName(m_kind); }

    bool operator==(const RelaxationPhase& o) const {
        return m_kind == o.m_kind && m_duration == o.m_duration;
    }
    bool operator!=(const RelaxationPhase& o) const { return !(*this == o); }

private:
    RelaxationPhase(PhaseKind kind, float durationSec) : m_kind(kind), m_duration(durationSec) {}

    PhaseKind m_kind;
    float m_duration;
};

// ============================================================================
// Pure Timing Functions
// ============================================================================

/**
 * @brief Seconds from session start at which a phase begins
 */
inline float phaseStartSeconds(PhaseKind kind, const PhaseDurations& d) {
    switch (kind) {
        case PhaseKind::INITIAL:     return 0.0f;
        case PhaseKind::DEEPENING:   return d.initialSec;
        case PhaseKind::MAINTENANCE: return d.initialSec + d.deepeningSec;
        default:                     return 0.0f;
    }
}

/**
 * @brief Phase current at a cumulative elapsed time
 *
 * Advances only once elapsed time exceeds the sum of the prior durations.
 */
inline PhaseKind phaseKindForElapsed(float elapsedSec, const PhaseDurations& d) {
    if (elapsedSec > phaseStartSeconds(PhaseKind::MAINTENANCE, d)) {
        return PhaseKind::MAINTENANCE;
    }
    if (elapsedSec > phaseStartSeconds(PhaseKind::DEEPENING, d)) {
        return PhaseKind::DEEPENING;
    }
    return PhaseKind::INITIAL;
}

/**
 * @brief Progress (0-1) through the phase current at elapsedSec
 *
 * Saturates at 1 once a MAINTENANCE session outlives its nominal duration.
 */
inline float phaseProgressForElapsed(float elapsedSec, const PhaseDurations& d) {
    PhaseKind kind = phaseKindForElapsed(elapsedSec, d);
    float duration = d.of(kind);
    if (duration <= 0.0f) {
        return 1.0f;
    }
    float t = (elapsedSec - phaseStartSeconds(kind, d)) / duration;
    if (t < 0.0f) return 0.0f;
    if (t > 1.0f) return 1.0f;
    return t;
}

/**
 * @brief Phase after `kind`; MAINTENANCE maps to itself
 */
inline PhaseKind nextPhaseKind(PhaseKind kind) {
    switch (kind) {
        case PhaseKind::INITIAL:   return PhaseKind::DEEPENING;
        case PhaseKind::DEEPENING: return PhaseKind::MAINTENANCE;
        default:                   return PhaseKind::MAINTENANCE;
    }
}

} // namespace session
} // namespace caninesense
