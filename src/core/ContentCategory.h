// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
#pragma once

#include "../session/RelaxationPhase.h"
#include "../session/StressMetrics.h"

namespace caninesense {
namespace core {

static constexpr const char* CONTENT_MENTAL_STIMULATION = "Mental Stimulation";
static constexpr const char* CONTENT_CALM_RELAX = "Calm & Relax";

/**
 * @brief Programme category for a phase; high stress always calms
 */
inline const char* contentCategoryFor(session::PhaseKind phase, session::StressLevel stress) {
    if (stress == session::StressLevel::HIGH) {
        return CONTENT_CALM_RELAX;
    }
    return (phase == session::PhaseKind::INITIAL) ? CONTENT_MENTAL_STIMULATION : CONTENT_CALM_RELAX;
}

} // namespace core
} // namespace caninesense
