// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file SessionState.h
 * @brief Mutable per-session state owned by one AdaptationOrchestrator
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "AdaptationParameters.h"
#include "Vec3.h"
#include "../session/RelaxationPhase.h"
#include "../session/StressMetrics.h"
#include "../utils/HistoryBuffer.h"

namespace caninesense {
namespace core {

static constexpr size_t HISTORY_CAPACITY = 32;

struct SessionState {
    float elapsedSeconds = 0.0f;
    session::RelaxationPhase currentPhase;
    session::StressLevel lastStressLevel = session::StressLevel::MODERATE;
    uint32_t evaluationCount = 0;

    bool hasSubjectLocation = false;
    Vec3 lastSubjectLocation;

    utils::HistoryBuffer<AdaptationParameters, HISTORY_CAPACITY> history;
};

} // namespace core
} // namespace caninesense
