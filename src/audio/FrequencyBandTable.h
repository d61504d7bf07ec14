// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file FrequencyBandTable.h
 * @brief Fixed 10-band table across canine hearing (40 Hz - 65 kHz)
 *
 * Band edges are log-spaced: edge[i] = 40 * (65000/40)^(i/10).
 * Center is the geometric mean of the edges, bandwidth the edge distance.
 */

#pragma once

#include <cstdint>
#include <vector>

#include "../core/AdaptationParameters.h"
#include "../session/RelaxationPhase.h"

namespace caninesense {
namespace audio {

struct BandSpec {
    float lowHz;
    float highHz;
    float centerHz;
    float bandwidthHz;
};

static constexpr BandSpec BAND_TABLE[BAND_COUNT] = {
    //  low       high      center    bandwidth
    {    40.0f,    83.8f,    57.9f,    43.8f },
    {    83.8f,   175.5f,   121.3f,    91.7f },
    {   175.5f,   367.5f,   254.0f,   192.0f },
    {   367.5f,   769.8f,   531.9f,   402.3f },
    {   769.8f,  1612.5f,  1114.2f,   842.7f },
    {  1612.5f,  3377.3f,  2333.6f,  1764.8f },
    {  3377.3f,  7073.9f,  4887.8f,  3696.6f },
    {  7073.9f, 14816.4f, 10237.6f,  7742.5f },
    { 14816.4f, 31033.3f, 21443.0f, 16216.9f },
    { 31033.3f, 65000.0f, 44912.9f, 33966.7f },
};

/**
 * @brief Base gain (dB) per phase and band before intensity scaling
 *
 * INITIAL is the brightest; MAINTENANCE the flattest, with a gentle
 * high-frequency roll-off.
 */
static constexpr float PHASE_BASE_GAIN_DB[session::PHASE_COUNT][BAND_COUNT] = {
    // INITIAL
    { -1.0f, 0.0f, 1.0f, 2.0f, 3.0f, 3.0f, 2.0f, 1.0f, -1.0f, -3.0f },
    // DEEPENING
    {  0.5f, 1.0f, 1.5f, 1.0f, 0.0f, -1.0f, -2.0f, -3.0f, -4.0f, -6.0f },
    // MAINTENANCE
    {  0.0f, 0.5f, 0.5f, 0.0f, 0.0f, -0.5f, -1.0f, -1.5f, -2.0f, -3.0f },
};

/// Base BPM per phase (INITIAL, DEEPENING, MAINTENANCE)
static constexpr int16_t PHASE_BASE_BPM[session::PHASE_COUNT] = { 60, 55, 50 };

/// Base volume ceiling per phase before sensitivity and stress attenuation
static constexpr float PHASE_BASE_VOLUME_DB[session::PHASE_COUNT] = { 60.0f, 55.0f, 50.0f };

/**
 * @brief True if any listed frequency falls inside the band [low, high)
 */
inline bool bandContainsAny(const BandSpec& band, const std::vector<float>& freqs) {
    for (float hz : freqs) {
        if (hz >= band.lowHz && hz < band.highHz) {
            return true;
        }
    }
    return false;
}

/**
 * @brief Index of the band containing hz, or -1 outside the table
 */
inline int8_t bandIndexFor(float hz) {
    for (uint8_t i = 0; i < BAND_COUNT; i++) {
        if (hz >= BAND_TABLE[i].lowHz && hz < BAND_TABLE[i].highHz) {
            return static_cast<int8_t>(i);
        }
    }
    return -1;
}

} // namespace audio
} // namespace caninesense
