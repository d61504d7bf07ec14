// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DichromaticTransform.h
 * @brief Per-pixel two-cone (blue/yellow) color remap
 *
 * blue'   = blue * blueWeight
 * yellow' = (red * redWeight + green * greenWeight) * yellowWeight
 *
 * Output pixels carry yellow' on the red and green channels and blue' on the
 * blue channel, then both pass through a contrast S-curve with the configured
 * exponent (> 1 steepens mid-tones to offset reduced acuity).
 *
 * transformPixel() is the pure reference. The class caches the contrast curve
 * in a 256-entry LUT for buffer processing and produces identical bytes.
 *
 * Usage:
 * @code
 * DichromaticTransform xform(params.dichromatic);
 * xform.processBuffer(leds, ledCount);
 * @endcode
 */

#pragma once

#include <FastLED.h>
#include <cstdint>

#include "../core/AdaptationParameters.h"

namespace caninesense {
namespace vision {

/**
 * @brief Contrast S-curve around 0.5
 * @param v Normalized channel value (0-1)
 * @param exponent Curve exponent (1 = identity)
 */
float contrastCurve(float v, float exponent);

/**
 * @brief Pure per-pixel transform
 */
CRGB transformPixel(const CRGB& in, const DichromaticCoefficients& coeffs);

class DichromaticTransform {
public:
    explicit DichromaticTransform(const DichromaticCoefficients& coeffs = DichromaticCoefficients());

    /**
     * @brief Replace coefficients and rebuild the contrast LUT
     */
    void setCoefficients(const DichromaticCoefficients& coeffs);
    const DichromaticCoefficients& getCoefficients() const { return m_coeffs; }

    CRGB apply(const CRGB& in) const;

    /**
     * @brief Transform a pixel buffer in place
     */
    void processBuffer(CRGB* buffer, uint16_t count) const;

private:
    void initLUT();

    DichromaticCoefficients m_coeffs;
    uint8_t m_contrastLUT[256];
};

} // namespace vision
} // namespace caninesense
