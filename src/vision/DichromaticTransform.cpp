// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DichromaticTransform.cpp
 * @brief Dichromatic color remap with LUT-based contrast curve
 */

#include "DichromaticTransform.h"
#include "../core/SafetyLimits.h"

#include <cmath>

#define CS_LOG_TAG "Dichromat"
#include "../utils/Log.h"

namespace caninesense {
namespace vision {

namespace {

uint8_t toByte(float normalized) {
    return static_cast<uint8_t>(core::clampf(normalized, 0.0f, 1.0f) * 255.0f + 0.5f);
}

uint8_t curveByte(uint8_t v, float exponent) {
    return toByte(contrastCurve(v / 255.0f, exponent));
}

} // namespace

// ============================================================================
// Pure Functions
// ============================================================================

float contrastCurve(float v, float exponent) {
    v = core::clampf(v, 0.0f, 1.0f);
    if (v < 0.5f) {
        return 0.5f * powf(2.0f * v, exponent);
    }
    return 1.0f - 0.5f * powf(2.0f * (1.0f - v), exponent);
}

CRGB transformPixel(const CRGB& in, const DichromaticCoefficients& coeffs) {
    const DichromaticCoefficients c = core::clampDichromatic(coeffs);

    const float r = in.r / 255.0f;
    const float g = in.g / 255.0f;
    const float b = in.b / 255.0f;

    const uint8_t yellow = toByte((r * c.redWeight + g * c.greenWeight) * c.yellowWeight);
    const uint8_t blue = toByte(b * c.blueWeight);

    const uint8_t y = curveByte(yellow, c.contrastExponent);
    return CRGB(y, y, curveByte(blue, c.contrastExponent));
}

// ============================================================================
// LUT-Backed Transform
// ============================================================================

DichromaticTransform::DichromaticTransform(const DichromaticCoefficients& coeffs)
    : m_coeffs(core::clampDichromatic(coeffs)) {
    initLUT();
}

void DichromaticTransform::setCoefficients(const DichromaticCoefficients& coeffs) {
    const DichromaticCoefficients clamped = core::clampDichromatic(coeffs);
    const bool curveChanged = clamped.contrastExponent != m_coeffs.contrastExponent;
    m_coeffs = clamped;
    if (curveChanged) {
        initLUT();
    }
}

void DichromaticTransform::initLUT() {
    for (int i = 0; i < 256; i++) {
        m_contrastLUT[i] = curveByte(static_cast<uint8_t>(i), m_coeffs.contrastExponent);
    }
    CS_VISION_LOGT("Contrast LUT rebuilt (exponent=%.2f)", m_coeffs.contrastExponent);
}

CRGB DichromaticTransform::apply(const CRGB& in) const {
    const float r = in.r / 255.0f;
    const float g = in.g / 255.0f;
    const float b = in.b / 255.0f;

    const uint8_t yellow = toByte((r * m_coeffs.redWeight + g * m_coeffs.greenWeight) * m_coeffs.yellowWeight);
    const uint8_t blue = toByte(b * m_coeffs.blueWeight);

    const uint8_t y = m_contrastLUT[yellow];
    return CRGB(y, y, m_contrastLUT[blue]);
}

void DichromaticTransform::processBuffer(CRGB* buffer, uint16_t count) const {
    if (buffer == nullptr) return;
    for (uint16_t i = 0; i < count; i++) {
        buffer[i] = apply(buffer[i]);
    }
}

} // namespace vision
} // namespace caninesense
