// ==============================================================================
// Layer 0: Core Utilities
// db_utils.h - Float Classification and dB/Linear Conversion
// ==============================================================================
// Real-time safe: no allocation, no locks, no exceptions, no I/O.
// Layer 0: no dependencies on higher layers.
// ==============================================================================

#pragma once

#include <bit>
#include <cmath>
#include <cstdint>
#include <limits>

namespace Chordpad {
namespace DSP {

// ==============================================================================
// Constants
// ==============================================================================

/// Floor value for silence/zero gain in decibels (~24-bit dynamic range).
inline constexpr float kSilenceFloorDb = -144.0f;

/// Values with smaller magnitude are flushed to zero in recursive filters.
inline constexpr float kDenormalThreshold = 1e-15f;

namespace detail {

/// Constexpr-safe NaN check using the IEEE 754 bit pattern.
///
/// Operates on integer bits so it keeps working in translation units built
/// with -ffast-math, where std::isnan() may be optimized out.
constexpr bool isNaN(float x) noexcept {
    const auto bits = std::bit_cast<std::uint32_t>(x);
    return ((bits & 0x7F800000u) == 0x7F800000u) && ((bits & 0x007FFFFFu) != 0);
}

/// True for any value that is neither NaN nor infinite.
constexpr bool isFinite(float x) noexcept {
    const auto bits = std::bit_cast<std::uint32_t>(x);
    return (bits & 0x7F800000u) != 0x7F800000u;
}

/// Flush denormal-range values to zero.
constexpr float flushDenormal(float x) noexcept {
    return (x > -kDenormalThreshold && x < kDenormalThreshold) ? 0.0f : x;
}

/// 1 / ln(10), used for log10 calculation
inline constexpr float kInvLn10 = 0.434294482f;

/// Constexpr natural logarithm.
/// ln(x) = 2 * sum(z^(2n+1) / (2n+1)) with z = (x-1)/(x+1), after range reduction.
constexpr float constexprLn(float x) noexcept {
    if (isNaN(x)) return std::numeric_limits<float>::quiet_NaN();
    if (x <= 0.0f) return -std::numeric_limits<float>::infinity();
    if (x == std::numeric_limits<float>::infinity()) return std::numeric_limits<float>::infinity();
    if (x == 1.0f) return 0.0f;

    constexpr float kLn2 = 0.693147181f;
    int exponent = 0;
    float mantissa = x;

    for (int iter = 0; iter < 150 && mantissa > 2.0f; ++iter) {
        mantissa *= 0.5f;
        exponent++;
    }
    for (int iter = 0; iter < 150 && mantissa < 0.5f; ++iter) {
        mantissa *= 2.0f;
        exponent--;
    }

    const float z = (mantissa - 1.0f) / (mantissa + 1.0f);
    const float z2 = z * z;
    float term = z;
    float sum = z;

    for (int i = 1; i <= 12; ++i) {
        term *= z2;
        sum += term / (2.0f * static_cast<float>(i) + 1.0f);
    }

    return 2.0f * sum + static_cast<float>(exponent) * kLn2;
}

/// Constexpr log10 using natural log
constexpr float constexprLog10(float x) noexcept {
    return constexprLn(x) * kInvLn10;
}

/// Constexpr exponential using a range-reduced Taylor series.
constexpr float constexprExp(float x) noexcept {
    if (isNaN(x)) return std::numeric_limits<float>::quiet_NaN();
    if (x == 0.0f) return 1.0f;
    if (x > 88.0f) return std::numeric_limits<float>::infinity();
    if (x < -88.0f) return 0.0f;

    // exp(x) = 2^k * exp(r), |r| <= ln(2)
    constexpr float kLn2 = 0.693147181f;
    const int k = static_cast<int>(x / kLn2);
    const float r = x - static_cast<float>(k) * kLn2;

    float term = 1.0f;
    float sum = 1.0f;

    for (int i = 1; i <= 16; ++i) {
        term *= r / static_cast<float>(i);
        sum += term;
        if (term < 1e-10f && term > -1e-10f) break;
    }

    if (k >= 0) {
        for (int i = 0; i < k && i < 150; ++i) sum *= 2.0f;
    } else {
        for (int i = 0; i > k && i > -150; --i) sum *= 0.5f;
    }

    return sum;
}

} // namespace detail

// ==============================================================================
// Functions
// ==============================================================================

/// Convert linear gain to decibels.
///
/// @param gain  Linear gain value
/// @return      Decibel value, floored at kSilenceFloorDb
///
/// @note Zero/negative/NaN input returns kSilenceFloorDb (-144 dB)
///
/// @example gainToDb(1.0f) -> 0.0f
/// @example gainToDb(0.5f) -> ~-6.02f
///
[[nodiscard]] constexpr float gainToDb(float gain) noexcept {
    if (detail::isNaN(gain) || gain <= 0.0f) {
        return kSilenceFloorDb;
    }
    const float result = 20.0f * detail::constexprLog10(gain);
    return (result < kSilenceFloorDb) ? kSilenceFloorDb : result;
}

} // namespace DSP
} // namespace Chordpad
