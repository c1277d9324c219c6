// ==============================================================================
// Layer 1: DSP Primitive - Biquad Filter
// ==============================================================================
// Second-order resonant filter behind every filter node of the software audio
// graph. Lowpass, highpass and bandpass responses (RBJ Audio EQ Cookbook),
// run in Transposed Direct Form II.
//
// Real-time safe: noexcept, no allocations in process.
// ==============================================================================

#pragma once

#include <chordpad/dsp/core/db_utils.h>
#include <chordpad/dsp/core/math_constants.h>
#include <chordpad/dsp/core/synth_settings.h>
#include <chordpad/dsp/core/synth_types.h>

#include <algorithm>
#include <cmath>
#include <complex>
#include <cstddef>

namespace Chordpad {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

/// Q range accepted by the kernel; matches the patch's resonance range
inline constexpr float kMinQ = kMinResonance;
inline constexpr float kMaxQ = kMaxResonance;

/// 1/sqrt(2): maximally flat passband
inline constexpr float kButterworthQ = 0.7071067811865476f;

/// Lowest design frequency in Hz
inline constexpr float kMinFilterFrequency = 1.0f;

/// Highest design frequency as a fraction of the sample rate
inline constexpr float kMaxFilterFrequencyRatio = 0.495f;

// =============================================================================
// BiquadCoefficients
// =============================================================================

/// Feed-forward (b) and feedback (a) taps, normalized so that a0 == 1.
/// Default-constructed coefficients pass the input through unchanged.
struct BiquadCoefficients {
    float b0 = 1.0f;
    float b1 = 0.0f;
    float b2 = 0.0f;
    float a1 = 0.0f;
    float a2 = 0.0f;

    /// Design a section.
    /// @param frequency Cutoff (LP/HP) or center (BP) in Hz, kept inside
    ///                  [kMinFilterFrequency, 0.495 * sampleRate]
    /// @param q         Clamped to [kMinQ, kMaxQ]; NaN selects kButterworthQ
    /// @param sampleRate Non-positive rates return pass-through coefficients
    [[nodiscard]] static BiquadCoefficients calculate(FilterType type, float frequency,
                                                      float q, float sampleRate) noexcept;

    /// Poles inside the unit circle (second-order stability triangle)
    [[nodiscard]] bool isStable() const noexcept {
        constexpr float kTolerance = 1e-6f;
        const bool poleRadiusOk = a2 > -1.0f - kTolerance && a2 < 1.0f + kTolerance;
        const bool poleAngleOk = std::abs(a1) < 1.0f + a2 + kTolerance;
        return poleRadiusOk && poleAngleOk;
    }

    [[nodiscard]] bool isBypass() const noexcept {
        constexpr float kTolerance = 1e-6f;
        const auto near = [](float value, float target) {
            return std::abs(value - target) < kTolerance;
        };
        return near(b0, 1.0f) && near(b1, 0.0f) && near(b2, 0.0f)
            && near(a1, 0.0f) && near(a2, 0.0f);
    }

    /// |H(e^jw)| at `frequency`. Evaluated in double precision; test and
    /// diagnostics use only.
    [[nodiscard]] float magnitudeAt(float frequency, float sampleRate) const noexcept {
        const double omega = static_cast<double>(kTwoPi) * frequency / sampleRate;
        const std::complex<double> zInv = std::polar(1.0, -omega);
        const std::complex<double> zInv2 = zInv * zInv;
        const std::complex<double> numerator =
            static_cast<double>(b0) + static_cast<double>(b1) * zInv + static_cast<double>(b2) * zInv2;
        const std::complex<double> denominator =
            1.0 + static_cast<double>(a1) * zInv + static_cast<double>(a2) * zInv2;
        return static_cast<float>(std::abs(numerator / denominator));
    }
};

// =============================================================================
// Biquad
// =============================================================================

/// One channel of TDF2 filtering:
///
/// @code
/// y      = b0*x + s1
/// s1'    = b1*x - a1*y + s2
/// s2'    = b2*x - a2*y
/// @endcode
///
/// Changing coefficients keeps s1/s2, so control-rate cutoff sweeps do not
/// click.
class Biquad {
public:
    Biquad() noexcept = default;

    explicit Biquad(const BiquadCoefficients& coeffs) noexcept
        : coeffs_(coeffs) {}

    void setCoefficients(const BiquadCoefficients& coeffs) noexcept { coeffs_ = coeffs; }

    void configure(FilterType type, float frequency, float q, float sampleRate) noexcept {
        coeffs_ = BiquadCoefficients::calculate(type, frequency, q, sampleRate);
    }

    [[nodiscard]] const BiquadCoefficients& coefficients() const noexcept { return coeffs_; }

    /// Non-finite input clears the state and yields silence.
    [[nodiscard]] float process(float x) noexcept {
        if (!detail::isFinite(x)) {
            reset();
            return 0.0f;
        }

        const float y = coeffs_.b0 * x + s1_;
        s1_ = detail::flushDenormal(coeffs_.b1 * x - coeffs_.a1 * y + s2_);
        s2_ = detail::flushDenormal(coeffs_.b2 * x - coeffs_.a2 * y);
        return y;
    }

    /// In-place
    void processBlock(float* samples, size_t count) noexcept {
        for (float* end = samples + count; samples != end; ++samples) {
            *samples = process(*samples);
        }
    }

    void reset() noexcept { s1_ = s2_ = 0.0f; }

private:
    BiquadCoefficients coeffs_;
    float s1_ = 0.0f;
    float s2_ = 0.0f;
};

// =============================================================================
// Design
// =============================================================================

inline BiquadCoefficients BiquadCoefficients::calculate(FilterType type, float frequency,
                                                        float q, float sampleRate) noexcept {
    if (!(sampleRate > 0.0f)) return {};

    const float nyquistLimit = std::max(sampleRate * kMaxFilterFrequencyRatio, kMinFilterFrequency);
    const float fc = detail::isNaN(frequency)
        ? nyquistLimit
        : std::clamp(frequency, kMinFilterFrequency, nyquistLimit);
    const float qc = detail::isNaN(q) ? kButterworthQ : std::clamp(q, kMinQ, kMaxQ);

    const float w0 = kTwoPi * fc / sampleRate;
    const float cosW0 = std::cos(w0);
    const float alpha = std::sin(w0) / (2.0f * qc);

    // Unnormalized numerator per response; the denominator is shared
    float n0 = 0.0f;
    float n1 = 0.0f;
    float n2 = 0.0f;
    switch (type) {
        case FilterType::Lowpass:
            n1 = 1.0f - cosW0;
            n0 = n2 = 0.5f * n1;
            break;
        case FilterType::Highpass:
            n1 = -(1.0f + cosW0);
            n0 = n2 = -0.5f * n1;
            break;
        case FilterType::Bandpass:
            n0 = alpha;
            n2 = -alpha;
            break;
    }

    const float norm = 1.0f / (1.0f + alpha);
    BiquadCoefficients c;
    c.b0 = n0 * norm;
    c.b1 = n1 * norm;
    c.b2 = n2 * norm;
    c.a1 = -2.0f * cosW0 * norm;
    c.a2 = (1.0f - alpha) * norm;
    return c;
}

} // namespace DSP
} // namespace Chordpad
