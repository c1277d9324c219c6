// ==============================================================================
// Layer 1: DSP Primitive - Waveform Generator
// ==============================================================================
// Stateless single-sample waveform evaluation over a normalized phase [0, 1).
// Used to fill the looped single-cycle buffers of the oscillator bank; not a
// running oscillator, so there is no phase accumulator and no band-limiting.
//
// Every periodic waveform is a pure function of (phase, amplitude, pulseWidth)
// and stays within [-amplitude, +amplitude]. Noise draws from a caller-owned
// generator.
//
// Real-time safe: noexcept, no allocations.
// ==============================================================================

#pragma once

#include <chordpad/dsp/core/math_constants.h>
#include <chordpad/dsp/core/random.h>
#include <chordpad/dsp/core/synth_types.h>

#include <cmath>

namespace Chordpad {
namespace DSP {

/// @brief Wrap an arbitrary phase into [0, 1).
[[nodiscard]] inline double wrapUnitPhase(double phase) noexcept {
    if (phase >= 0.0 && phase < 1.0) return phase;
    const double wrapped = phase - std::floor(phase);
    // floor() rounding can land exactly on 1.0 for tiny negative inputs
    return wrapped >= 1.0 ? 0.0 : wrapped;
}

/// @brief Evaluate a periodic waveform at `phase`.
///
/// @param phase      Normalized phase; values outside [0, 1) are wrapped
/// @param waveform   Waveform shape. Noise is not periodic and yields 0 here.
/// @param amplitude  Peak amplitude
/// @param pulseWidth Duty cycle for Waveform::Pulse (high while phase < width)
[[nodiscard]] inline float periodicWaveformSample(
    double phase,
    Waveform waveform,
    float amplitude,
    float pulseWidth
) noexcept {
    const double p = wrapUnitPhase(phase);

    switch (waveform) {
        case Waveform::Sine:
            return amplitude * static_cast<float>(std::sin(static_cast<double>(kTwoPi) * p));
        case Waveform::Triangle:
            return p < 0.5
                ? amplitude * static_cast<float>(4.0 * p - 1.0)
                : amplitude * static_cast<float>(3.0 - 4.0 * p);
        case Waveform::Sawtooth:
            return amplitude * static_cast<float>(2.0 * p - 1.0);
        case Waveform::Square:
            return p < 0.5 ? amplitude : -amplitude;
        case Waveform::Pulse:
            return p < static_cast<double>(pulseWidth) ? amplitude : -amplitude;
        case Waveform::Noise:
            break;
    }
    return 0.0f;
}

/// @brief Evaluate any waveform, including noise, at `phase`.
///
/// Identical to periodicWaveformSample() for the periodic shapes. For
/// Waveform::Noise the phase is ignored and a fresh uniform value in
/// [-amplitude, +amplitude] is drawn from `noise`.
[[nodiscard]] inline float generateWaveformSample(
    double phase,
    Waveform waveform,
    float amplitude,
    float pulseWidth,
    Xorshift32& noise
) noexcept {
    if (waveform == Waveform::Noise) {
        return amplitude * noise.nextFloat();
    }
    return periodicWaveformSample(phase, waveform, amplitude, pulseWidth);
}

} // namespace DSP
} // namespace Chordpad
