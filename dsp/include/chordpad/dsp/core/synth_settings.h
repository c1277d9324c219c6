// ==============================================================================
// Layer 0: Core Utilities
// synth_settings.h - Patch Parameter Snapshots
// ==============================================================================
// Immutable value snapshots of the shared patch: three oscillator slots, the
// amplitude and filter ADSRs, and the filter. Voices copy what they need at
// creation time; the synth engine owns the live values.
//
// sanitize() implements the clamping policy: out-of-range values are clamped
// to the documented range, NaN fields fall back to their defaults, and
// unknown enum values fall back to the default enumerator.
// ==============================================================================

#pragma once

#include <chordpad/dsp/core/db_utils.h>
#include <chordpad/dsp/core/synth_types.h>

#include <algorithm>
#include <array>
#include <cstddef>

namespace Chordpad {
namespace DSP {

// =============================================================================
// Ranges
// =============================================================================

inline constexpr size_t kNumOscillators = 3;

inline constexpr float kMinPitchSemitones = -24.0f;
inline constexpr float kMaxPitchSemitones = 24.0f;
inline constexpr float kMinDetuneCents = -100.0f;
inline constexpr float kMaxDetuneCents = 100.0f;
inline constexpr float kMinPulseWidth = 0.1f;
inline constexpr float kMaxPulseWidth = 0.9f;

inline constexpr float kMinEnvelopeTimeSeconds = 0.0001f;
inline constexpr float kMaxEnvelopeTimeSeconds = 10.0f;

inline constexpr float kMinCutoffHz = 20.0f;
inline constexpr float kMaxCutoffHz = 20000.0f;
inline constexpr float kMinResonance = 0.1f;
inline constexpr float kMaxResonance = 30.0f;

// =============================================================================
// OscillatorSettings
// =============================================================================

struct OscillatorSettings {
    Waveform waveform = Waveform::Sine;
    float pitch = 0.0f;        ///< Semitones, [-24, +24]
    float detune = 0.0f;       ///< Cents, [-100, +100]
    float level = 1.0f;        ///< [0, 1]; 0 silences the slot entirely
    float pulseWidth = 0.5f;   ///< [0.1, 0.9]; only used by Waveform::Pulse

    [[nodiscard]] bool isSilent() const noexcept { return level <= 0.0f; }

    bool operator==(const OscillatorSettings&) const = default;
};

// =============================================================================
// ADSRSettings
// =============================================================================

struct ADSRSettings {
    float attack = 0.1f;    ///< Seconds, > 0
    float decay = 0.4f;     ///< Seconds, > 0
    float sustain = 0.7f;   ///< Level, [0, 1]
    float release = 0.8f;   ///< Seconds, > 0

    bool operator==(const ADSRSettings&) const = default;
};

// =============================================================================
// FilterSettings
// =============================================================================

struct FilterSettings {
    FilterType type = FilterType::Lowpass;
    float cutoff = 1000.0f;        ///< Base cutoff in Hz, [20, 20000]
    float resonance = 1.0f;        ///< Q factor, [0.1, 30]
    float envelopeAmount = 0.0f;   ///< [-1, +1]; positive opens the filter

    bool operator==(const FilterSettings&) const = default;
};

// =============================================================================
// Patch Defaults
// =============================================================================

/// Three slightly detuned saws: a classic supersaw-style pad.
inline constexpr std::array<OscillatorSettings, kNumOscillators> kDefaultOscillatorPatch{{
    {Waveform::Sawtooth, 0.0f, 0.0f, 1.0f, 0.5f},
    {Waveform::Sawtooth, 0.0f, 20.0f, 1.0f, 0.5f},
    {Waveform::Sawtooth, 0.0f, -12.0f, 1.0f, 0.5f},
}};

inline constexpr ADSRSettings kDefaultAmpEnvelope{0.1f, 0.4f, 0.7f, 0.8f};
inline constexpr ADSRSettings kDefaultFilterEnvelope{0.1f, 0.3f, 0.7f, 0.5f};
inline constexpr FilterSettings kDefaultFilterSettings{};
inline constexpr float kDefaultMasterVolume = 0.5f;

// =============================================================================
// Sanitizers
// =============================================================================

namespace detail {

[[nodiscard]] constexpr float clampOr(float value, float lo, float hi, float fallback) noexcept {
    return isNaN(value) ? fallback : std::clamp(value, lo, hi);
}

} // namespace detail

[[nodiscard]] constexpr OscillatorSettings sanitize(const OscillatorSettings& s) noexcept {
    const OscillatorSettings defaults{};
    OscillatorSettings out;
    out.waveform = static_cast<size_t>(s.waveform) < kWaveformCount ? s.waveform : defaults.waveform;
    out.pitch = detail::clampOr(s.pitch, kMinPitchSemitones, kMaxPitchSemitones, defaults.pitch);
    out.detune = detail::clampOr(s.detune, kMinDetuneCents, kMaxDetuneCents, defaults.detune);
    out.level = detail::clampOr(s.level, 0.0f, 1.0f, defaults.level);
    out.pulseWidth = detail::clampOr(s.pulseWidth, kMinPulseWidth, kMaxPulseWidth, defaults.pulseWidth);
    return out;
}

[[nodiscard]] constexpr ADSRSettings sanitize(const ADSRSettings& s) noexcept {
    const ADSRSettings defaults{};
    ADSRSettings out;
    out.attack = detail::clampOr(s.attack, kMinEnvelopeTimeSeconds, kMaxEnvelopeTimeSeconds, defaults.attack);
    out.decay = detail::clampOr(s.decay, kMinEnvelopeTimeSeconds, kMaxEnvelopeTimeSeconds, defaults.decay);
    out.sustain = detail::clampOr(s.sustain, 0.0f, 1.0f, defaults.sustain);
    out.release = detail::clampOr(s.release, kMinEnvelopeTimeSeconds, kMaxEnvelopeTimeSeconds, defaults.release);
    return out;
}

[[nodiscard]] constexpr FilterSettings sanitize(const FilterSettings& s) noexcept {
    const FilterSettings defaults{};
    FilterSettings out;
    out.type = static_cast<size_t>(s.type) < kFilterTypeCount ? s.type : defaults.type;
    out.cutoff = detail::clampOr(s.cutoff, kMinCutoffHz, kMaxCutoffHz, defaults.cutoff);
    out.resonance = detail::clampOr(s.resonance, kMinResonance, kMaxResonance, defaults.resonance);
    out.envelopeAmount = detail::clampOr(s.envelopeAmount, -1.0f, 1.0f, defaults.envelopeAmount);
    return out;
}

} // namespace DSP
} // namespace Chordpad
