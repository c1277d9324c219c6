#pragma once

// ==============================================================================
// Oscillator Parameters (ID 100-199)
// ==============================================================================
// Three identical slots, 10 IDs apart. Each slot maps onto one
// DSP::OscillatorSettings snapshot.
// ==============================================================================

#include "param_ids.h"
#include "parameters/dropdown_mappings.h"

#include <chordpad/dsp/core/synth_settings.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cmath>
#include <cstddef>
#include <cstdio>

namespace Chordpad {

struct OscillatorParams {
    std::atomic<int> waveform{0};          // Dropdown index (0-5)
    std::atomic<float> pitch{0.0f};        // -24 to +24 semitones (integer steps)
    std::atomic<float> detune{0.0f};       // -100 to +100 cents
    std::atomic<float> level{1.0f};        // 0-1
    std::atomic<float> pulseWidth{0.5f};   // 0.1-0.9

    OscillatorParams() = default;

    explicit OscillatorParams(const DSP::OscillatorSettings& s)
        : waveform(getDropdownFromWaveform(s.waveform))
        , pitch(s.pitch)
        , detune(s.detune)
        , level(s.level)
        , pulseWidth(s.pulseWidth) {}
};

struct OscillatorBankParams {
    std::array<OscillatorParams, DSP::kNumOscillators> slots{{
        OscillatorParams(DSP::kDefaultOscillatorPatch[0]),
        OscillatorParams(DSP::kDefaultOscillatorPatch[1]),
        OscillatorParams(DSP::kDefaultOscillatorPatch[2]),
    }};
};

// =============================================================================
// Mappings
// =============================================================================

/// 0-1 -> -24..+24 semitones, rounded to whole semitones
[[nodiscard]] inline float pitchFromNormalized(ParamValue value) noexcept {
    const double clamped = std::clamp(value, 0.0, 1.0);
    return static_cast<float>(std::round(-24.0 + clamped * 48.0));
}

/// 0-1 -> -100..+100 cents
[[nodiscard]] inline float detuneFromNormalized(ParamValue value) noexcept {
    return static_cast<float>(-100.0 + std::clamp(value, 0.0, 1.0) * 200.0);
}

/// 0-1 -> 0.1..0.9
[[nodiscard]] inline float pulseWidthFromNormalized(ParamValue value) noexcept {
    return static_cast<float>(0.1 + std::clamp(value, 0.0, 1.0) * 0.8);
}

// =============================================================================
// Change handling
// =============================================================================

/// @return true if `id` addresses an oscillator parameter of a valid slot
inline bool handleOscillatorParamChange(OscillatorBankParams& params, ParamID id, ParamValue value) {
    if (!isOscillatorParam(id)) return false;
    const size_t slot = oscSlotForParam(id);
    if (slot >= DSP::kNumOscillators) return false;

    OscillatorParams& osc = params.slots[slot];
    switch (oscParamOffset(id)) {
        case kOscWaveformOffset:
            osc.waveform.store(dropdownIndexFromNormalized(value, kWaveformDropdownCount),
                               std::memory_order_relaxed);
            return true;
        case kOscPitchOffset:
            osc.pitch.store(pitchFromNormalized(value), std::memory_order_relaxed);
            return true;
        case kOscDetuneOffset:
            osc.detune.store(detuneFromNormalized(value), std::memory_order_relaxed);
            return true;
        case kOscLevelOffset:
            osc.level.store(static_cast<float>(std::clamp(value, 0.0, 1.0)),
                            std::memory_order_relaxed);
            return true;
        case kOscPulseWidthOffset:
            osc.pulseWidth.store(pulseWidthFromNormalized(value), std::memory_order_relaxed);
            return true;
        default:
            return false;
    }
}

inline bool formatOscillatorParam(ParamID id, ParamValue value, char* text, size_t size) {
    if (!isOscillatorParam(id) || oscSlotForParam(id) >= DSP::kNumOscillators) return false;

    switch (oscParamOffset(id)) {
        case kOscWaveformOffset:
            std::snprintf(text, size, "%s",
                kWaveformStrings[dropdownIndexFromNormalized(value, kWaveformDropdownCount)]);
            return true;
        case kOscPitchOffset:
            std::snprintf(text, size, "%+.0f st", static_cast<double>(pitchFromNormalized(value)));
            return true;
        case kOscDetuneOffset:
            std::snprintf(text, size, "%+.1f ct", static_cast<double>(detuneFromNormalized(value)));
            return true;
        case kOscLevelOffset:
            std::snprintf(text, size, "%.0f%%", std::clamp(value, 0.0, 1.0) * 100.0);
            return true;
        case kOscPulseWidthOffset:
            std::snprintf(text, size, "%.0f%%",
                          static_cast<double>(pulseWidthFromNormalized(value)) * 100.0);
            return true;
        default:
            return false;
    }
}

[[nodiscard]] inline DSP::OscillatorSettings toSettings(const OscillatorParams& params) {
    DSP::OscillatorSettings s;
    s.waveform = getWaveformFromDropdown(params.waveform.load(std::memory_order_relaxed));
    s.pitch = params.pitch.load(std::memory_order_relaxed);
    s.detune = params.detune.load(std::memory_order_relaxed);
    s.level = params.level.load(std::memory_order_relaxed);
    s.pulseWidth = params.pulseWidth.load(std::memory_order_relaxed);
    return DSP::sanitize(s);
}

} // namespace Chordpad
