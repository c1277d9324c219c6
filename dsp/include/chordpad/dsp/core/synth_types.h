// ==============================================================================
// Layer 0: Core Utilities
// synth_types.h - Closed Enumerations Shared Across the Synth
// ==============================================================================

#pragma once

#include <cstddef>
#include <cstdint>

namespace Chordpad {
namespace DSP {

/// @brief Single-cycle oscillator waveform.
enum class Waveform : uint8_t {
    Sine = 0,
    Triangle,
    Sawtooth,
    Square,
    Pulse,     ///< Duty cycle set by pulseWidth
    Noise      ///< White noise, fresh on every buffer regeneration
};

inline constexpr size_t kWaveformCount = 6;

/// @brief Band characteristic of the per-voice resonant filter.
enum class FilterType : uint8_t {
    Lowpass = 0,   ///< 12 dB/oct lowpass, -3dB at cutoff
    Highpass,      ///< 12 dB/oct highpass, -3dB at cutoff
    Bandpass       ///< Constant 0 dB peak gain
};

inline constexpr size_t kFilterTypeCount = 3;

[[nodiscard]] constexpr const char* waveformName(Waveform waveform) noexcept {
    switch (waveform) {
        case Waveform::Sine:     return "Sine";
        case Waveform::Triangle: return "Triangle";
        case Waveform::Sawtooth: return "Sawtooth";
        case Waveform::Square:   return "Square";
        case Waveform::Pulse:    return "Pulse";
        case Waveform::Noise:    return "Noise";
    }
    return "Unknown";
}

[[nodiscard]] constexpr const char* filterTypeName(FilterType type) noexcept {
    switch (type) {
        case FilterType::Lowpass:  return "Low Pass";
        case FilterType::Highpass: return "High Pass";
        case FilterType::Bandpass: return "Band Pass";
    }
    return "Unknown";
}

} // namespace DSP
} // namespace Chordpad
