#pragma once

// ==============================================================================
// Chordpad Dropdown Mappings
// ==============================================================================
// Explicit conversion between dropdown indices and DSP enums, plus the
// display strings. The dropdown order is the UI order; it is mapped through
// lookup tables rather than casts so the two can never silently desync.
// ==============================================================================

#include <chordpad/dsp/core/synth_types.h>

#include <algorithm>
#include <cmath>

namespace Chordpad {

// =============================================================================
// Normalized <-> index
// =============================================================================

/// Map a normalized value onto one of `count` evenly spaced steps.
[[nodiscard]] inline int dropdownIndexFromNormalized(double value, int count) noexcept {
    if (count <= 1) return 0;
    if (!(value >= 0.0)) value = 0.0;  // also catches NaN
    return std::clamp(static_cast<int>(value * (count - 1) + 0.5), 0, count - 1);
}

[[nodiscard]] constexpr double normalizedFromDropdownIndex(int index, int count) noexcept {
    if (count <= 1) return 0.0;
    const int clamped = index < 0 ? 0 : (index >= count ? count - 1 : index);
    return static_cast<double>(clamped) / static_cast<double>(count - 1);
}

// =============================================================================
// Waveform dropdown (6 entries)
// =============================================================================

inline constexpr int kWaveformDropdownCount = 6;

inline const char* const kWaveformStrings[] = {
    "Sine",
    "Triangle",
    "Saw",
    "Square",
    "Pulse",
    "Noise",
};

/// Defaults to Sine for out-of-range indices
[[nodiscard]] constexpr DSP::Waveform getWaveformFromDropdown(int index) noexcept {
    using DSP::Waveform;
    constexpr Waveform kLookup[] = {
        Waveform::Sine,
        Waveform::Triangle,
        Waveform::Sawtooth,
        Waveform::Square,
        Waveform::Pulse,
        Waveform::Noise,
    };
    if (index < 0 || index >= kWaveformDropdownCount) return Waveform::Sine;
    return kLookup[index];
}

[[nodiscard]] constexpr int getDropdownFromWaveform(DSP::Waveform waveform) noexcept {
    using DSP::Waveform;
    switch (waveform) {
        case Waveform::Sine:     return 0;
        case Waveform::Triangle: return 1;
        case Waveform::Sawtooth: return 2;
        case Waveform::Square:   return 3;
        case Waveform::Pulse:    return 4;
        case Waveform::Noise:    return 5;
    }
    return 0;
}

// =============================================================================
// Filter type dropdown (3 entries)
// =============================================================================

inline constexpr int kFilterTypeDropdownCount = 3;

inline const char* const kFilterTypeStrings[] = {
    "Low Pass",
    "High Pass",
    "Band Pass",
};

/// Defaults to Lowpass for out-of-range indices
[[nodiscard]] constexpr DSP::FilterType getFilterTypeFromDropdown(int index) noexcept {
    using DSP::FilterType;
    constexpr FilterType kLookup[] = {
        FilterType::Lowpass,
        FilterType::Highpass,
        FilterType::Bandpass,
    };
    if (index < 0 || index >= kFilterTypeDropdownCount) return FilterType::Lowpass;
    return kLookup[index];
}

[[nodiscard]] constexpr int getDropdownFromFilterType(DSP::FilterType type) noexcept {
    using DSP::FilterType;
    switch (type) {
        case FilterType::Lowpass:  return 0;
        case FilterType::Highpass: return 1;
        case FilterType::Bandpass: return 2;
    }
    return 0;
}

} // namespace Chordpad
