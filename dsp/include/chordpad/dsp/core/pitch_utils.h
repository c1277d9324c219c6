// Layer 0: Core Utility - Pitch Conversion
#pragma once

#include <cmath>

namespace Chordpad::DSP {

/// Convert semitones to frequency ratio
/// +12 semitones = 2.0 (octave up), -12 = 0.5 (octave down), 0 = 1.0
/// @param semitones Pitch offset in semitones (-24 to +24 typical range)
/// @return Frequency ratio
[[nodiscard]] inline float semitonesToRatio(float semitones) noexcept {
    return std::pow(2.0f, semitones / 12.0f);
}

/// Convert cents to frequency ratio
/// +1200 cents = 2.0, +100 cents = one semitone
[[nodiscard]] inline float centsToRatio(float cents) noexcept {
    return std::pow(2.0f, cents / 1200.0f);
}

/// Convert octaves to frequency ratio (2^octaves)
[[nodiscard]] inline float octavesToRatio(float octaves) noexcept {
    return std::exp2(octaves);
}

} // namespace Chordpad::DSP
