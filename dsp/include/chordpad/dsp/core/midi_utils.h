// ==============================================================================
// Layer 0: Core Utilities
// midi_utils.h - MIDI note/velocity clamping and conversion
// ==============================================================================
// Real-time safe, constexpr. Depends only on db_utils.h.
// ==============================================================================

#pragma once

#include <chordpad/dsp/core/db_utils.h>  // For detail::constexprExp

#include <cstdint>

namespace Chordpad {
namespace DSP {

// ==============================================================================
// Constants
// ==============================================================================

inline constexpr float kA4FrequencyHz = 440.0f;
inline constexpr int kA4MidiNote = 69;

/// Note range of the pads and of SynthEngine::playNote()
inline constexpr int kMinMidiNote = 0;
inline constexpr int kMaxMidiNote = 127;

/// Velocity 0 means note-off on the wire, so a sounding note starts at 1
inline constexpr int kMinNoteVelocity = 1;
inline constexpr int kMaxMidiVelocity = 127;

// ==============================================================================
// Functions
// ==============================================================================

/// Equal-tempered pitch of a MIDI note: a4 * 2^((note - 69) / 12).
/// Constexpr; 60 -> 261.63 Hz, 69 -> 440 Hz.
[[nodiscard]] constexpr float midiNoteToFrequency(int midiNote,
                                                  float a4Frequency = kA4FrequencyHz) noexcept {
    constexpr float kSemitoneLog = 0.0577622650f;  // ln(2) / 12
    return a4Frequency
         * detail::constexprExp(static_cast<float>(midiNote - kA4MidiNote) * kSemitoneLog);
}

/// Clamp an arbitrary integer to the MIDI note range [0, 127].
[[nodiscard]] constexpr uint8_t clampMidiNote(int note) noexcept {
    const int clamped = (note < kMinMidiNote) ? kMinMidiNote
                      : (note > kMaxMidiNote) ? kMaxMidiNote
                      : note;
    return static_cast<uint8_t>(clamped);
}

/// Clamp an arbitrary integer to the sounding velocity range [1, 127].
[[nodiscard]] constexpr uint8_t clampNoteVelocity(int velocity) noexcept {
    const int clamped = (velocity < kMinNoteVelocity) ? kMinNoteVelocity
                      : (velocity > kMaxMidiVelocity) ? kMaxMidiVelocity
                      : velocity;
    return static_cast<uint8_t>(clamped);
}

/// Linear velocity amplitude, velocity / 127 over [0, 127].
/// This is the per-voice scale baked into oscillator buffers.
[[nodiscard]] constexpr float velocityToGain(int velocity) noexcept {
    if (velocity <= 0) return 0.0f;
    if (velocity >= kMaxMidiVelocity) return 1.0f;
    return static_cast<float>(velocity) / static_cast<float>(kMaxMidiVelocity);
}

}  // namespace DSP
}  // namespace Chordpad
