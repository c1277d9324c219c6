// ==============================================================================
// Layer 2: DSP Processor - Oscillator Bank
// ==============================================================================
// Owns the looped single-cycle players of every sounding note. Each note gets
// a private mixer node routed into the caller's destination (the note's
// filter), and one player per audible oscillator slot feeding that mixer.
//
// Buffers are rendered at amplitude velocityAmplitude * level; the envelope
// is applied at control rate through player gain (envelopeLevel * master).
//
// Not thread-safe. The owning SynthEngine serializes all calls.
// ==============================================================================

#pragma once

#include <chordpad/dsp/core/random.h>
#include <chordpad/dsp/core/synth_settings.h>
#include <chordpad/dsp/primitives/audio_graph.h>
#include <chordpad/dsp/primitives/loop_buffer.h>

#include <array>
#include <cstddef>
#include <map>
#include <memory>
#include <vector>

namespace Chordpad {
namespace DSP {

/// @brief Per-note DCO voices built from the three shared oscillator slots.
///
/// @par Failure handling
/// A slot whose buffer or player cannot be created is logged and left out of
/// the note. A note with no playable slot is not registered at all and
/// createVoiceOscillators() returns an empty list.
class OscillatorBank {
public:
    /// @param graph Must outlive the bank
    explicit OscillatorBank(AudioGraph& graph);
    ~OscillatorBank();

    OscillatorBank(const OscillatorBank&) = delete;
    OscillatorBank& operator=(const OscillatorBank&) = delete;

    // =========================================================================
    // Note Lifecycle
    // =========================================================================

    /// Build players for every non-silent slot of `note`, routed through a
    /// per-note mixer into `destination`. Players start at gain 0.
    /// An existing set for `note` is stopped first.
    /// @return Player node ids (empty if no slot could be created)
    [[nodiscard]] std::vector<NodeId> createVoiceOscillators(
        int note,
        float baseFrequency,
        float velocityAmplitude,
        NodeId destination);

    /// Destroy all players and the mixer of `note`. No-op for unknown notes.
    void stopOscillators(int note);

    void stopAll();

    /// Set every player of `note` to envelopeLevel * masterVolume.
    void updateVolume(int note, float envelopeLevel, float masterVolume);

    /// Rebuild every note's buffers from the current slot settings at the
    /// note's original frequency and velocity amplitude. Slots that became
    /// audible get a player at the note's last applied gain; slots that went
    /// silent lose theirs. Loops restart at phase 0.
    void regenerateAll();

    // =========================================================================
    // Slot Settings
    // =========================================================================

    /// Store new settings for `slot` (sanitized). Does not regenerate.
    /// Out-of-range slots are ignored.
    void setSettings(size_t slot, const OscillatorSettings& settings) noexcept;

    /// @pre slot < kNumOscillators
    [[nodiscard]] const OscillatorSettings& getSettings(size_t slot) const noexcept {
        return settings_[slot];
    }

    /// Reseed the noise generator (for reproducible renders)
    void seedNoise(uint32_t seed) noexcept { noise_.seed(seed); }

    // =========================================================================
    // Observers
    // =========================================================================

    [[nodiscard]] bool hasNote(int note) const noexcept;
    [[nodiscard]] size_t activeNoteCount() const noexcept { return notes_.size(); }
    [[nodiscard]] size_t totalOscillatorCount() const noexcept;
    [[nodiscard]] size_t oscillatorCount(int note) const noexcept;

    /// Gain most recently applied to the players of `note` (0 if unknown)
    [[nodiscard]] float lastGain(int note) const noexcept;

    /// baseFrequency * 2^(pitch/12) * 2^(detune/1200)
    [[nodiscard]] static float oscillatorFrequency(float baseFrequency,
                                                   const OscillatorSettings& settings) noexcept;

private:
    struct NoteOscillators {
        float baseFrequency = 0.0f;
        float velocityAmplitude = 0.0f;
        NodeId mixer = kInvalidNodeId;
        std::array<NodeId, kNumOscillators> players{};
        float lastGain = 0.0f;
    };

    /// Build the cycle for one slot. Returns nullptr on failure (logged).
    [[nodiscard]] std::shared_ptr<const LoopBuffer> buildSlotBuffer(
        int note, size_t slot, const NoteOscillators& entry);

    /// Create, wire and start a player for one slot at `gain`.
    /// Returns kInvalidNodeId on failure (logged, nothing left behind).
    [[nodiscard]] NodeId createSlotPlayer(int note, size_t slot,
                                          const NoteOscillators& entry, float gain);

    void destroyNote(NoteOscillators& entry);

    AudioGraph& graph_;
    std::array<OscillatorSettings, kNumOscillators> settings_ = kDefaultOscillatorPatch;
    std::map<int, NoteOscillators> notes_;
    Xorshift32 noise_;
};

} // namespace DSP
} // namespace Chordpad
