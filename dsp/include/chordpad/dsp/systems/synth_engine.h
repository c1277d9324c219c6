// ==============================================================================
// Layer 3: System Component - Synth Engine
// ==============================================================================
// Voice manager and patch coordinator. Per MIDI note it allocates (or
// steals) a voice, wires a filter and up to three oscillators into the audio
// graph, starts the amplitude and filter envelopes, and on every control tick
// pushes the envelope levels into oscillator gain and filter cutoff. Released
// voices are torn down once both envelopes have faded out.
//
// Voice lifecycle per note:
//   NoActive --playNote--> Sounding --stopNote--> Releasing --faded--> NoActive
//
// Thread safety: every public method takes one internal mutex, so the
// control loop's tick() and caller operations (including panic()) never
// interleave.
// ==============================================================================

#pragma once

#include <chordpad/dsp/core/control_clock.h>
#include <chordpad/dsp/core/synth_settings.h>
#include <chordpad/dsp/primitives/adsr_envelope.h>
#include <chordpad/dsp/primitives/audio_graph.h>
#include <chordpad/dsp/processors/filter_stage.h>
#include <chordpad/dsp/processors/oscillator_bank.h>
#include <chordpad/dsp/systems/voice_pool.h>

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace Chordpad {
namespace DSP {

// =============================================================================
// Configuration
// =============================================================================

/// Construction-time engine constants
struct SynthEngineConfig {
    size_t maxVoices = kDefaultMaxVoices;

    /// Envelope level at or below which a released voice is silent
    float releaseThreshold = kEnvelopeFinishedThreshold;

    /// Extra time past the longest release before teardown is forced
    double releaseGraceSeconds = 0.5;

    float initialVolume = kDefaultMasterVolume;
};

/// Externally visible state of one note
enum class NoteState : uint8_t {
    NoActive = 0,
    Sounding,
    Releasing
};

[[nodiscard]] constexpr const char* noteStateName(NoteState state) noexcept {
    switch (state) {
        case NoteState::NoActive:  return "NoActive";
        case NoteState::Sounding:  return "Sounding";
        case NoteState::Releasing: return "Releasing";
    }
    return "Unknown";
}

// =============================================================================
// SynthEngine
// =============================================================================

class SynthEngine {
public:
    /// @param graph Audio backend; must outlive the engine
    /// @param clock Time source for envelopes; must outlive the engine
    SynthEngine(AudioGraph& graph, const ControlClock& clock, SynthEngineConfig config = {});
    ~SynthEngine();

    SynthEngine(const SynthEngine&) = delete;
    SynthEngine& operator=(const SynthEngine&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Start the audio graph. Returns false (logged) if it would not start.
    bool start();

    /// Silence every voice and stop the graph.
    void shutdown();

    /// Silence every voice, then stop and restart the graph.
    bool restartEngine();

    // =========================================================================
    // Notes
    // =========================================================================

    /// Start a voice. Note is clamped to [0, 127], velocity to [1, 127].
    /// A voice already sounding this note is torn down first; a full pool
    /// evicts its oldest voice. If the graph is not running the note is
    /// dropped and a restart is attempted.
    void playNote(int note, int velocity);

    /// Release both envelopes of `note`. Teardown happens on a later tick.
    /// No-op if the note has no voice or is already releasing.
    void stopNote(int note);

    /// Tear down every voice immediately, without release.
    void stopAllNotes();

    /// Emergency silence. Same as stopAllNotes().
    void panic();

    void playChord(const std::vector<int>& notes, int velocity);
    void stopChord(const std::vector<int>& notes);

    // =========================================================================
    // Control Rate
    // =========================================================================

    /// One control period: sample both envelopes of every voice at a single
    /// "now", write gain and cutoff, and tear down faded voices.
    void tick();

    /// Clamped to [0, 1]; NaN is ignored. Re-applies gain to every voice
    /// from its current envelope level.
    void setVolume(float volume);
    [[nodiscard]] float getVolume() const;

    // =========================================================================
    // Patch
    // =========================================================================

    /// Out-of-range slots are ignored (logged). Regenerates all buffers.
    void updateOscillatorSettings(size_t slot, const OscillatorSettings& settings);
    void updateADSRSettings(const ADSRSettings& settings);
    void updateFilterADSRSettings(const ADSRSettings& settings);
    void updateFilterSettings(const FilterSettings& settings);

    /// Shortcut for oscillator 1's waveform
    void setWaveform(Waveform waveform);

    /// Shortcut for oscillator 1's pulse width
    void setPulseWidth(float pulseWidth);

    // =========================================================================
    // Observers
    // =========================================================================

    [[nodiscard]] bool isEngineRunning() const;
    [[nodiscard]] size_t activeNoteCount() const;
    [[nodiscard]] size_t totalOscillatorCount() const;
    [[nodiscard]] bool hasVoice(int note) const;
    [[nodiscard]] NoteState getNoteState(int note) const;

    /// Amplitude envelope level of `note` now (0 without a voice)
    [[nodiscard]] float amplitudeLevel(int note) const;

    /// Notes with a voice, oldest first
    [[nodiscard]] std::vector<int> activeNotes() const;

    [[nodiscard]] OscillatorSettings getOscillatorSettings(size_t slot) const;
    [[nodiscard]] ADSRSettings getADSRSettings() const;
    [[nodiscard]] ADSRSettings getFilterADSRSettings() const;
    [[nodiscard]] FilterSettings getFilterSettings() const;
    [[nodiscard]] size_t maxVoices() const noexcept { return config_.maxVoices; }

private:
    // All *Locked methods require mutex_ to be held.
    void playNoteLocked(int note, int velocity, double now);
    void stopNoteLocked(int note, double now);
    void stopAllNotesLocked();
    [[nodiscard]] bool restartEngineLocked();
    void teardownVoiceLocked(int note);
    void updateVoiceLocked(const Voice& voice, double now);

    AudioGraph& graph_;
    const ControlClock& clock_;
    SynthEngineConfig config_;

    mutable std::mutex mutex_;
    OscillatorBank oscillators_;
    FilterStage filters_;
    VoicePool voices_;
    ADSRSettings ampSettings_ = kDefaultAmpEnvelope;
    ADSRSettings filterEnvSettings_ = kDefaultFilterEnvelope;
    float masterVolume_ = kDefaultMasterVolume;
};

} // namespace DSP
} // namespace Chordpad
