// ==============================================================================
// SynthEngine Implementation
// ==============================================================================

#include "synth_engine.h"

#include <chordpad/dsp/core/db_utils.h>
#include <chordpad/dsp/core/logging.h>
#include <chordpad/dsp/core/midi_utils.h>

#include <algorithm>
#include <utility>

namespace Chordpad {
namespace DSP {

namespace {

SynthEngineConfig sanitizeConfig(SynthEngineConfig config) noexcept {
    config.maxVoices = std::max<size_t>(config.maxVoices, 1);
    if (detail::isNaN(config.releaseThreshold) || config.releaseThreshold < 0.0f) {
        config.releaseThreshold = kEnvelopeFinishedThreshold;
    }
    if (!(config.releaseGraceSeconds >= 0.0)) {
        config.releaseGraceSeconds = 0.0;
    }
    config.initialVolume = detail::isNaN(config.initialVolume)
        ? kDefaultMasterVolume
        : std::clamp(config.initialVolume, 0.0f, 1.0f);
    return config;
}

} // anonymous namespace

SynthEngine::SynthEngine(AudioGraph& graph, const ControlClock& clock, SynthEngineConfig config)
    : graph_(graph)
    , clock_(clock)
    , config_(sanitizeConfig(config))
    , oscillators_(graph)
    , filters_(graph)
    , voices_(config_.maxVoices)
    , masterVolume_(config_.initialVolume) {}

SynthEngine::~SynthEngine() {
    shutdown();
}

// =============================================================================
// Lifecycle
// =============================================================================

bool SynthEngine::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (graph_.isRunning()) return true;

    if (!graph_.start()) {
        CHORDPAD_LOG_ERROR("audio engine failed to start");
        return false;
    }
    CHORDPAD_LOG_INFO("audio engine started (%.0f Hz, %zu voices)",
                      graph_.sampleRate(), config_.maxVoices);
    return true;
}

void SynthEngine::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    stopAllNotesLocked();
    if (graph_.isRunning()) {
        graph_.stop();
        CHORDPAD_LOG_INFO("audio engine stopped");
    }
}

bool SynthEngine::restartEngine() {
    std::lock_guard<std::mutex> lock(mutex_);
    return restartEngineLocked();
}

bool SynthEngine::restartEngineLocked() {
    stopAllNotesLocked();
    graph_.stop();
    if (!graph_.start()) {
        CHORDPAD_LOG_ERROR("audio engine restart failed");
        return false;
    }
    CHORDPAD_LOG_INFO("audio engine restarted");
    return true;
}

// =============================================================================
// Notes
// =============================================================================

void SynthEngine::playNote(int note, int velocity) {
    std::lock_guard<std::mutex> lock(mutex_);
    playNoteLocked(note, velocity, clock_.now());
}

void SynthEngine::stopNote(int note) {
    std::lock_guard<std::mutex> lock(mutex_);
    stopNoteLocked(note, clock_.now());
}

void SynthEngine::stopAllNotes() {
    std::lock_guard<std::mutex> lock(mutex_);
    stopAllNotesLocked();
}

void SynthEngine::panic() {
    std::lock_guard<std::mutex> lock(mutex_);
    CHORDPAD_LOG_INFO("panic: silencing %zu voices", voices_.size());
    stopAllNotesLocked();
}

void SynthEngine::playChord(const std::vector<int>& notes, int velocity) {
    std::lock_guard<std::mutex> lock(mutex_);
    const double now = clock_.now();
    for (int note : notes) {
        playNoteLocked(note, velocity, now);
    }
}

void SynthEngine::stopChord(const std::vector<int>& notes) {
    std::lock_guard<std::mutex> lock(mutex_);
    const double now = clock_.now();
    for (int note : notes) {
        stopNoteLocked(note, now);
    }
}

void SynthEngine::playNoteLocked(int rawNote, int rawVelocity, double now) {
    if (!graph_.isRunning()) {
        const bool restarted = restartEngineLocked();
        CHORDPAD_LOG_WARNING("note %d dropped: audio engine was not running (restart %s)",
                             rawNote, restarted ? "succeeded" : "failed");
        return;
    }

    const uint8_t note = clampMidiNote(rawNote);
    const uint8_t velocity = clampNoteVelocity(rawVelocity);

    if (voices_.contains(note)) {
        teardownVoiceLocked(note);
    } else if (voices_.full()) {
        const int victim = voices_.oldest()->note;
        CHORDPAD_LOG_DEBUG("voice limit %zu reached; evicting note %d",
                           voices_.capacity(), victim);
        teardownVoiceLocked(victim);
    }

    const float baseFrequency = midiNoteToFrequency(note);
    const float velocityAmplitude = velocityToGain(velocity);

    const NodeId filterNode = filters_.createFilter(note);
    if (filterNode == kInvalidNodeId) {
        CHORDPAD_LOG_WARNING("note %d dropped: no filter available", note);
        return;
    }

    const auto players = oscillators_.createVoiceOscillators(
        note, baseFrequency, velocityAmplitude, filterNode);
    if (players.empty()) {
        filters_.removeFilter(note);
        CHORDPAD_LOG_WARNING("note %d dropped: no oscillator could be created", note);
        return;
    }

    Voice voice;
    voice.note = note;
    voice.velocity = velocity;
    voice.velocityAmplitude = velocityAmplitude;
    voice.baseFrequency = baseFrequency;
    voice.ampEnvelope.updateSettings(ampSettings_);
    voice.filterEnvelope.updateSettings(filterEnvSettings_);
    voice.ampEnvelope.noteOn(now);
    voice.filterEnvelope.noteOn(now);

    if (!voices_.insert(std::move(voice))) {
        CHORDPAD_LOG_ERROR("note %d dropped: voice pool rejected insert", note);
        oscillators_.stopOscillators(note);
        filters_.removeFilter(note);
        return;
    }

    // First control update runs now rather than one period later
    updateVoiceLocked(*voices_.find(note), now);

    CHORDPAD_LOG_DEBUG("voice created: note %d velocity %d, %zu oscillators",
                       note, velocity, players.size());
}

void SynthEngine::stopNoteLocked(int rawNote, double now) {
    Voice* voice = voices_.find(clampMidiNote(rawNote));
    if (voice == nullptr || voice->released) return;

    voice->ampEnvelope.noteOff(now);
    voice->filterEnvelope.noteOff(now);
    voice->released = true;
    voice->releaseTime = now;

    CHORDPAD_LOG_DEBUG("voice released: note %d from level %.3f",
                       voice->note, static_cast<double>(voice->ampEnvelope.releaseStartLevel()));
}

void SynthEngine::stopAllNotesLocked() {
    oscillators_.stopAll();
    filters_.stopAll();
    voices_.clear();
}

void SynthEngine::teardownVoiceLocked(int note) {
    oscillators_.stopOscillators(note);
    filters_.removeFilter(note);
    voices_.erase(note);
    CHORDPAD_LOG_DEBUG("voice torn down: note %d", note);
}

void SynthEngine::updateVoiceLocked(const Voice& voice, double now) {
    oscillators_.updateVolume(voice.note, voice.ampEnvelope.currentLevel(now), masterVolume_);
    filters_.applyEnvelope(voice.note, voice.filterEnvelope.currentLevel(now));
}

// =============================================================================
// Control Rate
// =============================================================================

void SynthEngine::tick() {
    std::lock_guard<std::mutex> lock(mutex_);
    const double now = clock_.now();

    std::vector<int> finished;
    for (const Voice& voice : voices_) {
        updateVoiceLocked(voice, now);

        if (!voice.released) continue;

        if (voice.ampEnvelope.isFinished(now, config_.releaseThreshold) &&
            voice.filterEnvelope.isFinished(now, config_.releaseThreshold)) {
            finished.push_back(voice.note);
            continue;
        }

        const double longestRelease = std::max(voice.ampEnvelope.getSettings().release,
                                               voice.filterEnvelope.getSettings().release);
        if (now - voice.releaseTime > longestRelease + config_.releaseGraceSeconds) {
            CHORDPAD_LOG_WARNING("note %d still audible %.2f s after release; forcing teardown",
                                 voice.note, now - voice.releaseTime);
            finished.push_back(voice.note);
        }
    }

    for (int note : finished) {
        teardownVoiceLocked(note);
    }
}

void SynthEngine::setVolume(float volume) {
    if (detail::isNaN(volume)) return;

    std::lock_guard<std::mutex> lock(mutex_);
    masterVolume_ = std::clamp(volume, 0.0f, 1.0f);

    const double now = clock_.now();
    for (const Voice& voice : voices_) {
        oscillators_.updateVolume(voice.note, voice.ampEnvelope.currentLevel(now), masterVolume_);
    }
}

float SynthEngine::getVolume() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return masterVolume_;
}

// =============================================================================
// Patch
// =============================================================================

void SynthEngine::updateOscillatorSettings(size_t slot, const OscillatorSettings& settings) {
    if (slot >= kNumOscillators) {
        CHORDPAD_LOG_WARNING("ignoring settings for oscillator slot %zu", slot);
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    oscillators_.setSettings(slot, settings);
    oscillators_.regenerateAll();
}

void SynthEngine::updateADSRSettings(const ADSRSettings& settings) {
    std::lock_guard<std::mutex> lock(mutex_);
    ampSettings_ = sanitize(settings);
    for (Voice& voice : voices_) {
        voice.ampEnvelope.updateSettings(ampSettings_);
    }
}

void SynthEngine::updateFilterADSRSettings(const ADSRSettings& settings) {
    std::lock_guard<std::mutex> lock(mutex_);
    filterEnvSettings_ = sanitize(settings);
    for (Voice& voice : voices_) {
        voice.filterEnvelope.updateSettings(filterEnvSettings_);
    }
}

void SynthEngine::updateFilterSettings(const FilterSettings& settings) {
    std::lock_guard<std::mutex> lock(mutex_);
    filters_.updateSettings(settings);
}

void SynthEngine::setWaveform(Waveform waveform) {
    std::lock_guard<std::mutex> lock(mutex_);
    OscillatorSettings settings = oscillators_.getSettings(0);
    settings.waveform = waveform;
    oscillators_.setSettings(0, settings);
    oscillators_.regenerateAll();
}

void SynthEngine::setPulseWidth(float pulseWidth) {
    std::lock_guard<std::mutex> lock(mutex_);
    OscillatorSettings settings = oscillators_.getSettings(0);
    settings.pulseWidth = pulseWidth;
    oscillators_.setSettings(0, settings);
    oscillators_.regenerateAll();
}

// =============================================================================
// Observers
// =============================================================================

bool SynthEngine::isEngineRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return graph_.isRunning();
}

size_t SynthEngine::activeNoteCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return voices_.size();
}

size_t SynthEngine::totalOscillatorCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return oscillators_.totalOscillatorCount();
}

bool SynthEngine::hasVoice(int note) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return voices_.contains(note);
}

NoteState SynthEngine::getNoteState(int note) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Voice* voice = voices_.find(note);
    if (voice == nullptr) return NoteState::NoActive;
    return voice->released ? NoteState::Releasing : NoteState::Sounding;
}

float SynthEngine::amplitudeLevel(int note) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Voice* voice = voices_.find(note);
    return voice == nullptr ? 0.0f : voice->ampEnvelope.currentLevel(clock_.now());
}

std::vector<int> SynthEngine::activeNotes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return voices_.notes();
}

OscillatorSettings SynthEngine::getOscillatorSettings(size_t slot) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slot < kNumOscillators ? oscillators_.getSettings(slot) : OscillatorSettings{};
}

ADSRSettings SynthEngine::getADSRSettings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ampSettings_;
}

ADSRSettings SynthEngine::getFilterADSRSettings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return filterEnvSettings_;
}

FilterSettings SynthEngine::getFilterSettings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return filters_.getSettings();
}

} // namespace DSP
} // namespace Chordpad
