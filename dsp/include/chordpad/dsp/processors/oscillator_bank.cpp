// ==============================================================================
// OscillatorBank Implementation
// ==============================================================================

#include "oscillator_bank.h"

#include <chordpad/dsp/core/logging.h>
#include <chordpad/dsp/core/pitch_utils.h>

#include <new>
#include <utility>

namespace Chordpad {
namespace DSP {

OscillatorBank::OscillatorBank(AudioGraph& graph)
    : graph_(graph)
    , noise_(makeEntropySeed()) {}

OscillatorBank::~OscillatorBank() {
    stopAll();
}

// =============================================================================
// Note Lifecycle
// =============================================================================

std::vector<NodeId> OscillatorBank::createVoiceOscillators(
    int note,
    float baseFrequency,
    float velocityAmplitude,
    NodeId destination
) {
    stopOscillators(note);

    std::vector<NodeId> created;

    NoteOscillators entry;
    entry.baseFrequency = baseFrequency;
    entry.velocityAmplitude = velocityAmplitude;

    entry.mixer = graph_.createMixer();
    if (entry.mixer == kInvalidNodeId) {
        CHORDPAD_LOG_WARNING("note %d: could not allocate oscillator mixer", note);
        return created;
    }
    if (!graph_.connect(entry.mixer, destination)) {
        CHORDPAD_LOG_WARNING("note %d: could not route oscillator mixer to node %u",
                             note, destination);
        graph_.destroyNode(entry.mixer);
        return created;
    }

    for (size_t slot = 0; slot < kNumOscillators; ++slot) {
        if (settings_[slot].isSilent()) continue;

        const NodeId player = createSlotPlayer(note, slot, entry, 0.0f);
        if (player != kInvalidNodeId) {
            entry.players[slot] = player;
            created.push_back(player);
        }
    }

    if (created.empty()) {
        graph_.destroyNode(entry.mixer);
        return created;
    }

    notes_[note] = entry;
    return created;
}

void OscillatorBank::stopOscillators(int note) {
    auto it = notes_.find(note);
    if (it == notes_.end()) return;

    destroyNote(it->second);
    notes_.erase(it);
}

void OscillatorBank::stopAll() {
    for (auto& [note, entry] : notes_) {
        destroyNote(entry);
    }
    notes_.clear();
}

void OscillatorBank::updateVolume(int note, float envelopeLevel, float masterVolume) {
    auto it = notes_.find(note);
    if (it == notes_.end()) return;

    const float gain = envelopeLevel * masterVolume;
    it->second.lastGain = gain;
    for (NodeId player : it->second.players) {
        if (player != kInvalidNodeId) {
            graph_.setVolume(player, gain);
        }
    }
}

void OscillatorBank::regenerateAll() {
    for (auto& [note, entry] : notes_) {
        for (size_t slot = 0; slot < kNumOscillators; ++slot) {
            NodeId& player = entry.players[slot];

            if (settings_[slot].isSilent()) {
                if (player != kInvalidNodeId) {
                    graph_.destroyNode(player);
                    player = kInvalidNodeId;
                }
                continue;
            }

            if (player == kInvalidNodeId) {
                player = createSlotPlayer(note, slot, entry, entry.lastGain);
                continue;
            }

            auto buffer = buildSlotBuffer(note, slot, entry);
            if (!buffer || !graph_.scheduleLoop(player, std::move(buffer))) {
                CHORDPAD_LOG_WARNING("note %d: dropping oscillator %zu after failed regeneration",
                                     note, slot + 1);
                graph_.destroyNode(player);
                player = kInvalidNodeId;
            }
        }
    }
}

// =============================================================================
// Slot Settings
// =============================================================================

void OscillatorBank::setSettings(size_t slot, const OscillatorSettings& settings) noexcept {
    if (slot >= kNumOscillators) return;
    settings_[slot] = sanitize(settings);
}

// =============================================================================
// Observers
// =============================================================================

bool OscillatorBank::hasNote(int note) const noexcept {
    return notes_.find(note) != notes_.end();
}

size_t OscillatorBank::totalOscillatorCount() const noexcept {
    size_t count = 0;
    for (const auto& [note, entry] : notes_) {
        for (NodeId player : entry.players) {
            if (player != kInvalidNodeId) ++count;
        }
    }
    return count;
}

size_t OscillatorBank::oscillatorCount(int note) const noexcept {
    auto it = notes_.find(note);
    if (it == notes_.end()) return 0;

    size_t count = 0;
    for (NodeId player : it->second.players) {
        if (player != kInvalidNodeId) ++count;
    }
    return count;
}

float OscillatorBank::lastGain(int note) const noexcept {
    auto it = notes_.find(note);
    return it == notes_.end() ? 0.0f : it->second.lastGain;
}

float OscillatorBank::oscillatorFrequency(float baseFrequency,
                                          const OscillatorSettings& settings) noexcept {
    return baseFrequency * semitonesToRatio(settings.pitch) * centsToRatio(settings.detune);
}

// =============================================================================
// Internals
// =============================================================================

std::shared_ptr<const LoopBuffer> OscillatorBank::buildSlotBuffer(
    int note,
    size_t slot,
    const NoteOscillators& entry
) {
    const OscillatorSettings& settings = settings_[slot];
    const float frequency = oscillatorFrequency(entry.baseFrequency, settings);
    const float amplitude = entry.velocityAmplitude * settings.level;

    try {
        auto buffer = makeSingleCycleBuffer(frequency, amplitude, settings.waveform,
                                            settings.pulseWidth, graph_.sampleRate(), noise_);
        if (!buffer) {
            CHORDPAD_LOG_WARNING("note %d: oscillator %zu has unplayable frequency %.3f Hz",
                                 note, slot + 1, static_cast<double>(frequency));
        }
        return buffer;
    } catch (const std::bad_alloc&) {
        CHORDPAD_LOG_WARNING("note %d: out of memory building oscillator %zu buffer",
                             note, slot + 1);
        return nullptr;
    }
}

NodeId OscillatorBank::createSlotPlayer(int note, size_t slot,
                                        const NoteOscillators& entry, float gain) {
    auto buffer = buildSlotBuffer(note, slot, entry);
    if (!buffer) return kInvalidNodeId;

    const NodeId player = graph_.createPlayer();
    if (player == kInvalidNodeId) {
        CHORDPAD_LOG_WARNING("note %d: could not allocate player for oscillator %zu",
                             note, slot + 1);
        return kInvalidNodeId;
    }

    graph_.setVolume(player, gain);
    if (!graph_.connect(player, entry.mixer) || !graph_.scheduleLoop(player, std::move(buffer))) {
        CHORDPAD_LOG_WARNING("note %d: could not start oscillator %zu", note, slot + 1);
        graph_.destroyNode(player);
        return kInvalidNodeId;
    }
    return player;
}

void OscillatorBank::destroyNote(NoteOscillators& entry) {
    for (NodeId& player : entry.players) {
        if (player != kInvalidNodeId) {
            graph_.destroyNode(player);
            player = kInvalidNodeId;
        }
    }
    if (entry.mixer != kInvalidNodeId) {
        graph_.destroyNode(entry.mixer);
        entry.mixer = kInvalidNodeId;
    }
}

} // namespace DSP
} // namespace Chordpad
