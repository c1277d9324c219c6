// ==============================================================================
// Layer 3: System Component - Voice Pool
// ==============================================================================
// Insertion-ordered, fixed-capacity set of sounding voices keyed by MIDI note.
// Order matters only for choosing the eviction candidate: the front of the
// pool is the oldest voice.
// ==============================================================================

#pragma once

#include <chordpad/dsp/primitives/adsr_envelope.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace Chordpad {
namespace DSP {

/// Default polyphony
inline constexpr size_t kDefaultMaxVoices = 6;

/// @brief Everything the engine tracks for one sounding note.
///
/// Oscillator and filter nodes live in OscillatorBank / FilterStage, keyed by
/// the same note number.
struct Voice {
    uint8_t note = 0;
    uint8_t velocity = 0;
    float velocityAmplitude = 0.0f;
    float baseFrequency = 0.0f;
    ADSREnvelope ampEnvelope;
    ADSREnvelope filterEnvelope;
    bool released = false;
    double releaseTime = 0.0;
};

class VoicePool {
public:
    using iterator = std::vector<Voice>::iterator;
    using const_iterator = std::vector<Voice>::const_iterator;

    explicit VoicePool(size_t capacity = kDefaultMaxVoices)
        : capacity_(std::max<size_t>(capacity, 1)) {
        voices_.reserve(capacity_);
    }

    [[nodiscard]] Voice* find(int note) noexcept {
        auto it = locate(note);
        return it == voices_.end() ? nullptr : &*it;
    }

    [[nodiscard]] const Voice* find(int note) const noexcept {
        auto it = std::find_if(voices_.begin(), voices_.end(),
                               [note](const Voice& v) { return v.note == note; });
        return it == voices_.end() ? nullptr : &*it;
    }

    [[nodiscard]] bool contains(int note) const noexcept { return find(note) != nullptr; }

    /// Append as the newest voice. Fails when full or when the note is
    /// already present.
    [[nodiscard]] bool insert(Voice voice) {
        if (full() || contains(voice.note)) return false;
        voices_.push_back(std::move(voice));
        return true;
    }

    /// @return false if the note was not present
    bool erase(int note) noexcept {
        auto it = locate(note);
        if (it == voices_.end()) return false;
        voices_.erase(it);
        return true;
    }

    /// Oldest voice, or nullptr when empty
    [[nodiscard]] const Voice* oldest() const noexcept {
        return voices_.empty() ? nullptr : &voices_.front();
    }

    void clear() noexcept { voices_.clear(); }

    [[nodiscard]] size_t size() const noexcept { return voices_.size(); }
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] bool empty() const noexcept { return voices_.empty(); }
    [[nodiscard]] bool full() const noexcept { return voices_.size() >= capacity_; }

    /// Notes in insertion order (oldest first)
    [[nodiscard]] std::vector<int> notes() const {
        std::vector<int> result;
        result.reserve(voices_.size());
        for (const Voice& v : voices_) result.push_back(v.note);
        return result;
    }

    [[nodiscard]] iterator begin() noexcept { return voices_.begin(); }
    [[nodiscard]] iterator end() noexcept { return voices_.end(); }
    [[nodiscard]] const_iterator begin() const noexcept { return voices_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return voices_.end(); }

private:
    [[nodiscard]] iterator locate(int note) noexcept {
        return std::find_if(voices_.begin(), voices_.end(),
                            [note](const Voice& v) { return v.note == note; });
    }

    std::vector<Voice> voices_;
    size_t capacity_;
};

} // namespace DSP
} // namespace Chordpad
