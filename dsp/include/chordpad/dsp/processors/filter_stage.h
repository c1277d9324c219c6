// ==============================================================================
// Layer 2: DSP Processor - Filter Stage
// ==============================================================================
// One resonant filter node per sounding note, routed to the graph output.
// The cutoff tracks the note's filter envelope in octaves:
//
//   cutoff = clamp(base * 2^(amount * level * 4), 20 Hz, 20 kHz)
//
// so a full-scale envelope with amount +1 sweeps four octaves up, and amount
// -1 four octaves down. Resonance is passed straight through as biquad Q.
//
// Not thread-safe. The owning SynthEngine serializes all calls.
// ==============================================================================

#pragma once

#include <chordpad/dsp/core/synth_settings.h>
#include <chordpad/dsp/primitives/audio_graph.h>

#include <cstddef>
#include <map>

namespace Chordpad {
namespace DSP {

/// Octave excursion of a full-scale envelope at envelopeAmount = +/-1
inline constexpr float kFilterEnvelopeOctaves = 4.0f;

class FilterStage {
public:
    /// @param graph Must outlive the stage
    explicit FilterStage(AudioGraph& graph);
    ~FilterStage();

    FilterStage(const FilterStage&) = delete;
    FilterStage& operator=(const FilterStage&) = delete;

    /// Allocate a filter for `note` from the current settings and route it to
    /// the graph output. Replaces an existing filter for the note.
    /// @return The filter node, or kInvalidNodeId on failure (logged)
    [[nodiscard]] NodeId createFilter(int note);

    /// Replace type, cutoff, resonance and amount on every live filter and
    /// re-apply each filter's last envelope level immediately.
    void updateSettings(const FilterSettings& settings);

    /// Recompute and write the cutoff of `note` for `envelopeLevel`.
    void applyEnvelope(int note, float envelopeLevel);

    /// Destroy the filter of `note`. No-op for unknown notes.
    void removeFilter(int note);

    void stopAll();

    [[nodiscard]] static float modulatedCutoff(float baseCutoff,
                                               float envelopeAmount,
                                               float envelopeLevel) noexcept;

    [[nodiscard]] const FilterSettings& getSettings() const noexcept { return settings_; }

    /// kInvalidNodeId if `note` has no filter
    [[nodiscard]] NodeId filterNode(int note) const noexcept;

    /// Cutoff last written to the filter of `note` (0 if none)
    [[nodiscard]] float currentCutoff(int note) const noexcept;

    [[nodiscard]] size_t filterCount() const noexcept { return filters_.size(); }

private:
    struct NoteFilter {
        NodeId node = kInvalidNodeId;
        float envelopeLevel = 0.0f;
        float cutoffHz = 0.0f;
    };

    [[nodiscard]] FilterNodeParams paramsFor(float cutoffHz) const noexcept {
        return FilterNodeParams{settings_.type, cutoffHz, settings_.resonance};
    }

    void retune(NoteFilter& filter);

    AudioGraph& graph_;
    FilterSettings settings_ = kDefaultFilterSettings;
    std::map<int, NoteFilter> filters_;
};

} // namespace DSP
} // namespace Chordpad
