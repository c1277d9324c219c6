// ==============================================================================
// Layer 1: DSP Primitive - Loop Buffer
// ==============================================================================
// Single-cycle stereo sample buffer played in a loop by an audio-graph player
// node. This is the "DCO" of the synth: a precomputed cycle at a fixed pitch.
//
// Buffers are immutable once built and shared by pointer between the
// oscillator bank and the graph, so a render thread can keep reading an old
// cycle while a new one is being scheduled.
//
// NOT real-time safe: makeSingleCycleBuffer() allocates.
// ==============================================================================

#pragma once

#include <chordpad/dsp/core/db_utils.h>
#include <chordpad/dsp/core/random.h>
#include <chordpad/dsp/core/synth_types.h>
#include <chordpad/dsp/primitives/waveform_generator.h>

#include <cmath>
#include <cstddef>
#include <memory>
#include <vector>

namespace Chordpad {
namespace DSP {

/// Shortest cycle ever built. High pitches are quantized to this length.
inline constexpr size_t kMinLoopFrames = 64;

/// @brief Immutable stereo sample cycle.
///
/// Both channels are always the same length.
struct LoopBuffer {
    std::vector<float> left;
    std::vector<float> right;

    [[nodiscard]] size_t frames() const noexcept { return left.size(); }
    [[nodiscard]] bool empty() const noexcept { return left.empty(); }

    /// Largest absolute sample value across both channels
    [[nodiscard]] float peak() const noexcept {
        float result = 0.0f;
        for (size_t i = 0; i < left.size(); ++i) {
            result = std::max(result, std::abs(left[i]));
            result = std::max(result, std::abs(right[i]));
        }
        return result;
    }
};

/// @brief Number of frames in one cycle at `frequency`.
///
/// round(sampleRate / frequency), never shorter than kMinLoopFrames.
/// Returns 0 for a non-finite or non-positive frequency or sample rate.
[[nodiscard]] inline size_t cycleLengthFrames(float frequency, double sampleRate) noexcept {
    if (!detail::isFinite(frequency) || frequency <= 0.0f || !(sampleRate > 0.0)) {
        return 0;
    }
    const double exact = std::round(sampleRate / static_cast<double>(frequency));
    if (exact < static_cast<double>(kMinLoopFrames)) {
        return kMinLoopFrames;
    }
    return static_cast<size_t>(exact);
}

/// @brief Build one cycle of `waveform`, identical on both channels.
///
/// Sample i holds the waveform at phase i / frames.
///
/// @return nullptr when the cycle length is 0 (invalid frequency or sample
///         rate). Throws std::bad_alloc if the buffer cannot be allocated.
[[nodiscard]] inline std::shared_ptr<LoopBuffer> makeSingleCycleBuffer(
    float frequency,
    float amplitude,
    Waveform waveform,
    float pulseWidth,
    double sampleRate,
    Xorshift32& noise
) {
    const size_t frames = cycleLengthFrames(frequency, sampleRate);
    if (frames == 0) {
        return nullptr;
    }

    auto buffer = std::make_shared<LoopBuffer>();
    buffer->left.resize(frames);
    buffer->right.resize(frames);

    const double invFrames = 1.0 / static_cast<double>(frames);
    for (size_t i = 0; i < frames; ++i) {
        const double phase = static_cast<double>(i) * invFrames;
        const float value = generateWaveformSample(phase, waveform, amplitude, pulseWidth, noise);
        buffer->left[i] = value;
        buffer->right[i] = value;
    }
    return buffer;
}

} // namespace DSP
} // namespace Chordpad
