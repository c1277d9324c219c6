#pragma once

// ==============================================================================
// Envelope Parameters (Amp: ID 200-299, Filter: ID 300-399)
// ==============================================================================
// Both envelopes share one layout; the block base ID selects which one a
// change addresses.
// ==============================================================================

#include "param_ids.h"

#include <chordpad/dsp/core/synth_settings.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstddef>
#include <cstdio>

namespace Chordpad {

struct EnvelopeParams {
    std::atomic<float> attackSec{0.1f};    // 0.001-10 s (exponential)
    std::atomic<float> decaySec{0.4f};     // 0.001-10 s (exponential)
    std::atomic<float> sustain{0.7f};      // 0-1
    std::atomic<float> releaseSec{0.8f};   // 0.001-10 s (exponential)

    EnvelopeParams() = default;

    explicit EnvelopeParams(const DSP::ADSRSettings& s)
        : attackSec(s.attack)
        , decaySec(s.decay)
        , sustain(s.sustain)
        , releaseSec(s.release) {}
};

/// Exponential mapping: 0 -> 1 ms, 1 -> 10 s
[[nodiscard]] inline float envelopeTimeFromNormalized(ParamValue value) noexcept {
    const double clamped = std::clamp(std::isnan(value) ? 0.0 : value, 0.0, 1.0);
    return static_cast<float>(0.001 * std::pow(10000.0, clamped));
}

/// Inverse of envelopeTimeFromNormalized()
[[nodiscard]] inline ParamValue normalizedFromEnvelopeTime(float seconds) noexcept {
    const double clamped = std::clamp(static_cast<double>(seconds), 0.001, 10.0);
    return std::log10(clamped / 0.001) / 4.0;
}

/// @param baseId kAmpEnvBaseId or kFilterEnvBaseId
/// @return true if `id` is one of the four parameters of that block
inline bool handleEnvelopeParamChange(EnvelopeParams& params, ParamID baseId,
                                      ParamID id, ParamValue value) {
    if (id < baseId || id > baseId + kEnvReleaseOffset) return false;

    switch (id - baseId) {
        case kEnvAttackOffset:
            params.attackSec.store(envelopeTimeFromNormalized(value), std::memory_order_relaxed);
            return true;
        case kEnvDecayOffset:
            params.decaySec.store(envelopeTimeFromNormalized(value), std::memory_order_relaxed);
            return true;
        case kEnvSustainOffset:
            params.sustain.store(static_cast<float>(std::clamp(value, 0.0, 1.0)),
                                 std::memory_order_relaxed);
            return true;
        case kEnvReleaseOffset:
            params.releaseSec.store(envelopeTimeFromNormalized(value), std::memory_order_relaxed);
            return true;
        default:
            return false;
    }
}

inline bool formatEnvelopeParam(ParamID baseId, ParamID id, ParamValue value,
                                char* text, size_t size) {
    if (id < baseId || id > baseId + kEnvReleaseOffset) return false;

    if (id - baseId == kEnvSustainOffset) {
        std::snprintf(text, size, "%.0f%%", std::clamp(value, 0.0, 1.0) * 100.0);
        return true;
    }

    const float seconds = envelopeTimeFromNormalized(value);
    if (seconds >= 1.0f) {
        std::snprintf(text, size, "%.2f s", static_cast<double>(seconds));
    } else {
        std::snprintf(text, size, "%.1f ms", static_cast<double>(seconds) * 1000.0);
    }
    return true;
}

[[nodiscard]] inline DSP::ADSRSettings toSettings(const EnvelopeParams& params) {
    DSP::ADSRSettings s;
    s.attack = params.attackSec.load(std::memory_order_relaxed);
    s.decay = params.decaySec.load(std::memory_order_relaxed);
    s.sustain = params.sustain.load(std::memory_order_relaxed);
    s.release = params.releaseSec.load(std::memory_order_relaxed);
    return DSP::sanitize(s);
}

} // namespace Chordpad
