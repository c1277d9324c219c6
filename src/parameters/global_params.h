#pragma once

// ==============================================================================
// Global Parameters (ID 0-99)
// ==============================================================================

#include "param_ids.h"

#include <chordpad/dsp/core/midi_utils.h>
#include <chordpad/dsp/core/synth_settings.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstddef>
#include <cstdio>

namespace Chordpad {

/// Note-on velocity used by the on-screen pads
inline constexpr int kDefaultControllerVelocity = 80;

struct GlobalParams {
    std::atomic<float> masterVolume{DSP::kDefaultMasterVolume};  // 0-1
    std::atomic<int> velocity{kDefaultControllerVelocity};       // 1-127
};

/// 0-1 -> velocity 1-127
[[nodiscard]] inline int velocityFromNormalized(ParamValue value) noexcept {
    if (!(value >= 0.0)) value = 0.0;
    const int velocity = static_cast<int>(std::lround(1.0 + value * 126.0));
    return std::clamp(velocity, DSP::kMinNoteVelocity, DSP::kMaxMidiVelocity);
}

/// @return true if `id` is a global parameter
inline bool handleGlobalParamChange(GlobalParams& params, ParamID id, ParamValue value) {
    switch (id) {
        case kMasterVolumeId:
            params.masterVolume.store(
                std::clamp(static_cast<float>(std::isnan(value) ? 0.0 : value), 0.0f, 1.0f),
                std::memory_order_relaxed);
            return true;
        case kVelocityId:
            params.velocity.store(velocityFromNormalized(value), std::memory_order_relaxed);
            return true;
        default:
            return false;
    }
}

inline bool formatGlobalParam(ParamID id, ParamValue value, char* text, size_t size) {
    switch (id) {
        case kMasterVolumeId:
            std::snprintf(text, size, "%.0f%%",
                          std::clamp(std::isnan(value) ? 0.0 : value, 0.0, 1.0) * 100.0);
            return true;
        case kVelocityId:
            std::snprintf(text, size, "%d", velocityFromNormalized(value));
            return true;
        default:
            return false;
    }
}

} // namespace Chordpad
