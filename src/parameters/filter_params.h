#pragma once

// ==============================================================================
// Filter Parameters (ID 400-499)
// ==============================================================================

#include "param_ids.h"
#include "parameters/dropdown_mappings.h"

#include <chordpad/dsp/core/synth_settings.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstddef>
#include <cstdio>

namespace Chordpad {

struct FilterParams {
    std::atomic<int> type{0};                // Dropdown index (0-2)
    std::atomic<float> cutoffHz{1000.0f};    // 20-20000 Hz (exponential)
    std::atomic<float> resonance{1.0f};      // 0.1-30.0
    std::atomic<float> envAmount{0.0f};      // -1 to +1
};

/// Exponential mapping: 0 -> 20 Hz, 1 -> 20 kHz
[[nodiscard]] inline float cutoffFromNormalized(ParamValue value) noexcept {
    const double clamped = std::clamp(std::isnan(value) ? 0.0 : value, 0.0, 1.0);
    return std::clamp(static_cast<float>(20.0 * std::pow(1000.0, clamped)), 20.0f, 20000.0f);
}

/// Inverse of cutoffFromNormalized()
[[nodiscard]] inline ParamValue normalizedFromCutoff(float hz) noexcept {
    const double clamped = std::clamp(static_cast<double>(hz), 20.0, 20000.0);
    return std::log10(clamped / 20.0) / 3.0;
}

/// 0-1 -> 0.1-30.0
[[nodiscard]] inline float resonanceFromNormalized(ParamValue value) noexcept {
    if (std::isnan(value)) value = 0.0;
    return std::clamp(static_cast<float>(0.1 + value * 29.9), 0.1f, 30.0f);
}

/// 0-1 -> -1..+1
[[nodiscard]] inline float envAmountFromNormalized(ParamValue value) noexcept {
    if (std::isnan(value)) value = 0.5;
    return std::clamp(static_cast<float>(value * 2.0 - 1.0), -1.0f, 1.0f);
}

inline bool handleFilterParamChange(FilterParams& params, ParamID id, ParamValue value) {
    switch (id) {
        case kFilterTypeId:
            params.type.store(dropdownIndexFromNormalized(value, kFilterTypeDropdownCount),
                              std::memory_order_relaxed);
            return true;
        case kFilterCutoffId:
            params.cutoffHz.store(cutoffFromNormalized(value), std::memory_order_relaxed);
            return true;
        case kFilterResonanceId:
            params.resonance.store(resonanceFromNormalized(value), std::memory_order_relaxed);
            return true;
        case kFilterEnvAmountId:
            params.envAmount.store(envAmountFromNormalized(value), std::memory_order_relaxed);
            return true;
        default:
            return false;
    }
}

inline bool formatFilterParam(ParamID id, ParamValue value, char* text, size_t size) {
    switch (id) {
        case kFilterTypeId:
            std::snprintf(text, size, "%s",
                kFilterTypeStrings[dropdownIndexFromNormalized(value, kFilterTypeDropdownCount)]);
            return true;
        case kFilterCutoffId: {
            const float hz = cutoffFromNormalized(value);
            if (hz >= 1000.0f) std::snprintf(text, size, "%.1f kHz", static_cast<double>(hz) / 1000.0);
            else std::snprintf(text, size, "%.1f Hz", static_cast<double>(hz));
            return true;
        }
        case kFilterResonanceId:
            std::snprintf(text, size, "%.1f", static_cast<double>(resonanceFromNormalized(value)));
            return true;
        case kFilterEnvAmountId:
            std::snprintf(text, size, "%+.0f%%",
                          static_cast<double>(envAmountFromNormalized(value)) * 100.0);
            return true;
        default:
            return false;
    }
}

[[nodiscard]] inline DSP::FilterSettings toSettings(const FilterParams& params) {
    DSP::FilterSettings s;
    s.type = getFilterTypeFromDropdown(params.type.load(std::memory_order_relaxed));
    s.cutoff = params.cutoffHz.load(std::memory_order_relaxed);
    s.resonance = params.resonance.load(std::memory_order_relaxed);
    s.envelopeAmount = params.envAmount.load(std::memory_order_relaxed);
    return DSP::sanitize(s);
}

} // namespace Chordpad
