#pragma once

// ==============================================================================
// Parameter Identifiers
// ==============================================================================
// Every patch parameter the instrument exposes. Values crossing this boundary
// are normalized to [0, 1]; the per-module parameter headers map them to
// physical units.
//
// ID Range Allocation (100-ID gaps for future expansion):
//   0-99:      Global parameters
//   100-199:   Oscillators (10 IDs per slot: osc1 = 100, osc2 = 110, osc3 = 120)
//   200-299:   Amplitude envelope
//   300-399:   Filter envelope
//   400-499:   Filter
// ==============================================================================

#include <cstddef>
#include <cstdint>

namespace Chordpad {

using ParamID = uint32_t;

/// Normalized parameter value in [0, 1]
using ParamValue = double;

enum ParameterIDs : ParamID {
    // ==========================================================================
    // Global (0-99)
    // ==========================================================================
    kMasterVolumeId = 0,
    kVelocityId = 1,

    // ==========================================================================
    // Oscillators (100-199)
    // ==========================================================================
    kOscBaseId = 100,
    kOsc1WaveformId = 100,
    kOsc1PitchId = 101,
    kOsc1DetuneId = 102,
    kOsc1LevelId = 103,
    kOsc1PulseWidthId = 104,

    kOsc2WaveformId = 110,
    kOsc2PitchId = 111,
    kOsc2DetuneId = 112,
    kOsc2LevelId = 113,
    kOsc2PulseWidthId = 114,

    kOsc3WaveformId = 120,
    kOsc3PitchId = 121,
    kOsc3DetuneId = 122,
    kOsc3LevelId = 123,
    kOsc3PulseWidthId = 124,

    kOscEndId = 199,

    // ==========================================================================
    // Amplitude Envelope (200-299)
    // ==========================================================================
    kAmpEnvBaseId = 200,
    kAmpEnvAttackId = 200,
    kAmpEnvDecayId = 201,
    kAmpEnvSustainId = 202,
    kAmpEnvReleaseId = 203,
    kAmpEnvEndId = 299,

    // ==========================================================================
    // Filter Envelope (300-399)
    // ==========================================================================
    kFilterEnvBaseId = 300,
    kFilterEnvAttackId = 300,
    kFilterEnvDecayId = 301,
    kFilterEnvSustainId = 302,
    kFilterEnvReleaseId = 303,
    kFilterEnvEndId = 399,

    // ==========================================================================
    // Filter (400-499)
    // ==========================================================================
    kFilterTypeId = 400,
    kFilterCutoffId = 401,
    kFilterResonanceId = 402,
    kFilterEnvAmountId = 403,
    kFilterEndId = 499,
};

// ==============================================================================
// Oscillator slot addressing
// ==============================================================================

inline constexpr ParamID kOscSlotStride = 10;

/// Offsets within one oscillator slot
enum OscParamOffset : ParamID {
    kOscWaveformOffset = 0,
    kOscPitchOffset = 1,
    kOscDetuneOffset = 2,
    kOscLevelOffset = 3,
    kOscPulseWidthOffset = 4,
};

/// Offsets within an envelope block (amp or filter)
enum EnvParamOffset : ParamID {
    kEnvAttackOffset = 0,
    kEnvDecayOffset = 1,
    kEnvSustainOffset = 2,
    kEnvReleaseOffset = 3,
};

[[nodiscard]] constexpr bool isOscillatorParam(ParamID id) noexcept {
    return id >= kOscBaseId && id <= kOscEndId;
}

/// Slot index (0-based) addressed by an oscillator parameter
[[nodiscard]] constexpr size_t oscSlotForParam(ParamID id) noexcept {
    return static_cast<size_t>((id - kOscBaseId) / kOscSlotStride);
}

[[nodiscard]] constexpr ParamID oscParamOffset(ParamID id) noexcept {
    return (id - kOscBaseId) % kOscSlotStride;
}

[[nodiscard]] constexpr ParamID oscParamId(size_t slot, OscParamOffset offset) noexcept {
    return kOscBaseId + static_cast<ParamID>(slot) * kOscSlotStride + offset;
}

} // namespace Chordpad
