// ==============================================================================
// Layer 0: Core Utility - Math Constants
// ==============================================================================
// Centralized mathematical constants for DSP calculations.
// Constants are inline constexpr so every translation unit shares a single
// definition.
// ==============================================================================

#pragma once

namespace Chordpad {
namespace DSP {

// =============================================================================
// Mathematical Constants
// =============================================================================

/// Pi constant for DSP calculations
inline constexpr float kPi = 3.14159265358979323846f;

/// Two times Pi (full circle in radians)
/// Used for angular frequency calculations: omega = kTwoPi * f / fs
inline constexpr float kTwoPi = 2.0f * kPi;

} // namespace DSP
} // namespace Chordpad
