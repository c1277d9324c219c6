// ==============================================================================
// Layer 0: Core Utilities
// random.h - Noise Source for Oscillator Buffers
// ==============================================================================
// Xorshift32 generator used to fill noise cycles. Each OscillatorBank owns one
// generator seeded from std::random_device, so every regenerated noise buffer
// is fresh white noise.
// ==============================================================================

#pragma once

#include <cstdint>
#include <random>

namespace Chordpad {
namespace DSP {

/// Fast 32-bit pseudo-random number generator (Marsaglia xorshift 13/17/5).
///
/// Period 2^32-1. NOT cryptographically secure.
///
/// @example
///     Xorshift32 rng(12345);
///     float noise = rng.nextFloat();  // [-1.0, 1.0]
class Xorshift32 {
public:
    /// @param seedValue Initial seed (0 is replaced with a default, since an
    ///        all-zero state only ever produces zeros)
    explicit constexpr Xorshift32(uint32_t seedValue = 1) noexcept
        : state_(seedValue != 0 ? seedValue : kDefaultSeed) {}

    [[nodiscard]] constexpr uint32_t next() noexcept {
        state_ ^= state_ << 13;
        state_ ^= state_ >> 17;
        state_ ^= state_ << 5;
        return state_;
    }

    /// @return Random float in [-1.0, 1.0]
    [[nodiscard]] constexpr float nextFloat() noexcept {
        return static_cast<float>(next()) * kToFloat * 2.0f - 1.0f;
    }

    constexpr void seed(uint32_t seedValue) noexcept {
        state_ = (seedValue != 0) ? seedValue : kDefaultSeed;
    }

    [[nodiscard]] constexpr uint32_t state() const noexcept { return state_; }

private:
    static constexpr uint32_t kDefaultSeed = 2463534242u;

    /// 1.0 / (2^32 - 1)
    static constexpr float kToFloat = 2.3283064370807974e-10f;

    uint32_t state_;
};

/// Seed drawn from the platform entropy source.
/// NOT real-time safe (std::random_device may block or open a device).
[[nodiscard]] inline uint32_t makeEntropySeed() {
    std::random_device device;
    return static_cast<uint32_t>(device());
}

} // namespace DSP
} // namespace Chordpad
