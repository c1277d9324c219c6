// ==============================================================================
// Layer 0: Core Utilities
// control_clock.h - Time Source for Control-Rate Logic
// ==============================================================================
// Envelopes and the voice manager never read the system clock directly; they
// receive "now" in seconds from a ControlClock. Production code uses the
// steady clock. Tests and offline rendering advance a ManualControlClock.
// ==============================================================================

#pragma once

#include <chrono>

namespace Chordpad {
namespace DSP {

/// @brief Monotonic time source in seconds.
class ControlClock {
public:
    virtual ~ControlClock() = default;

    /// Seconds since an arbitrary, fixed epoch. Never decreases.
    [[nodiscard]] virtual double now() const noexcept = 0;
};

/// @brief Wall-clock time from std::chrono::steady_clock.
/// The epoch is the moment of construction.
class SteadyControlClock final : public ControlClock {
public:
    SteadyControlClock() noexcept
        : epoch_(std::chrono::steady_clock::now()) {}

    [[nodiscard]] double now() const noexcept override {
        const auto elapsed = std::chrono::steady_clock::now() - epoch_;
        return std::chrono::duration<double>(elapsed).count();
    }

private:
    std::chrono::steady_clock::time_point epoch_;
};

/// @brief Externally driven clock for deterministic tests and offline renders.
///
/// Single-threaded: advance() and now() must be called from the same thread.
class ManualControlClock final : public ControlClock {
public:
    explicit ManualControlClock(double startSeconds = 0.0) noexcept
        : now_(startSeconds) {}

    [[nodiscard]] double now() const noexcept override { return now_; }

    /// Move time forward. Negative deltas are ignored.
    void advance(double seconds) noexcept {
        if (seconds > 0.0) now_ += seconds;
    }

    /// Jump to an absolute time. Earlier times are ignored.
    void set(double seconds) noexcept {
        if (seconds > now_) now_ = seconds;
    }

private:
    double now_;
};

} // namespace DSP
} // namespace Chordpad
