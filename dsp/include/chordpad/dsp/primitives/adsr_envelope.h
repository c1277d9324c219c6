// ==============================================================================
// Layer 1: DSP Primitive - ADSR Envelope
// ==============================================================================
// Time-driven linear ADSR evaluated at control rate. The envelope holds no
// per-sample state: the caller passes the current time (seconds from a
// ControlClock) and the level is computed in closed form from the recorded
// start and release timestamps.
//
//   Attack   0 -> 1            linear over `attack` seconds
//   Decay    1 -> sustain      linear over `decay` seconds
//   Sustain  held
//   Release  captured level -> 0, linear over `release` seconds
//
// Settings can be replaced at any time without resetting the timers; the next
// evaluation follows the new curve from the current elapsed time.
//
// Real-time safe: noexcept, no allocations.
// ==============================================================================

#pragma once

#include <chordpad/dsp/core/synth_settings.h>

#include <algorithm>
#include <cstdint>

namespace Chordpad {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

/// Level at or below which a releasing envelope counts as finished
inline constexpr float kEnvelopeFinishedThreshold = 0.001f;

// =============================================================================
// Enumerations
// =============================================================================

enum class EnvelopeStage : uint8_t {
    Idle = 0,
    Attack,
    Decay,
    Sustain,
    Releasing,
    Finished
};

[[nodiscard]] constexpr const char* envelopeStageName(EnvelopeStage stage) noexcept {
    switch (stage) {
        case EnvelopeStage::Idle:      return "Idle";
        case EnvelopeStage::Attack:    return "Attack";
        case EnvelopeStage::Decay:     return "Decay";
        case EnvelopeStage::Sustain:   return "Sustain";
        case EnvelopeStage::Releasing: return "Releasing";
        case EnvelopeStage::Finished:  return "Finished";
    }
    return "Unknown";
}

// =============================================================================
// ADSREnvelope Class
// =============================================================================

/// @brief Closed-form linear ADSR driven by externally supplied time.
///
/// Only three states are stored (idle, gated, releasing). Decay, Sustain and
/// Finished are derived from elapsed time by getStage().
///
/// @par Usage
/// @code
/// ADSREnvelope env(kDefaultAmpEnvelope);
/// env.noteOn(clock.now());
/// float gain = env.currentLevel(clock.now());
/// env.noteOff(clock.now());
/// if (env.isFinished(clock.now())) { /* tear down */ }
/// @endcode
class ADSREnvelope {
public:
    ADSREnvelope() noexcept = default;

    explicit ADSREnvelope(const ADSRSettings& settings) noexcept
        : settings_(sanitize(settings)) {}

    // =========================================================================
    // Gate Control
    // =========================================================================

    /// Start (or restart) the envelope at `now`. Clears any release state.
    void noteOn(double now) noexcept {
        startTime_ = now;
        releaseStartTime_ = 0.0;
        releaseStartLevel_ = 0.0f;
        state_ = State::Gated;
    }

    /// Begin the release from whatever level the envelope has at `now`.
    /// Ignored when idle. A second call keeps the first captured level.
    void noteOff(double now) noexcept {
        if (state_ != State::Gated) return;

        releaseStartLevel_ = levelAt(now - startTime_);
        releaseStartTime_ = now;
        state_ = State::Releasing;
    }

    // =========================================================================
    // Evaluation
    // =========================================================================

    /// Gated (attack/decay/sustain) level for the given time since noteOn.
    [[nodiscard]] float levelAt(double elapsed) const noexcept {
        const double attack = settings_.attack;
        const double decay = settings_.decay;
        const double sustain = settings_.sustain;

        if (elapsed <= 0.0) return 0.0f;

        if (elapsed <= attack) {
            return static_cast<float>(elapsed / attack);
        }
        if (elapsed <= attack + decay) {
            const double progress = (elapsed - attack) / decay;
            return static_cast<float>(1.0 - (1.0 - sustain) * progress);
        }
        return settings_.sustain;
    }

    /// Level at `now`, including the release fade.
    [[nodiscard]] float currentLevel(double now) const noexcept {
        switch (state_) {
            case State::Idle:
                return 0.0f;
            case State::Gated:
                return levelAt(now - startTime_);
            case State::Releasing: {
                const double progress = std::min(
                    std::max(now - releaseStartTime_, 0.0) / static_cast<double>(settings_.release),
                    1.0);
                return static_cast<float>(static_cast<double>(releaseStartLevel_) * (1.0 - progress));
            }
        }
        return 0.0f;
    }

    [[nodiscard]] EnvelopeStage getStage(double now) const noexcept {
        switch (state_) {
            case State::Idle:
                return EnvelopeStage::Idle;
            case State::Releasing:
                return currentLevel(now) <= kEnvelopeFinishedThreshold
                    ? EnvelopeStage::Finished
                    : EnvelopeStage::Releasing;
            case State::Gated: {
                const double elapsed = now - startTime_;
                if (elapsed <= settings_.attack) return EnvelopeStage::Attack;
                if (elapsed <= static_cast<double>(settings_.attack) + settings_.decay) {
                    return EnvelopeStage::Decay;
                }
                return EnvelopeStage::Sustain;
            }
        }
        return EnvelopeStage::Idle;
    }

    /// True once released and faded to or below `threshold`.
    [[nodiscard]] bool isFinished(double now,
                                  float threshold = kEnvelopeFinishedThreshold) const noexcept {
        return state_ == State::Releasing && currentLevel(now) <= threshold;
    }

    [[nodiscard]] bool isReleasing() const noexcept { return state_ == State::Releasing; }

    // =========================================================================
    // Settings
    // =========================================================================

    /// Replace the ADSR parameters in place. Timers are not reset.
    void updateSettings(const ADSRSettings& settings) noexcept {
        settings_ = sanitize(settings);
    }

    [[nodiscard]] const ADSRSettings& getSettings() const noexcept { return settings_; }

    // =========================================================================
    // Timestamps
    // =========================================================================

    [[nodiscard]] double startTime() const noexcept { return startTime_; }
    [[nodiscard]] double releaseStartTime() const noexcept { return releaseStartTime_; }
    [[nodiscard]] float releaseStartLevel() const noexcept { return releaseStartLevel_; }

private:
    enum class State : uint8_t {
        Idle = 0,
        Gated,
        Releasing
    };

    ADSRSettings settings_{};
    State state_ = State::Idle;
    double startTime_ = 0.0;
    double releaseStartTime_ = 0.0;
    float releaseStartLevel_ = 0.0f;
};

} // namespace DSP
} // namespace Chordpad
