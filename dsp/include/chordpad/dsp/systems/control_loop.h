// ==============================================================================
// Layer 3: System Component - Control Loop
// ==============================================================================
// Background worker that calls SynthEngine::tick() once per control period
// (10 ms by default). One scheduler serves all voices; stopping it is a
// single operation regardless of how many notes are sounding.
//
// Periods are measured against absolute deadlines, so tick jitter does not
// accumulate. When a tick overruns, the missed periods are skipped rather
// than replayed in a burst.
// ==============================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace Chordpad {
namespace DSP {

class SynthEngine;

/// Default control period (100 Hz)
inline constexpr std::chrono::milliseconds kDefaultControlPeriod{10};

class ControlLoop {
public:
    /// @param engine Must outlive the loop
    /// @param period Clamped to at least 1 ms
    explicit ControlLoop(SynthEngine& engine,
                         std::chrono::milliseconds period = kDefaultControlPeriod);

    /// Stops and joins the worker.
    ~ControlLoop();

    ControlLoop(const ControlLoop&) = delete;
    ControlLoop& operator=(const ControlLoop&) = delete;

    /// Start the worker thread. No-op if already running.
    void start();

    /// Stop and join the worker thread. No-op if not running.
    void stop();

    [[nodiscard]] bool isRunning() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    /// Ticks performed since construction
    [[nodiscard]] uint64_t tickCount() const noexcept {
        return tickCount_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::chrono::milliseconds period() const noexcept { return period_; }

private:
    void workerLoop();

    SynthEngine& engine_;
    const std::chrono::milliseconds period_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> tickCount_{0};
    std::mutex wakeMutex_;
    std::condition_variable wake_;
    std::thread worker_;
};

} // namespace DSP
} // namespace Chordpad
