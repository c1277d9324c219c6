// ==============================================================================
// ControlLoop Implementation
// ==============================================================================

#include "control_loop.h"

#include <chordpad/dsp/core/logging.h>
#include <chordpad/dsp/systems/synth_engine.h>

#include <algorithm>

namespace Chordpad {
namespace DSP {

ControlLoop::ControlLoop(SynthEngine& engine, std::chrono::milliseconds period)
    : engine_(engine)
    , period_(std::max(period, std::chrono::milliseconds{1})) {}

ControlLoop::~ControlLoop() {
    stop();
}

void ControlLoop::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    worker_ = std::thread(&ControlLoop::workerLoop, this);
    CHORDPAD_LOG_DEBUG("control loop started (%lld ms period)",
                       static_cast<long long>(period_.count()));
}

void ControlLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        if (!running_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }
    }
    wake_.notify_one();
    if (worker_.joinable()) {
        worker_.join();
    }
    CHORDPAD_LOG_DEBUG("control loop stopped after %llu ticks",
                       static_cast<unsigned long long>(tickCount()));
}

void ControlLoop::workerLoop() {
    using Clock = std::chrono::steady_clock;
    auto deadline = Clock::now();

    while (running_.load(std::memory_order_acquire)) {
        engine_.tick();
        tickCount_.fetch_add(1, std::memory_order_relaxed);

        deadline += period_;
        const auto now = Clock::now();
        if (deadline <= now) {
            // Overran: drop the missed periods and realign
            const auto behind = now - deadline;
            const auto missed = behind / period_ + 1;
            deadline += period_ * missed;
        }

        std::unique_lock<std::mutex> lock(wakeMutex_);
        wake_.wait_until(lock, deadline, [this] {
            return !running_.load(std::memory_order_acquire);
        });
    }
}

} // namespace DSP
} // namespace Chordpad
