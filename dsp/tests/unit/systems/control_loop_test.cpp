// ==============================================================================
// Layer 3: System Component - Control Loop Tests
// ==============================================================================

#include <chordpad/dsp/systems/control_loop.h>

#include <catch2/catch_test_macros.hpp>

#include <chordpad/dsp/core/control_clock.h>
#include <chordpad/dsp/systems/software_audio_graph.h>
#include <chordpad/dsp/systems/synth_engine.h>

#include <chrono>
#include <thread>

using namespace Chordpad::DSP;
using namespace std::chrono_literals;

namespace {

/// Wait up to `timeout` for `predicate` to hold.
template <typename Predicate>
bool waitFor(Predicate predicate, std::chrono::milliseconds timeout = 2000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(1ms);
    }
    return predicate();
}

} // namespace

TEST_CASE("ControlLoop ticks until stopped", "[control_loop][systems]") {
    SoftwareAudioGraph graph;
    SteadyControlClock clock;
    SynthEngine engine(graph, clock);
    ControlLoop loop(engine, 1ms);

    REQUIRE_FALSE(loop.isRunning());
    loop.start();
    REQUIRE(loop.isRunning());

    REQUIRE(waitFor([&] { return loop.tickCount() >= 5; }));

    loop.stop();
    REQUIRE_FALSE(loop.isRunning());

    const auto ticks = loop.tickCount();
    std::this_thread::sleep_for(20ms);
    REQUIRE(loop.tickCount() == ticks);
}

TEST_CASE("ControlLoop start and stop are idempotent", "[control_loop][systems]") {
    SoftwareAudioGraph graph;
    SteadyControlClock clock;
    SynthEngine engine(graph, clock);
    ControlLoop loop(engine, 2ms);

    loop.stop();
    loop.start();
    loop.start();
    REQUIRE(loop.isRunning());
    loop.stop();
    loop.stop();
    REQUIRE_FALSE(loop.isRunning());

    // Restartable after a stop
    loop.start();
    REQUIRE(waitFor([&] { return loop.tickCount() >= 1; }));
}

TEST_CASE("ControlLoop period is clamped", "[control_loop][systems]") {
    SoftwareAudioGraph graph;
    SteadyControlClock clock;
    SynthEngine engine(graph, clock);

    ControlLoop fast(engine, 0ms);
    REQUIRE(fast.period() == 1ms);

    ControlLoop standard(engine);
    REQUIRE(standard.period() == kDefaultControlPeriod);
}

TEST_CASE("ControlLoop drives voices through release to teardown", "[control_loop][systems]") {
    SoftwareAudioGraph graph;
    SteadyControlClock clock;
    SynthEngine engine(graph, clock);
    REQUIRE(engine.start());

    engine.updateADSRSettings(ADSRSettings{0.005f, 0.005f, 0.8f, 0.02f});
    engine.updateFilterADSRSettings(ADSRSettings{0.005f, 0.005f, 0.8f, 0.02f});

    ControlLoop loop(engine, 2ms);
    loop.start();

    engine.playNote(60, 100);
    REQUIRE(engine.hasVoice(60));
    std::this_thread::sleep_for(20ms);

    engine.stopNote(60);
    REQUIRE(waitFor([&] { return !engine.hasVoice(60); }));
    REQUIRE(graph.nodeCount() == 0);

    loop.stop();
}

TEST_CASE("Destroying a running ControlLoop joins the worker", "[control_loop][systems]") {
    SoftwareAudioGraph graph;
    SteadyControlClock clock;
    SynthEngine engine(graph, clock);
    {
        ControlLoop loop(engine, 1ms);
        loop.start();
        REQUIRE(waitFor([&] { return loop.tickCount() >= 1; }));
    }
    SUCCEED("worker joined");
}
