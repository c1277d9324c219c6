// ==============================================================================
// Layer 1: DSP Primitive - ADSR Envelope Tests
// ==============================================================================
// Closed-form evaluation against an externally supplied clock.
// ==============================================================================

#include <chordpad/dsp/primitives/adsr_envelope.h>

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>
#include <string>

using namespace Chordpad::DSP;
using Catch::Approx;

// =============================================================================
// Gated Curve
// =============================================================================

TEST_CASE("ADSR gated curve with default settings", "[adsr][primitives]") {
    ADSREnvelope env(kDefaultAmpEnvelope);   // A 0.1, D 0.4, S 0.7
    env.noteOn(10.0);

    SECTION("Attack rises linearly") {
        REQUIRE(env.currentLevel(10.0) == 0.0f);
        REQUIRE(env.currentLevel(10.05) == Approx(0.5f).margin(1e-4f));
        REQUIRE(env.currentLevel(10.1) == Approx(1.0f).margin(1e-4f));
        REQUIRE(env.getStage(10.05) == EnvelopeStage::Attack);
    }

    SECTION("Decay falls linearly toward sustain") {
        // 0.2 s into a 0.4 s decay: 1 - (1 - 0.7) * 0.5
        REQUIRE(env.currentLevel(10.3) == Approx(0.85f).margin(1e-4f));
        REQUIRE(env.getStage(10.3) == EnvelopeStage::Decay);
    }

    SECTION("Sustain holds") {
        REQUIRE(env.currentLevel(11.0) == Approx(0.7f));
        REQUIRE(env.currentLevel(100.0) == Approx(0.7f));
        REQUIRE(env.getStage(11.0) == EnvelopeStage::Sustain);
    }

    SECTION("Time before noteOn reads as silence") {
        REQUIRE(env.currentLevel(9.0) == 0.0f);
    }
}

TEST_CASE("ADSR idle envelope is silent", "[adsr][primitives]") {
    ADSREnvelope env;
    REQUIRE(env.currentLevel(5.0) == 0.0f);
    REQUIRE(env.getStage(5.0) == EnvelopeStage::Idle);
    REQUIRE_FALSE(env.isFinished(5.0));

    env.noteOff(5.0);
    REQUIRE_FALSE(env.isReleasing());
}

// =============================================================================
// Release
// =============================================================================

TEST_CASE("ADSR release starts from the level at noteOff", "[adsr][primitives]") {
    ADSREnvelope env(kDefaultAmpEnvelope);   // R 0.8
    env.noteOn(0.0);

    SECTION("Release from mid-attack") {
        env.noteOff(0.05);
        REQUIRE(env.releaseStartLevel() == Approx(0.5f).margin(1e-4f));
        REQUIRE(env.currentLevel(0.05) == Approx(0.5f).margin(1e-4f));
        // Halfway through the release
        REQUIRE(env.currentLevel(0.45) == Approx(0.25f).margin(1e-4f));
        REQUIRE(env.getStage(0.45) == EnvelopeStage::Releasing);
    }

    SECTION("Release from sustain reaches zero after the release time") {
        env.noteOff(2.0);
        REQUIRE(env.currentLevel(2.0) == Approx(0.7f));
        REQUIRE(env.currentLevel(2.8) == Approx(0.0f).margin(1e-6f));
        REQUIRE(env.isFinished(2.8));
        REQUIRE(env.getStage(2.8) == EnvelopeStage::Finished);
        REQUIRE(env.currentLevel(50.0) == 0.0f);
    }

    SECTION("A second noteOff keeps the first captured level") {
        env.noteOff(2.0);
        env.noteOff(2.4);
        REQUIRE(env.releaseStartTime() == 2.0);
        REQUIRE(env.releaseStartLevel() == Approx(0.7f));
    }

    SECTION("noteOn after release restarts the attack") {
        env.noteOff(2.0);
        env.noteOn(3.0);
        REQUIRE_FALSE(env.isReleasing());
        REQUIRE(env.currentLevel(3.05) == Approx(0.5f).margin(1e-4f));
    }
}

TEST_CASE("ADSR isFinished honours a custom threshold", "[adsr][primitives]") {
    ADSREnvelope env(ADSRSettings{0.01f, 0.01f, 1.0f, 1.0f});
    env.noteOn(0.0);
    env.noteOff(1.0);

    // 0.9 s into a 1 s release from 1.0 -> 0.1
    REQUIRE_FALSE(env.isFinished(1.9));
    REQUIRE(env.isFinished(1.9, 0.2f));
}

TEST_CASE("ADSR release level is monotonic", "[adsr][primitives]") {
    ADSREnvelope env(kDefaultAmpEnvelope);
    env.noteOn(0.0);
    env.noteOff(0.3);

    float previous = env.currentLevel(0.3);
    for (double t = 0.31; t < 1.2; t += 0.01) {
        const float level = env.currentLevel(t);
        REQUIRE(level <= previous);
        REQUIRE(level >= 0.0f);
        previous = level;
    }
}

// =============================================================================
// Settings
// =============================================================================

TEST_CASE("ADSR settings can change mid-note without resetting timers", "[adsr][primitives]") {
    ADSREnvelope env(kDefaultAmpEnvelope);
    env.noteOn(0.0);
    REQUIRE(env.currentLevel(2.0) == Approx(0.7f));

    env.updateSettings(ADSRSettings{0.1f, 0.4f, 0.3f, 0.8f});
    REQUIRE(env.startTime() == 0.0);
    REQUIRE(env.currentLevel(2.0) == Approx(0.3f));

    env.updateSettings(ADSRSettings{4.0f, 0.4f, 0.3f, 0.8f});
    REQUIRE(env.getStage(2.0) == EnvelopeStage::Attack);
    REQUIRE(env.currentLevel(2.0) == Approx(0.5f));
}

TEST_CASE("ADSR decay slope changes mid-Decay", "[adsr][primitives]") {
    ADSREnvelope env(kDefaultAmpEnvelope);
    env.noteOn(0.0);
    REQUIRE(env.getStage(0.2) == EnvelopeStage::Decay);
    REQUIRE(env.currentLevel(0.2) == Approx(0.925f).margin(1e-4f));

    env.updateSettings(ADSRSettings{0.1f, 0.2f, 0.7f, 0.8f});
    REQUIRE(env.startTime() == 0.0);
    REQUIRE(env.getStage(0.2) == EnvelopeStage::Decay);
    REQUIRE(env.currentLevel(0.2) == Approx(0.85f).margin(1e-4f));
    REQUIRE(env.currentLevel(0.3) == Approx(0.7f).margin(1e-4f));
}

TEST_CASE("ADSR sanitizes zero-length segments", "[adsr][primitives]") {
    ADSREnvelope env(ADSRSettings{0.0f, 0.0f, 0.5f, 0.0f});
    env.noteOn(0.0);

    const float level = env.currentLevel(1.0);
    REQUIRE(std::isfinite(level));
    REQUIRE(level == Approx(0.5f));

    env.noteOff(1.0);
    REQUIRE(std::isfinite(env.currentLevel(1.0)));
    REQUIRE(env.isFinished(1.01));
}

TEST_CASE("envelopeStageName", "[adsr][primitives]") {
    REQUIRE(std::string(envelopeStageName(EnvelopeStage::Releasing)) == "Releasing");
    REQUIRE(std::string(envelopeStageName(EnvelopeStage::Finished)) == "Finished");
}
