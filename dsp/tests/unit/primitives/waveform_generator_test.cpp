// ==============================================================================
// Layer 1: DSP Primitive - Waveform Generator Tests
// ==============================================================================

#include <chordpad/dsp/primitives/waveform_generator.h>

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>

using namespace Chordpad::DSP;
using Catch::Approx;

TEST_CASE("wrapUnitPhase maps any phase into [0, 1)", "[waveform][primitives]") {
    REQUIRE(wrapUnitPhase(0.25) == Approx(0.25));
    REQUIRE(wrapUnitPhase(1.0) == Approx(0.0));
    REQUIRE(wrapUnitPhase(2.75) == Approx(0.75));
    REQUIRE(wrapUnitPhase(-0.25) == Approx(0.75));

    const double tiny = wrapUnitPhase(-1e-20);
    REQUIRE(tiny >= 0.0);
    REQUIRE(tiny < 1.0);
}

TEST_CASE("Periodic waveforms hit their characteristic points", "[waveform][primitives]") {
    SECTION("Sine") {
        REQUIRE(periodicWaveformSample(0.0, Waveform::Sine, 1.0f, 0.5f) == Approx(0.0f).margin(1e-6f));
        REQUIRE(periodicWaveformSample(0.25, Waveform::Sine, 1.0f, 0.5f) == Approx(1.0f));
        REQUIRE(periodicWaveformSample(0.75, Waveform::Sine, 1.0f, 0.5f) == Approx(-1.0f));
    }

    SECTION("Triangle") {
        REQUIRE(periodicWaveformSample(0.0, Waveform::Triangle, 1.0f, 0.5f) == Approx(-1.0f));
        REQUIRE(periodicWaveformSample(0.5, Waveform::Triangle, 1.0f, 0.5f) == Approx(1.0f));
        REQUIRE(periodicWaveformSample(0.25, Waveform::Triangle, 1.0f, 0.5f) == Approx(0.0f).margin(1e-6f));
    }

    SECTION("Sawtooth") {
        REQUIRE(periodicWaveformSample(0.0, Waveform::Sawtooth, 1.0f, 0.5f) == Approx(-1.0f));
        REQUIRE(periodicWaveformSample(0.5, Waveform::Sawtooth, 1.0f, 0.5f) == Approx(0.0f).margin(1e-6f));
        REQUIRE(periodicWaveformSample(0.99, Waveform::Sawtooth, 1.0f, 0.5f) == Approx(0.98f));
    }

    SECTION("Square") {
        REQUIRE(periodicWaveformSample(0.1, Waveform::Square, 0.5f, 0.5f) == 0.5f);
        REQUIRE(periodicWaveformSample(0.6, Waveform::Square, 0.5f, 0.5f) == -0.5f);
    }

    SECTION("Pulse follows the duty cycle") {
        REQUIRE(periodicWaveformSample(0.15, Waveform::Pulse, 1.0f, 0.2f) == 1.0f);
        REQUIRE(periodicWaveformSample(0.25, Waveform::Pulse, 1.0f, 0.2f) == -1.0f);
        REQUIRE(periodicWaveformSample(0.85, Waveform::Pulse, 1.0f, 0.9f) == 1.0f);
    }

    SECTION("Noise is not periodic") {
        REQUIRE(periodicWaveformSample(0.3, Waveform::Noise, 1.0f, 0.5f) == 0.0f);
    }
}

TEST_CASE("Every waveform stays within the amplitude", "[waveform][primitives]") {
    constexpr float kAmplitude = 0.6f;
    Xorshift32 noise(99);

    for (size_t w = 0; w < kWaveformCount; ++w) {
        const auto waveform = static_cast<Waveform>(w);
        for (int i = 0; i < 1000; ++i) {
            const double phase = static_cast<double>(i) / 1000.0;
            const float s = generateWaveformSample(phase, waveform, kAmplitude, 0.3f, noise);
            REQUIRE(std::isfinite(s));
            REQUIRE(std::abs(s) <= kAmplitude + 1e-6f);
        }
    }
}

TEST_CASE("Noise draws from the caller's generator", "[waveform][primitives]") {
    Xorshift32 a(5);
    Xorshift32 b(5);

    for (int i = 0; i < 32; ++i) {
        const float fromA = generateWaveformSample(0.0, Waveform::Noise, 1.0f, 0.5f, a);
        REQUIRE(fromA == b.nextFloat());
    }
}

TEST_CASE("generateWaveformSample matches the periodic shapes", "[waveform][primitives]") {
    Xorshift32 noise(1);
    const uint32_t before = noise.state();
    for (double phase : {0.0, 0.2, 0.5, 0.8}) {
        REQUIRE(generateWaveformSample(phase, Waveform::Sawtooth, 0.8f, 0.5f, noise) ==
                periodicWaveformSample(phase, Waveform::Sawtooth, 0.8f, 0.5f));
    }
    REQUIRE(noise.state() == before);
}
