// ==============================================================================
// Synth Settings - Unit Tests
// ==============================================================================
// Layer 0: Core Utilities
//
// Tests for: dsp/include/chordpad/dsp/core/synth_settings.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <chordpad/dsp/core/synth_settings.h>

#include <limits>
#include <string>

using namespace Chordpad::DSP;
using Catch::Approx;

namespace {
constexpr float kNaN = std::numeric_limits<float>::quiet_NaN();
}

TEST_CASE("Default patch is three detuned saws", "[dsp][core][settings]") {
    for (const auto& slot : kDefaultOscillatorPatch) {
        REQUIRE(slot.waveform == Waveform::Sawtooth);
        REQUIRE(slot.level == 1.0f);
        REQUIRE(slot.pitch == 0.0f);
    }
    REQUIRE(kDefaultOscillatorPatch[0].detune == 0.0f);
    REQUIRE(kDefaultOscillatorPatch[1].detune == 20.0f);
    REQUIRE(kDefaultOscillatorPatch[2].detune == -12.0f);

    REQUIRE(kDefaultAmpEnvelope == ADSRSettings{0.1f, 0.4f, 0.7f, 0.8f});
    REQUIRE(kDefaultFilterEnvelope == ADSRSettings{0.1f, 0.3f, 0.7f, 0.5f});
    REQUIRE(kDefaultFilterSettings.type == FilterType::Lowpass);
    REQUIRE(kDefaultFilterSettings.cutoff == 1000.0f);
    REQUIRE(kDefaultFilterSettings.envelopeAmount == 0.0f);
}

TEST_CASE("sanitize(OscillatorSettings) clamps to documented ranges", "[dsp][core][settings]") {
    OscillatorSettings wild;
    wild.pitch = 60.0f;
    wild.detune = -500.0f;
    wild.level = 3.0f;
    wild.pulseWidth = 0.0f;

    const auto s = sanitize(wild);
    REQUIRE(s.pitch == kMaxPitchSemitones);
    REQUIRE(s.detune == kMinDetuneCents);
    REQUIRE(s.level == 1.0f);
    REQUIRE(s.pulseWidth == kMinPulseWidth);
}

TEST_CASE("sanitize(OscillatorSettings) resets NaN and unknown enums", "[dsp][core][settings]") {
    OscillatorSettings broken;
    broken.waveform = static_cast<Waveform>(42);
    broken.pitch = kNaN;
    broken.level = kNaN;

    const auto s = sanitize(broken);
    REQUIRE(s.waveform == Waveform::Sine);
    REQUIRE(s.pitch == 0.0f);
    REQUIRE(s.level == 1.0f);
}

TEST_CASE("Silent oscillator slots", "[dsp][core][settings]") {
    OscillatorSettings s;
    REQUIRE_FALSE(s.isSilent());
    s.level = 0.0f;
    REQUIRE(s.isSilent());
    REQUIRE(sanitize(OscillatorSettings{Waveform::Sine, 0.0f, 0.0f, -1.0f, 0.5f}).isSilent());
}

TEST_CASE("sanitize(ADSRSettings) keeps times positive", "[dsp][core][settings]") {
    const auto s = sanitize(ADSRSettings{0.0f, -1.0f, 1.5f, 100.0f});
    REQUIRE(s.attack == kMinEnvelopeTimeSeconds);
    REQUIRE(s.decay == kMinEnvelopeTimeSeconds);
    REQUIRE(s.sustain == 1.0f);
    REQUIRE(s.release == kMaxEnvelopeTimeSeconds);

    const auto n = sanitize(ADSRSettings{kNaN, kNaN, kNaN, kNaN});
    REQUIRE(n == ADSRSettings{});
}

TEST_CASE("sanitize(FilterSettings) clamps cutoff, resonance and amount", "[dsp][core][settings]") {
    const auto s = sanitize(FilterSettings{FilterType::Highpass, 5.0f, 100.0f, -3.0f});
    REQUIRE(s.type == FilterType::Highpass);
    REQUIRE(s.cutoff == kMinCutoffHz);
    REQUIRE(s.resonance == kMaxResonance);
    REQUIRE(s.envelopeAmount == -1.0f);

    const auto t = sanitize(FilterSettings{static_cast<FilterType>(9), 50000.0f, 0.0f, kNaN});
    REQUIRE(t.type == FilterType::Lowpass);
    REQUIRE(t.cutoff == kMaxCutoffHz);
    REQUIRE(t.resonance == kMinResonance);
    REQUIRE(t.envelopeAmount == 0.0f);
}

TEST_CASE("Waveform and filter type names", "[dsp][core][settings]") {
    REQUIRE(std::string(waveformName(Waveform::Sawtooth)) == "Sawtooth");
    REQUIRE(std::string(waveformName(Waveform::Noise)) == "Noise");
    REQUIRE(std::string(filterTypeName(FilterType::Bandpass)) == "Band Pass");
}
