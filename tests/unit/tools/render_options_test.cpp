// ==============================================================================
// Chord Renderer Options Unit Tests
// ==============================================================================

#include "render_options.h"

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace Chordpad::Tools;
using Chordpad::DSP::Waveform;

TEST_CASE("Renderer defaults", "[tools][render]") {
    const char* argv[] = {"chordpad_render", "out.wav"};
    const auto options = parseArguments(2, argv);
    REQUIRE(options.has_value());
    REQUIRE(options->outputPath == "out.wav");
    REQUIRE(options->notes == std::vector<int>{60, 64, 67});
    REQUIRE(options->velocity == 100);
    REQUIRE_FALSE(options->waveform.has_value());
}

TEST_CASE("Renderer options are parsed", "[tools][render]") {
    const char* argv[] = {"chordpad_render", "out.wav", "--notes", "48,55",
                          "--waveform", "square", "--hold", "0.5", "--tail", "0"};
    const auto options = parseArguments(10, argv);
    REQUIRE(options.has_value());
    REQUIRE(options->notes == std::vector<int>{48, 55});
    REQUIRE(options->waveform == Waveform::Square);
    REQUIRE(options->holdSeconds == 0.5);
    REQUIRE(options->tailSeconds == 0.0);
}

TEST_CASE("A zero-length render is rejected", "[tools][render]") {
    const char* argv[] = {"chordpad_render", "out.wav", "--hold", "0", "--tail", "0"};
    REQUIRE_FALSE(parseArguments(6, argv).has_value());

    const char* negative[] = {"chordpad_render", "out.wav", "--hold", "-1", "--tail", "-2"};
    REQUIRE_FALSE(parseArguments(6, negative).has_value());
}

TEST_CASE("Out-of-range velocity and notes are clamped", "[tools][render]") {
    const char* argv[] = {"chordpad_render", "out.wav", "--velocity", "1e12",
                          "--notes", "-40,60,99999999999"};
    const auto options = parseArguments(6, argv);
    REQUIRE(options.has_value());
    REQUIRE(options->velocity == 127);
    REQUIRE(options->notes == std::vector<int>{0, 60, 127});

    const char* low[] = {"chordpad_render", "out.wav", "--velocity", "-1e12"};
    REQUIRE(parseArguments(4, low)->velocity == 1);
}

TEST_CASE("Malformed arguments are rejected", "[tools][render]") {
    const char* missingPath[] = {"chordpad_render", "--hold", "1"};
    REQUIRE_FALSE(parseArguments(3, missingPath).has_value());

    const char* badWave[] = {"chordpad_render", "out.wav", "--waveform", "organ"};
    REQUIRE_FALSE(parseArguments(4, badWave).has_value());

    const char* badNumber[] = {"chordpad_render", "out.wav", "--cutoff", "12k"};
    REQUIRE_FALSE(parseArguments(4, badNumber).has_value());

    const char* missingValue[] = {"chordpad_render", "out.wav", "--notes"};
    REQUIRE_FALSE(parseArguments(3, missingValue).has_value());
}

TEST_CASE("peakMagnitude", "[tools][render]") {
    REQUIRE(peakMagnitude({}) == 0.0f);
    REQUIRE(peakMagnitude({0.25f, -0.75f, 0.5f}) == 0.75f);
}
