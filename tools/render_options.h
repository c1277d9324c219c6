// ==============================================================================
// Offline Chord Renderer - Command Line Options
// ==============================================================================
// Argument parsing and output measurement for chordpad_render.
// ==============================================================================

#pragma once

#include <chordpad/dsp/core/midi_utils.h>
#include <chordpad/dsp/core/synth_types.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace Chordpad {
namespace Tools {

struct RenderOptions {
    std::string outputPath;
    std::vector<int> notes{60, 64, 67};
    double holdSeconds = 1.0;
    double tailSeconds = 1.5;
    std::optional<DSP::Waveform> waveform;
    std::optional<float> cutoffHz;
    std::optional<float> envAmount;
    int velocity = 100;
};

inline void printUsage() {
    std::cerr << "usage: chordpad_render <out.wav> [--notes 60,64,67] [--hold 1.0] [--tail 1.5]\n"
                 "                       [--waveform sine|triangle|saw|square|pulse|noise]\n"
                 "                       [--cutoff 1200] [--env-amount 0.5] [--velocity 100]\n";
}

inline std::optional<DSP::Waveform> parseWaveform(const std::string& name) {
    if (name == "sine") return DSP::Waveform::Sine;
    if (name == "triangle") return DSP::Waveform::Triangle;
    if (name == "saw" || name == "sawtooth") return DSP::Waveform::Sawtooth;
    if (name == "square") return DSP::Waveform::Square;
    if (name == "pulse") return DSP::Waveform::Pulse;
    if (name == "noise") return DSP::Waveform::Noise;
    return std::nullopt;
}

/// Comma-separated MIDI notes. Values are clamped to [0, 127].
inline std::optional<std::vector<int>> parseNotes(const std::string& list) {
    std::vector<int> notes;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        char* end = nullptr;
        const long value = std::strtol(item.c_str(), &end, 10);
        if (item.empty() || *end != '\0') return std::nullopt;
        notes.push_back(static_cast<int>(
            std::clamp<long>(value, DSP::kMinMidiNote, DSP::kMaxMidiNote)));
    }
    if (notes.empty()) return std::nullopt;
    return notes;
}

inline std::optional<double> parseNumber(const char* text) {
    char* end = nullptr;
    const double value = std::strtod(text, &end);
    if (end == text || *end != '\0' || !std::isfinite(value)) return std::nullopt;
    return value;
}

/// @return nullopt on any malformed argument, or when hold plus tail is zero
inline std::optional<RenderOptions> parseArguments(int argc, const char* const argv[]) {
    if (argc < 2 || argv[1][0] == '-') return std::nullopt;

    RenderOptions options;
    options.outputPath = argv[1];

    for (int i = 2; i < argc; ++i) {
        const std::string flag = argv[i];
        if (i + 1 >= argc) {
            std::cerr << "missing value for " << flag << "\n";
            return std::nullopt;
        }
        const char* value = argv[++i];

        if (flag == "--notes") {
            auto notes = parseNotes(value);
            if (!notes) { std::cerr << "bad note list: " << value << "\n"; return std::nullopt; }
            options.notes = *notes;
        } else if (flag == "--waveform") {
            options.waveform = parseWaveform(value);
            if (!options.waveform) { std::cerr << "unknown waveform: " << value << "\n"; return std::nullopt; }
        } else {
            auto number = parseNumber(value);
            if (!number) { std::cerr << "bad number for " << flag << ": " << value << "\n"; return std::nullopt; }

            if (flag == "--hold") options.holdSeconds = std::max(*number, 0.0);
            else if (flag == "--tail") options.tailSeconds = std::max(*number, 0.0);
            else if (flag == "--cutoff") options.cutoffHz = static_cast<float>(*number);
            else if (flag == "--env-amount") options.envAmount = static_cast<float>(*number);
            else if (flag == "--velocity") {
                options.velocity = static_cast<int>(std::lround(std::clamp(
                    *number, static_cast<double>(DSP::kMinNoteVelocity),
                    static_cast<double>(DSP::kMaxMidiVelocity))));
            }
            else { std::cerr << "unknown option: " << flag << "\n"; return std::nullopt; }
        }
    }

    if (options.holdSeconds + options.tailSeconds <= 0.0) {
        std::cerr << "nothing to render: --hold and --tail are both 0\n";
        return std::nullopt;
    }
    return options;
}

/// Largest absolute sample; 0 for an empty buffer.
[[nodiscard]] inline float peakMagnitude(const std::vector<float>& samples) noexcept {
    float peak = 0.0f;
    for (float s : samples) peak = std::max(peak, std::abs(s));
    return peak;
}

} // namespace Tools
} // namespace Chordpad
