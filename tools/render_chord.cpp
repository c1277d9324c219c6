// ==============================================================================
// Offline Chord Renderer for Chordpad
// ==============================================================================
// Plays a chord through the synth engine and the software audio graph and
// writes the result to a 16-bit stereo WAV file. Time is driven by a manual
// clock advanced in 10 ms blocks, so a render is independent of wall-clock
// speed.
//
// Usage:
//   chordpad_render <out.wav> [--notes 60,64,67] [--hold 1.0] [--tail 1.5]
//                   [--waveform saw] [--cutoff 1200] [--env-amount 0.5]
//                   [--velocity 100]
// ==============================================================================

#include "controller/instrument_controller.h"
#include "render_options.h"

#include <chordpad/dsp/core/control_clock.h>
#include <chordpad/dsp/core/db_utils.h>
#include <chordpad/dsp/core/logging.h>
#include <chordpad/dsp/core/synth_settings.h>
#include <chordpad/dsp/systems/software_audio_graph.h>
#include <chordpad/dsp/systems/synth_engine.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

using namespace Chordpad;
using namespace Chordpad::Tools;

// Simple little-endian writer for the RIFF container
class BinaryWriter {
public:
    std::vector<uint8_t> data;

    void writeTag(const char* tag) {
        data.insert(data.end(), tag, tag + 4);
    }

    void writeUInt32(uint32_t val) {
        for (int i = 0; i < 4; ++i) data.push_back(static_cast<uint8_t>(val >> (8 * i)));
    }

    void writeUInt16(uint16_t val) {
        data.push_back(static_cast<uint8_t>(val));
        data.push_back(static_cast<uint8_t>(val >> 8));
    }

    void writeInt16(int16_t val) {
        writeUInt16(static_cast<uint16_t>(val));
    }
};

// ==============================================================================
// WAV Output
// ==============================================================================

bool writeWav(const std::string& path, const std::vector<float>& left,
              const std::vector<float>& right, uint32_t sampleRate) {
    constexpr uint16_t kChannels = 2;
    constexpr uint16_t kBitsPerSample = 16;
    const uint32_t frames = static_cast<uint32_t>(left.size());
    const uint32_t dataBytes = frames * kChannels * (kBitsPerSample / 8);

    BinaryWriter writer;
    writer.writeTag("RIFF");
    writer.writeUInt32(36 + dataBytes);
    writer.writeTag("WAVE");

    writer.writeTag("fmt ");
    writer.writeUInt32(16);
    writer.writeUInt16(1);  // PCM
    writer.writeUInt16(kChannels);
    writer.writeUInt32(sampleRate);
    writer.writeUInt32(sampleRate * kChannels * (kBitsPerSample / 8));
    writer.writeUInt16(kChannels * (kBitsPerSample / 8));
    writer.writeUInt16(kBitsPerSample);

    writer.writeTag("data");
    writer.writeUInt32(dataBytes);
    for (uint32_t i = 0; i < frames; ++i) {
        writer.writeInt16(static_cast<int16_t>(std::lround(std::clamp(left[i], -1.0f, 1.0f) * 32767.0f)));
        writer.writeInt16(static_cast<int16_t>(std::lround(std::clamp(right[i], -1.0f, 1.0f) * 32767.0f)));
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) return false;
    file.write(reinterpret_cast<const char*>(writer.data.data()),
               static_cast<std::streamsize>(writer.data.size()));
    return static_cast<bool>(file);
}

} // anonymous namespace

// ==============================================================================
// Main
// ==============================================================================

int main(int argc, char* argv[]) {
    const auto options = parseArguments(argc, argv);
    if (!options) {
        printUsage();
        return 1;
    }

    DSP::SoftwareAudioGraph graph;
    DSP::ManualControlClock clock;
    DSP::SynthEngine engine(graph, clock);
    if (!engine.start()) {
        std::cerr << "audio engine failed to start" << std::endl;
        return 1;
    }

    if (options->waveform) {
        for (size_t slot = 0; slot < DSP::kNumOscillators; ++slot) {
            DSP::OscillatorSettings s = engine.getOscillatorSettings(slot);
            s.waveform = *options->waveform;
            engine.updateOscillatorSettings(slot, s);
        }
    }
    if (options->cutoffHz || options->envAmount) {
        DSP::FilterSettings f = engine.getFilterSettings();
        if (options->cutoffHz) f.cutoff = *options->cutoffHz;
        if (options->envAmount) f.envelopeAmount = *options->envAmount;
        engine.updateFilterSettings(f);
    }

    InstrumentController controller(engine);
    controller.setVelocity(options->velocity);

    const double sampleRate = graph.sampleRate();
    const size_t blockFrames = static_cast<size_t>(std::lround(sampleRate * 0.01));
    const double blockSeconds = static_cast<double>(blockFrames) / sampleRate;
    const size_t holdBlocks = static_cast<size_t>(std::ceil(options->holdSeconds / blockSeconds));
    const size_t totalBlocks = holdBlocks
        + static_cast<size_t>(std::ceil(options->tailSeconds / blockSeconds));

    std::vector<float> left(totalBlocks * blockFrames);
    std::vector<float> right(totalBlocks * blockFrames);

    controller.playChord(options->notes);
    std::cout << controller.describeState();

    for (size_t block = 0; block < totalBlocks; ++block) {
        if (block == holdBlocks) {
            controller.stopChord(options->notes);
        }
        engine.tick();
        graph.render(left.data() + block * blockFrames,
                     right.data() + block * blockFrames, blockFrames);
        clock.advance(blockSeconds);
    }

    const float peak = std::max(peakMagnitude(left), peakMagnitude(right));

    if (!writeWav(options->outputPath, left, right, static_cast<uint32_t>(sampleRate))) {
        std::cerr << "could not write " << options->outputPath << std::endl;
        return 1;
    }

    std::cout << "Rendered " << left.size() << " frames to " << options->outputPath
              << " (peak " << DSP::gainToDb(peak) << " dBFS, " << engine.activeNoteCount() << " voices left)"
              << std::endl;
    return 0;
}
