#pragma once

// ==============================================================================
// Instrument Controller
// ==============================================================================
// Input surface of the instrument: note and chord gestures from the pads and
// normalized parameter changes from the patch editor. Parameter changes are
// mapped to physical units by the parameter structs, and the resulting
// settings snapshot is pushed to the synth engine.
// ==============================================================================

#include "param_ids.h"
#include "parameters/envelope_params.h"
#include "parameters/filter_params.h"
#include "parameters/global_params.h"
#include "parameters/oscillator_params.h"

#include <cstddef>
#include <string>
#include <vector>

namespace Chordpad {

namespace DSP {
class SynthEngine;
}

class InstrumentController {
public:
    /// Parameter state is initialized from the engine's current patch.
    /// @param engine Must outlive the controller
    explicit InstrumentController(DSP::SynthEngine& engine);

    InstrumentController(const InstrumentController&) = delete;
    InstrumentController& operator=(const InstrumentController&) = delete;

    // =========================================================================
    // Notes
    // =========================================================================

    /// Velocity used for every note and chord, clamped to [1, 127]
    void setVelocity(int velocity);
    [[nodiscard]] int velocity() const;

    void noteOn(int note);
    void noteOff(int note);
    void playChord(const std::vector<int>& notes);
    void stopChord(const std::vector<int>& notes);
    void panic();

    /// @return false if the audio engine could not be restarted
    bool restartEngine();

    // =========================================================================
    // Parameters
    // =========================================================================

    /// Apply a normalized change and push the affected settings to the engine.
    /// @return false for unknown parameter IDs
    bool handleParamChange(ParamID id, ParamValue value);

    /// Display text for a normalized value of `id`.
    /// @return false for unknown parameter IDs (text is left untouched)
    bool formatParam(ParamID id, ParamValue value, char* text, size_t size) const;

    // =========================================================================
    // Diagnostics
    // =========================================================================

    /// Multi-line summary of engine state and the current patch
    [[nodiscard]] std::string describeState() const;

private:
    void loadFromEngine();

    DSP::SynthEngine& engine_;
    GlobalParams global_;
    OscillatorBankParams oscillators_;
    EnvelopeParams ampEnvelope_;
    EnvelopeParams filterEnvelope_;
    FilterParams filter_;
};

} // namespace Chordpad
