// ==============================================================================
// Instrument Controller Implementation
// ==============================================================================

#include "controller/instrument_controller.h"

#include <chordpad/dsp/core/logging.h>
#include <chordpad/dsp/core/midi_utils.h>
#include <chordpad/dsp/systems/synth_engine.h>

#include <cstdarg>
#include <cstdio>
#include <string>

namespace Chordpad {

namespace {

void appendLine(std::string& out, const char* fmt, ...) CHORDPAD_PRINTF_FORMAT(2, 3);

void appendLine(std::string& out, const char* fmt, ...) {
    char buf[256];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    out += buf;
    out += '\n';
}

void storeEnvelope(EnvelopeParams& params, const DSP::ADSRSettings& s) {
    params.attackSec.store(s.attack, std::memory_order_relaxed);
    params.decaySec.store(s.decay, std::memory_order_relaxed);
    params.sustain.store(s.sustain, std::memory_order_relaxed);
    params.releaseSec.store(s.release, std::memory_order_relaxed);
}

} // anonymous namespace

InstrumentController::InstrumentController(DSP::SynthEngine& engine)
    : engine_(engine) {
    loadFromEngine();
}

void InstrumentController::loadFromEngine() {
    global_.masterVolume.store(engine_.getVolume(), std::memory_order_relaxed);

    for (size_t slot = 0; slot < DSP::kNumOscillators; ++slot) {
        const DSP::OscillatorSettings s = engine_.getOscillatorSettings(slot);
        OscillatorParams& osc = oscillators_.slots[slot];
        osc.waveform.store(getDropdownFromWaveform(s.waveform), std::memory_order_relaxed);
        osc.pitch.store(s.pitch, std::memory_order_relaxed);
        osc.detune.store(s.detune, std::memory_order_relaxed);
        osc.level.store(s.level, std::memory_order_relaxed);
        osc.pulseWidth.store(s.pulseWidth, std::memory_order_relaxed);
    }

    storeEnvelope(ampEnvelope_, engine_.getADSRSettings());
    storeEnvelope(filterEnvelope_, engine_.getFilterADSRSettings());

    const DSP::FilterSettings f = engine_.getFilterSettings();
    filter_.type.store(getDropdownFromFilterType(f.type), std::memory_order_relaxed);
    filter_.cutoffHz.store(f.cutoff, std::memory_order_relaxed);
    filter_.resonance.store(f.resonance, std::memory_order_relaxed);
    filter_.envAmount.store(f.envelopeAmount, std::memory_order_relaxed);
}

// =============================================================================
// Notes
// =============================================================================

void InstrumentController::setVelocity(int velocity) {
    global_.velocity.store(DSP::clampNoteVelocity(velocity), std::memory_order_relaxed);
}

int InstrumentController::velocity() const {
    return global_.velocity.load(std::memory_order_relaxed);
}

void InstrumentController::noteOn(int note) {
    engine_.playNote(note, velocity());
    CHORDPAD_LOG_DEBUG("note on %d velocity %d", note, velocity());
}

void InstrumentController::noteOff(int note) {
    engine_.stopNote(note);
    CHORDPAD_LOG_DEBUG("note off %d", note);
}

void InstrumentController::playChord(const std::vector<int>& notes) {
    engine_.playChord(notes, velocity());
    CHORDPAD_LOG_DEBUG("chord on (%zu notes) velocity %d", notes.size(), velocity());
}

void InstrumentController::stopChord(const std::vector<int>& notes) {
    engine_.stopChord(notes);
    CHORDPAD_LOG_DEBUG("chord off (%zu notes)", notes.size());
}

void InstrumentController::panic() {
    engine_.panic();
}

bool InstrumentController::restartEngine() {
    return engine_.restartEngine();
}

// =============================================================================
// Parameters
// =============================================================================

bool InstrumentController::handleParamChange(ParamID id, ParamValue value) {
    if (handleGlobalParamChange(global_, id, value)) {
        if (id == kMasterVolumeId) {
            engine_.setVolume(global_.masterVolume.load(std::memory_order_relaxed));
        }
        return true;
    }

    if (handleOscillatorParamChange(oscillators_, id, value)) {
        const size_t slot = oscSlotForParam(id);
        engine_.updateOscillatorSettings(slot, toSettings(oscillators_.slots[slot]));
        return true;
    }

    if (handleEnvelopeParamChange(ampEnvelope_, kAmpEnvBaseId, id, value)) {
        engine_.updateADSRSettings(toSettings(ampEnvelope_));
        return true;
    }

    if (handleEnvelopeParamChange(filterEnvelope_, kFilterEnvBaseId, id, value)) {
        engine_.updateFilterADSRSettings(toSettings(filterEnvelope_));
        return true;
    }

    if (handleFilterParamChange(filter_, id, value)) {
        engine_.updateFilterSettings(toSettings(filter_));
        return true;
    }

    CHORDPAD_LOG_DEBUG("ignoring change of unknown parameter %u", id);
    return false;
}

bool InstrumentController::formatParam(ParamID id, ParamValue value,
                                       char* text, size_t size) const {
    return formatGlobalParam(id, value, text, size)
        || formatOscillatorParam(id, value, text, size)
        || formatEnvelopeParam(kAmpEnvBaseId, id, value, text, size)
        || formatEnvelopeParam(kFilterEnvBaseId, id, value, text, size)
        || formatFilterParam(id, value, text, size);
}

// =============================================================================
// Diagnostics
// =============================================================================

std::string InstrumentController::describeState() const {
    std::string out;

    appendLine(out, "engine: %s", engine_.isEngineRunning() ? "running" : "stopped");

    std::string notes;
    for (int note : engine_.activeNotes()) {
        if (!notes.empty()) notes += ' ';
        notes += std::to_string(note);
        if (engine_.getNoteState(note) == DSP::NoteState::Releasing) notes += "(rel)";
    }
    appendLine(out, "voices: %zu/%zu [%s], oscillators: %zu",
               engine_.activeNoteCount(), engine_.maxVoices(), notes.c_str(),
               engine_.totalOscillatorCount());
    appendLine(out, "volume: %.2f, velocity: %d",
               static_cast<double>(engine_.getVolume()), velocity());

    for (size_t slot = 0; slot < DSP::kNumOscillators; ++slot) {
        const DSP::OscillatorSettings s = engine_.getOscillatorSettings(slot);
        appendLine(out, "osc%zu: %s pitch %+.0f st detune %+.1f ct level %.2f pw %.2f",
                   slot + 1, DSP::waveformName(s.waveform),
                   static_cast<double>(s.pitch), static_cast<double>(s.detune),
                   static_cast<double>(s.level), static_cast<double>(s.pulseWidth));
    }

    const DSP::ADSRSettings amp = engine_.getADSRSettings();
    appendLine(out, "amp env: A %.3f D %.3f S %.2f R %.3f",
               static_cast<double>(amp.attack), static_cast<double>(amp.decay),
               static_cast<double>(amp.sustain), static_cast<double>(amp.release));

    const DSP::ADSRSettings fenv = engine_.getFilterADSRSettings();
    appendLine(out, "filter env: A %.3f D %.3f S %.2f R %.3f",
               static_cast<double>(fenv.attack), static_cast<double>(fenv.decay),
               static_cast<double>(fenv.sustain), static_cast<double>(fenv.release));

    const DSP::FilterSettings f = engine_.getFilterSettings();
    appendLine(out, "filter: %s cutoff %.1f Hz Q %.2f amount %+.2f",
               DSP::filterTypeName(f.type), static_cast<double>(f.cutoff),
               static_cast<double>(f.resonance), static_cast<double>(f.envelopeAmount));

    return out;
}

} // namespace Chordpad
