// ==============================================================================
// FilterStage Implementation
// ==============================================================================

#include "filter_stage.h"

#include <chordpad/dsp/core/db_utils.h>
#include <chordpad/dsp/core/logging.h>
#include <chordpad/dsp/core/pitch_utils.h>

#include <algorithm>

namespace Chordpad {
namespace DSP {

FilterStage::FilterStage(AudioGraph& graph)
    : graph_(graph) {}

FilterStage::~FilterStage() {
    stopAll();
}

NodeId FilterStage::createFilter(int note) {
    removeFilter(note);

    NoteFilter filter;
    filter.cutoffHz = modulatedCutoff(settings_.cutoff, settings_.envelopeAmount, 0.0f);
    filter.node = graph_.createFilter(paramsFor(filter.cutoffHz));
    if (filter.node == kInvalidNodeId) {
        CHORDPAD_LOG_WARNING("note %d: could not allocate filter", note);
        return kInvalidNodeId;
    }

    if (!graph_.connect(filter.node, graph_.outputNode())) {
        CHORDPAD_LOG_WARNING("note %d: could not route filter to output", note);
        graph_.destroyNode(filter.node);
        return kInvalidNodeId;
    }

    filters_[note] = filter;
    return filter.node;
}

void FilterStage::updateSettings(const FilterSettings& settings) {
    settings_ = sanitize(settings);
    for (auto& [note, filter] : filters_) {
        retune(filter);
    }
}

void FilterStage::applyEnvelope(int note, float envelopeLevel) {
    auto it = filters_.find(note);
    if (it == filters_.end()) return;

    it->second.envelopeLevel = envelopeLevel;
    retune(it->second);
}

void FilterStage::removeFilter(int note) {
    auto it = filters_.find(note);
    if (it == filters_.end()) return;

    graph_.destroyNode(it->second.node);
    filters_.erase(it);
}

void FilterStage::stopAll() {
    for (auto& [note, filter] : filters_) {
        graph_.destroyNode(filter.node);
    }
    filters_.clear();
}

float FilterStage::modulatedCutoff(float baseCutoff,
                                   float envelopeAmount,
                                   float envelopeLevel) noexcept {
    if (detail::isNaN(baseCutoff)) baseCutoff = kDefaultFilterSettings.cutoff;
    if (detail::isNaN(envelopeAmount)) envelopeAmount = 0.0f;
    if (detail::isNaN(envelopeLevel)) envelopeLevel = 0.0f;

    const float octaves = envelopeAmount * envelopeLevel * kFilterEnvelopeOctaves;
    return std::clamp(baseCutoff * octavesToRatio(octaves), kMinCutoffHz, kMaxCutoffHz);
}

NodeId FilterStage::filterNode(int note) const noexcept {
    auto it = filters_.find(note);
    return it == filters_.end() ? kInvalidNodeId : it->second.node;
}

float FilterStage::currentCutoff(int note) const noexcept {
    auto it = filters_.find(note);
    return it == filters_.end() ? 0.0f : it->second.cutoffHz;
}

void FilterStage::retune(NoteFilter& filter) {
    filter.cutoffHz = modulatedCutoff(settings_.cutoff, settings_.envelopeAmount,
                                      filter.envelopeLevel);
    graph_.setFilterParams(filter.node, paramsFor(filter.cutoffHz));
}

} // namespace DSP
} // namespace Chordpad
