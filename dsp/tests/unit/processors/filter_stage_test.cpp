// ==============================================================================
// Layer 2: DSP Processor - Filter Stage Tests
// ==============================================================================

#include <chordpad/dsp/processors/filter_stage.h>

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "test_helpers/log_capture.h"
#include "test_helpers/recording_audio_graph.h"

#include <limits>

using namespace Chordpad::DSP;
using Catch::Approx;
using Chordpad::DSP::TestUtils::LogCapture;
using Chordpad::DSP::TestUtils::RecordingAudioGraph;

// =============================================================================
// Cutoff Modulation
// =============================================================================

TEST_CASE("modulatedCutoff sweeps in octaves", "[filter_stage][processors]") {
    SECTION("No amount or no level leaves the base cutoff") {
        REQUIRE(FilterStage::modulatedCutoff(1000.0f, 0.0f, 1.0f) == Approx(1000.0f));
        REQUIRE(FilterStage::modulatedCutoff(1000.0f, 1.0f, 0.0f) == Approx(1000.0f));
    }

    SECTION("Full envelope at +1 opens four octaves") {
        REQUIRE(FilterStage::modulatedCutoff(1000.0f, 1.0f, 1.0f) == Approx(16000.0f));
    }

    SECTION("Half envelope at +1 opens two octaves") {
        REQUIRE(FilterStage::modulatedCutoff(1000.0f, 1.0f, 0.5f) == Approx(4000.0f));
    }

    SECTION("Negative amount closes the filter") {
        REQUIRE(FilterStage::modulatedCutoff(1000.0f, -1.0f, 1.0f) == Approx(62.5f));
        REQUIRE(FilterStage::modulatedCutoff(1000.0f, -0.25f, 1.0f) == Approx(500.0f));
    }
}

TEST_CASE("modulatedCutoff stays within 20 Hz - 20 kHz", "[filter_stage][processors]") {
    REQUIRE(FilterStage::modulatedCutoff(5000.0f, 1.0f, 1.0f) == kMaxCutoffHz);
    REQUIRE(FilterStage::modulatedCutoff(100.0f, -1.0f, 1.0f) == kMinCutoffHz);

    constexpr float kNaN = std::numeric_limits<float>::quiet_NaN();
    REQUIRE(FilterStage::modulatedCutoff(kNaN, 0.0f, 0.0f) == Approx(kDefaultFilterSettings.cutoff));
    REQUIRE(FilterStage::modulatedCutoff(1000.0f, kNaN, 1.0f) == Approx(1000.0f));
    REQUIRE(FilterStage::modulatedCutoff(1000.0f, 1.0f, kNaN) == Approx(1000.0f));
}

// =============================================================================
// Filter Lifecycle
// =============================================================================

TEST_CASE("createFilter routes a filter node to the output", "[filter_stage][processors]") {
    RecordingAudioGraph graph;
    FilterStage stage(graph);
    stage.updateSettings(FilterSettings{FilterType::Highpass, 800.0f, 4.0f, 0.5f});

    const NodeId node = stage.createFilter(60);

    REQUIRE(node != kInvalidNodeId);
    REQUIRE(stage.filterNode(60) == node);
    REQUIRE(stage.filterCount() == 1);

    const auto& record = graph.node(node);
    REQUIRE(record.kind == RecordingAudioGraph::Kind::Filter);
    REQUIRE(record.destination == graph.outputNode());
    REQUIRE(record.filterParams.type == FilterType::Highpass);
    REQUIRE(record.filterParams.cutoffHz == Approx(800.0f));
    REQUIRE(record.filterParams.q == Approx(4.0f));
    REQUIRE(stage.currentCutoff(60) == Approx(800.0f));
}

TEST_CASE("applyEnvelope retunes the note's filter", "[filter_stage][processors]") {
    RecordingAudioGraph graph;
    FilterStage stage(graph);
    stage.updateSettings(FilterSettings{FilterType::Lowpass, 500.0f, 1.0f, 1.0f});
    const NodeId node = stage.createFilter(60);

    stage.applyEnvelope(60, 1.0f);
    REQUIRE(stage.currentCutoff(60) == Approx(8000.0f));
    REQUIRE(graph.node(node).filterParams.cutoffHz == Approx(8000.0f));

    stage.applyEnvelope(60, 0.25f);
    REQUIRE(graph.node(node).filterParams.cutoffHz == Approx(1000.0f));

    // Unknown notes are ignored
    stage.applyEnvelope(61, 1.0f);
    REQUIRE(stage.currentCutoff(61) == 0.0f);
}

TEST_CASE("updateSettings retunes every live filter", "[filter_stage][processors]") {
    RecordingAudioGraph graph;
    FilterStage stage(graph);
    const NodeId a = stage.createFilter(60);
    const NodeId b = stage.createFilter(64);
    stage.applyEnvelope(60, 0.5f);

    stage.updateSettings(FilterSettings{FilterType::Bandpass, 2000.0f, 8.0f, 1.0f});

    REQUIRE(graph.node(a).filterParams.type == FilterType::Bandpass);
    REQUIRE(graph.node(a).filterParams.q == Approx(8.0f));
    REQUIRE(graph.node(a).filterParams.cutoffHz == Approx(8000.0f));   // level 0.5 -> 2 octaves
    REQUIRE(graph.node(b).filterParams.cutoffHz == Approx(2000.0f));   // level 0
}

TEST_CASE("updateSettings sanitizes", "[filter_stage][processors]") {
    RecordingAudioGraph graph;
    FilterStage stage(graph);

    stage.updateSettings(FilterSettings{FilterType::Lowpass, 1.0f, 0.0f, 5.0f});

    REQUIRE(stage.getSettings().cutoff == kMinCutoffHz);
    REQUIRE(stage.getSettings().resonance == kMinResonance);
    REQUIRE(stage.getSettings().envelopeAmount == 1.0f);
}

TEST_CASE("createFilter replaces an existing filter for the note", "[filter_stage][processors]") {
    RecordingAudioGraph graph;
    FilterStage stage(graph);

    const NodeId first = stage.createFilter(60);
    const NodeId second = stage.createFilter(60);

    REQUIRE(first != second);
    REQUIRE_FALSE(graph.has(first));
    REQUIRE(stage.filterCount() == 1);
}

TEST_CASE("removeFilter and stopAll destroy nodes", "[filter_stage][processors]") {
    RecordingAudioGraph graph;
    FilterStage stage(graph);
    (void)stage.createFilter(60);
    (void)stage.createFilter(64);
    (void)stage.createFilter(67);

    stage.removeFilter(64);
    REQUIRE(stage.filterNode(64) == kInvalidNodeId);
    REQUIRE(graph.liveNodes() == 2);

    stage.removeFilter(64);   // no-op
    REQUIRE(stage.filterCount() == 2);

    stage.stopAll();
    REQUIRE(stage.filterCount() == 0);
    REQUIRE(graph.liveNodes() == 0);
}

// =============================================================================
// Failure Handling
// =============================================================================

TEST_CASE("Filter allocation failure is reported", "[filter_stage][processors]") {
    RecordingAudioGraph graph;
    FilterStage stage(graph);
    LogCapture log;

    SECTION("No filter node available") {
        graph.failFilters = 1;
        REQUIRE(stage.createFilter(60) == kInvalidNodeId);
        REQUIRE(log.contains(LogLevel::Warning, "could not allocate filter"));
    }

    SECTION("Filter cannot be routed") {
        graph.failConnects = 1;
        REQUIRE(stage.createFilter(60) == kInvalidNodeId);
        REQUIRE(graph.liveNodes() == 0);
        REQUIRE(log.contains(LogLevel::Warning, "could not route filter"));
    }

    REQUIRE(stage.filterCount() == 0);
}
