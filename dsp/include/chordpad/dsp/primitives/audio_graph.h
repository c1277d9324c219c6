// ==============================================================================
// Layer 1: DSP Primitive - Audio Graph Contract
// ==============================================================================
// The minimal node-graph surface the synth engine needs from an audio backend:
// looped buffer players, mixers, resonant filter nodes and a single output.
// Node identifiers are opaque integers; kInvalidNodeId signals an allocation
// failure and is never a live node.
//
// Implementations must be safe to call from the control thread while the
// backend renders on its own thread.
// ==============================================================================

#pragma once

#include <chordpad/dsp/core/synth_types.h>
#include <chordpad/dsp/primitives/loop_buffer.h>

#include <cstdint>
#include <memory>

namespace Chordpad {
namespace DSP {

using NodeId = uint32_t;

/// Returned by the create* functions when no node could be allocated
inline constexpr NodeId kInvalidNodeId = 0;

/// Default output sample rate for software rendering
inline constexpr double kDefaultSampleRate = 44100.0;

/// @brief Band, cutoff and Q of a filter node.
struct FilterNodeParams {
    FilterType type = FilterType::Lowpass;
    float cutoffHz = 1000.0f;
    float q = 1.0f;

    bool operator==(const FilterNodeParams&) const = default;
};

/// @brief Abstract audio node graph.
///
/// Audio flows from players through mixers and filters to outputNode(). Each
/// node feeds at most one destination; connecting an already connected node
/// moves it.
class AudioGraph {
public:
    virtual ~AudioGraph() = default;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Start rendering. Returns false if the backend could not start.
    virtual bool start() = 0;

    /// Stop rendering. Nodes are kept.
    virtual void stop() = 0;

    [[nodiscard]] virtual bool isRunning() const = 0;

    [[nodiscard]] virtual double sampleRate() const = 0;

    // =========================================================================
    // Nodes
    // =========================================================================

    [[nodiscard]] virtual NodeId outputNode() const = 0;

    [[nodiscard]] virtual NodeId createMixer() = 0;
    [[nodiscard]] virtual NodeId createFilter(const FilterNodeParams& params) = 0;

    /// Player nodes start with no loop and unity volume.
    [[nodiscard]] virtual NodeId createPlayer() = 0;

    /// Route `source` into `destination`. Fails for unknown ids, for players
    /// as destination, for the output node as source, and for cycles.
    [[nodiscard]] virtual bool connect(NodeId source, NodeId destination) = 0;

    /// Remove a node and disconnect everything attached to it. Unknown ids
    /// and the output node are ignored.
    virtual void destroyNode(NodeId node) = 0;

    // =========================================================================
    // Node Control
    // =========================================================================

    /// Retune a filter node. Filter state is kept, so sweeps do not click.
    virtual void setFilterParams(NodeId filter, const FilterNodeParams& params) = 0;

    /// Replace a player's loop and restart it at phase 0.
    [[nodiscard]] virtual bool scheduleLoop(NodeId player,
                                            std::shared_ptr<const LoopBuffer> buffer) = 0;

    /// Output gain of any node.
    virtual void setVolume(NodeId node, float gain) = 0;
};

} // namespace DSP
} // namespace Chordpad
