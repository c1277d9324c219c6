// ==============================================================================
// Layer 3: System Component - Software Audio Graph
// ==============================================================================
// In-process AudioGraph that renders the node tree into stereo float blocks.
// Players loop their LoopBuffer, filter nodes run a stereo Biquad, mixers and
// the output sum their inputs. Every node applies its own volume.
//
// render() pulls from the output node recursively; it can be driven from an
// audio callback thread or offline (see tools/render_chord.cpp). The node
// table is guarded by a mutex shared with the control-side API.
// ==============================================================================

#pragma once

#include <chordpad/dsp/primitives/audio_graph.h>
#include <chordpad/dsp/primitives/biquad.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace Chordpad {
namespace DSP {

class SoftwareAudioGraph final : public AudioGraph {
public:
    explicit SoftwareAudioGraph(double sampleRate = kDefaultSampleRate);
    ~SoftwareAudioGraph() override = default;

    SoftwareAudioGraph(const SoftwareAudioGraph&) = delete;
    SoftwareAudioGraph& operator=(const SoftwareAudioGraph&) = delete;

    // =========================================================================
    // AudioGraph
    // =========================================================================

    bool start() override;
    void stop() override;
    [[nodiscard]] bool isRunning() const override;
    [[nodiscard]] double sampleRate() const override { return sampleRate_; }

    [[nodiscard]] NodeId outputNode() const override { return outputNode_; }
    [[nodiscard]] NodeId createMixer() override;
    [[nodiscard]] NodeId createFilter(const FilterNodeParams& params) override;
    [[nodiscard]] NodeId createPlayer() override;
    [[nodiscard]] bool connect(NodeId source, NodeId destination) override;
    void destroyNode(NodeId node) override;

    void setFilterParams(NodeId filter, const FilterNodeParams& params) override;
    [[nodiscard]] bool scheduleLoop(NodeId player,
                                    std::shared_ptr<const LoopBuffer> buffer) override;
    void setVolume(NodeId node, float gain) override;

    // =========================================================================
    // Rendering
    // =========================================================================

    /// Render `frames` stereo frames. Writes silence while stopped.
    void render(float* left, float* right, size_t frames);

    // =========================================================================
    // Diagnostics
    // =========================================================================

    /// Live nodes, not counting the output node
    [[nodiscard]] size_t nodeCount() const;

    [[nodiscard]] bool hasNode(NodeId node) const;

    /// Volume of `node`, or 0 for unknown ids
    [[nodiscard]] float nodeVolume(NodeId node) const;

    /// Make the next `count` create* calls fail with kInvalidNodeId.
    void setFailNextAllocations(size_t count);

private:
    enum class NodeKind : uint8_t {
        Output = 0,
        Mixer,
        Filter,
        Player
    };

    struct Node {
        NodeKind kind = NodeKind::Mixer;
        NodeId destination = kInvalidNodeId;
        std::vector<NodeId> inputs;
        float volume = 1.0f;

        // Filter
        FilterNodeParams filterParams;
        Biquad filterLeft;
        Biquad filterRight;

        // Player
        std::shared_ptr<const LoopBuffer> loop;
        size_t playhead = 0;

        std::vector<float> scratchLeft;
        std::vector<float> scratchRight;
    };

    /// Caller holds mutex_
    [[nodiscard]] NodeId allocateNode(NodeKind kind);

    /// Caller holds mutex_. Fills node.scratch* with `frames` frames.
    void pull(Node& node, size_t frames);

    void detachFromDestination(NodeId id, Node& node);

    const double sampleRate_;
    mutable std::mutex mutex_;
    std::unordered_map<NodeId, Node> nodes_;
    NodeId nextId_ = 1;
    NodeId outputNode_ = kInvalidNodeId;
    bool running_ = false;
    size_t failAllocations_ = 0;
};

} // namespace DSP
} // namespace Chordpad
