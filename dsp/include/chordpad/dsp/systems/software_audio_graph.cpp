// ==============================================================================
// SoftwareAudioGraph Implementation
// ==============================================================================

#include "software_audio_graph.h"

#include <chordpad/dsp/core/db_utils.h>

#include <algorithm>
#include <utility>

namespace Chordpad {
namespace DSP {

SoftwareAudioGraph::SoftwareAudioGraph(double sampleRate)
    : sampleRate_(sampleRate > 0.0 ? sampleRate : kDefaultSampleRate) {
    std::lock_guard<std::mutex> lock(mutex_);
    outputNode_ = allocateNode(NodeKind::Output);
}

// =============================================================================
// Lifecycle
// =============================================================================

bool SoftwareAudioGraph::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = true;
    return true;
}

void SoftwareAudioGraph::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
}

bool SoftwareAudioGraph::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

// =============================================================================
// Nodes
// =============================================================================

NodeId SoftwareAudioGraph::createMixer() {
    std::lock_guard<std::mutex> lock(mutex_);
    return allocateNode(NodeKind::Mixer);
}

NodeId SoftwareAudioGraph::createFilter(const FilterNodeParams& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    const NodeId id = allocateNode(NodeKind::Filter);
    if (id == kInvalidNodeId) return id;

    Node& node = nodes_.at(id);
    node.filterParams = params;
    node.filterLeft.configure(params.type, params.cutoffHz, params.q,
                              static_cast<float>(sampleRate_));
    node.filterRight.setCoefficients(node.filterLeft.coefficients());
    return id;
}

NodeId SoftwareAudioGraph::createPlayer() {
    std::lock_guard<std::mutex> lock(mutex_);
    return allocateNode(NodeKind::Player);
}

bool SoftwareAudioGraph::connect(NodeId source, NodeId destination) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto srcIt = nodes_.find(source);
    auto dstIt = nodes_.find(destination);
    if (srcIt == nodes_.end() || dstIt == nodes_.end()) return false;
    if (source == destination) return false;
    if (srcIt->second.kind == NodeKind::Output) return false;
    if (dstIt->second.kind == NodeKind::Player) return false;

    // Walking downstream from the destination must never reach the source
    for (NodeId cursor = dstIt->second.destination; cursor != kInvalidNodeId;) {
        if (cursor == source) return false;
        auto it = nodes_.find(cursor);
        if (it == nodes_.end()) break;
        cursor = it->second.destination;
    }

    detachFromDestination(source, srcIt->second);
    srcIt->second.destination = destination;
    dstIt->second.inputs.push_back(source);
    return true;
}

void SoftwareAudioGraph::destroyNode(NodeId id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (id == outputNode_) return;
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return;

    detachFromDestination(id, it->second);
    for (NodeId input : it->second.inputs) {
        auto inputIt = nodes_.find(input);
        if (inputIt != nodes_.end()) {
            inputIt->second.destination = kInvalidNodeId;
        }
    }
    nodes_.erase(it);
}

// =============================================================================
// Node Control
// =============================================================================

void SoftwareAudioGraph::setFilterParams(NodeId filter, const FilterNodeParams& params) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = nodes_.find(filter);
    if (it == nodes_.end() || it->second.kind != NodeKind::Filter) return;

    Node& node = it->second;
    if (node.filterParams == params) return;

    node.filterParams = params;
    node.filterLeft.configure(params.type, params.cutoffHz, params.q,
                              static_cast<float>(sampleRate_));
    node.filterRight.setCoefficients(node.filterLeft.coefficients());
}

bool SoftwareAudioGraph::scheduleLoop(NodeId player, std::shared_ptr<const LoopBuffer> buffer) {
    if (!buffer || buffer->empty()) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = nodes_.find(player);
    if (it == nodes_.end() || it->second.kind != NodeKind::Player) return false;

    it->second.loop = std::move(buffer);
    it->second.playhead = 0;
    return true;
}

void SoftwareAudioGraph::setVolume(NodeId id, float gain) {
    if (!detail::isFinite(gain)) return;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = nodes_.find(id);
    if (it != nodes_.end()) {
        it->second.volume = std::max(gain, 0.0f);
    }
}

// =============================================================================
// Rendering
// =============================================================================

void SoftwareAudioGraph::render(float* left, float* right, size_t frames) {
    if (frames == 0) return;

    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
        std::fill(left, left + frames, 0.0f);
        std::fill(right, right + frames, 0.0f);
        return;
    }

    Node& output = nodes_.at(outputNode_);
    pull(output, frames);
    std::copy_n(output.scratchLeft.begin(), frames, left);
    std::copy_n(output.scratchRight.begin(), frames, right);
}

void SoftwareAudioGraph::pull(Node& node, size_t frames) {
    if (node.scratchLeft.size() < frames) {
        node.scratchLeft.resize(frames);
        node.scratchRight.resize(frames);
    }
    std::fill_n(node.scratchLeft.begin(), frames, 0.0f);
    std::fill_n(node.scratchRight.begin(), frames, 0.0f);

    if (node.kind == NodeKind::Player) {
        if (!node.loop || node.loop->empty()) return;

        const LoopBuffer& loop = *node.loop;
        const size_t length = loop.frames();
        size_t head = node.playhead % length;
        for (size_t i = 0; i < frames; ++i) {
            node.scratchLeft[i] = loop.left[head] * node.volume;
            node.scratchRight[i] = loop.right[head] * node.volume;
            if (++head == length) head = 0;
        }
        node.playhead = head;
        return;
    }

    for (NodeId inputId : node.inputs) {
        auto it = nodes_.find(inputId);
        if (it == nodes_.end()) continue;

        Node& input = it->second;
        pull(input, frames);
        for (size_t i = 0; i < frames; ++i) {
            node.scratchLeft[i] += input.scratchLeft[i];
            node.scratchRight[i] += input.scratchRight[i];
        }
    }

    if (node.kind == NodeKind::Filter) {
        node.filterLeft.processBlock(node.scratchLeft.data(), frames);
        node.filterRight.processBlock(node.scratchRight.data(), frames);
    }

    for (size_t i = 0; i < frames; ++i) {
        node.scratchLeft[i] *= node.volume;
        node.scratchRight[i] *= node.volume;
    }
}

// =============================================================================
// Diagnostics
// =============================================================================

size_t SoftwareAudioGraph::nodeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nodes_.size() - 1;
}

bool SoftwareAudioGraph::hasNode(NodeId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nodes_.find(id) != nodes_.end();
}

float SoftwareAudioGraph::nodeVolume(NodeId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = nodes_.find(id);
    return it == nodes_.end() ? 0.0f : it->second.volume;
}

void SoftwareAudioGraph::setFailNextAllocations(size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    failAllocations_ = count;
}

// =============================================================================
// Internals
// =============================================================================

NodeId SoftwareAudioGraph::allocateNode(NodeKind kind) {
    if (failAllocations_ > 0) {
        --failAllocations_;
        return kInvalidNodeId;
    }

    const NodeId id = nextId_++;
    Node node;
    node.kind = kind;
    nodes_.emplace(id, std::move(node));
    return id;
}

void SoftwareAudioGraph::detachFromDestination(NodeId id, Node& node) {
    if (node.destination == kInvalidNodeId) return;

    auto it = nodes_.find(node.destination);
    if (it != nodes_.end()) {
        auto& inputs = it->second.inputs;
        inputs.erase(std::remove(inputs.begin(), inputs.end(), id), inputs.end());
    }
    node.destination = kInvalidNodeId;
}

} // namespace DSP
} // namespace Chordpad
