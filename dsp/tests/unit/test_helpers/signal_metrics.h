// ==============================================================================
// Test Helper: Signal Metrics
// ==============================================================================
// Peak, RMS and zero-crossing measurements for rendered blocks.
//
// This is TEST INFRASTRUCTURE, not production DSP code.
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace Chordpad {
namespace DSP {
namespace TestUtils {

[[nodiscard]] inline float peakAbs(const std::vector<float>& buffer) noexcept {
    float peak = 0.0f;
    for (float s : buffer) peak = std::max(peak, std::abs(s));
    return peak;
}

[[nodiscard]] inline float rms(const std::vector<float>& buffer) noexcept {
    if (buffer.empty()) return 0.0f;
    double sum = 0.0;
    for (float s : buffer) sum += static_cast<double>(s) * s;
    return static_cast<float>(std::sqrt(sum / static_cast<double>(buffer.size())));
}

/// Number of sign changes from negative to non-negative
[[nodiscard]] inline size_t risingZeroCrossings(const std::vector<float>& buffer) noexcept {
    size_t count = 0;
    for (size_t i = 1; i < buffer.size(); ++i) {
        if (buffer[i - 1] < 0.0f && buffer[i] >= 0.0f) ++count;
    }
    return count;
}

[[nodiscard]] inline bool allFinite(const std::vector<float>& buffer) noexcept {
    return std::all_of(buffer.begin(), buffer.end(), [](float s) { return std::isfinite(s); });
}

} // namespace TestUtils
} // namespace DSP
} // namespace Chordpad
