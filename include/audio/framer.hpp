#pragma once

#include "audio/sample_buffer.hpp"
#include <cstddef>
#include <vector>

namespace haptick {
namespace audio {

/**
 * One analysis frame: a fixed-length slice of the buffer starting at offset
 */
struct AnalysisFrame {
    size_t index;                 // Frame number in buffer order
    size_t offset;                // First sample of the frame
    std::vector<float> raw;       // Samples as they appear in the buffer
    std::vector<float> windowed;  // Samples multiplied by the Hann window

    AnalysisFrame() : index(0), offset(0) {}
};

/**
 * Slices a buffer into adjacent frames of frameLength samples (hop == length).
 * Trailing samples that do not fill a whole frame are dropped.
 */
class Framer {
public:
    Framer(const SampleBuffer& buffer, size_t frameLength);

    size_t frameLength() const { return frameLength_; }
    size_t frameCount() const { return frameCount_; }

    // Materialize frame `index`, index < frameCount()
    AnalysisFrame frame(size_t index) const;

    // Materialize every frame; prefer frame() for long buffers
    std::vector<AnalysisFrame> frames() const;

    const std::vector<float>& window() const { return window_; }

    static size_t countFrames(size_t sampleCount, size_t frameLength);
    static std::vector<float> hannWindow(size_t length);

private:
    const SampleBuffer& buffer_;
    size_t frameLength_;
    size_t frameCount_;
    std::vector<float> window_;
};

} // namespace audio
} // namespace haptick
