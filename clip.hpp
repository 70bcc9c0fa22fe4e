#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace owah {

// Fixed-length bite of decoded (or synthesized) audio. Never modified once
// built; a new load produces a new clip.
struct SampleClip {
    int sample_rate = 0;
    int num_channels = 0;
    std::vector<float> samples; // interleaved when num_channels > 1
    std::string path;           // empty for the synthesized tone

    size_t frames() const {
        return num_channels > 0 ? samples.size() / num_channels : 0;
    }
    double duration_sec() const {
        return sample_rate > 0 ? (double)frames() / sample_rate : 0.0;
    }
};

using ClipPtr = std::shared_ptr<const SampleClip>;

// round(sample_rate * duration_ms / 1000)
int64_t targetFrames(int sample_rate, int duration_ms);

// Pads with silence or truncates so samples.size() == frames * num_channels.
void fitToFrames(std::vector<float>& samples, int64_t frames, int num_channels);

// Peak of channel 0 per bucket, for drawing the bite.
std::vector<float> waveformSummary(const SampleClip& clip, int num_points);

} // namespace owah
