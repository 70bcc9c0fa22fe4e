#include "clip.hpp"

#include <algorithm>
#include <cmath>

namespace owah {

int64_t targetFrames(int sample_rate, int duration_ms) {
    return (int64_t)std::llround((double)sample_rate * duration_ms / 1000.0);
}

void fitToFrames(std::vector<float>& samples, int64_t frames, int num_channels) {
    samples.resize((size_t)(frames * num_channels), 0.0f);
}

std::vector<float> waveformSummary(const SampleClip& clip, int num_points) {
    std::vector<float> summary;
    if (num_points <= 0 || clip.num_channels <= 0 || clip.samples.empty()) return summary;

    summary.resize(num_points);
    int samples_per_point = (int)(clip.frames() / num_points);
    if (samples_per_point < 1) samples_per_point = 1;

    for (int i = 0; i < num_points; i++) {
        float max_val = 0;
        for (int j = 0; j < samples_per_point; j++) {
            size_t idx = ((size_t)i * samples_per_point + j) * clip.num_channels;
            if (idx < clip.samples.size()) {
                max_val = std::max(max_val, std::abs(clip.samples[idx]));
            }
        }
        summary[i] = max_val;
    }
    return summary;
}

} // namespace owah
