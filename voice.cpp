#include "voice.hpp"

#include <cmath>
#include <utility>

namespace owah {

Voice::Voice(ClipPtr c, int note, double ratio, float g, int output_rate)
    : clip(std::move(c)), midi_note(note), gain(g) {
    increment = ratio * clip->sample_rate / (double)output_rate;
    // A step that never advances would hold the voice forever.
    if (!std::isfinite(increment) || increment <= 0.0) finished = true;
}

int Voice::render(float* interleaved, int num_frames, int out_channels) {
    if (finished) return 0;

    const int src_channels = clip->num_channels;
    const int64_t src_frames = (int64_t)clip->frames();
    const float* src = clip->samples.data();

    int i = 0;
    for (; i < num_frames; ++i) {
        if (!std::isfinite(playhead) || playhead >= (double)src_frames) {
            finished = true;
            break;
        }
        int64_t index0 = (int64_t)playhead;
        int64_t index1 = index0 + 1 < src_frames ? index0 + 1 : index0;
        float fraction = (float)(playhead - (double)index0);

        for (int c = 0; c < out_channels; ++c) {
            int sc = src_channels == 1 ? 0 : c % src_channels;
            float s0 = src[index0 * src_channels + sc];
            float s1 = src[index1 * src_channels + sc];
            interleaved[i * out_channels + c] += (s0 * (1.0f - fraction) + s1 * fraction) * gain;
        }
        playhead += increment;
    }
    if (!std::isfinite(playhead) || playhead >= (double)src_frames) finished = true;
    return i;
}

} // namespace owah
