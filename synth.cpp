#include "synth.hpp"

#include <algorithm>
#include <cmath>

namespace owah {

namespace {
constexpr double kPi = 3.14159265358979323846;
constexpr double kFundamentalHz = 261.6255653005986; // C4
}

ClipPtr generateTone(int duration_ms) {
    auto clip = std::make_shared<SampleClip>();
    clip->sample_rate = kToneSampleRate;
    clip->num_channels = 1;

    int64_t frames = targetFrames(kToneSampleRate, duration_ms);
    clip->samples.resize((size_t)std::max<int64_t>(frames, 0));

    double duration_sec = duration_ms / 1000.0;
    for (int64_t i = 0; i < frames; ++i) {
        double t = (double)i / kToneSampleRate;
        double decay = 1.0 - t / duration_sec;
        double env = decay * decay;
        double val = 0.6 * std::sin(2.0 * kPi * kFundamentalHz * t)
                   + 0.25 * std::sin(2.0 * kPi * kFundamentalHz * 2.0 * t)
                   + 0.15 * std::sin(2.0 * kPi * kFundamentalHz * 0.5 * t);
        clip->samples[i] = (float)std::clamp(env * val, -1.0, 1.0);
    }
    return clip;
}

} // namespace owah
