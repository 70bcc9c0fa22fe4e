#pragma once

#include "clip.hpp"

namespace owah {

// One rendering of a clip at a pitch. Resamples by reading the clip at
// `ratio` times its recorded speed, so pitch and length change together.
class Voice {
public:
    Voice(ClipPtr clip, int note, double ratio, float gain, int output_rate);

    // Adds up to num_frames of output into interleaved. Returns the number of
    // frames written; fewer than num_frames means the voice has finished.
    int render(float* interleaved, int num_frames, int out_channels);

    void stop() { finished = true; }
    bool is_finished() const { return finished; }
    int note() const { return midi_note; }
    double step() const { return increment; }

private:
    ClipPtr clip;
    int midi_note;
    float gain;
    double increment; // source frames per output frame
    double playhead = 0.0;
    bool finished = false;
};

} // namespace owah
