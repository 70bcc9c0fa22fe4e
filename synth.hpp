#pragma once

#include "clip.hpp"

namespace owah {

constexpr int kToneSampleRate = 44100;

// Fallback bite used until a file is loaded: a decaying middle C with one
// overtone and one sub-harmonic. Deterministic for a given duration.
ClipPtr generateTone(int duration_ms);

} // namespace owah
