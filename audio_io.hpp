#pragma once

#include <string>

#include "audio_types.hpp"
#include "clip.hpp"
#include "status.hpp"

namespace owah {

// Decodes the first duration_ms of the audio file at path into a clip of
// exactly targetFrames(rate, duration_ms) frames at the source rate. Decoding
// stops as soon as enough frames are gathered. `out` is only written on
// success.
Status decodeBite(const std::string& path, int duration_ms,
                  const DecodeOptions& options, ClipPtr& out);

} // namespace owah
