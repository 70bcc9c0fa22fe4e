#pragma once

#include <string>

namespace owah {

constexpr int kMinBiteMs = 500;
constexpr int kMaxBiteMs = 5000;
constexpr int kDefaultBiteMs = 1000;

enum class VoicePolicy {
    SingleVoice,   // a new note cuts off the one playing
    FireAndForget, // notes overlap until they finish
};

enum class ChannelMode {
    Preserve, // keep the source channels interleaved
    Mono,     // average all channels of a frame
};

struct EngineConfig {
    std::string device = "default";
    int sample_rate = 44100;
    int channels = 2;
    int block_size = 512;
    int base_note = 60; // C4
    float gain = 0.7f;  // headroom for overlapping notes
    VoicePolicy voice_policy = VoicePolicy::SingleVoice;
    int max_voices = 16;
};

struct DecodeOptions {
    ChannelMode channel_mode = ChannelMode::Preserve;
};

} // namespace owah
