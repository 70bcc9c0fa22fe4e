#pragma once

#include <string>
#include <vector>

#include "base_playback.hpp"

typedef struct _snd_pcm snd_pcm_t;

namespace owah {

class AlsaPlayback : public BasePlayback {
    snd_pcm_t *pcm_handle = nullptr;
    std::string device;
    int rate;
    int num_channels;
public:
    AlsaPlayback(const std::string& device = "default", int rate = 44100, int ch = 2);
    ~AlsaPlayback() override;

    AlsaPlayback(const AlsaPlayback&) = delete;
    AlsaPlayback& operator=(const AlsaPlayback&) = delete;

    bool is_ready() const override;
    bool write(const std::vector<float>& interleaved_data, int num_frames) override;
    int sample_rate() const override { return rate; }
    int channels() const override { return num_channels; }
    std::string name() const override { return device; }

    // Prints the PCM playback devices ALSA knows about.
    static void listDevices();
};

} // namespace owah
