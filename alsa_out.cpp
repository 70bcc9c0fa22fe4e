#include "alsa_out.hpp"

#include <alsa/asoundlib.h>

#include <cerrno>
#include <cstdlib>
#include <iostream>

namespace owah {

AlsaPlayback::AlsaPlayback(const std::string& dev, int r, int ch)
    : device(dev), rate(r), num_channels(ch) {
    int err = snd_pcm_open(&pcm_handle, device.c_str(), SND_PCM_STREAM_PLAYBACK, 0);
    if (err < 0) {
        std::cerr << "Cannot open ALSA audio device '" << device << "': " << snd_strerror(err) << std::endl;
        pcm_handle = nullptr;
        return;
    }
    snd_pcm_info_t* info;
    snd_pcm_info_alloca(&info);
    if (snd_pcm_info(pcm_handle, info) == 0) {
        std::cerr << "ALSA Audio Device: " << snd_pcm_info_get_id(info)
                  << " (" << snd_pcm_info_get_name(info) << ")" << std::endl;
    }

    err = snd_pcm_set_params(pcm_handle,
                             SND_PCM_FORMAT_FLOAT_LE,
                             SND_PCM_ACCESS_RW_INTERLEAVED,
                             num_channels,
                             rate,
                             1,     // allow resampling
                             50000); // 50ms latency
    if (err < 0) {
        std::cerr << "ALSA parameter setting failed: " << snd_strerror(err) << std::endl;
        snd_pcm_close(pcm_handle);
        pcm_handle = nullptr;
    }
}

AlsaPlayback::~AlsaPlayback() {
    if (pcm_handle) {
        snd_pcm_drain(pcm_handle);
        snd_pcm_close(pcm_handle);
        pcm_handle = nullptr;
    }
}

bool AlsaPlayback::is_ready() const {
    return pcm_handle != nullptr;
}

bool AlsaPlayback::write(const std::vector<float>& interleaved_data, int num_frames) {
    if (!pcm_handle) return false;
    const float* data = interleaved_data.data();
    int remaining = num_frames;
    while (remaining > 0) {
        snd_pcm_sframes_t frames = snd_pcm_writei(pcm_handle, data, remaining);
        if (frames == -EAGAIN) continue;
        if (frames < 0) {
            // Underruns are expected between notes; recover and retry.
            frames = snd_pcm_recover(pcm_handle, (int)frames, 1);
            if (frames < 0) {
                std::cerr << "ALSA write failed: " << snd_strerror((int)frames) << std::endl;
                return false;
            }
            continue;
        }
        data += frames * num_channels;
        remaining -= (int)frames;
    }
    return true;
}

void AlsaPlayback::listDevices() {
    void** hints = nullptr;
    if (snd_device_name_hint(-1, "pcm", &hints) < 0) {
        std::cerr << "Cannot enumerate ALSA devices" << std::endl;
        return;
    }
    for (void** h = hints; *h; ++h) {
        char* name = snd_device_name_get_hint(*h, "NAME");
        char* io = snd_device_name_get_hint(*h, "IOID");
        // IOID is absent for devices that do both directions.
        if (name && (!io || std::string(io) == "Output")) {
            std::cout << name << std::endl;
        }
        free(name);
        free(io);
    }
    snd_device_name_free_hint(hints);
}

} // namespace owah
