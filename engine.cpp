#include "engine.hpp"
#include "alsa_out.hpp"
#include "midi.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>
#include <system_error>

namespace owah {

DeviceEngine::DeviceEngine(std::unique_ptr<BasePlayback> pb, const EngineConfig& config)
    : playback(std::move(pb)), cfg(config) {}

DeviceEngine::~DeviceEngine() {
    shutdown();
}

void DeviceEngine::start() {
    if (render_thread.joinable()) return;
    quit = false;
    render_thread = std::thread(&DeviceEngine::render_loop, this);
}

void DeviceEngine::shutdown() {
    quit = true;
    if (render_thread.joinable()) render_thread.join();
}

Status DeviceEngine::play_note(const ClipPtr& clip, int midi_note) {
    if (device_failed) {
        return Status::Error(ErrorCode::PlaybackError, "audio device stopped accepting samples");
    }
    if (!clip || clip->sample_rate <= 0 || clip->num_channels <= 0 || clip->samples.empty()) {
        return Status::Error(ErrorCode::PlaybackError, "cannot create render stream from an empty clip");
    }

    if (!isValidNote(midi_note)) {
        return Status::Error(ErrorCode::PlaybackError, "note " + std::to_string(midi_note) + " is outside 0..127");
    }

    double ratio = pitchRatio(midi_note, cfg.base_note);
    auto voice = std::make_unique<Voice>(clip, midi_note, ratio, cfg.gain, playback->sample_rate());

    try {
        std::lock_guard<std::mutex> lock(voices_mutex);
        if (cfg.voice_policy == VoicePolicy::SingleVoice) {
            for (auto& v : voices) v->stop();
            voices.clear();
        } else if ((int)voices.size() >= std::max(1, cfg.max_voices)) {
            voices.erase(voices.begin());
        }
        voices.push_back(std::move(voice));
    } catch (const std::system_error& e) {
        return Status::Error(ErrorCode::PlaybackError, std::string("voice lock unavailable: ") + e.what());
    }
    return Status::Ok();
}

void DeviceEngine::stop_all() {
    std::lock_guard<std::mutex> lock(voices_mutex);
    for (auto& v : voices) v->stop();
    voices.clear();
}

int DeviceEngine::active_voices() const {
    std::lock_guard<std::mutex> lock(voices_mutex);
    return (int)voices.size();
}

std::vector<int> DeviceEngine::active_notes() const {
    std::lock_guard<std::mutex> lock(voices_mutex);
    std::vector<int> notes;
    for (const auto& v : voices) notes.push_back(v->note());
    return notes;
}

int DeviceEngine::render_block(std::vector<float>& interleaved, int num_frames) {
    const int out_channels = playback->channels();
    interleaved.assign((size_t)num_frames * out_channels, 0.0f);

    std::lock_guard<std::mutex> lock(voices_mutex);
    int rendered = 0;
    for (auto& v : voices) {
        if (v->render(interleaved.data(), num_frames, out_channels) > 0) rendered++;
    }
    voices.erase(std::remove_if(voices.begin(), voices.end(), [](const auto& v) {
        return v->is_finished();
    }), voices.end());
    return rendered;
}

void DeviceEngine::render_loop() {
    std::vector<float> interleaved;
    while (!quit) {
        int rendered = 0;
        try {
            rendered = render_block(interleaved, cfg.block_size);
        } catch (const std::system_error& e) {
            std::cerr << "Render thread lock failed: " << e.what() << std::endl;
            device_failed = true;
            break;
        }

        if (rendered == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }

        if (!playback->write(interleaved, cfg.block_size)) {
            std::cerr << "Audio device '" << playback->name() << "' failed, stopping playback" << std::endl;
            device_failed = true;
            break;
        }
    }
}

std::unique_ptr<BaseEngine> createEngine(const EngineConfig& config) {
    auto playback = std::make_unique<AlsaPlayback>(config.device, config.sample_rate, config.channels);
    if (!playback->is_ready()) {
        std::cerr << errorCodeName(ErrorCode::DeviceUnavailable)
                  << ": no usable audio output device, continuing silently" << std::endl;
        return std::make_unique<SilentEngine>();
    }
    auto engine = std::make_unique<DeviceEngine>(std::move(playback), config);
    engine->start();
    return engine;
}

} // namespace owah
