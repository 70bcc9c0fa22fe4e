#include "piano.hpp"
#include "audio_io.hpp"
#include "synth.hpp"

#include <algorithm>
#include <cstdio>
#include <iostream>

namespace owah {

static std::string fileName(const std::string& path) {
    size_t last_slash = path.find_last_of("/\\");
    if (last_slash == std::string::npos) return path;
    return path.substr(last_slash + 1);
}

SamplePiano::SamplePiano(std::unique_ptr<BaseEngine> e, const DecodeOptions& options)
    : engine(std::move(e)), decode_options(options) {
    std::atomic_store(&current, generateTone(duration_ms));
    if (engine->has_device()) {
        status_text = "Load any sound clip to build your base note.";
    } else {
        status_text = "No audio output device found; playback is silent.";
    }
}

// Re-cuts the current source at a new length. No selected file means the
// built-in tone is the source.
Status SamplePiano::rebuild(const std::string& source, int ms) {
    if (source.empty()) {
        std::atomic_store(&current, generateTone(ms));
        return Status::Ok();
    }
    ClipPtr clip;
    Status status = decodeBite(source, ms, decode_options, clip);
    if (status.ok()) std::atomic_store(&current, clip);
    return status;
}

Status SamplePiano::load_bite(const std::string& new_path) {
    int ms = bite_duration_ms();
    ClipPtr clip;
    Status status = decodeBite(new_path, ms, decode_options, clip);
    if (!status.ok()) {
        set_status("Could not load clip: " + status.message);
        return status;
    }
    std::atomic_store(&current, clip);

    char seconds[32];
    std::snprintf(seconds, sizeof(seconds), "%.2f", clip->duration_sec());
    {
        std::lock_guard<std::mutex> lock(mutex);
        path = new_path;
        status_text = "Loaded " + fileName(new_path) + " (" + std::to_string(clip->sample_rate) + " Hz, "
                    + std::to_string(clip->num_channels) + " channel(s)). First " + seconds
                    + " s is now mapped across the keyboard.";
    }
    return status;
}

Status SamplePiano::set_bite_duration(int requested_ms) {
    int ms = std::clamp(requested_ms, kMinBiteMs, kMaxBiteMs);
    std::string source = selected_path();

    Status status = rebuild(source, ms);
    if (!status.ok()) {
        set_status("Could not load clip: " + status.message);
        return status;
    }
    std::lock_guard<std::mutex> lock(mutex);
    duration_ms = ms;
    status_text = "Bite length set to " + std::to_string(ms) + " ms.";
    return status;
}

void SamplePiano::use_tone() {
    int ms = bite_duration_ms();
    std::atomic_store(&current, generateTone(ms));
    std::lock_guard<std::mutex> lock(mutex);
    path.clear();
    status_text = "Using the built-in tone.";
}

Status SamplePiano::play_note(int midi_note) {
    Status status = engine->play_note(current_clip(), midi_note);
    if (!status.ok()) {
        std::cerr << "Playback error: " << status.message << std::endl;
        set_status("Playback error: " + status.message);
    }
    return status;
}

void SamplePiano::stop() {
    engine->stop_all();
}

ClipPtr SamplePiano::current_clip() const {
    return std::atomic_load(&current);
}

std::string SamplePiano::selected_path() const {
    std::lock_guard<std::mutex> lock(mutex);
    return path;
}

int SamplePiano::bite_duration_ms() const {
    std::lock_guard<std::mutex> lock(mutex);
    return duration_ms;
}

std::string SamplePiano::status() const {
    std::lock_guard<std::mutex> lock(mutex);
    return status_text;
}

void SamplePiano::set_status(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex);
    status_text = text;
}

} // namespace owah
