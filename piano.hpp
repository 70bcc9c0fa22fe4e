#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "audio_types.hpp"
#include "clip.hpp"
#include "engine.hpp"
#include "status.hpp"

namespace owah {

// What the UI talks to: the current bite, where it came from, and the engine
// that plays it. The current clip is replaced whole, never edited, so a
// reader on another thread always sees a complete clip.
class SamplePiano {
public:
    SamplePiano(std::unique_ptr<BaseEngine> engine, const DecodeOptions& options = {});

    Status load_bite(const std::string& path);
    // Clamped to [kMinBiteMs, kMaxBiteMs]. Rebuilds the bite from the selected
    // file, or regenerates the tone when there is none.
    Status set_bite_duration(int duration_ms);
    void use_tone();

    Status play_note(int midi_note);
    void stop();

    ClipPtr current_clip() const;
    std::string selected_path() const;
    int bite_duration_ms() const;
    std::string status() const;
    bool has_device() const { return engine->has_device(); }
    BaseEngine& audio() { return *engine; }

private:
    Status rebuild(const std::string& path, int duration_ms);
    void set_status(const std::string& text);

    std::unique_ptr<BaseEngine> engine;
    DecodeOptions decode_options;

    ClipPtr current; // only touched through std::atomic_load / atomic_store

    mutable std::mutex mutex;
    std::string path;
    int duration_ms = kDefaultBiteMs;
    std::string status_text;
};

} // namespace owah
