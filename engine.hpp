#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "audio_types.hpp"
#include "base_playback.hpp"
#include "clip.hpp"
#include "status.hpp"
#include "voice.hpp"

namespace owah {

class BaseEngine {
public:
    virtual ~BaseEngine() = default;

    virtual bool has_device() const = 0;
    // Starts rendering clip at midi_note and returns without waiting for
    // the sound to finish.
    virtual Status play_note(const ClipPtr& clip, int midi_note) = 0;
    virtual void stop_all() = 0;
    virtual int active_voices() const = 0;
    virtual std::vector<int> active_notes() const = 0;
};

// Used when no output device could be opened. Every call succeeds and does
// nothing.
class SilentEngine : public BaseEngine {
public:
    bool has_device() const override { return false; }
    Status play_note(const ClipPtr&, int) override { return Status::Ok(); }
    void stop_all() override {}
    int active_voices() const override { return 0; }
    std::vector<int> active_notes() const override { return {}; }
};

class DeviceEngine : public BaseEngine {
public:
    DeviceEngine(std::unique_ptr<BasePlayback> playback, const EngineConfig& config);
    ~DeviceEngine() override;

    DeviceEngine(const DeviceEngine&) = delete;
    DeviceEngine& operator=(const DeviceEngine&) = delete;

    // Spawns the render thread that feeds the device.
    void start();
    void shutdown();

    bool has_device() const override { return true; }
    Status play_note(const ClipPtr& clip, int midi_note) override;
    void stop_all() override;
    int active_voices() const override;
    std::vector<int> active_notes() const override;

    // Mixes the next num_frames of all live voices into interleaved (resized
    // and cleared first) and drops finished voices. Returns how many voices
    // contributed. Called by the render thread; tests call it directly.
    int render_block(std::vector<float>& interleaved, int num_frames);

    const EngineConfig& config() const { return cfg; }

private:
    void render_loop();

    std::unique_ptr<BasePlayback> playback;
    EngineConfig cfg;

    mutable std::mutex voices_mutex;
    std::vector<std::unique_ptr<Voice>> voices;

    std::atomic<bool> quit{false};
    std::atomic<bool> device_failed{false};
    std::thread render_thread;
};

// Opens the configured ALSA device. Falls back to a SilentEngine when the
// device is unusable so startup never fails on audio.
std::unique_ptr<BaseEngine> createEngine(const EngineConfig& config);

} // namespace owah
