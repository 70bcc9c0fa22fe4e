#pragma once

#include "base_playback.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace owah {

class MockPlayback : public BasePlayback {
public:
    std::vector<float> recorded_data;
    std::mutex mutex;
    int rate;
    int num_channels;
    std::atomic<int> writes{0};

    MockPlayback(int r = 44100, int ch = 2) : rate(r), num_channels(ch) {}

    bool is_ready() const override { return true; }
    bool write(const std::vector<float>& interleaved_data, int num_frames) override {
        std::lock_guard<std::mutex> lock(mutex);
        recorded_data.insert(recorded_data.end(), interleaved_data.begin(),
                             interleaved_data.begin() + (size_t)num_frames * num_channels);
        writes++;
        return true;
    }
    int sample_rate() const override { return rate; }
    int channels() const override { return num_channels; }
    std::string name() const override { return "mock"; }
};

// Device that dies on the first write.
class FailingPlayback : public MockPlayback {
public:
    using MockPlayback::MockPlayback;
    bool write(const std::vector<float>&, int) override {
        writes++;
        return false;
    }
};

} // namespace owah
