#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <climits>
#include <memory>
#include <thread>
#include <vector>

#include "engine.hpp"
#include "midi.hpp"
#include "mock_audio.hpp"
#include "voice.hpp"

using namespace owah;

namespace {

ClipPtr constantClip(int rate, int channels, int frames, float value) {
    auto clip = std::make_shared<SampleClip>();
    clip->sample_rate = rate;
    clip->num_channels = channels;
    clip->samples.assign((size_t)frames * channels, value);
    return clip;
}

ClipPtr rampClip(int rate, int frames) {
    auto clip = std::make_shared<SampleClip>();
    clip->sample_rate = rate;
    clip->num_channels = 1;
    for (int i = 0; i < frames; ++i) clip->samples.push_back((float)i / frames);
    return clip;
}

int renderToEnd(Voice& voice, int out_channels, std::vector<float>& out) {
    int total = 0;
    std::vector<float> block(64 * out_channels);
    while (!voice.is_finished()) {
        std::fill(block.begin(), block.end(), 0.0f);
        int n = voice.render(block.data(), 64, out_channels);
        out.insert(out.end(), block.begin(), block.begin() + n * out_channels);
        total += n;
    }
    return total;
}

} // namespace

TEST_CASE("Voice at the base pitch plays every frame once with gain", "[voice]") {
    Voice voice(constantClip(44100, 1, 1000, 0.5f), 60, 1.0, 0.7f, 44100);
    std::vector<float> out;
    REQUIRE(renderToEnd(voice, 2, out) == 1000);
    REQUIRE(out.size() == 2000);
    REQUIRE(out[0] == Catch::Approx(0.35f));
    REQUIRE(out[1] == Catch::Approx(0.35f)); // mono copied to both outputs
}

TEST_CASE("Octave up halves the duration, octave down doubles it", "[voice]") {
    std::vector<float> out;
    Voice up(constantClip(44100, 1, 1000, 0.5f), 72, 2.0, 1.0f, 44100);
    REQUIRE(renderToEnd(up, 1, out) == 500);

    out.clear();
    Voice down(constantClip(44100, 1, 1000, 0.5f), 48, 0.5, 1.0f, 44100);
    REQUIRE(renderToEnd(down, 1, out) == 2000);
}

TEST_CASE("Voice converts the clip rate to the device rate", "[voice]") {
    Voice voice(constantClip(22050, 1, 1000, 0.5f), 60, 1.0, 1.0f, 44100);
    REQUIRE(voice.step() == Catch::Approx(0.5));
    std::vector<float> out;
    REQUIRE(renderToEnd(voice, 1, out) == 2000);
}

TEST_CASE("Voice interpolates between source frames", "[voice]") {
    Voice voice(rampClip(44100, 100), 48, 0.5, 1.0f, 44100);
    std::vector<float> out;
    renderToEnd(voice, 1, out);
    REQUIRE(out[1] == Catch::Approx(0.005f));
    REQUIRE(out[2] == Catch::Approx(0.01f));
}

TEST_CASE("Stereo clip keeps its channels", "[voice]") {
    auto clip = std::make_shared<SampleClip>();
    clip->sample_rate = 44100;
    clip->num_channels = 2;
    clip->samples = {0.2f, -0.4f, 0.2f, -0.4f};
    Voice voice(clip, 60, 1.0, 1.0f, 44100);
    std::vector<float> out;
    REQUIRE(renderToEnd(voice, 2, out) == 2);
    REQUIRE(out[0] == Catch::Approx(0.2f));
    REQUIRE(out[1] == Catch::Approx(-0.4f));
}

TEST_CASE("Voice stepping past the clip finishes without reading beyond it", "[voice]") {
    Voice voice(constantClip(44100, 1, 44100, 0.5f), 900, pitchRatio(900), 0.7f, 44100);
    std::vector<float> block(512 * 2, 0.0f);
    REQUIRE(voice.render(block.data(), 512, 2) == 1);
    REQUIRE(voice.is_finished());
    REQUIRE(block[0] == Catch::Approx(0.35f));
    REQUIRE(block[2] == 0.0f);
    REQUIRE(voice.render(block.data(), 512, 2) == 0);
}

TEST_CASE("Voice that never advances is finished at once", "[voice]") {
    Voice voice(constantClip(44100, 1, 100, 0.5f), 60, 0.0, 0.7f, 44100);
    REQUIRE(voice.is_finished());
    std::vector<float> block(64, 0.0f);
    REQUIRE(voice.render(block.data(), 64, 1) == 0);
}

TEST_CASE("Notes outside 0..127 are rejected", "[engine]") {
    EngineConfig config;
    config.voice_policy = VoicePolicy::FireAndForget;
    DeviceEngine engine(std::make_unique<MockPlayback>(), config);
    auto clip = constantClip(44100, 1, 44100, 0.5f);

    for (int note : {-1, 128, 900, -2000, INT_MIN, INT_MAX}) {
        REQUIRE(engine.play_note(clip, note).code == ErrorCode::PlaybackError);
    }
    REQUIRE(engine.active_voices() == 0);
    REQUIRE(engine.play_note(clip, 0).ok());
    REQUIRE(engine.play_note(clip, 127).ok());
    REQUIRE(engine.active_notes() == std::vector<int>{0, 127});
}

TEST_CASE("Single voice policy cuts off the previous note", "[engine]") {
    auto playback = std::make_unique<MockPlayback>();
    EngineConfig config;
    DeviceEngine engine(std::move(playback), config);
    auto clip = constantClip(44100, 1, 44100, 0.5f);

    REQUIRE(engine.play_note(clip, 60).ok());
    REQUIRE(engine.play_note(clip, 67).ok());
    REQUIRE(engine.active_voices() == 1);
    REQUIRE(engine.active_notes() == std::vector<int>{67});

    std::vector<float> block;
    REQUIRE(engine.render_block(block, 512) == 1);
    // One voice at gain 0.7, not two summed.
    REQUIRE(block[0] == Catch::Approx(0.35f));
}

TEST_CASE("Concurrent triggers never leave two voices live", "[engine]") {
    DeviceEngine engine(std::make_unique<MockPlayback>(), EngineConfig{});
    auto clip = constantClip(44100, 1, 44100, 0.5f);

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&engine, &clip, &failures, t] {
            for (int i = 0; i < 200; ++i) {
                if (!engine.play_note(clip, 48 + t).ok()) failures++;
            }
        });
    }
    std::vector<float> block;
    for (int i = 0; i < 200; ++i) {
        REQUIRE(engine.render_block(block, 64) <= 1);
        REQUIRE(engine.active_voices() <= 1);
    }
    for (auto& th : threads) th.join();
    REQUIRE(failures == 0);
    REQUIRE(engine.active_voices() == 1);
}

TEST_CASE("Fire-and-forget policy lets notes overlap", "[engine]") {
    EngineConfig config;
    config.voice_policy = VoicePolicy::FireAndForget;
    config.max_voices = 3;
    DeviceEngine engine(std::make_unique<MockPlayback>(), config);
    auto clip = constantClip(44100, 1, 44100, 0.5f);

    REQUIRE(engine.play_note(clip, 60).ok());
    REQUIRE(engine.play_note(clip, 64).ok());
    REQUIRE(engine.active_voices() == 2);

    std::vector<float> block;
    REQUIRE(engine.render_block(block, 512) == 2);
    REQUIRE(block[0] == Catch::Approx(0.7f));

    REQUIRE(engine.play_note(clip, 67).ok());
    REQUIRE(engine.play_note(clip, 72).ok());
    REQUIRE(engine.active_notes() == std::vector<int>{64, 67, 72});
}

TEST_CASE("Finished voices are dropped", "[engine]") {
    DeviceEngine engine(std::make_unique<MockPlayback>(), EngineConfig{});
    REQUIRE(engine.play_note(constantClip(44100, 1, 100, 0.5f), 60).ok());

    std::vector<float> block;
    REQUIRE(engine.render_block(block, 512) == 1);
    REQUIRE(engine.active_voices() == 0);
    REQUIRE(block[99 * 2] == Catch::Approx(0.35f));
    REQUIRE(block[100 * 2] == 0.0f);
    REQUIRE(engine.render_block(block, 512) == 0);
}

TEST_CASE("stop_all silences the engine", "[engine]") {
    DeviceEngine engine(std::make_unique<MockPlayback>(), EngineConfig{});
    REQUIRE(engine.play_note(constantClip(44100, 1, 44100, 0.5f), 60).ok());
    engine.stop_all();
    REQUIRE(engine.active_voices() == 0);
}

TEST_CASE("Empty clip cannot form a render stream", "[engine]") {
    DeviceEngine engine(std::make_unique<MockPlayback>(), EngineConfig{});
    REQUIRE(engine.play_note(nullptr, 60).code == ErrorCode::PlaybackError);
    REQUIRE(engine.play_note(std::make_shared<SampleClip>(), 60).code == ErrorCode::PlaybackError);
    REQUIRE(engine.active_voices() == 0);
}

TEST_CASE("Render thread feeds the device", "[engine]") {
    auto playback = std::make_unique<MockPlayback>();
    MockPlayback* mock = playback.get();
    DeviceEngine engine(std::move(playback), EngineConfig{});
    engine.start();

    REQUIRE(engine.play_note(constantClip(44100, 1, 2048, 0.5f), 60).ok());
    for (int i = 0; i < 200 && engine.active_voices() > 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    engine.shutdown();

    REQUIRE(engine.active_voices() == 0);
    std::lock_guard<std::mutex> lock(mock->mutex);
    REQUIRE(mock->recorded_data.size() == 4 * 512 * 2);
    REQUIRE(mock->recorded_data[0] == Catch::Approx(0.35f));
}

TEST_CASE("Device failure surfaces as PlaybackError", "[engine]") {
    auto playback = std::make_unique<FailingPlayback>();
    FailingPlayback* failing = playback.get();
    DeviceEngine engine(std::move(playback), EngineConfig{});
    engine.start();

    auto clip = constantClip(44100, 1, 44100, 0.5f);
    REQUIRE(engine.play_note(clip, 60).ok());
    for (int i = 0; i < 200 && failing->writes == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    engine.shutdown();

    REQUIRE(engine.play_note(clip, 62).code == ErrorCode::PlaybackError);
}

TEST_CASE("Silent engine accepts every note", "[engine]") {
    SilentEngine engine;
    REQUIRE_FALSE(engine.has_device());
    REQUIRE(engine.play_note(constantClip(44100, 1, 10, 0.5f), 60).ok());
    REQUIRE(engine.play_note(nullptr, 60).ok());
    REQUIRE(engine.active_voices() == 0);
}
