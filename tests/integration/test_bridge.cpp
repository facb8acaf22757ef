#include <gtest/gtest.h>
#include "CInterface.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

class BridgeTest : public ::testing::Test {
protected:
    const unsigned int sample_rate = 44100;
    const size_t block_size = 512;

    void SetUp() override {
        engine = morpho_engine_create(nullptr);
        ASSERT_NE(engine, nullptr);
    }

    void TearDown() override {
        morpho_engine_destroy(engine);
    }

    // Interleaved stereo test tone, L = R.
    std::vector<float> tone(size_t frames) const {
        std::vector<float> data(frames * 2);
        for (size_t i = 0; i < frames; ++i) {
            const float s = 0.5f * static_cast<float>(std::sin(2.0 * M_PI * 440.0 * static_cast<double>(i) / sample_rate));
            data[2 * i] = s;
            data[2 * i + 1] = s;
        }
        return data;
    }

    MorphoEngineHandle engine = nullptr;
};

TEST_F(BridgeTest, SilentUntilPlaying) {
    const auto data = tone(44100);
    ASSERT_EQ(morpho_engine_load_interleaved(engine, data.data(), 44100, 2, sample_rate), 0);
    EXPECT_DOUBLE_EQ(morpho_engine_get_duration(engine), 1.0);
    EXPECT_EQ(morpho_engine_get_phase(engine), MORPHO_PHASE_IDLE);

    std::vector<float> out(block_size * 2, 1.0f);
    ASSERT_EQ(morpho_engine_process(engine, out.data(), block_size), 0);
    float peak = 0.0f;
    for (float s : out) peak = std::max(peak, std::fabs(s));
    EXPECT_EQ(peak, 0.0f);

    ASSERT_EQ(morpho_engine_play(engine), 0);
    EXPECT_EQ(morpho_engine_get_phase(engine), MORPHO_PHASE_PLAYING);
    ASSERT_EQ(morpho_engine_process(engine, out.data(), block_size), 0);
    for (float s : out) peak = std::max(peak, std::fabs(s));
    EXPECT_GT(peak, 0.0f);
    EXPECT_NEAR(morpho_engine_get_current_time(engine), static_cast<double>(block_size) / sample_rate, 1e-9);
}

TEST_F(BridgeTest, BypassRoundTripsInterleavedAudio) {
    const auto data = tone(4096);
    ASSERT_EQ(morpho_engine_load_interleaved(engine, data.data(), 4096, 2, sample_rate), 0);
    ASSERT_EQ(morpho_engine_set_bypass(engine, 1), 0);
    ASSERT_EQ(morpho_engine_play(engine), 0);

    // Larger than the configured block size.
    std::vector<float> out(2048 * 2);
    ASSERT_EQ(morpho_engine_process(engine, out.data(), 2048), 0);
    for (size_t i = 0; i < out.size(); ++i) {
        ASSERT_EQ(out[i], data[i]) << "sample " << i;
    }
}

TEST_F(BridgeTest, ParametersAndTelemetry) {
    EXPECT_EQ(morpho_engine_set_width(engine, 1.2f), 0);
    EXPECT_FLOAT_EQ(morpho_engine_get_width(engine), 1.2f);
    EXPECT_EQ(morpho_engine_set_width(engine, 9.0f), 0);
    EXPECT_FLOAT_EQ(morpho_engine_get_width(engine), 1.5f);

    EXPECT_EQ(morpho_engine_set_haas(engine, 1), 0);
    EXPECT_EQ(morpho_engine_get_haas(engine), 1);

    EXPECT_EQ(morpho_engine_set_band_pan(engine, MORPHO_BAND_HIGH, -0.5f), 0);
    EXPECT_EQ(morpho_engine_set_band_gain(engine, MORPHO_BAND_LOW, 0.8f), 0);
    EXPECT_EQ(morpho_engine_set_band_pan(engine, 7, 0.0f), -1);
    EXPECT_EQ(morpho_engine_set_band_gain(engine, -1, 1.0f), -1);
    EXPECT_EQ(morpho_engine_set_mono_safe_mode(engine, 0), 0);

    EXPECT_FLOAT_EQ(morpho_engine_get_phase_correlation(engine), 1.0f);
    EXPECT_EQ(morpho_engine_is_correcting(engine), 0);
    EXPECT_EQ(morpho_engine_tick(engine), 0);
}

TEST_F(BridgeTest, TransportWithoutAudioFails) {
    EXPECT_EQ(morpho_engine_play(engine), -1);
    EXPECT_EQ(morpho_engine_seek(engine, 1.0), -1);
    EXPECT_EQ(morpho_engine_pause(engine), 0);
    EXPECT_EQ(morpho_engine_stop(engine), 0);
    EXPECT_EQ(morpho_engine_start_device(engine), -1);

    const float one = 0.0f;
    EXPECT_EQ(morpho_engine_load_interleaved(engine, &one, 0, 2, sample_rate), -1);
    EXPECT_EQ(morpho_engine_load_interleaved(engine, nullptr, 10, 2, sample_rate), -1);
}

namespace {

void count_ended(void* user_data) {
    ++*static_cast<int*>(user_data);
}

} // namespace

TEST_F(BridgeTest, EndedCallbackFiresFromTick) {
    const auto data = tone(1000);
    ASSERT_EQ(morpho_engine_load_interleaved(engine, data.data(), 1000, 2, sample_rate), 0);

    int ended = 0;
    ASSERT_EQ(morpho_engine_set_ended_callback(engine, count_ended, &ended), 0);
    ASSERT_EQ(morpho_engine_play(engine), 0);

    std::vector<float> out(block_size * 2);
    for (int i = 0; i < 3; ++i) {
        ASSERT_EQ(morpho_engine_process(engine, out.data(), block_size), 0);
    }
    ASSERT_EQ(morpho_engine_tick(engine), 0);
    EXPECT_EQ(ended, 1);
    EXPECT_EQ(morpho_engine_get_phase(engine), MORPHO_PHASE_IDLE);
    EXPECT_EQ(morpho_engine_get_current_time(engine), 0.0);
}

TEST_F(BridgeTest, TimeDomainSnapshot) {
    const auto data = tone(8192);
    ASSERT_EQ(morpho_engine_load_interleaved(engine, data.data(), 8192, 2, sample_rate), 0);
    ASSERT_EQ(morpho_engine_play(engine), 0);

    std::vector<float> out(4096 * 2);
    ASSERT_EQ(morpho_engine_process(engine, out.data(), 4096), 0);

    std::vector<float> left(1024), right(1024);
    EXPECT_EQ(morpho_engine_get_time_domain(engine, left.data(), right.data(), left.size()), 1024);
    EXPECT_EQ(left.back(), out[2 * 4095]);
    EXPECT_EQ(right.back(), out[2 * 4095 + 1]);
}

TEST_F(BridgeTest, ExportProducesWav) {
    uint8_t* wav = nullptr;
    size_t size = 0;
    EXPECT_EQ(morpho_engine_export(engine, 16, &wav, &size), 1);
    EXPECT_EQ(wav, nullptr);

    const auto data = tone(1000);
    ASSERT_EQ(morpho_engine_load_interleaved(engine, data.data(), 1000, 2, sample_rate), 0);
    EXPECT_EQ(morpho_engine_export(engine, 12, &wav, &size), -1);

    ASSERT_EQ(morpho_engine_export(engine, 24, &wav, &size), 0);
    ASSERT_NE(wav, nullptr);
    EXPECT_EQ(size, 44u + 1000u * 6u);
    EXPECT_EQ(std::memcmp(wav, "RIFF", 4), 0);
    EXPECT_EQ(std::memcmp(wav + 8, "WAVE", 4), 0);
    morpho_free_buffer(wav);
}

TEST_F(BridgeTest, LoadFileRoundTrip) {
    const auto data = tone(2000);
    ASSERT_EQ(morpho_engine_load_interleaved(engine, data.data(), 2000, 2, sample_rate), 0);

    uint8_t* wav = nullptr;
    size_t size = 0;
    ASSERT_EQ(morpho_engine_export(engine, 32, &wav, &size), 0);

    const std::string path = ::testing::TempDir() + "morpho_bridge_export.wav";
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(wav), static_cast<std::streamsize>(size));
    }
    morpho_free_buffer(wav);

    MorphoEngineHandle other = morpho_engine_create(nullptr);
    ASSERT_NE(other, nullptr);
    EXPECT_EQ(morpho_engine_load_file(other, path.c_str()), 0);
    EXPECT_NEAR(morpho_engine_get_duration(other), 2000.0 / sample_rate, 1e-9);
    EXPECT_EQ(morpho_engine_load_file(other, "/nonexistent/morpho.wav"), -1);
    EXPECT_EQ(morpho_engine_get_duration(other), 0.0);
    morpho_engine_destroy(other);
    std::remove(path.c_str());
}

TEST_F(BridgeTest, NullHandleIsRejected) {
    EXPECT_EQ(morpho_engine_play(nullptr), -1);
    EXPECT_EQ(morpho_engine_tick(nullptr), -1);
    EXPECT_EQ(morpho_engine_get_phase(nullptr), -1);
    EXPECT_EQ(morpho_engine_get_duration(nullptr), 0.0);
    morpho_engine_destroy(nullptr);
    morpho_log_message("TEST", "bridge logging");
    morpho_log_event("TEST", 1.0f);
}
