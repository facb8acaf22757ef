#include <gtest/gtest.h>
#include "ParameterBlock.hpp"
#include "RealtimeSession.hpp"
#include "TestHelper.hpp"
#include <atomic>
#include <iostream>
#include <memory>
#include <thread>

using namespace morpho;

namespace {

std::shared_ptr<const PcmBuffer> sine_source(double hz, size_t frames) {
    return std::make_shared<PcmBuffer>(test::mono_buffer(test::sine(hz, 44100, frames)));
}

EngineState bypass_state() {
    EngineState state;
    state.bypass = true;
    return state;
}

} // namespace

TEST(ParameterBlockTest, PublishAdvancesVersion) {
    ParameterBlock block;
    const uint64_t v0 = block.version();
    EXPECT_EQ(v0 % 2, 0u);

    EngineState state;
    state.set_width(0.7f);
    state.haas_enabled = true;
    state.band(BandId::High).gain = 0.3f;
    block.publish(state);
    EXPECT_EQ(block.version(), v0 + 2);

    EngineState read;
    uint64_t version = 0;
    ASSERT_TRUE(block.read(read, version));
    EXPECT_EQ(version, v0 + 2);
    EXPECT_FLOAT_EQ(read.global_width, 0.7f);
    EXPECT_TRUE(read.haas_enabled);
    EXPECT_FLOAT_EQ(read.band(BandId::High).gain, 0.3f);
    EXPECT_EQ(read.bands[2].id, BandId::MidHigh);
}

TEST(ParameterBlockTest, ConcurrentReadsSeeWholeSnapshots) {
    ParameterBlock block;
    std::atomic<bool> done{false};

    std::thread writer([&]() {
        for (int i = 0; i < 20000; ++i) {
            EngineState state;
            const float v = static_cast<float>(i % 2);
            for (auto& band : state.bands) band.gain = v;
            state.global_width = v;
            block.publish(state);
        }
        done = true;
    });

    size_t torn = 0;
    size_t reads = 0;
    while (!done) {
        EngineState state;
        uint64_t version = 0;
        if (!block.read(state, version)) continue;
        ++reads;
        for (const auto& band : state.bands) {
            if (band.gain != state.global_width) ++torn;
        }
    }
    writer.join();
    std::cout << "[AUDIT] " << reads << " consistent reads" << std::endl;
    EXPECT_EQ(torn, 0u);
}

TEST(RealtimeSessionTest, IdleSessionRendersSilence) {
    RealtimeSession session(ContextOptions{}, 0.03f);
    StereoBlock out(256);
    std::fill(out.left.begin(), out.left.end(), 1.0f);
    AudioBuffer view = out.view();
    session.render(view);

    EXPECT_FALSE(session.active());
    EXPECT_EQ(test::peak(out.left), 0.0f);
    EXPECT_EQ(session.describe(), "");
}

TEST(RealtimeSessionTest, PlaysFromStartFrame) {
    RealtimeSession session(ContextOptions{}, 0.03f);
    auto source = sine_source(440.0, 44100);
    session.start(source, 1000, bypass_state());
    EXPECT_TRUE(session.active());
    EXPECT_EQ(session.position_frames(), 1000u);

    StereoBlock out(700);
    AudioBuffer view = out.view();
    session.render(view);

    EXPECT_EQ(session.position_frames(), 1700u);
    for (size_t i = 0; i < 700; ++i) {
        ASSERT_EQ(out.left[i], source->channels[0][1000 + i]);
        ASSERT_EQ(out.right[i], source->channels[0][1000 + i]);
    }
    EXPECT_FALSE(session.ended());
}

TEST(RealtimeSessionTest, ReportsEndOfBuffer) {
    RealtimeSession session(ContextOptions{}, 0.03f);
    session.start(sine_source(440.0, 1000), 0, EngineState{});

    StereoBlock out(2048);
    AudioBuffer view = out.view();
    session.render(view);

    EXPECT_TRUE(session.ended());
    EXPECT_EQ(session.position_frames(), 1000u);

    session.clear();
    EXPECT_FALSE(session.active());
    EXPECT_FALSE(session.ended());
}

TEST(RealtimeSessionTest, RestartCrossfadesWithoutClick) {
    // 30 ms crossfade: 1323 frames at 44.1 kHz.
    RealtimeSession session(ContextOptions{}, 0.03f);
    auto source = sine_source(100.0, 88200);
    session.start(source, 0, bypass_state());

    std::vector<float> captured;
    StereoBlock out(512);
    AudioBuffer view = out.view();
    for (int i = 0; i < 8; ++i) {
        session.render(view);
        captured.insert(captured.end(), out.left.begin(), out.left.end());
    }

    // A quarter period ahead: a hard cut would jump by up to the full amplitude.
    session.start(source, 22050 + 110, bypass_state());
    for (int i = 0; i < 8; ++i) {
        session.render(view);
        captured.insert(captured.end(), out.left.begin(), out.left.end());
    }

    const float step = test::max_step(captured);
    std::cout << "[AUDIT] largest step across restart: " << step << std::endl;
    EXPECT_LT(step, 0.02f);

    EXPECT_EQ(session.position_frames(), 22050u + 110u + 8u * 512u);
    EXPECT_EQ(session.collect_garbage(), 1u);
    EXPECT_EQ(session.collect_garbage(), 0u);
}

TEST(RealtimeSessionTest, PendingInstanceReplacesPendingInstance) {
    RealtimeSession session(ContextOptions{}, 0.03f);
    auto source = sine_source(440.0, 44100);
    session.start(source, 0, bypass_state());
    session.start(source, 5000, bypass_state());

    StereoBlock out(64);
    AudioBuffer view = out.view();
    session.render(view);

    // Nothing was current yet, so the second instance starts without a fade.
    EXPECT_EQ(session.position_frames(), 5064u);
    EXPECT_EQ(out.left[0], source->channels[0][5000]);
    EXPECT_EQ(session.collect_garbage(), 0u);
}

TEST(RealtimeSessionTest, PublishedParametersReachTheGraph) {
    RealtimeSession session(ContextOptions{}, 0.03f);
    auto source = std::make_shared<PcmBuffer>(test::mono_buffer(test::noise(44100)));
    session.start(source, 0, bypass_state());

    StereoBlock out(512);
    AudioBuffer view = out.view();
    session.render(view);
    EXPECT_EQ(out.left[100], source->channels[0][100]);

    EngineState wide;
    wide.set_width(1.5f);
    wide.haas_enabled = true;
    session.publish(wide);
    for (int i = 0; i < 40; ++i) session.render(view);

    // The wet path with Haas decorrelates the channels.
    size_t differing = 0;
    for (size_t i = 0; i < out.frames(); ++i) {
        if (out.left[i] != out.right[i]) ++differing;
    }
    EXPECT_GT(differing, out.frames() / 2);
}

TEST(RealtimeSessionTest, SnapshotHoldsLatestOutput) {
    RealtimeSession session(ContextOptions{}, 0.03f);
    auto source = sine_source(440.0, 44100);
    session.start(source, 0, bypass_state());

    StereoBlock out(4096);
    AudioBuffer view = out.view();
    session.render(view);

    std::vector<float> l(2048), r(2048);
    EXPECT_EQ(session.snapshot(l, r), 2048u);
    EXPECT_EQ(l.front(), source->channels[0][2048]);
    EXPECT_EQ(l.back(), source->channels[0][4095]);
}
