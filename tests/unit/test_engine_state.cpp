#include <gtest/gtest.h>
#include "EngineConfig.hpp"
#include "EngineState.hpp"
#include <cmath>
#include <string>

using namespace morpho;

TEST(EngineStateTest, Defaults) {
    EngineState state;
    EXPECT_FALSE(state.haas_enabled);
    EXPECT_FALSE(state.bypass);
    EXPECT_TRUE(state.mono_safe_mode);
    EXPECT_EQ(state.global_width, 1.0f);
    EXPECT_EQ(state.band(BandId::Low).pan, 0.0f);
    EXPECT_EQ(state.band(BandId::MidLow).pan, -0.3f);
    EXPECT_EQ(state.band(BandId::MidHigh).pan, 0.3f);
    EXPECT_EQ(state.band(BandId::High).pan, 0.1f);
    for (size_t i = 0; i < kNumBands; ++i) {
        EXPECT_EQ(band_index(state.bands[i].id), i);
        EXPECT_EQ(state.bands[i].gain, 1.0f);
    }
}

TEST(EngineStateTest, EffectivePanLaw) {
    for (int p = -10; p <= 10; ++p) {
        for (int w = 0; w <= 15; ++w) {
            const float pan = static_cast<float>(p) / 10.0f;
            const float width = static_cast<float>(w) / 10.0f;
            const float expected = std::fmax(-1.0f, std::fmin(1.0f, pan * width));
            const float actual = effective_pan(pan, width);
            ASSERT_EQ(actual, expected) << "pan " << pan << " width " << width;
            ASSERT_LE(std::fabs(actual), 1.0f);
        }
    }
    EXPECT_EQ(effective_pan(0.9f, 1.5f), 1.0f);
    EXPECT_EQ(effective_pan(-0.9f, 1.5f), -1.0f);
    EXPECT_EQ(effective_pan(0.5f, 0.0f), 0.0f);
}

TEST(EngineStateTest, WidthIsClampedToMax) {
    EngineState state;
    state.set_width(2.0f);
    EXPECT_EQ(state.global_width, kDefaultMaxWidth);
    state.set_width(-0.1f);
    EXPECT_EQ(state.global_width, 0.0f);

    state.max_width = 3.0f;
    state.set_width(2.0f);
    EXPECT_EQ(state.global_width, 2.0f);
}

TEST(EngineStateTest, SanitizeRestoresIdentity) {
    BandSet bands = default_bands();
    bands[1].id = BandId::High;
    bands[1].pan = -4.0f;
    bands[3].pan = 2.0f;

    const BandSet clean = sanitize_bands(bands);
    EXPECT_EQ(clean[1].id, BandId::MidLow);
    EXPECT_EQ(clean[1].pan, -1.0f);
    EXPECT_EQ(clean[3].pan, 1.0f);
}

TEST(EngineStateTest, NonFiniteWidthKeepsCurrentValue) {
    EngineState state;
    state.set_width(0.7f);
    state.set_width(std::nanf(""));
    EXPECT_EQ(state.global_width, 0.7f);
    state.set_width(-INFINITY);
    EXPECT_EQ(state.global_width, 0.7f);
}

TEST(EngineStateTest, SanitizeClampsGainAndReplacesNonFinite) {
    BandSet previous = default_bands();
    previous[2].pan = 0.6f;
    previous[0].gain = 0.4f;

    BandSet bands = default_bands();
    bands[0].gain = std::nanf("");
    bands[1].gain = -3.0f;
    bands[2].pan = INFINITY;

    const BandSet clean = sanitize_bands(bands, previous);
    EXPECT_EQ(clean[0].gain, 0.4f);
    EXPECT_EQ(clean[1].gain, 0.0f);
    EXPECT_EQ(clean[2].pan, 0.6f);
    EXPECT_EQ(clean[3].gain, 1.0f);
}

TEST(BandSpecTest, NamesRoundTrip) {
    for (size_t i = 0; i < kNumBands; ++i) {
        const auto id = static_cast<BandId>(i);
        const auto parsed = parse_band_id(band_id_name(id));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, id);
    }
    EXPECT_FALSE(parse_band_id("sub").has_value());
    EXPECT_EQ(band_id_name(BandId::MidHigh), "mid-high");
    EXPECT_FALSE(supports_haas(BandId::Low));
    EXPECT_TRUE(supports_haas(BandId::High));
}

TEST(EngineStateTest, PhaseNames) {
    EXPECT_EQ(std::string(playback_phase_name(PlaybackPhase::Idle)), "idle");
    EXPECT_EQ(std::string(playback_phase_name(PlaybackPhase::Exporting)), "exporting");
}

TEST(EngineConfigTest, DefaultsSurviveSanitizing) {
    const EngineConfig defaults;
    const EngineConfig clean = defaults.sanitized();
    EXPECT_EQ(clean.sample_rate, defaults.sample_rate);
    EXPECT_EQ(clean.block_size, defaults.block_size);
    EXPECT_EQ(clean.max_width, defaults.max_width);
    EXPECT_EQ(clean.safety.cooldown_ticks, 60);
    EXPECT_EQ(clean.safety.width_decay, 0.95f);
    EXPECT_EQ(clean.safety.width_floor, 0.5f);
    EXPECT_EQ(clean.graph_crossfade_seconds, 0.03f);
}
