#include <gtest/gtest.h>
#include "SafetyController.hpp"
#include <chrono>
#include <iostream>

using namespace morpho;

namespace {

EngineState wide_state() {
    EngineState state;
    state.set_width(1.5f);
    state.haas_enabled = true;
    return state;
}

} // namespace

TEST(SafetyControllerTest, FiresOnNegativeCorrelation) {
    SafetyController safety;
    EngineState state = wide_state();

    const auto action = safety.tick(-0.2f, state);
    EXPECT_TRUE(action.fired);
    EXPECT_TRUE(action.haas_disabled);
    EXPECT_TRUE(action.width_changed);
    EXPECT_FALSE(state.haas_enabled);
    EXPECT_NEAR(state.global_width, 1.425f, 1e-6f);
    EXPECT_EQ(action.width, state.global_width);
    EXPECT_EQ(safety.state(), SafetyController::State::Correcting);
    EXPECT_EQ(safety.cooldown(), 59);
}

TEST(SafetyControllerTest, NonNegativeCorrelationIsIgnored) {
    SafetyController safety;
    EngineState state = wide_state();

    EXPECT_FALSE(safety.tick(0.0f, state).fired);
    EXPECT_FALSE(safety.tick(0.8f, state).fired);
    EXPECT_TRUE(state.haas_enabled);
    EXPECT_EQ(state.global_width, 1.5f);
    EXPECT_EQ(safety.state(), SafetyController::State::Normal);
}

TEST(SafetyControllerTest, OneCorrectionPerCooldown) {
    SafetyController safety;
    EngineState state = wide_state();

    int fired = 0;
    for (int i = 0; i < 600; ++i) {
        const auto action = safety.tick(-0.5f, state);
        if (action.fired) {
            EXPECT_EQ(i % 60, 0) << "fired on tick " << i;
            ++fired;
        }
    }
    EXPECT_EQ(fired, 10);
}

TEST(SafetyControllerTest, WidthDecaysToExactFloor) {
    SafetyController safety;
    EngineState state = wide_state();

    int width_changes = 0;
    float previous = state.global_width;
    for (int i = 0; i < 60 * 30; ++i) {
        const auto action = safety.tick(-1.0f, state);
        if (action.width_changed) {
            ++width_changes;
            EXPECT_LT(state.global_width, previous);
            EXPECT_GE(state.global_width, 0.5f);
            previous = state.global_width;
        }
    }
    std::cout << "[AUDIT] width reached " << state.global_width
              << " after " << width_changes << " corrections" << std::endl;
    // 1.5 * 0.95^21 > 0.5 > 1.5 * 0.95^22
    EXPECT_EQ(width_changes, 22);
    EXPECT_EQ(state.global_width, 0.5f);
}

TEST(SafetyControllerTest, WidthAtOrBelowFloorIsLeftAlone) {
    SafetyController safety;
    EngineState state;
    state.set_width(0.3f);

    const auto action = safety.tick(-1.0f, state);
    EXPECT_TRUE(action.fired);
    EXPECT_FALSE(action.width_changed);
    EXPECT_EQ(state.global_width, 0.3f);
}

TEST(SafetyControllerTest, BypassSuppressesCorrection) {
    SafetyController safety;
    EngineState state = wide_state();
    state.bypass = true;

    EXPECT_FALSE(safety.tick(-1.0f, state).fired);
    EXPECT_TRUE(state.haas_enabled);
    EXPECT_EQ(state.global_width, 1.5f);
}

TEST(SafetyControllerTest, MonoSafeOffSuppressesCorrection) {
    SafetyController safety;
    EngineState state = wide_state();
    state.mono_safe_mode = false;

    for (int i = 0; i < 120; ++i) {
        EXPECT_FALSE(safety.tick(-1.0f, state).fired);
    }
    EXPECT_EQ(state.global_width, 1.5f);
}

TEST(SafetyControllerTest, CooldownRunsOutWhileCorrelationRecovers) {
    SafetyController safety;
    EngineState state = wide_state();

    safety.tick(-1.0f, state);
    for (int i = 0; i < 59; ++i) {
        safety.tick(0.5f, state);
    }
    EXPECT_EQ(safety.cooldown(), 0);
    EXPECT_EQ(safety.state(), SafetyController::State::Normal);

    // Corrections are not undone.
    EXPECT_FALSE(state.haas_enabled);
    EXPECT_NEAR(state.global_width, 1.425f, 1e-6f);
}

TEST(SafetyControllerTest, IndicatorLastsOneSecond) {
    using namespace std::chrono_literals;
    SafetyController safety;
    EngineState state = wide_state();
    const auto t0 = SafetyController::Clock::time_point{} + 10s;

    EXPECT_FALSE(safety.is_correcting(t0));
    safety.tick(-1.0f, state, t0);
    EXPECT_TRUE(safety.is_correcting(t0));
    EXPECT_TRUE(safety.is_correcting(t0 + 999ms));
    EXPECT_FALSE(safety.is_correcting(t0 + 1000ms));

    safety.reset();
    EXPECT_FALSE(safety.is_correcting(t0));
    EXPECT_EQ(safety.cooldown(), 0);
}

TEST(SafetyControllerTest, CustomConfig) {
    SafetyConfig config;
    config.cooldown_ticks = 5;
    config.width_decay = 0.5f;
    config.width_floor = 0.25f;
    SafetyController safety(config);
    EngineState state;

    safety.tick(-1.0f, state);
    EXPECT_EQ(state.global_width, 0.5f);
    for (int i = 0; i < 4; ++i) EXPECT_FALSE(safety.tick(-1.0f, state).fired);
    EXPECT_TRUE(safety.tick(-1.0f, state).fired);
    EXPECT_EQ(state.global_width, 0.25f);
}
