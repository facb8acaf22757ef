/**
 * @file SafetyController.hpp
 * @brief Automatic mono-compatibility guard driven by the correlation meter.
 */

#ifndef MORPHO_SAFETY_CONTROLLER_HPP
#define MORPHO_SAFETY_CONTROLLER_HPP

#include "EngineConfig.hpp"
#include "EngineState.hpp"
#include <chrono>

namespace morpho {

/**
 * @brief Damps width and disables Haas while the output is out of phase.
 *
 * Runs once per monitor tick on the control thread. A correction fires when
 * the cooldown is 0, mono-safe mode is on, bypass is off and the smoothed
 * correlation is negative. Each firing disables Haas, scales the width by
 * the decay factor (never below the floor, and only while above it) and
 * starts a cooldown; the cooldown counts down once per tick, the firing
 * tick included. Corrections are never undone automatically.
 */
class SafetyController {
public:
    using Clock = std::chrono::steady_clock;

    enum class State {
        Normal,
        Correcting
    };

    /**
     * @brief What a tick changed.
     */
    struct Action {
        bool fired = false;
        bool haas_disabled = false;
        bool width_changed = false;
        float width = 0.0f;
    };

    explicit SafetyController(const SafetyConfig& config = SafetyConfig{});

    Action tick(float smoothed_correlation, EngineState& state, Clock::time_point now = Clock::now());

    State state() const { return cooldown_ > 0 ? State::Correcting : State::Normal; }
    int cooldown() const { return cooldown_; }

    /**
     * @brief True for indicator_ms after the last correction.
     */
    bool is_correcting(Clock::time_point now = Clock::now()) const {
        return has_indicator_ && now < indicator_until_;
    }

    const SafetyConfig& config() const { return config_; }

    void reset();

private:
    SafetyConfig config_;
    int cooldown_ = 0;
    bool has_indicator_ = false;
    Clock::time_point indicator_until_{};
};

} // namespace morpho

#endif // MORPHO_SAFETY_CONTROLLER_HPP
