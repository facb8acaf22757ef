#include "SafetyController.hpp"
#include "Logger.hpp"
#include <algorithm>

namespace morpho {

SafetyController::SafetyController(const SafetyConfig& config)
    : config_(config)
{}

SafetyController::Action SafetyController::tick(float smoothed_correlation, EngineState& state, Clock::time_point now) {
    Action action;

    if (cooldown_ <= 0 && state.mono_safe_mode && !state.bypass && smoothed_correlation < 0.0f) {
        action.fired = true;
        auto& logger = AudioLogger::instance();

        if (state.haas_enabled) {
            state.haas_enabled = false;
            action.haas_disabled = true;
            logger.log_message("SAFETY", "phase issue: haas disabled");
        }

        if (state.global_width > config_.width_floor) {
            state.global_width = std::max(config_.width_floor, state.global_width * config_.width_decay);
            action.width_changed = true;
            logger.log_event("SAFETY", state.global_width);
        }

        cooldown_ = config_.cooldown_ticks;
        has_indicator_ = true;
        indicator_until_ = now + std::chrono::milliseconds(config_.indicator_ms);
    }
    action.width = state.global_width;

    if (cooldown_ > 0) {
        --cooldown_;
    }

    return action;
}

void SafetyController::reset() {
    cooldown_ = 0;
    has_indicator_ = false;
    indicator_until_ = Clock::time_point{};
}

} // namespace morpho
