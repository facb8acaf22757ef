/**
 * @file EngineConfig.hpp
 * @brief Tunable engine constants.
 */

#ifndef MORPHO_ENGINE_CONFIG_HPP
#define MORPHO_ENGINE_CONFIG_HPP

#include <algorithm>
#include <cstddef>
#include <string>

namespace morpho {

/**
 * @brief Safety controller constants.
 */
struct SafetyConfig {
    int cooldown_ticks = 60;
    float width_decay = 0.95f;
    float width_floor = 0.5f;
    int indicator_ms = 1000;
};

/**
 * @brief Engine-wide settings, loadable from JSON through ConfigStore.
 */
struct EngineConfig {
    int version = 1;

    // Device
    int sample_rate = 44100;
    size_t block_size = 512;
    std::string alsa_device = "default";

    // Signal graph
    float haas_delay_seconds = 0.015f;
    float haas_smoothing_seconds = 0.1f;
    float pan_smoothing_seconds = 0.05f;
    float gain_smoothing_seconds = 0.05f;
    float bypass_crossfade_seconds = 0.03f;
    float graph_crossfade_seconds = 0.03f;
    float max_width = 1.5f;

    // Monitoring
    float correlation_smoothing = 0.9f;
    int monitor_tick_hz = 60;
    SafetyConfig safety;

    /**
     * @brief Copy with every field forced into its valid range.
     */
    EngineConfig sanitized() const {
        EngineConfig c = *this;
        c.sample_rate = std::clamp(c.sample_rate, 3000, 768000);
        c.block_size = std::clamp<size_t>(c.block_size, 16, 8192);
        c.haas_delay_seconds = std::clamp(c.haas_delay_seconds, 0.0f, 0.05f);
        c.haas_smoothing_seconds = std::clamp(c.haas_smoothing_seconds, 0.0f, 2.0f);
        c.pan_smoothing_seconds = std::clamp(c.pan_smoothing_seconds, 0.0f, 2.0f);
        c.gain_smoothing_seconds = std::clamp(c.gain_smoothing_seconds, 0.0f, 2.0f);
        c.bypass_crossfade_seconds = std::clamp(c.bypass_crossfade_seconds, 0.0f, 2.0f);
        c.graph_crossfade_seconds = std::clamp(c.graph_crossfade_seconds, 0.0f, 2.0f);
        c.max_width = std::clamp(c.max_width, 1.0f, 4.0f);
        c.correlation_smoothing = std::clamp(c.correlation_smoothing, 0.0f, 0.999f);
        c.monitor_tick_hz = std::clamp(c.monitor_tick_hz, 1, 1000);
        c.safety.cooldown_ticks = std::max(c.safety.cooldown_ticks, 1);
        c.safety.width_decay = std::clamp(c.safety.width_decay, 0.0f, 1.0f);
        c.safety.width_floor = std::clamp(c.safety.width_floor, 0.0f, c.max_width);
        c.safety.indicator_ms = std::max(c.safety.indicator_ms, 0);
        if (c.alsa_device.empty()) c.alsa_device = "default";
        return c;
    }
};

} // namespace morpho

#endif // MORPHO_ENGINE_CONFIG_HPP
