/**
 * @file ConfigStore.hpp
 * @brief Human-readable JSON persistence for EngineConfig.
 */

#ifndef MORPHO_CONFIG_STORE_HPP
#define MORPHO_CONFIG_STORE_HPP

#include <string>
#include <nlohmann/json.hpp>
#include "EngineConfig.hpp"

namespace morpho {

using json = nlohmann::json;

// Every key is optional on input; missing keys keep their defaults.
inline void to_json(json& j, const SafetyConfig& s) {
    j = json{
        {"cooldown_ticks", s.cooldown_ticks},
        {"width_decay", s.width_decay},
        {"width_floor", s.width_floor},
        {"indicator_ms", s.indicator_ms}
    };
}

inline void from_json(const json& j, SafetyConfig& s) {
    const SafetyConfig d;
    s.cooldown_ticks = j.value("cooldown_ticks", d.cooldown_ticks);
    s.width_decay = j.value("width_decay", d.width_decay);
    s.width_floor = j.value("width_floor", d.width_floor);
    s.indicator_ms = j.value("indicator_ms", d.indicator_ms);
}

inline void to_json(json& j, const EngineConfig& c) {
    j = json{
        {"version", c.version},
        {"sample_rate", c.sample_rate},
        {"block_size", c.block_size},
        {"alsa_device", c.alsa_device},
        {"haas_delay_seconds", c.haas_delay_seconds},
        {"haas_smoothing_seconds", c.haas_smoothing_seconds},
        {"pan_smoothing_seconds", c.pan_smoothing_seconds},
        {"gain_smoothing_seconds", c.gain_smoothing_seconds},
        {"bypass_crossfade_seconds", c.bypass_crossfade_seconds},
        {"graph_crossfade_seconds", c.graph_crossfade_seconds},
        {"max_width", c.max_width},
        {"correlation_smoothing", c.correlation_smoothing},
        {"monitor_tick_hz", c.monitor_tick_hz},
        {"safety", c.safety}
    };
}

inline void from_json(const json& j, EngineConfig& c) {
    const EngineConfig d;
    c.version = j.value("version", d.version);
    c.sample_rate = j.value("sample_rate", d.sample_rate);
    c.block_size = j.value("block_size", d.block_size);
    c.alsa_device = j.value("alsa_device", d.alsa_device);
    c.haas_delay_seconds = j.value("haas_delay_seconds", d.haas_delay_seconds);
    c.haas_smoothing_seconds = j.value("haas_smoothing_seconds", d.haas_smoothing_seconds);
    c.pan_smoothing_seconds = j.value("pan_smoothing_seconds", d.pan_smoothing_seconds);
    c.gain_smoothing_seconds = j.value("gain_smoothing_seconds", d.gain_smoothing_seconds);
    c.bypass_crossfade_seconds = j.value("bypass_crossfade_seconds", d.bypass_crossfade_seconds);
    c.graph_crossfade_seconds = j.value("graph_crossfade_seconds", d.graph_crossfade_seconds);
    c.max_width = j.value("max_width", d.max_width);
    c.correlation_smoothing = j.value("correlation_smoothing", d.correlation_smoothing);
    c.monitor_tick_hz = j.value("monitor_tick_hz", d.monitor_tick_hz);
    c.safety = j.contains("safety") ? j.at("safety").get<SafetyConfig>() : d.safety;
}

/**
 * @brief Manages saving and loading of EngineConfig.
 */
class ConfigStore {
public:
    static bool save_to_file(const EngineConfig& config, const std::string& path);
    static bool load_from_file(EngineConfig& config, const std::string& path);

    /**
     * @brief Convert EngineConfig to a JSON string.
     */
    static std::string serialize(const EngineConfig& config) {
        json j = config;
        return j.dump(4);
    }

    /**
     * @brief Load EngineConfig from a JSON string. Values are clamped.
     *
     * @return false (and @p config untouched) if the text is not a JSON
     *         object with values of the expected types.
     */
    static bool deserialize(EngineConfig& config, const std::string& data) {
        try {
            json j = json::parse(data);
            if (!j.is_object()) return false;
            config = j.get<EngineConfig>().sanitized();
            return true;
        } catch (const json::exception&) {
            return false;
        }
    }
};

} // namespace morpho

#endif // MORPHO_CONFIG_STORE_HPP
