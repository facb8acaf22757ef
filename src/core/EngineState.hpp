/**
 * @file EngineState.hpp
 * @brief Control-thread owned engine parameters and the playback phase.
 */

#ifndef MORPHO_ENGINE_STATE_HPP
#define MORPHO_ENGINE_STATE_HPP

#include "BandSpec.hpp"
#include <algorithm>
#include <cmath>

namespace morpho {

inline constexpr float kDefaultMaxWidth = 1.5f;

enum class PlaybackPhase {
    Idle,
    Loading,
    Playing,
    Paused,
    Exporting
};

inline const char* playback_phase_name(PlaybackPhase phase) {
    switch (phase) {
        case PlaybackPhase::Idle:      return "idle";
        case PlaybackPhase::Loading:   return "loading";
        case PlaybackPhase::Playing:   return "playing";
        case PlaybackPhase::Paused:    return "paused";
        case PlaybackPhase::Exporting: return "exporting";
    }
    return "unknown";
}

/**
 * @brief Everything the signal graph is built from.
 *
 * Graph builders receive a copy; the engine owns the live value.
 */
struct EngineState {
    BandSet bands = default_bands();
    bool haas_enabled = false;
    float global_width = 1.0f;
    bool bypass = false;
    bool mono_safe_mode = true;
    float max_width = kDefaultMaxWidth;

    BandSpec& band(BandId id) { return bands[band_index(id)]; }
    const BandSpec& band(BandId id) const { return bands[band_index(id)]; }

    // Non-finite input keeps the current width.
    void set_width(float width) {
        if (!std::isfinite(width)) return;
        global_width = std::clamp(width, 0.0f, max_width);
    }
};

/**
 * @brief Pan actually applied to a band: base pan scaled by the global width.
 */
inline float effective_pan(float base_pan, float global_width) {
    return std::clamp(base_pan * global_width, -1.0f, 1.0f);
}

inline float clamp_pan(float pan) {
    return std::clamp(pan, -1.0f, 1.0f);
}

inline float clamp_gain(float gain) {
    return std::max(gain, 0.0f);
}

/**
 * @brief Clamp a band set into its valid domain and restore canonical ids.
 *
 * A non-finite pan or gain falls back to the matching entry of @p previous.
 */
inline BandSet sanitize_bands(const BandSet& bands, const BandSet& previous = default_bands()) {
    BandSet out = bands;
    for (size_t i = 0; i < kNumBands; ++i) {
        out[i].id = static_cast<BandId>(i);
        out[i].pan = std::isfinite(out[i].pan) ? clamp_pan(out[i].pan) : previous[i].pan;
        out[i].gain = std::isfinite(out[i].gain) ? clamp_gain(out[i].gain) : previous[i].gain;
    }
    return out;
}

} // namespace morpho

#endif // MORPHO_ENGINE_STATE_HPP
