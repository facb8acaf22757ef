/**
 * @file BandSpec.hpp
 * @brief The four fixed frequency bands and their mutable pan/gain.
 */

#ifndef MORPHO_BAND_SPEC_HPP
#define MORPHO_BAND_SPEC_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace morpho {

/**
 * @brief Stable band identity. The enum order is the spectral order.
 */
enum class BandId {
    Low = 0,
    MidLow,
    MidHigh,
    High,
    Count
};

inline constexpr size_t kNumBands = static_cast<size_t>(BandId::Count);

/**
 * @brief Per-band settings. Identity is fixed; pan and gain mutate.
 */
struct BandSpec {
    BandId id = BandId::Low;
    float pan = 0.0f;   // -1 (left) .. 1 (right)
    float gain = 1.0f;
};

using BandSet = std::array<BandSpec, kNumBands>;

inline constexpr size_t band_index(BandId id) { return static_cast<size_t>(id); }

/**
 * @brief Wire id used by hosts ("low", "mid-low", "mid-high", "high").
 */
inline constexpr std::string_view band_id_name(BandId id) {
    switch (id) {
        case BandId::Low:     return "low";
        case BandId::MidLow:  return "mid-low";
        case BandId::MidHigh: return "mid-high";
        case BandId::High:    return "high";
        default:              return "";
    }
}

inline constexpr std::string_view band_display_name(BandId id) {
    switch (id) {
        case BandId::Low:     return "Low";
        case BandId::MidLow:  return "Lo-Mid";
        case BandId::MidHigh: return "Hi-Mid";
        case BandId::High:    return "High";
        default:              return "";
    }
}

inline constexpr std::string_view band_range_label(BandId id) {
    switch (id) {
        case BandId::Low:     return "< 250Hz";
        case BandId::MidLow:  return "250-2k";
        case BandId::MidHigh: return "2k-8k";
        case BandId::High:    return "> 8k";
        default:              return "";
    }
}

inline std::optional<BandId> parse_band_id(std::string_view name) {
    for (size_t i = 0; i < kNumBands; ++i) {
        const auto id = static_cast<BandId>(i);
        if (band_id_name(id) == name) {
            return id;
        }
    }
    return std::nullopt;
}

/**
 * @brief Bass stays mono-coherent: the low band never gets the Haas delay.
 */
inline constexpr bool supports_haas(BandId id) { return id != BandId::Low; }

/**
 * @brief Factory layout: slight left/right spread of the mids, centred bass.
 */
inline constexpr BandSet default_bands() {
    return BandSet{{
        {BandId::Low, 0.0f, 1.0f},
        {BandId::MidLow, -0.3f, 1.0f},
        {BandId::MidHigh, 0.3f, 1.0f},
        {BandId::High, 0.1f, 1.0f},
    }};
}

} // namespace morpho

#endif // MORPHO_BAND_SPEC_HPP
