/**
 * @file BandChannel.hpp
 * @brief One band's chain: crossover filters, gain, Haas unit, panner.
 */

#ifndef MORPHO_BAND_CHANNEL_HPP
#define MORPHO_BAND_CHANNEL_HPP

#include "AudioContext.hpp"
#include "EngineState.hpp"
#include <vector>

namespace morpho {

/**
 * @brief Nodes of a built band channel. haas is null for the low band.
 */
struct BandChannelNodes {
    BandId id = BandId::Low;
    std::vector<BiquadProcessor*> filters;
    GainProcessor* gain = nullptr;
    HaasDelayProcessor* haas = nullptr;
    StereoPannerProcessor* panner = nullptr;
};

/**
 * @brief Wire input -> filters -> gain -> [haas] -> panner -> collector.
 *
 * Initial gain, pan and Haas state come from @p state and are applied
 * without smoothing.
 */
BandChannelNodes build_band_channel(AudioContext& context,
                                    const Processor* input,
                                    const BandSpec& band,
                                    const EngineState& state,
                                    const Processor* collector);

/**
 * @brief Retarget gain, pan and Haas on an existing band channel.
 */
void apply_band_state(BandChannelNodes& channel, const BandSpec& band, const EngineState& state, bool immediate);

} // namespace morpho

#endif // MORPHO_BAND_CHANNEL_HPP
