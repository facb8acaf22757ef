/**
 * @file SignalGraphBuilder.hpp
 * @brief Wires the full dry/wet band-splitting graph into a context.
 */

#ifndef MORPHO_SIGNAL_GRAPH_BUILDER_HPP
#define MORPHO_SIGNAL_GRAPH_BUILDER_HPP

#include "BandChannel.hpp"
#include <array>

namespace morpho {

/**
 * @brief Handles to the nodes of one signal graph instance.
 */
struct SignalGraph {
    BufferSourceProcessor* source = nullptr;
    GainProcessor* dry = nullptr;
    GainProcessor* wet = nullptr;
    GainProcessor* master = nullptr;
    std::array<BandChannelNodes, kNumBands> bands{};
};

/**
 * @brief Build source -> {dry, 4 band channels -> wet} -> master -> destination.
 *
 * The wet gain is also the collector the band panners sum into. Dry and wet
 * are complementary: bypass selects dry = 1, wet = 0. All initial values are
 * set without smoothing, and the same state always yields the same wiring.
 *
 * @throws std::logic_error if @p source does not belong to @p context.
 */
SignalGraph build_signal_graph(AudioContext& context, BufferSourceProcessor* source, const EngineState& state);

/**
 * @brief Push pan, gain, Haas and bypass from @p state to an existing graph.
 *
 * With @p immediate false the changes glide with the context's smoothing
 * times; the bypass switch crossfades over the bypass crossfade window.
 */
void apply_state(SignalGraph& graph, const EngineState& state, bool immediate);

} // namespace morpho

#endif // MORPHO_SIGNAL_GRAPH_BUILDER_HPP
