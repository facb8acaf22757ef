#include "SignalGraphBuilder.hpp"

namespace morpho {

SignalGraph build_signal_graph(AudioContext& context, BufferSourceProcessor* source, const EngineState& state) {
    SignalGraph graph;
    graph.source = source;

    const float fade = context.options().bypass_crossfade_seconds;
    graph.master = context.create_gain(1.0f, 0.0f);
    graph.dry = context.create_gain(state.bypass ? 1.0f : 0.0f, fade);
    graph.wet = context.create_gain(state.bypass ? 0.0f : 1.0f, fade);

    context.connect(source, graph.dry);

    for (size_t i = 0; i < kNumBands; ++i) {
        graph.bands[i] = build_band_channel(context, source, state.bands[i], state, graph.wet);
    }

    context.connect(graph.dry, graph.master);
    context.connect(graph.wet, graph.master);
    context.connect(graph.master, context.destination());

    return graph;
}

void apply_state(SignalGraph& graph, const EngineState& state, bool immediate) {
    const float dry = state.bypass ? 1.0f : 0.0f;
    const float wet = state.bypass ? 0.0f : 1.0f;
    if (immediate) {
        graph.dry->set_gain_immediate(dry);
        graph.wet->set_gain_immediate(wet);
    } else {
        graph.dry->set_gain(dry);
        graph.wet->set_gain(wet);
    }

    for (size_t i = 0; i < kNumBands; ++i) {
        apply_band_state(graph.bands[i], state.bands[i], state, immediate);
    }
}

} // namespace morpho
