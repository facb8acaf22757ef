#include "BandChannel.hpp"
#include "FilterBank.hpp"

namespace morpho {

BandChannelNodes build_band_channel(AudioContext& context,
                                    const Processor* input,
                                    const BandSpec& band,
                                    const EngineState& state,
                                    const Processor* collector) {
    BandChannelNodes nodes;
    nodes.id = band.id;

    const Processor* tail = input;
    for (const auto& stage : FilterBank::build_filters(band.id)) {
        auto* filter = context.create_biquad(stage);
        context.connect(tail, filter);
        nodes.filters.push_back(filter);
        tail = filter;
    }

    nodes.gain = context.create_gain(band.gain, context.options().gain_smoothing_seconds);
    context.connect(tail, nodes.gain);
    tail = nodes.gain;

    if (supports_haas(band.id)) {
        nodes.haas = context.create_haas_delay(state.haas_enabled);
        context.connect(tail, nodes.haas);
        tail = nodes.haas;
    }

    nodes.panner = context.create_panner(effective_pan(band.pan, state.global_width));
    context.connect(tail, nodes.panner);
    context.connect(nodes.panner, collector);

    return nodes;
}

void apply_band_state(BandChannelNodes& channel, const BandSpec& band, const EngineState& state, bool immediate) {
    const float pan = effective_pan(band.pan, state.global_width);
    if (immediate) {
        channel.gain->set_gain_immediate(band.gain);
        channel.panner->set_pan_immediate(pan);
        if (channel.haas) channel.haas->set_enabled_immediate(state.haas_enabled);
    } else {
        channel.gain->set_gain(band.gain);
        channel.panner->set_pan(pan);
        if (channel.haas) channel.haas->set_enabled(state.haas_enabled);
    }
}

} // namespace morpho
