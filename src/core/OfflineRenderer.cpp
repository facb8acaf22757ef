#include "OfflineRenderer.hpp"
#include "Errors.hpp"
#include "SignalGraphBuilder.hpp"

namespace morpho {

OfflineRenderer::OfflineRenderer(const ContextOptions& options)
    : options_(options)
{}

RenderedBuffer OfflineRenderer::render(std::shared_ptr<const PcmBuffer> buffer,
                                       const EngineState& state,
                                       const std::atomic<bool>* cancel) const {
    if (!buffer || !buffer->is_valid()) {
        throw RenderError(RenderError::Reason::ContextAllocation, "no valid source buffer");
    }

    OfflineAudioContext context(2, buffer->frames(), buffer->sample_rate, options_);
    auto* source = context.create_buffer_source(buffer, 0);
    build_signal_graph(context, source, state);
    return context.start_rendering(cancel);
}

std::vector<uint8_t> OfflineRenderer::render_wav(std::shared_ptr<const PcmBuffer> buffer,
                                                 const EngineState& state,
                                                 BitDepth depth,
                                                 const std::atomic<bool>* cancel) const {
    // Checked before rendering so an oversized export fails without work.
    if (buffer && buffer->frames() > WavEncoder::max_frames(2, depth)) {
        throw RenderError(RenderError::Reason::ContextAllocation, "export exceeds the WAV size limit");
    }
    const RenderedBuffer rendered = render(std::move(buffer), state, cancel);
    return WavEncoder::encode(rendered.interleaved, 2, rendered.sample_rate, depth);
}

} // namespace morpho
