/**
 * @file OfflineRenderer.hpp
 * @brief Renders a buffer through the signal graph and encodes it as WAV.
 */

#ifndef MORPHO_OFFLINE_RENDERER_HPP
#define MORPHO_OFFLINE_RENDERER_HPP

#include "AudioContext.hpp"
#include "EngineState.hpp"
#include "WavEncoder.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

namespace morpho {

/**
 * @brief Stateless offline export pipeline.
 *
 * Each call builds its own OfflineAudioContext and graph from a frozen
 * EngineState, so renders never share nodes with live playback. The
 * safety controller does not run offline.
 */
class OfflineRenderer {
public:
    explicit OfflineRenderer(const ContextOptions& options);

    /**
     * @throws RenderError(ContextAllocation) if the context cannot be created.
     * @throws RenderError(Cancelled) if @p cancel is raised mid-render.
     */
    RenderedBuffer render(std::shared_ptr<const PcmBuffer> buffer,
                          const EngineState& state,
                          const std::atomic<bool>* cancel = nullptr) const;

    /**
     * @brief render() followed by WAV encoding at @p depth.
     *
     * @throws RenderError(ContextAllocation) if the result cannot fit a RIFF file.
     */
    std::vector<uint8_t> render_wav(std::shared_ptr<const PcmBuffer> buffer,
                                    const EngineState& state,
                                    BitDepth depth,
                                    const std::atomic<bool>* cancel = nullptr) const;

private:
    ContextOptions options_;
};

} // namespace morpho

#endif // MORPHO_OFFLINE_RENDERER_HPP
