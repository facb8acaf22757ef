/**
 * @file AudioContext.hpp
 * @brief Node factory and render target shared by live playback and export.
 */

#ifndef MORPHO_AUDIO_CONTEXT_HPP
#define MORPHO_AUDIO_CONTEXT_HPP

#include "AudioGraph.hpp"
#include "BiquadProcessor.hpp"
#include "BufferSourceProcessor.hpp"
#include "GainProcessor.hpp"
#include "HaasDelayProcessor.hpp"
#include "PcmBuffer.hpp"
#include "StereoPannerProcessor.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace morpho {

/**
 * @brief Per-context node defaults (smoothing times, Haas delay, block size).
 */
struct ContextOptions {
    size_t block_size = 512;
    float haas_delay_seconds = HaasDelayProcessor::kDefaultDelaySeconds;
    float haas_smoothing_seconds = 0.1f;
    float pan_smoothing_seconds = 0.05f;
    float gain_smoothing_seconds = 0.05f;
    float bypass_crossfade_seconds = 0.03f;
};

/**
 * @brief Creates graph nodes and owns the graph they live in.
 *
 * Every node is created through the context, so the same builder code wires
 * a device graph or an offline render graph. destination() is the sink;
 * whatever is connected to it is what the context renders.
 */
class AudioContext {
public:
    AudioContext(int sample_rate, const ContextOptions& options);
    virtual ~AudioContext() = default;

    AudioContext(const AudioContext&) = delete;
    AudioContext& operator=(const AudioContext&) = delete;

    int sample_rate() const { return sample_rate_; }
    const ContextOptions& options() const { return options_; }

    BufferSourceProcessor* create_buffer_source(std::shared_ptr<const PcmBuffer> buffer, size_t start_frame = 0);
    BiquadProcessor* create_biquad(const FilterStage& stage);
    GainProcessor* create_gain(float gain, float smoothing_seconds);
    StereoPannerProcessor* create_panner(float pan);
    HaasDelayProcessor* create_haas_delay(bool enabled);

    /**
     * @throws std::logic_error on invalid wiring (see AudioGraph::connect).
     */
    void connect(const Processor* from, const Processor* to);

    GainProcessor* destination() { return destination_; }

    std::string describe() const { return graph_.describe(); }
    size_t node_count() const { return graph_.node_count(); }

    virtual const char* context_kind() const = 0;

protected:
    int sample_rate_;
    ContextOptions options_;
    AudioGraph graph_;
    GainProcessor* destination_;
};

/**
 * @brief Context pulled block by block by a device callback.
 */
class RealtimeAudioContext : public AudioContext {
public:
    RealtimeAudioContext(int sample_rate, const ContextOptions& options);

    /**
     * @brief Finalize wiring. Call on the control thread before rendering.
     *
     * @throws std::logic_error if the graph contains a cycle.
     */
    void prepare();

    // Audio Thread (RT-Safe once prepared)
    void render_block(AudioBuffer& output) { graph_.process(output); }

    void reset() { graph_.reset(); }

    const char* context_kind() const override { return "realtime"; }
};

/**
 * @brief Interleaved stereo result of an offline render.
 */
struct RenderedBuffer {
    int sample_rate = 44100;
    size_t frames = 0;
    std::vector<float> interleaved;
};

/**
 * @brief Context that renders a fixed number of frames as fast as possible.
 */
class OfflineAudioContext : public AudioContext {
public:
    static constexpr int kMinSampleRate = 3000;
    static constexpr int kMaxSampleRate = 768000;

    /**
     * @throws RenderError(ContextAllocation) for a channel count other than 2,
     *         a zero length, a sample rate outside [3000, 768000] Hz, or when
     *         the output cannot be allocated.
     */
    OfflineAudioContext(size_t channels, size_t length_frames, int sample_rate, const ContextOptions& options);

    size_t length() const { return length_; }

    /**
     * @brief Render the whole graph.
     *
     * @param cancel Optional flag polled once per block.
     * @throws RenderError(Cancelled) if @p cancel was raised.
     * @throws std::logic_error if the graph is miswired.
     */
    RenderedBuffer start_rendering(const std::atomic<bool>* cancel = nullptr);

    const char* context_kind() const override { return "offline"; }

private:
    size_t length_;
    std::vector<float> output_;
};

} // namespace morpho

#endif // MORPHO_AUDIO_CONTEXT_HPP
