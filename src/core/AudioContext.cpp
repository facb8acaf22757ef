#include "AudioContext.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <new>
#include <stdexcept>
#include <string>

namespace morpho {

AudioContext::AudioContext(int sample_rate, const ContextOptions& options)
    : sample_rate_(sample_rate)
    , options_(options)
    , graph_(options.block_size)
{
    destination_ = graph_.add_node<GainProcessor>(sample_rate_, 1.0f);
    graph_.set_output(destination_);
}

BufferSourceProcessor* AudioContext::create_buffer_source(std::shared_ptr<const PcmBuffer> buffer, size_t start_frame) {
    return graph_.add_node<BufferSourceProcessor>(std::move(buffer), start_frame);
}

BiquadProcessor* AudioContext::create_biquad(const FilterStage& stage) {
    return graph_.add_node<BiquadProcessor>(sample_rate_, stage);
}

GainProcessor* AudioContext::create_gain(float gain, float smoothing_seconds) {
    return graph_.add_node<GainProcessor>(sample_rate_, gain, smoothing_seconds);
}

StereoPannerProcessor* AudioContext::create_panner(float pan) {
    return graph_.add_node<StereoPannerProcessor>(sample_rate_, pan, options_.pan_smoothing_seconds);
}

HaasDelayProcessor* AudioContext::create_haas_delay(bool enabled) {
    return graph_.add_node<HaasDelayProcessor>(sample_rate_, enabled,
                                               options_.haas_delay_seconds,
                                               options_.haas_smoothing_seconds);
}

void AudioContext::connect(const Processor* from, const Processor* to) {
    graph_.connect(from, to);
}

RealtimeAudioContext::RealtimeAudioContext(int sample_rate, const ContextOptions& options)
    : AudioContext(sample_rate, options)
{}

void RealtimeAudioContext::prepare() {
    graph_.prepare();
}

OfflineAudioContext::OfflineAudioContext(size_t channels, size_t length_frames, int sample_rate, const ContextOptions& options)
    : AudioContext(sample_rate, options)
    , length_(length_frames)
{
    if (channels != 2) {
        throw RenderError(RenderError::Reason::ContextAllocation, "offline context supports 2 channels only");
    }
    if (length_frames == 0) {
        throw RenderError(RenderError::Reason::ContextAllocation, "zero-length render");
    }
    if (sample_rate < kMinSampleRate || sample_rate > kMaxSampleRate) {
        throw RenderError(RenderError::Reason::ContextAllocation,
                          "unsupported sample rate " + std::to_string(sample_rate));
    }
    try {
        output_.resize(length_frames * 2);
    } catch (const std::bad_alloc&) {
        throw RenderError(RenderError::Reason::ContextAllocation, "out of memory");
    } catch (const std::length_error&) {
        throw RenderError(RenderError::Reason::ContextAllocation, "render length too large");
    }
}

RenderedBuffer OfflineAudioContext::start_rendering(const std::atomic<bool>* cancel) {
    if (output_.size() != length_ * 2) {
        throw std::logic_error("OfflineAudioContext: already rendered");
    }
    graph_.prepare();
    graph_.reset();

    auto& logger = AudioLogger::instance();
    logger.log_message("RENDER", "offline render started");

    StereoBlock block(graph_.block_size());
    const size_t progress_step = std::max<size_t>(length_ / 10, 1);
    size_t next_progress = progress_step;

    size_t done = 0;
    while (done < length_) {
        if (cancel && cancel->load(std::memory_order_acquire)) {
            logger.log_message("RENDER", "offline render cancelled");
            throw RenderError(RenderError::Reason::Cancelled, "render cancelled");
        }

        const size_t n = std::min(graph_.block_size(), length_ - done);
        AudioBuffer view = block.view(n);
        graph_.process(view);

        float* dst = output_.data() + done * 2;
        for (size_t i = 0; i < n; ++i) {
            dst[2 * i] = view.left[i];
            dst[2 * i + 1] = view.right[i];
        }
        done += n;

        if (done >= next_progress) {
            logger.log_event("RENDER", static_cast<float>(done) / static_cast<float>(length_));
            next_progress += progress_step;
        }
    }

    logger.log_message("RENDER", "offline render finished");

    RenderedBuffer result;
    result.sample_rate = sample_rate_;
    result.frames = length_;
    result.interleaved = std::move(output_);
    output_.clear();
    return result;
}

} // namespace morpho
