#include "RealtimeSession.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace morpho {

RealtimeSession::RealtimeSession(const ContextOptions& options, float crossfade_seconds)
    : options_(options)
    , crossfade_seconds_(std::max(0.0f, crossfade_seconds))
    , scratch_(std::max<size_t>(options.block_size, 1))
{}

RealtimeSession::~RealtimeSession() = default;

void RealtimeSession::start(std::shared_ptr<const PcmBuffer> buffer, size_t start_frame, const EngineState& state) {
    const int sample_rate = buffer ? buffer->sample_rate : 44100;
    auto instance = std::make_unique<Instance>();
    instance->context = std::make_unique<RealtimeAudioContext>(sample_rate, options_);
    instance->fade_frames = static_cast<size_t>(std::lround(crossfade_seconds_ * sample_rate));
    auto* source = instance->context->create_buffer_source(std::move(buffer), start_frame);
    instance->graph = build_signal_graph(*instance->context, source, state);
    instance->context->prepare();

    params_.publish(state);

    std::unique_ptr<Instance> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped = std::move(pending_);
        pending_ = std::move(instance);
        ended_.store(false, std::memory_order_release);
        position_.store(start_frame, std::memory_order_release);
        active_.store(true, std::memory_order_release);
    }
    AudioLogger::instance().log_message("GRAPH", "instance scheduled");
}

void RealtimeSession::clear() {
    std::vector<std::unique_ptr<Instance>> released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        released.push_back(std::move(current_));
        released.push_back(std::move(fading_));
        released.push_back(std::move(pending_));
        for (auto& slot : retired_) {
            released.push_back(std::move(slot));
        }
        fade_pos_ = 0;
        active_.store(false, std::memory_order_release);
        ended_.store(false, std::memory_order_release);
    }
    tap_.clear();
}

size_t RealtimeSession::collect_garbage() {
    std::vector<std::unique_ptr<Instance>> released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& slot : retired_) {
            if (slot) released.push_back(std::move(slot));
        }
    }
    return released.size();
}

std::string RealtimeSession::describe() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_) return pending_->context->describe();
    if (current_) return current_->context->describe();
    return {};
}

void RealtimeSession::render(AudioBuffer& output) {
    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        output.clear();
        return;
    }
    render_locked(output);
}

void RealtimeSession::render_locked(AudioBuffer& output) {
    size_t offset = 0;
    const size_t total = output.frames();
    const size_t chunk = scratch_.frames();

    while (offset < total) {
        const size_t n = std::min(chunk, total - offset);
        AudioBuffer out = output.subview(offset, n);

        adopt_pending();
        apply_parameters(false);

        if (!current_) {
            out.clear();
        } else {
            current_->context->render_block(out);

            if (fading_ && fade_pos_ < fade_frames_) {
                AudioBuffer old = scratch_.view(n);
                fading_->context->render_block(old);
                for (size_t i = 0; i < n; ++i) {
                    const float g = std::min(1.0f, static_cast<float>(fade_pos_ + i) / static_cast<float>(fade_frames_));
                    out.left[i] = out.left[i] * g + old.left[i] * (1.0f - g);
                    out.right[i] = out.right[i] * g + old.right[i] * (1.0f - g);
                }
                fade_pos_ += n;
            }
            if (fading_ && fade_pos_ >= fade_frames_ && retire(fading_)) {
                AudioLogger::instance().log_message("GRAPH", "crossfade complete");
            }

            const auto* source = current_->graph.source;
            position_.store(source->position(), std::memory_order_release);
            if (source->ended() && !pending_) {
                ended_.store(true, std::memory_order_release);
            }
        }

        tap_.push(out);
        offset += n;
    }
}

void RealtimeSession::adopt_pending() {
    if (!pending_) return;

    if (!current_) {
        current_ = std::move(pending_);
        apply_parameters(true);
        return;
    }

    // One crossfade at a time; a newer instance waits until it completes.
    if (fading_) return;

    fading_ = std::move(current_);
    current_ = std::move(pending_);
    fade_frames_ = current_->fade_frames;
    fade_pos_ = 0;
    apply_parameters(true);
}

void RealtimeSession::apply_parameters(bool force) {
    EngineState state;
    uint64_t version = 0;
    if (params_.read(state, version)) {
        if (version != applied_version_ || force) {
            audio_state_ = state;
            applied_version_ = version;
            if (current_) apply_state(current_->graph, audio_state_, false);
        }
    } else if (force && current_) {
        apply_state(current_->graph, audio_state_, false);
    }
}

bool RealtimeSession::retire(std::unique_ptr<Instance>& instance) {
    if (!instance) return true;
    for (auto& slot : retired_) {
        if (!slot) {
            slot = std::move(instance);
            return true;
        }
    }
    return false;
}

} // namespace morpho
