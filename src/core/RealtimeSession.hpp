/**
 * @file RealtimeSession.hpp
 * @brief Live signal graph instances, parameter handoff and analysis tap.
 */

#ifndef MORPHO_REALTIME_SESSION_HPP
#define MORPHO_REALTIME_SESSION_HPP

#include "AnalyserTap.hpp"
#include "AudioContext.hpp"
#include "CorrelationMonitor.hpp"
#include "ParameterBlock.hpp"
#include "SignalGraphBuilder.hpp"
#include <array>
#include <atomic>
#include <memory>
#include <mutex>

namespace morpho {

/**
 * @brief Everything the audio thread touches while playing.
 *
 * Graph instances are built on the control thread and handed over as a
 * pending instance. The audio thread takes the session with try_lock (a
 * contended block renders silence), adopts the pending instance and
 * crossfades from the previous one. Finished instances are parked in retired
 * slots and freed by collect_garbage() on the control thread, so the audio
 * thread never allocates or frees.
 */
class RealtimeSession {
public:
    using Tap = AnalyserTap<CorrelationMonitor::kWindowFrames>;

    RealtimeSession(const ContextOptions& options, float crossfade_seconds);
    ~RealtimeSession();

    RealtimeSession(const RealtimeSession&) = delete;
    RealtimeSession& operator=(const RealtimeSession&) = delete;

    // Control Thread
    /**
     * @brief Build a graph reading @p buffer from @p start_frame and schedule it.
     *
     * The graph runs at the buffer's sample rate.
     * If nothing is playing the instance starts immediately; otherwise it
     * replaces the current one with a crossfade.
     *
     * @throws std::logic_error on a wiring fault.
     */
    void start(std::shared_ptr<const PcmBuffer> buffer, size_t start_frame, const EngineState& state);

    /**
     * @brief Publish new parameters; applied with smoothing on the next block.
     */
    void publish(const EngineState& state) { params_.publish(state); }

    /**
     * @brief Drop every instance and clear the analysis window.
     */
    void clear();

    /**
     * @brief Free instances the audio thread has finished with.
     *
     * @return Number of instances released.
     */
    size_t collect_garbage();

    bool active() const { return active_.load(std::memory_order_acquire); }
    size_t position_frames() const { return position_.load(std::memory_order_acquire); }
    bool ended() const { return ended_.load(std::memory_order_acquire); }

    size_t snapshot(std::span<float> left, std::span<float> right) const { return tap_.snapshot(left, right); }

    /**
     * @brief Topology of the current instance ("" when idle).
     */
    std::string describe();

    // Audio Thread (RT-Safe)
    void render(AudioBuffer& output);

private:
    struct Instance {
        std::unique_ptr<RealtimeAudioContext> context;
        SignalGraph graph;
        size_t fade_frames = 0;
    };

    static constexpr size_t kRetiredSlots = 4;

    void render_locked(AudioBuffer& output);
    void adopt_pending();
    void apply_parameters(bool force);
    bool retire(std::unique_ptr<Instance>& instance);

    ContextOptions options_;
    float crossfade_seconds_;
    size_t fade_frames_ = 0;

    std::mutex mutex_;
    std::unique_ptr<Instance> current_;
    std::unique_ptr<Instance> fading_;
    std::unique_ptr<Instance> pending_;
    std::array<std::unique_ptr<Instance>, kRetiredSlots> retired_;
    size_t fade_pos_ = 0;

    ParameterBlock params_;
    uint64_t applied_version_ = 0;
    EngineState audio_state_;

    StereoBlock scratch_;
    Tap tap_;

    std::atomic<bool> active_{false};
    std::atomic<bool> ended_{false};
    std::atomic<size_t> position_{0};
};

} // namespace morpho

#endif // MORPHO_REALTIME_SESSION_HPP
