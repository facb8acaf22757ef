/**
 * @file Engine.hpp
 * @brief Control surface of the stereo enhancement engine.
 */

#ifndef MORPHO_ENGINE_HPP
#define MORPHO_ENGINE_HPP

#include "AudioDriver.hpp"
#include "CorrelationMonitor.hpp"
#include "EngineConfig.hpp"
#include "EngineState.hpp"
#include "OfflineRenderer.hpp"
#include "RealtimeSession.hpp"
#include "SafetyController.hpp"
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace morpho {

/**
 * @brief Owns the engine state, the live session and the export pipeline.
 *
 * Every method except render() belongs to the control thread. render() is
 * the audio-thread entry for hosts without a driver; with a driver the
 * driver's callback renders instead.
 */
class Engine {
public:
    using Clock = std::chrono::steady_clock;
    using EndedCallback = std::function<void()>;
    using ExportResult = std::optional<std::vector<uint8_t>>;

    explicit Engine(const EngineConfig& config = EngineConfig{}, std::unique_ptr<hal::AudioDriver> driver = nullptr);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // --- Loading ---

    /**
     * @brief Replace the source buffer. Stops playback.
     *
     * @return false if the buffer is empty or malformed (nothing is loaded).
     */
    bool load(PcmBuffer buffer);

    /**
     * @brief Decode and load a WAV file.
     *
     * @throws DecodeError if the file cannot be decoded; the engine is left
     *         idle without a buffer.
     */
    void load_file(const std::string& path);

    bool has_buffer() const { return static_cast<bool>(buffer_); }

    // --- Transport ---

    /**
     * @brief Start playback with @p bands from the paused position.
     *
     * @return false without a loaded buffer, or if a driver is attached whose
     *         sample rate differs from the buffer's.
     */
    bool play(const BandSet& bands, EndedCallback on_ended);
    bool play();
    void pause();
    void stop();

    /**
     * @brief Move the playhead (clamped to [0, duration]).
     *
     * While playing, a new graph instance crossfades in at the new position.
     */
    bool seek(double seconds);

    // --- Parameters (clamped, applied with smoothing) ---
    void set_haas(bool enabled);
    void set_bypass(bool bypass);
    void set_width(float width);
    void set_band_pan(BandId id, float pan);
    void set_band_gain(BandId id, float gain);
    void set_mono_safe_mode(bool enabled);
    void update_bands(const BandSet& bands);

    /**
     * @brief Monitor tick: correlation, safety control, end-of-stream,
     * release of retired graph instances.
     */
    void tick(Clock::time_point now = Clock::now());

    // --- Export ---

    /**
     * @brief Render the current state offline and encode it.
     *
     * @return std::nullopt if no buffer is loaded.
     * @throws RenderError (ContextAllocation, Cancelled or Busy).
     */
    ExportResult export_audio(BitDepth depth);

    /**
     * @brief export_audio() on a worker thread.
     *
     * @throws RenderError(Busy) if an export is already running.
     */
    std::future<ExportResult> export_audio_async(BitDepth depth);

    void cancel_export();
    bool is_exporting() const;

    // --- Audio ---

    // Audio Thread (RT-Safe)
    void render(AudioBuffer& output) { session_.render(output); }

    /**
     * @return false if the device fails to open, or if a loaded buffer's
     *         sample rate differs from the rate the device negotiated (the
     *         device is stopped again).
     */
    bool start_device();
    void stop_device();
    bool has_device() const { return static_cast<bool>(driver_); }

    // --- Telemetry ---
    double current_time() const;
    double duration() const;
    float phase_correlation() const { return monitor_.smoothed(); }
    float instantaneous_correlation() const { return monitor_.instantaneous(); }
    size_t time_domain_samples(std::span<float> left, std::span<float> right) const;
    bool is_correcting(Clock::time_point now = Clock::now()) const { return safety_.is_correcting(now); }
    SafetyController::State safety_state() const { return safety_.state(); }
    PlaybackPhase phase() const;
    const EngineState& state() const { return state_; }
    const EngineConfig& config() const { return config_; }
    std::string describe_graph() { return session_.describe(); }

private:
    struct ExportJob {
        std::atomic<bool> busy{false};
        std::atomic<bool> cancel{false};
    };

    bool device_rate_matches() const;
    void publish();
    void start_session(size_t start_frame);
    void reset_monitoring();
    size_t frames_for(double seconds) const;

    EngineConfig config_;
    ContextOptions options_;
    EngineState state_;
    PlaybackPhase phase_ = PlaybackPhase::Idle;

    std::shared_ptr<const PcmBuffer> buffer_;
    size_t paused_frame_ = 0;
    EndedCallback on_ended_;

    RealtimeSession session_;
    CorrelationMonitor monitor_;
    SafetyController safety_;
    std::vector<float> window_left_;
    std::vector<float> window_right_;

    OfflineRenderer renderer_;
    std::shared_ptr<ExportJob> export_job_;

    std::unique_ptr<hal::AudioDriver> driver_;
};

} // namespace morpho

#endif // MORPHO_ENGINE_HPP
