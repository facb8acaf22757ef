#include "Engine.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "WavReader.hpp"
#include <algorithm>
#include <cmath>
#include <system_error>

namespace morpho {

namespace {

ContextOptions make_options(const EngineConfig& config) {
    ContextOptions options;
    options.block_size = config.block_size;
    options.haas_delay_seconds = config.haas_delay_seconds;
    options.haas_smoothing_seconds = config.haas_smoothing_seconds;
    options.pan_smoothing_seconds = config.pan_smoothing_seconds;
    options.gain_smoothing_seconds = config.gain_smoothing_seconds;
    options.bypass_crossfade_seconds = config.bypass_crossfade_seconds;
    return options;
}

EngineState initial_state(const EngineConfig& config) {
    EngineState state;
    state.max_width = config.max_width;
    return state;
}

// Clears the busy flag however the export ends.
class ExportGuard {
public:
    explicit ExportGuard(std::atomic<bool>& busy) : busy_(busy) {}
    ~ExportGuard() { busy_.store(false, std::memory_order_release); }
    ExportGuard(const ExportGuard&) = delete;
    ExportGuard& operator=(const ExportGuard&) = delete;

private:
    std::atomic<bool>& busy_;
};

} // namespace

Engine::Engine(const EngineConfig& config, std::unique_ptr<hal::AudioDriver> driver)
    : config_(config.sanitized())
    , options_(make_options(config_))
    , state_(initial_state(config_))
    , session_(options_, config_.graph_crossfade_seconds)
    , monitor_(config_.correlation_smoothing)
    , safety_(config_.safety)
    , window_left_(CorrelationMonitor::kWindowFrames, 0.0f)
    , window_right_(CorrelationMonitor::kWindowFrames, 0.0f)
    , renderer_(options_)
    , export_job_(std::make_shared<ExportJob>())
    , driver_(std::move(driver))
{
    session_.publish(state_);
    if (driver_) {
        driver_->set_stereo_callback([this](AudioBuffer& output) {
            session_.render(output);
        });
    }
}

Engine::~Engine() {
    cancel_export();
    stop_device();
    session_.clear();
}

bool Engine::load(PcmBuffer buffer) {
    stop();
    phase_ = PlaybackPhase::Loading;
    buffer_.reset();

    if (!buffer.is_valid() || buffer.frames() == 0) {
        AudioLogger::instance().log_message("ENGINE", "load rejected: empty buffer");
        phase_ = PlaybackPhase::Idle;
        return false;
    }

    buffer_ = std::make_shared<const PcmBuffer>(std::move(buffer));
    paused_frame_ = 0;
    reset_monitoring();
    phase_ = PlaybackPhase::Idle;
    AudioLogger::instance().log_event("ENGINE", static_cast<float>(buffer_->duration()));
    return true;
}

void Engine::load_file(const std::string& path) {
    stop();
    phase_ = PlaybackPhase::Loading;
    buffer_.reset();
    try {
        PcmBuffer decoded = WavReader::read_file(path);
        if (!load(std::move(decoded))) {
            throw DecodeError("no audio frames in " + path);
        }
    } catch (const DecodeError&) {
        phase_ = PlaybackPhase::Idle;
        AudioLogger::instance().log_message("ENGINE", "load failed: decode error");
        throw;
    }
}

bool Engine::play(const BandSet& bands, EndedCallback on_ended) {
    on_ended_ = std::move(on_ended);
    state_.bands = sanitize_bands(bands, state_.bands);
    return play();
}

bool Engine::play() {
    if (!buffer_) return false;
    if (!device_rate_matches()) {
        AudioLogger::instance().log_message("ENGINE", "play refused: device rate differs");
        return false;
    }

    if (phase_ == PlaybackPhase::Playing) {
        publish();
        return true;
    }

    // Starting from the end wraps to the beginning.
    const size_t start = paused_frame_ % buffer_->frames();
    start_session(start);
    phase_ = PlaybackPhase::Playing;
    AudioLogger::instance().log_message("ENGINE", "play");
    return true;
}

void Engine::pause() {
    if (phase_ != PlaybackPhase::Playing) return;
    paused_frame_ = std::min(session_.position_frames(), buffer_ ? buffer_->frames() : 0);
    session_.clear();
    phase_ = PlaybackPhase::Paused;
    AudioLogger::instance().log_message("ENGINE", "pause");
}

void Engine::stop() {
    session_.clear();
    session_.collect_garbage();
    paused_frame_ = 0;
    reset_monitoring();
    if (phase_ == PlaybackPhase::Playing || phase_ == PlaybackPhase::Paused) {
        AudioLogger::instance().log_message("ENGINE", "stop");
    }
    phase_ = PlaybackPhase::Idle;
}

bool Engine::seek(double seconds) {
    if (!buffer_ || std::isnan(seconds)) return false;

    const double clamped = std::clamp(seconds, 0.0, buffer_->duration());
    paused_frame_ = std::min(frames_for(clamped), buffer_->frames());

    if (phase_ == PlaybackPhase::Playing) {
        start_session(paused_frame_ % buffer_->frames());
    }
    return true;
}

void Engine::set_haas(bool enabled) {
    state_.haas_enabled = enabled;
    publish();
}

void Engine::set_bypass(bool bypass) {
    state_.bypass = bypass;
    publish();
}

void Engine::set_width(float width) {
    state_.set_width(width);
    publish();
}

void Engine::set_band_pan(BandId id, float pan) {
    if (id == BandId::Count || !std::isfinite(pan)) return;
    state_.band(id).pan = clamp_pan(pan);
    publish();
}

void Engine::set_band_gain(BandId id, float gain) {
    if (id == BandId::Count || !std::isfinite(gain)) return;
    state_.band(id).gain = clamp_gain(gain);
    publish();
}

void Engine::set_mono_safe_mode(bool enabled) {
    state_.mono_safe_mode = enabled;
    publish();
}

void Engine::update_bands(const BandSet& bands) {
    state_.bands = sanitize_bands(bands, state_.bands);
    publish();
}

void Engine::tick(Clock::time_point now) {
    if (phase_ == PlaybackPhase::Playing) {
        session_.snapshot(window_left_, window_right_);
        const float smoothed = monitor_.update(window_left_, window_right_);

        const auto action = safety_.tick(smoothed, state_, now);
        if (action.fired) {
            publish();
        }

        if (session_.ended()) {
            session_.clear();
            paused_frame_ = 0;
            phase_ = PlaybackPhase::Idle;
            AudioLogger::instance().log_message("ENGINE", "ended");
            if (on_ended_) {
                on_ended_();
            }
        }
    }

    session_.collect_garbage();
}

Engine::ExportResult Engine::export_audio(BitDepth depth) {
    if (!buffer_) return std::nullopt;

    auto job = export_job_;
    bool expected = false;
    if (!job->busy.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        throw RenderError(RenderError::Reason::Busy, "export already running");
    }
    ExportGuard guard(job->busy);
    job->cancel.store(false, std::memory_order_release);

    return renderer_.render_wav(buffer_, state_, depth, &job->cancel);
}

std::future<Engine::ExportResult> Engine::export_audio_async(BitDepth depth) {
    if (!buffer_) {
        std::promise<ExportResult> none;
        none.set_value(std::nullopt);
        return none.get_future();
    }

    auto job = export_job_;
    bool expected = false;
    if (!job->busy.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        throw RenderError(RenderError::Reason::Busy, "export already running");
    }
    job->cancel.store(false, std::memory_order_release);

    // The worker holds its own copies; it never touches the engine.
    try {
        return std::async(std::launch::async,
            [job, renderer = renderer_, buffer = buffer_, state = state_, depth]() -> ExportResult {
                ExportGuard guard(job->busy);
                return renderer.render_wav(buffer, state, depth, &job->cancel);
            });
    } catch (const std::system_error&) {
        // No worker started, so no guard exists to release the job.
        job->busy.store(false, std::memory_order_release);
        AudioLogger::instance().log_message("RENDER", "export worker failed to start");
        throw;
    }
}

void Engine::cancel_export() {
    export_job_->cancel.store(true, std::memory_order_release);
}

bool Engine::is_exporting() const {
    return export_job_->busy.load(std::memory_order_acquire);
}

bool Engine::start_device() {
    if (!driver_) return false;
    if (!driver_->start()) {
        AudioLogger::instance().log_message("ENGINE", "device start failed");
        return false;
    }
    // The negotiated rate is only known once the device is open.
    if (!device_rate_matches()) {
        driver_->stop();
        AudioLogger::instance().log_event("ENGINE", static_cast<float>(driver_->sample_rate()));
        AudioLogger::instance().log_message("ENGINE", "device rate differs from buffer");
        return false;
    }
    return true;
}

void Engine::stop_device() {
    if (driver_) {
        driver_->stop();
    }
}

double Engine::current_time() const {
    if (!buffer_) return 0.0;
    const size_t frame = phase_ == PlaybackPhase::Playing ? session_.position_frames() : paused_frame_;
    return std::min(static_cast<double>(frame) / buffer_->sample_rate, buffer_->duration());
}

double Engine::duration() const {
    return buffer_ ? buffer_->duration() : 0.0;
}

size_t Engine::time_domain_samples(std::span<float> left, std::span<float> right) const {
    return session_.snapshot(left, right);
}

PlaybackPhase Engine::phase() const {
    return is_exporting() ? PlaybackPhase::Exporting : phase_;
}

bool Engine::device_rate_matches() const {
    if (!driver_ || !buffer_) return true;
    return driver_->sample_rate() == buffer_->sample_rate;
}

void Engine::publish() {
    session_.publish(state_);
}

void Engine::start_session(size_t start_frame) {
    session_.start(buffer_, start_frame, state_);
}

void Engine::reset_monitoring() {
    monitor_.reset();
    safety_.reset();
}

size_t Engine::frames_for(double seconds) const {
    return buffer_ ? static_cast<size_t>(std::llround(seconds * buffer_->sample_rate)) : 0;
}

} // namespace morpho
