/**
 * @file AlsaDriver.cpp
 * @brief Linux ALSA implementation of the AudioDriver interface.
 */

#include "AlsaDriver.hpp"
#include "Logger.hpp"
#include "WavEncoder.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <iostream>
#include <pthread.h>

namespace morpho::hal {

AlsaDriver::AlsaDriver(int sample_rate, int block_size, int num_channels, const std::string& device)
    : pcm_handle_(nullptr)
    , device_name_(device)
    , sample_rate_(sample_rate)
    , block_size_(block_size)
    , num_channels_(std::clamp(num_channels, 1, 2))
    , format_(SND_PCM_FORMAT_S32_LE)
    , running_(false)
{
    // Buffers are sized after PCM setup
}

AlsaDriver::~AlsaDriver() {
    stop();
}

void AlsaDriver::set_stereo_callback(StereoAudioCallback callback) {
    stereo_callback_ = std::move(callback);
}

bool AlsaDriver::start() {
    if (running_) return true;

    if (!setup_pcm()) {
        close_pcm();
        return false;
    }

    running_ = true;
    processing_thread_ = std::thread(&AlsaDriver::thread_loop, this);

    return true;
}

void AlsaDriver::stop() {
    running_ = false;
    if (processing_thread_.joinable()) {
        processing_thread_.join();
    }
    if (pcm_handle_) {
        snd_pcm_drain(pcm_handle_);
    }
    close_pcm();
}

void AlsaDriver::close_pcm() {
    if (pcm_handle_) {
        snd_pcm_close(pcm_handle_);
        pcm_handle_ = nullptr;
    }
}

bool AlsaDriver::setup_pcm() {
    int err;
    snd_pcm_hw_params_t* hw_params = nullptr;

    if ((err = snd_pcm_open(&pcm_handle_, device_name_.c_str(), SND_PCM_STREAM_PLAYBACK, 0)) < 0) {
        std::cerr << "ALSA: Cannot open audio device " << device_name_ << " (" << snd_strerror(err) << ")" << std::endl;
        pcm_handle_ = nullptr;
        return false;
    }

    if ((err = snd_pcm_hw_params_malloc(&hw_params)) < 0) {
        std::cerr << "ALSA: Cannot allocate hardware parameter structure (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    // Frees hw_params on every exit path below.
    auto fail = [hw_params](const char* what, int code) {
        std::cerr << "ALSA: " << what << " (" << snd_strerror(code) << ")" << std::endl;
        snd_pcm_hw_params_free(hw_params);
        return false;
    };

    if ((err = snd_pcm_hw_params_any(pcm_handle_, hw_params)) < 0) {
        return fail("Cannot initialize hardware parameter structure", err);
    }

    if ((err = snd_pcm_hw_params_set_access(pcm_handle_, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED)) < 0) {
        return fail("Cannot set access type", err);
    }

    format_ = SND_PCM_FORMAT_S32_LE;
    if ((err = snd_pcm_hw_params_set_format(pcm_handle_, hw_params, format_)) < 0) {
        std::cerr << "ALSA: Cannot set S32_LE, falling back to S16_LE" << std::endl;
        format_ = SND_PCM_FORMAT_S16_LE;
        if ((err = snd_pcm_hw_params_set_format(pcm_handle_, hw_params, format_)) < 0) {
            return fail("Cannot set sample format", err);
        }
    }

    unsigned int rate = static_cast<unsigned int>(sample_rate_);
    if ((err = snd_pcm_hw_params_set_rate_near(pcm_handle_, hw_params, &rate, 0)) < 0) {
        return fail("Cannot set sample rate", err);
    }
    if (static_cast<int>(rate) != sample_rate_) {
        std::cerr << "ALSA: " << sample_rate_ << " Hz not available, device runs at " << rate << " Hz" << std::endl;
    }
    sample_rate_ = static_cast<int>(rate);

    unsigned int channels = static_cast<unsigned int>(num_channels_);
    if ((err = snd_pcm_hw_params_set_channels_near(pcm_handle_, hw_params, &channels)) < 0) {
        return fail("Cannot set channel count", err);
    }
    num_channels_ = static_cast<int>(channels);

    snd_pcm_uframes_t frames = static_cast<snd_pcm_uframes_t>(block_size_);
    if ((err = snd_pcm_hw_params_set_period_size_near(pcm_handle_, hw_params, &frames, 0)) < 0) {
        return fail("Cannot set period size", err);
    }
    block_size_ = static_cast<int>(frames);

    unsigned int periods = 4;
    snd_pcm_hw_params_set_periods_near(pcm_handle_, hw_params, &periods, 0);

    if ((err = snd_pcm_hw_params(pcm_handle_, hw_params)) < 0) {
        return fail("Cannot set parameters", err);
    }

    snd_pcm_hw_params_free(hw_params);

    left_buffer_.assign(block_size_, 0.0f);
    right_buffer_.assign(block_size_, 0.0f);
    const size_t bytes_per_sample = format_ == SND_PCM_FORMAT_S32_LE ? 4 : 2;
    interleaved_buffer_.assign(static_cast<size_t>(block_size_ * num_channels_) * bytes_per_sample, 0);

    if ((err = snd_pcm_prepare(pcm_handle_)) < 0) {
        std::cerr << "ALSA: Cannot prepare audio interface for use (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    return true;
}

void AlsaDriver::thread_loop() {
    auto& logger = AudioLogger::instance();

    // Set Real-Time Priority (SCHED_FIFO, Priority 80)
    struct sched_param param;
    param.sched_priority = 80;
    int res = pthread_setschedparam(pthread_self(), SCHED_FIFO, &param);
    if (res != 0) {
        if (res == EPERM) {
            logger.log_message("ALSA", "Priority Failed: EPERM (Need ulimit -r 80+)");
        } else {
            logger.log_message("ALSA", "Priority Failed: Unknown Error");
        }
    } else {
        logger.log_message("ALSA", "Real-Time Priority Set (SCHED_FIFO, 80)");
    }

    while (running_) {
        if (!stereo_callback_) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }

        // Zeroing: never send stale samples if the callback leaves gaps
        std::fill(left_buffer_.begin(), left_buffer_.end(), 0.0f);
        std::fill(right_buffer_.begin(), right_buffer_.end(), 0.0f);

        AudioBuffer buffer{std::span<float>(left_buffer_), std::span<float>(right_buffer_)};
        stereo_callback_(buffer);

        write_interleaved();

        snd_pcm_sframes_t written = snd_pcm_writei(pcm_handle_, interleaved_buffer_.data(), static_cast<snd_pcm_uframes_t>(block_size_));
        if (written < 0) {
            recover_pcm(static_cast<int>(written));
        }
    }
}

// Same quantization as the WAV exporter; S32 carries the 24-bit value left-justified.
void AlsaDriver::write_interleaved() {
    const size_t frames = left_buffer_.size();
    const size_t stride = static_cast<size_t>(num_channels_);
    if (format_ == SND_PCM_FORMAT_S32_LE) {
        int32_t* out = reinterpret_cast<int32_t*>(interleaved_buffer_.data());
        for (size_t i = 0; i < frames; ++i) {
            out[i * stride] = static_cast<int32_t>(static_cast<uint32_t>(WavEncoder::to_pcm24(left_buffer_[i])) << 8);
            if (stride > 1) {
                out[i * stride + 1] = static_cast<int32_t>(static_cast<uint32_t>(WavEncoder::to_pcm24(right_buffer_[i])) << 8);
            }
        }
    } else {
        int16_t* out = reinterpret_cast<int16_t*>(interleaved_buffer_.data());
        for (size_t i = 0; i < frames; ++i) {
            out[i * stride] = WavEncoder::to_pcm16(left_buffer_[i]);
            if (stride > 1) {
                out[i * stride + 1] = WavEncoder::to_pcm16(right_buffer_[i]);
            }
        }
    }
}

void AlsaDriver::recover_pcm(int err) {
    if (err == -EPIPE) {
        AudioLogger::instance().log_message("ALSA", "xrun recovered");
        snd_pcm_prepare(pcm_handle_);
    } else if (err == -ESTRPIPE) {
        while ((err = snd_pcm_resume(pcm_handle_)) == -EAGAIN)
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        if (err < 0) {
            snd_pcm_prepare(pcm_handle_);
        }
    } else {
        AudioLogger::instance().log_event("ALSA", static_cast<float>(err));
        snd_pcm_prepare(pcm_handle_);
    }
}

} // namespace morpho::hal
