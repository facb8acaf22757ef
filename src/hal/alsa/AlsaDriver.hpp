/**
 * @file AlsaDriver.hpp
 * @brief Linux ALSA implementation of the AudioDriver interface.
 */

#ifndef MORPHO_ALSA_DRIVER_HPP
#define MORPHO_ALSA_DRIVER_HPP

#include "AudioDriver.hpp"
#include <alsa/asoundlib.h>
#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

namespace morpho::hal {

/**
 * @brief Blocking-write ALSA playback on a dedicated thread.
 *
 * Negotiates S32_LE (falling back to S16_LE), interleaves the stereo
 * callback output, recovers from underruns and tries to run the thread
 * with SCHED_FIFO priority. Mono hardware receives the left channel.
 */
class AlsaDriver : public AudioDriver {
public:
    /**
     * @param sample_rate Requested sample rate.
     * @param block_size Requested period size (frames per interrupt).
     * @param num_channels Requested hardware channels (1 or 2).
     * @param device ALSA device name.
     */
    AlsaDriver(int sample_rate = 44100, int block_size = 512, int num_channels = 2, const std::string& device = "default");
    ~AlsaDriver() override;

    bool start() override;
    void stop() override;
    void set_stereo_callback(StereoAudioCallback callback) override;

    int sample_rate() const override { return sample_rate_; }
    int block_size() const override { return block_size_; }
    int channels() const { return num_channels_; }

private:
    void thread_loop();
    bool setup_pcm();
    void close_pcm();
    void write_interleaved();
    void recover_pcm(int err);

    snd_pcm_t* pcm_handle_;
    std::string device_name_;
    int sample_rate_;
    int block_size_;
    int num_channels_;
    snd_pcm_format_t format_;
    StereoAudioCallback stereo_callback_;
    std::atomic<bool> running_;
    std::thread processing_thread_;

    // Internal buffers
    std::vector<float> left_buffer_;
    std::vector<float> right_buffer_;
    std::vector<uint8_t> interleaved_buffer_;
};

} // namespace morpho::hal

#endif // MORPHO_ALSA_DRIVER_HPP
