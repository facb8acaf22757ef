/**
 * @file AudioDriver.hpp
 * @brief Abstract base class for platform-specific audio output drivers.
 *
 * Hardware/OS audio code stays out of the DSP and engine layers; the engine
 * only hands the driver a stereo render callback.
 */

#ifndef MORPHO_AUDIO_DRIVER_HPP
#define MORPHO_AUDIO_DRIVER_HPP

#include <functional>
#include "AudioBuffer.hpp"

namespace morpho::hal {

/**
 * @brief Unified interface for audio output devices.
 */
class AudioDriver {
public:
    /**
     * @brief Called on the driver's audio thread once per period.
     */
    using StereoAudioCallback = std::function<void(AudioBuffer& output)>;

    virtual ~AudioDriver() = default;

    /**
     * @brief Start the audio driver.
     *
     * @return true if successfully started, false otherwise.
     */
    virtual bool start() = 0;

    /**
     * @brief Stop the audio driver. Blocks until the audio thread has exited.
     */
    virtual void stop() = 0;

    /**
     * @brief Set the stereo processing callback. Call before start().
     */
    virtual void set_stereo_callback(StereoAudioCallback callback) = 0;

    /**
     * @return int Sample rate in Hz (the negotiated one after start()).
     */
    virtual int sample_rate() const = 0;

    /**
     * @return int Number of frames per period.
     */
    virtual int block_size() const = 0;
};

} // namespace morpho::hal

#endif // MORPHO_AUDIO_DRIVER_HPP
