/**
 * @file PcmBuffer.hpp
 * @brief Decoded, planar float PCM as handed to the engine.
 */

#ifndef MORPHO_PCM_BUFFER_HPP
#define MORPHO_PCM_BUFFER_HPP

#include <cstddef>
#include <vector>

namespace morpho {

/**
 * @brief Planar float samples in [-1, 1] plus the sample rate.
 *
 * Produced by a decoder (WavReader or the host's own) and shared read-only
 * between the realtime session and the offline renderer.
 */
struct PcmBuffer {
    int sample_rate = 44100;
    std::vector<std::vector<float>> channels;

    size_t num_channels() const { return channels.size(); }

    size_t frames() const { return channels.empty() ? 0 : channels.front().size(); }

    double duration() const {
        return sample_rate > 0 ? static_cast<double>(frames()) / sample_rate : 0.0;
    }

    /**
     * @brief At least one channel, all channels equally long, positive rate.
     */
    bool is_valid() const {
        if (channels.empty() || sample_rate <= 0) return false;
        for (const auto& ch : channels) {
            if (ch.size() != channels.front().size()) return false;
        }
        return true;
    }

    /**
     * @brief Build from interleaved samples (as a C host hands them over).
     */
    static PcmBuffer from_interleaved(const float* data, size_t frames, size_t num_channels, int sample_rate) {
        PcmBuffer buffer;
        buffer.sample_rate = sample_rate;
        buffer.channels.assign(num_channels, std::vector<float>(frames, 0.0f));
        for (size_t i = 0; i < frames; ++i) {
            for (size_t ch = 0; ch < num_channels; ++ch) {
                buffer.channels[ch][i] = data[i * num_channels + ch];
            }
        }
        return buffer;
    }
};

} // namespace morpho

#endif // MORPHO_PCM_BUFFER_HPP
