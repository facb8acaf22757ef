/**
 * @file WavEncoder.hpp
 * @brief Byte-exact RIFF/WAVE writer for interleaved stereo float audio.
 */

#ifndef MORPHO_WAV_ENCODER_HPP
#define MORPHO_WAV_ENCODER_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace morpho {

enum class BitDepth {
    Pcm16 = 16,
    Pcm24 = 24,
    Float32 = 32
};

std::optional<BitDepth> bit_depth_from_int(int bits);

/**
 * @brief Encodes a 44-byte canonical header followed by interleaved samples.
 *
 * Layout: "RIFF", 36 + data size, "WAVE", "fmt " (16 bytes: format tag 1 for
 * PCM or 3 for IEEE float, channels, sample rate, byte rate, block align,
 * bits per sample), "data", data size. All fields little-endian.
 */
class WavEncoder {
public:
    static constexpr size_t kHeaderSize = 44;

    /**
     * @param interleaved Frame-interleaved samples, @p channels per frame.
     * @throws std::length_error if the result would exceed the RIFF size limit.
     */
    static std::vector<uint8_t> encode(std::span<const float> interleaved,
                                       int channels,
                                       int sample_rate,
                                       BitDepth depth);

    /**
     * @brief Largest frame count whose RIFF sizes fit the 32-bit fields.
     */
    static size_t max_frames(int channels, BitDepth depth);

    /**
     * @return false (and nothing appended) if the data does not fit a RIFF file.
     */
    static bool write_header(std::vector<uint8_t>& out, size_t frames, int channels, int sample_rate, BitDepth depth);

    static int16_t to_pcm16(float sample);
    static int32_t to_pcm24(float sample);
    static float to_float32(float sample);
};

} // namespace morpho

#endif // MORPHO_WAV_ENCODER_HPP
