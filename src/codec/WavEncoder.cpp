#include "WavEncoder.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <stdexcept>

namespace morpho {

namespace {

void put_u16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

void put_tag(std::vector<uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

float clip(float sample) {
    if (std::isnan(sample)) return 0.0f;
    return std::clamp(sample, -1.0f, 1.0f);
}

} // namespace

std::optional<BitDepth> bit_depth_from_int(int bits) {
    switch (bits) {
        case 16: return BitDepth::Pcm16;
        case 24: return BitDepth::Pcm24;
        case 32: return BitDepth::Float32;
        default: return std::nullopt;
    }
}

int16_t WavEncoder::to_pcm16(float sample) {
    const float s = clip(sample);
    const float scaled = s < 0.0f ? s * 32768.0f : s * 32767.0f;
    return static_cast<int16_t>(std::lround(scaled));
}

int32_t WavEncoder::to_pcm24(float sample) {
    const double s = clip(sample);
    const double scaled = s < 0.0 ? s * 8388608.0 : s * 8388607.0;
    return static_cast<int32_t>(std::lround(scaled));
}

float WavEncoder::to_float32(float sample) {
    return clip(sample);
}

size_t WavEncoder::max_frames(int channels, BitDepth depth) {
    const size_t block_align = static_cast<size_t>(std::max(channels, 1)) * (static_cast<size_t>(depth) / 8);
    const uint64_t limit = std::numeric_limits<uint32_t>::max() - 36u;
    return static_cast<size_t>(limit / block_align);
}

bool WavEncoder::write_header(std::vector<uint8_t>& out, size_t frames, int channels, int sample_rate, BitDepth depth) {
    if (frames > max_frames(channels, depth)) {
        return false;
    }
    const uint16_t bits = static_cast<uint16_t>(depth);
    const uint16_t block_align = static_cast<uint16_t>(channels * (bits / 8));
    const uint32_t data_size = static_cast<uint32_t>(frames * block_align);

    put_tag(out, "RIFF");
    put_u32(out, 36 + data_size);
    put_tag(out, "WAVE");
    put_tag(out, "fmt ");
    put_u32(out, 16);
    put_u16(out, depth == BitDepth::Float32 ? 3 : 1);
    put_u16(out, static_cast<uint16_t>(channels));
    put_u32(out, static_cast<uint32_t>(sample_rate));
    put_u32(out, static_cast<uint32_t>(sample_rate) * block_align);
    put_u16(out, block_align);
    put_u16(out, bits);
    put_tag(out, "data");
    put_u32(out, data_size);
    return true;
}

std::vector<uint8_t> WavEncoder::encode(std::span<const float> interleaved,
                                        int channels,
                                        int sample_rate,
                                        BitDepth depth) {
    const size_t frames = channels > 0 ? interleaved.size() / static_cast<size_t>(channels) : 0;
    const size_t samples = frames * static_cast<size_t>(channels);
    const size_t bytes_per_sample = static_cast<size_t>(depth) / 8;

    std::vector<uint8_t> out;
    if (!write_header(out, frames, channels, sample_rate, depth)) {
        throw std::length_error("WAV data exceeds the 4 GiB RIFF limit");
    }
    out.reserve(kHeaderSize + samples * bytes_per_sample);

    for (size_t i = 0; i < samples; ++i) {
        switch (depth) {
            case BitDepth::Pcm16:
                put_u16(out, static_cast<uint16_t>(to_pcm16(interleaved[i])));
                break;
            case BitDepth::Pcm24: {
                const uint32_t v = static_cast<uint32_t>(to_pcm24(interleaved[i]));
                out.push_back(static_cast<uint8_t>(v & 0xFF));
                out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
                out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
                break;
            }
            case BitDepth::Float32: {
                const float f = to_float32(interleaved[i]);
                uint32_t bits;
                std::memcpy(&bits, &f, sizeof(bits));
                put_u32(out, bits);
                break;
            }
        }
    }
    return out;
}

} // namespace morpho
