#include "WavReader.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace morpho {

namespace {

constexpr uint16_t kFormatPcm = 1;
constexpr uint16_t kFormatFloat = 3;
constexpr uint16_t kFormatExtensible = 0xFFFE;

uint16_t read_u16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t read_u32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

bool tag_is(const uint8_t* p, const char* tag) {
    return std::memcmp(p, tag, 4) == 0;
}

struct Format {
    uint16_t tag = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t block_align = 0;
    uint16_t bits = 0;
};

float decode_sample(const uint8_t* p, const Format& fmt) {
    if (fmt.tag == kFormatFloat) {
        if (fmt.bits == 32) {
            float f;
            const uint32_t raw = read_u32(p);
            std::memcpy(&f, &raw, sizeof(f));
            return f;
        }
        double d;
        const uint64_t raw = static_cast<uint64_t>(read_u32(p)) | (static_cast<uint64_t>(read_u32(p + 4)) << 32);
        std::memcpy(&d, &raw, sizeof(d));
        return static_cast<float>(d);
    }

    switch (fmt.bits) {
        case 8:
            return (static_cast<int>(p[0]) - 128) / 128.0f;
        case 16: {
            const int16_t v = static_cast<int16_t>(read_u16(p));
            return v < 0 ? v / 32768.0f : v / 32767.0f;
        }
        case 24: {
            int32_t v = static_cast<int32_t>(p[0] | (p[1] << 8) | (p[2] << 16));
            if (v & 0x800000) v |= ~0xFFFFFF;
            return v < 0 ? static_cast<float>(v / 8388608.0) : static_cast<float>(v / 8388607.0);
        }
        default: {
            const int32_t v = static_cast<int32_t>(read_u32(p));
            return static_cast<float>(v < 0 ? v / 2147483648.0 : v / 2147483647.0);
        }
    }
}

} // namespace

PcmBuffer WavReader::decode(std::span<const uint8_t> bytes) {
    if (bytes.size() < 12 || !tag_is(bytes.data(), "RIFF") || !tag_is(bytes.data() + 8, "WAVE")) {
        throw DecodeError("not a RIFF/WAVE stream");
    }

    Format fmt;
    bool have_fmt = false;
    const uint8_t* data = nullptr;
    size_t data_size = 0;

    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const uint8_t* chunk = bytes.data() + pos;
        const size_t size = read_u32(chunk + 4);
        const size_t body = pos + 8;
        const size_t available = bytes.size() - body;

        if (tag_is(chunk, "fmt ")) {
            if (size < 16 || available < 16) {
                throw DecodeError("truncated fmt chunk");
            }
            const uint8_t* f = bytes.data() + body;
            fmt.tag = read_u16(f);
            fmt.channels = read_u16(f + 2);
            fmt.sample_rate = read_u32(f + 4);
            fmt.block_align = read_u16(f + 12);
            fmt.bits = read_u16(f + 14);
            if (fmt.tag == kFormatExtensible) {
                if (size < 40 || available < 40) {
                    throw DecodeError("truncated extensible fmt chunk");
                }
                // First two bytes of the sub-format GUID carry the format code.
                fmt.tag = read_u16(f + 24);
            }
            have_fmt = true;
        } else if (tag_is(chunk, "data")) {
            data = bytes.data() + body;
            // Streams written before their length was known report 0 or too much.
            data_size = (size == 0 || size > available) ? available : size;
        }

        if (size > available) break;
        pos = body + size + (size & 1u);
    }

    if (!have_fmt) throw DecodeError("missing fmt chunk");
    if (!data) throw DecodeError("missing data chunk");
    if (fmt.channels == 0) throw DecodeError("zero channels");
    if (fmt.sample_rate == 0) throw DecodeError("zero sample rate");

    const bool pcm_ok = fmt.tag == kFormatPcm &&
        (fmt.bits == 8 || fmt.bits == 16 || fmt.bits == 24 || fmt.bits == 32);
    const bool float_ok = fmt.tag == kFormatFloat && (fmt.bits == 32 || fmt.bits == 64);
    if (!pcm_ok && !float_ok) {
        throw DecodeError("unsupported format " + std::to_string(fmt.tag) + "/" + std::to_string(fmt.bits) + " bit");
    }

    const size_t bytes_per_sample = fmt.bits / 8;
    // Some writers leave block align at 0 or pad frames; never read less than one frame.
    const size_t frame_size = std::max<size_t>(fmt.block_align, bytes_per_sample * fmt.channels);
    const size_t frames = data_size / frame_size;

    PcmBuffer buffer;
    buffer.sample_rate = static_cast<int>(fmt.sample_rate);
    buffer.channels.assign(fmt.channels, std::vector<float>(frames, 0.0f));

    for (size_t i = 0; i < frames; ++i) {
        const uint8_t* frame = data + i * frame_size;
        for (size_t ch = 0; ch < fmt.channels; ++ch) {
            buffer.channels[ch][i] = decode_sample(frame + ch * bytes_per_sample, fmt);
        }
    }
    return buffer;
}

PcmBuffer WavReader::read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw DecodeError("cannot open " + path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    return decode(bytes);
}

} // namespace morpho
