/**
 * @file WavReader.hpp
 * @brief RIFF/WAVE decoder producing a PcmBuffer.
 */

#ifndef MORPHO_WAV_READER_HPP
#define MORPHO_WAV_READER_HPP

#include "PcmBuffer.hpp"
#include <cstdint>
#include <span>
#include <string>

namespace morpho {

/**
 * @brief Decodes PCM (8/16/24/32-bit), IEEE float (32/64-bit) and
 * WAVE_FORMAT_EXTENSIBLE files. Chunks may appear in any order; unknown
 * chunks are skipped.
 */
class WavReader {
public:
    /**
     * @throws DecodeError on malformed or unsupported input.
     */
    static PcmBuffer decode(std::span<const uint8_t> bytes);

    /**
     * @throws DecodeError if the file cannot be read or decoded.
     */
    static PcmBuffer read_file(const std::string& path);
};

} // namespace morpho

#endif // MORPHO_WAV_READER_HPP
