/**
 * @file AudioBuffer.hpp
 * @brief Stereo buffer views and owned stereo storage.
 */

#ifndef MORPHO_AUDIO_BUFFER_HPP
#define MORPHO_AUDIO_BUFFER_HPP

#include <algorithm>
#include <cstddef>
#include <span>
#include <vector>

namespace morpho {

/**
 * @brief Non-owning view of a stereo (2-channel) block.
 *
 * Uses separate spans for left and right channels (planar layout).
 */
struct AudioBuffer {
    std::span<float> left;
    std::span<float> right;

    size_t frames() const { return left.size(); }

    /**
     * @brief Zero out the buffer.
     */
    void clear() {
        if (!left.empty()) std::fill(left.begin(), left.end(), 0.0f);
        if (!right.empty()) std::fill(right.begin(), right.end(), 0.0f);
    }

    /**
     * @brief Accumulate another block of the same length into this one.
     */
    void add_from(const AudioBuffer& other) {
        const size_t n = std::min(frames(), other.frames());
        for (size_t i = 0; i < n; ++i) {
            left[i] += other.left[i];
            right[i] += other.right[i];
        }
    }

    void copy_from(const AudioBuffer& other) {
        const size_t n = std::min(frames(), other.frames());
        std::copy_n(other.left.begin(), n, left.begin());
        std::copy_n(other.right.begin(), n, right.begin());
    }

    AudioBuffer subview(size_t offset, size_t count) const {
        return AudioBuffer{left.subspan(offset, count), right.subspan(offset, count)};
    }
};

/**
 * @brief Owned stereo memory block (L/R vectors).
 */
struct StereoBlock {
    std::vector<float> left;
    std::vector<float> right;

    StereoBlock() = default;

    explicit StereoBlock(size_t frames)
        : left(frames, 0.0f)
        , right(frames, 0.0f)
    {}

    size_t frames() const { return left.size(); }

    AudioBuffer view() { return AudioBuffer{left, right}; }

    AudioBuffer view(size_t count) {
        return AudioBuffer{std::span<float>(left.data(), count), std::span<float>(right.data(), count)};
    }
};

} // namespace morpho

#endif // MORPHO_AUDIO_BUFFER_HPP
