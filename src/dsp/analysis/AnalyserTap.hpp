/**
 * @file AnalyserTap.hpp
 * @brief Lock-free window of the most recent stereo output for metering.
 */

#ifndef MORPHO_ANALYSER_TAP_HPP
#define MORPHO_ANALYSER_TAP_HPP

#include "AudioBuffer.hpp"
#include <algorithm>
#include <array>
#include <atomic>
#include <cstddef>
#include <span>

namespace morpho {

/**
 * @brief Keeps the last Size frames of L/R written by the audio thread.
 *
 * Samples are stored in relaxed atomics, so the control thread can take a
 * snapshot at any time without locks. A snapshot that overlaps a write may
 * mix two adjacent blocks, which is acceptable for metering.
 */
template<size_t Size>
class AnalyserTap {
public:
    static_assert((Size & (Size - 1)) == 0, "Size must be a power of 2");

    AnalyserTap() { clear(); }

    static constexpr size_t size() { return Size; }

    // Audio Thread (RT-Safe)
    void push(const AudioBuffer& block) {
        size_t w = write_pos_.load(std::memory_order_relaxed);
        for (size_t i = 0; i < block.frames(); ++i) {
            left_[w].store(block.left[i], std::memory_order_relaxed);
            right_[w].store(block.right[i], std::memory_order_relaxed);
            w = (w + 1) & mask;
        }
        write_pos_.store(w, std::memory_order_release);
    }

    // Control Thread
    /**
     * @brief Copy the most recent frames, oldest first.
     *
     * If the destination is shorter than the window, the newest frames are
     * returned; if longer, the excess is zero-filled.
     */
    size_t snapshot(std::span<float> left, std::span<float> right) const {
        const size_t count = std::min({left.size(), right.size(), Size});
        const size_t w = write_pos_.load(std::memory_order_acquire);
        size_t r = (w + Size - count) & mask;
        for (size_t i = 0; i < count; ++i) {
            left[i] = left_[r].load(std::memory_order_relaxed);
            right[i] = right_[r].load(std::memory_order_relaxed);
            r = (r + 1) & mask;
        }
        std::fill(left.begin() + static_cast<std::ptrdiff_t>(count), left.end(), 0.0f);
        std::fill(right.begin() + static_cast<std::ptrdiff_t>(count), right.end(), 0.0f);
        return count;
    }

    void clear() {
        for (size_t i = 0; i < Size; ++i) {
            left_[i].store(0.0f, std::memory_order_relaxed);
            right_[i].store(0.0f, std::memory_order_relaxed);
        }
        write_pos_.store(0, std::memory_order_release);
    }

private:
    static constexpr size_t mask = Size - 1;
    std::array<std::atomic<float>, Size> left_;
    std::array<std::atomic<float>, Size> right_;
    std::atomic<size_t> write_pos_{0};
};

} // namespace morpho

#endif // MORPHO_ANALYSER_TAP_HPP
