/**
 * @file ParameterBlock.hpp
 * @brief Lock-free handoff of EngineState from the control to the audio thread.
 */

#ifndef MORPHO_PARAMETER_BLOCK_HPP
#define MORPHO_PARAMETER_BLOCK_HPP

#include "EngineState.hpp"
#include <array>
#include <atomic>
#include <cstdint>

namespace morpho {

/**
 * @brief Sequence-locked parameter snapshot.
 *
 * One writer (control thread), one reader (audio thread). The sequence is
 * odd while a write is in progress; a read that overlaps a write fails and
 * the reader simply tries again on its next block.
 */
class ParameterBlock {
public:
    ParameterBlock() { publish(EngineState{}); }

    // Control Thread
    void publish(const EngineState& state) {
        const uint64_t seq = sequence_.load(std::memory_order_relaxed);
        sequence_.store(seq + 1, std::memory_order_relaxed);
        std::atomic_thread_fence(std::memory_order_release);

        for (size_t i = 0; i < kNumBands; ++i) {
            pan_[i].store(state.bands[i].pan, std::memory_order_relaxed);
            gain_[i].store(state.bands[i].gain, std::memory_order_relaxed);
        }
        width_.store(state.global_width, std::memory_order_relaxed);
        max_width_.store(state.max_width, std::memory_order_relaxed);
        haas_.store(state.haas_enabled, std::memory_order_relaxed);
        bypass_.store(state.bypass, std::memory_order_relaxed);
        mono_safe_.store(state.mono_safe_mode, std::memory_order_relaxed);

        sequence_.store(seq + 2, std::memory_order_release);
    }

    // Audio Thread (RT-Safe)
    /**
     * @brief Copy the latest complete snapshot.
     *
     * @param version Receives the snapshot version (even, increasing).
     * @return false if a write was in progress.
     */
    bool read(EngineState& out, uint64_t& version) const {
        const uint64_t before = sequence_.load(std::memory_order_acquire);
        if (before & 1u) return false;

        EngineState state;
        for (size_t i = 0; i < kNumBands; ++i) {
            state.bands[i].id = static_cast<BandId>(i);
            state.bands[i].pan = pan_[i].load(std::memory_order_relaxed);
            state.bands[i].gain = gain_[i].load(std::memory_order_relaxed);
        }
        state.global_width = width_.load(std::memory_order_relaxed);
        state.max_width = max_width_.load(std::memory_order_relaxed);
        state.haas_enabled = haas_.load(std::memory_order_relaxed);
        state.bypass = bypass_.load(std::memory_order_relaxed);
        state.mono_safe_mode = mono_safe_.load(std::memory_order_relaxed);

        std::atomic_thread_fence(std::memory_order_acquire);
        if (sequence_.load(std::memory_order_relaxed) != before) return false;

        out = state;
        version = before;
        return true;
    }

    uint64_t version() const { return sequence_.load(std::memory_order_acquire); }

private:
    std::atomic<uint64_t> sequence_{0};
    std::array<std::atomic<float>, kNumBands> pan_{};
    std::array<std::atomic<float>, kNumBands> gain_{};
    std::atomic<float> width_{1.0f};
    std::atomic<float> max_width_{kDefaultMaxWidth};
    std::atomic<bool> haas_{false};
    std::atomic<bool> bypass_{false};
    std::atomic<bool> mono_safe_{true};
};

} // namespace morpho

#endif // MORPHO_PARAMETER_BLOCK_HPP
