/**
 * @file CorrelationMonitor.hpp
 * @brief Stereo phase correlation meter.
 */

#ifndef MORPHO_CORRELATION_MONITOR_HPP
#define MORPHO_CORRELATION_MONITOR_HPP

#include <cstddef>
#include <span>
#include <vector>

namespace morpho {

/**
 * @brief Measures how mono-compatible the output is.
 *
 * corr = sum(L*R) / (sqrt(sum(L^2)) * sqrt(sum(R^2))), without mean removal.
 * +1 means identical channels, -1 means full cancellation in mono. Silence
 * (zero denominator) reads as +1. The readout is smoothed once per tick:
 * smoothed = smoothed * k + corr * (1 - k).
 */
class CorrelationMonitor {
public:
    static constexpr size_t kWindowFrames = 2048;
    static constexpr float kDefaultSmoothing = 0.9f;

    explicit CorrelationMonitor(float smoothing = kDefaultSmoothing);

    /**
     * @brief Raw correlation of two equally long windows, clamped to [-1, 1].
     */
    static float compute(std::span<const float> left, std::span<const float> right);

    /**
     * @brief Measure a window and fold it into the smoothed value.
     *
     * @return The smoothed correlation after this update.
     */
    float update(std::span<const float> left, std::span<const float> right);

    /**
     * @brief Fold an already measured value into the smoothed value.
     */
    float push(float correlation);

    float instantaneous() const { return instantaneous_; }
    float smoothed() const { return smoothed_; }

    void reset();

private:
    float smoothing_;
    float instantaneous_ = 1.0f;
    float smoothed_ = 1.0f;
};

} // namespace morpho

#endif // MORPHO_CORRELATION_MONITOR_HPP
