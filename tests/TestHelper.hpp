/**
 * @file TestHelper.hpp
 * @brief Signal generators and measurements shared by the test suites.
 */

#ifndef MORPHO_TEST_HELPER_HPP
#define MORPHO_TEST_HELPER_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>
#include "PcmBuffer.hpp"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace test {

inline std::vector<float> sine(double frequency, int sample_rate, size_t frames, float amplitude = 0.5f) {
    std::vector<float> out(frames);
    for (size_t i = 0; i < frames; ++i) {
        out[i] = amplitude * static_cast<float>(std::sin(2.0 * M_PI * frequency * static_cast<double>(i) / sample_rate));
    }
    return out;
}

/**
 * @brief Deterministic broadband noise (LCG), reproducible across runs.
 */
inline std::vector<float> noise(size_t frames, float amplitude = 0.5f, uint32_t seed = 12345u) {
    std::vector<float> out(frames);
    uint32_t state = seed;
    for (size_t i = 0; i < frames; ++i) {
        state = state * 1664525u + 1013904223u;
        out[i] = amplitude * (static_cast<float>(state >> 8) / 8388608.0f - 1.0f);
    }
    return out;
}

inline morpho::PcmBuffer mono_buffer(std::vector<float> samples, int sample_rate = 44100) {
    morpho::PcmBuffer buffer;
    buffer.sample_rate = sample_rate;
    buffer.channels.push_back(std::move(samples));
    return buffer;
}

inline morpho::PcmBuffer stereo_buffer(std::vector<float> left, std::vector<float> right, int sample_rate = 44100) {
    morpho::PcmBuffer buffer;
    buffer.sample_rate = sample_rate;
    buffer.channels.push_back(std::move(left));
    buffer.channels.push_back(std::move(right));
    return buffer;
}

inline double rms(std::span<const float> data) {
    if (data.empty()) return 0.0;
    double sum = 0.0;
    for (float s : data) sum += static_cast<double>(s) * s;
    return std::sqrt(sum / static_cast<double>(data.size()));
}

inline float peak(std::span<const float> data) {
    float p = 0.0f;
    for (float s : data) p = std::max(p, std::fabs(s));
    return p;
}

/**
 * @brief Largest absolute step between consecutive samples (click detector).
 */
inline float max_step(std::span<const float> data) {
    float m = 0.0f;
    for (size_t i = 1; i < data.size(); ++i) {
        m = std::max(m, std::fabs(data[i] - data[i - 1]));
    }
    return m;
}

} // namespace test

#endif // MORPHO_TEST_HELPER_HPP
