/**
 * @file DelayLine.hpp
 * @brief Circular mono delay line with fractional (linear) read-out.
 */

#ifndef MORPHO_DELAY_LINE_HPP
#define MORPHO_DELAY_LINE_HPP

#include <algorithm>
#include <cmath>
#include <vector>

namespace morpho {

/**
 * @brief Mono delay line without feedback.
 *
 * A delay of zero samples returns the sample just written, so the line is a
 * bit-exact pass-through when the delay is off.
 */
class DelayLine {
public:
    /**
     * @param sample_rate Sample rate in Hz.
     * @param max_delay_seconds Maximum delay time in seconds.
     */
    explicit DelayLine(int sample_rate, float max_delay_seconds = 0.05f)
        : sample_rate_(sample_rate)
        , write_pos_(0)
    {
        const size_t size = static_cast<size_t>(std::ceil(sample_rate_ * max_delay_seconds)) + 2;
        buffer_.resize(size, 0.0f);
    }

    /**
     * @brief Largest usable delay in samples.
     */
    float max_delay_samples() const { return static_cast<float>(buffer_.size() - 2); }

    /**
     * @brief Push one sample and read the line @p delay_samples behind it.
     *
     * @param input Input sample.
     * @param delay_samples Delay in samples (clamped to the line length).
     * @return float Delayed sample, linearly interpolated.
     */
    float process_sample(float input, float delay_samples) {
        const size_t buf_size = buffer_.size();
        buffer_[write_pos_] = input;

        const float delay = std::clamp(delay_samples, 0.0f, max_delay_samples());
        float output = input;
        if (delay > 0.0f) {
            float read_pos = static_cast<float>(write_pos_) - delay;
            while (read_pos < 0.0f) read_pos += static_cast<float>(buf_size);

            const size_t i0 = static_cast<size_t>(read_pos) % buf_size;
            const size_t i1 = (i0 + 1) % buf_size;
            const float frac = read_pos - std::floor(read_pos);
            output = buffer_[i0] + frac * (buffer_[i1] - buffer_[i0]);
        }

        write_pos_ = (write_pos_ + 1) % buf_size;
        return output;
    }

    int sample_rate() const { return sample_rate_; }

    void reset() {
        std::fill(buffer_.begin(), buffer_.end(), 0.0f);
        write_pos_ = 0;
    }

private:
    int sample_rate_;
    std::vector<float> buffer_;
    size_t write_pos_;
};

} // namespace morpho

#endif // MORPHO_DELAY_LINE_HPP
