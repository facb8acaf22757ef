/**
 * @file BiquadProcessor.hpp
 * @brief Stereo 2nd-order low/high-pass section (RBJ cookbook).
 */

#ifndef MORPHO_BIQUAD_PROCESSOR_HPP
#define MORPHO_BIQUAD_PROCESSOR_HPP

#include "FilterBank.hpp"
#include "Processor.hpp"
#include <algorithm>
#include <array>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace morpho {

/**
 * @brief Transposed direct form II biquad with one state pair per channel.
 *
 * Coefficients are computed once in double precision; crossover points are
 * fixed for the lifetime of a graph.
 */
class BiquadProcessor : public Processor {
public:
    BiquadProcessor(int sample_rate, const FilterStage& stage)
        : sample_rate_(sample_rate)
        , type_(stage.type)
        , cutoff_(stage.cutoff_hz)
        , q_(stage.q)
    {
        update_coefficients();
    }

    float cutoff() const { return cutoff_; }
    FilterType type() const { return type_; }

    void reset() override {
        state_ = {};
    }

    const char* kind() const override {
        return type_ == FilterType::LowPass ? "lowpass" : "highpass";
    }

    /**
     * @brief Magnitude response at @p frequency_hz (for analysis and tests).
     */
    double magnitude_at(double frequency_hz) const {
        const double w = 2.0 * M_PI * frequency_hz / sample_rate_;
        const double cos1 = std::cos(w), sin1 = std::sin(w);
        const double cos2 = std::cos(2.0 * w), sin2 = std::sin(2.0 * w);
        const double num_re = b0_ + b1_ * cos1 + b2_ * cos2;
        const double num_im = -(b1_ * sin1 + b2_ * sin2);
        const double den_re = 1.0 + a1_ * cos1 + a2_ * cos2;
        const double den_im = -(a1_ * sin1 + a2_ * sin2);
        return std::sqrt((num_re * num_re + num_im * num_im) / (den_re * den_re + den_im * den_im));
    }

protected:
    void do_pull(AudioBuffer& output) override {
        process_channel(output.left, state_[0]);
        process_channel(output.right, state_[1]);
    }

private:
    struct State {
        double z1 = 0.0;
        double z2 = 0.0;
    };

    void process_channel(std::span<float> data, State& s) const {
        double z1 = s.z1;
        double z2 = s.z2;
        for (auto& sample : data) {
            const double x = sample;
            const double y = b0_ * x + z1;
            z1 = b1_ * x - a1_ * y + z2;
            z2 = b2_ * x - a2_ * y;
            sample = static_cast<float>(y);
        }
        s.z1 = z1;
        s.z2 = z2;
    }

    void update_coefficients() {
        const double nyquist = sample_rate_ * 0.5;
        const double freq = std::clamp(static_cast<double>(cutoff_), 10.0, nyquist * 0.99);
        const double omega = 2.0 * M_PI * freq / sample_rate_;
        const double sin_w = std::sin(omega);
        const double cos_w = std::cos(omega);
        const double alpha = sin_w / (2.0 * std::max(0.1, static_cast<double>(q_)));

        double b0, b1, b2;
        if (type_ == FilterType::LowPass) {
            b0 = (1.0 - cos_w) * 0.5;
            b1 = 1.0 - cos_w;
            b2 = (1.0 - cos_w) * 0.5;
        } else {
            b0 = (1.0 + cos_w) * 0.5;
            b1 = -(1.0 + cos_w);
            b2 = (1.0 + cos_w) * 0.5;
        }
        const double a0 = 1.0 + alpha;
        const double inv_a0 = 1.0 / a0;

        b0_ = b0 * inv_a0;
        b1_ = b1 * inv_a0;
        b2_ = b2 * inv_a0;
        a1_ = (-2.0 * cos_w) * inv_a0;
        a2_ = (1.0 - alpha) * inv_a0;
    }

    int sample_rate_;
    FilterType type_;
    float cutoff_;
    float q_;
    double b0_ = 1.0, b1_ = 0.0, b2_ = 0.0, a1_ = 0.0, a2_ = 0.0;
    std::array<State, 2> state_{};
};

} // namespace morpho

#endif // MORPHO_BIQUAD_PROCESSOR_HPP
