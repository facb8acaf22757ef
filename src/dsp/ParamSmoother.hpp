/**
 * @file ParamSmoother.hpp
 * @brief One-pole parameter smoother with exact settling.
 */

#ifndef MORPHO_PARAM_SMOOTHER_HPP
#define MORPHO_PARAM_SMOOTHER_HPP

#include <cmath>

namespace morpho {

/**
 * @brief Exponential (single-pole) glide towards a target value.
 *
 * Once the distance to the target drops below the snap threshold the value
 * jumps onto the target, so a settled smoother returns the target bit-exactly.
 * A time constant of zero makes every change immediate.
 */
class ParamSmoother {
public:
    ParamSmoother() = default;

    ParamSmoother(int sample_rate, float time_constant_seconds, float initial_value, double snap_threshold = 1.0e-6)
        : current_(initial_value)
        , target_(initial_value)
        , snap_(snap_threshold)
    {
        set_time_constant(sample_rate, time_constant_seconds);
    }

    void set_time_constant(int sample_rate, float seconds) {
        if (seconds <= 0.0f || sample_rate <= 0) {
            coefficient_ = 1.0;
        } else {
            coefficient_ = 1.0 - std::exp(-1.0 / (static_cast<double>(seconds) * sample_rate));
        }
    }

    // Non-finite values are ignored; a NaN would never settle.
    void set_target(float value) {
        if (std::isfinite(value)) target_ = value;
    }

    /**
     * @brief Jump to a value without gliding.
     */
    void set_immediate(float value) {
        if (!std::isfinite(value)) return;
        target_ = value;
        current_ = value;
    }

    float next() {
        if (current_ != target_) {
            const double previous = current_;
            current_ += coefficient_ * (target_ - current_);
            // Snap once close enough, or once the step underflows the precision.
            if (std::fabs(target_ - current_) <= snap_ || current_ == previous) {
                current_ = target_;
            }
        }
        return static_cast<float>(current_);
    }

    bool is_settled() const { return current_ == target_; }
    float current() const { return static_cast<float>(current_); }
    float target() const { return static_cast<float>(target_); }

private:
    double current_ = 0.0;
    double target_ = 0.0;
    double coefficient_ = 1.0;
    double snap_ = 1.0e-6;
};

} // namespace morpho

#endif // MORPHO_PARAM_SMOOTHER_HPP
