/**
 * @file HaasDelayProcessor.hpp
 * @brief Inter-channel micro-delay that decorrelates L/R to widen a band.
 */

#ifndef MORPHO_HAAS_DELAY_PROCESSOR_HPP
#define MORPHO_HAAS_DELAY_PROCESSOR_HPP

#include "Processor.hpp"
#include "DelayLine.hpp"
#include "ParamSmoother.hpp"
#include <algorithm>

namespace morpho {

/**
 * @brief Haas widener: left passes, right is delayed.
 *
 * The unit stays in the graph whether or not the effect is enabled; toggling
 * only moves the delay target between 0 and the configured time (15 ms by
 * default), and the delay time glides there with a one-pole smoother so the
 * switch never clicks. With the delay settled at 0 the unit is transparent.
 */
class HaasDelayProcessor : public Processor {
public:
    static constexpr float kDefaultDelaySeconds = 0.015f;
    static constexpr float kMaxDelaySeconds = 0.05f;

    HaasDelayProcessor(int sample_rate,
                       bool enabled,
                       float delay_seconds = kDefaultDelaySeconds,
                       float smoothing_seconds = 0.1f)
        : sample_rate_(sample_rate)
        , delay_seconds_(std::clamp(delay_seconds, 0.0f, kMaxDelaySeconds))
        , enabled_(enabled)
        , delay_(sample_rate, smoothing_seconds, enabled ? delay_seconds_ : 0.0f)
        , line_(sample_rate, kMaxDelaySeconds)
    {}

    void set_enabled(bool enabled) {
        enabled_ = enabled;
        delay_.set_target(enabled ? delay_seconds_ : 0.0f);
    }

    void set_enabled_immediate(bool enabled) {
        enabled_ = enabled;
        delay_.set_immediate(enabled ? delay_seconds_ : 0.0f);
    }

    bool enabled() const { return enabled_; }

    /**
     * @brief Current (smoothed) right-channel delay in seconds.
     */
    float current_delay_seconds() const { return delay_.current(); }

    void reset() override {
        line_.reset();
        delay_.set_immediate(delay_.target());
    }

    const char* kind() const override { return "haas"; }

protected:
    void do_pull(AudioBuffer& output) override {
        const float sr = static_cast<float>(sample_rate_);
        for (size_t i = 0; i < output.frames(); ++i) {
            const float delay_samples = delay_.next() * sr;
            output.right[i] = line_.process_sample(output.right[i], delay_samples);
        }
    }

private:
    int sample_rate_;
    float delay_seconds_;
    bool enabled_;
    ParamSmoother delay_;
    DelayLine line_;
};

} // namespace morpho

#endif // MORPHO_HAAS_DELAY_PROCESSOR_HPP
