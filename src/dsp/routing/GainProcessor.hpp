/**
 * @file GainProcessor.hpp
 * @brief Smoothed scalar gain stage, also used as a summing collector.
 */

#ifndef MORPHO_GAIN_PROCESSOR_HPP
#define MORPHO_GAIN_PROCESSOR_HPP

#include "Processor.hpp"
#include "ParamSmoother.hpp"

namespace morpho {

/**
 * @brief Multiplies both channels by a smoothed gain.
 *
 * The graph sums all inputs into this node's block before it runs, so a
 * unity GainProcessor is the collector node (master, wet bus, destination).
 * Once the smoother has settled the node applies the exact target, and a
 * settled unity gain leaves the block untouched.
 */
class GainProcessor : public Processor {
public:
    GainProcessor(int sample_rate, float gain, float smoothing_seconds = 0.0f)
        : gain_(sample_rate, smoothing_seconds, gain)
    {}

    void set_gain(float gain) { gain_.set_target(gain); }
    void set_gain_immediate(float gain) { gain_.set_immediate(gain); }

    float gain() const { return gain_.current(); }
    float target_gain() const { return gain_.target(); }
    bool is_settled() const { return gain_.is_settled(); }

    void reset() override {
        gain_.set_immediate(gain_.target());
    }

    const char* kind() const override { return "gain"; }

protected:
    void do_pull(AudioBuffer& output) override {
        if (gain_.is_settled()) {
            const float g = gain_.current();
            if (g == 1.0f) return;
            for (size_t i = 0; i < output.frames(); ++i) {
                output.left[i] *= g;
                output.right[i] *= g;
            }
            return;
        }

        for (size_t i = 0; i < output.frames(); ++i) {
            const float g = gain_.next();
            output.left[i] *= g;
            output.right[i] *= g;
        }
    }

private:
    ParamSmoother gain_;
};

} // namespace morpho

#endif // MORPHO_GAIN_PROCESSOR_HPP
