/**
 * @file StereoPannerProcessor.hpp
 * @brief Linear stereo pan law for already-stereo band signals.
 */

#ifndef MORPHO_STEREO_PANNER_PROCESSOR_HPP
#define MORPHO_STEREO_PANNER_PROCESSOR_HPP

#include "Processor.hpp"
#include "ParamSmoother.hpp"
#include <algorithm>

namespace morpho {

/**
 * @brief Positions a stereo signal in the field.
 *
 * Pan p in [-1, 1]. Moving left folds the right channel into the left
 * (p <= 0: L' = L + R*(-p), R' = R*(1+p)); moving right is the mirror image.
 * At p = 0 the block passes through unchanged.
 */
class StereoPannerProcessor : public Processor {
public:
    StereoPannerProcessor(int sample_rate, float pan, float smoothing_seconds = 0.0f)
        : pan_(sample_rate, smoothing_seconds, std::clamp(pan, -1.0f, 1.0f))
    {}

    void set_pan(float pan) { pan_.set_target(std::clamp(pan, -1.0f, 1.0f)); }
    void set_pan_immediate(float pan) { pan_.set_immediate(std::clamp(pan, -1.0f, 1.0f)); }

    float pan() const { return pan_.current(); }
    float target_pan() const { return pan_.target(); }

    static void apply(float pan, float& left, float& right) {
        const float l = left;
        const float r = right;
        if (pan <= 0.0f) {
            left = l + r * -pan;
            right = r * (1.0f + pan);
        } else {
            left = l * (1.0f - pan);
            right = r + l * pan;
        }
    }

    void reset() override {
        pan_.set_immediate(pan_.target());
    }

    const char* kind() const override { return "panner"; }

protected:
    void do_pull(AudioBuffer& output) override {
        if (pan_.is_settled() && pan_.current() == 0.0f) return;

        for (size_t i = 0; i < output.frames(); ++i) {
            apply(pan_.next(), output.left[i], output.right[i]);
        }
    }

private:
    ParamSmoother pan_;
};

} // namespace morpho

#endif // MORPHO_STEREO_PANNER_PROCESSOR_HPP
