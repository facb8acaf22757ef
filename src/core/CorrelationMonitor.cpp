#include "CorrelationMonitor.hpp"
#include <algorithm>
#include <cmath>

namespace morpho {

CorrelationMonitor::CorrelationMonitor(float smoothing)
    : smoothing_(std::clamp(smoothing, 0.0f, 0.999f))
{}

float CorrelationMonitor::compute(std::span<const float> left, std::span<const float> right) {
    const size_t n = std::min(left.size(), right.size());
    double sum_lr = 0.0;
    double sum_ll = 0.0;
    double sum_rr = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double l = left[i];
        const double r = right[i];
        sum_lr += l * r;
        sum_ll += l * l;
        sum_rr += r * r;
    }

    const double denominator = std::sqrt(sum_ll) * std::sqrt(sum_rr);
    if (denominator == 0.0) {
        return 1.0f;
    }
    return static_cast<float>(std::clamp(sum_lr / denominator, -1.0, 1.0));
}

float CorrelationMonitor::update(std::span<const float> left, std::span<const float> right) {
    return push(compute(left, right));
}

float CorrelationMonitor::push(float correlation) {
    // A window holding NaN/Inf samples is skipped so the running value survives.
    if (!std::isfinite(correlation)) {
        return smoothed_;
    }
    instantaneous_ = std::clamp(correlation, -1.0f, 1.0f);
    smoothed_ = smoothed_ * smoothing_ + instantaneous_ * (1.0f - smoothing_);
    return smoothed_;
}

void CorrelationMonitor::reset() {
    instantaneous_ = 1.0f;
    smoothed_ = 1.0f;
}

} // namespace morpho
