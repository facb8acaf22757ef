/**
 * @file FilterBank.cpp
 * @brief Constant crossover table indexed by band.
 */

#include "FilterBank.hpp"
#include <limits>

namespace morpho {

namespace {

struct BandFilterPlan {
    std::array<FilterStage, FilterBank::kMaxStages> stages;
    size_t count;
    float lower_hz;
    float upper_hz;
};

constexpr FilterStage lp(float hz) { return FilterStage{FilterType::LowPass, hz, kButterworthQ}; }
constexpr FilterStage hp(float hz) { return FilterStage{FilterType::HighPass, hz, kButterworthQ}; }

constexpr float kOpen = std::numeric_limits<float>::infinity();

// Indexed by BandId.
constexpr std::array<BandFilterPlan, kNumBands> kPlans{{
    {{lp(kCrossoverLowHz), lp(kCrossoverLowHz), {}, {}}, 2, 0.0f, kCrossoverLowHz},
    {{hp(kCrossoverLowHz), hp(kCrossoverLowHz), lp(kCrossoverMidHz), lp(kCrossoverMidHz)}, 4, kCrossoverLowHz, kCrossoverMidHz},
    {{hp(kCrossoverMidHz), hp(kCrossoverMidHz), lp(kCrossoverHighHz), lp(kCrossoverHighHz)}, 4, kCrossoverMidHz, kCrossoverHighHz},
    {{hp(kCrossoverHighHz), hp(kCrossoverHighHz), {}, {}}, 2, kCrossoverHighHz, kOpen},
}};

const BandFilterPlan& plan_for(BandId id) {
    return kPlans[band_index(id) % kNumBands];
}

} // namespace

std::span<const FilterStage> FilterBank::build_filters(BandId id) {
    const auto& plan = plan_for(id);
    return std::span<const FilterStage>(plan.stages.data(), plan.count);
}

float FilterBank::lower_edge_hz(BandId id) {
    return plan_for(id).lower_hz;
}

float FilterBank::upper_edge_hz(BandId id) {
    return plan_for(id).upper_hz;
}

} // namespace morpho
