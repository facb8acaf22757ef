/**
 * @file FilterBank.hpp
 * @brief Crossover plan: the cascaded biquad stages that isolate each band.
 */

#ifndef MORPHO_FILTER_BANK_HPP
#define MORPHO_FILTER_BANK_HPP

#include <array>
#include <cstddef>
#include <span>
#include "BandSpec.hpp"

namespace morpho {

enum class FilterType {
    LowPass,
    HighPass
};

/**
 * @brief One 2nd-order section.
 */
struct FilterStage {
    FilterType type = FilterType::LowPass;
    float cutoff_hz = 1000.0f;
    float q = 0.707f;
};

inline constexpr float kButterworthQ = 0.707f;
inline constexpr float kCrossoverLowHz = 250.0f;
inline constexpr float kCrossoverMidHz = 2000.0f;
inline constexpr float kCrossoverHighHz = 8000.0f;

/**
 * @brief Builds the ordered stage list for a band.
 *
 * Each band edge is two cascaded Butterworth sections (4th order).
 * Edge bands have one edge (2 stages), interior bands two (high-pass first,
 * then low-pass: 4 stages). Stages run strictly in series, first to last.
 */
class FilterBank {
public:
    static constexpr size_t kMaxStages = 4;

    static std::span<const FilterStage> build_filters(BandId id);

    /**
     * @brief Lower and upper edge of the band's pass region (0 / +inf where open).
     */
    static float lower_edge_hz(BandId id);
    static float upper_edge_hz(BandId id);
};

} // namespace morpho

#endif // MORPHO_FILTER_BANK_HPP
