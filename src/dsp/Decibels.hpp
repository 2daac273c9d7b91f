/**
 * @file Decibels.hpp
 * @brief Amplitude/power to dB conversions with a hard floor.
 */

#ifndef OMEGA_DECIBELS_HPP
#define OMEGA_DECIBELS_HPP

#include <algorithm>
#include <cmath>

namespace omega::dsp {

constexpr double kEpsilon = 1e-10;
constexpr double kMeterFloorDb = -100.0;

/**
 * @brief 20*log10(max(amplitude, eps)). Never returns -inf; NaN maps to eps.
 */
inline double amplitude_to_db(double amplitude) {
    if (!(amplitude > kEpsilon)) amplitude = kEpsilon;
    return 20.0 * std::log10(amplitude);
}

/**
 * @brief Clamp a level from below. NaN becomes the floor.
 */
inline double clamp_to_floor(double level_db, double floor_db) {
    if (std::isnan(level_db)) return floor_db;
    return std::max(level_db, floor_db);
}

} // namespace omega::dsp

#endif // OMEGA_DECIBELS_HPP
