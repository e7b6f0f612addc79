/**
 * @file constants.hpp
 * @brief Shared angular/spectral constants.
 * @author Watosn
 */
#pragma once

#include <numbers>

namespace ringsky::core::constants {

inline constexpr double kPi = std::numbers::pi;
inline constexpr double kDegToRad = kPi / 180.0;
inline constexpr double kHourToRad = 15.0 * kDegToRad;
inline constexpr double kArcminToRad = kDegToRad / 60.0;
inline constexpr double kArcsecToRad = kDegToRad / 3600.0;
inline constexpr double kMilliarcsecToRad = kArcsecToRad / 1000.0;
inline constexpr double kRadToArcsec = 1.0 / kArcsecToRad;

inline constexpr double kDefaultSpectralIncrementHz = 7.5e9;

}  // namespace ringsky::core::constants
