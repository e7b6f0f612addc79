/**
 * @file coordinate_system.hpp
 * @brief World coordinate system for the model image (SIN direction axes + spectral axis).
 * @author Watosn
 */
#pragma once

#include <array>
#include <string>

#include "ringsky/core/types.hpp"

namespace ringsky::imaging {

/**
 * @brief Spatial image size in pixels.
 */
struct ImageShape {
  int nx{};
  int ny{};
};

/**
 * @brief Linear direction axes about a reference pixel (0-based pixel indices).
 *
 * `increment_x_rad` is negative by sky convention (RA grows to the left).
 */
struct DirectionAxes {
  double ref_ra_rad{};
  double ref_dec_rad{};
  double ref_pixel_x{};
  double ref_pixel_y{};
  double increment_x_rad{};
  double increment_y_rad{};
  ringsky::core::DirectionFrame frame{ringsky::core::DirectionFrame::J2000};
};

/**
 * @brief Degenerate (single-channel) spectral axis.
 */
struct SpectralAxis {
  double ref_freq_hz{};
  double increment_hz{};
  double ref_pixel{};
};

/**
 * @brief Full coordinate system of a (nx, ny, 1, 1) image: direction, Stokes, spectral.
 */
struct CoordinateSystem {
  DirectionAxes direction{};
  SpectralAxis spectral{};
  std::array<std::string, 4> units{"rad", "rad", "", "Hz"};

  /**
   * @brief Project a sky direction to fractional pixel coordinates (orthographic SIN).
   * @return false when the direction lies on the far hemisphere.
   */
  [[nodiscard]] bool world_to_pixel(const ringsky::core::Direction& dir, double& px, double& py) const;

  /**
   * @brief Deproject fractional pixel coordinates to a sky direction.
   * @return false when the pixel lies outside the projection's native circle.
   */
  [[nodiscard]] bool pixel_to_world(double px, double py, ringsky::core::Direction& dir) const;
};

/**
 * @brief Build the coordinate system for a grid centred on `center`.
 *
 * Reference pixel is (nx / 2, ny / 2) using integer division; increments are
 * (-cell, +cell) in radians.
 */
[[nodiscard]] CoordinateSystem make_coordinate_system(const ImageShape& shape,
                                                      double cell_size_arcsec,
                                                      const ringsky::core::Direction& center,
                                                      double freq_hz,
                                                      double spectral_increment_hz);

}  // namespace ringsky::imaging
